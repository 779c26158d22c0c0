// Copyright (C) 2018 Bluzelle
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU Affero General Public License, version 3,
// as published by the Free Software Foundation.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU Affero General Public License for more details.
//
// You should have received a copy of the GNU Affero General Public License
// along with this program. If not, see <http://www.gnu.org/licenses/>.


#include <subscriber/subscriber.hpp>

using namespace ehub;


subscriber::subscriber(size_t queue_capacity)
    : subscriber_id(ehub::next_subscriber_id())
    , queue_capacity(queue_capacity)
{
}


subscriber::~subscriber()
{
    this->close();
}


void
subscriber::send_event(std::shared_ptr<const event_envelope> event)
{
    {
        std::lock_guard<std::mutex> lock(this->lock);

        if (this->closed)
        {
            return;
        }

        if (this->inbox.size() >= this->queue_capacity)
        {
            if (this->dropped_events++ == 0)
            {
                LOG(warning) << "subscriber [" << this->subscriber_id << "] inbox full (" << this->queue_capacity
                             << " events), dropping event for: " << event->channel();
            }
            return;
        }

        this->inbox.emplace_back(std::move(event));
    }

    this->inbox_cv.notify_one();
}


ehub::shutdown_handler_id_t
subscriber::add_shutdown_handler(ehub::subscriber_shutdown_handler handler)
{
    {
        std::lock_guard<std::mutex> lock(this->lock);

        if (!this->closed)
        {
            const auto id = this->next_shutdown_handler_id++;
            this->shutdown_handlers.emplace(id, std::move(handler));
            return id;
        }
    }

    // already gone...
    handler();

    return 0;
}


void
subscriber::remove_shutdown_handler(ehub::shutdown_handler_id_t id)
{
    std::lock_guard<std::mutex> lock(this->lock);

    this->shutdown_handlers.erase(id);
}


std::shared_ptr<const event_envelope>
subscriber::receive(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(this->lock);

    this->inbox_cv.wait_for(lock, timeout, [this]() { return !this->inbox.empty() || this->closed; });

    if (this->inbox.empty())
    {
        return nullptr;
    }

    auto event = std::move(this->inbox.front());
    this->inbox.pop_front();

    return event;
}


std::shared_ptr<const event_envelope>
subscriber::try_receive()
{
    std::lock_guard<std::mutex> lock(this->lock);

    if (this->inbox.empty())
    {
        return nullptr;
    }

    auto event = std::move(this->inbox.front());
    this->inbox.pop_front();

    return event;
}


size_t
subscriber::pending() const
{
    std::lock_guard<std::mutex> lock(this->lock);

    return this->inbox.size();
}


size_t
subscriber::dropped() const
{
    std::lock_guard<std::mutex> lock(this->lock);

    return this->dropped_events;
}


void
subscriber::close()
{
    std::map<ehub::shutdown_handler_id_t, ehub::subscriber_shutdown_handler> handlers;
    {
        std::lock_guard<std::mutex> lock(this->lock);

        if (this->closed)
        {
            return;
        }

        this->closed = true;
        handlers.swap(this->shutdown_handlers);
    }

    this->inbox_cv.notify_all();

    LOG(debug) << "subscriber [" << this->subscriber_id << "] closed";

    // run outside the lock, handlers may call back into us...
    for (const auto& [id, handler] : handlers)
    {
        handler();
    }
}


size_t
subscriber::shutdown_handler_count() const
{
    std::lock_guard<std::mutex> lock(this->lock);

    return this->shutdown_handlers.size();
}


bool
subscriber::is_closed() const
{
    std::lock_guard<std::mutex> lock(this->lock);

    return this->closed;
}
