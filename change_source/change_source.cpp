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


#include <change_source/change_source.hpp>
#include <vector>

using namespace ehub;


change_source::change_source(std::shared_ptr<ehub::asio::io_context_base> io_context)
    : io_context(std::move(io_context))
{
}


ehub::observer_id_t
change_source::add_observer(ehub::change_observer observer)
{
    std::lock_guard<std::mutex> lock(this->lock);

    const auto id = this->next_observer_id++;
    this->observers.emplace(id, std::move(observer));

    LOG(debug) << "change source observer " << id << " attached";

    return id;
}


bool
change_source::remove_observer(ehub::observer_id_t id)
{
    std::lock_guard<std::mutex> lock(this->lock);

    return this->observers.erase(id) > 0;
}


bool
change_source::has_observers() const
{
    std::lock_guard<std::mutex> lock(this->lock);

    return !this->observers.empty();
}


size_t
change_source::observer_count() const
{
    std::lock_guard<std::mutex> lock(this->lock);

    return this->observers.size();
}


void
change_source::notify(const ehub::channel_t& channel, const db_event& event)
{
    std::vector<ehub::change_observer> targets;
    {
        std::lock_guard<std::mutex> lock(this->lock);

        for (const auto& observer : this->observers)
        {
            targets.emplace_back(observer.second);
        }
    }

    for (const auto& observer : targets)
    {
        observer(channel, event);
    }
}


void
change_source::terminate(const std::string& reason)
{
    size_t discarded;
    {
        std::lock_guard<std::mutex> lock(this->lock);

        // the observer list is what we don't trust, it does not survive a restart...
        discarded = this->observers.size();
        this->observers.clear();
        ++this->restart_count;
    }

    LOG(warning) << "change source terminated: " << reason << " (" << discarded << " observers discarded)";

    this->io_context->post(std::bind(&change_source::restart, shared_from_this(), reason));
}


void
change_source::set_restart_handler(ehub::change_source_restart_handler handler)
{
    std::lock_guard<std::mutex> lock(this->lock);

    this->restart_handler = std::move(handler);
}


size_t
change_source::get_restart_count() const
{
    std::lock_guard<std::mutex> lock(this->lock);

    return this->restart_count;
}


void
change_source::restart(const std::string& reason)
{
    ehub::change_source_restart_handler handler;
    {
        std::lock_guard<std::mutex> lock(this->lock);

        handler = this->restart_handler;
    }

    LOG(info) << "change source restarted after: " << reason;

    if (handler)
    {
        handler(reason);
    }
}
