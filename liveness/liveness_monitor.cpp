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


#include <liveness/liveness_monitor.hpp>
#include <vector>

using namespace ehub;


liveness_monitor::liveness_monitor(std::shared_ptr<ehub::asio::io_context_base> io_context, std::chrono::milliseconds purge_interval)
    : purge_timer(io_context->make_unique_steady_timer())
    , purge_interval(purge_interval)
{
}


void
liveness_monitor::start()
{
    std::call_once(this->start_once,
        [this]()
        {
            this->start_purge_timer();
        });
}


ehub::liveness_token_t
liveness_monitor::monitor(std::shared_ptr<ehub::subscriber_base> subscriber, ehub::liveness_down_handler handler)
{
    ehub::liveness_token_t token;
    {
        std::lock_guard<std::mutex> lock(this->observations_lock);

        token = this->next_token++;
        this->observations[token] = observation{subscriber, subscriber->get_subscriber_id(), std::move(handler), 0};
    }

    LOG(debug) << "monitoring subscriber [" << subscriber->get_subscriber_id() << "] with token " << token;

    // may run right away if the subscriber is already gone...
    const auto hook = subscriber->add_shutdown_handler(
        [weak_self = weak_from_this(), token]()
        {
            if (auto self = weak_self.lock())
            {
                self->notify_down(token);
            }
        });

    {
        std::lock_guard<std::mutex> lock(this->observations_lock);

        auto observation_it = this->observations.find(token);

        if (observation_it != this->observations.end())
        {
            observation_it->second.hook = hook;
            return token;
        }
    }

    // reported or demonitored before the hook was recorded...
    if (hook)
    {
        subscriber->remove_shutdown_handler(hook);
    }

    return token;
}


bool
liveness_monitor::demonitor(ehub::liveness_token_t token)
{
    observation cancelled;
    {
        std::lock_guard<std::mutex> lock(this->observations_lock);

        auto observation_it = this->observations.find(token);

        if (observation_it == this->observations.end())
        {
            return false;
        }

        cancelled = std::move(observation_it->second);
        this->observations.erase(observation_it);
    }

    // the subscriber only holds hooks for live observations...
    if (auto subscriber = cancelled.subscriber.lock(); subscriber && cancelled.hook)
    {
        subscriber->remove_shutdown_handler(cancelled.hook);
    }

    return true;
}


size_t
liveness_monitor::monitored_count() const
{
    std::lock_guard<std::mutex> lock(this->observations_lock);

    return this->observations.size();
}


void
liveness_monitor::notify_down(ehub::liveness_token_t token)
{
    observation down;
    {
        std::lock_guard<std::mutex> lock(this->observations_lock);

        auto observation_it = this->observations.find(token);

        if (observation_it == this->observations.end())
        {
            // demonitored or already reported...
            return;
        }

        down = std::move(observation_it->second);
        this->observations.erase(observation_it);
    }

    LOG(debug) << "subscriber [" << down.subscriber_id << "] terminated (token " << token << ")";

    down.handler(token, down.subscriber_id);
}


void
liveness_monitor::start_purge_timer()
{
    this->purge_timer->expires_from_now(this->purge_interval);
    this->purge_timer->async_wait(std::bind(&liveness_monitor::purge_expired, shared_from_this(), std::placeholders::_1));
}


void
liveness_monitor::purge_expired(const boost::system::error_code& ec)
{
    if (ec)
    {
        return;
    }

    std::vector<std::pair<ehub::liveness_token_t, observation>> expired;
    {
        std::lock_guard<std::mutex> lock(this->observations_lock);

        auto observation_it = this->observations.begin();

        while (observation_it != this->observations.end())
        {
            if (observation_it->second.subscriber.expired())
            {
                expired.emplace_back(observation_it->first, std::move(observation_it->second));
                observation_it = this->observations.erase(observation_it);
                continue;
            }

            ++observation_it;
        }
    }

    if (!expired.empty())
    {
        LOG(debug) << "purged " << expired.size() << " destroyed subscribers";
    }

    for (const auto& [token, down] : expired)
    {
        down.handler(token, down.subscriber_id);
    }

    // reschedule...
    this->start_purge_timer();
}
