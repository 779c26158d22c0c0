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


#include <dispatcher/dispatcher.hpp>
#include <future>
#include <type_traits>

using namespace ehub;

namespace
{
    const std::string NAME{"dispatcher"};

    const std::string SUBSCRIBERS_KEY{"subscribers"};
    const std::string CHANNELS_KEY{"channels"};
    const std::string PUBLISHED_KEY{"events_published"};
    const std::string DELIVERED_KEY{"events_delivered"};
    const std::string WATCHDOG_KEY{"watchdog"};
    const std::string WATCHDOG_DEATHS_KEY{"watchdog_deaths"};
}


dispatcher::dispatcher(std::shared_ptr<ehub::asio::io_context_base> io_context, std::shared_ptr<ehub::liveness_monitor_base> liveness,
    ehub::watchdog_factory make_watchdog, std::chrono::milliseconds watchdog_respawn_delay)
    : strand(io_context->make_unique_strand())
    , liveness(std::move(liveness))
    , make_watchdog(std::move(make_watchdog))
    , respawn_timer(io_context->make_unique_steady_timer())
    , watchdog_respawn_delay(watchdog_respawn_delay)
{
}


void
dispatcher::start()
{
    std::call_once(this->start_once,
        [this]()
        {
            this->liveness->start();

            this->strand->post(std::bind(&dispatcher::spawn_watchdog, shared_from_this()));
        });
}


void
dispatcher::stop()
{
    this->strand->post(
        [self = shared_from_this()]()
        {
            self->respawn_timer->cancel();

            if (self->watchdog)
            {
                self->watchdog->stop();
                self->watchdog.reset();
            }

            self->update_status_snapshot();
        });
}


void
dispatcher::register_subscriber(std::shared_ptr<ehub::subscriber_base> subscriber, const std::vector<ehub::channel_t>& channels)
{
    this->call<void>(
        [this, &subscriber, &channels]()
        {
            this->do_register(subscriber, channels);
        });
}


control_response::status_t
dispatcher::unregister_subscriber(std::shared_ptr<ehub::subscriber_base> subscriber)
{
    const auto id = subscriber->get_subscriber_id();

    return this->call<control_response::status_t>(
        [this, id]()
        {
            return this->do_unregister(id);
        });
}


void
dispatcher::publish(const ehub::channel_t& channel, const db_event& event)
{
    auto envelope = std::make_shared<event_envelope>();
    envelope->set_channel(channel);
    *envelope->mutable_event() = event;

    this->strand->post(std::bind(&dispatcher::do_publish, shared_from_this(), std::shared_ptr<const event_envelope>(std::move(envelope))));
}


control_response
dispatcher::handle_request(const control_request& request, std::shared_ptr<ehub::subscriber_base> subscriber)
{
    control_response response;

    if (!subscriber)
    {
        LOG(info) << "ignoring request without a subscriber: " << request.ShortDebugString().substr(0, MAX_MESSAGE_SIZE);

        response.set_status(control_response::IGNORED);

        return response;
    }

    switch (request.msg_case())
    {
        case control_request::kSubscribe:
        {
            const std::vector<ehub::channel_t> channels(request.subscribe().channels().begin(), request.subscribe().channels().end());

            this->register_subscriber(subscriber, channels);
            response.set_status(control_response::OK);
            break;
        }

        case control_request::kUnsubscribe:
            response.set_status(this->unregister_subscriber(subscriber));
            break;

        default:
            LOG(info) << "ignoring request from subscriber [" << subscriber->get_subscriber_id() << "]: "
                      << request.ShortDebugString().substr(0, MAX_MESSAGE_SIZE);
            response.set_status(control_response::IGNORED);
            break;
    }

    return response;
}


std::string
dispatcher::get_name()
{
    return NAME;
}


ehub::json_message
dispatcher::get_status()
{
    // never waits on the strand, so a worker thread may ask...
    ehub::json_message status;

    status[SUBSCRIBERS_KEY] = Json::UInt64(this->subscriber_count);
    status[CHANNELS_KEY] = Json::UInt64(this->channel_count);
    status[PUBLISHED_KEY] = Json::UInt64(this->events_published);
    status[DELIVERED_KEY] = Json::UInt64(this->events_delivered);
    status[WATCHDOG_KEY] = this->watchdog_running ? "running" : "stopped";
    status[WATCHDOG_DEATHS_KEY] = Json::UInt64(this->watchdog_death_count);

    return status;
}


template<typename T>
T
dispatcher::call(std::function<T()> request)
{
    if (this->strand->running_in_this_thread())
    {
        return request();
    }

    auto reply = std::make_shared<std::promise<T>>();
    auto result = reply->get_future();

    this->strand->post(
        [request = std::move(request), reply]()
        {
            try
            {
                if constexpr (std::is_void_v<T>)
                {
                    request();
                    reply->set_value();
                }
                else
                {
                    reply->set_value(request());
                }
            }
            catch (const std::exception&)
            {
                // the caller sees the failure, the control loop still goes down with it...
                reply->set_exception(std::current_exception());
                throw;
            }
        });

    return result.get();
}


void
dispatcher::do_register(std::shared_ptr<ehub::subscriber_base> subscriber, const std::vector<ehub::channel_t>& channels)
{
    const auto id = subscriber->get_subscriber_id();

    ehub::liveness_token_t token;

    if (auto record = this->registry.lookup(id))
    {
        // keep the observation we already have...
        token = record->token;
    }
    else
    {
        token = this->liveness->monitor(subscriber,
            [weak_self = weak_from_this()](ehub::liveness_token_t down_token, ehub::subscriber_id_t down_id)
            {
                if (auto self = weak_self.lock())
                {
                    self->strand->post(std::bind(&dispatcher::handle_subscriber_down, self, down_token, down_id));
                }
            });
    }

    this->registry.register_subscriber(id, token, subscriber, channels);
    this->update_status_snapshot();

    LOG(debug) << "subscriber [" << id << "] registered for " << channels.size() << " channels";
}


control_response::status_t
dispatcher::do_unregister(ehub::subscriber_id_t id)
{
    auto record = this->registry.lookup(id);

    if (!record)
    {
        LOG(debug) << "subscriber [" << id << "] is not registered";

        return control_response::NOT_REGISTERED;
    }

    this->registry.unregister_subscriber(id);
    this->update_status_snapshot();

    this->liveness->demonitor(record->token);

    LOG(debug) << "subscriber [" << id << "] unregistered";

    return control_response::OK;
}


void
dispatcher::do_publish(std::shared_ptr<const event_envelope> envelope)
{
    ++this->events_published;

    ehub::listener_set_t targets;

    if (auto listeners = this->registry.listeners_of(ehub::ALL_DBS_CHANNEL))
    {
        targets = std::move(*listeners);
    }

    if (envelope->channel() != ehub::ALL_DBS_CHANNEL)
    {
        if (auto listeners = this->registry.listeners_of(envelope->channel()))
        {
            targets.insert(listeners->begin(), listeners->end());
        }
    }

    for (const auto& id : targets)
    {
        // a destroyed subscriber is cleaned up once its down notification arrives...
        if (auto subscriber = this->registry.find_subscriber(id))
        {
            subscriber->send_event(envelope);
            ++this->events_delivered;
        }
    }
}


void
dispatcher::handle_subscriber_down(ehub::liveness_token_t token, ehub::subscriber_id_t id)
{
    auto record = this->registry.lookup(id);

    // stale notification for an observation that was cancelled or replaced...
    if (!record || record->token != token)
    {
        return;
    }

    this->registry.unregister_subscriber(id);
    this->update_status_snapshot();

    LOG(debug) << "subscriber [" << id << "] terminated, registrations removed";
}


void
dispatcher::spawn_watchdog()
{
    if (this->watchdog)
    {
        return;
    }

    this->watchdog = this->make_watchdog();
    const auto token = ++this->watchdog_token;

    this->update_status_snapshot();

    this->watchdog->start(
        [weak_self = weak_from_this(), token](const std::string& reason)
        {
            if (auto self = weak_self.lock())
            {
                self->strand->post(std::bind(&dispatcher::handle_watchdog_down, self, token, reason));
            }
        });
}


void
dispatcher::handle_watchdog_down(ehub::liveness_token_t token, const std::string& reason)
{
    if (!this->watchdog || token != this->watchdog_token)
    {
        return;
    }

    LOG(info) << "watchdog died: " << reason;

    this->watchdog.reset();
    ++this->watchdog_death_count;

    this->update_status_snapshot();

    this->respawn_timer->expires_from_now(this->watchdog_respawn_delay);
    this->respawn_timer->async_wait(this->strand->wrap(std::bind(&dispatcher::handle_respawn_timer, shared_from_this(), std::placeholders::_1)));
}


void
dispatcher::handle_respawn_timer(const boost::system::error_code& ec)
{
    if (ec)
    {
        return;
    }

    if (this->watchdog)
    {
        LOG(debug) << "watchdog already running";
        return;
    }

    LOG(info) << "respawning watchdog";

    this->spawn_watchdog();
}


void
dispatcher::update_status_snapshot()
{
    this->subscriber_count = this->registry.subscriber_count();
    this->channel_count = this->registry.channel_count();
    this->watchdog_running = bool(this->watchdog);
}
