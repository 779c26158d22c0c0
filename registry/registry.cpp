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


#include <registry/registry.hpp>
#include <stdexcept>

using namespace ehub;


void
registry::register_subscriber(ehub::subscriber_id_t id, ehub::liveness_token_t token,
    std::weak_ptr<ehub::subscriber_base> subscriber, const std::vector<ehub::channel_t>& channels)
{
    // drop the old reverse links first so nothing from the previous set survives...
    this->unregister_subscriber(id);

    auto& record = this->by_subscriber[id];
    record.token = token;
    record.subscriber = std::move(subscriber);
    record.channels = ehub::channel_set_t(channels.begin(), channels.end());

    for (const auto& channel : record.channels)
    {
        this->add_listener(channel, id);
    }
}


bool
registry::unregister_subscriber(ehub::subscriber_id_t id)
{
    auto subscriber_it = this->by_subscriber.find(id);

    if (subscriber_it == this->by_subscriber.end())
    {
        return false;
    }

    const auto channels = std::move(subscriber_it->second.channels);
    this->by_subscriber.erase(subscriber_it);

    for (const auto& channel : channels)
    {
        this->remove_listener(channel, id);
    }

    return true;
}


std::optional<ehub::subscriber_record>
registry::lookup(ehub::subscriber_id_t id) const
{
    if (auto subscriber_it = this->by_subscriber.find(id); subscriber_it != this->by_subscriber.end())
    {
        return subscriber_it->second;
    }

    return std::nullopt;
}


std::optional<ehub::listener_set_t>
registry::listeners_of(const ehub::channel_t& channel) const
{
    if (auto channel_it = this->by_channel.find(channel); channel_it != this->by_channel.end())
    {
        return channel_it->second;
    }

    return std::nullopt;
}


std::shared_ptr<ehub::subscriber_base>
registry::find_subscriber(ehub::subscriber_id_t id) const
{
    if (auto subscriber_it = this->by_subscriber.find(id); subscriber_it != this->by_subscriber.end())
    {
        return subscriber_it->second.subscriber.lock();
    }

    return nullptr;
}


size_t
registry::subscriber_count() const
{
    return this->by_subscriber.size();
}


size_t
registry::channel_count() const
{
    return this->by_channel.size();
}


bool
registry::is_consistent() const
{
    for (const auto& [id, record] : this->by_subscriber)
    {
        for (const auto& channel : record.channels)
        {
            auto channel_it = this->by_channel.find(channel);

            if (channel_it == this->by_channel.end() || channel_it->second.count(id) == 0)
            {
                return false;
            }
        }
    }

    for (const auto& [channel, listeners] : this->by_channel)
    {
        if (listeners.empty())
        {
            return false;
        }

        for (const auto& id : listeners)
        {
            auto subscriber_it = this->by_subscriber.find(id);

            if (subscriber_it == this->by_subscriber.end() || subscriber_it->second.channels.count(channel) == 0)
            {
                return false;
            }
        }
    }

    return true;
}


void
registry::add_listener(const ehub::channel_t& channel, ehub::subscriber_id_t id)
{
    this->by_channel[channel].insert(id);
}


void
registry::remove_listener(const ehub::channel_t& channel, ehub::subscriber_id_t id)
{
    auto channel_it = this->by_channel.find(channel);

    if (channel_it == this->by_channel.end() || channel_it->second.erase(id) == 0)
    {
        throw std::logic_error("registry corrupted: subscriber " + std::to_string(id) + " missing from channel " + channel);
    }

    if (channel_it->second.empty())
    {
        this->by_channel.erase(channel_it);
    }
}
