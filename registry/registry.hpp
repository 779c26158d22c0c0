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


#pragma once

#include <include/ehub.hpp>
#include <subscriber/subscriber_base.hpp>
#include <optional>
#include <unordered_map>
#include <vector>


namespace ehub
{
    using listener_set_t = std::unordered_set<ehub::subscriber_id_t>;

    struct subscriber_record
    {
        ehub::liveness_token_t token;
        std::weak_ptr<ehub::subscriber_base> subscriber;
        ehub::channel_set_t channels;
    };

    /**
     * Bidirectional subscriber/channel index. Not thread safe: every call must come from the single
     * writer that owns it.
     *
     * For every subscriber S and channel C: S is a listener of C iff C is in the channel set of S, and a
     * channel entry only exists while it has listeners.
     */
    class registry final
    {
    public:
        /**
         * Set the channels a subscriber listens on, replacing any previous set
         * @param id            subscriber id
         * @param token         liveness token of the subscriber's observation
         * @param subscriber    handle used for delivery
         * @param channels      channel names, duplicates collapse
         */
        void register_subscriber(ehub::subscriber_id_t id, ehub::liveness_token_t token,
            std::weak_ptr<ehub::subscriber_base> subscriber, const std::vector<ehub::channel_t>& channels);

        /**
         * Remove a subscriber and all of its channel memberships
         * @param id    subscriber id
         * @return false if the subscriber was not registered
         */
        bool unregister_subscriber(ehub::subscriber_id_t id);

        std::optional<ehub::subscriber_record> lookup(ehub::subscriber_id_t id) const;

        std::optional<ehub::listener_set_t> listeners_of(const ehub::channel_t& channel) const;

        /**
         * Resolve a registered subscriber's handle for delivery
         * @return nullptr if unknown or already destroyed
         */
        std::shared_ptr<ehub::subscriber_base> find_subscriber(ehub::subscriber_id_t id) const;

        size_t subscriber_count() const;

        size_t channel_count() const;

        /**
         * Check both indexes mirror each other and that no empty channel entry is left behind
         */
        bool is_consistent() const;

    private:
        void add_listener(const ehub::channel_t& channel, ehub::subscriber_id_t id);

        void remove_listener(const ehub::channel_t& channel, ehub::subscriber_id_t id);

        std::unordered_map<ehub::subscriber_id_t, ehub::subscriber_record> by_subscriber;
        std::unordered_map<ehub::channel_t, ehub::listener_set_t> by_channel;
    };

} // ehub
