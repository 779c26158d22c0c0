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
#include <proto/ehub.pb.h>
#include <vector>


namespace ehub
{
    class dispatcher_base
    {
    public:
        virtual ~dispatcher_base() = default;

        virtual void start() = 0;

        virtual void stop() = 0;

        /**
         * Set the channels a subscriber receives events for, replacing whatever it registered before.
         * Returns once the registration is in effect.
         * @param subscriber    subscriber
         * @param channels      database names and/or ALL_DBS_CHANNEL
         */
        virtual void register_subscriber(std::shared_ptr<ehub::subscriber_base> subscriber, const std::vector<ehub::channel_t>& channels) = 0;

        /**
         * Drop all of a subscriber's registrations and stop watching it
         * @param subscriber    subscriber
         * @return OK or NOT_REGISTERED
         */
        virtual control_response::status_t unregister_subscriber(std::shared_ptr<ehub::subscriber_base> subscriber) = 0;

        /**
         * Queue an event for delivery to the listeners of a channel and of ALL_DBS_CHANNEL. Does not wait.
         * @param channel   database name
         * @param event     event
         */
        virtual void publish(const ehub::channel_t& channel, const db_event& event) = 0;

        /**
         * Message level entry point, unrecognized requests are answered IGNORED
         */
        virtual control_response handle_request(const control_request& request, std::shared_ptr<ehub::subscriber_base> subscriber) = 0;
    };

} // ehub
