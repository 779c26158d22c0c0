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
#include <proto/ehub.pb.h>
#include <functional>
#include <memory>


namespace ehub
{
    using subscriber_shutdown_handler = std::function<void()>;
    using shutdown_handler_id_t = uint64_t;

    class subscriber_base
    {
    public:
        virtual ~subscriber_base() = default;

        /**
         * Get the id associated with this subscriber
         * @return id
         */
        virtual ehub::subscriber_id_t get_subscriber_id() const = 0;

        /**
         * Hand an event to the subscriber's inbound queue. Must not block: a subscriber that cannot keep up
         * drops or defers on its own.
         * @param event     event tagged with the channel it was published on
         */
        virtual void send_event(std::shared_ptr<const event_envelope> event) = 0;

        /**
         * Register a handler called once when this subscriber terminates. Handlers added after termination
         * are called immediately.
         * @param handler   handler
         * @return id for remove_shutdown_handler, 0 if the handler already ran
         */
        virtual ehub::shutdown_handler_id_t add_shutdown_handler(ehub::subscriber_shutdown_handler handler) = 0;

        /**
         * Drop a handler that has not run yet. Unknown ids are ignored.
         * @param id    id returned by add_shutdown_handler
         */
        virtual void remove_shutdown_handler(ehub::shutdown_handler_id_t id) = 0;
    };

} // ehub
