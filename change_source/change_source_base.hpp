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


namespace ehub
{
    using change_observer = std::function<void(const ehub::channel_t& channel, const db_event& event)>;

    using change_source_restart_handler = std::function<void(const std::string& reason)>;

    /**
     * Source of database change notifications with its own observer list. When it is suspected wedged it
     * is terminated and its restart policy brings it back with an empty observer list.
     */
    class change_source_base
    {
    public:
        virtual ~change_source_base() = default;

        virtual ehub::observer_id_t add_observer(ehub::change_observer observer) = 0;

        virtual bool remove_observer(ehub::observer_id_t id) = 0;

        virtual bool has_observers() const = 0;

        virtual size_t observer_count() const = 0;

        /**
         * Pass a change to every attached observer
         */
        virtual void notify(const ehub::channel_t& channel, const db_event& event) = 0;

        /**
         * Abnormally terminate the source and hand it to its restart policy
         * @param reason    why the source is being terminated
         */
        virtual void terminate(const std::string& reason) = 0;
    };

} // ehub
