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

#include <change_source/change_source_base.hpp>
#include <include/boost_asio.hpp>
#include <map>
#include <mutex>


namespace ehub
{
    class change_source final : public ehub::change_source_base, public std::enable_shared_from_this<change_source>
    {
    public:
        explicit change_source(std::shared_ptr<ehub::asio::io_context_base> io_context);

        ehub::observer_id_t add_observer(ehub::change_observer observer) override;

        bool remove_observer(ehub::observer_id_t id) override;

        bool has_observers() const override;

        size_t observer_count() const override;

        void notify(const ehub::channel_t& channel, const db_event& event) override;

        void terminate(const std::string& reason) override;

        /**
         * Install the owner's restart policy, run on the io_context after each termination
         */
        void set_restart_handler(ehub::change_source_restart_handler handler);

        size_t get_restart_count() const;

    private:
        void restart(const std::string& reason);

        std::shared_ptr<ehub::asio::io_context_base> io_context;

        std::map<ehub::observer_id_t, ehub::change_observer> observers;
        ehub::observer_id_t next_observer_id = 1;

        ehub::change_source_restart_handler restart_handler;
        size_t restart_count = 0;

        mutable std::mutex lock;
    };

} // ehub
