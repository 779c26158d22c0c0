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

#include <watchdog/watchdog_base.hpp>
#include <change_source/change_source_base.hpp>
#include <include/boost_asio.hpp>
#include <atomic>
#include <mutex>


namespace ehub
{
    class watchdog final : public ehub::watchdog_base, public std::enable_shared_from_this<watchdog>
    {
    public:
        watchdog(std::shared_ptr<ehub::asio::io_context_base> io_context, std::weak_ptr<ehub::change_source_base> source,
            std::chrono::milliseconds interval);

        void start(ehub::watchdog_death_handler handler) override;

        void stop() override;

        size_t get_forced_terminations() const;

    private:
        void start_timer();

        void handle_timeout(const boost::system::error_code& ec);

        void check_and_rearm();

        void check_source();

        void die(const std::string& reason);

        std::weak_ptr<ehub::change_source_base> source;

        std::unique_ptr<ehub::asio::steady_timer_base> interval_timer;

        const std::chrono::milliseconds interval;

        ehub::watchdog_death_handler death_handler;

        std::atomic<bool> stopped = false;
        std::atomic<size_t> forced_terminations = 0;

        std::once_flag start_once;
    };

} // ehub
