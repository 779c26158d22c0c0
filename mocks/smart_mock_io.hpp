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
#include <mocks/mock_boost_asio.hpp>
#include <deque>
#include <map>


namespace ehub::asio
{
    /**
     * io_context whose strands and posts run handlers on the calling thread, one at a time and in order,
     * and whose timers only fire when a test calls them.
     */
    class smart_mock_io : public mock_io_context_base
    {
    public:

        smart_mock_io();

        void fire_timer(size_t id, const boost::system::error_code& ec = boost::system::error_code{});

        void shutdown();

        size_t timer_count = 0;
        std::map<size_t, ehub::asio::wait_handler> timer_callbacks;
        std::map<size_t, std::chrono::milliseconds> timer_expiries;
        std::map<size_t, size_t> timer_cancels;

    private:
        void wrapped_post(ehub::asio::task_handler task);

        std::deque<ehub::asio::task_handler> pending_tasks;
        bool running_task = false;
    };
}
