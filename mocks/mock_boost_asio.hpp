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

#include <include/boost_asio.hpp>
#include <gmock/gmock.h>


// gmock_gen.py generated...

namespace ehub::asio {

    class mock_steady_timer_base : public steady_timer_base {
    public:
        MOCK_METHOD1(async_wait,
            void(wait_handler handler));
        MOCK_METHOD1(expires_from_now,
            std::size_t(const std::chrono::milliseconds& expiry_time));
        MOCK_METHOD0(cancel,
            void());
        MOCK_METHOD0(get_steady_timer,
            boost::asio::steady_timer&());
    };

}  // namespace ehub::asio


namespace ehub::asio {

    class mock_strand_base : public strand_base {
    public:
        MOCK_METHOD1(wrap,
            ehub::asio::wait_handler(wait_handler handler));
        MOCK_METHOD1(post,
            void(task_handler handler));
        MOCK_CONST_METHOD0(running_in_this_thread,
            bool());
        MOCK_METHOD0(get_strand,
            boost::asio::io_context::strand&());
    };

}  // namespace ehub::asio


namespace ehub::asio {

    class mock_io_context_base : public io_context_base {
    public:
        MOCK_METHOD0(make_unique_steady_timer,
            std::unique_ptr<ehub::asio::steady_timer_base>());
        MOCK_METHOD0(make_unique_strand,
            std::unique_ptr<ehub::asio::strand_base>());
        MOCK_METHOD1(post,
            void(task_handler handler));
        MOCK_METHOD0(run,
            boost::asio::io_context::count_type());
        MOCK_METHOD0(stop,
            void());
        MOCK_METHOD0(get_io_context,
            boost::asio::io_context&());
    };

}  // namespace ehub::asio
