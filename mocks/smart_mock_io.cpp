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


#include <mocks/smart_mock_io.hpp>

using namespace ::testing;
using namespace ehub;


ehub::asio::smart_mock_io::smart_mock_io()
{
    EXPECT_CALL(*this, make_unique_strand()).WillRepeatedly(Invoke(
            [&]()
            {
                auto strand = std::make_unique<NiceMock<ehub::asio::mock_strand_base>>();
                EXPECT_CALL(*strand, wrap(_)).WillRepeatedly(ReturnArg<0>());
                EXPECT_CALL(*strand, post(_)).WillRepeatedly(Invoke(
                        [&](auto task)
                        {
                            this->wrapped_post(task);
                        }));
                EXPECT_CALL(*strand, running_in_this_thread()).WillRepeatedly(Invoke(
                        [&]()
                        {
                            return this->running_task;
                        }));

                return strand;
            }));

    EXPECT_CALL(*this, post(_)).WillRepeatedly(Invoke(
            [&](auto func)
            {
                this->wrapped_post(func);
            }));

    EXPECT_CALL(*this, make_unique_steady_timer()).WillRepeatedly(Invoke(
            [&]()
            {
                auto id = timer_count++;

                auto timer = std::make_unique<NiceMock<ehub::asio::mock_steady_timer_base>>();
                EXPECT_CALL(*timer, async_wait(_)).WillRepeatedly(Invoke(
                        [&, id](auto wh)
                        {
                            this->timer_callbacks[id] = wh;
                        }));
                EXPECT_CALL(*timer, expires_from_now(_)).WillRepeatedly(Invoke(
                        [&, id](const std::chrono::milliseconds& expiry)
                        {
                            this->timer_expiries[id] = expiry;
                            return std::size_t(0);
                        }));
                EXPECT_CALL(*timer, cancel()).WillRepeatedly(Invoke(
                        [&, id]()
                        {
                            ++this->timer_cancels[id];
                        }));

                return timer;
            }));
}


void
ehub::asio::smart_mock_io::fire_timer(size_t id, const boost::system::error_code& ec)
{
    // a handler normally re-arms its own timer, so take it out first...
    auto handler = this->timer_callbacks.at(id);
    this->timer_callbacks.erase(id);

    handler(ec);
}


void
ehub::asio::smart_mock_io::shutdown()
{
    if (!this->pending_tasks.empty())
    {
        LOG(error) << "Warning: shutting down mock io context while it still has pending tasks to execute";
    }

    // These callbacks are likely to transitively hold a shared pointers to us,
    // so cleaning them up is necessary for us to be cleaned up
    this->timer_callbacks.clear();
    this->pending_tasks.clear();
}


void
ehub::asio::smart_mock_io::wrapped_post(ehub::asio::task_handler task)
{
    this->pending_tasks.emplace_back(std::move(task));

    // posted from inside a running task, it runs once that one is done...
    if (this->running_task)
    {
        return;
    }

    this->running_task = true;

    while (!this->pending_tasks.empty())
    {
        auto next = std::move(this->pending_tasks.front());
        this->pending_tasks.pop_front();

        try
        {
            next();
        }
        catch (const std::exception&)
        {
            this->running_task = false;
            this->pending_tasks.clear();
            throw;
        }
    }

    this->running_task = false;
}
