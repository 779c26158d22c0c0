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

#include <boost/asio.hpp>
#include <chrono>
#include <functional>
#include <memory>


namespace ehub::asio
{
    // types...
    using    wait_handler = std::function<void(const boost::system::error_code& ec)>;
    using    task_handler = std::function<void()>;

    ///////////////////////////////////////////////////////////////////////////
    // mockable interfaces...

    class steady_timer_base
    {
    public:
        virtual ~steady_timer_base() = default;

        virtual void async_wait(wait_handler handler) = 0;

        virtual std::size_t expires_from_now(const std::chrono::milliseconds& expiry_time) = 0;

        virtual void cancel() = 0;

        virtual boost::asio::steady_timer& get_steady_timer() = 0;
    };

    ///////////////////////////////////////////////////////////////////////////

    class strand_base
    {
    public:
        virtual ~strand_base() = default;

        virtual ehub::asio::wait_handler wrap(wait_handler handler) = 0;

        virtual void post(task_handler handler) = 0;

        virtual bool running_in_this_thread() const = 0;

        virtual boost::asio::io_context::strand& get_strand() = 0;
    };

    ///////////////////////////////////////////////////////////////////////////

    class io_context_base
    {
    public:
        virtual ~io_context_base() = default;

        virtual std::unique_ptr<ehub::asio::steady_timer_base> make_unique_steady_timer() = 0;

        virtual std::unique_ptr<ehub::asio::strand_base> make_unique_strand() = 0;

        virtual void post(task_handler handler) = 0;

        virtual boost::asio::io_context::count_type run() = 0;

        virtual void stop() = 0;

        virtual boost::asio::io_context& get_io_context() = 0;
    };

    ///////////////////////////////////////////////////////////////////////////
    // the real thing...

    class steady_timer final : public steady_timer_base
    {
    public:
        explicit steady_timer(boost::asio::io_context& io_context)
            : timer(io_context)
        {
        }

        void async_wait(wait_handler handler) override
        {
            this->timer.async_wait(handler);
        }

        std::size_t expires_from_now(const std::chrono::milliseconds& expiry_time) override
        {
            return this->timer.expires_from_now(expiry_time);
        }

        void cancel() override
        {
            this->timer.cancel();
        }

        boost::asio::steady_timer& get_steady_timer() override
        {
            return this->timer;
        }

    private:
        boost::asio::steady_timer timer;
    };

    ///////////////////////////////////////////////////////////////////////////

    class strand final : public strand_base
    {
    public:
        explicit strand(boost::asio::io_context& io_context)
            : s(io_context)
        {
        }

        ehub::asio::wait_handler wrap(wait_handler handler) override
        {
            return this->s.wrap(std::move(handler));
        }

        void post(task_handler handler) override
        {
            this->s.post(std::move(handler));
        }

        bool running_in_this_thread() const override
        {
            return this->s.running_in_this_thread();
        }

        boost::asio::io_context::strand& get_strand() override
        {
            return this->s;
        }

    private:
        boost::asio::io_context::strand s;
    };

    ///////////////////////////////////////////////////////////////////////////

    class io_context final : public io_context_base
    {
    public:
        std::unique_ptr<ehub::asio::steady_timer_base> make_unique_steady_timer() override
        {
            return std::make_unique<ehub::asio::steady_timer>(this->io_context);
        }

        std::unique_ptr<ehub::asio::strand_base> make_unique_strand() override
        {
            return std::make_unique<ehub::asio::strand>(this->io_context);
        }

        void post(task_handler handler) override
        {
            boost::asio::post(this->io_context, std::move(handler));
        }

        boost::asio::io_context::count_type run() override
        {
            return this->io_context.run();
        }

        void stop() override
        {
            this->io_context.stop();
        }

        boost::asio::io_context& get_io_context() override
        {
            return this->io_context;
        }

    private:
        boost::asio::io_context io_context;
    };

} // ehub::asio
