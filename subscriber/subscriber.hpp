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

#include <subscriber/subscriber_base.hpp>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>


namespace ehub
{
    /**
     * Subscriber with a bounded mailbox. Events arriving while the mailbox is full are dropped, the
     * publisher is never held up.
     */
    class subscriber final : public ehub::subscriber_base
    {
    public:
        explicit subscriber(size_t queue_capacity);

        ~subscriber();

        ehub::subscriber_id_t get_subscriber_id() const override { return this->subscriber_id; }

        void send_event(std::shared_ptr<const event_envelope> event) override;

        ehub::shutdown_handler_id_t add_shutdown_handler(ehub::subscriber_shutdown_handler handler) override;

        void remove_shutdown_handler(ehub::shutdown_handler_id_t id) override;

        /**
         * Wait for the next event
         * @param timeout   how long to wait
         * @return event or nullptr on timeout or once closed and drained
         */
        std::shared_ptr<const event_envelope> receive(std::chrono::milliseconds timeout);

        std::shared_ptr<const event_envelope> try_receive();

        size_t pending() const;

        size_t dropped() const;

        size_t shutdown_handler_count() const;

        /**
         * Terminate the subscriber. Shutdown handlers run once, further events are discarded.
         */
        void close();

        bool is_closed() const;

    private:
        const ehub::subscriber_id_t subscriber_id;
        const size_t queue_capacity;

        std::deque<std::shared_ptr<const event_envelope>> inbox;
        std::map<ehub::shutdown_handler_id_t, ehub::subscriber_shutdown_handler> shutdown_handlers;
        ehub::shutdown_handler_id_t next_shutdown_handler_id = 1;

        mutable std::mutex lock;
        std::condition_variable inbox_cv;

        bool closed = false;
        size_t dropped_events = 0;
    };

} // ehub
