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

#include <liveness/liveness_monitor_base.hpp>
#include <include/boost_asio.hpp>
#include <mutex>
#include <unordered_map>


namespace ehub
{
    class liveness_monitor final : public ehub::liveness_monitor_base, public std::enable_shared_from_this<liveness_monitor>
    {
    public:
        liveness_monitor(std::shared_ptr<ehub::asio::io_context_base> io_context, std::chrono::milliseconds purge_interval);

        void start() override;

        ehub::liveness_token_t monitor(std::shared_ptr<ehub::subscriber_base> subscriber, ehub::liveness_down_handler handler) override;

        bool demonitor(ehub::liveness_token_t token) override;

        size_t monitored_count() const override;

    private:
        struct observation
        {
            std::weak_ptr<ehub::subscriber_base> subscriber;
            ehub::subscriber_id_t subscriber_id;
            ehub::liveness_down_handler handler;
            ehub::shutdown_handler_id_t hook = 0;
        };

        void notify_down(ehub::liveness_token_t token);

        void start_purge_timer();

        void purge_expired(const boost::system::error_code& ec);

        std::unordered_map<ehub::liveness_token_t, observation> observations;

        ehub::liveness_token_t next_token = 1;

        mutable std::mutex observations_lock;

        std::unique_ptr<ehub::asio::steady_timer_base> purge_timer;

        const std::chrono::milliseconds purge_interval;

        std::once_flag start_once;
    };

} // ehub
