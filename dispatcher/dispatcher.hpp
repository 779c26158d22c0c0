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

#include <dispatcher/dispatcher_base.hpp>
#include <include/boost_asio.hpp>
#include <liveness/liveness_monitor_base.hpp>
#include <registry/registry.hpp>
#include <status/status_provider_base.hpp>
#include <watchdog/watchdog_base.hpp>
#include <atomic>
#include <mutex>

#include <gtest/gtest_prod.h>


namespace ehub
{
    using watchdog_factory = std::function<std::shared_ptr<ehub::watchdog_base>()>;

    class dispatcher final : public ehub::dispatcher_base, public ehub::status_provider_base, public std::enable_shared_from_this<dispatcher>
    {
    public:
        dispatcher(std::shared_ptr<ehub::asio::io_context_base> io_context, std::shared_ptr<ehub::liveness_monitor_base> liveness,
            ehub::watchdog_factory make_watchdog, std::chrono::milliseconds watchdog_respawn_delay);

        void start() override;

        void stop() override;

        void register_subscriber(std::shared_ptr<ehub::subscriber_base> subscriber, const std::vector<ehub::channel_t>& channels) override;

        control_response::status_t unregister_subscriber(std::shared_ptr<ehub::subscriber_base> subscriber) override;

        void publish(const ehub::channel_t& channel, const db_event& event) override;

        control_response handle_request(const control_request& request, std::shared_ptr<ehub::subscriber_base> subscriber) override;

        std::string get_name() override;

        ehub::json_message get_status() override;

    private:
        FRIEND_TEST(dispatcher_test, test_that_registry_stays_consistent_across_random_operations);

        template<typename T>
        T call(std::function<T()> request);

        void do_register(std::shared_ptr<ehub::subscriber_base> subscriber, const std::vector<ehub::channel_t>& channels);

        control_response::status_t do_unregister(ehub::subscriber_id_t id);

        void do_publish(std::shared_ptr<const event_envelope> envelope);

        void handle_subscriber_down(ehub::liveness_token_t token, ehub::subscriber_id_t id);

        void spawn_watchdog();

        void handle_watchdog_down(ehub::liveness_token_t token, const std::string& reason);

        void handle_respawn_timer(const boost::system::error_code& ec);

        void update_status_snapshot();

        std::unique_ptr<ehub::asio::strand_base> strand;

        std::shared_ptr<ehub::liveness_monitor_base> liveness;

        // only touched from within the strand...
        ehub::registry registry;

        const ehub::watchdog_factory make_watchdog;
        std::shared_ptr<ehub::watchdog_base> watchdog;
        ehub::liveness_token_t watchdog_token = 0;

        std::unique_ptr<ehub::asio::steady_timer_base> respawn_timer;
        const std::chrono::milliseconds watchdog_respawn_delay;

        // written from within the strand, read by get_status from any thread...
        std::atomic<uint64_t> subscriber_count = 0;
        std::atomic<uint64_t> channel_count = 0;
        std::atomic<bool> watchdog_running = false;
        std::atomic<uint64_t> watchdog_death_count = 0;
        std::atomic<uint64_t> events_published = 0;
        std::atomic<uint64_t> events_delivered = 0;

        std::once_flag start_once;
    };

} // ehub
