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


#include <dispatcher/dispatcher.hpp>
#include <liveness/liveness_monitor.hpp>
#include <subscriber/subscriber.hpp>
#include <mocks/smart_mock_io.hpp>
#include <mocks/mock_liveness_monitor_base.hpp>
#include <mocks/mock_watchdog_base.hpp>
#include <future>
#include <random>
#include <thread>

using namespace ::testing;

namespace
{
    const std::chrono::milliseconds TEST_PURGE_INTERVAL{15000};
    const std::chrono::milliseconds TEST_RESPAWN_DELAY{60000};

    // timers are handed out in construction order: the liveness purge timer, then the respawn timer...
    const size_t RESPAWN_TIMER_ID = 1;

    db_event
    make_event(const std::string& doc_id)
    {
        db_event event;
        event.set_type(db_event::UPDATED);
        event.mutable_change()->set_id(doc_id);

        return event;
    }

    size_t
    drain(ehub::subscriber& subscriber, std::vector<ehub::channel_t>* channels = nullptr)
    {
        size_t count = 0;

        while (auto envelope = subscriber.try_receive())
        {
            if (channels)
            {
                channels->emplace_back(envelope->channel());
            }
            ++count;
        }

        return count;
    }
}

namespace ehub
{
    class dispatcher_test : public Test
    {
    public:
        std::shared_ptr<ehub::asio::smart_mock_io> mock_io = std::make_shared<NiceMock<ehub::asio::smart_mock_io>>();

        std::shared_ptr<ehub::liveness_monitor> liveness = std::make_shared<ehub::liveness_monitor>(this->mock_io, TEST_PURGE_INTERVAL);

        std::vector<std::shared_ptr<ehub::mock_watchdog_base>> watchdogs;
        std::vector<ehub::watchdog_death_handler> death_handlers;

        std::shared_ptr<ehub::dispatcher> test_dispatcher = std::make_shared<ehub::dispatcher>(this->mock_io, this->liveness,
            [this]()
            {
                return this->make_watchdog();
            },
            TEST_RESPAWN_DELAY);

        std::shared_ptr<ehub::watchdog_base> make_watchdog()
        {
            auto watchdog = std::make_shared<NiceMock<ehub::mock_watchdog_base>>();

            EXPECT_CALL(*watchdog, start(_)).WillOnce(Invoke(
                [this](auto handler)
                {
                    this->death_handlers.emplace_back(handler);
                }));

            this->watchdogs.emplace_back(watchdog);

            return watchdog;
        }

        std::shared_ptr<ehub::subscriber> make_subscriber()
        {
            return std::make_shared<ehub::subscriber>(100);
        }

        ~dispatcher_test()
        {
            this->mock_io->shutdown();
        }
    };


    TEST_F(dispatcher_test, test_that_start_spawns_one_watchdog)
    {
        this->test_dispatcher->start();
        this->test_dispatcher->start();

        EXPECT_EQ(this->watchdogs.size(), size_t(1));
        EXPECT_EQ(this->death_handlers.size(), size_t(1));

        // liveness purge timer...
        EXPECT_EQ(this->mock_io->timer_callbacks.count(0), size_t(1));

        EXPECT_EQ(this->test_dispatcher->get_status()["watchdog"].asString(), "running");
    }


    TEST_F(dispatcher_test, test_that_channel_and_wildcard_listeners_receive_publish)
    {
        this->test_dispatcher->start();

        auto s1 = this->make_subscriber();
        auto s2 = this->make_subscriber();

        this->test_dispatcher->register_subscriber(s1, {"db_a"});
        this->test_dispatcher->register_subscriber(s2, {ehub::ALL_DBS_CHANNEL});

        this->test_dispatcher->publish("db_a", make_event("doc1"));

        EXPECT_EQ(drain(*s1), size_t(1));

        std::vector<ehub::channel_t> channels;
        EXPECT_EQ(drain(*s2, &channels), size_t(1));
        EXPECT_EQ(channels, std::vector<ehub::channel_t>{"db_a"});

        this->test_dispatcher->publish("db_b", make_event("doc2"));

        EXPECT_EQ(drain(*s1), size_t(0));
        EXPECT_EQ(drain(*s2), size_t(1));
    }


    TEST_F(dispatcher_test, test_that_reregistering_drops_previous_channels)
    {
        auto s1 = this->make_subscriber();

        this->test_dispatcher->register_subscriber(s1, {"db_a", "db_b"});
        this->test_dispatcher->register_subscriber(s1, {"db_b"});

        this->test_dispatcher->publish("db_a", make_event("doc1"));
        EXPECT_EQ(drain(*s1), size_t(0));

        this->test_dispatcher->publish("db_b", make_event("doc2"));
        EXPECT_EQ(drain(*s1), size_t(1));

        // still one observation for the subscriber...
        EXPECT_EQ(this->liveness->monitored_count(), size_t(1));
    }


    TEST_F(dispatcher_test, test_that_subscriber_on_channel_and_wildcard_gets_one_copy)
    {
        auto s1 = this->make_subscriber();

        this->test_dispatcher->register_subscriber(s1, {"db_a", ehub::ALL_DBS_CHANNEL});

        this->test_dispatcher->publish("db_a", make_event("doc1"));
        EXPECT_EQ(drain(*s1), size_t(1));

        // publishing on the wildcard name itself reaches only the wildcard listeners...
        auto s2 = this->make_subscriber();
        this->test_dispatcher->register_subscriber(s2, {"db_a"});

        this->test_dispatcher->publish(ehub::ALL_DBS_CHANNEL, make_event("doc2"));
        EXPECT_EQ(drain(*s1), size_t(1));
        EXPECT_EQ(drain(*s2), size_t(0));
    }


    TEST_F(dispatcher_test, test_that_publish_without_listeners_is_harmless)
    {
        this->test_dispatcher->publish("nobody", make_event("doc1"));

        auto status = this->test_dispatcher->get_status();

        EXPECT_EQ(status["events_published"].asUInt64(), 1u);
        EXPECT_EQ(status["events_delivered"].asUInt64(), 0u);
    }


    TEST_F(dispatcher_test, test_that_unregister_removes_subscriber)
    {
        auto s1 = this->make_subscriber();

        this->test_dispatcher->register_subscriber(s1, {"db_a"});

        EXPECT_EQ(this->test_dispatcher->unregister_subscriber(s1), control_response::OK);
        EXPECT_EQ(this->test_dispatcher->unregister_subscriber(s1), control_response::NOT_REGISTERED);

        EXPECT_EQ(this->liveness->monitored_count(), size_t(0));

        this->test_dispatcher->publish("db_a", make_event("doc1"));
        EXPECT_EQ(drain(*s1), size_t(0));

        EXPECT_EQ(this->test_dispatcher->get_status()["subscribers"].asUInt64(), 0u);
    }


    TEST_F(dispatcher_test, test_that_register_unregister_cycles_do_not_pile_up_shutdown_hooks)
    {
        auto s1 = this->make_subscriber();

        for (size_t i = 0; i < 1000; ++i)
        {
            this->test_dispatcher->register_subscriber(s1, {"db_a"});
            EXPECT_EQ(this->test_dispatcher->unregister_subscriber(s1), control_response::OK);
        }

        EXPECT_EQ(this->liveness->monitored_count(), size_t(0));
        EXPECT_LE(s1->shutdown_handler_count(), size_t(1));

        // registered once more, termination is still noticed...
        this->test_dispatcher->register_subscriber(s1, {"db_a"});
        EXPECT_EQ(s1->shutdown_handler_count(), size_t(1));

        s1->close();

        EXPECT_EQ(this->test_dispatcher->get_status()["subscribers"].asUInt64(), 0u);
    }


    TEST_F(dispatcher_test, test_that_terminated_subscriber_is_cleaned_up)
    {
        auto s1 = this->make_subscriber();
        auto s2 = this->make_subscriber();

        this->test_dispatcher->register_subscriber(s1, {"db_a", "db_b"});
        this->test_dispatcher->register_subscriber(s2, {"db_b"});

        s1->close();

        auto status = this->test_dispatcher->get_status();
        EXPECT_EQ(status["subscribers"].asUInt64(), 1u);
        EXPECT_EQ(status["channels"].asUInt64(), 1u);
        EXPECT_EQ(this->liveness->monitored_count(), size_t(1));

        // destroying works as well as closing...
        s2.reset();

        status = this->test_dispatcher->get_status();
        EXPECT_EQ(status["subscribers"].asUInt64(), 0u);
        EXPECT_EQ(status["channels"].asUInt64(), 0u);
    }


    TEST_F(dispatcher_test, test_that_handle_request_answers_control_messages)
    {
        auto s1 = this->make_subscriber();

        control_request subscribe;
        subscribe.mutable_subscribe()->add_channels("db_a");
        subscribe.mutable_subscribe()->add_channels("db_b");

        EXPECT_EQ(this->test_dispatcher->handle_request(subscribe, s1).status(), control_response::OK);

        this->test_dispatcher->publish("db_b", make_event("doc1"));
        EXPECT_EQ(drain(*s1), size_t(1));

        control_request unsubscribe;
        unsubscribe.mutable_unsubscribe();

        EXPECT_EQ(this->test_dispatcher->handle_request(unsubscribe, s1).status(), control_response::OK);
        EXPECT_EQ(this->test_dispatcher->handle_request(unsubscribe, s1).status(), control_response::NOT_REGISTERED);

        // unrecognized...
        EXPECT_EQ(this->test_dispatcher->handle_request(control_request(), s1).status(), control_response::IGNORED);
        EXPECT_EQ(this->test_dispatcher->handle_request(subscribe, nullptr).status(), control_response::IGNORED);

        EXPECT_EQ(this->test_dispatcher->get_status()["subscribers"].asUInt64(), 0u);
    }


    TEST_F(dispatcher_test, test_that_dead_watchdog_is_respawned_after_delay)
    {
        this->test_dispatcher->start();
        ASSERT_EQ(this->death_handlers.size(), size_t(1));

        this->death_handlers[0]("change source is not running");

        auto status = this->test_dispatcher->get_status();
        EXPECT_EQ(status["watchdog"].asString(), "stopped");
        EXPECT_EQ(status["watchdog_deaths"].asUInt64(), 1u);

        ASSERT_EQ(this->mock_io->timer_callbacks.count(RESPAWN_TIMER_ID), size_t(1));
        EXPECT_EQ(this->mock_io->timer_expiries[RESPAWN_TIMER_ID], TEST_RESPAWN_DELAY);
        EXPECT_EQ(this->watchdogs.size(), size_t(1));

        auto late_expiry = this->mock_io->timer_callbacks.at(RESPAWN_TIMER_ID);

        this->mock_io->fire_timer(RESPAWN_TIMER_ID);

        EXPECT_EQ(this->watchdogs.size(), size_t(2));
        EXPECT_EQ(this->test_dispatcher->get_status()["watchdog"].asString(), "running");

        // an expiry while a watchdog is running does nothing...
        late_expiry(boost::system::error_code());
        EXPECT_EQ(this->watchdogs.size(), size_t(2));

        // neither does a report from a watchdog that was already replaced...
        this->death_handlers[0]("late");

        status = this->test_dispatcher->get_status();
        EXPECT_EQ(status["watchdog"].asString(), "running");
        EXPECT_EQ(status["watchdog_deaths"].asUInt64(), 1u);
    }


    TEST_F(dispatcher_test, test_that_watchdog_death_leaves_registrations_alone)
    {
        this->test_dispatcher->start();

        auto s1 = this->make_subscriber();
        this->test_dispatcher->register_subscriber(s1, {"db_a"});

        this->death_handlers[0]("boom");

        this->test_dispatcher->publish("db_a", make_event("doc1"));
        EXPECT_EQ(drain(*s1), size_t(1));
    }


    TEST_F(dispatcher_test, test_that_stop_stops_the_watchdog)
    {
        this->test_dispatcher->start();
        ASSERT_EQ(this->watchdogs.size(), size_t(1));

        EXPECT_CALL(*this->watchdogs[0], stop()).Times(1);

        this->test_dispatcher->stop();

        EXPECT_EQ(this->mock_io->timer_cancels[RESPAWN_TIMER_ID], size_t(1));
        EXPECT_EQ(this->test_dispatcher->get_status()["watchdog"].asString(), "stopped");
    }


    TEST_F(dispatcher_test, test_that_status_reports_name_and_delivery_counts)
    {
        auto s1 = this->make_subscriber();
        auto s2 = this->make_subscriber();

        this->test_dispatcher->register_subscriber(s1, {"db_a"});
        this->test_dispatcher->register_subscriber(s2, {ehub::ALL_DBS_CHANNEL});

        this->test_dispatcher->publish("db_a", make_event("doc1"));
        this->test_dispatcher->publish("db_c", make_event("doc2"));

        EXPECT_EQ(this->test_dispatcher->get_name(), "dispatcher");

        auto status = this->test_dispatcher->get_status();
        EXPECT_EQ(status["subscribers"].asUInt64(), 2u);
        EXPECT_EQ(status["channels"].asUInt64(), 2u);
        EXPECT_EQ(status["events_published"].asUInt64(), 2u);
        EXPECT_EQ(status["events_delivered"].asUInt64(), 3u);
    }


    TEST_F(dispatcher_test, test_that_registry_stays_consistent_across_random_operations)
    {
        const std::vector<ehub::channel_t> channel_pool{"db_a", "db_b", "db_c", "db_d", ehub::ALL_DBS_CHANNEL};

        std::vector<std::shared_ptr<ehub::subscriber>> subscribers;
        for (size_t i = 0; i < 8; ++i)
        {
            subscribers.emplace_back(this->make_subscriber());
        }

        std::mt19937 gen(1234);
        std::uniform_int_distribution<size_t> pick_subscriber(0, subscribers.size() - 1);
        std::uniform_int_distribution<size_t> pick_channel(0, channel_pool.size() - 1);
        std::uniform_int_distribution<size_t> pick_op(0, 9);
        std::uniform_int_distribution<size_t> pick_count(0, 4);

        for (size_t step = 0; step < 2000; ++step)
        {
            auto& subscriber = subscribers[pick_subscriber(gen)];

            switch (pick_op(gen))
            {
                case 0:
                case 1:
                case 2:
                case 3:
                {
                    std::vector<ehub::channel_t> channels;
                    for (size_t n = pick_count(gen); n > 0; --n)
                    {
                        channels.emplace_back(channel_pool[pick_channel(gen)]);
                    }

                    this->test_dispatcher->register_subscriber(subscriber, channels);
                    break;
                }

                case 4:
                case 5:
                    this->test_dispatcher->unregister_subscriber(subscriber);
                    break;

                case 6:
                    // abrupt termination, replaced by a fresh subscriber...
                    subscriber->close();
                    subscriber = this->make_subscriber();
                    break;

                default:
                    this->test_dispatcher->publish(channel_pool[pick_channel(gen)], make_event(std::to_string(step)));
                    drain(*subscriber);
                    break;
            }

            ASSERT_TRUE(this->test_dispatcher->registry.is_consistent()) << "after step " << step;
        }

        // closed subscribers never linger...
        for (const auto& subscriber : subscribers)
        {
            this->test_dispatcher->unregister_subscriber(subscriber);
        }

        EXPECT_EQ(this->test_dispatcher->registry.subscriber_count(), size_t(0));
        EXPECT_EQ(this->test_dispatcher->registry.channel_count(), size_t(0));
        EXPECT_EQ(this->liveness->monitored_count(), size_t(0));
    }


    TEST(dispatcher_liveness_test, test_that_stale_down_notification_is_ignored)
    {
        auto mock_io = std::make_shared<NiceMock<ehub::asio::smart_mock_io>>();
        auto mock_liveness = std::make_shared<StrictMock<ehub::mock_liveness_monitor_base>>();

        auto test_dispatcher = std::make_shared<ehub::dispatcher>(mock_io, mock_liveness,
            []() -> std::shared_ptr<ehub::watchdog_base> { return nullptr; }, TEST_RESPAWN_DELAY);

        auto s1 = std::make_shared<ehub::subscriber>(10);

        std::vector<ehub::liveness_down_handler> handlers;
        EXPECT_CALL(*mock_liveness, monitor(_, _)).Times(2)
            .WillOnce(Invoke([&handlers](auto, auto handler){ handlers.emplace_back(handler); return ehub::liveness_token_t(1); }))
            .WillOnce(Invoke([&handlers](auto, auto handler){ handlers.emplace_back(handler); return ehub::liveness_token_t(2); }));
        EXPECT_CALL(*mock_liveness, demonitor(ehub::liveness_token_t(1))).WillOnce(Return(true));

        test_dispatcher->register_subscriber(s1, {"db_a"});

        // keeps its first observation...
        test_dispatcher->register_subscriber(s1, {"db_b"});

        EXPECT_EQ(test_dispatcher->unregister_subscriber(s1), control_response::OK);
        test_dispatcher->register_subscriber(s1, {"db_a"});

        ASSERT_EQ(handlers.size(), size_t(2));

        // report for the cancelled observation...
        handlers[0](1, s1->get_subscriber_id());
        EXPECT_EQ(test_dispatcher->get_status()["subscribers"].asUInt64(), 1u);

        handlers[1](2, s1->get_subscriber_id());
        EXPECT_EQ(test_dispatcher->get_status()["subscribers"].asUInt64(), 0u);

        mock_io->shutdown();
    }


    TEST(dispatcher_status_test, test_that_status_from_the_only_worker_thread_does_not_block)
    {
        auto io_context = std::make_shared<ehub::asio::io_context>();
        auto work = boost::asio::make_work_guard(io_context->get_io_context());

        auto liveness = std::make_shared<ehub::liveness_monitor>(io_context, TEST_PURGE_INTERVAL);
        auto test_dispatcher = std::make_shared<ehub::dispatcher>(io_context, liveness,
            []() -> std::shared_ptr<ehub::watchdog_base> { return nullptr; }, TEST_RESPAWN_DELAY);

        std::thread worker([io_context]()
        {
            io_context->run();
        });

        auto s1 = std::make_shared<ehub::subscriber>(10);
        test_dispatcher->register_subscriber(s1, {"db_a"});

        auto reported = std::make_shared<std::promise<ehub::json_message>>();
        auto report = reported->get_future();

        io_context->post([test_dispatcher, reported]()
        {
            reported->set_value(test_dispatcher->get_status());
        });

        const bool ready = report.wait_for(std::chrono::seconds(5)) == std::future_status::ready;

        work.reset();
        io_context->stop();
        worker.join();

        ASSERT_TRUE(ready);
        EXPECT_EQ(report.get()["subscribers"].asUInt64(), 1u);
    }

} // ehub
