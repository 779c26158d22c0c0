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


#include <change_source/change_source.hpp>
#include <dispatcher/dispatcher.hpp>
#include <liveness/liveness_monitor.hpp>
#include <options/options.hpp>
#include <options/simple_options.hpp>
#include <peruser/peruser.hpp>
#include <status/status.hpp>
#include <storage/mem_account_store.hpp>
#include <watchdog/watchdog.hpp>

#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <iomanip>
#include <iostream>
#include <thread>


void
init_logging(const ehub::options& options)
{
    namespace keywords = boost::log::keywords;

    const auto format = boost::log::expressions::stream
            << boost::log::expressions::format_date_time< boost::posix_time::ptime >("TimeStamp", "[%Y-%m-%d %H:%M:%S.%f UTC]")
            << " [" << boost::log::expressions::attr< boost::log::attributes::current_thread_id::value_type >("ThreadID")
            << "] [" << std::setw(5) << std::left << boost::log::trivial::severity << "] " << boost::log::expressions::smessage;

    auto sink = boost::log::add_file_log
        (
            keywords::file_name = options.get_logfile_dir() + "/ehub-%5N.log",
            keywords::rotation_size = options.get_logfile_rotation_size(),
            keywords::open_mode = std::ios_base::app,
            keywords::auto_flush = true,
            keywords::format = format
        );

    boost::log::core::get()->add_global_attribute("TimeStamp", boost::log::attributes::utc_clock());

    if (options.get_log_to_stdout())
    {
        boost::log::add_console_log(std::cout, keywords::format = format, keywords::auto_flush = true);
    }

    boost::log::add_common_attributes();

    sink->locked_backend()->set_file_collector(boost::log::sinks::file::make_collector
        (
            keywords::target = options.get_logfile_dir(),
            keywords::max_size = options.get_logfile_max_size()
        ));

    sink->locked_backend()->scan_for_files();

    boost::log::core::get()->add_sink(sink);

    if (options.get_debug_logging())
    {
        LOG(info) << "debug logging enabled";

        boost::log::core::get()->set_filter(boost::log::trivial::severity >= boost::log::trivial::debug);
    }
    else
    {
        LOG(info) << "debug logging disabled";

        boost::log::core::get()->set_filter(boost::log::trivial::severity > boost::log::trivial::debug);
    }
}


void
print_banner(const ehub::options& options)
{
    std::stringstream ss;

    ss << '\n';
    ss << "          ehub version: " << EHUB_VERSION << "\n"
       << "     Watchdog interval: " << options.get_watchdog_interval().count() << " ms\n"
       << " Watchdog respawn delay: " << options.get_watchdog_respawn_delay().count() << " ms\n"
       << "  Per-user databases: " << (options.get_peruser_enabled() ? "enabled for " + options.get_authentication_db() : "disabled") << "\n"
       << '\n';

    LOG(info) << ss.str();

    if (!options.get_log_to_stdout())
    {
        std::cout << ss.str();
    }
}


void
wait_for_status_signal(std::shared_ptr<boost::asio::signal_set> signals, std::shared_ptr<ehub::status> status)
{
    signals->async_wait([signals, status](const boost::system::error_code& error, int /*signal_number*/)
        {
            if (!error)
            {
                LOG(info) << "status: " << status->get_report().toStyledString();

                wait_for_status_signal(signals, status);
            }
        });
}


std::vector<std::thread>
start_worker_threads(std::shared_ptr<ehub::asio::io_context_base> io_context, std::shared_ptr<ehub::options_base> options)
{
    std::vector<std::thread> workers;

    size_t thread_count;
    if (options->get_simple_options().has(ehub::option_names::OVERRIDE_NUM_THREADS))
    {
        thread_count = options->get_simple_options().get<size_t>(ehub::option_names::OVERRIDE_NUM_THREADS);
    }
    else
    {
        // synchronous registration blocks a thread while the dispatcher works on another...
        thread_count = std::max(2u, std::thread::hardware_concurrency());
    }

    LOG(info) << "starting " << thread_count << " worker threads";

    for (size_t i = 0; i < thread_count; ++i)
    {
        workers.emplace_back(std::thread([io_context]
        {
            io_context->run();
        }));
    }

    return workers;
}


int
main(int argc, const char* argv[])
{
    try
    {
        auto options = std::make_shared<ehub::options>();
        if (!options->parse_command_line(argc, argv))
        {
            return 1;
        }

        init_logging(*options);

        auto io_context = std::make_shared<ehub::asio::io_context>();
        auto work = boost::asio::make_work_guard(io_context->get_io_context());

        // setup signal handler...
        boost::asio::signal_set signals(io_context->get_io_context(), SIGINT, SIGTERM);

        // startup...
        auto source = std::make_shared<ehub::change_source>(io_context);
        auto liveness = std::make_shared<ehub::liveness_monitor>(io_context, options->get_liveness_purge_interval());

        // the daemon owns no database: a storage layer embedding ehub calls dispatcher->publish(db_name, event)
        // after each committed change, which is what feeds peruser...
        auto dispatcher = std::make_shared<ehub::dispatcher>(io_context, liveness,
            [io_context, weak_source = std::weak_ptr<ehub::change_source_base>(source), interval = options->get_watchdog_interval()]()
            {
                return std::make_shared<ehub::watchdog>(io_context, weak_source, interval);
            },
            options->get_watchdog_respawn_delay());

        source->set_restart_handler([](const std::string& reason)
            {
                LOG(debug) << "change source back with an empty observer list after: " << reason;
            });

        auto status = std::make_shared<ehub::status>(ehub::status::status_provider_list_t{dispatcher});

        auto status_signal = std::make_shared<boost::asio::signal_set>(io_context->get_io_context(), SIGUSR1);
        wait_for_status_signal(status_signal, status);

        std::shared_ptr<ehub::peruser> peruser;

        signals.async_wait([io_context, &work, dispatcher, status_signal](const boost::system::error_code& error, int signal_number)
            {
                if (!error)
                {
                    LOG(info) << "signal received -- shutting down (" << signal_number << ")";

                    dispatcher->stop();
                    status_signal->cancel();
                    work.reset();
                    io_context->stop();
                }
            });

        dispatcher->start();

        auto workers = start_worker_threads(io_context, options);

        // registration is a round trip through the dispatcher, so the workers have to be running...
        if (options->get_peruser_enabled())
        {
            peruser = std::make_shared<ehub::peruser>(io_context, dispatcher, std::make_shared<ehub::mem_account_store>(),
                options->get_authentication_db(), options->get_userdb_prefix());
            peruser->start();
        }

        print_banner(*options);

        // wait for shutdown...
        for (auto& t : workers)
        {
            t.join();
        }

        if (peruser)
        {
            peruser->stop();
        }
    }
    catch(std::exception& ex)
    {
        LOG(fatal) << ex.what();
        std::cerr << '\n' << ex.what() << '\n';
        return 1;
    }

    return 0;
}
