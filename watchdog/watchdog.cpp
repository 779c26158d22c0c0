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


#include <watchdog/watchdog.hpp>
#include <stdexcept>

using namespace ehub;


watchdog::watchdog(std::shared_ptr<ehub::asio::io_context_base> io_context, std::weak_ptr<ehub::change_source_base> source,
    std::chrono::milliseconds interval)
    : source(std::move(source))
    , interval_timer(io_context->make_unique_steady_timer())
    , interval(interval)
{
}


void
watchdog::start(ehub::watchdog_death_handler handler)
{
    std::call_once(this->start_once,
        [this, &handler]()
        {
            this->death_handler = std::move(handler);

            // first check right away, then once per interval...
            this->check_and_rearm();
        });
}


void
watchdog::stop()
{
    this->stopped = true;
    this->interval_timer->cancel();
}


size_t
watchdog::get_forced_terminations() const
{
    return this->forced_terminations;
}


void
watchdog::start_timer()
{
    this->interval_timer->expires_from_now(this->interval);
    this->interval_timer->async_wait(std::bind(&watchdog::handle_timeout, shared_from_this(), std::placeholders::_1));
}


void
watchdog::handle_timeout(const boost::system::error_code& ec)
{
    if (ec || this->stopped)
    {
        return;
    }

    this->check_and_rearm();
}


void
watchdog::check_and_rearm()
{
    try
    {
        this->check_source();
    }
    catch (const std::exception& ex)
    {
        this->die(ex.what());
        return;
    }

    this->start_timer();
}


void
watchdog::check_source()
{
    auto source = this->source.lock();

    if (!source)
    {
        throw std::runtime_error("change source is not running");
    }

    if (source->has_observers())
    {
        LOG(warning) << "change source has " << source->observer_count() << " observers attached, forcing restart";

        ++this->forced_terminations;
        source->terminate(WATCHDOG_FORCE_REASON);
    }
}


void
watchdog::die(const std::string& reason)
{
    if (this->stopped.exchange(true))
    {
        return;
    }

    if (this->death_handler)
    {
        this->death_handler(reason);
    }
}
