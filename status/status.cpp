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


#include <status/status.hpp>
#include <ehub_version.hpp>
#include <sstream>

using namespace ehub;

namespace
{
    const std::string NAME_KEY{"name"};
    const std::string STATUS_KEY{"status"};
    const std::string VERSION_KEY{"version"};
    const std::string MODULE_KEY{"module"};
    const std::string UPTIME_KEY{"uptime"};

    std::string get_uptime(const std::chrono::steady_clock::time_point& start_time)
    {
        using namespace std::chrono;

        auto uptime = duration_cast<seconds>(steady_clock::now() - start_time);

        auto d = duration_cast<duration<int64_t, std::ratio<3600 * 24>>>(uptime);
        auto h = duration_cast<hours>(uptime -= d);
        auto m = duration_cast<minutes>(uptime -= h);

        std::stringstream ss;
        ss << d.count() << " days, " << h.count() << " hours, " << m.count() << " minutes";

        return ss.str();
    }
}


status::status(ehub::status::status_provider_list_t&& status_providers)
    : status_providers(std::move(status_providers))
    , start_time(std::chrono::steady_clock::now())
{
}


ehub::json_message
status::get_report()
{
    ehub::json_message report;

    report[VERSION_KEY] = EHUB_VERSION;
    report[UPTIME_KEY] = get_uptime(this->start_time);
    report[MODULE_KEY] = this->query_modules();

    return report;
}


ehub::json_message
status::query_modules()
{
    ehub::json_message module_status(Json::arrayValue);

    for (const auto& provider : this->status_providers)
    {
        if (auto provider_shared_ptr = provider.lock())
        {
            ehub::json_message entry;

            entry[NAME_KEY] = provider_shared_ptr->get_name();
            entry[STATUS_KEY] = provider_shared_ptr->get_status();

            module_status.append(entry);
        }
    }

    return module_status;
}
