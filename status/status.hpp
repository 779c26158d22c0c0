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

#include <include/ehub.hpp>
#include <status/status_provider_base.hpp>
#include <chrono>
#include <memory>
#include <vector>


namespace ehub
{
    class status final
    {
    public:
        using status_provider_list_t = std::vector<std::weak_ptr<ehub::status_provider_base>>;

        explicit status(status_provider_list_t&& status_providers);

        /**
         * Version, uptime and the status of every provider still alive
         * @return report
         */
        ehub::json_message get_report();

    private:
        ehub::json_message query_modules();

        status_provider_list_t status_providers;

        const std::chrono::steady_clock::time_point start_time;
    };

} // namespace ehub
