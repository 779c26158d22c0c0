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

#include <boost/log/trivial.hpp>
#include <string_view>
#include <json/json.h>
#include <ehub_version.hpp>
#include <cstdint>
#include <string>
#include <unordered_set>


namespace ehub
{
    using channel_t = std::string;

    using channel_set_t = std::unordered_set<channel_t>;

    using json_message = Json::Value;

    using liveness_token_t = uint64_t;

    using observer_id_t = uint64_t;

    using subscriber_id_t = uint64_t;

    // reserved channel name whose listeners receive every publish...
    const channel_t ALL_DBS_CHANNEL{"all_dbs"};

    /**
     * Allocate a process wide unique subscriber id
     * @return id
     */
    subscriber_id_t next_subscriber_id();

} // ehub


namespace ehub::utils
{
    constexpr
    std::string_view basename(const std::string_view& path)
    {
        return path.substr(path.rfind('/') + 1);
    }
} // ehub::utils


// logging
#define LOG(x) BOOST_LOG_TRIVIAL(x) << "(" << ehub::utils::basename(__FILE__) << ":"  << __LINE__ << ") - "

// This limits the number of characters that are displayed in "LOG(x) <<"  messages.
const uint16_t MAX_MESSAGE_SIZE = 1024;
