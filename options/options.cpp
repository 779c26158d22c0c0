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


#include <options/options.hpp>
#include <boost/lexical_cast.hpp>
#include <regex>
#include <cstdint>

using namespace ehub;
using namespace ehub::option_names;

bool
options::parse_command_line(int argc, const char* argv[])
{
    return this->raw_opts.parse(argc, argv);
}

const simple_options&
options::get_simple_options() const
{
    return this->raw_opts;
}

simple_options&
options::get_mutable_simple_options()
{
    return this->raw_opts;
}


std::chrono::milliseconds
options::get_watchdog_interval() const
{
    return std::chrono::milliseconds(this->raw_opts.get<uint64_t>(WATCHDOG_INTERVAL));
}


std::chrono::milliseconds
options::get_watchdog_respawn_delay() const
{
    return std::chrono::milliseconds(this->raw_opts.get<uint64_t>(WATCHDOG_RESPAWN_DELAY));
}


std::chrono::milliseconds
options::get_liveness_purge_interval() const
{
    return std::chrono::milliseconds(this->raw_opts.get<uint64_t>(LIVENESS_PURGE_INTERVAL));
}


bool
options::get_peruser_enabled() const
{
    return this->raw_opts.get<bool>(PERUSER_ENABLED);
}


std::string
options::get_authentication_db() const
{
    return this->raw_opts.get<std::string>(AUTHENTICATION_DB);
}


std::string
options::get_userdb_prefix() const
{
    return this->raw_opts.get<std::string>(USERDB_PREFIX);
}


bool
options::get_debug_logging() const
{
    return this->raw_opts.get<bool>(DEBUG_LOGGING);
}


bool
options::get_log_to_stdout() const
{
    return this->raw_opts.get<bool>(LOG_TO_STDOUT);
}


std::string
options::get_logfile_dir() const
{
    return this->raw_opts.get<std::string>(LOGFILE_DIR);
}


size_t
options::get_logfile_rotation_size() const
{
    return this->parse_size(this->raw_opts.get<std::string>(LOGFILE_ROTATION_SIZE));
}


size_t
options::get_logfile_max_size() const
{
    return this->parse_size(this->raw_opts.get<std::string>(LOGFILE_MAX_SIZE));
}


size_t
options::parse_size(const std::string& max_value) const
{
    const std::regex expr{"(\\d+)([K,M,G,T]?[B]?)"};

    std::smatch base_match;
    if (std::regex_match(max_value, base_match, expr))
    {
        std::string suffix = base_match[2];

        return boost::lexical_cast<size_t>(base_match[1])
               * utils::BYTE_SUFFIXES.at(suffix.empty() ? 'B' : suffix[0]);
    }

    throw std::runtime_error(std::string("\nUnable to parse size value from options: " + max_value));
}
