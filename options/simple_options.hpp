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

#include <boost/program_options.hpp>
#include <boost/program_options/variables_map.hpp>
#include <map>
#include <mutex>
#include <string>

namespace ehub::option_names
{
    const std::string AUTHENTICATION_DB = "authentication_db";
    const std::string DEBUG_LOGGING = "debug_logging";
    const std::string LIVENESS_PURGE_INTERVAL = "liveness_purge_interval_ms";
    const std::string LOG_TO_STDOUT = "log_to_stdout";
    const std::string LOGFILE_DIR = "logfile_dir";
    const std::string LOGFILE_MAX_SIZE = "logfile_max_size";
    const std::string LOGFILE_ROTATION_SIZE = "logfile_rotation_size";
    const std::string OVERRIDE_NUM_THREADS = "override_num_threads";
    const std::string PERUSER_ENABLED = "peruser_enabled";
    const std::string USERDB_PREFIX = "userdb_prefix";
    const std::string WATCHDOG_INTERVAL = "watchdog_interval_ms";
    const std::string WATCHDOG_RESPAWN_DELAY = "watchdog_respawn_delay_ms";
}

namespace ehub
{
    class simple_options
    {
    public:
        simple_options();

        /*
         * Read command line to find location of config file, read config file for everything else
         */
        bool parse(int argc, const char* argv[]);

        /*
         * Get the value of a particular option (options defined in ehub::option_names) with a particular type
         */
        template<typename T>
        T
        get(const std::string& option_name) const
        {
            if (this->has(option_name))
            {
                return this->vm[option_name].as<T>();
            }
            else
            {
                return T();
            }
        }

        /*
         * Assign a value to an option at runtime
         */
        void set(const std::string& option_name, const std::string& option_value);

        /*
         * Do we have a value for an option (either explicit or default)
         */
        bool has(const std::string& option_name) const;

    private:
        void build_options();
        bool validate_options();
        bool handle_command_line_options(int argc, const char* argv[]);
        bool handle_config_file_options();
        bool combine_options();

        std::string config_file;
        boost::program_options::options_description options_root;
        boost::program_options::parsed_options cmd_opts;
        boost::program_options::parsed_options config_file_opts;
        boost::program_options::variables_map vm;

        std::map<std::string, std::string> overrides;
        std::mutex lock;
    };
}
