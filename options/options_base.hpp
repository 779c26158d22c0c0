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
#include <options/simple_options.hpp>
#include <string>
#include <map>
#include <chrono>


namespace ehub
{
    // Suffixes for the max size parser.
    namespace utils
    {
        const std::map<char, size_t> BYTE_SUFFIXES = std::map<char, size_t>({{'B', 1},
                                                                             {'K', 1024},
                                                                             {'M', 1048576},
                                                                             {'G', 1073741824},
                                                                             {'T', 1099511627776}});
    }

    class options_base
    {
    public:
        virtual ~options_base() = default;

        /**
         * @return the raw_options container for accessing simple options
         */
        virtual const simple_options& get_simple_options() const = 0;


        /**
         * @return the raw_options container for accessing simple options
         */
        virtual simple_options& get_mutable_simple_options() = 0;


        /**
         * How often the watchdog looks at the change source
         * @return interval
         */
        virtual std::chrono::milliseconds get_watchdog_interval() const = 0;


        /**
         * How long a dead watchdog stays dead
         * @return delay
         */
        virtual std::chrono::milliseconds get_watchdog_respawn_delay() const = 0;


        virtual std::chrono::milliseconds get_liveness_purge_interval() const = 0;


        /**
         * Should user databases be provisioned?
         * @return true if enabled
         */
        virtual bool get_peruser_enabled() const = 0;


        /**
         * Name of the database holding user documents
         * @return database name
         */
        virtual std::string get_authentication_db() const = 0;


        virtual std::string get_userdb_prefix() const = 0;


        /**
         * Debug logging level?
         * @return true if we should log debug entries
         */
        virtual bool get_debug_logging() const = 0;


        /**
         * Log to terminal instead of disk.
         * @return true if we log to stdout
         */
        virtual bool get_log_to_stdout() const = 0;


        /**
         * Get the director to log into
         * @return directory
         */
        virtual std::string get_logfile_dir() const = 0;


        /**
         * Get the size of a log file to rotate
         * @return size
         */
        virtual size_t get_logfile_rotation_size() const = 0;


        /**
         * Get the total size of logs before deletion
         * @return size
         */
        virtual size_t get_logfile_max_size() const = 0;
    };
} // ehub
