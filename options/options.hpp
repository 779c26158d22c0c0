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

#include <options/options_base.hpp>


namespace ehub
{
    class options final : public ehub::options_base
    {
    public:
        const simple_options& get_simple_options() const override;

        simple_options& get_mutable_simple_options() override;

        bool parse_command_line(int argc, const char* argv[]);

        std::chrono::milliseconds get_watchdog_interval() const override;

        std::chrono::milliseconds get_watchdog_respawn_delay() const override;

        std::chrono::milliseconds get_liveness_purge_interval() const override;

        bool get_peruser_enabled() const override;

        std::string get_authentication_db() const override;

        std::string get_userdb_prefix() const override;

        bool get_debug_logging() const override;

        bool get_log_to_stdout() const override;

        std::string get_logfile_dir() const override;

        size_t get_logfile_rotation_size() const override ;

        size_t get_logfile_max_size() const override;

    private:
        size_t parse_size(const std::string& key) const;

        simple_options raw_opts;

    };

} // ehub
