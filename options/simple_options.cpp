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


#include <include/ehub.hpp>
#include <options/simple_options.hpp>
#include <json/json.h>
#include <boost/algorithm/string.hpp>
#include <boost/predef.h>
#include <cstring>
#include <iostream>
#include <fstream>

using namespace ehub;
using namespace ehub::option_names;
namespace po = boost::program_options;

namespace
{
    const std::string DEFAULT_CONFIG_FILE = "ehub.json";
}

simple_options::simple_options()
        : options_root("Core configuration")
        , cmd_opts(&(this->options_root))
        , config_file_opts(&(this->options_root))
{
    this->build_options();
    this->combine_options();
}

bool
simple_options::parse(int argc, const char* argv[])
{
    return this->handle_command_line_options(argc, argv) && this->handle_config_file_options() && this->combine_options() && this->validate_options();
}

void
simple_options::build_options()
{
    po::options_description cmd_only("Command line only");
    cmd_only.add_options()
                    ("help,h", "Shows this information")
                    ("version,v", "Shows the application's version")
                    ("config,c", po::value<std::string>()->default_value(DEFAULT_CONFIG_FILE), "Path to configuration file");
    this->options_root.add(cmd_only);

    this->options_root.add_options()
                (OVERRIDE_NUM_THREADS.c_str(),
                        po::value<size_t>(),
                        "number of worker threads to run (default is automatic based on hardware")
                (LIVENESS_PURGE_INTERVAL.c_str(),
                        po::value<uint64_t>()->default_value(15000),
                        "interval at which destroyed subscribers are purged (ms)");

    po::options_description watchdog("Watchdog");
    watchdog.add_options()
                (WATCHDOG_INTERVAL.c_str(),
                        po::value<uint64_t>()->default_value(5000),
                        "interval at which the change source is checked for attached observers (ms)")
                (WATCHDOG_RESPAWN_DELAY.c_str(),
                        po::value<uint64_t>()->default_value(60000),
                        "delay before a dead watchdog is respawned (ms)");
    this->options_root.add(watchdog);

    po::options_description peruser("Per-user databases");
    peruser.add_options()
                (PERUSER_ENABLED.c_str(),
                        po::value<bool>()->default_value(true),
                        "create a private database for every user")
                (AUTHENTICATION_DB.c_str(),
                        po::value<std::string>()->default_value("_users"),
                        "database holding the user documents")
                (USERDB_PREFIX.c_str(),
                        po::value<std::string>()->default_value("userdb-"),
                        "name prefix of user databases");
    this->options_root.add(peruser);

    po::options_description logging("Logging");
    logging.add_options()
                (LOG_TO_STDOUT.c_str(),
                        po::value<bool>()->default_value(false),
                        "log to stdout")
                (LOGFILE_DIR.c_str(),
                        po::value<std::string>()->default_value("logs/"),
                        "directory for log files")
                (LOGFILE_MAX_SIZE.c_str(),
                        po::value<std::string>()->default_value("512K"),
                        "maximum size for log files")
                (LOGFILE_ROTATION_SIZE.c_str(),
                        po::value<std::string>()->default_value("64K"),
                        "size at which to rotate log files")
                (DEBUG_LOGGING.c_str(),
                        po::value<bool>()->default_value(false),
                        "enable debug logging");
    this->options_root.add(logging);
}

bool
simple_options::validate_options()
{
    this->vm.notify();
    bool errors = false;

    // Boost will enforce types of options, we only need to validate more complex constraints

    if (this->get<uint64_t>(WATCHDOG_INTERVAL) == 0)
    {
        std::cerr << "Invalid " << WATCHDOG_INTERVAL << ": must be greater than zero\n";
        errors = true;
    }

    if (this->get<uint64_t>(LIVENESS_PURGE_INTERVAL) == 0)
    {
        std::cerr << "Invalid " << LIVENESS_PURGE_INTERVAL << ": must be greater than zero\n";
        errors = true;
    }

    if (this->get<std::string>(USERDB_PREFIX).empty())
    {
        std::cerr << "Invalid " << USERDB_PREFIX << ": must not be empty\n";
        errors = true;
    }

    return !errors;
}

bool
simple_options::handle_config_file_options()
{
    Json::Value json;

    std::ifstream ifile;
    ifile.exceptions(std::ios::failbit);

    try
    {
        ifile.open(config_file);
    }
    catch (const std::exception& /*ex*/)
    {
        throw std::runtime_error("Failed to load: " + config_file + " : " + strerror(errno));
    }

    Json::CharReaderBuilder builder;
    std::string errors;
    ifile.exceptions(std::ios::goodbit);

    if (!Json::parseFromStream(builder, ifile, &json, &errors))
    {
        throw std::runtime_error("Failed to parse: " + config_file + " : " + errors);
    }

    if (!json.isObject())
    {
        throw std::runtime_error("Config file should be an object");
    }

    this->config_file_opts = po::parsed_options{&(this->options_root)};

    for (const auto& name : json.getMemberNames())
    {
        const auto& json_val = json[name];

        if (! this->options_root.find_nothrow(name.c_str(), false))
        {
            std::cerr << "Warning: ignoring unknown config file option '" << name << "'\n";
            continue;
        }

        boost::program_options::basic_option<char> opt;
        opt.string_key = name;

        if (json_val.isString())
        {
            opt.value.push_back(json_val.asString());
        }
        else
        {
            // If it's not a string, then it should be a bool or a number, so we can let boost parse it
            auto option_value = json_val.toStyledString();
            boost::trim(option_value); // jsoncpp sometimes includes a trailing newline here

            opt.value.push_back(option_value);
        }

        this->config_file_opts.options.push_back(opt);
    }

    return true;
}

bool
simple_options::handle_command_line_options(int argc, const char* argv[])
{
    try
    {
        this->cmd_opts = po::parse_command_line(argc, argv, this->options_root);
        po::variables_map early_vm;
        po::store(this->cmd_opts, early_vm);

        if (early_vm.count("version"))
        {
            std::cout << "ehub" << ": " << EHUB_VERSION << std::endl;

            std::string compiler_name = "unknown";
            if (BOOST_COMP_CLANG)
            {
                compiler_name = "clang";
            }

            if (BOOST_COMP_GNUC){
                compiler_name = "gcc";
            }

#ifdef __OPTIMIZE__
            bool opt = true;
#else
            bool opt = false;
#endif

            std::cout << "compiled by " << compiler_name <<  __VERSION__ << "; optimize=" << opt << std::endl;

            return false;
        }

        if (early_vm.count("help") || early_vm.count("config") == 0)
        {
            std::cout << "Usage:" << '\n'
                      << "  " << "ehubd" << " [OPTION]" << '\n'
                      << "Long form options may be specified on command line or in json object in config file" << '\n'
                      << '\n' << this->options_root << '\n';

            return false;
        }

        this->config_file = early_vm["config"].as<std::string>();
        return true;
    }
    catch (po::error& e)
    {
        std::cerr << "ERROR: " << e.what() << std::endl << std::endl;
        return false;
    }
}

bool
simple_options::combine_options()
{
    boost::program_options::parsed_options override_opts(&(this->options_root));
    for (const auto& pair : this->overrides)
    {
        po::basic_option<char> opt;
        opt.string_key = pair.first;
        opt.value.push_back(pair.second);
        override_opts.options.push_back(opt);
    }

    // first store wins, so overrides beat the command line which beats the config file...
    this->vm = boost::program_options::variables_map{};
    po::store(override_opts, this->vm);
    po::store(this->cmd_opts, this->vm);
    po::store(this->config_file_opts, this->vm);

    return true;
}

bool
simple_options::has(const std::string& option_name) const
{
    return this->vm.count(option_name) > 0;
}

void
simple_options::set(const std::string& option_name, const std::string& option_value)
{
    std::lock_guard<std::mutex> lock(this->lock);
    this->overrides[option_name] = option_value;
    this->combine_options();
}
