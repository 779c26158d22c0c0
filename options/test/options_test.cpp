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
#include <options/options.hpp>
#include <boost/lexical_cast.hpp>
#include <algorithm>
#include <fstream>
#include <gtest/gtest.h>
#include <unordered_set>
#include <unistd.h>


namespace
{
    const char* NO_ARGS[] = {"config_tests"};

    const std::string TEST_CONFIG_FILE = "ehub.json";

    const std::string DEFAULT_CONFIG_CONTENT =
        "  \"watchdog_interval_ms\" : 2500,\n"
        "  \"watchdog_respawn_delay_ms\" : 30000,\n"
        "  \"liveness_purge_interval_ms\" : 1000,\n"
        "  \"peruser_enabled\" : false,\n"
        "  \"authentication_db\" : \"accounts\",\n"
        "  \"userdb_prefix\" : \"private-\",\n"
        "  \"debug_logging\" : true,"
        "  \"log_to_stdout\" : true,"
        "  \"logfile_max_size\" : \"1M\","
        "  \"logfile_rotation_size\" : \"2M\","
        "  \"logfile_dir\" : \".\"";

    const std::string DEFAULT_CONFIG_DATA = "{" + DEFAULT_CONFIG_CONTENT + "}";

    std::string compose_config_data(const std::string& a, const std::string& b)
    {
        std::string result = "{" + a + ",\n" + b + "}";
        return result;
    }
}

using namespace ::testing;


// create default options and remove when done...
class options_file_test : public Test
{
public:

    std::unordered_set<std::string> open_files;

    options_file_test()
    {
        this->save_options_file(DEFAULT_CONFIG_DATA);
    }

    ~options_file_test()
    {
        for(const auto& file : this->open_files)
        {
            unlink(file.c_str());
        }
    }

    void save_file(const std::string& filename, const std::string& content)
    {
        this->open_files.insert(filename);

        std::ofstream ofile(filename.c_str(), std::ios::trunc);
        ofile.exceptions(std::ios::failbit);
        ofile << content;
    }

    void
    save_options_file(const std::string& content)
    {
        save_file(TEST_CONFIG_FILE, content);
    }
};


TEST_F(options_file_test, test_that_loading_of_default_config_file)
{
    ehub::options options;

    ASSERT_TRUE(options.parse_command_line(1, NO_ARGS));

    EXPECT_EQ(std::chrono::milliseconds(2500), options.get_watchdog_interval());
    EXPECT_EQ(std::chrono::milliseconds(30000), options.get_watchdog_respawn_delay());
    EXPECT_EQ(std::chrono::milliseconds(1000), options.get_liveness_purge_interval());
    EXPECT_FALSE(options.get_peruser_enabled());
    EXPECT_EQ("accounts", options.get_authentication_db());
    EXPECT_EQ("private-", options.get_userdb_prefix());
    ASSERT_EQ(true, options.get_debug_logging());
    ASSERT_EQ(true, options.get_log_to_stdout());
    EXPECT_EQ(size_t(1048576), options.get_logfile_max_size());
    EXPECT_EQ(size_t(2097152), options.get_logfile_rotation_size());
    EXPECT_EQ(".", options.get_logfile_dir());
}


TEST_F(options_file_test, test_that_defaults_are_used_for_missing_options)
{
    this->save_options_file("{}");

    ehub::options options;

    ASSERT_TRUE(options.parse_command_line(1, NO_ARGS));

    EXPECT_EQ(std::chrono::milliseconds(5000), options.get_watchdog_interval());
    EXPECT_EQ(std::chrono::milliseconds(60000), options.get_watchdog_respawn_delay());
    EXPECT_EQ(std::chrono::milliseconds(15000), options.get_liveness_purge_interval());
    EXPECT_TRUE(options.get_peruser_enabled());
    EXPECT_EQ("_users", options.get_authentication_db());
    EXPECT_EQ("userdb-", options.get_userdb_prefix());
    EXPECT_FALSE(options.get_debug_logging());
    EXPECT_FALSE(options.get_log_to_stdout());
    EXPECT_EQ(size_t(524288), options.get_logfile_max_size());
    EXPECT_EQ(size_t(65536), options.get_logfile_rotation_size());
    EXPECT_EQ("logs/", options.get_logfile_dir());
    EXPECT_FALSE(options.get_simple_options().has(ehub::option_names::OVERRIDE_NUM_THREADS));
}


TEST(options, test_that_defaults_are_available_before_parsing)
{
    ehub::options options;

    EXPECT_EQ(std::chrono::milliseconds(5000), options.get_watchdog_interval());
    EXPECT_EQ(std::chrono::milliseconds(60000), options.get_watchdog_respawn_delay());
    EXPECT_EQ("_users", options.get_authentication_db());
}


TEST(options, test_that_missing_default_config_throws_exception)
{
    ehub::options options;

    EXPECT_THROW(options.parse_command_line(1, NO_ARGS), std::runtime_error);
}


TEST_F(options_file_test, test_that_invalid_config_is_rejected)
{
    {
        this->save_options_file("[1, 2, 3]");
        ehub::options options;
        EXPECT_THROW(options.parse_command_line(1, NO_ARGS), std::runtime_error);
    }
    {
        this->save_options_file("{ \"watchdog_interval_ms\" : ");
        ehub::options options;
        EXPECT_THROW(options.parse_command_line(1, NO_ARGS), std::runtime_error);
    }
}


TEST_F(options_file_test, test_that_out_of_range_values_fail_validation)
{
    {
        this->save_options_file("{\"watchdog_interval_ms\" : 0}");
        ehub::options options;
        EXPECT_FALSE(options.parse_command_line(1, NO_ARGS));
    }
    {
        this->save_options_file("{\"liveness_purge_interval_ms\" : 0}");
        ehub::options options;
        EXPECT_FALSE(options.parse_command_line(1, NO_ARGS));
    }
    {
        this->save_options_file("{\"userdb_prefix\" : \"\"}");
        ehub::options options;
        EXPECT_FALSE(options.parse_command_line(1, NO_ARGS));
    }
}


TEST_F(options_file_test, test_that_unknown_options_are_ignored)
{
    this->save_options_file(compose_config_data(DEFAULT_CONFIG_CONTENT, "\"no_such_option\" : 42"));

    ehub::options options;

    ASSERT_TRUE(options.parse_command_line(1, NO_ARGS));
    EXPECT_EQ(std::chrono::milliseconds(2500), options.get_watchdog_interval());
}


TEST_F(options_file_test, test_log_size_parsing)
{
    std::for_each(ehub::utils::BYTE_SUFFIXES.cbegin()
            , ehub::utils::BYTE_SUFFIXES.cend()
            , [&](const auto& p)
                  {
                      const size_t expected = 3 * 1099511627776; // 3TB in B
                      {
                          const auto size = boost::lexical_cast<std::string>(expected / p.second) + p.first;

                          this->save_options_file("{\"logfile_max_size\" : \"" + size + "\"}");

                          ehub::options options;
                          options.parse_command_line(1, NO_ARGS);

                          EXPECT_EQ(expected, options.get_logfile_max_size());
                      }
                      {
                          std::string size{boost::lexical_cast<std::string>(expected / p.second)};
                          size = size + p.first;
                          if (p.first!='B')
                          {
                              size = size.append("B");
                          }

                          this->save_options_file("{\"logfile_max_size\" : \"" + size + "\"}");

                          ehub::options options;
                          options.parse_command_line(1, NO_ARGS);

                          EXPECT_EQ(expected, options.get_logfile_max_size());
                      }
                  });

    this->save_options_file("{\"logfile_max_size\" : \"lots\"}");

    ehub::options options;
    options.parse_command_line(1, NO_ARGS);

    EXPECT_THROW(options.get_logfile_max_size(), std::runtime_error);
}


TEST_F(options_file_test, test_that_command_line_options_work)
{
    const std::string other_config = "other_ehub.json";
    this->save_file(other_config, "{\"watchdog_interval_ms\" : 7000, \"authentication_db\" : \"people\"}");

    ehub::options options;
    const char* ARGS[] = {"ehubd", "-c", other_config.c_str(), "--authentication_db", "members"};

    ASSERT_TRUE(options.parse_command_line(5, ARGS));

    EXPECT_EQ(std::chrono::milliseconds(7000), options.get_watchdog_interval());

    // the command line beats the config file...
    EXPECT_EQ("members", options.get_authentication_db());
}


TEST_F(options_file_test, test_that_help_and_version_do_not_continue)
{
    {
        ehub::options options;
        const char* ARGS[] = {"ehubd", "--help"};
        EXPECT_FALSE(options.parse_command_line(2, ARGS));
    }
    {
        ehub::options options;
        const char* ARGS[] = {"ehubd", "--version"};
        EXPECT_FALSE(options.parse_command_line(2, ARGS));
    }
    {
        ehub::options options;
        const char* ARGS[] = {"ehubd", "--no_such_flag"};
        EXPECT_FALSE(options.parse_command_line(2, ARGS));
    }
}


TEST_F(options_file_test, test_that_options_can_be_overridden_at_runtime)
{
    ehub::options options;

    ASSERT_TRUE(options.parse_command_line(1, NO_ARGS));

    options.get_mutable_simple_options().set(ehub::option_names::USERDB_PREFIX, "override-");
    options.get_mutable_simple_options().set(ehub::option_names::WATCHDOG_INTERVAL, "100");

    EXPECT_EQ("override-", options.get_userdb_prefix());
    EXPECT_EQ(std::chrono::milliseconds(100), options.get_watchdog_interval());

    // untouched options keep their config file values...
    EXPECT_EQ("accounts", options.get_authentication_db());
}
