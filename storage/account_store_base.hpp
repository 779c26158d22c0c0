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
#include <optional>
#include <unordered_map>


namespace ehub
{
    enum class account_store_result : uint8_t
    {
        ok=0,
        db_not_found,
        db_exists,
        invalid_argument
    };

    const std::unordered_map<account_store_result, const std::string> account_store_result_msg{
        {account_store_result::ok,               "OK"},
        {account_store_result::db_not_found,     "DATABASE_NOT_FOUND"},
        {account_store_result::db_exists,        "DATABASE_EXISTS"},
        {account_store_result::invalid_argument, "INVALID_ARGUMENT"}};


    class account_store_base
    {
    public:
        virtual ~account_store_base() = default;

        virtual bool has_database(const std::string& db_name) = 0;

        virtual ehub::account_store_result create_database(const std::string& db_name) = 0;

        virtual ehub::account_store_result delete_database(const std::string& db_name) = 0;

        /**
         * Read a database's security object
         * @param db_name   database
         * @return security object or nullopt if the database does not exist
         */
        virtual std::optional<ehub::json_message> get_security(const std::string& db_name) = 0;

        virtual ehub::account_store_result set_security(const std::string& db_name, const ehub::json_message& security) = 0;
    };

} // ehub
