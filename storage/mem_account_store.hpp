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

#include <storage/account_store_base.hpp>
#include <shared_mutex>
#include <vector>


namespace ehub
{
    class mem_account_store : public ehub::account_store_base
    {
    public:
        bool has_database(const std::string& db_name) override;

        ehub::account_store_result create_database(const std::string& db_name) override;

        ehub::account_store_result delete_database(const std::string& db_name) override;

        std::optional<ehub::json_message> get_security(const std::string& db_name) override;

        ehub::account_store_result set_security(const std::string& db_name, const ehub::json_message& security) override;

        std::vector<std::string> get_databases();

    private:
        // database name -> security object
        std::unordered_map<std::string, ehub::json_message> databases;

        std::shared_mutex lock; // for multi-reader and single writer access
    };

} // ehub
