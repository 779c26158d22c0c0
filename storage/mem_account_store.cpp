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


#include <storage/mem_account_store.hpp>
#include <algorithm>
#include <mutex>

using namespace ehub;


bool
mem_account_store::has_database(const std::string& db_name)
{
    std::shared_lock<std::shared_mutex> lock(this->lock); // lock for read access

    return this->databases.count(db_name) > 0;
}


ehub::account_store_result
mem_account_store::create_database(const std::string& db_name)
{
    if (db_name.empty())
    {
        return ehub::account_store_result::invalid_argument;
    }

    std::lock_guard<std::shared_mutex> lock(this->lock); // lock for write access

    if (this->databases.count(db_name))
    {
        return ehub::account_store_result::db_exists;
    }

    this->databases.emplace(db_name, ehub::json_message(Json::objectValue));

    return ehub::account_store_result::ok;
}


ehub::account_store_result
mem_account_store::delete_database(const std::string& db_name)
{
    std::lock_guard<std::shared_mutex> lock(this->lock); // lock for write access

    if (this->databases.erase(db_name) == 0)
    {
        return ehub::account_store_result::db_not_found;
    }

    return ehub::account_store_result::ok;
}


std::optional<ehub::json_message>
mem_account_store::get_security(const std::string& db_name)
{
    std::shared_lock<std::shared_mutex> lock(this->lock); // lock for read access

    if (auto search = this->databases.find(db_name); search != this->databases.end())
    {
        return search->second;
    }

    return std::nullopt;
}


ehub::account_store_result
mem_account_store::set_security(const std::string& db_name, const ehub::json_message& security)
{
    if (!security.isObject())
    {
        return ehub::account_store_result::invalid_argument;
    }

    std::lock_guard<std::shared_mutex> lock(this->lock); // lock for write access

    auto search = this->databases.find(db_name);

    if (search == this->databases.end())
    {
        return ehub::account_store_result::db_not_found;
    }

    search->second = security;

    return ehub::account_store_result::ok;
}


std::vector<std::string>
mem_account_store::get_databases()
{
    std::shared_lock<std::shared_mutex> lock(this->lock); // lock for read access

    std::vector<std::string> names;

    for (const auto& database : this->databases)
    {
        names.emplace_back(database.first);
    }

    std::sort(names.begin(), names.end());

    return names;
}
