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
#include <gmock/gmock.h>


// gmock_gen.py generated...

namespace ehub {

    class mock_account_store_base : public account_store_base {
    public:
        MOCK_METHOD1(has_database,
            bool(const std::string& db_name));
        MOCK_METHOD1(create_database,
            ehub::account_store_result(const std::string& db_name));
        MOCK_METHOD1(delete_database,
            ehub::account_store_result(const std::string& db_name));
        MOCK_METHOD1(get_security,
            std::optional<ehub::json_message>(const std::string& db_name));
        MOCK_METHOD2(set_security,
            ehub::account_store_result(const std::string& db_name, const ehub::json_message& security));
    };

}  // namespace ehub
