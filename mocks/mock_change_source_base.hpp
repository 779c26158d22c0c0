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

#include <change_source/change_source_base.hpp>
#include <gmock/gmock.h>


// gmock_gen.py generated...

namespace ehub {

    class mock_change_source_base : public change_source_base {
    public:
        MOCK_METHOD1(add_observer,
            ehub::observer_id_t(ehub::change_observer observer));
        MOCK_METHOD1(remove_observer,
            bool(ehub::observer_id_t id));
        MOCK_CONST_METHOD0(has_observers,
            bool());
        MOCK_CONST_METHOD0(observer_count,
            size_t());
        MOCK_METHOD2(notify,
            void(const ehub::channel_t& channel, const db_event& event));
        MOCK_METHOD1(terminate,
            void(const std::string& reason));
    };

}  // namespace ehub
