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

#include <dispatcher/dispatcher_base.hpp>
#include <gmock/gmock.h>


// gmock_gen.py generated...

namespace ehub {

    class mock_dispatcher_base : public dispatcher_base {
    public:
        MOCK_METHOD0(start,
            void());
        MOCK_METHOD0(stop,
            void());
        MOCK_METHOD2(register_subscriber,
            void(std::shared_ptr<ehub::subscriber_base> subscriber, const std::vector<ehub::channel_t>& channels));
        MOCK_METHOD1(unregister_subscriber,
            control_response::status_t(std::shared_ptr<ehub::subscriber_base> subscriber));
        MOCK_METHOD2(publish,
            void(const ehub::channel_t& channel, const db_event& event));
        MOCK_METHOD2(handle_request,
            control_response(const control_request& request, std::shared_ptr<ehub::subscriber_base> subscriber));
    };

}  // namespace ehub
