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

#include <subscriber/subscriber_base.hpp>
#include <gmock/gmock.h>


// gmock_gen.py generated...

namespace ehub {

    class mock_subscriber_base : public subscriber_base {
    public:
        MOCK_CONST_METHOD0(get_subscriber_id,
            ehub::subscriber_id_t());
        MOCK_METHOD1(send_event,
            void(std::shared_ptr<const event_envelope> event));
        MOCK_METHOD1(add_shutdown_handler,
            ehub::shutdown_handler_id_t(ehub::subscriber_shutdown_handler handler));
        MOCK_METHOD1(remove_shutdown_handler,
            void(ehub::shutdown_handler_id_t id));
    };

}  // namespace ehub
