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
#include <functional>
#include <string>


namespace ehub
{
    using watchdog_death_handler = std::function<void(const std::string& reason)>;

    const std::string WATCHDOG_FORCE_REASON{"force_upgrade"};

    class watchdog_base
    {
    public:
        virtual ~watchdog_base() = default;

        /**
         * Begin supervising. Runs until it dies, the death handler is then called exactly once.
         * @param handler   death notification
         */
        virtual void start(ehub::watchdog_death_handler handler) = 0;

        /**
         * Stop without reporting a death
         */
        virtual void stop() = 0;
    };

} // ehub
