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
#include <subscriber/subscriber_base.hpp>


namespace ehub
{
    using liveness_down_handler = std::function<void(ehub::liveness_token_t token, ehub::subscriber_id_t id)>;

    class liveness_monitor_base
    {
    public:
        virtual ~liveness_monitor_base() = default;

        virtual void start() = 0;

        /**
         * Begin observing a subscriber. The handler fires at most once, when the subscriber shuts down or
         * is found destroyed.
         * @param subscriber    subscriber to observe
         * @param handler       called with the returned token and the subscriber's id
         * @return token identifying this observation
         */
        virtual ehub::liveness_token_t monitor(std::shared_ptr<ehub::subscriber_base> subscriber, ehub::liveness_down_handler handler) = 0;

        /**
         * Cancel an observation. A termination that has not been reported yet never will be.
         * @param token     observation to cancel
         * @return false if the observation was not active
         */
        virtual bool demonitor(ehub::liveness_token_t token) = 0;

        virtual size_t monitored_count() const = 0;
    };

} // ehub
