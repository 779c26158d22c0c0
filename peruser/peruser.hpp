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
#include <include/boost_asio.hpp>
#include <storage/account_store_base.hpp>
#include <subscriber/subscriber_base.hpp>
#include <map>
#include <mutex>


namespace ehub
{
    const std::string USER_DOC_PREFIX{"org.couchdb.user:"};

    /**
     * Gives every user a private database. Listens on the authentication database's channel and, for each
     * new or updated user document, makes sure the user's database exists and lists the user as admin and
     * member. Deleting a user leaves the database alone.
     */
    class peruser final : public ehub::subscriber_base, public std::enable_shared_from_this<peruser>
    {
    public:
        peruser(std::shared_ptr<ehub::asio::io_context_base> io_context, std::shared_ptr<ehub::dispatcher_base> dispatcher,
            std::shared_ptr<ehub::account_store_base> store, ehub::channel_t authentication_db, std::string userdb_prefix);

        ~peruser();

        void start();

        void stop();

        ehub::subscriber_id_t get_subscriber_id() const override { return this->subscriber_id; }

        void send_event(std::shared_ptr<const event_envelope> event) override;

        ehub::shutdown_handler_id_t add_shutdown_handler(ehub::subscriber_shutdown_handler handler) override;

        void remove_shutdown_handler(ehub::shutdown_handler_id_t id) override;

        /**
         * Name of a user's private database: the prefix followed by the user name bytes in lowercase hex
         */
        static std::string user_db_name(const std::string& userdb_prefix, const std::string& user);

    private:
        void handle_event(std::shared_ptr<const event_envelope> event);

        std::string ensure_user_db(const std::string& user);

        void ensure_security(const std::string& user, const std::string& user_db);

        void fire_shutdown_handlers();

        const ehub::subscriber_id_t subscriber_id;

        std::unique_ptr<ehub::asio::strand_base> strand;
        std::shared_ptr<ehub::dispatcher_base> dispatcher;
        std::shared_ptr<ehub::account_store_base> store;

        const ehub::channel_t authentication_db;
        const std::string userdb_prefix;

        std::map<ehub::shutdown_handler_id_t, ehub::subscriber_shutdown_handler> shutdown_handlers;
        ehub::shutdown_handler_id_t next_shutdown_handler_id = 1;
        bool stopped = false;
        std::mutex lock;

        std::once_flag start_once;
    };

} // ehub
