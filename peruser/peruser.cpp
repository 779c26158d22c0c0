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


#include <peruser/peruser.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <sstream>

using namespace ehub;

namespace
{
    const std::string ADMINS_KEY{"admins"};
    const std::string MEMBERS_KEY{"members"};
    const std::string NAMES_KEY{"names"};

    // adds user to security[role].names, returns true if the object changed
    bool
    add_user(const std::string& user, const std::string& role, ehub::json_message& security)
    {
        const ehub::json_message names = security.get(role, Json::objectValue).get(NAMES_KEY, Json::arrayValue);

        for (const auto& name : names)
        {
            if (name.isString() && name.asString() == user)
            {
                return false;
            }
        }

        // new names go first...
        ehub::json_message updated(Json::arrayValue);
        updated.append(user);

        for (const auto& name : names)
        {
            updated.append(name);
        }

        if (!security[role].isObject())
        {
            security[role] = Json::objectValue;
        }

        security[role][NAMES_KEY] = updated;

        return true;
    }
}


peruser::peruser(std::shared_ptr<ehub::asio::io_context_base> io_context, std::shared_ptr<ehub::dispatcher_base> dispatcher,
    std::shared_ptr<ehub::account_store_base> store, ehub::channel_t authentication_db, std::string userdb_prefix)
    : subscriber_id(ehub::next_subscriber_id())
    , strand(io_context->make_unique_strand())
    , dispatcher(std::move(dispatcher))
    , store(std::move(store))
    , authentication_db(std::move(authentication_db))
    , userdb_prefix(std::move(userdb_prefix))
{
}


peruser::~peruser()
{
    this->fire_shutdown_handlers();
}


void
peruser::start()
{
    std::call_once(this->start_once,
        [this]()
        {
            LOG(info) << "peruser provisioning user databases for changes to: " << this->authentication_db;

            this->dispatcher->register_subscriber(shared_from_this(), {this->authentication_db});
        });
}


void
peruser::stop()
{
    LOG(info) << "peruser stopping";

    this->fire_shutdown_handlers();
}


void
peruser::send_event(std::shared_ptr<const event_envelope> event)
{
    this->strand->post(std::bind(&peruser::handle_event, shared_from_this(), std::move(event)));
}


ehub::shutdown_handler_id_t
peruser::add_shutdown_handler(ehub::subscriber_shutdown_handler handler)
{
    {
        std::lock_guard<std::mutex> lock(this->lock);

        if (!this->stopped)
        {
            const auto id = this->next_shutdown_handler_id++;
            this->shutdown_handlers.emplace(id, std::move(handler));
            return id;
        }
    }

    handler();

    return 0;
}


void
peruser::remove_shutdown_handler(ehub::shutdown_handler_id_t id)
{
    std::lock_guard<std::mutex> lock(this->lock);

    this->shutdown_handlers.erase(id);
}


std::string
peruser::user_db_name(const std::string& userdb_prefix, const std::string& user)
{
    std::stringstream ss;

    ss << userdb_prefix << std::hex;

    for (const auto c : user)
    {
        ss << static_cast<unsigned int>(static_cast<unsigned char>(c));
    }

    return ss.str();
}


void
peruser::handle_event(std::shared_ptr<const event_envelope> event)
{
    {
        std::lock_guard<std::mutex> lock(this->lock);

        if (this->stopped)
        {
            return;
        }
    }

    if (event->event().type() != db_event::UPDATED || !event->event().has_change())
    {
        return;
    }

    const auto& change = event->event().change();

    if (!boost::starts_with(change.id(), USER_DOC_PREFIX))
    {
        return;
    }

    const std::string user = change.id().substr(USER_DOC_PREFIX.size());

    if (change.deleted())
    {
        // user databases are not garbage collected...
        LOG(debug) << "user deleted: " << user;
        return;
    }

    try
    {
        const auto user_db = this->ensure_user_db(user);
        this->ensure_security(user, user_db);
    }
    catch (const std::exception& ex)
    {
        LOG(error) << "failed to provision database for " << user << ": " << ex.what();

        this->stop();
    }
}


std::string
peruser::ensure_user_db(const std::string& user)
{
    auto user_db = peruser::user_db_name(this->userdb_prefix, user);

    if (!this->store->has_database(user_db))
    {
        const auto result = this->store->create_database(user_db);

        // lost a race with another creator, which is fine...
        if (result != ehub::account_store_result::ok && result != ehub::account_store_result::db_exists)
        {
            throw std::runtime_error("unable to create " + user_db + ": " + ehub::account_store_result_msg.at(result));
        }

        LOG(info) << "created user database " << user_db << " for: " << user;
    }

    return user_db;
}


void
peruser::ensure_security(const std::string& user, const std::string& user_db)
{
    auto security = this->store->get_security(user_db);

    if (!security)
    {
        throw std::runtime_error("security object missing for: " + user_db);
    }

    bool modified = false;

    for (const auto& role : {ADMINS_KEY, MEMBERS_KEY})
    {
        modified |= add_user(user, role, *security);
    }

    if (!modified)
    {
        return;
    }

    if (const auto result = this->store->set_security(user_db, *security); result != ehub::account_store_result::ok)
    {
        throw std::runtime_error("unable to update security of " + user_db + ": " + ehub::account_store_result_msg.at(result));
    }

    LOG(info) << "added " << user << " to admins and members of " << user_db;
}


void
peruser::fire_shutdown_handlers()
{
    std::map<ehub::shutdown_handler_id_t, ehub::subscriber_shutdown_handler> handlers;
    {
        std::lock_guard<std::mutex> lock(this->lock);

        if (this->stopped)
        {
            return;
        }

        this->stopped = true;
        handlers.swap(this->shutdown_handlers);
    }

    for (const auto& [id, handler] : handlers)
    {
        handler();
    }
}
