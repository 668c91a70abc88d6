//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATLOG_SERVER_INCLUDE_SERVICES_MESSAGE_STORE_HPP
#define CHATLOG_SERVER_INCLUDE_SERVICES_MESSAGE_STORE_HPP

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

#include "business_types.hpp"
#include "config.hpp"
#include "error.hpp"

// The persistent message table. It implements the storage operations
// required by the message log, abstracting away the actual SQL operations.
// Every failure is reported as errc::store_unavailable, with the driver's
// diagnostics as message. Operations are never retried.

namespace chatlog {

// Using an interface to reduce build times and improve testability
class message_store
{
public:
    virtual ~message_store() {}

    // Starts the connection pool task, in detached mode. This must be called once
    // to allow other operations to make progress and keep the reconnection loop
    // running
    virtual void start_run() = 0;

    // Cancels the connection pool task. To be called at shutdown
    virtual void cancel() = 0;

    // Creates the message table if it doesn't exist, and upgrades tables
    // created by older versions (which lack the room column or the
    // (room, id) index). Running it against an up-to-date table is a no-op.
    virtual boost::asio::awaitable<error_with_message> setup_db() = 0;

    // Inserts a message and returns the ID the database assigned to it.
    // Arguments are stored as-is: validation is the caller's responsibility.
    virtual boost::asio::awaitable<result_with_message<std::int64_t>> insert_message(
        std::string_view author,
        std::string_view room,
        std::string_view text,
        timestamp_t created_at
    ) = 0;

    // Retrieves all messages in room with an ID greater than cursor,
    // sorted by ascending ID.
    virtual boost::asio::awaitable<result_with_message<std::vector<message>>> get_messages_since(
        std::string_view room,
        std::int64_t cursor
    ) = 0;
};

// Creates a message_store backed by a MySQL connection pool
std::unique_ptr<message_store> create_mysql_message_store(
    boost::asio::any_io_executor ex,
    const store_config& cfg
);

}  // namespace chatlog

#endif
