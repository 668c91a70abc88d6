//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATLOG_SERVER_INCLUDE_SERVICES_MESSAGE_LOG_HPP
#define CHATLOG_SERVER_INCLUDE_SERVICES_MESSAGE_LOG_HPP

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include <cstdint>
#include <string_view>
#include <vector>

#include "business_types.hpp"
#include "error.hpp"
#include "util/async_mutex.hpp"

// The append-only message log. Validates input, assigns IDs through the
// store and serves incremental reads to polling clients.

namespace chatlog {

class message_store;

class message_log
{
    message_store* store_;

    // Held while a message is being inserted and committed. The store assigns
    // IDs when the row is inserted, so two concurrent inserts could otherwise
    // commit out of order, and a reader could observe ID N+1 before N exists.
    // Readers don't take this.
    async_mutex write_mtx_;

public:
    message_log(message_store& store, boost::asio::any_io_executor ex) : store_(&store), write_mtx_(std::move(ex))
    {
    }

    // Appends a message to room and returns its ID.
    // author and text are trimmed and must not be empty. room is trimmed,
    // lowercased and must be one of room_ids.
    // Returns errc::invalid_argument on validation failures, without
    // touching the store, and errc::store_unavailable if the store fails.
    // Once this returns, the message is visible to any subsequent poll_since.
    boost::asio::awaitable<result_with_message<std::int64_t>> append(
        std::string_view author,
        std::string_view text,
        std::string_view room
    );

    // Returns all messages in room with ID greater than cursor, by ascending ID.
    // An empty vector means there are no new messages.
    // Returns errc::invalid_argument if room is not valid,
    // and errc::store_unavailable if the store fails.
    boost::asio::awaitable<result_with_message<std::vector<message>>> poll_since(
        std::int64_t cursor,
        std::string_view room
    );
};

}  // namespace chatlog

#endif
