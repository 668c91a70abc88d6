//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATLOG_CLIENT_INCLUDE_RPC_CLIENT_HPP
#define CHATLOG_CLIENT_INCLUDE_RPC_CLIENT_HPP

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/json/array.hpp>
#include <boost/json/value.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "business_types.hpp"
#include "error.hpp"

namespace chatlog {

// Calls the chat server's JSON-RPC methods over HTTP.
// Each call opens a new connection, which makes the client
// insensitive to server restarts. Calls are never retried.
class rpc_client
{
    boost::asio::any_io_executor ex_;
    std::string host_;
    std::string port_;
    std::int64_t next_id_{1};

    // Issues a call and returns its result. Transport failures are
    // reported with the Asio or Beast error code, and faults with the
    // errc the fault code maps to.
    boost::asio::awaitable<result_with_message<boost::json::value>> call(
        std::string_view method,
        boost::json::array params
    );

public:
    rpc_client(boost::asio::any_io_executor ex, std::string host, std::string port)
        : ex_(std::move(ex)), host_(std::move(host)), port_(std::move(port))
    {
    }

    // send_message(author, text, room). Returns the new message's ID.
    // If this fails, the message may or may not have been stored.
    boost::asio::awaitable<result_with_message<std::int64_t>> send_message(
        std::string_view author,
        std::string_view text,
        std::string_view room
    );

    // get_messages(cursor, room)
    boost::asio::awaitable<result_with_message<std::vector<message>>> get_messages(
        std::int64_t cursor,
        std::string_view room
    );
};

}  // namespace chatlog

#endif
