//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATLOG_SERVER_INCLUDE_API_RPC_SERVICE_HPP
#define CHATLOG_SERVER_INCLUDE_API_RPC_SERVICE_HPP

#include <boost/asio/awaitable.hpp>

#include <string>
#include <string_view>

// Binds the message log operations to JSON-RPC methods:
//   send_message(author, text, room = "public") -> id
//   get_messages(cursor, room = "public") -> [{id, author, text, timestamp}]
//   system.listMethods() -> [method names]

namespace chatlog {

class message_log;

// Has no state of its own. All synchronization lives in the message log,
// so one instance can serve any number of concurrent calls.
class rpc_service
{
    message_log* log_;

public:
    rpc_service(message_log& log) noexcept : log_(&log) {}

    // Runs a JSON-RPC call, given the request body. Always returns a
    // serialized JSON-RPC response object: errors are reported as faults.
    boost::asio::awaitable<std::string> handle_call(std::string_view body);
};

}  // namespace chatlog

#endif
