//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATLOG_SERVER_INCLUDE_API_RPC_TYPES_HPP
#define CHATLOG_SERVER_INCLUDE_API_RPC_TYPES_HPP

#include <boost/core/span.hpp>
#include <boost/json/array.hpp>
#include <boost/json/value.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "business_types.hpp"
#include "error.hpp"

// Wire types for the JSON-RPC 2.0 interface. Used by both the server,
// to parse calls and serialize results, and the client poller, to
// build calls and parse results.
//
// A call looks like:
//   {"jsonrpc": "2.0", "method": "send_message", "params": ["bob", "hi", "public"], "id": 1}
// Parameters may also be passed by name:
//   {"jsonrpc": "2.0", "method": "get_messages", "params": {"cursor": 10, "room": "founders"}, "id": 2}

namespace chatlog {

// Method names
constexpr std::string_view send_message_method = "send_message";
constexpr std::string_view get_messages_method = "get_messages";
constexpr std::string_view list_methods_method = "system.listMethods";

//
// Incoming calls (server side)
//

// A parsed JSON-RPC request object
struct rpc_request
{
    // The request ID, echoed in the response. Null for notifications
    // and for requests where the ID couldn't be determined
    boost::json::value id;

    // The method to invoke
    std::string method;

    // The raw parameters. Either an array, an object or null
    boost::json::value params;

    // Parses a request from a JSON string. Returns errc::rpc_parse_error
    // if from is not JSON, and errc::rpc_invalid_request if it's not a request object
    static result<rpc_request> from_json(std::string_view from);
};

// Parameters for send_message(author, text, room = "public")
struct send_message_params
{
    std::string author;
    std::string text;
    std::string room;

    // Type-checks the raw parameters. author and text must be strings,
    // room must be a string or absent. Returns errc::rpc_invalid_params otherwise.
    // No content validation is performed here.
    static result<send_message_params> from_params(const boost::json::value& params);
};

// Parameters for get_messages(cursor, room = "public")
struct get_messages_params
{
    // Never fails to parse. Invalid values become 0
    std::int64_t cursor{};
    std::string room;

    // Type-checks the raw parameters. room must be a string or absent.
    // Returns errc::rpc_invalid_params otherwise.
    static result<get_messages_params> from_params(const boost::json::value& params);
};

//
// Outgoing responses (server side)
//

// Serializes messages as a JSON array of {id, author, text, timestamp} objects.
// The timestamp is a number with seconds since the UNIX epoch.
boost::json::array serialize_messages(boost::span<const message> messages);

// The JSON-RPC error code to report for an error_code
int fault_code(error_code ec) noexcept;

// The error kind to report for an error_code, e.g. "InvalidArgument"
std::string_view fault_kind(error_code ec) noexcept;

// A successful JSON-RPC response
struct rpc_result_response
{
    const boost::json::value& id;
    boost::json::value result;

    // Serializes the object as a JSON string.
    std::string to_json() const;
};

// A JSON-RPC error response, carrying the error kind and a message
struct rpc_fault_response
{
    const boost::json::value& id;
    error_code ec;
    std::string_view message;

    // Serializes the object as a JSON string.
    std::string to_json() const;
};

//
// Outgoing calls and incoming responses (client side)
//

// Serializes a call to method with the given positional params
std::string serialize_rpc_call(std::int64_t id, std::string_view method, boost::json::array params);

// Parses a JSON-RPC response. On success, returns the result member.
// Faults are returned as an error_with_message, with the fault code mapped
// back to errc and the fault message.
result_with_message<boost::json::value> parse_rpc_response(std::string_view from);

// Parses the result of get_messages
result<std::vector<message>> parse_messages(const boost::json::value& from);

}  // namespace chatlog

#endif
