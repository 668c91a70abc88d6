//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "api/rpc_types.hpp"

#include <boost/describe/class.hpp>
#include <boost/json/array.hpp>
#include <boost/json/object.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/serialize.hpp>
#include <boost/json/value.hpp>
#include <boost/json/value_from.hpp>
#include <boost/json/value_to.hpp>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "business_types.hpp"
#include "error.hpp"
#include "timestamp.hpp"
#include "util/normalize.hpp"

using namespace chatlog;

namespace {

//
// Helper structs with Describe metadata. They make serialization code easier.
//

// Message wire format, as sent by the server
struct wire_message
{
    std::int64_t id;
    std::string_view author;
    std::string_view text;
    double timestamp;
};
BOOST_DESCRIBE_STRUCT(wire_message, (), (id, author, text, timestamp))

// Message wire format, as parsed by clients
struct wire_client_message
{
    std::int64_t id;
    std::string author;
    std::string text;
    double timestamp;
};
BOOST_DESCRIBE_STRUCT(wire_client_message, (), (id, author, text, timestamp))

// Fault details
struct wire_fault_data
{
    std::string_view kind;
};
BOOST_DESCRIBE_STRUCT(wire_fault_data, (), (kind))

struct wire_fault
{
    int code;
    std::string_view message;
    wire_fault_data data;
};
BOOST_DESCRIBE_STRUCT(wire_fault, (), (code, message, data))

constexpr std::string_view jsonrpc_version = "2.0";

// JSON-RPC 2.0 reserved codes
constexpr int parse_error_code = -32700;
constexpr int invalid_request_code = -32600;
constexpr int method_not_found_code = -32601;
constexpr int invalid_params_code = -32602;
constexpr int internal_error_code = -32603;

// Application-defined codes
constexpr int invalid_argument_code = -32000;
constexpr int store_unavailable_code = -32001;

// A parameter that may be omitted or null
bool is_absent(const boost::json::value* v) noexcept { return v == nullptr || v->is_null(); }

// Looks up a named parameter, trying each of the names in order
const boost::json::value* find_param(const boost::json::object& obj, std::initializer_list<std::string_view> names)
{
    for (auto name : names)
    {
        if (const auto* res = obj.if_contains(name))
            return res;
    }
    return nullptr;
}

// Gets the optional room parameter. Absent means the default room
result<std::string> get_room_param(const boost::json::value* room)
{
    if (is_absent(room))
        return std::string(default_room);
    if (!room->is_string())
        CHATLOG_RETURN_ERROR(errc::rpc_invalid_params)
    return std::string(room->get_string());
}

// Gets a mandatory string parameter
result<std::string> get_string_param(const boost::json::value* v)
{
    if (v == nullptr || !v->is_string())
        CHATLOG_RETURN_ERROR(errc::rpc_invalid_params)
    return std::string(v->get_string());
}

std::string serialize_response(const boost::json::value& id, std::string_view member, boost::json::value value)
{
    boost::json::object res;
    res.emplace("jsonrpc", jsonrpc_version);
    res.emplace(member, std::move(value));
    res.emplace("id", id);
    return boost::json::serialize(res);
}

}  // namespace

//
// Incoming calls
//

result<rpc_request> rpc_request::from_json(std::string_view from)
{
    // Parse the JSON
    error_code ec;
    auto msg = boost::json::parse(from, ec);
    if (ec)
        CHATLOG_RETURN_ERROR(errc::rpc_parse_error)

    // Must be an object. Batches are not supported
    const auto* obj = msg.if_object();
    if (!obj)
        CHATLOG_RETURN_ERROR(errc::rpc_invalid_request)

    // Protocol version
    const auto* version = obj->if_contains("jsonrpc");
    if (!version || *version != jsonrpc_version)
        CHATLOG_RETURN_ERROR(errc::rpc_invalid_request)

    // Method
    const auto* method = obj->if_contains("method");
    if (!method || !method->is_string())
        CHATLOG_RETURN_ERROR(errc::rpc_invalid_request)

    // ID. May be absent, a string, a number or null
    rpc_request res;
    if (const auto* id = obj->if_contains("id"))
    {
        if (!id->is_null() && !id->is_string() && !id->is_number())
            CHATLOG_RETURN_ERROR(errc::rpc_invalid_request)
        res.id = *id;
    }

    // Params. May be absent, an array or an object
    if (const auto* params = obj->if_contains("params"))
    {
        if (!params->is_array() && !params->is_object())
            CHATLOG_RETURN_ERROR(errc::rpc_invalid_request)
        res.params = *params;
    }

    res.method = method->get_string();
    return res;
}

result<send_message_params> send_message_params::from_params(const boost::json::value& params)
{
    const boost::json::value *author = nullptr, *text = nullptr, *room = nullptr;

    if (const auto* arr = params.if_array())
    {
        // Positional: [author, text] or [author, text, room]
        if (arr->size() < 2u || arr->size() > 3u)
            CHATLOG_RETURN_ERROR(errc::rpc_invalid_params)
        author = &(*arr)[0];
        text = &(*arr)[1];
        if (arr->size() == 3u)
            room = &(*arr)[2];
    }
    else if (const auto* obj = params.if_object())
    {
        // Named. username is accepted for compatibility with older clients
        author = find_param(*obj, {"author", "username"});
        text = find_param(*obj, {"text"});
        room = find_param(*obj, {"room"});
    }
    else
    {
        CHATLOG_RETURN_ERROR(errc::rpc_invalid_params)
    }

    auto author_result = get_string_param(author);
    if (author_result.has_error())
        return author_result.error();
    auto text_result = get_string_param(text);
    if (text_result.has_error())
        return text_result.error();
    auto room_result = get_room_param(room);
    if (room_result.has_error())
        return room_result.error();

    return send_message_params{
        std::move(*author_result),
        std::move(*text_result),
        std::move(*room_result),
    };
}

result<get_messages_params> get_messages_params::from_params(const boost::json::value& params)
{
    const boost::json::value *cursor = nullptr, *room = nullptr;

    if (const auto* arr = params.if_array())
    {
        // Positional: [], [cursor] or [cursor, room]
        if (arr->size() > 2u)
            CHATLOG_RETURN_ERROR(errc::rpc_invalid_params)
        if (arr->size() >= 1u)
            cursor = &(*arr)[0];
        if (arr->size() == 2u)
            room = &(*arr)[1];
    }
    else if (const auto* obj = params.if_object())
    {
        // Named. last_id is accepted for compatibility with older clients
        cursor = find_param(*obj, {"cursor", "last_id"});
        room = find_param(*obj, {"room"});
    }
    else if (!params.is_null())
    {
        CHATLOG_RETURN_ERROR(errc::rpc_invalid_params)
    }

    auto room_result = get_room_param(room);
    if (room_result.has_error())
        return room_result.error();

    return get_messages_params{
        cursor ? parse_cursor(*cursor) : 0,
        std::move(*room_result),
    };
}

//
// Outgoing responses
//

boost::json::array chatlog::serialize_messages(boost::span<const message> messages)
{
    boost::json::array res;
    res.reserve(messages.size());
    for (const auto& msg : messages)
    {
        res.push_back(boost::json::value_from(wire_message{
            msg.id,
            msg.author,
            msg.text,
            serialize_timestamp(msg.timestamp),
        }));
    }
    return res;
}

int chatlog::fault_code(error_code ec) noexcept
{
    if (ec == errc::invalid_argument)
        return invalid_argument_code;
    else if (ec == errc::store_unavailable)
        return store_unavailable_code;
    else if (ec == errc::rpc_parse_error)
        return parse_error_code;
    else if (ec == errc::rpc_invalid_request)
        return invalid_request_code;
    else if (ec == errc::rpc_method_not_found)
        return method_not_found_code;
    else if (ec == errc::rpc_invalid_params)
        return invalid_params_code;
    else
        return internal_error_code;
}

std::string_view chatlog::fault_kind(error_code ec) noexcept
{
    switch (fault_code(ec))
    {
    case invalid_argument_code: return "InvalidArgument";
    case store_unavailable_code: return "StoreUnavailable";
    case parse_error_code: return "ParseError";
    case invalid_request_code: return "InvalidRequest";
    case method_not_found_code: return "MethodNotFound";
    case invalid_params_code: return "InvalidParams";
    default: return "InternalError";
    }
}

std::string rpc_result_response::to_json() const { return serialize_response(id, "result", result); }

std::string rpc_fault_response::to_json() const
{
    auto fault = boost::json::value_from(wire_fault{
        fault_code(ec),
        message.empty() ? std::string_view(fault_kind(ec)) : message,
        wire_fault_data{fault_kind(ec)},
    });
    return serialize_response(id, "error", std::move(fault));
}

//
// Client side
//

std::string chatlog::serialize_rpc_call(std::int64_t id, std::string_view method, boost::json::array params)
{
    boost::json::object res;
    res.emplace("jsonrpc", jsonrpc_version);
    res.emplace("method", method);
    res.emplace("params", std::move(params));
    res.emplace("id", id);
    return boost::json::serialize(res);
}

static errc errc_from_fault_code(std::int64_t code) noexcept
{
    switch (code)
    {
    case invalid_argument_code: return errc::invalid_argument;
    case store_unavailable_code: return errc::store_unavailable;
    case parse_error_code: return errc::rpc_parse_error;
    case invalid_request_code: return errc::rpc_invalid_request;
    case method_not_found_code: return errc::rpc_method_not_found;
    case invalid_params_code: return errc::rpc_invalid_params;
    default: return errc::uncaught_exception;
    }
}

// Builds an error result. Spelled out because json::value has many converting constructors
static result_with_message<boost::json::value> response_error(errc e, std::string msg)
{
    return {boost::system::in_place_error, error_with_message{e, std::move(msg)}};
}

result_with_message<boost::json::value> chatlog::parse_rpc_response(std::string_view from)
{
    // Parse the JSON
    error_code ec;
    auto msg = boost::json::parse(from, ec);
    if (ec)
        return response_error(errc::rpc_parse_error, "Response is not valid JSON");

    const auto* obj = msg.if_object();
    if (!obj)
        return response_error(errc::rpc_parse_error, "Response is not a JSON object");

    // Faults
    if (const auto* fault = obj->if_contains("error"); fault && !fault->is_null())
    {
        const auto* fault_obj = fault->if_object();
        if (!fault_obj)
            return response_error(errc::rpc_parse_error, "Malformed error object");
        const auto* code = fault_obj->if_contains("code");
        const auto* message = fault_obj->if_contains("message");
        return response_error(
            code && code->is_int64() ? errc_from_fault_code(code->get_int64()) : errc::uncaught_exception,
            message && message->is_string() ? std::string(message->get_string()) : std::string()
        );
    }

    // Results
    const auto* res = obj->if_contains("result");
    if (!res)
        return response_error(errc::rpc_parse_error, "Response has neither result nor error");
    return {boost::system::in_place_value, *res};
}

result<std::vector<message>> chatlog::parse_messages(const boost::json::value& from)
{
    auto parsed = boost::json::try_value_to<std::vector<wire_client_message>>(from);
    if (parsed.has_error())
        CHATLOG_RETURN_ERROR(parsed.error())

    std::vector<message> res;
    res.reserve(parsed->size());
    for (auto& msg : *parsed)
    {
        res.push_back(message{
            msg.id,
            std::move(msg.author),
            std::string(),
            std::move(msg.text),
            parse_timestamp(msg.timestamp),
        });
    }
    return res;
}
