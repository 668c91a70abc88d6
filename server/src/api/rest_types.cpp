//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "api/rest_types.hpp"

#include <boost/describe/class.hpp>
#include <boost/json/object.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/serialize.hpp>
#include <boost/json/value_from.hpp>

#include <cstdint>
#include <string>
#include <string_view>

#include "api/rpc_types.hpp"
#include "business_types.hpp"
#include "error.hpp"

using namespace chatlog;

namespace {

// API error wire format
struct wire_api_error
{
    std::string_view id;
    std::string_view message;
};
BOOST_DESCRIBE_STRUCT(wire_api_error, (), (id, message))

// POST /api/messages response wire format
struct wire_post_message_response
{
    std::int64_t id;
};
BOOST_DESCRIBE_STRUCT(wire_post_message_response, (), (id))

}  // namespace

result<post_message_request> post_message_request::from_json(std::string_view from)
{
    // Parse the JSON
    error_code ec;
    auto msg = boost::json::parse(from, ec);
    if (ec)
        CHATLOG_RETURN_ERROR(ec)

    const auto* obj = msg.if_object();
    if (!obj)
        CHATLOG_RETURN_ERROR(errc::invalid_argument)

    // author (or username) and text are required strings
    const auto* author = obj->if_contains("author");
    if (!author)
        author = obj->if_contains("username");
    const auto* text = obj->if_contains("text");
    if (!author || !author->is_string() || !text || !text->is_string())
        CHATLOG_RETURN_ERROR(errc::invalid_argument)

    // room is optional
    post_message_request res{std::string(author->get_string()), std::string(text->get_string()), {}};
    const auto* room = obj->if_contains("room");
    if (room && !room->is_null())
    {
        if (!room->is_string())
            CHATLOG_RETURN_ERROR(errc::invalid_argument)
        res.room = room->get_string();
    }
    else
    {
        res.room = default_room;
    }
    return res;
}

static std::string_view to_string(api_error_id input)
{
    switch (input)
    {
    case api_error_id::invalid_argument: return "INVALID_ARGUMENT";
    case api_error_id::store_unavailable: return "STORE_UNAVAILABLE";
    case api_error_id::bad_request:
    default: return "BAD_REQUEST";
    }
}

std::string api_error::to_json() const
{
    wire_api_error err{to_string(error_id), error_message};
    return boost::json::serialize(boost::json::value_from(err));
}

std::string post_message_response::to_json() const
{
    return boost::json::serialize(boost::json::value_from(wire_post_message_response{id}));
}

std::string get_messages_response::to_json() const { return boost::json::serialize(serialize_messages(messages)); }
