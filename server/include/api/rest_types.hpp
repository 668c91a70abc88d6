//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATLOG_SERVER_INCLUDE_API_REST_TYPES_HPP
#define CHATLOG_SERVER_INCLUDE_API_REST_TYPES_HPP

#include <boost/core/span.hpp>

#include <cstdint>
#include <string>
#include <string_view>

#include "business_types.hpp"
#include "error.hpp"

// Type definitions for the REST facade over the message log, used by web UIs.
// Types for incoming requests are owning, since they're used after parsing.
// Types for responses are non-owning and lightweight, since they are only
// used as intermediate types for serialization.

namespace chatlog {

//
// Incoming requests
//

// The request for POST /api/messages
struct post_message_request
{
    // Author of the message. Older clients send it as "username"
    std::string author;

    // Message content
    std::string text;

    // Room to post to. Defaults to the public room if absent
    std::string room;

    // Parses a request from a JSON string. author and text must be strings
    // (possibly empty, content validation happens later). room may be absent.
    static result<post_message_request> from_json(std::string_view from);
};

//
// Outgoing responses
//

// Used within api_error, as a way to communicate specific error conditions
// to the client.
enum class api_error_id
{
    // generic, when there is not a more specific error ID
    bad_request = 0,

    // Empty author or text, or unknown room
    invalid_argument,

    // The message store failed
    store_unavailable,
};

// A REST API error. Used within HTTP error responses.
struct api_error
{
    // An identifier for the error that occurred.
    api_error_id error_id;

    // A human-readable explanation of the error.
    std::string_view error_message;

    // Serializes the object as a JSON string.
    std::string to_json() const;
};

// The response for POST /api/messages
struct post_message_response
{
    // ID of the newly created message
    std::int64_t id;

    // Serializes the object as a JSON string.
    std::string to_json() const;
};

// The response for GET /api/messages
struct get_messages_response
{
    boost::span<const message> messages;

    // Serializes the object as a JSON string.
    std::string to_json() const;
};

}  // namespace chatlog

#endif
