//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATLOG_SERVER_INCLUDE_BUSINESS_TYPES_HPP
#define CHATLOG_SERVER_INCLUDE_BUSINESS_TYPES_HPP

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

#include "timestamp.hpp"

// This file contains business object definitions

namespace chatlog {

// The rooms messages can be posted to. Rooms partition visibility:
// a message is only ever returned to queries for its own room.
constexpr std::array<std::string_view, 2> room_ids{"public", "founders"};

// The room used when the client doesn't specify one
constexpr std::string_view default_room = "public";

// A chat message. Immutable once stored.
struct message
{
    // Message ID. Assigned by the store, strictly increasing
    std::int64_t id{};

    // Free-form label of whoever sent the message. Not bound to any identity
    std::string author;

    // The room the message belongs to. One of room_ids
    std::string room;

    // The actual content of the message
    std::string text;

    // UTC timestamp when the store received the message
    timestamp_t timestamp;
};

}  // namespace chatlog

#endif
