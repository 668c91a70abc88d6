//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATLOG_CLIENT_INCLUDE_MESSAGE_CURSOR_HPP
#define CHATLOG_CLIENT_INCLUDE_MESSAGE_CURSOR_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "business_types.hpp"

namespace chatlog {

// Tracks the last message ID a client has seen in a room.
// The first poll uses cursor 0, which retrieves the full room history.
class message_cursor
{
    std::string self_;
    std::int64_t last_id_{0};

public:
    // self is the identity this client posts as. Messages from
    // this author are not rendered, since they were echoed when sent.
    explicit message_cursor(std::string self) : self_(std::move(self)) {}

    // The cursor to pass to the next get_messages call
    std::int64_t last_id() const noexcept { return last_id_; }

    // Registers a batch returned by get_messages. Advances the cursor to the
    // highest ID in the batch, own messages included, and returns the
    // messages that should be rendered, in the order they were received.
    // Messages at or below the current cursor are dropped.
    std::vector<message> apply(std::vector<message> batch);
};

// Formats a timestamp as HH:MM:SS, in local time
std::string format_clock_time(timestamp_t tp);

// Formats a message received from another author, as "[HH:MM:SS] author: text"
std::string format_message(const message& msg);

}  // namespace chatlog

#endif
