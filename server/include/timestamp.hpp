//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATLOG_SERVER_INCLUDE_TIMESTAMP_HPP
#define CHATLOG_SERVER_INCLUDE_TIMESTAMP_HPP

#include <chrono>
#include <cstdint>

// Helpers to work with timestamps.
// The serialized representation of a timestamp is a double with seconds
// since the UNIX epoch, with microsecond resolution

namespace chatlog {

// Timestamps are eventually shown to the user, so we need them to match the system clock
using timestamp_t = std::chrono::system_clock::time_point;

// Converts a timestamp to its serialized representation
inline double serialize_timestamp(timestamp_t input) noexcept
{
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(input.time_since_epoch()).count();
    return static_cast<double>(us) / 1e6;
}

// Creates a timestamp from its serialized representation
inline timestamp_t parse_timestamp(double input) noexcept
{
    return timestamp_t(std::chrono::duration_cast<timestamp_t::duration>(
        std::chrono::microseconds(static_cast<std::int64_t>(input * 1e6))
    ));
}

}  // namespace chatlog

#endif
