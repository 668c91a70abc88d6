//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATLOG_SERVER_INCLUDE_UTIL_NORMALIZE_HPP
#define CHATLOG_SERVER_INCLUDE_UTIL_NORMALIZE_HPP

#include <boost/json/fwd.hpp>

#include <cstdint>
#include <string>
#include <string_view>

#include "error.hpp"

// Input normalization shared by the message log and the API layers

namespace chatlog {

// Removes leading and trailing ASCII whitespace
std::string_view trim(std::string_view input) noexcept;

// Trims and lowercases a room identifier, and checks that it belongs
// to the allowed set. An empty input selects the default room.
// Returns errc::invalid_argument for any other value.
result<std::string> normalize_room(std::string_view input);

// Parses a message cursor. Never fails: anything that isn't a
// non-negative integer yields 0, which means "from the beginning".
// Integers too large for an int64_t clamp to its maximum.
std::int64_t parse_cursor(std::string_view input) noexcept;

// Same as the above, for a JSON value. Integers pass through, numbers are
// truncated and strings are parsed as above.
std::int64_t parse_cursor(const boost::json::value& input) noexcept;

}  // namespace chatlog

#endif
