//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "util/normalize.hpp"

#include <boost/json/value.hpp>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

#include "business_types.hpp"
#include "error.hpp"

using namespace chatlog;

static constexpr auto max_cursor = (std::numeric_limits<std::int64_t>::max)();

static bool is_space(char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

static char to_lower(char c) noexcept { return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c; }

std::string_view chatlog::trim(std::string_view input) noexcept
{
    while (!input.empty() && is_space(input.front()))
        input.remove_prefix(1);
    while (!input.empty() && is_space(input.back()))
        input.remove_suffix(1);
    return input;
}

result<std::string> chatlog::normalize_room(std::string_view input)
{
    if (input.empty())
        return std::string(default_room);

    std::string res(trim(input));
    std::transform(res.begin(), res.end(), res.begin(), to_lower);

    // Rooms are a closed set. Unknown values are rejected, never remapped
    if (std::find(room_ids.begin(), room_ids.end(), res) == room_ids.end())
        CHATLOG_RETURN_ERROR(errc::invalid_argument)
    return res;
}

std::int64_t chatlog::parse_cursor(std::string_view input) noexcept
{
    input = trim(input);
    if (!input.empty() && input.front() == '+')
        input.remove_prefix(1);

    const char* end = input.data() + input.size();
    std::int64_t res = 0;
    auto [ptr, ec] = std::from_chars(input.data(), end, res);

    // Integers too big to represent are past any existing ID
    if (ec == std::errc::result_out_of_range && ptr == end && input.front() != '-')
        return max_cursor;

    // Trailing garbage, negative numbers and empty strings all degrade to 0
    if (ec != std::errc() || ptr != end || res < 0)
        return 0;
    return res;
}

std::int64_t chatlog::parse_cursor(const boost::json::value& input) noexcept
{
    switch (input.kind())
    {
    case boost::json::kind::int64: return (std::max)(input.get_int64(), std::int64_t(0));
    case boost::json::kind::uint64:
        return input.get_uint64() > static_cast<std::uint64_t>(max_cursor)
                   ? max_cursor
                   : static_cast<std::int64_t>(input.get_uint64());
    case boost::json::kind::double_:
    {
        double v = input.get_double();
        if (!std::isfinite(v) || v < 0)
            return 0;
        if (v >= static_cast<double>(max_cursor))
            return max_cursor;
        return static_cast<std::int64_t>(v);
    }
    case boost::json::kind::string: return parse_cursor(std::string_view(input.get_string()));
    default: return 0;
    }
}
