//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "message_cursor.hpp"

#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>
#include <utility>
#include <vector>

#include "business_types.hpp"

using namespace chatlog;

std::vector<message> message_cursor::apply(std::vector<message> batch)
{
    std::vector<message> res;
    for (auto& msg : batch)
    {
        // Duplicates may arrive if a poll overlaps with a previous one
        if (msg.id <= last_id_)
            continue;
        last_id_ = msg.id;
        if (msg.author != self_)
            res.push_back(std::move(msg));
    }
    return res;
}

std::string chatlog::format_clock_time(timestamp_t tp)
{
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_value{};
    localtime_r(&t, &tm_value);
    char buff[16]{};
    std::size_t size = std::strftime(buff, sizeof(buff), "%H:%M:%S", &tm_value);
    return std::string(buff, size);
}

std::string chatlog::format_message(const message& msg)
{
    std::string res = "[";
    res += format_clock_time(msg.timestamp);
    res += "] ";
    res += msg.author;
    res += ": ";
    res += msg.text;
    return res;
}
