//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "config.hpp"

#include <charconv>
#include <cstddef>
#include <cstdlib>
#include <limits>
#include <string>
#include <string_view>

using namespace chatlog;

// Returns the value of an environment variable, or default_value if it's not defined
static std::string getenv_or(const char* name, const std::string& default_value)
{
    const char* res = std::getenv(name);
    return res == nullptr ? default_value : res;
}

// Same, but parsing the variable as an unsigned number in [1, max_value]
template <class T>
static T getenv_number_or(const char* name, T default_value, T max_value)
{
    const char* res = std::getenv(name);
    if (res == nullptr)
        return default_value;

    std::string_view str(res);
    unsigned long long value = 0;
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (ec != std::errc() || ptr != str.data() + str.size() || value == 0 || value > max_value)
        return default_value;
    return static_cast<T>(value);
}

store_config chatlog::store_config_from_env()
{
    store_config res;
    res.hostname = getenv_or("CHAT_DB_HOST", res.hostname);
    res.port = getenv_number_or<unsigned short>(
        "CHAT_DB_PORT",
        res.port,
        (std::numeric_limits<unsigned short>::max)()
    );
    res.username = getenv_or("CHAT_DB_USER", res.username);
    res.password = getenv_or("CHAT_DB_PASSWORD", res.password);
    res.database = getenv_or("CHAT_DB_NAME", res.database);
    res.max_pool_size = getenv_number_or<std::size_t>("CHAT_DB_POOL_SIZE", res.max_pool_size, 1000u);
    return res;
}
