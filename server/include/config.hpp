//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATLOG_SERVER_INCLUDE_CONFIG_HPP
#define CHATLOG_SERVER_INCLUDE_CONFIG_HPP

#include <cstddef>
#include <string>

// Server configuration. Built once at startup and passed down explicitly.

namespace chatlog {

// How to reach the database backing the message store
struct store_config
{
    std::string hostname{"localhost"};
    unsigned short port{3306};
    std::string username{"chatuser"};
    std::string password{"chatpass"};
    std::string database{"chatdb"};

    // Maximum number of connections the pool will open
    std::size_t max_pool_size{16};
};

struct server_config
{
    // IP and port where the server will listen
    std::string ip;
    unsigned short port;

    store_config store;
};

// Builds a store_config from the CHAT_DB_* environment variables.
// Variables that are unset or can't be parsed keep their default value.
store_config store_config_from_env();

}  // namespace chatlog

#endif
