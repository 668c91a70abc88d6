//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATLOG_SERVER_INCLUDE_API_RPC_ENDPOINT_HPP
#define CHATLOG_SERVER_INCLUDE_API_RPC_ENDPOINT_HPP

#include <boost/asio/awaitable.hpp>

#include "request_context.hpp"

// API handler functions. The signature is shared by all HTTP endpoints

namespace chatlog {

class shared_state;

// POST /RPC2: JSON-RPC calls
boost::asio::awaitable<response_builder::response_type> handle_rpc(request_context& ctx, shared_state& st);

// GET /api/messages?last_id=N&room=R
boost::asio::awaitable<response_builder::response_type> handle_get_messages(
    request_context& ctx,
    shared_state& st
);

// POST /api/messages
boost::asio::awaitable<response_builder::response_type> handle_post_message(
    request_context& ctx,
    shared_state& st
);

}  // namespace chatlog

#endif
