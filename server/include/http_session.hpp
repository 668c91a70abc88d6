//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATLOG_SERVER_INCLUDE_HTTP_SESSION_HPP
#define CHATLOG_SERVER_INCLUDE_HTTP_SESSION_HPP

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/message_generator.hpp>
#include <boost/beast/http/string_body.hpp>

#include <memory>

namespace chatlog {

// Forward declaration
class shared_state;

// Routes a request to the matching endpoint and generates its response.
// Unknown paths get a 404, and known paths with the wrong method a 405.
// Handlers run with a 30 second timeout. Unexpected exceptions become a 500.
boost::asio::awaitable<boost::beast::http::message_generator> handle_http_request(
    boost::beast::http::request<boost::beast::http::string_body>&& req,
    shared_state& st
);

// Runs a HTTP session until the connection is closed or an error is encountered.
// Each request is routed to the RPC endpoint or the REST facade.
boost::asio::awaitable<void> run_http_session(
    boost::asio::ip::tcp::socket&& socket,
    std::shared_ptr<shared_state> state
);

}  // namespace chatlog

#endif
