//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "rpc_client.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/version.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "api/rpc_types.hpp"
#include "business_types.hpp"
#include "error.hpp"

using namespace chatlog;
namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;

// Timeout for each of the network operations involved in a call
static constexpr std::chrono::seconds io_timeout{10};

// Builds an error result for transport failures
static error_with_message transport_error(error_code ec, std::string_view what)
{
    std::string msg(what);
    msg += ": ";
    msg += ec.message();
    return error_with_message{ec, std::move(msg)};
}

asio::awaitable<result_with_message<boost::json::value>> rpc_client::call(
    std::string_view method,
    boost::json::array params
)
{
    error_code ec;

    // Resolve the server's address
    asio::ip::tcp::resolver resolver(ex_);
    auto endpoints = co_await resolver.async_resolve(host_, port_, asio::redirect_error(ec));
    if (ec)
        co_return transport_error(ec, "Resolving server address");

    // Connect
    beast::tcp_stream stream(ex_);
    stream.expires_after(io_timeout);
    co_await stream.async_connect(endpoints, asio::redirect_error(ec));
    if (ec)
        co_return transport_error(ec, "Connecting to server");

    // Compose the request
    http::request<http::string_body> req{http::verb::post, "/RPC2", 11};
    req.set(http::field::host, host_);
    req.set(http::field::content_type, "application/json");
    req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    req.keep_alive(false);
    req.body() = serialize_rpc_call(next_id_++, method, std::move(params));
    req.prepare_payload();

    // Send it
    stream.expires_after(io_timeout);
    co_await http::async_write(stream, req, asio::redirect_error(ec));
    if (ec)
        co_return transport_error(ec, "Sending request");

    // Read the response
    beast::flat_buffer buff;
    http::response<http::string_body> res;
    stream.expires_after(io_timeout);
    co_await http::async_read(stream, buff, res, asio::redirect_error(ec));
    if (ec)
        co_return transport_error(ec, "Reading response");

    // Close the connection. Errors here don't affect the result
    stream.socket().shutdown(asio::ip::tcp::socket::shutdown_both, ec);

    // JSON-RPC responses are always 200, anything else comes from elsewhere
    if (res.result() != http::status::ok)
    {
        co_return error_with_message{
            errc::rpc_invalid_request,
            "Server responded with HTTP status " + std::to_string(res.result_int()),
        };
    }

    co_return parse_rpc_response(res.body());
}

asio::awaitable<result_with_message<std::int64_t>> rpc_client::send_message(
    std::string_view author,
    std::string_view text,
    std::string_view room
)
{
    auto res = co_await call(send_message_method, {author, text, room});
    if (res.has_error())
        co_return std::move(res).error();

    const auto* id = res->if_int64();
    if (!id)
        co_return error_with_message{errc::rpc_parse_error, "send_message returned a non-integer ID"};
    co_return *id;
}

asio::awaitable<result_with_message<std::vector<message>>> rpc_client::get_messages(
    std::int64_t cursor,
    std::string_view room
)
{
    auto res = co_await call(get_messages_method, {cursor, room});
    if (res.has_error())
        co_return std::move(res).error();

    auto messages = parse_messages(*res);
    if (messages.has_error())
        co_return error_with_message{messages.error(), "get_messages returned malformed messages"};

    // The server doesn't echo the room, since it's implied by the call
    for (auto& msg : *messages)
        msg.room = room;
    co_return std::move(*messages);
}
