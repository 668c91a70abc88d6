//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "api/rpc_endpoint.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/beast/http/status.hpp>

#include <cstdint>
#include <string>
#include <string_view>

#include "api/rest_types.hpp"
#include "api/rpc_service.hpp"
#include "business_types.hpp"
#include "error.hpp"
#include "request_context.hpp"
#include "services/message_log.hpp"
#include "shared_state.hpp"
#include "util/normalize.hpp"

using namespace chatlog;
namespace http = boost::beast::http;
namespace asio = boost::asio;

// Maps message log errors to REST responses. Validation errors are expected
// and described to the client. Store errors are reported with their message,
// so that clients can tell the write may not have happened.
static response_builder::response_type log_error_response(response_builder& resp, const error_with_message& err)
{
    if (err.ec == errc::invalid_argument)
        return resp.bad_request_json(api_error_id::invalid_argument, err.msg);
    else if (err.ec == errc::store_unavailable)
        return resp.json_error(http::status::internal_server_error, api_error_id::store_unavailable, err.msg);
    else
        return resp.internal_server_error(err);
}

asio::awaitable<response_builder::response_type> chatlog::handle_rpc(request_context& ctx, shared_state& st)
{
    if (!ctx.is_json_content_type())
        co_return ctx.response().unsupported_media_type();

    // Faults are regular responses in JSON-RPC, so this always returns 200
    auto body = co_await st.rpc().handle_call(ctx.request_body());
    co_return ctx.response().serialized_json_response(std::move(body));
}

asio::awaitable<response_builder::response_type> chatlog::handle_get_messages(
    request_context& ctx,
    shared_state& st
)
{
    // A missing or malformed cursor means "from the beginning"
    auto last_id = ctx.query_param("last_id");
    std::int64_t cursor = last_id ? parse_cursor(std::string_view(*last_id)) : 0;
    auto room = ctx.query_param("room");

    auto messages_result = co_await st.log().poll_since(cursor, room ? *room : std::string(default_room));
    if (messages_result.has_error())
        co_return log_error_response(ctx.response(), messages_result.error());
    co_return ctx.response().json_response(get_messages_response{*messages_result});
}

asio::awaitable<response_builder::response_type> chatlog::handle_post_message(
    request_context& ctx,
    shared_state& st
)
{
    // Parse params
    auto parse_result = ctx.parse_json_body<post_message_request>();
    if (parse_result.has_error())
    {
        if (parse_result.error() == errc::invalid_content_type)
            co_return ctx.response().unsupported_media_type();
        co_return ctx.response().bad_request_json("author and text are required");
    }
    const auto& req_params = parse_result.value();

    // Execute the operation. The log validates contents
    auto id_result = co_await st.log().append(req_params.author, req_params.text, req_params.room);
    if (id_result.has_error())
        co_return log_error_response(ctx.response(), id_result.error());
    co_return ctx.response().json_response(post_message_response{*id_result});
}
