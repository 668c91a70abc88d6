//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "api/rpc_service.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/json/array.hpp>
#include <boost/json/value.hpp>

#include <algorithm>
#include <iterator>
#include <string>
#include <string_view>

#include "api/rpc_types.hpp"
#include "error.hpp"
#include "services/message_log.hpp"

using namespace chatlog;
namespace asio = boost::asio;

namespace {

// The outcome of a method: either a JSON result or an error to report as a fault
using method_result = result_with_message<boost::json::value>;

// The function signature of method handlers
using method_fn = asio::awaitable<method_result> (*)(message_log&, const boost::json::value& params);

method_result fault(error_code ec, std::string msg = {})
{
    return {boost::system::in_place_error, error_with_message{ec, std::move(msg)}};
}

asio::awaitable<method_result> handle_send_message(message_log& log, const boost::json::value& params)
{
    // Type-check. Malformed calls never reach the log
    auto params_result = send_message_params::from_params(params);
    if (params_result.has_error())
        co_return fault(params_result.error(), "send_message expects (author: string, text: string, room: string)");
    const auto& p = *params_result;

    auto id_result = co_await log.append(p.author, p.text, p.room);
    if (id_result.has_error())
        co_return fault(id_result.error().ec, std::move(id_result.error().msg));
    co_return method_result(boost::system::in_place_value, *id_result);
}

asio::awaitable<method_result> handle_get_messages(message_log& log, const boost::json::value& params)
{
    auto params_result = get_messages_params::from_params(params);
    if (params_result.has_error())
        co_return fault(params_result.error(), "get_messages expects (cursor: integer, room: string)");
    const auto& p = *params_result;

    auto messages_result = co_await log.poll_since(p.cursor, p.room);
    if (messages_result.has_error())
        co_return fault(messages_result.error().ec, std::move(messages_result.error().msg));
    co_return method_result(boost::system::in_place_value, serialize_messages(*messages_result));
}

asio::awaitable<method_result> handle_list_methods(message_log&, const boost::json::value&);

// Identifies a single method that clients can call
struct rpc_method
{
    std::string_view name;
    method_fn handler;
};

// All the methods that our service exposes
constexpr rpc_method methods[] = {
    {send_message_method, handle_send_message},
    {get_messages_method, handle_get_messages},
    {list_methods_method, handle_list_methods},
};

asio::awaitable<method_result> handle_list_methods(message_log&, const boost::json::value&)
{
    boost::json::array res;
    for (const auto& m : methods)
        res.push_back(boost::json::value(m.name));
    co_return method_result(boost::system::in_place_value, std::move(res));
}

}  // namespace

asio::awaitable<std::string> rpc_service::handle_call(std::string_view body)
{
    static const boost::json::value null_id;

    // Parse the call envelope
    auto req_result = rpc_request::from_json(body);
    if (req_result.has_error())
        co_return rpc_fault_response{null_id, req_result.error(), ""}.to_json();
    const auto& req = *req_result;

    // Look up the method.
    // Since there aren't too many, linear search works better here.
    auto it = std::find_if(std::begin(methods), std::end(methods), [&req](const rpc_method& m) {
        return m.name == req.method;
    });
    if (it == std::end(methods))
        co_return rpc_fault_response{req.id, errc::rpc_method_not_found, "Unknown method: " + req.method}.to_json();

    // Invoke it
    auto res = co_await it->handler(*log_, req.params);
    if (res.has_error())
        co_return rpc_fault_response{req.id, res.error().ec, res.error().msg}.to_json();
    co_return rpc_result_response{req.id, std::move(*res)}.to_json();
}
