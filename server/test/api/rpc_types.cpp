//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "api/rpc_types.hpp"

#include <boost/json/parse.hpp>
#include <boost/json/value.hpp>
#include <boost/test/unit_test.hpp>

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include "business_types.hpp"
#include "error.hpp"
#include "timestamp.hpp"

using namespace chatlog;

BOOST_AUTO_TEST_SUITE(rpc_types)

//
// Incoming calls
//

BOOST_AUTO_TEST_CASE(rpc_request_from_json)
{
    // Data
    const char* from = R"%({
        "jsonrpc": "2.0",
        "method": "send_message",
        "params": ["bob", "hi", "public"],
        "id": 1
    })%";

    // Call the function
    auto result = rpc_request::from_json(from);

    // Validate
    BOOST_TEST_REQUIRE(result.error() == error_code());
    BOOST_TEST(result->method == "send_message");
    BOOST_TEST(result->id == boost::json::value(1));
    BOOST_TEST(result->params == boost::json::parse(R"(["bob", "hi", "public"])"));
}

BOOST_AUTO_TEST_CASE(rpc_request_from_json_optional_members)
{
    // No id and no params
    auto result = rpc_request::from_json(R"({"jsonrpc": "2.0", "method": "system.listMethods"})");

    BOOST_TEST_REQUIRE(result.error() == error_code());
    BOOST_TEST(result->method == "system.listMethods");
    BOOST_TEST(result->id.is_null());
    BOOST_TEST(result->params.is_null());
}

BOOST_AUTO_TEST_CASE(rpc_request_from_json_error)
{
    struct
    {
        std::string_view name;
        std::string_view input;
        errc expected;
    } test_cases[] = {
        {"not_json",          "{bad",                                                    errc::rpc_parse_error    },
        {"empty",             "",                                                        errc::rpc_parse_error    },
        {"not_object",        "[]",                                                      errc::rpc_invalid_request},
        {"batch",             R"([{"jsonrpc":"2.0","method":"a","id":1}])",              errc::rpc_invalid_request},
        {"missing_version",   R"({"method":"a","id":1})",                                errc::rpc_invalid_request},
        {"bad_version",       R"({"jsonrpc":"1.0","method":"a","id":1})",                errc::rpc_invalid_request},
        {"missing_method",    R"({"jsonrpc":"2.0","id":1})",                             errc::rpc_invalid_request},
        {"method_not_string", R"({"jsonrpc":"2.0","method":10,"id":1})",                 errc::rpc_invalid_request},
        {"id_object",         R"({"jsonrpc":"2.0","method":"a","id":{}})",               errc::rpc_invalid_request},
        {"params_string",     R"({"jsonrpc":"2.0","method":"a","params":"x","id":1})",   errc::rpc_invalid_request},
    };

    for (const auto& tc : test_cases)
    {
        BOOST_TEST_CONTEXT(tc.name)
        {
            auto result = rpc_request::from_json(tc.input);
            BOOST_TEST(result.error() == tc.expected);
        }
    }
}

BOOST_AUTO_TEST_CASE(send_message_params_positional)
{
    auto result = send_message_params::from_params(boost::json::parse(R"(["alice", "hello", "founders"])"));
    BOOST_TEST_REQUIRE(result.error() == error_code());
    BOOST_TEST(result->author == "alice");
    BOOST_TEST(result->text == "hello");
    BOOST_TEST(result->room == "founders");

    // The room defaults to public
    result = send_message_params::from_params(boost::json::parse(R"(["alice", "hello"])"));
    BOOST_TEST_REQUIRE(result.error() == error_code());
    BOOST_TEST(result->room == "public");
}

BOOST_AUTO_TEST_CASE(send_message_params_named)
{
    auto result = send_message_params::from_params(
        boost::json::parse(R"({"author": "alice", "text": "hello", "room": "founders"})")
    );
    BOOST_TEST_REQUIRE(result.error() == error_code());
    BOOST_TEST(result->author == "alice");
    BOOST_TEST(result->text == "hello");
    BOOST_TEST(result->room == "founders");

    // username is an alias for author, and null rooms are ignored
    result = send_message_params::from_params(
        boost::json::parse(R"({"username": "bob", "text": "hi", "room": null})")
    );
    BOOST_TEST_REQUIRE(result.error() == error_code());
    BOOST_TEST(result->author == "bob");
    BOOST_TEST(result->room == "public");
}

BOOST_AUTO_TEST_CASE(send_message_params_content_not_validated)
{
    // Empty strings and unknown rooms are the log's business
    auto result = send_message_params::from_params(boost::json::parse(R"(["", "", "lobby"])"));
    BOOST_TEST_REQUIRE(result.error() == error_code());
    BOOST_TEST(result->author == "");
    BOOST_TEST(result->room == "lobby");
}

BOOST_AUTO_TEST_CASE(send_message_params_error)
{
    constexpr std::string_view test_cases[] = {
        R"(null)",
        R"([])",
        R"(["alice"])",
        R"(["alice", "hi", "public", "extra"])",
        R"([1, "hi"])",
        R"(["alice", 2])",
        R"(["alice", "hi", 3])",
        R"({"text": "hi"})",
        R"({"author": "alice"})",
        R"({"author": null, "text": "hi"})",
        R"({"author": "alice", "text": "hi", "room": []})",
    };

    for (auto tc : test_cases)
    {
        BOOST_TEST_CONTEXT(tc)
        {
            auto result = send_message_params::from_params(boost::json::parse(tc));
            BOOST_TEST(result.error() == errc::rpc_invalid_params);
        }
    }
}

BOOST_AUTO_TEST_CASE(get_messages_params_success)
{
    struct
    {
        std::string_view params;
        std::int64_t cursor;
        std::string_view room;
    } test_cases[] = {
        {"null",                                 0,  "public"  },
        {"[]",                                   0,  "public"  },
        {"[5]",                                  5,  "public"  },
        {R"([5, "founders"])",                   5,  "founders"},
        {R"(["12", "public"])",                  12, "public"  },
        {R"(["garbage"])",                       0,  "public"  },
        {R"([-4])",                              0,  "public"  },
        {R"([null, "founders"])",                0,  "founders"},
        {R"({"cursor": 3, "room": "founders"})", 3,  "founders"},
        {R"({"last_id": 8})",                    8,  "public"  },
        {R"({})",                                0,  "public"  },
    };

    for (const auto& tc : test_cases)
    {
        BOOST_TEST_CONTEXT(tc.params)
        {
            auto result = get_messages_params::from_params(boost::json::parse(tc.params));
            BOOST_TEST_REQUIRE(result.error() == error_code());
            BOOST_TEST(result->cursor == tc.cursor);
            BOOST_TEST(result->room == tc.room);
        }
    }
}

BOOST_AUTO_TEST_CASE(get_messages_params_error)
{
    constexpr std::string_view test_cases[] = {
        R"([0, "public", 1])",
        R"([0, 1])",
        R"({"room": false})",
        R"("abc")",
        R"(10)",
    };

    for (auto tc : test_cases)
    {
        BOOST_TEST_CONTEXT(tc)
        {
            auto result = get_messages_params::from_params(boost::json::parse(tc));
            BOOST_TEST(result.error() == errc::rpc_invalid_params);
        }
    }
}

//
// Outgoing responses
//

BOOST_AUTO_TEST_CASE(serialize_messages_)
{
    // Data
    const message messages[] = {
        {1, "alice", "public", "hello", parse_timestamp(1700000000.5)},
        {3, "bob", "public", "hi", parse_timestamp(1700000001.0)},
    };

    // Call the function
    auto res = serialize_messages(messages);

    // Validate. The room is not serialized
    auto expected = boost::json::parse(R"([
        {"id": 1, "author": "alice", "text": "hello", "timestamp": 1700000000.5},
        {"id": 3, "author": "bob", "text": "hi", "timestamp": 1700000001.0}
    ])");
    BOOST_TEST(boost::json::value(res) == expected);
}

BOOST_AUTO_TEST_CASE(serialize_messages_empty) { BOOST_TEST(serialize_messages({}).empty()); }

BOOST_AUTO_TEST_CASE(fault_codes)
{
    BOOST_TEST(fault_code(errc::invalid_argument) == -32000);
    BOOST_TEST(fault_code(errc::store_unavailable) == -32001);
    BOOST_TEST(fault_code(errc::rpc_parse_error) == -32700);
    BOOST_TEST(fault_code(errc::rpc_invalid_request) == -32600);
    BOOST_TEST(fault_code(errc::rpc_method_not_found) == -32601);
    BOOST_TEST(fault_code(errc::rpc_invalid_params) == -32602);
    BOOST_TEST(fault_code(errc::uncaught_exception) == -32603);

    BOOST_TEST(fault_kind(errc::invalid_argument) == "InvalidArgument");
    BOOST_TEST(fault_kind(errc::store_unavailable) == "StoreUnavailable");
    BOOST_TEST(fault_kind(errc::uncaught_exception) == "InternalError");
}

BOOST_AUTO_TEST_CASE(rpc_result_response_to_json)
{
    boost::json::value id("abc");
    auto res = rpc_result_response{id, boost::json::value(42)}.to_json();
    BOOST_TEST(boost::json::parse(res) == boost::json::parse(R"({"jsonrpc": "2.0", "result": 42, "id": "abc"})"));
}

BOOST_AUTO_TEST_CASE(rpc_fault_response_to_json)
{
    boost::json::value id(7);
    auto res = rpc_fault_response{id, errc::invalid_argument, "text must be a non-empty string"}.to_json();
    auto expected = boost::json::parse(R"({
        "jsonrpc": "2.0",
        "error": {
            "code": -32000,
            "message": "text must be a non-empty string",
            "data": {"kind": "InvalidArgument"}
        },
        "id": 7
    })");
    BOOST_TEST(boost::json::parse(res) == expected);
}

BOOST_AUTO_TEST_CASE(rpc_fault_response_to_json_default_message)
{
    boost::json::value id;
    auto res = rpc_fault_response{id, errc::rpc_parse_error, ""}.to_json();
    auto expected = boost::json::parse(R"({
        "jsonrpc": "2.0",
        "error": {"code": -32700, "message": "ParseError", "data": {"kind": "ParseError"}},
        "id": null
    })");
    BOOST_TEST(boost::json::parse(res) == expected);
}

//
// Client side
//

BOOST_AUTO_TEST_CASE(serialize_rpc_call_)
{
    auto res = serialize_rpc_call(3, get_messages_method, {10, "founders"});
    auto expected = boost::json::parse(R"({
        "jsonrpc": "2.0",
        "method": "get_messages",
        "params": [10, "founders"],
        "id": 3
    })");
    BOOST_TEST(boost::json::parse(res) == expected);
}

BOOST_AUTO_TEST_CASE(parse_rpc_response_result)
{
    auto res = parse_rpc_response(R"({"jsonrpc": "2.0", "result": [1, 2], "id": 1})");
    BOOST_TEST_REQUIRE(res.has_value());
    BOOST_TEST(*res == boost::json::parse("[1, 2]"));

    // Null results are valid
    res = parse_rpc_response(R"({"jsonrpc": "2.0", "result": null, "id": 1})");
    BOOST_TEST_REQUIRE(res.has_value());
    BOOST_TEST(res->is_null());
}

BOOST_AUTO_TEST_CASE(parse_rpc_response_fault)
{
    auto res = parse_rpc_response(
        R"({"jsonrpc": "2.0", "error": {"code": -32001, "message": "db down"}, "id": 1})"
    );
    BOOST_TEST_REQUIRE(res.has_error());
    BOOST_TEST(res.error().ec == errc::store_unavailable);
    BOOST_TEST(res.error().msg == "db down");

    // Unknown codes
    res = parse_rpc_response(R"({"jsonrpc": "2.0", "error": {"code": 1, "message": "x"}, "id": 1})");
    BOOST_TEST_REQUIRE(res.has_error());
    BOOST_TEST(res.error().ec == errc::uncaught_exception);
}

BOOST_AUTO_TEST_CASE(parse_rpc_response_error)
{
    constexpr std::string_view test_cases[] = {
        "not json",
        "[]",
        R"({"jsonrpc": "2.0", "id": 1})",
        R"({"jsonrpc": "2.0", "error": "bad", "id": 1})",
    };

    for (auto tc : test_cases)
    {
        BOOST_TEST_CONTEXT(tc)
        {
            auto res = parse_rpc_response(tc);
            BOOST_TEST_REQUIRE(res.has_error());
            BOOST_TEST(res.error().ec == errc::rpc_parse_error);
        }
    }
}

BOOST_AUTO_TEST_CASE(parse_messages_)
{
    auto res = parse_messages(boost::json::parse(R"([
        {"id": 4, "author": "alice", "text": "hello", "timestamp": 1700000000.25}
    ])"));

    BOOST_TEST_REQUIRE(res.has_value());
    BOOST_TEST_REQUIRE(res->size() == 1u);
    const auto& msg = res->at(0);
    BOOST_TEST(msg.id == 4);
    BOOST_TEST(msg.author == "alice");
    BOOST_TEST(msg.text == "hello");
    BOOST_TEST((msg.timestamp == parse_timestamp(1700000000.25)));
}

BOOST_AUTO_TEST_CASE(parse_messages_error)
{
    BOOST_TEST(parse_messages(boost::json::parse(R"({"id": 1})")).has_error());
    BOOST_TEST(parse_messages(boost::json::parse(R"([{"id": "x", "author": "a", "text": "b", "timestamp": 1}])"))
                   .has_error());
}

BOOST_AUTO_TEST_SUITE_END()
