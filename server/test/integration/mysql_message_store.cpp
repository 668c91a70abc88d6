//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Requires a running MySQL server, configured with the same environment
// variables as the server (CHAT_DB_HOST, CHAT_DB_USER...).

#include <boost/asio/awaitable.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/mysql/any_connection.hpp>
#include <boost/mysql/connect_params.hpp>
#include <boost/mysql/results.hpp>
#include <boost/mysql/static_results.hpp>
#include <boost/test/unit_test.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <tuple>

#include "common/run_coroutine.hpp"
#include "config.hpp"
#include "error.hpp"
#include "services/message_store.hpp"

using namespace chatlog;
using chatlog::test::run_coroutine;
namespace asio = boost::asio;
namespace mysql = boost::mysql;

namespace {

// A room name no other test run uses, so results are not affected by
// rows left by previous runs. The store doesn't validate rooms.
std::string unique_room()
{
    auto ticks = std::chrono::system_clock::now().time_since_epoch().count();
    return "itest_" + std::to_string(ticks % 1000000000000);
}

// A direct connection, to manipulate the schema behind the store's back
mysql::connect_params get_connect_params(const store_config& cfg)
{
    mysql::connect_params res;
    res.server_address.emplace_host_and_port(cfg.hostname, cfg.port);
    res.username = cfg.username;
    res.password = cfg.password;
    res.database = cfg.database;
    return res;
}

}  // namespace

BOOST_AUTO_TEST_SUITE(mysql_message_store_)

BOOST_AUTO_TEST_CASE(setup_db_idempotent)
{
    run_coroutine([]() -> asio::awaitable<void> {
        auto store = create_mysql_message_store(co_await asio::this_coro::executor, store_config_from_env());
        store->start_run();

        auto err = co_await store->setup_db();
        BOOST_TEST_REQUIRE(err.ec == error_code(), err.msg);

        // Running it again against an up-to-date table is a no-op
        err = co_await store->setup_db();
        BOOST_TEST_REQUIRE(err.ec == error_code(), err.msg);

        store->cancel();
    });
}

BOOST_AUTO_TEST_CASE(insert_and_select)
{
    run_coroutine([]() -> asio::awaitable<void> {
        auto store = create_mysql_message_store(co_await asio::this_coro::executor, store_config_from_env());
        store->start_run();

        auto err = co_await store->setup_db();
        BOOST_TEST_REQUIRE(err.ec == error_code(), err.msg);

        auto room = unique_room();
        auto now = std::chrono::system_clock::now();
        auto id1 = co_await store->insert_message("alice", room, "first", now);
        BOOST_TEST_REQUIRE(id1.has_value());
        auto id2 = co_await store->insert_message("bob", room, "second", now);
        BOOST_TEST_REQUIRE(id2.has_value());
        BOOST_TEST(*id2 > *id1);

        // Full history
        auto messages = co_await store->get_messages_since(room, 0);
        BOOST_TEST_REQUIRE(messages.has_value());
        BOOST_TEST_REQUIRE(messages->size() == 2u);
        BOOST_TEST(messages->at(0).id == *id1);
        BOOST_TEST(messages->at(0).author == "alice");
        BOOST_TEST(messages->at(0).text == "first");
        BOOST_TEST(messages->at(0).room == room);
        BOOST_TEST(messages->at(1).id == *id2);

        // Timestamps are stored with microsecond resolution
        auto expected_ts = std::chrono::time_point_cast<std::chrono::microseconds>(now);
        BOOST_TEST((messages->at(0).timestamp == expected_ts));

        // Since a cursor
        messages = co_await store->get_messages_since(room, *id1);
        BOOST_TEST_REQUIRE(messages.has_value());
        BOOST_TEST_REQUIRE(messages->size() == 1u);
        BOOST_TEST(messages->at(0).id == *id2);

        store->cancel();
    });
}

// Tables created by older versions lack the room column and its index.
// Note: this test drops chat_messages, deleting any data in it
BOOST_AUTO_TEST_CASE(setup_db_upgrades_legacy_table)
{
    run_coroutine([]() -> asio::awaitable<void> {
        auto ex = co_await asio::this_coro::executor;
        auto cfg = store_config_from_env();

        // Recreate the table as older versions did
        mysql::any_connection conn(ex);
        auto params = get_connect_params(cfg);
        co_await conn.async_connect(params);
        mysql::results r;
        co_await conn.async_execute("DROP TABLE IF EXISTS chat_messages", r);
        co_await conn.async_execute(
            "CREATE TABLE chat_messages ("
            "    id BIGINT NOT NULL AUTO_INCREMENT,"
            "    author TEXT NOT NULL,"
            "    text TEXT NOT NULL,"
            "    created_at DATETIME(6) NOT NULL DEFAULT CURRENT_TIMESTAMP(6),"
            "    PRIMARY KEY (id)"
            ") ENGINE=InnoDB",
            r
        );
        co_await conn.async_execute(
            "INSERT INTO chat_messages (author, text) VALUES ('carol', 'from the old days')",
            r
        );
        auto legacy_id = static_cast<std::int64_t>(r.last_insert_id());

        // Upgrade. Running it twice checks that the upgrade itself is idempotent
        auto store = create_mysql_message_store(ex, cfg);
        store->start_run();
        auto err = co_await store->setup_db();
        BOOST_TEST_REQUIRE(err.ec == error_code(), err.msg);
        err = co_await store->setup_db();
        BOOST_TEST_REQUIRE(err.ec == error_code(), err.msg);

        // Existing rows end up in the default room
        auto messages = co_await store->get_messages_since("public", 0);
        BOOST_TEST_REQUIRE(messages.has_value());
        BOOST_TEST_REQUIRE(messages->size() == 1u);
        BOOST_TEST(messages->at(0).id == legacy_id);
        BOOST_TEST(messages->at(0).author == "carol");
        BOOST_TEST(messages->at(0).text == "from the old days");
        BOOST_TEST(messages->at(0).room == "public");

        // The index used by range scans exists
        mysql::static_results<std::tuple<std::int64_t>> num_indexes;
        co_await conn.async_execute(
            "SELECT COUNT(*) FROM information_schema.STATISTICS WHERE TABLE_SCHEMA = DATABASE() "
            "AND TABLE_NAME = 'chat_messages' AND INDEX_NAME = 'chat_messages_room_id'",
            num_indexes
        );
        BOOST_TEST_REQUIRE(num_indexes.rows().size() == 1u);
        BOOST_TEST(std::get<0>(num_indexes.rows()[0]) > 0);

        // New rows can be added to any room
        auto id = co_await store->insert_message("dave", "founders", "new", std::chrono::system_clock::now());
        BOOST_TEST_REQUIRE(id.has_value());
        BOOST_TEST(*id > legacy_id);

        co_await conn.async_close();
        store->cancel();
    });
}

BOOST_AUTO_TEST_SUITE_END()
