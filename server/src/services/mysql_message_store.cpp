//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/describe/class.hpp>
#include <boost/mysql/any_address.hpp>
#include <boost/mysql/connection_pool.hpp>
#include <boost/mysql/datetime.hpp>
#include <boost/mysql/diagnostics.hpp>
#include <boost/mysql/pool_params.hpp>
#include <boost/mysql/results.hpp>
#include <boost/mysql/static_results.hpp>
#include <boost/mysql/with_params.hpp>

#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include "business_types.hpp"
#include "config.hpp"
#include "error.hpp"
#include "services/message_store.hpp"
#include "timestamp.hpp"

using namespace chatlog;
namespace mysql = boost::mysql;
namespace asio = boost::asio;

namespace {

// A row in the chat_messages table, as retrieved by get_messages_since.
// static_results requires that SQL field names match with C++ struct
// field names, and Describe metadata to match them.
struct message_row
{
    std::int64_t id;
    std::string author;
    std::string text;
    mysql::datetime created_at;
};
BOOST_DESCRIBE_STRUCT(message_row, (), (id, author, text, created_at))

constexpr std::string_view create_table_query = R"SQL(
CREATE TABLE IF NOT EXISTS chat_messages (
    id BIGINT NOT NULL AUTO_INCREMENT,
    author TEXT NOT NULL,
    room VARCHAR(32) NOT NULL DEFAULT 'public',
    text TEXT NOT NULL,
    created_at DATETIME(6) NOT NULL DEFAULT CURRENT_TIMESTAMP(6),
    PRIMARY KEY (id),
    INDEX chat_messages_room_id (room, id)
) ENGINE=InnoDB
)SQL";

// Extracts the diagnostic string from a diagnostics object
std::string get_message(const mysql::diagnostics& diag)
{
    return diag.client_message().empty() ? diag.server_message() : diag.client_message();
}

// All failures are reported to the message log with the same error code.
// The original code and the server diagnostics go in the message.
error_with_message store_error(error_code ec, const mysql::diagnostics& diag)
{
    std::string msg = ec.message();
    auto server_msg = get_message(diag);
    if (!server_msg.empty())
    {
        msg += ": ";
        msg += server_msg;
    }
    return error_with_message{errc::store_unavailable, std::move(msg)};
}

// Returns the pool params to use
mysql::pool_params get_pool_params(const store_config& cfg)
{
    mysql::pool_params res;

    // The server address
    res.server_address = mysql::host_and_port{cfg.hostname, cfg.port};

    // Credentials and database
    res.username = cfg.username;
    res.password = cfg.password;
    res.database = cfg.database;

    // The pool grows on demand, up to this many connections
    res.max_size = cfg.max_pool_size;

    return res;
}

// Converts a DATETIME(6) value, stored in UTC, to a timestamp
timestamp_t to_timestamp(const mysql::datetime& dt)
{
    return std::chrono::time_point_cast<timestamp_t::duration>(dt.as_time_point());
}

class mysql_message_store final : public message_store
{
    mysql::connection_pool pool_;

    // Runs a query returning a single integer, like SELECT COUNT(*)
    template <class Query>
    asio::awaitable<result_with_message<std::int64_t>> query_count(mysql::pooled_connection& conn, Query query)
    {
        error_code ec;
        mysql::diagnostics diag;
        mysql::static_results<std::tuple<std::int64_t>> result;
        co_await conn->async_execute(std::move(query), result, diag, asio::redirect_error(ec));
        if (ec)
            co_return store_error(ec, diag);
        co_return result.rows().empty() ? 0 : std::get<0>(result.rows()[0]);
    }

    // Runs a statement that doesn't return rows
    asio::awaitable<error_with_message> execute(mysql::pooled_connection& conn, std::string_view stmt)
    {
        error_code ec;
        mysql::diagnostics diag;
        mysql::results result;
        co_await conn->async_execute(stmt, result, diag, asio::redirect_error(ec));
        if (ec)
            co_return store_error(ec, diag);
        co_return error_with_message{};
    }

public:
    mysql_message_store(asio::any_io_executor ex, const store_config& cfg)
        : pool_(std::move(ex), get_pool_params(cfg))
    {
    }

    void start_run() override final
    {
        asio::co_spawn(
            pool_.get_executor(),
            [pool = &pool_]() { return pool->async_run(asio::use_awaitable); },
            [](std::exception_ptr exc) {
                if (exc)
                    std::rethrow_exception(exc);
            }
        );
    }

    void cancel() override final { pool_.cancel(); }

    asio::awaitable<error_with_message> setup_db() override final
    {
        error_code ec;
        mysql::diagnostics diag;

        // Get a connection
        mysql::pooled_connection conn = co_await pool_.async_get_connection(diag, asio::redirect_error(ec));
        if (ec)
            co_return store_error(ec, diag);

        // Create the table, if it doesn't exist
        auto err = co_await execute(conn, create_table_query);
        if (err.ec)
            co_return err;

        // Tables created by older versions don't have a room column.
        // MySQL lacks ADD COLUMN IF NOT EXISTS, so look it up first.
        auto num_columns = co_await query_count(
            conn,
            mysql::with_params(
                "SELECT COUNT(*) FROM information_schema.COLUMNS "
                "WHERE TABLE_SCHEMA = DATABASE() AND TABLE_NAME = 'chat_messages' AND COLUMN_NAME = {}",
                "room"
            )
        );
        if (num_columns.has_error())
            co_return std::move(num_columns).error();
        if (*num_columns == 0)
        {
            log_info("Adding the room column to chat_messages");
            err = co_await execute(
                conn,
                "ALTER TABLE chat_messages ADD COLUMN room VARCHAR(32) NOT NULL DEFAULT 'public' AFTER author"
            );
            if (err.ec)
                co_return err;
        }

        // Same for the index used by range scans
        auto num_indexes = co_await query_count(
            conn,
            mysql::with_params(
                "SELECT COUNT(*) FROM information_schema.STATISTICS "
                "WHERE TABLE_SCHEMA = DATABASE() AND TABLE_NAME = 'chat_messages' AND INDEX_NAME = {}",
                "chat_messages_room_id"
            )
        );
        if (num_indexes.has_error())
            co_return std::move(num_indexes).error();
        if (*num_indexes == 0)
        {
            log_info("Creating the chat_messages_room_id index");
            err = co_await execute(conn, "CREATE INDEX chat_messages_room_id ON chat_messages (room, id)");
            if (err.ec)
                co_return err;
        }

        // We didn't modify any session state, so no reset is required
        conn.return_without_reset();
        co_return error_with_message{};
    }

    asio::awaitable<result_with_message<std::int64_t>> insert_message(
        std::string_view author,
        std::string_view room,
        std::string_view text,
        timestamp_t created_at
    ) override final
    {
        error_code ec;
        mysql::diagnostics diag;
        mysql::results result;

        // Get a connection
        mysql::pooled_connection conn = co_await pool_.async_get_connection(diag, asio::redirect_error(ec));
        if (ec)
            co_return store_error(ec, diag);

        // Execute the insertion. The statement runs with autocommit, so the row
        // and its ID become visible atomically when this completes.
        auto created_at_us = std::chrono::time_point_cast<std::chrono::microseconds>(created_at);
        co_await conn->async_execute(
            mysql::with_params(
                "INSERT INTO chat_messages (author, room, text, created_at) VALUES ({}, {}, {}, {})",
                author,
                room,
                text,
                mysql::datetime(created_at_us)
            ),
            result,
            diag,
            asio::redirect_error(ec)
        );
        if (ec)
            co_return store_error(ec, diag);

        // Done. MySQL reports last_insert_id as an uint64_t to be able to handle
        // any column type, but our id field is defined as BIGINT (int64).
        // The connection is returned to the pool automatically.
        co_return static_cast<std::int64_t>(result.last_insert_id());
    }

    asio::awaitable<result_with_message<std::vector<message>>> get_messages_since(
        std::string_view room,
        std::int64_t cursor
    ) override final
    {
        error_code ec;
        mysql::diagnostics diag;

        // Get a connection
        auto conn = co_await pool_.async_get_connection(diag, asio::redirect_error(ec));
        if (ec)
            co_return store_error(ec, diag);

        // A range scan on the (room, id) index
        mysql::static_results<message_row> result;
        co_await conn->async_execute(
            mysql::with_params(
                "SELECT id, author, text, created_at FROM chat_messages "
                "WHERE room = {} AND id > {} ORDER BY id ASC",
                room,
                cursor
            ),
            result,
            diag,
            asio::redirect_error(ec)
        );
        if (ec)
            co_return store_error(ec, diag);

        // Read-only query, the connection can be reused as is
        conn.return_without_reset();

        // Result
        std::vector<message> res;
        res.reserve(result.rows().size());
        for (const auto& row : result.rows())
        {
            res.push_back(message{
                row.id,
                row.author,
                std::string(room),
                row.text,
                to_timestamp(row.created_at),
            });
        }
        co_return res;
    }
};

}  // namespace

std::unique_ptr<message_store> chatlog::create_mysql_message_store(
    asio::any_io_executor ex,
    const store_config& cfg
)
{
    return std::unique_ptr<message_store>{new mysql_message_store(std::move(ex), cfg)};
}
