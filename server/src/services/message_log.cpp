//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/message_log.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/experimental/channel_error.hpp>
#include <boost/system/system_error.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "business_types.hpp"
#include "error.hpp"
#include "services/message_store.hpp"
#include "timestamp.hpp"
#include "util/normalize.hpp"

using namespace chatlog;
namespace asio = boost::asio;

static bool is_cancellation(error_code ec) noexcept
{
    return ec == asio::error::operation_aborted || ec == asio::experimental::error::channel_cancelled;
}

asio::awaitable<result_with_message<std::int64_t>> message_log::append(
    std::string_view author,
    std::string_view text,
    std::string_view room
)
{
    // Validate before touching the store
    author = trim(author);
    text = trim(text);
    if (author.empty())
        co_return error_with_message{errc::invalid_argument, "author must be a non-empty string"};
    if (text.empty())
        co_return error_with_message{errc::invalid_argument, "text must be a non-empty string"};
    auto room_result = normalize_room(room);
    if (room_result.has_error())
        co_return error_with_message{room_result.error(), "room must be either 'public' or 'founders'"};

    // Critical section: insert and commit. The guard releases the
    // mutex on every exit path
    result_with_message<std::int64_t> id_result;
    try
    {
        auto guard = co_await write_mtx_.lock_with_guard();
        id_result = co_await store_->insert_message(
            author,
            *room_result,
            text,
            std::chrono::system_clock::now()
        );
    }
    catch (const boost::system::system_error& err)
    {
        // Timeouts cancel us while queued behind other writers. Report
        // these as store failures, like the store itself would
        if (!is_cancellation(err.code()))
            throw;
        id_result = error_with_message{
            errc::store_unavailable,
            "The operation timed out; the message may not have been stored"
        };
    }
    if (id_result.has_error())
        log_error(id_result.error(), "Appending message");
    co_return id_result;
}

asio::awaitable<result_with_message<std::vector<message>>> message_log::poll_since(
    std::int64_t cursor,
    std::string_view room
)
{
    auto room_result = normalize_room(room);
    if (room_result.has_error())
        co_return error_with_message{room_result.error(), "room must be either 'public' or 'founders'"};

    auto messages_result = co_await store_->get_messages_since(*room_result, (std::max)(cursor, std::int64_t(0)));
    if (messages_result.has_error())
        log_error(messages_result.error(), "Polling messages");
    co_return messages_result;
}
