//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "util/async_mutex.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/experimental/channel.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/test/unit_test.hpp>

#include <chrono>
#include <vector>

#include "common/run_coroutine.hpp"
#include "error.hpp"

using namespace chatlog;
using chatlog::test::rethrow_on_error;
using chatlog::test::run_coroutine;
namespace asio = boost::asio;

BOOST_AUTO_TEST_SUITE(async_mutex_)

BOOST_AUTO_TEST_CASE(lock)
{
    run_coroutine([]() -> asio::awaitable<void> {
        // I/O objects
        async_mutex mtx(co_await asio::this_coro::executor);
        BOOST_TEST(!mtx.locked());

        // Lock
        co_await mtx.lock();
        BOOST_TEST(mtx.locked());

        // Unlock
        mtx.unlock();
        BOOST_TEST(!mtx.locked());
    });
}

BOOST_AUTO_TEST_CASE(lock_with_guard)
{
    run_coroutine([]() -> asio::awaitable<void> {
        // I/O objects
        async_mutex mtx(co_await asio::this_coro::executor);

        // Lock
        auto guard = co_await mtx.lock_with_guard();
        BOOST_TEST(mtx.locked());

        // Unlock
        guard.reset();
        BOOST_TEST(!mtx.locked());
    });
}

BOOST_AUTO_TEST_CASE(try_lock)
{
    run_coroutine([]() -> asio::awaitable<void> {
        // I/O objects
        async_mutex mtx(co_await asio::this_coro::executor);

        // Lock
        bool ok = mtx.try_lock();
        BOOST_TEST(ok);
        BOOST_TEST(mtx.locked());

        // Trying to lock a locked mutex fails
        ok = mtx.try_lock();
        BOOST_TEST(!ok);
        BOOST_TEST(mtx.locked());

        // Unlock
        mtx.unlock();
        BOOST_TEST(!mtx.locked());
    });
}

BOOST_AUTO_TEST_CASE(lock_contention)
{
    run_coroutine([]() -> asio::awaitable<void> {
        // I/O objects
        async_mutex mtx(co_await asio::this_coro::executor);
        asio::steady_timer timer(co_await asio::this_coro::executor);
        asio::experimental::channel<void(error_code)> chan(co_await asio::this_coro::executor, 1);

        // Lock the mutex
        auto guard = co_await mtx.lock_with_guard();
        BOOST_TEST(mtx.locked());

        // Launch another coroutine that tries to acquire it
        asio::co_spawn(
            co_await asio::this_coro::executor,
            [&]() -> asio::awaitable<void> {
                // Mutex should be held by the main coroutine
                BOOST_TEST_REQUIRE(mtx.locked());

                // Lock and unlock
                co_await mtx.lock();
                mtx.unlock();

                // Notify the main coroutine that we're done
                bool ok = chan.try_send(error_code());
                BOOST_TEST_REQUIRE(ok);
            },
            rethrow_on_error
        );

        // Yield so that the other coroutine tries to acquire the mutex while being held by us
        timer.expires_after(std::chrono::milliseconds(10));
        co_await timer.async_wait(asio::use_awaitable);

        // Unlock the mutex
        guard.reset();

        // Wait for the other coroutine to finish
        co_await chan.async_receive(asio::use_awaitable);

        BOOST_TEST(!mtx.locked());
    });
}

// Waiters acquire the mutex in the order they requested it
BOOST_AUTO_TEST_CASE(lock_fifo)
{
    run_coroutine([]() -> asio::awaitable<void> {
        // I/O objects
        auto ex = co_await asio::this_coro::executor;
        async_mutex mtx(ex);
        asio::steady_timer timer(ex);
        asio::experimental::channel<void(error_code)> chan(ex, 3);
        std::vector<int> order;

        // Hold the mutex while the waiters queue up
        auto guard = co_await mtx.lock_with_guard();

        for (int i = 0; i < 3; ++i)
        {
            asio::co_spawn(
                ex,
                [&mtx, &order, &chan, i]() -> asio::awaitable<void> {
                    auto waiter_guard = co_await mtx.lock_with_guard();
                    order.push_back(i);
                    chan.try_send(error_code());
                },
                rethrow_on_error
            );
        }

        // Let all of them block on the mutex
        timer.expires_after(std::chrono::milliseconds(10));
        co_await timer.async_wait(asio::use_awaitable);
        BOOST_TEST(order.empty());

        // Release and wait for all of them
        guard.reset();
        for (int i = 0; i < 3; ++i)
            co_await chan.async_receive(asio::use_awaitable);

        const std::vector<int> expected{0, 1, 2};
        BOOST_TEST(order == expected);
        BOOST_TEST(!mtx.locked());
    });
}

BOOST_AUTO_TEST_SUITE_END()
