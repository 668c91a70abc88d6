//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATLOG_SERVER_INCLUDE_UTIL_ASYNC_MUTEX_HPP
#define CHATLOG_SERVER_INCLUDE_UTIL_ASYNC_MUTEX_HPP

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/experimental/channel.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/assert.hpp>

#include <memory>

#include "error.hpp"

namespace chatlog {

// An asynchronous mutex to guarantee mutual exclusion in async code.
// Note that this is not thread-safe - it ensures mutual exclusion between
// coroutines running on the same single-threaded executor.
//
// The mutex is a channel holding a single token. Locking receives the token
// and unlocking sends it back. Channels serve pending receivers in order,
// so coroutines acquire the mutex in the order they requested it.
class async_mutex
{
    boost::asio::experimental::channel<void(error_code)> chan_;

    struct guard_deleter
    {
        void operator()(async_mutex* self) const noexcept { self->unlock(); }
    };

public:
    // Constructors, assignments, destructor
    async_mutex(boost::asio::any_io_executor ex) : chan_(std::move(ex), 1) { chan_.try_send(error_code()); }
    async_mutex(const async_mutex&) = delete;
    async_mutex(async_mutex&&) = delete;
    async_mutex& operator=(const async_mutex&) = delete;
    async_mutex& operator=(async_mutex&&) = delete;
    ~async_mutex() = default;

    // Is the mutex locked? True while the token is checked out
    bool locked() const noexcept { return !chan_.ready(); }

    // Suspends the current coroutine until the mutex can be acquired, then acquire it
    boost::asio::awaitable<void> lock() { co_await chan_.async_receive(boost::asio::use_awaitable); }

    // Try to acquire without suspending
    bool try_lock() { return chan_.try_receive([](error_code) {}); }

    // Unlock. The mutex must be locked. If there are waiting coroutines,
    // the oldest one gets the token.
    void unlock() noexcept
    {
        bool ok = chan_.try_send(error_code());
        BOOST_ASSERT(ok);
        static_cast<void>(ok);
    }

    using guard = std::unique_ptr<async_mutex, guard_deleter>;
    boost::asio::awaitable<guard> lock_with_guard()
    {
        co_await lock();
        co_return guard(this);
    }
};

}  // namespace chatlog

#endif
