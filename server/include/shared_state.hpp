//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATLOG_SERVER_INCLUDE_SHARED_STATE_HPP
#define CHATLOG_SERVER_INCLUDE_SHARED_STATE_HPP

#include <boost/asio/any_io_executor.hpp>

#include <memory>

namespace chatlog {

// Forward declaration
class message_store;
class message_log;
class rpc_service;

// Contains the objects shared by all sessions in the server.
// Nothing here is global: each instance is independent from the others.
class shared_state
{
    struct
    {
        std::unique_ptr<message_store> store_;
        std::unique_ptr<message_log> log_;
        std::unique_ptr<rpc_service> rpc_;
    } impl_;

public:
    // Takes ownership of the store, and builds the log and services on top of it
    shared_state(std::unique_ptr<message_store> store, boost::asio::any_io_executor ex);
    shared_state(const shared_state&) = delete;
    shared_state(shared_state&&) noexcept;
    shared_state& operator=(const shared_state&) = delete;
    shared_state& operator=(shared_state&&) noexcept;
    ~shared_state();

    message_store& store() noexcept { return *impl_.store_; }
    message_log& log() noexcept { return *impl_.log_; }
    rpc_service& rpc() noexcept { return *impl_.rpc_; }
};

}  // namespace chatlog

#endif
