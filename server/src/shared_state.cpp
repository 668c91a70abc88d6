//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "shared_state.hpp"

#include <boost/asio/any_io_executor.hpp>

#include <memory>

#include "api/rpc_service.hpp"
#include "services/message_log.hpp"
#include "services/message_store.hpp"

using namespace chatlog;

shared_state::shared_state(std::unique_ptr<message_store> store, boost::asio::any_io_executor ex)
    : impl_{
          std::move(store),
          nullptr,
          nullptr,
      }
{
    impl_.log_ = std::make_unique<message_log>(*impl_.store_, std::move(ex));
    impl_.rpc_ = std::make_unique<rpc_service>(*impl_.log_);
}

shared_state::shared_state(shared_state&& rhs) noexcept : impl_(std::move(rhs.impl_)) {}

shared_state& shared_state::operator=(shared_state&& rhs) noexcept
{
    impl_ = std::move(rhs.impl_);
    return *this;
}

shared_state::~shared_state() {}
