//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "line_reader.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/system/system_error.hpp>

#include <optional>
#include <string>
#include <utility>

#include "error.hpp"

using namespace chatlog;
namespace asio = boost::asio;

asio::awaitable<std::optional<std::string>> line_reader::read_line()
{
    if (!eof_)
    {
        error_code ec;
        std::size_t bytes_read = co_await asio::async_read_until(
            stream_,
            asio::dynamic_buffer(buff_),
            '\n',
            asio::redirect_error(ec)
        );

        if (!ec)
        {
            std::string line = buff_.substr(0, bytes_read - 1u);
            buff_.erase(0, bytes_read);
            co_return line;
        }
        else if (ec != asio::error::eof)
        {
            throw boost::system::system_error(ec, "Reading input");
        }
        eof_ = true;
    }

    // Input closed. Hand out any unterminated line
    if (buff_.empty())
        co_return std::nullopt;
    std::string line = std::move(buff_);
    buff_.clear();
    co_return line;
}
