//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATLOG_CLIENT_INCLUDE_LINE_READER_HPP
#define CHATLOG_CLIENT_INCLUDE_LINE_READER_HPP

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>

#include <optional>
#include <string>
#include <utility>

namespace chatlog {

// Reads newline-terminated lines from a file descriptor.
// Works with terminals, pipes and regular files (e.g. redirected stdin).
// Descriptors that the reactor can't wait on never block when read,
// so Asio completes reads on them immediately.
class line_reader
{
    boost::asio::posix::stream_descriptor stream_;
    std::string buff_;
    bool eof_{false};

public:
    // Takes ownership of fd
    line_reader(boost::asio::any_io_executor ex, int fd) : stream_(std::move(ex), fd) {}

    // Returns the next line, without the terminator. When the input ends,
    // an unterminated last line is returned as-is. After that, returns
    // an empty optional. Read errors are thrown.
    boost::asio::awaitable<std::optional<std::string>> read_line();
};

}  // namespace chatlog

#endif
