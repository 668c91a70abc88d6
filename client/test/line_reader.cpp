//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "line_reader.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/test/unit_test.hpp>

#include <cstdlib>
#include <fcntl.h>
#include <optional>
#include <string>
#include <string_view>
#include <unistd.h>
#include <utility>
#include <vector>

#include "common/run_coroutine.hpp"

using namespace chatlog;
using chatlog::test::run_coroutine;
namespace asio = boost::asio;

namespace {

void write_all(int fd, std::string_view contents)
{
    while (!contents.empty())
    {
        auto res = ::write(fd, contents.data(), contents.size());
        BOOST_TEST_REQUIRE(res > 0);
        contents.remove_prefix(static_cast<std::size_t>(res));
    }
}

// A temporary regular file, removed on destruction
class temp_file
{
    std::string path_{"/tmp/chatlog_line_reader_XXXXXX"};

public:
    explicit temp_file(std::string_view contents)
    {
        int fd = ::mkstemp(path_.data());
        BOOST_TEST_REQUIRE(fd >= 0);
        write_all(fd, contents);
        ::close(fd);
    }
    temp_file(const temp_file&) = delete;
    temp_file& operator=(const temp_file&) = delete;
    ~temp_file() { ::unlink(path_.c_str()); }

    // Opens the file for reading, positioned at the start
    int open() const
    {
        int fd = ::open(path_.c_str(), O_RDONLY);
        BOOST_TEST_REQUIRE(fd >= 0);
        return fd;
    }
};

// Reads lines until the input is exhausted
asio::awaitable<std::vector<std::string>> read_all(line_reader& reader)
{
    std::vector<std::string> res;
    while (auto line = co_await reader.read_line())
        res.push_back(std::move(*line));
    co_return res;
}

}  // namespace

BOOST_AUTO_TEST_SUITE(line_reader_)

// stdin redirected from a file. epoll can't wait on regular files
BOOST_AUTO_TEST_CASE(regular_file)
{
    run_coroutine([]() -> asio::awaitable<void> {
        temp_file file("hello\n\nworld");
        line_reader reader(co_await asio::this_coro::executor, file.open());

        const std::vector<std::string> expected{"hello", "", "world"};
        auto lines = co_await read_all(reader);
        BOOST_TEST(lines == expected);

        // Exhausted readers stay exhausted
        auto line = co_await reader.read_line();
        BOOST_TEST(!line.has_value());
    });
}

BOOST_AUTO_TEST_CASE(empty_input)
{
    run_coroutine([]() -> asio::awaitable<void> {
        int fd = ::open("/dev/null", O_RDONLY);
        BOOST_TEST_REQUIRE(fd >= 0);
        line_reader reader(co_await asio::this_coro::executor, fd);

        auto line = co_await reader.read_line();
        BOOST_TEST(!line.has_value());
    });
}

// stdin piped from another process
BOOST_AUTO_TEST_CASE(pipe_input)
{
    run_coroutine([]() -> asio::awaitable<void> {
        int fds[2]{};
        BOOST_TEST_REQUIRE(::pipe(fds) == 0);
        line_reader reader(co_await asio::this_coro::executor, fds[0]);

        write_all(fds[1], "first line\nsecond");
        auto line = co_await reader.read_line();
        BOOST_TEST_REQUIRE(line.has_value());
        BOOST_TEST(*line == "first line");

        // The rest of the line arrives later
        write_all(fds[1], " line\n/quit\n");
        ::close(fds[1]);
        const std::vector<std::string> expected{"second line", "/quit"};
        auto lines = co_await read_all(reader);
        BOOST_TEST(lines == expected);
    });
}

BOOST_AUTO_TEST_SUITE_END()
