//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <string_view>
#include <unistd.h>

#include "error.hpp"
#include "line_reader.hpp"
#include "message_cursor.hpp"
#include "rpc_client.hpp"
#include "util/normalize.hpp"

namespace asio = boost::asio;
using namespace chatlog;

namespace {

constexpr std::chrono::milliseconds default_poll_interval{1000};
constexpr std::chrono::milliseconds min_poll_interval{200};

// Everything the client tasks share
struct client_state
{
    rpc_client rpc;
    message_cursor cursor;
    std::string username;
    std::string room;
    std::chrono::milliseconds poll_interval;
};

std::chrono::milliseconds parse_poll_interval(std::string_view from)
{
    long value = 0;
    auto res = std::from_chars(from.data(), from.data() + from.size(), value);
    if (res.ec != std::errc() || res.ptr != from.data() + from.size())
        return default_poll_interval;
    return (std::max)(std::chrono::milliseconds(value), min_poll_interval);
}

bool is_quit_command(std::string_view line)
{
    std::string lower;
    for (char c : line)
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return lower == "/quit" || lower == "/exit";
}

// Polls the server for new messages, forever. Failures don't
// end the loop: we warn and try again on the next tick
asio::awaitable<void> poll_loop(client_state& st)
{
    asio::steady_timer timer(co_await asio::this_coro::executor);

    while (true)
    {
        auto res = co_await st.rpc.get_messages(st.cursor.last_id(), st.room);
        if (res.has_error())
        {
            std::cout << "[warning] Error while receiving messages: " << res.error().msg << std::endl;
        }
        else
        {
            for (const auto& msg : st.cursor.apply(std::move(*res)))
                std::cout << format_message(msg) << std::endl;
        }

        timer.expires_after(st.poll_interval);
        co_await timer.async_wait(asio::use_awaitable);
    }
}

// Sends a line typed by the user
asio::awaitable<void> send_line(client_state& st, std::string_view text)
{
    auto res = co_await st.rpc.send_message(st.username, text, st.room);
    if (res.has_error())
    {
        // The message might have been committed even if we got an error,
        // so we can't say that it wasn't delivered
        std::cout << "[error] message may not have been delivered: " << res.error().msg << std::endl;
    }
    else
    {
        std::cout << '[' << format_clock_time(std::chrono::system_clock::now()) << "] you (" << st.username
                  << ") [" << *res << "]: " << text << std::endl;
    }
}

// Reads lines from stdin and sends them, until the user quits or closes stdin
asio::awaitable<void> input_loop(client_state& st)
{
    // Duplicate the descriptor, so the reader doesn't close stdin on destruction
    line_reader input(co_await asio::this_coro::executor, ::dup(STDIN_FILENO));

    while (auto line = co_await input.read_line())
    {
        auto text = trim(*line);
        if (text.empty())
            continue;
        if (is_quit_command(text))
            co_return;

        co_await send_line(st, text);
    }
}

void main_impl(int argc, char* argv[])
{
    // Check command line arguments.
    if (argc < 4 || argc > 6)
    {
        std::cerr << "Usage: " << argv[0] << " <host> <port> <username> [room] [poll-interval-ms]\n"
                  << "Example:\n"
                  << "    " << argv[0] << " 127.0.0.1 9000 alice founders 500\n";
        exit(EXIT_FAILURE);
    }

    // Validate the room before contacting the server
    auto room = normalize_room(argc >= 5 ? std::string_view(argv[4]) : std::string_view());
    if (room.has_error())
    {
        std::cerr << "Invalid room '" << argv[4] << "': rooms are 'public' and 'founders'\n";
        exit(EXIT_FAILURE);
    }

    auto username = std::string(trim(argv[3]));
    if (username.empty())
    {
        std::cerr << "The username can't be empty\n";
        exit(EXIT_FAILURE);
    }

    asio::io_context ctx(1);

    client_state st{
        rpc_client(ctx.get_executor(), argv[1], argv[2]),
        message_cursor(username),
        username,
        std::move(*room),
        argc >= 6 ? parse_poll_interval(argv[5]) : default_poll_interval,
    };

    std::cout << "Connected to chat server at http://" << argv[1] << ':' << argv[2] << "/RPC2 as '"
              << st.username << "' in room '" << st.room << "'.\n"
              << "Type your message and press Enter to send. Use /quit or Ctrl+C to exit." << std::endl;

    // The poller runs until the context is stopped
    asio::co_spawn(ctx, poll_loop(st), [](std::exception_ptr exc) {
        if (exc)
            std::rethrow_exception(exc);
    });

    // Finishing the input task ends the session
    asio::co_spawn(ctx, input_loop(st), [&ctx](std::exception_ptr exc) {
        ctx.stop();
        if (exc)
            std::rethrow_exception(exc);
    });

    // Ctrl+C also ends the session
    asio::signal_set signals(ctx.get_executor(), SIGINT, SIGTERM);
    signals.async_wait([&ctx](error_code, int) { ctx.stop(); });

    ctx.run();

    std::cout << "Exiting chat client." << std::endl;
}

}  // namespace

int main(int argc, char* argv[])
{
    try
    {
        main_impl(argc, argv);
    }
    catch (const std::exception& err)
    {
        std::cerr << "Exception in main(): " << err.what() << std::endl;
        return EXIT_FAILURE;
    }
}
