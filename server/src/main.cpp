//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <sstream>

#include "config.hpp"
#include "error.hpp"
#include "server.hpp"
#include "services/message_store.hpp"
#include "shared_state.hpp"

namespace asio = boost::asio;
using namespace chatlog;

static void main_impl(int argc, char* argv[])
{
    // Check command line arguments.
    if (argc != 3)
    {
        std::cerr << "Usage: " << argv[0] << " <address> <port>\n"
                  << "Example:\n"
                  << "    " << argv[0] << " 0.0.0.0 9000\n"
                  << "The database is configured through the CHAT_DB_HOST, CHAT_DB_PORT,\n"
                  << "CHAT_DB_NAME, CHAT_DB_USER, CHAT_DB_PASSWORD and CHAT_DB_POOL_SIZE\n"
                  << "environment variables.\n";
        exit(EXIT_FAILURE);
    }

    // Application config
    server_config cfg{
        argv[1],                                          // IP where the server will listen
        static_cast<unsigned short>(std::atoi(argv[2])),  // Port
        store_config_from_env(),                          // Database
    };

    // An event loop, where the application will run. The server is single-
    // threaded, so we set the concurrency hint to 1
    asio::io_context ctx(1);

    // Objects shared by all connections
    auto st = std::make_shared<shared_state>(
        create_mysql_message_store(ctx.get_executor(), cfg.store),
        ctx.get_executor()
    );

    std::ostringstream oss;
    oss << "Connecting to MySQL at " << cfg.store.hostname << ':' << cfg.store.port
        << " db=" << cfg.store.database << " user=" << cfg.store.username;
    log_info(oss.str());

    // The physical endpoint where our server will listen
    asio::ip::tcp::endpoint listening_endpoint(asio::ip::make_address(cfg.ip), cfg.port);

    // A signal_set allows us to intercept SIGINT and SIGTERM and
    // exit gracefully
    asio::signal_set signals(ctx.get_executor(), SIGINT, SIGTERM);

    // Launch the MySQL connection pool
    st->store().start_run();

    // Start listening for HTTP connections. This will run until the context is stopped
    asio::co_spawn(
        // The execution context to run the coroutine on
        ctx,

        // The actual coroutine to run, as an awaitable
        run_server(listening_endpoint, st),

        // Will run when the coroutine finishes. Propagate any exceptions thrown
        // in the coroutine to main
        [](std::exception_ptr exc) {
            if (exc)
                std::rethrow_exception(exc);
        }
    );

    // Capture SIGINT and SIGTERM to perform a clean shutdown
    signals.async_wait([st, &ctx](boost::system::error_code, int) {
        log_info("Shutting down chat server");

        // Stop the MySQL reconnection loop
        st->store().cancel();

        // Stop the io_context. This will cause run() to return
        ctx.stop();
    });

    // Run the io_context. This will block until the context is stopped by
    // a signal and all outstanding async tasks are finished.
    ctx.run();

    // (If we get here, it means we got a SIGINT or SIGTERM)
}

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
