//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATLOG_SERVER_INCLUDE_ERROR_HPP
#define CHATLOG_SERVER_INCLUDE_ERROR_HPP

#include <boost/assert/source_location.hpp>
#include <boost/system/error_category.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/result.hpp>

#include <string>
#include <string_view>
#include <utility>

// Error management infrastructure. Uses Boost.System error codes and categories.
// This is consistent with Asio, Beast and MySQL.

namespace chatlog {

using boost::system::error_code;

template <class T>
using result = boost::system::result<T>;

// Error code enum for errors originated within our application
enum class errc
{
    invalid_argument = 1,  // Empty author or text, or a room outside the allowed set
    store_unavailable,     // The message store couldn't complete the operation (connection, SQL, schema)
    rpc_parse_error,       // The RPC request body is not valid JSON
    rpc_invalid_request,   // The RPC request is JSON, but not a valid JSON-RPC request object
    rpc_method_not_found,  // The requested RPC method doesn't exist
    rpc_invalid_params,    // The RPC parameters don't have the expected types
    uncaught_exception,    // an API handler threw an unexpected exception
    invalid_content_type,  // an endpoint received an unsupported Content-Type
};

// The error category for errc
const boost::system::error_category& get_chatlog_category() noexcept;

// Allows constructing error_code from errc
inline error_code make_error_code(errc v) noexcept
{
    return error_code(static_cast<int>(v), get_chatlog_category());
}

// An error code with a diagnostic string, to be surfaced to clients or logs
struct error_with_message
{
    error_code ec;
    std::string msg;
};

// Allows using error_with_message as the error type of a boost::system::result
[[noreturn]] void throw_exception_from_error(const error_with_message& e, const boost::source_location& loc);

template <class T>
using result_with_message = boost::system::result<T, error_with_message>;

// Logs ec to stderr
void log_error(error_code ec, std::string_view what, std::string_view diagnostics = "");
inline void log_error(const error_with_message& err, std::string_view what)
{
    log_error(err.ec, what, err.msg);
}

// Logs an informational message to stdout
void log_info(std::string_view what);

}  // namespace chatlog

// Allows constructing error_code from errc
namespace boost {
namespace system {

template <>
struct is_error_code_enum<chatlog::errc>
{
    static constexpr bool value = true;
};
}  // namespace system
}  // namespace boost

// Returns an error_code with source-code location information on it
#define CHATLOG_RETURN_ERROR(e)                                                   \
    {                                                                             \
        static constexpr auto loc = BOOST_CURRENT_LOCATION;                       \
        return ::boost::system::error_code(::boost::system::error_code(e), &loc); \
    }

// Same, but for co_return
#define CHATLOG_CO_RETURN_ERROR(e)                                                   \
    {                                                                                \
        static constexpr auto loc = BOOST_CURRENT_LOCATION;                          \
        co_return ::boost::system::error_code(::boost::system::error_code(e), &loc); \
    }

#endif
