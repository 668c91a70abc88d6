//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "error.hpp"

#include <boost/asio/error.hpp>
#include <boost/describe/enum.hpp>
#include <boost/describe/enum_to_string.hpp>
#include <boost/system/system_error.hpp>

#include <iostream>
#include <string_view>

namespace chatlog {

// Adds Boost.Describe metadata to errc. Required for describe::enum_to_string
BOOST_DESCRIBE_ENUM(
    errc,
    invalid_argument,
    store_unavailable,
    rpc_parse_error,
    rpc_invalid_request,
    rpc_method_not_found,
    rpc_invalid_params,
    uncaught_exception,
    invalid_content_type
)

}  // namespace chatlog

namespace {

static const char* to_string(chatlog::errc v) noexcept
{
    return boost::describe::enum_to_string(v, "<unknown chatlog error>");
}

// Custom category for chatlog::errc. Exposed by get_chatlog_category
class chatlog_category final : public boost::system::error_category
{
public:
    const char* name() const noexcept final override { return "chatlog"; }
    std::string message(int ev) const final override { return to_string(static_cast<chatlog::errc>(ev)); }
};

static chatlog_category cat;

}  // namespace

const boost::system::error_category& chatlog::get_chatlog_category() noexcept { return cat; }

[[noreturn]] void chatlog::throw_exception_from_error(const error_with_message& e, const boost::source_location&)
{
    throw boost::system::system_error(e.ec, e.msg);
}

void chatlog::log_error(error_code ec, std::string_view what, std::string_view diagnostics)
{
    // Don't report on canceled operations
    if (ec == boost::asio::error::operation_aborted)
        return;

    std::cerr << what << ": " << ec << ": " << ec.message();
    if (ec.has_location())
        std::cerr << " (" << ec.location() << ")";
    if (!diagnostics.empty())
        std::cerr << "\nDiagnostics: " << diagnostics;
    std::cerr << '\n';
}

void chatlog::log_info(std::string_view what) { std::cout << what << std::endl; }
