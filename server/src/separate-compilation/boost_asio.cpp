//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Separate compilation for Boost.Asio, shared by the server, the client
// and the tests. BOOST_ASIO_SEPARATE_COMPILATION must be defined everywhere.
// Boost.MySQL needs the SSL part, even if we don't use TLS.

#include <boost/asio/impl/src.hpp>
#include <boost/asio/ssl/impl/src.hpp>
