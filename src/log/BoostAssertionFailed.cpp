/**
 * Socks4ClientAsio : A Simple SOCKS4/SOCKS4a Proxy Client Handshake Powered by Boost.Asio
 * Copyright (C) <2020>  <Jeremie>
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#include "./Log.h"
#include <boost/assert.hpp>
#include <cstdlib>

namespace {
    // log the broken invariant, then abort
    [[noreturn]] void logAssertionAndAbort(char const *expr, char const *msg,
                                           char const *function, char const *file, long line) {
        BOOST_LOG_S4C(fatal)
            << "BOOST_ASSERT(" << expr << ") failed"
            << (msg ? " : " : "") << (msg ? msg : "")
            << " in " << function
            << " at " << file << ":" << line;
        std::abort();
    }
}

namespace boost {
    void assertion_failed(char const *expr, char const *function, char const *file, long line) {
        logAssertionAndAbort(expr, nullptr, function, file, line);
    }

    void assertion_failed_msg(char const *expr, char const *msg, char const *function, char const *file, long line) {
        logAssertionAndAbort(expr, msg, function, file, line);
    }
}
