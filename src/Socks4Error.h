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

#ifndef SOCKS4CLIENTASIO_SOCKS4ERROR_H
#define SOCKS4CLIENTASIO_SOCKS4ERROR_H

#ifdef MSVC
#pragma once
#endif

#include <string>
#include <stdexcept>
#include <type_traits>
#include <boost/system/error_code.hpp>

// every way a socks4/socks4a dial can fail
enum class socks4_error {
    // network is not "tcp" or "tcp4", socks4 only carry tcp over ipv4
    wrong_network = 1,
    // target is not host:port, or the port is not a number in 1..65535
    wrong_address,
    // the upstream dialer cannot reach the proxy server
    dial_failed,
    // socks4 (not socks4a) mode cannot resolve the target host to an ipv4 address
    host_unknown,
    // write or read on the proxy connection failed or was truncated
    io_error,
    // proxy reply 0x5C or 0x5D, we never run identd
    ident_required,
    // proxy reply 0x5B
    connection_rejected,
    // proxy reply with a status we don't know
    invalid_response,
};

const boost::system::error_category &socks4_category() noexcept;

boost::system::error_code make_error_code(socks4_error e) noexcept;

namespace boost {
    namespace system {
        template<>
        struct is_error_code_enum<socks4_error> : std::true_type {
        };
    }
}

/**
 * thrown by the throwing overload of Socks4Dialer::dial
 *
 * code()   the socks4_error kind, compare it with `socks4_error::xxx`
 * cause()  the wrapped transport/resolver error, empty if the kind has no cause
 * what()   a full message, contains the offending address/host/status byte
 */
class Socks4DialError : public std::runtime_error {
    boost::system::error_code code_;
    boost::system::error_code cause_;
public:
    Socks4DialError(boost::system::error_code code,
                    boost::system::error_code cause,
                    const std::string &what)
            : std::runtime_error(what), code_(code), cause_(cause) {}

    const boost::system::error_code &code() const noexcept {
        return code_;
    }

    const boost::system::error_code &cause() const noexcept {
        return cause_;
    }
};


#endif //SOCKS4CLIENTASIO_SOCKS4ERROR_H
