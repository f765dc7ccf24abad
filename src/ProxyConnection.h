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

#ifndef SOCKS4CLIENTASIO_PROXYCONNECTION_H
#define SOCKS4CLIENTASIO_PROXYCONNECTION_H

#ifdef MSVC
#pragma once
#endif

#include <cstddef>
#include <memory>
#include <string>
#include <boost/asio/buffer.hpp>
#include <boost/system/error_code.hpp>

// a connected, blocking, bidirectional byte stream
class ProxyConnection {
public:
    virtual ~ProxyConnection() = default;

    // transfer the whole buffer, or fail with ec
    virtual std::size_t write(boost::asio::const_buffer data, boost::system::error_code &ec) = 0;

    // read at least one byte, or fail with ec (boost::asio::error::eof on a clean end of stream)
    virtual std::size_t read_some(boost::asio::mutable_buffer data, boost::system::error_code &ec) = 0;

    virtual void close(boost::system::error_code &ec) = 0;

    virtual bool is_open() const = 0;
};

// why a dial failed, beyond the error code
struct DialDetail {
    // the lower layer error, e.g. the transport error behind socks4_error::dial_failed
    boost::system::error_code cause;
    std::string what;
};

// open a ProxyConnection to a network address
class Dialer {
public:
    virtual ~Dialer() = default;

    /**
     * @param network   "tcp", "tcp4" ...
     * @param address   "host:port"
     * @param ec        [out] set on failure
     * @return          the connection, or nullptr when ec set
     */
    virtual std::unique_ptr<ProxyConnection> dial(const std::string &network,
                                                  const std::string &address,
                                                  boost::system::error_code &ec) = 0;

    // same as above, and fill detail on failure
    virtual std::unique_ptr<ProxyConnection> dial(const std::string &network,
                                                  const std::string &address,
                                                  boost::system::error_code &ec,
                                                  DialDetail &detail) {
        auto c = dial(network, address, ec);
        if (ec) {
            detail.cause = {};
            detail.what = ec.message();
        }
        return c;
    }
};


#endif //SOCKS4CLIENTASIO_PROXYCONNECTION_H
