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

#ifndef SOCKS4CLIENTASIO_TCPDIALER_H
#define SOCKS4CLIENTASIO_TCPDIALER_H

#ifdef MSVC
#pragma once
#endif

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <memory>
#include <string>

#include "ProxyConnection.h"

class TcpConnection : public ProxyConnection {
    boost::asio::ip::tcp::socket socket_;
public:
    explicit TcpConnection(boost::asio::ip::tcp::socket socket) : socket_(std::move(socket)) {}

    std::size_t write(boost::asio::const_buffer data, boost::system::error_code &ec) override;

    std::size_t read_some(boost::asio::mutable_buffer data, boost::system::error_code &ec) override;

    void close(boost::system::error_code &ec) override;

    bool is_open() const override {
        return socket_.is_open();
    }
};

// the plain tcp dialer, first hop of every proxy chain
class TcpDialer : public Dialer {
    boost::asio::any_io_executor executor;
public:
    explicit TcpDialer(boost::asio::any_io_executor ex) : executor(ex) {}

    using Dialer::dial;

    std::unique_ptr<ProxyConnection> dial(const std::string &network,
                                          const std::string &address,
                                          boost::system::error_code &ec) override;
};


#endif //SOCKS4CLIENTASIO_TCPDIALER_H
