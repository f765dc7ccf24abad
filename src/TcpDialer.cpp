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

#include "TcpDialer.h"

#include <boost/asio/connect.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>

#include "UtilTools.h"
#include "./log/Log.h"

std::size_t TcpConnection::write(boost::asio::const_buffer data, boost::system::error_code &ec) {
    return boost::asio::write(socket_, data, ec);
}

std::size_t TcpConnection::read_some(boost::asio::mutable_buffer data, boost::system::error_code &ec) {
    return socket_.read_some(data, ec);
}

void TcpConnection::close(boost::system::error_code &ec) {
    if (!socket_.is_open()) {
        ec = {};
        return;
    }
    boost::system::error_code ignore_ec;
    // the peer may already gone, shutdown is best effort before close
    socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignore_ec);
    socket_.close(ec);
}

std::unique_ptr<ProxyConnection> TcpDialer::dial(const std::string &network,
                                                 const std::string &address,
                                                 boost::system::error_code &ec) {
    std::string host, port, reason;
    if (!splitHostPort(address, host, port, reason)) {
        BOOST_LOG_S4C(debug) << "TcpDialer::dial invalid address [" << address << "] " << reason;
        ec = boost::asio::error::invalid_argument;
        return nullptr;
    }

    boost::asio::ip::tcp::resolver resolver(executor);
    boost::asio::ip::tcp::resolver::results_type results;
    if (network == "tcp") {
        results = resolver.resolve(host, port, ec);
    } else if (network == "tcp4") {
        results = resolver.resolve(boost::asio::ip::tcp::v4(), host, port, ec);
    } else if (network == "tcp6") {
        results = resolver.resolve(boost::asio::ip::tcp::v6(), host, port, ec);
    } else {
        BOOST_LOG_S4C(debug) << "TcpDialer::dial unsupported network [" << network << "]";
        ec = boost::asio::error::invalid_argument;
        return nullptr;
    }
    if (ec) {
        BOOST_LOG_S4C(debug) << "TcpDialer::dial resolve [" << address << "] : " << ec.message();
        return nullptr;
    }

    boost::asio::ip::tcp::socket socket(executor);
    auto endpoint = boost::asio::connect(socket, results, ec);
    if (ec) {
        BOOST_LOG_S4C(debug) << "TcpDialer::dial connect [" << address << "] : " << ec.message();
        return nullptr;
    }

    BOOST_LOG_S4C(trace) << "TcpDialer::dial connected to " << endpoint.address() << ":" << endpoint.port();
    return std::make_unique<TcpConnection>(std::move(socket));
}
