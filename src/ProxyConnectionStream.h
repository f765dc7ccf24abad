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

#ifndef SOCKS4CLIENTASIO_PROXYCONNECTIONSTREAM_H
#define SOCKS4CLIENTASIO_PROXYCONNECTIONSTREAM_H

#ifdef MSVC
#pragma once
#endif

#include <boost/asio/buffer.hpp>
#include <boost/system/system_error.hpp>
#include <boost/throw_exception.hpp>
#include <cstddef>

#include "ProxyConnection.h"

// make a ProxyConnection usable as Asio SyncReadStream / SyncWriteStream,
// so boost::asio::read/write and boost::beast::http::read/write can run on it
class ProxyConnectionStream {
    ProxyConnection &conn_;
public:
    explicit ProxyConnectionStream(ProxyConnection &conn) : conn_(conn) {}

    template<typename MutableBufferSequence>
    std::size_t read_some(const MutableBufferSequence &buffers, boost::system::error_code &ec) {
        for (auto it = boost::asio::buffer_sequence_begin(buffers);
             it != boost::asio::buffer_sequence_end(buffers); ++it) {
            boost::asio::mutable_buffer b(*it);
            if (b.size() != 0) {
                return conn_.read_some(b, ec);
            }
        }
        ec = {};
        return 0;
    }

    template<typename MutableBufferSequence>
    std::size_t read_some(const MutableBufferSequence &buffers) {
        boost::system::error_code ec;
        auto n = read_some(buffers, ec);
        if (ec) {
            BOOST_THROW_EXCEPTION(boost::system::system_error{ec});
        }
        return n;
    }

    template<typename ConstBufferSequence>
    std::size_t write_some(const ConstBufferSequence &buffers, boost::system::error_code &ec) {
        for (auto it = boost::asio::buffer_sequence_begin(buffers);
             it != boost::asio::buffer_sequence_end(buffers); ++it) {
            boost::asio::const_buffer b(*it);
            if (b.size() != 0) {
                return conn_.write(b, ec);
            }
        }
        ec = {};
        return 0;
    }

    template<typename ConstBufferSequence>
    std::size_t write_some(const ConstBufferSequence &buffers) {
        boost::system::error_code ec;
        auto n = write_some(buffers, ec);
        if (ec) {
            BOOST_THROW_EXCEPTION(boost::system::system_error{ec});
        }
        return n;
    }
};


#endif //SOCKS4CLIENTASIO_PROXYCONNECTIONSTREAM_H
