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

#include "Socks4Dialer.h"

#include <array>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <boost/assert.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/system/error_code.hpp>

#include "UtilTools.h"
#include "./log/Log.h"

const std::string Socks4Dialer::defaultIdent{"nobody@0.0.0.0"};

Socks4Dialer::Socks4Dialer(boost::asio::any_io_executor ex,
                           Socks4Scheme scheme,
                           std::string proxyEndpoint,
                           std::shared_ptr<Dialer> upstream,
                           std::string ident)
        : executor(std::move(ex)),
          scheme_(scheme),
          proxyEndpoint_(std::move(proxyEndpoint)),
          upstream_(std::move(upstream)),
          ident_(std::move(ident)) {
    if (!upstream_) {
        throw std::invalid_argument("Socks4Dialer need a upstream dialer");
    }
    if (ident_.find('\0') != std::string::npos) {
        throw std::invalid_argument("Socks4Dialer ident must not contain NUL");
    }
}

std::unique_ptr<ProxyConnection> Socks4Dialer::dial(const std::string &network,
                                                    const std::string &address,
                                                    boost::system::error_code &ec) {
    DialDetail detail;
    auto c = dial(network, address, ec, detail);
    if (ec) {
        BOOST_LOG_S4C(warning) << "Socks4Dialer::dial " << address << " via " << proxyEndpoint_
                               << " : " << detail.what
                               << (detail.cause ? " cause: " + detail.cause.message() : std::string{});
    }
    return c;
}

std::unique_ptr<ProxyConnection> Socks4Dialer::dial(const std::string &network,
                                                    const std::string &address,
                                                    boost::system::error_code &ec,
                                                    DialDetail &detail) {
    DialFailure failure;
    auto c = do_dial(network, address, failure);
    ec = failure.code;
    if (ec) {
        detail.cause = failure.cause;
        detail.what = failure.what;
    }
    return c;
}

std::unique_ptr<ProxyConnection> Socks4Dialer::dial(const std::string &network,
                                                    const std::string &address) {
    DialFailure failure;
    auto c = do_dial(network, address, failure);
    if (failure.code) {
        throw Socks4DialError(failure.code, failure.cause, failure.what);
    }
    return c;
}

std::vector<uint8_t> Socks4Dialer::makeRequest(Socks4Scheme scheme,
                                               const std::string &ident,
                                               const std::string &host,
                                               uint16_t port,
                                               const boost::asio::ip::address_v4 &dstIp) {
    //                        0.0.0.x if socks4a                          | socks4a only
    //   +----+----+----+----+----+----+----+----+----+----+....+----+----+----+....+----+
    //   | VN | CD | DSTPORT |      DSTIP        | USERID       |NULL| HOSTNAME     |NULL|
    //   +----+----+----+----+----+----+----+----+----+----+....+----+----+----+....+----+
    //     1    1      2              4             variable      1    variable       1
    std::vector<uint8_t> data_send;
    data_send.reserve(minRequestLen + ident.size() + 1 + host.size() + 1);
    data_send.insert(data_send.end(), {socksVersion, socksConnect});
    data_send.push_back(static_cast<uint8_t>(port >> 8));
    data_send.push_back(static_cast<uint8_t>(port & 0xff));

    if (scheme == Socks4Scheme::socks4a) {
        data_send.insert(data_send.end(), {0x00, 0x00, 0x00, 0x01});
    } else {
        auto v4 = dstIp.to_bytes();
        data_send.insert(data_send.end(), v4.begin(), v4.end());
    }
    BOOST_ASSERT(data_send.size() == minRequestLen);

    data_send.insert(data_send.end(), ident.begin(), ident.end());
    data_send.push_back(0x00);

    if (scheme == Socks4Scheme::socks4a) {
        data_send.insert(data_send.end(), host.begin(), host.end());
        data_send.push_back(0x00);
    }
    return data_send;
}

std::unique_ptr<ProxyConnection> Socks4Dialer::do_dial(const std::string &network,
                                                       const std::string &address,
                                                       DialFailure &failure) {
    if (network != "tcp" && network != "tcp4") {
        fail(failure, socks4_error::wrong_network, {},
             "network should be tcp or tcp4, but got [" + network + "]");
        return nullptr;
    }

    std::string host, portString, reason;
    if (!splitHostPort(address, host, portString, reason)) {
        fail(failure, socks4_error::wrong_address, {}, "wrong addr: " + address + " (" + reason + ")");
        return nullptr;
    }
    auto port = parsePort(portString);
    if (!port) {
        fail(failure, socks4_error::wrong_address, {}, "wrong addr: " + address + " (invalid port)");
        return nullptr;
    }
    if (host.empty() || host.find('\0') != std::string::npos) {
        fail(failure, socks4_error::wrong_address, {}, "wrong addr: " + address + " (invalid host)");
        return nullptr;
    }

    boost::system::error_code ec;
    DialDetail upstreamDetail;
    auto c = upstream_->dial(network, proxyEndpoint_, ec, upstreamDetail);
    if (ec || !c) {
        if (!ec) {
            ec = boost::asio::error::not_connected;
            upstreamDetail.what = ec.message();
        }
        // a chained proxy hop reports its own description, keep it
        fail(failure, socks4_error::dial_failed, ec,
             "socks4 dial " + proxyEndpoint_ + ": "
             + (upstreamDetail.what.empty() ? ec.message() : upstreamDetail.what));
        return nullptr;
    }
    BOOST_LOG_S4C(trace) << "Socks4Dialer::do_dial connected to proxy " << proxyEndpoint_;

    boost::asio::ip::address_v4 dstIp{};
    if (!isSocks4a()) {
        if (!lookupAddr(host, dstIp, failure)) {
            do_whenError(c);
            return nullptr;
        }
    }

    auto data_send = makeRequest(scheme_, ident_, host, *port, dstIp);

    BOOST_LOG_S4C(trace)
        << "Socks4Dialer::do_dial write request"
        << " socks4a:" << isSocks4a()
        << " host:" << host
        << " port:" << *port
        << " len:" << data_send.size();

    auto bytes_transferred = c->write(boost::asio::buffer(data_send), ec);
    if (ec) {
        fail(failure, socks4_error::io_error, ec, "i/o error: write request: " + ec.message());
        do_whenError(c);
        return nullptr;
    }
    if (bytes_transferred < data_send.size()) {
        std::stringstream ss;
        ss << "i/o error: short write, bytes_transferred:" << bytes_transferred
           << " but data_send.size():" << data_send.size();
        fail(failure, socks4_error::io_error,
             boost::system::errc::make_error_code(boost::system::errc::io_error), ss.str());
        do_whenError(c);
        return nullptr;
    }

    //   +----+----+----+----+----+----+----+----+
    //   | VN | CD | DSTPORT |      DSTIP        |
    //   +----+----+----+----+----+----+----+----+
    //     1    1      2              4
    std::array<uint8_t, replyLen> reply{};
    std::size_t bytes_read = 0;
    while (bytes_read < reply.size()) {
        auto n = c->read_some(boost::asio::buffer(reply.data() + bytes_read, reply.size() - bytes_read), ec);
        bytes_read += n;
        if (ec) {
            break;
        }
        if (n == 0) {
            // a stream that return nothing without error will never fill the reply
            ec = boost::asio::error::eof;
            break;
        }
    }
    if (ec && ec != boost::asio::error::eof) {
        fail(failure, socks4_error::io_error, ec, "i/o error: read reply: " + ec.message());
        do_whenError(c);
        return nullptr;
    }
    if (bytes_read != reply.size()) {
        std::stringstream ss;
        ss << "i/o error: unexpected end of stream, got " << bytes_read << " of " << reply.size() << " reply bytes";
        fail(failure, socks4_error::io_error, boost::asio::error::eof, ss.str());
        do_whenError(c);
        return nullptr;
    }

    switch (reply[1]) {
        case accessGranted:
            BOOST_LOG_S4C(trace) << "Socks4Dialer::do_dial access granted to " << address;
            return c;
        case accessIdentRequired:
        case accessIdentFailed:
            fail(failure, socks4_error::ident_required, {},
                 "valid ident required, proxy reply " + std::to_string(reply[1]) + " for ident [" + ident_ + "]");
            break;
        case accessRejected:
            fail(failure, socks4_error::connection_rejected, {},
                 "connection to remote host " + address + " was rejected");
            break;
        default: {
            std::stringstream ss;
            ss << "unknown socks4 server response " << static_cast<int>(reply[1])
               << " (0x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(reply[1]) << ")";
            fail(failure, socks4_error::invalid_response, {}, ss.str());
        }
            break;
    }
    do_whenError(c);
    return nullptr;
}

bool Socks4Dialer::lookupAddr(const std::string &host, boost::asio::ip::address_v4 &ip, DialFailure &failure) {
    boost::system::error_code ec;
    auto literal = boost::asio::ip::make_address_v4(host, ec);
    if (!ec) {
        ip = literal;
        return true;
    }

    boost::asio::ip::tcp::resolver resolver(executor);
    auto results = resolver.resolve(boost::asio::ip::tcp::v4(), host, "", ec);
    if (!ec && results.empty()) {
        ec = boost::asio::error::host_not_found;
    }
    if (ec) {
        fail(failure, socks4_error::host_unknown, ec,
             "unable to find IP address of host " + host + ": " + ec.message());
        return false;
    }
    ip = results.begin()->endpoint().address().to_v4();
    BOOST_LOG_S4C(trace) << "Socks4Dialer::lookupAddr " << host << " -> " << ip;
    return true;
}

void Socks4Dialer::do_whenError(std::unique_ptr<ProxyConnection> &c) {
    if (!c) {
        return;
    }
    boost::system::error_code ec;
    c->close(ec);
    if (ec) {
        BOOST_LOG_S4C(warning) << "Socks4Dialer close proxy connection " << proxyEndpoint_ << " : " << ec.message();
    }
    c.reset();
}

void Socks4Dialer::fail(DialFailure &failure,
                        socks4_error code,
                        boost::system::error_code cause,
                        const std::string &what) {
    failure.code = code;
    failure.cause = cause;
    failure.what = what;
    BOOST_LOG_S4C(debug) << "Socks4Dialer::fail " << what;
}
