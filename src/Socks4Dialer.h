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

#ifndef SOCKS4CLIENTASIO_SOCKS4DIALER_H
#define SOCKS4CLIENTASIO_SOCKS4DIALER_H

#ifdef MSVC
#pragma once
#endif

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/ip/address_v4.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "ProxyConnection.h"
#include "Socks4Error.h"

enum class Socks4Scheme {
    // client resolve the target, send ipv4 address
    socks4,
    // send 0.0.0.1 and the hostname, proxy resolve the target
    socks4a,
};

// Socks4 / Socks4a proxy protocol client, CONNECT command only
// https://www.openssh.com/txt/socks4.protocol
// https://www.openssh.com/txt/socks4a.protocol
//
// immutable after construction, dial() can be called from many thread at same time
class Socks4Dialer : public Dialer {
public:
    static const std::string defaultIdent;

    static constexpr uint8_t socksVersion = 0x04;
    static constexpr uint8_t socksConnect = 0x01;

    static constexpr uint8_t accessGranted = 0x5A;
    static constexpr uint8_t accessRejected = 0x5B;
    static constexpr uint8_t accessIdentRequired = 0x5C;
    static constexpr uint8_t accessIdentFailed = 0x5D;

    static constexpr std::size_t minRequestLen = 8;
    static constexpr std::size_t replyLen = 8;

private:
    const boost::asio::any_io_executor executor;
    const Socks4Scheme scheme_;
    const std::string proxyEndpoint_;
    const std::shared_ptr<Dialer> upstream_;
    const std::string ident_;

public:
    /**
     * @param ex                executor for the socks4 mode target lookup
     * @param scheme            socks4 or socks4a
     * @param proxyEndpoint     "host:port" of the proxy server
     * @param upstream          open the connection to proxyEndpoint
     * @param ident             USERID field, throw std::invalid_argument if it contains '\0'
     */
    Socks4Dialer(boost::asio::any_io_executor ex,
                 Socks4Scheme scheme,
                 std::string proxyEndpoint,
                 std::shared_ptr<Dialer> upstream,
                 std::string ident = defaultIdent);

    // on failure set ec to a socks4_error and return nullptr, never return a closed connection.
    // the cause and the description of a failure are logged at warning
    std::unique_ptr<ProxyConnection> dial(const std::string &network,
                                          const std::string &address,
                                          boost::system::error_code &ec) override;

    // same as above, the cause and the description of a failure go to detail
    std::unique_ptr<ProxyConnection> dial(const std::string &network,
                                          const std::string &address,
                                          boost::system::error_code &ec,
                                          DialDetail &detail) override;

    // same as above, but throw Socks4DialError
    std::unique_ptr<ProxyConnection> dial(const std::string &network,
                                          const std::string &address);

    Socks4Scheme scheme() const {
        return scheme_;
    }

    bool isSocks4a() const {
        return scheme_ == Socks4Scheme::socks4a;
    }

    const std::string &proxyEndpoint() const {
        return proxyEndpoint_;
    }

    const std::string &ident() const {
        return ident_;
    }

    // the CONNECT request bytes, dstIp is ignored in socks4a mode
    static std::vector<uint8_t> makeRequest(Socks4Scheme scheme,
                                            const std::string &ident,
                                            const std::string &host,
                                            uint16_t port,
                                            const boost::asio::ip::address_v4 &dstIp);

private:
    struct DialFailure {
        boost::system::error_code code;
        boost::system::error_code cause;
        std::string what;
    };

    std::unique_ptr<ProxyConnection> do_dial(const std::string &network,
                                             const std::string &address,
                                             DialFailure &failure);

    bool lookupAddr(const std::string &host, boost::asio::ip::address_v4 &ip, DialFailure &failure);

    void do_whenError(std::unique_ptr<ProxyConnection> &c);

    static void fail(DialFailure &failure,
                     socks4_error code,
                     boost::system::error_code cause,
                     const std::string &what);
};


#endif //SOCKS4CLIENTASIO_SOCKS4DIALER_H
