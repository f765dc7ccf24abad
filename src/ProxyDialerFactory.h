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

#ifndef SOCKS4CLIENTASIO_PROXYDIALERFACTORY_H
#define SOCKS4CLIENTASIO_PROXYDIALERFACTORY_H

#ifdef MSVC
#pragma once
#endif

#include <boost/asio/any_io_executor.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "Socks4Dialer.h"

std::optional<Socks4Scheme> string2Socks4Scheme(std::string s);

std::string socks4Scheme2string(Socks4Scheme s);

extern std::vector<std::string> Socks4SchemeList;

struct ProxyUrl {
    Socks4Scheme scheme;
    // from the userinfo part, empty if the url has none
    std::string ident;
    // "host:port" , port default 1080
    std::string endpoint;
};

constexpr uint16_t defaultProxyPort = 1080;

// "socks4a://[ident@]host[:port][/...]" , nullopt if the scheme is unknown or no host
std::optional<ProxyUrl> parseProxyUrl(const std::string &url);

class ProxyDialerFactory : public std::enable_shared_from_this<ProxyDialerFactory> {
    boost::asio::any_io_executor executor;
    const std::string defaultIdent;
public:
    ProxyDialerFactory(boost::asio::any_io_executor ex, std::string defaultIdent = Socks4Dialer::defaultIdent)
            : executor(ex), defaultIdent(std::move(defaultIdent)) {}

    // throw std::invalid_argument on a bad url
    std::shared_ptr<Socks4Dialer> create(const std::string &url, std::shared_ptr<Dialer> upstream) const;

    std::shared_ptr<Socks4Dialer> create(Socks4Scheme scheme,
                                         const std::string &proxyEndpoint,
                                         std::shared_ptr<Dialer> upstream) const;

    std::shared_ptr<Socks4Dialer> create(Socks4Scheme scheme,
                                         const std::string &proxyEndpoint,
                                         std::shared_ptr<Dialer> upstream,
                                         const std::string &ident) const;

    /**
     * client -> urls[0] -> urls[1] -> ... -> target
     *
     * urls[0] is dialed by firstUpstream, every next proxy is dialed through the previous one .
     * an empty urls return firstUpstream .
     */
    std::shared_ptr<Dialer> createChain(const std::vector<std::string> &urls,
                                        std::shared_ptr<Dialer> firstUpstream) const;
};


#endif //SOCKS4CLIENTASIO_PROXYDIALERFACTORY_H
