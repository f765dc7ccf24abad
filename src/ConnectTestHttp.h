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

#ifndef SOCKS4CLIENTASIO_CONNECTTESTHTTP_H
#define SOCKS4CLIENTASIO_CONNECTTESTHTTP_H

#ifdef MSVC
#pragma once
#endif

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <cstdint>
#include <memory>
#include <string>

#include "ProxyConnection.h"

// dial a http server through the proxy chain, send a GET and read the response
class ConnectTestHttp {
public:
    using SuccessfulInfo = boost::beast::http::response<boost::beast::http::string_body>;

private:
    std::shared_ptr<Dialer> dialer;

    const std::string network;
    const std::string targetHost;
    const uint16_t targetPort;
    const std::string targetPath;
    const int httpVersion;

    boost::beast::http::request<boost::beast::http::empty_body> req_;

public:
    ConnectTestHttp(std::shared_ptr<Dialer> dialer,
                    const std::string &network,
                    const std::string &targetHost,
                    uint16_t targetPort,
                    const std::string &targetPath = "/",
                    int httpVersion = 11);

    /**
     * @param ec    [out] socks4_error when the dial failed, else the beast/asio error
     * @return      the response, only meaningful when !ec
     */
    SuccessfulInfo run(boost::system::error_code &ec);

    // same as above, a failed dial also fill detail
    SuccessfulInfo run(boost::system::error_code &ec, DialDetail &detail);

private:
    void fail(boost::system::error_code ec, const std::string &what, const DialDetail &detail = {});
};


#endif //SOCKS4CLIENTASIO_CONNECTTESTHTTP_H
