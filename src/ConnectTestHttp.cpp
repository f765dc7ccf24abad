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

#include "ConnectTestHttp.h"

#include <sstream>
#include <boost/beast/version.hpp>
#include <boost/asio/error.hpp>
#include <boost/lexical_cast.hpp>

#include "ProxyConnectionStream.h"
#include "UtilTools.h"
#include "./log/Log.h"

ConnectTestHttp::ConnectTestHttp(std::shared_ptr<Dialer> dialer,
                                 const std::string &network,
                                 const std::string &targetHost,
                                 uint16_t targetPort,
                                 const std::string &targetPath,
                                 int httpVersion) :
        dialer(std::move(dialer)),
        network(network),
        targetHost(targetHost),
        targetPort(targetPort),
        targetPath(targetPath),
        httpVersion(httpVersion) {

    // Set up an HTTP GET request message
    req_.version(httpVersion);
    req_.method(boost::beast::http::verb::get);
    req_.target(targetPath);
    req_.set(boost::beast::http::field::host, targetHost);
    req_.set(boost::beast::http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    req_.set(boost::beast::http::field::connection, "close");

}

ConnectTestHttp::SuccessfulInfo ConnectTestHttp::run(boost::system::error_code &ec) {
    DialDetail detail;
    return run(ec, detail);
}

ConnectTestHttp::SuccessfulInfo ConnectTestHttp::run(boost::system::error_code &ec, DialDetail &detail) {
    auto target = joinHostPort(targetHost, boost::lexical_cast<std::string>(targetPort));
    auto c = dialer->dial(network, target, ec, detail);
    if (!ec && !c) {
        ec = boost::asio::error::not_connected;
        detail.what = ec.message();
    }
    if (ec) {
        fail(ec, "dial", detail);
        return {};
    }

    ProxyConnectionStream stream{*c};

    boost::beast::http::write(stream, req_, ec);
    if (ec) {
        fail(ec, "write");
        return {};
    }

    boost::beast::flat_buffer buffer;
    SuccessfulInfo res;
    boost::beast::http::read(stream, buffer, res, ec);
    if (ec) {
        fail(ec, "read");
        return {};
    }

    BOOST_LOG_S4C(trace) << "ConnectTestHttp::run got " << res.result_int() << " from " << target;

    boost::system::error_code close_ec;
    c->close(close_ec);
    if (close_ec) {
        BOOST_LOG_S4C(warning) << "ConnectTestHttp::run close: " << close_ec.message();
    }
    return res;
}

void ConnectTestHttp::fail(boost::system::error_code ec, const std::string &what, const DialDetail &detail) {
    std::stringstream ss;
    ss << what << ": [" << ec.message() << "] . ";
    if (!detail.what.empty()) {
        ss << "detail: [" << detail.what << "] . ";
    }
    if (detail.cause) {
        ss << "cause: [" << detail.cause.message() << "] . ";
    }
    ss << "on "
       << "targetHost:" << targetHost << " "
       << "targetPort:" << targetPort << " "
       << "targetPath:" << targetPath << " "
       << "httpVersion:" << httpVersion << " ";
    BOOST_LOG_S4C(error) << "ConnectTestHttp::fail " << ss.str();
}
