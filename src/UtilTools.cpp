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

#include "UtilTools.h"

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

bool splitHostPort(const std::string &hostPort, std::string &host, std::string &port, std::string &reason) {
    host.clear();
    port.clear();

    std::string::size_type colon;
    if (!hostPort.empty() && hostPort.front() == '[') {
        // [host]:port
        auto end = hostPort.find(']');
        if (end == std::string::npos) {
            reason = "missing ']' in address";
            return false;
        }
        if (end + 1 == hostPort.size()) {
            reason = "missing port in address";
            return false;
        }
        if (hostPort.at(end + 1) != ':') {
            reason = "unexpected character after ']' in address";
            return false;
        }
        colon = end + 1;
        host = hostPort.substr(1, end - 1);
    } else {
        colon = hostPort.rfind(':');
        if (colon == std::string::npos) {
            reason = "missing port in address";
            return false;
        }
        host = hostPort.substr(0, colon);
        if (host.find(':') != std::string::npos) {
            host.clear();
            reason = "too many colons in address";
            return false;
        }
        if (host.find_first_of("[]") != std::string::npos) {
            host.clear();
            reason = "unexpected bracket in address";
            return false;
        }
    }
    port = hostPort.substr(colon + 1);
    if (port.find_first_of("[]") != std::string::npos) {
        host.clear();
        port.clear();
        reason = "unexpected bracket in port";
        return false;
    }
    return true;
}

std::string joinHostPort(const std::string &host, const std::string &port) {
    if (host.find(':') != std::string::npos) {
        return "[" + host + "]:" + port;
    }
    return host + ":" + port;
}

std::optional<uint16_t> parsePort(const std::string &port) {
    // lexical_cast accept "+80" and "-1", so check digits first
    if (port.empty() || port.size() > 5 || !boost::algorithm::all(port, boost::algorithm::is_digit())) {
        return std::nullopt;
    }
    auto n = boost::lexical_cast<unsigned int>(port);
    if (n == 0 || n > 65535) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(n);
}
