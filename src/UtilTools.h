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

#ifndef SOCKS4CLIENTASIO_UTILTOOLS_H
#define SOCKS4CLIENTASIO_UTILTOOLS_H

#ifdef MSVC
#pragma once
#endif

#include <cstdint>
#include <optional>
#include <string>


/**
 * split "host:port" , "[ipv6]:port" into host and port
 *
 * the brackets are removed from a ipv6 host .
 * a host with ':' must be in brackets .
 *
 * <code>
 *
 * std::string host, port, reason;
 *
 * splitHostPort("[::1]:80", host, port, reason); // host == "::1" , port == "80"
 *
 * splitHostPort("example.com", host, port, reason); // false , reason == "missing port in address"
 *
 * </code>
 *
 * @param hostPort  the input
 * @param host      [out] the host part
 * @param port      [out] the port part, not checked
 * @param reason    [out] why the split failed
 * @return          false if the input not in the form
 */
bool splitHostPort(const std::string &hostPort, std::string &host, std::string &port, std::string &reason);

/**
 * join host and port back , add brackets to a ipv6 host
 */
std::string joinHostPort(const std::string &host, const std::string &port);

// only decimal digits, 1..65535
std::optional<uint16_t> parsePort(const std::string &port);


#endif //SOCKS4CLIENTASIO_UTILTOOLS_H
