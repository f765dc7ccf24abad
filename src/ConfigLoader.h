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

#ifndef SOCKS4CLIENTASIO_CONFIGLOADER_H
#define SOCKS4CLIENTASIO_CONFIGLOADER_H

#ifdef MSVC
#pragma once
#endif

#include <string>
#include <vector>
#include <iostream>
#include <memory>
#include <cstdint>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>

struct ConnectTestConfig {
    bool enable = false;
    std::string path;
    int httpVersion;
};

struct Config {
    // client -> proxyChain[0] -> proxyChain[1] -> ... -> target
    std::vector<std::string> proxyChain;

    // default USERID for every proxy in the chain without a userinfo in its url
    std::string ident;

    std::string network;

    std::string targetHost;
    uint16_t targetPort;

    std::string logLevel;

    ConnectTestConfig connectTest;
};

class ConfigLoader : public std::enable_shared_from_this<ConfigLoader> {
public:
    Config config;

    void print(std::ostream &os = std::cout);

    void
    load(const std::string &filename);

    void parse_json(const boost::property_tree::ptree &tree);
};


#endif //SOCKS4CLIENTASIO_CONFIGLOADER_H
