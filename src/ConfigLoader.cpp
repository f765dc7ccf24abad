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

#include "ConfigLoader.h"

#include <stdexcept>
#include <boost/format.hpp>

#include "Socks4Dialer.h"

void ConfigLoader::print(std::ostream &os) {
    os << "config.ident:" << config.ident << "\n";
    os << "config.network:" << config.network << "\n";
    os << "config.targetHost:" << config.targetHost << "\n";
    os << "config.targetPort:" << config.targetPort << "\n";
    os << "config.logLevel:" << config.logLevel << "\n";

    for (size_t i = 0; i != config.proxyChain.size(); ++i) {
        os << "config.proxyChain [" << i << "]:" << config.proxyChain[i] << "\n";
    }

    if (!config.connectTest.enable) {
        os << "config.connectTest.enable : false .\n";
    } else {
        auto &ct = config.connectTest;
        os << "config.connectTest.enable : true :\n";
        os << "\t" << "connectTest.path:" << ct.path << "\n";
        os << "\t" << "connectTest.httpVersion:" << ct.httpVersion << "\n";
    }
}

void ConfigLoader::load(const std::string &filename) {
    boost::property_tree::ptree tree;
    boost::property_tree::read_json(filename, tree);
    parse_json(tree);
}

void ConfigLoader::parse_json(const boost::property_tree::ptree &tree) {
    Config c{};

    c.ident = tree.get("ident", Socks4Dialer::defaultIdent);
    c.network = tree.get("network", std::string{"tcp"});

    c.targetHost = tree.get("targetHost", std::string{"www.google.com"});
    c.targetPort = 80;
    if (tree.get_child_optional("targetPort")) {
        auto targetPort = tree.get<int>("targetPort");
        if (targetPort < 1 || targetPort > 65535) {
            throw std::invalid_argument(
                    (boost::format{"targetPort must in 1..65535, but got %1%"} % targetPort).str());
        }
        c.targetPort = static_cast<uint16_t>(targetPort);
    }

    c.logLevel = tree.get("logLevel", std::string{"info"});

    if (tree.get_child_optional("proxyChain")) {
        auto proxyChain = tree.get_child("proxyChain");
        for (auto &item: proxyChain) {
            c.proxyChain.push_back(item.second.get_value<std::string>());
        }
    } else if (tree.get_optional<std::string>("proxy")) {
        // single hop shortcut
        c.proxyChain.push_back(tree.get<std::string>("proxy"));
    }

    c.connectTest = {};
    c.connectTest.enable = false;
    c.connectTest.path = "/";
    c.connectTest.httpVersion = 11;
    if (tree.get_child_optional("connectTest")) {
        auto pts = tree.get_child("connectTest");
        auto &connectTest = c.connectTest;
        connectTest.enable = pts.get("enable", false);
        connectTest.path = pts.get("path", connectTest.path);
        connectTest.httpVersion = pts.get("httpVersion", connectTest.httpVersion);
        if (connectTest.httpVersion != 10 && connectTest.httpVersion != 11) {
            throw std::invalid_argument(
                    (boost::format{"connectTest.httpVersion must be 10 or 11, but got %1%"}
                     % connectTest.httpVersion).str());
        }
    }

    config = c;
}
