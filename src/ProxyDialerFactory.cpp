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

#include "ProxyDialerFactory.h"

#include <stdexcept>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

#include "UtilTools.h"
#include "./log/Log.h"

std::optional<Socks4Scheme> string2Socks4Scheme(std::string s) {
    boost::algorithm::to_lower(s);
    if ("socks4" == s) {
        return Socks4Scheme::socks4;
    }
    if ("socks4a" == s) {
        return Socks4Scheme::socks4a;
    }
    return std::nullopt;
}

std::string socks4Scheme2string(Socks4Scheme s) {
    switch (s) {
        case Socks4Scheme::socks4:
            return "socks4";
        case Socks4Scheme::socks4a:
            return "socks4a";
        default:
            return "socks4";
    }
}

std::vector<std::string> Socks4SchemeList{
        "socks4",
        "socks4a",
};

std::optional<ProxyUrl> parseProxyUrl(const std::string &url) {
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        return std::nullopt;
    }
    auto scheme = string2Socks4Scheme(url.substr(0, schemeEnd));
    if (!scheme) {
        return std::nullopt;
    }

    auto authority = url.substr(schemeEnd + 3);
    auto pathBegin = authority.find_first_of("/?#");
    if (pathBegin != std::string::npos) {
        authority.resize(pathBegin);
    }

    ProxyUrl r{*scheme, {}, {}};
    auto at = authority.rfind('@');
    if (at != std::string::npos) {
        r.ident = authority.substr(0, at);
        authority = authority.substr(at + 1);
    }
    if (authority.empty()) {
        return std::nullopt;
    }

    std::string host, port, reason;
    if (splitHostPort(authority, host, port, reason)) {
        if (host.empty() || !parsePort(port)) {
            return std::nullopt;
        }
        r.endpoint = joinHostPort(host, port);
    } else {
        // no port
        host = authority;
        if (host.front() == '[' && host.back() == ']') {
            host = host.substr(1, host.size() - 2);
        }
        if (host.empty() || host.find_first_of("[]") != std::string::npos
            || (host.find(':') != std::string::npos && authority.front() != '[')) {
            return std::nullopt;
        }
        r.endpoint = joinHostPort(host, boost::lexical_cast<std::string>(defaultProxyPort));
    }
    return r;
}

std::shared_ptr<Socks4Dialer>
ProxyDialerFactory::create(const std::string &url, std::shared_ptr<Dialer> upstream) const {
    auto u = parseProxyUrl(url);
    if (!u) {
        throw std::invalid_argument("invalid socks4 proxy url: " + url);
    }
    BOOST_LOG_S4C(trace)
        << "ProxyDialerFactory::create " << socks4Scheme2string(u->scheme)
        << " endpoint:" << u->endpoint
        << " ident from url:" << !u->ident.empty();
    return create(u->scheme, u->endpoint, std::move(upstream), u->ident.empty() ? defaultIdent : u->ident);
}

std::shared_ptr<Socks4Dialer>
ProxyDialerFactory::create(Socks4Scheme scheme, const std::string &proxyEndpoint,
                           std::shared_ptr<Dialer> upstream) const {
    return create(scheme, proxyEndpoint, std::move(upstream), defaultIdent);
}

std::shared_ptr<Socks4Dialer>
ProxyDialerFactory::create(Socks4Scheme scheme, const std::string &proxyEndpoint,
                           std::shared_ptr<Dialer> upstream, const std::string &ident) const {
    return std::make_shared<Socks4Dialer>(executor, scheme, proxyEndpoint, std::move(upstream), ident);
}

std::shared_ptr<Dialer>
ProxyDialerFactory::createChain(const std::vector<std::string> &urls, std::shared_ptr<Dialer> firstUpstream) const {
    auto d = std::move(firstUpstream);
    for (const auto &url: urls) {
        d = create(url, d);
    }
    return d;
}
