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

#include <iostream>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/variables_map.hpp>
#include <boost/program_options/positional_options.hpp>
#include <boost/program_options/parsers.hpp>
#include <memory>
#include <exception>
#include <sstream>
#include "./log/Log.h"
#include "ConfigLoader.h"
#include "ConnectTestHttp.h"
#include "ProxyDialerFactory.h"
#include "Socks4Error.h"
#include "TcpDialer.h"
#include "UtilTools.h"

#ifndef DEFAULT_CONFIG
#define DEFAULT_CONFIG R"(config.json)"
#endif // DEFAULT_CONFIG

int main(int argc, const char *argv[]) {

    s4ca_log::threadName = "main";

    s4ca_log::init_logging();

    std::string config_file;
    std::string proxy_url;
    std::string target;
    std::string ident;
    boost::program_options::options_description desc("options");
    desc.add_options()
            ("config,c", boost::program_options::value<std::string>(&config_file)->
                    default_value(DEFAULT_CONFIG)->
                    value_name("CONFIG"), "specify config file")
            ("proxy,p", boost::program_options::value<std::string>(&proxy_url)->
                    value_name("URL"), "use only this proxy, socks4://host:port or socks4a://host:port")
            ("target,t", boost::program_options::value<std::string>(&target)->
                    value_name("HOST:PORT"), "the remote host to connect through the proxy")
            ("ident,i", boost::program_options::value<std::string>(&ident)->
                    value_name("IDENT"), "the socks4 USERID")
            ("help,h", "print help message")
            ("version,v", "print version and build info");
    boost::program_options::positional_options_description pd;
    pd.add("config", 1);
    boost::program_options::variables_map vMap;
    try {
        boost::program_options::store(
                boost::program_options::command_line_parser(argc, argv)
                        .options(desc)
                        .positional(pd)
                        .run(), vMap);
        boost::program_options::notify(vMap);
    } catch (const boost::program_options::error &e) {
        BOOST_LOG_S4C(error) << "bad command line: " << e.what();
        return -1;
    }
    if (vMap.count("help")) {
        BOOST_LOG_S4C(info_VSERION) << "usage: " << argv[0] << " [[-c] CONFIG] [-p URL] [-t HOST:PORT] [-i IDENT]"
                                    << "\n";

        BOOST_LOG_S4C(info_VSERION) << "    Socks4ClientAsio  Copyright (C) <2020>  <Jeremie>\n"
                                    << "    This program comes with ABSOLUTELY NO WARRANTY; \n"
                                    << "    This is free software, and you are welcome to redistribute it\n"
                                    << "    under certain conditions; \n"
                                    << "         GNU GENERAL PUBLIC LICENSE , Version 3 "
                                    << "\n";

        BOOST_LOG_S4C(info_VSERION) << desc << std::endl;
        return 0;
    }
    if (vMap.count("version")) {
        BOOST_LOG_S4C(info_VSERION) << s4ca_log::versionInfo();
        return 0;
    }

    BOOST_LOG_S4C(info) << "config_file: " << config_file;

    try {
        boost::asio::io_context ioc;
        boost::asio::any_io_executor ex = ioc.get_executor();

        auto configLoader = std::make_shared<ConfigLoader>();
        configLoader->load(config_file);

        auto &config = configLoader->config;
        if (vMap.count("proxy")) {
            config.proxyChain = {proxy_url};
        }
        if (vMap.count("ident")) {
            config.ident = ident;
        }
        if (vMap.count("target")) {
            std::string host, port, reason;
            if (!splitHostPort(target, host, port, reason)) {
                BOOST_LOG_S4C(error) << "bad target [" << target << "] : " << reason;
                return -1;
            }
            auto p = parsePort(port);
            if (!p) {
                BOOST_LOG_S4C(error) << "bad target port [" << target << "]";
                return -1;
            }
            config.targetHost = host;
            config.targetPort = *p;
        }

        s4ca_log::set_log_level(s4ca_log::string2SeverityLevel(config.logLevel));

        {
            std::stringstream ss;
            configLoader->print(ss);
            BOOST_LOG_S4C(info) << "config:\n" << ss.str();
        }

        if (config.proxyChain.empty()) {
            BOOST_LOG_S4C(error) << "no proxy configured, set proxyChain in config or use --proxy";
            return -1;
        }

        auto factory = std::make_shared<ProxyDialerFactory>(ex, config.ident);
        auto dialer = factory->createChain(config.proxyChain, std::make_shared<TcpDialer>(ex));

        boost::system::error_code ec;
        if (config.connectTest.enable) {
            ConnectTestHttp connectTest{
                    dialer,
                    config.network,
                    config.targetHost,
                    config.targetPort,
                    config.connectTest.path,
                    config.connectTest.httpVersion,
            };
            DialDetail detail;
            auto res = connectTest.run(ec, detail);
            if (ec) {
                BOOST_LOG_S4C(error) << "connect test failed: " << ec.message()
                                     << (detail.what.empty() ? std::string{} : " : " + detail.what);
                return ec.category() == socks4_category() ? 1 : -1;
            }
            BOOST_LOG_S4C(info) << "connect test ok, http status: " << res.result_int()
                                << " body size: " << res.body().size();
            return 0;
        }

        // the last hop is always a Socks4Dialer, use the throwing dial to keep the full error message
        auto lastHop = std::dynamic_pointer_cast<Socks4Dialer>(dialer);
        if (!lastHop) {
            BOOST_LOG_S4C(error) << "the last hop of the proxy chain is not a socks4 proxy";
            return -1;
        }
        auto c = lastHop->dial(config.network, joinHostPort(config.targetHost, std::to_string(config.targetPort)));
        BOOST_LOG_S4C(info) << "dial " << config.targetHost << ":" << config.targetPort << " ok";
        c->close(ec);
        if (ec) {
            BOOST_LOG_S4C(warning) << "close: " << ec.message();
        }

    } catch (const Socks4DialError &e) {
        BOOST_LOG_S4C(error) << "catch Socks4DialError: " << e.what() << " cause: " << e.cause().message();
        return 1;
    } catch (const std::exception &e) {
        BOOST_LOG_S4C(error) << "catch std::exception: " << e.what();
        return -1;
    }

    return 0;
}
