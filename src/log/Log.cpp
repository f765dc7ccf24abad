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

#include "Log.h"

#include <boost/core/null_deleter.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/attributes.hpp>
#include <boost/log/utility/setup/formatter_parser.hpp>
#include <boost/version.hpp>
#include <boost/algorithm/string.hpp>

#include <iomanip>
#include <iostream>
#include <sstream>
#include <mutex>
#include <memory>

#include "../VERSION/ProgramVersion.h"

namespace s4ca_log {
    thread_local std::string threadName;

    boost::log::sources::severity_logger_mt<severity_level> slg;

    const char *severity_level_str[severity_level::MAX] = {
            "trace",
            "debug",
            "info",
            "info_VSERION",
            "warning",
            "error",
            "fatal"
    };

    template<typename CharT, typename TraitsT>
    std::basic_ostream<CharT, TraitsT> &
    operator<<(std::basic_ostream<CharT, TraitsT> &strm, severity_level lvl) {
        if (lvl < severity_level::MAX && lvl >= 0)
            strm << severity_level_str[lvl];
        else
            strm << static_cast< int >(lvl);
        return strm;
    }

    class thread_name_impl :
            public boost::log::attribute::impl {
    public:
        boost::log::attribute_value get_value() override {
            return boost::log::attributes::make_attribute_value(
                    s4ca_log::threadName.empty() ? std::string("no name") : s4ca_log::threadName);
        }

        using value_type = std::string;
    };

    class thread_name :
            public boost::log::attribute {
    public:
        thread_name() : boost::log::attribute(new thread_name_impl()) {
        }

        explicit thread_name(boost::log::attributes::cast_source const &source)
                : boost::log::attribute(source.as<thread_name_impl>()) {
        }

        using value_type = thread_name_impl::value_type;

    };

    BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", severity_level)

    void init_logging() {

        boost::log::register_simple_formatter_factory<severity_level, char>("Severity");

        boost::shared_ptr<boost::log::core> core = boost::log::core::get();

        typedef boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend> sink_t;
        boost::shared_ptr<sink_t> sink(new sink_t());
        sink->locked_backend()->add_stream(boost::shared_ptr<std::ostream>(&std::cout, boost::null_deleter()));
        sink->locked_backend()->auto_flush(true);
        sink->set_formatter(
                boost::log::expressions::stream
                        << "["
                        << boost::log::expressions::format_date_time<boost::posix_time::ptime>(
                                "TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
                        << "]"
                        << "["
                        << boost::log::expressions::attr<boost::log::attributes::current_thread_id::value_type>(
                                "ThreadID")
                        << "]"
                        << "["
                        << std::setw(6)
                        << boost::log::expressions::attr<thread_name::value_type>("ThreadName")
                        << "]"
                        << "[" << boost::log::expressions::attr<severity_level>("Severity") << "] "
                        << boost::log::expressions::smessage);
        core->add_sink(sink);

        core->add_global_attribute("ThreadName", thread_name());
        core->add_global_attribute("ThreadID", boost::log::attributes::current_thread_id());
        core->add_global_attribute("TimeStamp", boost::log::attributes::local_clock());

        BOOST_LOG_S4C(trace) << "init_logging() done";
    }

    void set_log_level(severity_level lvl) {
        boost::log::core::get()->set_filter(
                severity >= lvl || severity == severity_level::info_VSERION
        );
    }

    severity_level string2SeverityLevel(const std::string &s) {
        auto name = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(s));
        for (int i = 0; i != severity_level::MAX; ++i) {
            if (name == severity_level_str[i]) {
                return static_cast<severity_level>(i);
            }
        }
        return severity_level::info;
    }

    std::once_flag versionInfo_OnceFlag{};
    std::unique_ptr<std::string> versionInfoString{};

    void versionInfoStringInit() {
        std::stringstream ss;
        ss << "Socks4ClientAsio"
           << "\n   ProgramVersion " << ProgramVersion
           << "\n   Boost " << BOOST_LIB_VERSION
           << "\n ------------------------------------------------------------------------- "
           << "\nSocks4ClientAsio  Copyright (C) <2020>  <Jeremie>"
           << "\n  This program comes with ABSOLUTELY NO WARRANTY; "
           << "\n  This is free software, and you are welcome to redistribute it"
           << "\n  under certain conditions; "
           << "\n       GNU GENERAL PUBLIC LICENSE , Version 3 "
           << "\n ---------- Socks4ClientAsio  Copyright (C) <2020>  <Jeremie> ---------- ";
        versionInfoString = std::make_unique<decltype(versionInfoString)::element_type>(ss.str());
    }

    std::string versionInfo() {
        std::call_once(versionInfo_OnceFlag, &versionInfoStringInit);
        return *versionInfoString;
    }

} // s4ca_log
