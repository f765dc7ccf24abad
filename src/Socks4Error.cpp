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

#include "Socks4Error.h"

namespace {

    class socks4_error_category : public boost::system::error_category {
    public:
        const char *name() const noexcept override {
            return "socks4";
        }

        std::string message(int ev) const override {
            switch (static_cast<socks4_error>(ev)) {
                case socks4_error::wrong_network:
                    return "network should be tcp or tcp4";
                case socks4_error::wrong_address:
                    return "wrong addr";
                case socks4_error::dial_failed:
                    return "socks4 dial";
                case socks4_error::host_unknown:
                    return "unable to find IP address of host";
                case socks4_error::io_error:
                    return "i/o error";
                case socks4_error::ident_required:
                    return "valid ident required";
                case socks4_error::connection_rejected:
                    return "connection to remote host was rejected";
                case socks4_error::invalid_response:
                    return "unknown socks4 server response";
                default:
                    return "unknown socks4 error";
            }
        }
    };

}

const boost::system::error_category &socks4_category() noexcept {
    static const socks4_error_category instance;
    return instance;
}

boost::system::error_code make_error_code(socks4_error e) noexcept {
    return boost::system::error_code{static_cast<int>(e), socks4_category()};
}
