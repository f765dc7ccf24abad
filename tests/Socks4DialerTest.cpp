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

#include <gtest/gtest.h>

#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>
#include <memory>
#include <string>
#include <vector>

#include "Socks4Dialer.h"
#include "Socks4Error.h"
#include "MockConnection.h"

namespace {

    std::vector<uint8_t> bytesOf(const std::string &s) {
        return {s.begin(), s.end()};
    }

    std::vector<uint8_t> concat(std::initializer_list<std::vector<uint8_t>> parts) {
        std::vector<uint8_t> r;
        for (const auto &p: parts) {
            r.insert(r.end(), p.begin(), p.end());
        }
        return r;
    }

}

class Socks4DialerTest : public ::testing::Test {
protected:
    boost::asio::io_context ioc;
    std::shared_ptr<MockDialer> upstream = std::make_shared<MockDialer>();

    std::shared_ptr<Socks4Dialer> make(Socks4Scheme scheme, const std::string &ident = Socks4Dialer::defaultIdent) {
        return std::make_shared<Socks4Dialer>(ioc.get_executor(), scheme, "proxy.local:1080", upstream, ident);
    }

    // dial and return the socks4_error, or a default code when it succeeded
    boost::system::error_code dialError(Socks4Dialer &d, const std::string &network, const std::string &address) {
        boost::system::error_code ec;
        auto c = d.dial(network, address, ec);
        if (ec) {
            EXPECT_EQ(c, nullptr);
        }
        return ec;
    }
};

TEST_F(Socks4DialerTest, RejectsNonTcp4NetworkBeforeDialing) {
    auto d = make(Socks4Scheme::socks4a);
    for (const std::string network: {"udp", "tcp6", "TCP", "ip4", "unix", ""}) {
        upstream->replyWith(Socks4Dialer::accessGranted);
        try {
            d->dial(network, "example.com:80");
            FAIL() << "no error for network [" << network << "]";
        } catch (const Socks4DialError &e) {
            EXPECT_EQ(e.code(), socks4_error::wrong_network) << network;
            EXPECT_FALSE(e.cause());
        }
    }
    EXPECT_EQ(upstream->dialCount, 0);
}

TEST_F(Socks4DialerTest, AcceptsTcpAndTcp4) {
    auto d = make(Socks4Scheme::socks4a);
    for (const std::string network: {"tcp", "tcp4"}) {
        upstream->state = std::make_shared<MockConnectionState>();
        upstream->replyWith(Socks4Dialer::accessGranted);
        auto c = d->dial(network, "example.com:80");
        ASSERT_NE(c, nullptr);
        EXPECT_EQ(upstream->lastNetwork, network);
    }
}

TEST_F(Socks4DialerTest, RejectsMalformedTargetAddress) {
    auto d = make(Socks4Scheme::socks4a);
    const std::vector<std::string> bad{
            "example.com",
            "example.com:",
            "example.com:http",
            "example.com:0",
            "example.com:65536",
            "example.com:-1",
            "example.com:+80",
            "example.com:80x",
            ":80",
            "a:b:80",
            "[::1",
            "[::1]80",
    };
    for (const auto &address: bad) {
        try {
            d->dial("tcp", address);
            FAIL() << "no error for address [" << address << "]";
        } catch (const Socks4DialError &e) {
            EXPECT_EQ(e.code(), socks4_error::wrong_address) << address;
            EXPECT_NE(std::string{e.what()}.find(address), std::string::npos) << e.what();
        }
    }
    EXPECT_EQ(upstream->dialCount, 0);
}

TEST_F(Socks4DialerTest, Socks4aSendsHostnameAndSentinelAddress) {
    auto d = make(Socks4Scheme::socks4a);
    upstream->replyWith(Socks4Dialer::accessGranted);

    auto c = d->dial("tcp", "example.com:80");
    ASSERT_NE(c, nullptr);
    EXPECT_TRUE(c->is_open());
    EXPECT_EQ(upstream->dialCount, 1);
    EXPECT_EQ(upstream->lastAddress, "proxy.local:1080");

    auto expected = concat({
                                   {0x04, 0x01, 0x00, 0x50, 0x00, 0x00, 0x00, 0x01},
                                   bytesOf("nobody@0.0.0.0"), {0x00},
                                   bytesOf("example.com"), {0x00},
                           });
    EXPECT_EQ(upstream->state->written, expected);
    EXPECT_EQ(upstream->state->writeCalls, 1);
    EXPECT_FALSE(upstream->state->closed);
}

TEST_F(Socks4DialerTest, Socks4aNeverResolvesLocally) {
    auto d = make(Socks4Scheme::socks4a);
    upstream->replyWith(Socks4Dialer::accessGranted);

    auto c = d->dial("tcp", "no-such-host.invalid:443");
    ASSERT_NE(c, nullptr);

    const auto &w = upstream->state->written;
    ASSERT_GE(w.size(), 8u);
    EXPECT_EQ(w[2], 0x01);
    EXPECT_EQ(w[3], 0xbb);
    EXPECT_EQ(std::vector<uint8_t>(w.begin() + 4, w.begin() + 8), (std::vector<uint8_t>{0, 0, 0, 1}));
    auto tail = bytesOf("no-such-host.invalid");
    tail.push_back(0x00);
    ASSERT_GE(w.size(), tail.size());
    EXPECT_TRUE(std::equal(tail.begin(), tail.end(), w.end() - tail.size()));
}

TEST_F(Socks4DialerTest, Socks4SendsIpv4AddressWithoutHostname) {
    auto d = make(Socks4Scheme::socks4);
    upstream->replyWith(Socks4Dialer::accessGranted);

    auto c = d->dial("tcp4", "10.1.2.3:8080");
    ASSERT_NE(c, nullptr);

    auto expected = concat({
                                   {0x04, 0x01, 0x1f, 0x90, 10, 1, 2, 3},
                                   bytesOf("nobody@0.0.0.0"), {0x00},
                           });
    EXPECT_EQ(upstream->state->written, expected);
}

TEST_F(Socks4DialerTest, Socks4ResolvesHostnameToIpv4) {
    auto d = make(Socks4Scheme::socks4);
    upstream->replyWith(Socks4Dialer::accessGranted);

    auto c = d->dial("tcp", "localhost:80");
    ASSERT_NE(c, nullptr);

    const auto &w = upstream->state->written;
    ASSERT_EQ(w.size(), 8u + std::string{"nobody@0.0.0.0"}.size() + 1u);
    EXPECT_EQ(w[4], 127);
    EXPECT_EQ(w.back(), 0x00);
}

TEST_F(Socks4DialerTest, Socks4UnknownHostClosesConnection) {
    auto d = make(Socks4Scheme::socks4);
    upstream->replyWith(Socks4Dialer::accessGranted);

    try {
        d->dial("tcp", "no-such-host.invalid:80");
        FAIL() << "resolved a .invalid host";
    } catch (const Socks4DialError &e) {
        EXPECT_EQ(e.code(), socks4_error::host_unknown);
        EXPECT_TRUE(e.cause());
        EXPECT_NE(std::string{e.what()}.find("no-such-host.invalid"), std::string::npos);
    }
    EXPECT_EQ(upstream->dialCount, 1);
    EXPECT_EQ(upstream->state->writeCalls, 0);
    EXPECT_TRUE(upstream->state->closed);
}

TEST_F(Socks4DialerTest, RequestIsDeterministic) {
    auto d = make(Socks4Scheme::socks4a, "alice");
    std::vector<std::vector<uint8_t>> seen;
    for (int i = 0; i != 3; ++i) {
        upstream->state = std::make_shared<MockConnectionState>();
        upstream->replyWith(Socks4Dialer::accessGranted);
        auto c = d->dial("tcp", "example.org:443");
        ASSERT_NE(c, nullptr);
        seen.push_back(upstream->state->written);
    }
    EXPECT_EQ(seen[0], seen[1]);
    EXPECT_EQ(seen[1], seen[2]);
    EXPECT_EQ(seen[0], Socks4Dialer::makeRequest(Socks4Scheme::socks4a, "alice", "example.org", 443, {}));
}

TEST_F(Socks4DialerTest, UsesConfiguredIdent) {
    auto d = make(Socks4Scheme::socks4, "");
    upstream->replyWith(Socks4Dialer::accessGranted);

    auto c = d->dial("tcp", "192.168.0.1:22");
    ASSERT_NE(c, nullptr);
    EXPECT_EQ(upstream->state->written, (std::vector<uint8_t>{0x04, 0x01, 0x00, 0x16, 192, 168, 0, 1, 0x00}));
}

struct StatusCase {
    uint8_t status;
    socks4_error expected;
};

class Socks4DialerStatusTest : public Socks4DialerTest, public ::testing::WithParamInterface<StatusCase> {
};

TEST_P(Socks4DialerStatusTest, MapsReplyStatusAndClosesConnection) {
    auto d = make(Socks4Scheme::socks4a);
    upstream->replyWith(GetParam().status);

    auto ec = dialError(*d, "tcp", "example.com:80");
    EXPECT_EQ(ec, GetParam().expected);
    EXPECT_EQ(&ec.category(), &socks4_category());
    EXPECT_TRUE(upstream->state->closed);
    EXPECT_EQ(upstream->state->closeCalls, 1);
}

INSTANTIATE_TEST_SUITE_P(
        Replies, Socks4DialerStatusTest,
        ::testing::Values(
                StatusCase{0x5B, socks4_error::connection_rejected},
                StatusCase{0x5C, socks4_error::ident_required},
                StatusCase{0x5D, socks4_error::ident_required},
                StatusCase{0x99, socks4_error::invalid_response},
                StatusCase{0x00, socks4_error::invalid_response},
                StatusCase{0x5A + 4, socks4_error::invalid_response}
        ));

TEST_F(Socks4DialerTest, InvalidResponseReportsRawByte) {
    auto d = make(Socks4Scheme::socks4a);
    upstream->replyWith(0x99);
    try {
        d->dial("tcp", "example.com:80");
        FAIL();
    } catch (const Socks4DialError &e) {
        EXPECT_EQ(e.code(), socks4_error::invalid_response);
        EXPECT_NE(std::string{e.what()}.find("153"), std::string::npos) << e.what();
    }
}

TEST_F(Socks4DialerTest, ShortReplyIsIoError) {
    auto d = make(Socks4Scheme::socks4a);
    upstream->state->reply = {0x00, 0x5A, 0x00, 0x50, 0x7f};

    try {
        d->dial("tcp", "example.com:80");
        FAIL();
    } catch (const Socks4DialError &e) {
        EXPECT_EQ(e.code(), socks4_error::io_error);
        EXPECT_EQ(e.cause(), boost::asio::error::eof);
    }
    EXPECT_TRUE(upstream->state->closed);
}

TEST_F(Socks4DialerTest, EmptyReplyIsIoError) {
    auto d = make(Socks4Scheme::socks4);
    upstream->state->reply.clear();

    auto ec = dialError(*d, "tcp", "127.0.0.1:80");
    EXPECT_EQ(ec, socks4_error::io_error);
    EXPECT_TRUE(upstream->state->closed);
}

TEST_F(Socks4DialerTest, ReplyMayArriveInPieces) {
    auto d = make(Socks4Scheme::socks4a);
    upstream->replyWith(Socks4Dialer::accessGranted);
    upstream->state->readChunk = 1;

    auto c = d->dial("tcp", "example.com:80");
    ASSERT_NE(c, nullptr);
    EXPECT_EQ(upstream->state->readPos, 8u);
}

TEST_F(Socks4DialerTest, ReadErrorIsWrapped) {
    auto d = make(Socks4Scheme::socks4a);
    upstream->state->readError = boost::asio::error::connection_reset;

    try {
        d->dial("tcp", "example.com:80");
        FAIL();
    } catch (const Socks4DialError &e) {
        EXPECT_EQ(e.code(), socks4_error::io_error);
        EXPECT_EQ(e.cause(), boost::asio::error::connection_reset);
    }
    EXPECT_TRUE(upstream->state->closed);
}

TEST_F(Socks4DialerTest, WriteErrorIsWrapped) {
    auto d = make(Socks4Scheme::socks4a);
    upstream->replyWith(Socks4Dialer::accessGranted);
    upstream->state->writeError = boost::asio::error::broken_pipe;

    try {
        d->dial("tcp", "example.com:80");
        FAIL();
    } catch (const Socks4DialError &e) {
        EXPECT_EQ(e.code(), socks4_error::io_error);
        EXPECT_EQ(e.cause(), boost::asio::error::broken_pipe);
    }
    EXPECT_EQ(upstream->state->readPos, 0u);
    EXPECT_TRUE(upstream->state->closed);
}

TEST_F(Socks4DialerTest, ShortWriteIsIoError) {
    auto d = make(Socks4Scheme::socks4a);
    upstream->replyWith(Socks4Dialer::accessGranted);
    upstream->state->writeLimit = 4;

    auto ec = dialError(*d, "tcp", "example.com:80");
    EXPECT_EQ(ec, socks4_error::io_error);
    EXPECT_TRUE(upstream->state->closed);
}

TEST_F(Socks4DialerTest, UpstreamFailureIsDialFailed) {
    auto d = make(Socks4Scheme::socks4a);
    upstream->dialError = boost::asio::error::connection_refused;

    try {
        d->dial("tcp", "example.com:80");
        FAIL();
    } catch (const Socks4DialError &e) {
        EXPECT_EQ(e.code(), socks4_error::dial_failed);
        EXPECT_EQ(e.cause(), boost::asio::error::connection_refused);
        EXPECT_NE(std::string{e.what()}.find("proxy.local:1080"), std::string::npos);
    }
    EXPECT_EQ(upstream->lastAddress, "proxy.local:1080");
}

TEST_F(Socks4DialerTest, ErrorCodeDialKeepsRawByteInDetail) {
    auto d = make(Socks4Scheme::socks4a);
    upstream->replyWith(0x99);

    Dialer &dialer = *d;
    boost::system::error_code ec;
    DialDetail detail;
    auto c = dialer.dial("tcp", "example.com:80", ec, detail);
    EXPECT_EQ(c, nullptr);
    EXPECT_EQ(ec, socks4_error::invalid_response);
    EXPECT_NE(detail.what.find("153"), std::string::npos) << detail.what;
    EXPECT_NE(detail.what.find("0x99"), std::string::npos) << detail.what;
    EXPECT_TRUE(upstream->state->closed);
}

TEST_F(Socks4DialerTest, ErrorCodeDialKeepsUpstreamCauseInDetail) {
    auto d = make(Socks4Scheme::socks4a);
    upstream->dialError = boost::asio::error::connection_refused;

    boost::system::error_code ec;
    DialDetail detail;
    d->dial("tcp", "example.com:80", ec, detail);
    EXPECT_EQ(ec, socks4_error::dial_failed);
    EXPECT_EQ(detail.cause, boost::asio::error::connection_refused);
    EXPECT_NE(detail.what.find("proxy.local:1080"), std::string::npos) << detail.what;
    auto refused = boost::system::error_code{boost::asio::error::connection_refused}.message();
    EXPECT_NE(detail.what.find(refused), std::string::npos) << detail.what;
}

TEST_F(Socks4DialerTest, ErrorCodeDialNamesBadLiteralInDetail) {
    auto d = make(Socks4Scheme::socks4);

    boost::system::error_code ec;
    DialDetail detail;
    d->dial("tcp", "example.com:http", ec, detail);
    EXPECT_EQ(ec, socks4_error::wrong_address);
    EXPECT_NE(detail.what.find("example.com:http"), std::string::npos) << detail.what;

    upstream->replyWith(Socks4Dialer::accessGranted);
    detail = {};
    d->dial("tcp", "no-such-host.invalid:80", ec, detail);
    EXPECT_EQ(ec, socks4_error::host_unknown);
    EXPECT_TRUE(detail.cause);
    EXPECT_NE(detail.what.find("no-such-host.invalid"), std::string::npos) << detail.what;
}

TEST_F(Socks4DialerTest, ChainedFailureKeepsInnerHopDetail) {
    auto first = std::make_shared<Socks4Dialer>(ioc.get_executor(), Socks4Scheme::socks4a,
                                                "first.proxy:1080", upstream);
    auto second = std::make_shared<Socks4Dialer>(ioc.get_executor(), Socks4Scheme::socks4a,
                                                 "second.proxy:1081", first);
    upstream->dialError = boost::asio::error::connection_refused;

    boost::system::error_code ec;
    DialDetail detail;
    auto c = second->dial("tcp", "example.com:80", ec, detail);
    EXPECT_EQ(c, nullptr);
    EXPECT_EQ(ec, socks4_error::dial_failed);
    EXPECT_EQ(detail.cause, socks4_error::dial_failed);
    EXPECT_NE(detail.what.find("second.proxy:1081"), std::string::npos) << detail.what;
    EXPECT_NE(detail.what.find("first.proxy:1080"), std::string::npos) << detail.what;
}

TEST_F(Socks4DialerTest, FailuresLeaveDescriptorUntouchedAndCloseEveryConnection) {
    auto d = make(Socks4Scheme::socks4a, "bob");
    const std::vector<uint8_t> statuses{0x5B, 0x5C, 0x5D, 0x99};
    for (auto status: statuses) {
        upstream->replyWith(status);
        upstream->state->readPos = 0;
        EXPECT_TRUE(dialError(*d, "tcp", "example.com:80"));
    }
    EXPECT_EQ(upstream->dialCount, static_cast<int>(statuses.size()));
    EXPECT_EQ(upstream->state->closeCalls, static_cast<int>(statuses.size()));
    EXPECT_EQ(d->scheme(), Socks4Scheme::socks4a);
    EXPECT_EQ(d->proxyEndpoint(), "proxy.local:1080");
    EXPECT_EQ(d->ident(), "bob");
}

TEST_F(Socks4DialerTest, ChainsThroughAnotherSocks4Dialer) {
    auto first = std::make_shared<Socks4Dialer>(ioc.get_executor(), Socks4Scheme::socks4a,
                                                "first.proxy:1080", upstream);
    auto second = std::make_shared<Socks4Dialer>(ioc.get_executor(), Socks4Scheme::socks4a,
                                                 "second.proxy:1081", first, "carol");
    upstream->state->reply = {
            0x00, 0x5A, 0, 0, 0, 0, 0, 0,
            0x00, 0x5A, 0, 0, 0, 0, 0, 0,
    };

    auto c = second->dial("tcp", "example.com:80");
    ASSERT_NE(c, nullptr);
    EXPECT_EQ(upstream->lastAddress, "first.proxy:1080");

    auto expected = concat({
                                   Socks4Dialer::makeRequest(Socks4Scheme::socks4a, Socks4Dialer::defaultIdent,
                                                             "second.proxy", 1081, {}),
                                   Socks4Dialer::makeRequest(Socks4Scheme::socks4a, "carol",
                                                             "example.com", 80, {}),
                           });
    EXPECT_EQ(upstream->state->written, expected);
}

TEST_F(Socks4DialerTest, ConstructorValidatesArguments) {
    EXPECT_THROW(Socks4Dialer(ioc.get_executor(), Socks4Scheme::socks4, "p:1080", nullptr),
                 std::invalid_argument);
    EXPECT_THROW(Socks4Dialer(ioc.get_executor(), Socks4Scheme::socks4, "p:1080", upstream, std::string{"a\0b", 3}),
                 std::invalid_argument);
}

TEST(Socks4ErrorCategory, NamesEveryKind) {
    EXPECT_STREQ(socks4_category().name(), "socks4");
    boost::system::error_code ec = socks4_error::ident_required;
    EXPECT_EQ(ec.message(), "valid ident required");
    ec = socks4_error::connection_rejected;
    EXPECT_EQ(ec.message(), "connection to remote host was rejected");
    EXPECT_NE(ec, make_error_code(socks4_error::io_error));
}
