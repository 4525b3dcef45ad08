// tests/dispatcher_test.cpp
// Exchange flow, connect retries and error classification through the dispatcher.

#include <gtest/gtest.h>
#include "dispatcher.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace spamc {
namespace {

using namespace std::chrono_literals;

// What the fake daemon does for one exchange on a connection.
struct Script {
    std::string reply;        // bytes fed to the decoder
    bool fail_write = false;  // send() throws Write
    bool eof = false;         // finish() after feeding
};

// Shared record of everything the fake connections saw.
struct Wire {
    std::mutex mutex;
    std::vector<std::string> sent;
    std::vector<std::string> addresses;
    std::deque<Script> scripts;
    int connects = 0;
    int refuse = 0;  // refuse this many connects first

    Script next() {
        std::lock_guard<std::mutex> lock(mutex);
        if (scripts.empty()) return Script{"SPAMD/1.5 0 PONG\r\n\r\n"};
        Script s = scripts.front();
        scripts.pop_front();
        return s;
    }
};

class ScriptedTransport : public Transport {
public:
    explicit ScriptedTransport(std::shared_ptr<Wire> wire) : wire_(std::move(wire)) {}

    void send(const uint8_t* data, size_t len, Deadline, const CancellationToken&) override {
        current_ = wire_->next();
        if (current_.fail_write) {
            close();
            throw SpamcError::write("broken pipe after 0 of " + std::to_string(len) + " bytes");
        }
        std::lock_guard<std::mutex> lock(wire_->mutex);
        wire_->sent.emplace_back(reinterpret_cast<const char*>(data), len);
    }

    void receive(codec::FrameDecoder& decoder, Deadline, const CancellationToken&) override {
        try {
            if (!current_.reply.empty()) decoder.feed(current_.reply);
            if (current_.eof || !decoder.complete()) {
                decoder.finish();
                reusable_ = false;
            }
        } catch (const SpamcError&) {
            close();
            throw;
        }
    }

    bool alive() override { return state_ != TransportState::Closed; }
    void close() noexcept override { state_ = TransportState::Closed; }

private:
    std::shared_ptr<Wire> wire_;
    Script current_;
};

Dispatcher::TransportFactory factory_for(std::shared_ptr<Wire> wire) {
    return [wire](const Address& address, Deadline, const CancellationToken&) {
        std::lock_guard<std::mutex> lock(wire->mutex);
        wire->connects++;
        wire->addresses.push_back(address.to_string());
        if (wire->refuse > 0) {
            wire->refuse--;
            throw SpamcError::connection("connect failed to " + address.to_string() +
                                         ": Connection refused");
        }
        return std::unique_ptr<Transport>(new ScriptedTransport(wire));
    };
}

ClientConfigBuilder test_config() {
    return ClientConfig::builder()
        .address("spamd.test:783")
        .retry_backoff(1ms)
        .request_timeout(2000ms);
}

TEST(DispatcherTest, PingExchange) {
    auto wire = std::make_shared<Wire>();
    Dispatcher d(test_config().build(), factory_for(wire));

    auto r = d.execute(Request::make(Command::Ping));
    EXPECT_EQ(r.status_message, "PONG");
    ASSERT_EQ(wire->sent.size(), 1u);
    EXPECT_EQ(wire->sent[0], "PING SPAMC/1.5\r\n\r\n");
    EXPECT_EQ(wire->addresses[0], "spamd.test:783");
}

TEST(DispatcherTest, ConnectionReusedAcrossExchanges) {
    auto wire = std::make_shared<Wire>();
    Dispatcher d(test_config().build(), factory_for(wire));

    d.execute(Request::make(Command::Ping));
    d.execute(Request::make(Command::Ping));
    d.execute(Request::make(Command::Ping));
    EXPECT_EQ(wire->connects, 1);
    EXPECT_EQ(d.pool_for("spamd.test:783").idle_count(), 1u);
}

TEST(DispatcherTest, RefusedConnectsRetriedThenSucceed) {
    auto wire = std::make_shared<Wire>();
    wire->refuse = 2;
    std::vector<ErrorKind> reported;
    auto config = test_config()
        .max_connect_retries(3)
        .on_error([&reported](const SpamcError& e) { reported.push_back(e.kind()); })
        .build();
    Dispatcher d(std::move(config), factory_for(wire));

    EXPECT_EQ(d.execute(Request::make(Command::Ping)).status_message, "PONG");
    EXPECT_EQ(wire->connects, 3);
    EXPECT_EQ(reported, (std::vector<ErrorKind>{ErrorKind::Connection, ErrorKind::Connection}));
}

TEST(DispatcherTest, RetriesAreBounded) {
    auto wire = std::make_shared<Wire>();
    wire->refuse = 100;
    std::atomic<int> reported{0};
    auto config = test_config()
        .max_connect_retries(2)
        .on_error([&reported](const SpamcError&) { reported++; })
        .build();
    Dispatcher d(std::move(config), factory_for(wire));

    try {
        d.execute(Request::make(Command::Ping));
        FAIL() << "expected Connection";
    } catch (const SpamcError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Connection);
        EXPECT_EQ(e.command(), "PING");
        EXPECT_EQ(e.address(), "spamd.test:783");
    }
    EXPECT_EQ(wire->connects, 3);
    EXPECT_EQ(reported.load(), 2);
}

TEST(DispatcherTest, NoRetriesWhenDisabled) {
    auto wire = std::make_shared<Wire>();
    wire->refuse = 1;
    Dispatcher d(test_config().max_connect_retries(0).build(), factory_for(wire));
    EXPECT_THROW(d.execute(Request::make(Command::Ping)), SpamcError);
    EXPECT_EQ(wire->connects, 1);
}

TEST(DispatcherTest, WriteErrorOnFreshConnectionNotRetried) {
    auto wire = std::make_shared<Wire>();
    wire->scripts.push_back(Script{"", true});
    Dispatcher d(test_config().build(), factory_for(wire));

    try {
        d.execute(Request::make(Command::Ping));
        FAIL() << "expected Write";
    } catch (const SpamcError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Write);
    }
    EXPECT_EQ(wire->connects, 1);
    auto& pool = d.pool_for("spamd.test:783");
    EXPECT_EQ(pool.idle_count(), 0u);
    EXPECT_EQ(pool.open_count(), 0u);

    d.execute(Request::make(Command::Ping));
    EXPECT_EQ(wire->connects, 2);
}

TEST(DispatcherTest, PooledConnectionClosedAfterSendIsNotResent) {
    auto wire = std::make_shared<Wire>();
    std::atomic<int> reported{0};
    Dispatcher d(test_config().on_error([&reported](const SpamcError&) { reported++; }).build(),
                 factory_for(wire));

    d.execute(Request::make(Command::Ping));
    // The pooled connection takes the request, then closes without a reply.
    wire->scripts.push_back(Script{"", false, true});
    try {
        d.execute(Request::make(Command::Tell, Headers{{"Message-class", "spam"},
                                                       {"Set", "local"}},
                                "msg"));
        FAIL() << "expected UnexpectedEof";
    } catch (const SpamcError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UnexpectedEof);
        EXPECT_EQ(e.command(), "TELL");
    }

    size_t tells = 0;
    for (const auto& sent : wire->sent) {
        if (sent.compare(0, 5, "TELL ") == 0) tells++;
    }
    EXPECT_EQ(tells, 1u);
    EXPECT_EQ(wire->connects, 1);
    EXPECT_EQ(reported.load(), 0);
    EXPECT_EQ(d.pool_for("spamd.test:783").open_count(), 0u);
}

TEST(DispatcherTest, WriteErrorOnPooledConnectionNotRetried) {
    auto wire = std::make_shared<Wire>();
    Dispatcher d(test_config().build(), factory_for(wire));

    d.execute(Request::make(Command::Ping));
    wire->scripts.push_back(Script{"", true});
    try {
        d.execute(Request::make(Command::Ping));
        FAIL() << "expected Write";
    } catch (const SpamcError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Write);
    }
    EXPECT_EQ(wire->connects, 1);

    // The next call opens a fresh connection.
    d.execute(Request::make(Command::Ping));
    EXPECT_EQ(wire->connects, 2);
}

TEST(DispatcherTest, DaemonErrorKeepsConnection) {
    auto wire = std::make_shared<Wire>();
    wire->scripts.push_back(Script{"SPAMD/1.5 76 Bad header line: (Content-length mismatch)\r\n\r\n"});
    Dispatcher d(test_config().build(), factory_for(wire));

    try {
        d.execute(Request::make(Command::Ping));
        FAIL() << "expected Daemon";
    } catch (const SpamcError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Daemon);
        EXPECT_EQ(e.status_code(), 76);
        EXPECT_TRUE(e.connection_reusable());
        EXPECT_FALSE(e.is_protocol_error());
    }
    EXPECT_EQ(d.pool_for("spamd.test:783").idle_count(), 1u);

    d.execute(Request::make(Command::Ping));
    EXPECT_EQ(wire->connects, 1);
}

TEST(DispatcherTest, MalformedReplyDiscardsConnection) {
    auto wire = std::make_shared<Wire>();
    wire->scripts.push_back(Script{"SPAMD/1.5 zero EX_OK\r\n\r\n"});
    Dispatcher d(test_config().build(), factory_for(wire));

    try {
        d.execute(Request::make(Command::Ping));
        FAIL() << "expected MalformedStatusLine";
    } catch (const SpamcError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::MalformedStatusLine);
        EXPECT_TRUE(e.is_protocol_error());
    }
    EXPECT_EQ(d.pool_for("spamd.test:783").open_count(), 0u);
}

TEST(DispatcherTest, TruncatedBodyIsUnexpectedEof) {
    auto wire = std::make_shared<Wire>();
    wire->scripts.push_back(Script{"SPAMD/1.5 0 EX_OK\r\nContent-length: 10\r\n\r\n12345", false, true});
    Dispatcher d(test_config().build(), factory_for(wire));

    try {
        d.execute(Request::make(Command::Process, Headers(), "msg"));
        FAIL() << "expected UnexpectedEof";
    } catch (const SpamcError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UnexpectedEof);
    }
}

TEST(DispatcherTest, UserHeaderFromConfigAndCall) {
    auto wire = std::make_shared<Wire>();
    Dispatcher d(test_config().user("alice").build(), factory_for(wire));

    d.execute(Request::make(Command::Ping));
    d.execute(Request::make(Command::Ping), CallOptions().with_user("bob"));
    d.execute(Request::make(Command::Ping, Headers{{"User", "carol"}}));

    ASSERT_EQ(wire->sent.size(), 3u);
    EXPECT_EQ(wire->sent[0], "PING SPAMC/1.5\r\nUser: alice\r\n\r\n");
    EXPECT_EQ(wire->sent[1], "PING SPAMC/1.5\r\nUser: bob\r\n\r\n");
    EXPECT_EQ(wire->sent[2], "PING SPAMC/1.5\r\nUser: carol\r\n\r\n");
}

TEST(DispatcherTest, PerCallAddressUsesOwnPool) {
    auto wire = std::make_shared<Wire>();
    Dispatcher d(test_config().build(), factory_for(wire));

    d.execute(Request::make(Command::Ping));
    d.execute(Request::make(Command::Ping), CallOptions().with_address("unix:/tmp/other.sock"));
    ASSERT_EQ(wire->addresses.size(), 2u);
    EXPECT_EQ(wire->addresses[1], "unix:/tmp/other.sock");
    EXPECT_EQ(d.pool_for("unix:/tmp/other.sock").idle_count(), 1u);
}

TEST(DispatcherTest, BadPerCallAddress) {
    auto wire = std::make_shared<Wire>();
    Dispatcher d(test_config().build(), factory_for(wire));
    try {
        d.execute(Request::make(Command::Ping), CallOptions().with_address("nope"));
        FAIL() << "expected Configuration";
    } catch (const SpamcError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Configuration);
    }
    EXPECT_EQ(wire->connects, 0);
}

TEST(DispatcherTest, EncodeErrorNeverConnects) {
    auto wire = std::make_shared<Wire>();
    Dispatcher d(test_config().build(), factory_for(wire));
    EXPECT_THROW(
        d.execute(Request::make(Command::Check, Headers{{"Content-length", "3"}}, "abc")),
        SpamcError);
    EXPECT_EQ(wire->connects, 0);
}

TEST(DispatcherTest, CancelledBeforeStart) {
    auto wire = std::make_shared<Wire>();
    Dispatcher d(test_config().build(), factory_for(wire));
    CancellationSource source;
    source.cancel();
    try {
        d.execute(Request::make(Command::Ping), CallOptions().with_cancel(source.token()));
        FAIL() << "expected Cancelled";
    } catch (const SpamcError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Cancelled);
    }
    EXPECT_EQ(wire->connects, 0);
}

TEST(DispatcherTest, ClosedDispatcherRejects) {
    auto wire = std::make_shared<Wire>();
    Dispatcher d(test_config().build(), factory_for(wire));
    d.close();
    EXPECT_TRUE(d.closed());
    try {
        d.execute(Request::make(Command::Ping));
        FAIL() << "expected Closed";
    } catch (const SpamcError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Closed);
    }
}

TEST(DispatcherTest, CompressedExchange) {
    Compressor rev;
    rev.token = "rev";
    rev.compress = [](const Bytes& in) { return Bytes(in.rbegin(), in.rend()); };
    rev.decompress = [](const Bytes& in) { return Bytes(in.rbegin(), in.rend()); };

    auto wire = std::make_shared<Wire>();
    wire->scripts.push_back(
        Script{"SPAMD/1.5 0 EX_OK\r\nCompress: rev\r\nContent-length: 3\r\n\r\nyxz"});
    Dispatcher d(test_config().compress(true).compressor(rev).build(), factory_for(wire));

    auto r = d.execute(Request::make(Command::Process, Headers(), "abc", "1.5", true));
    EXPECT_EQ(wire->sent[0], "PROCESS SPAMC/1.5\r\nCompress: rev\r\nContent-length: 3\r\n\r\ncba");
    EXPECT_EQ(r.body_text(), "zxy");
}

} // namespace
} // namespace spamc
