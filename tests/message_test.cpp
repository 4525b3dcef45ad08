// tests/message_test.cpp
// Request validation and response accessors.

#include <gtest/gtest.h>
#include "spamc/error.hpp"
#include "spamc/message.hpp"

#include <functional>

using namespace spamc;

static ErrorKind kind_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const SpamcError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected SpamcError";
    return ErrorKind::Io;
}

TEST(RequestTest, PingWithoutBody) {
    auto req = Request::make(Command::Ping);
    EXPECT_EQ(req.command(), Command::Ping);
    EXPECT_EQ(req.version(), "1.5");
    EXPECT_FALSE(req.body().has_value());
    EXPECT_TRUE(req.headers().empty());
}

TEST(RequestTest, PingWithBodyRejected) {
    EXPECT_EQ(kind_of([] { Request::make(Command::Ping, Headers(), to_bytes("x")); }),
              ErrorKind::InvalidRequest);
}

TEST(RequestTest, CheckWithoutBodyRejected) {
    EXPECT_EQ(kind_of([] { Request::make(Command::Check); }), ErrorKind::InvalidRequest);
}

TEST(RequestTest, EmptyBodyIsStillABody) {
    auto req = Request::make(Command::Check, Headers(), Bytes());
    ASSERT_TRUE(req.body().has_value());
    EXPECT_TRUE(req.body()->empty());
}

TEST(RequestTest, EveryBodyCommandRequiresBody) {
    for (auto cmd : {Command::Check, Command::Symbols, Command::Report, Command::ReportIfSpam,
                     Command::Process, Command::Headers, Command::Tell}) {
        EXPECT_TRUE(requires_body(cmd)) << command_name(cmd);
        EXPECT_THROW(Request::make(cmd), SpamcError) << command_name(cmd);
    }
}

TEST(RequestTest, HeaderNameWithColonRejected) {
    EXPECT_EQ(kind_of([] { Request::make(Command::Ping, Headers{{"Bad:Name", "v"}}); }),
              ErrorKind::InvalidRequest);
}

TEST(RequestTest, EmptyHeaderNameRejected) {
    EXPECT_EQ(kind_of([] { Request::make(Command::Ping, Headers{{"", "v"}}); }),
              ErrorKind::InvalidRequest);
}

TEST(RequestTest, HeaderValueWithNewlineRejected) {
    EXPECT_EQ(kind_of([] { Request::make(Command::Ping, Headers{{"User", "a\r\nSpam: yes"}}); }),
              ErrorKind::InvalidHeaderValue);
    EXPECT_EQ(kind_of([] { Request::make(Command::Ping, Headers{{"User", "a\nb"}}); }),
              ErrorKind::InvalidHeaderValue);
}

TEST(RequestTest, HeaderValueMayContainColons) {
    auto req = Request::make(Command::Ping, Headers{{"X-Time", "12:30:45"}});
    EXPECT_EQ(req.headers().get("x-time"), "12:30:45");
}

TEST(RequestTest, BadVersionRejected) {
    EXPECT_THROW(Request::make(Command::Ping, Headers(), std::nullopt, "1"), SpamcError);
    EXPECT_THROW(Request::make(Command::Ping, Headers(), std::nullopt, "a.b"), SpamcError);
    EXPECT_NO_THROW(Request::make(Command::Ping, Headers(), std::nullopt, "1.2"));
}

TEST(RequestTest, CompressOnlyWithBody) {
    EXPECT_FALSE(Request::make(Command::Ping, Headers(), std::nullopt, "1.5", true).compress());
    EXPECT_TRUE(Request::make(Command::Check, Headers(), "msg", "1.5", true).compress());
}

TEST(RequestTest, WithHeaderCopies) {
    auto req = Request::make(Command::Check, Headers(), "msg");
    auto with_user = req.with_header("User", "alice");
    EXPECT_FALSE(req.headers().contains("User"));
    EXPECT_EQ(with_user.headers().get("user"), "alice");
    EXPECT_THROW(req.with_header("User", "a\nb"), SpamcError);
}

TEST(ResponseTest, OkAndContentLength) {
    Response r;
    EXPECT_TRUE(r.ok());
    EXPECT_FALSE(r.content_length().has_value());

    r.status_code = 76;
    r.headers.add("content-length", "42");
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.content_length(), 42u);
}

TEST(ResponseTest, ContentLengthRejectsOverlongValue) {
    Response r;
    r.headers.add("Content-length", "999999999999999999");
    EXPECT_EQ(r.content_length(), 999999999999999999u);

    Response huge;
    huge.headers.add("Content-length", "99999999999999999999999");
    EXPECT_FALSE(huge.content_length().has_value());

    Response signed_value;
    signed_value.headers.add("Content-length", "-5");
    EXPECT_FALSE(signed_value.content_length().has_value());
}

TEST(ResponseTest, BodyText) {
    Response r;
    EXPECT_EQ(r.body_text(), "");
    r.body = to_bytes("hello");
    EXPECT_EQ(r.body_text(), "hello");
}

TEST(TypesTest, CommandNamesRoundTrip) {
    for (auto cmd : {Command::Check, Command::Symbols, Command::Report, Command::ReportIfSpam,
                     Command::Process, Command::Headers, Command::Ping, Command::Tell}) {
        Command parsed = Command::Ping;
        ASSERT_TRUE(parse_command(command_name(cmd), parsed));
        EXPECT_EQ(parsed, cmd);
    }
    EXPECT_STREQ(command_name(Command::ReportIfSpam), "REPORT_IFSPAM");
    Command out;
    EXPECT_FALSE(parse_command("SKIP", out));
    EXPECT_FALSE(parse_command("check", out));
}

TEST(TypesTest, StatusNames) {
    EXPECT_STREQ(status_name(0), "EX_OK");
    EXPECT_STREQ(status_name(76), "EX_PROTOCOL");
    EXPECT_STREQ(status_name(79), "EX_TIMEOUT");
    EXPECT_STREQ(status_name(12), "UNKNOWN");
}

TEST(TypesTest, ResponseBodyTraits) {
    EXPECT_FALSE(response_has_body(Command::Check));
    EXPECT_FALSE(response_has_body(Command::Ping));
    EXPECT_FALSE(response_has_body(Command::Tell));
    EXPECT_TRUE(response_has_body(Command::Process));
    EXPECT_TRUE(response_has_body(Command::Headers));
}
