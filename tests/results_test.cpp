// tests/results_test.cpp
// Header-value and body parsers behind the typed command results.

#include <gtest/gtest.h>
#include "spamc/error.hpp"
#include "spamc/results.hpp"

namespace spamc {
namespace {

// ==================== Spam header ====================

TEST(SpamHeaderTest, SpamVerdict) {
    auto s = parse_spam_header("True ; 15.2 / 5.0");
    ASSERT_TRUE(s.has_value());
    EXPECT_TRUE(s->is_spam);
    EXPECT_DOUBLE_EQ(s->score, 15.2);
    EXPECT_DOUBLE_EQ(s->threshold, 5.0);
}

TEST(SpamHeaderTest, HamWithNegativeScore) {
    auto s = parse_spam_header("False ; -1.9 / 5.0");
    ASSERT_TRUE(s.has_value());
    EXPECT_FALSE(s->is_spam);
    EXPECT_DOUBLE_EQ(s->score, -1.9);
}

TEST(SpamHeaderTest, YesNoAndCase) {
    EXPECT_TRUE(parse_spam_header("yes ; 6 / 5")->is_spam);
    EXPECT_FALSE(parse_spam_header("NO;0.0/5.0")->is_spam);
    EXPECT_TRUE(parse_spam_header("TRUE ; 6 / 5")->is_spam);
}

TEST(SpamHeaderTest, Malformed) {
    for (const char* bad : {"", "True", "True ; 5.0", "Maybe ; 1 / 5", "True ; abc / 5",
                            "True ; 1.5x / 5", "True ; 1 / "}) {
        EXPECT_FALSE(parse_spam_header(bad).has_value()) << bad;
    }
}

TEST(SpamHeaderTest, SpamStatusRequiresHeader) {
    Response r;
    try {
        spam_status(r);
        FAIL() << "expected MalformedHeader";
    } catch (const SpamcError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::MalformedHeader);
    }

    r.headers.add("spam", "False ; 0.1 / 5.0");
    EXPECT_DOUBLE_EQ(spam_status(r).score, 0.1);

    Response bad;
    bad.headers.add("Spam", "garbage");
    EXPECT_THROW(spam_status(bad), SpamcError);
}

// ==================== Actions and classes ====================

TEST(ActionTest, Parse) {
    EXPECT_EQ(parse_action("local"), (ActionOption{true, false}));
    EXPECT_EQ(parse_action("remote"), (ActionOption{false, true}));
    EXPECT_EQ(parse_action("local, remote"), (ActionOption{true, true}));
    EXPECT_EQ(parse_action("Remote,Local"), (ActionOption{true, true}));
    EXPECT_FALSE(parse_action("").has_value());
    EXPECT_FALSE(parse_action("global").has_value());
    EXPECT_FALSE(parse_action("local, remote, local").has_value());
}

TEST(ActionTest, Format) {
    EXPECT_EQ(format_action(ActionOption{true, false}), "local");
    EXPECT_EQ(format_action(ActionOption{false, true}), "remote");
    EXPECT_EQ(format_action(ActionOption{true, true}), "local, remote");
    EXPECT_EQ(format_action(ActionOption{}), "");
}

TEST(MessageClassTest, ParseAndName) {
    EXPECT_EQ(parse_message_class("spam"), MessageClass::Spam);
    EXPECT_EQ(parse_message_class(" Ham "), MessageClass::Ham);
    EXPECT_FALSE(parse_message_class("eggs").has_value());
    EXPECT_STREQ(message_class_name(MessageClass::Spam), "spam");
    EXPECT_STREQ(message_class_name(MessageClass::Ham), "ham");
}

// ==================== Bodies ====================

TEST(SymbolsTest, CommaSeparated) {
    auto s = parse_symbols("BAYES_99,HTML_MESSAGE, MISSING_DATE\r\n");
    EXPECT_EQ(s, (std::vector<std::string>{"BAYES_99", "HTML_MESSAGE", "MISSING_DATE"}));
    EXPECT_TRUE(parse_symbols("").empty());
    EXPECT_TRUE(parse_symbols("\r\n").empty());
}

const char* const SAMPLE_REPORT =
    "Spam detection software, running on the system \"mail.example.com\",\r\n"
    "has identified this incoming email as possible spam.\r\n"
    "\r\n"
    "Content analysis details:   (6.2 points, 5.0 required)\r\n"
    "\r\n"
    " pts rule name              description\r\n"
    "---- ---------------------- --------------------------------------------------\r\n"
    " 3.5 BAYES_99               BODY: Bayes spam probability is 99 to 100%\r\n"
    "                            [score: 1.0000]\r\n"
    " 0.0 HTML_MESSAGE           BODY: HTML included in message\r\n"
    " 2.7 MISSING_DATE           Missing Date: header\r\n"
    "-0.1 DKIM_VALID             Message has at least one valid DKIM or DK signature\r\n"
    "\r\n";

TEST(ReportTest, RuleTable) {
    auto rules = parse_report(SAMPLE_REPORT);
    ASSERT_EQ(rules.size(), 4u);

    EXPECT_DOUBLE_EQ(rules[0].score, 3.5);
    EXPECT_EQ(rules[0].name, "BAYES_99");
    EXPECT_EQ(rules[0].description,
              "BODY: Bayes spam probability is 99 to 100% [score: 1.0000]");

    EXPECT_EQ(rules[1].name, "HTML_MESSAGE");
    EXPECT_DOUBLE_EQ(rules[1].score, 0.0);
    EXPECT_EQ(rules[2].description, "Missing Date: header");
    EXPECT_DOUBLE_EQ(rules[3].score, -0.1);
    EXPECT_EQ(rules[3].name, "DKIM_VALID");
}

TEST(ReportTest, NoTable) {
    EXPECT_TRUE(parse_report("").empty());
    EXPECT_TRUE(parse_report("just some text\nwithout a table\n").empty());
}

TEST(ReportTest, BareLineEndings) {
    auto rules = parse_report("---- ----\n 1.0 A_RULE   first\n 2.0 B_RULE   second\n");
    ASSERT_EQ(rules.size(), 2u);
    EXPECT_EQ(rules[1].name, "B_RULE");
    EXPECT_EQ(rules[1].description, "second");
}

TEST(HeaderBlockTest, ParsesAndUnfolds) {
    auto h = parse_header_block(
        "Received: from mx.example.com\r\n"
        "\tby mail.example.com\r\n"
        "Subject: hello\r\n"
        "X-Spam-Status: Yes, score=6.2\r\n"
        "  required=5.0\r\n"
        "\r\n"
        "body is ignored: really\r\n");
    ASSERT_EQ(h.size(), 3u);
    EXPECT_EQ(h.get("received"), "from mx.example.com by mail.example.com");
    EXPECT_EQ(h.get("Subject"), "hello");
    EXPECT_EQ(h.get("X-Spam-Status"), "Yes, score=6.2 required=5.0");
}

TEST(HeaderBlockTest, MissingColon) {
    try {
        parse_header_block("Subject: ok\r\nnot a header\r\n");
        FAIL() << "expected MalformedHeader";
    } catch (const SpamcError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::MalformedHeader);
    }
}

TEST(HeaderBlockTest, LeadingContinuation) {
    EXPECT_THROW(parse_header_block(" folded first\r\n"), SpamcError);
}

} // namespace
} // namespace spamc
