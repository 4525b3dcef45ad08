// include/spamc/results.hpp
// Typed results for the high-level commands, and the header/body parsers behind them.

#pragma once

#include "headers.hpp"
#include "message.hpp"
#include "types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace spamc {

// Value of the Spam header: "True ; 6.5 / 5.0".
struct SpamStatus {
    bool is_spam = false;
    double score = 0.0;
    double threshold = 0.0;
};

// One row of a REPORT rule table.
struct ReportRule {
    double score = 0.0;
    std::string name;
    std::string description;
};

struct CheckResult {
    SpamStatus spam;
    Response response;

    bool is_spam() const noexcept { return spam.is_spam; }
};

struct SymbolsResult {
    SpamStatus spam;
    std::vector<std::string> symbols;
    Response response;
};

struct ReportResult {
    SpamStatus spam;
    std::vector<ReportRule> details;
    // Body text as sent by the daemon; empty for REPORT_IFSPAM on ham.
    std::string report;
    Response response;
};

struct ProcessResult {
    SpamStatus spam;
    // Rewritten message.
    std::string message;
    Response response;
};

struct HeadersResult {
    SpamStatus spam;
    Headers headers;
    std::string raw_headers;
    Response response;
};

struct PingResult {
    bool pong = false;
    Response response;
};

struct TellResult {
    ActionOption did_set;
    ActionOption did_remove;
    Response response;
};

// --- Header values ---

// "True ; 6.5 / 5.0". True/False and Yes/No are accepted in any case.
std::optional<SpamStatus> parse_spam_header(const std::string& value);

// "local", "remote", "local, remote".
std::optional<ActionOption> parse_action(const std::string& value);
std::string format_action(const ActionOption& action);

std::optional<MessageClass> parse_message_class(const std::string& value);
const char* message_class_name(MessageClass message_class) noexcept;

// Spam header of `response`. Throws SpamcError (MalformedHeader) if it is
// missing or unparseable.
SpamStatus spam_status(const Response& response);

// --- Bodies ---

// SYMBOLS body: comma-separated rule names.
std::vector<std::string> parse_symbols(const std::string& body);

// REPORT body: the rule table below the " ---- ---" separator. Wrapped
// description lines are joined onto their rule.
std::vector<ReportRule> parse_report(const std::string& body);

// HEADERS body: an RFC 5322 header block. Folded lines are unfolded.
// Throws SpamcError (MalformedHeader) on a line with no colon.
Headers parse_header_block(const std::string& text);

} // namespace spamc
