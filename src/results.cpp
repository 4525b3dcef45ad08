// src/results.cpp
// Parsers for typed header values and command bodies.

#include "spamc/results.hpp"
#include "spamc/error.hpp"

#include <cstdlib>
#include <sstream>

namespace spamc {

static bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

static std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && is_space(s[begin])) begin++;
    while (end > begin && is_space(s[end - 1])) end--;
    return s.substr(begin, end - begin);
}

// Whole-string decimal. strtod alone would accept "1.5abc".
static bool parse_number(const std::string& text, double& out) {
    if (text.empty()) return false;
    const char* begin = text.c_str();
    char* end = nullptr;
    out = std::strtod(begin, &end);
    return end == begin + text.size();
}

// Split on '\n', dropping a trailing '\r' from each line.
static std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(std::move(line));
    }
    return lines;
}

// --- Header values ---

std::optional<SpamStatus> parse_spam_header(const std::string& value) {
    auto semi = value.find(';');
    if (semi == std::string::npos) return std::nullopt;
    auto slash = value.find('/', semi + 1);
    if (slash == std::string::npos) return std::nullopt;

    SpamStatus status;
    std::string flag = trim(value.substr(0, semi));
    if (iequals(flag, "true") || iequals(flag, "yes")) {
        status.is_spam = true;
    } else if (iequals(flag, "false") || iequals(flag, "no")) {
        status.is_spam = false;
    } else {
        return std::nullopt;
    }

    if (!parse_number(trim(value.substr(semi + 1, slash - semi - 1)), status.score)) {
        return std::nullopt;
    }
    if (!parse_number(trim(value.substr(slash + 1)), status.threshold)) {
        return std::nullopt;
    }
    return status;
}

std::optional<ActionOption> parse_action(const std::string& value) {
    ActionOption action;
    std::string token;
    std::istringstream in(value);
    size_t count = 0;
    while (std::getline(in, token, ',')) {
        token = trim(token);
        if (iequals(token, "local")) {
            action.local = true;
        } else if (iequals(token, "remote")) {
            action.remote = true;
        } else {
            return std::nullopt;
        }
        count++;
    }
    if (count == 0 || count > 2) return std::nullopt;
    return action;
}

std::string format_action(const ActionOption& action) {
    if (action.local && action.remote) return "local, remote";
    if (action.local) return "local";
    if (action.remote) return "remote";
    return "";
}

std::optional<MessageClass> parse_message_class(const std::string& value) {
    std::string v = trim(value);
    if (iequals(v, "spam")) return MessageClass::Spam;
    if (iequals(v, "ham")) return MessageClass::Ham;
    return std::nullopt;
}

const char* message_class_name(MessageClass message_class) noexcept {
    switch (message_class) {
        case MessageClass::Spam: return "spam";
        case MessageClass::Ham:  return "ham";
    }
    return "ham";
}

SpamStatus spam_status(const Response& response) {
    auto value = response.headers.get(HeaderNames::SPAM);
    if (!value) {
        throw SpamcError::malformed_header("response has no Spam header");
    }
    auto status = parse_spam_header(*value);
    if (!status) {
        throw SpamcError::malformed_header("Spam header is not '<bool> ; <score> / <threshold>': " +
                                           *value);
    }
    return *status;
}

// --- Bodies ---

std::vector<std::string> parse_symbols(const std::string& body) {
    std::vector<std::string> symbols;
    std::istringstream in(body);
    std::string token;
    while (std::getline(in, token, ',')) {
        token = trim(token);
        if (!token.empty()) symbols.push_back(std::move(token));
    }
    return symbols;
}

std::vector<ReportRule> parse_report(const std::string& body) {
    std::vector<ReportRule> rules;
    bool in_table = false;

    for (const auto& line : split_lines(body)) {
        if (!in_table) {
            if (line.compare(0, 4, "----") == 0) in_table = true;
            continue;
        }

        std::string trimmed = trim(line);
        if (trimmed.empty()) {
            if (!rules.empty()) break;
            continue;
        }

        std::istringstream fields(trimmed);
        std::string first;
        fields >> first;

        double score = 0.0;
        if (parse_number(first, score)) {
            ReportRule rule;
            rule.score = score;
            fields >> rule.name;
            std::string rest;
            std::getline(fields, rest);
            rule.description = trim(rest);
            rules.push_back(std::move(rule));
        } else if (!rules.empty() && is_space(line[0])) {
            auto& description = rules.back().description;
            if (!description.empty()) description += ' ';
            description += trimmed;
        } else {
            break;
        }
    }
    return rules;
}

Headers parse_header_block(const std::string& text) {
    Headers headers;
    for (const auto& line : split_lines(text)) {
        if (line.empty()) break;

        if (line[0] == ' ' || line[0] == '\t') {
            if (headers.empty()) {
                throw SpamcError::malformed_header("continuation line before any header: " + line);
            }
            auto& value = headers.back().second;
            std::string folded = trim(line);
            if (!folded.empty()) {
                if (!value.empty()) value += ' ';
                value += folded;
            }
            continue;
        }

        auto colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            throw SpamcError::malformed_header("missing ':' in " + line);
        }
        headers.add(trim(line.substr(0, colon)), trim(line.substr(colon + 1)));
    }
    return headers;
}

} // namespace spamc
