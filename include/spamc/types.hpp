// include/spamc/types.hpp
// Protocol enums: commands, status codes, TELL options.

#pragma once

#include <cstdint>
#include <string>

namespace spamc {

// Commands understood by spamd.
enum class Command : uint8_t {
    Check,
    Symbols,
    Report,
    ReportIfSpam,
    Process,
    Headers,
    Ping,
    Tell,
};

// Wire name, e.g. "REPORT_IFSPAM".
const char* command_name(Command command) noexcept;

// Parse a wire name. Returns false for unknown commands.
bool parse_command(const std::string& name, Command& out) noexcept;

// Whether the request must carry a message body.
inline bool requires_body(Command command) noexcept {
    switch (command) {
        case Command::Ping:
            return false;
        case Command::Check:
        case Command::Symbols:
        case Command::Report:
        case Command::ReportIfSpam:
        case Command::Process:
        case Command::Headers:
        case Command::Tell:
            return true;
    }
    return true;
}

// Whether the daemon answers with a body.
inline bool response_has_body(Command command) noexcept {
    switch (command) {
        case Command::Symbols:
        case Command::Report:
        case Command::ReportIfSpam:
        case Command::Process:
        case Command::Headers:
            return true;
        case Command::Check:
        case Command::Ping:
        case Command::Tell:
            return false;
    }
    return false;
}

// spamd status codes (sysexits.h).
enum class Status : int {
    Ok          = 0,
    Usage       = 64,
    DataErr     = 65,
    NoInput     = 66,
    NoUser      = 67,
    NoHost      = 68,
    Unavailable = 69,
    Software    = 70,
    OsErr       = 71,
    OsFile      = 72,
    CantCreat   = 73,
    IoErr       = 74,
    TempFail    = 75,
    Protocol    = 76,
    NoPerm      = 77,
    Config      = 78,
    Timeout     = 79,
};

// "EX_OK", "EX_USAGE", ... or "UNKNOWN".
const char* status_name(int code) noexcept;

// Message-class header value.
enum class MessageClass : uint8_t {
    Spam,
    Ham,
};

// Value of Set/Remove/DidSet/DidRemove headers.
struct ActionOption {
    bool local = false;
    bool remote = false;

    bool any() const noexcept { return local || remote; }
    bool operator==(const ActionOption& o) const noexcept {
        return local == o.local && remote == o.remote;
    }
    bool operator!=(const ActionOption& o) const noexcept { return !(*this == o); }
};

// High-level TELL operations (spamc -L / -C).
enum class LearnType : uint8_t {
    Spam,    // learn as spam
    Ham,     // learn as ham
    Forget,  // forget a learned message
    Report,  // report spam to local and remote databases
    Revoke,  // revoke a spam report
};

// Header names used by the protocol.
struct HeaderNames {
    static constexpr const char* CONTENT_LENGTH = "Content-length";
    static constexpr const char* COMPRESS       = "Compress";
    static constexpr const char* USER           = "User";
    static constexpr const char* SPAM           = "Spam";
    static constexpr const char* MESSAGE_CLASS  = "Message-class";
    static constexpr const char* SET            = "Set";
    static constexpr const char* REMOVE         = "Remove";
    static constexpr const char* DID_SET        = "DidSet";
    static constexpr const char* DID_REMOVE     = "DidRemove";
};

} // namespace spamc
