// src/types.cpp
// Name tables for protocol enums.

#include "spamc/error.hpp"
#include "spamc/types.hpp"

namespace spamc {

const char* command_name(Command command) noexcept {
    switch (command) {
        case Command::Check:        return "CHECK";
        case Command::Symbols:      return "SYMBOLS";
        case Command::Report:       return "REPORT";
        case Command::ReportIfSpam: return "REPORT_IFSPAM";
        case Command::Process:      return "PROCESS";
        case Command::Headers:      return "HEADERS";
        case Command::Ping:         return "PING";
        case Command::Tell:         return "TELL";
    }
    return "UNKNOWN";
}

bool parse_command(const std::string& name, Command& out) noexcept {
    static const Command all[] = {
        Command::Check, Command::Symbols, Command::Report, Command::ReportIfSpam,
        Command::Process, Command::Headers, Command::Ping, Command::Tell,
    };
    for (Command c : all) {
        if (name == command_name(c)) {
            out = c;
            return true;
        }
    }
    return false;
}

const char* status_name(int code) noexcept {
    switch (static_cast<Status>(code)) {
        case Status::Ok:          return "EX_OK";
        case Status::Usage:       return "EX_USAGE";
        case Status::DataErr:     return "EX_DATAERR";
        case Status::NoInput:     return "EX_NOINPUT";
        case Status::NoUser:      return "EX_NOUSER";
        case Status::NoHost:      return "EX_NOHOST";
        case Status::Unavailable: return "EX_UNAVAILABLE";
        case Status::Software:    return "EX_SOFTWARE";
        case Status::OsErr:       return "EX_OSERR";
        case Status::OsFile:      return "EX_OSFILE";
        case Status::CantCreat:   return "EX_CANTCREAT";
        case Status::IoErr:       return "EX_IOERR";
        case Status::TempFail:    return "EX_TEMPFAIL";
        case Status::Protocol:    return "EX_PROTOCOL";
        case Status::NoPerm:      return "EX_NOPERM";
        case Status::Config:      return "EX_CONFIG";
        case Status::Timeout:     return "EX_TIMEOUT";
    }
    return "UNKNOWN";
}

const char* error_kind_name(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidRequest:      return "InvalidRequest";
        case ErrorKind::InvalidHeaderValue:  return "InvalidHeaderValue";
        case ErrorKind::Encode:              return "Encode";
        case ErrorKind::Configuration:       return "Configuration";
        case ErrorKind::Connection:          return "Connection";
        case ErrorKind::Write:               return "Write";
        case ErrorKind::Timeout:             return "Timeout";
        case ErrorKind::UnexpectedEof:       return "UnexpectedEof";
        case ErrorKind::MalformedStatusLine: return "MalformedStatusLine";
        case ErrorKind::MalformedHeader:     return "MalformedHeader";
        case ErrorKind::Compression:         return "Compression";
        case ErrorKind::Daemon:              return "Daemon";
        case ErrorKind::PoolExhausted:       return "PoolExhausted";
        case ErrorKind::Cancelled:           return "Cancelled";
        case ErrorKind::Closed:              return "Closed";
        case ErrorKind::Io:                  return "Io";
    }
    return "Unknown";
}

} // namespace spamc
