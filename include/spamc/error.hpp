// include/spamc/error.hpp
// Error handling: single exception class with kind enum.

#pragma once

#include <string>
#include <stdexcept>

namespace spamc {

enum class ErrorKind {
    InvalidRequest,       // Request violates protocol shape (never sent)
    InvalidHeaderValue,   // Header value would break line framing
    Encode,               // Request could not be serialized
    Configuration,        // Invalid config or address
    Connection,           // Transport could not be established (retried)
    Write,                // Send failed mid-exchange
    Timeout,              // Deadline elapsed
    UnexpectedEof,        // Peer closed before the frame was complete
    MalformedStatusLine,  // Unparseable status/request line
    MalformedHeader,      // Unparseable header line
    Compression,          // Compression hook missing or failed
    Daemon,               // Well-formed response with non-zero status
    PoolExhausted,        // Admission control rejected the exchange
    Cancelled,            // Caller cancelled the exchange
    Closed,               // Client or pool already closed
    Io                    // System I/O error while receiving
};

const char* error_kind_name(ErrorKind kind) noexcept;

class SpamcError : public std::exception {
public:
    SpamcError(ErrorKind kind, std::string message)
        : kind_(kind), message_(std::move(message)) {}

    const char* what() const noexcept override { return message_.c_str(); }
    ErrorKind kind() const noexcept { return kind_; }
    const std::string& message() const noexcept { return message_; }
    const std::string& command() const noexcept { return command_; }
    const std::string& address() const noexcept { return address_; }

    // Daemon status code; -1 unless kind() == ErrorKind::Daemon.
    int status_code() const noexcept { return status_code_; }

    bool is_protocol_error() const noexcept {
        return kind_ == ErrorKind::MalformedStatusLine || kind_ == ErrorKind::MalformedHeader ||
               kind_ == ErrorKind::Compression;
    }

    // Connection may be reused after this error.
    bool connection_reusable() const noexcept { return kind_ == ErrorKind::Daemon; }

    // Copy with exchange context attached; existing context is kept.
    SpamcError with_context(const std::string& command, const std::string& address) const {
        SpamcError copy = *this;
        if (copy.command_.empty() && !command.empty()) {
            copy.command_ = command;
            copy.message_ += " [" + command;
            copy.message_ += address.empty() ? "]" : " @ " + address + "]";
            copy.address_ = address;
        }
        return copy;
    }

    static SpamcError invalid_request(std::string msg) {
        return SpamcError(ErrorKind::InvalidRequest, "invalid request: " + msg);
    }

    static SpamcError invalid_header_value(const std::string& name) {
        return SpamcError(ErrorKind::InvalidHeaderValue,
                          "invalid header value: " + name + " contains CR or LF");
    }

    static SpamcError encode(std::string msg) {
        return SpamcError(ErrorKind::Encode, "encode error: " + msg);
    }

    static SpamcError configuration(std::string msg) {
        return SpamcError(ErrorKind::Configuration, "configuration error: " + msg);
    }

    static SpamcError connection(std::string msg) {
        return SpamcError(ErrorKind::Connection, "connection error: " + msg);
    }

    static SpamcError write(std::string msg) {
        return SpamcError(ErrorKind::Write, "write error: " + msg);
    }

    static SpamcError timeout(std::string msg) {
        return SpamcError(ErrorKind::Timeout, "timeout: " + msg);
    }

    static SpamcError unexpected_eof(std::string msg) {
        return SpamcError(ErrorKind::UnexpectedEof, "unexpected eof: " + msg);
    }

    static SpamcError malformed_status_line(std::string msg) {
        return SpamcError(ErrorKind::MalformedStatusLine, "malformed status line: " + msg);
    }

    static SpamcError malformed_header(std::string msg) {
        return SpamcError(ErrorKind::MalformedHeader, "malformed header: " + msg);
    }

    static SpamcError compression(std::string msg) {
        return SpamcError(ErrorKind::Compression, "compression error: " + msg);
    }

    static SpamcError daemon(int status_code, const std::string& status_message) {
        SpamcError err(ErrorKind::Daemon, "daemon error: " + std::to_string(status_code) + " " +
                                              status_message);
        err.status_code_ = status_code;
        return err;
    }

    static SpamcError pool_exhausted(const std::string& address, size_t max_connections) {
        return SpamcError(ErrorKind::PoolExhausted,
                          "pool exhausted: " + std::to_string(max_connections) +
                              " connections in use for " + address);
    }

    static SpamcError cancelled() {
        return SpamcError(ErrorKind::Cancelled, "exchange cancelled");
    }

    static SpamcError closed() {
        return SpamcError(ErrorKind::Closed, "client is closed");
    }

    static SpamcError io(std::string msg) {
        return SpamcError(ErrorKind::Io, "io error: " + msg);
    }

private:
    ErrorKind kind_;
    std::string message_;
    std::string command_;
    std::string address_;
    int status_code_ = -1;
};

} // namespace spamc
