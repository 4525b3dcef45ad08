// include/spamc/message.hpp
// Request and response models.

#pragma once

#include "headers.hpp"
#include "types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace spamc {

using Bytes = std::vector<uint8_t>;

inline Bytes to_bytes(const std::string& s) { return Bytes(s.begin(), s.end()); }
inline std::string to_string(const Bytes& b) { return std::string(b.begin(), b.end()); }

static constexpr const char* DEFAULT_PROTOCOL_VERSION = "1.5";

// A validated SPAMC request. Immutable after construction.
class Request {
public:
    // Validate and build a request. Throws SpamcError:
    //   InvalidRequest      body given for a body-less command, body missing,
    //                       bad header name or bad version
    //   InvalidHeaderValue  header value contains CR or LF
    static Request make(Command command, Headers headers = Headers(),
                        std::optional<Bytes> body = std::nullopt,
                        std::string version = DEFAULT_PROTOCOL_VERSION,
                        bool compress = false);

    static Request make(Command command, Headers headers, const std::string& body,
                        std::string version = DEFAULT_PROTOCOL_VERSION,
                        bool compress = false) {
        return make(command, std::move(headers), to_bytes(body), std::move(version), compress);
    }

    Command command() const noexcept { return command_; }
    const std::string& version() const noexcept { return version_; }
    const Headers& headers() const noexcept { return headers_; }
    const std::optional<Bytes>& body() const noexcept { return body_; }
    bool compress() const noexcept { return compress_; }

    // Copy with one extra header, validated like make().
    Request with_header(const std::string& name, const std::string& value) const;

private:
    Request() = default;

    Command command_ = Command::Ping;
    std::string version_ = DEFAULT_PROTOCOL_VERSION;
    Headers headers_;
    std::optional<Bytes> body_;
    bool compress_ = false;
};

// A decoded SPAMD response.
struct Response {
    std::string version = DEFAULT_PROTOCOL_VERSION;
    int status_code = 0;
    std::string status_message;
    Headers headers;
    std::optional<Bytes> body;

    bool ok() const noexcept { return status_code == static_cast<int>(Status::Ok); }

    // Declared Content-length, if present and numeric.
    std::optional<size_t> content_length() const;

    std::string body_text() const { return body ? to_string(*body) : std::string(); }
};

} // namespace spamc
