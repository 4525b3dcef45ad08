// src/message.cpp
// Request construction and validation.

#include "spamc/message.hpp"
#include "spamc/error.hpp"
#include "validation.hpp"

namespace spamc {

static void validate_header(const std::string& name, const std::string& value) {
    if (!validation::check_header_name(name)) {
        throw SpamcError::invalid_request("header name '" + name +
                                          "' is empty or contains ':', CR or LF");
    }
    if (!validation::check_header_value(value)) {
        throw SpamcError::invalid_header_value(name);
    }
}

Request Request::make(Command command, Headers headers, std::optional<Bytes> body,
                      std::string version, bool compress) {
    if (requires_body(command) && !body) {
        throw SpamcError::invalid_request(std::string(command_name(command)) + " requires a body");
    }
    if (!requires_body(command) && body) {
        throw SpamcError::invalid_request(std::string(command_name(command)) +
                                          " does not take a body");
    }
    if (!validation::check_version(version)) {
        throw SpamcError::invalid_request("protocol version must be <major>.<minor>, got '" +
                                          version + "'");
    }
    for (const auto& [name, value] : headers) {
        validate_header(name, value);
    }

    Request req;
    req.command_ = command;
    req.version_ = std::move(version);
    req.headers_ = std::move(headers);
    req.body_ = std::move(body);
    req.compress_ = compress && req.body_.has_value();
    return req;
}

Request Request::with_header(const std::string& name, const std::string& value) const {
    validate_header(name, value);
    Request copy = *this;
    copy.headers_.add(name, value);
    return copy;
}

std::optional<size_t> Response::content_length() const {
    auto value = headers.get(HeaderNames::CONTENT_LENGTH);
    // Same bound as the decoder: more digits could overflow size_t.
    if (!value || value->empty() || value->size() > 18) return std::nullopt;
    size_t n = 0;
    for (char c : *value) {
        if (c < '0' || c > '9') return std::nullopt;
        n = n * 10 + static_cast<size_t>(c - '0');
    }
    return n;
}

} // namespace spamc
