// src/codec.cpp
// SPAMC/SPAMD wire codec.

#include "codec.hpp"
#include "validation.hpp"

#include <algorithm>
#include <exception>

namespace spamc {
namespace codec {

// --- Helpers ---

static inline void append_str(Bytes& buf, const std::string& s) {
    buf.insert(buf.end(), s.begin(), s.end());
}

static inline void append_lit(Bytes& buf, const char* s, size_t n) {
    buf.insert(buf.end(), reinterpret_cast<const uint8_t*>(s),
               reinterpret_cast<const uint8_t*>(s) + n);
}

static inline void append_header(Bytes& buf, const std::string& name, const std::string& value) {
    append_str(buf, name);
    append_lit(buf, ": ", 2);
    append_str(buf, value);
    append_lit(buf, "\r\n", 2);
}

static inline bool is_space(char c) { return c == ' ' || c == '\t'; }
static inline bool is_digit(char c) { return c >= '0' && c <= '9'; }

static std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && is_space(s[b])) b++;
    while (e > b && is_space(s[e - 1])) e--;
    return s.substr(b, e - b);
}

// Quote a line for error messages, truncated.
static std::string quoted(const std::string& line) {
    constexpr size_t max_shown = 80;
    if (line.size() <= max_shown) return "'" + line + "'";
    return "'" + line.substr(0, max_shown) + "...'";
}

// "<PROTO>/<d+.d+>" at the start of `s`; returns the version or nullopt.
static std::optional<std::string> parse_protocol(const std::string& s, const char* proto) {
    std::string prefix = std::string(proto) + "/";
    if (s.compare(0, prefix.size(), prefix) != 0) return std::nullopt;
    std::string version = s.substr(prefix.size());
    if (!validation::check_version(version)) return std::nullopt;
    return version;
}

static Bytes run_hook(const Compressor::Transform& hook, const Bytes& in, const char* what) {
    try {
        return hook(in);
    } catch (const SpamcError&) {
        throw;
    } catch (const std::exception& e) {
        throw SpamcError::compression(std::string(what) + " failed: " + e.what());
    }
}

// --- Encoding ---

void encode_request_into(Bytes& buf, const Request& request, const Compressor* compressor) {
    const bool compress = request.compress() && request.body().has_value();

    append_str(buf, command_name(request.command()));
    buf.push_back(' ');
    append_str(buf, REQUEST_PROTOCOL);
    buf.push_back('/');
    append_str(buf, request.version());
    append_lit(buf, "\r\n", 2);

    for (const auto& [name, value] : request.headers()) {
        if (iequals(name, HeaderNames::CONTENT_LENGTH)) {
            throw SpamcError::encode("Content-length is computed from the body and cannot be set");
        }
        if (compress && iequals(name, HeaderNames::COMPRESS)) {
            throw SpamcError::encode("Compress is set by the compressor and cannot be set");
        }
        append_header(buf, name, value);
    }

    if (request.body()) {
        const Bytes* payload = &*request.body();
        Bytes compressed;
        if (compress) {
            if (compressor == nullptr || !compressor->valid()) {
                throw SpamcError::encode("compression requested but no compressor is configured");
            }
            compressed = run_hook(compressor->compress, *payload, "compress");
            payload = &compressed;
            append_header(buf, HeaderNames::COMPRESS, compressor->token);
        }
        append_header(buf, HeaderNames::CONTENT_LENGTH, std::to_string(payload->size()));
        append_lit(buf, "\r\n", 2);
        buf.insert(buf.end(), payload->begin(), payload->end());
    } else {
        append_lit(buf, "\r\n", 2);
    }
}

Bytes encode_response(const Response& response) {
    Bytes buf;
    append_str(buf, RESPONSE_PROTOCOL);
    buf.push_back('/');
    append_str(buf, response.version);
    buf.push_back(' ');
    append_str(buf, std::to_string(response.status_code));
    buf.push_back(' ');
    append_str(buf, response.status_message);
    append_lit(buf, "\r\n", 2);

    for (const auto& [name, value] : response.headers) {
        append_header(buf, name, value);
    }
    if (response.body && !response.headers.contains(HeaderNames::CONTENT_LENGTH)) {
        append_header(buf, HeaderNames::CONTENT_LENGTH, std::to_string(response.body->size()));
    }
    append_lit(buf, "\r\n", 2);
    if (response.body) buf.insert(buf.end(), response.body->begin(), response.body->end());
    return buf;
}

// --- FrameDecoder ---

DecodeStatus FrameDecoder::feed(const uint8_t* data, size_t len) {
    if (state_ == State::Failed) {
        throw SpamcError::io("decoder used after a decode failure");
    }

    const uint8_t* p = data;
    const uint8_t* end = data + len;

    try {
        while (p < end && state_ != State::Complete) {
            switch (state_) {
                case State::StartLine:
                    if (take_line(p, end)) on_start_line();
                    break;
                case State::Headers:
                    if (take_line(p, end)) on_header_line();
                    break;
                case State::Body: {
                    size_t n = std::min(remaining_, static_cast<size_t>(end - p));
                    body_->insert(body_->end(), p, p + n);
                    p += n;
                    remaining_ -= n;
                    if (remaining_ == 0) on_complete();
                    break;
                }
                case State::BodyUntilClose:
                    body_->insert(body_->end(), p, end);
                    p = end;
                    break;
                case State::Complete:
                case State::Failed:
                    break;
            }
        }
    } catch (...) {
        state_ = State::Failed;
        throw;
    }

    consumed_ += static_cast<size_t>(p - data);
    trailing_ += static_cast<size_t>(end - p);
    return state_ == State::Complete ? DecodeStatus::Complete : DecodeStatus::NeedMore;
}

DecodeStatus FrameDecoder::finish() {
    try {
        return finish_frame();
    } catch (...) {
        state_ = State::Failed;
        throw;
    }
}

DecodeStatus FrameDecoder::finish_frame() {
    switch (state_) {
        case State::Complete:
            return DecodeStatus::Complete;
        case State::BodyUntilClose:
            // Nothing after the blank line means no body, unlike an explicit
            // "Content-length: 0".
            if (body_ && body_->empty()) body_.reset();
            on_complete();
            return DecodeStatus::Complete;
        case State::Headers: {
            // spamd may close right after the header block (or status line)
            // without the blank line when there is no body to follow.
            auto declared = declared_length();
            if (line_.empty() && (!declared || *declared == 0)) {
                if (declared) body_ = Bytes();
                on_complete();
                return DecodeStatus::Complete;
            }
            throw SpamcError::unexpected_eof("connection closed inside the header block");
        }
        case State::Body: {
            size_t got = body_ ? body_->size() : 0;
            throw SpamcError::unexpected_eof("expected " + std::to_string(got + remaining_) +
                                             " body bytes, received " + std::to_string(got));
        }
        case State::StartLine:
            throw SpamcError::unexpected_eof(line_.empty()
                                                 ? "connection closed before the status line"
                                                 : "connection closed inside the status line");
        case State::Failed:
            break;
    }
    throw SpamcError::io("decoder used after a decode failure");
}

// Accumulate up to and including '\n'. Returns true with line_ holding the
// line (terminator stripped) when one is complete.
bool FrameDecoder::take_line(const uint8_t*& p, const uint8_t* end) {
    const uint8_t* nl = std::find(p, end, static_cast<uint8_t>('\n'));
    line_.append(reinterpret_cast<const char*>(p), static_cast<size_t>(nl - p));
    if (line_.size() > MAX_LINE_LENGTH) {
        if (state_ == State::StartLine) {
            throw start_line_error("line exceeds " + std::to_string(MAX_LINE_LENGTH) + " bytes");
        }
        throw SpamcError::malformed_header("line exceeds " + std::to_string(MAX_LINE_LENGTH) +
                                           " bytes");
    }
    if (nl == end) {
        p = end;
        return false;
    }
    p = nl + 1;
    if (!line_.empty() && line_.back() == '\r') line_.pop_back();
    return true;
}

void FrameDecoder::on_start_line() {
    std::string line;
    line.swap(line_);
    parse_start_line(line);
    state_ = State::Headers;
}

void FrameDecoder::on_header_line() {
    std::string line;
    line.swap(line_);

    if (line.empty()) {
        on_headers_done();
        return;
    }

    // Folded continuation of the previous header.
    if (is_space(line[0])) {
        if (headers_.empty()) {
            throw SpamcError::malformed_header("continuation line before any header: " +
                                               quoted(line));
        }
        std::string more = trim(line);
        auto& last = headers_.back();
        if (!more.empty()) {
            if (!last.second.empty()) last.second.push_back(' ');
            last.second += more;
        }
        return;
    }

    auto colon = line.find(':');
    if (colon == std::string::npos) {
        throw SpamcError::malformed_header("missing ':' in " + quoted(line));
    }
    std::string name = trim(line.substr(0, colon));
    if (!validation::check_header_name(name) ||
        name.find_first_of(" \t") != std::string::npos) {
        throw SpamcError::malformed_header("bad header name in " + quoted(line));
    }
    headers_.add(std::move(name), trim(line.substr(colon + 1)));
}

std::optional<size_t> FrameDecoder::declared_length() const {
    std::optional<size_t> declared;
    for (const auto& value : headers_.get_all(HeaderNames::CONTENT_LENGTH)) {
        if (value.empty() || value.size() > 18 ||
            !std::all_of(value.begin(), value.end(), is_digit)) {
            throw SpamcError::malformed_header("Content-length is not a byte count: " +
                                               quoted(value));
        }
        size_t n = std::stoull(value);
        if (declared && *declared != n) {
            throw SpamcError::malformed_header("conflicting Content-length headers");
        }
        declared = n;
    }
    return declared;
}

void FrameDecoder::on_headers_done() {
    auto declared = declared_length();
    if (declared) {
        body_ = Bytes();
        // Cap the up-front reservation; the declared length is untrusted.
        body_->reserve(std::min<size_t>(*declared, 1024 * 1024));
        remaining_ = *declared;
        if (remaining_ == 0) {
            on_complete();
        } else {
            state_ = State::Body;
        }
        return;
    }

    if (policy_ == BodyPolicy::UntilClose) {
        body_ = Bytes();
        state_ = State::BodyUntilClose;
    } else {
        on_complete();
    }
}

void FrameDecoder::on_complete() {
    auto token = headers_.get(HeaderNames::COMPRESS);
    if (token && body_) {
        if (compressor_ == nullptr || !compressor_->decompress) {
            throw SpamcError::compression("body is compressed with '" + *token +
                                          "' but no decompressor is configured");
        }
        if (!iequals(*token, compressor_->token)) {
            throw SpamcError::compression("unsupported compression '" + *token + "'");
        }
        body_ = run_hook(compressor_->decompress, *body_, "decompress");
    }
    state_ = State::Complete;
}

// --- ResponseDecoder ---

void ResponseDecoder::parse_start_line(const std::string& line) {
    // SPAMD/<version> <code> <message>
    auto sp = line.find_first_of(" \t");
    if (sp == std::string::npos) {
        throw SpamcError::malformed_status_line(quoted(line));
    }
    auto version = parse_protocol(line.substr(0, sp), RESPONSE_PROTOCOL);
    if (!version) {
        throw SpamcError::malformed_status_line("expected SPAMD/<version> in " + quoted(line));
    }

    size_t i = sp;
    while (i < line.size() && is_space(line[i])) i++;
    size_t code_start = i;
    while (i < line.size() && is_digit(line[i])) i++;
    if (i == code_start || i - code_start > 9 || (i < line.size() && !is_space(line[i]))) {
        throw SpamcError::malformed_status_line("status code is not a number in " +
                                                quoted(line));
    }

    response_.version = *version;
    response_.status_code = std::stoi(line.substr(code_start, i - code_start));
    response_.status_message = trim(line.substr(i));
}

const Response& ResponseDecoder::response() {
    if (!complete()) {
        throw SpamcError::io("response requested before the frame was complete");
    }
    if (frame_body() || !frame_headers().empty()) {
        response_.headers = std::move(frame_headers());
        response_.body = std::move(frame_body());
        frame_headers().clear();
        frame_body().reset();
    }
    return response_;
}

Response ResponseDecoder::take_response() {
    response();
    return std::move(response_);
}

// --- RequestDecoder ---

void RequestDecoder::parse_start_line(const std::string& line) {
    // <COMMAND> SPAMC/<version>
    auto sp = line.find_first_of(" \t");
    if (sp == std::string::npos) {
        throw SpamcError::malformed_status_line(quoted(line));
    }
    if (!parse_command(line.substr(0, sp), command_)) {
        throw SpamcError::malformed_status_line("unknown command in " + quoted(line));
    }
    auto version = parse_protocol(trim(line.substr(sp)), REQUEST_PROTOCOL);
    if (!version) {
        throw SpamcError::malformed_status_line("expected SPAMC/<version> in " + quoted(line));
    }
    version_ = *version;
}

Request RequestDecoder::request() {
    if (!complete()) {
        throw SpamcError::io("request requested before the frame was complete");
    }
    return Request::make(command_, frame_headers(), frame_body(), version_);
}

} // namespace codec
} // namespace spamc
