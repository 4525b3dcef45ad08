// src/codec.hpp
// SPAMC/SPAMD wire codec: request encoder and incremental frame decoders.

#pragma once

#include "spamc/config.hpp"
#include "spamc/error.hpp"
#include "spamc/message.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace spamc {
namespace codec {

static constexpr const char* REQUEST_PROTOCOL = "SPAMC";
static constexpr const char* RESPONSE_PROTOCOL = "SPAMD";
static constexpr size_t MAX_LINE_LENGTH = 64 * 1024;

// --- Encoding ---

// Append the wire form of `request` to buf:
//   <COMMAND> SPAMC/<version>\r\n
//   <Name>: <Value>\r\n            (caller headers, in order)
//   Compress: <token>\r\n          (when compression is requested)
//   Content-length: <n>\r\n        (when a body is present)
//   \r\n
//   <body>
// Throws SpamcError (Encode) when a caller header collides with a computed one.
void encode_request_into(Bytes& buf, const Request& request, const Compressor* compressor = nullptr);

inline Bytes encode_request(const Request& request, const Compressor* compressor = nullptr) {
    Bytes buf;
    encode_request_into(buf, request, compressor);
    return buf;
}

// Daemon-direction framing. Headers are written verbatim; Content-length is
// added only when a body is present and none was given.
Bytes encode_response(const Response& response);

// --- Decoding ---

enum class DecodeStatus : uint8_t {
    NeedMore,
    Complete,
};

// What to do with a frame that has no Content-length header.
enum class BodyPolicy : uint8_t {
    UntilClose,  // body runs until the peer closes
    None,        // frame ends at the blank line
};

// Resumable header/body state machine shared by both directions.
// Feed it arbitrary chunks; call finish() when the peer closes.
// Any SpamcError thrown leaves the decoder failed.
class FrameDecoder {
public:
    virtual ~FrameDecoder() = default;

    FrameDecoder(const FrameDecoder&) = delete;
    FrameDecoder& operator=(const FrameDecoder&) = delete;

    DecodeStatus feed(const uint8_t* data, size_t len);
    DecodeStatus feed(const Bytes& data) { return feed(data.data(), data.size()); }
    DecodeStatus feed(const std::string& data) {
        return feed(reinterpret_cast<const uint8_t*>(data.data()), data.size());
    }

    // Peer closed. Returns Complete or throws SpamcError (UnexpectedEof).
    DecodeStatus finish();

    bool complete() const noexcept { return state_ == State::Complete; }

    // Bytes received after the frame completed.
    size_t trailing_bytes() const noexcept { return trailing_; }
    size_t bytes_consumed() const noexcept { return consumed_; }

protected:
    FrameDecoder(BodyPolicy policy, const Compressor* compressor)
        : policy_(policy), compressor_(compressor) {}

    virtual void parse_start_line(const std::string& line) = 0;
    virtual SpamcError start_line_error(std::string msg) const = 0;

    Headers& frame_headers() { return headers_; }
    std::optional<Bytes>& frame_body() { return body_; }

private:
    enum class State : uint8_t {
        StartLine,
        Headers,
        Body,
        BodyUntilClose,
        Complete,
        Failed,
    };

    DecodeStatus finish_frame();
    bool take_line(const uint8_t*& p, const uint8_t* end);
    void on_start_line();
    void on_header_line();
    void on_headers_done();
    void on_complete();
    std::optional<size_t> declared_length() const;

    State state_ = State::StartLine;
    BodyPolicy policy_;
    const Compressor* compressor_;
    std::string line_;
    size_t remaining_ = 0;
    size_t trailing_ = 0;
    size_t consumed_ = 0;
    Headers headers_;
    std::optional<Bytes> body_;
};

// Decodes "SPAMD/<version> <code> <message>" responses.
class ResponseDecoder : public FrameDecoder {
public:
    explicit ResponseDecoder(BodyPolicy policy = BodyPolicy::UntilClose,
                             const Compressor* compressor = nullptr)
        : FrameDecoder(policy, compressor) {}

    // Valid once complete().
    const Response& response();
    Response take_response();

protected:
    void parse_start_line(const std::string& line) override;
    SpamcError start_line_error(std::string msg) const override {
        return SpamcError::malformed_status_line(std::move(msg));
    }

private:
    Response response_;
};

// Decodes "<COMMAND> SPAMC/<version>" requests. Decoded requests keep the
// wire headers, including Content-length.
class RequestDecoder : public FrameDecoder {
public:
    explicit RequestDecoder(const Compressor* compressor = nullptr)
        : FrameDecoder(BodyPolicy::None, compressor) {}

    // Valid once complete(). Throws SpamcError if the request is not well-formed.
    Request request();

protected:
    void parse_start_line(const std::string& line) override;
    SpamcError start_line_error(std::string msg) const override {
        return SpamcError::malformed_status_line(std::move(msg));
    }

private:
    Command command_ = Command::Ping;
    std::string version_;
};

} // namespace codec
} // namespace spamc
