// src/transport.hpp
// Socket transport: one TCP or Unix stream connection per instance.

#pragma once

#include "codec.hpp"
#include "spamc/cancel.hpp"
#include "spamc/error.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace spamc {

using Clock = std::chrono::steady_clock;
using Deadline = Clock::time_point;

// Parsed daemon address.
struct Address {
    enum class Kind : uint8_t {
        Tcp,
        Unix,
    };

    Kind kind = Kind::Tcp;
    std::string host;
    uint16_t port = 0;
    std::string path;

    // "host:port", "[v6addr]:port", "/path/to/socket" or "unix:/path".
    // Throws SpamcError (Configuration).
    static Address parse(const std::string& address);

    std::string to_string() const;
};

enum class TransportState : uint8_t {
    Idle,
    InUse,
    Closed,
};

class ConnectionPool;

// One connection to the daemon. Every failure closes the transport; a
// closed transport never reopens.
class Transport {
public:
    virtual ~Transport() = default;

    // Write all bytes. Throws SpamcError (Write, Timeout, Cancelled).
    virtual void send(const uint8_t* data, size_t len, Deadline deadline,
                      const CancellationToken& cancel) = 0;

    // Read until the decoder completes. Throws SpamcError (Timeout,
    // UnexpectedEof, Cancelled, Io, or whatever the decoder raises).
    virtual void receive(codec::FrameDecoder& decoder, Deadline deadline,
                         const CancellationToken& cancel) = 0;

    // Non-blocking liveness probe for idle connections.
    virtual bool alive() = 0;

    // Idempotent.
    virtual void close() noexcept = 0;

    TransportState state() const noexcept { return state_; }

    // False once the frame boundary with the peer is no longer known.
    bool reusable() const noexcept { return reusable_ && state_ != TransportState::Closed; }

protected:
    friend class ConnectionPool;

    TransportState state_ = TransportState::Idle;
    bool reusable_ = true;
};

// POSIX socket implementation. The descriptor stays non-blocking; every
// wait goes through poll() together with the cancellation descriptor.
class SocketTransport : public Transport {
public:
    // Throws SpamcError (Connection, including connect timeouts, or Cancelled).
    static std::unique_ptr<SocketTransport> connect(const Address& address, Deadline deadline,
                                                    const CancellationToken& cancel);

    ~SocketTransport() override;

    SocketTransport(const SocketTransport&) = delete;
    SocketTransport& operator=(const SocketTransport&) = delete;

    void send(const uint8_t* data, size_t len, Deadline deadline,
              const CancellationToken& cancel) override;
    void receive(codec::FrameDecoder& decoder, Deadline deadline,
                 const CancellationToken& cancel) override;
    bool alive() override;
    void close() noexcept override;

    int fd() const noexcept { return socket_fd_; }
    const std::string& peer() const noexcept { return peer_; }

private:
    SocketTransport(int fd, std::string peer) : socket_fd_(fd), peer_(std::move(peer)) {}

    enum class WaitResult : uint8_t {
        Ready,
        Timeout,
        Cancelled,
    };

    static WaitResult wait_fd(int fd, short events, Deadline deadline,
                              const CancellationToken& cancel);

    int socket_fd_ = -1;
    std::string peer_;
};

} // namespace spamc
