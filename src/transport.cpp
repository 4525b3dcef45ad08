// src/transport.cpp
// TCP and Unix socket transport.

#include "transport.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>

// POSIX sockets
#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace spamc {

static constexpr size_t READ_CHUNK = 16 * 1024;

static std::string errno_string(int err) {
    return std::strerror(err);
}

// --- Address ---

Address Address::parse(const std::string& address) {
    Address result;

    if (address.rfind("unix:", 0) == 0 || (!address.empty() && address[0] == '/')) {
        result.kind = Kind::Unix;
        result.path = address[0] == '/' ? address : address.substr(5);
        if (result.path.empty()) {
            throw SpamcError::configuration("unix socket path is empty");
        }
        if (result.path.size() >= sizeof(sockaddr_un{}.sun_path)) {
            throw SpamcError::configuration("unix socket path is too long: " + result.path);
        }
        return result;
    }

    // Parse host:port
    auto colon = address.rfind(':');
    if (colon == std::string::npos) {
        throw SpamcError::configuration("address must be host:port or a socket path, got: " +
                                        address);
    }
    std::string host = address.substr(0, colon);
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    if (host.empty()) {
        throw SpamcError::configuration("address host is empty: " + address);
    }

    std::string port_str = address.substr(colon + 1);
    int port_int = 0;
    try {
        size_t used = 0;
        port_int = std::stoi(port_str, &used);
        if (used != port_str.size()) port_int = -1;
    } catch (const std::exception&) {
        throw SpamcError::configuration("address port is not a valid number: " + address);
    }
    if (port_int <= 0 || port_int > 65535) {
        throw SpamcError::configuration("address port must be 1-65535, got: " + port_str);
    }

    result.kind = Kind::Tcp;
    result.host = std::move(host);
    result.port = static_cast<uint16_t>(port_int);
    return result;
}

std::string Address::to_string() const {
    if (kind == Kind::Unix) return "unix:" + path;
    if (host.find(':') != std::string::npos) {
        return "[" + host + "]:" + std::to_string(port);
    }
    return host + ":" + std::to_string(port);
}

// --- Socket helpers ---

static bool set_nonblocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0) return false;
    return ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

static void configure_tcp_socket(int fd) {
    int nodelay = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));

    int keepalive = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &keepalive, sizeof(keepalive));
}

SocketTransport::WaitResult SocketTransport::wait_fd(int fd, short events, Deadline deadline,
                                                     const CancellationToken& cancel) {
    struct pollfd pfds[2]{};
    pfds[0].fd = fd;
    pfds[0].events = events;
    nfds_t count = 1;
    if (cancel.wait_fd() >= 0) {
        pfds[1].fd = cancel.wait_fd();
        pfds[1].events = POLLIN;
        count = 2;
    }

    for (;;) {
        if (cancel.cancelled()) return WaitResult::Cancelled;

        auto now = Clock::now();
        if (now >= deadline) return WaitResult::Timeout;
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        // Round up so a sub-millisecond remainder does not spin.
        int timeout_ms = static_cast<int>(std::min<int64_t>(remaining.count() + 1, 60000));

        int ret = ::poll(pfds, count, timeout_ms);
        if (ret < 0) {
            if (errno == EINTR) continue;
            // poll itself failing leaves nothing to wait on; let the caller's
            // next syscall report the socket error.
            return WaitResult::Ready;
        }
        if (ret == 0) continue;
        if (count == 2 && (pfds[1].revents & POLLIN)) return WaitResult::Cancelled;
        if (pfds[0].revents != 0) return WaitResult::Ready;
    }
}

// --- SocketTransport ---

std::unique_ptr<SocketTransport> SocketTransport::connect(const Address& address,
                                                          Deadline deadline,
                                                          const CancellationToken& cancel) {
    cancel.throw_if_cancelled();
    const std::string peer = address.to_string();

    // Try one resolved address. Returns the fd or -1 with last_error set.
    auto attempt = [&](int family, int socktype, int protocol, const sockaddr* addr,
                       socklen_t addrlen, std::string& last_error) -> int {
        int fd = ::socket(family, socktype | SOCK_CLOEXEC, protocol);
        if (fd < 0) {
            last_error = errno_string(errno);
            return -1;
        }
        if (!set_nonblocking(fd)) {
            last_error = errno_string(errno);
            ::close(fd);
            return -1;
        }

        int ret;
        do {
            ret = ::connect(fd, addr, addrlen);
        } while (ret < 0 && errno == EINTR);
        if (ret == 0) return fd;

        if (errno != EINPROGRESS) {
            last_error = errno_string(errno);
            ::close(fd);
            return -1;
        }

        // Wait for connection with timeout
        switch (wait_fd(fd, POLLOUT, deadline, cancel)) {
            case WaitResult::Timeout:
                ::close(fd);
                throw SpamcError::connection("connect to " + peer + " timed out");
            case WaitResult::Cancelled:
                ::close(fd);
                throw SpamcError::cancelled();
            case WaitResult::Ready:
                break;
        }

        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0) {
            so_error = errno;
        }
        if (so_error != 0) {
            last_error = errno_string(so_error);
            ::close(fd);
            return -1;
        }
        return fd;
    };

    std::string last_error = "no usable address";

    if (address.kind == Address::Kind::Unix) {
        sockaddr_un unix_addr{};
        unix_addr.sun_family = AF_UNIX;
        std::memcpy(unix_addr.sun_path, address.path.c_str(), address.path.size());
        int fd = attempt(AF_UNIX, SOCK_STREAM, 0, reinterpret_cast<const sockaddr*>(&unix_addr),
                         sizeof(unix_addr), last_error);
        if (fd < 0) {
            throw SpamcError::connection("connect failed to " + peer + ": " + last_error);
        }
        spdlog::debug("spamc: connected to {}", peer);
        return std::unique_ptr<SocketTransport>(new SocketTransport(fd, peer));
    }

    struct addrinfo hints{}, *res = nullptr;
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    auto port_str = std::to_string(address.port);
    int err = ::getaddrinfo(address.host.c_str(), port_str.c_str(), &hints, &res);
    if (err != 0 || res == nullptr) {
        throw SpamcError::connection("DNS resolution failed for " + address.host + ": " +
                                     ::gai_strerror(err));
    }

    // Try each resolved address (IPv6/IPv4) until one connects.
    int fd = -1;
    try {
        for (struct addrinfo* rp = res; rp != nullptr && fd < 0; rp = rp->ai_next) {
            fd = attempt(rp->ai_family, rp->ai_socktype, rp->ai_protocol, rp->ai_addr,
                         rp->ai_addrlen, last_error);
        }
    } catch (...) {
        ::freeaddrinfo(res);
        throw;
    }
    ::freeaddrinfo(res);

    if (fd < 0) {
        throw SpamcError::connection("connect failed to " + peer + ": " + last_error);
    }
    configure_tcp_socket(fd);
    spdlog::debug("spamc: connected to {}", peer);
    return std::unique_ptr<SocketTransport>(new SocketTransport(fd, peer));
}

SocketTransport::~SocketTransport() {
    close();
}

void SocketTransport::close() noexcept {
    if (socket_fd_ >= 0) {
        ::close(socket_fd_);
        socket_fd_ = -1;
    }
    state_ = TransportState::Closed;
}

void SocketTransport::send(const uint8_t* data, size_t len, Deadline deadline,
                           const CancellationToken& cancel) {
    if (socket_fd_ < 0) throw SpamcError::write("connection to " + peer_ + " is closed");
    if (cancel.cancelled()) {
        close();
        throw SpamcError::cancelled();
    }

    size_t sent = 0;
    while (sent < len) {
        ssize_t n = ::send(socket_fd_, data + sent, len - sent, MSG_NOSIGNAL);
        if (n > 0) {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            switch (wait_fd(socket_fd_, POLLOUT, deadline, cancel)) {
                case WaitResult::Ready:
                    continue;
                case WaitResult::Timeout:
                    close();
                    throw SpamcError::timeout("write to " + peer_ + " after " +
                                              std::to_string(sent) + " of " +
                                              std::to_string(len) + " bytes");
                case WaitResult::Cancelled:
                    close();
                    throw SpamcError::cancelled();
            }
        }
        int err = n < 0 ? errno : EPIPE;
        close();
        throw SpamcError::write(errno_string(err) + " after " + std::to_string(sent) + " of " +
                                std::to_string(len) + " bytes to " + peer_);
    }
}

void SocketTransport::receive(codec::FrameDecoder& decoder, Deadline deadline,
                              const CancellationToken& cancel) {
    if (socket_fd_ < 0) throw SpamcError::io("connection to " + peer_ + " is closed");

    uint8_t buf[READ_CHUNK];
    try {
        for (;;) {
            cancel.throw_if_cancelled();

            ssize_t n = ::recv(socket_fd_, buf, sizeof(buf), 0);
            if (n > 0) {
                if (decoder.feed(buf, static_cast<size_t>(n)) == codec::DecodeStatus::Complete) {
                    // Extra bytes mean the next frame boundary is unknown.
                    if (decoder.trailing_bytes() > 0) reusable_ = false;
                    return;
                }
                continue;
            }
            if (n == 0) {
                // Peer closed: the decoder decides whether the frame is whole.
                decoder.finish();
                reusable_ = false;
                return;
            }
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                switch (wait_fd(socket_fd_, POLLIN, deadline, cancel)) {
                    case WaitResult::Ready:
                        continue;
                    case WaitResult::Timeout:
                        throw SpamcError::timeout("read from " + peer_);
                    case WaitResult::Cancelled:
                        throw SpamcError::cancelled();
                }
            }
            if (errno == ECONNRESET) {
                throw SpamcError::unexpected_eof("connection reset by " + peer_);
            }
            throw SpamcError::io("recv from " + peer_ + ": " + errno_string(errno));
        }
    } catch (...) {
        close();
        throw;
    }
}

bool SocketTransport::alive() {
    if (socket_fd_ < 0) return false;

    struct pollfd pfd{};
    pfd.fd = socket_fd_;
    pfd.events = POLLIN;
    int ret;
    do {
        ret = ::poll(&pfd, 1, 0);
    } while (ret < 0 && errno == EINTR);
    if (ret < 0) return false;
    if (ret == 0) return true;
    if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) return false;

    // Readable while idle: either EOF or bytes nobody asked for.
    uint8_t probe;
    ssize_t n = ::recv(socket_fd_, &probe, 1, MSG_PEEK | MSG_DONTWAIT);
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return true;
    return false;
}

} // namespace spamc
