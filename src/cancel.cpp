// src/cancel.cpp
// Self-pipe cancellation.

#include "spamc/cancel.hpp"
#include "spamc/error.hpp"

#include <atomic>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <unistd.h>

namespace spamc {

struct CancellationToken::State {
    std::atomic<bool> flag{false};
    int read_fd = -1;
    int write_fd = -1;

    ~State() {
        if (read_fd >= 0) ::close(read_fd);
        if (write_fd >= 0) ::close(write_fd);
    }
};

bool CancellationToken::cancelled() const noexcept {
    return state_ && state_->flag.load(std::memory_order_acquire);
}

int CancellationToken::wait_fd() const noexcept {
    return state_ ? state_->read_fd : -1;
}

void CancellationToken::throw_if_cancelled() const {
    if (cancelled()) throw SpamcError::cancelled();
}

CancellationSource::CancellationSource() : state_(std::make_shared<CancellationToken::State>()) {
    int fds[2];
    if (::pipe(fds) != 0) {
        throw SpamcError::io(std::string("cancellation pipe: ") + std::strerror(errno));
    }
    state_->read_fd = fds[0];
    state_->write_fd = fds[1];
    for (int fd : fds) {
        int flags = ::fcntl(fd, F_GETFL, 0);
        if (flags >= 0) ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
        ::fcntl(fd, F_SETFD, FD_CLOEXEC);
    }
}

void CancellationSource::cancel() noexcept {
    if (state_->flag.exchange(true, std::memory_order_acq_rel)) return;
    // The byte is never drained, so the read end stays readable for every waiter.
    const char byte = 1;
    ssize_t n;
    do {
        n = ::write(state_->write_fd, &byte, 1);
    } while (n < 0 && errno == EINTR);
}

bool CancellationSource::cancelled() const noexcept {
    return state_->flag.load(std::memory_order_acquire);
}

} // namespace spamc
