// src/pool.cpp
// Connection pool implementation.

#include "pool.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace spamc {

// Waiters re-check cancellation at least this often.
static constexpr std::chrono::milliseconds WAIT_SLICE{20};

// --- Lease ---

void ConnectionPool::Lease::release() {
    if (!transport_) return;
    ConnectionPool* pool = pool_;
    pool_ = nullptr;
    if (pool == nullptr) {
        transport_->close();
        transport_.reset();
        return;
    }
    pool->give_back(std::move(transport_));
}

void ConnectionPool::Lease::discard() noexcept {
    if (!transport_) return;
    ConnectionPool* pool = pool_;
    pool_ = nullptr;
    if (pool == nullptr) {
        transport_->close();
        transport_.reset();
        return;
    }
    pool->drop(std::move(transport_));
}

// --- ConnectionPool ---

ConnectionPool::ConnectionPool(std::string address, size_t max_connections, PoolPolicy policy,
                               Factory factory)
    : address_(std::move(address)),
      max_connections_(max_connections == 0 ? 1 : max_connections),
      policy_(policy),
      factory_(std::move(factory)) {}

ConnectionPool::~ConnectionPool() {
    close();
}

void ConnectionPool::leave_queue(uint64_t ticket) {
    auto it = std::find(waiters_.begin(), waiters_.end(), ticket);
    if (it != waiters_.end()) waiters_.erase(it);
    cv_.notify_all();
}

ConnectionPool::Lease ConnectionPool::acquire(Deadline deadline, const CancellationToken& cancel) {
    std::unique_lock<std::mutex> lock(mutex_);
    const uint64_t ticket = next_ticket_++;
    waiters_.push_back(ticket);

    for (;;) {
        if (closed_) {
            leave_queue(ticket);
            throw SpamcError::closed();
        }

        // FIFO: only the oldest waiter may take a slot.
        const bool first = waiters_.front() == ticket;

        if (first && !idle_.empty()) {
            auto transport = std::move(idle_.front());
            idle_.pop_front();
            leave_queue(ticket);
            lock.unlock();

            if (transport->alive()) {
                transport->state_ = TransportState::InUse;
                spdlog::debug("spamc: reusing idle connection to {}", address_);
                return Lease(this, std::move(transport), true);
            }

            spdlog::debug("spamc: idle connection to {} went stale, discarding", address_);
            transport->close();
            lock.lock();
            open_--;
            waiters_.push_front(ticket);
            continue;
        }

        if (first && open_ < max_connections_) {
            open_++;
            leave_queue(ticket);
            lock.unlock();

            std::unique_ptr<Transport> transport;
            try {
                transport = factory_(deadline, cancel);
            } catch (...) {
                lock.lock();
                open_--;
                cv_.notify_all();
                throw;
            }
            if (!transport) {
                lock.lock();
                open_--;
                cv_.notify_all();
                throw SpamcError::connection("no transport created for " + address_);
            }
            created_.fetch_add(1, std::memory_order_relaxed);
            transport->state_ = TransportState::InUse;
            spdlog::debug("spamc: opened connection to {}", address_);
            return Lease(this, std::move(transport), false);
        }

        if (policy_ == PoolPolicy::FailFast) {
            leave_queue(ticket);
            throw SpamcError::pool_exhausted(address_, max_connections_);
        }

        if (cancel.cancelled()) {
            leave_queue(ticket);
            throw SpamcError::cancelled();
        }
        auto now = Clock::now();
        if (now >= deadline) {
            leave_queue(ticket);
            throw SpamcError::timeout("waiting for a pooled connection to " + address_);
        }
        cv_.wait_until(lock, std::min(deadline, now + WAIT_SLICE));
    }
}

void ConnectionPool::give_back(std::unique_ptr<Transport> transport) {
    if (!transport->reusable()) {
        drop(std::move(transport));
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        transport->close();
        open_--;
        cv_.notify_all();
        return;
    }
    transport->state_ = TransportState::Idle;
    idle_.push_back(std::move(transport));
    cv_.notify_all();
}

void ConnectionPool::drop(std::unique_ptr<Transport> transport) noexcept {
    transport->close();
    transport.reset();
    spdlog::debug("spamc: discarded connection to {}", address_);

    std::lock_guard<std::mutex> lock(mutex_);
    open_--;
    cv_.notify_all();
}

void ConnectionPool::close() {
    std::deque<std::unique_ptr<Transport>> idle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        std::swap(idle, idle_);
        open_ -= idle.size();
        cv_.notify_all();
    }
    for (auto& t : idle) t->close();
}

size_t ConnectionPool::open_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
}

size_t ConnectionPool::idle_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return idle_.size();
}

size_t ConnectionPool::waiting_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return waiters_.size();
}

} // namespace spamc
