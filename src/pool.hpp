// src/pool.hpp
// Bounded connection pool with exclusive leases.

#pragma once

#include "transport.hpp"
#include "spamc/cancel.hpp"
#include "spamc/config.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace spamc {

// Pool of transports for one daemon address.
//
// A transport is handed to at most one Lease at a time. Leases that are
// dropped without release() close their transport, so a connection whose
// exchange failed never returns to the idle set.
class ConnectionPool {
public:
    using Factory =
        std::function<std::unique_ptr<Transport>(Deadline deadline, const CancellationToken& cancel)>;

    // Exclusive ownership of one InUse transport.
    class Lease {
    public:
        Lease() = default;
        ~Lease() { discard(); }

        Lease(Lease&& other) noexcept
            : pool_(other.pool_), transport_(std::move(other.transport_)), reused_(other.reused_) {
            other.pool_ = nullptr;
        }
        Lease& operator=(Lease&& other) noexcept {
            if (this != &other) {
                discard();
                pool_ = other.pool_;
                transport_ = std::move(other.transport_);
                reused_ = other.reused_;
                other.pool_ = nullptr;
            }
            return *this;
        }

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        Transport& operator*() const { return *transport_; }
        Transport* operator->() const { return transport_.get(); }
        explicit operator bool() const noexcept { return transport_ != nullptr; }

        // True if the transport came from the idle set.
        bool reused() const noexcept { return reused_; }

        // Exchange finished cleanly: back to Idle (closed instead if the
        // transport reports it is no longer reusable).
        void release();

        // Close the transport and free its pool slot.
        void discard() noexcept;

    private:
        friend class ConnectionPool;
        Lease(ConnectionPool* pool, std::unique_ptr<Transport> transport, bool reused)
            : pool_(pool), transport_(std::move(transport)), reused_(reused) {}

        ConnectionPool* pool_ = nullptr;
        std::unique_ptr<Transport> transport_;
        bool reused_ = false;
    };

    ConnectionPool(std::string address, size_t max_connections, PoolPolicy policy,
                   Factory factory);
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    // Idle transport or a new one from the factory. At the connection bound,
    // Wait queues FIFO and FailFast throws PoolExhausted. Throws SpamcError
    // (Timeout, Cancelled, Closed, PoolExhausted, or whatever the factory throws).
    Lease acquire(Deadline deadline, const CancellationToken& cancel = CancellationToken());

    // Close idle transports; later acquires throw Closed. Leases still out
    // are closed when they come back.
    void close();

    const std::string& address() const noexcept { return address_; }
    size_t max_connections() const noexcept { return max_connections_; }

    // Idle + in use + being opened.
    size_t open_count() const;
    size_t idle_count() const;
    size_t waiting_count() const;
    uint64_t created_count() const noexcept { return created_.load(std::memory_order_relaxed); }

private:
    void give_back(std::unique_ptr<Transport> transport);
    void drop(std::unique_ptr<Transport> transport) noexcept;
    void leave_queue(uint64_t ticket);

    const std::string address_;
    const size_t max_connections_;
    const PoolPolicy policy_;
    Factory factory_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::unique_ptr<Transport>> idle_;
    std::deque<uint64_t> waiters_;
    uint64_t next_ticket_ = 0;
    size_t open_ = 0;
    bool closed_ = false;

    std::atomic<uint64_t> created_{0};
};

} // namespace spamc
