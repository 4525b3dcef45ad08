// src/dispatcher.hpp
// Request dispatch: one pool per daemon address, connect retries, exchange.

#pragma once

#include "codec.hpp"
#include "pool.hpp"
#include "transport.hpp"
#include "spamc/config.hpp"
#include "spamc/message.hpp"
#include "spamc/options.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace spamc {

// Runs one request/response exchange per execute() call:
//   acquire -> encode -> send -> receive -> release
// Connection failures while opening a transport are retried with backoff;
// every other failure is surfaced to the caller with the connection closed.
class Dispatcher {
public:
    // Opens a transport to `address`. Replaced in tests.
    using TransportFactory = std::function<std::unique_ptr<Transport>(
        const Address& address, Deadline deadline, const CancellationToken& cancel)>;

    explicit Dispatcher(ClientConfig config, TransportFactory factory = TransportFactory());
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    // Throws SpamcError. Daemon errors carry the status code; every error
    // carries the command and address.
    Response execute(const Request& request, const CallOptions& options = CallOptions());

    // Pool for `address`, created on first use. Throws SpamcError
    // (Configuration) for unparseable addresses, (Closed) after close().
    ConnectionPool& pool_for(const std::string& address);

    // Close every pool. Exchanges in flight finish; new ones throw Closed.
    void close();
    bool closed() const;

    const ClientConfig& config() const noexcept { return config_; }

private:
    ConnectionPool::Lease acquire(ConnectionPool& pool, Deadline deadline,
                                  const CancellationToken& cancel);
    Response exchange(ConnectionPool::Lease& lease, codec::ResponseDecoder& decoder,
                      const Bytes& encoded, Deadline deadline, const CancellationToken& cancel);
    const Compressor* compressor() const noexcept;
    void report(const SpamcError& err) const;

    ClientConfig config_;
    TransportFactory factory_;

    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<ConnectionPool>> pools_;
    bool closed_ = false;
};

} // namespace spamc
