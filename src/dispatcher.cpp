// src/dispatcher.cpp
// Request dispatch implementation.

#include "dispatcher.hpp"
#include "codec.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <random>

#include <poll.h>

namespace spamc {

// Exponential backoff: base * 1.5^attempt plus up to 20% jitter.
static std::chrono::milliseconds backoff_delay(std::chrono::milliseconds base_delay,
                                               uint32_t attempt) {
    double base = static_cast<double>(base_delay.count()) *
                  std::pow(1.5, static_cast<double>(attempt));

    std::random_device rd;
    double jitter = base * 0.2 * (static_cast<double>(rd()) / static_cast<double>(rd.max()));
    double delay = std::min(base + jitter, 30000.0);
    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

// Sleep for `delay`, waking early on cancellation.
static void backoff_sleep(std::chrono::milliseconds delay, const CancellationToken& cancel) {
    struct pollfd pfd{};
    pfd.fd = cancel.wait_fd();
    pfd.events = POLLIN;
    const nfds_t count = pfd.fd >= 0 ? 1 : 0;

    auto until = Clock::now() + delay;
    for (;;) {
        cancel.throw_if_cancelled();
        auto now = Clock::now();
        if (now >= until) return;
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(until - now);
        int ret = ::poll(&pfd, count, static_cast<int>(remaining.count()) + 1);
        if (ret < 0 && errno != EINTR) {
            throw SpamcError::io("poll failed during backoff");
        }
    }
}

static Deadline deadline_for(const ClientConfig& config, const CallOptions& options) {
    return Clock::now() + options.timeout.value_or(config.request_timeout());
}

Dispatcher::Dispatcher(ClientConfig config, TransportFactory factory)
    : config_(std::move(config)), factory_(std::move(factory)) {
    if (!factory_) {
        factory_ = [](const Address& address, Deadline deadline, const CancellationToken& cancel) {
            return std::unique_ptr<Transport>(SocketTransport::connect(address, deadline, cancel));
        };
    }
}

Dispatcher::~Dispatcher() {
    close();
}

ConnectionPool& Dispatcher::pool_for(const std::string& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) throw SpamcError::closed();

    auto it = pools_.find(address);
    if (it != pools_.end()) return *it->second;

    Address parsed = Address::parse(address);
    auto connect_timeout = config_.connect_timeout();
    TransportFactory factory = factory_;
    auto pool = std::make_unique<ConnectionPool>(
        parsed.to_string(), config_.max_connections(), config_.pool_policy(),
        [parsed, connect_timeout, factory](Deadline deadline, const CancellationToken& cancel) {
            // The connect phase gets its own, shorter, budget.
            Deadline connect_deadline = std::min(deadline, Clock::now() + connect_timeout);
            return factory(parsed, connect_deadline, cancel);
        });
    ConnectionPool& ref = *pool;
    pools_.emplace(address, std::move(pool));
    return ref;
}

void Dispatcher::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        closed_ = true;
        for (auto& entry : pools_) entry.second->close();
    }
    spdlog::debug("spamc: dispatcher closed");
}

bool Dispatcher::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

const Compressor* Dispatcher::compressor() const noexcept {
    return config_.compressor().valid() ? &config_.compressor() : nullptr;
}

void Dispatcher::report(const SpamcError& err) const {
    if (config_.on_error()) {
        config_.on_error()(err);
    }
}

ConnectionPool::Lease Dispatcher::acquire(ConnectionPool& pool, Deadline deadline,
                                          const CancellationToken& cancel) {
    const uint32_t max_retries = config_.max_connect_retries();
    for (uint32_t attempt = 0;; attempt++) {
        try {
            return pool.acquire(deadline, cancel);
        } catch (const SpamcError& e) {
            if (e.kind() != ErrorKind::Connection || attempt >= max_retries) throw;

            auto delay = backoff_delay(config_.retry_backoff(), attempt);
            if (Clock::now() + delay >= deadline) throw;

            spdlog::warn("spamc: {} (attempt {}/{}), retrying in {}ms", e.what(), attempt + 1,
                         max_retries + 1, delay.count());
            report(e);
            backoff_sleep(delay, cancel);
        }
    }
}

Response Dispatcher::exchange(ConnectionPool::Lease& lease, codec::ResponseDecoder& decoder,
                              const Bytes& encoded, Deadline deadline,
                              const CancellationToken& cancel) {
    lease->send(encoded.data(), encoded.size(), deadline, cancel);
    lease->receive(decoder, deadline, cancel);

    Response response = decoder.take_response();
    // A whole frame arrived, so the connection is still in step whatever
    // the status says.
    lease.release();
    return response;
}

Response Dispatcher::execute(const Request& request, const CallOptions& options) {
    const Deadline deadline = deadline_for(config_, options);
    const std::string& address = options.address.empty() ? config_.address() : options.address;
    const char* command = command_name(request.command());

    try {
        options.cancel.throw_if_cancelled();

        const std::string& user = options.user.empty() ? config_.user() : options.user;
        Bytes encoded;
        if (!user.empty() && !request.headers().contains(HeaderNames::USER)) {
            encoded = codec::encode_request(request.with_header(HeaderNames::USER, user),
                                            compressor());
        } else {
            encoded = codec::encode_request(request, compressor());
        }

        ConnectionPool& pool = pool_for(address);
        const codec::BodyPolicy policy = response_has_body(request.command())
                                             ? codec::BodyPolicy::UntilClose
                                             : codec::BodyPolicy::None;

        // Write and read failures are not retried: the daemon may already
        // have acted on the request (TELL is not idempotent).
        ConnectionPool::Lease lease = acquire(pool, deadline, options.cancel);
        codec::ResponseDecoder decoder(policy, compressor());
        Response response = exchange(lease, decoder, encoded, deadline, options.cancel);

        spdlog::debug("spamc: {} @ {} -> {} {}", command, pool.address(), response.status_code,
                      response.status_message);
        if (!response.ok()) {
            throw SpamcError::daemon(response.status_code, response.status_message);
        }
        return response;
    } catch (const SpamcError& e) {
        throw e.with_context(command, address);
    }
}

} // namespace spamc
