// include/spamc/config.hpp
// Flat configuration struct with builder pattern.

#pragma once

#include "error.hpp"
#include "message.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace spamc {

class ClientConfigBuilder;

// Compression hook. The library only frames the bytes; the algorithm
// behind `token` is supplied by the caller.
struct Compressor {
    using Transform = std::function<Bytes(const Bytes&)>;

    std::string token = "zlib";
    Transform compress;
    Transform decompress;

    bool valid() const noexcept { return !token.empty() && compress && decompress; }
};

// What acquire() does when every pooled connection is in use.
enum class PoolPolicy : uint8_t {
    Wait,      // queue FIFO until a connection frees or the deadline passes
    FailFast,  // throw PoolExhausted immediately
};

// Configuration for the spamd client.
class ClientConfig {
public:
    using ErrorCallback = std::function<void(const SpamcError&)>;

    static ClientConfigBuilder builder();

    // Presets.
    static ClientConfig tcp(const std::string& host, uint16_t port = 783);
    static ClientConfig unix_socket(const std::string& path);

    const std::string& address() const noexcept { return address_; }
    const std::string& protocol_version() const noexcept { return protocol_version_; }
    const std::string& user() const noexcept { return user_; }
    bool compress() const noexcept { return compress_; }
    const Compressor& compressor() const noexcept { return compressor_; }
    std::chrono::milliseconds connect_timeout() const noexcept { return connect_timeout_; }
    std::chrono::milliseconds request_timeout() const noexcept { return request_timeout_; }
    size_t max_connections() const noexcept { return max_connections_; }
    PoolPolicy pool_policy() const noexcept { return pool_policy_; }
    uint32_t max_connect_retries() const noexcept { return max_connect_retries_; }
    std::chrono::milliseconds retry_backoff() const noexcept { return retry_backoff_; }
    size_t worker_threads() const noexcept { return worker_threads_; }
    const ErrorCallback& on_error() const noexcept { return on_error_; }

private:
    friend class ClientConfigBuilder;

    std::string address_ = "localhost:783";
    std::string protocol_version_ = DEFAULT_PROTOCOL_VERSION;
    std::string user_;
    bool compress_ = false;
    Compressor compressor_;
    std::chrono::milliseconds connect_timeout_{5000};
    std::chrono::milliseconds request_timeout_{30000};
    size_t max_connections_ = 8;
    PoolPolicy pool_policy_ = PoolPolicy::Wait;
    uint32_t max_connect_retries_ = 3;
    std::chrono::milliseconds retry_backoff_{100};
    size_t worker_threads_ = 2;
    ErrorCallback on_error_;
};

// Fluent builder for ClientConfig.
class ClientConfigBuilder {
public:
    ClientConfigBuilder() = default;

    // "host:port", "[v6addr]:port", "/path/to/socket" or "unix:/path".
    ClientConfigBuilder& address(std::string address);
    ClientConfigBuilder& protocol_version(std::string version);
    ClientConfigBuilder& user(std::string user);
    ClientConfigBuilder& compress(bool enabled);
    ClientConfigBuilder& compressor(Compressor compressor);
    ClientConfigBuilder& connect_timeout(std::chrono::milliseconds timeout);
    ClientConfigBuilder& request_timeout(std::chrono::milliseconds timeout);
    ClientConfigBuilder& max_connections(size_t count);
    ClientConfigBuilder& pool_policy(PoolPolicy policy);
    ClientConfigBuilder& max_connect_retries(uint32_t retries);
    ClientConfigBuilder& retry_backoff(std::chrono::milliseconds backoff);
    ClientConfigBuilder& worker_threads(size_t count);
    ClientConfigBuilder& on_error(ClientConfig::ErrorCallback callback);

    // Build the config. Throws SpamcError (Configuration) on invalid values.
    ClientConfig build() const;

private:
    ClientConfig config_;
};

} // namespace spamc
