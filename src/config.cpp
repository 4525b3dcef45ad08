// src/config.cpp
// Configuration builder and presets.

#include "spamc/config.hpp"
#include "transport.hpp"
#include "validation.hpp"

namespace spamc {

// --- ClientConfig presets ---

ClientConfigBuilder ClientConfig::builder() {
    return ClientConfigBuilder();
}

ClientConfig ClientConfig::tcp(const std::string& host, uint16_t port) {
    std::string address = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    return ClientConfig::builder()
        .address(address + ":" + std::to_string(port))
        .build();
}

ClientConfig ClientConfig::unix_socket(const std::string& path) {
    return ClientConfig::builder()
        .address("unix:" + path)
        .build();
}

// --- ClientConfigBuilder ---

ClientConfigBuilder& ClientConfigBuilder::address(std::string address) {
    config_.address_ = std::move(address);
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::protocol_version(std::string version) {
    config_.protocol_version_ = std::move(version);
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::user(std::string user) {
    config_.user_ = std::move(user);
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::compress(bool enabled) {
    config_.compress_ = enabled;
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::compressor(Compressor compressor) {
    config_.compressor_ = std::move(compressor);
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::connect_timeout(std::chrono::milliseconds timeout) {
    config_.connect_timeout_ = timeout;
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::request_timeout(std::chrono::milliseconds timeout) {
    config_.request_timeout_ = timeout;
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::max_connections(size_t count) {
    config_.max_connections_ = count;
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::pool_policy(PoolPolicy policy) {
    config_.pool_policy_ = policy;
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::max_connect_retries(uint32_t retries) {
    config_.max_connect_retries_ = retries;
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::retry_backoff(std::chrono::milliseconds backoff) {
    config_.retry_backoff_ = backoff;
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::worker_threads(size_t count) {
    config_.worker_threads_ = count;
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::on_error(ClientConfig::ErrorCallback callback) {
    config_.on_error_ = std::move(callback);
    return *this;
}

ClientConfig ClientConfigBuilder::build() const {
    ClientConfig result = config_;

    // Throws Configuration on malformed addresses.
    (void)Address::parse(result.address_);

    if (!validation::check_version(result.protocol_version_)) {
        throw SpamcError::configuration("protocol version must be <major>.<minor>, got '" +
                                        result.protocol_version_ + "'");
    }
    if (!result.user_.empty() && !validation::check_user_name(result.user_)) {
        throw SpamcError::configuration("user contains characters spamd does not accept: " +
                                        result.user_);
    }
    if (result.connect_timeout_.count() <= 0) {
        throw SpamcError::configuration("connect timeout must be positive");
    }
    if (result.request_timeout_.count() <= 0) {
        throw SpamcError::configuration("request timeout must be positive");
    }
    if (result.max_connections_ == 0) {
        throw SpamcError::configuration("max connections must be at least 1");
    }
    if (result.worker_threads_ == 0) {
        throw SpamcError::configuration("worker threads must be at least 1");
    }
    if (result.retry_backoff_.count() < 0) {
        throw SpamcError::configuration("retry backoff must not be negative");
    }
    if (result.compress_ && !result.compressor_.valid()) {
        throw SpamcError::configuration("compress requires a compressor with token and hooks");
    }
    return result;
}

} // namespace spamc
