// include/spamc/client.hpp
// spamd client: command API over a pooled connection set.

#pragma once

#include "config.hpp"
#include "error.hpp"
#include "message.hpp"
#include "options.hpp"
#include "results.hpp"
#include "types.hpp"

#include <future>
#include <memory>
#include <string>

namespace spamc {

// The spamd client.
//
// Created via Client::create(config). Calls are thread-safe and block the
// calling thread; execute_async() hands the exchange to a worker thread.
// Every failure throws SpamcError.
//
// Example:
//   auto client = Client::create(ClientConfig::tcp("127.0.0.1"));
//   auto result = client->check(message);
//   if (result.is_spam()) { ... }
//   client->close();
class Client {
public:
    // Throws SpamcError (Configuration) on an unusable address.
    static std::unique_ptr<Client> create(ClientConfig config);

    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;
    Client(Client&&) noexcept;
    Client& operator=(Client&&) noexcept;

    // --- Commands ---

    // Score the message.
    CheckResult check(const std::string& message, const CallOptions& options = CallOptions());

    // Score and list the matching rule names.
    SymbolsResult symbols(const std::string& message, const CallOptions& options = CallOptions());

    // Score and return the rule report.
    ReportResult report(const std::string& message, const CallOptions& options = CallOptions());

    // Like report(), but the daemon only sends the report for spam.
    ReportResult report_if_spam(const std::string& message,
                                const CallOptions& options = CallOptions());

    // Score and return the message rewritten by the daemon.
    ProcessResult process(const std::string& message, const CallOptions& options = CallOptions());

    // Score and return only the rewritten header block.
    HeadersResult headers(const std::string& message, const CallOptions& options = CallOptions());

    // Daemon liveness. A daemon error still throws; pong is true otherwise.
    PingResult ping(const CallOptions& options = CallOptions());

    // Train or report the message.
    TellResult tell(const std::string& message, LearnType learn,
                    const CallOptions& options = CallOptions());

    // --- Raw exchange ---

    Response execute(const Request& request, const CallOptions& options = CallOptions());

    // Runs on the worker threads; errors arrive through the future.
    std::future<Response> execute_async(Request request, CallOptions options = CallOptions());

    // Build a request with the configured protocol version and compression.
    Request make_request(Command command, Headers headers = Headers(),
                         const std::string* message = nullptr) const;

    // --- Lifecycle ---

    // Finish queued async calls, then close every connection. Later calls
    // throw SpamcError (Closed). Idempotent. May be called from on_error
    // inside an async call; the Client must then be destroyed from a thread
    // other than its worker threads.
    void close();

    const ClientConfig& config() const noexcept;

private:
    explicit Client(ClientConfig config);
    struct Inner;
    std::unique_ptr<Inner> inner_;
};

} // namespace spamc
