// src/client.cpp
// spamd client implementation.

#include "spamc/client.hpp"
#include "dispatcher.hpp"
#include "transport.hpp"
#include "worker.hpp"

#include <spdlog/spdlog.h>

#include <atomic>

namespace spamc {

// TELL headers for each learning operation.
static Headers tell_headers(LearnType learn) {
    Headers h;
    switch (learn) {
        case LearnType::Spam:
            h.add(HeaderNames::MESSAGE_CLASS, message_class_name(MessageClass::Spam));
            h.add(HeaderNames::SET, format_action(ActionOption{true, false}));
            break;
        case LearnType::Ham:
            h.add(HeaderNames::MESSAGE_CLASS, message_class_name(MessageClass::Ham));
            h.add(HeaderNames::SET, format_action(ActionOption{true, false}));
            break;
        case LearnType::Forget:
            h.add(HeaderNames::REMOVE, format_action(ActionOption{true, false}));
            break;
        case LearnType::Report:
            h.add(HeaderNames::MESSAGE_CLASS, message_class_name(MessageClass::Spam));
            h.add(HeaderNames::SET, format_action(ActionOption{true, true}));
            break;
        case LearnType::Revoke:
            h.add(HeaderNames::MESSAGE_CLASS, message_class_name(MessageClass::Ham));
            h.add(HeaderNames::SET, format_action(ActionOption{true, false}));
            h.add(HeaderNames::REMOVE, format_action(ActionOption{false, true}));
            break;
    }
    return h;
}

// DidSet/DidRemove: absent means nothing was done.
static ActionOption action_header(const Response& response, const char* name) {
    auto value = response.headers.get(name);
    if (!value) return ActionOption{};
    auto action = parse_action(*value);
    if (!action) {
        throw SpamcError::malformed_header(std::string(name) + " is not an action list: " + *value);
    }
    return *action;
}

// ---

struct Client::Inner {
    explicit Inner(ClientConfig config)
        : dispatcher(std::move(config)), worker(dispatcher.config().worker_threads()) {}

    // Declared before the worker so queued jobs always see a live dispatcher.
    Dispatcher dispatcher;
    Worker worker;
    std::atomic<bool> closed{false};

    void check_open() const {
        if (closed.load()) throw SpamcError::closed();
    }
};

Client::Client(ClientConfig config) : inner_(std::make_unique<Inner>(std::move(config))) {}

Client::~Client() {
    if (inner_) close();
}

Client::Client(Client&&) noexcept = default;
Client& Client::operator=(Client&&) noexcept = default;

std::unique_ptr<Client> Client::create(ClientConfig config) {
    // Fail at creation rather than on the first call.
    Address::parse(config.address());
    spdlog::debug("spamc: client created for {} ({} worker threads, {} connections)",
                  config.address(), config.worker_threads(), config.max_connections());
    return std::unique_ptr<Client>(new Client(std::move(config)));
}

const ClientConfig& Client::config() const noexcept {
    return inner_->dispatcher.config();
}

Request Client::make_request(Command command, Headers headers,
                             const std::string* message) const {
    const auto& cfg = inner_->dispatcher.config();
    std::optional<Bytes> body;
    if (message != nullptr) body = to_bytes(*message);
    return Request::make(command, std::move(headers), std::move(body), cfg.protocol_version(),
                         cfg.compress());
}

// --- Raw exchange ---

Response Client::execute(const Request& request, const CallOptions& options) {
    inner_->check_open();
    return inner_->dispatcher.execute(request, options);
}

std::future<Response> Client::execute_async(Request request, CallOptions options) {
    inner_->check_open();
    Dispatcher* dispatcher = &inner_->dispatcher;
    return inner_->worker.submit(
        [dispatcher, request = std::move(request), options = std::move(options)]() {
            return dispatcher->execute(request, options);
        });
}

// --- Commands ---

CheckResult Client::check(const std::string& message, const CallOptions& options) {
    CheckResult result;
    result.response = execute(make_request(Command::Check, Headers(), &message), options);
    result.spam = spam_status(result.response);
    return result;
}

SymbolsResult Client::symbols(const std::string& message, const CallOptions& options) {
    SymbolsResult result;
    result.response = execute(make_request(Command::Symbols, Headers(), &message), options);
    result.spam = spam_status(result.response);
    result.symbols = parse_symbols(result.response.body_text());
    return result;
}

ReportResult Client::report(const std::string& message, const CallOptions& options) {
    ReportResult result;
    result.response = execute(make_request(Command::Report, Headers(), &message), options);
    result.spam = spam_status(result.response);
    result.report = result.response.body_text();
    result.details = parse_report(result.report);
    return result;
}

ReportResult Client::report_if_spam(const std::string& message, const CallOptions& options) {
    ReportResult result;
    result.response = execute(make_request(Command::ReportIfSpam, Headers(), &message), options);
    result.spam = spam_status(result.response);
    result.report = result.response.body_text();
    result.details = parse_report(result.report);
    return result;
}

ProcessResult Client::process(const std::string& message, const CallOptions& options) {
    ProcessResult result;
    result.response = execute(make_request(Command::Process, Headers(), &message), options);
    result.spam = spam_status(result.response);
    result.message = result.response.body_text();
    return result;
}

HeadersResult Client::headers(const std::string& message, const CallOptions& options) {
    HeadersResult result;
    result.response = execute(make_request(Command::Headers, Headers(), &message), options);
    result.spam = spam_status(result.response);
    result.raw_headers = result.response.body_text();
    result.headers = parse_header_block(result.raw_headers);
    return result;
}

PingResult Client::ping(const CallOptions& options) {
    PingResult result;
    result.response = execute(make_request(Command::Ping), options);
    result.pong = result.response.ok() && iequals(result.response.status_message, "PONG");
    return result;
}

TellResult Client::tell(const std::string& message, LearnType learn, const CallOptions& options) {
    TellResult result;
    result.response = execute(make_request(Command::Tell, tell_headers(learn), &message), options);
    result.did_set = action_header(result.response, HeaderNames::DID_SET);
    result.did_remove = action_header(result.response, HeaderNames::DID_REMOVE);
    return result;
}

// --- Lifecycle ---

void Client::close() {
    if (inner_->closed.exchange(true)) return;
    inner_->worker.shutdown();
    inner_->dispatcher.close();
}

} // namespace spamc
