// include/spamc/cancel.hpp
// Cancellation source/token pair for in-flight exchanges.

#pragma once

#include <memory>

namespace spamc {

class CancellationSource;

// Read-only view of a cancellation flag. A default-constructed token is
// never cancelled.
class CancellationToken {
public:
    CancellationToken() = default;

    bool cancelled() const noexcept;

    // Descriptor that becomes readable once cancelled, or -1.
    int wait_fd() const noexcept;

    // Throws SpamcError (Cancelled) if cancelled.
    void throw_if_cancelled() const;

private:
    friend class CancellationSource;
    struct State;
    explicit CancellationToken(std::shared_ptr<State> state) : state_(std::move(state)) {}

    std::shared_ptr<State> state_;
};

// Owner side. cancel() wakes every transport blocked on one of its tokens.
//
// Example:
//   CancellationSource source;
//   auto fut = client->execute_async(req, CallOptions().with_cancel(source.token()));
//   source.cancel();  // fut.get() throws SpamcError (Cancelled)
class CancellationSource {
public:
    // Throws SpamcError (Io) if the wake-up pipe cannot be created.
    CancellationSource();

    CancellationSource(const CancellationSource&) = delete;
    CancellationSource& operator=(const CancellationSource&) = delete;

    void cancel() noexcept;
    bool cancelled() const noexcept;
    CancellationToken token() const { return CancellationToken(state_); }

private:
    std::shared_ptr<CancellationToken::State> state_;
};

} // namespace spamc
