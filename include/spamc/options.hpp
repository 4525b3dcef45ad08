// include/spamc/options.hpp
// Per-call overrides for a single exchange.

#pragma once

#include "cancel.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace spamc {

// Overrides applied to one call. Unset fields fall back to the ClientConfig.
//
// Example:
//   auto opts = CallOptions().with_timeout(std::chrono::seconds(2)).with_user("alice");
//   auto result = client->check(message, opts);
struct CallOptions {
    // Whole-exchange deadline, measured from the start of the call.
    std::optional<std::chrono::milliseconds> timeout;

    // Daemon address for this call only.
    std::string address;

    // Value of the User header for this call only.
    std::string user;

    CancellationToken cancel;

    CallOptions& with_timeout(std::chrono::milliseconds t) {
        timeout = t;
        return *this;
    }
    CallOptions& with_address(std::string a) {
        address = std::move(a);
        return *this;
    }
    CallOptions& with_user(std::string u) {
        user = std::move(u);
        return *this;
    }
    CallOptions& with_cancel(CancellationToken token) {
        cancel = std::move(token);
        return *this;
    }
};

} // namespace spamc
