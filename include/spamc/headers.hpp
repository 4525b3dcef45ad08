// include/spamc/headers.hpp
// Ordered header list with case-insensitive lookup.

#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace spamc {

// ASCII case-insensitive equality.
bool iequals(const std::string& a, const std::string& b) noexcept;

// Protocol headers in insertion order.
//
// Names keep the caller's casing on the wire; every lookup ignores case.
// Duplicates are allowed through add().
//
// Example:
//   Headers h;
//   h.add("User", "alice").add("X-Trace", "1");
//   auto user = h.get("user");  // "alice"
class Headers {
public:
    using Entry = std::pair<std::string, std::string>;
    using const_iterator = std::vector<Entry>::const_iterator;

    Headers() = default;
    Headers(std::initializer_list<Entry> entries) : entries_(entries) {}

    // Append, keeping existing entries with the same name.
    Headers& add(std::string name, std::string value);

    // Replace every entry named `name` with one entry at the first position.
    Headers& set(const std::string& name, std::string value);

    // First value named `name`.
    std::optional<std::string> get(const std::string& name) const;
    std::vector<std::string> get_all(const std::string& name) const;
    bool contains(const std::string& name) const noexcept;

    // Remove every entry named `name`. Returns the number removed.
    size_t remove(const std::string& name);

    size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }
    void clear() noexcept { entries_.clear(); }

    const_iterator begin() const noexcept { return entries_.begin(); }
    const_iterator end() const noexcept { return entries_.end(); }
    const Entry& operator[](size_t i) const { return entries_[i]; }
    Entry& back() { return entries_.back(); }

    // Exact comparison, including name casing and order.
    bool operator==(const Headers& o) const { return entries_ == o.entries_; }
    bool operator!=(const Headers& o) const { return !(*this == o); }

private:
    std::vector<Entry> entries_;
};

} // namespace spamc
