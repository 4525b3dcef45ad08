// src/headers.cpp
// Header list implementation.

#include "spamc/headers.hpp"

#include <algorithm>

namespace spamc {

static inline char ascii_lower(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

bool iequals(const std::string& a, const std::string& b) noexcept {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); i++) {
        if (ascii_lower(a[i]) != ascii_lower(b[i])) return false;
    }
    return true;
}

Headers& Headers::add(std::string name, std::string value) {
    entries_.emplace_back(std::move(name), std::move(value));
    return *this;
}

Headers& Headers::set(const std::string& name, std::string value) {
    auto first = std::find_if(entries_.begin(), entries_.end(),
        [&name](const Entry& e) { return iequals(e.first, name); });
    if (first == entries_.end()) {
        entries_.emplace_back(name, std::move(value));
        return *this;
    }

    first->first = name;
    first->second = std::move(value);
    auto next = first + 1;
    entries_.erase(std::remove_if(next, entries_.end(),
        [&name](const Entry& e) { return iequals(e.first, name); }), entries_.end());
    return *this;
}

std::optional<std::string> Headers::get(const std::string& name) const {
    for (const auto& e : entries_) {
        if (iequals(e.first, name)) return e.second;
    }
    return std::nullopt;
}

std::vector<std::string> Headers::get_all(const std::string& name) const {
    std::vector<std::string> values;
    for (const auto& e : entries_) {
        if (iequals(e.first, name)) values.push_back(e.second);
    }
    return values;
}

bool Headers::contains(const std::string& name) const noexcept {
    return std::any_of(entries_.begin(), entries_.end(),
        [&name](const Entry& e) { return iequals(e.first, name); });
}

size_t Headers::remove(const std::string& name) {
    size_t before = entries_.size();
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
        [&name](const Entry& e) { return iequals(e.first, name); }), entries_.end());
    return before - entries_.size();
}

} // namespace spamc
