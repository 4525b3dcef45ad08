// src/validation.hpp
// Internal input validation functions.

#pragma once

#include "spamc/error.hpp"
#include <string>

namespace spamc {
namespace validation {

// Header names must be non-empty and free of ':', CR and LF.
inline bool check_header_name(const std::string& name) {
    if (name.empty()) return false;
    for (char c : name) {
        if (c == ':' || c == '\r' || c == '\n') return false;
    }
    return true;
}

// Header values must not break the line framing.
inline bool check_header_value(const std::string& value) {
    return value.find_first_of("\r\n") == std::string::npos;
}

// Protocol version in "<major>.<minor>" digit form.
inline bool check_version(const std::string& version) {
    auto dot = version.find('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == version.size()) return false;
    for (size_t i = 0; i < version.size(); i++) {
        if (i == dot) continue;
        if (version[i] < '0' || version[i] > '9') return false;
    }
    return true;
}

// spamd user names: letters, digits, '-', '_' (plus '.' and '@' for virtual users).
inline bool check_user_name(const std::string& user) {
    if (user.empty() || user.size() > 256) return false;
    for (char c : user) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                  c == '-' || c == '_' || c == '.' || c == '@';
        if (!ok) return false;
    }
    return true;
}

} // namespace validation
} // namespace spamc
