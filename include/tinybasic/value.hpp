#pragma once

#include <string>
#include <cstdint>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <optional>

namespace tinybasic {

// All TinyBasic values are 32-bit signed integers
using Value = std::int32_t;

constexpr Value VALUE_MAX = std::numeric_limits<Value>::max();
constexpr Value VALUE_MIN = std::numeric_limits<Value>::min();

// Narrow a 64-bit intermediate result; nullopt when it does not fit
inline std::optional<Value> narrow(long long v) {
    if (v < VALUE_MIN || v > VALUE_MAX) return std::nullopt;
    return static_cast<Value>(v);
}

// Parse an INPUT reply: optional surrounding blanks, optional sign, digits
inline std::optional<Value> parse_value(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return std::nullopt;
    size_t end = text.find_last_not_of(" \t\r\n");
    std::string s = text.substr(start, end - start + 1);

    size_t i = 0;
    if (s[0] == '+' || s[0] == '-') i = 1;
    if (i >= s.size()) return std::nullopt;
    for (size_t j = i; j < s.size(); ++j) {
        if (!std::isdigit(static_cast<unsigned char>(s[j]))) return std::nullopt;
    }

    errno = 0;
    long long v = std::strtoll(s.c_str(), nullptr, 10);
    if (errno == ERANGE) return std::nullopt;
    return narrow(v);
}

inline std::string to_string(Value v) {
    return std::to_string(v);
}

} // namespace tinybasic
