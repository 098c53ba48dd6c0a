#pragma once

#include <string>
#include <string_view>
#include <cstdint>
#include <cmath>
#include <charconv>


namespace lcr {
namespace json {

// Appends s as a quoted JSON string (RFC 8259 escaping)
inline void append_string(std::string& out, std::string_view s) {
    static constexpr char hex[] = "0123456789abcdef";
    out.reserve(out.size() + s.size() + 2);
    out += '"';
    for (char ch : s) {
        const auto c = static_cast<unsigned char>(ch);
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (c < 0x20) {
                    out += "\\u00";
                    out += hex[c >> 4];
                    out += hex[c & 0x0F];
                } else {
                    out += ch;
                }
        }
    }
    out += '"';
}

// Fast integer → string formatter
inline void append(std::string& out, std::uint64_t value) {
    char buf[32];
    char* p = buf + sizeof(buf);

    do {
        *(--p) = static_cast<char>('0' + (value % 10));
        value /= 10;
    } while (value > 0);

    out.append(p, buf + sizeof(buf) - p);
}

inline void append(std::string& out, std::int64_t value) {
    if (value < 0) {
        out += '-';
        // two's complement safe negation
        append(out, static_cast<std::uint64_t>(0) - static_cast<std::uint64_t>(value));
        return;
    }
    append(out, static_cast<std::uint64_t>(value));
}

inline void append(std::string& out, int value) {
    append(out, static_cast<std::int64_t>(value));
}

// Shortest round-trip representation.
// Returns false for NaN / infinity (not representable in JSON).
[[nodiscard]]
inline bool append(std::string& out, double value) {
    if (!std::isfinite(value)) {
        return false;
    }
    char buf[32];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc{}) {
        return false;
    }
    out.append(buf, end);
    return true;
}

inline void append_bool(std::string& out, bool value) {
    out += value ? "true" : "false";
}

// Appends "key": (with a leading comma unless first)
inline void append_key(std::string& out, std::string_view key, bool& first) {
    if (!first) out += ',';
    first = false;
    append_string(out, key);
    out += ':';
}

} // namespace json
} // namespace lcr
