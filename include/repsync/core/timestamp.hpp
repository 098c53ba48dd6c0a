#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <cstdlib>
#include <cstdio>
#include <cctype>

namespace repsync::core {

// ============================================================================
// Timestamp type
// ============================================================================
using Timestamp = std::chrono::sys_time<std::chrono::nanoseconds>;

[[nodiscard]] inline Timestamp now() noexcept {
    return std::chrono::time_point_cast<std::chrono::nanoseconds>(std::chrono::system_clock::now());
}


// ============================================================================
// Helper: convert fixed-width digit run → integer
// ============================================================================
[[nodiscard]] inline bool parse_digits(std::string_view sv, int& out) noexcept {
    if (sv.empty()) return false;
    int value = 0;
    for (char c : sv) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        value = value * 10 + (c - '0');
    }
    out = value;
    return true;
}

namespace detail {

struct Fields {
    int year{0}, mon{0}, day{0};
    int hour{0}, minute{0}, sec{0};
};

// YYYY-MM-DDTHH:MM:SS (19 chars). Accepts 'T', 't' or ' ' as separator.
[[nodiscard]] inline bool parse_date_time(std::string_view sv, Fields& f) noexcept {
    if (sv.size() < 19) return false;
    if (!parse_digits(sv.substr(0, 4), f.year)) return false;
    if (sv[4] != '-') return false;
    if (!parse_digits(sv.substr(5, 2), f.mon)) return false;
    if (sv[7] != '-') return false;
    if (!parse_digits(sv.substr(8, 2), f.day)) return false;
    if (sv[10] != 'T' && sv[10] != 't' && sv[10] != ' ') return false;
    if (!parse_digits(sv.substr(11, 2), f.hour)) return false;
    if (sv[13] != ':') return false;
    if (!parse_digits(sv.substr(14, 2), f.minute)) return false;
    if (sv[16] != ':') return false;
    if (!parse_digits(sv.substr(17, 2), f.sec)) return false;
    return f.hour < 24 && f.minute < 60 && f.sec < 61;
}

// ".ddd…" at pos; advances pos. Requires at least one digit.
[[nodiscard]] inline bool parse_fraction(std::string_view sv, std::size_t& pos, std::chrono::nanoseconds& out) noexcept {
    if (pos >= sv.size() || sv[pos] != '.') return false;
    std::size_t start = ++pos;
    long long frac = 0;
    std::size_t digits = 0;
    while (pos < sv.size() && std::isdigit(static_cast<unsigned char>(sv[pos]))) {
        if (digits < 9) {
            frac = frac * 10 + (sv[pos] - '0');
        }
        ++digits;
        ++pos;
    }
    if (pos == start) return false;
    for (std::size_t i = digits; i < 9; ++i) {
        frac *= 10;
    }
    out = std::chrono::nanoseconds(frac);
    return true;
}

// "Z" or "±hh:mm" / "±hhmm" at pos, consuming the rest of the input.
[[nodiscard]] inline bool parse_zone(std::string_view sv, std::size_t pos, std::chrono::minutes& offset) noexcept {
    if (pos >= sv.size()) return false;
    if (sv[pos] == 'Z' || sv[pos] == 'z') {
        offset = std::chrono::minutes(0);
        return pos + 1 == sv.size();
    }
    if (sv[pos] != '+' && sv[pos] != '-') return false;
    const int sign = (sv[pos] == '-') ? -1 : 1;
    std::string_view rest = sv.substr(pos + 1);
    int hh = 0, mm = 0;
    if (rest.size() == 5 && rest[2] == ':') {
        if (!parse_digits(rest.substr(0, 2), hh) || !parse_digits(rest.substr(3, 2), mm)) return false;
    } else if (rest.size() == 4) {
        if (!parse_digits(rest.substr(0, 2), hh) || !parse_digits(rest.substr(2, 2), mm)) return false;
    } else {
        return false;
    }
    if (hh > 23 || mm > 59) return false;
    offset = std::chrono::minutes(sign * (hh * 60 + mm));
    return true;
}

[[nodiscard]] inline bool compose(const Fields& f, std::chrono::nanoseconds frac, std::chrono::minutes offset, Timestamp& out) noexcept {
    using namespace std::chrono;
    year_month_day ymd =
        year{f.year} /
        month{static_cast<unsigned>(f.mon)} /
        day{static_cast<unsigned>(f.day)};
    if (!ymd.ok()) return false;
    out = sys_days{ymd} + hours(f.hour) + minutes(f.minute) + seconds(f.sec) + frac - offset;
    return true;
}

} // namespace detail


// ============================================================================
// ISO-8601 decoding
//
// Forms are tried in this order, the first match wins:
//   1) fractional seconds with zone:  2024-05-01T10:22:33.123+02:00 / ...123Z
//   2) whole seconds with zone:       2024-05-01T10:22:33+02:00 / ...33Z
//   3) UTC with Z:                    2024-05-01T10:22:33[.fff]Z
//   4) no zone (taken as UTC):        2024-05-01T10:22:33[.fff]
//
// Always returns a UTC Timestamp.
// ============================================================================
[[nodiscard]] inline bool parse_fractional_with_offset(std::string_view sv, Timestamp& out) noexcept {
    detail::Fields f;
    if (!detail::parse_date_time(sv, f)) return false;
    std::size_t pos = 19;
    std::chrono::nanoseconds frac{0};
    if (!detail::parse_fraction(sv, pos, frac)) return false;
    std::chrono::minutes offset{0};
    if (!detail::parse_zone(sv, pos, offset)) return false;
    return detail::compose(f, frac, offset, out);
}

[[nodiscard]] inline bool parse_whole_with_offset(std::string_view sv, Timestamp& out) noexcept {
    detail::Fields f;
    if (!detail::parse_date_time(sv, f)) return false;
    std::chrono::minutes offset{0};
    if (!detail::parse_zone(sv, 19, offset)) return false;
    return detail::compose(f, std::chrono::nanoseconds{0}, offset, out);
}

[[nodiscard]] inline bool parse_utc_z(std::string_view sv, Timestamp& out) noexcept {
    if (sv.empty() || (sv.back() != 'Z' && sv.back() != 'z')) return false;
    detail::Fields f;
    if (!detail::parse_date_time(sv, f)) return false;
    std::size_t pos = 19;
    std::chrono::nanoseconds frac{0};
    if (pos < sv.size() && sv[pos] == '.') {
        if (!detail::parse_fraction(sv, pos, frac)) return false;
    }
    if (pos + 1 != sv.size()) return false;
    return detail::compose(f, frac, std::chrono::minutes{0}, out);
}

[[nodiscard]] inline bool parse_naive_utc(std::string_view sv, Timestamp& out) noexcept {
    detail::Fields f;
    if (!detail::parse_date_time(sv, f)) return false;
    std::size_t pos = 19;
    std::chrono::nanoseconds frac{0};
    if (pos < sv.size()) {
        if (!detail::parse_fraction(sv, pos, frac)) return false;
        if (pos != sv.size()) return false;
    }
    return detail::compose(f, frac, std::chrono::minutes{0}, out);
}

[[nodiscard]] inline bool parse_iso8601(std::string_view sv, Timestamp& out) noexcept {
    return parse_fractional_with_offset(sv, out)
        || parse_whole_with_offset(sv, out)
        || parse_utc_z(sv, out)
        || parse_naive_utc(sv, out);
}


// ============================================================================
// ISO-8601 Formatter (always UTC, millisecond precision)
//
// Produces:
//   YYYY-MM-DDTHH:MM:SS.mmmZ
// ============================================================================
[[nodiscard]] inline std::string to_string(const Timestamp& ts) {
    using namespace std::chrono;

    sys_days d = floor<days>(ts);
    year_month_day ymd{d};

    auto tod = ts - d;
    auto h = floor<hours>(tod);
    auto m = floor<minutes>(tod - h);
    auto s = floor<seconds>(tod - h - m);
    auto ms = duration_cast<milliseconds>(tod - h - m - s).count();

    char buf[64];
    std::snprintf(buf, sizeof(buf),
                  "%04d-%02u-%02uT%02d:%02d:%02d.%03lldZ",
                  int(ymd.year()), unsigned(ymd.month()), unsigned(ymd.day()),
                  int(h.count()), int(m.count()), int(s.count()),
                  static_cast<long long>(ms));

    return std::string(buf);
}

} // namespace repsync::core
