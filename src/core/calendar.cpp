/// @file src/core/calendar.cpp
/// @brief ISO-8601 parsing and UTC civil breakdown.

#include "fras/calendar.hpp"

#include <fmt/format.h>

#include <cctype>

namespace fras::calendar {

using namespace std::chrono;

namespace {

/// Read exactly `n` decimal digits at `pos`.
bool read_digits(std::string_view s, std::size_t pos, std::size_t n, int& out) noexcept {
    if (pos + n > s.size()) return false;
    int v = 0;
    for (std::size_t i = 0; i < n; ++i) {
        const char c = s[pos + i];
        if (c < '0' || c > '9') return false;
        v = v * 10 + (c - '0');
    }
    out = v;
    return true;
}

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))  s.remove_suffix(1);
    return s;
}

} // anonymous namespace

// ─── parse_iso8601 ────────────────────────────────────────────────────────────

std::optional<sys_seconds> parse_iso8601(std::string_view text) noexcept {
    const std::string_view s = trim(text);

    int y = 0, mo = 0, d = 0;
    if (!read_digits(s, 0, 4, y) || s.size() < 10 || s[4] != '-' ||
        !read_digits(s, 5, 2, mo) || s[7] != '-' || !read_digits(s, 8, 2, d)) {
        return std::nullopt;
    }

    const year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)},
                             day{static_cast<unsigned>(d)}};
    if (!ymd.ok()) return std::nullopt;

    std::size_t pos = 10;
    int hh = 0, mm = 0, ss = 0;
    long long offset_seconds = 0;

    if (pos < s.size()) {
        if (s[pos] != 'T' && s[pos] != 't' && s[pos] != ' ') return std::nullopt;
        ++pos;

        if (!read_digits(s, pos, 2, hh) || pos + 2 >= s.size() || s[pos + 2] != ':' ||
            !read_digits(s, pos + 3, 2, mm)) {
            return std::nullopt;
        }
        pos += 5;

        if (pos < s.size() && s[pos] == ':') {
            if (!read_digits(s, pos + 1, 2, ss)) return std::nullopt;
            pos += 3;

            // Fractional seconds are truncated.
            if (pos < s.size() && (s[pos] == '.' || s[pos] == ',')) {
                ++pos;
                const std::size_t start = pos;
                while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') ++pos;
                if (pos == start) return std::nullopt;
            }
        }

        if (hh > 23 || mm > 59 || ss > 59) return std::nullopt;

        if (pos < s.size()) {
            const char z = s[pos];
            if (z == 'Z' || z == 'z') {
                ++pos;
            } else if (z == '+' || z == '-') {
                int oh = 0, om = 0;
                if (!read_digits(s, pos + 1, 2, oh)) return std::nullopt;
                pos += 3;
                if (pos < s.size() && s[pos] == ':') ++pos;
                if (!read_digits(s, pos, 2, om)) return std::nullopt;
                pos += 2;
                if (om > 59 || oh * 60 + om > 18 * 60) return std::nullopt;
                offset_seconds = (oh * 3600LL + om * 60LL) * (z == '-' ? -1 : 1);
            } else {
                return std::nullopt;
            }
        }
    }

    if (pos != s.size()) return std::nullopt;

    const sys_seconds local = sys_days{ymd} + hours{hh} + minutes{mm} + seconds{ss};
    return local - seconds{offset_seconds};
}

// ─── to_civil ─────────────────────────────────────────────────────────────────

CivilTime to_civil(sys_seconds t) noexcept {
    const auto dp = floor<days>(t);
    const year_month_day ymd{dp};
    const hh_mm_ss hms{t - dp};
    const weekday wd{dp};

    const auto last = year_month_day_last{ymd.year(), month_day_last{ymd.month()}};
    const bool month_end = last.day() == ymd.day();
    const unsigned m = static_cast<unsigned>(ymd.month());

    return CivilTime{
        .year           = static_cast<int>(ymd.year()),
        .month          = m,
        .day            = static_cast<unsigned>(ymd.day()),
        .hour           = static_cast<int>(hms.hours().count()),
        .minute         = static_cast<int>(hms.minutes().count()),
        .weekday        = wd.c_encoding(),
        .is_month_end   = month_end,
        .is_quarter_end = month_end && m % 3 == 0,
    };
}

// ─── format_iso8601 ───────────────────────────────────────────────────────────

std::string format_iso8601(sys_seconds t) {
    const auto dp = floor<days>(t);
    const year_month_day ymd{dp};
    const hh_mm_ss hms{t - dp};
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}Z",
                       static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()),
                       static_cast<unsigned>(ymd.day()),
                       hms.hours().count(),
                       hms.minutes().count(),
                       hms.seconds().count());
}

} // namespace fras::calendar
