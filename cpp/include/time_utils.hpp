#pragma once

#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>

#include "errors.hpp"

// ---------------------------------------------------------------------------
// UTC epoch-second helpers. All timestamps inside the engine are int64 epoch
// seconds; calendar strings only appear at the edges (config, data files,
// block-resolver callers, log lines).
// ---------------------------------------------------------------------------
namespace clmm::time_utils {

constexpr int64_t SECONDS_PER_HOUR = 3600;
constexpr int64_t SECONDS_PER_DAY  = 24 * SECONDS_PER_HOUR;
constexpr int64_t SECONDS_PER_YEAR = 365 * SECONDS_PER_DAY;

// Days since 1970-01-01 for a proleptic Gregorian date.
inline int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

inline unsigned days_in_month(int64_t y, unsigned m) {
    static constexpr unsigned kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    const bool leap = (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
    return m == 2 && leap ? 29 : kDays[m - 1];
}

struct CivilTime {
    int64_t year;
    unsigned month;
    unsigned day;
    unsigned hour;
    unsigned minute;
    unsigned second;
};

inline CivilTime civil_from_epoch(int64_t ts) {
    int64_t days = ts / SECONDS_PER_DAY;
    int64_t rem = ts % SECONDS_PER_DAY;
    if (rem < 0) { rem += SECONDS_PER_DAY; --days; }

    const int64_t z = days + 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;

    CivilTime out;
    out.year = static_cast<int64_t>(yoe) + era * 400 + (m <= 2);
    out.month = m;
    out.day = d;
    out.hour = static_cast<unsigned>(rem / SECONDS_PER_HOUR);
    out.minute = static_cast<unsigned>((rem % SECONDS_PER_HOUR) / 60);
    out.second = static_cast<unsigned>(rem % 60);
    return out;
}

// "YYYY-MM-DD HH:MM:SS+00:00"
inline std::string format_utc(int64_t ts) {
    const CivilTime c = civil_from_epoch(ts);
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02u %02u:%02u:%02u+00:00",
                  static_cast<long long>(c.year), c.month, c.day, c.hour, c.minute, c.second);
    return buf;
}

struct ParsedTime {
    int64_t epoch{0};     // seconds, already shifted by the zone offset if present
    bool has_zone{false}; // 'Z' or an explicit +HH:MM / -HH:MM was given
};

namespace detail {

inline bool read_digits(const std::string& s, size_t& pos, size_t count, unsigned& out) {
    if (pos + count > s.size()) return false;
    unsigned v = 0;
    for (size_t i = 0; i < count; ++i) {
        const char c = s[pos + i];
        if (c < '0' || c > '9') return false;
        v = v * 10 + static_cast<unsigned>(c - '0');
    }
    out = v;
    pos += count;
    return true;
}

inline bool expect(const std::string& s, size_t& pos, char c) {
    if (pos >= s.size() || s[pos] != c) return false;
    ++pos;
    return true;
}

} // namespace detail

// Accepts YYYY-MM-DD, optionally followed by [T| ]HH:MM[:SS[.fraction]] and a
// zone designator (Z, +HH:MM, -HH:MM, +HHMM). Fractions are truncated.
inline std::optional<ParsedTime> parse_iso8601(const std::string& s) {
    size_t pos = 0;
    unsigned y = 0, mo = 0, d = 0, h = 0, mi = 0, sec = 0;
    if (!detail::read_digits(s, pos, 4, y) || !detail::expect(s, pos, '-') ||
        !detail::read_digits(s, pos, 2, mo) || !detail::expect(s, pos, '-') ||
        !detail::read_digits(s, pos, 2, d)) {
        return std::nullopt;
    }
    if (mo < 1 || mo > 12 || d < 1 || d > days_in_month(y, mo)) return std::nullopt;

    if (pos < s.size() && (s[pos] == 'T' || s[pos] == ' ')) {
        ++pos;
        if (!detail::read_digits(s, pos, 2, h) || !detail::expect(s, pos, ':') ||
            !detail::read_digits(s, pos, 2, mi)) {
            return std::nullopt;
        }
        if (pos < s.size() && s[pos] == ':') {
            ++pos;
            if (!detail::read_digits(s, pos, 2, sec)) return std::nullopt;
            if (pos < s.size() && s[pos] == '.') {
                ++pos;
                while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') ++pos;
            }
        }
        if (h > 23 || mi > 59 || sec > 60) return std::nullopt;
    }

    ParsedTime out;
    out.epoch = days_from_civil(y, mo, d) * SECONDS_PER_DAY +
                static_cast<int64_t>(h) * SECONDS_PER_HOUR + mi * 60 + sec;

    if (pos == s.size()) return out;

    if (s[pos] == 'Z' || s[pos] == 'z') {
        ++pos;
        out.has_zone = true;
    } else if (s[pos] == '+' || s[pos] == '-') {
        const int sign = s[pos] == '+' ? 1 : -1;
        ++pos;
        unsigned oh = 0, om = 0;
        if (!detail::read_digits(s, pos, 2, oh)) return std::nullopt;
        if (pos < s.size() && s[pos] == ':') ++pos;
        if (!detail::read_digits(s, pos, 2, om)) return std::nullopt;
        if (oh > 23 || om > 59) return std::nullopt;
        out.epoch -= sign * (static_cast<int64_t>(oh) * SECONDS_PER_HOUR + om * 60);
        out.has_zone = true;
    }
    if (pos != s.size()) return std::nullopt;
    return out;
}

// Zone-aware parse: a calendar time without a zone designator is rejected.
inline int64_t to_epoch_utc(const std::string& s) {
    const auto parsed = parse_iso8601(s);
    if (!parsed) {
        throw InvalidInput("unparseable timestamp: '" + s + "'");
    }
    if (!parsed->has_zone) {
        throw InvalidInput("timestamp must be timezone-aware (UTC): '" + s + "'");
    }
    return parsed->epoch;
}

// Lenient parse for data files: naive calendar times are taken as UTC.
inline int64_t to_epoch_assume_utc(const std::string& s) {
    const auto parsed = parse_iso8601(s);
    if (!parsed) {
        throw InvalidInput("unparseable timestamp: '" + s + "'");
    }
    return parsed->epoch;
}

// Exchange feeds mix second and millisecond epochs; anything past year 2286
// in seconds is taken to be milliseconds.
inline int64_t normalize_epoch(int64_t ts) {
    if (ts > 10000000000LL) ts /= 1000LL;
    return ts;
}

} // namespace clmm::time_utils
