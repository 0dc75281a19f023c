#pragma once
#include <fmt/format.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../core/types.hpp"
#include "../util/strings.hpp"

namespace dsprof {

// ---------- civil calendar ----------
inline bool is_leap_year(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

inline int days_in_month(int y, int m) {
    static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m < 1 || m > 12) return 0;
    return (m == 2 && is_leap_year(y)) ? 29 : kDays[m - 1];
}

inline std::int64_t days_from_civil(int y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const int mp = static_cast<int>(m) + (m > 2 ? -3 : 9);
    const unsigned doy = (153 * static_cast<unsigned>(mp) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return static_cast<std::int64_t>(era) * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

struct civil_date { int year; unsigned month; unsigned day; };

inline civil_date civil_from_days(std::int64_t z) {
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return civil_date{static_cast<int>(y + (m <= 2)), m, d};
}

// "YYYY-MM-DD HH:MM:SS" in UTC.
inline std::string format_timestamp(timestamp t) {
    std::int64_t days = t.unix_seconds / 86400;
    std::int64_t rem = t.unix_seconds % 86400;
    if (rem < 0) { rem += 86400; --days; }
    const civil_date c = civil_from_days(days);
    return fmt::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}",
                       c.year, c.month, c.day, rem / 3600, (rem % 3600) / 60, rem % 60);
}

// ---------- field parsers ----------
namespace detail {

inline bool parse_digits(std::string_view s, std::size_t min_len, std::size_t max_len, int& out) {
    if (s.size() < min_len || s.size() > max_len) return false;
    int v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + (c - '0');
    }
    out = v;
    return true;
}

inline int month_from_name(std::string_view s) {
    static const std::array<const char*, 12> kNames = {
        "jan", "feb", "mar", "apr", "may", "jun", "jul", "aug", "sep", "oct", "nov", "dec"};
    if (s.size() < 3) return 0;
    const std::string lower = to_lower(s);
    for (std::size_t i = 0; i < kNames.size(); ++i) {
        if (lower.compare(0, 3, kNames[i]) != 0) continue;
        // "sept", "september", "jan" ... but not "janx"
        static const std::array<const char*, 12> kFull = {
            "january", "february", "march", "april", "may", "june", "july",
            "august", "september", "october", "november", "december"};
        if (lower.size() == 3 || lower == kFull[i] || lower == "sept") return static_cast<int>(i) + 1;
        return 0;
    }
    return 0;
}

inline int expand_two_digit_year(int yy) { return yy >= 70 ? 1900 + yy : 2000 + yy; }

inline std::vector<std::string_view> split_on(std::string_view s, char sep) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    for (std::size_t i = 0; i <= s.size(); ++i) {
        if (i == s.size() || s[i] == sep) {
            parts.push_back(s.substr(start, i - start));
            start = i + 1;
        }
    }
    return parts;
}

inline bool valid_ymd(int y, int m, int d) {
    return y >= 1 && y <= 9999 && m >= 1 && m <= 12 && d >= 1 && d <= days_in_month(y, m);
}

// Numeric date part: Y-M-D, M/D/Y (D/M/Y when unambiguous), D-M-Y, D.M.Y, D-Mon-Y.
inline bool parse_date_part(std::string_view s, int& y, int& m, int& d) {
    char sep = 0;
    for (char c : {'-', '/', '.'}) {
        if (s.find(c) != std::string_view::npos) { sep = c; break; }
    }
    if (!sep) return false;
    const auto parts = split_on(s, sep);
    if (parts.size() != 3) return false;

    if (parts[0].size() == 4) {
        return parse_digits(parts[0], 4, 4, y) &&
               parse_digits(parts[1], 1, 2, m) &&
               parse_digits(parts[2], 1, 2, d) && valid_ymd(y, m, d);
    }

    int year = 0;
    if (parts[2].size() == 2) {
        if (!parse_digits(parts[2], 2, 2, year)) return false;
        year = expand_two_digit_year(year);
    } else if (!parse_digits(parts[2], 4, 4, year)) {
        return false;
    }

    int a = 0, b = 0;
    if (!parse_digits(parts[0], 1, 2, a)) return false;
    if (sep == '-' && !parts[1].empty() && std::isalpha(static_cast<unsigned char>(parts[1][0]))) {
        b = month_from_name(parts[1]);
        if (b == 0) return false;
        y = year; m = b; d = a;
        return valid_ymd(y, m, d);
    }
    if (!parse_digits(parts[1], 1, 2, b)) return false;

    y = year;
    if (sep == '/') {
        // month first unless the first field can only be a day
        if (a > 12 && b <= 12) { d = a; m = b; } else { m = a; d = b; }
    } else {
        if (b > 12 && a <= 12) { m = a; d = b; } else { d = a; m = b; }
    }
    return valid_ymd(y, m, d);
}

// "Jan 15, 2024", "January 15 2024"
inline bool parse_named_month(std::string_view s, int& y, int& m, int& d) {
    std::size_t i = 0;
    while (i < s.size() && std::isalpha(static_cast<unsigned char>(s[i]))) ++i;
    m = month_from_name(s.substr(0, i));
    if (m == 0) return false;
    std::string_view rest = trim_view(s.substr(i));
    const std::size_t sp = rest.find_first_of(", ");
    if (sp == std::string_view::npos) return false;
    if (!parse_digits(rest.substr(0, sp), 1, 2, d)) return false;
    rest = rest.substr(sp);
    while (!rest.empty() && (rest.front() == ',' || rest.front() == ' ')) rest.remove_prefix(1);
    return parse_digits(rest, 4, 4, y) && valid_ymd(y, m, d);
}

// HH:MM[:SS[.fff]] [AM|PM] [Z|+HH:MM|-HHMM]; fills offset in seconds east of UTC.
inline bool parse_time_part(std::string_view s, int& hh, int& mm, int& ss, int& offset) {
    hh = mm = ss = offset = 0;
    s = trim_view(s);
    if (s.empty()) return true;

    // zone suffix
    if (s.back() == 'Z' || s.back() == 'z') {
        s.remove_suffix(1);
    } else {
        const std::size_t pos = s.find_last_of("+-");
        if (pos != std::string_view::npos && pos >= 5) {
            std::string_view z = s.substr(pos + 1);
            int oh = 0, om = 0;
            bool ok = false;
            if (z.size() == 5 && z[2] == ':') {
                ok = parse_digits(z.substr(0, 2), 2, 2, oh) && parse_digits(z.substr(3, 2), 2, 2, om);
            } else if (z.size() == 4) {
                ok = parse_digits(z.substr(0, 2), 2, 2, oh) && parse_digits(z.substr(2, 2), 2, 2, om);
            } else if (z.size() == 2) {
                ok = parse_digits(z, 2, 2, oh);
            }
            if (!ok || oh > 14 || om > 59) return false;
            offset = (oh * 3600 + om * 60) * (s[pos] == '-' ? -1 : 1);
            s = s.substr(0, pos);
        }
    }
    s = trim_view(s);

    int meridiem = 0; // 1 = AM, 2 = PM
    if (s.size() > 2) {
        const std::string tail = to_lower(s.substr(s.size() - 2));
        if (tail == "am" || tail == "pm") {
            meridiem = tail == "am" ? 1 : 2;
            s = trim_view(s.substr(0, s.size() - 2));
        }
    }

    const auto parts = split_on(s, ':');
    if (parts.size() < 2 || parts.size() > 3) return false;
    if (!parse_digits(parts[0], 1, 2, hh) || !parse_digits(parts[1], 2, 2, mm)) return false;
    if (parts.size() == 3) {
        std::string_view sec = parts[2];
        const std::size_t dot = sec.find('.');
        if (dot != std::string_view::npos) {
            std::string_view frac = sec.substr(dot + 1);
            int ignored = 0;
            if (frac.empty() || !parse_digits(frac.substr(0, std::min<std::size_t>(frac.size(), 9)), 1, 9, ignored))
                return false;
            sec = sec.substr(0, dot);
        }
        if (!parse_digits(sec, 2, 2, ss)) return false;
    }
    if (meridiem != 0) {
        if (hh < 1 || hh > 12) return false;
        if (meridiem == 1 && hh == 12) hh = 0;
        if (meridiem == 2 && hh != 12) hh += 12;
    }
    return hh < 24 && mm < 60 && ss < 60;
}

} // namespace detail

// Permissive single-value parse; nullopt for anything not recognizably a date/time.
inline std::optional<timestamp> try_parse_timestamp(std::string_view raw) {
    const std::string_view s = trim_view(raw);
    if (s.size() < 6 || s.size() > 40) return std::nullopt;

    // pure digit runs are numbers, never dates
    bool all_digits = true;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) { all_digits = false; break; }
    }
    if (all_digits) return std::nullopt;

    int y = 0, m = 0, d = 0, hh = 0, mm = 0, ss = 0, offset = 0;
    if (std::isalpha(static_cast<unsigned char>(s[0]))) {
        if (!detail::parse_named_month(s, y, m, d)) return std::nullopt;
    } else {
        std::size_t split = s.find_first_of("T ");
        const std::string_view date_part = s.substr(0, split);
        const std::string_view time_part = split == std::string_view::npos ? std::string_view{} : s.substr(split + 1);
        if (!detail::parse_date_part(date_part, y, m, d)) return std::nullopt;
        if (!detail::parse_time_part(time_part, hh, mm, ss, offset)) return std::nullopt;
    }

    const std::int64_t days = days_from_civil(y, static_cast<unsigned>(m), static_cast<unsigned>(d));
    return timestamp{days * 86400 + hh * 3600 + mm * 60 + ss - offset};
}

}
