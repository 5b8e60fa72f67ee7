#pragma once

#include <chrono>
#include <cstdio>
#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// Calendar date utilities. Dates are carried as int YYYYMMDD throughout.
// ---------------------------------------------------------------------------
namespace time_utils {

inline int make_date(int year, int month, int day) {
    return year * 10000 + month * 100 + day;
}

inline int year_of(int date) { return date / 10000; }
inline int month_of(int date) { return (date / 100) % 100; }
inline int day_of(int date) { return date % 100; }

inline std::chrono::year_month_day to_ymd(int date) {
    return std::chrono::year_month_day{
        std::chrono::year{year_of(date)},
        std::chrono::month{static_cast<unsigned>(month_of(date))},
        std::chrono::day{static_cast<unsigned>(day_of(date))}};
}

inline int from_ymd(const std::chrono::year_month_day& ymd) {
    return make_date(static_cast<int>(ymd.year()),
                     static_cast<int>(static_cast<unsigned>(ymd.month())),
                     static_cast<int>(static_cast<unsigned>(ymd.day())));
}

inline bool is_valid(int date) {
    if (date <= 0) return false;
    return to_ymd(date).ok();
}

inline std::chrono::sys_days to_sys_days(int date) {
    return std::chrono::sys_days{to_ymd(date)};
}

inline int from_sys_days(std::chrono::sys_days days) {
    return from_ymd(std::chrono::year_month_day{days});
}

inline int add_days(int date, int days) {
    return from_sys_days(to_sys_days(date) + std::chrono::days{days});
}

// Days from a to b (negative when b precedes a).
inline int days_between(int a, int b) {
    return static_cast<int>((to_sys_days(b) - to_sys_days(a)).count());
}

// Calendar month arithmetic; the day is clamped to the end of the target month.
inline int add_months(int date, int months) {
    int total = year_of(date) * 12 + (month_of(date) - 1) + months;
    int year = total / 12;
    int month = total % 12 + 1;
    auto last = std::chrono::year{year} / std::chrono::month{static_cast<unsigned>(month)} /
                std::chrono::last;
    int last_day = static_cast<int>(static_cast<unsigned>(last.day()));
    int day = day_of(date) < last_day ? day_of(date) : last_day;
    return make_date(year, month, day);
}

// 0 = Sunday ... 6 = Saturday
inline int weekday(int date) {
    return static_cast<int>(std::chrono::weekday{to_sys_days(date)}.c_encoding());
}

inline bool is_weekend(int date) {
    int wd = weekday(date);
    return wd == 0 || wd == 6;
}

// n-th occurrence (1-based) of a weekday within a month.
inline int nth_weekday(int year, int month, int wd, int n) {
    int first = make_date(year, month, 1);
    int offset = (wd - weekday(first) + 7) % 7;
    return add_days(first, offset + 7 * (n - 1));
}

inline int last_weekday(int year, int month, int wd) {
    int last = add_days(add_months(make_date(year, month, 1), 1), -1);
    int offset = (weekday(last) - wd + 7) % 7;
    return add_days(last, -offset);
}

inline int today_utc() {
    auto now = std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now());
    return from_sys_days(now);
}

// yyyy-MM-dd
inline std::string format_date(int date) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year_of(date), month_of(date), day_of(date));
    return buf;
}

// yyyyMMdd
inline std::string format_compact(int date) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d%02d%02d", year_of(date), month_of(date), day_of(date));
    return buf;
}

namespace detail {

inline bool parse_digits(const std::string& s, size_t pos, size_t len, int& out) {
    int value = 0;
    for (size_t i = pos; i < pos + len; ++i) {
        char c = s[i];
        if (c < '0' || c > '9') return false;
        value = value * 10 + (c - '0');
    }
    out = value;
    return true;
}

}  // namespace detail

// Strict yyyy-MM-dd. Throws std::invalid_argument on anything else.
inline int parse_date(const std::string& s) {
    int y = 0, m = 0, d = 0;
    bool ok = s.size() == 10 && s[4] == '-' && s[7] == '-' &&
              detail::parse_digits(s, 0, 4, y) &&
              detail::parse_digits(s, 5, 2, m) &&
              detail::parse_digits(s, 8, 2, d);
    int date = make_date(y, m, d);
    if (!ok || !is_valid(date)) {
        throw std::invalid_argument("Invalid date (expected yyyy-MM-dd): '" + s + "'");
    }
    return date;
}

// Strict yyyyMMdd. Throws std::invalid_argument on anything else.
inline int parse_compact(const std::string& s) {
    int y = 0, m = 0, d = 0;
    bool ok = s.size() == 8 &&
              detail::parse_digits(s, 0, 4, y) &&
              detail::parse_digits(s, 4, 2, m) &&
              detail::parse_digits(s, 6, 2, d);
    int date = make_date(y, m, d);
    if (!ok || !is_valid(date)) {
        throw std::invalid_argument("Invalid date (expected yyyyMMdd): '" + s + "'");
    }
    return date;
}

}  // namespace time_utils
