#pragma once

#include "time_utils.hpp"

// ---------------------------------------------------------------------------
// HolidayCalendar — US exchange holidays (CBOE / CFE schedule)
// ---------------------------------------------------------------------------
class HolidayCalendar {
public:
    static constexpr int MONDAY = 1;
    static constexpr int THURSDAY = 4;

    static int easter_sunday(int year) {
        int a = year % 19;
        int b = year / 100;
        int c = year % 100;
        int d = b / 4;
        int e = b % 4;
        int f = (b + 8) / 25;
        int g = (b - f + 1) / 3;
        int h = (19 * a + b - d - g + 15) % 30;
        int i = c / 4;
        int k = c % 4;
        int l = (32 + 2 * e + 2 * i - h - k) % 7;
        int m = (a + 11 * h + 22 * l) / 451;
        int month = (h + l - 7 * m + 114) / 31;
        int day = (h + l - 7 * m + 114) % 31 + 1;
        return time_utils::make_date(year, month, day);
    }

    bool is_holiday(int date) const {
        using namespace time_utils;
        int y = year_of(date);
        int m = month_of(date);

        if (date == observed_new_year(y)) return true;
        if (m == 1 && date == nth_weekday(y, 1, MONDAY, 3)) return true;   // MLK
        if (m == 2 && date == nth_weekday(y, 2, MONDAY, 3)) return true;   // Presidents'
        if (date == add_days(easter_sunday(y), -2)) return true;           // Good Friday
        if (m == 5 && date == last_weekday(y, 5, MONDAY)) return true;     // Memorial
        if (y >= 2022 && date == observed(make_date(y, 6, 19))) return true;
        if (date == observed(make_date(y, 7, 4))) return true;
        if (m == 9 && date == nth_weekday(y, 9, MONDAY, 1)) return true;   // Labor
        if (m == 11 && date == nth_weekday(y, 11, THURSDAY, 4)) return true;
        if (date == observed(make_date(y, 12, 25))) return true;
        return false;
    }

    bool is_business_day(int date) const {
        return !time_utils::is_weekend(date) && !is_holiday(date);
    }

    int previous_business_day(int date) const {
        int d = time_utils::add_days(date, -1);
        while (!is_business_day(d)) d = time_utils::add_days(d, -1);
        return d;
    }

private:
    // Saturday holidays move to Friday, Sunday holidays to Monday.
    static int observed(int date) {
        int wd = time_utils::weekday(date);
        if (wd == 6) return time_utils::add_days(date, -1);
        if (wd == 0) return time_utils::add_days(date, 1);
        return date;
    }

    // New Year's Day on a Saturday is not observed on the prior Friday.
    static int observed_new_year(int year) {
        int date = time_utils::make_date(year, 1, 1);
        int wd = time_utils::weekday(date);
        if (wd == 0) return time_utils::add_days(date, 1);
        return date;
    }
};
