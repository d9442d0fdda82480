#pragma once

#include <optional>
#include <string>

namespace costbridge::normalize {

struct CalendarDate {
    int year = 1970;
    int month = 1;  // 1..12
    int day = 1;

    bool operator==(const CalendarDate& other) const {
        return year == other.year && month == other.month && day == other.day;
    }
    bool operator!=(const CalendarDate& other) const { return !(*this == other); }
    bool operator<(const CalendarDate& other) const {
        if (year != other.year) return year < other.year;
        if (month != other.month) return month < other.month;
        return day < other.day;
    }
};

// Accepts "YYYY-MM-DD".
std::optional<CalendarDate> parse_iso_date(const std::string& text);

// Accepts "YYYY-MM" or anything starting with "YYYY-MM-"; the day becomes 1.
std::optional<CalendarDate> parse_year_month(const std::string& text);

std::string format_iso_date(const CalendarDate& date);

CalendarDate first_of_month(const CalendarDate& date);

// Moves a first-of-month date by `delta` months.
CalendarDate add_months(const CalendarDate& date, int delta);

bool same_month(const CalendarDate& a, const CalendarDate& b);

CalendarDate today_local();

}  // namespace costbridge::normalize
