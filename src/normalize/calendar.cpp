#include "normalize/calendar.hpp"

#include <charconv>
#include <cstdio>
#include <ctime>

namespace costbridge::normalize {

namespace {

bool parse_fixed_int(const std::string& text, const std::size_t pos,
                     const std::size_t width, int& out) {
    if (pos + width > text.size()) {
        return false;
    }
    const char* begin = text.data() + pos;
    const char* end = begin + width;
    auto [ptr, ec] = std::from_chars(begin, end, out);
    return ec == std::errc() && ptr == end;
}

bool is_leap_year(const int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(const int year, const int month) {
    static constexpr int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return kDays[month - 1];
}

}  // namespace

std::optional<CalendarDate> parse_year_month(const std::string& text) {
    if (text.size() < 7 || text[4] != '-') {
        return std::nullopt;
    }
    if (text.size() > 7 && text[7] != '-') {
        return std::nullopt;
    }

    CalendarDate date;
    if (!parse_fixed_int(text, 0, 4, date.year) ||
        !parse_fixed_int(text, 5, 2, date.month)) {
        return std::nullopt;
    }
    if (date.month < 1 || date.month > 12) {
        return std::nullopt;
    }
    date.day = 1;
    return date;
}

std::optional<CalendarDate> parse_iso_date(const std::string& text) {
    if (text.size() != 10 || text[7] != '-') {
        return std::nullopt;
    }
    auto date = parse_year_month(text);
    if (!date.has_value()) {
        return std::nullopt;
    }
    int day = 0;
    if (!parse_fixed_int(text, 8, 2, day)) {
        return std::nullopt;
    }
    if (day < 1 || day > days_in_month(date->year, date->month)) {
        return std::nullopt;
    }
    date->day = day;
    return date;
}

std::string format_iso_date(const CalendarDate& date) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", date.year, date.month,
                  date.day);
    return buffer;
}

CalendarDate first_of_month(const CalendarDate& date) {
    return CalendarDate{date.year, date.month, 1};
}

CalendarDate add_months(const CalendarDate& date, const int delta) {
    int index = date.year * 12 + (date.month - 1) + delta;
    CalendarDate shifted;
    shifted.year = index / 12;
    shifted.month = index % 12 + 1;
    shifted.day = 1;
    return shifted;
}

bool same_month(const CalendarDate& a, const CalendarDate& b) {
    return a.year == b.year && a.month == b.month;
}

CalendarDate today_local() {
    const std::time_t now = std::time(nullptr);
    std::tm local {};
    localtime_r(&now, &local);
    return CalendarDate{local.tm_year + 1900, local.tm_mon + 1, local.tm_mday};
}

}  // namespace costbridge::normalize
