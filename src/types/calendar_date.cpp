#include "types/calendar_date.hpp"

#include <cstdio>
#include <regex>

namespace TXR {

bool CalendarDate::isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int CalendarDate::daysInMonth(int year, int month) {
    static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) {
        return 0;
    }
    if (month == 2 && isLeapYear(year)) {
        return 29;
    }
    return kDays[month - 1];
}

bool CalendarDate::isValid(int year, int month, int day) {
    if (year < 1 || year > 9999) {
        return false;
    }
    if (month < 1 || month > 12) {
        return false;
    }
    return day >= 1 && day <= daysInMonth(year, month);
}

std::optional<CalendarDate> CalendarDate::fromIsoString(const std::string& text) {
    static const std::regex iso_pattern(R"(^(\d{4})-(\d{2})-(\d{2})$)");
    std::smatch match;
    if (!std::regex_match(text, match, iso_pattern)) {
        return std::nullopt;
    }
    int year = std::stoi(match[1].str());
    int month = std::stoi(match[2].str());
    int day = std::stoi(match[3].str());
    if (!isValid(year, month, day)) {
        return std::nullopt;
    }
    return CalendarDate(year, month, day);
}

std::string CalendarDate::toIsoString() const {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", year, month, day);
    return std::string(buffer);
}

} // namespace TXR
