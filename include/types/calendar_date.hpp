// EN: Plain calendar date (proleptic Gregorian) used for normalized order dates and validation windows
// FR: Date calendaire simple (grégorien proleptique) utilisée pour les dates normalisées et les fenêtres de validation

#pragma once

#include <optional>
#include <string>
#include <tuple>

namespace TXR {

struct CalendarDate {
    int year{1970};
    int month{1};
    int day{1};

    CalendarDate() = default;
    CalendarDate(int y, int m, int d) : year(y), month(m), day(d) {}

    // EN: True when the triple names an existing day (leap years included).
    // FR: Vrai quand le triplet désigne un jour existant (années bissextiles incluses).
    static bool isValid(int year, int month, int day);
    static bool isLeapYear(int year);
    static int daysInMonth(int year, int month);

    // EN: Strict YYYY-MM-DD parsing, nullopt when the text is not an existing date.
    // FR: Parsing strict YYYY-MM-DD, nullopt si le texte n'est pas une date existante.
    static std::optional<CalendarDate> fromIsoString(const std::string& text);

    // EN: Canonical YYYY-MM-DD rendering.
    // FR: Rendu canonique YYYY-MM-DD.
    std::string toIsoString() const;

    bool operator==(const CalendarDate& other) const {
        return std::tie(year, month, day) == std::tie(other.year, other.month, other.day);
    }
    bool operator!=(const CalendarDate& other) const { return !(*this == other); }
    bool operator<(const CalendarDate& other) const {
        return std::tie(year, month, day) < std::tie(other.year, other.month, other.day);
    }
    bool operator<=(const CalendarDate& other) const { return !(other < *this); }
    bool operator>(const CalendarDate& other) const { return other < *this; }
    bool operator>=(const CalendarDate& other) const { return !(*this < other); }
};

} // namespace TXR
