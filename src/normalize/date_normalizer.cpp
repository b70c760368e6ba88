#include "normalize/date_normalizer.hpp"
#include "normalize/normalization_error.hpp"
#include "normalize/text_utils.hpp"

#include <regex>

namespace TXR {
namespace Normalize {

std::string dateShapeToString(DateShape shape) {
    switch (shape) {
        case DateShape::SLASH_MONTH_FIRST: return "MM/DD/YYYY";
        case DateShape::SLASH_DAY_FIRST:   return "DD/MM/YYYY";
        case DateShape::DASH_DAY_FIRST:    return "DD-MM-YYYY";
        case DateShape::SLASH_YEAR_FIRST:  return "YYYY/MM/DD";
        case DateShape::ISO:               return "YYYY-MM-DD";
        default:                           return "UNKNOWN";
    }
}

DateShape DateNormalizer::resolveSlashOrder(int first_group, int second_group, bool& ambiguous) {
    if (first_group > 12) {
        ambiguous = false;
        return DateShape::SLASH_DAY_FIRST;
    }
    ambiguous = second_group <= 12 && first_group != second_group;
    return DateShape::SLASH_MONTH_FIRST;
}

DateResult DateNormalizer::normalize(const std::string& raw_date) const {
    static const std::regex slash_short_first(R"(^(\d{2})/(\d{2})/(\d{4})$)");
    static const std::regex dash_short_first(R"(^(\d{2})-(\d{2})-(\d{4})$)");
    static const std::regex slash_year_first(R"(^(\d{4})/(\d{2})/(\d{2})$)");
    static const std::regex iso_year_first(R"(^(\d{4})-(\d{2})-(\d{2})$)");

    std::string text = trim(raw_date);
    std::smatch match;
    DateResult result;
    int year = 0;
    int month = 0;
    int day = 0;

    if (std::regex_match(text, match, slash_short_first)) {
        int first = std::stoi(match[1].str());
        int second = std::stoi(match[2].str());
        year = std::stoi(match[3].str());
        result.shape = resolveSlashOrder(first, second, result.ambiguous);
        if (result.shape == DateShape::SLASH_DAY_FIRST) {
            day = first;
            month = second;
        } else {
            month = first;
            day = second;
        }
    } else if (std::regex_match(text, match, dash_short_first)) {
        result.shape = DateShape::DASH_DAY_FIRST;
        day = std::stoi(match[1].str());
        month = std::stoi(match[2].str());
        year = std::stoi(match[3].str());
    } else if (std::regex_match(text, match, slash_year_first)) {
        result.shape = DateShape::SLASH_YEAR_FIRST;
        year = std::stoi(match[1].str());
        month = std::stoi(match[2].str());
        day = std::stoi(match[3].str());
    } else if (std::regex_match(text, match, iso_year_first)) {
        result.shape = DateShape::ISO;
        year = std::stoi(match[1].str());
        month = std::stoi(match[2].str());
        day = std::stoi(match[3].str());
    } else {
        throw NormalizationException(NormalizationError::DATE_FORMAT_ERROR, "order_date", raw_date,
                                     "Date '" + raw_date + "' matches no known format");
    }

    if (!CalendarDate::isValid(year, month, day)) {
        throw NormalizationException(NormalizationError::DATE_FORMAT_ERROR, "order_date", raw_date,
                                     "Date '" + raw_date + "' is not a valid " + dateShapeToString(result.shape) + " date");
    }

    result.date = CalendarDate(year, month, day);
    return result;
}

} // namespace Normalize
} // namespace TXR
