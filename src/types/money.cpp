#include "types/money.hpp"

#include <cmath>
#include <cstdlib>
#include <regex>

namespace TXR {

namespace {
    constexpr size_t kMaxIntegerDigits = 15;
}

std::optional<Money> Money::parseDecimal(const std::string& text) {
    static const std::regex decimal_pattern(R"(^([+-]?)(\d*)(?:\.(\d*))?$)");
    std::smatch match;
    if (!std::regex_match(text, match, decimal_pattern)) {
        return std::nullopt;
    }

    bool negative = match[1].str() == "-";
    std::string integer_part = match[2].str();
    std::string fraction_part = match[3].matched ? match[3].str() : std::string();

    // EN: At least one digit on either side of the point.
    // FR: Au moins un chiffre d'un côté ou de l'autre du point.
    if (integer_part.empty() && fraction_part.empty()) {
        return std::nullopt;
    }

    size_t first_significant = integer_part.find_first_not_of('0');
    integer_part = first_significant == std::string::npos ? std::string() : integer_part.substr(first_significant);
    if (integer_part.size() > kMaxIntegerDigits) {
        return std::nullopt;
    }

    int64_t cents = integer_part.empty() ? 0 : std::strtoll(integer_part.c_str(), nullptr, 10) * 100;
    if (!fraction_part.empty()) {
        cents += (fraction_part[0] - '0') * 10;
    }
    if (fraction_part.size() > 1) {
        cents += fraction_part[1] - '0';
    }
    // EN: Third fraction digit decides the rounding (half away from zero).
    // FR: Le troisième chiffre décimal décide de l'arrondi (demi loin de zéro).
    if (fraction_part.size() > 2 && fraction_part[2] >= '5') {
        cents += 1;
    }

    return Money(negative ? -cents : cents);
}

std::optional<Money> Money::convert(double rate) const {
    double product = static_cast<double>(cents_) * rate;
    // EN: 2^63 is exact as a double; NaN fails the comparison too.
    // FR: 2^63 est exact en double ; NaN échoue aussi la comparaison.
    if (!(std::fabs(product) < 9223372036854775808.0)) {
        return std::nullopt;
    }
    return Money(static_cast<int64_t>(std::llround(product)));
}

std::string Money::toString() const {
    int64_t magnitude = cents_ < 0 ? -cents_ : cents_;
    std::string whole = std::to_string(magnitude / 100);
    int64_t fraction = magnitude % 100;
    std::string result = cents_ < 0 ? "-" : "";
    result += whole;
    result += '.';
    result += static_cast<char>('0' + fraction / 10);
    result += static_cast<char>('0' + fraction % 10);
    return result;
}

} // namespace TXR
