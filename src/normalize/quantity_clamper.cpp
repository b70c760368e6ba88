#include "normalize/quantity_clamper.hpp"
#include "normalize/normalization_error.hpp"
#include "normalize/text_utils.hpp"

#include <limits>
#include <regex>

namespace TXR {
namespace Normalize {

QuantityResult applyQuantityResetPolicy(long long value, int ceiling) {
    QuantityResult result;
    if (value <= 0 || value > ceiling) {
        result.quantity = 1;
        result.adjusted = true;
        return result;
    }
    result.quantity = static_cast<int>(value);
    return result;
}

QuantityClamper::QuantityClamper(int ceiling) : ceiling_(ceiling) {}

QuantityResult QuantityClamper::normalize(const std::string& raw_quantity) const {
    static const std::regex integer_pattern(R"(^([+-]?)0*(\d+)$)");

    std::string text = trim(raw_quantity);
    if (text.empty()) {
        QuantityResult result;
        result.adjusted = true;
        return result;
    }

    std::smatch match;
    if (!std::regex_match(text, match, integer_pattern)) {
        throw NormalizationException(NormalizationError::QUANTITY_PARSE_ERROR, "quantity", raw_quantity,
                                     "Quantity '" + raw_quantity + "' is not an integer");
    }

    bool negative = match[1].str() == "-";
    std::string digits = match[2].str();

    // EN: Anything wider than 18 digits is out of range either way.
    // FR: Tout ce qui dépasse 18 chiffres est hors bornes de toute façon.
    if (digits.size() > 18) {
        return applyQuantityResetPolicy(negative ? -1 : std::numeric_limits<long long>::max(), ceiling_);
    }

    long long value = std::stoll(digits);
    return applyQuantityResetPolicy(negative ? -value : value, ceiling_);
}

} // namespace Normalize
} // namespace TXR
