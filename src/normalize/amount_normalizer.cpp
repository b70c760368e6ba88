// EN: Amount normalizer implementation
// FR: Implémentation du normaliseur de montants

#include "normalize/amount_normalizer.hpp"
#include "normalize/normalization_error.hpp"
#include "normalize/text_utils.hpp"
#include "types/transaction_record.hpp"

#include <algorithm>
#include <cctype>

namespace TXR {
namespace Normalize {

namespace {

struct CurrencySymbol {
    const char* bytes;
    const char* code;
};

// EN: UTF-8 encodings of the recognized symbols
// FR: Encodages UTF-8 des symboles reconnus
const CurrencySymbol kCurrencySymbols[] = {
    {"$", "USD"},
    {"\xE2\x82\xAC", "EUR"},
    {"\xC2\xA3", "GBP"},
    {"\xC2\xA5", "JPY"},
};

std::string stripSymbols(const std::string& text) {
    std::string result = text;
    for (const auto& symbol : kCurrencySymbols) {
        std::string needle(symbol.bytes);
        size_t pos = 0;
        while ((pos = result.find(needle, pos)) != std::string::npos) {
            result.erase(pos, needle.size());
        }
    }
    return result;
}

bool allDigits(const std::string& text) {
    return !text.empty() && std::all_of(text.begin(), text.end(),
                                        [](unsigned char c) { return std::isdigit(c) != 0; });
}

} // namespace

AmountNormalizer::AmountNormalizer(ExchangeRateTable rates) : rates_(std::move(rates)) {}

std::optional<std::string> AmountNormalizer::detectLeadingSymbol(const std::string& raw_amount) {
    size_t pos = raw_amount.find_first_not_of(" \t-(");
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    for (const auto& symbol : kCurrencySymbols) {
        if (raw_amount.compare(pos, std::char_traits<char>::length(symbol.bytes), symbol.bytes) == 0) {
            return std::string(symbol.code);
        }
    }
    return std::nullopt;
}

std::string AmountNormalizer::cleanAmountText(const std::string& raw_amount) {
    std::string text = trim(stripSymbols(raw_amount));

    // EN: (123.45) means -123.45
    // FR: (123.45) signifie -123.45
    if (text.size() >= 2 && text.front() == '(' && text.back() == ')') {
        text = "-" + trim(text.substr(1, text.size() - 2));
    }

    size_t last_comma = text.rfind(',');
    if (last_comma == std::string::npos) {
        return text;
    }

    size_t last_dot = text.rfind('.');
    std::string tail = text.substr(last_comma + 1);
    bool comma_is_last_separator = last_dot == std::string::npos || last_dot < last_comma;

    if (comma_is_last_separator && tail.size() <= 2 && allDigits(tail)) {
        // EN: European form: dots group thousands, the last comma is the decimal point.
        // FR: Forme européenne : les points groupent les milliers, la dernière virgule est la décimale.
        std::string head = text.substr(0, last_comma);
        head.erase(std::remove(head.begin(), head.end(), '.'), head.end());
        head.erase(std::remove(head.begin(), head.end(), ','), head.end());
        return head + "." + tail;
    }

    text.erase(std::remove(text.begin(), text.end(), ','), text.end());
    return text;
}

std::string AmountNormalizer::resolveCurrency(const std::string& raw_amount,
                                              const std::optional<std::string>& currency_field) const {
    auto symbol_code = detectLeadingSymbol(raw_amount);
    if (symbol_code) {
        return *symbol_code;
    }
    if (!isMissingValue(currency_field)) {
        return toUpperAscii(trim(*currency_field));
    }
    return "USD";
}

AmountResult AmountNormalizer::normalize(const std::string& raw_amount,
                                         const std::optional<std::string>& currency_field) const {
    std::string cleaned = cleanAmountText(raw_amount);
    auto parsed = Money::parseDecimal(cleaned);
    if (!parsed) {
        throw NormalizationException(NormalizationError::AMOUNT_PARSE_ERROR, "amount", raw_amount,
                                     "Amount '" + raw_amount + "' is not a decimal number");
    }

    AmountResult result;
    result.amount_original = *parsed;
    result.currency_detected = resolveCurrency(raw_amount, currency_field);
    result.converted = hasRate(result.currency_detected);
    double rate = rateFor(result.currency_detected);
    auto converted = parsed->convert(rate);
    if (!converted) {
        throw NormalizationException(NormalizationError::AMOUNT_PARSE_ERROR, "amount", raw_amount,
                                     "Amount '" + raw_amount + "' overflows at rate " +
                                     std::to_string(rate) + " for " + result.currency_detected);
    }
    result.amount_usd = *converted;
    return result;
}

double AmountNormalizer::rateFor(const std::string& currency_code) const {
    auto it = rates_.find(currency_code);
    return it == rates_.end() ? 1.0 : it->second;
}

bool AmountNormalizer::hasRate(const std::string& currency_code) const {
    return rates_.find(currency_code) != rates_.end();
}

} // namespace Normalize
} // namespace TXR
