// EN: Amount normalization - strips symbols and separators, resolves the currency and converts to USD
// FR: Normalisation des montants - retire symboles et séparateurs, résout la devise et convertit en USD

#pragma once

#include "types/money.hpp"

#include <optional>
#include <string>
#include <unordered_map>

namespace TXR {
namespace Normalize {

// EN: Currency code to USD multiplier
// FR: Code devise vers multiplicateur USD
using ExchangeRateTable = std::unordered_map<std::string, double>;

struct AmountResult {
    Money amount_original;          // EN: Parsed amount in the detected currency / FR: Montant parsé dans la devise détectée
    Money amount_usd;               // EN: Converted amount / FR: Montant converti
    std::string currency_detected;  // EN: Resolved currency code / FR: Code devise résolu
    bool converted{false};          // EN: A rate from the table was applied / FR: Un taux de la table a été appliqué
};

class AmountNormalizer {
public:
    explicit AmountNormalizer(ExchangeRateTable rates);

    // EN: Parse and convert. Throws NormalizationException(AMOUNT_PARSE_ERROR) when the
    //     cleaned text is not a decimal.
    // FR: Parse et convertit. Lance NormalizationException(AMOUNT_PARSE_ERROR) si le
    //     texte nettoyé n'est pas un décimal.
    AmountResult normalize(const std::string& raw_amount,
                           const std::optional<std::string>& currency_field) const;

    // EN: Currency priority: leading symbol, then the currency field (upper-cased), then USD.
    //     Never fails, so every record gets a currency even when its amount is unparsable.
    // FR: Priorité de devise : symbole en tête, puis le champ devise (en majuscules), puis USD.
    //     N'échoue jamais, chaque enregistrement reçoit une devise même si son montant est illisible.
    std::string resolveCurrency(const std::string& raw_amount,
                                const std::optional<std::string>& currency_field) const;

    // EN: Unknown codes are passed through unconverted (rate 1.0).
    // FR: Les codes inconnus passent sans conversion (taux 1.0).
    double rateFor(const std::string& currency_code) const;
    bool hasRate(const std::string& currency_code) const;

    const ExchangeRateTable& getRates() const { return rates_; }

    // EN: Currency code for a leading $, €, £ or ¥ (after whitespace, '-' and '(').
    // FR: Code devise pour un $, €, £ ou ¥ en tête (après espaces, '-' et '(').
    static std::optional<std::string> detectLeadingSymbol(const std::string& raw_amount);

    // EN: Textual cleanup to a plain decimal: symbols, parentheses, thousands separators, decimal comma.
    // FR: Nettoyage textuel vers un décimal simple : symboles, parenthèses, séparateurs de milliers, virgule décimale.
    static std::string cleanAmountText(const std::string& raw_amount);

private:
    ExchangeRateTable rates_;
};

} // namespace Normalize
} // namespace TXR
