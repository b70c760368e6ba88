// EN: Quantity normalization with the reset-to-minimum policy for out-of-range values
// FR: Normalisation des quantités avec la politique de remise au minimum pour les valeurs hors bornes

#pragma once

#include <string>

namespace TXR {
namespace Normalize {

struct QuantityResult {
    int quantity{1};
    bool adjusted{false};
};

// EN: Values <= 0 and values above the ceiling both become 1. Large values are
//     reset, not capped to the ceiling.
// FR: Les valeurs <= 0 et celles au-dessus du plafond deviennent toutes 1. Les grandes
//     valeurs sont remises à 1, pas plafonnées.
QuantityResult applyQuantityResetPolicy(long long value, int ceiling);

class QuantityClamper {
public:
    explicit QuantityClamper(int ceiling = 100);

    // EN: Empty input becomes 1 (adjusted). Throws NormalizationException(QUANTITY_PARSE_ERROR)
    //     for anything that is not a signed integer.
    // FR: Une entrée vide devient 1 (ajustée). Lance NormalizationException(QUANTITY_PARSE_ERROR)
    //     pour tout ce qui n'est pas un entier signé.
    QuantityResult normalize(const std::string& raw_quantity) const;

    int getCeiling() const { return ceiling_; }

private:
    int ceiling_;
};

} // namespace Normalize
} // namespace TXR
