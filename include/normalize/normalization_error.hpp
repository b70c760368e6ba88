// EN: Field-level normalization errors and the exception that carries them
// FR: Erreurs de normalisation au niveau des champs et l'exception qui les transporte

#pragma once

#include <stdexcept>
#include <string>

namespace TXR {
namespace Normalize {

// EN: Error codes raised by the field normalizers
// FR: Codes d'erreur levés par les normaliseurs de champs
enum class NormalizationError {
    SUCCESS = 0,
    AMOUNT_PARSE_ERROR,         // EN: Cleaned amount is not a decimal / FR: Le montant nettoyé n'est pas un décimal
    DATE_FORMAT_ERROR,          // EN: Date matches none of the known shapes / FR: La date ne correspond à aucune forme connue
    QUANTITY_PARSE_ERROR,       // EN: Quantity is not an integer / FR: La quantité n'est pas un entier
    EMAIL_SHAPE_VIOLATION       // EN: Repaired email still malformed / FR: Email réparé toujours malformé
};

std::string normalizationErrorToString(NormalizationError error);

class NormalizationException : public std::runtime_error {
public:
    NormalizationException(NormalizationError code, std::string field, std::string raw_value,
                           const std::string& message)
        : std::runtime_error(message),
          code_(code), field_(std::move(field)), raw_value_(std::move(raw_value)) {}

    NormalizationError code() const { return code_; }
    const std::string& field() const { return field_; }
    const std::string& rawValue() const { return raw_value_; }

private:
    NormalizationError code_;
    std::string field_;
    std::string raw_value_;
};

} // namespace Normalize
} // namespace TXR
