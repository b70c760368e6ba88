#include "normalize/normalization_error.hpp"

namespace TXR {
namespace Normalize {

std::string normalizationErrorToString(NormalizationError error) {
    switch (error) {
        case NormalizationError::SUCCESS:               return "SUCCESS";
        case NormalizationError::AMOUNT_PARSE_ERROR:    return "AMOUNT_PARSE_ERROR";
        case NormalizationError::DATE_FORMAT_ERROR:     return "DATE_FORMAT_ERROR";
        case NormalizationError::QUANTITY_PARSE_ERROR:  return "QUANTITY_PARSE_ERROR";
        case NormalizationError::EMAIL_SHAPE_VIOLATION: return "EMAIL_SHAPE_VIOLATION";
        default:                                        return "UNKNOWN";
    }
}

} // namespace Normalize
} // namespace TXR
