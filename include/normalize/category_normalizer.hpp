#pragma once

#include "normalize/country_normalizer.hpp"

#include <optional>
#include <string>
#include <unordered_map>

namespace TXR {
namespace Normalize {

// EN: Category cleanup: missing values get a sentinel, known aliases map case-insensitively
// FR: Nettoyage des catégories : valeurs manquantes vers une sentinelle, alias connus sans tenir compte de la casse
class CategoryNormalizer {
public:
    CategoryNormalizer(const SynonymTable& aliases, std::string missing_sentinel = "Uncategorized");

    std::string normalize(const std::optional<std::string>& raw_category) const;

    const std::string& getMissingSentinel() const { return missing_sentinel_; }

private:
    std::unordered_map<std::string, std::string> lookup_;
    std::string missing_sentinel_;
};

} // namespace Normalize
} // namespace TXR
