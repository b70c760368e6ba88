// EN: Country normalization through a synonym table, with title-case fallback for unknown values
// FR: Normalisation des pays via une table de synonymes, avec repli en casse titre pour les valeurs inconnues

#pragma once

#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace TXR {
namespace Normalize {

// EN: Canonical name to its accepted spellings
// FR: Nom canonique vers ses orthographes acceptées
using SynonymTable = std::map<std::string, std::vector<std::string>>;

class CountryNormalizer {
public:
    // EN: Throws std::invalid_argument when an alias maps to two canonical names.
    // FR: Lance std::invalid_argument quand un alias pointe vers deux noms canoniques.
    explicit CountryNormalizer(const SynonymTable& synonyms);

    std::string normalize(const std::string& raw_country) const;

    // EN: True when the value resolves through the table (not the title-case fallback).
    // FR: Vrai quand la valeur se résout via la table (pas le repli en casse titre).
    bool isKnown(const std::string& raw_country) const;

    size_t canonicalCount() const { return canonical_count_; }

    // EN: Describe every alias claimed by more than one canonical name.
    // FR: Décrit chaque alias revendiqué par plus d'un nom canonique.
    static std::vector<std::string> findConflicts(const SynonymTable& synonyms);

    // EN: Upper-case ASCII and Latin-1 letters encoded as UTF-8 (é -> É).
    // FR: Met en majuscules l'ASCII et les lettres Latin-1 encodées en UTF-8 (é -> É).
    static std::string toLookupKey(const std::string& text);

    // EN: First letter of each alphanumeric run upper-cased, the rest lower-cased.
    // FR: Première lettre de chaque suite alphanumérique en majuscule, le reste en minuscule.
    static std::string titleCase(const std::string& text);

private:
    std::unordered_map<std::string, std::string> lookup_;
    size_t canonical_count_{0};
};

} // namespace Normalize
} // namespace TXR
