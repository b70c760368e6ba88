// EN: Country normalizer implementation
// FR: Implémentation du normaliseur de pays

#include "normalize/country_normalizer.hpp"
#include "normalize/text_utils.hpp"

#include <cctype>
#include <sstream>
#include <stdexcept>

namespace TXR {
namespace Normalize {

CountryNormalizer::CountryNormalizer(const SynonymTable& synonyms) {
    auto conflicts = findConflicts(synonyms);
    if (!conflicts.empty()) {
        throw std::invalid_argument(conflicts.front());
    }

    for (const auto& [canonical, aliases] : synonyms) {
        // EN: The canonical name always resolves to itself.
        // FR: Le nom canonique se résout toujours vers lui-même.
        lookup_[toLookupKey(trim(canonical))] = canonical;
        for (const auto& alias : aliases) {
            lookup_[toLookupKey(trim(alias))] = canonical;
        }
    }
    canonical_count_ = synonyms.size();
}

std::vector<std::string> CountryNormalizer::findConflicts(const SynonymTable& synonyms) {
    std::vector<std::string> conflicts;
    std::unordered_map<std::string, std::string> owners;

    for (const auto& [canonical, aliases] : synonyms) {
        std::vector<std::string> keys;
        keys.push_back(toLookupKey(trim(canonical)));
        for (const auto& alias : aliases) {
            keys.push_back(toLookupKey(trim(alias)));
        }

        for (const auto& key : keys) {
            auto it = owners.find(key);
            if (it == owners.end()) {
                owners.emplace(key, canonical);
            } else if (it->second != canonical) {
                std::ostringstream oss;
                oss << "Synonym '" << key << "' maps to both '" << it->second
                    << "' and '" << canonical << "'";
                conflicts.push_back(oss.str());
            }
        }
    }
    return conflicts;
}

std::string CountryNormalizer::toLookupKey(const std::string& text) {
    std::string key = toUpperAscii(text);
    for (size_t i = 0; i + 1 < key.size(); ++i) {
        unsigned char lead = static_cast<unsigned char>(key[i]);
        unsigned char next = static_cast<unsigned char>(key[i + 1]);
        // EN: U+00E0..U+00FE map to U+00C0..U+00DE, except the division sign U+00F7.
        // FR: U+00E0..U+00FE correspondent à U+00C0..U+00DE, sauf le signe de division U+00F7.
        if (lead == 0xC3 && next >= 0xA0 && next <= 0xBE && next != 0xB7) {
            key[i + 1] = static_cast<char>(next - 0x20);
            ++i;
        }
    }
    return key;
}

std::string CountryNormalizer::titleCase(const std::string& text) {
    std::string result = text;
    bool word_start = true;
    for (auto& ch : result) {
        unsigned char c = static_cast<unsigned char>(ch);
        bool word_char = std::isalnum(c) != 0 || c >= 0x80;
        if (!word_char) {
            word_start = true;
            continue;
        }
        if (c < 0x80) {
            ch = static_cast<char>(word_start ? std::toupper(c) : std::tolower(c));
        }
        word_start = false;
    }
    return result;
}

std::string CountryNormalizer::normalize(const std::string& raw_country) const {
    std::string trimmed = trim(raw_country);
    auto it = lookup_.find(toLookupKey(trimmed));
    if (it != lookup_.end()) {
        return it->second;
    }
    return titleCase(trimmed);
}

bool CountryNormalizer::isKnown(const std::string& raw_country) const {
    return lookup_.find(toLookupKey(trim(raw_country))) != lookup_.end();
}

} // namespace Normalize
} // namespace TXR
