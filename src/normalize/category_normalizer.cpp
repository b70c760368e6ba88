#include "normalize/category_normalizer.hpp"
#include "normalize/text_utils.hpp"

namespace TXR {
namespace Normalize {

CategoryNormalizer::CategoryNormalizer(const SynonymTable& aliases, std::string missing_sentinel)
    : missing_sentinel_(std::move(missing_sentinel)) {
    for (const auto& [canonical, spellings] : aliases) {
        for (const auto& spelling : spellings) {
            lookup_[toUpperAscii(trim(spelling))] = canonical;
        }
    }
}

std::string CategoryNormalizer::normalize(const std::optional<std::string>& raw_category) const {
    if (!raw_category.has_value()) {
        return missing_sentinel_;
    }
    std::string trimmed = trim(*raw_category);
    if (trimmed.empty()) {
        return missing_sentinel_;
    }
    auto it = lookup_.find(toUpperAscii(trimmed));
    if (it != lookup_.end()) {
        return it->second;
    }
    return trimmed;
}

} // namespace Normalize
} // namespace TXR
