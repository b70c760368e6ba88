#include "types/transaction_record.hpp"

#include <algorithm>
#include <cctype>

namespace TXR {

bool isMissingValue(const std::optional<std::string>& value) {
    if (!value.has_value()) {
        return true;
    }
    const std::string& text = *value;
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return true;
    }
    size_t end = text.find_last_not_of(" \t\r\n");
    std::string trimmed = text.substr(start, end - start + 1);
    if (trimmed.size() != 4) {
        return false;
    }
    std::transform(trimmed.begin(), trimmed.end(), trimmed.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return trimmed == "NULL";
}

std::string recordStatusToString(RecordStatus status) {
    switch (status) {
        case RecordStatus::PENDING:   return "PENDING";
        case RecordStatus::KEPT:      return "KEPT";
        case RecordStatus::DUPLICATE: return "DUPLICATE";
        default:                      return "UNKNOWN";
    }
}

bool NormalizedRecord::hasIssue(const std::string& field) const {
    return std::any_of(issues.begin(), issues.end(),
                       [&field](const FieldIssue& issue) { return issue.field == field; });
}

} // namespace TXR
