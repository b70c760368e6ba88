#include "normalize/email_repairer.hpp"
#include "normalize/normalization_error.hpp"
#include "normalize/text_utils.hpp"
#include "types/transaction_record.hpp"

#include <regex>

namespace TXR {
namespace Normalize {

namespace {

bool endsWith(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

EmailRepairer::EmailRepairer(EmailRepairConfig config) : config_(std::move(config)) {}

bool EmailRepairer::isValidShape(const std::string& email) {
    static const std::regex shape(R"(^[^@]+@[^@]+\.[^@]+$)");
    return email.size() >= 5 && std::regex_match(email, shape);
}

std::string EmailRepairer::synthesize(const std::string& customer_id) const {
    return "customer_" + trim(customer_id) + "@" + config_.inferred_domain;
}

EmailResult EmailRepairer::repair(const std::optional<std::string>& raw_email,
                                  const std::string& customer_id) const {
    EmailResult result;

    if (isMissingValue(raw_email)) {
        result.email = synthesize(customer_id);
        result.inferred = true;
    } else {
        // EN: Completion rules keep the original case; only a kept address is lower-cased.
        // FR: Les règles de complétion gardent la casse d'origine ; seule une adresse conservée est mise en minuscules.
        std::string email = trim(*raw_email);
        result.raw_complete = isValidShape(email);

        bool provider_completed = false;
        for (const auto& provider : config_.bare_providers) {
            if (endsWith(email, "@" + provider)) {
                email += ".com";
                provider_completed = true;
                break;
            }
        }

        size_t at = email.rfind('@');
        if (provider_completed) {
            result.repaired = true;
        } else if (at != std::string::npos && at + 1 == email.size()) {
            email += config_.placeholder_domain;
            result.repaired = true;
        } else if (at != std::string::npos && email.find('.', at) == std::string::npos) {
            email += ".com";
            result.repaired = true;
        } else {
            email = toLowerAscii(email);
        }

        // EN: No '@', several '@' or an empty local part: nothing to repair, synthesize instead.
        // FR: Pas de '@', plusieurs '@' ou partie locale vide : rien à réparer, on synthétise.
        if (!isValidShape(email)) {
            email = synthesize(customer_id);
            result.inferred = true;
            result.repaired = false;
        }
        result.email = email;
    }

    if (!isValidShape(result.email)) {
        throw NormalizationException(NormalizationError::EMAIL_SHAPE_VIOLATION, "customer_email",
                                     raw_email.value_or(""),
                                     "Could not build a valid email for customer '" + customer_id + "'");
    }
    return result;
}

} // namespace Normalize
} // namespace TXR
