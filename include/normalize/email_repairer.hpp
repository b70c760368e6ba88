// EN: Email repair - synthesizes missing addresses and completes truncated domains
// FR: Réparation d'emails - synthétise les adresses manquantes et complète les domaines tronqués

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace TXR {
namespace Normalize {

struct EmailRepairConfig {
    std::string inferred_domain{"inferred.com"};        // EN: Domain of synthesized addresses / FR: Domaine des adresses synthétisées
    std::string placeholder_domain{"domain.com"};       // EN: Appended after a trailing '@' / FR: Ajouté après un '@' final
    std::vector<std::string> bare_providers{"gmail", "yahoo", "hotmail", "outlook"};
};

struct EmailResult {
    std::string email;
    bool inferred{false};       // EN: Address was synthesized from the customer id / FR: Adresse synthétisée depuis l'id client
    bool repaired{false};       // EN: A domain completion rule was applied / FR: Une règle de complétion de domaine a été appliquée
    bool raw_complete{false};   // EN: The raw input already had the valid shape / FR: L'entrée brute avait déjà la forme valide
};

class EmailRepairer {
public:
    EmailRepairer() = default;
    explicit EmailRepairer(EmailRepairConfig config);

    // EN: Apply the repair rules in order. The result always has the valid shape;
    //     NormalizationException(EMAIL_SHAPE_VIOLATION) signals that even the
    //     synthesized address could not be made valid (customer id containing '@').
    // FR: Applique les règles de réparation dans l'ordre. Le résultat a toujours la forme
    //     valide ; NormalizationException(EMAIL_SHAPE_VIOLATION) signale que même l'adresse
    //     synthétisée n'a pas pu être rendue valide (id client contenant '@').
    EmailResult repair(const std::optional<std::string>& raw_email, const std::string& customer_id) const;

    std::string synthesize(const std::string& customer_id) const;

    // EN: local@domain.tld: exactly one '@', a dot after it, length of at least 5.
    // FR: local@domaine.tld : exactement un '@', un point après, longueur d'au moins 5.
    static bool isValidShape(const std::string& email);

    const EmailRepairConfig& getConfig() const { return config_; }

private:
    EmailRepairConfig config_;
};

} // namespace Normalize
} // namespace TXR
