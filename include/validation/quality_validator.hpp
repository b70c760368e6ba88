// EN: Quality validator - fixed, ordered battery of checks over the canonical record set
// FR: Validateur de qualité - batterie ordonnée et fixe de contrôles sur l'ensemble canonique

#pragma once

#include "types/calendar_date.hpp"
#include "types/money.hpp"
#include "types/transaction_record.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace TXR::Validation {

// EN: How much a failing check matters
// FR: Importance d'un contrôle en échec
enum class CheckSeverity {
    HARD,           // EN: Failure means the canonical set breaks an invariant / FR: Un échec signifie une invariante violée
    ADVISORY,       // EN: Failure is reported as a warning / FR: Un échec est rapporté comme avertissement
    INFORMATIONAL   // EN: Metric only, never fails / FR: Métrique seulement, n'échoue jamais
};

enum class CheckStatus {
    PASSED,
    FAILED,
    WARNING,
    INFO
};

std::string checkSeverityToString(CheckSeverity severity);
std::string checkStatusToString(CheckStatus status);

struct ValidationSettings {
    CalendarDate date_window_start{2024, 1, 1};        // EN: Inclusive / FR: Inclus
    CalendarDate date_window_end{2024, 12, 31};        // EN: Inclusive / FR: Inclus
    int quantity_ceiling{100};
    Money amount_ceiling{Money::fromCents(10000000)};  // EN: 100000.00 / FR: 100000.00
    size_t country_ceiling{20};
    double outlier_sigma{3.0};
    std::set<std::string> canonical_countries;         // EN: Names produced by the synonym table / FR: Noms produits par la table de synonymes
};

struct CheckResult {
    int order{0};
    std::string name;
    CheckSeverity severity{CheckSeverity::HARD};
    CheckStatus status{CheckStatus::PASSED};
    size_t offending_count{0};
    std::optional<double> metric;
    std::string detail;

    bool passed() const { return status == CheckStatus::PASSED; }
};

class ValidationReport {
public:
    void addCheck(CheckResult check) { checks_.push_back(std::move(check)); }

    const std::vector<CheckResult>& getChecks() const { return checks_; }
    std::optional<CheckResult> getCheck(const std::string& name) const;

    size_t getRecordCount() const { return record_count_; }
    void setRecordCount(size_t count) { record_count_ = count; }

    // EN: Passed hard checks over hard checks, in percent with one decimal.
    // FR: Contrôles bloquants réussis sur contrôles bloquants, en pourcentage à une décimale.
    double getScore() const;
    size_t getHardChecksPassed() const;
    size_t getHardCheckCount() const;
    bool allHardChecksPassed() const;

    std::string generateTextReport() const;
    nlohmann::json toJson() const;

    bool operator==(const ValidationReport& other) const;

private:
    std::vector<CheckResult> checks_;
    size_t record_count_{0};
};

// EN: Read-only diagnostics; never throws, never mutates the records.
// FR: Diagnostic en lecture seule ; ne lance jamais d'exception, ne modifie jamais les enregistrements.
class QualityValidator {
public:
    explicit QualityValidator(ValidationSettings settings = ValidationSettings{});

    ValidationReport validate(const std::vector<NormalizedRecord>& records) const;

    const ValidationSettings& getSettings() const { return settings_; }

private:
    CheckResult checkCriticalFields(const std::vector<NormalizedRecord>& records) const;
    CheckResult checkUniqueTransactionIds(const std::vector<NormalizedRecord>& records) const;
    CheckResult checkEmailShape(const std::vector<NormalizedRecord>& records) const;
    CheckResult checkDateWindow(const std::vector<NormalizedRecord>& records) const;
    CheckResult checkAmountRange(const std::vector<NormalizedRecord>& records) const;
    CheckResult checkQuantityRange(const std::vector<NormalizedRecord>& records) const;
    CheckResult checkCountryCardinality(const std::vector<NormalizedRecord>& records) const;
    CheckResult checkCurrencyTracking(const std::vector<NormalizedRecord>& records) const;
    CheckResult checkCompleteness(const std::vector<NormalizedRecord>& records) const;
    CheckResult checkAmountOutliers(const std::vector<NormalizedRecord>& records) const;

    ValidationSettings settings_;
};

} // namespace TXR::Validation
