// EN: Quality validator implementation
// FR: Implémentation du validateur de qualité

#include "validation/quality_validator.hpp"
#include "normalize/email_repairer.hpp"
#include "infrastructure/logging/logger.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

namespace TXR::Validation {

namespace {

double roundTo(double value, int digits) {
    double factor = std::pow(10.0, digits);
    return std::round(value * factor) / factor;
}

CheckResult makeCheck(int order, const std::string& name, CheckSeverity severity) {
    CheckResult check;
    check.order = order;
    check.name = name;
    check.severity = severity;
    return check;
}

// EN: Hard checks fail, advisory checks warn.
// FR: Les contrôles bloquants échouent, les contrôles consultatifs avertissent.
void settle(CheckResult& check, bool ok, const std::string& failure_detail) {
    if (ok) {
        check.status = CheckStatus::PASSED;
        check.detail = "No issues found";
        return;
    }
    check.status = check.severity == CheckSeverity::HARD ? CheckStatus::FAILED : CheckStatus::WARNING;
    check.detail = failure_detail;
}

} // namespace

std::string checkSeverityToString(CheckSeverity severity) {
    switch (severity) {
        case CheckSeverity::HARD:          return "HARD";
        case CheckSeverity::ADVISORY:      return "ADVISORY";
        case CheckSeverity::INFORMATIONAL: return "INFORMATIONAL";
        default:                           return "UNKNOWN";
    }
}

std::string checkStatusToString(CheckStatus status) {
    switch (status) {
        case CheckStatus::PASSED:  return "PASSED";
        case CheckStatus::FAILED:  return "FAILED";
        case CheckStatus::WARNING: return "WARNING";
        case CheckStatus::INFO:    return "INFO";
        default:                   return "UNKNOWN";
    }
}

// EN: ValidationReport implementation
// FR: Implémentation de ValidationReport

std::optional<CheckResult> ValidationReport::getCheck(const std::string& name) const {
    for (const auto& check : checks_) {
        if (check.name == name) {
            return check;
        }
    }
    return std::nullopt;
}

size_t ValidationReport::getHardCheckCount() const {
    size_t count = 0;
    for (const auto& check : checks_) {
        if (check.severity == CheckSeverity::HARD) {
            count++;
        }
    }
    return count;
}

size_t ValidationReport::getHardChecksPassed() const {
    size_t count = 0;
    for (const auto& check : checks_) {
        if (check.severity == CheckSeverity::HARD && check.passed()) {
            count++;
        }
    }
    return count;
}

bool ValidationReport::allHardChecksPassed() const {
    return getHardChecksPassed() == getHardCheckCount();
}

double ValidationReport::getScore() const {
    size_t hard = getHardCheckCount();
    if (hard == 0) {
        return 100.0;
    }
    return roundTo(static_cast<double>(getHardChecksPassed()) / static_cast<double>(hard) * 100.0, 1);
}

std::string ValidationReport::generateTextReport() const {
    std::ostringstream oss;
    oss << "=== Data Quality Validation ===\n";
    oss << "Records validated: " << record_count_ << "\n\n";

    for (const auto& check : checks_) {
        oss << std::setw(2) << check.order << ". "
            << std::left << std::setw(32) << check.name << std::right
            << " [" << checkStatusToString(check.status) << "] ";
        if (check.metric) {
            oss << std::fixed << std::setprecision(2) << *check.metric << " - ";
        }
        oss << check.detail << "\n";
    }

    oss << "\nOverall Validation Score: " << std::fixed << std::setprecision(1) << getScore()
        << "% (" << getHardChecksPassed() << "/" << getHardCheckCount() << " tests passed)\n";
    return oss.str();
}

nlohmann::json ValidationReport::toJson() const {
    nlohmann::json json;
    json["record_count"] = record_count_;
    json["score"] = getScore();
    json["hard_checks_passed"] = getHardChecksPassed();
    json["hard_checks_total"] = getHardCheckCount();
    json["all_hard_checks_passed"] = allHardChecksPassed();

    nlohmann::json checks = nlohmann::json::array();
    for (const auto& check : checks_) {
        nlohmann::json entry;
        entry["order"] = check.order;
        entry["name"] = check.name;
        entry["severity"] = checkSeverityToString(check.severity);
        entry["status"] = checkStatusToString(check.status);
        entry["offending_count"] = check.offending_count;
        if (check.metric) {
            entry["metric"] = *check.metric;
        } else {
            entry["metric"] = nullptr;
        }
        entry["detail"] = check.detail;
        checks.push_back(std::move(entry));
    }
    json["checks"] = std::move(checks);
    return json;
}

bool ValidationReport::operator==(const ValidationReport& other) const {
    if (record_count_ != other.record_count_ || checks_.size() != other.checks_.size()) {
        return false;
    }
    for (size_t i = 0; i < checks_.size(); ++i) {
        const auto& a = checks_[i];
        const auto& b = other.checks_[i];
        if (a.order != b.order || a.name != b.name || a.severity != b.severity ||
            a.status != b.status || a.offending_count != b.offending_count ||
            a.metric != b.metric || a.detail != b.detail) {
            return false;
        }
    }
    return true;
}

// EN: QualityValidator implementation
// FR: Implémentation de QualityValidator

QualityValidator::QualityValidator(ValidationSettings settings) : settings_(std::move(settings)) {}

ValidationReport QualityValidator::validate(const std::vector<NormalizedRecord>& records) const {
    ValidationReport report;
    report.setRecordCount(records.size());

    report.addCheck(checkCriticalFields(records));
    report.addCheck(checkUniqueTransactionIds(records));
    report.addCheck(checkEmailShape(records));
    report.addCheck(checkDateWindow(records));
    report.addCheck(checkAmountRange(records));
    report.addCheck(checkQuantityRange(records));
    report.addCheck(checkCountryCardinality(records));
    report.addCheck(checkCurrencyTracking(records));
    report.addCheck(checkCompleteness(records));
    report.addCheck(checkAmountOutliers(records));

    LOG_INFO_META("quality_validator", "Validation completed", {
        {"records", std::to_string(records.size())},
        {"hard_checks_passed", std::to_string(report.getHardChecksPassed())},
        {"hard_checks_total", std::to_string(report.getHardCheckCount())}
    });
    return report;
}

CheckResult QualityValidator::checkCriticalFields(const std::vector<NormalizedRecord>& records) const {
    CheckResult check = makeCheck(1, "Critical Fields NULL Check", CheckSeverity::HARD);
    for (const auto& record : records) {
        if (record.transaction_id.empty() || record.customer_id.empty() || record.customer_email.empty() ||
            !record.order_date.has_value() || !record.amount_usd.has_value()) {
            check.offending_count++;
        }
    }
    settle(check, check.offending_count == 0,
           "Found " + std::to_string(check.offending_count) + " records with NULL values");
    return check;
}

CheckResult QualityValidator::checkUniqueTransactionIds(const std::vector<NormalizedRecord>& records) const {
    CheckResult check = makeCheck(2, "Duplicate Transaction IDs", CheckSeverity::HARD);
    std::unordered_map<std::string, size_t> counts;
    for (const auto& record : records) {
        counts[record.transaction_id]++;
    }
    for (const auto& [id, count] : counts) {
        if (count > 1) {
            check.offending_count++;
        }
    }
    settle(check, check.offending_count == 0,
           "Found " + std::to_string(check.offending_count) + " duplicate transaction IDs");
    return check;
}

CheckResult QualityValidator::checkEmailShape(const std::vector<NormalizedRecord>& records) const {
    CheckResult check = makeCheck(3, "Email Format Validation", CheckSeverity::HARD);
    for (const auto& record : records) {
        if (!Normalize::EmailRepairer::isValidShape(record.customer_email)) {
            check.offending_count++;
        }
    }
    settle(check, check.offending_count == 0,
           "Found " + std::to_string(check.offending_count) + " invalid email formats");
    return check;
}

CheckResult QualityValidator::checkDateWindow(const std::vector<NormalizedRecord>& records) const {
    CheckResult check = makeCheck(4, "Date Range Check", CheckSeverity::HARD);
    for (const auto& record : records) {
        if (record.order_date &&
            (*record.order_date < settings_.date_window_start || *record.order_date > settings_.date_window_end)) {
            check.offending_count++;
        }
    }
    settle(check, check.offending_count == 0,
           "Found " + std::to_string(check.offending_count) + " dates outside " +
           settings_.date_window_start.toIsoString() + ".." + settings_.date_window_end.toIsoString());
    return check;
}

CheckResult QualityValidator::checkAmountRange(const std::vector<NormalizedRecord>& records) const {
    CheckResult check = makeCheck(5, "Amount Range Validation", CheckSeverity::HARD);
    for (const auto& record : records) {
        if (record.amount_usd &&
            (!record.amount_usd->isPositive() || *record.amount_usd > settings_.amount_ceiling)) {
            check.offending_count++;
        }
    }
    settle(check, check.offending_count == 0,
           "Found " + std::to_string(check.offending_count) + " records with invalid amounts");
    return check;
}

CheckResult QualityValidator::checkQuantityRange(const std::vector<NormalizedRecord>& records) const {
    CheckResult check = makeCheck(6, "Quantity Validation", CheckSeverity::HARD);
    for (const auto& record : records) {
        if (!record.quantity || *record.quantity <= 0 || *record.quantity > settings_.quantity_ceiling) {
            check.offending_count++;
        }
    }
    settle(check, check.offending_count == 0,
           "Found " + std::to_string(check.offending_count) + " records with invalid quantities");
    return check;
}

CheckResult QualityValidator::checkCountryCardinality(const std::vector<NormalizedRecord>& records) const {
    CheckResult check = makeCheck(7, "Country Standardization", CheckSeverity::ADVISORY);
    std::unordered_set<std::string> distinct;
    for (const auto& record : records) {
        distinct.insert(record.ship_country);
        if (settings_.canonical_countries.count(record.ship_country) == 0) {
            check.offending_count++;
        }
    }
    check.metric = static_cast<double>(distinct.size());
    std::string detail = std::to_string(distinct.size()) + " unique country values (ceiling " +
                         std::to_string(settings_.country_ceiling) + "), " +
                         std::to_string(check.offending_count) + " records outside the canonical set";
    settle(check, distinct.size() <= settings_.country_ceiling, detail);
    // EN: Non-canonical rows are reported even when the ceiling holds.
    // FR: Les lignes non canoniques sont signalées même si le plafond est respecté.
    if (check.offending_count > 0) {
        check.detail = detail;
    }
    return check;
}

CheckResult QualityValidator::checkCurrencyTracking(const std::vector<NormalizedRecord>& records) const {
    CheckResult check = makeCheck(8, "Currency Tracking", CheckSeverity::ADVISORY);
    for (const auto& record : records) {
        if (record.currency_detected.empty()) {
            check.offending_count++;
        }
    }
    settle(check, check.offending_count == 0,
           std::to_string(check.offending_count) + " records missing original currency");
    return check;
}

CheckResult QualityValidator::checkCompleteness(const std::vector<NormalizedRecord>& records) const {
    CheckResult check = makeCheck(9, "Data Completeness Score", CheckSeverity::INFORMATIONAL);
    check.status = CheckStatus::INFO;

    size_t complete_ids = 0;
    size_t complete_emails = 0;
    size_t original_emails = 0;
    for (const auto& record : records) {
        if (!record.transaction_id.empty()) complete_ids++;
        if (!record.customer_email.empty()) complete_emails++;
        if (!record.email_was_inferred) original_emails++;
    }

    double score = 0.0;
    if (!records.empty()) {
        score = static_cast<double>(complete_ids + complete_emails + original_emails) /
                static_cast<double>(records.size() * 3) * 100.0;
    }
    check.metric = roundTo(score, 2);

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << *check.metric << "% complete";
    check.detail = oss.str();
    return check;
}

CheckResult QualityValidator::checkAmountOutliers(const std::vector<NormalizedRecord>& records) const {
    CheckResult check = makeCheck(10, "Statistical Outliers", CheckSeverity::INFORMATIONAL);

    std::vector<double> amounts;
    amounts.reserve(records.size());
    for (const auto& record : records) {
        if (record.amount_usd) {
            amounts.push_back(record.amount_usd->toDouble());
        }
    }

    // EN: Sample standard deviation is undefined below two values.
    // FR: L'écart-type d'échantillon n'est pas défini sous deux valeurs.
    if (amounts.size() >= 2) {
        double mean = 0.0;
        for (double amount : amounts) mean += amount;
        mean /= static_cast<double>(amounts.size());

        double squares = 0.0;
        for (double amount : amounts) squares += (amount - mean) * (amount - mean);
        double stddev = std::sqrt(squares / static_cast<double>(amounts.size() - 1));

        double low = mean - settings_.outlier_sigma * stddev;
        double high = mean + settings_.outlier_sigma * stddev;
        for (double amount : amounts) {
            if (amount < low || amount > high) {
                check.offending_count++;
            }
        }
        check.metric = roundTo(stddev, 2);
    }

    if (check.offending_count == 0) {
        check.status = CheckStatus::PASSED;
        check.detail = "No statistical outliers";
    } else {
        check.status = CheckStatus::INFO;
        std::ostringstream oss;
        oss << "Found " << check.offending_count << " statistical outliers (>"
            << settings_.outlier_sigma << " std dev)";
        check.detail = oss.str();
    }
    return check;
}

} // namespace TXR::Validation
