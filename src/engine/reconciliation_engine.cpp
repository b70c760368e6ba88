// EN: Reconciliation engine implementation
// FR: Implémentation du moteur de réconciliation

#include "engine/reconciliation_engine.hpp"
#include "infrastructure/logging/logger.hpp"
#include "infrastructure/threading/thread_pool.hpp"
#include "normalize/text_utils.hpp"

#include <memory>
#include <regex>
#include <sstream>
#include <unordered_set>

namespace TXR {
namespace Engine {

// EN: RawProfile implementation
// FR: Implémentation de RawProfile

RawProfile RawProfile::compute(const std::vector<RawRecord>& records) {
    static const std::regex integer_pattern(R"(^[+-]?\d+$)");

    RawProfile profile;
    profile.total_records = records.size();

    std::unordered_set<std::string> ids;
    size_t non_blank_ids = 0;

    for (const auto& record : records) {
        std::string id = Normalize::trim(record.transaction_id);
        if (!id.empty()) {
            non_blank_ids++;
            ids.insert(id);
        }

        if (isMissingValue(record.customer_email)) profile.missing_emails++;
        if (isMissingValue(record.currency)) profile.missing_currency++;
        if (!record.category || Normalize::trim(*record.category).empty()) profile.missing_category++;

        std::string quantity = Normalize::trim(record.quantity);
        if (quantity.empty()) {
            continue;
        }
        if (!std::regex_match(quantity, integer_pattern)) {
            profile.non_numeric_quantities++;
        } else if (quantity.front() == '-' && quantity.find_first_not_of("-0") != std::string::npos) {
            profile.negative_quantities++;
        } else if (quantity.find_first_not_of("+-0") == std::string::npos) {
            profile.zero_quantities++;
        }
    }

    profile.distinct_transaction_ids = ids.size();
    profile.duplicate_submissions = non_blank_ids - ids.size();
    return profile;
}

nlohmann::json RawProfile::toJson() const {
    return nlohmann::json{
        {"total_records", total_records},
        {"distinct_transaction_ids", distinct_transaction_ids},
        {"duplicate_submissions", duplicate_submissions},
        {"missing_emails", missing_emails},
        {"missing_currency", missing_currency},
        {"missing_category", missing_category},
        {"negative_quantities", negative_quantities},
        {"zero_quantities", zero_quantities},
        {"non_numeric_quantities", non_numeric_quantities}
    };
}

// EN: CleaningSummary implementation
// FR: Implémentation de CleaningSummary

nlohmann::json CleaningSummary::toJson() const {
    nlohmann::json json{
        {"raw_records", raw_records},
        {"canonical_records", canonical_records},
        {"duplicates_removed", duplicates_removed},
        {"emails_inferred", emails_inferred},
        {"emails_repaired", emails_repaired},
        {"quantities_adjusted", quantities_adjusted},
        {"ambiguous_dates", ambiguous_dates}
    };
    json["unparsed_fields"] = nlohmann::json::object();
    for (const auto& [field, count] : unparsed_fields) {
        json["unparsed_fields"][field] = count;
    }
    return json;
}

std::string CleaningSummary::generateReport() const {
    std::ostringstream oss;
    oss << "=== Cleaning Summary ===\n";
    oss << "Raw Records: " << raw_records << "\n";
    oss << "Cleaned Records: " << canonical_records << "\n";
    oss << "Duplicates Removed: " << duplicates_removed << "\n";
    oss << "Emails Inferred: " << emails_inferred << "\n";
    oss << "Emails Repaired: " << emails_repaired << "\n";
    oss << "Quantities Adjusted: " << quantities_adjusted << "\n";
    oss << "Ambiguous Dates: " << ambiguous_dates << "\n";
    for (const auto& [field, count] : unparsed_fields) {
        oss << "Unparsed " << field << ": " << count << "\n";
    }
    return oss.str();
}

// EN: ReconciliationEngine implementation
// FR: Implémentation de ReconciliationEngine

// EN: Hand-built configurations may leave the canonical country set empty; derive it from the synonym keys.
// FR: Une configuration construite à la main peut laisser l'ensemble des pays canoniques vide ; dérivé des clés de synonymes.
EngineConfig ReconciliationEngine::withCanonicalCountries(EngineConfig config) {
    if (config.validation.canonical_countries.empty()) {
        for (const auto& [canonical, aliases] : config.normalizer.country_synonyms) {
            config.validation.canonical_countries.insert(canonical);
        }
    }
    return config;
}

Normalize::RecordNormalizer ReconciliationEngine::buildNormalizer(const EngineConfig& config) {
    config.validate();
    try {
        return Normalize::RecordNormalizer(config.normalizer);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(std::string("Invalid lookup table: ") + e.what());
    }
}

ReconciliationEngine::ReconciliationEngine(EngineConfig config)
    : config_(withCanonicalCountries(std::move(config))),
      normalizer_(buildNormalizer(config_)),
      validator_(config_.validation) {}

EngineResult ReconciliationEngine::run(const std::vector<RawRecord>& raw_records) const {
    EngineResult result;
    result.profile = RawProfile::compute(raw_records);

    LOG_INFO_META("engine", "Normalization started", {
        {"raw_records", std::to_string(raw_records.size())},
        {"worker_threads", std::to_string(config_.worker_threads)}
    });

    // EN: Worker pool only lives for this run; inline when one thread or fewer is requested.
    // FR: Le pool de workers ne vit que pour cette exécution ; en ligne si un thread ou moins est demandé.
    std::unique_ptr<ThreadPool> pool;
    if (config_.worker_threads > 1) {
        ThreadPoolConfig pool_config;
        pool_config.worker_threads = config_.worker_threads;
        pool_config.name = "engine_pool";
        pool = std::make_unique<ThreadPool>(pool_config);
    }

    std::vector<NormalizedRecord> normalized =
        normalizer_.normalizeAll(raw_records, pool.get(), config_.chunk_size);

    size_t records_with_issues = 0;
    for (const auto& record : normalized) {
        if (!record.issues.empty()) records_with_issues++;
    }
    LOG_INFO_META("engine", "Normalization completed", {
        {"records", std::to_string(normalized.size())},
        {"records_with_issues", std::to_string(records_with_issues)}
    });

    Reconcile::ReconcileResult reconciled = reconciler_.reconcile(std::move(normalized), pool.get());
    if (pool) {
        pool->shutdown();
    }

    result.canonical.records = std::move(reconciled.canonical);
    result.duplicates = std::move(reconciled.duplicates);
    result.audit = std::move(reconciled.audit);

    result.report = validator_.validate(result.canonical.records);

    CleaningSummary& summary = result.summary;
    summary.raw_records = raw_records.size();
    summary.canonical_records = result.canonical.size();
    summary.duplicates_removed = result.duplicates.size();
    for (const auto& record : result.canonical.records) {
        if (record.email_was_inferred) summary.emails_inferred++;
        if (record.email_was_repaired) summary.emails_repaired++;
        if (record.quantity_was_adjusted) summary.quantities_adjusted++;
        if (record.date_was_ambiguous) summary.ambiguous_dates++;
        for (const auto& issue : record.issues) {
            summary.unparsed_fields[issue.field]++;
        }
    }

    LOG_INFO_META("engine", "Run completed", {
        {"canonical_records", std::to_string(summary.canonical_records)},
        {"duplicates_removed", std::to_string(summary.duplicates_removed)},
        {"validation_score", std::to_string(result.report.getScore())}
    });
    return result;
}

EngineResult normalizeAndReconcile(const std::vector<RawRecord>& raw_records, const EngineConfig& config) {
    ReconciliationEngine engine(config);
    return engine.run(raw_records);
}

} // namespace Engine
} // namespace TXR
