// EN: Reconciliation engine - raw records in, canonical dataset, quality report and audit trail out
// FR: Moteur de réconciliation - enregistrements bruts en entrée, jeu canonique, rapport qualité et piste d'audit en sortie

#pragma once

#include "engine/engine_config.hpp"
#include "normalize/record_normalizer.hpp"
#include "reconcile/reconciler.hpp"
#include "types/transaction_record.hpp"
#include "validation/quality_validator.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <vector>

namespace TXR {
namespace Engine {

// EN: Profile of the raw batch before any cleaning
// FR: Profil du lot brut avant tout nettoyage
struct RawProfile {
    size_t total_records{0};
    size_t distinct_transaction_ids{0};     // EN: Non-blank ids / FR: Ids non vides
    size_t duplicate_submissions{0};        // EN: Non-blank rows minus distinct ids / FR: Lignes non vides moins ids distincts
    size_t missing_emails{0};
    size_t missing_currency{0};
    size_t missing_category{0};
    size_t negative_quantities{0};
    size_t zero_quantities{0};
    size_t non_numeric_quantities{0};

    static RawProfile compute(const std::vector<RawRecord>& records);
    nlohmann::json toJson() const;
};

// EN: What the cleaning changed, counted over the canonical set
// FR: Ce que le nettoyage a changé, compté sur l'ensemble canonique
struct CleaningSummary {
    size_t raw_records{0};
    size_t canonical_records{0};
    size_t duplicates_removed{0};
    size_t emails_inferred{0};
    size_t emails_repaired{0};
    size_t quantities_adjusted{0};
    size_t ambiguous_dates{0};
    std::map<std::string, size_t> unparsed_fields;  // EN: Field name to count / FR: Nom de champ vers nombre

    nlohmann::json toJson() const;
    std::string generateReport() const;
};

// EN: Kept records, unique by transaction id, ordered by source row
// FR: Enregistrements conservés, uniques par id de transaction, triés par ligne source
struct CanonicalDataset {
    std::vector<NormalizedRecord> records;

    size_t size() const { return records.size(); }
    bool empty() const { return records.empty(); }
};

struct EngineResult {
    CanonicalDataset canonical;
    Validation::ValidationReport report;
    Reconcile::AuditTrail audit;
    CleaningSummary summary;
    RawProfile profile;
    std::vector<NormalizedRecord> duplicates;
};

class ReconciliationEngine {
public:
    // EN: Builds every normalizer up front; an inconsistent configuration throws ConfigError here,
    //     before any record is touched.
    // FR: Construit tous les normaliseurs d'avance ; une configuration incohérente lance ConfigError
    //     ici, avant de toucher le moindre enregistrement.
    explicit ReconciliationEngine(EngineConfig config);

    // EN: Pure batch transformation: normalize, reconcile, validate.
    // FR: Transformation par lot pure : normaliser, réconcilier, valider.
    EngineResult run(const std::vector<RawRecord>& raw_records) const;

    const EngineConfig& getConfig() const { return config_; }

private:
    static EngineConfig withCanonicalCountries(EngineConfig config);
    static Normalize::RecordNormalizer buildNormalizer(const EngineConfig& config);

    EngineConfig config_;
    Normalize::RecordNormalizer normalizer_;
    Reconcile::Reconciler reconciler_;
    Validation::QualityValidator validator_;
};

// EN: Single entry point of the core.
// FR: Point d'entrée unique du cœur.
EngineResult normalizeAndReconcile(const std::vector<RawRecord>& raw_records, const EngineConfig& config);

} // namespace Engine
} // namespace TXR
