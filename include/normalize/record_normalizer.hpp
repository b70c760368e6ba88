// EN: Record normalizer - applies every field normalizer to a raw record, never dropping it
// FR: Normaliseur d'enregistrement - applique chaque normaliseur de champ à un enregistrement brut, sans jamais l'écarter

#pragma once

#include "normalize/amount_normalizer.hpp"
#include "normalize/category_normalizer.hpp"
#include "normalize/country_normalizer.hpp"
#include "normalize/date_normalizer.hpp"
#include "normalize/email_repairer.hpp"
#include "normalize/quantity_clamper.hpp"
#include "types/transaction_record.hpp"

#include <vector>

namespace TXR {

class ThreadPool;

namespace Normalize {

// EN: Lookup tables and policies shared (read-only) by all field normalizers
// FR: Tables de correspondance et politiques partagées (lecture seule) par tous les normaliseurs
struct RecordNormalizerConfig {
    ExchangeRateTable exchange_rates;
    SynonymTable country_synonyms;
    SynonymTable category_aliases;
    EmailRepairConfig email;
    int quantity_ceiling{100};
    std::string missing_category{"Uncategorized"};
};

class RecordNormalizer {
public:
    // EN: Throws std::invalid_argument if the country table is inconsistent.
    // FR: Lance std::invalid_argument si la table des pays est incohérente.
    explicit RecordNormalizer(const RecordNormalizerConfig& config);

    // EN: Normalize one record. Field failures become FieldIssue entries on the result.
    // FR: Normalise un enregistrement. Les échecs de champ deviennent des FieldIssue sur le résultat.
    NormalizedRecord normalize(const RawRecord& raw, size_t source_row) const;

    // EN: Normalize a batch. With a pool, chunks run in parallel and write into
    //     pre-sized slots, so the output order always matches the input order.
    // FR: Normalise un lot. Avec un pool, les chunks s'exécutent en parallèle et écrivent
    //     dans des emplacements pré-alloués : l'ordre de sortie suit toujours l'entrée.
    std::vector<NormalizedRecord> normalizeAll(const std::vector<RawRecord>& raw_records,
                                               ThreadPool* pool = nullptr,
                                               size_t chunk_size = 1024) const;

    const AmountNormalizer& amounts() const { return amount_normalizer_; }
    const DateNormalizer& dates() const { return date_normalizer_; }
    const EmailRepairer& emails() const { return email_repairer_; }
    const CountryNormalizer& countries() const { return country_normalizer_; }
    const QuantityClamper& quantities() const { return quantity_clamper_; }
    const CategoryNormalizer& categories() const { return category_normalizer_; }

private:
    void normalizeRange(const std::vector<RawRecord>& raw_records,
                        std::vector<NormalizedRecord>& output,
                        size_t begin, size_t end) const;

    AmountNormalizer amount_normalizer_;
    DateNormalizer date_normalizer_;
    EmailRepairer email_repairer_;
    CountryNormalizer country_normalizer_;
    QuantityClamper quantity_clamper_;
    CategoryNormalizer category_normalizer_;
};

} // namespace Normalize
} // namespace TXR
