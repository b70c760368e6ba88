// EN: Record normalizer implementation
// FR: Implémentation du normaliseur d'enregistrement

#include "normalize/record_normalizer.hpp"
#include "normalize/normalization_error.hpp"
#include "normalize/text_utils.hpp"
#include "infrastructure/logging/logger.hpp"
#include "infrastructure/threading/thread_pool.hpp"

#include <algorithm>
#include <future>

namespace TXR {
namespace Normalize {

namespace {

void recordIssue(NormalizedRecord& record, const NormalizationException& e) {
    FieldIssue issue;
    issue.field = e.field();
    issue.raw_value = e.rawValue();
    issue.code = normalizationErrorToString(e.code());
    issue.message = e.what();
    record.issues.push_back(std::move(issue));

    LOG_DEBUG_META("record_normalizer", e.what(), {
        {"row", std::to_string(record.source_row)},
        {"transaction_id", record.transaction_id},
        {"field", e.field()},
        {"code", normalizationErrorToString(e.code())}
    });
}

} // namespace

RecordNormalizer::RecordNormalizer(const RecordNormalizerConfig& config)
    : amount_normalizer_(config.exchange_rates),
      email_repairer_(config.email),
      country_normalizer_(config.country_synonyms),
      quantity_clamper_(config.quantity_ceiling),
      category_normalizer_(config.category_aliases, config.missing_category) {}

NormalizedRecord RecordNormalizer::normalize(const RawRecord& raw, size_t source_row) const {
    NormalizedRecord record;
    record.source_row = source_row;
    record.transaction_id = trim(raw.transaction_id);
    record.customer_id = trim(raw.customer_id);
    record.product_sku = trim(raw.product_sku);
    record.payment_method = trim(raw.payment_method);

    // EN: Currency is resolved independently so it is set even when the amount fails.
    // FR: La devise est résolue séparément pour être définie même si le montant échoue.
    record.currency_detected = amount_normalizer_.resolveCurrency(raw.amount, raw.currency);
    try {
        AmountResult amount = amount_normalizer_.normalize(raw.amount, raw.currency);
        record.amount_original = amount.amount_original;
        record.amount_usd = amount.amount_usd;
    } catch (const NormalizationException& e) {
        recordIssue(record, e);
    }

    try {
        DateResult date = date_normalizer_.normalize(raw.order_date);
        record.order_date = date.date;
        record.date_was_ambiguous = date.ambiguous;
    } catch (const NormalizationException& e) {
        recordIssue(record, e);
    }

    try {
        EmailResult email = email_repairer_.repair(raw.customer_email, raw.customer_id);
        record.customer_email = email.email;
        record.email_was_inferred = email.inferred;
        record.email_was_repaired = email.repaired;
        record.raw_email_complete = email.raw_complete;
    } catch (const NormalizationException& e) {
        record.customer_email = trim(raw.customer_email.value_or(""));
        recordIssue(record, e);
    }

    try {
        QuantityResult quantity = quantity_clamper_.normalize(raw.quantity);
        record.quantity = quantity.quantity;
        record.quantity_was_adjusted = quantity.adjusted;
    } catch (const NormalizationException& e) {
        recordIssue(record, e);
    }

    record.ship_country = country_normalizer_.normalize(raw.ship_country);
    record.category = category_normalizer_.normalize(raw.category);
    return record;
}

void RecordNormalizer::normalizeRange(const std::vector<RawRecord>& raw_records,
                                      std::vector<NormalizedRecord>& output,
                                      size_t begin, size_t end) const {
    for (size_t i = begin; i < end; ++i) {
        output[i] = normalize(raw_records[i], i + 1);
    }
}

std::vector<NormalizedRecord> RecordNormalizer::normalizeAll(const std::vector<RawRecord>& raw_records,
                                                             ThreadPool* pool,
                                                             size_t chunk_size) const {
    std::vector<NormalizedRecord> output(raw_records.size());
    if (chunk_size == 0) {
        chunk_size = 1;
    }

    if (pool == nullptr || raw_records.size() <= chunk_size) {
        normalizeRange(raw_records, output, 0, raw_records.size());
        return output;
    }

    std::vector<std::future<void>> futures;
    for (size_t begin = 0; begin < raw_records.size(); begin += chunk_size) {
        size_t end = std::min(begin + chunk_size, raw_records.size());
        futures.push_back(pool->submitNamed("normalize_chunk", [this, &raw_records, &output, begin, end]() {
            normalizeRange(raw_records, output, begin, end);
        }));
    }

    // EN: Every chunk finishes before get() rethrows, so no task outlives the output slots.
    // FR: Chaque chunk se termine avant que get() ne relance, aucune tâche ne survit aux emplacements.
    for (auto& future : futures) {
        future.wait();
    }
    for (auto& future : futures) {
        future.get();
    }
    return output;
}

} // namespace Normalize
} // namespace TXR
