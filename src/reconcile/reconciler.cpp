// EN: Reconciler implementation - deterministic sort + first-wins reduction per transaction id
// FR: Implémentation du réconciliateur - tri déterministe + premier gagnant par id de transaction

#include "reconcile/reconciler.hpp"
#include "infrastructure/logging/logger.hpp"
#include "infrastructure/threading/thread_pool.hpp"

#include <algorithm>
#include <future>
#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace TXR {
namespace Reconcile {

int emailCompletenessRank(const NormalizedRecord& record) {
    return record.raw_email_complete ? 0 : 1;
}

bool survivorPrecedes(const NormalizedRecord& lhs, const NormalizedRecord& rhs) {
    int lhs_rank = emailCompletenessRank(lhs);
    int rhs_rank = emailCompletenessRank(rhs);
    if (lhs_rank != rhs_rank) {
        return lhs_rank < rhs_rank;
    }

    if (lhs.order_date.has_value() != rhs.order_date.has_value()) {
        return lhs.order_date.has_value();
    }
    if (lhs.order_date && rhs.order_date && *lhs.order_date != *rhs.order_date) {
        return *lhs.order_date < *rhs.order_date;
    }

    return lhs.source_row < rhs.source_row;
}

std::string explainPrecedence(const NormalizedRecord& survivor, const NormalizedRecord& duplicate) {
    if (emailCompletenessRank(survivor) != emailCompletenessRank(duplicate)) {
        return "complete email preferred";
    }
    if (survivor.order_date.has_value() != duplicate.order_date.has_value()) {
        return "order date present";
    }
    if (survivor.order_date && duplicate.order_date && *survivor.order_date != *duplicate.order_date) {
        return "earlier order date";
    }
    return "earlier input row";
}

std::string ReconcileStatistics::generateReport() const {
    std::ostringstream oss;
    oss << "=== Reconciliation Statistics ===\n";
    oss << "Input records: " << input_records << "\n";
    oss << "Partitions: " << partitions << "\n";
    oss << "Duplicate groups: " << duplicate_groups << "\n";
    oss << "Duplicates removed: " << duplicates_removed << "\n";
    oss << "Largest group: " << largest_group << "\n";
    oss << "Blank transaction ids: " << blank_transaction_ids << "\n";
    oss << "Duration: " << std::fixed << std::setprecision(3) << duration.count() << " seconds\n";
    return oss.str();
}

Reconciler::PartitionOutcome Reconciler::resolvePartition(const std::vector<NormalizedRecord>& records,
                                                          std::vector<size_t> members) {
    std::stable_sort(members.begin(), members.end(), [&records](size_t a, size_t b) {
        return survivorPrecedes(records[a], records[b]);
    });

    PartitionOutcome outcome;
    outcome.survivor = members.front();
    outcome.duplicates.assign(members.begin() + 1, members.end());
    return outcome;
}

ReconcileResult Reconciler::reconcile(std::vector<NormalizedRecord> records, ThreadPool* pool) const {
    auto start_time = std::chrono::high_resolution_clock::now();
    ReconcileResult result;
    result.statistics.input_records = records.size();

    // EN: Partitions in order of first appearance; all blank ids share one partition.
    // FR: Partitions dans l'ordre de première apparition ; tous les ids vides partagent une partition.
    std::vector<std::vector<size_t>> partitions;
    std::unordered_map<std::string, size_t> partition_index;
    for (size_t i = 0; i < records.size(); ++i) {
        const std::string& id = records[i].transaction_id;
        if (id.empty()) {
            result.statistics.blank_transaction_ids++;
        }
        auto it = partition_index.find(id);
        if (it == partition_index.end()) {
            partition_index.emplace(id, partitions.size());
            partitions.push_back({i});
        } else {
            partitions[it->second].push_back(i);
        }
    }

    std::vector<PartitionOutcome> outcomes(partitions.size());
    if (pool == nullptr || partitions.size() < 2) {
        for (size_t p = 0; p < partitions.size(); ++p) {
            outcomes[p] = resolvePartition(records, partitions[p]);
        }
    } else {
        // EN: Groups are independent; each task owns a contiguous slice of the outcome slots.
        // FR: Les groupes sont indépendants ; chaque tâche possède une tranche contiguë des emplacements.
        size_t slice = std::max<size_t>(1, partitions.size() / (pool->size() * 4));
        std::vector<std::future<void>> futures;
        for (size_t begin = 0; begin < partitions.size(); begin += slice) {
            size_t end = std::min(begin + slice, partitions.size());
            futures.push_back(pool->submitNamed("reconcile_partitions",
                [&records, &partitions, &outcomes, begin, end]() {
                    for (size_t p = begin; p < end; ++p) {
                        outcomes[p] = resolvePartition(records, partitions[p]);
                    }
                }));
        }
        for (auto& future : futures) {
            future.wait();
        }
        for (auto& future : futures) {
            future.get();
        }
    }

    std::vector<size_t> kept_indices;
    std::vector<size_t> duplicate_indices;
    kept_indices.reserve(outcomes.size());

    for (size_t p = 0; p < outcomes.size(); ++p) {
        const auto& outcome = outcomes[p];
        records[outcome.survivor].status = RecordStatus::KEPT;
        kept_indices.push_back(outcome.survivor);

        size_t group_size = outcome.duplicates.size() + 1;
        result.statistics.largest_group = std::max(result.statistics.largest_group, group_size);
        if (group_size > 1) {
            result.statistics.duplicate_groups++;
        }

        for (size_t duplicate : outcome.duplicates) {
            records[duplicate].status = RecordStatus::DUPLICATE;
            duplicate_indices.push_back(duplicate);

            AuditEntry entry;
            entry.transaction_id = records[duplicate].transaction_id;
            entry.duplicate_row = records[duplicate].source_row;
            entry.survivor_row = records[outcome.survivor].source_row;
            entry.reason = explainPrecedence(records[outcome.survivor], records[duplicate]);
            result.audit.push_back(std::move(entry));
        }
    }
    result.statistics.partitions = partitions.size();
    result.statistics.duplicates_removed = duplicate_indices.size();

    auto by_source_row = [&records](size_t a, size_t b) {
        return records[a].source_row < records[b].source_row;
    };
    std::sort(kept_indices.begin(), kept_indices.end(), by_source_row);
    std::sort(duplicate_indices.begin(), duplicate_indices.end(), by_source_row);
    std::sort(result.audit.begin(), result.audit.end(), [](const AuditEntry& a, const AuditEntry& b) {
        return a.duplicate_row < b.duplicate_row;
    });

    result.canonical.reserve(kept_indices.size());
    for (size_t index : kept_indices) {
        result.canonical.push_back(std::move(records[index]));
    }
    result.duplicates.reserve(duplicate_indices.size());
    for (size_t index : duplicate_indices) {
        result.duplicates.push_back(std::move(records[index]));
    }

    result.statistics.duration = std::chrono::high_resolution_clock::now() - start_time;

    LOG_INFO_META("reconciler", "Reconciliation completed", {
        {"input_records", std::to_string(result.statistics.input_records)},
        {"canonical_records", std::to_string(result.canonical.size())},
        {"duplicates_removed", std::to_string(result.statistics.duplicates_removed)},
        {"duplicate_groups", std::to_string(result.statistics.duplicate_groups)}
    });

    return result;
}

} // namespace Reconcile
} // namespace TXR
