// EN: Reconciler - collapses duplicate submissions of a transaction into one deterministic survivor
// FR: Réconciliateur - réduit les soumissions dupliquées d'une transaction à un survivant déterministe

#pragma once

#include "types/transaction_record.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace TXR {

class ThreadPool;

namespace Reconcile {

// EN: One discarded duplicate and the survivor that superseded it
// FR: Un doublon écarté et le survivant qui l'a remplacé
struct AuditEntry {
    std::string transaction_id;
    size_t duplicate_row{0};    // EN: Source row of the discarded record / FR: Ligne source de l'enregistrement écarté
    size_t survivor_row{0};     // EN: Source row of the kept record / FR: Ligne source de l'enregistrement conservé
    std::string reason;         // EN: Which part of the sort key decided / FR: Quelle partie de la clé de tri a décidé
};

using AuditTrail = std::vector<AuditEntry>;

// EN: Counters for one reconciliation run
// FR: Compteurs pour une exécution de réconciliation
struct ReconcileStatistics {
    size_t input_records{0};
    size_t partitions{0};               // EN: Distinct transaction ids, all blanks forming one / FR: Ids distincts, tous les vides n'en formant qu'un
    size_t duplicate_groups{0};         // EN: Partitions with more than one member / FR: Partitions avec plus d'un membre
    size_t duplicates_removed{0};
    size_t largest_group{0};
    size_t blank_transaction_ids{0};
    std::chrono::duration<double> duration{0};

    std::string generateReport() const;
};

struct ReconcileResult {
    std::vector<NormalizedRecord> canonical;    // EN: Survivors ordered by source row / FR: Survivants triés par ligne source
    std::vector<NormalizedRecord> duplicates;   // EN: Discarded records ordered by source row / FR: Enregistrements écartés triés par ligne source
    AuditTrail audit;                           // EN: Ordered by duplicate row / FR: Trié par ligne du doublon
    ReconcileStatistics statistics;
};

// EN: 0 when the raw email already had the valid shape, 1 otherwise.
// FR: 0 si l'email brut avait déjà la forme valide, 1 sinon.
int emailCompletenessRank(const NormalizedRecord& record);

// EN: Survivor ordering: completeness rank, then earliest order date (missing dates last),
//     then earliest source row. Strict weak ordering, so the choice never depends on input order.
// FR: Ordre des survivants : rang de complétude, puis date la plus ancienne (dates manquantes en
//     dernier), puis ligne source la plus petite. Ordre faible strict, le choix ne dépend jamais de l'ordre d'entrée.
bool survivorPrecedes(const NormalizedRecord& lhs, const NormalizedRecord& rhs);

// EN: Names the first key component that separates survivor from duplicate.
// FR: Nomme la première composante de clé qui sépare le survivant du doublon.
std::string explainPrecedence(const NormalizedRecord& survivor, const NormalizedRecord& duplicate);

class Reconciler {
public:
    Reconciler() = default;

    // EN: Partition by transaction id and keep the first record of each partition under
    //     survivorPrecedes. With a pool, partitions are resolved in parallel.
    // FR: Partitionne par id de transaction et garde le premier enregistrement de chaque
    //     partition selon survivorPrecedes. Avec un pool, les partitions sont résolues en parallèle.
    ReconcileResult reconcile(std::vector<NormalizedRecord> records, ThreadPool* pool = nullptr) const;

private:
    struct PartitionOutcome {
        size_t survivor{0};
        std::vector<size_t> duplicates;
    };

    static PartitionOutcome resolvePartition(const std::vector<NormalizedRecord>& records,
                                             std::vector<size_t> members);
};

} // namespace Reconcile
} // namespace TXR
