// EN: Report writer - JSON quality report and audit trail for a finished engine run
// FR: Rédacteur de rapports - rapport qualité JSON et piste d'audit pour une exécution terminée

#pragma once

#include "engine/reconciliation_engine.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace TXR {
namespace Engine {

class ReportWriter {
public:
    // EN: Full quality report: raw profile, cleaning summary, validation checks and unparsed fields.
    // FR: Rapport qualité complet : profil brut, résumé de nettoyage, contrôles de validation et champs non analysés.
    static nlohmann::json buildQualityReport(const EngineResult& result);

    // EN: One entry per field that could not be parsed, with its raw text, in canonical row order.
    // FR: Une entrée par champ non analysable, avec son texte brut, dans l'ordre des lignes canoniques.
    static nlohmann::json buildUnparsedRecords(const std::vector<NormalizedRecord>& records);

    static nlohmann::json buildAuditReport(const Reconcile::AuditTrail& audit);

    // EN: Pretty-printed with 2-space indentation. Returns false and logs on I/O failure.
    // FR: Indenté sur 2 espaces. Retourne false et journalise en cas d'échec d'E/S.
    static bool writeQualityReport(const std::string& file_path, const EngineResult& result);
    static bool writeAuditReport(const std::string& file_path, const Reconcile::AuditTrail& audit);

private:
    static bool writeJson(const std::string& file_path, const nlohmann::json& json);
};

} // namespace Engine
} // namespace TXR
