#include "engine/report_writer.hpp"
#include "infrastructure/logging/logger.hpp"

#include <fstream>

namespace TXR {
namespace Engine {

nlohmann::json ReportWriter::buildQualityReport(const EngineResult& result) {
    nlohmann::json report;
    report["profile"] = result.profile.toJson();
    report["summary"] = result.summary.toJson();
    report["validation"] = result.report.toJson();
    report["unparsed_records"] = buildUnparsedRecords(result.canonical.records);
    return report;
}

nlohmann::json ReportWriter::buildUnparsedRecords(const std::vector<NormalizedRecord>& records) {
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& record : records) {
        for (const auto& issue : record.issues) {
            entries.push_back({
                {"transaction_id", record.transaction_id},
                {"source_row", record.source_row},
                {"field", issue.field},
                {"code", issue.code},
                {"raw_value", issue.raw_value},
                {"message", issue.message}
            });
        }
    }
    return entries;
}

nlohmann::json ReportWriter::buildAuditReport(const Reconcile::AuditTrail& audit) {
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& entry : audit) {
        entries.push_back({
            {"transaction_id", entry.transaction_id},
            {"duplicate_row", entry.duplicate_row},
            {"survivor_row", entry.survivor_row},
            {"reason", entry.reason}
        });
    }
    return nlohmann::json{{"duplicates_removed", audit.size()}, {"entries", std::move(entries)}};
}

bool ReportWriter::writeQualityReport(const std::string& file_path, const EngineResult& result) {
    return writeJson(file_path, buildQualityReport(result));
}

bool ReportWriter::writeAuditReport(const std::string& file_path, const Reconcile::AuditTrail& audit) {
    return writeJson(file_path, buildAuditReport(audit));
}

bool ReportWriter::writeJson(const std::string& file_path, const nlohmann::json& json) {
    std::ofstream file(file_path, std::ios::trunc);
    if (!file.is_open()) {
        LOG_ERROR("report_writer", "Cannot open report file: " + file_path);
        return false;
    }
    file << json.dump(2) << '\n';
    file.flush();
    if (!file.good()) {
        LOG_ERROR("report_writer", "Write failed: " + file_path);
        return false;
    }
    LOG_INFO("report_writer", "Report written: " + file_path);
    return true;
}

} // namespace Engine
} // namespace TXR
