#include "csv/transaction_csv.hpp"
#include "engine/engine_config.hpp"
#include "engine/reconciliation_engine.hpp"
#include "engine/report_writer.hpp"
#include "infrastructure/cli/option_parser.hpp"
#include "infrastructure/logging/logger.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace {

const char* kVersion = "1.0.0";

// EN: Exit codes: 0 success, 1 configuration or I/O failure, 2 a hard quality check failed
// FR: Codes de sortie : 0 succès, 1 échec de configuration ou d'E/S, 2 un contrôle qualité bloquant a échoué
constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;
constexpr int kExitQualityGate = 2;

TXR::CLI::OptionParser buildParser() {
    using TXR::CLI::CliOptionDefinition;
    using TXR::CLI::CliOptionType;

    TXR::CLI::OptionParser parser("txrctl");
    parser.setHelpHeader("txrctl - transaction reconciliation and data quality");
    parser.setVersionInfo(kVersion, std::string("built ") + __DATE__ + " " + __TIME__);

    CliOptionDefinition input;
    input.long_name = "input";
    input.short_name = 'i';
    input.description = "Raw transactions CSV file";
    input.required = true;

    CliOptionDefinition config;
    config.long_name = "config";
    config.short_name = 'c';
    config.description = "YAML configuration file";
    config.default_value = "config/txr.yaml";

    CliOptionDefinition output;
    output.long_name = "output";
    output.short_name = 'o';
    output.description = "Canonical CSV output file";

    CliOptionDefinition report;
    report.long_name = "report";
    report.short_name = 'r';
    report.description = "JSON quality report file";

    CliOptionDefinition audit;
    audit.long_name = "audit";
    audit.short_name = 'a';
    audit.description = "JSON duplicate audit file";

    CliOptionDefinition threads;
    threads.long_name = "threads";
    threads.short_name = 't';
    threads.type = CliOptionType::INTEGER;
    threads.description = "Worker threads (overrides engine.worker_threads)";
    threads.config_path = "engine.worker_threads";
    threads.min_value = 0;
    threads.max_value = 256;

    CliOptionDefinition log_level;
    log_level.long_name = "log-level";
    log_level.short_name = 'l';
    log_level.description = "DEBUG, INFO, WARN or ERROR";
    log_level.default_value = "INFO";

    CliOptionDefinition log_file;
    log_file.long_name = "log-file";
    log_file.description = "Write NDJSON logs to this file instead of the console";

    parser.addOptions({input, config, output, report, audit, threads, log_level, log_file});
    return parser;
}

} // namespace

int main(int argc, char* argv[]) {
    TXR::CLI::OptionParser parser = buildParser();
    TXR::CLI::CliParseResult options = parser.parse(argc, argv);

    if (options.status == TXR::CLI::CliParseStatus::HELP_REQUESTED) {
        std::cout << options.help_text;
        return kExitSuccess;
    }
    if (options.status == TXR::CLI::CliParseStatus::VERSION_REQUESTED) {
        std::cout << options.version_text;
        return kExitSuccess;
    }
    if (options.status != TXR::CLI::CliParseStatus::SUCCESS) {
        for (const auto& error : options.errors) {
            std::cerr << "txrctl: " << error << std::endl;
        }
        std::cerr << "Try 'txrctl --help' for more information." << std::endl;
        return kExitFailure;
    }

    auto& logger = TXR::Logger::getInstance();
    TXR::LogLevel level = TXR::LogLevel::INFO;
    if (!TXR::parseLogLevel(options.get("log-level"), level)) {
        std::cerr << "txrctl: unknown log level: " << options.get("log-level") << std::endl;
        return kExitFailure;
    }
    logger.setLogLevel(level);
    if (options.has("log-file") && !logger.setOutputFile(options.get("log-file"))) {
        std::cerr << "txrctl: cannot open log file: " << options.get("log-file") << std::endl;
        return kExitFailure;
    }
    logger.setCorrelationId(logger.generateCorrelationId());

    try {
        TXR::Engine::EngineConfig config =
            TXR::Engine::EngineConfig::loadFromFile(options.get("config"), options.overrides);

        TXR::CSV::TransactionReader reader;
        std::vector<TXR::RawRecord> raw_records;
        TXR::CSV::ParserError read_result = reader.readFile(options.get("input"), raw_records);
        if (read_result != TXR::CSV::ParserError::SUCCESS) {
            std::cerr << "txrctl: cannot read " << options.get("input") << ": "
                      << TXR::CSV::parserErrorToString(read_result) << std::endl;
            logger.flush();
            return kExitFailure;
        }

        TXR::Engine::EngineResult result = TXR::Engine::normalizeAndReconcile(raw_records, config);

        bool written = true;
        if (options.has("output")) {
            written = TXR::CSV::CanonicalWriter::writeFile(options.get("output"), result.canonical.records) && written;
        }
        if (options.has("report")) {
            written = TXR::Engine::ReportWriter::writeQualityReport(options.get("report"), result) && written;
        }
        if (options.has("audit")) {
            written = TXR::Engine::ReportWriter::writeAuditReport(options.get("audit"), result.audit) && written;
        }

        std::cout << result.summary.generateReport() << std::endl;
        std::cout << result.report.generateTextReport() << std::endl;
        logger.flush();

        if (!written) {
            std::cerr << "txrctl: one or more outputs could not be written" << std::endl;
            return kExitFailure;
        }
        return result.report.allHardChecksPassed() ? kExitSuccess : kExitQualityGate;

    } catch (const TXR::Engine::ConfigError& e) {
        std::cerr << "txrctl: configuration error: " << e.what() << std::endl;
        logger.flush();
        return kExitFailure;
    } catch (const std::exception& e) {
        LOG_ERROR("txrctl", std::string("Fatal error: ") + e.what());
        std::cerr << "txrctl: " << e.what() << std::endl;
        logger.flush();
        return kExitFailure;
    }
}
