// EN: End-to-end tests for ReconciliationEngine and ReportWriter
// FR: Tests de bout en bout pour ReconciliationEngine et ReportWriter

#include <gtest/gtest.h>
#include "csv/transaction_csv.hpp"
#include "engine/reconciliation_engine.hpp"
#include "engine/report_writer.hpp"
#include "infrastructure/logging/logger.hpp"
#include "normalize/date_normalizer.hpp"
#include "normalize/email_repairer.hpp"
#include "test_fixtures.hpp"

#include <cstdio>
#include <fstream>
#include <set>

using namespace TXR;
using namespace TXR::Engine;

class ReconciliationEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
        config_.normalizer = Testing::referenceNormalizerConfig();
    }

    void TearDown() override {
        for (const auto& path : temp_files_) {
            std::remove(path.c_str());
        }
    }

    // EN: A batch with every kind of defect the normalizers handle
    // FR: Un lot avec chaque type de défaut géré par les normaliseurs
    std::vector<RawRecord> messyBatch(size_t count) const {
        const char* emails[] = {"a@b.com", "john@gmail", "NULL", "x@", "bad email", "Mixed@Case.Org"};
        const char* amounts[] = {"$12.50", "\xE2\x82\xAC" "7,25", "(4.00)", "1,000", "none", "\xC2\xA3" "3"};
        const char* dates[] = {"2024-02-01", "03/04/2024", "25/12/2024", "01-07-2024", "2024/05/05", "soon"};
        const char* quantities[] = {"3", "0", "-7", "250", "", "x"};
        const char* countries[] = {"USA", "uk", "M\xC3\xA9xico", "new zealand", "Deutschland", "  "};

        std::vector<RawRecord> batch;
        for (size_t i = 0; i < count; ++i) {
            RawRecord raw = Testing::makeRaw("TXN-" + std::to_string(i % (count / 2 + 1)),
                                             std::string(emails[i % 6]), dates[(i / 2) % 6], amounts[(i / 3) % 6]);
            raw.customer_id = "CUST_" + std::to_string(i % 17);
            raw.quantity = quantities[(i / 5) % 6];
            raw.ship_country = countries[i % 6];
            if (i % 4 == 0) raw.currency = std::nullopt;
            if (i % 9 == 0) raw.category = std::nullopt;
            batch.push_back(raw);
        }
        return batch;
    }

    std::string tempPath(const std::string& name) {
        temp_files_.push_back(name);
        return name;
    }

    EngineConfig config_;
    std::vector<std::string> temp_files_;
};

TEST_F(ReconciliationEngineTest, CompleteEmailSurvivesDuplicateSubmission) {
    std::vector<RawRecord> raw = {
        Testing::makeRaw("TRX_001", std::string("john@gmail"), "2024-03-15"),
        Testing::makeRaw("TRX_001", std::string("john@gmail.com"), "2024-03-16")
    };

    EngineResult result = normalizeAndReconcile(raw, config_);

    ASSERT_EQ(result.canonical.size(), 1u);
    const NormalizedRecord& survivor = result.canonical.records[0];
    EXPECT_EQ(survivor.source_row, 2u);
    EXPECT_EQ(survivor.customer_email, "john@gmail.com");
    EXPECT_EQ(*survivor.order_date, CalendarDate(2024, 3, 16));
    EXPECT_EQ(survivor.status, RecordStatus::KEPT);

    ASSERT_EQ(result.duplicates.size(), 1u);
    EXPECT_EQ(result.duplicates[0].source_row, 1u);
    ASSERT_EQ(result.audit.size(), 1u);
    EXPECT_EQ(result.audit[0].reason, "complete email preferred");
}

TEST_F(ReconciliationEngineTest, RunsAreIdempotent) {
    auto batch = messyBatch(60);
    ReconciliationEngine engine(config_);

    EngineResult first = engine.run(batch);
    EngineResult second = engine.run(batch);

    EXPECT_EQ(CSV::CanonicalWriter::toCsv(first.canonical.records),
              CSV::CanonicalWriter::toCsv(second.canonical.records));
    EXPECT_TRUE(first.report == second.report);
    EXPECT_EQ(ReportWriter::buildAuditReport(first.audit), ReportWriter::buildAuditReport(second.audit));
}

TEST_F(ReconciliationEngineTest, CanonicalSetSatisfiesRecordLaws) {
    EngineResult result = normalizeAndReconcile(messyBatch(120), config_);

    std::set<std::string> ids;
    for (const auto& record : result.canonical.records) {
        EXPECT_TRUE(ids.insert(record.transaction_id).second) << record.transaction_id;

        if (record.quantity) {
            EXPECT_GE(*record.quantity, 1);
            EXPECT_LE(*record.quantity, 100);
        }

        EXPECT_TRUE(Normalize::EmailRepairer::isValidShape(record.customer_email)) << record.customer_email;
        EXPECT_GE(record.customer_email.size(), 5u);
        EXPECT_FALSE(record.currency_detected.empty());
    }
    EXPECT_EQ(ids.size(), result.canonical.size());
    EXPECT_EQ(result.canonical.size() + result.duplicates.size(), 120u);
    EXPECT_TRUE(result.report.getCheck("Duplicate Transaction IDs")->passed());
    EXPECT_TRUE(result.report.getCheck("Email Format Validation")->passed());
}

TEST_F(ReconciliationEngineTest, CanonicalDatesRoundTrip) {
    EngineResult result = normalizeAndReconcile(messyBatch(30), config_);
    Normalize::DateNormalizer dates;
    for (const auto& record : result.canonical.records) {
        if (record.order_date) {
            EXPECT_EQ(dates.normalize(record.order_date->toIsoString()).date, *record.order_date);
        }
    }
}

TEST_F(ReconciliationEngineTest, ParallelRunMatchesSequentialRun) {
    auto batch = messyBatch(250);

    EngineConfig parallel_config = config_;
    parallel_config.worker_threads = 4;
    parallel_config.chunk_size = 7;

    EngineResult sequential = normalizeAndReconcile(batch, config_);
    EngineResult parallel = normalizeAndReconcile(batch, parallel_config);

    EXPECT_EQ(CSV::CanonicalWriter::toCsv(sequential.canonical.records),
              CSV::CanonicalWriter::toCsv(parallel.canonical.records));
    EXPECT_TRUE(sequential.report == parallel.report);
    EXPECT_EQ(ReportWriter::buildAuditReport(sequential.audit), ReportWriter::buildAuditReport(parallel.audit));
    EXPECT_EQ(sequential.summary.toJson(), parallel.summary.toJson());
}

TEST_F(ReconciliationEngineTest, RawProfileCountsDefects) {
    std::vector<RawRecord> raw = {
        Testing::makeRaw("T1", std::string("NULL")),
        Testing::makeRaw("T1"),
        Testing::makeRaw("T2"),
        Testing::makeRaw(""),
        Testing::makeRaw("T3")
    };
    raw[0].currency = std::nullopt;
    raw[0].category = std::nullopt;
    raw[0].quantity = "-2";
    raw[1].quantity = "0";
    raw[2].quantity = "abc";
    raw[3].quantity = "";
    raw[4].currency = std::string(" ");

    RawProfile profile = RawProfile::compute(raw);

    EXPECT_EQ(profile.total_records, 5u);
    EXPECT_EQ(profile.distinct_transaction_ids, 3u);
    EXPECT_EQ(profile.duplicate_submissions, 1u);
    EXPECT_EQ(profile.missing_emails, 1u);
    EXPECT_EQ(profile.missing_currency, 2u);
    EXPECT_EQ(profile.missing_category, 1u);
    EXPECT_EQ(profile.negative_quantities, 1u);
    EXPECT_EQ(profile.zero_quantities, 1u);
    EXPECT_EQ(profile.non_numeric_quantities, 1u);

    nlohmann::json json = profile.toJson();
    EXPECT_EQ(json["duplicate_submissions"], 1);
    EXPECT_EQ(json["non_numeric_quantities"], 1);
}

TEST_F(ReconciliationEngineTest, CleaningSummaryCountsCanonicalRecords) {
    std::vector<RawRecord> raw = {
        Testing::makeRaw("T1", std::string("bob@gmail"), "03/04/2024"),
        Testing::makeRaw("T2", std::nullopt, "2024-03-15", "oops"),
        Testing::makeRaw("T3", std::string("carol@yahoo")),
        Testing::makeRaw("T2", std::string("x@y.com"), "2024-03-15", "10.00"),
        Testing::makeRaw("T4", std::string("d@e.com"), "someday", "n/a"),
        Testing::makeRaw("T5", std::nullopt)
    };
    raw[0].quantity = "500";

    EngineResult result = normalizeAndReconcile(raw, config_);
    const CleaningSummary& summary = result.summary;

    EXPECT_EQ(summary.raw_records, 6u);
    EXPECT_EQ(summary.canonical_records, 5u);
    EXPECT_EQ(summary.duplicates_removed, 1u);
    EXPECT_EQ(summary.emails_repaired, 2u);
    EXPECT_EQ(summary.emails_inferred, 1u);
    EXPECT_EQ(summary.quantities_adjusted, 1u);
    EXPECT_EQ(summary.ambiguous_dates, 1u);
    ASSERT_EQ(summary.unparsed_fields.size(), 2u);
    EXPECT_EQ(summary.unparsed_fields.at("amount"), 1u);
    EXPECT_EQ(summary.unparsed_fields.at("order_date"), 1u);

    // EN: The record with unparsed fields is kept and fails the critical field check.
    // FR: L'enregistrement aux champs non parsés est conservé et échoue au contrôle des champs critiques.
    EXPECT_FALSE(result.report.allHardChecksPassed());
    EXPECT_EQ(result.report.getCheck("Critical Fields NULL Check")->offending_count, 1u);

    std::string text = summary.generateReport();
    EXPECT_NE(text.find("Duplicates Removed: 1"), std::string::npos);
    EXPECT_NE(text.find("Unparsed amount: 1"), std::string::npos);
}

TEST_F(ReconciliationEngineTest, EmptyBatch) {
    EngineResult result = normalizeAndReconcile({}, config_);
    EXPECT_TRUE(result.canonical.empty());
    EXPECT_TRUE(result.audit.empty());
    EXPECT_TRUE(result.report.allHardChecksPassed());
    EXPECT_EQ(result.profile.total_records, 0u);
}

TEST_F(ReconciliationEngineTest, CanonicalCountriesAreDerivedFromSynonyms) {
    ReconciliationEngine engine(config_);
    EXPECT_EQ(engine.getConfig().validation.canonical_countries.size(), 14u);
}

TEST_F(ReconciliationEngineTest, InvalidConfigurationFailsBeforeProcessing) {
    EngineConfig no_rates = config_;
    no_rates.normalizer.exchange_rates.clear();
    EXPECT_THROW(ReconciliationEngine{no_rates}, ConfigError);

    EngineConfig no_countries = config_;
    no_countries.normalizer.country_synonyms.clear();
    EXPECT_THROW(normalizeAndReconcile({Testing::makeRaw("T1")}, no_countries), ConfigError);

    EngineConfig conflict = config_;
    conflict.normalizer.country_synonyms["France"].push_back("US");
    EXPECT_THROW(ReconciliationEngine{conflict}, ConfigError);
}

TEST_F(ReconciliationEngineTest, QualityAndAuditReports) {
    std::vector<RawRecord> raw = {
        Testing::makeRaw("T1", std::string("john@gmail")),
        Testing::makeRaw("T1", std::string("john@gmail.com")),
        Testing::makeRaw("T2", std::string("ann@example.com"), "someday", "oops")
    };
    EngineResult result = normalizeAndReconcile(raw, config_);

    nlohmann::json quality = ReportWriter::buildQualityReport(result);
    ASSERT_TRUE(quality.contains("profile"));
    ASSERT_TRUE(quality.contains("summary"));
    ASSERT_TRUE(quality.contains("validation"));
    EXPECT_EQ(quality["profile"]["total_records"], 3);
    EXPECT_EQ(quality["summary"]["canonical_records"], 2);
    EXPECT_EQ(quality["validation"]["checks"].size(), 10u);

    const nlohmann::json& unparsed = quality["unparsed_records"];
    ASSERT_EQ(unparsed.size(), 2u);
    EXPECT_EQ(unparsed[0]["transaction_id"], "T2");
    EXPECT_EQ(unparsed[0]["source_row"], 3);
    EXPECT_EQ(unparsed[0]["field"], "amount");
    EXPECT_EQ(unparsed[0]["code"], "AMOUNT_PARSE_ERROR");
    EXPECT_EQ(unparsed[0]["raw_value"], "oops");
    EXPECT_EQ(unparsed[1]["field"], "order_date");
    EXPECT_EQ(unparsed[1]["code"], "DATE_FORMAT_ERROR");
    EXPECT_EQ(unparsed[1]["raw_value"], "someday");

    nlohmann::json audit = ReportWriter::buildAuditReport(result.audit);
    EXPECT_EQ(audit["duplicates_removed"], 1);
    ASSERT_EQ(audit["entries"].size(), 1u);
    EXPECT_EQ(audit["entries"][0]["transaction_id"], "T1");
    EXPECT_EQ(audit["entries"][0]["duplicate_row"], 1);
    EXPECT_EQ(audit["entries"][0]["survivor_row"], 2);

    std::string path = tempPath("test_engine_quality_tmp.json");
    ASSERT_TRUE(ReportWriter::writeQualityReport(path, result));
    std::ifstream file(path);
    nlohmann::json reloaded = nlohmann::json::parse(file);
    EXPECT_EQ(reloaded, quality);

    EXPECT_FALSE(ReportWriter::writeAuditReport("/nonexistent_dir/audit.json", result.audit));
}

TEST_F(ReconciliationEngineTest, CanonicalCsvOutput) {
    std::vector<RawRecord> raw = {Testing::makeRaw("T1", std::nullopt)};
    raw[0].quantity = "0";
    EngineResult result = normalizeAndReconcile(raw, config_);

    std::string path = tempPath("test_engine_canonical_tmp.csv");
    ASSERT_TRUE(CSV::CanonicalWriter::writeFile(path, result.canonical.records));

    std::ifstream file(path);
    std::string header;
    std::string row;
    std::getline(file, header);
    std::getline(file, row);
    EXPECT_EQ(header, "transaction_id,customer_id,customer_email,product_sku,quantity,amount_usd,"
                      "original_currency,order_date,ship_country,payment_method,category,"
                      "email_was_inferred,quantity_was_adjusted");
    EXPECT_EQ(row, "T1,CUST_001,customer_CUST_001@inferred.com,SKU-1,1,100.00,USD,2024-03-15,"
                   "United States,Credit Card,Electronics,Y,Y");
}
