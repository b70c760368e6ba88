// EN: Unit tests for EngineConfig - YAML tables, validation and overrides
// FR: Tests unitaires pour EngineConfig - tables YAML, validation et surcharges

#include <gtest/gtest.h>
#include "engine/engine_config.hpp"
#include "infrastructure/logging/logger.hpp"
#include "test_fixtures.hpp"

#include <algorithm>
#include <cstdio>
#include <fstream>

using namespace TXR;
using namespace TXR::Engine;

class EngineConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
        ConfigManager::getInstance().reset();
    }

    void TearDown() override {
        ConfigManager::getInstance().reset();
        if (!temp_file_.empty()) {
            std::remove(temp_file_.c_str());
        }
    }

    std::string writeTempConfig(const std::string& content) {
        temp_file_ = "test_engine_config_tmp.yaml";
        std::ofstream file(temp_file_);
        file << content;
        return temp_file_;
    }

    std::string temp_file_;
};

TEST_F(EngineConfigTest, ReferenceTablesLoad) {
    EngineConfig config = EngineConfig::loadFromString(Testing::kTestConfigYaml);

    EXPECT_EQ(config.normalizer.exchange_rates.size(), 5u);
    EXPECT_DOUBLE_EQ(config.normalizer.exchange_rates.at("EUR"), 1.08);
    EXPECT_DOUBLE_EQ(config.normalizer.exchange_rates.at("JPY"), 0.0067);

    EXPECT_EQ(config.normalizer.country_synonyms.size(), 14u);
    const auto& us = config.normalizer.country_synonyms.at("United States");
    EXPECT_NE(std::find(us.begin(), us.end(), "USA"), us.end());
    const auto& mexico = config.normalizer.country_synonyms.at("Mexico");
    EXPECT_NE(std::find(mexico.begin(), mexico.end(), "M\xC3\x89XICO"), mexico.end());

    EXPECT_EQ(config.normalizer.category_aliases.size(), 2u);
    EXPECT_EQ(config.validation.canonical_countries.size(), 14u);
    EXPECT_EQ(config.validation.canonical_countries.count("South Korea"), 1u);
}

TEST_F(EngineConfigTest, ValidationAndEngineSections) {
    EngineConfig config = EngineConfig::loadFromString(Testing::kTestConfigYaml);

    EXPECT_EQ(config.validation.date_window_start, CalendarDate(2024, 1, 1));
    EXPECT_EQ(config.validation.date_window_end, CalendarDate(2024, 12, 31));
    EXPECT_EQ(config.validation.quantity_ceiling, 100);
    EXPECT_EQ(config.normalizer.quantity_ceiling, 100);
    EXPECT_EQ(config.validation.amount_ceiling.cents(), 10000000);
    EXPECT_EQ(config.validation.country_ceiling, 20u);
    EXPECT_DOUBLE_EQ(config.validation.outlier_sigma, 3.0);
    EXPECT_EQ(config.worker_threads, 0u);
    EXPECT_EQ(config.chunk_size, 1024u);
    EXPECT_EQ(config.normalizer.missing_category, "Uncategorized");
    EXPECT_EQ(config.normalizer.email.inferred_domain, "inferred.com");
    EXPECT_EQ(config.normalizer.email.placeholder_domain, "domain.com");
}

TEST_F(EngineConfigTest, OptionalSectionsFallBackToDefaults) {
    EngineConfig config = EngineConfig::loadFromString(R"(
exchange_rates:
  usd: 1
country_synonyms:
  "Canada": ["CA"]
)");

    EXPECT_DOUBLE_EQ(config.normalizer.exchange_rates.at("USD"), 1.0);
    EXPECT_TRUE(config.normalizer.category_aliases.empty());
    EXPECT_EQ(config.validation.quantity_ceiling, 100);
    EXPECT_EQ(config.worker_threads, 0u);
}

TEST_F(EngineConfigTest, SingleAliasAndEmptyAliasList) {
    EngineConfig config = EngineConfig::loadFromString(R"(
exchange_rates:
  USD: 1.0
country_synonyms:
  "Canada": "CA"
  "France":
)");

    EXPECT_EQ(config.normalizer.country_synonyms.at("Canada"), std::vector<std::string>{"CA"});
    EXPECT_TRUE(config.normalizer.country_synonyms.at("France").empty());
}

TEST_F(EngineConfigTest, MissingExchangeRatesIsFatal) {
    EXPECT_THROW(EngineConfig::loadFromString(R"(
country_synonyms:
  "Canada": ["CA"]
)"), ConfigError);
}

TEST_F(EngineConfigTest, MissingCountryTableIsFatal) {
    EXPECT_THROW(EngineConfig::loadFromString(R"(
exchange_rates:
  USD: 1.0
)"), ConfigError);
}

TEST_F(EngineConfigTest, NonPositiveRateIsFatal) {
    EXPECT_THROW(EngineConfig::loadFromString(R"(
exchange_rates:
  USD: 1.0
  EUR: 0
country_synonyms:
  "Canada": ["CA"]
)"), ConfigError);

    EXPECT_THROW(EngineConfig::loadFromString(R"(
exchange_rates:
  EUR: "lots"
country_synonyms:
  "Canada": ["CA"]
)"), ConfigError);
}

TEST_F(EngineConfigTest, ConflictingAliasIsFatal) {
    try {
        EngineConfig::loadFromString(R"(
exchange_rates:
  USD: 1.0
country_synonyms:
  "United States": ["US"]
  "Ukraine": ["us"]
)");
        FAIL() << "Expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("country_synonyms"), std::string::npos);
    }
}

TEST_F(EngineConfigTest, InvalidScalarsAreFatal) {
    const std::string tables = "exchange_rates:\n  USD: 1.0\ncountry_synonyms:\n  \"Canada\": [\"CA\"]\n";

    EXPECT_THROW(EngineConfig::loadFromString(tables + "validation:\n  quantity_ceiling: 0\n"), ConfigError);
    EXPECT_THROW(EngineConfig::loadFromString(tables + "validation:\n  date_window_start: \"01/01/2024\"\n"),
                 ConfigError);
    EXPECT_THROW(EngineConfig::loadFromString(
                     tables + "validation:\n  date_window_start: \"2024-06-01\"\n  date_window_end: \"2024-01-01\"\n"),
                 ConfigError);
    EXPECT_THROW(EngineConfig::loadFromString(tables + "engine:\n  worker_threads: 1000\n"), ConfigError);
    EXPECT_THROW(EngineConfig::loadFromString(tables + "engine:\n  missing_category: \"  \"\n"), ConfigError);
}

TEST_F(EngineConfigTest, UnparsableYamlIsFatal) {
    EXPECT_THROW(EngineConfig::loadFromString("exchange_rates: [unclosed"), ConfigError);
    EXPECT_THROW(EngineConfig::loadFromString("- just\n- a list\n"), ConfigError);
}

TEST_F(EngineConfigTest, MissingFileIsFatal) {
    EXPECT_THROW(EngineConfig::loadFromFile("/nonexistent/txr.yaml"), ConfigError);
}

TEST_F(EngineConfigTest, FileOverridesWinOverYaml) {
    std::string path = writeTempConfig(Testing::kTestConfigYaml);

    std::unordered_map<std::string, ConfigValue> overrides;
    overrides["engine.worker_threads"] = ConfigValue(4);
    overrides["validation.quantity_ceiling"] = ConfigValue(50);

    EngineConfig config = EngineConfig::loadFromFile(path, overrides);
    EXPECT_EQ(config.worker_threads, 4u);
    EXPECT_EQ(config.validation.quantity_ceiling, 50);
    EXPECT_EQ(config.normalizer.quantity_ceiling, 50);
}

TEST_F(EngineConfigTest, OverrideWithoutSectionIsFatal) {
    std::string path = writeTempConfig(Testing::kTestConfigYaml);

    std::unordered_map<std::string, ConfigValue> overrides;
    overrides["threads"] = ConfigValue(4);
    EXPECT_THROW(EngineConfig::loadFromFile(path, overrides), ConfigError);
}

TEST_F(EngineConfigTest, ValidateCatchesManualEdits) {
    EngineConfig config = EngineConfig::loadFromString(Testing::kTestConfigYaml);
    EXPECT_NO_THROW(config.validate());

    EngineConfig no_rates = config;
    no_rates.normalizer.exchange_rates.clear();
    EXPECT_THROW(no_rates.validate(), ConfigError);

    EngineConfig bad_window = config;
    bad_window.validation.date_window_end = CalendarDate(2023, 1, 1);
    EXPECT_THROW(bad_window.validate(), ConfigError);

    EngineConfig conflict = config;
    conflict.normalizer.country_synonyms["Canada"].push_back("USA");
    EXPECT_THROW(conflict.validate(), ConfigError);
}

TEST(EngineConfigRulesTest, RulesCoverScalarKeys) {
    auto rules = EngineConfig::validationRules();
    ASSERT_EQ(rules.size(), 4u);
    EXPECT_EQ(rules[0].key, "validation.quantity_ceiling");
    EXPECT_EQ(rules[3].key, "engine.worker_threads");
    EXPECT_DOUBLE_EQ(*rules[3].max_value, 256.0);
}
