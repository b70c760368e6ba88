// EN: Unit tests for ConfigManager - YAML sections, environment overrides and rule validation
// FR: Tests unitaires pour ConfigManager - sections YAML, surcharges d'environnement et validation par règles

#include <gtest/gtest.h>
#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>

using namespace TXR;

namespace {

const std::string kYaml = R"(
engine:
  worker_threads: 2
  chunk_size: 1024
  verbose: false
  name: nightly
validation:
  outlier_sigma: 3.0
  date_window_start: "2024-01-01"
  quantity_ceiling: "100"
  countries:
    - United States
    - Canada
mode: strict
)";

} // namespace

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
        ConfigManager::getInstance().reset();
    }

    void TearDown() override {
        ConfigManager::getInstance().reset();
        for (const auto& name : env_vars_) {
            unsetenv(name.c_str());
        }
        if (!temp_file_.empty()) {
            std::remove(temp_file_.c_str());
        }
    }

    void setEnv(const std::string& name, const std::string& value) {
        setenv(name.c_str(), value.c_str(), 1);
        env_vars_.push_back(name);
    }

    ConfigManager& config_ = ConfigManager::getInstance();
    std::vector<std::string> env_vars_;
    std::string temp_file_;
};

TEST_F(ConfigManagerTest, ScalarTypesFollowYaml) {
    ASSERT_TRUE(config_.loadFromString(kYaml));

    EXPECT_EQ(config_.get("engine", "worker_threads").tryAs<int>().value_or(-1), 2);
    EXPECT_FALSE(config_.get("engine", "verbose").as<bool>());
    EXPECT_EQ(config_.get("engine", "name").as<std::string>(), "nightly");
    EXPECT_DOUBLE_EQ(config_.get("validation", "outlier_sigma").as<double>(), 3.0);

    // EN: Quoted scalars stay strings even when numeric.
    // FR: Les scalaires entre guillemets restent des chaînes même numériques.
    EXPECT_EQ(config_.get("validation", "quantity_ceiling").tryAs<std::string>().value_or(""), "100");
    EXPECT_FALSE(config_.get("validation", "quantity_ceiling").tryAs<int>().has_value());

    auto countries = config_.get("validation", "countries").as<std::vector<std::string>>();
    EXPECT_EQ(countries, (std::vector<std::string>{"United States", "Canada"}));
}

TEST_F(ConfigManagerTest, TopLevelScalarLandsInValueKey) {
    ASSERT_TRUE(config_.loadFromString(kYaml));
    EXPECT_EQ(config_.get("mode", "value").as<std::string>(), "strict");
    EXPECT_EQ(config_.getSectionNames(), (std::vector<std::string>{"engine", "mode", "validation"}));
}

TEST_F(ConfigManagerTest, MissingValuesAreEmpty) {
    ASSERT_TRUE(config_.loadFromString(kYaml));

    ConfigValue missing = config_.get("engine", "nope");
    EXPECT_FALSE(missing.isValid());
    EXPECT_FALSE(missing.tryAs<int>().has_value());
    EXPECT_EQ(missing.asOrDefault<int>(7), 7);
    EXPECT_EQ(missing.toString(), "<empty>");
    EXPECT_THROW(missing.as<int>(), std::runtime_error);
    EXPECT_FALSE(config_.hasSection("reports"));
}

TEST_F(ConfigManagerTest, NumericViewAcceptsIntAndDouble) {
    EXPECT_DOUBLE_EQ(ConfigValue(4).asNumber().value_or(0.0), 4.0);
    EXPECT_DOUBLE_EQ(ConfigValue(2.5).asNumber().value_or(0.0), 2.5);
    EXPECT_FALSE(ConfigValue(std::string("4")).asNumber().has_value());
}

TEST_F(ConfigManagerTest, SetRemoveAndSections) {
    config_.set("engine", "worker_threads", ConfigValue(4));
    config_.set("engine", "name", ConfigValue(std::string("adhoc")));
    EXPECT_TRUE(config_.has("engine", "worker_threads"));

    config_.remove("engine", "worker_threads");
    EXPECT_FALSE(config_.has("engine", "worker_threads"));

    ConfigSection extra;
    extra.set("name", ConfigValue(std::string("ignored")));
    extra.set("chunk_size", ConfigValue(64));

    ConfigSection engine = config_.getSection("engine");
    engine.merge(extra, false);
    EXPECT_EQ(engine.get("name").as<std::string>(), "adhoc");
    EXPECT_EQ(engine.get("chunk_size").as<int>(), 64);
    EXPECT_EQ(engine.keys(), (std::vector<std::string>{"chunk_size", "name"}));

    config_.setSection("engine", engine);
    EXPECT_EQ(config_.getSection("engine").size(), 2u);
}

TEST_F(ConfigManagerTest, FailedLoadKeepsPreviousConfiguration) {
    ASSERT_TRUE(config_.loadFromString(kYaml));

    EXPECT_FALSE(config_.loadFromString("engine: [unclosed"));
    EXPECT_FALSE(config_.loadFromString("- a\n- list\n"));
    EXPECT_FALSE(config_.loadFromString("engine:\n  nested:\n    too: deep\n"));

    EXPECT_EQ(config_.get("engine", "name").as<std::string>(), "nightly");
}

TEST_F(ConfigManagerTest, LoadFromFile) {
    EXPECT_FALSE(config_.loadFromFile("/nonexistent/txr.yaml"));

    temp_file_ = "test_config_manager_tmp.yaml";
    {
        std::ofstream file(temp_file_);
        file << kYaml;
    }
    ASSERT_TRUE(config_.loadFromFile(temp_file_));
    EXPECT_EQ(config_.getSourcePath(), temp_file_);
    EXPECT_EQ(config_.get("engine", "chunk_size").as<int>(), 1024);
}

TEST_F(ConfigManagerTest, VariablesExpandFromEnvironment) {
    setEnv("TXR_TEST_DATA_DIR", "/srv/txr");
    ASSERT_TRUE(config_.loadFromString("paths:\n  input: \"${TXR_TEST_DATA_DIR}/raw.csv\"\n"
                                       "  other: \"${TXR_TEST_UNSET_VAR}/x\"\n"));

    EXPECT_EQ(config_.get("paths", "input").as<std::string>(), "/srv/txr/raw.csv");
    EXPECT_EQ(config_.get("paths", "other").as<std::string>(), "${TXR_TEST_UNSET_VAR}/x");
}

TEST_F(ConfigManagerTest, EnvironmentOverridesKeepTypes) {
    ASSERT_TRUE(config_.loadFromString(kYaml));
    setEnv("TXR_ENGINE_WORKER_THREADS", "8");
    setEnv("TXR_ENGINE_VERBOSE", "yes");
    setEnv("TXR_VALIDATION_OUTLIER_SIGMA", "2.5");
    setEnv("TXR_VALIDATION_COUNTRIES", "Mexico,Japan");

    EXPECT_EQ(config_.loadEnvironmentOverrides(), 4u);
    EXPECT_EQ(config_.get("engine", "worker_threads").as<int>(), 8);
    EXPECT_TRUE(config_.get("engine", "verbose").as<bool>());
    EXPECT_DOUBLE_EQ(config_.get("validation", "outlier_sigma").as<double>(), 2.5);
    EXPECT_EQ(config_.get("validation", "countries").as<std::vector<std::string>>(),
              (std::vector<std::string>{"Mexico", "Japan"}));
}

TEST_F(ConfigManagerTest, MalformedEnvironmentOverrideIsIgnored) {
    ASSERT_TRUE(config_.loadFromString(kYaml));
    setEnv("TXR_ENGINE_WORKER_THREADS", "8x");
    setEnv("TXR_ENGINE_VERBOSE", "maybe");
    setEnv("TXR_ENGINE_UNKNOWN_KEY", "1");

    EXPECT_EQ(config_.loadEnvironmentOverrides(), 0u);
    EXPECT_EQ(config_.get("engine", "worker_threads").as<int>(), 2);
    EXPECT_FALSE(config_.has("engine", "unknown_key"));
}

TEST_F(ConfigManagerTest, ValidationRules) {
    ASSERT_TRUE(config_.loadFromString(kYaml));

    ConfigManager::ValidationRule threads;
    threads.key = "engine.worker_threads";
    threads.type = "int";
    threads.min_value = 0;
    threads.max_value = 1;

    ConfigManager::ValidationRule ceiling;
    ceiling.key = "validation.quantity_ceiling";
    ceiling.type = "number";

    ConfigManager::ValidationRule mode;
    mode.key = "mode.value";
    mode.type = "string";
    mode.allowed_values = {"strict", "lenient"};

    ConfigManager::ValidationRule required;
    required.key = "reports.output_dir";
    required.required = true;

    ConfigManager::ValidationRule optional;
    optional.key = "reports.format";
    optional.type = "string";

    config_.addValidationRules({threads, ceiling, mode});
    config_.addValidationRules({required, optional});

    std::vector<std::string> errors;
    EXPECT_FALSE(config_.validate(errors));
    ASSERT_EQ(errors.size(), 3u);
    EXPECT_EQ(errors[0], "Configuration engine.worker_threads must be <= 1");
    EXPECT_EQ(errors[1], "Configuration validation.quantity_ceiling must be a number");
    EXPECT_EQ(errors[2], "Required configuration missing: reports.output_dir");

    config_.set("engine", "worker_threads", ConfigValue(1));
    config_.set("validation", "quantity_ceiling", ConfigValue(100));
    config_.set("reports", "output_dir", ConfigValue(std::string("out")));
    config_.set("mode", "value", ConfigValue(std::string("loose")));

    EXPECT_FALSE(config_.validate(errors));
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], "Configuration mode.value must be one of: strict, lenient");
}

TEST_F(ConfigManagerTest, ResetClearsSectionsAndRules) {
    ASSERT_TRUE(config_.loadFromString(kYaml));
    ConfigManager::ValidationRule required;
    required.key = "reports.output_dir";
    required.required = true;
    config_.addValidationRules({required});

    config_.reset();

    std::vector<std::string> errors;
    EXPECT_TRUE(config_.validate(errors));
    EXPECT_TRUE(config_.getSectionNames().empty());
    EXPECT_TRUE(config_.getSourcePath().empty());
}

TEST_F(ConfigManagerTest, DumpIsSorted) {
    config_.set("engine", "worker_threads", ConfigValue(2));
    config_.set("engine", "name", ConfigValue(std::string("nightly")));
    config_.set("alpha", "flags", ConfigValue(std::vector<std::string>{"a", "b"}));

    EXPECT_EQ(config_.dump(),
              "[alpha]\n  flags = [a, b]\n\n"
              "[engine]\n  name = nightly\n  worker_threads = 2\n\n");
}
