// EN: Unit tests for the txrctl OptionParser
// FR: Tests unitaires pour l'OptionParser de txrctl

#include <gtest/gtest.h>
#include "infrastructure/cli/option_parser.hpp"

using namespace TXR;
using namespace TXR::CLI;

class OptionParserTest : public ::testing::Test {
protected:
    void SetUp() override {
        CliOptionDefinition input;
        input.long_name = "input";
        input.short_name = 'i';
        input.description = "Input CSV file";
        input.required = true;

        CliOptionDefinition config;
        config.long_name = "config";
        config.short_name = 'c';
        config.description = "Configuration file";
        config.default_value = "config/txr.yaml";

        CliOptionDefinition threads;
        threads.long_name = "threads";
        threads.short_name = 't';
        threads.type = CliOptionType::INTEGER;
        threads.description = "Worker threads";
        threads.config_path = "engine.worker_threads";
        threads.min_value = 0;
        threads.max_value = 256;

        CliOptionDefinition quiet;
        quiet.long_name = "quiet";
        quiet.short_name = 'q';
        quiet.type = CliOptionType::BOOLEAN;
        quiet.description = "Suppress the summary";

        parser_.addOptions({input, config, threads, quiet});
        parser_.setVersionInfo("1.0.0", "test");
    }

    OptionParser parser_{"txrctl"};
};

TEST_F(OptionParserTest, LongAndShortForms) {
    CliParseResult result = parser_.parse(std::vector<std::string>{"--input", "data.csv", "-t", "4", "-q"});

    EXPECT_EQ(result.status, CliParseStatus::SUCCESS);
    EXPECT_EQ(result.get("input"), "data.csv");
    EXPECT_EQ(result.get("threads"), "4");
    EXPECT_TRUE(result.flag("quiet"));
    EXPECT_TRUE(result.errors.empty());
}

TEST_F(OptionParserTest, InlineValue) {
    CliParseResult result = parser_.parse(std::vector<std::string>{"--input=in.csv", "--threads=8"});
    EXPECT_EQ(result.status, CliParseStatus::SUCCESS);
    EXPECT_EQ(result.get("input"), "in.csv");
    EXPECT_EQ(result.get("threads"), "8");
}

TEST_F(OptionParserTest, DefaultsAreApplied) {
    CliParseResult result = parser_.parse(std::vector<std::string>{"-i", "x.csv"});
    EXPECT_EQ(result.get("config"), "config/txr.yaml");
    EXPECT_FALSE(result.has("threads"));
    EXPECT_FALSE(result.flag("quiet"));
    EXPECT_EQ(result.get("threads", "none"), "none");
}

TEST_F(OptionParserTest, IntegerOptionBecomesTypedOverride) {
    CliParseResult result = parser_.parse(std::vector<std::string>{"-i", "x.csv", "--threads", "12"});

    ASSERT_EQ(result.overrides.count("engine.worker_threads"), 1u);
    auto value = result.overrides.at("engine.worker_threads").tryAs<int>();
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, 12);
    EXPECT_EQ(result.overrides.size(), 1u);
}

TEST_F(OptionParserTest, MissingRequiredOption) {
    CliParseResult result = parser_.parse(std::vector<std::string>{"-t", "2"});
    EXPECT_EQ(result.status, CliParseStatus::MISSING_VALUE);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_NE(result.errors[0].find("--input"), std::string::npos);
}

TEST_F(OptionParserTest, MissingValueAtEnd) {
    CliParseResult result = parser_.parse(std::vector<std::string>{"-i", "x.csv", "--threads"});
    EXPECT_EQ(result.status, CliParseStatus::MISSING_VALUE);
}

TEST_F(OptionParserTest, UnknownOption) {
    CliParseResult result = parser_.parse(std::vector<std::string>{"-i", "x.csv", "--bogus"});
    EXPECT_EQ(result.status, CliParseStatus::INVALID_OPTION);
    EXPECT_EQ(result.errors.front(), "Unknown option: --bogus");
}

TEST_F(OptionParserTest, IntegerValidation) {
    EXPECT_EQ(parser_.parse(std::vector<std::string>{"-i", "x", "-t", "four"}).status, CliParseStatus::INVALID_VALUE);
    EXPECT_EQ(parser_.parse(std::vector<std::string>{"-i", "x", "-t", "4x"}).status, CliParseStatus::INVALID_VALUE);
    EXPECT_EQ(parser_.parse(std::vector<std::string>{"-i", "x", "-t", "-1"}).status, CliParseStatus::INVALID_VALUE);
    EXPECT_EQ(parser_.parse(std::vector<std::string>{"-i", "x", "-t", "257"}).status, CliParseStatus::INVALID_VALUE);
    EXPECT_EQ(parser_.parse(std::vector<std::string>{"-i", "x", "-t", "99999999999999999999"}).status,
              CliParseStatus::INVALID_VALUE);
    EXPECT_EQ(parser_.parse(std::vector<std::string>{"-i", "x", "-t", "256"}).status, CliParseStatus::SUCCESS);
}

TEST_F(OptionParserTest, FirstErrorDecidesStatus) {
    CliParseResult result = parser_.parse(std::vector<std::string>{"--bogus", "-t", "nope"});
    EXPECT_EQ(result.status, CliParseStatus::INVALID_OPTION);
    EXPECT_EQ(result.errors.size(), 3u);
}

TEST_F(OptionParserTest, HelpAndVersionStopParsing) {
    CliParseResult help = parser_.parse(std::vector<std::string>{"--bogus", "-h"});
    EXPECT_EQ(help.status, CliParseStatus::HELP_REQUESTED);

    help = parser_.parse(std::vector<std::string>{"--help", "--bogus"});
    EXPECT_EQ(help.status, CliParseStatus::HELP_REQUESTED);
    EXPECT_NE(help.help_text.find("Usage: txrctl [OPTIONS]"), std::string::npos);
    EXPECT_NE(help.help_text.find("-i, --input VALUE"), std::string::npos);
    EXPECT_NE(help.help_text.find("(required)"), std::string::npos);
    EXPECT_NE(help.help_text.find("(default: config/txr.yaml)"), std::string::npos);

    CliParseResult version = parser_.parse(std::vector<std::string>{"-V"});
    EXPECT_EQ(version.status, CliParseStatus::VERSION_REQUESTED);
    EXPECT_EQ(version.version_text, "txrctl 1.0.0 (test)\n");
}

TEST_F(OptionParserTest, PositionalArguments) {
    CliParseResult result = parser_.parse(std::vector<std::string>{"-i", "x.csv", "extra", "-"});
    EXPECT_EQ(result.status, CliParseStatus::SUCCESS);
    EXPECT_EQ(result.positional, (std::vector<std::string>{"extra", "-"}));
}

TEST_F(OptionParserTest, ArgvEntryPoint) {
    char program[] = "txrctl";
    char flag[] = "-i";
    char value[] = "file.csv";
    char* argv[] = {program, flag, value};

    CliParseResult result = parser_.parse(3, argv);
    EXPECT_EQ(result.status, CliParseStatus::SUCCESS);
    EXPECT_EQ(result.get("input"), "file.csv");
}

TEST_F(OptionParserTest, DuplicateOrUnnamedOptionRejected) {
    CliOptionDefinition duplicate;
    duplicate.long_name = "input";
    EXPECT_THROW(parser_.addOption(duplicate), std::invalid_argument);

    CliOptionDefinition unnamed;
    EXPECT_THROW(parser_.addOption(unnamed), std::invalid_argument);
    EXPECT_TRUE(parser_.hasOption("threads"));
    EXPECT_FALSE(parser_.hasOption("bogus"));
}

TEST(CliParseStatusTest, StatusNames) {
    EXPECT_EQ(cliParseStatusToString(CliParseStatus::SUCCESS), "SUCCESS");
    EXPECT_EQ(cliParseStatusToString(CliParseStatus::INVALID_VALUE), "INVALID_VALUE");
    EXPECT_EQ(cliParseStatusToString(CliParseStatus::HELP_REQUESTED), "HELP_REQUESTED");
}
