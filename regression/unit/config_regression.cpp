/*-------------------------------------------------------------------------
 *
 * config_regression.cpp
 *      Configuration loading, typed settings and the logger.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "CConfig.hpp"
#include "CLogMacros.hpp"
#include "CLogRegistry.hpp"
#include "CLogger.hpp"
#include "CWalkConfig.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <sstream>
#include <unistd.h>

using json = nlohmann::json;

namespace BsonWalk
{
namespace Regression
{

class ConfigRegressionTest : public ::testing::Test
{
  protected:
    CConfig config;
    std::filesystem::path tempDir;

    void SetUp() override
    {
        tempDir = std::filesystem::temp_directory_path() /
                  ("bsonwalk_config_" + std::to_string(::getpid()));
        std::filesystem::create_directories(tempDir);
    }

    void TearDown() override
    {
        CLogRegistry::reset();
        std::error_code ec;
        std::filesystem::remove_all(tempDir, ec);
    }

    std::string writeFile(const std::string& name, const std::string& content)
    {
        std::filesystem::path path = tempDir / name;
        std::ofstream out(path);
        out << content;
        return path.string();
    }
};

TEST_F(ConfigRegressionTest, TestJsonFlattening)
{
    ASSERT_FALSE(config.loadFromJson(R"({
        "logging": {"log_level": "DEBUG", "console_output": false},
        "document": {"unknown_type_policy": "fail"},
        "retries": 3,
        "ratio": 0.5,
        "tags": ["a", "b"]
    })"));

    EXPECT_EQ(config.getString("logging.log_level", ""), "DEBUG");
    EXPECT_FALSE(config.getBool("logging.console_output", true));
    EXPECT_EQ(config.getInt("retries", 0), 3);
    EXPECT_TRUE(config.has("ratio"));
    EXPECT_EQ(std::get<std::vector<std::string>>(*config.get("tags")),
              (std::vector<std::string>{"a", "b"}));
    EXPECT_FALSE(config.has("logging"));
    EXPECT_EQ(config.keys().size(), 6u);
}

TEST_F(ConfigRegressionTest, TestYamlScalars)
{
    ASSERT_FALSE(config.loadFromYaml("log_level: warn\n"
                                     "console_output: false\n"
                                     "depth: 12\n"
                                     "scale: 1.5\n"
                                     "name: walker\n"));

    EXPECT_EQ(config.getString("log_level", ""), "warn");
    EXPECT_FALSE(config.getBool("console_output", true));
    EXPECT_EQ(config.getInt("depth", 0), 12);
    EXPECT_EQ(std::get<double>(*config.get("scale")), 1.5);
    EXPECT_EQ(config.getString("name", ""), "walker");
}

TEST_F(ConfigRegressionTest, TestIniSections)
{
    ASSERT_FALSE(config.loadFromIni("# comment\n"
                                    "json_mode = relaxed\n"
                                    "[logging]\n"
                                    "log_file = /tmp/walk.log\n"
                                    "console_output = no\n"));

    EXPECT_EQ(config.getString("json_mode", ""), "relaxed");
    EXPECT_EQ(config.getString("logging.log_file", ""), "/tmp/walk.log");
    EXPECT_FALSE(config.getBool("logging.console_output", true));
}

TEST_F(ConfigRegressionTest, TestMalformedInput)
{
    EXPECT_TRUE(config.loadFromJson("{not json"));
    EXPECT_TRUE(config.loadFromJson(""));
    EXPECT_TRUE(config.loadFromYaml("key: [unterminated"));
    EXPECT_EQ(config.loadFromFile(writeFile("settings.toml", "a = 1")),
              std::errc::invalid_argument);
    EXPECT_EQ(config.loadFromFile((tempDir / "absent.json").string()),
              std::errc::no_such_file_or_directory);
}

TEST_F(ConfigRegressionTest, TestStringConversions)
{
    config.set("n", std::string("42"));
    config.set("bad", std::string("forty"));
    config.set("flag", std::string("yes"));

    EXPECT_EQ(config.getInt("n", 0), 42);
    EXPECT_EQ(config.getInt("bad", 7), 7);
    EXPECT_TRUE(config.getBool("flag", false));
    EXPECT_EQ(config.getString("missing", "dflt"), "dflt");

    json dumped = json::parse(config.toJson());
    EXPECT_EQ(dumped["n"], "42");
}

TEST_F(ConfigRegressionTest, TestWalkConfigFromFile)
{
    std::string path = writeFile("bsonwalk.yaml",
                                 "logging:\n"
                                 "  log_level: DEBUG\n"
                                 "  console_output: false\n"
                                 "document:\n"
                                 "  unknown_type_policy: fail\n"
                                 "  json_mode: relaxed\n");

    ASSERT_FALSE(config.loadFromFile(path));

    CWalkConfig walk;
    ASSERT_FALSE(walk.loadFromConfig(config));
    EXPECT_EQ(walk.logLevel, "DEBUG");
    EXPECT_FALSE(walk.consoleOutput);
    EXPECT_EQ(walk.policy(), CUnknownTypePolicy::Fail);
    EXPECT_TRUE(walk.relaxedJson());
}

TEST_F(ConfigRegressionTest, TestWalkConfigDefaults)
{
    CWalkConfig walk;
    walk.logLevel = "TRACE";
    walk.jsonMode = "relaxed";
    walk.setDefaults();

    EXPECT_TRUE(walk.validate());
    EXPECT_EQ(walk.logLevel, "INFO");
    EXPECT_EQ(walk.policy(), CUnknownTypePolicy::Sentinel);
    EXPECT_FALSE(walk.relaxedJson());
}

TEST_F(ConfigRegressionTest, TestWalkConfigRejectsUnknownValues)
{
    config.set("unknown_type_policy", std::string("ignore"));

    CWalkConfig walk;
    EXPECT_EQ(walk.loadFromConfig(config), std::errc::invalid_argument);

    CWalkConfig level;
    level.logLevel = "LOUD";
    EXPECT_FALSE(level.validate());
}

TEST_F(ConfigRegressionTest, TestLoggerWritesFile)
{
    CWalkConfig walk;
    walk.logFile = (tempDir / "walk.log").string();
    walk.consoleOutput = false;
    walk.logLevel = "WARN";

    auto logger = std::make_shared<CLogger>(walk);
    ASSERT_FALSE(logger->initialize());
    EXPECT_EQ(logger->getLogLevel(), CLogLevel::WARN);
    CLogRegistry::set(logger);

    debug_log("hidden message");
    warn_log("visible message");
    logger->shutdown();

    std::ifstream in(walk.logFile);
    std::stringstream contents;
    contents << in.rdbuf();
    EXPECT_NE(contents.str().find("visible message"), std::string::npos);
    EXPECT_EQ(contents.str().find("hidden message"), std::string::npos);
}

TEST_F(ConfigRegressionTest, TestLevelNames)
{
    EXPECT_EQ(CLogger::parseLevel("debug"), CLogLevel::DEBUG);
    EXPECT_EQ(CLogger::parseLevel("Warning"), CLogLevel::WARN);
    EXPECT_FALSE(CLogger::parseLevel("verbose").has_value());
    EXPECT_EQ(CLogger::getLevelString(CLogLevel::ERROR), "ERROR");
}

TEST_F(ConfigRegressionTest, TestNoLoggerInstalled)
{
    CLogRegistry::reset();
    EXPECT_EQ(CLogRegistry::get(), nullptr);
    error_log("dropped");
}

} /* namespace Regression */
} /* namespace BsonWalk */
