/*-------------------------------------------------------------------------
 *
 * walk_regression.cpp
 *      End to end runs of the bsonwalk commands over BSON files.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "CRawDocument.hpp"
#include "CWalkTool.hpp"
#include "document/CBsonError.hpp"
#include "document/CDocumentBuilder.hpp"
#include "document/CDocumentIterator.hpp"

#include <filesystem>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <sstream>
#include <unistd.h>

using json = nlohmann::json;

namespace BsonWalk
{
namespace Regression
{

class WalkRegressionTest : public ::testing::Test
{
  protected:
    std::filesystem::path test_data_dir;
    std::string input_file;
    std::ostringstream out;
    std::ostringstream err;
    CWalkConfig config;

    void SetUp() override
    {
        test_data_dir = std::filesystem::temp_directory_path() /
                        ("bsonwalk_regression_" + std::to_string(::getpid()));
        std::filesystem::create_directories(test_data_dir);
        input_file = (test_data_dir / "input.bson").string();

        CDocumentBuilder first;
        first.addInt32("id", 1);
        first.addString("name", "alpha");
        first.addDouble("score", 0.5);

        CDocumentBuilder second;
        second.addInt32("id", 2);
        second.addBool("active", true);
        second.addInt64("hits", 10);

        ASSERT_FALSE(CWalkTool::writeDocuments(
            input_file, {first.build(), second.build()}));
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(test_data_dir, ec);
    }

    std::vector<std::string> outputLines() const
    {
        std::vector<std::string> lines;
        std::istringstream in(out.str());
        std::string line;
        while (std::getline(in, line))
            lines.push_back(line);
        return lines;
    }
};

TEST_F(WalkRegressionTest, TestReadDocuments)
{
    std::vector<CDocument> documents;
    ASSERT_FALSE(CWalkTool::readDocuments(input_file, documents));
    ASSERT_EQ(documents.size(), 2u);
    EXPECT_EQ(documents[0].count(), 3u);
    EXPECT_EQ(documents[1].count(), 3u);
}

TEST_F(WalkRegressionTest, TestReadTruncatedFile)
{
    std::filesystem::resize_file(input_file,
                                 std::filesystem::file_size(input_file) - 2);

    std::vector<CDocument> documents;
    EXPECT_EQ(CWalkTool::readDocuments(input_file, documents),
              CBsonErrc::MalformedHeader);

    CWalkTool tool(config, out, err);
    EXPECT_EQ(tool.dump(input_file), 1);
    EXPECT_NE(err.str().find("Failed to read"), std::string::npos);
}

TEST_F(WalkRegressionTest, TestDump)
{
    CWalkTool tool(config, out, err);
    ASSERT_EQ(tool.dump(input_file), 0);

    std::vector<std::string> lines = outputLines();
    ASSERT_EQ(lines.size(), 2u);

    json first = json::parse(lines[0]);
    EXPECT_EQ(first["id"]["$numberInt"], "1");
    EXPECT_EQ(first["name"], "alpha");

    json second = json::parse(lines[1]);
    EXPECT_EQ(second["hits"]["$numberLong"], "10");
}

TEST_F(WalkRegressionTest, TestDumpRelaxed)
{
    config.jsonMode = "relaxed";
    CWalkTool tool(config, out, err);
    ASSERT_EQ(tool.dump(input_file), 0);

    json first = json::parse(outputLines()[0]);
    EXPECT_EQ(first["id"], 1);
    EXPECT_EQ(first["score"], 0.5);
}

TEST_F(WalkRegressionTest, TestKeys)
{
    CWalkTool tool(config, out, err);
    ASSERT_EQ(tool.keys(input_file), 0);
    EXPECT_EQ(outputLines(),
              (std::vector<std::string>{"id name score", "id active hits"}));
}

TEST_F(WalkRegressionTest, TestGet)
{
    CWalkTool tool(config, out, err);
    ASSERT_EQ(tool.get(input_file, "active"), 0);

    std::vector<std::string> lines = outputLines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(json::parse(lines[0])["active"], true);

    EXPECT_EQ(tool.get(input_file, "missing"), 1);
    EXPECT_NE(err.str().find("key 'missing' not found"), std::string::npos);
}

TEST_F(WalkRegressionTest, TestSlice)
{
    std::string output = (test_data_dir / "slice.bson").string();

    CWalkTool tool(config, out, err);
    ASSERT_EQ(tool.slice(input_file, "1", "end", output), 0);

    std::vector<CDocument> slices;
    ASSERT_FALSE(CWalkTool::readDocuments(output, slices));
    ASSERT_EQ(slices.size(), 2u);
    EXPECT_EQ(CDocumentIterator(slices[0]).keys(),
              (std::vector<std::string>{"name", "score"}));
    EXPECT_EQ(CDocumentIterator(slices[1]).keys(),
              (std::vector<std::string>{"active", "hits"}));
}

TEST_F(WalkRegressionTest, TestSliceRejectsBadRange)
{
    std::string output = (test_data_dir / "slice.bson").string();

    CWalkTool tool(config, out, err);
    EXPECT_EQ(tool.slice(input_file, "3", "1", output), 1);
    EXPECT_EQ(tool.slice(input_file, "x", "1", output), 1);
    EXPECT_FALSE(std::filesystem::exists(output));
}

TEST_F(WalkRegressionTest, TestSetKeepsFileLength)
{
    auto before = std::filesystem::file_size(input_file);

    CWalkTool tool(config, out, err);
    ASSERT_EQ(tool.set(input_file, "id", "-40"), 0);
    EXPECT_EQ(std::filesystem::file_size(input_file), before);

    std::vector<CDocument> documents;
    ASSERT_FALSE(CWalkTool::readDocuments(input_file, documents));
    for (const auto& doc : documents)
        EXPECT_EQ(CDocumentIterator(doc, "id").currentValue(),
                  CBsonValue(int32_t{-40}));
}

TEST_F(WalkRegressionTest, TestSetRejectsVariableWidth)
{
    CWalkTool tool(config, out, err);
    EXPECT_EQ(tool.set(input_file, "name", "beta"), 1);
    EXPECT_NE(err.str().find("cannot set string"), std::string::npos);
}

TEST_F(WalkRegressionTest, TestSetRejectsBadNumber)
{
    CWalkTool tool(config, out, err);
    EXPECT_EQ(tool.set(input_file, "hits", "ten"), 1);
    EXPECT_EQ(tool.set(input_file, "active", "false"), 0);

    std::vector<CDocument> documents;
    ASSERT_FALSE(CWalkTool::readDocuments(input_file, documents));
    EXPECT_EQ(CDocumentIterator(documents[1], "active").currentValue(),
              CBsonValue(false));
    EXPECT_EQ(CDocumentIterator(documents[1], "hits").currentValue(),
              CBsonValue(int64_t{10}));
}

TEST_F(WalkRegressionTest, TestUnknownTypePolicy)
{
    CDocument doc = CRawDocument()
                        .int32("a", 1)
                        .element(0x42, "u", {0x01})
                        .build();
    ASSERT_FALSE(CWalkTool::writeDocuments(input_file, {doc}));

    CWalkTool lenient(config, out, err);
    EXPECT_EQ(lenient.keys(input_file), 1);
    EXPECT_EQ(outputLines(), (std::vector<std::string>{"a u"}));

    out.str("");
    config.unknownTypePolicy = "fail";
    CWalkTool strict(config, out, err);
    EXPECT_EQ(strict.keys(input_file), 1);
    EXPECT_EQ(outputLines(), (std::vector<std::string>{"a"}));
}

} /* namespace Regression */
} /* namespace BsonWalk */
