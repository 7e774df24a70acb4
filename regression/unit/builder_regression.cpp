/*-------------------------------------------------------------------------
 *
 * builder_regression.cpp
 *      libbson document builder and extended JSON rendering.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "CRawDocument.hpp"
#include "document/CDocumentBuilder.hpp"
#include "document/CDocumentIterator.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace BsonWalk
{
namespace Regression
{

class BuilderRegressionTest : public ::testing::Test
{
  protected:
    CDocumentBuilder builder;
};

TEST_F(BuilderRegressionTest, TestEmptyBuilder)
{
    EXPECT_TRUE(builder.isEmpty());
    EXPECT_EQ(builder.getDocumentSize(), 5u);
    EXPECT_EQ(builder.build(), CDocument());
}

TEST_F(BuilderRegressionTest, TestEveryWireType)
{
    CDocument scope = CRawDocument().int32("x", 1).build();
    CDocument sub = CRawDocument().string("k", "v").build();
    CBsonObjectId oid = *CBsonObjectId::fromHex("0102030405060708090a0b0c");

    ASSERT_TRUE(builder.append("double", 1.25));
    ASSERT_TRUE(builder.append("string", "text"));
    ASSERT_TRUE(builder.append("document", sub));
    ASSERT_TRUE(builder.addArray("array", {int32_t{1}, "two"}));
    ASSERT_TRUE(builder.append("binary", CBsonBinary{0x00, {1, 2, 3}}));
    ASSERT_TRUE(builder.append("undefined", CBsonUndefined{}));
    ASSERT_TRUE(builder.append("oid", oid));
    ASSERT_TRUE(builder.append("bool", true));
    ASSERT_TRUE(builder.append("date", CBsonDateTime{86400000}));
    ASSERT_TRUE(builder.append("null", CBsonNull{}));
    ASSERT_TRUE(builder.append("regex", CBsonRegex{"^a", "i"}));
    ASSERT_TRUE(builder.append("dbptr", CBsonDbPointer{"db.c", oid}));
    ASSERT_TRUE(builder.append("code", CBsonCode{"f()"}));
    ASSERT_TRUE(builder.append("symbol", CBsonSymbol{"sym"}));
    ASSERT_TRUE(builder.append("cws", CBsonCodeWithScope{"g(x)", scope}));
    ASSERT_TRUE(builder.append("int32", int32_t{-3}));
    ASSERT_TRUE(builder.append("ts", CBsonTimestamp{100, 7}));
    ASSERT_TRUE(builder.append("int64", int64_t{1} << 33));
    ASSERT_TRUE(builder.append("dec", *CBsonDecimal128::fromString("0.1")));
    ASSERT_TRUE(builder.append("min", CBsonMinKey{}));
    ASSERT_TRUE(builder.append("max", CBsonMaxKey{}));
    ASSERT_FALSE(builder.hasErrors());

    CDocument doc = builder.build();
    CDocumentIterator iter(doc);
    std::vector<CBsonWireType> types;
    std::vector<CBsonValue> values;
    while (auto pair = iter.next())
    {
        types.push_back(pair->second.type());
        values.push_back(pair->second);
    }

    std::vector<CBsonWireType> expected = {
        CBsonWireType::Double,    CBsonWireType::String,
        CBsonWireType::Document,  CBsonWireType::Array,
        CBsonWireType::Binary,    CBsonWireType::Undefined,
        CBsonWireType::ObjectId,  CBsonWireType::Boolean,
        CBsonWireType::DateTime,  CBsonWireType::Null,
        CBsonWireType::Regex,     CBsonWireType::DbPointer,
        CBsonWireType::Code,      CBsonWireType::Symbol,
        CBsonWireType::CodeWithScope, CBsonWireType::Int32,
        CBsonWireType::Timestamp, CBsonWireType::Int64,
        CBsonWireType::Decimal128, CBsonWireType::MinKey,
        CBsonWireType::MaxKey};
    EXPECT_EQ(types, expected);
    EXPECT_FALSE(iter.lastError());

    EXPECT_EQ(values[2].as<CDocument>(), sub);
    EXPECT_EQ(values[3].as<CBsonArray>().values(),
              (std::vector<CBsonValue>{int32_t{1}, "two"}));
    EXPECT_EQ(values[4].as<CBsonBinary>().data,
              (std::vector<uint8_t>{1, 2, 3}));
    EXPECT_EQ(values[11].as<CBsonDbPointer>().id, oid);
    EXPECT_EQ(values[14].as<CBsonCodeWithScope>().scope, scope);
    EXPECT_EQ(values[16].as<CBsonTimestamp>().timestamp, 100u);
    EXPECT_EQ(values[18].as<CBsonDecimal128>().toString(), "0.1");
}

TEST_F(BuilderRegressionTest, TestCodeWithEmptyScopeKeepsType)
{
    std::vector<uint8_t> body = cat(bsonString("f()"), CDocument().bytes());
    CDocument expected =
        CRawDocument()
            .element(0x0F, "c",
                     cat(le32(static_cast<int32_t>(body.size() + 4)), body))
            .build();

    ASSERT_TRUE(builder.append("c", CBsonCodeWithScope{"f()", CDocument()}));
    EXPECT_EQ(builder.build(), expected);

    CDocumentIterator iter(builder.build(), "c");
    EXPECT_EQ(iter.currentType(), CBsonWireType::CodeWithScope);
    EXPECT_EQ(iter.currentValue().as<CBsonCodeWithScope>().scope, CDocument());
}

TEST_F(BuilderRegressionTest, TestCodeTextWithNul)
{
    std::string code("a\0b", 3);

    ASSERT_TRUE(builder.append("code", CBsonCode{code}));
    EXPECT_EQ(builder.build(),
              CRawDocument().element(0x0D, "code", bsonString(code)).build());
    EXPECT_EQ(CDocumentIterator(builder.build(), "code")
                  .currentValue()
                  .as<CBsonCode>()
                  .code,
              code);
}

TEST_F(BuilderRegressionTest, TestScopedCodeTextWithNul)
{
    std::string code("g(\0)", 4);
    CRawDocument scope;
    scope.int32("x", 1);

    ASSERT_TRUE(builder.append("cws", CBsonCodeWithScope{code, scope.build()}));

    std::vector<uint8_t> body = cat(bsonString(code), scope.bytes());
    EXPECT_EQ(builder.build(),
              CRawDocument()
                  .element(0x0F, "cws",
                           cat(le32(static_cast<int32_t>(body.size() + 4)),
                               body))
                  .build());
}

TEST_F(BuilderRegressionTest, TestDbPointerCollectionWithNul)
{
    std::string collection("db\0c", 4);
    CBsonObjectId oid = *CBsonObjectId::fromHex("0102030405060708090a0b0c");

    ASSERT_TRUE(builder.append("p", CBsonDbPointer{collection, oid}));

    std::vector<uint8_t> idBytes(oid.bytes.begin(), oid.bytes.end());
    EXPECT_EQ(builder.build(),
              CRawDocument()
                  .element(0x0C, "p", cat(bsonString(collection), idBytes))
                  .build());

    CBsonDbPointer back = CDocumentIterator(builder.build(), "p")
                              .currentValue()
                              .as<CBsonDbPointer>();
    EXPECT_EQ(back.collection, collection);
    EXPECT_EQ(back.id, oid);
}

TEST_F(BuilderRegressionTest, TestRawElementsIntoArray)
{
    ASSERT_TRUE(builder.addArray("l", {CBsonCode{"x"}, int32_t{2}}));

    CRawDocument list;
    list.element(0x0D, "0", bsonString("x")).int32("1", 2);
    EXPECT_EQ(builder.build(), CRawDocument().array("l", list).build());
}

TEST_F(BuilderRegressionTest, TestInvalidValueRefused)
{
    EXPECT_FALSE(builder.append("bad", CBsonInvalid{0x42}));
    EXPECT_TRUE(builder.hasErrors());
    EXPECT_NE(builder.getLastError().find("bad"), std::string::npos);

    /* refused until the error is cleared */
    EXPECT_FALSE(builder.addInt32("ok", 1));

    builder.clearErrors();
    EXPECT_TRUE(builder.addInt32("ok", 1));
    EXPECT_EQ(builder.build().count(), 1u);
}

TEST_F(BuilderRegressionTest, TestInvalidTextForms)
{
    EXPECT_FALSE(builder.addObjectId("_id", "xyz"));
    EXPECT_EQ(builder.getLastError(), "Invalid ObjectId format");

    builder.clear();
    EXPECT_FALSE(builder.addDecimal128("d", "abc"));
    EXPECT_EQ(builder.getLastError(), "Invalid Decimal128 format");

    builder.clear();
    EXPECT_FALSE(builder.hasErrors());
    EXPECT_TRUE(builder.isEmpty());
}

TEST_F(BuilderRegressionTest, TestExtendedJson)
{
    ASSERT_TRUE(builder.addInt32("n", 7));
    ASSERT_TRUE(builder.addString("s", "hi"));
    ASSERT_TRUE(builder.addInt64("l", 9));

    CDocument doc = builder.build();

    json canonical = json::parse(doc.toJson());
    EXPECT_EQ(canonical["n"]["$numberInt"], "7");
    EXPECT_EQ(canonical["s"], "hi");
    EXPECT_EQ(canonical["l"]["$numberLong"], "9");

    json relaxed = json::parse(doc.toJson(true));
    EXPECT_EQ(relaxed["n"], 7);
    EXPECT_EQ(relaxed["l"], 9);
}

TEST_F(BuilderRegressionTest, TestJsonOfInvalidBytes)
{
    std::vector<uint8_t> bytes = CRawDocument().int32("a", 1).bytes();
    bytes[0] = 0x50;
    EXPECT_TRUE(CDocument(bytes).toJson().empty());
}

} /* namespace Regression */
} /* namespace BsonWalk */
