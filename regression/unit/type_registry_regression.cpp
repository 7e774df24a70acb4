/*-------------------------------------------------------------------------
 *
 * type_registry_regression.cpp
 *      Wire type table and value decoders.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "CRawDocument.hpp"
#include "document/CDocumentBuilder.hpp"
#include "document/CDocumentIterator.hpp"
#include "document/CTypeRegistry.hpp"

#include <gtest/gtest.h>

namespace BsonWalk
{
namespace Regression
{

class TypeRegistryRegressionTest : public ::testing::Test
{
  protected:
    const CTypeRegistry& registry = CTypeRegistry::instance();

    /* Decode the first element of a document */
    CBsonValue first(const CDocument& doc)
    {
        CDocumentIterator iter(doc);
        EXPECT_TRUE(iter.advance());
        return iter.currentValue();
    }
};

TEST_F(TypeRegistryRegressionTest, TestRecognizedTags)
{
    for (int tag = 0x01; tag <= 0x13; tag++)
        EXPECT_TRUE(registry.isRecognized(static_cast<uint8_t>(tag))) << tag;
    EXPECT_TRUE(registry.isRecognized(0x7F));
    EXPECT_TRUE(registry.isRecognized(0xFF));

    EXPECT_FALSE(registry.isRecognized(0x00));
    EXPECT_FALSE(registry.isRecognized(0x14));
    EXPECT_FALSE(registry.isRecognized(0x42));
    EXPECT_FALSE(registry.isRecognized(0x80));
}

TEST_F(TypeRegistryRegressionTest, TestFixedWidths)
{
    EXPECT_EQ(registry.fixedWidth(0x01), 8u);
    EXPECT_EQ(registry.fixedWidth(0x06), 0u);
    EXPECT_EQ(registry.fixedWidth(0x07), 12u);
    EXPECT_EQ(registry.fixedWidth(0x08), 1u);
    EXPECT_EQ(registry.fixedWidth(0x09), 8u);
    EXPECT_EQ(registry.fixedWidth(0x0A), 0u);
    EXPECT_EQ(registry.fixedWidth(0x10), 4u);
    EXPECT_EQ(registry.fixedWidth(0x11), 8u);
    EXPECT_EQ(registry.fixedWidth(0x12), 8u);
    EXPECT_EQ(registry.fixedWidth(0x13), 16u);
    EXPECT_EQ(registry.fixedWidth(0x7F), 0u);
    EXPECT_EQ(registry.fixedWidth(0xFF), 0u);

    for (uint8_t tag : {0x02, 0x03, 0x04, 0x05, 0x0B, 0x0C, 0x0D, 0x0E, 0x0F})
        EXPECT_FALSE(registry.fixedWidth(tag).has_value()) << int(tag);
    EXPECT_FALSE(registry.fixedWidth(0x42).has_value());
}

TEST_F(TypeRegistryRegressionTest, TestTypeNames)
{
    EXPECT_STREQ(registry.typeName(CBsonWireType::Int32), "int");
    EXPECT_STREQ(registry.typeName(CBsonWireType::Int64), "long");
    EXPECT_STREQ(registry.typeName(CBsonWireType::String), "string");
    EXPECT_STREQ(registry.typeName(uint8_t{0x42}), "invalid");

    const CTypeEntry& entry = registry.entry(0x12);
    EXPECT_EQ(entry.type, CBsonWireType::Int64);
    EXPECT_EQ(entry.fixedWidth, 8);
    EXPECT_NE(entry.decoder, nullptr);
    EXPECT_FALSE(registry.entry(0x42).recognized);
}

TEST_F(TypeRegistryRegressionTest, TestUnknownTagDecodesToSentinel)
{
    CDocument doc = CRawDocument().element(0x42, "u", {0x01, 0x02}).build();

    CBsonValue value = first(doc);
    ASSERT_TRUE(value.isInvalid());
    EXPECT_EQ(value.as<CBsonInvalid>().tag, 0x42);
}

TEST_F(TypeRegistryRegressionTest, TestScalarDecoders)
{
    CDocument doc = CRawDocument()
                        .real("d", 2.5)
                        .int32("i", -7)
                        .int64("l", int64_t{1} << 40)
                        .boolean("t", true)
                        .element(0x09, "dt", le64(1700000000000))
                        .element(0x11, "ts", cat(le32(3), le32(1234)))
                        .element(0x0A, "n", {})
                        .element(0x06, "u", {})
                        .element(0xFF, "min", {})
                        .element(0x7F, "max", {})
                        .build();

    CDocumentIterator iter(doc);
    std::vector<CBsonValue> values = iter.values();
    ASSERT_EQ(values.size(), 10u);

    EXPECT_EQ(values[0], CBsonValue(2.5));
    EXPECT_EQ(values[1], CBsonValue(int32_t{-7}));
    EXPECT_EQ(values[2], CBsonValue(int64_t{1} << 40));
    EXPECT_EQ(values[3], CBsonValue(true));
    EXPECT_EQ(values[4], CBsonValue(CBsonDateTime{1700000000000}));
    EXPECT_EQ(values[5].as<CBsonTimestamp>().timestamp, 1234u);
    EXPECT_EQ(values[5].as<CBsonTimestamp>().increment, 3u);
    EXPECT_EQ(values[6].type(), CBsonWireType::Null);
    EXPECT_EQ(values[7].type(), CBsonWireType::Undefined);
    EXPECT_EQ(values[8].type(), CBsonWireType::MinKey);
    EXPECT_EQ(values[9].type(), CBsonWireType::MaxKey);
}

TEST_F(TypeRegistryRegressionTest, TestStringLikeDecoders)
{
    std::vector<uint8_t> oid = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12};
    CDocument doc = CRawDocument()
                        .string("s", "hello")
                        .element(0x0D, "code", bsonString("f()"))
                        .element(0x0E, "sym", bsonString("atom"))
                        .element(0x0B, "re", {'a', '+', 0x00, 'i', 0x00})
                        .element(0x0C, "ptr", cat(bsonString("db.c"), oid))
                        .element(0x07, "oid", oid)
                        .build();

    CDocumentIterator iter(doc);
    std::vector<CBsonValue> values = iter.values();
    ASSERT_EQ(values.size(), 6u);

    EXPECT_EQ(values[0].as<std::string>(), "hello");
    EXPECT_EQ(values[1].as<CBsonCode>().code, "f()");
    EXPECT_EQ(values[2].as<CBsonSymbol>().symbol, "atom");
    EXPECT_EQ(values[3].as<CBsonRegex>().pattern, "a+");
    EXPECT_EQ(values[3].as<CBsonRegex>().options, "i");
    EXPECT_EQ(values[4].as<CBsonDbPointer>().collection, "db.c");
    EXPECT_EQ(values[4].as<CBsonDbPointer>().id.bytes[11], 12);
    EXPECT_EQ(values[5].as<CBsonObjectId>().toHex(),
              "0102030405060708090a0b0c");
}

TEST_F(TypeRegistryRegressionTest, TestBinaryDecoder)
{
    std::vector<uint8_t> generic = cat(le32(3), {0x00, 'a', 'b', 'c'});
    std::vector<uint8_t> old =
        cat(le32(7), cat({0x02}, cat(le32(3), {'x', 'y', 'z'})));

    CDocument doc = CRawDocument()
                        .element(0x05, "g", generic)
                        .element(0x05, "o", old)
                        .build();

    CDocumentIterator iter(doc);
    std::vector<CBsonValue> values = iter.values();
    ASSERT_EQ(values.size(), 2u);

    EXPECT_EQ(values[0].as<CBsonBinary>().subtype, 0x00);
    EXPECT_EQ(values[0].as<CBsonBinary>().data,
              (std::vector<uint8_t>{'a', 'b', 'c'}));
    EXPECT_EQ(values[1].as<CBsonBinary>().subtype, 0x02);
    EXPECT_EQ(values[1].as<CBsonBinary>().data,
              (std::vector<uint8_t>{'x', 'y', 'z'}));
}

TEST_F(TypeRegistryRegressionTest, TestInconsistentOldBinary)
{
    std::vector<uint8_t> old =
        cat(le32(7), cat({0x02}, cat(le32(9), {'x', 'y', 'z'})));
    CDocument doc = CRawDocument().element(0x05, "o", old).build();

    CDocumentIterator iter(doc);
    EXPECT_FALSE(iter.advance());
    EXPECT_EQ(iter.status(), CCursorStatus::Exhausted);
    EXPECT_EQ(iter.lastError(), CBsonErrc::CorruptElement);

    CDocumentIterator seek(doc, "o");
    EXPECT_FALSE(seek.isValid());
    EXPECT_EQ(seek.lastError(), CBsonErrc::CorruptElement);
}

TEST_F(TypeRegistryRegressionTest, TestTruncatedOldBinary)
{
    std::vector<uint8_t> old = cat(le32(2), {0x02, 0x00, 0x00});
    CDocument doc = CRawDocument().element(0x05, "o", old).int32("n", 1).build();

    CDocumentIterator iter(doc);
    EXPECT_FALSE(iter.advance());
    EXPECT_EQ(iter.lastError(), CBsonErrc::CorruptElement);
}

TEST_F(TypeRegistryRegressionTest, TestCompositeValuesShareStorage)
{
    CRawDocument inner;
    inner.int32("a", 1).string("b", "two");

    CRawDocument list;
    list.int32("0", 10).int32("1", 20);

    CDocument doc = CRawDocument().document("d", inner).array("l", list).build();

    CDocumentIterator iter(doc);
    std::vector<CBsonValue> values = iter.values();
    ASSERT_EQ(values.size(), 2u);

    const CDocument& sub = values[0].as<CDocument>();
    EXPECT_EQ(sub.storage(), doc.storage());
    EXPECT_EQ(sub.count(), 2u);

    const CBsonArray& array = values[1].as<CBsonArray>();
    EXPECT_EQ(array.elements.storage(), doc.storage());
    EXPECT_EQ(array.size(), 2u);
    EXPECT_EQ(array.values(),
              (std::vector<CBsonValue>{int32_t{10}, int32_t{20}}));
}

TEST_F(TypeRegistryRegressionTest, TestCodeWithScopeDecoder)
{
    CDocument scope = CRawDocument().int32("x", 1).build();
    std::vector<uint8_t> inner = cat(bsonString("f(x)"), scope.bytes());
    std::vector<uint8_t> payload =
        cat(le32(static_cast<int32_t>(inner.size() + 4)), inner);

    CDocument doc = CRawDocument().element(0x0F, "c", payload).build();
    CBsonValue value = first(doc);

    ASSERT_EQ(value.type(), CBsonWireType::CodeWithScope);
    EXPECT_EQ(value.as<CBsonCodeWithScope>().code, "f(x)");
    EXPECT_EQ(value.as<CBsonCodeWithScope>().scope, scope);
}

TEST_F(TypeRegistryRegressionTest, TestDecimal128Text)
{
    auto dec = CBsonDecimal128::fromString("1.5");
    ASSERT_TRUE(dec.has_value());
    EXPECT_EQ(dec->toString(), "1.5");

    CDocumentBuilder builder;
    ASSERT_TRUE(builder.append("d", *dec));
    CBsonValue value = first(builder.build());
    EXPECT_EQ(value, CBsonValue(*dec));

    EXPECT_FALSE(CBsonDecimal128::fromString("not a number").has_value());
}

} /* namespace Regression */
} /* namespace BsonWalk */
