/*-------------------------------------------------------------------------
 *
 * overwrite_regression.cpp
 *      In-place replacement of fixed width values.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "CRawDocument.hpp"
#include "document/CBsonError.hpp"
#include "document/CDocumentBuilder.hpp"
#include "document/CDocumentIterator.hpp"
#include "document/CInPlaceOverwriter.hpp"

#include <gtest/gtest.h>

namespace BsonWalk
{
namespace Regression
{

class OverwriteRegressionTest : public ::testing::Test
{
  protected:
    CDocument doc = CRawDocument()
                        .string("name", "n")
                        .int32("count", 5)
                        .int64("big", 1)
                        .real("ratio", 0.5)
                        .boolean("flag", false)
                        .build();
};

TEST_F(OverwriteRegressionTest, TestInt32KeepsLayout)
{
    std::vector<uint8_t> before = doc.bytes();

    auto iter = CDocumentIterator::forWriting(doc);
    ASSERT_TRUE(iter.isWritable());
    ASSERT_TRUE(iter.move("count"));
    CValueRange range = iter.currentValueRange();

    EXPECT_FALSE(iter.overwriteCurrentValue(CBsonValue(int32_t{-5})));

    std::vector<uint8_t> after = doc.bytes();
    ASSERT_EQ(after.size(), before.size());
    for (size_t i = 0; i < after.size(); i++)
    {
        if (i >= range.offset && i < range.offset + range.length)
            continue;
        EXPECT_EQ(after[i], before[i]) << "byte " << i;
    }

    CDocumentIterator check(doc, "count");
    EXPECT_EQ(check.currentValue(), CBsonValue(int32_t{-5}));
}

TEST_F(OverwriteRegressionTest, TestEveryFixedWidthScalar)
{
    auto iter = CDocumentIterator::forWriting(doc);

    ASSERT_TRUE(iter.move("big"));
    EXPECT_FALSE(iter.overwriteCurrentValue(CBsonValue(int64_t{-1} << 50)));
    ASSERT_TRUE(iter.move("ratio"));
    EXPECT_FALSE(iter.overwriteCurrentValue(CBsonValue(-3.25)));
    ASSERT_TRUE(iter.move("flag"));
    EXPECT_FALSE(iter.overwriteCurrentValue(CBsonValue(true)));

    CDocumentIterator check(doc);
    std::vector<CBsonValue> values = check.values();
    ASSERT_EQ(values.size(), 5u);
    EXPECT_EQ(values[2], CBsonValue(int64_t{-1} << 50));
    EXPECT_EQ(values[3], CBsonValue(-3.25));
    EXPECT_EQ(values[4], CBsonValue(true));
}

TEST_F(OverwriteRegressionTest, TestLibbsonTypes)
{
    CDocumentBuilder builder;
    ASSERT_TRUE(builder.addObjectId("_id", "0102030405060708090a0b0c"));
    ASSERT_TRUE(builder.addDateTime("when", 1000));
    ASSERT_TRUE(builder.addDecimal128("amount", "1.5"));
    ASSERT_TRUE(builder.append("ts", CBsonTimestamp{10, 1}));
    CDocument built = builder.build();

    auto newId = CBsonObjectId::fromHex("ffffffffffffffffffffffff");
    auto newAmount = CBsonDecimal128::fromString("-2.75");
    ASSERT_TRUE(newId && newAmount);

    auto iter = CDocumentIterator::forWriting(built);
    ASSERT_TRUE(iter.advance());
    EXPECT_FALSE(iter.overwriteCurrentValue(*newId));
    ASSERT_TRUE(iter.advance());
    EXPECT_FALSE(iter.overwriteCurrentValue(CBsonDateTime{-1000}));
    ASSERT_TRUE(iter.advance());
    EXPECT_FALSE(iter.overwriteCurrentValue(*newAmount));
    ASSERT_TRUE(iter.advance());
    EXPECT_FALSE(iter.overwriteCurrentValue(CBsonTimestamp{20, 2}));

    CDocumentIterator check(built);
    std::vector<CBsonValue> values = check.values();
    ASSERT_EQ(values.size(), 4u);
    EXPECT_EQ(values[0].as<CBsonObjectId>().toHex(),
              "ffffffffffffffffffffffff");
    EXPECT_EQ(values[1].as<CBsonDateTime>().millis, -1000);
    EXPECT_EQ(values[2].as<CBsonDecimal128>().toString(), "-2.75");
    EXPECT_EQ(values[3].as<CBsonTimestamp>().timestamp, 20u);
    EXPECT_EQ(values[3].as<CBsonTimestamp>().increment, 2u);
}

TEST_F(OverwriteRegressionTest, TestVariableWidthNotOverwritable)
{
    std::vector<uint8_t> before = doc.bytes();

    auto iter = CDocumentIterator::forWriting(doc);
    ASSERT_TRUE(iter.move("name"));
    EXPECT_EQ(iter.overwriteCurrentValue(CBsonValue("m")),
              CBsonErrc::NotOverwritable);
    EXPECT_EQ(doc.bytes(), before);
}

TEST_F(OverwriteRegressionTest, TestCopyOnWrite)
{
    CDocument reader = doc;
    CDocumentIterator readIter(reader, "count");

    auto iter = CDocumentIterator::forWriting(doc);
    EXPECT_NE(doc.storage(), reader.storage());
    ASSERT_TRUE(iter.move("count"));
    EXPECT_FALSE(iter.overwriteCurrentValue(CBsonValue(int32_t{99})));

    EXPECT_EQ(readIter.currentValue(), CBsonValue(int32_t{5}));
    EXPECT_EQ(CDocumentIterator(doc, "count").currentValue(),
              CBsonValue(int32_t{99}));
}

TEST_F(OverwriteRegressionTest, TestWritableViewOfNestedDocument)
{
    CRawDocument inner;
    inner.int32("v", 1);
    CDocument outer = CRawDocument().document("sub", inner).build();

    CDocument sub = CDocumentIterator(outer, "sub").currentValue().as<CDocument>();
    auto iter = CDocumentIterator::forWriting(sub);
    ASSERT_TRUE(iter.move("v"));
    EXPECT_FALSE(iter.overwriteCurrentValue(CBsonValue(int32_t{2})));

    EXPECT_EQ(CDocumentIterator(sub, "v").currentValue(), CBsonValue(int32_t{2}));
    EXPECT_EQ(CDocumentIterator(outer, "sub").currentValue().as<CDocument>(),
              CRawDocument().int32("v", 1).build());
}

TEST_F(OverwriteRegressionTest, TestEncodeFixedWidth)
{
    auto bytes = CInPlaceOverwriter::encodeFixedWidth(CBsonValue(int32_t{-5}));
    ASSERT_TRUE(bytes.has_value());
    EXPECT_EQ(*bytes, (std::vector<uint8_t>{0xFB, 0xFF, 0xFF, 0xFF}));

    auto ts = CInPlaceOverwriter::encodeFixedWidth(CBsonTimestamp{2, 1});
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(*ts, cat(le32(1), le32(2)));

    EXPECT_TRUE(CInPlaceOverwriter::encodeFixedWidth(CBsonNull{})->empty());
    EXPECT_FALSE(CInPlaceOverwriter::encodeFixedWidth(CBsonValue("x")));
}

TEST_F(OverwriteRegressionTest, TestTypeMismatchIsFatal)
{
    auto iter = CDocumentIterator::forWriting(doc);
    ASSERT_TRUE(iter.move("count"));
    EXPECT_DEATH(iter.overwriteCurrentValue(CBsonValue(int64_t{5})),
                 "Cannot overwrite 'count' of BSON type int with a value of type long");
}

TEST_F(OverwriteRegressionTest, TestReadOnlyIteratorIsFatal)
{
    CDocumentIterator iter(doc, "count");
    EXPECT_FALSE(iter.isWritable());
    EXPECT_DEATH(iter.overwriteCurrentValue(CBsonValue(int32_t{1})),
                 "forWriting");
}

TEST_F(OverwriteRegressionTest, TestReadOnlyVariableWidthIsFatal)
{
    CDocumentIterator iter(doc, "name");
    ASSERT_TRUE(iter.isValid());
    EXPECT_DEATH(iter.overwriteCurrentValue(CBsonValue("m")),
                 "overwrite of 'name' through an iterator not obtained from "
                 "forWriting");
}

TEST_F(OverwriteRegressionTest, TestUnpositionedIsFatal)
{
    auto iter = CDocumentIterator::forWriting(doc);
    EXPECT_DEATH(iter.overwriteCurrentValue(CBsonValue(int32_t{1})),
                 "overwrite while iterator is BeforeFirst");
}

} /* namespace Regression */
} /* namespace BsonWalk */
