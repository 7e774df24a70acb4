/*-------------------------------------------------------------------------
 *
 * byte_cursor_regression.cpp
 *      Header validation and bounds checks of the byte cursor.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "CRawDocument.hpp"
#include "document/CBsonError.hpp"
#include "document/CByteCursor.hpp"

#include <gtest/gtest.h>

namespace BsonWalk
{
namespace Regression
{

class ByteCursorRegressionTest : public ::testing::Test
{
  protected:
    CByteCursor cursor;

    std::error_code open(const std::vector<uint8_t>& bytes,
                         CUnknownTypePolicy policy = CUnknownTypePolicy::Sentinel)
    {
        return cursor.init(CDocument(bytes), policy);
    }
};

TEST_F(ByteCursorRegressionTest, TestEmptyDocument)
{
    ASSERT_FALSE(open({0x05, 0x00, 0x00, 0x00, 0x00}));
    EXPECT_EQ(cursor.status(), CCursorStatus::BeforeFirst);

    EXPECT_FALSE(cursor.advance());
    EXPECT_EQ(cursor.status(), CCursorStatus::Exhausted);
    EXPECT_FALSE(cursor.error());
}

TEST_F(ByteCursorRegressionTest, TestShortBuffer)
{
    EXPECT_EQ(open({0x05, 0x00, 0x00}), CBsonErrc::MalformedHeader);
    EXPECT_EQ(cursor.status(), CCursorStatus::Invalid);
    EXPECT_FALSE(cursor.advance());
    EXPECT_EQ(cursor.status(), CCursorStatus::Invalid);
}

TEST_F(ByteCursorRegressionTest, TestLengthPrefixMismatch)
{
    std::vector<uint8_t> bytes = CRawDocument().int32("a", 1).bytes();
    bytes[0] += 1;
    EXPECT_EQ(open(bytes), CBsonErrc::MalformedHeader);

    bytes = CRawDocument().int32("a", 1).bytes();
    bytes.push_back(0);
    EXPECT_EQ(open(bytes), CBsonErrc::MalformedHeader);
}

TEST_F(ByteCursorRegressionTest, TestMissingTerminator)
{
    std::vector<uint8_t> bytes = CRawDocument().int32("a", 1).bytes();
    bytes.back() = 0x01;
    EXPECT_EQ(open(bytes), CBsonErrc::MalformedHeader);
    EXPECT_EQ(cursor.status(), CCursorStatus::Invalid);
}

TEST_F(ByteCursorRegressionTest, TestElementRanges)
{
    ASSERT_FALSE(open(CRawDocument().int32("x", 1).string("y", "hi").bytes()));

    ASSERT_TRUE(cursor.advance());
    EXPECT_EQ(cursor.currentKeyBytes(), "x");
    EXPECT_EQ(cursor.currentTypeTag(), 0x10);
    EXPECT_EQ(cursor.currentValueRange().offset, 7u);
    EXPECT_EQ(cursor.currentValueRange().length, 4u);

    ASSERT_TRUE(cursor.advance());
    EXPECT_EQ(cursor.currentKeyBytes(), "y");
    EXPECT_EQ(cursor.currentTypeTag(), 0x02);
    EXPECT_EQ(cursor.currentValueRange().offset, 14u);
    EXPECT_EQ(cursor.currentValueRange().length, 7u);

    EXPECT_FALSE(cursor.advance());
    EXPECT_EQ(cursor.status(), CCursorStatus::Exhausted);
    EXPECT_FALSE(cursor.advance());
    EXPECT_EQ(cursor.status(), CCursorStatus::Exhausted);
}

TEST_F(ByteCursorRegressionTest, TestZeroWidthValues)
{
    ASSERT_FALSE(open(CRawDocument()
                          .element(0x0A, "n", {})
                          .element(0xFF, "min", {})
                          .element(0x7F, "max", {})
                          .int32("after", 7)
                          .bytes()));

    for (const char* key : {"n", "min", "max"})
    {
        ASSERT_TRUE(cursor.advance());
        EXPECT_EQ(cursor.currentKeyBytes(), key);
        EXPECT_EQ(cursor.currentValueRange().length, 0u);
    }
    ASSERT_TRUE(cursor.advance());
    EXPECT_EQ(cursor.currentKeyBytes(), "after");
}

TEST_F(ByteCursorRegressionTest, TestTerminatorBeforeEnd)
{
    ASSERT_FALSE(open({0x06, 0x00, 0x00, 0x00, 0x00, 0x00}));
    EXPECT_FALSE(cursor.advance());
    EXPECT_EQ(cursor.status(), CCursorStatus::Exhausted);
    EXPECT_EQ(cursor.error(), CBsonErrc::CorruptElement);
}

TEST_F(ByteCursorRegressionTest, TestUnterminatedKey)
{
    ASSERT_FALSE(open({0x08, 0x00, 0x00, 0x00, 0x10, 'a', 'b', 0x00}));
    EXPECT_FALSE(cursor.advance());
    EXPECT_EQ(cursor.error(), CBsonErrc::CorruptElement);
}

TEST_F(ByteCursorRegressionTest, TestTruncatedFixedWidthValue)
{
    ASSERT_FALSE(open(CRawDocument().element(0x10, "a", {0x01, 0x00}).bytes()));
    EXPECT_FALSE(cursor.advance());
    EXPECT_EQ(cursor.status(), CCursorStatus::Exhausted);
    EXPECT_EQ(cursor.error(), CBsonErrc::CorruptElement);
}

TEST_F(ByteCursorRegressionTest, TestOversizedStringLength)
{
    std::vector<uint8_t> payload = cat(le32(100), {'h', 'i', 0x00});
    ASSERT_FALSE(open(CRawDocument().element(0x02, "s", payload).bytes()));
    EXPECT_FALSE(cursor.advance());
    EXPECT_EQ(cursor.error(), CBsonErrc::CorruptElement);
}

TEST_F(ByteCursorRegressionTest, TestStringWithoutNul)
{
    std::vector<uint8_t> payload = cat(le32(2), {'h', 'i'});
    ASSERT_FALSE(open(CRawDocument().element(0x02, "s", payload).bytes()));
    EXPECT_FALSE(cursor.advance());
    EXPECT_EQ(cursor.error(), CBsonErrc::CorruptElement);
}

TEST_F(ByteCursorRegressionTest, TestNegativeBinaryLength)
{
    std::vector<uint8_t> payload = cat(le32(-1), {0x00});
    ASSERT_FALSE(open(CRawDocument().element(0x05, "b", payload).bytes()));
    EXPECT_FALSE(cursor.advance());
    EXPECT_EQ(cursor.error(), CBsonErrc::CorruptElement);
}

TEST_F(ByteCursorRegressionTest, TestEmbeddedDocumentOverrun)
{
    std::vector<uint8_t> sub = CRawDocument().int32("a", 1).bytes();
    sub[0] = 0x40;
    ASSERT_FALSE(open(CRawDocument().element(0x03, "d", sub).bytes()));
    EXPECT_FALSE(cursor.advance());
    EXPECT_EQ(cursor.error(), CBsonErrc::CorruptElement);
}

TEST_F(ByteCursorRegressionTest, TestCodeWithScopeLengths)
{
    std::vector<uint8_t> scope = CRawDocument().int32("x", 1).bytes();
    std::vector<uint8_t> inner = cat(bsonString("f()"), scope);
    std::vector<uint8_t> good =
        cat(le32(static_cast<int32_t>(inner.size() + 4)), inner);

    ASSERT_FALSE(open(CRawDocument().element(0x0F, "c", good).bytes()));
    ASSERT_TRUE(cursor.advance());
    EXPECT_EQ(cursor.currentValueRange().length, good.size());

    std::vector<uint8_t> bad =
        cat(le32(static_cast<int32_t>(inner.size() + 5)), cat(inner, {0x00}));
    ASSERT_FALSE(open(CRawDocument().element(0x0F, "c", bad).bytes()));
    EXPECT_FALSE(cursor.advance());
    EXPECT_EQ(cursor.error(), CBsonErrc::CorruptElement);
}

TEST_F(ByteCursorRegressionTest, TestUnknownTagSentinel)
{
    std::vector<uint8_t> bytes = CRawDocument()
                                     .int32("a", 1)
                                     .element(0x42, "u", {0x01, 0x02, 0x03})
                                     .int32("b", 2)
                                     .bytes();
    ASSERT_FALSE(open(bytes));

    ASSERT_TRUE(cursor.advance());
    ASSERT_TRUE(cursor.advance());
    EXPECT_EQ(cursor.status(), CCursorStatus::Positioned);
    EXPECT_EQ(cursor.currentKeyBytes(), "u");
    EXPECT_EQ(cursor.currentTypeTag(), 0x42);

    CValueRange range = cursor.currentValueRange();
    EXPECT_EQ(range.offset + range.length, bytes.size() - 1);

    EXPECT_FALSE(cursor.advance());
    EXPECT_EQ(cursor.status(), CCursorStatus::Exhausted);
    EXPECT_EQ(cursor.error(), CBsonErrc::UnknownType);
}

TEST_F(ByteCursorRegressionTest, TestUnknownTagFailPolicy)
{
    ASSERT_FALSE(open(CRawDocument()
                          .int32("a", 1)
                          .element(0x42, "u", {0x01})
                          .bytes(),
                      CUnknownTypePolicy::Fail));

    ASSERT_TRUE(cursor.advance());
    EXPECT_FALSE(cursor.advance());
    EXPECT_EQ(cursor.status(), CCursorStatus::Exhausted);
    EXPECT_EQ(cursor.error(), CBsonErrc::UnknownType);
}

TEST_F(ByteCursorRegressionTest, TestReadBeforeFirst)
{
    ASSERT_FALSE(open(CRawDocument().int32("a", 1).bytes()));
    EXPECT_DEATH(cursor.currentKeyBytes(), "contract violation");
}

TEST_F(ByteCursorRegressionTest, TestReadAfterExhausted)
{
    ASSERT_FALSE(open(CRawDocument().int32("a", 1).bytes()));
    ASSERT_TRUE(cursor.advance());
    ASSERT_FALSE(cursor.advance());
    EXPECT_DEATH(cursor.currentValueRange(), "contract violation");
}

} /* namespace Regression */
} /* namespace BsonWalk */
