/*-------------------------------------------------------------------------
 *
 * subsequence_regression.cpp
 *      Extraction of element ranges into independent documents.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "CRawDocument.hpp"
#include "document/CDocumentIterator.hpp"
#include "document/CSubsequenceExtractor.hpp"

#include <gtest/gtest.h>

namespace BsonWalk
{
namespace Regression
{

class SubsequenceRegressionTest : public ::testing::Test
{
  protected:
    CDocument source = CRawDocument()
                           .int32("a", 1)
                           .string("b", "two")
                           .int32("a", 3)
                           .boolean("c", true)
                           .real("d", 4.5)
                           .build();

    static std::vector<CKeyValuePair> pairs(const CDocument& doc)
    {
        std::vector<CKeyValuePair> out;
        CDocumentIterator iter(doc);
        while (auto pair = iter.next())
            out.push_back(*pair);
        return out;
    }
};

TEST_F(SubsequenceRegressionTest, TestWholeDocument)
{
    CDocument copy =
        CSubsequenceExtractor::subsequence(source, 0, source.count());

    EXPECT_EQ(pairs(copy), pairs(source));
    EXPECT_EQ(copy, source);
    EXPECT_NE(copy.storage(), source.storage());
}

TEST_F(SubsequenceRegressionTest, TestWholeDocumentOfEveryType)
{
    std::vector<uint8_t> oid = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12};
    std::string nulText("f(\0)", 4);
    std::vector<uint8_t> emptyScope = CDocument().bytes();
    std::vector<uint8_t> scopedBody = cat(bsonString(nulText), emptyScope);
    CRawDocument inner;
    inner.string("k", "v");
    CRawDocument list;
    list.int32("0", 1).string("1", "two");

    CDocument all =
        CRawDocument()
            .real("double", -0.5)
            .string("string", std::string("a\0b", 3))
            .document("document", inner)
            .array("array", list)
            .element(0x05, "binary", cat(le32(3), {0x00, 'a', 'b', 'c'}))
            .element(0x05, "old",
                     cat(le32(7), cat({0x02}, cat(le32(3), {'x', 'y', 'z'}))))
            .element(0x06, "undefined", {})
            .element(0x07, "oid", oid)
            .boolean("bool", true)
            .element(0x09, "date", le64(-86400000))
            .element(0x0A, "null", {})
            .element(0x0B, "regex", {'^', 'a', 0x00, 'i', 0x00})
            .element(0x0C, "dbptr", cat(bsonString("db.c"), oid))
            .element(0x0D, "code", bsonString(nulText))
            .element(0x0E, "symbol", bsonString("sym"))
            .element(0x0F, "cws",
                     cat(le32(static_cast<int32_t>(scopedBody.size() + 4)),
                         scopedBody))
            .int32("int32", 7)
            .element(0x11, "ts", cat(le32(3), le32(100)))
            .int64("int64", int64_t{1} << 40)
            .element(0x13, "dec", cat(le64(1), le64(0x3040000000000000)))
            .element(0xFF, "min", {})
            .element(0x7F, "max", {})
            .build();

    ASSERT_EQ(all.count(), 22u);

    CDocument copy = CSubsequenceExtractor::subsequence(all, 0, all.count());
    EXPECT_EQ(pairs(copy), pairs(all));
    EXPECT_EQ(copy, all);
}

TEST_F(SubsequenceRegressionTest, TestDefaultRangeCopiesAll)
{
    EXPECT_EQ(pairs(CSubsequenceExtractor::subsequence(source)), pairs(source));
}

TEST_F(SubsequenceRegressionTest, TestMiddleRangeKeepsDuplicates)
{
    CDocument slice = CSubsequenceExtractor::subsequence(source, 1, 3);

    std::vector<CKeyValuePair> expected = {{"b", CBsonValue("two")},
                                           {"a", CBsonValue(int32_t{3})}};
    EXPECT_EQ(pairs(slice), expected);
}

TEST_F(SubsequenceRegressionTest, TestEmptyRanges)
{
    EXPECT_TRUE(CSubsequenceExtractor::subsequence(source, 2, 2).isEmpty());
    EXPECT_TRUE(CSubsequenceExtractor::subsequence(source, 5, 9).isEmpty());
    EXPECT_TRUE(CSubsequenceExtractor::subsequence(source, 50, 60).isEmpty());
    EXPECT_EQ(CSubsequenceExtractor::subsequence(source, 4, 100).count(), 1u);
}

TEST_F(SubsequenceRegressionTest, TestInvalidSourceIsEmpty)
{
    std::vector<uint8_t> bytes = source.bytes();
    bytes[0] = 0x01;

    CDocument slice = CSubsequenceExtractor::subsequence(CDocument(bytes));
    EXPECT_EQ(slice, CDocument());
}

TEST_F(SubsequenceRegressionTest, TestNestedValuesAreCopied)
{
    CRawDocument inner;
    inner.int32("x", 1);
    CDocument doc = CRawDocument().int32("skip", 0).document("sub", inner).build();

    CDocument slice = CSubsequenceExtractor::subsequence(doc, 1);
    CDocumentIterator iter(slice, "sub");
    ASSERT_TRUE(iter.isValid());

    CDocument sub = iter.currentValue().as<CDocument>();
    EXPECT_EQ(sub, inner.build());
    EXPECT_NE(sub.storage(), doc.storage());
}

TEST_F(SubsequenceRegressionTest, TestStopsAtUnknownType)
{
    CDocument doc = CRawDocument()
                        .int32("a", 1)
                        .element(0x42, "u", {0x00})
                        .int32("b", 2)
                        .build();

    CDocument slice = CSubsequenceExtractor::subsequence(doc);
    CDocumentIterator iter(slice);
    EXPECT_EQ(iter.keys(), (std::vector<std::string>{"a"}));
}

TEST_F(SubsequenceRegressionTest, TestStopsAtCorruptElement)
{
    CDocument doc = CRawDocument()
                        .int32("a", 1)
                        .element(0x02, "s", cat(le32(90), {0x00}))
                        .build();

    EXPECT_EQ(CSubsequenceExtractor::subsequence(doc).count(), 1u);
}

TEST_F(SubsequenceRegressionTest, TestInvertedRangeIsFatal)
{
    EXPECT_DEATH(CSubsequenceExtractor::subsequence(source, 3, 1),
                 "subsequence end 1 precedes start 3");
}

} /* namespace Regression */
} /* namespace BsonWalk */
