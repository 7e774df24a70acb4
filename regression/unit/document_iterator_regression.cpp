/*-------------------------------------------------------------------------
 *
 * document_iterator_regression.cpp
 *      Traversal, seeking and draining of the document iterator.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "CRawDocument.hpp"
#include "document/CBsonError.hpp"
#include "document/CDocumentIterator.hpp"

#include <gtest/gtest.h>

namespace BsonWalk
{
namespace Regression
{

class DocumentIteratorRegressionTest : public ::testing::Test
{
  protected:
    /* {"a": 1, "b": 2, "a": 3} */
    CDocument duplicates =
        CRawDocument().int32("a", 1).int32("b", 2).int32("a", 3).build();

    /* {"x": 1, "y": "hi"} */
    CDocument mixed = CRawDocument().int32("x", 1).string("y", "hi").build();
};

TEST_F(DocumentIteratorRegressionTest, TestDrainInOrder)
{
    CDocumentIterator iter(mixed);
    EXPECT_EQ(iter.status(), CCursorStatus::BeforeFirst);

    std::vector<CKeyValuePair> pairs;
    while (auto pair = iter.next())
        pairs.push_back(*pair);

    ASSERT_EQ(pairs.size(), 2u);
    EXPECT_EQ(pairs[0].first, "x");
    EXPECT_EQ(pairs[0].second, CBsonValue(int32_t{1}));
    EXPECT_EQ(pairs[1].first, "y");
    EXPECT_EQ(pairs[1].second, CBsonValue("hi"));
    EXPECT_EQ(iter.status(), CCursorStatus::Exhausted);
}

TEST_F(DocumentIteratorRegressionTest, TestNextAfterExhaustion)
{
    CDocumentIterator iter(mixed);
    iter.keys();

    EXPECT_FALSE(iter.next().has_value());
    EXPECT_FALSE(iter.next().has_value());
    EXPECT_FALSE(iter.advance());
    EXPECT_EQ(iter.status(), CCursorStatus::Exhausted);
}

TEST_F(DocumentIteratorRegressionTest, TestDuplicateKeysPreserved)
{
    CDocumentIterator iter(duplicates);
    EXPECT_EQ(iter.keys(), (std::vector<std::string>{"a", "b", "a"}));

    CDocumentIterator values(duplicates);
    EXPECT_EQ(values.values(),
              (std::vector<CBsonValue>{int32_t{1}, int32_t{2}, int32_t{3}}));
}

TEST_F(DocumentIteratorRegressionTest, TestKeysDrainRemainder)
{
    CDocumentIterator iter(duplicates);
    ASSERT_TRUE(iter.advance());

    EXPECT_EQ(iter.keys(), (std::vector<std::string>{"b", "a"}));
    EXPECT_TRUE(iter.keys().empty());
}

TEST_F(DocumentIteratorRegressionTest, TestMoveIsForwardOnly)
{
    CDocumentIterator iter(duplicates);

    ASSERT_TRUE(iter.move("a"));
    EXPECT_EQ(iter.currentValue(), CBsonValue(int32_t{1}));

    ASSERT_TRUE(iter.advance());
    EXPECT_EQ(iter.currentKey(), "b");

    /* the scan resumes after "b" and reaches the later duplicate */
    ASSERT_TRUE(iter.move("a"));
    EXPECT_EQ(iter.currentValue(), CBsonValue(int32_t{3}));

    EXPECT_FALSE(iter.move("a"));
    EXPECT_EQ(iter.status(), CCursorStatus::Exhausted);
    EXPECT_EQ(iter.lastError(), CBsonErrc::KeyNotFound);
}

TEST_F(DocumentIteratorRegressionTest, TestMoveNeverFindsPassedKey)
{
    CDocumentIterator iter(mixed);

    ASSERT_TRUE(iter.move("y"));
    EXPECT_EQ(iter.currentValue(), CBsonValue("hi"));
    EXPECT_FALSE(iter.move("x"));
}

TEST_F(DocumentIteratorRegressionTest, TestSeekConstructor)
{
    CDocumentIterator found(mixed, "y");
    EXPECT_EQ(found.status(), CCursorStatus::Positioned);
    EXPECT_EQ(found.currentKey(), "y");
    EXPECT_EQ(found.currentType(), CBsonWireType::String);

    CDocumentIterator missing(mixed, "z");
    EXPECT_FALSE(missing.isValid());
    EXPECT_EQ(missing.status(), CCursorStatus::Invalid);
    EXPECT_EQ(missing.lastError(), CBsonErrc::KeyNotFound);
    EXPECT_FALSE(missing.advance());
    EXPECT_FALSE(missing.next().has_value());
}

TEST_F(DocumentIteratorRegressionTest, TestMalformedHeader)
{
    std::vector<uint8_t> bytes = CRawDocument().int32("a", 1).bytes();
    bytes[0] = 0x7F;

    CDocumentIterator iter{CDocument(bytes)};
    EXPECT_FALSE(iter.isValid());
    EXPECT_EQ(iter.lastError(), CBsonErrc::MalformedHeader);
    EXPECT_TRUE(iter.keys().empty());

    CDocumentIterator seek(CDocument(bytes), "a");
    EXPECT_EQ(seek.lastError(), CBsonErrc::MalformedHeader);
}

TEST_F(DocumentIteratorRegressionTest, TestCorruptElementStopsTraversal)
{
    CDocument doc = CRawDocument()
                        .int32("ok", 1)
                        .element(0x02, "s", cat(le32(50), {'x', 0x00}))
                        .int32("never", 2)
                        .build();

    CDocumentIterator iter(doc);
    EXPECT_EQ(iter.keys(), (std::vector<std::string>{"ok"}));
    EXPECT_EQ(iter.status(), CCursorStatus::Exhausted);
    EXPECT_EQ(iter.lastError(), CBsonErrc::CorruptElement);

    CDocumentIterator seek(doc, "never");
    EXPECT_FALSE(seek.isValid());
    EXPECT_EQ(seek.lastError(), CBsonErrc::CorruptElement);
}

TEST_F(DocumentIteratorRegressionTest, TestUnknownTypeSentinel)
{
    CDocument doc = CRawDocument()
                        .int32("a", 1)
                        .element(0x42, "u", {0x01, 0x02})
                        .int32("b", 2)
                        .build();

    CDocumentIterator iter(doc);
    auto first = iter.next();
    auto unknown = iter.next();
    ASSERT_TRUE(unknown.has_value());
    EXPECT_EQ(unknown->first, "u");
    EXPECT_TRUE(unknown->second.isInvalid());
    EXPECT_EQ(iter.currentType(), CBsonWireType::Invalid);

    EXPECT_FALSE(iter.next().has_value());
    EXPECT_EQ(iter.lastError(), CBsonErrc::UnknownType);
    ASSERT_TRUE(first.has_value());
}

TEST_F(DocumentIteratorRegressionTest, TestUnknownTypeFailPolicy)
{
    CDocument doc = CRawDocument()
                        .int32("a", 1)
                        .element(0x42, "u", {0x01})
                        .build();

    CDocumentIterator iter(doc, CUnknownTypePolicy::Fail);
    EXPECT_EQ(iter.unknownTypePolicy(), CUnknownTypePolicy::Fail);
    EXPECT_EQ(iter.keys(), (std::vector<std::string>{"a"}));
    EXPECT_EQ(iter.lastError(), CBsonErrc::UnknownType);
}

TEST_F(DocumentIteratorRegressionTest, TestDocumentCount)
{
    EXPECT_EQ(duplicates.count(), 3u);
    EXPECT_FALSE(duplicates.isEmpty());
    EXPECT_EQ(CDocument().count(), 0u);
    EXPECT_TRUE(CDocument().isEmpty());
}

TEST_F(DocumentIteratorRegressionTest, TestNestedIteration)
{
    CRawDocument inner;
    inner.string("name", "n").int64("size", 9);
    CDocument doc = CRawDocument().document("meta", inner).int32("z", 0).build();

    CDocumentIterator outer(doc, "meta");
    ASSERT_TRUE(outer.isValid());

    CDocumentIterator nested(outer.currentValue().as<CDocument>(), "size");
    ASSERT_TRUE(nested.isValid());
    EXPECT_EQ(nested.currentValue(), CBsonValue(int64_t{9}));
}

TEST_F(DocumentIteratorRegressionTest, TestCurrentValueBeforeFirst)
{
    CDocumentIterator iter(mixed);
    EXPECT_DEATH(iter.currentValue(), "contract violation");
}

TEST_F(DocumentIteratorRegressionTest, TestCurrentKeyOnInvalid)
{
    CDocumentIterator iter(mixed, "missing");
    EXPECT_DEATH(iter.currentKey(), "contract violation");
}

} /* namespace Regression */
} /* namespace BsonWalk */
