#include <gtest/gtest.h>

#include "CodeTable.h"
#include "FrequencyModel.h"
#include "HuffmanTree.h"
#include "TestHelpers.h"

using namespace HuffStream;
using HuffStream::test::bytesOf;

TEST(FrequencyModelTest, CountsEveryByte) {
    FrequencyModel model(bytesOf("abracadabra"));

    EXPECT_EQ(model.total(), 11u);
    EXPECT_EQ(model.count('a'), 5u);
    EXPECT_EQ(model.count('b'), 2u);
    EXPECT_EQ(model.count('r'), 2u);
    EXPECT_EQ(model.count('c'), 1u);
    EXPECT_EQ(model.count('d'), 1u);
    EXPECT_EQ(model.count('z'), 0u);
    EXPECT_EQ(model.distinctSymbols(), 5u);
}

TEST(FrequencyModelTest, EntriesAreAscendingAndNonZero) {
    FrequencyModel model(bytesOf("zza"));
    auto entries = model.entries();

    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].first, 'a');
    EXPECT_EQ(entries[0].second, 1u);
    EXPECT_EQ(entries[1].first, 'z');
    EXPECT_EQ(entries[1].second, 2u);
}

TEST(FrequencyModelTest, AddAccumulates) {
    FrequencyModel model;
    EXPECT_TRUE(model.empty());

    const uint8_t first[] = {0x00, 0xFF};
    const uint8_t second[] = {0xFF};
    model.add(first, sizeof(first));
    model.add(second, sizeof(second));

    EXPECT_FALSE(model.empty());
    EXPECT_EQ(model.count(0x00), 1u);
    EXPECT_EQ(model.count(0xFF), 2u);
    EXPECT_EQ(model.total(), 3u);
}

TEST(HuffmanTreeTest, EmptyModelGivesEmptyTree) {
    auto tree = HuffmanTree::build(FrequencyModel());
    EXPECT_TRUE(tree.empty());
    EXPECT_EQ(tree.leafCount(), 0u);
    EXPECT_TRUE(CodeTable::fromTree(tree).empty());
}

TEST(HuffmanTreeTest, SingleSymbolIsOneLeafWithCodeZero) {
    auto tree = HuffmanTree::build(FrequencyModel(bytesOf("AAAAA")));

    ASSERT_FALSE(tree.empty());
    EXPECT_TRUE(tree.root()->isLeaf());
    EXPECT_EQ(tree.root()->symbol, 'A');
    EXPECT_EQ(tree.root()->frequency, 5u);
    EXPECT_EQ(tree.depth(), 0u);

    auto table = CodeTable::fromTree(tree);
    EXPECT_EQ(table.size(), 1u);
    EXPECT_EQ(table.code('A'), "0");
}

TEST(HuffmanTreeTest, LowerFrequencyPopsFirstAndGoesLeft) {
    auto table = CodeTable::fromTree(HuffmanTree::build(FrequencyModel(bytesOf("aab"))));

    EXPECT_EQ(table.code('b'), "0");
    EXPECT_EQ(table.code('a'), "1");
}

TEST(HuffmanTreeTest, EqualFrequenciesBreakTiesBySymbolThenCreationOrder) {
    // a and b merge first (lowest symbols), then c (leaf) beats the new internal node
    auto table = CodeTable::fromTree(HuffmanTree::build(FrequencyModel(bytesOf("abc"))));

    EXPECT_EQ(table.code('c'), "0");
    EXPECT_EQ(table.code('a'), "10");
    EXPECT_EQ(table.code('b'), "11");
}

TEST(HuffmanTreeTest, BuildIsDeterministic) {
    auto data = bytesOf("the quick brown fox jumps over the lazy dog");
    auto first = CodeTable::fromTree(HuffmanTree::build(FrequencyModel(data)));
    auto second = CodeTable::fromTree(HuffmanTree::build(FrequencyModel(data)));

    EXPECT_EQ(first.entries(), second.entries());
}

TEST(HuffmanTreeTest, RootFrequencyIsTotal) {
    FrequencyModel model(bytesOf("mississippi"));
    auto tree = HuffmanTree::build(model);

    EXPECT_EQ(tree.root()->frequency, model.total());
    EXPECT_EQ(tree.leafCount(), model.distinctSymbols());
}

TEST(CodeTableTest, CodesArePrefixFreeForAllByteValues) {
    std::vector<uint8_t> data;
    for (int round = 0; round < 3; ++round) {
        for (int value = 0; value < 256; ++value) {
            for (int repeat = 0; repeat <= value % 7; ++repeat) {
                data.push_back(static_cast<uint8_t>(value));
            }
        }
    }

    auto table = CodeTable::fromTree(HuffmanTree::build(FrequencyModel(data)));
    EXPECT_EQ(table.size(), 256u);
    EXPECT_TRUE(table.isPrefixFree());
}

TEST(CodeTableTest, MoreFrequentSymbolsNeverGetLongerCodes) {
    FrequencyModel model(bytesOf("aaaaaaaaaaaaaaaabbbbbbbbccccdde"));
    auto table = CodeTable::fromTree(HuffmanTree::build(model));

    EXPECT_LE(table.code('a').size(), table.code('b').size());
    EXPECT_LE(table.code('b').size(), table.code('c').size());
    EXPECT_LE(table.code('c').size(), table.code('e').size());
    EXPECT_EQ(table.maxCodeLength(), table.code('e').size());
}

TEST(CodeTableTest, EncodedBitLengthSumsCodeLengths) {
    FrequencyModel model(bytesOf("aab"));
    auto table = CodeTable::fromTree(HuffmanTree::build(model));

    EXPECT_EQ(table.encodedBitLength(model), 3u);
}

TEST(CodeTableTest, InsertRejectsBadCodes) {
    CodeTable table;
    ASSERT_TRUE(table.insert('a', "01"));

    auto empty = table.insert('b', "");
    ASSERT_FALSE(empty);
    EXPECT_EQ(empty.error().code, hfs::ErrorCode::CodeTableMismatch);

    EXPECT_FALSE(table.insert('b', "012"));
    EXPECT_FALSE(table.insert('a', "11"));
    EXPECT_FALSE(table.insert('c', "01"));

    EXPECT_EQ(table.size(), 1u);
    EXPECT_EQ(table.symbolFor("01").value(), 'a');
    EXPECT_FALSE(table.symbolFor("11").has_value());
}

TEST(CodeTableTest, DetectsPrefixCollision) {
    CodeTable table;
    ASSERT_TRUE(table.insert('a', "0"));
    ASSERT_TRUE(table.insert('b', "01"));

    EXPECT_FALSE(table.isPrefixFree());

    auto tree = HuffmanTree::fromCodeTable(table);
    ASSERT_FALSE(tree);
    EXPECT_EQ(tree.error().code, hfs::ErrorCode::CodeTableMismatch);
}

TEST(CodeTableTest, TreeRebuiltFromTableYieldsSameCodes) {
    auto original = CodeTable::fromTree(HuffmanTree::build(FrequencyModel(bytesOf("abracadabra"))));

    auto rebuilt = HuffmanTree::fromCodeTable(original);
    ASSERT_TRUE(rebuilt);
    EXPECT_EQ(rebuilt->leafCount(), original.size());
    EXPECT_EQ(CodeTable::fromTree(rebuilt.value()).entries(), original.entries());
}
