#pragma once

#include "FrequencyModel.h"
#include "Result.h"
#include <cstddef>
#include <cstdint>
#include <memory>

namespace HuffStream {

class CodeTable;

/**
 * @brief Node of a Huffman prefix tree.
 *
 * Leaves carry a symbol; internal nodes own both children.
 */
struct HuffmanNode {
    uint64_t frequency{0};
    uint8_t symbol{0};
    std::unique_ptr<HuffmanNode> left;
    std::unique_ptr<HuffmanNode> right;

    bool isLeaf() const { return !left && !right; }
};

/**
 * @brief Binary prefix tree built from a FrequencyModel.
 *
 * Construction repeatedly merges the two lowest-frequency nodes taken from a
 * min-priority queue; the first node popped becomes the left child. Equal
 * frequencies are ordered by a secondary key so the tree shape is
 * reproducible: a leaf ranks by its symbol value, an internal node ranks
 * after every leaf in creation order.
 */
class HuffmanTree {
public:
    HuffmanTree() = default;

    HuffmanTree(HuffmanTree&&) noexcept = default;
    HuffmanTree& operator=(HuffmanTree&&) noexcept = default;
    HuffmanTree(const HuffmanTree&) = delete;
    HuffmanTree& operator=(const HuffmanTree&) = delete;

    /// Empty model yields an empty tree; one distinct symbol yields a single leaf
    static HuffmanTree build(const FrequencyModel& model);

    /**
     * @brief Rebuild a decoding tree from shipped codes.
     *
     * Fails with CodeTableMismatch if the codes are not prefix-free.
     */
    static hfs::Result<HuffmanTree> fromCodeTable(const CodeTable& table);

    const HuffmanNode* root() const { return root_.get(); }
    bool empty() const { return !root_; }

    std::size_t leafCount() const;

    /// Longest root-to-leaf path, 0 for a single leaf
    std::size_t depth() const;

private:
    explicit HuffmanTree(std::unique_ptr<HuffmanNode> root) : root_(std::move(root)) {}

    std::unique_ptr<HuffmanNode> root_;
};

} // namespace HuffStream
