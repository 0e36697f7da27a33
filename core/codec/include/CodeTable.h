#pragma once

#include "FrequencyModel.h"
#include "Result.h"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace HuffStream {

class HuffmanTree;

/**
 * @brief Bijective symbol <-> bitstring mapping.
 *
 * Codes are strings of '0' and '1'. A table derived from a tree is
 * prefix-free by construction; a table parsed from a payload is checked
 * when the decoding tree is rebuilt.
 */
class CodeTable {
public:
    CodeTable() = default;

    /**
     * @brief Derive codes depth-first, appending '0' for left and '1' for right.
     *
     * A single-leaf tree assigns the code "0".
     */
    static CodeTable fromTree(const HuffmanTree& tree);

    /**
     * @brief Add a code; rejects empty or non-binary codes and duplicate
     * symbols or codes.
     */
    hfs::Result<void> insert(uint8_t symbol, const std::string& code);

    bool contains(uint8_t symbol) const { return !codes_[symbol].empty(); }

    /// Code for a symbol, empty string if none is assigned
    const std::string& code(uint8_t symbol) const { return codes_[symbol]; }

    std::optional<uint8_t> symbolFor(const std::string& code) const;

    std::size_t size() const { return inverse_.size(); }
    bool empty() const { return inverse_.empty(); }

    /// (symbol, code) pairs in ascending symbol order
    std::vector<std::pair<uint8_t, std::string>> entries() const;

    /// True if no code is a prefix of another
    bool isPrefixFree() const;

    /// Sum of code lengths over every symbol counted by the model
    uint64_t encodedBitLength(const FrequencyModel& model) const;

    std::size_t maxCodeLength() const;

private:
    std::array<std::string, FrequencyModel::SYMBOL_COUNT> codes_;
    std::unordered_map<std::string, uint8_t> inverse_;
};

} // namespace HuffStream
