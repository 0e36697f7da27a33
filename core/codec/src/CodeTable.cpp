#include "CodeTable.h"
#include "HuffmanTree.h"
#include "Logger.h"
#include <algorithm>

namespace HuffStream {

namespace {

    void assignCodes(const HuffmanNode* node, const std::string& prefix, CodeTable& table) {
        if (!node) return;

        if (node->isLeaf()) {
            auto inserted = table.insert(node->symbol, prefix.empty() ? "0" : prefix);
            if (!inserted) {
                Logger::instance().error(inserted.error().message, "Codec");
            }
            return;
        }

        assignCodes(node->left.get(), prefix + "0", table);
        assignCodes(node->right.get(), prefix + "1", table);
    }

} // namespace

CodeTable CodeTable::fromTree(const HuffmanTree& tree) {
    CodeTable table;
    assignCodes(tree.root(), "", table);
    return table;
}

hfs::Result<void> CodeTable::insert(uint8_t symbol, const std::string& code) {
    if (code.empty()) {
        return hfs::Err(hfs::ErrorCode::CodeTableMismatch,
                        "Empty code for symbol " + std::to_string(symbol));
    }
    if (code.find_first_not_of("01") != std::string::npos) {
        return hfs::Err(hfs::ErrorCode::CodeTableMismatch,
                        "Code for symbol " + std::to_string(symbol) + " is not a bitstring");
    }
    if (contains(symbol)) {
        return hfs::Err(hfs::ErrorCode::CodeTableMismatch,
                        "Symbol " + std::to_string(symbol) + " already has a code");
    }
    if (inverse_.count(code) != 0) {
        return hfs::Err(hfs::ErrorCode::CodeTableMismatch,
                        "Code " + code + " is assigned twice");
    }

    codes_[symbol] = code;
    inverse_.emplace(code, symbol);
    return hfs::Ok();
}

std::optional<uint8_t> CodeTable::symbolFor(const std::string& code) const {
    auto it = inverse_.find(code);
    if (it == inverse_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::pair<uint8_t, std::string>> CodeTable::entries() const {
    std::vector<std::pair<uint8_t, std::string>> result;
    result.reserve(inverse_.size());
    for (std::size_t symbol = 0; symbol < codes_.size(); ++symbol) {
        if (!codes_[symbol].empty()) {
            result.emplace_back(static_cast<uint8_t>(symbol), codes_[symbol]);
        }
    }
    return result;
}

bool CodeTable::isPrefixFree() const {
    std::vector<std::string> codes;
    codes.reserve(inverse_.size());
    for (const auto& pair : inverse_) {
        codes.push_back(pair.first);
    }

    // After sorting, a prefix always sorts directly before some code it prefixes
    std::sort(codes.begin(), codes.end());
    for (std::size_t i = 1; i < codes.size(); ++i) {
        const auto& previous = codes[i - 1];
        if (codes[i].compare(0, previous.size(), previous) == 0) {
            return false;
        }
    }
    return true;
}

uint64_t CodeTable::encodedBitLength(const FrequencyModel& model) const {
    uint64_t bits = 0;
    for (const auto& [symbol, count] : model.entries()) {
        bits += count * codes_[symbol].size();
    }
    return bits;
}

std::size_t CodeTable::maxCodeLength() const {
    std::size_t longest = 0;
    for (const auto& code : codes_) {
        longest = std::max(longest, code.size());
    }
    return longest;
}

} // namespace HuffStream
