#include "HuffmanTree.h"
#include "CodeTable.h"
#include <queue>
#include <vector>

namespace HuffStream {

namespace {

    struct QueueEntry {
        uint64_t frequency;
        uint32_t order;
        std::size_t slot;
    };

    struct Compare {
        bool operator()(const QueueEntry& l, const QueueEntry& r) const {
            if (l.frequency != r.frequency) {
                return l.frequency > r.frequency;
            }
            return l.order > r.order;
        }
    };

    std::size_t countLeaves(const HuffmanNode* node) {
        if (!node) return 0;
        if (node->isLeaf()) return 1;
        return countLeaves(node->left.get()) + countLeaves(node->right.get());
    }

    std::size_t maxDepth(const HuffmanNode* node) {
        if (!node || node->isLeaf()) return 0;
        std::size_t left = maxDepth(node->left.get());
        std::size_t right = maxDepth(node->right.get());
        return 1 + (left > right ? left : right);
    }

} // namespace

HuffmanTree HuffmanTree::build(const FrequencyModel& model) {
    if (model.empty()) {
        return HuffmanTree();
    }

    // Nodes live in slots until they are merged under a parent
    std::vector<std::unique_ptr<HuffmanNode>> slots;
    std::priority_queue<QueueEntry, std::vector<QueueEntry>, Compare> queue;

    for (const auto& [symbol, count] : model.entries()) {
        auto leaf = std::make_unique<HuffmanNode>();
        leaf->frequency = count;
        leaf->symbol = symbol;
        queue.push({count, static_cast<uint32_t>(symbol), slots.size()});
        slots.push_back(std::move(leaf));
    }

    uint32_t nextOrder = static_cast<uint32_t>(FrequencyModel::SYMBOL_COUNT);
    while (queue.size() > 1) {
        QueueEntry first = queue.top(); queue.pop();
        QueueEntry second = queue.top(); queue.pop();

        auto parent = std::make_unique<HuffmanNode>();
        parent->frequency = first.frequency + second.frequency;
        parent->left = std::move(slots[first.slot]);
        parent->right = std::move(slots[second.slot]);

        queue.push({parent->frequency, nextOrder++, slots.size()});
        slots.push_back(std::move(parent));
    }

    return HuffmanTree(std::move(slots[queue.top().slot]));
}

hfs::Result<HuffmanTree> HuffmanTree::fromCodeTable(const CodeTable& table) {
    if (table.empty()) {
        return HuffmanTree();
    }

    auto root = std::make_unique<HuffmanNode>();

    for (const auto& [symbol, code] : table.entries()) {
        HuffmanNode* node = root.get();
        for (std::size_t i = 0; i < code.size(); ++i) {
            if (node->frequency != 0) {
                return hfs::Err<HuffmanTree>(hfs::ErrorCode::CodeTableMismatch,
                    "Code for symbol " + std::to_string(symbol) + " extends another code");
            }
            auto& child = (code[i] == '1') ? node->right : node->left;
            if (!child) {
                child = std::make_unique<HuffmanNode>();
            }
            node = child.get();
        }

        if (!node->isLeaf()) {
            return hfs::Err<HuffmanTree>(hfs::ErrorCode::CodeTableMismatch,
                "Code for symbol " + std::to_string(symbol) + " is a prefix of another code");
        }
        if (node->frequency != 0) {
            return hfs::Err<HuffmanTree>(hfs::ErrorCode::CodeTableMismatch,
                "Duplicate code for symbol " + std::to_string(symbol));
        }
        node->symbol = symbol;
        node->frequency = 1; // marks the node as an assigned leaf
    }

    return HuffmanTree(std::move(root));
}

std::size_t HuffmanTree::leafCount() const {
    return countLeaves(root_.get());
}

std::size_t HuffmanTree::depth() const {
    return maxDepth(root_.get());
}

} // namespace HuffStream
