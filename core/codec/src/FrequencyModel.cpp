#include "FrequencyModel.h"

namespace HuffStream {

FrequencyModel::FrequencyModel(const std::vector<uint8_t>& data) {
    add(data.data(), data.size());
}

void FrequencyModel::add(const uint8_t* data, std::size_t size) {
    for (std::size_t i = 0; i < size; ++i) {
        ++counts_[data[i]];
    }
    total_ += size;
}

std::size_t FrequencyModel::distinctSymbols() const {
    std::size_t distinct = 0;
    for (auto count : counts_) {
        if (count > 0) {
            ++distinct;
        }
    }
    return distinct;
}

std::vector<std::pair<uint8_t, uint64_t>> FrequencyModel::entries() const {
    std::vector<std::pair<uint8_t, uint64_t>> result;
    for (std::size_t symbol = 0; symbol < SYMBOL_COUNT; ++symbol) {
        if (counts_[symbol] > 0) {
            result.emplace_back(static_cast<uint8_t>(symbol), counts_[symbol]);
        }
    }
    return result;
}

} // namespace HuffStream
