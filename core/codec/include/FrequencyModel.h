#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace HuffStream {

/**
 * @brief Byte occurrence counts for one input buffer.
 *
 * The sum of all counts always equals the number of bytes added.
 */
class FrequencyModel {
public:
    static constexpr std::size_t SYMBOL_COUNT = 256;

    FrequencyModel() = default;
    explicit FrequencyModel(const std::vector<uint8_t>& data);

    void add(const uint8_t* data, std::size_t size);

    uint64_t count(uint8_t symbol) const { return counts_[symbol]; }
    uint64_t total() const { return total_; }
    bool empty() const { return total_ == 0; }

    /// Number of symbols with a non-zero count
    std::size_t distinctSymbols() const;

    /// Non-zero (symbol, count) pairs in ascending symbol order
    std::vector<std::pair<uint8_t, uint64_t>> entries() const;

private:
    std::array<uint64_t, SYMBOL_COUNT> counts_{};
    uint64_t total_{0};
};

} // namespace HuffStream
