#pragma once

#include "TransferStatus.h"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace HuffStream {

struct TransferRecord {
    std::string transferId;
    std::string filename;
    uint64_t declaredSize{0};
    TransferStatus status{TransferStatus::Prepared};
    std::string destinationPath;
    std::optional<std::string> decodedPath;
    std::chrono::system_clock::time_point updatedAt;
};

/**
 * @brief Server-side bookkeeping of transfers by id.
 *
 * Every read and write takes the same mutex. Records are never removed;
 * callers receive copies, never references into the map.
 */
class TransferRegistry {
public:
    TransferRegistry() = default;

    TransferRegistry(const TransferRegistry&) = delete;
    TransferRegistry& operator=(const TransferRegistry&) = delete;

    /// Create or overwrite the record for id in the prepared state
    void prepare(const std::string& id, const std::string& filename,
                 uint64_t declaredSize, const std::string& destinationPath);

    /// std::nullopt for an unknown id
    std::optional<TransferStatus> status(const std::string& id) const;

    /**
     * @brief Force the record to cancelled whatever its state
     * @return false if the id is unknown (no record is created)
     */
    bool cancel(const std::string& id);

    /**
     * @brief Claim a prepared transfer for the data channel
     * @return Snapshot after the move to receiving, or std::nullopt if the
     *         id is unknown or not in the prepared state
     */
    std::optional<TransferRecord> beginReceiving(const std::string& id);

    /**
     * @brief Move id from `from` to `to`
     * @return false if the record is missing or no longer in `from`
     */
    bool transition(const std::string& id, TransferStatus from, TransferStatus to);

    /// received -> decoded, recording where the output was written
    bool markDecoded(const std::string& id, const std::string& decodedPath);

    std::optional<TransferRecord> find(const std::string& id) const;

    std::size_t size() const;

private:
    std::unordered_map<std::string, TransferRecord> records_;
    mutable std::mutex mutex_;
};

} // namespace HuffStream
