#include "TransferRegistry.h"
#include "LoggerMacros.h"

namespace HuffStream {

void TransferRegistry::prepare(const std::string& id, const std::string& filename,
                               uint64_t declaredSize, const std::string& destinationPath) {
    TransferRecord record;
    record.transferId = id;
    record.filename = filename;
    record.declaredSize = declaredSize;
    record.status = TransferStatus::Prepared;
    record.destinationPath = destinationPath;
    record.updatedAt = std::chrono::system_clock::now();

    bool replaced = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.find(id);
        replaced = it != records_.end();
        records_[id] = std::move(record);
    }

    if (replaced) {
        LOG_WARN_COMP("Transfer " + id + " prepared again, previous record replaced", "TransferRegistry");
    }
    LOG_DEBUG_COMP_IF("Prepared " + id + " (" + filename + ", " + std::to_string(declaredSize) + " bytes)",
                      "TransferRegistry");
}

std::optional<TransferStatus> TransferRegistry::status(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second.status;
}

bool TransferRegistry::cancel(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) {
        return false;
    }
    it->second.status = TransferStatus::Cancelled;
    it->second.updatedAt = std::chrono::system_clock::now();
    return true;
}

std::optional<TransferRecord> TransferRegistry::beginReceiving(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end() || it->second.status != TransferStatus::Prepared) {
        return std::nullopt;
    }
    it->second.status = TransferStatus::Receiving;
    it->second.updatedAt = std::chrono::system_clock::now();
    return it->second;
}

bool TransferRegistry::transition(const std::string& id, TransferStatus from, TransferStatus to) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end() || it->second.status != from) {
        return false;
    }
    it->second.status = to;
    it->second.updatedAt = std::chrono::system_clock::now();
    return true;
}

bool TransferRegistry::markDecoded(const std::string& id, const std::string& decodedPath) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end() || it->second.status != TransferStatus::Received) {
        return false;
    }
    it->second.status = TransferStatus::Decoded;
    it->second.decodedPath = decodedPath;
    it->second.updatedAt = std::chrono::system_clock::now();
    return true;
}

std::optional<TransferRecord> TransferRegistry::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t TransferRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

} // namespace HuffStream
