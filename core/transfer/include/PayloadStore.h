#pragma once

#include "Result.h"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace HuffStream {

/**
 * @brief Where the server keeps received payloads and their decoded output.
 *
 * Peer-supplied names are reduced to their final path component, so every
 * file lands directly inside the save directory.
 */
class PayloadStore {
public:
    explicit PayloadStore(std::filesystem::path directory);

    const std::filesystem::path& directory() const { return directory_; }

    /// directory/<basename>, empty path if the name is unusable
    std::filesystem::path encodedPath(const std::string& filename) const;

    /// directory/<basename with _encoded replaced by _decoded>
    std::filesystem::path decodedPath(const std::string& filename) const;

    hfs::Result<void> saveEncoded(const std::string& filename, const std::vector<uint8_t>& payload) const;

    /**
     * @brief Decode a payload and write the result next to the encoded file
     * @return Path of the decoded file
     */
    hfs::Result<std::filesystem::path> decodeAndSave(const std::string& filename,
                                                     const std::vector<uint8_t>& payload) const;

private:
    std::filesystem::path directory_;
};

} // namespace HuffStream
