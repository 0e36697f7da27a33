#include "PayloadStore.h"
#include "Codec.h"
#include "PathUtils.h"

namespace HuffStream {

PayloadStore::PayloadStore(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

std::filesystem::path PayloadStore::encodedPath(const std::string& filename) const {
    auto name = PathUtils::safeBasename(filename);
    if (name.empty()) {
        return {};
    }
    return directory_ / name;
}

std::filesystem::path PayloadStore::decodedPath(const std::string& filename) const {
    if (PathUtils::safeBasename(filename).empty()) {
        return {};
    }
    return directory_ / PathUtils::decodedName(filename);
}

hfs::Result<void> PayloadStore::saveEncoded(const std::string& filename,
                                            const std::vector<uint8_t>& payload) const {
    auto path = encodedPath(filename);
    if (path.empty()) {
        return hfs::Err(hfs::ErrorCode::InvalidArgument, "Unusable filename: " + filename);
    }

    auto dir = PathUtils::ensureDirectory(directory_);
    if (!dir) {
        return dir;
    }
    return PathUtils::writeFile(path, payload);
}

hfs::Result<std::filesystem::path> PayloadStore::decodeAndSave(const std::string& filename,
                                                               const std::vector<uint8_t>& payload) const {
    auto path = decodedPath(filename);
    if (path.empty()) {
        return hfs::Err<std::filesystem::path>(hfs::ErrorCode::InvalidArgument, "Unusable filename: " + filename);
    }

    auto decoded = Codec::decode(payload);
    if (!decoded) {
        return decoded.error();
    }

    auto dir = PathUtils::ensureDirectory(directory_);
    if (!dir) {
        return dir.error();
    }

    auto written = PathUtils::writeFile(path, decoded.value());
    if (!written) {
        return written.error();
    }
    return path;
}

} // namespace HuffStream
