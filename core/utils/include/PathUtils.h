#pragma once

#include "Result.h"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace HuffStream {

class PathUtils {
public:
    static std::filesystem::path getHome();
    static std::filesystem::path getConfigDir();

    /// Creates the directory (and parents) if missing
    static hfs::Result<void> ensureDirectory(const std::filesystem::path& dir);

    static hfs::Result<std::vector<uint8_t>> readFile(const std::filesystem::path& path);
    static hfs::Result<void> writeFile(const std::filesystem::path& path, const std::vector<uint8_t>& data);

    /**
     * @brief Final path component of a peer-supplied filename
     * @return empty string if nothing usable remains ("", ".", "..")
     */
    static std::string safeBasename(const std::string& filename);

    /// report.txt -> report_encoded.txt
    static std::string encodedName(const std::string& filename);

    /// report_encoded.txt -> report_decoded.txt, report.txt -> report_decoded.txt
    static std::string decodedName(const std::string& filename);
};

} // namespace HuffStream
