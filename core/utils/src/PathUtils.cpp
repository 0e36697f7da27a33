#include "PathUtils.h"
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace HuffStream {

std::filesystem::path PathUtils::getHome() {
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home);
    }
    throw std::runtime_error("HOME environment variable is not set");
}

std::filesystem::path PathUtils::getConfigDir() {
    if (const char* config = std::getenv("XDG_CONFIG_HOME")) {
        return std::filesystem::path(config) / "huffstream";
    }
    return getHome() / ".config" / "huffstream";
}

hfs::Result<void> PathUtils::ensureDirectory(const std::filesystem::path& dir) {
    std::error_code ec;
    if (!std::filesystem::exists(dir, ec)) {
        std::filesystem::create_directories(dir, ec);
    }
    if (ec) {
        return hfs::Err(hfs::ErrorCode::DirectoryCreateFailed,
                        "Failed to create directory: " + dir.string() + " (" + ec.message() + ")");
    }
    return hfs::Ok();
}

hfs::Result<std::vector<uint8_t>> PathUtils::readFile(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return hfs::Err<std::vector<uint8_t>>(hfs::ErrorCode::FileNotFound,
                                              "File not found: " + path.string());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return hfs::Err<std::vector<uint8_t>>(hfs::ErrorCode::FileReadError,
                                              "Cannot open file: " + path.string());
    }

    std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)),
                              std::istreambuf_iterator<char>());
    if (file.bad()) {
        return hfs::Err<std::vector<uint8_t>>(hfs::ErrorCode::FileReadError,
                                              "Read failed: " + path.string());
    }
    return data;
}

hfs::Result<void> PathUtils::writeFile(const std::filesystem::path& path, const std::vector<uint8_t>& data) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return hfs::Err(hfs::ErrorCode::FileWriteError, "Cannot open file for writing: " + path.string());
    }

    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    file.flush();
    if (!file) {
        return hfs::Err(hfs::ErrorCode::FileWriteError, "Write failed: " + path.string());
    }
    return hfs::Ok();
}

std::string PathUtils::safeBasename(const std::string& filename) {
    auto name = std::filesystem::path(filename).filename().string();
    if (name.empty() || name == "." || name == "..") {
        return "";
    }
    return name;
}

std::string PathUtils::encodedName(const std::string& filename) {
    std::filesystem::path path(safeBasename(filename));
    return path.stem().string() + "_encoded" + path.extension().string();
}

std::string PathUtils::decodedName(const std::string& filename) {
    std::filesystem::path path(safeBasename(filename));
    std::string stem = path.stem().string();

    const std::string marker = "_encoded";
    auto pos = stem.rfind(marker);
    if (pos != std::string::npos) {
        stem.replace(pos, marker.size(), "_decoded");
    } else {
        stem += "_decoded";
    }
    return stem + path.extension().string();
}

} // namespace HuffStream
