#include "infrastructure/AtomicFile.hpp"

#include <chrono>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace fileextractor::infrastructure {

namespace fs = std::filesystem;

void WriteFileAtomically(const fs::path& path, const std::string& content) {
    // filename.<timestamp>.tmp
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = path;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    std::error_code ec;
    if (path.has_parent_path() && !fs::exists(path.parent_path(), ec)) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("Cannot create directory " + path.parent_path().string() + ": " + ec.message());
        }
    }

    {
        std::ofstream ofs(tempPath, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            throw std::runtime_error("Failed to open temp file: " + tempPath.string());
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            ofs.close();
            fs::remove(tempPath, ec);
            throw std::runtime_error("Write failed during output: " + tempPath.string());
        }
    }

    fs::rename(tempPath, path, ec);
    if (ec) {
        const std::string reason = ec.message();
        std::error_code cleanupEc;
        fs::remove(tempPath, cleanupEc);
        throw std::runtime_error("Rename to " + path.string() + " failed: " + reason);
    }
}

} // namespace fileextractor::infrastructure
