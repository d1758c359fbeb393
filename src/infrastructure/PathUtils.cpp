#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>

namespace fileextractor::infrastructure {

namespace fs = std::filesystem;

namespace {

fs::path XdgDirectory(const char* variable, const char* homeFallback) {
    const char* value = std::getenv(variable);
    if (value && *value) {
        return fs::path(value);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / homeFallback;
    }
    return fs::current_path(); // Fallback
}

} // namespace

fs::path PathUtils::GetDataHome() {
    return XdgDirectory("XDG_DATA_HOME", ".local/share");
}

fs::path PathUtils::GetConfigHome() {
    return XdgDirectory("XDG_CONFIG_HOME", ".config");
}

fs::path PathUtils::GetDefaultSettingsPath() {
    return GetConfigHome() / "FileExtractor" / "settings.json";
}

fs::path PathUtils::GetLogDirectory() {
    return GetDataHome() / "FileExtractor";
}

} // namespace fileextractor::infrastructure
