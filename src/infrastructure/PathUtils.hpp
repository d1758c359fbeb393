// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace fileextractor::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();
    static std::filesystem::path GetDefaultSettingsPath();
    static std::filesystem::path GetLogDirectory();
};

} // namespace fileextractor::infrastructure
