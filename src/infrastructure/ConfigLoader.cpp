/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/AtomicFile.hpp"
#include "infrastructure/Logging.hpp"
#include "domain/ExtensionUtils.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <system_error>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace fileextractor::infrastructure {

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

std::string Trim(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return {};
    const auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

std::string Transform(std::string text, int (*fn)(int)) {
    std::transform(text.begin(), text.end(), text.begin(), [fn](unsigned char c) { return static_cast<char>(fn(c)); });
    return text;
}

// Accepts a JSON array of strings or a single comma separated string.
std::vector<std::string> ReadStringList(const json& j, const char* key, const std::vector<std::string>& fallback) {
    if (!j.contains(key) || j.at(key).is_null()) return fallback;
    const json& value = j.at(key);
    if (value.is_string()) {
        return domain::SplitCommaSeparated({value.get<std::string>()});
    }
    if (!value.is_array()) {
        throw ConfigValidationError(std::string(key) + " must be an array of strings");
    }
    std::vector<std::string> raw;
    for (const auto& item : value) {
        if (!item.is_string()) {
            throw ConfigValidationError(std::string(key) + " must be an array of strings");
        }
        raw.push_back(item.get<std::string>());
    }
    return domain::SplitCommaSeparated(raw);
}

std::size_t ReadPositive(const json& j, const char* key, std::size_t fallback) {
    if (!j.contains(key)) return fallback;
    const json& value = j.at(key);
    if (!value.is_number_integer() || value.get<long long>() <= 0) {
        throw ConfigValidationError(std::string(key) + " must be a positive integer");
    }
    return static_cast<std::size_t>(value.get<long long>());
}

void Persist(const fs::path& path, const AppSettings& settings, const std::shared_ptr<spdlog::logger>& logger) {
    try {
        ConfigLoader::Save(path, settings);
        if (logger) logger->debug("[ConfigLoader] Configuration saved to {}", path.string());
    } catch (const std::runtime_error& e) {
        if (logger) logger->error("[ConfigLoader] Error saving configuration: {}", e.what());
    }
}

} // namespace

AppSettings ConfigLoader::Defaults() {
    AppSettings settings;
    settings.extensions = domain::DefaultExtensions();
    settings.excludeFiles = domain::DefaultExcludes();
    settings.excludeFolders = domain::DefaultExcludes();
    settings.priorityFiles = domain::DefaultPriorityFiles();
    return settings;
}

AppSettings ConfigLoader::FromJson(const json& j) {
    if (!j.is_object()) {
        throw ConfigValidationError("settings must be a JSON object");
    }

    AppSettings settings = Defaults();
    try {
        if (j.contains("output_file")) settings.outputFile = Trim(j.at("output_file").get<std::string>());
        if (j.contains("mode")) settings.mode = Transform(Trim(j.at("mode").get<std::string>()), ::tolower);
        if (j.contains("include_hidden")) settings.includeHidden = j.at("include_hidden").get<bool>();

        settings.extensions = domain::NormaliseExtensionTokens(ReadStringList(j, "extensions", settings.extensions));
        settings.excludeFiles = ReadStringList(j, "exclude_files", settings.excludeFiles);
        settings.excludeFolders = ReadStringList(j, "exclude_folders", settings.excludeFolders);
        settings.priorityFiles = ReadStringList(j, "priority_files", settings.priorityFiles);

        if (j.contains("max_file_size_mb") && !j.at("max_file_size_mb").is_null()) {
            const json& limit = j.at("max_file_size_mb");
            if (!limit.is_number()) throw ConfigValidationError("max_file_size_mb must be a number or null");
            settings.maxFileSizeMb = limit.get<double>();
        }

        settings.chunkSize = ReadPositive(j, "chunk_size", settings.chunkSize);
        settings.queueCapacity = ReadPositive(j, "queue_capacity", settings.queueCapacity);
        settings.pollIntervalMs = ReadPositive(j, "poll_interval_ms", settings.pollIntervalMs);

        if (j.contains("recent_folders")) {
            const json& recent = j.at("recent_folders");
            if (!recent.is_array()) throw ConfigValidationError("recent_folders must be an array of strings");
            settings.recentFolders.clear();
            for (const auto& item : recent) {
                if (!item.is_string()) throw ConfigValidationError("recent_folders entries must be strings");
                settings.recentFolders.push_back(item.get<std::string>());
            }
        }

        if (j.contains("log_level")) settings.logLevel = Transform(Trim(j.at("log_level").get<std::string>()), ::toupper);
        if (j.contains("log_file")) settings.logFile = Trim(j.at("log_file").get<std::string>());
    } catch (const json::exception& e) {
        throw ConfigValidationError(std::string("Invalid settings value: ") + e.what());
    }

    Validate(settings);
    return settings;
}

json ConfigLoader::ToJson(const AppSettings& settings) {
    json j;
    j["output_file"] = settings.outputFile;
    j["mode"] = settings.mode;
    j["include_hidden"] = settings.includeHidden;
    j["extensions"] = settings.extensions;
    j["exclude_files"] = settings.excludeFiles;
    j["exclude_folders"] = settings.excludeFolders;
    j["max_file_size_mb"] = settings.maxFileSizeMb ? json(*settings.maxFileSizeMb) : json(nullptr);
    j["chunk_size"] = settings.chunkSize;
    j["queue_capacity"] = settings.queueCapacity;
    j["poll_interval_ms"] = settings.pollIntervalMs;
    j["priority_files"] = settings.priorityFiles;
    j["recent_folders"] = settings.recentFolders;
    j["log_level"] = settings.logLevel;
    j["log_file"] = settings.logFile;
    return j;
}

void ConfigLoader::Validate(const AppSettings& settings) {
    if (settings.outputFile.empty()) {
        throw ConfigValidationError("output_file cannot be empty");
    }
    if (!domain::ParseMode(settings.mode)) {
        throw ConfigValidationError("mode must be one of inclusion, exclusion");
    }
    if (settings.maxFileSizeMb && !(*settings.maxFileSizeMb > 0.0)) {
        throw ConfigValidationError("max_file_size_mb must be greater than zero");
    }
    if (settings.chunkSize == 0) throw ConfigValidationError("chunk_size must be greater than zero");
    if (settings.queueCapacity == 0) throw ConfigValidationError("queue_capacity must be greater than zero");
    if (settings.pollIntervalMs == 0) throw ConfigValidationError("poll_interval_ms must be greater than zero");
    if (settings.recentFolders.size() > kMaxRecentFolders) {
        throw ConfigValidationError("recent_folders cannot exceed 10 entries");
    }
    for (const auto& folder : settings.recentFolders) {
        if (folder.empty()) throw ConfigValidationError("recent_folders entries must be non-empty strings");
    }
    if (!ParseLogLevel(settings.logLevel)) {
        throw ConfigValidationError("log_level must be one of DEBUG, INFO, WARNING, ERROR, CRITICAL");
    }
}

AppSettings ConfigLoader::Load(const fs::path& path, const std::shared_ptr<spdlog::logger>& logger) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        AppSettings settings = Defaults();
        Persist(path, settings, logger);
        if (logger) logger->info("[ConfigLoader] Created new configuration file: {}", path.string());
        return settings;
    }

    AppSettings settings;
    try {
        std::ifstream f(path);
        if (!f.is_open()) {
            throw ConfigValidationError("cannot open " + path.string());
        }
        json j = json::parse(f);
        settings = FromJson(j);
    } catch (const json::exception& e) {
        if (logger) logger->warn("[ConfigLoader] Invalid configuration detected. Resetting to defaults: {}", e.what());
        settings = Defaults();
    } catch (const ConfigValidationError& e) {
        if (logger) logger->warn("[ConfigLoader] Invalid configuration detected. Resetting to defaults: {}", e.what());
        settings = Defaults();
    }

    Persist(path, settings, logger);
    return settings;
}

void ConfigLoader::Save(const fs::path& path, const AppSettings& settings) {
    WriteFileAtomically(path, ToJson(settings).dump(4) + "\n");
}

void ConfigLoader::UpdateRecentFolders(AppSettings& settings, const std::string& folder, std::size_t limit) {
    const std::string sanitized = Trim(folder);
    if (sanitized.empty()) {
        throw std::invalid_argument("folder cannot be empty");
    }
    const std::size_t effectiveLimit = std::max<std::size_t>(1, std::min(limit, kMaxRecentFolders));

    std::vector<std::string> updated{sanitized};
    for (const auto& existing : settings.recentFolders) {
        if (existing != sanitized) updated.push_back(existing);
    }
    if (updated.size() > effectiveLimit) updated.resize(effectiveLimit);
    settings.recentFolders = std::move(updated);
}

domain::ExtractionRequest ConfigLoader::BuildRequest(const AppSettings& settings, const fs::path& root) {
    Validate(settings);

    domain::ExtractionRequest request;
    request.rootFolder = root;
    request.mode = *domain::ParseMode(settings.mode);
    request.includeHidden = settings.includeHidden;

    auto extensions = domain::NormaliseExtensionTokens(settings.extensions);
    if (extensions.empty() && request.mode == domain::ExtractionMode::Inclusion) {
        extensions = domain::DefaultExtensions();
    }
    request.extensions.insert(extensions.begin(), extensions.end());

    request.excludeFilePatterns = settings.excludeFiles;
    request.excludeFolderPatterns = settings.excludeFolders;
    request.outputPath = settings.outputFile;
    if (settings.maxFileSizeMb) {
        request.sizeWarningThreshold = static_cast<std::uintmax_t>(*settings.maxFileSizeMb * 1024.0 * 1024.0);
    }
    request.chunkSize = settings.chunkSize;
    request.priorityFiles = settings.priorityFiles;
    return request;
}

} // namespace fileextractor::infrastructure
