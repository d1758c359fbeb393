/**
 * @file ExtensionUtils.cpp
 * @brief Implementation of the extension helpers.
 */

#include "domain/ExtensionUtils.hpp"
#include "domain/ExtractionRequest.hpp"

#include <algorithm>
#include <cctype>

namespace fileextractor::domain {

namespace {

std::string Trim(const std::string& text) {
    auto begin = std::find_if_not(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    if (begin >= end) return {};
    return std::string(begin, end);
}

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return std::tolower(c); });
    return text;
}

void AppendUnique(std::vector<std::string>& out, const std::string& value) {
    if (std::find(out.begin(), out.end(), value) == out.end()) {
        out.push_back(value);
    }
}

} // namespace

const std::vector<std::string>& DefaultExtensions() {
    static const std::vector<std::string> extensions = {
        ".css", ".csv", ".db", ".html", ".ini", ".js", ".json",
        ".log", ".md", ".py", ".txt", ".xml", ".yaml", ".yml"
    };
    return extensions;
}

const std::vector<std::string>& DefaultExcludes() {
    static const std::vector<std::string> excludes = {
        ".git", ".vscode", "__pycache__", "venv", "node_modules", ".venv", ".pytest_cache"
    };
    return excludes;
}

const std::vector<std::string>& DefaultPriorityFiles() {
    static const std::vector<std::string> files = {"README.md", "SPECIFICATIONS.md"};
    return files;
}

std::vector<std::string> NormaliseExtensionTokens(const std::vector<std::string>& rawTokens) {
    std::vector<std::string> normalised;
    for (const auto& raw : rawTokens) {
        std::string token = ToLower(Trim(raw));
        if (token.empty()) continue;

        if (token == "*" || token == "*.*") {
            AppendUnique(normalised, kWildcardExtension);
            continue;
        }
        if (token.rfind("*.", 0) == 0) {
            token = token.substr(1);
        }
        if (token.front() != '.') {
            token.insert(token.begin(), '.');
        }
        AppendUnique(normalised, token);
    }
    return normalised;
}

std::string CanonicalExtension(const std::filesystem::path& path) {
    return ToLower(path.extension().string());
}

std::vector<std::string> SplitCommaSeparated(const std::vector<std::string>& values) {
    std::vector<std::string> parts;
    for (const auto& value : values) {
        std::size_t start = 0;
        while (start <= value.size()) {
            std::size_t comma = value.find(',', start);
            if (comma == std::string::npos) comma = value.size();
            std::string part = Trim(value.substr(start, comma - start));
            if (!part.empty()) {
                AppendUnique(parts, part);
            }
            start = comma + 1;
        }
    }
    return parts;
}

} // namespace fileextractor::domain
