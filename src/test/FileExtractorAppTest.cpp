#include <cassert>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "app/FileExtractorApp.hpp"
#include "TestSupport.hpp"

using namespace fileextractor;
using app::CliOptions;
using app::FileExtractorApp;

namespace fs = std::filesystem;

namespace {

void TestOverrides() {
    auto settings = infrastructure::ConfigLoader::Defaults();
    CliOptions options;
    options.mode = "Exclusion";
    options.includeHidden = true;
    options.extensions = {"log, TMP", "*.bak"};
    options.excludeFolders = {"build,dist"};
    options.output = fs::path("merged.txt");
    options.pollIntervalSeconds = 0.25;
    options.logLevel = "warning";

    auto merged = app::ApplyOverrides(settings, options);
    assert(merged.mode == "exclusion");
    assert(merged.includeHidden);
    assert((merged.extensions == std::vector<std::string>{".log", ".tmp", ".bak"}));
    assert((merged.excludeFolders == std::vector<std::string>{"build", "dist"}));
    assert(merged.excludeFiles == domain::DefaultExcludes());
    assert(merged.outputFile == "merged.txt");
    assert(merged.pollIntervalMs == 250);
    assert(merged.logLevel == "WARNING");

    CliOptions none;
    auto untouched = app::ApplyOverrides(settings, none);
    assert(untouched.extensions == settings.extensions);

    CliOptions badPoll;
    badPoll.pollIntervalSeconds = 0.0;
    bool threw = false;
    try {
        app::ApplyOverrides(settings, badPoll);
    } catch (const infrastructure::ConfigValidationError&) {
        threw = true;
    }
    assert(threw);

    assert(app::ExitCodeFor(domain::RunOutcome::Completed) == 0);
    assert(app::ExitCodeFor(domain::RunOutcome::Failed) == 1);
    assert(app::ExitCodeFor(domain::RunOutcome::Cancelled) == 130);
    std::cout << "[PASS] Command-line overrides merge into settings." << std::endl;
}

void TestCompletedRun(const fs::path& base) {
    const fs::path root = base / "project";
    test::WriteFile(root / "README.md", "# Title");
    test::WriteFile(root / "src" / "main.py", "print('hi')");
    test::WriteFile(root / "image.png", "png");

    CliOptions options;
    options.folder = root;
    options.config = base / "settings.json";
    options.output = base / "combined.txt";
    options.report = base / "report.json";
    options.pollIntervalSeconds = 0.01;

    std::ostringstream lines;
    FileExtractorApp runner(options, test::MakeCapturingLogger(lines));
    const int code = runner.Run();
    assert(code == app::kExitCompleted);
    assert(runner.LastResult() && runner.LastResult()->filesProcessed == 2);

    const std::string expected = test::Block("README.md", "# Title") + test::Block("src/main.py", "print('hi')");
    assert(test::ReadFile(base / "combined.txt") == expected);

    auto report = nlohmann::json::parse(test::ReadFile(base / "report.json"));
    assert(report["outcome"] == "completed");
    assert(report["statistics"]["processed_files"] == 2);
    assert(report["file_details"].size() == 2);
    assert(report["total_size"] == 18);

    auto settings = nlohmann::json::parse(test::ReadFile(base / "settings.json"));
    assert(settings["recent_folders"].size() == 1);
    assert(settings["recent_folders"][0] == fs::absolute(root).string());

    const std::string log = lines.str();
    assert(log.find("Progress: 100.0% (2/2)") != std::string::npos);
    assert(log.find("Extraction finished with state: completed") != std::string::npos);
    std::cout << "[PASS] A command-line run writes output, report and history." << std::endl;
}

void TestFailedRun(const fs::path& base) {
    CliOptions options;
    options.folder = base / "missing";
    options.config = base / "settings.json";
    options.output = base / "never.txt";
    options.pollIntervalSeconds = 0.01;

    std::ostringstream lines;
    FileExtractorApp runner(options, test::MakeCapturingLogger(lines));
    assert(runner.Run() == app::kExitFailed);
    assert(runner.LastResult()->failureKind == domain::ErrorKind::FolderNotFound);
    assert(lines.str().find("Error during extraction") != std::string::npos);

    CliOptions invalid = options;
    invalid.chunkSize = 0;
    FileExtractorApp rejected(invalid, test::MakeCapturingLogger(lines));
    assert(rejected.Run() == app::kExitFailed);
    assert(!rejected.LastResult());
    std::cout << "[PASS] Missing folders and invalid options exit with 1." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting FileExtractorApp Test..." << std::endl;
    test::ScratchDir scratch("fe_app");
    TestOverrides();
    TestCompletedRun(scratch.path());
    TestFailedRun(scratch.path());
    std::cout << "[Test] All FileExtractorApp tests passed." << std::endl;
    return 0;
}
