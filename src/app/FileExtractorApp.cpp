/**
 * @file FileExtractorApp.cpp
 * @brief Implementation of the FileExtractorApp class.
 */
#include "app/FileExtractorApp.hpp"

#include "application/ExtractorService.hpp"
#include "domain/ExtensionUtils.hpp"
#include "infrastructure/Logging.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/ReportWriter.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <csignal>
#include <iomanip>
#include <sstream>
#include <system_error>

#include <spdlog/spdlog.h>

namespace fileextractor::app {

namespace fs = std::filesystem;

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void HandleInterrupt(int) {
    g_interrupted = 1;
}

// Installs SIGINT/SIGTERM handlers for the lifetime of the poll loop.
class SignalGuard {
public:
    SignalGuard() {
        g_interrupted = 0;
        m_previousInt = std::signal(SIGINT, HandleInterrupt);
        m_previousTerm = std::signal(SIGTERM, HandleInterrupt);
    }
    ~SignalGuard() {
        std::signal(SIGINT, m_previousInt == SIG_ERR ? SIG_DFL : m_previousInt);
        std::signal(SIGTERM, m_previousTerm == SIG_ERR ? SIG_DFL : m_previousTerm);
    }
    SignalGuard(const SignalGuard&) = delete;
    SignalGuard& operator=(const SignalGuard&) = delete;

private:
    void (*m_previousInt)(int) = SIG_DFL;
    void (*m_previousTerm)(int) = SIG_DFL;
};

std::string Transform(std::string text, int (*fn)(int)) {
    std::transform(text.begin(), text.end(), text.begin(), [fn](unsigned char c) { return static_cast<char>(fn(c)); });
    return text;
}

void LogStatus(const std::shared_ptr<spdlog::logger>& logger, const domain::LogMessage& message) {
    switch (message.level) {
        case domain::LogLevel::Debug: logger->debug("{}", message.text); break;
        case domain::LogLevel::Info: logger->info("{}", message.text); break;
        case domain::LogLevel::Warning: logger->warn("{}", message.text); break;
        case domain::LogLevel::Error: logger->error("{}", message.text); break;
    }
}

void LogProgress(const std::shared_ptr<spdlog::logger>& logger, const domain::ProgressSnapshot& snapshot) {
    if (snapshot.total == 0) {
        logger->info("Processed {} files", snapshot.processed);
        return;
    }
    std::ostringstream line;
    line << "Progress: " << std::fixed << std::setprecision(1)
         << (100.0 * static_cast<double>(snapshot.processed) / static_cast<double>(snapshot.total))
         << "% (" << snapshot.processed << "/" << snapshot.total << ")";
    logger->info("{}", line.str());
}

} // namespace

infrastructure::AppSettings ApplyOverrides(infrastructure::AppSettings settings, const CliOptions& options) {
    if (options.mode) settings.mode = Transform(*options.mode, ::tolower);
    if (options.includeHidden) settings.includeHidden = true;

    auto extensions = domain::NormaliseExtensionTokens(domain::SplitCommaSeparated(options.extensions));
    if (!extensions.empty()) settings.extensions = std::move(extensions);

    auto excludeFiles = domain::SplitCommaSeparated(options.excludeFiles);
    if (!excludeFiles.empty()) settings.excludeFiles = std::move(excludeFiles);
    auto excludeFolders = domain::SplitCommaSeparated(options.excludeFolders);
    if (!excludeFolders.empty()) settings.excludeFolders = std::move(excludeFolders);

    if (options.output) settings.outputFile = options.output->string();
    if (options.maxFileSizeMb) settings.maxFileSizeMb = *options.maxFileSizeMb;
    if (options.chunkSize) settings.chunkSize = *options.chunkSize;
    if (options.logLevel) settings.logLevel = Transform(*options.logLevel, ::toupper);

    if (options.pollIntervalSeconds) {
        if (!(*options.pollIntervalSeconds > 0.0)) {
            throw infrastructure::ConfigValidationError("poll interval must be greater than zero");
        }
        const double millis = std::ceil(*options.pollIntervalSeconds * 1000.0);
        settings.pollIntervalMs = static_cast<std::size_t>(std::max(1.0, millis));
    }

    infrastructure::ConfigLoader::Validate(settings);
    return settings;
}

int ExitCodeFor(domain::RunOutcome outcome) {
    switch (outcome) {
        case domain::RunOutcome::Completed: return kExitCompleted;
        case domain::RunOutcome::Cancelled: return kExitCancelled;
        case domain::RunOutcome::Failed: return kExitFailed;
    }
    return kExitFailed;
}

FileExtractorApp::FileExtractorApp(CliOptions options, std::shared_ptr<spdlog::logger> logger)
    : m_options(std::move(options)), m_logger(std::move(logger)) {}

int FileExtractorApp::Run() {
    if (!Init()) {
        return kExitFailed;
    }
    int code = Execute();
    Shutdown();
    return code;
}

bool FileExtractorApp::Init() {
    const bool injectedLogger = static_cast<bool>(m_logger);
    if (!injectedLogger) {
        // Console-only logger until the settings name the log file.
        infrastructure::LoggingOptions bootstrap;
        bootstrap.level = m_options.logLevel && infrastructure::ParseLogLevel(*m_options.logLevel)
                              ? *m_options.logLevel : "INFO";
        m_logger = infrastructure::configureLogging(bootstrap);
    }

    m_settingsPath = m_options.config ? *m_options.config : infrastructure::PathUtils::GetDefaultSettingsPath();
    auto loaded = infrastructure::ConfigLoader::Load(m_settingsPath, m_logger);

    try {
        m_settings = ApplyOverrides(loaded, m_options);
    } catch (const infrastructure::ConfigValidationError& e) {
        m_logger->error("[FileExtractorApp] Invalid option: {}", e.what());
        return false;
    }

    if (!injectedLogger) {
        infrastructure::LoggingOptions logging;
        logging.level = m_settings.logLevel;
        if (!m_settings.logFile.empty()) {
            fs::path logFile(m_settings.logFile);
            if (logFile.is_relative()) logFile = infrastructure::PathUtils::GetLogDirectory() / logFile;
            logging.logFile = logFile;
        }
        try {
            m_logger = infrastructure::configureLogging(logging);
        } catch (const spdlog::spdlog_ex& e) {
            m_logger->error("[FileExtractorApp] Cannot open log file {}: {}", m_settings.logFile, e.what());
            return false;
        }
    }

    m_request = infrastructure::ConfigLoader::BuildRequest(m_settings, m_options.folder);
    m_pollInterval = std::chrono::milliseconds(m_settings.pollIntervalMs);
    return true;
}

int FileExtractorApp::Execute() {
    application::ExtractorService service(m_logger, m_settings.queueCapacity);
    std::shared_ptr<application::ExtractionRun> run = service.start(m_request);

    try {
        std::error_code ec;
        fs::path absolute = fs::absolute(m_options.folder, ec);
        infrastructure::ConfigLoader::UpdateRecentFolders(m_settings, (ec ? m_options.folder : absolute).string());
        infrastructure::ConfigLoader::Save(m_settingsPath, m_settings);
    } catch (const std::invalid_argument& e) {
        m_logger->warn("[FileExtractorApp] Recent folders not updated: {}", e.what());
    } catch (const std::runtime_error& e) {
        m_logger->warn("[FileExtractorApp] Recent folders not saved: {}", e.what());
    }

    {
        SignalGuard signals;
        bool cancelRequested = false;
        auto channel = run->channel();

        while (!m_result) {
            if (g_interrupted && !cancelRequested) {
                cancelRequested = true;
                m_logger->warn("[FileExtractorApp] Extraction interrupted by user");
                run->cancel();
            }

            auto message = channel->pop(m_pollInterval);
            if (!message) {
                if (!run->isRunning() && channel->size() == 0) {
                    m_result = run->result();
                    break;
                }
                continue;
            }

            if (const auto* log = std::get_if<domain::LogMessage>(&*message)) {
                LogStatus(m_logger, *log);
            } else if (const auto* progress = std::get_if<domain::ProgressMessage>(&*message)) {
                LogProgress(m_logger, progress->snapshot);
            } else if (const auto* state = std::get_if<domain::StateMessage>(&*message)) {
                m_result = state->result;
                m_logger->info("Extraction finished with state: {}", domain::OutcomeToString(state->result.outcome));
            }
        }
        run->wait();
    }

    if (!m_result) {
        m_logger->error("[FileExtractorApp] Extraction ended without a result");
        return kExitFailed;
    }

    if (m_options.report) {
        try {
            infrastructure::ReportWriter::WriteReport(*m_options.report, *m_result, m_request);
            m_logger->info("[FileExtractorApp] Report written to {}", m_options.report->string());
        } catch (const std::runtime_error& e) {
            m_logger->warn("[FileExtractorApp] Skipping report generation: {}", e.what());
        }
    }

    return ExitCodeFor(m_result->outcome);
}

void FileExtractorApp::Shutdown() {
    m_logger->flush();
}

} // namespace fileextractor::app
