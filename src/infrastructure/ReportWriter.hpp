/**
 * @file ReportWriter.hpp
 * @brief JSON summary of a finished extraction run.
 */

#pragma once

#include <filesystem>

#include <nlohmann/json_fwd.hpp>

#include "domain/ExtractionRequest.hpp"
#include "domain/StatusMessage.hpp"

namespace fileextractor::infrastructure {

class ReportWriter {
public:
    /**
     * @brief Serialises a terminal result together with the request that produced it.
     */
    static nlohmann::json ToJson(const domain::TerminalResult& result,
                                 const domain::ExtractionRequest& context);

    /**
     * @brief Writes the report atomically to path.
     * @throws std::runtime_error when the report cannot be written.
     */
    static void WriteReport(const std::filesystem::path& path,
                            const domain::TerminalResult& result,
                            const domain::ExtractionRequest& context);
};

} // namespace fileextractor::infrastructure
