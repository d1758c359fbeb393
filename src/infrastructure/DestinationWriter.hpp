/**
 * @file DestinationWriter.hpp
 * @brief The single output stream of an extraction run.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

namespace fileextractor::infrastructure {

/**
 * @class DestinationWriter
 * @brief Append-only writer with per-file rollback.
 *
 * Opened once per run (truncating any previous content) and written
 * sequentially. rollbackTo() cuts the file back to an earlier position so a
 * failed or cancelled file leaves no bytes behind.
 */
class DestinationWriter {
public:
    explicit DestinationWriter(std::filesystem::path path);
    ~DestinationWriter();

    DestinationWriter(const DestinationWriter&) = delete;
    DestinationWriter& operator=(const DestinationWriter&) = delete;

    /**
     * @brief Opens the destination, creating parent directories.
     * @throws std::runtime_error when the destination cannot be opened.
     */
    void open();

    /** @brief Appends bytes. Returns false on a write failure. */
    bool write(const char* data, std::size_t size);
    bool write(const std::string& text) { return write(text.data(), text.size()); }

    /** @brief Flushes buffered bytes. Returns false on a write failure. */
    bool flush();

    /** @brief Truncates the output back to position. */
    bool rollbackTo(std::uintmax_t position);

    /** @brief Flushes and closes. Returns false when the final flush failed. */
    bool close();

    bool isOpen() const { return m_stream.is_open(); }
    std::uintmax_t position() const { return m_position; }
    const std::filesystem::path& path() const { return m_path; }
    const std::string& lastError() const { return m_lastError; }

private:
    void recordError(const std::string& what);

    std::filesystem::path m_path;
    std::ofstream m_stream;
    std::uintmax_t m_position = 0;
    std::string m_lastError;
};

} // namespace fileextractor::infrastructure
