/**
 * @file DestinationWriter.cpp
 * @brief Implementation of DestinationWriter.
 */

#include "infrastructure/DestinationWriter.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace fileextractor::infrastructure {

DestinationWriter::DestinationWriter(fs::path path) : m_path(std::move(path)) {}

DestinationWriter::~DestinationWriter() {
    if (m_stream.is_open()) {
        m_stream.close();
    }
}

void DestinationWriter::recordError(const std::string& what) {
    m_lastError = what + ": " + m_path.string();
    if (errno != 0) {
        m_lastError += " (" + std::string(std::strerror(errno)) + ")";
    }
}

void DestinationWriter::open() {
    std::error_code ec;
    if (m_path.has_parent_path() && !fs::exists(m_path.parent_path(), ec)) {
        fs::create_directories(m_path.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("Cannot create output directory " + m_path.parent_path().string() + ": " + ec.message());
        }
    }

    errno = 0;
    m_stream.open(m_path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!m_stream.is_open()) {
        recordError("Cannot open output file");
        throw std::runtime_error(m_lastError);
    }
    m_position = 0;
    m_lastError.clear();
}

bool DestinationWriter::write(const char* data, std::size_t size) {
    if (!m_stream.is_open()) {
        m_lastError = "Output file is not open: " + m_path.string();
        return false;
    }
    errno = 0;
    m_stream.write(data, static_cast<std::streamsize>(size));
    if (!m_stream) {
        recordError("Write failed");
        return false;
    }
    m_position += size;
    return true;
}

bool DestinationWriter::flush() {
    if (!m_stream.is_open()) return false;
    errno = 0;
    m_stream.flush();
    if (!m_stream) {
        recordError("Flush failed");
        return false;
    }
    return true;
}

bool DestinationWriter::rollbackTo(std::uintmax_t position) {
    if (!m_stream.is_open() || position > m_position) return false;

    // Pending bytes must reach the file before it is resized.
    m_stream.clear();
    m_stream.flush();
    m_stream.clear();

    std::error_code ec;
    fs::resize_file(m_path, position, ec);
    if (ec) {
        m_lastError = "Cannot truncate " + m_path.string() + ": " + ec.message();
        return false;
    }
    m_stream.seekp(static_cast<std::streamoff>(position));
    if (!m_stream) {
        m_stream.clear();
        m_lastError = "Cannot reposition " + m_path.string();
        return false;
    }
    m_position = position;
    return true;
}

bool DestinationWriter::close() {
    if (!m_stream.is_open()) return true;
    bool ok = flush();
    m_stream.close();
    if (m_stream.fail() && ok) {
        recordError("Close failed");
        ok = false;
    }
    return ok;
}

} // namespace fileextractor::infrastructure
