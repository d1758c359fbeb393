/**
 * @file Utf8Validator.hpp
 * @brief Incremental UTF-8 validation across chunk boundaries.
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace fileextractor::application {

/**
 * @class Utf8Validator
 * @brief Validates a byte stream fed in arbitrary pieces.
 *
 * Rejects overlong forms, surrogates and code points above U+10FFFF. A
 * sequence split between two feed() calls is carried over.
 */
class Utf8Validator {
public:
    /** @brief Validates the next piece. Returns false at the first invalid byte. */
    bool feed(const char* data, std::size_t size) {
        for (std::size_t i = 0; i < size; ++i) {
            const auto byte = static_cast<std::uint8_t>(data[i]);
            if (!accept(byte)) {
                m_errorOffset = m_offset + i;
                return false;
            }
        }
        m_offset += size;
        return true;
    }

    /** @brief True when the stream did not end inside a multi-byte sequence. */
    bool finish() const { return m_pending == 0; }

    /** @brief Stream offset of the first invalid byte. */
    std::size_t errorOffset() const { return m_errorOffset; }

private:
    bool accept(std::uint8_t byte) {
        if (m_pending == 0) {
            if (byte < 0x80) return true;
            if (byte >= 0xC2 && byte <= 0xDF) { m_pending = 1; m_lower = 0x80; m_upper = 0xBF; return true; }
            if (byte == 0xE0) { m_pending = 2; m_lower = 0xA0; m_upper = 0xBF; return true; }
            if (byte == 0xED) { m_pending = 2; m_lower = 0x80; m_upper = 0x9F; return true; }
            if (byte >= 0xE1 && byte <= 0xEF) { m_pending = 2; m_lower = 0x80; m_upper = 0xBF; return true; }
            if (byte == 0xF0) { m_pending = 3; m_lower = 0x90; m_upper = 0xBF; return true; }
            if (byte >= 0xF1 && byte <= 0xF3) { m_pending = 3; m_lower = 0x80; m_upper = 0xBF; return true; }
            if (byte == 0xF4) { m_pending = 3; m_lower = 0x80; m_upper = 0x8F; return true; }
            return false;
        }
        if (byte < m_lower || byte > m_upper) return false;
        --m_pending;
        m_lower = 0x80;
        m_upper = 0xBF;
        return true;
    }

    int m_pending = 0;
    std::uint8_t m_lower = 0x80;
    std::uint8_t m_upper = 0xBF;
    std::size_t m_offset = 0;
    std::size_t m_errorOffset = 0;
};

} // namespace fileextractor::application
