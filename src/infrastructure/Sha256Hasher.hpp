/**
 * @file Sha256Hasher.hpp
 * @brief Streaming SHA-256 digest over OpenSSL EVP.
 */

#pragma once

#include <cstddef>
#include <memory>
#include <string>

struct evp_md_ctx_st;

namespace fileextractor::infrastructure {

/**
 * @class Sha256Hasher
 * @brief Incremental SHA-256 of data fed in chunks.
 *
 * Usage:
 * @code
 *   Sha256Hasher hasher;
 *   if (!hasher.update(chunk, size)) return false;
 *   std::string hex;
 *   if (!hasher.finalHex(hex)) return false;
 * @endcode
 *
 * Non-copyable. finalHex() ends the computation; a further update() fails
 * until reset() is called.
 */
class Sha256Hasher {
public:
    /** @throws std::runtime_error when the digest context cannot be created. */
    Sha256Hasher();
    ~Sha256Hasher();

    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;

    /** @brief Starts a new computation. */
    bool reset();

    bool update(const void* data, std::size_t size);

    /** @brief Finishes the computation and writes the lower-case hex digest. */
    bool finalHex(std::string& outHex);

private:
    struct ContextDeleter {
        void operator()(evp_md_ctx_st* ctx) const;
    };

    std::unique_ptr<evp_md_ctx_st, ContextDeleter> m_ctx;
    bool m_active = false;
};

} // namespace fileextractor::infrastructure
