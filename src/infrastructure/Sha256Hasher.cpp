/**
 * @file Sha256Hasher.cpp
 * @brief Implementation of Sha256Hasher.
 */

#include "infrastructure/Sha256Hasher.hpp"

#include <stdexcept>

#include <openssl/evp.h>

namespace fileextractor::infrastructure {

void Sha256Hasher::ContextDeleter::operator()(evp_md_ctx_st* ctx) const {
    EVP_MD_CTX_free(ctx);
}

Sha256Hasher::Sha256Hasher() : m_ctx(EVP_MD_CTX_new()) {
    if (!m_ctx) {
        throw std::runtime_error("Cannot allocate SHA-256 context");
    }
    if (!reset()) {
        throw std::runtime_error("Cannot initialise SHA-256 context");
    }
}

Sha256Hasher::~Sha256Hasher() = default;

bool Sha256Hasher::reset() {
    m_active = EVP_DigestInit_ex(m_ctx.get(), EVP_sha256(), nullptr) == 1;
    return m_active;
}

bool Sha256Hasher::update(const void* data, std::size_t size) {
    if (!m_active) return false;
    if (size == 0) return true;
    return EVP_DigestUpdate(m_ctx.get(), data, size) == 1;
}

bool Sha256Hasher::finalHex(std::string& outHex) {
    if (!m_active) return false;
    m_active = false;

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(m_ctx.get(), digest, &length) != 1) return false;

    static const char kHex[] = "0123456789abcdef";
    outHex.clear();
    outHex.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        outHex.push_back(kHex[digest[i] >> 4]);
        outHex.push_back(kHex[digest[i] & 0x0F]);
    }
    return true;
}

} // namespace fileextractor::infrastructure
