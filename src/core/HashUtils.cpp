/**
 * @file HashUtils.cpp
 * @brief Digest computation utilities using OpenSSL EVP API
 *
 * Uses the EVP API instead of the deprecated SHA256_* functions
 * for compatibility with OpenSSL 3.0+, and so that any digest OpenSSL
 * knows by name can back a content-addressed writer.
 */

#include "casfile/HashUtils.h"

#include <openssl/evp.h>
#include <utility>

namespace CasFile {

//=============================================================================
// Static Methods
//=============================================================================

std::string HashUtils::sha256Hex(const std::string& data)
{
    IncrementalHash hasher(DEFAULT_DIGEST_ALGORITHM);
    if (!hasher.update(reinterpret_cast<const uint8_t*>(data.data()), data.size())) {
        return "";
    }
    return hasher.finalizeHex();
}

std::string HashUtils::bytesToHex(const unsigned char* data, size_t size)
{
    static constexpr char kHex[] = "0123456789abcdef";

    std::string out;
    if (!data) {
        return out;
    }
    out.reserve(size * 2);
    for (size_t i = 0; i < size; ++i) {
        out.push_back(kHex[(data[i] >> 4) & 0x0F]);
        out.push_back(kHex[data[i] & 0x0F]);
    }
    return out;
}

//=============================================================================
// IncrementalHash Implementation
//=============================================================================

HashUtils::IncrementalHash::IncrementalHash(const std::string& algorithm)
    : m_ctx(nullptr)
    , m_md(nullptr)
    , m_algorithm(algorithm)
    , m_finalized(false)
{
    const EVP_MD* md = EVP_get_digestbyname(algorithm.c_str());
    if (!md) {
        return;  // Unknown digest, isValid() reports false
    }

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        return;
    }

    if (EVP_DigestInit_ex(ctx, md, nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        return;
    }

    m_ctx = ctx;
    m_md = md;
}

HashUtils::IncrementalHash::~IncrementalHash()
{
    if (m_ctx) {
        EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(m_ctx));
        m_ctx = nullptr;
    }
}

HashUtils::IncrementalHash::IncrementalHash(IncrementalHash&& other) noexcept
    : m_ctx(other.m_ctx)
    , m_md(other.m_md)
    , m_algorithm(std::move(other.m_algorithm))
    , m_finalized(other.m_finalized)
{
    // Steal the context from other, leave other in valid empty state
    other.m_ctx = nullptr;
    other.m_md = nullptr;
    other.m_finalized = false;
}

HashUtils::IncrementalHash& HashUtils::IncrementalHash::operator=(IncrementalHash&& other) noexcept {
    if (this != &other) {
        if (m_ctx) {
            EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(m_ctx));
        }

        m_ctx = other.m_ctx;
        m_md = other.m_md;
        m_algorithm = std::move(other.m_algorithm);
        m_finalized = other.m_finalized;

        other.m_ctx = nullptr;
        other.m_md = nullptr;
        other.m_finalized = false;
    }
    return *this;
}

size_t HashUtils::IncrementalHash::digestSize() const
{
    if (!m_md) {
        return 0;
    }
    return static_cast<size_t>(EVP_MD_size(static_cast<const EVP_MD*>(m_md)));
}

bool HashUtils::IncrementalHash::update(const uint8_t* data, size_t size)
{
    if (m_finalized || !isValid()) {
        return false;  // Cannot update after finalize
    }

    if (!data || size == 0) {
        return true;  // Nothing to update
    }

    EVP_MD_CTX* ctx = static_cast<EVP_MD_CTX*>(m_ctx);
    return EVP_DigestUpdate(ctx, data, size) == 1;
}

bool HashUtils::IncrementalHash::finalize(unsigned char* hash)
{
    if (m_finalized || !hash || !isValid()) {
        return false;
    }

    EVP_MD_CTX* ctx = static_cast<EVP_MD_CTX*>(m_ctx);
    unsigned int hashLen = 0;
    bool success = (EVP_DigestFinal_ex(ctx, hash, &hashLen) == 1);
    m_finalized = true;
    return success;
}

std::string HashUtils::IncrementalHash::finalizeHex()
{
    unsigned char digest[EVP_MAX_MD_SIZE];
    if (!finalize(digest)) {
        return "";
    }
    return bytesToHex(digest, digestSize());
}

}  // namespace CasFile
