/**
 * @file HashUtils.h
 * @brief Digest computation utilities
 */

#pragma once

#include "config.h"
#include <string>
#include <cstdint>

namespace CasFile {

/**
 * @class HashUtils
 * @brief Hashing utilities for content addressing
 *
 * Streaming digests over OpenSSL EVP for the writer, plus the hex
 * helpers that turn a digest into an object name.
 *
 * Thread Safety:
 * - All static methods are thread-safe (no shared state)
 * - An IncrementalHash instance must not be shared between threads
 */
class HashUtils {
public:
    /**
     * @brief SHA-256 of a string as 64 lower-case hex characters
     *
     * This is the name a content-addressed file holding `data` must carry.
     */
    static std::string sha256Hex(const std::string& data);

    /**
     * @brief Convert an arbitrary byte run to lower-case hex
     */
    static std::string bytesToHex(const unsigned char* data, size_t size);

    /**
     * @brief Streaming digest context
     *
     * Wraps an OpenSSL EVP_MD_CTX for any digest OpenSSL knows by name
     * ("sha256", "sha1", "sha512", ...). Use this when the data arrives
     * in pieces, e.g. while it is being written to disk.
     */
    class IncrementalHash {
    public:
        /**
         * @brief Initialize a context for the named digest
         *
         * Check isValid() afterwards: an unknown name or an OpenSSL
         * failure leaves the context unusable.
         */
        explicit IncrementalHash(const std::string& algorithm = DEFAULT_DIGEST_ALGORITHM);

        ~IncrementalHash();

        // Prevent copying (context cannot be copied)
        IncrementalHash(const IncrementalHash&) = delete;
        IncrementalHash& operator=(const IncrementalHash&) = delete;

        // Allow moving (transfers ownership of EVP_MD_CTX)
        IncrementalHash(IncrementalHash&& other) noexcept;
        IncrementalHash& operator=(IncrementalHash&& other) noexcept;

        bool isValid() const { return m_ctx != nullptr && m_md != nullptr; }

        const std::string& algorithm() const { return m_algorithm; }

        /// Digest length in bytes (0 if invalid)
        size_t digestSize() const;

        /**
         * @brief Add data to the hash computation
         * @return false if finalized, invalid, or OpenSSL fails
         */
        bool update(const uint8_t* data, size_t size);

        /**
         * @brief Finalize and get the hash result
         * @param hash Output buffer (must be at least digestSize() bytes)
         * @return true if successful
         *
         * After calling finalize(), you can no longer call update().
         */
        bool finalize(unsigned char* hash);

        /**
         * @brief Finalize and return the digest as lower-case hex
         * @return empty string on failure
         */
        std::string finalizeHex();

    private:
        void* m_ctx;        ///< Opaque pointer to EVP_MD_CTX
        const void* m_md;   ///< Opaque pointer to EVP_MD
        std::string m_algorithm;
        bool m_finalized;
    };
};

}  // namespace CasFile
