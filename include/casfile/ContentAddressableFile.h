/**
 * @file ContentAddressableFile.h
 * @brief Atomic writer for files named after the digest of their content
 */

#pragma once

#include "ErrorCodes.h"
#include "HashUtils.h"
#include "SafeFile.h"
#include "WriterOptions.h"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace CasFile {

/**
 * @class ContentAddressableFile
 * @brief Writes a content-addressed file through an exclusive staging file
 *
 * The base name of the destination is the OID: the hex digest its content
 * must have. Bytes go to `<destination><suffix>` and into a running digest.
 * accept() publishes the staging file with rename(2) only if the digest
 * equals the OID.
 *
 * Lifecycle:
 *   open() -> write()* -> accept()   created, or skipped if the destination exists
 *                      -> accept()   mismatch: staging kept until close()
 *                      -> close()    staging discarded
 *
 * Concurrency:
 * - Staging files are created with O_EXCL: a second writer for the same
 *   destination fails in open() with ErrorKind::Conflict.
 * - Whoever accepts first renames; a later writer finds the destination
 *   and discards its own copy.
 * - An instance is not thread-safe.
 *
 * Nothing is logged and nothing is retried; every failure is returned.
 * A failed accept() does not clean up: call close().
 */
class ContentAddressableFile {
public:
    struct AcceptResult {
        bool created = false;  ///< true only if this writer produced the destination
        Status status;
    };

    /**
     * @brief Create the parent directory and the staging file.
     * @return nullptr on failure, with status describing it
     */
    static std::unique_ptr<ContentAddressableFile> open(const std::filesystem::path& finalPath,
                                                        const WriterOptions& options,
                                                        Status& status);

    /// open() with default options (suffix "-temp", SHA-256)
    static std::unique_ptr<ContentAddressableFile> open(const std::filesystem::path& finalPath,
                                                        Status& status);

    /// Discards the staging file if neither accept() nor close() did.
    ~ContentAddressableFile();

    ContentAddressableFile(const ContentAddressableFile&) = delete;
    ContentAddressableFile& operator=(const ContentAddressableFile&) = delete;

    /**
     * @brief Append bytes to the staging file and the digest.
     * @return Bytes stored. On a failed write only the stored prefix is hashed.
     */
    size_t write(const uint8_t* data, size_t size, Status& status);
    size_t write(const std::string& data, Status& status);
    size_t write(const std::vector<uint8_t>& data, Status& status);

    /**
     * @brief Verify the digest and publish the staging file.
     *
     * - Mismatch: created=false, ContentMismatch. Destination untouched.
     * - Match, destination absent: staging renamed, created=true plus rename status.
     * - Match, destination present: staging discarded, created=false plus close status.
     *   The existing file is trusted on digest equality and not reread.
     */
    AcceptResult accept();

    /**
     * @brief Close the handle and remove the staging file.
     *
     * Also removes a staging file left behind by a failed rename in accept().
     * Idempotent: once nothing is left to remove it returns success.
     */
    Status close();

    /// True once the staging handle is released
    bool closed() const { return !m_file.isOpen(); }

    const std::string& oid() const { return m_oid; }
    const std::filesystem::path& finalPath() const { return m_finalPath; }
    const std::filesystem::path& tempPath() const { return m_tempPath; }
    const std::string& digestAlgorithm() const { return m_hasher.algorithm(); }
    uint64_t bytesWritten() const { return m_bytesWritten; }

private:
    ContentAddressableFile(std::string oid,
                           std::filesystem::path finalPath,
                           std::filesystem::path tempPath,
                           ScopedFile file,
                           HashUtils::IncrementalHash hasher);

    const std::string m_oid;
    const std::filesystem::path m_finalPath;
    const std::filesystem::path m_tempPath;
    ScopedFile m_file;
    HashUtils::IncrementalHash m_hasher;
    uint64_t m_bytesWritten = 0;
    bool m_verified = false;  ///< accept() ran the comparison; digest is spent
    bool m_stagingLeft = false;  ///< rename failed after the handle was closed
};

}  // namespace CasFile
