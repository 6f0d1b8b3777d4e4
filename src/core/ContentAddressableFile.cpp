/**
 * @file ContentAddressableFile.cpp
 * @brief Staging, verification and publication of content-addressed files
 */

#include "casfile/ContentAddressableFile.h"

#include "casfile/AtomicFile.h"

#include <utility>

namespace CasFile {

//=============================================================================
// Construction
//=============================================================================

std::unique_ptr<ContentAddressableFile> ContentAddressableFile::open(
    const std::filesystem::path& finalPath,
    Status& status)
{
    return open(finalPath, WriterOptions{}, status);
}

std::unique_ptr<ContentAddressableFile> ContentAddressableFile::open(
    const std::filesystem::path& finalPath,
    const WriterOptions& options,
    Status& status)
{
    status.clear();

    if (!options.validate(status)) {
        return nullptr;
    }

    const AtomicFilePaths paths = computeAtomicFilePaths(finalPath, options.tempSuffix);
    if (paths.oid.empty() || paths.oid == "." || paths.oid == "..") {
        status = Status::invalidArgument("Destination has no file name: " + finalPath.string());
        return nullptr;
    }

    if (!createDirectories(finalPath.parent_path(), options.dirMode, status)) {
        return nullptr;
    }

    // Seed the digest before touching the staging path so a crypto failure leaves nothing behind
    HashUtils::IncrementalHash hasher(options.digestAlgorithm);
    if (!hasher.isValid()) {
        status = Status::crypto("Failed to initialize " + options.digestAlgorithm + " context");
        return nullptr;
    }

    int fd = -1;
    if (!createNewFileExclusive(paths.tempPath, options.fileMode, fd, status)) {
        return nullptr;
    }

    return std::unique_ptr<ContentAddressableFile>(new ContentAddressableFile(
        paths.oid, paths.finalPath, paths.tempPath, ScopedFile(fd), std::move(hasher)));
}

ContentAddressableFile::ContentAddressableFile(std::string oid,
                                               std::filesystem::path finalPath,
                                               std::filesystem::path tempPath,
                                               ScopedFile file,
                                               HashUtils::IncrementalHash hasher)
    : m_oid(std::move(oid))
    , m_finalPath(std::move(finalPath))
    , m_tempPath(std::move(tempPath))
    , m_file(std::move(file))
    , m_hasher(std::move(hasher))
{
}

ContentAddressableFile::~ContentAddressableFile()
{
    if (!closed() || m_stagingLeft) {
        // Best effort: a destructor has no caller to report to
        const Status ignored = close();
        (void)ignored;
    }
}

//=============================================================================
// Writing
//=============================================================================

size_t ContentAddressableFile::write(const uint8_t* data, size_t size, Status& status)
{
    status.clear();
    if (closed() || m_verified) {
        status = Status::alreadyClosed();
        return 0;
    }

    size_t written = 0;
    const bool ok = writeAllFile(m_file.fd, data, size, written, status);

    // Hash exactly what reached the file, even if the write stopped short
    if (!m_hasher.update(data, written) && ok) {
        status = Status::crypto("Failed to update " + m_hasher.algorithm() + " digest");
    }
    m_bytesWritten += written;
    return written;
}

size_t ContentAddressableFile::write(const std::string& data, Status& status)
{
    return write(reinterpret_cast<const uint8_t*>(data.data()), data.size(), status);
}

size_t ContentAddressableFile::write(const std::vector<uint8_t>& data, Status& status)
{
    return write(data.data(), data.size(), status);
}

//=============================================================================
// Verification and publication
//=============================================================================

ContentAddressableFile::AcceptResult ContentAddressableFile::accept()
{
    AcceptResult result;
    if (closed() || m_verified) {
        result.status = Status::alreadyClosed();
        return result;
    }

    m_verified = true;
    const std::string actual = m_hasher.finalizeHex();
    if (actual.empty()) {
        result.status = Status::crypto("Failed to finalize " + m_hasher.algorithm() + " digest");
        return result;
    }

    if (actual != m_oid) {
        result.status = Status::contentMismatch(m_oid, actual);
        return result;
    }

    // A failing stat counts as "absent": the rename below then reports the real error
    bool destinationExists = false;
    Status statStatus;
    if (!pathExists(m_finalPath, destinationExists, statStatus)) {
        destinationExists = false;
    }

    if (destinationExists) {
        // Same digest, so the existing file is taken to hold the same bytes
        result.status = close();
        return result;
    }

    if (!closeFile(m_file.fd, result.status)) {
        // The staging data may be incomplete; never publish it
        Status removeStatus;
        if (!removeAll(m_tempPath, removeStatus)) {
            result.status.message += "; " + removeStatus.message;
        }
        return result;
    }

    result.created = true;
    if (!renameFile(m_tempPath, m_finalPath, result.status)) {
        m_stagingLeft = true;  // handle is gone, close() still owes the removal
    }
    return result;
}

//=============================================================================
// Release
//=============================================================================

Status ContentAddressableFile::close()
{
    Status status;
    if (closed()) {
        if (m_stagingLeft && removeAll(m_tempPath, status)) {
            m_stagingLeft = false;
        }
        return status;
    }

    Status closeStatus;
    closeFile(m_file.fd, closeStatus);

    if (!removeAll(m_tempPath, status)) {
        return status;
    }
    return closeStatus;
}

}  // namespace CasFile
