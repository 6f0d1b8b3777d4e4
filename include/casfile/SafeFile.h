/**
 * @file SafeFile.h
 * @brief POSIX file primitives used to stage and publish content-addressed files.
 *
 * Every call reports failure through a Status carrying the untranslated errno;
 * nothing here retries (other than EINTR) or logs.
 */

#pragma once

#include "ErrorCodes.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <sys/types.h>

namespace CasFile {

/**
 * @brief Create dir and any missing parents with the given mode (before umask).
 *
 * Succeeds if dir already exists as a directory. An empty path is the
 * current directory and always succeeds. A component that exists but is
 * not a directory fails with mkdir's own errno (EEXIST).
 */
bool createDirectories(const std::filesystem::path& dir, mode_t mode, Status& status);

/**
 * @brief Create a new file at path, failing if anything already occupies it.
 *
 * Uses O_CREAT | O_EXCL, so two processes racing on the same path get
 * exactly one winner. EEXIST is reported as ErrorKind::Conflict.
 */
bool createNewFileExclusive(const std::filesystem::path& path,
                            mode_t mode,
                            int& outFd,
                            Status& status);

/**
 * @brief Write the whole buffer, retrying EINTR and partial writes.
 * @param outWritten Bytes stored, also on failure
 */
bool writeAllFile(int fd,
                  const uint8_t* data,
                  size_t size,
                  size_t& outWritten,
                  Status& status);

/// Close fd and set it to -1. A negative fd is a no-op.
bool closeFile(int& fd, Status& status);

/// rename(2); atomic when both paths are on the same filesystem.
bool renameFile(const std::filesystem::path& fromPath,
                const std::filesystem::path& toPath,
                Status& status);

/// Remove path and, if it is a directory, everything below it. Missing is not an error.
bool removeAll(const std::filesystem::path& path, Status& status);

/**
 * @brief stat(2) the path.
 *
 * ENOENT and ENOTDIR mean "does not exist" and are not errors.
 */
bool pathExists(const std::filesystem::path& path, bool& outExists, Status& status);

// Simple RAII wrapper for a file descriptor.
// Needed to avoid double-close in move operations when used as a class member.
struct ScopedFile {
    int fd = -1;

    ScopedFile() = default;
    explicit ScopedFile(int f) : fd(f) {}

    ~ScopedFile() {
        Status ignored;
        closeFile(fd, ignored);
    }

    ScopedFile(const ScopedFile&) = delete;
    ScopedFile& operator=(const ScopedFile&) = delete;

    ScopedFile(ScopedFile&& other) noexcept : fd(other.fd) {
        other.fd = -1;
    }

    ScopedFile& operator=(ScopedFile&& other) noexcept {
        if (this != &other) {
            Status ignored;
            closeFile(fd, ignored);
            fd = other.fd;
            other.fd = -1;
        }
        return *this;
    }

    bool isOpen() const { return fd >= 0; }
};

}  // namespace CasFile
