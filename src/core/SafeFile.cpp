#include "casfile/SafeFile.h"

#include "casfile/config.h"

#include <algorithm>
#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace CasFile {
namespace {

bool isDirectory(const std::filesystem::path& path) {
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

}  // namespace

bool createDirectories(const std::filesystem::path& dir, mode_t mode, Status& status) {
    status.clear();
    if (dir.empty() || isDirectory(dir)) {
        return true;
    }

    std::filesystem::path current;
    for (const auto& part : dir) {
        current /= part;
        if (::mkdir(current.c_str(), mode) == 0) {
            continue;
        }
        const int err = errno;
        // Existing components (including "/" and "..") are fine as long as they are directories
        if (isDirectory(current)) {
            continue;
        }
        status = Status::filesystem("mkdir " + current.string(), err);
        return false;
    }
    return true;
}

bool createNewFileExclusive(const std::filesystem::path& path,
                            mode_t mode,
                            int& outFd,
                            Status& status) {
    status.clear();
    outFd = -1;

    int fd = -1;
    do {
        fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, mode);
    } while (fd < 0 && errno == EINTR);

    if (fd < 0) {
        const int err = errno;
        if (err == EEXIST) {
            status = Status::conflict(path.string(), err);
        } else {
            status = Status::filesystem("open " + path.string(), err);
        }
        return false;
    }

    outFd = fd;
    return true;
}

bool writeAllFile(int fd,
                  const uint8_t* data,
                  size_t size,
                  size_t& outWritten,
                  Status& status) {
    status.clear();
    outWritten = 0;
    if (fd < 0) {
        status = Status::filesystem("write", EBADF);
        return false;
    }
    if (!data || size == 0) return true;

    while (outWritten < size) {
        const size_t chunk = std::min<size_t>(size - outWritten, MAX_WRITE_CHUNK);
        const ssize_t n = ::write(fd, data + outWritten, chunk);
        if (n < 0) {
            const int err = errno;
            if (err == EINTR) {
                continue;
            }
            status = Status::filesystem("write", err);
            return false;
        }
        if (n == 0) {
            status = Status::filesystem("write returned 0 bytes", EIO);
            return false;
        }
        outWritten += static_cast<size_t>(n);
    }
    return true;
}

bool closeFile(int& fd, Status& status) {
    status.clear();
    if (fd < 0) return true;

    // close(2) must not be retried on EINTR; the descriptor is gone either way
    const int rc = ::close(fd);
    fd = -1;
    if (rc != 0) {
        const int err = errno;
        if (err != EINTR) {
            status = Status::filesystem("close", err);
            return false;
        }
    }
    return true;
}

bool renameFile(const std::filesystem::path& fromPath,
                const std::filesystem::path& toPath,
                Status& status) {
    status.clear();
    if (::rename(fromPath.c_str(), toPath.c_str()) != 0) {
        status = Status::filesystem("rename " + fromPath.string() + " -> " + toPath.string(), errno);
        return false;
    }
    return true;
}

bool removeAll(const std::filesystem::path& path, Status& status) {
    status.clear();
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    if (ec) {
        status = Status::filesystem("remove " + path.string(), ec);
        return false;
    }
    return true;
}

bool pathExists(const std::filesystem::path& path, bool& outExists, Status& status) {
    status.clear();
    outExists = false;

    struct stat st{};
    if (::stat(path.c_str(), &st) == 0) {
        outExists = true;
        return true;
    }

    const int err = errno;
    if (err == ENOENT || err == ENOTDIR) {
        return true;
    }
    status = Status::filesystem("stat " + path.string(), err);
    return false;
}

}  // namespace CasFile
