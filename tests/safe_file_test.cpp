#include <gtest/gtest.h>

#include "casfile/SafeFile.h"

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

using namespace CasFile;
namespace fs = std::filesystem;

namespace {

fs::path makeRoot(const std::string& name) {
    const auto root = fs::temp_directory_path() /
                      ("casfile_safe_file_" + std::to_string(::getpid()) + "_" + name);
    std::error_code ec;
    fs::remove_all(root, ec);
    fs::create_directories(root);
    return root;
}

}  // namespace

TEST(SafeFileTest, CreateDirectoriesBuildsNestedPathWithMode)
{
    const auto root = makeRoot("mkdir");
    const auto nested = root / "a" / "b" / "c";

    const mode_t oldMask = ::umask(022);
    Status status;
    EXPECT_TRUE(createDirectories(nested, 0750, status)) << status.message;
    ::umask(oldMask);

    EXPECT_TRUE(fs::is_directory(nested));
    struct stat st{};
    ASSERT_EQ(::stat(nested.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0750u);

    // Existing directories and the empty path are fine
    EXPECT_TRUE(createDirectories(nested, 0750, status));
    EXPECT_TRUE(createDirectories(fs::path(), 0750, status));

    fs::remove_all(root);
}

TEST(SafeFileTest, CreateDirectoriesReportsMkdirErrno)
{
    const auto root = makeRoot("mkdir_errno");
    { std::ofstream f(root / "file"); }

    Status status;
    EXPECT_FALSE(createDirectories(root / "file", 0755, status));
    EXPECT_EQ(status.kind, ErrorKind::Filesystem);
    EXPECT_EQ(status.sysError.value(), EEXIST);

    EXPECT_FALSE(createDirectories(root / "file" / "below", 0755, status));
    EXPECT_EQ(status.sysError.value(), EEXIST);  // reported for the blocking component

    fs::remove_all(root);
}

TEST(SafeFileTest, CreateNewFileExclusiveFailsWhenPresent)
{
    const auto root = makeRoot("excl");
    const auto path = root / "staging";

    Status status;
    int fd = -1;
    ASSERT_TRUE(createNewFileExclusive(path, 0644, fd, status)) << status.message;
    ScopedFile guard(fd);
    EXPECT_TRUE(guard.isOpen());

    int second = -1;
    EXPECT_FALSE(createNewFileExclusive(path, 0644, second, status));
    EXPECT_EQ(second, -1);
    EXPECT_EQ(status.kind, ErrorKind::Conflict);
    EXPECT_EQ(status.sysError.value(), EEXIST);

    int missingDir = -1;
    EXPECT_FALSE(createNewFileExclusive(root / "missing" / "f", 0644, missingDir, status));
    EXPECT_EQ(status.kind, ErrorKind::Filesystem);
    EXPECT_EQ(status.sysError.value(), ENOENT);

    fs::remove_all(root);
}

TEST(SafeFileTest, WriteAllThenRename)
{
    const auto root = makeRoot("write");
    const auto temp = root / "final.bin-temp";
    const auto finalPath = root / "final.bin";

    Status status;
    int fd = -1;
    ASSERT_TRUE(createNewFileExclusive(temp, 0644, fd, status));

    const std::string payload = "hello";
    size_t written = 0;
    ASSERT_TRUE(writeAllFile(fd, reinterpret_cast<const uint8_t*>(payload.data()), payload.size(),
                             written, status)) << status.message;
    EXPECT_EQ(written, payload.size());

    ASSERT_TRUE(closeFile(fd, status));
    EXPECT_EQ(fd, -1);
    EXPECT_TRUE(closeFile(fd, status));  // no-op once closed

    ASSERT_TRUE(renameFile(temp, finalPath, status)) << status.message;
    EXPECT_FALSE(fs::exists(temp));

    std::ifstream in(finalPath, std::ios::binary);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "hello");

    fs::remove_all(root);
}

TEST(SafeFileTest, WriteToClosedDescriptorFails)
{
    Status status;
    size_t written = 42;
    const uint8_t byte = 1;
    EXPECT_FALSE(writeAllFile(-1, &byte, 1, written, status));
    EXPECT_EQ(written, 0u);
    EXPECT_EQ(status.sysError.value(), EBADF);
}

TEST(SafeFileTest, PathExistsDistinguishesMissingFromPresent)
{
    const auto root = makeRoot("exists");
    { std::ofstream f(root / "present"); }

    Status status;
    bool exists = false;
    ASSERT_TRUE(pathExists(root / "present", exists, status));
    EXPECT_TRUE(exists);

    ASSERT_TRUE(pathExists(root / "absent", exists, status));
    EXPECT_FALSE(exists);

    // A file used as a directory is "absent", not an error
    ASSERT_TRUE(pathExists(root / "present" / "child", exists, status));
    EXPECT_FALSE(exists);

    fs::remove_all(root);
}

TEST(SafeFileTest, RemoveAllHandlesFilesDirectoriesAndMissing)
{
    const auto root = makeRoot("remove");
    fs::create_directories(root / "dir" / "sub");
    { std::ofstream f(root / "dir" / "sub" / "x"); }
    { std::ofstream f(root / "file"); }

    Status status;
    EXPECT_TRUE(removeAll(root / "dir", status)) << status.message;
    EXPECT_FALSE(fs::exists(root / "dir"));
    EXPECT_TRUE(removeAll(root / "file", status));
    EXPECT_FALSE(fs::exists(root / "file"));
    EXPECT_TRUE(removeAll(root / "never-existed", status));

    fs::remove_all(root);
}

TEST(SafeFileTest, ScopedFileMoveTransfersOwnership)
{
    const auto root = makeRoot("scoped");
    Status status;
    int fd = -1;
    ASSERT_TRUE(createNewFileExclusive(root / "f", 0644, fd, status));

    ScopedFile a(fd);
    ScopedFile b(std::move(a));
    EXPECT_FALSE(a.isOpen());
    EXPECT_TRUE(b.isOpen());
    EXPECT_EQ(b.fd, fd);

    fs::remove_all(root);
}
