/**
 * @file writer_options_test.cpp
 * @brief Unit tests for WriterOptions validation and JSON persistence
 */

#include "casfile/WriterOptions.h"
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace CasFile;

TEST(WriterOptionsTest, DefaultsAreValid) {
    WriterOptions opts;
    EXPECT_EQ(opts.tempSuffix, "-temp");
    EXPECT_EQ(opts.digestAlgorithm, "sha256");
    EXPECT_EQ(opts.dirMode, 0755u);
    EXPECT_EQ(opts.fileMode, 0644u);

    Status status;
    EXPECT_TRUE(opts.validate(status)) << status.message;
}

TEST(WriterOptionsTest, ValidateRejectsBadSuffixAndDigest) {
    Status status;

    WriterOptions emptySuffix;
    emptySuffix.tempSuffix = "";
    EXPECT_FALSE(emptySuffix.validate(status));
    EXPECT_EQ(status.kind, ErrorKind::InvalidArgument);

    WriterOptions slashSuffix;
    slashSuffix.tempSuffix = "/tmp";
    EXPECT_FALSE(slashSuffix.validate(status));

    WriterOptions badDigest;
    badDigest.digestAlgorithm = "md42";
    EXPECT_FALSE(badDigest.validate(status));
    EXPECT_EQ(status.code, ErrorCodes::INVALID_ARGUMENT);
}

TEST(WriterOptionsTest, JsonRoundTrip) {
    WriterOptions opts;
    opts.tempSuffix = ".staging";
    opts.digestAlgorithm = "sha512";
    opts.dirMode = 0700;
    opts.fileMode = 0600;

    const auto j = opts.toJson();
    EXPECT_EQ(j["dir_mode"], "0700");

    const WriterOptions parsed = WriterOptions::fromJson(j);
    EXPECT_EQ(parsed.tempSuffix, ".staging");
    EXPECT_EQ(parsed.digestAlgorithm, "sha512");
    EXPECT_EQ(parsed.dirMode, 0700u);
    EXPECT_EQ(parsed.fileMode, 0600u);
}

TEST(WriterOptionsTest, FromJsonKeepsDefaultsForInvalidFields) {
    nlohmann::json j = nlohmann::json::object();
    j["temp_suffix"] = 12;
    j["dir_mode"] = "0999";
    j["file_mode"] = "0640";
    j["unrelated"] = true;

    const WriterOptions parsed = WriterOptions::fromJson(j);
    EXPECT_EQ(parsed.tempSuffix, DEFAULT_TEMP_SUFFIX);
    EXPECT_EQ(parsed.digestAlgorithm, DEFAULT_DIGEST_ALGORITHM);
    EXPECT_EQ(parsed.dirMode, DEFAULT_DIR_MODE);
    EXPECT_EQ(parsed.fileMode, 0640u);

    const WriterOptions fromArray = WriterOptions::fromJson(nlohmann::json::array());
    EXPECT_EQ(fromArray.tempSuffix, DEFAULT_TEMP_SUFFIX);
}

TEST(WriterOptionsTest, ParseOctalMode) {
    mode_t mode = 0;
    EXPECT_TRUE(parseOctalMode("755", mode));
    EXPECT_EQ(mode, 0755u);
    EXPECT_TRUE(parseOctalMode("0600", mode));
    EXPECT_EQ(mode, 0600u);
    EXPECT_FALSE(parseOctalMode("", mode));
    EXPECT_FALSE(parseOctalMode("8", mode));
    EXPECT_FALSE(parseOctalMode("07550", mode));
    EXPECT_EQ(formatOctalMode(0644), "0644");
}

TEST(WriterOptionsTest, LoadFromFile) {
    const auto dir = std::filesystem::temp_directory_path() /
                     ("casfile_options_" + std::to_string(::getpid()));
    std::filesystem::create_directories(dir);

    {
        std::ofstream out(dir / "good.json");
        out << R"({"temp_suffix": ".tmp", "digest_algorithm": "sha1"})";
    }
    {
        std::ofstream out(dir / "broken.json");
        out << "{ not json";
    }
    {
        std::ofstream out(dir / "unknown_digest.json");
        out << R"({"digest_algorithm": "nope"})";
    }

    Status status;
    WriterOptions opts;
    ASSERT_TRUE(WriterOptions::loadFromFile(dir / "good.json", opts, status)) << status.message;
    EXPECT_EQ(opts.tempSuffix, ".tmp");
    EXPECT_EQ(opts.digestAlgorithm, "sha1");

    EXPECT_FALSE(WriterOptions::loadFromFile(dir / "broken.json", opts, status));
    EXPECT_EQ(status.kind, ErrorKind::InvalidArgument);

    EXPECT_FALSE(WriterOptions::loadFromFile(dir / "unknown_digest.json", opts, status));
    EXPECT_FALSE(WriterOptions::loadFromFile(dir / "missing.json", opts, status));

    std::filesystem::remove_all(dir);
}
