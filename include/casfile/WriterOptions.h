/**
 * @file WriterOptions.h
 * @brief Tunable settings of a content-addressed writer
 */

#pragma once

#include "config.h"
#include "ErrorCodes.h"

#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>

namespace CasFile {

/**
 * @brief Options for ContentAddressableFile::open().
 *
 * JSON form (all keys optional):
 * {
 *   "temp_suffix": "-temp",
 *   "digest_algorithm": "sha256",
 *   "dir_mode": "0755",
 *   "file_mode": "0644"
 * }
 * Modes are octal strings.
 */
struct WriterOptions {
    std::string tempSuffix = DEFAULT_TEMP_SUFFIX;
    std::string digestAlgorithm = DEFAULT_DIGEST_ALGORITHM;
    mode_t dirMode = DEFAULT_DIR_MODE;
    mode_t fileMode = DEFAULT_FILE_MODE;

    /// Checks the suffix is a usable file name fragment and the digest is known to OpenSSL
    bool validate(Status& status) const;

    nlohmann::json toJson() const;

    /// Unknown keys and fields of the wrong type are ignored; defaults are kept for them.
    static WriterOptions fromJson(const nlohmann::json& j);

    static bool loadFromFile(const std::filesystem::path& path,
                             WriterOptions& out,
                             Status& status);
};

/// "0755" -> 0755. Returns false on anything that is not 1-4 octal digits.
bool parseOctalMode(const std::string& text, mode_t& out);

std::string formatOctalMode(mode_t mode);

}  // namespace CasFile
