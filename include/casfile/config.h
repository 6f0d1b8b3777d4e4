/**
 * @file config.h
 * @brief Configuration constants for CasFile
 *
 * This file contains the compile-time defaults used throughout CasFile:
 * staging-file naming, digest selection, filesystem modes and I/O buffer
 * sizes. Runtime overrides go through WriterOptions.
 *
 * @note The digest algorithm must match the convention used by whoever
 *       names the content-addressed files.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <sys/types.h>

/**
 * @namespace CasFile
 * @brief CasFile namespace containing all public APIs
 */
namespace CasFile {

//=========================================================================
// Staging Files
//=========================================================================

/**
 * @brief Suffix appended to the destination path to form the staging path.
 *
 * Exclusivity of the staging path is scoped to this convention: two writers
 * using different suffixes for the same destination are not kept apart.
 */
constexpr const char* DEFAULT_TEMP_SUFFIX = "-temp";

/// Mode for directories created on the way to the destination (before umask)
constexpr mode_t DEFAULT_DIR_MODE = 0755;

/// Mode for the staging file (before umask)
constexpr mode_t DEFAULT_FILE_MODE = 0644;

//=========================================================================
// Digest
//=========================================================================

/// OpenSSL digest name used when no algorithm is configured
constexpr const char* DEFAULT_DIGEST_ALGORITHM = "sha256";

//=========================================================================
// I/O
//=========================================================================

/// Read chunk size for streaming input (256 KB)
constexpr size_t BUFFER_SIZE = 262144;

/// Largest single write(2) request issued to the staging file (1 MB)
constexpr size_t MAX_WRITE_CHUNK = 1024 * 1024;

}  // namespace CasFile
