/**
 * @file AtomicFile.h
 * @brief Path helpers for atomic content-addressed writes (write temp, then rename).
 */

#pragma once

#include "config.h"

#include <filesystem>
#include <string>

namespace CasFile {

struct AtomicFilePaths {
    std::filesystem::path finalPath;
    std::filesystem::path tempPath;
    std::string oid;  ///< Base name of finalPath, the digest the content must have
};

/**
 * @brief Compute the staging path next to finalPath and the expected OID.
 *
 * The temp path is finalPath with suffix appended (not a new extension), so it
 * is derived deterministically and two writers for the same OID collide on it.
 */
AtomicFilePaths computeAtomicFilePaths(const std::filesystem::path& finalPath,
                                       const std::string& suffix = DEFAULT_TEMP_SUFFIX);

}  // namespace CasFile
