/**
 * @file AtomicFile.cpp
 * @brief Atomic file path helpers implementation.
 */

#include "casfile/AtomicFile.h"

namespace CasFile {

AtomicFilePaths computeAtomicFilePaths(const std::filesystem::path& finalPath,
                                       const std::string& suffix)
{
    AtomicFilePaths out;
    out.finalPath = finalPath;
    out.tempPath = finalPath;
    out.tempPath += suffix;
    out.oid = finalPath.filename().string();
    return out;
}

}  // namespace CasFile
