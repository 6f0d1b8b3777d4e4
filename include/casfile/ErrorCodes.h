/**
 * @file ErrorCodes.h
 * @brief Stable error codes and the Status value returned by CasFile calls.
 *
 * These codes are intended to be:
 * - Stable across versions (avoid renaming once shipped)
 * - Short and searchable
 * - Presented alongside a human-readable message
 */

#pragma once

#include <string>
#include <system_error>

namespace CasFile {
namespace ErrorCodes {

// Content-addressed writer
inline constexpr const char* STAGING_CONFLICT = "CAS-FILE-1001";
inline constexpr const char* ALREADY_CLOSED = "CAS-FILE-1002";
inline constexpr const char* CONTENT_MISMATCH = "CAS-FILE-1003";
inline constexpr const char* FILESYSTEM_ERROR = "CAS-FILE-1004";
inline constexpr const char* INVALID_ARGUMENT = "CAS-FILE-1005";
inline constexpr const char* CRYPTO_ERROR = "CAS-FILE-1006";

}  // namespace ErrorCodes

enum class ErrorKind {
    None,
    Conflict,         ///< Staging path already occupied
    AlreadyClosed,    ///< Writer is past its terminal state
    ContentMismatch,  ///< Digest differs from the expected OID
    Filesystem,       ///< Raw OS error, see sysError
    InvalidArgument,
    Crypto
};

/**
 * @brief Outcome of a fallible call.
 *
 * Filesystem failures keep the untranslated errno in sysError. A content
 * mismatch carries both identifiers in expected/actual.
 */
struct Status {
    ErrorKind kind = ErrorKind::None;
    std::string code;
    std::string message;
    std::error_code sysError;
    std::string expected;
    std::string actual;

    bool ok() const { return kind == ErrorKind::None; }

    void clear() { *this = Status{}; }

    static Status conflict(const std::string& path, int err);
    static Status alreadyClosed();
    static Status contentMismatch(const std::string& expectedOid, const std::string& actualOid);
    static Status filesystem(const std::string& what, int err);
    static Status filesystem(const std::string& what, const std::error_code& ec);
    static Status invalidArgument(const std::string& what);
    static Status crypto(const std::string& what);
};

/// Human-readable name of an ErrorKind ("conflict", "content-mismatch", ...)
const char* errorKindName(ErrorKind kind);

}  // namespace CasFile
