/**
 * @file ErrorCodes.cpp
 * @brief Status constructors for each error kind
 */

#include "casfile/ErrorCodes.h"

namespace CasFile {

Status Status::conflict(const std::string& path, int err)
{
    Status s;
    s.kind = ErrorKind::Conflict;
    s.code = ErrorCodes::STAGING_CONFLICT;
    s.sysError = std::error_code(err, std::generic_category());
    s.message = "Staging file already exists (another writer holds this OID): " + path;
    return s;
}

Status Status::alreadyClosed()
{
    Status s;
    s.kind = ErrorKind::AlreadyClosed;
    s.code = ErrorCodes::ALREADY_CLOSED;
    s.message = "Already closed.";
    return s;
}

Status Status::contentMismatch(const std::string& expectedOid, const std::string& actualOid)
{
    Status s;
    s.kind = ErrorKind::ContentMismatch;
    s.code = ErrorCodes::CONTENT_MISMATCH;
    s.expected = expectedOid;
    s.actual = actualOid;
    s.message = "Content mismatch. Expected OID " + expectedOid + ", got " + actualOid;
    return s;
}

Status Status::filesystem(const std::string& what, int err)
{
    return filesystem(what, std::error_code(err, std::generic_category()));
}

Status Status::filesystem(const std::string& what, const std::error_code& ec)
{
    Status s;
    s.kind = ErrorKind::Filesystem;
    s.code = ErrorCodes::FILESYSTEM_ERROR;
    s.sysError = ec;
    s.message = what + ": " + ec.message();
    return s;
}

Status Status::invalidArgument(const std::string& what)
{
    Status s;
    s.kind = ErrorKind::InvalidArgument;
    s.code = ErrorCodes::INVALID_ARGUMENT;
    s.message = what;
    return s;
}

Status Status::crypto(const std::string& what)
{
    Status s;
    s.kind = ErrorKind::Crypto;
    s.code = ErrorCodes::CRYPTO_ERROR;
    s.message = what;
    return s;
}

const char* errorKindName(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::None:
        return "ok";
    case ErrorKind::Conflict:
        return "conflict";
    case ErrorKind::AlreadyClosed:
        return "already-closed";
    case ErrorKind::ContentMismatch:
        return "content-mismatch";
    case ErrorKind::Filesystem:
        return "filesystem";
    case ErrorKind::InvalidArgument:
        return "invalid-argument";
    case ErrorKind::Crypto:
        return "crypto";
    }
    return "unknown";
}

}  // namespace CasFile
