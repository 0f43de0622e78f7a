#pragma once

#include <stdexcept>
#include <string>

enum class ErrorKind {
    Generic,
    Usage,
    MalformedIdentifier,
    ParseError,
    RepoUnavailable,
    NoCandidate,
    UnsatisfiableDependency,
    DependencyCycle,
    ReplacementCycle,
    PackageConflict,
    NotFound,
    DownloadError,
    ChecksumMismatch,
    ScriptError,
    DBBusy,
    DBCorrupt,
    FileConflict,
    Cancelled,
    Io
};

class GoogetException : public std::runtime_error {
public:
    explicit GoogetException(const std::string& message, ErrorKind kind = ErrorKind::Generic)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

// Process exit status reported for an error kind.
int exit_code_for(ErrorKind kind);
const char* error_kind_name(ErrorKind kind);
