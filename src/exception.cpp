#include "exception.hpp"

int exit_code_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Usage:
            return 2;
        case ErrorKind::DBBusy:
            return 3;
        case ErrorKind::DBCorrupt:
            return 4;
        case ErrorKind::MalformedIdentifier:
        case ErrorKind::ParseError:
        case ErrorKind::NoCandidate:
        case ErrorKind::UnsatisfiableDependency:
        case ErrorKind::DependencyCycle:
        case ErrorKind::ReplacementCycle:
        case ErrorKind::PackageConflict:
            return 5;
        case ErrorKind::RepoUnavailable:
        case ErrorKind::DownloadError:
        case ErrorKind::ChecksumMismatch:
            return 6;
        case ErrorKind::ScriptError:
        case ErrorKind::Cancelled:
            return 7;
        case ErrorKind::FileConflict:
            return 8;
        case ErrorKind::Generic:
        case ErrorKind::NotFound:
        case ErrorKind::Io:
        default:
            return 1;
    }
}

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Generic: return "Generic";
        case ErrorKind::Usage: return "Usage";
        case ErrorKind::MalformedIdentifier: return "MalformedIdentifier";
        case ErrorKind::ParseError: return "ParseError";
        case ErrorKind::RepoUnavailable: return "RepoUnavailable";
        case ErrorKind::NoCandidate: return "NoCandidate";
        case ErrorKind::UnsatisfiableDependency: return "UnsatisfiableDependency";
        case ErrorKind::DependencyCycle: return "DependencyCycle";
        case ErrorKind::ReplacementCycle: return "ReplacementCycle";
        case ErrorKind::PackageConflict: return "PackageConflict";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::DownloadError: return "DownloadError";
        case ErrorKind::ChecksumMismatch: return "ChecksumMismatch";
        case ErrorKind::ScriptError: return "ScriptError";
        case ErrorKind::DBBusy: return "DBBusy";
        case ErrorKind::DBCorrupt: return "DBCorrupt";
        case ErrorKind::FileConflict: return "FileConflict";
        case ErrorKind::Cancelled: return "Cancelled";
        case ErrorKind::Io: return "Io";
    }
    return "Unknown";
}
