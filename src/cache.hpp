#pragma once

#include "identifier.hpp"

#include <atomic>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace fs = std::filesystem;

// Directory of downloaded package archives named name.arch.version.goo.
// Entries are only ever placed by renaming a verified temporary file, so a
// reader never observes a partial archive.
class DownloadCache {
public:
    // Writes the archive body into the given temporary path.
    using Fetcher = std::function<void(const fs::path&)>;

    explicit DownloadCache(fs::path dir);

    const fs::path& dir() const { return dir_; }
    fs::path archive_path(const PackageId& id) const;
    // Working directory an archive is unpacked into: its path without ".goo".
    fs::path unpack_dir(const PackageId& id) const;

    // Path of the cached archive when present and hashing to checksum.
    std::optional<fs::path> lookup(const PackageId& id, const std::string& checksum) const;

    // Fetches into a temporary file, verifies it and moves it into place.
    // Throws ChecksumMismatch (temporary deleted) or whatever fetch throws.
    fs::path store(const PackageId& id, const std::string& checksum, const Fetcher& fetch);

    // Deletes path (file or directory). Missing paths are ignored.
    void remove(const fs::path& path) const;

    // True when path lies inside the cache directory.
    bool contains(const fs::path& path) const;

private:
    fs::path temp_path_for(const PackageId& id);

    fs::path dir_;
    std::atomic<unsigned> temp_counter_{0};
};
