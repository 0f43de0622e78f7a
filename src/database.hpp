#pragma once

#include "pkgspec.hpp"
#include "utils.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// Record of one installed package.
struct PackageState {
    std::string source_repo;
    std::string download_url;
    std::string checksum;
    std::string local_path;   // archive in the cache, empty after clean or for local installs
    std::string unpack_dir;
    PkgSpec package_spec;
    std::map<std::string, std::string> installed_files; // absolute path -> sha256, "" for directories
    std::int64_t install_date = 0;                       // seconds since the epoch
    int install_exit_code = 0;

    std::string key() const { return package_spec.id().key(); }
    bool matches(const std::string& name, const std::string& arch) const {
        return package_spec.name == name && package_spec.arch == arch;
    }
    bool operator==(const PackageState&) const = default;
};

using GooGetState = std::vector<PackageState>;

// name.arch -> installed version.
using PackageMap = std::map<std::string, std::string>;

PackageMap installed_packages(const GooGetState& state);

std::string serialize_state(const GooGetState& state);
// Throws DBCorrupt for malformed content or duplicate name.arch keys.
GooGetState parse_state(const std::string& text, const std::string& origin);

// Single-file store of GooGetState, keyed by name.arch. Opening takes an
// exclusive lock on <path>.lock (DBBusy when another process holds it). Every
// mutation rewrites the whole file through a temporary and a rename.
class StateDB {
public:
    explicit StateDB(const fs::path& path);
    ~StateDB();
    StateDB(const StateDB&) = delete;
    StateDB& operator=(const StateDB&) = delete;

    // States whose name contains filter; all when filter is empty.
    GooGetState fetch_all(const std::string& filter = "") const;
    // Throws NotFound.
    PackageState fetch_one(const std::string& name, const std::string& arch) const;
    std::optional<PackageState> find(const std::string& name, const std::string& arch) const;

    void write(const GooGetState& states);
    void upsert(const PackageState& state);
    // Throws NotFound.
    void remove(const std::string& name, const std::string& arch);

    void close();
    bool is_open() const { return lock_ != nullptr; }
    const fs::path& path() const { return path_; }

private:
    void ensure_open() const;

    fs::path path_;
    std::unique_ptr<FileLock> lock_;
    GooGetState states_;
};
