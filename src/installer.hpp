#pragma once

#include "cache.hpp"
#include "database.hpp"
#include "downloader.hpp"
#include "environment.hpp"
#include "resolver.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

enum class TaskState {
    Planned,
    Downloading,
    Verified,
    ScriptRunning,
    Recorded,
    Deleted,
    Done,
    Failed
};

const char* task_state_name(TaskState state);

// Collaborators shared by every task of one command.
struct InstallContext {
    const Environment& env;
    StateDB& db;
    DownloadCache& cache;
    const Downloader& downloader;
};

struct InstallOptions {
    bool db_only = false;    // record state without copying files or running scripts
    bool redownload = false; // ignore a cached archive
};

// Where a package comes from: a repository offer, an installed record being
// reinstalled, or an archive on local disk.
struct PackageSource {
    PkgSpec spec;
    std::string repo;
    std::string download_url;
    std::string checksum;
    fs::path local_file;

    static PackageSource from_candidate(const Candidate& c);
    static PackageSource from_state(const PackageState& state);
    static PackageSource from_file(const fs::path& archive);
};

// Installs one package. run() prepares everything that can fail without
// side effects (download, checksum, unpack, file conflicts), then commits
// (files, install script, database). Files written by a failed commit are
// removed and overwritten files restored.
class InstallationTask {
public:
    InstallationTask(InstallContext& ctx, PackageSource source, InstallOptions options);

    void run();

    TaskState state() const { return state_; }
    ErrorKind failure() const { return failure_; }
    const std::map<std::string, std::string>& installed_files() const { return installed_files_; }

private:
    struct FileEntry {
        fs::path src;
        fs::path dst;
        bool is_dir;
    };

    void prepare();
    void download_and_verify_package();
    void extract_and_validate_package();
    void check_for_file_conflicts();

    void commit();
    void copy_package_files();
    void record_unpacked_files();
    void run_install_script();
    void clean_old_version();
    void register_package();
    void rollback_files();
    void cleanup_unpack_dir();

    InstallContext& ctx_;
    PackageSource source_;
    InstallOptions options_;
    PackageId id_;
    std::optional<PackageState> previous_;

    TaskState state_ = TaskState::Planned;
    ErrorKind failure_ = ErrorKind::Generic;
    fs::path archive_path_;
    fs::path unpack_dir_;
    int exit_code_ = 0;
    std::vector<FileEntry> entries_;
    std::map<std::string, std::string> installed_files_;
    std::vector<fs::path> written_files_;
    std::vector<std::pair<fs::path, fs::path>> backups_;
    std::set<fs::path> created_dirs_;
};

// Uninstalls one recorded package: uninstall script (when declared),
// installed files, cached archive, database record.
class RemovalTask {
public:
    RemovalTask(InstallContext& ctx, PackageState state, bool db_only);

    void run();
    TaskState state() const { return state_; }

private:
    void run_uninstall_script();
    void remove_installed_files();

    InstallContext& ctx_;
    PackageState record_;
    bool db_only_;
    TaskState state_ = TaskState::Recorded;
};

// Resolves the archive of an installed package, downloading it again when it
// is missing, fails its checksum or force is set. Throws DownloadError when
// no download URL was recorded.
fs::path ensure_archive(InstallContext& ctx, const PackageState& state, bool force = false);

// Executes plan steps in order. A failing step aborts the plan; steps
// already recorded stay recorded.
void execute_plan(InstallContext& ctx, const InstallPlan& plan, const InstallOptions& options);

// Re-runs file copy and install script for an installed package.
void reinstall_package(InstallContext& ctx, const PackageState& state, const InstallOptions& options);

// Removes name.arch and every installed package depending on it, leaves first.
void remove_with_dependents(InstallContext& ctx, const std::string& name, const std::string& arch, bool db_only);

// Installs a local .goo archive. Its dependencies must already be installed
// and nothing it replaces may be. Returns false when an equal or newer version
// is installed and reinstall is not set.
bool install_from_file(InstallContext& ctx, const fs::path& archive, const InstallOptions& options, bool reinstall);

// Runs the verify script (if any) and, unless skip_files, checks every
// installed file against its recorded sha256. Returns false on mismatch.
bool verify_package(InstallContext& ctx, const PackageState& state, bool skip_files);

// Downloads the archive of each candidate into dir, verifying checksums.
std::vector<fs::path> download_packages(const std::vector<Candidate>& candidates, const fs::path& dir,
                                        const Downloader& downloader);

// Expands a files destination: "<VAR>rest" uses environment variable VAR,
// other relative paths are rebased on "/".
fs::path resolve_destination(const std::string& dst);
