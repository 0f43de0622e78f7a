#include "installer.hpp"

#include "archive.hpp"
#include "exception.hpp"
#include "hash.hpp"
#include "localization.hpp"
#include "script.hpp"
#include "utils.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <ranges>

namespace {

// Internal helper: parent directories of path that do not exist yet, outermost first.
std::vector<fs::path> missing_parents(const fs::path& path) {
    std::vector<fs::path> to_create;
    fs::path parent = path.parent_path();
    while (!parent.empty() && parent != parent.root_path() && !fs::exists(parent)) {
        to_create.push_back(parent);
        parent = parent.parent_path();
    }
    std::ranges::reverse(to_create);
    return to_create;
}

void remove_quietly(const fs::path& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        log_warning(string_format("warning.remove_failed", path.string(), ec.message()));
    }
}

// Deletes recorded files, then recorded directories deepest first. Failures
// are logged and skipped.
void delete_recorded_files(const std::map<std::string, std::string>& files,
                           const std::map<std::string, std::string>& keep = {}) {
    std::vector<std::string> dirs;
    for (const auto& [file, sha] : files) {
        if (keep.contains(file)) continue;
        if (sha.empty()) {
            dirs.push_back(file);
            continue;
        }
        log_debug(string_format("info.removing_file", file));
        std::error_code ec;
        fs::remove(file, ec);
        if (ec) {
            log_error(string_format("error.remove_failed", file, ec.message()));
        }
    }
    std::ranges::sort(dirs, std::greater<>{});
    for (const auto& dir : dirs) {
        std::error_code ec;
        if (fs::is_directory(dir) && fs::is_empty(dir, ec)) {
            fs::remove(dir, ec);
        }
        if (ec) {
            log_debug(string_format("info.dir_not_removed", dir, ec.message()));
        }
    }
}

ScriptEnv script_env(const Environment& env, const fs::path& unpack_dir, const PkgSpec& spec) {
    return {
        {"GOOGET_UNPACK_DIR", unpack_dir.string()},
        {"GOOGET_ROOT", env.root.string()},
        {"GOOGET_PACKAGE", spec.to_string()},
    };
}

fs::path unpack_archive(InstallContext& ctx, const PackageId& id, const fs::path& archive) {
    const fs::path dir = ctx.cache.unpack_dir(id);
    remove_quietly(dir);
    extract_package(archive, dir);
    return dir;
}

} // anonymous namespace

const char* task_state_name(TaskState state) {
    switch (state) {
        case TaskState::Planned: return "Planned";
        case TaskState::Downloading: return "Downloading";
        case TaskState::Verified: return "Verified";
        case TaskState::ScriptRunning: return "ScriptRunning";
        case TaskState::Recorded: return "Recorded";
        case TaskState::Deleted: return "Deleted";
        case TaskState::Done: return "Done";
        case TaskState::Failed: return "Failed";
    }
    return "Unknown";
}

fs::path resolve_destination(const std::string& dst) {
    const fs::path p(dst);
    if (p.is_absolute()) {
        return p;
    }
    if (dst.starts_with("<")) {
        if (const size_t close = dst.rfind('>'); close != std::string::npos) {
            const std::string var = dst.substr(1, close - 1);
            const char* value = std::getenv(var.c_str());
            return fs::path(std::string(value ? value : "") + dst.substr(close + 1));
        }
    }
    return fs::path("/") / p;
}

PackageSource PackageSource::from_candidate(const Candidate& c) {
    return PackageSource{
        .spec = c.spec(),
        .repo = c.repo,
        .download_url = download_url_for(c.repo, c.repo_spec.source),
        .checksum = c.repo_spec.checksum,
        .local_file = {},
    };
}

PackageSource PackageSource::from_state(const PackageState& state) {
    return PackageSource{
        .spec = state.package_spec,
        .repo = state.source_repo,
        .download_url = state.download_url,
        .checksum = state.checksum,
        .local_file = {},
    };
}

PackageSource PackageSource::from_file(const fs::path& archive) {
    return PackageSource{
        .spec = read_pkgspec_from_archive(archive),
        .repo = {},
        .download_url = {},
        .checksum = {},
        .local_file = archive,
    };
}

// ---------------------------------------------------------------------------
// InstallationTask

InstallationTask::InstallationTask(InstallContext& ctx, PackageSource source, InstallOptions options)
    : ctx_(ctx), source_(std::move(source)), options_(options), id_(source_.spec.id()) {}

void InstallationTask::run() {
    previous_ = ctx_.db.find(id_.name, id_.arch);
    log_info(string_format("info.installing_package", id_.to_string()));

    try {
        prepare();
        commit();
    } catch (const std::exception& e) {
        const auto* ge = dynamic_cast<const GoogetException*>(&e);
        failure_ = ge ? ge->kind() : ErrorKind::Io;
        if (state_ != TaskState::Recorded) {
            rollback_files();
        }
        state_ = TaskState::Failed;
        cleanup_unpack_dir();
        throw;
    }

    for (const auto& backup : backups_ | std::views::values) {
        std::error_code ec;
        fs::remove(backup, ec);
    }
    backups_.clear();
    cleanup_unpack_dir();
    state_ = TaskState::Done;
    log_info(string_format("info.package_installed_successfully", id_.to_string()));
}

void InstallationTask::prepare() {
    download_and_verify_package();
    extract_and_validate_package();
    check_for_file_conflicts();
}

void InstallationTask::download_and_verify_package() {
    if (!source_.local_file.empty()) {
        if (!fs::exists(source_.local_file)) {
            throw GoogetException(string_format("error.local_pkg_not_found", source_.local_file.string()), ErrorKind::NotFound);
        }
        archive_path_ = ctx_.cache.archive_path(id_);
        if (fs::weakly_canonical(source_.local_file) != fs::weakly_canonical(archive_path_)) {
            archive_path_ = ctx_.cache.store(id_, source_.checksum, [&](const fs::path& tmp) {
                fs::copy_file(source_.local_file, tmp, fs::copy_options::overwrite_existing);
            });
        }
        state_ = TaskState::Verified;
        return;
    }

    if (!options_.redownload) {
        if (auto hit = ctx_.cache.lookup(id_, source_.checksum)) {
            log_debug(string_format("info.cache_hit", hit->string()));
            archive_path_ = *hit;
            state_ = TaskState::Verified;
            return;
        }
    }

    if (source_.download_url.empty()) {
        throw GoogetException(string_format("error.cannot_redownload", id_.to_string()), ErrorKind::DownloadError);
    }
    state_ = TaskState::Downloading;
    archive_path_ = ctx_.cache.store(id_, source_.checksum, [&](const fs::path& tmp) {
        ctx_.downloader.download_with_retries(source_.download_url, tmp);
    });
    state_ = TaskState::Verified;
}

void InstallationTask::extract_and_validate_package() {
    unpack_dir_ = unpack_archive(ctx_, id_, archive_path_);
    log_debug(string_format("info.extracting_to", unpack_dir_.string()));

    entries_.clear();
    for (const auto& [src, dst] : source_.spec.files) {
        const fs::path src_path = validate_path(src, unpack_dir_);
        if (!fs::exists(src_path)) {
            throw GoogetException(string_format("error.package_file_missing", id_.to_string(), src), ErrorKind::ParseError);
        }
        const fs::path dst_root = resolve_destination(dst);
        if (!fs::is_directory(src_path)) {
            entries_.push_back({src_path, dst_root, false});
            continue;
        }
        entries_.push_back({src_path, dst_root, true});
        std::vector<FileEntry> nested;
        for (const auto& dirent : fs::recursive_directory_iterator(src_path)) {
            nested.push_back({dirent.path(), dst_root / dirent.path().lexically_relative(src_path), dirent.is_directory()});
        }
        std::ranges::sort(nested, [](const FileEntry& a, const FileEntry& b) { return a.dst < b.dst; });
        entries_.insert(entries_.end(), nested.begin(), nested.end());
    }
}

void InstallationTask::check_for_file_conflicts() {
    std::map<std::string, std::string> owners;
    for (const auto& s : ctx_.db.fetch_all()) {
        if (s.key() == id_.key()) continue;
        for (const auto& [path, sha] : s.installed_files) {
            if (!sha.empty()) owners[path] = s.package_spec.to_string();
        }
    }

    std::map<std::string, std::string> conflicts;
    for (const auto& e : entries_) {
        if (e.is_dir) continue;
        if (auto it = owners.find(e.dst.string()); it != owners.end()) {
            conflicts[it->first] = it->second;
        }
    }

    if (!conflicts.empty()) {
        std::string msg = string_format("error.file_conflict_header", id_.to_string()) + "\n";
        for (const auto& [file, owner] : conflicts)
            msg += "  " + string_format("error.file_conflict_entry", file, owner) + "\n";
        throw GoogetException(msg + get_string("error.installation_aborted"), ErrorKind::FileConflict);
    }
}

void InstallationTask::commit() {
    if (options_.db_only) {
        record_unpacked_files();
    } else {
        copy_package_files();
        run_install_script();
    }
    clean_old_version();
    register_package();
}

void InstallationTask::copy_package_files() {
    log_debug(get_string("info.copying_files"));
    for (const auto& e : entries_) {
        for (const auto& d : missing_parents(e.dst)) {
            ensure_dir_exists(d);
            created_dirs_.insert(d);
        }

        if (e.is_dir) {
            if (!fs::exists(e.dst)) {
                ensure_dir_exists(e.dst);
                created_dirs_.insert(e.dst);
            }
            // Directories are recorded with an empty hash.
            installed_files_[e.dst.string()] = "";
            continue;
        }

        try {
            if (fs::exists(e.dst) || fs::is_symlink(e.dst)) {
                if (fs::is_directory(e.dst)) {
                    throw GoogetException(string_format("error.dst_is_directory", e.dst.string()), ErrorKind::Io);
                }
                fs::path bak = e.dst;
                bak += ".googet_bak";
                fs::rename(e.dst, bak);
                backups_.emplace_back(e.dst, bak);
            }
            fs::copy_file(e.src, e.dst, fs::copy_options::overwrite_existing);
            written_files_.push_back(e.dst);
            installed_files_[e.dst.string()] = calculate_sha256(e.dst);
        } catch (const fs::filesystem_error& ex) {
            throw GoogetException(string_format("error.copy_failed_rollback", e.src.string(), e.dst.string(), ex.what()), ErrorKind::Io);
        }
    }
}

void InstallationTask::record_unpacked_files() {
    for (const auto& e : entries_) {
        installed_files_[e.dst.string()] = e.is_dir ? "" : calculate_sha256(e.src);
    }
}

void InstallationTask::run_install_script() {
    const ExecFile& script = source_.spec.install;
    if (script.empty()) return;

    state_ = TaskState::ScriptRunning;
    ScriptEnv env = script_env(ctx_.env, unpack_dir_, source_.spec);
    if (previous_) {
        env["GOOGET_PREVIOUS_VERSION"] = previous_->package_spec.version.str();
    }
    exit_code_ = run_exec_file(unpack_dir_, script, "googet_install.log", env);
}

void InstallationTask::clean_old_version() {
    if (!previous_) return;
    if (!options_.db_only) {
        delete_recorded_files(previous_->installed_files, installed_files_);
    }
    if (!previous_->local_path.empty() && fs::path(previous_->local_path) != archive_path_) {
        remove_quietly(previous_->local_path);
    }
}

void InstallationTask::register_package() {
    PackageState record;
    record.source_repo = source_.repo;
    record.download_url = source_.download_url;
    record.checksum = source_.checksum;
    record.local_path = archive_path_.string();
    record.package_spec = source_.spec;
    record.installed_files = installed_files_;
    record.install_date = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    record.install_exit_code = exit_code_;

    ctx_.db.upsert(record);
    state_ = TaskState::Recorded;
}

void InstallationTask::rollback_files() {
    if (written_files_.empty() && backups_.empty() && created_dirs_.empty()) return;
    log_error(string_format("error.rollback_install", id_.to_string()));
    for (const auto& file : written_files_) {
        std::error_code ec;
        fs::remove(file, ec);
    }
    for (const auto& [physical, backup] : backups_) {
        std::error_code ec;
        fs::rename(backup, physical, ec);
        if (ec) {
            log_error(string_format("error.restore_failed", physical.string(), ec.message()));
        }
    }
    backups_.clear();

    // Clean up empty dirs in reverse
    for (const auto& dir : created_dirs_ | std::views::reverse) {
        std::error_code ec;
        if (fs::is_directory(dir, ec) && fs::is_empty(dir, ec)) {
            fs::remove(dir, ec);
        }
    }
}

void InstallationTask::cleanup_unpack_dir() {
    if (!unpack_dir_.empty()) {
        remove_quietly(unpack_dir_);
    }
}

// ---------------------------------------------------------------------------
// RemovalTask

RemovalTask::RemovalTask(InstallContext& ctx, PackageState state, bool db_only)
    : ctx_(ctx), record_(std::move(state)), db_only_(db_only) {}

void RemovalTask::run() {
    const PkgSpec& spec = record_.package_spec;
    log_info(string_format("info.removing_package", spec.to_string()));

    try {
        if (!db_only_) {
            run_uninstall_script();
            remove_installed_files();
            if (!record_.local_path.empty()) {
                remove_quietly(record_.local_path);
            }
        }
        ctx_.db.remove(spec.name, spec.arch);
        state_ = TaskState::Deleted;
    } catch (const std::exception&) {
        state_ = TaskState::Failed;
        throw;
    }
    state_ = TaskState::Done;
    log_info(string_format("info.package_removed", spec.to_string()));
}

void RemovalTask::run_uninstall_script() {
    const PkgSpec& spec = record_.package_spec;
    if (spec.uninstall.empty()) return;

    const fs::path archive = ensure_archive(ctx_, record_);
    if (record_.local_path.empty()) {
        record_.local_path = archive.string();
    }
    const fs::path dir = unpack_archive(ctx_, spec.id(), archive);
    state_ = TaskState::ScriptRunning;
    try {
        run_exec_file(dir, spec.uninstall, "googet_remove.log", script_env(ctx_.env, dir, spec));
    } catch (const GoogetException&) {
        remove_quietly(dir);
        throw;
    }
    remove_quietly(dir);
}

void RemovalTask::remove_installed_files() {
    delete_recorded_files(record_.installed_files);
}

// ---------------------------------------------------------------------------

fs::path ensure_archive(InstallContext& ctx, const PackageState& state, bool force) {
    const PackageId id = state.package_spec.id();
    fs::path path = ctx.cache.archive_path(id);
    if (!state.local_path.empty()) {
        path = state.local_path;
    } else if (!state.unpack_dir.empty()) {
        path = state.unpack_dir + ".goo";
    }

    if (!force) {
        if (!fs::is_regular_file(path)) {
            log_info(string_format("info.local_package_missing", id.to_string()));
        } else if (!state.checksum.empty() && !checksums_equal(calculate_sha256(path), state.checksum)) {
            log_info(string_format("info.local_package_mismatch", id.to_string()));
        } else {
            return path;
        }
    }

    if (state.download_url.empty()) {
        throw GoogetException(string_format("error.cannot_redownload", id.to_string()), ErrorKind::DownloadError);
    }
    return ctx.cache.store(id, state.checksum, [&](const fs::path& tmp) {
        ctx.downloader.download_with_retries(state.download_url, tmp);
    });
}

void execute_plan(InstallContext& ctx, const InstallPlan& plan, const InstallOptions& options) {
    const size_t total = plan.steps.size();
    size_t n = 0;
    for (const auto& step : plan.steps) {
        ++n;
        if (cancellation_requested()) {
            throw GoogetException(get_string("error.cancelled"), ErrorKind::Cancelled);
        }
        switch (step.action) {
            case StepAction::Remove:
                log_info(string_format("info.plan_step_remove", n, total, step.id.to_string(), step.reason));
                RemovalTask(ctx, ctx.db.fetch_one(step.id.name, step.id.arch), options.db_only).run();
                break;
            case StepAction::Install:
                log_info(string_format("info.plan_step_install", n, total, step.id.to_string()));
                InstallationTask(ctx, PackageSource::from_candidate(*step.candidate), options).run();
                break;
            case StepAction::Reinstall:
                log_info(string_format("info.plan_step_reinstall", n, total, step.id.to_string()));
                reinstall_package(ctx, ctx.db.fetch_one(step.id.name, step.id.arch), options);
                break;
        }
    }
}

void reinstall_package(InstallContext& ctx, const PackageState& state, const InstallOptions& options) {
    PackageSource source = PackageSource::from_state(state);
    if (source.download_url.empty() && !state.local_path.empty() && !options.redownload) {
        // Local installs keep only their cached copy.
        source.local_file = state.local_path;
    }
    InstallationTask(ctx, std::move(source), options).run();
}

void remove_with_dependents(InstallContext& ctx, const std::string& name, const std::string& arch, bool db_only) {
    for (const auto& id : enumerate_dependents(name, arch, ctx.db.fetch_all())) {
        RemovalTask(ctx, ctx.db.fetch_one(id.name, id.arch), db_only).run();
    }
}

bool install_from_file(InstallContext& ctx, const fs::path& archive, const InstallOptions& options, bool reinstall) {
    if (!fs::exists(archive)) {
        throw GoogetException(string_format("error.local_pkg_not_found", archive.string()), ErrorKind::NotFound);
    }
    PackageSource source = PackageSource::from_file(archive);
    const PkgSpec& spec = source.spec;
    const GooGetState state = ctx.db.fetch_all();

    if (!reinstall && !needs_installation(spec.id(), state)) {
        log_info(string_format("info.newer_or_equal_installed", spec.to_string()));
        return false;
    }

    for (const auto& pattern : spec.conflict_patterns()) {
        for (const auto& s : state) {
            if (s.key() != spec.id().key() && pattern.matches(s.package_spec.id())) {
                throw GoogetException(string_format("error.package_conflict", spec.to_string(), s.package_spec.to_string()),
                                      ErrorKind::PackageConflict);
            }
        }
    }
    for (const auto& dep : spec.dependency_requests()) {
        if (!dependency_installed(dep, state)) {
            throw GoogetException(string_format("error.local_dependency_missing", spec.to_string(), dep.name, dep.min_version),
                                  ErrorKind::UnsatisfiableDependency);
        }
    }
    for (const auto& pattern : spec.replace_patterns()) {
        for (const auto& s : state) {
            if (s.key() != spec.id().key() && pattern.matches(s.package_spec.id())) {
                throw GoogetException(string_format("error.local_replaces_installed", spec.to_string(), s.package_spec.to_string()),
                                      ErrorKind::PackageConflict);
            }
        }
    }

    InstallationTask(ctx, std::move(source), options).run();
    return true;
}

bool verify_package(InstallContext& ctx, const PackageState& state, bool skip_files) {
    const PkgSpec& spec = state.package_spec;
    log_info(string_format("info.verifying_package", spec.to_string()));

    if (!spec.verify.empty()) {
        const fs::path dir = unpack_archive(ctx, spec.id(), ensure_archive(ctx, state));
        bool passed = true;
        try {
            run_exec_file(dir, spec.verify, "googet_verify.log", script_env(ctx.env, dir, spec));
        } catch (const GoogetException& e) {
            remove_quietly(dir);
            if (e.kind() != ErrorKind::ScriptError) throw;
            log_error(e.what());
            passed = false;
        }
        remove_quietly(dir);
        if (!passed) return false;
    }

    if (skip_files) return true;
    for (const auto& [file, sha] : state.installed_files) {
        if (!fs::exists(file)) {
            log_error(string_format("error.verify_file_missing", spec.to_string(), file));
            return false;
        }
        if (!sha.empty() && !checksums_equal(calculate_sha256(file), sha)) {
            log_error(string_format("error.verify_checksum_mismatch", spec.to_string(), file));
            return false;
        }
    }
    return true;
}

std::vector<fs::path> download_packages(const std::vector<Candidate>& candidates, const fs::path& dir,
                                        const Downloader& downloader) {
    ensure_dir_exists(dir);
    std::vector<fs::path> out;
    for (const auto& c : candidates) {
        const fs::path dst = dir / c.id().archive_name();
        fs::path tmp = dst;
        tmp += ".part";
        downloader.download_with_retries(download_url_for(c.repo, c.repo_spec.source), tmp);
        const std::string actual = calculate_sha256(tmp);
        if (!c.repo_spec.checksum.empty() && !checksums_equal(actual, c.repo_spec.checksum)) {
            std::error_code ec;
            fs::remove(tmp, ec);
            throw GoogetException(string_format("error.checksum_mismatch", c.id().to_string(), c.repo_spec.checksum, actual),
                                  ErrorKind::ChecksumMismatch);
        }
        fs::rename(tmp, dst);
        log_info(string_format("info.downloaded_to", c.id().to_string(), dst.string()));
        out.push_back(dst);
    }
    return out;
}
