#include "environment.hpp"
#include "exception.hpp"
#include "pkgspec.hpp"
#include "localization.hpp"
#include "utils.hpp"
#include "yaml_util.hpp"

#include <signal.h>
#include <unistd.h>

#include <charconv>
#include <cstdlib>
#include <optional>
#include <thread>

fs::path resolve_root(const std::string& flag_value) {
    if (!flag_value.empty()) {
        return fs::absolute(flag_value);
    }
    for (const char* var : {"GooGetRoot", "GOOGETROOT"}) {
        if (const char* value = std::getenv(var); value && *value) {
            return fs::absolute(value);
        }
    }
    return GOOGET_DEFAULT_ROOT;
}

namespace {

bool lock_is_stale(const fs::path& lock_file, std::chrono::seconds max_age) {
    std::error_code ec;
    const auto mtime = fs::last_write_time(lock_file, ec);
    return !ec && fs::file_time_type::clock::now() - mtime > max_age;
}

// PID recorded in the lock file when it belongs to a running googet process.
std::optional<pid_t> googet_holder(const fs::path& lock_file) {
    std::string text;
    try {
        text = trim(read_file(lock_file));
    } catch (const GoogetException&) {
        return std::nullopt;
    }
    pid_t pid = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), pid);
    if (ec != std::errc() || pid <= 0 || pid == getpid()) return std::nullopt;

    std::error_code fec;
    const fs::path exe = fs::read_symlink(fs::path("/proc") / std::to_string(pid) / "exe", fec);
    if (fec || exe.filename() != "googet") return std::nullopt;
    return pid;
}

} // anonymous namespace

std::unique_ptr<FileLock> obtain_root_lock(const Environment& env) {
    try {
        return std::make_unique<FileLock>(env.lock_file);
    } catch (const GoogetException& e) {
        if (e.kind() != ErrorKind::DBBusy || !lock_is_stale(env.lock_file, env.lock_max_age)) throw;
        const auto pid = googet_holder(env.lock_file);
        if (!pid) throw;
        log_warning(string_format("warning.killing_stale_holder", *pid, env.lock_file.string()));
        if (kill(*pid, SIGKILL) != 0) throw;
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        return std::make_unique<FileLock>(env.lock_file);
    }
}

void load_config(Environment& env, const fs::path& conf_file) {
    YAML::Node conf = parse_yaml_file(conf_file);
    if (!conf.IsDefined() || conf.IsNull()) return;
    if (!conf.IsMap()) {
        throw GoogetException(string_format("error.config_not_a_map", conf_file.string()), ErrorKind::ParseError);
    }

    if (auto archs = yaml_string_list(conf, "archs"); !archs.empty()) {
        env.archs = std::move(archs);
    }
    if (auto life = yaml_string(conf, "cachelife"); !life.empty()) {
        env.cache_life = parse_duration(life);
    }
    if (auto age = yaml_string(conf, "lockfilemaxage"); !age.empty()) {
        env.lock_max_age = parse_duration(age);
    }
    env.proxy_server = yaml_string(conf, "proxyserver");
    env.allow_unsafe_url = yaml_bool(conf, "allowunsafeurl");
}

Environment make_environment(const fs::path& root) {
    Environment env;
    env.root = root;
    env.cache_dir = root / "cache";
    env.db_file = root / "googet.db";
    env.lock_file = root / "googet.lock";
    env.repo_dir = root / "repos";
    env.conf_file = root / "googet.conf";
    env.log_file = root / "googet.log";
    env.archs = known_archs();

    if (fs::exists(env.conf_file)) {
        load_config(env, env.conf_file);
    }
    return env;
}

void init_filesystem(const Environment& env) {
    ensure_dir_exists(env.root);
    ensure_dir_exists(env.cache_dir);
    ensure_dir_exists(env.repo_dir);
}
