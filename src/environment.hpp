#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;

class FileLock;

#ifndef GOOGET_DEFAULT_ROOT
#define GOOGET_DEFAULT_ROOT "/var/lib/googet"
#endif

inline constexpr std::chrono::seconds DEFAULT_CACHE_LIFE{3 * 60};
inline constexpr std::chrono::seconds DEFAULT_LOCK_MAX_AGE{24 * 60 * 60};

// Everything a component needs to know about the installation it works on.
// Built once by the command driver and passed down by reference.
struct Environment {
    fs::path root;
    fs::path cache_dir;
    fs::path db_file;
    fs::path lock_file;
    fs::path repo_dir;
    fs::path conf_file;
    fs::path log_file;

    std::vector<std::string> archs;
    std::chrono::seconds cache_life = DEFAULT_CACHE_LIFE;
    std::chrono::seconds lock_max_age = DEFAULT_LOCK_MAX_AGE;
    std::string proxy_server;
    bool allow_unsafe_url = false;

    bool confirm = true;
    bool verbose = false;
};

// Root from the --root flag, else GooGetRoot / GOOGETROOT, else the default.
fs::path resolve_root(const std::string& flag_value);

// Derives the layout under root and applies googet.conf when present.
Environment make_environment(const fs::path& root);

// Applies googet.conf keys (archs, cachelife, lockfilemaxage, proxyserver,
// allowunsafeurl). Throws ParseError for malformed values.
void load_config(Environment& env, const fs::path& conf_file);

// Takes the installation lock. A lock older than env.lock_max_age whose
// holder is another googet process is treated as stale: the holder is killed
// and the lock retried once. Throws DBBusy.
std::unique_ptr<FileLock> obtain_root_lock(const Environment& env);

// Creates root, cache and repo directories.
void init_filesystem(const Environment& env);
