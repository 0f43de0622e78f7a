#include "repository.hpp"
#include "archive.hpp"
#include "downloader.hpp"
#include "environment.hpp"
#include "exception.hpp"
#include "hash.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <chrono>

namespace {

bool cache_is_fresh(const fs::path& path, std::chrono::seconds life) {
    std::error_code ec;
    const auto mtime = fs::last_write_time(path, ec);
    if (ec) return false;
    return fs::file_time_type::clock::now() - mtime < life;
}

std::string strip_trailing_slash(std::string url) {
    while (url.size() > 1 && url.back() == '/') url.pop_back();
    return url;
}

// Tries index.gz, then index; returns the manifest text.
std::string download_manifest(const std::string& url, const Downloader& downloader) {
    const std::string base = strip_trailing_slash(url);
    try {
        return decompress_gzip(downloader.fetch_to_string(base + "/index.gz"));
    } catch (const GoogetException& e) {
        if (e.kind() == ErrorKind::Cancelled) throw;
        log_debug(string_format("info.index_gz_unavailable", base, e.what()));
    }
    try {
        return downloader.fetch_to_string(base + "/index");
    } catch (const GoogetException& e) {
        if (e.kind() == ErrorKind::Cancelled) throw;
        throw GoogetException(string_format("error.repo_unavailable", url, e.what()), ErrorKind::RepoUnavailable);
    }
}

} // anonymous namespace

fs::path manifest_cache_path(const std::string& url, const Environment& env) {
    return env.cache_dir / (sha256_string(url) + ".rs");
}

std::vector<RepoSpec> fetch_manifest(const std::string& url, const Environment& env, const Downloader& downloader) {
    const fs::path cached = manifest_cache_path(url, env);
    if (cache_is_fresh(cached, env.cache_life)) {
        log_debug(string_format("info.manifest_from_cache", url));
        try {
            return parse_repo_manifest(read_file(cached), cached.string());
        } catch (const GoogetException& e) {
            log_warning(string_format("warning.manifest_cache_invalid", cached.string(), e.what()));
        }
    }

    log_debug(string_format("info.fetching_manifest", url));
    const std::string text = download_manifest(url, downloader);
    std::vector<RepoSpec> specs;
    try {
        specs = parse_repo_manifest(text, url);
    } catch (const GoogetException& e) {
        throw GoogetException(string_format("error.repo_unavailable", url, e.what()), ErrorKind::RepoUnavailable);
    }

    try {
        ensure_dir_exists(env.cache_dir);
        write_file_atomically(cached, text);
    } catch (const GoogetException& e) {
        log_warning(string_format("warning.manifest_cache_write_failed", cached.string(), e.what()));
    }
    return specs;
}

RepoMap fetch_repo_map(const RepoSources& sources, const Environment& env, const Downloader& downloader) {
    RepoMap repo_map;
    for (const auto& [url, priority] : sources) {
        try {
            repo_map[url] = Repo{priority, fetch_manifest(url, env, downloader)};
        } catch (const GoogetException& e) {
            if (e.kind() != ErrorKind::RepoUnavailable) throw;
            log_warning(e.what());
        }
    }
    return repo_map;
}

std::optional<RepoSpec> find_repo_spec(const PackageId& id, const Repo& repo) {
    for (const auto& rs : repo.packages) {
        const PkgSpec& ps = rs.package_spec;
        if (ps.name == id.name && ps.arch == id.arch && ps.version.str() == id.version) {
            return rs;
        }
    }
    return std::nullopt;
}

std::string what_repo(const PackageId& id, const RepoMap& repo_map) {
    for (const auto& [url, repo] : repo_map) {
        if (find_repo_spec(id, repo)) {
            return url;
        }
    }
    throw GoogetException(string_format("error.package_not_in_repos", id.to_string()), ErrorKind::NotFound);
}

std::string download_url_for(const std::string& repo_url, const std::string& source) {
    std::string base = strip_trailing_slash(repo_url);
    const size_t scheme = base.find("://");
    const size_t path_start = scheme == std::string::npos ? 0 : scheme + 3;
    const size_t slash = base.rfind('/');
    if (slash != std::string::npos && slash >= path_start) {
        base.erase(slash);
    }
    std::string rel = source;
    while (!rel.empty() && rel.front() == '/') rel.erase(0, 1);
    return base + "/" + rel;
}
