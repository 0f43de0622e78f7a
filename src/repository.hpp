#pragma once

#include "pkgspec.hpp"
#include "priority.hpp"
#include "repo_file.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

struct Environment;
class Downloader;

struct Repo {
    Priority priority = PRIORITY_DEFAULT;
    std::vector<RepoSpec> packages;
};

// Repo base URL -> Repo.
using RepoMap = std::map<std::string, Repo>;

// Fetches <url>/index.gz, falling back to <url>/index, reusing the cached
// <cache>/<sha256(url)>.rs copy while it is younger than env.cache_life.
// Throws RepoUnavailable.
std::vector<RepoSpec> fetch_manifest(const std::string& url, const Environment& env, const Downloader& downloader);

// Builds the RepoMap for sources. A repo whose manifest cannot be fetched or
// parsed is dropped with a warning.
RepoMap fetch_repo_map(const RepoSources& sources, const Environment& env, const Downloader& downloader);

// Path of the cached manifest for a repo URL.
fs::path manifest_cache_path(const std::string& url, const Environment& env);

// Exact name, arch and version lookup within one repo.
std::optional<RepoSpec> find_repo_spec(const PackageId& id, const Repo& repo);

// URL of the first repo offering id, in map order. Throws NotFound.
std::string what_repo(const PackageId& id, const RepoMap& repo_map);

// Archive URL for a spec's source: the repo URL with its last path segment
// replaced by source.
std::string download_url_for(const std::string& repo_url, const std::string& source);
