#pragma once

#include "priority.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace fs = std::filesystem;

struct Environment;

// One record of a .repo file.
struct RepoEntry {
    std::string name;
    std::string url;
    bool use_oauth = false;
    Priority priority = PRIORITY_DEFAULT;

    bool operator==(const RepoEntry&) const = default;
};

struct RepoFile {
    fs::path path;
    std::vector<RepoEntry> entries;
};

// Repo base URL -> priority.
using RepoSources = std::map<std::string, Priority>;

// Accepts a single entry map or a list of entries. A file holding only
// comments yields no entries. Throws ParseError.
std::vector<RepoEntry> parse_repo_file(const std::string& text, const std::string& origin);
std::vector<RepoEntry> read_repo_file(const fs::path& path);
void write_repo_file(const fs::path& path, const std::vector<RepoEntry>& entries);

// All *.repo files under dir, sorted by file name.
std::vector<RepoFile> read_repo_files(const fs::path& dir);

// Adds entry to file, dropping existing entries with the same name or URL.
void add_repo_entry(const RepoEntry& entry, const fs::path& file);

// Removes entries named name (case-insensitive) from every repo file under
// dir. Files left empty are deleted. Returns the number of entries removed.
int remove_repo_entry(const std::string& name, const fs::path& dir);

// Collects the enabled repo URLs. Non-https URLs are skipped unless
// env.allow_unsafe_url; a URL listed twice keeps its highest priority.
RepoSources build_sources(const Environment& env);

// Comma separated URLs from --sources, each at Default priority.
RepoSources sources_from_list(const std::string& csv);
