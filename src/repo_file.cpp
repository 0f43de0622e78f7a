#include "repo_file.hpp"
#include "environment.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"
#include "yaml_util.hpp"

#include <algorithm>

namespace {

RepoEntry entry_from_yaml(const YAML::Node& node, const std::string& origin) {
    if (!node.IsMap()) {
        throw GoogetException(string_format("error.repo_entry_invalid", origin), ErrorKind::ParseError);
    }
    RepoEntry entry;
    entry.name = yaml_string(node, "name");
    entry.url = yaml_string(node, "url");
    entry.use_oauth = yaml_bool(node, "useoauth");
    if (const std::string p = yaml_string(node, "priority"); !p.empty()) {
        entry.priority = parse_priority(p);
    }
    if (entry.priority <= 0) {
        entry.priority = PRIORITY_DEFAULT;
    }
    if (entry.name.empty()) {
        throw GoogetException(string_format("error.repo_entry_no_name", origin), ErrorKind::ParseError);
    }
    if (entry.url.empty()) {
        throw GoogetException(string_format("error.repo_entry_no_url", origin, entry.name), ErrorKind::ParseError);
    }
    return entry;
}

bool is_safe_url(const std::string& url) {
    return to_lower(url).starts_with("https://");
}

} // anonymous namespace

std::vector<RepoEntry> parse_repo_file(const std::string& text, const std::string& origin) {
    YAML::Node root = parse_yaml_string(text, origin);
    std::vector<RepoEntry> entries;
    if (!root.IsDefined() || root.IsNull()) {
        return entries;
    }
    if (root.IsMap()) {
        entries.push_back(entry_from_yaml(root, origin));
    } else if (root.IsSequence()) {
        for (const auto& node : root) {
            entries.push_back(entry_from_yaml(node, origin));
        }
    } else {
        throw GoogetException(string_format("error.repo_entry_invalid", origin), ErrorKind::ParseError);
    }
    return entries;
}

std::vector<RepoEntry> read_repo_file(const fs::path& path) {
    return parse_repo_file(read_file(path), path.string());
}

void write_repo_file(const fs::path& path, const std::vector<RepoEntry>& entries) {
    YAML::Node root(YAML::NodeType::Sequence);
    for (const auto& e : entries) {
        YAML::Node node(YAML::NodeType::Map);
        node["name"] = e.name;
        node["url"] = e.url;
        if (e.use_oauth) node["useoauth"] = true;
        node["priority"] = priority_to_string(e.priority);
        root.push_back(node);
    }
    if (path.has_parent_path()) ensure_dir_exists(path.parent_path());
    write_file_atomically(path, emit_yaml(root));
}

std::vector<RepoFile> read_repo_files(const fs::path& dir) {
    std::vector<RepoFile> files;
    if (!fs::is_directory(dir)) {
        return files;
    }
    for (const auto& dirent : fs::directory_iterator(dir)) {
        if (!dirent.is_regular_file() || dirent.path().extension() != ".repo") continue;
        // An unreadable file drops its own entries only.
        try {
            files.push_back({dirent.path(), read_repo_file(dirent.path())});
        } catch (const GoogetException& e) {
            if (e.kind() != ErrorKind::ParseError) throw;
            log_error(string_format("error.repo_file_skipped", dirent.path().string(), e.what()));
        }
    }
    std::ranges::sort(files, {}, &RepoFile::path);
    return files;
}

void add_repo_entry(const RepoEntry& entry, const fs::path& file) {
    std::vector<RepoEntry> entries;
    if (fs::exists(file)) {
        entries = read_repo_file(file);
    }
    std::erase_if(entries, [&](const RepoEntry& e) {
        return e.name == entry.name || e.url == entry.url;
    });
    entries.push_back(entry);
    write_repo_file(file, entries);
}

int remove_repo_entry(const std::string& name, const fs::path& dir) {
    const std::string wanted = to_lower(name);
    int removed = 0;
    for (auto& rf : read_repo_files(dir)) {
        const auto count = std::erase_if(rf.entries, [&](const RepoEntry& e) {
            return to_lower(e.name) == wanted;
        });
        if (count == 0) continue;
        removed += static_cast<int>(count);
        if (rf.entries.empty()) {
            log_debug(string_format("info.repo_file_removed", rf.path.string()));
            fs::remove(rf.path);
        } else {
            write_repo_file(rf.path, rf.entries);
        }
    }
    return removed;
}

RepoSources build_sources(const Environment& env) {
    RepoSources sources;
    for (const auto& rf : read_repo_files(env.repo_dir)) {
        for (const auto& e : rf.entries) {
            if (!env.allow_unsafe_url && !is_safe_url(e.url)) {
                log_warning(string_format("warning.unsafe_repo_url", e.url, rf.path.string()));
                continue;
            }
            auto [it, inserted] = sources.try_emplace(e.url, e.priority);
            if (!inserted) {
                it->second = std::max(it->second, e.priority);
            }
        }
    }
    return sources;
}

RepoSources sources_from_list(const std::string& csv) {
    RepoSources sources;
    for (const auto& part : split(csv, ',')) {
        const std::string url = trim(part);
        if (!url.empty()) sources.emplace(url, PRIORITY_DEFAULT);
    }
    return sources;
}
