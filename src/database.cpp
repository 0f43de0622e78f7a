#include "database.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "yaml_util.hpp"

#include <algorithm>
#include <iterator>
#include <set>

namespace {

YAML::Node state_to_yaml(const PackageState& s) {
    YAML::Node node(YAML::NodeType::Map);
    node["SourceRepo"] = s.source_repo;
    node["DownloadURL"] = s.download_url;
    node["Checksum"] = s.checksum;
    node["LocalPath"] = s.local_path;
    node["UnpackDir"] = s.unpack_dir;
    node["PackageSpec"] = pkgspec_to_yaml(s.package_spec);
    YAML::Node files(YAML::NodeType::Map);
    for (const auto& [path, sha] : s.installed_files) files[path] = sha;
    node["InstalledFiles"] = files;
    node["InstallDate"] = s.install_date;
    node["InstallExitCode"] = s.install_exit_code;
    return node;
}

PackageState state_from_yaml(const YAML::Node& node) {
    if (!node.IsMap()) {
        throw GoogetException(get_string("error.db_record_invalid"), ErrorKind::DBCorrupt);
    }
    PackageState s;
    s.source_repo = yaml_string(node, "SourceRepo");
    s.download_url = yaml_string(node, "DownloadURL");
    s.checksum = yaml_string(node, "Checksum");
    s.local_path = yaml_string(node, "LocalPath");
    s.unpack_dir = yaml_string(node, "UnpackDir");
    s.package_spec = pkgspec_from_yaml(yaml_child(node, "PackageSpec"));
    s.installed_files = yaml_string_map(node, "InstalledFiles");
    if (auto date = yaml_child(node, "InstallDate"); date.IsScalar()) {
        s.install_date = date.as<std::int64_t>();
    }
    if (auto code = yaml_child(node, "InstallExitCode"); code.IsScalar()) {
        s.install_exit_code = code.as<int>();
    }
    return s;
}

} // anonymous namespace

PackageMap installed_packages(const GooGetState& state) {
    PackageMap pm;
    for (const auto& s : state) {
        pm[s.key()] = s.package_spec.version.str();
    }
    return pm;
}

std::string serialize_state(const GooGetState& state) {
    YAML::Node root(YAML::NodeType::Sequence);
    for (const auto& s : state) root.push_back(state_to_yaml(s));
    return emit_yaml(root);
}

GooGetState parse_state(const std::string& text, const std::string& origin) {
    GooGetState state;
    try {
        YAML::Node root = parse_yaml_string(text, origin);
        if (!root.IsDefined() || root.IsNull()) return state;
        if (!root.IsSequence()) {
            throw GoogetException(string_format("error.db_not_a_list", origin), ErrorKind::DBCorrupt);
        }
        std::set<std::string> keys;
        for (const auto& node : root) {
            PackageState s = state_from_yaml(node);
            if (s.package_spec.name.empty()) {
                throw GoogetException(string_format("error.db_record_no_name", origin), ErrorKind::DBCorrupt);
            }
            if (!keys.insert(s.key()).second) {
                throw GoogetException(string_format("error.db_duplicate_key", origin, s.key()), ErrorKind::DBCorrupt);
            }
            state.push_back(std::move(s));
        }
    } catch (const GoogetException& e) {
        if (e.kind() == ErrorKind::DBCorrupt) throw;
        throw GoogetException(string_format("error.db_corrupt", origin, e.what()), ErrorKind::DBCorrupt);
    } catch (const YAML::Exception& e) {
        throw GoogetException(string_format("error.db_corrupt", origin, e.what()), ErrorKind::DBCorrupt);
    }
    return state;
}

StateDB::StateDB(const fs::path& path) : path_(path) {
    lock_ = std::make_unique<FileLock>(fs::path(path_.string() + ".lock"));
    if (fs::exists(path_)) {
        states_ = parse_state(read_file(path_), path_.string());
    }
    log_debug(string_format("info.db_opened", path_.string(), states_.size()));
}

StateDB::~StateDB() = default;

void StateDB::ensure_open() const {
    if (!lock_) {
        throw GoogetException(string_format("error.db_closed", path_.string()), ErrorKind::Io);
    }
}

GooGetState StateDB::fetch_all(const std::string& filter) const {
    ensure_open();
    GooGetState out;
    std::ranges::copy_if(states_, std::back_inserter(out), [&](const PackageState& s) {
        return filter.empty() || s.package_spec.name.find(filter) != std::string::npos;
    });
    return out;
}

std::optional<PackageState> StateDB::find(const std::string& name, const std::string& arch) const {
    ensure_open();
    auto it = std::ranges::find_if(states_, [&](const PackageState& s) { return s.matches(name, arch); });
    if (it == states_.end()) return std::nullopt;
    return *it;
}

PackageState StateDB::fetch_one(const std::string& name, const std::string& arch) const {
    if (auto s = find(name, arch)) return *s;
    throw GoogetException(string_format("error.package_not_installed", name + "." + arch), ErrorKind::NotFound);
}

void StateDB::write(const GooGetState& states) {
    ensure_open();
    std::set<std::string> keys;
    for (const auto& s : states) {
        if (!keys.insert(s.key()).second) {
            throw GoogetException(string_format("error.db_duplicate_key", path_.string(), s.key()), ErrorKind::DBCorrupt);
        }
    }
    write_file_atomically(path_, serialize_state(states));
    states_ = states;
}

void StateDB::upsert(const PackageState& state) {
    GooGetState next = states_;
    auto it = std::ranges::find_if(next, [&](const PackageState& s) { return s.key() == state.key(); });
    if (it != next.end()) {
        *it = state;
    } else {
        next.push_back(state);
    }
    write(next);
}

void StateDB::remove(const std::string& name, const std::string& arch) {
    GooGetState next = states_;
    const auto erased = std::erase_if(next, [&](const PackageState& s) { return s.matches(name, arch); });
    if (erased == 0) {
        throw GoogetException(string_format("error.package_not_installed", name + "." + arch), ErrorKind::NotFound);
    }
    write(next);
}

void StateDB::close() {
    lock_.reset();
    states_.clear();
}
