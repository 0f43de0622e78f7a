#include "pkgspec.hpp"

#include "archive.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"
#include "yaml_util.hpp"

#include <algorithm>
#include <ranges>

namespace {

constexpr size_t MAX_TAG_KEY_LEN = 127;
constexpr size_t MAX_TAG_VALUE_SIZE = 1024 * 10;

ExecFile exec_from_yaml(const YAML::Node& node) {
    ExecFile ef;
    if (!node.IsDefined() || node.IsNull()) return ef;
    if (!node.IsMap()) {
        throw GoogetException(get_string("error.invalid_exec_file"), ErrorKind::ParseError);
    }
    ef.path = yaml_string(node, "Path");
    ef.args = yaml_string_list(node, "Args");
    YAML::Node codes = yaml_child(node, "ExitCodes");
    if (codes.IsSequence()) {
        for (const auto& c : codes) {
            try {
                ef.exit_codes.push_back(c.as<int>());
            } catch (const YAML::Exception&) {
                throw GoogetException(string_format("error.invalid_exit_code", c.Scalar()), ErrorKind::ParseError);
            }
        }
    }
    return ef;
}

YAML::Node exec_to_yaml(const ExecFile& ef) {
    YAML::Node node(YAML::NodeType::Map);
    node["Path"] = ef.path;
    YAML::Node args(YAML::NodeType::Sequence);
    for (const auto& a : ef.args) args.push_back(a);
    node["Args"] = args;
    YAML::Node codes(YAML::NodeType::Sequence);
    for (int c : ef.exit_codes) codes.push_back(c);
    node["ExitCodes"] = codes;
    return node;
}

YAML::Node string_map_to_yaml(const std::map<std::string, std::string>& m) {
    YAML::Node node(YAML::NodeType::Map);
    for (const auto& [k, v] : m) node[k] = v;
    return node;
}

YAML::Node string_list_to_yaml(const std::vector<std::string>& l) {
    YAML::Node node(YAML::NodeType::Sequence);
    for (const auto& v : l) node.push_back(v);
    return node;
}

std::string clean_relative(const std::string& path) {
    if (path.empty() || fs::path(path).is_absolute()) return path;
    fs::path cleaned = (fs::path("/") / path).lexically_normal();
    std::string s = cleaned.string();
    return s.size() > 1 ? s.substr(1) : "";
}

} // anonymous namespace

const std::vector<std::string>& known_archs() {
    static const std::vector<std::string> archs = {"noarch", "x86_64", "x86_32", "arm", "arm64"};
    return archs;
}

std::vector<DependencyRequest> PkgSpec::dependency_requests() const {
    std::vector<DependencyRequest> out;
    for (const auto& [key, min_version] : dependencies) {
        DependencyRequest req;
        const size_t dot = key.find('.');
        req.name = key.substr(0, dot);
        if (dot != std::string::npos) {
            req.arch = key.substr(dot + 1);
            req.arch_explicit = true;
        } else {
            req.arch = arch;
        }
        req.min_version = min_version;
        out.push_back(std::move(req));
    }
    return out;
}

std::vector<PackagePattern> PkgSpec::replace_patterns() const {
    std::vector<PackagePattern> out;
    out.reserve(replaces.size());
    for (const auto& r : replaces) out.push_back(PackagePattern::parse(r));
    return out;
}

std::vector<PackagePattern> PkgSpec::conflict_patterns() const {
    std::vector<PackagePattern> out;
    out.reserve(conflicts.size());
    for (const auto& c : conflicts) out.push_back(PackagePattern::parse(c));
    return out;
}

void normalize_pkgspec(PkgSpec& spec) {
    spec.install.path = clean_relative(spec.install.path);
    spec.uninstall.path = clean_relative(spec.uninstall.path);
    spec.verify.path = clean_relative(spec.verify.path);
}

void verify_pkgspec(const PkgSpec& spec) {
    auto fail = [](const std::string& msg) {
        throw GoogetException(msg, ErrorKind::ParseError);
    };

    if (spec.name.empty()) fail(get_string("error.spec_no_name"));
    if (std::ranges::find(known_archs(), spec.arch) == known_archs().end()) {
        fail(string_format("error.spec_invalid_arch", spec.arch));
    }
    if (spec.version.empty()) fail(string_format("error.spec_no_version", spec.name));
    if (spec.tags.size() > MAX_TAGS) fail(string_format("error.spec_too_many_tags", spec.name));
    for (const auto& [k, v] : spec.tags) {
        if (k.size() > MAX_TAG_KEY_LEN) fail(string_format("error.spec_tag_key_too_large", k));
        if (v.size() > MAX_TAG_VALUE_SIZE) fail(string_format("error.spec_tag_too_large", k));
    }
    for (const auto& [dep, ver] : spec.dependencies) {
        if (!Version::is_valid(ver)) fail(string_format("error.spec_invalid_dep_version", ver, dep));
    }
    for (const auto& src : spec.files | std::views::keys) {
        if (fs::path(src).is_absolute()) fail(string_format("error.spec_absolute_path", src));
    }
    for (const ExecFile* ef : {&spec.install, &spec.uninstall, &spec.verify}) {
        if (fs::path(ef->path).is_absolute()) fail(string_format("error.spec_absolute_path", ef->path));
    }
    for (const auto& r : spec.replaces) PackagePattern::parse(r);
    for (const auto& c : spec.conflicts) PackagePattern::parse(c);
}

PkgSpec pkgspec_from_yaml(const YAML::Node& node) {
    if (!node.IsMap()) {
        throw GoogetException(get_string("error.spec_not_a_map"), ErrorKind::ParseError);
    }
    PkgSpec spec;
    spec.name = yaml_string(node, "Name");
    if (const std::string v = yaml_string(node, "Version"); !v.empty()) {
        spec.version = Version::parse(v);
    }
    spec.arch = yaml_string(node, "Arch");
    spec.release_notes = yaml_string_list(node, "ReleaseNotes");
    spec.description = yaml_string(node, "Description");
    spec.license = yaml_string(node, "License");
    spec.authors = yaml_string(node, "Authors");
    spec.owners = yaml_string(node, "Owners");
    spec.source = yaml_string(node, "Source");
    spec.tags = yaml_string_map(node, "Tags");
    spec.dependencies = yaml_string_map(node, "PkgDependencies");
    spec.replaces = yaml_string_list(node, "Replaces");
    spec.conflicts = yaml_string_list(node, "Conflicts");
    spec.files = yaml_string_map(node, "Files");
    spec.install = exec_from_yaml(yaml_child(node, "Install"));
    spec.uninstall = exec_from_yaml(yaml_child(node, "Uninstall"));
    spec.verify = exec_from_yaml(yaml_child(node, "Verify"));
    return spec;
}

YAML::Node pkgspec_to_yaml(const PkgSpec& spec) {
    YAML::Node node(YAML::NodeType::Map);
    node["Name"] = spec.name;
    node["Version"] = spec.version.str();
    node["Arch"] = spec.arch;
    if (!spec.release_notes.empty()) node["ReleaseNotes"] = string_list_to_yaml(spec.release_notes);
    if (!spec.description.empty()) node["Description"] = spec.description;
    if (!spec.license.empty()) node["License"] = spec.license;
    if (!spec.authors.empty()) node["Authors"] = spec.authors;
    if (!spec.owners.empty()) node["Owners"] = spec.owners;
    if (!spec.source.empty()) node["Source"] = spec.source;
    if (!spec.tags.empty()) node["Tags"] = string_map_to_yaml(spec.tags);
    if (!spec.dependencies.empty()) node["PkgDependencies"] = string_map_to_yaml(spec.dependencies);
    node["Replaces"] = string_list_to_yaml(spec.replaces);
    node["Conflicts"] = string_list_to_yaml(spec.conflicts);
    node["Install"] = exec_to_yaml(spec.install);
    node["Uninstall"] = exec_to_yaml(spec.uninstall);
    node["Verify"] = exec_to_yaml(spec.verify);
    if (!spec.files.empty()) node["Files"] = string_map_to_yaml(spec.files);
    return node;
}

RepoSpec repospec_from_yaml(const YAML::Node& node) {
    if (!node.IsMap()) {
        throw GoogetException(get_string("error.repospec_not_a_map"), ErrorKind::ParseError);
    }
    RepoSpec rs;
    rs.checksum = yaml_string(node, "Checksum");
    rs.source = yaml_string(node, "Source");
    YAML::Node ps = yaml_child(node, "PackageSpec");
    if (!ps.IsDefined() || ps.IsNull()) {
        throw GoogetException(string_format("error.repospec_missing_spec", rs.source), ErrorKind::ParseError);
    }
    rs.package_spec = pkgspec_from_yaml(ps);
    normalize_pkgspec(rs.package_spec);
    return rs;
}

YAML::Node repospec_to_yaml(const RepoSpec& spec) {
    YAML::Node node(YAML::NodeType::Map);
    node["Checksum"] = spec.checksum;
    node["Source"] = spec.source;
    node["PackageSpec"] = pkgspec_to_yaml(spec.package_spec);
    return node;
}

PkgSpec parse_pkgspec(const std::string& text) {
    PkgSpec spec = pkgspec_from_yaml(parse_yaml_string(text, "pkgspec"));
    normalize_pkgspec(spec);
    verify_pkgspec(spec);
    return spec;
}

std::string serialize_pkgspec(const PkgSpec& spec) {
    verify_pkgspec(spec);
    return emit_json(pkgspec_to_yaml(spec));
}

std::vector<RepoSpec> parse_repo_manifest(const std::string& text, const std::string& origin) {
    YAML::Node root = parse_yaml_string(text, origin);
    std::vector<RepoSpec> specs;
    if (!root.IsDefined() || root.IsNull()) return specs;
    if (!root.IsSequence()) {
        throw GoogetException(string_format("error.manifest_not_a_list", origin), ErrorKind::ParseError);
    }
    size_t index = 0;
    for (const auto& entry : root) {
        ++index;
        try {
            RepoSpec rs = repospec_from_yaml(entry);
            verify_pkgspec(rs.package_spec);
            specs.push_back(std::move(rs));
        } catch (const GoogetException& e) {
            if (e.kind() != ErrorKind::ParseError && e.kind() != ErrorKind::MalformedIdentifier) throw;
            log_warning(string_format("warning.manifest_entry_skipped", index, origin, e.what()));
        }
    }
    return specs;
}

std::string serialize_repo_manifest(const std::vector<RepoSpec>& specs) {
    YAML::Node root(YAML::NodeType::Sequence);
    for (const auto& rs : specs) root.push_back(repospec_to_yaml(rs));
    return emit_json(root);
}

PkgSpec read_pkgspec_from_archive(const fs::path& archive_path) {
    auto content = read_archive_entry(archive_path, [](const std::string& entry) {
        return entry.ends_with(".pkgspec");
    });
    if (!content) {
        throw GoogetException(string_format("error.no_pkgspec_in_archive", archive_path.string()), ErrorKind::ParseError);
    }
    return parse_pkgspec(*content);
}
