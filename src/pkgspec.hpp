#pragma once

#include "identifier.hpp"
#include "version.hpp"

#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <map>
#include <string>
#include <vector>

inline constexpr size_t MAX_TAGS = 10;

// A script or binary run at install, uninstall or verify time.
struct ExecFile {
    std::string path;
    std::vector<std::string> args;
    std::vector<int> exit_codes;

    bool empty() const { return path.empty(); }
    bool operator==(const ExecFile&) const = default;
};

// One dependency edge of a spec: dep-name.dep-arch at least min_version.
struct DependencyRequest {
    std::string name;
    std::string arch;
    std::string min_version;
    bool arch_explicit = false;
};

struct PkgSpec {
    std::string name;
    Version version;
    std::string arch;
    std::vector<std::string> release_notes;
    std::string description;
    std::string license;
    std::string authors;
    std::string owners;
    std::string source;
    std::map<std::string, std::string> tags;
    std::map<std::string, std::string> dependencies; // "name[.arch]" -> minimum version
    std::vector<std::string> replaces;
    std::vector<std::string> conflicts;
    std::map<std::string, std::string> files;        // archive path -> install destination
    ExecFile install;
    ExecFile uninstall;
    ExecFile verify;

    PackageId id() const { return {name, arch, version.str()}; }
    std::string to_string() const { return id().to_string(); }

    // Dependencies without an explicit arch inherit this package's arch.
    std::vector<DependencyRequest> dependency_requests() const;
    std::vector<PackagePattern> replace_patterns() const;
    std::vector<PackagePattern> conflict_patterns() const;

    bool operator==(const PkgSpec&) const = default;
};

// A package offered by a repository manifest.
struct RepoSpec {
    std::string checksum;
    std::string source;
    PkgSpec package_spec;
};

const std::vector<std::string>& known_archs();

// Strips ".." components from script paths.
void normalize_pkgspec(PkgSpec& spec);
// Throws ParseError describing the first invalid field.
void verify_pkgspec(const PkgSpec& spec);

PkgSpec pkgspec_from_yaml(const YAML::Node& node);
YAML::Node pkgspec_to_yaml(const PkgSpec& spec);
RepoSpec repospec_from_yaml(const YAML::Node& node);
YAML::Node repospec_to_yaml(const RepoSpec& spec);

// Parses, normalizes and verifies a .pkgspec document (JSON or YAML).
PkgSpec parse_pkgspec(const std::string& text);
std::string serialize_pkgspec(const PkgSpec& spec);

// Parses a repository manifest: a list of RepoSpec entries.
std::vector<RepoSpec> parse_repo_manifest(const std::string& text, const std::string& origin);
std::string serialize_repo_manifest(const std::vector<RepoSpec>& specs);

// Reads <name>.pkgspec out of a .goo archive.
PkgSpec read_pkgspec_from_archive(const std::filesystem::path& archive_path);
