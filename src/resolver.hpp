#pragma once

#include "database.hpp"
#include "identifier.hpp"
#include "pkgspec.hpp"
#include "priority.hpp"
#include "repository.hpp"

#include <optional>
#include <string>
#include <vector>

// A repository offer chosen by the resolver.
struct Candidate {
    RepoSpec repo_spec;
    std::string repo;
    Priority priority = PRIORITY_DEFAULT;

    const PkgSpec& spec() const { return repo_spec.package_spec; }
    PackageId id() const { return spec().id(); }
};

// Latest offer of name for arch (or noarch) from the highest-priority repos
// that carry one. Equal priority and version resolve to the smallest repo
// URL. An empty arch tries archs in order, taking the first arch with any
// offer. Throws NoCandidate.
Candidate find_repo_latest(const std::string& name, const std::string& arch, const RepoMap& repo_map,
                           const std::vector<std::string>& archs);

// Offer of exactly id.name, id.arch (or one of archs when empty) and
// id.version. Throws NoCandidate.
Candidate find_repo_version(const PackageId& id, const RepoMap& repo_map, const std::vector<std::string>& archs);

struct PackageUpdate {
    std::string name;
    std::string arch;
    std::string installed_version;
    Candidate candidate;
};

// Installed packages whose winning offer differs from the installed version,
// in either direction.
std::vector<PackageUpdate> compute_updates(const PackageMap& installed, const RepoMap& repo_map,
                                           const std::vector<std::string>& archs);

struct InstallRequest {
    std::string name;
    std::string arch;     // empty: first of the configured archs with an offer
    std::string version;  // empty: latest
    bool reinstall = false;
    bool allow_downgrade = false;
};

// Parses name[.arch[.version]] into a request.
InstallRequest make_install_request(const std::string& text);

enum class StepAction {
    Install,
    Reinstall,
    Remove
};

struct PlanStep {
    StepAction action;
    PackageId id;
    std::optional<Candidate> candidate; // set for Install
    std::string reason;                 // why a Remove step is present
};

struct InstallPlan {
    std::vector<PlanStep> steps;

    bool empty() const { return steps.empty(); }
    std::vector<PackageId> installs() const;
    std::vector<PackageId> removals() const;
};

// Resolves a request against the installed state. The plan lists removals
// forced by replacements (dependents before the packages they need) ahead of
// the install that triggers them, and installs dependencies before
// dependents. Throws NoCandidate, UnsatisfiableDependency, DependencyCycle,
// ReplacementCycle or PackageConflict without touching anything.
InstallPlan resolve_install(const InstallRequest& request, const GooGetState& state, const RepoMap& repo_map,
                            const std::vector<std::string>& archs);

// True unless name.arch is installed at version or newer.
bool needs_installation(const PackageId& id, const GooGetState& state);

// True when an installed package meets dep (name, compatible arch, version).
bool dependency_installed(const DependencyRequest& dep, const GooGetState& state);

// True when spec declares a dependency on name for arch.
bool depends_on(const PkgSpec& spec, const std::string& name, const std::string& arch);

// Installed packages that depend on name.arch, directly or transitively,
// ordered leaves first and ending with name.arch itself.
std::vector<PackageId> enumerate_dependents(const std::string& name, const std::string& arch, const GooGetState& state);

// The candidate followed by its transitive repo dependencies (ignoring the
// installed state), dependencies first.
std::vector<Candidate> list_dependencies(const Candidate& root, const RepoMap& repo_map,
                                         const std::vector<std::string>& archs);
