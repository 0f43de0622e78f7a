#include "resolver.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <algorithm>
#include <functional>
#include <map>
#include <ranges>
#include <set>

namespace {

// Priority first, then version, then the smaller repo URL.
bool outranks(const Candidate& challenger, const Candidate& best) {
    if (challenger.priority != best.priority) {
        return challenger.priority > best.priority;
    }
    const int c = Version::compare(challenger.spec().version.str(), best.spec().version.str());
    if (c != 0) {
        return c > 0;
    }
    return challenger.repo < best.repo;
}

std::optional<Candidate> select_best(const RepoMap& repo_map, const std::function<bool(const PkgSpec&)>& wanted) {
    std::optional<Candidate> best;
    for (const auto& [url, repo] : repo_map) {
        for (const auto& rs : repo.packages) {
            if (!wanted(rs.package_spec)) continue;
            Candidate c{rs, url, repo.priority};
            if (!best || outranks(c, *best)) {
                best = std::move(c);
            }
        }
    }
    return best;
}

bool at_least(const std::string& version, const std::string& minimum) {
    return minimum.empty() || Version::compare(version, minimum) >= 0;
}

// An inferred dependency arch accepts noarch; a noarch parent accepts any arch.
bool arch_satisfies(const DependencyRequest& dep, const std::string& arch) {
    if (dep.arch_explicit) {
        return arch == dep.arch;
    }
    return arch == dep.arch || arch == NOARCH || dep.arch == NOARCH;
}

bool satisfies(const DependencyRequest& dep, const PkgSpec& spec) {
    return spec.name == dep.name && arch_satisfies(dep, spec.arch) && at_least(spec.version.str(), dep.min_version);
}

std::pair<std::string, std::string> split_key(const std::string& key) {
    const size_t dot = key.find('.');
    if (dot == std::string::npos) return {key, ""};
    return {key.substr(0, dot), key.substr(dot + 1)};
}

const PackageState* find_state(const GooGetState& state, const std::string& key) {
    for (const auto& s : state) {
        if (s.key() == key) return &s;
    }
    return nullptr;
}

std::string dependency_text(const DependencyRequest& dep) {
    std::string text = dep.name + "." + dep.arch;
    if (!dep.min_version.empty()) text += " >= " + dep.min_version;
    return text;
}

// Picks the repo offer for a dependency, falling back from an inferred
// noarch to the configured archs.
Candidate choose_dependency(const DependencyRequest& dep, const std::string& parent, const RepoMap& repo_map,
                            const std::vector<std::string>& archs) {
    std::optional<Candidate> found;
    try {
        found = find_repo_latest(dep.name, dep.arch, repo_map, archs);
    } catch (const GoogetException& e) {
        if (e.kind() != ErrorKind::NoCandidate) throw;
    }
    if (!found && !dep.arch_explicit && dep.arch == NOARCH) {
        try {
            found = find_repo_latest(dep.name, "", repo_map, archs);
        } catch (const GoogetException& e) {
            if (e.kind() != ErrorKind::NoCandidate) throw;
        }
    }
    if (!found || !at_least(found->spec().version.str(), dep.min_version)) {
        throw GoogetException(string_format("error.unsatisfiable_dependency", parent, dependency_text(dep)),
                              ErrorKind::UnsatisfiableDependency);
    }
    return *found;
}

// Keys ordered so that every package precedes the packages it depends on.
std::vector<PackageId> order_leaves_first(std::set<std::string> remaining, const GooGetState& state) {
    std::vector<PackageId> ordered;
    while (!remaining.empty()) {
        auto pick = std::ranges::find_if(remaining, [&](const std::string& key) {
            const auto id = split_key(key);
            return std::ranges::none_of(remaining, [&](const std::string& other) {
                if (other == key) return false;
                const PackageState* s = find_state(state, other);
                return s && depends_on(s->package_spec, id.first, id.second);
            });
        });
        if (pick == remaining.end()) {
            // Dependency loop among installed packages: fall back to name order.
            pick = remaining.begin();
        }
        const PackageState* s = find_state(state, *pick);
        ordered.push_back(s ? s->package_spec.id() : PackageId{split_key(*pick).first, split_key(*pick).second, ""});
        remaining.erase(pick);
    }
    return ordered;
}

// Dependency closure of a target, built depth first.
class Closure {
public:
    Closure(const GooGetState& state, const RepoMap& repo_map, const std::vector<std::string>& archs)
        : state_(state), repo_map_(repo_map), archs_(archs) {}

    void visit(const Candidate& c) {
        const std::string key = c.id().key();
        visiting_.insert(key);
        members_.emplace(key, c);

        for (const auto& dep : c.spec().dependency_requests()) {
            if (const PackageState* inst = installed_match(dep)) {
                log_debug(string_format("info.dependency_met", dependency_text(dep), inst->package_spec.to_string()));
                installed_deps_.push_back({key, inst->key()});
                continue;
            }
            Candidate d = choose_dependency(dep, c.spec().to_string(), repo_map_, archs_);
            const std::string dkey = d.id().key();
            if (visiting_.contains(dkey)) {
                throw GoogetException(string_format("error.dependency_cycle", c.spec().to_string(), d.spec().to_string()),
                                      ErrorKind::DependencyCycle);
            }
            if (auto it = members_.find(dkey); it != members_.end()) {
                if (!satisfies(dep, it->second.spec())) {
                    throw GoogetException(string_format("error.unsatisfiable_dependency", c.spec().to_string(), dependency_text(dep)),
                                          ErrorKind::UnsatisfiableDependency);
                }
                continue;
            }
            log_debug(string_format("info.dependency_found", dependency_text(dep), d.spec().to_string(), d.repo));
            visit(d);
        }

        visiting_.erase(key);
        order_.push_back(key);
    }

    bool satisfied_by_member(const DependencyRequest& dep) const {
        return std::ranges::any_of(members_, [&](const auto& kv) { return satisfies(dep, kv.second.spec()); });
    }

    const std::map<std::string, Candidate>& members() const { return members_; }
    const std::vector<std::string>& order() const { return order_; }
    // (member key, installed key) pairs for dependencies met by the installed set.
    const std::vector<std::pair<std::string, std::string>>& installed_deps() const { return installed_deps_; }

private:
    const PackageState* installed_match(const DependencyRequest& dep) const {
        for (const auto& s : state_) {
            if (satisfies(dep, s.package_spec)) return &s;
        }
        return nullptr;
    }

    const GooGetState& state_;
    const RepoMap& repo_map_;
    const std::vector<std::string>& archs_;
    std::map<std::string, Candidate> members_;
    std::set<std::string> visiting_;
    std::vector<std::string> order_;
    std::vector<std::pair<std::string, std::string>> installed_deps_;
};

} // anonymous namespace

Candidate find_repo_latest(const std::string& name, const std::string& arch, const RepoMap& repo_map,
                           const std::vector<std::string>& archs) {
    if (!arch.empty()) {
        auto best = select_best(repo_map, [&](const PkgSpec& ps) {
            return ps.name == name && (ps.arch == arch || ps.arch == NOARCH);
        });
        if (best) return *best;
    } else {
        for (const auto& a : archs) {
            auto best = select_best(repo_map, [&](const PkgSpec& ps) { return ps.name == name && ps.arch == a; });
            if (best) return *best;
        }
    }
    throw GoogetException(string_format("error.no_candidate", arch.empty() ? name : name + "." + arch),
                          ErrorKind::NoCandidate);
}

Candidate find_repo_version(const PackageId& id, const RepoMap& repo_map, const std::vector<std::string>& archs) {
    auto offers = [&](const std::string& arch) {
        return select_best(repo_map, [&](const PkgSpec& ps) {
            return ps.name == id.name && ps.arch == arch && ps.version.str() == id.version;
        });
    };
    if (!id.arch.empty()) {
        if (auto best = offers(id.arch)) return *best;
        if (auto best = offers(std::string(NOARCH))) return *best;
    } else {
        for (const auto& a : archs) {
            if (auto best = offers(a)) return *best;
        }
    }
    throw GoogetException(string_format("error.no_candidate", id.to_string()), ErrorKind::NoCandidate);
}

std::vector<PackageUpdate> compute_updates(const PackageMap& installed, const RepoMap& repo_map,
                                           const std::vector<std::string>& archs) {
    std::vector<PackageUpdate> updates;
    for (const auto& [key, version] : installed) {
        const auto [name, arch] = split_key(key);
        try {
            Candidate c = find_repo_latest(name, arch, repo_map, archs);
            if (c.spec().version.str() != version) {
                updates.push_back({name, arch, version, std::move(c)});
            }
        } catch (const GoogetException& e) {
            if (e.kind() != ErrorKind::NoCandidate) throw;
            log_debug(string_format("info.no_update_source", key));
        }
    }
    return updates;
}

InstallRequest make_install_request(const std::string& text) {
    const PackageId id = parse_package_id(text);
    return InstallRequest{.name = id.name, .arch = id.arch, .version = id.version};
}

std::vector<PackageId> InstallPlan::installs() const {
    std::vector<PackageId> out;
    for (const auto& step : steps) {
        if (step.action != StepAction::Remove) out.push_back(step.id);
    }
    return out;
}

std::vector<PackageId> InstallPlan::removals() const {
    std::vector<PackageId> out;
    for (const auto& step : steps) {
        if (step.action == StepAction::Remove) out.push_back(step.id);
    }
    return out;
}

InstallPlan resolve_install(const InstallRequest& request, const GooGetState& state, const RepoMap& repo_map,
                            const std::vector<std::string>& archs) {
    if (request.reinstall) {
        for (const auto& s : state) {
            const PkgSpec& ps = s.package_spec;
            if (ps.name == request.name && (request.arch.empty() || ps.arch == request.arch)) {
                return InstallPlan{{PlanStep{StepAction::Reinstall, ps.id(), std::nullopt, ""}}};
            }
        }
        log_info(string_format("info.reinstall_not_installed", request.name));
        return {};
    }

    const Candidate target = request.version.empty()
        ? find_repo_latest(request.name, request.arch, repo_map, archs)
        : find_repo_version({request.name, request.arch, request.version}, repo_map, archs);

    // A winner of another arch takes the place of the installed name.arch it
    // was chosen for.
    const std::string superseded = request.name + "." + request.arch;
    const bool arch_change = !request.arch.empty() && target.spec().arch != request.arch &&
                             find_state(state, superseded) != nullptr;

    const PackageState* inst = find_state(state, target.id().key());
    if (!inst && arch_change) inst = find_state(state, superseded);
    if (inst) {
        const int c = Version::compare(inst->package_spec.version.str(), target.spec().version.str());
        if (c == 0) {
            log_info(string_format("info.already_installed", inst->package_spec.to_string()));
            return {};
        }
        if (c > 0 && !request.allow_downgrade) {
            log_info(string_format("info.newer_installed", inst->package_spec.to_string(), target.spec().to_string()));
            return {};
        }
    }

    Closure closure(state, repo_map, archs);
    closure.visit(target);
    const auto& members = closure.members();

    // Replacements, keyed by installed package, valued by the member replacing it.
    std::map<std::string, std::string> removal;
    for (const auto& key : closure.order()) {
        const Candidate& m = members.at(key);
        for (const auto& pattern : m.spec().replace_patterns()) {
            for (const auto& s : state) {
                if (members.contains(s.key()) || !pattern.matches(s.package_spec.id())) continue;
                for (const auto& back : s.package_spec.replace_patterns()) {
                    if (back.matches(m.id())) {
                        throw GoogetException(string_format("error.replacement_cycle", m.spec().to_string(), s.package_spec.to_string()),
                                              ErrorKind::ReplacementCycle);
                    }
                }
                removal.try_emplace(s.key(), key);
            }
            for (const auto& [other_key, other] : members) {
                if (other_key == key || !pattern.matches(other.id())) continue;
                for (const auto& back : other.spec().replace_patterns()) {
                    if (back.matches(m.id())) {
                        throw GoogetException(string_format("error.replacement_cycle", m.spec().to_string(), other.spec().to_string()),
                                              ErrorKind::ReplacementCycle);
                    }
                }
                throw GoogetException(string_format("error.replaces_plan_member", m.spec().to_string(), other.spec().to_string()),
                                      ErrorKind::PackageConflict);
            }
        }
    }

    if (arch_change && !members.contains(superseded)) {
        removal.try_emplace(superseded, target.id().key());
    }

    // Installed packages depending on something removed go too, unless the
    // plan itself satisfies that dependency.
    for (bool changed = true; changed;) {
        changed = false;
        for (const auto& s : state) {
            if (removal.contains(s.key()) || members.contains(s.key())) continue;
            for (const auto& dep : s.package_spec.dependency_requests()) {
                auto hit = std::ranges::find_if(removal, [&](const auto& kv) {
                    const auto id = split_key(kv.first);
                    return id.first == dep.name && (!dep.arch_explicit || id.second == dep.arch);
                });
                if (hit == removal.end() || closure.satisfied_by_member(dep)) continue;
                removal.emplace(s.key(), hit->second);
                changed = true;
                break;
            }
        }
    }

    for (const auto& [member, installed] : closure.installed_deps()) {
        if (removal.contains(installed)) {
            throw GoogetException(string_format("error.dependency_replaced", members.at(member).spec().to_string(), installed),
                                  ErrorKind::UnsatisfiableDependency);
        }
    }

    // Conflicts against what remains installed and against the rest of the plan.
    for (const auto& [key, m] : members) {
        for (const auto& pattern : m.spec().conflict_patterns()) {
            for (const auto& s : state) {
                if (members.contains(s.key()) || removal.contains(s.key())) continue;
                if (pattern.matches(s.package_spec.id())) {
                    throw GoogetException(string_format("error.package_conflict", m.spec().to_string(), s.package_spec.to_string()),
                                          ErrorKind::PackageConflict);
                }
            }
            for (const auto& [other_key, other] : members) {
                if (other_key != key && pattern.matches(other.id())) {
                    throw GoogetException(string_format("error.package_conflict", m.spec().to_string(), other.spec().to_string()),
                                          ErrorKind::PackageConflict);
                }
            }
        }
        for (const auto& s : state) {
            if (members.contains(s.key()) || removal.contains(s.key())) continue;
            for (const auto& pattern : s.package_spec.conflict_patterns()) {
                if (pattern.matches(m.id())) {
                    throw GoogetException(string_format("error.package_conflict", m.spec().to_string(), s.package_spec.to_string()),
                                          ErrorKind::PackageConflict);
                }
            }
        }
    }

    InstallPlan plan;
    for (const auto& key : closure.order()) {
        const Candidate& m = members.at(key);
        std::set<std::string> triggered;
        for (const auto& [removed, by] : removal) {
            if (by == key) triggered.insert(removed);
        }
        for (auto& id : order_leaves_first(triggered, state)) {
            plan.steps.push_back(PlanStep{StepAction::Remove, std::move(id), std::nullopt, m.spec().to_string()});
        }
        plan.steps.push_back(PlanStep{StepAction::Install, m.id(), m, ""});
    }
    return plan;
}

bool needs_installation(const PackageId& id, const GooGetState& state) {
    for (const auto& s : state) {
        if (s.package_spec.name == id.name && s.package_spec.arch == id.arch) {
            return Version::compare(s.package_spec.version.str(), id.version) < 0;
        }
    }
    return true;
}

bool dependency_installed(const DependencyRequest& dep, const GooGetState& state) {
    return std::ranges::any_of(state, [&](const PackageState& s) { return satisfies(dep, s.package_spec); });
}

bool depends_on(const PkgSpec& spec, const std::string& name, const std::string& arch) {
    for (const auto& key : spec.dependencies | std::views::keys) {
        const auto [dep_name, dep_arch] = split_key(key);
        if (dep_name == name && (dep_arch.empty() || dep_arch == arch)) {
            return true;
        }
    }
    return false;
}

std::vector<PackageId> enumerate_dependents(const std::string& name, const std::string& arch, const GooGetState& state) {
    const std::string root = name + "." + arch;
    std::set<std::string> found;
    std::vector<std::pair<std::string, std::string>> work{{name, arch}};
    while (!work.empty()) {
        const auto [n, a] = work.back();
        work.pop_back();
        for (const auto& s : state) {
            if (s.key() == root || found.contains(s.key())) continue;
            if (depends_on(s.package_spec, n, a)) {
                found.insert(s.key());
                work.emplace_back(s.package_spec.name, s.package_spec.arch);
            }
        }
    }

    std::vector<PackageId> ordered = order_leaves_first(found, state);
    if (const PackageState* s = find_state(state, root)) {
        ordered.push_back(s->package_spec.id());
    } else {
        ordered.push_back({name, arch, ""});
    }
    return ordered;
}

std::vector<Candidate> list_dependencies(const Candidate& root, const RepoMap& repo_map,
                                         const std::vector<std::string>& archs) {
    std::vector<Candidate> out;
    std::set<std::string> seen;
    std::function<void(const Candidate&)> walk = [&](const Candidate& c) {
        if (!seen.insert(c.id().key()).second) return;
        for (const auto& dep : c.spec().dependency_requests()) {
            walk(choose_dependency(dep, c.spec().to_string(), repo_map, archs));
        }
        out.push_back(c);
    };
    walk(root);
    return out;
}
