#include "commands.hpp"

#include "cache.hpp"
#include "clean.hpp"
#include "database.hpp"
#include "downloader.hpp"
#include "exception.hpp"
#include "installer.hpp"
#include "localization.hpp"
#include "repo_file.hpp"
#include "repository.hpp"
#include "resolver.hpp"
#include "utils.hpp"

#include <algorithm>
#include <optional>
#include <ranges>
#include <set>

namespace {

bool confirm(const CommandContext& ctx, const std::string& prompt) {
    return !ctx.env.confirm || user_confirms(prompt);
}

RepoMap load_repo_map(const CommandContext& ctx, const CommandArgs& args) {
    const std::string sources = args.value("sources");
    const RepoSources repos = sources.empty() ? build_sources(ctx.env) : sources_from_list(sources);
    if (repos.empty()) {
        throw GoogetException(get_string("error.no_repos"), ErrorKind::Usage);
    }
    return fetch_repo_map(repos, ctx.env, ctx.downloader);
}

// Installed states matching a possibly partial name[.arch[.version]].
std::vector<PackageState> match_installed(const GooGetState& state, const PackageId& pi) {
    std::vector<PackageState> out;
    for (const auto& s : state) {
        const PkgSpec& ps = s.package_spec;
        if (ps.name != pi.name) continue;
        if (!pi.arch.empty() && ps.arch != pi.arch) continue;
        if (!pi.version.empty() && ps.version.str() != pi.version) continue;
        out.push_back(s);
    }
    return out;
}

// Resolves one installed package for arg. Logs and returns nullopt when
// nothing or more than one package matches.
std::optional<PackageState> single_installed(const GooGetState& state, const std::string& arg) {
    const auto matches = match_installed(state, parse_package_id(arg));
    if (matches.empty()) {
        log_error(string_format("error.package_not_installed", arg));
        return std::nullopt;
    }
    if (matches.size() > 1) {
        std::string choices;
        for (const auto& m : matches) choices += " " + m.key();
        log_error(string_format("error.ambiguous_installed", arg, choices));
        return std::nullopt;
    }
    return matches.front();
}

void print_spec_info(std::ostream& out, const PkgSpec& spec, const std::string& state) {
    out << "\n";
    out << "  Name: " << spec.name << "\n";
    out << "  Arch: " << spec.arch << "\n";
    out << "  Version: " << spec.version.str() << "\n";
    out << "  State: " << state << "\n";
    if (!spec.description.empty()) out << "  Description: " << spec.description << "\n";
    if (!spec.license.empty()) out << "  License: " << spec.license << "\n";
    if (!spec.authors.empty()) out << "  Authors: " << spec.authors << "\n";
    if (!spec.owners.empty()) out << "  Owners: " << spec.owners << "\n";
    if (!spec.source.empty()) out << "  Source: " << spec.source << "\n";
    if (!spec.dependencies.empty()) {
        out << "  Dependencies:\n";
        for (const auto& [dep, ver] : spec.dependencies) out << "    " << dep << " " << ver << "\n";
    }
    if (!spec.replaces.empty()) {
        out << "  Replaces:\n";
        for (const auto& r : spec.replaces) out << "    " << r << "\n";
    }
    if (!spec.conflicts.empty()) {
        out << "  Conflicts:\n";
        for (const auto& c : spec.conflicts) out << "    " << c << "\n";
    }
    if (!spec.tags.empty()) {
        out << "  Tags:\n";
        for (const auto& [k, v] : spec.tags) out << "    " << k << ": " << v << "\n";
    }
}

bool confirm_plan(const CommandContext& ctx, const InstallPlan& plan) {
    if (!ctx.env.confirm) return true;
    std::string prompt = get_string("info.plan_header") + "\n";
    for (const auto& step : plan.steps) {
        switch (step.action) {
            case StepAction::Install:
                prompt += "  + " + step.id.to_string() + "\n";
                break;
            case StepAction::Reinstall:
                prompt += "  * " + step.id.to_string() + "\n";
                break;
            case StepAction::Remove:
                prompt += "  - " + step.id.to_string() + " (" + string_format("info.replaced_by", step.reason) + ")\n";
                break;
        }
    }
    return user_confirms(prompt + get_string("info.confirm_proceed"));
}

// ---------------------------------------------------------------------------
// Handlers

int cmd_install(CommandContext& ctx, const CommandArgs& args) {
    StateDB db(ctx.env.db_file);
    DownloadCache cache(ctx.env.cache_dir);
    InstallContext ictx{ctx.env, db, cache, ctx.downloader};
    const InstallOptions options{.db_only = args.flag("db_only"), .redownload = args.flag("redownload")};
    const bool reinstall = args.flag("reinstall");

    std::optional<RepoMap> repo_map;
    for (const auto& arg : args.positional) {
        if (arg.ends_with(".goo")) {
            if (install_from_file(ictx, arg, options, reinstall)) {
                log_info(string_format("info.install_completed", arg));
            }
            continue;
        }

        if (!repo_map) repo_map = load_repo_map(ctx, args);
        InstallRequest request = make_install_request(arg);
        request.reinstall = reinstall;
        const InstallPlan plan = resolve_install(request, db.fetch_all(), *repo_map, ctx.env.archs);
        if (plan.empty()) continue;
        if (!confirm_plan(ctx, plan)) {
            log_info(get_string("info.operation_cancelled"));
            continue;
        }
        execute_plan(ictx, plan, options);
        log_info(string_format("info.install_completed", arg));
    }
    return 0;
}

int cmd_remove(CommandContext& ctx, const CommandArgs& args) {
    StateDB db(ctx.env.db_file);
    DownloadCache cache(ctx.env.cache_dir);
    InstallContext ictx{ctx.env, db, cache, ctx.downloader};

    int rc = 0;
    for (const auto& arg : args.positional) {
        const auto target = single_installed(db.fetch_all(), arg);
        if (!target) {
            rc = 1;
            continue;
        }
        const PkgSpec& spec = target->package_spec;
        const auto order = enumerate_dependents(spec.name, spec.arch, db.fetch_all());
        if (ctx.env.confirm) {
            std::string prompt = get_string("info.remove_header") + "\n";
            for (const auto& id : order) prompt += "  " + id.to_string() + "\n";
            if (!user_confirms(prompt + string_format("info.remove_confirm", spec.name))) {
                log_info(get_string("info.operation_cancelled"));
                continue;
            }
        }
        remove_with_dependents(ictx, spec.name, spec.arch, args.flag("db_only"));
        ctx.out << string_format("info.removal_completed", spec.name) << "\n";
    }
    return rc;
}

int cmd_update(CommandContext& ctx, const CommandArgs& args) {
    StateDB db(ctx.env.db_file);
    DownloadCache cache(ctx.env.cache_dir);
    InstallContext ictx{ctx.env, db, cache, ctx.downloader};
    const RepoMap repo_map = load_repo_map(ctx, args);

    const auto updates = compute_updates(installed_packages(db.fetch_all()), repo_map, ctx.env.archs);
    if (updates.empty()) {
        ctx.out << get_string("info.no_updates") << "\n";
        return 0;
    }

    std::string prompt = get_string("info.updates_header") + "\n";
    for (const auto& u : updates) {
        prompt += "  " + u.name + "." + u.arch + " " + u.installed_version + " -> " + u.candidate.spec().version.str() + "\n";
    }
    if (!confirm(ctx, prompt + get_string("info.confirm_proceed"))) {
        log_info(get_string("info.operation_cancelled"));
        return 0;
    }

    const InstallOptions options{.db_only = args.flag("db_only"), .redownload = false};
    for (const auto& u : updates) {
        const InstallRequest request{
            .name = u.name,
            .arch = u.arch,
            .version = u.candidate.spec().version.str(),
            .reinstall = false,
            .allow_downgrade = true,
        };
        const InstallPlan plan = resolve_install(request, db.fetch_all(), repo_map, ctx.env.archs);
        execute_plan(ictx, plan, options);
    }
    log_info(get_string("info.update_completed"));
    return 0;
}

int cmd_check(CommandContext& ctx, const CommandArgs& args) {
    StateDB db(ctx.env.db_file);
    const auto installed = installed_packages(db.fetch_all());
    db.close();

    const auto updates = compute_updates(installed, load_repo_map(ctx, args), ctx.env.archs);
    if (updates.empty()) {
        ctx.out << get_string("info.no_updates") << "\n";
        return 0;
    }
    ctx.out << get_string("info.updates_header") << "\n";
    for (const auto& u : updates) {
        ctx.out << "  " << u.name << "." << u.arch << " " << u.installed_version << " -> "
                << u.candidate.spec().version.str() << " (" << u.candidate.repo << ")\n";
    }
    return 0;
}

int cmd_clean(CommandContext& ctx, const CommandArgs& args) {
    if (args.flag("all")) {
        clean_all(ctx.env.cache_dir);
        return 0;
    }

    StateDB db(ctx.env.db_file);
    const GooGetState state = db.fetch_all();
    if (const std::string packages = args.value("packages"); !packages.empty()) {
        std::set<std::string> names;
        for (const auto& n : split(packages, ',')) {
            if (const std::string t = trim(n); !t.empty()) names.insert(t);
        }
        clean_packages(state, names);
        return 0;
    }
    clean_uninstalled(ctx.env.cache_dir, state);
    return 0;
}

int cmd_addrepo(CommandContext& ctx, const CommandArgs& args) {
    RepoEntry entry{.name = args.positional[0], .url = args.positional[1]};

    std::string file = args.value("file", entry.name + ".repo");
    if (!file.ends_with(".repo")) {
        throw GoogetException(get_string("error.repo_file_suffix"), ErrorKind::Usage);
    }
    if (const std::string p = args.value("priority"); !p.empty()) {
        try {
            entry.priority = parse_priority(p);
        } catch (const GoogetException&) {
            throw GoogetException(string_format("error.invalid_priority", p), ErrorKind::Usage);
        }
    }

    ensure_dir_exists(ctx.env.repo_dir);
    const fs::path path = ctx.env.repo_dir / file;
    add_repo_entry(entry, path);
    ctx.out << string_format("info.repo_added", entry.name, entry.url, path.string()) << "\n";
    return 0;
}

int cmd_rmrepo(CommandContext& ctx, const CommandArgs& args) {
    const std::string& name = args.positional[0];
    if (remove_repo_entry(name, ctx.env.repo_dir) == 0) {
        log_warning(string_format("warning.repo_not_found", name));
        return 1;
    }
    ctx.out << string_format("info.repo_removed", name) << "\n";
    return 0;
}

int cmd_listrepos(CommandContext& ctx, const CommandArgs&) {
    for (const auto& rf : read_repo_files(ctx.env.repo_dir)) {
        ctx.out << rf.path.string() << ":\n";
        for (const auto& e : rf.entries) {
            ctx.out << "  " << e.name << ": " << e.url;
            if (e.priority != PRIORITY_DEFAULT) ctx.out << " (" << priority_to_string(e.priority) << ")";
            ctx.out << "\n";
        }
    }
    return 0;
}

int cmd_installed(CommandContext& ctx, const CommandArgs& args) {
    const std::string filter = args.positional.empty() ? "" : args.positional[0];
    StateDB db(ctx.env.db_file);
    GooGetState state = db.fetch_all(filter);
    db.close();

    if (state.empty()) {
        ctx.out << (filter.empty() ? get_string("info.nothing_installed")
                                   : string_format("info.no_installed_match", filter))
                << "\n";
        return 1;
    }
    ctx.out << (filter.empty() ? get_string("info.installed_header") : string_format("info.installed_match_header", filter))
            << "\n";

    std::ranges::sort(state, {}, &PackageState::key);
    for (const auto& s : state) {
        const PkgSpec& ps = s.package_spec;
        if (args.flag("info")) {
            print_spec_info(ctx.out, ps, "installed");
            continue;
        }
        ctx.out << "  " << ps.name << "." << ps.arch << " " << ps.version.str() << "\n";
        if (!args.flag("files")) continue;
        if (s.installed_files.empty()) {
            ctx.out << "  - " << get_string("info.no_managed_files") << "\n";
        }
        for (const auto& file : s.installed_files | std::views::keys) {
            ctx.out << "  - " << file << "\n";
        }
    }
    return 0;
}

int cmd_latest(CommandContext& ctx, const CommandArgs& args) {
    const PackageId pi = parse_package_id(args.positional[0]);
    const Candidate c = find_repo_latest(pi.name, pi.arch, load_repo_map(ctx, args), ctx.env.archs);
    const std::string latest = c.spec().version.str();
    if (!args.flag("compare")) {
        ctx.out << latest << "\n";
        return 0;
    }

    StateDB db(ctx.env.db_file);
    const auto installed = db.find(pi.name, c.spec().arch);
    db.close();
    if (!installed) {
        ctx.out << string_format("info.latest_not_installed", pi.name, latest) << "\n";
        return 0;
    }
    const std::string current = installed->package_spec.version.str();
    const int cmp = Version::compare(latest, current);
    if (cmp > 0) {
        ctx.out << string_format("info.latest_update_available", pi.name, current, latest) << "\n";
    } else if (cmp == 0) {
        ctx.out << string_format("info.latest_up_to_date", pi.name, current) << "\n";
    } else {
        ctx.out << string_format("info.latest_newer_installed", pi.name, current, latest) << "\n";
    }
    return 0;
}

int cmd_available(CommandContext& ctx, const CommandArgs& args) {
    const std::string filter = args.positional.empty() ? "" : args.positional[0];
    const RepoMap repo_map = load_repo_map(ctx, args);

    bool found = false;
    for (const auto& [url, repo] : repo_map) {
        std::vector<const PkgSpec*> specs;
        for (const auto& rs : repo.packages) {
            if (rs.package_spec.name.find(filter) != std::string::npos) specs.push_back(&rs.package_spec);
        }
        if (specs.empty()) continue;
        found = true;
        std::ranges::sort(specs, [](const PkgSpec* a, const PkgSpec* b) {
            if (a->name != b->name) return a->name < b->name;
            if (a->arch != b->arch) return a->arch < b->arch;
            return a->version < b->version;
        });
        ctx.out << url << "\n";
        for (const PkgSpec* ps : specs) {
            if (args.flag("info")) {
                print_spec_info(ctx.out, *ps, "available");
            } else {
                ctx.out << "  " << ps->name << "." << ps->arch << " " << ps->version.str() << "\n";
            }
        }
    }
    if (!found) {
        ctx.out << string_format("info.no_available_match", filter) << "\n";
        return 1;
    }
    return 0;
}

int cmd_verify(CommandContext& ctx, const CommandArgs& args) {
    StateDB db(ctx.env.db_file);
    DownloadCache cache(ctx.env.cache_dir);
    InstallContext ictx{ctx.env, db, cache, ctx.downloader};

    int rc = 0;
    for (const auto& arg : args.positional) {
        const auto target = single_installed(db.fetch_all(), arg);
        if (!target) {
            rc = 1;
            continue;
        }
        const std::string pkg = target->package_spec.to_string();
        if (!verify_package(ictx, *target, args.flag("skip_files"))) {
            if (!args.flag("reinstall")) {
                log_error(string_format("error.verify_failed", pkg));
                rc = 1;
                continue;
            }
            log_info(string_format("info.verify_reinstalling", pkg));
            reinstall_package(ictx, *target, InstallOptions{});
        }
        ctx.out << string_format("info.verify_completed", pkg) << "\n";
    }
    return rc;
}

int cmd_download(CommandContext& ctx, const CommandArgs& args) {
    const fs::path dir = args.value("download_dir", fs::current_path().string());
    const RepoMap repo_map = load_repo_map(ctx, args);

    int rc = 0;
    for (const auto& arg : args.positional) {
        try {
            const PackageId pi = parse_package_id(arg);
            const Candidate c = pi.version.empty() ? find_repo_latest(pi.name, pi.arch, repo_map, ctx.env.archs)
                                                   : find_repo_version(pi, repo_map, ctx.env.archs);
            const auto wanted = args.flag("deps") ? list_dependencies(c, repo_map, ctx.env.archs)
                                                  : std::vector<Candidate>{c};
            for (const auto& path : download_packages(wanted, dir, ctx.downloader)) {
                ctx.out << path.string() << "\n";
            }
        } catch (const GoogetException& e) {
            if (e.kind() == ErrorKind::Cancelled) throw;
            log_error(string_format("error.download_package_failed", arg, e.what()));
            rc = 1;
        }
    }
    return rc;
}

} // anonymous namespace

bool CommandArgs::flag(const std::string& name) const {
    auto it = values.find(name);
    return it != values.end() && it->second != "false";
}

std::string CommandArgs::value(const std::string& name, const std::string& fallback) const {
    auto it = values.find(name);
    return it == values.end() || it->second.empty() ? fallback : it->second;
}

void CommandRegistry::add(Command command) {
    if (find(command.name)) {
        throw GoogetException(string_format("error.duplicate_command", command.name), ErrorKind::Usage);
    }
    commands_.push_back(std::move(command));
}

const Command* CommandRegistry::find(const std::string& name) const {
    auto it = std::ranges::find(commands_, name, &Command::name);
    return it == commands_.end() ? nullptr : &*it;
}

CommandRegistry build_command_registry() {
    const FlagSpec sources{"sources", "comma separated list of sources, overrides local .repo files", true};
    const FlagSpec db_only{"db_only", "only make changes to the database, skip files and scripts"};

    CommandRegistry registry;
    registry.add({"install", "download and install a package and its dependencies",
                  "install [--reinstall] [--redownload] [--db_only] [--sources=<url,...>] <name|file.goo>...",
                  1, std::nullopt,
                  {{"reinstall", "reinstall an installed package"},
                   {"redownload", "ignore cached archives"},
                   db_only,
                   sources},
                  true, cmd_install});
    registry.add({"remove", "uninstall a package and every package depending on it",
                  "remove [--db_only] <name>...", 1, std::nullopt, {db_only}, true, cmd_remove});
    registry.add({"update", "update all installed packages to the versions the repos offer",
                  "update [--db_only] [--sources=<url,...>]", 0, 0, {db_only, sources}, true, cmd_update});
    registry.add({"check", "list installed packages with updates available",
                  "check [--sources=<url,...>]", 0, 0, {sources}, false, cmd_check});
    registry.add({"clean", "clean the cache directory", "clean [--all] [--packages=<name,...>]", 0, 0,
                  {{"all", "clear out the entire cache directory"},
                   {"packages", "comma separated list of packages to clear out of the cache", true}},
                  true, cmd_clean});
    registry.add({"addrepo", "add a repository", "addrepo [--file=<name.repo>] [--priority=<value>] <name> <url>", 2, 2,
                  {{"file", "repo file to add this repository to", true},
                   {"priority", "priority level assigned to the repository", true}},
                  true, cmd_addrepo});
    registry.add({"rmrepo", "remove a repository", "rmrepo <name>", 1, 1, {}, true, cmd_rmrepo});
    registry.add({"listrepos", "list repositories", "listrepos", 0, 0, {}, false, cmd_listrepos});
    registry.add({"installed", "list installed packages", "installed [--info] [--files] [filter]", 0, 1,
                  {{"info", "display package info"}, {"files", "display package file list"}}, false, cmd_installed});
    registry.add({"latest", "print the latest available version of a package",
                  "latest [--compare] [--sources=<url,...>] <name>", 1, 1,
                  {{"compare", "compare to the installed version"}, sources}, false, cmd_latest});
    registry.add({"available", "list available packages", "available [--info] [--sources=<url,...>] [filter]", 0, 1,
                  {{"info", "display package info"}, sources}, false, cmd_available});
    registry.add({"verify", "verify installed packages, reinstalling on request",
                  "verify [--skip_files] [--reinstall] <name>...", 1, std::nullopt,
                  {{"skip_files", "skip checksum verification of installed files"},
                   {"reinstall", "reinstall packages that fail verification"}},
                  true, cmd_verify});
    registry.add({"download", "download a package without installing it",
                  "download [--download_dir=<dir>] [--deps] [--sources=<url,...>] <name>...", 1, std::nullopt,
                  {{"download_dir", "directory to download packages to", true},
                   {"deps", "also download dependencies"},
                   sources},
                  false, cmd_download});
    return registry;
}

int dispatch(const CommandRegistry& registry, const std::string& name, CommandContext& ctx, const CommandArgs& args) {
    const Command* cmd = registry.find(name);
    if (!cmd) {
        throw GoogetException(string_format("error.unknown_command", name), ErrorKind::Usage);
    }
    for (const auto& given : args.values | std::views::keys) {
        if (std::ranges::find(cmd->flags, given, &FlagSpec::name) == cmd->flags.end()) {
            throw GoogetException(string_format("error.flag_not_supported", given, cmd->name), ErrorKind::Usage);
        }
    }

    const size_t n = args.positional.size();
    if (n < cmd->min_args || (cmd->max_args && n > *cmd->max_args)) {
        throw GoogetException(string_format("error.wrong_arg_count", cmd->name, cmd->usage), ErrorKind::Usage);
    }

    std::unique_ptr<FileLock> lock;
    if (cmd->mutates_state) {
        init_filesystem(ctx.env);
        lock = obtain_root_lock(ctx.env);
    }
    return cmd->handler(ctx, args);
}
