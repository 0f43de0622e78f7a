#include "commands.hpp"
#include "downloader.hpp"
#include "environment.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <cxxopts.hpp>

#include <iostream>
#include <set>
#include <string>
#include <vector>

namespace {

void print_usage(const cxxopts::Options& options, const CommandRegistry& registry) {
    std::cerr << options.help({"", "command"});
    std::cerr << get_string("info.commands") << std::endl;
    for (const auto& cmd : registry.commands()) {
        std::cerr << "  " << cmd.name << ": " << cmd.synopsis << std::endl;
        std::cerr << "      " << cmd.usage << std::endl;
    }
}

// Every command flag is known to the parser; dispatch rejects flags the
// chosen command does not declare.
void add_command_flags(cxxopts::Options& options, const CommandRegistry& registry) {
    std::set<std::string> seen;
    auto adder = options.add_options("command");
    for (const auto& cmd : registry.commands()) {
        for (const auto& flag : cmd.flags) {
            if (!seen.insert(flag.name).second) continue;
            if (flag.takes_value) {
                adder(flag.name, flag.help, cxxopts::value<std::string>());
            } else {
                adder(flag.name, flag.help, cxxopts::value<bool>()->default_value("false"));
            }
        }
    }
}

CommandArgs collect_args(const cxxopts::ParseResult& result) {
    CommandArgs args;
    if (result.count("args")) {
        args.positional = result["args"].as<std::vector<std::string>>();
    }
    for (const auto& kv : result.arguments()) {
        const std::string& key = kv.key();
        if (key == "command" || key == "args" || key == "root" || key == "noconfirm" || key == "verbose" ||
            key == "quiet") {
            continue;
        }
        args.values[key] = kv.value();
    }
    return args;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    init_localization();
    const CommandRegistry registry = build_command_registry();

    cxxopts::Options options(argv[0], string_format("info.usage", argv[0]));
    options.add_options()
        ("h,help", get_string("info.help_desc"))
        ("root", get_string("info.root_desc"), cxxopts::value<std::string>()->default_value(""))
        ("noconfirm", get_string("info.noconfirm_desc"), cxxopts::value<bool>()->default_value("false"))
        ("verbose", get_string("info.verbose_desc"), cxxopts::value<bool>()->default_value("false"))
        ("quiet", get_string("info.quiet_desc"), cxxopts::value<bool>()->default_value("false"))
        ("command", "", cxxopts::value<std::string>())
        ("args", "", cxxopts::value<std::vector<std::string>>());
    add_command_flags(options, registry);
    options.parse_positional({"command", "args"});

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help") || !result.count("command")) {
            print_usage(options, registry);
            return result.count("help") ? 0 : exit_code_for(ErrorKind::Usage);
        }

        const std::string command = result["command"].as<std::string>();
        const Command* cmd = registry.find(command);
        if (!cmd) {
            log_error(string_format("error.unknown_command", command));
            print_usage(options, registry);
            return exit_code_for(ErrorKind::Usage);
        }

        Environment env = make_environment(resolve_root(result["root"].as<std::string>()));
        env.confirm = !result["noconfirm"].as<bool>();
        env.verbose = result["verbose"].as<bool>();
        set_verbose_mode(env.verbose);
        set_quiet_mode(result["quiet"].as<bool>());
        if (!env.confirm) {
            set_non_interactive_mode(NonInteractiveMode::YES);
        }
        if (cmd->mutates_state) {
            init_filesystem(env);
            set_log_file(env.log_file);
        }

        CurlGlobalInitializer curl;
        install_signal_handlers();
        const Downloader downloader(env.proxy_server);
        CommandContext ctx{env, downloader, std::cout};

        const int rc = dispatch(registry, command, ctx, collect_args(result));
        close_log_file();
        return rc;
    } catch (const cxxopts::exceptions::exception& e) {
        log_error(string_format("error.cmd_parse_error", e.what()));
        return exit_code_for(ErrorKind::Usage);
    } catch (const GoogetException& e) {
        log_error(string_format("error.googet_error", error_kind_name(e.kind()), e.what()));
        close_log_file();
        return exit_code_for(e.kind());
    } catch (const std::exception& e) {
        log_error(string_format("error.unexpected_error", e.what()));
        close_log_file();
        return exit_code_for(ErrorKind::Generic);
    }
}
