#pragma once

#include "environment.hpp"

#include <functional>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

class Downloader;

// A flag a command accepts. Boolean flags take no value.
struct FlagSpec {
    std::string name;
    std::string help;
    bool takes_value = false;
};

// Arguments of one invocation after option parsing.
struct CommandArgs {
    std::vector<std::string> positional;
    std::map<std::string, std::string> values; // given flags; booleans hold "true"

    bool flag(const std::string& name) const;
    std::string value(const std::string& name, const std::string& fallback = "") const;
};

struct CommandContext {
    Environment& env;
    const Downloader& downloader;
    std::ostream& out;
};

using CommandHandler = std::function<int(CommandContext&, const CommandArgs&)>;

struct Command {
    std::string name;
    std::string synopsis;
    std::string usage;
    size_t min_args = 0;
    std::optional<size_t> max_args; // unbounded when unset
    std::vector<FlagSpec> flags;
    bool mutates_state = false; // runs under the installation lock
    CommandHandler handler;
};

class CommandRegistry {
public:
    // Throws Usage when name is already registered.
    void add(Command command);
    const Command* find(const std::string& name) const;
    const std::vector<Command>& commands() const { return commands_; }

private:
    std::vector<Command> commands_;
};

CommandRegistry build_command_registry();

// Runs the named command, holding the installation lock for commands that
// mutate state. Throws Usage for unknown commands or undeclared flags or a wrong
// number of arguments.
int dispatch(const CommandRegistry& registry, const std::string& name, CommandContext& ctx, const CommandArgs& args);
