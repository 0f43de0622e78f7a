#pragma once

#include "pkgspec.hpp"

#include <filesystem>
#include <map>
#include <string>

namespace fs = std::filesystem;

using ScriptEnv = std::map<std::string, std::string>;

// Runs ef.path (relative to dir) with ef.args, dir as working directory and
// output appended to dir/log_name. Exit code 0 or one listed in
// ef.exit_codes is success. Cancellation terminates the child. Returns the
// exit code; throws ScriptError otherwise.
int run_exec_file(const fs::path& dir, const ExecFile& ef, const std::string& log_name, const ScriptEnv& env);
