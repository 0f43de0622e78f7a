#include "script.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <string_view>
#include <thread>
#include <vector>

extern char** environ;

namespace {

// Descriptor closed on scope exit.
class FdGuard {
public:
    explicit FdGuard(int fd) : fd_(fd) {}
    ~FdGuard() { if (fd_ >= 0) close(fd_); }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;
    int get() const { return fd_; }

private:
    int fd_;
};

std::vector<std::string> command_line(const fs::path& script, const ExecFile& ef) {
    std::vector<std::string> args;
    if (script.extension() == ".sh") {
        args.push_back("/bin/sh");
    }
    args.push_back(script.string());
    args.insert(args.end(), ef.args.begin(), ef.args.end());
    return args;
}

// The current environment with overrides applied, as KEY=VALUE strings.
std::vector<std::string> environment_block(const ScriptEnv& overrides) {
    std::vector<std::string> block;
    for (char** e = environ; e && *e; ++e) {
        const std::string_view entry(*e);
        const std::string key(entry.substr(0, entry.find('=')));
        if (!overrides.contains(key)) block.emplace_back(entry);
    }
    for (const auto& [key, value] : overrides) {
        block.push_back(key + "=" + value);
    }
    return block;
}

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

} // anonymous namespace

int run_exec_file(const fs::path& dir, const ExecFile& ef, const std::string& log_name, const ScriptEnv& env) {
    const fs::path script = validate_path(ef.path, dir);
    if (!fs::exists(script)) {
        throw GoogetException(string_format("error.script_not_found", script.string()), ErrorKind::ScriptError);
    }

    const fs::path log_path = dir / log_name;
    FdGuard log_fd(open(log_path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644));
    if (log_fd.get() < 0) {
        throw GoogetException(string_format("error.create_file_failed", log_path.string()), ErrorKind::Io);
    }

    const std::vector<std::string> args = command_line(script, ef);
    std::vector<char*> c_args;
    for (const auto& arg : args) c_args.push_back(const_cast<char*>(arg.c_str()));
    c_args.push_back(nullptr);
    const std::vector<std::string> env_block = environment_block(env);
    std::vector<char*> c_env;
    for (const auto& e : env_block) c_env.push_back(const_cast<char*>(e.c_str()));
    c_env.push_back(nullptr);

    log_info(string_format("info.running_script", ef.path));
    pid_t pid = fork();
    if (pid == -1) {
        throw GoogetException(string_format("error.script_fork_failed", std::string(strerror(errno))), ErrorKind::ScriptError);
    }
    if (pid == 0) {
        if (chdir(dir.c_str()) != 0) _exit(126);
        if (dup2(log_fd.get(), STDOUT_FILENO) < 0 || dup2(log_fd.get(), STDERR_FILENO) < 0) _exit(126);
        execve(c_args[0], c_args.data(), c_env.data());
        _exit(127);
    }

    int status = 0;
    while (true) {
        const pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid) break;
        if (r < 0 && errno != EINTR) {
            throw GoogetException(string_format("error.script_wait_failed", std::string(strerror(errno))), ErrorKind::ScriptError);
        }
        if (cancellation_requested()) {
            kill(pid, SIGTERM);
            waitpid(pid, &status, 0);
            throw GoogetException(string_format("error.script_cancelled", ef.path), ErrorKind::ScriptError);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    const int code = decode_status(status);
    if (code != 0 && std::ranges::find(ef.exit_codes, code) == ef.exit_codes.end()) {
        throw GoogetException(string_format("error.script_failed", ef.path, code, log_path.string()), ErrorKind::ScriptError);
    }
    log_debug(string_format("info.script_finished", ef.path, code));
    return code;
}
