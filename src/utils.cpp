#include "utils.hpp"

#include "exception.hpp"
#include "localization.hpp"

#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>
#include <fcntl.h>

#include <atomic>
#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace {
    NonInteractiveMode non_interactive_mode = NonInteractiveMode::INTERACTIVE;
    bool verbose_mode = false;
    bool quiet_mode = false;
    std::mutex log_mutex;
    std::ofstream log_file;
    bool is_stdout_tty = false;
    bool is_stderr_tty = false;
    bool tty_check_performed = false;
    std::atomic<bool> cancel_flag{false};

    void write_log_file(std::string_view level, std::string_view msg) {
        if (!log_file.is_open()) return;
        std::time_t now = std::time(nullptr);
        std::tm tm_buf{};
        localtime_r(&now, &tm_buf);
        log_file << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << " " << level << " " << msg << '\n';
        log_file.flush();
    }

    void log_internal(std::string_view level, std::string_view prefix, std::string_view color,
                      std::string_view msg, std::ostream& stream, bool console) {
        std::lock_guard<std::mutex> lock(log_mutex);

        write_log_file(level, msg);
        if (!console || quiet_mode) return;

        if (!tty_check_performed) {
            is_stdout_tty = isatty(STDOUT_FILENO);
            is_stderr_tty = isatty(STDERR_FILENO);
            tty_check_performed = true;
        }

        bool current_stream_is_tty = false;
        if (&stream == &std::cout) {
            current_stream_is_tty = is_stdout_tty;
        } else if (&stream == &std::cerr) {
            current_stream_is_tty = is_stderr_tty;
        }

        if (current_stream_is_tty) {
            stream << color << prefix << COLOR_WHITE << msg << COLOR_RESET << std::endl;
        } else {
            stream << prefix << msg << std::endl;
        }
    }

    void on_signal(int) {
        cancel_flag.store(true);
    }
}

void log_info(std::string_view msg) {
    log_internal("INFO", get_string("info.log_prefix"), COLOR_GREEN, msg, std::cout, true);
}

void log_warning(std::string_view msg) {
    log_internal("WARNING", get_string("warning.prefix") + " ", COLOR_YELLOW, msg, std::cerr, true);
}

void log_error(std::string_view msg) {
    log_internal("ERROR", get_string("error.prefix") + " ", COLOR_RED, msg, std::cerr, true);
}

void log_debug(std::string_view msg) {
    log_internal("DEBUG", get_string("debug.prefix") + " ", COLOR_WHITE, msg, std::cout, verbose_mode);
}

void log_progress(const std::string& msg, double percentage, int bar_width) {
    {
        std::lock_guard<std::mutex> lock(log_mutex);
        if (!tty_check_performed) {
            is_stdout_tty = isatty(STDOUT_FILENO);
            is_stderr_tty = isatty(STDERR_FILENO);
            tty_check_performed = true;
        }

        if (!is_stdout_tty || quiet_mode) {
            return;
        }
    }

    int pos = static_cast<int>(bar_width * percentage / 100.0);

    std::cout << "\r" << COLOR_GREEN << "==> " << COLOR_WHITE << msg << " [";
    for (int i = 0; i < bar_width; ++i) {
        if (i < pos) std::cout << "#";
        else if (i == pos) std::cout << ">";
        else std::cout << "-";
    }
    std::cout << "] " << std::fixed << std::setprecision(1) << percentage << "%" << COLOR_RESET << std::flush;
}

void set_verbose_mode(bool enable) {
    verbose_mode = enable;
}

void set_quiet_mode(bool enable) {
    quiet_mode = enable;
}

void set_log_file(const fs::path& path) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_file.is_open()) log_file.close();
    log_file.open(path, std::ios::app);
    if (!log_file.is_open()) {
        std::cerr << string_format("warning.log_file_unavailable", path.string()) << std::endl;
    }
}

void close_log_file() {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_file.is_open()) log_file.close();
}

void set_non_interactive_mode(NonInteractiveMode mode) {
    non_interactive_mode = mode;
}

NonInteractiveMode get_non_interactive_mode() {
    return non_interactive_mode;
}

bool user_confirms(const std::string& prompt) {
    switch (get_non_interactive_mode()) {
        case NonInteractiveMode::YES:
            return true;
        case NonInteractiveMode::NO:
            return false;
        case NonInteractiveMode::INTERACTIVE:
        default:
            std::cout << prompt << " " << get_string("prompt.yes_no") << " ";
            std::string response;
            std::cin >> response;
            return (response == "y" || response == "Y");
    }
}

void install_signal_handlers() {
    struct sigaction sa{};
    sa.sa_handler = on_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

void request_cancellation() {
    cancel_flag.store(true);
}

void reset_cancellation() {
    cancel_flag.store(false);
}

bool cancellation_requested() {
    return cancel_flag.load();
}

FileLock::FileLock(const fs::path& path) : path_(path) {
    if (path_.has_parent_path()) ensure_dir_exists(path_.parent_path());
    lock_fd = open(path_.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (lock_fd < 0) {
        throw GoogetException(string_format("error.create_file_failed", path_.string()), ErrorKind::Io);
    }

    if (flock(lock_fd, LOCK_EX | LOCK_NB) < 0) {
        int err = errno;
        close(lock_fd);
        lock_fd = -1;
        if (err == EWOULDBLOCK) {
            throw GoogetException(string_format("error.db_locked", path_.string()), ErrorKind::DBBusy);
        }
        throw GoogetException(string_format("error.db_lock_failed", path_.string(), std::strerror(err)), ErrorKind::DBBusy);
    }

    // Record the holder for operators inspecting a busy lock.
    const std::string pid = std::to_string(getpid()) + "\n";
    if (ftruncate(lock_fd, 0) == 0) {
        (void)!write(lock_fd, pid.data(), pid.size());
    }
}

FileLock::~FileLock() {
    if (lock_fd != -1) {
        flock(lock_fd, LOCK_UN);
        close(lock_fd);
        lock_fd = -1;
    }
}

void ensure_dir_exists(const fs::path& path) {
    if (!fs::exists(path)) {
        std::error_code ec;
        if (!fs::create_directories(path, ec) && ec) {
            throw GoogetException(string_format("error.create_dir_failed", path.string()) + ": " + ec.message(), ErrorKind::Io);
        }
    }
    else if (!fs::is_directory(path)) {
        throw GoogetException(string_format("error.path_not_dir", path.string()), ErrorKind::Io);
    }
}

fs::path validate_path(const fs::path& path, const fs::path& root) {
    if (path.is_absolute()) {
        throw GoogetException(string_format("error.path_not_relative", path.string()), ErrorKind::ParseError);
    }

    fs::path normalized = path.lexically_normal();
    for (const auto& component : normalized) {
        if (component == "..") {
            throw GoogetException(string_format("error.path_traversal", path.string()), ErrorKind::ParseError);
        }
    }
    return root / normalized;
}

void write_file_atomically(const fs::path& path, const std::string& content) {
    fs::path tmp_path = path.string() + ".tmp";
    {
        std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw GoogetException(string_format("error.create_file_failed", tmp_path.string()), ErrorKind::Io);
        }
        file << content;
        file.flush();
        if (!file) {
            throw GoogetException(string_format("error.write_file_failed", tmp_path.string()), ErrorKind::Io);
        }
    }
    // Flush the data before the rename makes it visible.
    int fd = open(tmp_path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd >= 0) {
        fsync(fd);
        close(fd);
    }
    std::error_code ec;
    fs::rename(tmp_path, path, ec);
    if (ec) {
        fs::remove(tmp_path, ec);
        throw GoogetException(string_format("error.write_file_failed", path.string()), ErrorKind::Io);
    }
}

std::string read_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw GoogetException(string_format("error.open_file_failed", path.string()), ErrorKind::Io);
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

std::vector<std::string> split(std::string_view s, char delim) {
    std::vector<std::string> res;
    size_t start = 0, end = 0;
    while ((end = s.find(delim, start)) != std::string_view::npos) {
        res.emplace_back(s.substr(start, end - start));
        start = end + 1;
    }
    res.emplace_back(s.substr(start));
    return res;
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

std::string trim(std::string_view s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return std::string(s.substr(b, e - b));
}

std::chrono::seconds parse_duration(const std::string& text) {
    const std::string t = trim(text);
    if (t.empty()) {
        throw GoogetException(string_format("error.invalid_duration", text), ErrorKind::ParseError);
    }

    long long total = 0;
    long long value = 0;
    bool have_digits = false;
    for (char c : t) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            value = value * 10 + (c - '0');
            have_digits = true;
            continue;
        }
        if (!have_digits) {
            throw GoogetException(string_format("error.invalid_duration", text), ErrorKind::ParseError);
        }
        switch (c) {
            case 'h': total += value * 3600; break;
            case 'm': total += value * 60; break;
            case 's': total += value; break;
            default:
                throw GoogetException(string_format("error.invalid_duration", text), ErrorKind::ParseError);
        }
        value = 0;
        have_digits = false;
    }
    if (have_digits) total += value;
    return std::chrono::seconds(total);
}
