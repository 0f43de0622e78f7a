#pragma once

#include "exception.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

// Color codes
inline constexpr std::string_view COLOR_GREEN = "\033[1;32m";
inline constexpr std::string_view COLOR_WHITE = "\033[1;37m";
inline constexpr std::string_view COLOR_YELLOW = "\033[1;33m";
inline constexpr std::string_view COLOR_RED = "\033[1;31m";
inline constexpr std::string_view COLOR_RESET = "\033[0m";

// Log functions
void log_info(std::string_view msg);
void log_warning(std::string_view msg);
void log_error(std::string_view msg);
void log_debug(std::string_view msg);
void log_progress(const std::string& msg, double percentage, int bar_width = 50);

// Console output is suppressed in quiet mode; the detail log still receives every line.
void set_verbose_mode(bool enable);
void set_quiet_mode(bool enable);
void set_log_file(const fs::path& path);
void close_log_file();

// Interactive mode control
enum class NonInteractiveMode {
    INTERACTIVE,
    YES,
    NO
};

void set_non_interactive_mode(NonInteractiveMode mode);
NonInteractiveMode get_non_interactive_mode();

bool user_confirms(const std::string& prompt);

// Cancellation, raised by SIGINT/SIGTERM and polled by downloads and scripts.
void install_signal_handlers();
void request_cancellation();
void reset_cancellation();
bool cancellation_requested();

// Exclusive advisory lock on a file (RAII). Throws DBBusy when already held.
class FileLock {
public:
    explicit FileLock(const fs::path& path);
    ~FileLock();
    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
    int lock_fd = -1;
};

// Filesystem utilities
void ensure_dir_exists(const fs::path& path);
fs::path validate_path(const fs::path& path, const fs::path& root);
void write_file_atomically(const fs::path& path, const std::string& content);
std::string read_file(const fs::path& path);

// String utilities
std::vector<std::string> split(std::string_view s, char delim);
std::string to_lower(std::string_view s);
std::string trim(std::string_view s);

// Parses durations such as "90s", "3m", "1h30m" or a bare number of seconds.
std::chrono::seconds parse_duration(const std::string& text);
