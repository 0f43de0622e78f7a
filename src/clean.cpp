#include "clean.hpp"

#include "localization.hpp"
#include "utils.hpp"

#include <system_error>

namespace {

bool remove_entry(const fs::path& path) {
    std::error_code ec;
    const auto removed = fs::remove_all(path, ec);
    if (ec) {
        log_error(string_format("error.clean_remove_failed", path.string(), ec.message()));
        return false;
    }
    if (removed > 0) {
        log_debug(string_format("info.clean_removed", path.string()));
    }
    return removed > 0;
}

size_t clean_directory(const fs::path& cache_dir, const std::set<fs::path>& excluded) {
    std::error_code ec;
    if (!fs::is_directory(cache_dir, ec)) return 0;

    size_t count = 0;
    fs::directory_iterator it(cache_dir, ec);
    if (ec) {
        log_error(string_format("error.clean_remove_failed", cache_dir.string(), ec.message()));
        return 0;
    }
    for (const auto& entry : it) {
        if (excluded.contains(entry.path().lexically_normal())) continue;
        if (remove_entry(entry.path())) ++count;
    }
    return count;
}

} // anonymous namespace

size_t clean_all(const fs::path& cache_dir) {
    log_info(get_string("info.clean_all"));
    return clean_directory(cache_dir, {});
}

size_t clean_packages(const GooGetState& state, const std::set<std::string>& names) {
    size_t count = 0;
    for (const auto& s : state) {
        if (!names.contains(s.package_spec.name) || s.local_path.empty()) continue;
        log_info(string_format("info.clean_package", s.package_spec.to_string()));
        if (remove_entry(s.local_path)) ++count;
    }
    return count;
}

size_t clean_uninstalled(const fs::path& cache_dir, const GooGetState& state) {
    log_info(get_string("info.clean_uninstalled"));
    std::set<fs::path> keep;
    for (const auto& s : state) {
        if (!s.local_path.empty()) keep.insert(fs::path(s.local_path).lexically_normal());
    }
    return clean_directory(cache_dir, keep);
}
