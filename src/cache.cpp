#include "cache.hpp"
#include "exception.hpp"
#include "hash.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <unistd.h>

DownloadCache::DownloadCache(fs::path dir) : dir_(std::move(dir)) {}

fs::path DownloadCache::archive_path(const PackageId& id) const {
    return dir_ / id.archive_name();
}

fs::path DownloadCache::unpack_dir(const PackageId& id) const {
    fs::path p = archive_path(id);
    p.replace_extension();
    return p;
}

std::optional<fs::path> DownloadCache::lookup(const PackageId& id, const std::string& checksum) const {
    const fs::path path = archive_path(id);
    if (!fs::is_regular_file(path)) {
        return std::nullopt;
    }
    if (checksum.empty()) {
        return path;
    }
    const std::string actual = calculate_sha256(path);
    if (!checksums_equal(actual, checksum)) {
        log_debug(string_format("info.cache_checksum_stale", path.string(), actual, checksum));
        return std::nullopt;
    }
    return path;
}

fs::path DownloadCache::temp_path_for(const PackageId& id) {
    return dir_ / (id.archive_name() + "." + std::to_string(getpid()) + "." + std::to_string(temp_counter_++) + ".part");
}

fs::path DownloadCache::store(const PackageId& id, const std::string& checksum, const Fetcher& fetch) {
    ensure_dir_exists(dir_);
    const fs::path tmp = temp_path_for(id);
    const fs::path dst = archive_path(id);

    try {
        fetch(tmp);
        if (!fs::is_regular_file(tmp)) {
            throw GoogetException(string_format("error.download_no_output", id.to_string()), ErrorKind::DownloadError);
        }
        if (!checksum.empty()) {
            const std::string actual = calculate_sha256(tmp);
            if (!checksums_equal(actual, checksum)) {
                throw GoogetException(string_format("error.checksum_mismatch", id.to_string(), checksum, actual),
                                      ErrorKind::ChecksumMismatch);
            }
        }
        fs::rename(tmp, dst);
    } catch (...) {
        std::error_code ec;
        fs::remove(tmp, ec);
        throw;
    }
    return dst;
}

void DownloadCache::remove(const fs::path& path) const {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        throw GoogetException(string_format("error.remove_failed", path.string(), ec.message()), ErrorKind::Io);
    }
}

bool DownloadCache::contains(const fs::path& path) const {
    const fs::path rel = fs::weakly_canonical(path).lexically_relative(fs::weakly_canonical(dir_));
    return !rel.empty() && *rel.begin() != "..";
}
