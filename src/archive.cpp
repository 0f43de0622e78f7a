#include "archive.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <memory>

namespace {

// Custom deleters for libarchive handles
struct ArchiveReadDeleter {
    void operator()(struct archive* a) const {
        if (a) {
            archive_read_close(a);
            archive_read_free(a);
        }
    }
};

struct ArchiveWriteDeleter {
    void operator()(struct archive* a) const {
        if (a) {
            archive_write_close(a);
            archive_write_free(a);
        }
    }
};

using ArchiveReadHandle = std::unique_ptr<struct archive, ArchiveReadDeleter>;
using ArchiveWriteHandle = std::unique_ptr<struct archive, ArchiveWriteDeleter>;

ArchiveReadHandle open_package(const fs::path& archive_path) {
    ArchiveReadHandle a(archive_read_new());
    if (!a) {
        throw GoogetException(get_string("error.archive_alloc_failed"), ErrorKind::Io);
    }
    archive_read_support_filter_all(a.get());
    archive_read_support_format_all(a.get());
    if (archive_read_open_filename(a.get(), archive_path.c_str(), 10240) != ARCHIVE_OK) {
        throw GoogetException(string_format("error.archive_open_failed", archive_path.string(),
                                            archive_error_string(a.get()) ? archive_error_string(a.get()) : ""),
                              ErrorKind::Io);
    }
    return a;
}

std::string archive_error(struct archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown error";
}

} // anonymous namespace

std::vector<std::string> extract_package(const fs::path& archive_path, const fs::path& output_dir) {
    ensure_dir_exists(output_dir);
    ArchiveReadHandle a = open_package(archive_path);

    ArchiveWriteHandle ext(archive_write_disk_new());
    archive_write_disk_set_options(ext.get(), ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM |
                                                  ARCHIVE_EXTRACT_SECURE_NODOTDOT | ARCHIVE_EXTRACT_SECURE_SYMLINKS);
    archive_write_disk_set_standard_lookup(ext.get());

    std::vector<std::string> written;
    struct archive_entry* entry;
    int r = ARCHIVE_OK;
    while ((r = archive_read_next_header(a.get(), &entry)) == ARCHIVE_OK) {
        const fs::path relative = fs::path(archive_entry_pathname(entry)).lexically_normal();
        if (relative.empty() || relative == ".") continue;
        const fs::path target = validate_path(relative, output_dir);
        archive_entry_set_pathname(entry, target.c_str());

        if (archive_write_header(ext.get(), entry) < ARCHIVE_OK) {
            throw GoogetException(string_format("error.archive_extract_failed", archive_path.string(), archive_error(ext.get())),
                                  ErrorKind::Io);
        }

        const void* buff;
        size_t size;
        la_int64_t offset;
        while ((r = archive_read_data_block(a.get(), &buff, &size, &offset)) == ARCHIVE_OK) {
            if (archive_write_data_block(ext.get(), buff, size, offset) < ARCHIVE_OK) {
                throw GoogetException(string_format("error.archive_extract_failed", archive_path.string(), archive_error(ext.get())),
                                      ErrorKind::Io);
            }
        }
        if (r != ARCHIVE_EOF) {
            throw GoogetException(string_format("error.archive_extract_failed", archive_path.string(), archive_error(a.get())),
                                  ErrorKind::Io);
        }
        archive_write_finish_entry(ext.get());

        if (archive_entry_filetype(entry) == AE_IFREG) {
            written.push_back(relative.generic_string());
        }
    }
    if (r != ARCHIVE_EOF) {
        throw GoogetException(string_format("error.archive_extract_failed", archive_path.string(), archive_error(a.get())),
                              ErrorKind::Io);
    }

    log_debug(string_format("info.extract_complete", written.size(), output_dir.string()));
    return written;
}

std::optional<std::string> read_archive_entry(const fs::path& archive_path,
                                              const std::function<bool(const std::string&)>& predicate) {
    ArchiveReadHandle a = open_package(archive_path);

    struct archive_entry* entry;
    int r;
    while ((r = archive_read_next_header(a.get(), &entry)) == ARCHIVE_OK) {
        const std::string name = fs::path(archive_entry_pathname(entry)).lexically_normal().generic_string();
        if (archive_entry_filetype(entry) != AE_IFREG || !predicate(name)) {
            archive_read_data_skip(a.get());
            continue;
        }
        std::string content;
        char buffer[8192];
        la_ssize_t n;
        while ((n = archive_read_data(a.get(), buffer, sizeof(buffer))) > 0) {
            content.append(buffer, static_cast<size_t>(n));
        }
        if (n < 0) {
            throw GoogetException(string_format("error.archive_extract_failed", archive_path.string(), archive_error(a.get())),
                                  ErrorKind::Io);
        }
        return content;
    }
    if (r != ARCHIVE_EOF) {
        throw GoogetException(string_format("error.archive_extract_failed", archive_path.string(), archive_error(a.get())),
                              ErrorKind::Io);
    }
    return std::nullopt;
}

std::string decompress_gzip(const std::string& data) {
    ArchiveReadHandle a(archive_read_new());
    archive_read_support_filter_gzip(a.get());
    archive_read_support_format_raw(a.get());
    if (archive_read_open_memory(a.get(), data.data(), data.size()) != ARCHIVE_OK) {
        throw GoogetException(string_format("error.gzip_failed", archive_error(a.get())), ErrorKind::ParseError);
    }

    struct archive_entry* entry;
    if (archive_read_next_header(a.get(), &entry) != ARCHIVE_OK) {
        throw GoogetException(string_format("error.gzip_failed", archive_error(a.get())), ErrorKind::ParseError);
    }
    std::string out;
    char buffer[8192];
    la_ssize_t n;
    while ((n = archive_read_data(a.get(), buffer, sizeof(buffer))) > 0) {
        out.append(buffer, static_cast<size_t>(n));
    }
    if (n < 0) {
        throw GoogetException(string_format("error.gzip_failed", archive_error(a.get())), ErrorKind::ParseError);
    }
    return out;
}
