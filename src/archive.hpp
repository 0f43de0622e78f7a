#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// Unpacks a .goo (gzip-compressed tar) archive into output_dir. Entry paths
// that escape output_dir are rejected with ParseError. Returns the relative
// paths of the regular files written.
std::vector<std::string> extract_package(const fs::path& archive_path, const fs::path& output_dir);

// Returns the contents of the first entry whose path satisfies the predicate.
std::optional<std::string> read_archive_entry(const fs::path& archive_path,
                                              const std::function<bool(const std::string&)>& predicate);

// Decompresses gzip data held in memory.
std::string decompress_gzip(const std::string& data);
