#pragma once

#include "database.hpp"

#include <filesystem>
#include <set>
#include <string>

namespace fs = std::filesystem;

// Cache garbage collection. Each function removes top-level entries of
// cache_dir (archives, unpack directories, cached manifests) and returns how
// many were removed. Entries that cannot be removed are logged and skipped.
// None of them touches the database.

size_t clean_all(const fs::path& cache_dir);

// Removes the LocalPath of every installed package whose name is in names.
size_t clean_packages(const GooGetState& state, const std::set<std::string>& names);

// Removes every cache entry that is not the LocalPath of an installed package.
size_t clean_uninstalled(const fs::path& cache_dir, const GooGetState& state);
