#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

struct evp_md_ctx_st;

// Incremental SHA-256 digest.
class Sha256 {
public:
    Sha256();
    ~Sha256();
    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    void update(const void* data, size_t len);
    // Lowercase hex digest. The object cannot be updated afterwards.
    std::string hex_digest();

private:
    struct CtxDeleter {
        void operator()(evp_md_ctx_st* ctx) const;
    };
    std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
};

// Calculates the SHA256 hash of a file.
// Throws GoogetException if the file cannot be opened.
std::string calculate_sha256(const fs::path& file_path);
std::string sha256_string(std::string_view data);

// Case-insensitive hex comparison.
bool checksums_equal(std::string_view a, std::string_view b);
