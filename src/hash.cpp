#include "hash.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <iomanip>
#include <sstream>

void Sha256::CtxDeleter::operator()(EVP_MD_CTX* ctx) const {
    if (ctx) {
        EVP_MD_CTX_free(ctx);
    }
}

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw GoogetException(get_string("error.openssl_ctx_failed"));
    }
    if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
        throw GoogetException(get_string("error.openssl_init_failed"));
    }
}

Sha256::~Sha256() = default;

void Sha256::update(const void* data, size_t len) {
    if (EVP_DigestUpdate(ctx_.get(), data, len) != 1) {
        throw GoogetException(get_string("error.openssl_update_failed"));
    }
}

std::string Sha256::hex_digest() {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len;
    if (EVP_DigestFinal_ex(ctx_.get(), hash, &hash_len) != 1) {
        throw GoogetException(get_string("error.openssl_final_failed"));
    }

    std::stringstream ss;
    for (unsigned int i = 0; i < hash_len; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

std::string calculate_sha256(const fs::path& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        throw GoogetException(string_format("error.open_file_failed", file_path.string()), ErrorKind::Io);
    }

    Sha256 digest;
    char buffer[8192];
    while (file.read(buffer, sizeof(buffer))) {
        digest.update(buffer, static_cast<size_t>(file.gcount()));
    }
    if (file.gcount() > 0) { // Handle the last chunk
        digest.update(buffer, static_cast<size_t>(file.gcount()));
    }
    return digest.hex_digest();
}

std::string sha256_string(std::string_view data) {
    Sha256 digest;
    digest.update(data.data(), data.size());
    return digest.hex_digest();
}

bool checksums_equal(std::string_view a, std::string_view b) {
    return to_lower(a) == to_lower(b);
}
