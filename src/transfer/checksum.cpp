#include "checksum.hpp"
#include <core/constants.hpp>
#include <openssl/evp.h>
#include <fmt/format.h>
#include <fstream>
#include <vector>

Sha256Hasher::Sha256Hasher() : ctx_(EVP_MD_CTX_new()), ok_(false) {
    if (ctx_) ok_ = EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) == 1;
}

Sha256Hasher::~Sha256Hasher() {
    if (ctx_) EVP_MD_CTX_free(ctx_);
}

void Sha256Hasher::update(const char* data, size_t len) {
    if (ok_ && len > 0) {
        ok_ = EVP_DigestUpdate(ctx_, data, len) == 1;
    }
}

std::string Sha256Hasher::hex_digest() {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    std::string hex;
    if (ok_ && EVP_DigestFinal_ex(ctx_, digest, &len) == 1) {
        hex.reserve(len * 2);
        for (unsigned int i = 0; i < len; i++) {
            hex += fmt::format("{:02x}", digest[i]);
        }
    }
    ok_ = ctx_ && EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) == 1;
    return hex;
}

Result<std::string> sha256_file(const std::string& path, const CancelToken& token) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result<std::string>::Err("Cannot read file: " + path, ErrorKind::LocalSourceMissing);
    }

    Sha256Hasher hasher;
    std::vector<char> buf(HASH_READ_BUF_SIZE);
    while (in) {
        if (token.interrupted()) {
            return Result<std::string>::Err("Hashing " + path + " interrupted", token.interruption());
        }
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        std::streamsize n = in.gcount();
        if (n > 0) hasher.update(buf.data(), static_cast<size_t>(n));
    }
    if (in.bad()) {
        return Result<std::string>::Err("Read error hashing " + path, ErrorKind::IOError);
    }

    std::string hex = hasher.hex_digest();
    if (hex.empty()) {
        return Result<std::string>::Err("SHA-256 failed for " + path, ErrorKind::IOError);
    }
    return Result<std::string>::Ok(hex);
}

std::string sha256_hex(const std::string& data) {
    Sha256Hasher hasher;
    hasher.update(data.data(), data.size());
    return hasher.hex_digest();
}
