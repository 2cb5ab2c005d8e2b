#pragma once

#include <cstddef>
#include <string>
#include <core/types.hpp>
#include <core/cancel_token.hpp>

// evp_md_ctx_st from OpenSSL
typedef struct evp_md_ctx_st EVP_MD_CTX;

// Incremental SHA-256. Feed bytes as they are uploaded, then read the digest.
class Sha256Hasher {
public:
    Sha256Hasher();
    ~Sha256Hasher();

    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;

    void update(const char* data, size_t len);

    // Lowercase hex digest. The hasher is reset afterwards.
    std::string hex_digest();

private:
    EVP_MD_CTX* ctx_;
    bool ok_;
};

// SHA-256 of a local file, read in HASH_READ_BUF_SIZE chunks. Checks the
// token between chunks.
Result<std::string> sha256_file(const std::string& path, const CancelToken& token);

// SHA-256 of an in-memory buffer.
std::string sha256_hex(const std::string& data);
