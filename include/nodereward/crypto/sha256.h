// NODEREWARD - SHA256 Hash Function
// Copyright (c) 2024 NODEREWARD Developers
// MIT License
//
// SHA-256 over OpenSSL's EVP digest interface. Used to derive reward ids
// and time-locked operation hashes from serialized content.

#ifndef NODEREWARD_CRYPTO_SHA256_H
#define NODEREWARD_CRYPTO_SHA256_H

#include "nodereward/core/types.h"
#include <cstdint>
#include <cstddef>
#include <vector>

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace nodereward {

/// SHA-256 hasher class with incremental Write/Finalize
class SHA256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;

    SHA256();
    ~SHA256();

    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;

    /// Write data to the hasher
    SHA256& Write(const Byte* data, size_t len);

    /// Finalize the hash and write to output; the hasher is reset afterwards
    void Finalize(Byte hash[OUTPUT_SIZE]);

    /// Reset hasher to initial state
    SHA256& Reset();

private:
    EVP_MD_CTX* ctx_;
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// Compute SHA256 hash of data in a single call
Hash256 SHA256Hash(const Byte* data, size_t len);

/// Compute SHA256 hash of a vector
inline Hash256 SHA256Hash(const std::vector<Byte>& data) {
    return SHA256Hash(data.data(), data.size());
}

} // namespace nodereward

#endif // NODEREWARD_CRYPTO_SHA256_H
