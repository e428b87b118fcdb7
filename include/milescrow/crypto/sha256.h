// MILESCROW - SHA256 Hash Function
// Copyright (c) 2024 MILESCROW Developers
// MIT License
//
// SHA-256 digests backed by OpenSSL's EVP interface.

#ifndef MILESCROW_CRYPTO_SHA256_H
#define MILESCROW_CRYPTO_SHA256_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include "milescrow/core/types.h"

// Forward declaration to keep OpenSSL headers out of the public interface
typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace milescrow {

/// Incremental SHA-256 hasher
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

    /// Write a string's bytes to the hasher
    SHA256& Write(const std::string& str) {
        return Write(reinterpret_cast<const Byte*>(str.data()), str.size());
    }

    /// Write a 64-bit integer in little-endian order
    SHA256& WriteUInt64(uint64_t value);

    /// Finalize the hash and write to output
    /// @param hash Pointer to output buffer (must be at least OUTPUT_SIZE bytes)
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

} // namespace milescrow

#endif // MILESCROW_CRYPTO_SHA256_H
