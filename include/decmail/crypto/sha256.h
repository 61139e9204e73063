// DECMAIL - SHA256 Hash Function
// Copyright (c) 2024 DECMAIL Developers
// MIT License
//
// SHA-256 (FIPS 180-4) backed by the OpenSSL EVP digest interface.

#ifndef DECMAIL_CRYPTO_SHA256_H
#define DECMAIL_CRYPTO_SHA256_H

#include <cstdint>
#include <cstddef>
#include <string>

#include "decmail/core/types.h"

struct evp_md_ctx_st;

namespace decmail {

/// SHA-256 hasher class with incremental writes
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
    
    SHA256& Write(const std::string& str) {
        return Write(reinterpret_cast<const Byte*>(str.data()), str.size());
    }
    
    /// Finalize the hash and write to output
    void Finalize(Byte hash[OUTPUT_SIZE]);
    
    /// Finalize into a Hash256
    Hash256 Finalize();
    
    /// Reset hasher to initial state
    SHA256& Reset();

private:
    evp_md_ctx_st* ctx_;
};

/// Compute SHA256 hash of data in a single call
Hash256 SHA256Hash(const Byte* data, size_t len);

inline Hash256 SHA256Hash(const Bytes& data) {
    return SHA256Hash(data.data(), data.size());
}

inline Hash256 SHA256Hash(const std::string& str) {
    return SHA256Hash(reinterpret_cast<const Byte*>(str.data()), str.size());
}

} // namespace decmail

#endif // DECMAIL_CRYPTO_SHA256_H
