// DECMAIL - HMAC and HKDF
// Copyright (c) 2024 DECMAIL Developers
// MIT License
//
// HMAC (RFC 2104) with SHA-256 / SHA-512 and HKDF-SHA256 (RFC 5869).

#ifndef DECMAIL_CRYPTO_HMAC_H
#define DECMAIL_CRYPTO_HMAC_H

#include <cstdint>
#include <cstddef>
#include <vector>

#include "decmail/core/types.h"

namespace decmail {

// ============================================================================
// HMAC
// ============================================================================

/// HMAC-SHA256 of data with key
Hash256 ComputeHMAC_SHA256(const Byte* key, size_t keyLen,
                           const Byte* data, size_t dataLen);

inline Hash256 ComputeHMAC_SHA256(const Bytes& key, const Bytes& data) {
    return ComputeHMAC_SHA256(key.data(), key.size(), data.data(), data.size());
}

/// HMAC-SHA512 of data with key
Hash512 ComputeHMAC_SHA512(const Byte* key, size_t keyLen,
                           const Byte* data, size_t dataLen);

inline Hash512 ComputeHMAC_SHA512(const Bytes& key, const Bytes& data) {
    return ComputeHMAC_SHA512(key.data(), key.size(), data.data(), data.size());
}

// ============================================================================
// HKDF
// ============================================================================

/// HKDF-SHA256 extract-and-expand
/// @param outputLen Requested length, at most 255 * 32 bytes
Bytes HKDF(const Bytes& salt, const Bytes& ikm, const Bytes& info, size_t outputLen);

// ============================================================================
// Utilities
// ============================================================================

/// Constant-time comparison
bool ConstantTimeCompare(const Byte* a, const Byte* b, size_t len);

/// Overwrite memory in a way the compiler will not elide
void SecureClear(void* ptr, size_t len);

} // namespace decmail

#endif // DECMAIL_CRYPTO_HMAC_H
