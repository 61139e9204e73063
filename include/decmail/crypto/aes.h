// DECMAIL - AES Symmetric Encryption
// Copyright (c) 2024 DECMAIL Developers
// MIT License
//
// AES-256 in GCM mode (authenticated encryption) via OpenSSL EVP.

#ifndef DECMAIL_CRYPTO_AES_H
#define DECMAIL_CRYPTO_AES_H

#include <cstdint>
#include <cstddef>
#include <optional>
#include <vector>

#include "decmail/core/types.h"

namespace decmail {

namespace aes {
    /// AES-256 key size
    constexpr size_t KEY_SIZE_256 = 32;
    
    /// Recommended GCM nonce size
    constexpr size_t GCM_NONCE_SIZE = 12;
    
    /// GCM authentication tag size
    constexpr size_t GCM_TAG_SIZE = 16;
}

/**
 * Encrypt with AES-256-GCM.
 * 
 * @param key 32-byte key
 * @param nonce 12-byte nonce, never reused with the same key
 * @param plaintext Data to encrypt
 * @param aad Additional authenticated data (may be empty)
 * @return ciphertext || 16-byte tag
 */
Bytes AES256GCMEncrypt(const Bytes& key, const Bytes& nonce,
                       const Bytes& plaintext, const Bytes& aad = {});

/**
 * Decrypt AES-256-GCM output of AES256GCMEncrypt.
 * 
 * @return plaintext, or nullopt when the tag does not verify
 */
std::optional<Bytes> AES256GCMDecrypt(const Bytes& key, const Bytes& nonce,
                                      const Bytes& sealed, const Bytes& aad = {});

} // namespace decmail

#endif // DECMAIL_CRYPTO_AES_H
