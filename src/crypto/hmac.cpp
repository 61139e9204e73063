// DECMAIL - HMAC and HKDF Implementation
// Copyright (c) 2024 DECMAIL Developers
// MIT License

#include "decmail/crypto/hmac.h"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <algorithm>
#include <stdexcept>

namespace decmail {

Hash256 ComputeHMAC_SHA256(const Byte* key, size_t keyLen,
                           const Byte* data, size_t dataLen) {
    Hash256 result;
    unsigned int resultLen = 0;
    if (HMAC(EVP_sha256(), key, static_cast<int>(keyLen), data, dataLen,
             result.data(), &resultLen) == nullptr || resultLen != Hash256::SIZE) {
        throw std::runtime_error("HMAC-SHA256 failed");
    }
    return result;
}

Hash512 ComputeHMAC_SHA512(const Byte* key, size_t keyLen,
                           const Byte* data, size_t dataLen) {
    Hash512 result;
    unsigned int resultLen = 0;
    if (HMAC(EVP_sha512(), key, static_cast<int>(keyLen), data, dataLen,
             result.data(), &resultLen) == nullptr || resultLen != Hash512::SIZE) {
        throw std::runtime_error("HMAC-SHA512 failed");
    }
    return result;
}

Bytes HKDF(const Bytes& salt, const Bytes& ikm, const Bytes& info, size_t outputLen) {
    constexpr size_t HASH_LEN = Hash256::SIZE;
    if (outputLen == 0 || outputLen > 255 * HASH_LEN) {
        throw std::invalid_argument("HKDF output length out of range");
    }
    
    // Extract: PRK = HMAC(salt, IKM); an empty salt is HashLen zero bytes
    Bytes saltBytes = salt.empty() ? Bytes(HASH_LEN, 0) : salt;
    Hash256 prk = ComputeHMAC_SHA256(saltBytes, ikm);
    
    // Expand: T(i) = HMAC(PRK, T(i-1) || info || i)
    Bytes okm;
    okm.reserve(outputLen);
    Bytes previous;
    for (uint8_t counter = 1; okm.size() < outputLen; ++counter) {
        Bytes block(previous);
        block.insert(block.end(), info.begin(), info.end());
        block.push_back(counter);
        Hash256 t = ComputeHMAC_SHA256(prk.data(), prk.size(), block.data(), block.size());
        previous.assign(t.begin(), t.end());
        size_t take = std::min(HASH_LEN, outputLen - okm.size());
        okm.insert(okm.end(), t.begin(), t.begin() + take);
    }
    
    SecureClear(prk.data(), prk.size());
    return okm;
}

bool ConstantTimeCompare(const Byte* a, const Byte* b, size_t len) {
    return CRYPTO_memcmp(a, b, len) == 0;
}

void SecureClear(void* ptr, size_t len) {
    OPENSSL_cleanse(ptr, len);
}

} // namespace decmail
