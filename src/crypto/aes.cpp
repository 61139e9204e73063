// DECMAIL - AES Implementation
// Copyright (c) 2024 DECMAIL Developers
// MIT License

#include "decmail/crypto/aes.h"
#include "decmail/core/errors.h"

#include <openssl/evp.h>

#include <memory>
#include <stdexcept>

namespace decmail {

namespace {

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

CipherCtxPtr NewCipherCtx() {
    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw std::runtime_error("EVP_CIPHER_CTX_new failed");
    }
    return ctx;
}

void CheckParams(const Bytes& key, const Bytes& nonce) {
    if (key.size() != aes::KEY_SIZE_256) {
        throw InvalidArgumentError("AES-256 key must be 32 bytes");
    }
    if (nonce.size() != aes::GCM_NONCE_SIZE) {
        throw InvalidArgumentError("GCM nonce must be 12 bytes");
    }
}

} // anonymous namespace

Bytes AES256GCMEncrypt(const Bytes& key, const Bytes& nonce,
                       const Bytes& plaintext, const Bytes& aad) {
    CheckParams(key, nonce);
    CipherCtxPtr ctx = NewCipherCtx();
    
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, key.data(), nonce.data()) != 1) {
        throw std::runtime_error("AES-GCM init failed");
    }
    
    int len = 0;
    if (!aad.empty() &&
        EVP_EncryptUpdate(ctx.get(), nullptr, &len, aad.data(), static_cast<int>(aad.size())) != 1) {
        throw std::runtime_error("AES-GCM AAD failed");
    }
    
    Bytes out(plaintext.size() + aes::GCM_TAG_SIZE);
    int written = 0;
    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), out.data(), &len,
                              plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
            throw std::runtime_error("AES-GCM encrypt failed");
        }
        written = len;
    }
    
    if (EVP_EncryptFinal_ex(ctx.get(), out.data() + written, &len) != 1) {
        throw std::runtime_error("AES-GCM finalize failed");
    }
    written += len;
    
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                            static_cast<int>(aes::GCM_TAG_SIZE), out.data() + written) != 1) {
        throw std::runtime_error("AES-GCM tag failed");
    }
    
    out.resize(static_cast<size_t>(written) + aes::GCM_TAG_SIZE);
    return out;
}

std::optional<Bytes> AES256GCMDecrypt(const Bytes& key, const Bytes& nonce,
                                      const Bytes& sealed, const Bytes& aad) {
    CheckParams(key, nonce);
    if (sealed.size() < aes::GCM_TAG_SIZE) {
        return std::nullopt;
    }
    
    const size_t cipherLen = sealed.size() - aes::GCM_TAG_SIZE;
    CipherCtxPtr ctx = NewCipherCtx();
    
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, key.data(), nonce.data()) != 1) {
        throw std::runtime_error("AES-GCM init failed");
    }
    
    int len = 0;
    if (!aad.empty() &&
        EVP_DecryptUpdate(ctx.get(), nullptr, &len, aad.data(), static_cast<int>(aad.size())) != 1) {
        return std::nullopt;
    }
    
    Bytes out(cipherLen);
    int written = 0;
    if (cipherLen > 0) {
        if (EVP_DecryptUpdate(ctx.get(), out.data(), &len,
                              sealed.data(), static_cast<int>(cipherLen)) != 1) {
            return std::nullopt;
        }
        written = len;
    }
    
    Bytes tag(sealed.end() - aes::GCM_TAG_SIZE, sealed.end());
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                            static_cast<int>(tag.size()), tag.data()) != 1) {
        return std::nullopt;
    }
    
    // Tag mismatch is reported here
    if (EVP_DecryptFinal_ex(ctx.get(), out.data() + written, &len) != 1) {
        return std::nullopt;
    }
    written += len;
    
    out.resize(static_cast<size_t>(written));
    return out;
}

} // namespace decmail
