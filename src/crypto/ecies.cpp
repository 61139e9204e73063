// DECMAIL - ECIES Envelope Implementation
// Copyright (c) 2024 DECMAIL Developers
// MIT License

#include "decmail/crypto/ecies.h"
#include "decmail/core/errors.h"
#include "decmail/core/random.h"
#include "decmail/core/serialize.h"
#include "decmail/crypto/aes.h"
#include "decmail/crypto/hmac.h"

#include <string>

namespace decmail {
namespace ecies {

namespace {

const std::string KDF_INFO = "decmail.ecies.v1";

constexpr size_t HEADER_SIZE = 1 + PublicKey::COMPRESSED_SIZE + aes::GCM_NONCE_SIZE;

Bytes DeriveKey(const Hash256& shared, const PublicKey& ephemeral, const PublicKey& recipient) {
    Bytes salt(ephemeral.begin(), ephemeral.end());
    salt.insert(salt.end(), recipient.begin(), recipient.end());
    Bytes ikm(shared.begin(), shared.end());
    Bytes info(KDF_INFO.begin(), KDF_INFO.end());
    Bytes key = HKDF(salt, ikm, info, aes::KEY_SIZE_256);
    SecureClear(ikm.data(), ikm.size());
    return key;
}

} // anonymous namespace

Bytes Encrypt(const PublicKey& recipient, const Bytes& plaintext) {
    PublicKey target = recipient.GetCompressed();
    if (!target.IsFullyValid()) {
        throw InvalidArgumentError("Recipient key is not a valid secp256k1 point");
    }
    
    PrivateKey ephemeral = PrivateKey::Generate();
    PublicKey ephemeralPub = ephemeral.GetPublicKey();
    auto shared = ephemeral.ECDH(target);
    if (!shared) {
        throw InvalidArgumentError("Key agreement with recipient failed");
    }
    
    Bytes key = DeriveKey(*shared, ephemeralPub, target);
    Bytes nonce = GetRandBytes(aes::GCM_NONCE_SIZE);
    
    DataStream stream;
    stream << ENVELOPE_VERSION;
    stream.Write(ephemeralPub.data(), ephemeralPub.size());
    stream.Write(nonce.data(), nonce.size());
    
    Bytes aad = stream.Data();
    Bytes sealed = AES256GCMEncrypt(key, nonce, plaintext, aad);
    SecureClear(key.data(), key.size());
    
    stream << sealed;
    return stream.Data();
}

std::optional<Bytes> Decrypt(const PrivateKey& key, const Bytes& envelope) {
    if (!key.IsValid() || envelope.size() <= HEADER_SIZE || envelope[0] != ENVELOPE_VERSION) {
        return std::nullopt;
    }
    
    PublicKey ephemeralPub(envelope.data() + 1, PublicKey::COMPRESSED_SIZE);
    Bytes nonce(envelope.begin() + 1 + PublicKey::COMPRESSED_SIZE,
                envelope.begin() + HEADER_SIZE);
    Bytes aad(envelope.begin(), envelope.begin() + HEADER_SIZE);
    
    DataStream body(envelope.data() + HEADER_SIZE, envelope.size() - HEADER_SIZE);
    Bytes sealed;
    try {
        body >> sealed;
    } catch (const FormatError&) {
        return std::nullopt;
    }
    if (!body.empty()) {
        return std::nullopt;
    }
    
    auto shared = key.ECDH(ephemeralPub);
    if (!shared) {
        return std::nullopt;
    }
    
    Bytes aesKey = DeriveKey(*shared, ephemeralPub, key.GetPublicKey());
    auto plaintext = AES256GCMDecrypt(aesKey, nonce, sealed, aad);
    SecureClear(aesKey.data(), aesKey.size());
    return plaintext;
}

} // namespace ecies
} // namespace decmail
