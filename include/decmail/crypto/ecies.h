// DECMAIL - ECIES Envelope
// Copyright (c) 2024 DECMAIL Developers
// MIT License
//
// Public-key encryption to a secp256k1 key:
//   ephemeral key pair, ECDH shared X coordinate,
//   HKDF-SHA256(salt = ephemeralPub || recipientPub, info = "decmail.ecies.v1"),
//   AES-256-GCM with the envelope header as AAD.
//
// Envelope layout (DataStream):
//   uint8 version (1) | 33-byte ephemeral key | 12-byte nonce | bytes sealed

#ifndef DECMAIL_CRYPTO_ECIES_H
#define DECMAIL_CRYPTO_ECIES_H

#include "decmail/core/types.h"
#include "decmail/crypto/keys.h"

#include <optional>

namespace decmail {
namespace ecies {

/// Current envelope version
constexpr uint8_t ENVELOPE_VERSION = 1;

/// Encrypt plaintext to the holder of recipient's private key.
/// Throws InvalidArgumentError if recipient is not a point on the curve.
Bytes Encrypt(const PublicKey& recipient, const Bytes& plaintext);

/// Decrypt an envelope; nullopt when it is malformed or was not
/// addressed to this key.
std::optional<Bytes> Decrypt(const PrivateKey& key, const Bytes& envelope);

} // namespace ecies
} // namespace decmail

#endif // DECMAIL_CRYPTO_ECIES_H
