// DECMAIL - Base32E Public Key Addresses
// Copyright (c) 2024 DECMAIL Developers
// MIT License
//
// Base32E is a 32-letter, case-insensitive text encoding that avoids the
// easily confused characters l, o, 0 and 1 so that a key can be typed into
// the local part of an email address.
//
// Bytes are read as one big-endian bit string, prefixed with zero bits so
// that the length is a multiple of five, and emitted five bits per letter.
// A 33-byte compressed secp256k1 key therefore has one leading pad bit and
// encodes to exactly 53 letters.

#ifndef DECMAIL_KEYS_BASE32E_H
#define DECMAIL_KEYS_BASE32E_H

#include <decmail/core/types.h>
#include <decmail/crypto/keys.h>

#include <optional>
#include <string>

namespace decmail {

namespace base32e {

/// Encoding alphabet, canonical (lowercase) case
constexpr const char* ALPHABET = "abcdefghijkmnpqrstuvwxyz23456789";

/// Number of letters needed for byteCount bytes
constexpr size_t EncodedLength(size_t byteCount) {
    return (byteCount * 8 + 4) / 5;
}

/// True if c belongs to the alphabet in either case
bool IsAlphabetChar(char c);

/// Encode bytes to lowercase Base32E
std::string Encode(const Byte* data, size_t len);

inline std::string Encode(const Bytes& data) {
    return Encode(data.data(), data.size());
}

/// Decode text that is expected to hold byteCount bytes.
/// Returns nullopt on wrong length, foreign letters or non-zero pad bits.
std::optional<Bytes> Decode(const std::string& text, size_t byteCount);

} // namespace base32e

/// Length of a Base32E encoded compressed public key
constexpr size_t PUBLIC_KEY_ADDRESS_LENGTH = base32e::EncodedLength(secp256k1::COMPRESSED_PUBKEY_SIZE);

/// Cheap shape check of a public key address: exact length and alphabet only.
/// Performs no decoding.
bool IsPublicKeyAddressSyntax(const std::string& value);

// ============================================================================
// Public Key Codec
// ============================================================================

/**
 * Converts elliptic-curve public keys to and from their textual address.
 */
class IEcPublicKeyCodec {
public:
    virtual ~IEcPublicKeyCodec() = default;
    
    /// Encode a compressed key.
    /// Throws InvalidArgumentError for an absent or uncompressed key.
    virtual std::string Encode(const PublicKey& key) const = 0;
    
    /// Decode an address.
    /// Throws InvalidArgumentError on wrong length, FormatError when the text
    /// does not describe a compressed point on the curve.
    virtual PublicKey Decode(const std::string& address) const = 0;
};

/// Base32E codec for compressed secp256k1 keys
class Secp256k1Base32ECodec : public IEcPublicKeyCodec {
public:
    std::string Encode(const PublicKey& key) const override;
    PublicKey Decode(const std::string& address) const override;
};

} // namespace decmail

#endif // DECMAIL_KEYS_BASE32E_H
