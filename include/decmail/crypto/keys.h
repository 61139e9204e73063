// DECMAIL - secp256k1 Keys
// Copyright (c) 2024 DECMAIL Developers
// MIT License
//
// Account keys of the decentralized network, built on OpenSSL's EC_* API.
// Mail recipients are always addressed by 33-byte compressed points;
// uncompressed points are only accepted as input and converted.

#ifndef DECMAIL_CRYPTO_KEYS_H
#define DECMAIL_CRYPTO_KEYS_H

#include <decmail/core/types.h>

#include <array>
#include <optional>
#include <string>

namespace decmail {

namespace secp256k1 {

constexpr size_t PRIVATE_KEY_SIZE = 32;
constexpr size_t COMPRESSED_PUBKEY_SIZE = 33;      // 02|03 || X
constexpr size_t UNCOMPRESSED_PUBKEY_SIZE = 65;    // 04 || X || Y
constexpr size_t MAX_SIGNATURE_SIZE = 72;          // DER

using Scalar = std::array<Byte, 32>;

/// 0 < key < n, key big-endian
bool IsValidPrivateKey(const Byte* key32);

/// Strict DER only; r and s must both lie in [1, n-1]
bool ParseDERSignature(const Bytes& der, Scalar& r, Scalar& s);

/// s <= n/2
bool IsLowS(const Scalar& s);

} // namespace secp256k1

// ============================================================================
// PublicKey
// ============================================================================

class PublicKey {
public:
    static constexpr size_t COMPRESSED_SIZE = secp256k1::COMPRESSED_PUBKEY_SIZE;
    static constexpr size_t MAX_SIZE = secp256k1::UNCOMPRESSED_PUBKEY_SIZE;

    PublicKey() { bytes_.fill(0); }

    /// Keeps the bytes only when length and prefix agree; otherwise empty
    PublicKey(const Byte* data, size_t len);
    explicit PublicKey(const Bytes& data) : PublicKey(data.data(), data.size()) {}

    /// Length and prefix; IsFullyValid also decodes the point
    bool IsValid() const;
    bool IsFullyValid() const;

    bool IsCompressed() const { return length_ == COMPRESSED_SIZE; }
    size_t size() const { return length_; }

    const Byte* data() const { return bytes_.data(); }
    const Byte* begin() const { return bytes_.data(); }
    const Byte* end() const { return bytes_.data() + length_; }
    Bytes ToVector() const { return Bytes(begin(), end()); }

    /// Empty key when this one is not on the curve
    PublicKey GetCompressed() const;

    /// ECDSA over a digest; high-S and non-strict DER signatures fail
    bool Verify(const Hash256& hash, const Bytes& signature) const;

    bool operator==(const PublicKey& other) const;
    bool operator!=(const PublicKey& other) const { return !(*this == other); }

    std::string ToHex() const;
    static std::optional<PublicKey> FromHex(const std::string& hex);

private:
    std::array<Byte, MAX_SIZE> bytes_;
    Byte length_{0};
};

// ============================================================================
// PrivateKey
// ============================================================================

/**
 * Scalar in [1, n-1]. The bytes are wiped on destruction and on Clear().
 *
 * Sign() is deterministic (RFC 6979 nonces) and always returns low-S DER.
 */
class PrivateKey {
public:
    static constexpr size_t SIZE = secp256k1::PRIVATE_KEY_SIZE;

    PrivateKey() { bytes_.fill(0); }
    explicit PrivateKey(const Byte* data);
    explicit PrivateKey(const std::array<Byte, SIZE>& data) : PrivateKey(data.data()) {}

    PrivateKey(const PrivateKey& other);
    PrivateKey(PrivateKey&& other) noexcept;
    PrivateKey& operator=(const PrivateKey& other);
    PrivateKey& operator=(PrivateKey&& other) noexcept;
    ~PrivateKey();

    /// Fresh key from the OpenSSL RNG
    static PrivateKey Generate();

    bool IsValid() const { return valid_; }

    const Byte* data() const { return bytes_.data(); }
    const Byte* begin() const { return bytes_.data(); }
    const Byte* end() const { return bytes_.data() + SIZE; }
    static constexpr size_t size() { return SIZE; }

    /// Compressed point; empty when this key is invalid
    PublicKey GetPublicKey() const;

    /// DER signature, or empty when this key is invalid
    Bytes Sign(const Hash256& hash) const;

    /// (key + tweak) mod n; nullopt when tweak >= n or the sum is zero
    std::optional<PrivateKey> TweakAdd(const Hash256& tweak) const;

    /// X coordinate of key * other
    std::optional<Hash256> ECDH(const PublicKey& other) const;

    /// Constant time
    bool operator==(const PrivateKey& other) const;
    bool operator!=(const PrivateKey& other) const { return !(*this == other); }

    void Clear();

private:
    std::array<Byte, SIZE> bytes_;
    bool valid_{false};
};

} // namespace decmail

#endif // DECMAIL_CRYPTO_KEYS_H
