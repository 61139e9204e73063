// DECMAIL - Hierarchical Deterministic Key Derivation (BIP32/BIP44)
// Copyright (c) 2024 DECMAIL Developers
// MIT License
//
// Derives every per-purpose key of an account from a single master key.
// Two derivation modes exist:
//
//   BIP44 path: m/44'/coin'/account'/channel/index
//   Tag:        child of the master key selected by an arbitrary string
//
// Eppie mail keys use coin type 3630 and channel 10.

#ifndef DECMAIL_KEYS_HDKEY_H
#define DECMAIL_KEYS_HDKEY_H

#include <decmail/core/types.h>
#include <decmail/crypto/keys.h>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace decmail {

// ============================================================================
// Constants
// ============================================================================

/// BIP44 purpose constant
constexpr uint32_t BIP44_PURPOSE = 44;

/// Hardened key derivation threshold
constexpr uint32_t HARDENED_FLAG = 0x80000000;

/// SLIP-0044 coin types
constexpr uint32_t EPPIE_COIN_TYPE = 3630;
constexpr uint32_t BITCOIN_COIN_TYPE = 0;
constexpr uint32_t ETHEREUM_COIN_TYPE = 60;

/// Channel of mail keys below an Eppie account
constexpr uint32_t EMAIL_CHANNEL = 10;

/// External chain of Bitcoin/Ethereum accounts
constexpr uint32_t EXTERNAL_CHANNEL = 0;

/// Key index used for mail keys
constexpr uint32_t DEFAULT_KEY_INDEX = 0;

/// Accepted master seed sizes (BIP32)
constexpr size_t MIN_SEED_SIZE = 16;
constexpr size_t MAX_SEED_SIZE = 64;

// ============================================================================
// Key Derivation Path
// ============================================================================

/**
 * Represents a BIP32 derivation path component.
 */
struct PathComponent {
    uint32_t index;
    bool hardened;
    
    PathComponent(uint32_t idx = 0, bool hard = false) 
        : index(idx), hardened(hard) {}
    
    /// Get the full index value (with hardened flag if applicable)
    uint32_t GetFullIndex() const {
        return hardened ? (index | HARDENED_FLAG) : index;
    }
    
    /// Parse from string (e.g., "44'" or "0")
    static std::optional<PathComponent> FromString(const std::string& str);
    
    std::string ToString() const;
};

/**
 * A complete BIP32 derivation path.
 * 
 * Example paths:
 * - m/44'/3630'/0'/10/0  (mail key of the first Eppie account)
 * - m/44'/0'/2'/0/0      (first receiving key of the third Bitcoin account)
 */
class DerivationPath {
public:
    /// Create empty path (master key)
    DerivationPath() = default;
    
    explicit DerivationPath(std::vector<PathComponent> components)
        : components_(std::move(components)) {}
    
    /// Parse from string (e.g., "m/44'/3630'/0'/10/0")
    static std::optional<DerivationPath> FromString(const std::string& path);
    
    /// m/44'/coin'/account'/channel/index; InvalidArgumentError when a
    /// component is not below HARDENED_FLAG
    static DerivationPath BIP44(uint32_t coinType, uint32_t account,
                                uint32_t channel, uint32_t index);
    
    const std::vector<PathComponent>& GetComponents() const { return components_; }
    
    size_t Depth() const { return components_.size(); }
    
    bool IsEmpty() const { return components_.empty(); }
    
    /// Append a component; same range rule as BIP44
    DerivationPath Child(uint32_t index, bool hardened = false) const;
    
    std::string ToString() const;
    
    bool operator==(const DerivationPath& other) const;
    bool operator!=(const DerivationPath& other) const { return !(*this == other); }
    
private:
    std::vector<PathComponent> components_;
};

// ============================================================================
// Extended Key (BIP32)
// ============================================================================

/**
 * An extended private key: key material plus chain code.
 * 
 * Only private derivation is supported; every key this library needs is
 * derived by the owner of the master key.
 */
class ExtendedKey {
public:
    static constexpr size_t CHAIN_CODE_SIZE = 32;
    
    /// Default constructor - invalid key
    ExtendedKey() { chainCode_.fill(0); }
    
    ExtendedKey(const PrivateKey& key, const std::array<Byte, CHAIN_CODE_SIZE>& chainCode,
                uint8_t depth = 0, uint32_t childIndex = 0);
    
    /// Generate master key from seed; invalid key if the seed size is
    /// outside [MIN_SEED_SIZE, MAX_SEED_SIZE] or the result is unusable.
    static ExtendedKey FromSeed(const Byte* seed, size_t seedLen);
    
    static ExtendedKey FromSeed(const Bytes& seed) {
        return FromSeed(seed.data(), seed.size());
    }
    
    /// Derive child key
    /// @param index Child index (use | HARDENED_FLAG for hardened)
    std::optional<ExtendedKey> DeriveChild(uint32_t index) const;
    
    /// Derive key at path; nullopt for a component index >= HARDENED_FLAG
    std::optional<ExtendedKey> DerivePath(const DerivationPath& path) const;
    
    /// Derive the child selected by a non-empty tag:
    /// I = HMAC-SHA512(chainCode, 0x00 || key || "decmail.tag.v1" || SHA256(tag)),
    /// child = IL + key mod n.
    std::optional<ExtendedKey> DeriveTagged(const std::string& tag) const;
    
    bool IsValid() const { return key_.IsValid(); }
    
    const PrivateKey& GetPrivateKey() const { return key_; }
    
    /// Compressed public key (invalid key if this key is invalid)
    PublicKey GetPublicKey() const;
    
    const std::array<Byte, CHAIN_CODE_SIZE>& GetChainCode() const { return chainCode_; }
    
    uint8_t GetDepth() const { return depth_; }
    
    uint32_t GetChildIndex() const { return childIndex_; }

private:
    PrivateKey key_;
    std::array<Byte, CHAIN_CODE_SIZE> chainCode_;
    uint8_t depth_{0};
    uint32_t childIndex_{0};
    
    /// HMAC-SHA512 over data, then IL + key and IR as the new chain code
    std::optional<ExtendedKey> DeriveFromData(const Bytes& data, uint32_t childIndex) const;
};

/// Root key material of an account. Never serialized by this library.
using MasterKey = ExtendedKey;

} // namespace decmail

#endif // DECMAIL_KEYS_HDKEY_H
