// DECMAIL - Network Public Key Rules
// Copyright (c) 2024 DECMAIL Developers
// MIT License
//
// Per-network validation of the address segment of a decentralized email.
// Syntactic checks are cheap and never decode; semantic checks may run
// cryptographic decoding and are only reached through TryValidate after
// the syntactic check passed.

#ifndef DECMAIL_KEYS_NETWORK_RULES_H
#define DECMAIL_KEYS_NETWORK_RULES_H

#include <decmail/keys/base32e.h>
#include <decmail/keys/hdkey.h>
#include <decmail/mail/email_address.h>

#include <memory>
#include <string>

namespace decmail {

// ============================================================================
// Rules Interface
// ============================================================================

class INetworkPublicKeyRules {
public:
    virtual ~INetworkPublicKeyRules() = default;
    
    /// Shape check only
    virtual bool IsSyntacticallyValid(const std::string& value) const = 0;
    
    /// Full decoding check; false instead of an exception
    virtual bool TrySemanticValidate(const std::string& value) const = 0;
    
    /// Syntactic check first; semantic check only when it passed
    bool TryValidate(const std::string& value) const {
        return IsSyntacticallyValid(value) && TrySemanticValidate(value);
    }
};

/// Eppie: Base32E compressed secp256k1 keys
class EppieNetworkPublicKeyRules : public INetworkPublicKeyRules {
public:
    /// Throws ArgumentNullError for a null codec
    explicit EppieNetworkPublicKeyRules(std::shared_ptr<const IEcPublicKeyCodec> codec);
    
    bool IsSyntacticallyValid(const std::string& value) const override;
    bool TrySemanticValidate(const std::string& value) const override;

private:
    std::shared_ptr<const IEcPublicKeyCodec> codec_;
};

/// Bitcoin and Ethereum: segment must be non-empty, keys come from the network
class ForeignNetworkPublicKeyRules : public INetworkPublicKeyRules {
public:
    bool IsSyntacticallyValid(const std::string& value) const override {
        return !value.empty();
    }
    bool TrySemanticValidate(const std::string& value) const override {
        return !value.empty();
    }
};

/// Create the rules of a network; throws NotSupportedError for Unsupported
std::unique_ptr<INetworkPublicKeyRules> CreateNetworkPublicKeyRules(
    NetworkType network, std::shared_ptr<const IEcPublicKeyCodec> codec);

// ============================================================================
// Network Key Paths
// ============================================================================

/// SLIP-0044 coin type of a network; throws NotSupportedError for Unsupported
uint32_t GetCoinType(NetworkType network);

/// Channel (BIP44 change level) of a network's account keys
uint32_t GetChannel(NetworkType network);

/// Key index of a network's account keys
uint32_t GetKeyIndex(NetworkType network);

/// Full BIP44 path of an account key on a network
DerivationPath GetAccountKeyPath(NetworkType network, uint32_t accountIndex);

} // namespace decmail

#endif // DECMAIL_KEYS_NETWORK_RULES_H
