// DECMAIL - Network Public Key Rules Implementation
// Copyright (c) 2024 DECMAIL Developers
// MIT License

#include <decmail/keys/network_rules.h>
#include <decmail/core/errors.h>

namespace decmail {

// ============================================================================
// EppieNetworkPublicKeyRules
// ============================================================================

EppieNetworkPublicKeyRules::EppieNetworkPublicKeyRules(
    std::shared_ptr<const IEcPublicKeyCodec> codec)
    : codec_(std::move(codec)) {
    if (!codec_) {
        throw ArgumentNullError("codec");
    }
}

bool EppieNetworkPublicKeyRules::IsSyntacticallyValid(const std::string& value) const {
    return IsPublicKeyAddressSyntax(value);
}

bool EppieNetworkPublicKeyRules::TrySemanticValidate(const std::string& value) const {
    try {
        codec_->Decode(value);
        return true;
    } catch (const InvalidArgumentError&) {
        return false;
    } catch (const FormatError&) {
        return false;
    }
}

std::unique_ptr<INetworkPublicKeyRules> CreateNetworkPublicKeyRules(
    NetworkType network, std::shared_ptr<const IEcPublicKeyCodec> codec) {
    switch (network) {
        case NetworkType::Eppie:
            return std::make_unique<EppieNetworkPublicKeyRules>(std::move(codec));
        case NetworkType::Bitcoin:
        case NetworkType::Ethereum:
            return std::make_unique<ForeignNetworkPublicKeyRules>();
        default:
            throw NotSupportedError(std::string("Unsupported network for public key rules: ") +
                                    NetworkTypeToString(network));
    }
}

// ============================================================================
// Network Key Paths
// ============================================================================

uint32_t GetCoinType(NetworkType network) {
    switch (network) {
        case NetworkType::Eppie: return EPPIE_COIN_TYPE;
        case NetworkType::Bitcoin: return BITCOIN_COIN_TYPE;
        case NetworkType::Ethereum: return ETHEREUM_COIN_TYPE;
        default:
            throw NotSupportedError(std::string("No coin type for network ") +
                                    NetworkTypeToString(network));
    }
}

uint32_t GetChannel(NetworkType network) {
    switch (network) {
        case NetworkType::Eppie: return EMAIL_CHANNEL;
        case NetworkType::Bitcoin:
        case NetworkType::Ethereum: return EXTERNAL_CHANNEL;
        default:
            throw NotSupportedError(std::string("No key channel for network ") +
                                    NetworkTypeToString(network));
    }
}

uint32_t GetKeyIndex(NetworkType network) {
    if (network == NetworkType::Unsupported) {
        throw NotSupportedError("No key index for unsupported network");
    }
    return DEFAULT_KEY_INDEX;
}

DerivationPath GetAccountKeyPath(NetworkType network, uint32_t accountIndex) {
    return DerivationPath::BIP44(GetCoinType(network), accountIndex,
                                 GetChannel(network), GetKeyIndex(network));
}

} // namespace decmail
