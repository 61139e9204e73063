// DECMAIL - Name Claims Implementation
// Copyright (c) 2024 DECMAIL Developers
// MIT License

#include <decmail/names/name_claim.h>
#include <decmail/core/base64.h>
#include <decmail/core/errors.h>
#include <decmail/crypto/sha256.h>
#include <decmail/keys/base32e.h>
#include <decmail/keys/network_rules.h>
#include <decmail/util/logging.h>

#include <algorithm>
#include <cctype>

namespace decmail {
namespace names {

namespace {

bool IsBlank(const std::string& value) {
    return std::all_of(value.begin(), value.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

bool EndsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string Sanitize(const std::string& value) {
    std::string result;
    result.reserve(value.size());
    for (char c : value) {
        if (c != '\r' && c != '\n' && c != '=') {
            result += c;
        }
    }
    return result;
}

} // namespace

// ============================================================================
// Claim Text
// ============================================================================

std::string CanonicalizeName(const std::string& name) {
    if (IsBlank(name)) {
        return std::string();
    }
    
    auto notSpace = [](unsigned char c) { return std::isspace(c) == 0; };
    auto first = std::find_if(name.begin(), name.end(), notSpace);
    auto last = std::find_if(name.rbegin(), name.rend(), notSpace).base();
    
    // Inner whitespace other than ' ' is part of the name
    std::string canonical;
    canonical.reserve(name.size() + 5);
    for (auto it = first; it != last; ++it) {
        if (*it == ' ' || *it == '+') {
            continue;
        }
        canonical += static_cast<char>(std::tolower(static_cast<unsigned char>(*it)));
    }
    
    if (!EndsWith(canonical, CLAIM_NAME_SUFFIX)) {
        canonical += CLAIM_NAME_SUFFIX;
    }
    return canonical;
}

std::string BuildClaimV1Payload(const std::string& name, const std::string& publicKey) {
    std::string payload = CLAIM_V1_HEADER;
    payload += "\nname=";
    payload += Sanitize(CanonicalizeName(name));
    payload += "\npublicKey=";
    payload += Sanitize(publicKey);
    return payload;
}

// ============================================================================
// Signing and Verification
// ============================================================================

std::string SignClaimV1(const std::string& name, const std::string& publicKey,
                        const PrivateKey& key) {
    if (IsBlank(name)) {
        throw InvalidArgumentError("Name is empty");
    }
    if (IsBlank(publicKey)) {
        throw InvalidArgumentError("Public key is empty");
    }
    if (!key.IsValid()) {
        throw InvalidArgumentError("Private key is invalid");
    }
    
    Bytes der = key.Sign(SHA256Hash(BuildClaimV1Payload(name, publicKey)));
    if (der.empty()) {
        throw InvalidArgumentError("Failed to generate ECDSA signature");
    }
    return EncodeBase64(der);
}

bool VerifyClaimV1Signature(const std::string& name, const std::string& publicKey,
                            const std::string& signatureBase64) {
    if (IsBlank(name) || IsBlank(publicKey) || IsBlank(signatureBase64)) {
        return false;
    }
    
    auto der = DecodeBase64(signatureBase64);
    if (!der || der->empty()) {
        return false;
    }
    
    PublicKey key;
    try {
        key = Secp256k1Base32ECodec().Decode(publicKey);
    } catch (const InvalidArgumentError&) {
        return false;
    } catch (const FormatError&) {
        return false;
    }
    
    return key.Verify(SHA256Hash(BuildClaimV1Payload(name, publicKey)), *der);
}

// ============================================================================
// NameClaimSigner
// ============================================================================

NameClaimSigner::NameClaimSigner(MasterKey master, std::shared_ptr<const PublicKeyService> keys)
    : master_(std::move(master))
    , keys_(std::move(keys)) {
    if (!keys_) {
        throw ArgumentNullError("keys");
    }
}

ExtendedKey NameClaimSigner::ClaimKey(const Account& account) const {
    if (account.email.IsNull() || account.email.Network() != NetworkType::Eppie) {
        throw NotSupportedError("Name claims are only supported for Eppie accounts");
    }
    if (!account.HasDecentralizedIndex()) {
        throw NotSupportedError("Account " + account.email.Address() +
                                " has no decentralized account index");
    }
    if (!master_.IsValid()) {
        throw InvalidArgumentError("Master key is not initialized");
    }
    
    auto key = master_.DerivePath(GetAccountKeyPath(
        NetworkType::Eppie, static_cast<uint32_t>(account.decentralizedAccountIndex)));
    if (!key) {
        throw InvalidArgumentError("Account key derivation produced an invalid key");
    }
    return *key;
}

std::string NameClaimSigner::ClaimPublicKey(const Account& account) const {
    return keys_->Encode(ClaimKey(account).GetPublicKey());
}

std::string NameClaimSigner::SignClaim(const std::string& name, const Account& account) const {
    if (IsBlank(name)) {
        throw InvalidArgumentError("Name is empty");
    }
    
    ExtendedKey key = ClaimKey(account);
    std::string publicKey = keys_->Encode(key.GetPublicKey());
    std::string signature = SignClaimV1(name, publicKey, key.GetPrivateKey());
    
    LOG_DEBUG(util::LogCategory::CLAIM) << "Signed claim for '" << CanonicalizeName(name)
                                        << "' with " << publicKey;
    return signature;
}

} // namespace names
} // namespace decmail
