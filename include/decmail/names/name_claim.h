// DECMAIL - Name Claims
// Copyright (c) 2024 DECMAIL Developers
// MIT License
//
// A name claim binds a human readable alias to an Eppie public key:
//
//   claim-v1\n
//   name=<canonical name>\n
//   publicKey=<Base32E key>
//
// The claim is signed with deterministic (RFC 6979), low-S ECDSA over the
// SHA-256 of its UTF-8 bytes. Signatures travel as Base64 of the DER
// SEQUENCE { r, s }.

#ifndef DECMAIL_NAMES_NAME_CLAIM_H
#define DECMAIL_NAMES_NAME_CLAIM_H

#include <decmail/crypto/keys.h>
#include <decmail/keys/hdkey.h>
#include <decmail/keys/public_key_service.h>
#include <decmail/mail/account.h>

#include <memory>
#include <string>

namespace decmail {
namespace names {

/// Suffix every canonical name carries
constexpr const char* CLAIM_NAME_SUFFIX = ".test";

/// First line of a version 1 claim
constexpr const char* CLAIM_V1_HEADER = "claim-v1";

/**
 * Canonical form of a name: trimmed of surrounding whitespace, lowercase,
 * without ' ' or '+', with the ".test" suffix. Other inner whitespace is
 * kept. Blank input gives the empty string.
 */
std::string CanonicalizeName(const std::string& name);

/// Claim text for a name and encoded key; CR, LF and '=' are dropped from both
std::string BuildClaimV1Payload(const std::string& name, const std::string& publicKey);

/**
 * Sign the claim of a name and key with a private key.
 * Throws InvalidArgumentError for a blank name or key or an invalid private key.
 */
std::string SignClaimV1(const std::string& name, const std::string& publicKey,
                        const PrivateKey& key);

/**
 * Check a claim signature. Returns false, never throws, for blank input,
 * bad Base64, malformed or high-S signatures and undecodable keys.
 */
bool VerifyClaimV1Signature(const std::string& name, const std::string& publicKey,
                            const std::string& signatureBase64);

/**
 * Signs claims with the Eppie account keys of one master key.
 */
class NameClaimSigner {
public:
    /// Throws ArgumentNullError for a null key service
    NameClaimSigner(MasterKey master, std::shared_ptr<const PublicKeyService> keys);
    
    /**
     * Sign the claim of name for the Eppie key of account.
     * Throws InvalidArgumentError for a blank name and NotSupportedError for
     * a non-Eppie account or one without a decentralized account index.
     */
    std::string SignClaim(const std::string& name, const Account& account) const;
    
    /// Encoded key a claim of account is bound to; same failures as SignClaim
    std::string ClaimPublicKey(const Account& account) const;

private:
    MasterKey master_;
    std::shared_ptr<const PublicKeyService> keys_;
    
    ExtendedKey ClaimKey(const Account& account) const;
};

} // namespace names
} // namespace decmail

#endif // DECMAIL_NAMES_NAME_CLAIM_H
