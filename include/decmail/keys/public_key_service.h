// DECMAIL - Public Key Service
// Copyright (c) 2024 DECMAIL Developers
// MIT License
//
// Single entry point for key encoding, derivation and resolution.

#ifndef DECMAIL_KEYS_PUBLIC_KEY_SERVICE_H
#define DECMAIL_KEYS_PUBLIC_KEY_SERVICE_H

#include <decmail/crypto/keys.h>
#include <decmail/keys/base32e.h>
#include <decmail/keys/hdkey.h>
#include <decmail/keys/resolvers.h>
#include <decmail/mail/account.h>
#include <decmail/mail/email_address.h>
#include <decmail/util/cancellation.h>

#include <future>
#include <memory>
#include <string>

namespace decmail {

/**
 * Derive the key of a local account.
 *
 * Hybrid accounts use the key tag of their email; other accounts use the
 * BIP44 path of their network and decentralized account index.
 * Throws InvalidArgumentError for an invalid master key and
 * NotSupportedError when the account has neither a hybrid email nor an index.
 */
ExtendedKey DeriveAccountKey(const MasterKey& master, const Account& account);

class PublicKeyService {
public:
    /// Throws ArgumentNullError for a null codec or resolver
    PublicKeyService(std::shared_ptr<const IEcPublicKeyCodec> codec,
                     std::shared_ptr<IEmailPublicKeyResolver> resolver);
    
    /**
     * Service with the Base32E codec and a resolver for each network that has
     * a source of keys. Eppie is always supported (a null name resolver
     * becomes a NullNameResolver); Bitcoin and Ethereum only with a fetcher.
     */
    static std::shared_ptr<PublicKeyService> CreateDefault(
        std::shared_ptr<INameResolver> nameResolver,
        std::shared_ptr<IKeyFetcher> bitcoinFetcher = nullptr,
        std::shared_ptr<IKeyFetcher> ethereumFetcher = nullptr);
    
    // ========================================================================
    // Encoding
    // ========================================================================
    
    std::string Encode(const PublicKey& key) const;
    PublicKey Decode(const std::string& address) const;
    
    const IEcPublicKeyCodec& Codec() const { return *codec_; }
    
    // ========================================================================
    // Derivation
    // ========================================================================
    
    /// Throws InvalidArgumentError for an invalid master key
    PublicKey Derive(const MasterKey& master, const DerivationPath& path) const;
    
    PublicKey Derive(const MasterKey& master, uint32_t coinType, uint32_t account,
                     uint32_t channel, uint32_t keyIndex) const;
    
    /// Throws InvalidArgumentError for an invalid master key or an empty tag
    PublicKey Derive(const MasterKey& master, const std::string& tag) const;
    
    std::string DeriveEncoded(const MasterKey& master, const DerivationPath& path) const;
    
    std::string DeriveEncoded(const MasterKey& master, uint32_t coinType, uint32_t account,
                              uint32_t channel, uint32_t keyIndex) const;
    
    std::string DeriveEncoded(const MasterKey& master, const std::string& tag) const;
    
    /// Encoded key of a local account (see DeriveAccountKey)
    std::string DeriveAccountAddress(const MasterKey& master, const Account& account) const;
    
    // ========================================================================
    // Resolution
    // ========================================================================
    
    /**
     * Public key of an email address.
     * Throws ArgumentNullError for a null address, NotSupportedError for a
     * network without a resolver and NoPublicKeyError when nothing usable
     * was found.
     */
    PublicKey GetByEmail(const EmailAddress& email,
                         const util::CancellationToken& token = util::CancellationToken::None()) const;
    
    /// Canonical encoded key of an email address; same failures as GetByEmail
    std::string GetEncodedByEmail(const EmailAddress& email,
                                  const util::CancellationToken& token = util::CancellationToken::None()) const;
    
    std::future<PublicKey> GetByEmailAsync(EmailAddress email,
                                           util::CancellationToken token = util::CancellationToken::None()) const;
    
    std::future<std::string> GetEncodedByEmailAsync(EmailAddress email,
                                                    util::CancellationToken token = util::CancellationToken::None()) const;

private:
    std::shared_ptr<const IEcPublicKeyCodec> codec_;
    std::shared_ptr<IEmailPublicKeyResolver> resolver_;
    
    /// Resolve and require a found, decodable key
    PublicKey ResolveKey(const EmailAddress& email, const util::CancellationToken& token) const;
};

} // namespace decmail

#endif // DECMAIL_KEYS_PUBLIC_KEY_SERVICE_H
