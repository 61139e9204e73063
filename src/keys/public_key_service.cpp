// DECMAIL - Public Key Service Implementation
// Copyright (c) 2024 DECMAIL Developers
// MIT License

#include <decmail/keys/public_key_service.h>
#include <decmail/keys/network_rules.h>
#include <decmail/core/errors.h>
#include <decmail/util/logging.h>

namespace decmail {

namespace {

void RequireMasterKey(const MasterKey& master) {
    if (!master.IsValid()) {
        throw InvalidArgumentError("Master key is not initialized");
    }
}

} // namespace

ExtendedKey DeriveAccountKey(const MasterKey& master, const Account& account) {
    RequireMasterKey(master);
    
    std::optional<ExtendedKey> derived;
    if (!account.email.IsNull() && account.email.IsHybrid()) {
        derived = master.DeriveTagged(account.KeyTag());
    } else if (account.HasDecentralizedIndex()) {
        NetworkType network = account.email.IsNull() ? NetworkType::Eppie
                                                     : account.email.Network();
        if (network == NetworkType::Unsupported) {
            network = NetworkType::Eppie;
        }
        derived = master.DerivePath(GetAccountKeyPath(
            network, static_cast<uint32_t>(account.decentralizedAccountIndex)));
    } else {
        throw NotSupportedError("Account " + account.email.Address() +
                                " has no decentralized key");
    }
    
    if (!derived) {
        throw InvalidArgumentError("Account key derivation produced an invalid key");
    }
    return *derived;
}

// ============================================================================
// Construction
// ============================================================================

PublicKeyService::PublicKeyService(std::shared_ptr<const IEcPublicKeyCodec> codec,
                                   std::shared_ptr<IEmailPublicKeyResolver> resolver)
    : codec_(std::move(codec))
    , resolver_(std::move(resolver)) {
    if (!codec_) {
        throw ArgumentNullError("codec");
    }
    if (!resolver_) {
        throw ArgumentNullError("resolver");
    }
}

std::shared_ptr<PublicKeyService> PublicKeyService::CreateDefault(
    std::shared_ptr<INameResolver> nameResolver,
    std::shared_ptr<IKeyFetcher> bitcoinFetcher,
    std::shared_ptr<IKeyFetcher> ethereumFetcher) {
    auto codec = std::make_shared<Secp256k1Base32ECodec>();
    if (!nameResolver) {
        nameResolver = std::make_shared<NullNameResolver>();
    }
    
    CompositeEmailPublicKeyResolver::ResolverMap resolvers;
    resolvers[NetworkType::Eppie] =
        std::make_shared<EppieEmailPublicKeyResolver>(codec, std::move(nameResolver));
    if (bitcoinFetcher) {
        resolvers[NetworkType::Bitcoin] = std::make_shared<ForeignEmailPublicKeyResolver>(
            NetworkType::Bitcoin, codec, std::move(bitcoinFetcher));
    }
    if (ethereumFetcher) {
        resolvers[NetworkType::Ethereum] = std::make_shared<ForeignEmailPublicKeyResolver>(
            NetworkType::Ethereum, codec, std::move(ethereumFetcher));
    }
    
    return std::make_shared<PublicKeyService>(
        codec, std::make_shared<CompositeEmailPublicKeyResolver>(std::move(resolvers)));
}

// ============================================================================
// Encoding
// ============================================================================

std::string PublicKeyService::Encode(const PublicKey& key) const {
    return codec_->Encode(key);
}

PublicKey PublicKeyService::Decode(const std::string& address) const {
    return codec_->Decode(address);
}

// ============================================================================
// Derivation
// ============================================================================

PublicKey PublicKeyService::Derive(const MasterKey& master, const DerivationPath& path) const {
    RequireMasterKey(master);
    auto derived = master.DerivePath(path);
    if (!derived) {
        throw InvalidArgumentError("Key derivation failed for path " + path.ToString());
    }
    return derived->GetPublicKey();
}

PublicKey PublicKeyService::Derive(const MasterKey& master, uint32_t coinType, uint32_t account,
                                   uint32_t channel, uint32_t keyIndex) const {
    return Derive(master, DerivationPath::BIP44(coinType, account, channel, keyIndex));
}

PublicKey PublicKeyService::Derive(const MasterKey& master, const std::string& tag) const {
    RequireMasterKey(master);
    if (tag.empty()) {
        throw InvalidArgumentError("Key tag is empty");
    }
    auto derived = master.DeriveTagged(tag);
    if (!derived) {
        throw InvalidArgumentError("Key derivation failed for tag");
    }
    return derived->GetPublicKey();
}

std::string PublicKeyService::DeriveEncoded(const MasterKey& master,
                                            const DerivationPath& path) const {
    return Encode(Derive(master, path));
}

std::string PublicKeyService::DeriveEncoded(const MasterKey& master, uint32_t coinType,
                                            uint32_t account, uint32_t channel,
                                            uint32_t keyIndex) const {
    return Encode(Derive(master, coinType, account, channel, keyIndex));
}

std::string PublicKeyService::DeriveEncoded(const MasterKey& master, const std::string& tag) const {
    return Encode(Derive(master, tag));
}

std::string PublicKeyService::DeriveAccountAddress(const MasterKey& master,
                                                   const Account& account) const {
    return Encode(DeriveAccountKey(master, account).GetPublicKey());
}

// ============================================================================
// Resolution
// ============================================================================

PublicKey PublicKeyService::ResolveKey(const EmailAddress& email,
                                       const util::CancellationToken& token) const {
    if (email.IsNull()) {
        throw ArgumentNullError("email");
    }
    
    ResolveResult result = resolver_->Resolve(email, token);
    if (!result.IsFound()) {
        LOG_DEBUG(util::LogCategory::KEYS) << "No key for " << email.Address() << " ("
                                           << ResolveStatusToString(result.status) << ")";
        throw NoPublicKeyError(email.Address());
    }
    
    try {
        return codec_->Decode(result.value);
    } catch (const FormatError&) {
        throw NoPublicKeyError(email.Address());
    } catch (const InvalidArgumentError&) {
        throw NoPublicKeyError(email.Address());
    }
}

PublicKey PublicKeyService::GetByEmail(const EmailAddress& email,
                                       const util::CancellationToken& token) const {
    return ResolveKey(email, token);
}

std::string PublicKeyService::GetEncodedByEmail(const EmailAddress& email,
                                                const util::CancellationToken& token) const {
    return Encode(ResolveKey(email, token));
}

std::future<PublicKey> PublicKeyService::GetByEmailAsync(EmailAddress email,
                                                         util::CancellationToken token) const {
    return std::async(std::launch::async, [this, email = std::move(email), token]() {
        return GetByEmail(email, token);
    });
}

std::future<std::string> PublicKeyService::GetEncodedByEmailAsync(
    EmailAddress email, util::CancellationToken token) const {
    return std::async(std::launch::async, [this, email = std::move(email), token]() {
        return GetEncodedByEmail(email, token);
    });
}

} // namespace decmail
