// DECMAIL - Public Key Resolvers
// Copyright (c) 2024 DECMAIL Developers
// MIT License
//
// Resolution of a decentralized email address to its encoded public key.
//
// Eppie addresses carry either the key itself or a human alias; aliases go
// through an INameResolver. Bitcoin and Ethereum addresses are looked up with
// a per-network IKeyFetcher. The composite resolver dispatches by network.

#ifndef DECMAIL_KEYS_RESOLVERS_H
#define DECMAIL_KEYS_RESOLVERS_H

#include <decmail/keys/base32e.h>
#include <decmail/keys/network_rules.h>
#include <decmail/mail/email_address.h>
#include <decmail/util/cancellation.h>

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace decmail {

// ============================================================================
// Collaborator Interfaces
// ============================================================================

/// Looks up the key registered for a human alias
class INameResolver {
public:
    virtual ~INameResolver() = default;
    
    /// Encoded key of the name, nullopt when the name is not registered
    virtual std::optional<std::string> Resolve(const std::string& name,
                                               const util::CancellationToken& token) = 0;
};

/// Resolver that knows no names
class NullNameResolver : public INameResolver {
public:
    std::optional<std::string> Resolve(const std::string& name,
                                       const util::CancellationToken& token) override;
};

/// Fetches the public key of an account on a foreign network
class IKeyFetcher {
public:
    virtual ~IKeyFetcher() = default;
    
    /// Encoded key of the account, nullopt when the network holds none
    virtual std::optional<std::string> Fetch(const std::string& address,
                                             const util::CancellationToken& token) = 0;
};

// ============================================================================
// Resolve Result
// ============================================================================

/// Outcome of a resolution
struct ResolveResult {
    enum class Status {
        Found,      ///< value holds a valid encoded key
        Absent,     ///< nothing is registered
        Malformed   ///< something was found but it is not a usable key
    };
    
    Status status{Status::Absent};
    std::string value;
    
    static ResolveResult Found(std::string key) {
        return {Status::Found, std::move(key)};
    }
    static ResolveResult Absent() {
        return {Status::Absent, std::string()};
    }
    static ResolveResult Malformed(std::string value) {
        return {Status::Malformed, std::move(value)};
    }
    
    bool IsFound() const { return status == Status::Found; }
};

const char* ResolveStatusToString(ResolveResult::Status status);

// ============================================================================
// Email Resolvers
// ============================================================================

class IEmailPublicKeyResolver {
public:
    virtual ~IEmailPublicKeyResolver() = default;
    
    virtual ResolveResult Resolve(const EmailAddress& email,
                                  const util::CancellationToken& token) = 0;
};

/**
 * Eppie network resolver.
 *
 * A segment with public key syntax is decoded directly and the name resolver
 * is never consulted. Any other segment is treated as an alias; the value the
 * name resolver returns must pass full validation.
 */
class EppieEmailPublicKeyResolver : public IEmailPublicKeyResolver {
public:
    /// Throws ArgumentNullError for a null codec or name resolver
    EppieEmailPublicKeyResolver(std::shared_ptr<const IEcPublicKeyCodec> codec,
                                std::shared_ptr<INameResolver> nameResolver);
    
    ResolveResult Resolve(const EmailAddress& email,
                          const util::CancellationToken& token) override;

private:
    std::shared_ptr<INameResolver> nameResolver_;
    EppieNetworkPublicKeyRules rules_;
};

/// Bitcoin and Ethereum resolver backed by a key fetcher
class ForeignEmailPublicKeyResolver : public IEmailPublicKeyResolver {
public:
    /// Throws ArgumentNullError for a null codec or fetcher
    ForeignEmailPublicKeyResolver(NetworkType network,
                                  std::shared_ptr<const IEcPublicKeyCodec> codec,
                                  std::shared_ptr<IKeyFetcher> fetcher);
    
    ResolveResult Resolve(const EmailAddress& email,
                          const util::CancellationToken& token) override;

private:
    NetworkType network_;
    std::shared_ptr<IKeyFetcher> fetcher_;
    EppieNetworkPublicKeyRules keyRules_;
};

/// Dispatches to the resolver registered for the address network
class CompositeEmailPublicKeyResolver : public IEmailPublicKeyResolver {
public:
    using ResolverMap = std::map<NetworkType, std::shared_ptr<IEmailPublicKeyResolver>>;
    
    explicit CompositeEmailPublicKeyResolver(ResolverMap resolvers);
    
    /// Throws ArgumentNullError for a null address and NotSupportedError when
    /// no resolver is registered for its network
    ResolveResult Resolve(const EmailAddress& email,
                          const util::CancellationToken& token) override;
    
    bool Supports(NetworkType network) const;

private:
    ResolverMap resolvers_;
};

// ============================================================================
// Caching Name Resolver
// ============================================================================

/**
 * Thread-safe cache in front of another name resolver.
 * Only registered names are cached; misses are asked again every time.
 */
class CachingNameResolver : public INameResolver {
public:
    /// Throws ArgumentNullError for a null inner resolver
    explicit CachingNameResolver(std::shared_ptr<INameResolver> inner);
    
    std::optional<std::string> Resolve(const std::string& name,
                                       const util::CancellationToken& token) override;
    
    /// Drop the cached key of one name
    void Invalidate(const std::string& name);
    
    /// Drop every cached key
    void Clear();
    
    size_t Size() const;

private:
    std::shared_ptr<INameResolver> inner_;
    mutable std::mutex mutex_;
    std::map<std::string, std::string> cache_;
};

} // namespace decmail

#endif // DECMAIL_KEYS_RESOLVERS_H
