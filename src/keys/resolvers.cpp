// DECMAIL - Public Key Resolvers Implementation
// Copyright (c) 2024 DECMAIL Developers
// MIT License

#include <decmail/keys/resolvers.h>
#include <decmail/core/errors.h>
#include <decmail/util/logging.h>

#include <algorithm>
#include <cctype>

namespace decmail {

namespace {

bool IsBlank(const std::string& value) {
    return std::all_of(value.begin(), value.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace

const char* ResolveStatusToString(ResolveResult::Status status) {
    switch (status) {
        case ResolveResult::Status::Found: return "found";
        case ResolveResult::Status::Absent: return "absent";
        case ResolveResult::Status::Malformed: return "malformed";
        default: return "unknown";
    }
}

// ============================================================================
// NullNameResolver
// ============================================================================

std::optional<std::string> NullNameResolver::Resolve(const std::string& /*name*/,
                                                     const util::CancellationToken& token) {
    token.ThrowIfCancellationRequested();
    return std::nullopt;
}

// ============================================================================
// EppieEmailPublicKeyResolver
// ============================================================================

EppieEmailPublicKeyResolver::EppieEmailPublicKeyResolver(
    std::shared_ptr<const IEcPublicKeyCodec> codec,
    std::shared_ptr<INameResolver> nameResolver)
    : nameResolver_(std::move(nameResolver))
    , rules_(std::move(codec)) {
    if (!nameResolver_) {
        throw ArgumentNullError("nameResolver");
    }
}

ResolveResult EppieEmailPublicKeyResolver::Resolve(const EmailAddress& email,
                                                   const util::CancellationToken& token) {
    if (email.IsNull()) {
        throw ArgumentNullError("email");
    }
    token.ThrowIfCancellationRequested();
    
    std::string segment = email.DecentralizedAddress();
    if (IsBlank(segment)) {
        LOG_DEBUG(util::LogCategory::RESOLVE) << "Empty Eppie segment in " << email.Address();
        return ResolveResult::Absent();
    }
    
    // A key in the address is taken as is; no lookup
    if (rules_.IsSyntacticallyValid(segment)) {
        if (rules_.TrySemanticValidate(segment)) {
            return ResolveResult::Found(segment);
        }
        LOG_DEBUG(util::LogCategory::RESOLVE) << "Direct key of " << email.Address()
                                              << " is not a curve point";
        return ResolveResult::Malformed(segment);
    }
    
    auto resolved = nameResolver_->Resolve(segment, token);
    if (!resolved || resolved->empty()) {
        LOG_DEBUG(util::LogCategory::RESOLVE) << "Name '" << segment << "' is not registered";
        return ResolveResult::Absent();
    }
    
    if (!rules_.TryValidate(*resolved)) {
        LOG_WARN(util::LogCategory::RESOLVE) << "Name '" << segment
                                             << "' resolved to an invalid key";
        return ResolveResult::Malformed(*resolved);
    }
    
    return ResolveResult::Found(*resolved);
}

// ============================================================================
// ForeignEmailPublicKeyResolver
// ============================================================================

ForeignEmailPublicKeyResolver::ForeignEmailPublicKeyResolver(
    NetworkType network,
    std::shared_ptr<const IEcPublicKeyCodec> codec,
    std::shared_ptr<IKeyFetcher> fetcher)
    : network_(network)
    , fetcher_(std::move(fetcher))
    , keyRules_(std::move(codec)) {
    if (!fetcher_) {
        throw ArgumentNullError("fetcher");
    }
}

ResolveResult ForeignEmailPublicKeyResolver::Resolve(const EmailAddress& email,
                                                     const util::CancellationToken& token) {
    if (email.IsNull()) {
        throw ArgumentNullError("email");
    }
    token.ThrowIfCancellationRequested();
    
    std::string address = email.DecentralizedAddress();
    auto fetched = fetcher_->Fetch(address, token);
    if (!fetched || fetched->empty()) {
        LOG_DEBUG(util::LogCategory::RESOLVE) << "No public key for " << address << " on "
                                              << NetworkTypeToString(network_);
        return ResolveResult::Absent();
    }
    
    if (!keyRules_.TryValidate(*fetched)) {
        LOG_WARN(util::LogCategory::RESOLVE) << "Key fetched for " << address << " on "
                                             << NetworkTypeToString(network_) << " is invalid";
        return ResolveResult::Malformed(*fetched);
    }
    
    return ResolveResult::Found(*fetched);
}

// ============================================================================
// CompositeEmailPublicKeyResolver
// ============================================================================

CompositeEmailPublicKeyResolver::CompositeEmailPublicKeyResolver(ResolverMap resolvers)
    : resolvers_(std::move(resolvers)) {
    for (const auto& [network, resolver] : resolvers_) {
        if (!resolver) {
            throw ArgumentNullError(std::string("resolver for ") + NetworkTypeToString(network));
        }
    }
}

ResolveResult CompositeEmailPublicKeyResolver::Resolve(const EmailAddress& email,
                                                       const util::CancellationToken& token) {
    if (email.IsNull()) {
        throw ArgumentNullError("email");
    }
    
    NetworkType network = email.Network();
    auto it = resolvers_.find(network);
    if (it == resolvers_.end()) {
        throw NotSupportedError(std::string("Network type ") + NetworkTypeToString(network) +
                                " is not supported");
    }
    
    token.ThrowIfCancellationRequested();
    ResolveResult result = it->second->Resolve(email, token);
    LOG_TRACE(util::LogCategory::RESOLVE) << email.Address() << " -> "
                                          << ResolveStatusToString(result.status);
    return result;
}

bool CompositeEmailPublicKeyResolver::Supports(NetworkType network) const {
    return resolvers_.count(network) != 0;
}

// ============================================================================
// CachingNameResolver
// ============================================================================

CachingNameResolver::CachingNameResolver(std::shared_ptr<INameResolver> inner)
    : inner_(std::move(inner)) {
    if (!inner_) {
        throw ArgumentNullError("inner");
    }
}

std::optional<std::string> CachingNameResolver::Resolve(const std::string& name,
                                                        const util::CancellationToken& token) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cache_.find(name);
        if (it != cache_.end()) {
            return it->second;
        }
    }
    
    // Not held while asking the inner resolver
    auto resolved = inner_->Resolve(name, token);
    if (resolved && !resolved->empty()) {
        std::lock_guard<std::mutex> lock(mutex_);
        cache_[name] = *resolved;
    }
    return resolved;
}

void CachingNameResolver::Invalidate(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.erase(name);
}

void CachingNameResolver::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
}

size_t CachingNameResolver::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

} // namespace decmail
