// DECMAIL - Public Key Resolver Tests
// Copyright (c) 2024 DECMAIL Developers
// MIT License

#include <gtest/gtest.h>
#include "decmail/keys/resolvers.h"
#include "decmail/keys/network_rules.h"
#include "decmail/core/errors.h"
#include "decmail/util/cancellation.h"

#include <atomic>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>

namespace decmail {
namespace test {

namespace {

const std::string KEY_A = "ag5cbrzubnm98b87ufgmvqc6ei7gpxwsq5j6g9ed7nci5yucf6rxg";
const std::string KEY_B = "aeu6ruhru5zhzyzahyimeysgjp6kqiu5jzj85k9b8xs5wxnuwh2n8";
const std::string OFF_CURVE = "aeaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaf";

/// Name resolver backed by a map that counts lookups
class CountingNameResolver : public INameResolver {
public:
    std::optional<std::string> Resolve(const std::string& name,
                                       const util::CancellationToken& token) override {
        token.ThrowIfCancellationRequested();
        ++calls;
        auto it = names.find(name);
        if (it == names.end()) {
            return std::nullopt;
        }
        return it->second;
    }
    
    std::map<std::string, std::string> names;
    std::atomic<int> calls{0};
};

/// Key fetcher returning a fixed answer
class FixedKeyFetcher : public IKeyFetcher {
public:
    explicit FixedKeyFetcher(std::optional<std::string> answer) : answer_(std::move(answer)) {}
    
    std::optional<std::string> Fetch(const std::string& address,
                                     const util::CancellationToken& /*token*/) override {
        lastAddress = address;
        return answer_;
    }
    
    std::string lastAddress;

private:
    std::optional<std::string> answer_;
};

/// Codec whose Decode always fails with the given exception
template<typename E>
class ThrowingCodec : public IEcPublicKeyCodec {
public:
    std::string Encode(const PublicKey& /*key*/) const override {
        throw E("encode");
    }
    PublicKey Decode(const std::string& /*address*/) const override {
        throw E("decode");
    }
};

} // anonymous namespace

// ============================================================================
// Network Rules Tests
// ============================================================================

TEST(NetworkRulesTest, EppieRulesValidateKeys) {
    EppieNetworkPublicKeyRules rules(std::make_shared<Secp256k1Base32ECodec>());
    EXPECT_TRUE(rules.TryValidate(KEY_A));
    EXPECT_TRUE(rules.IsSyntacticallyValid(OFF_CURVE));
    EXPECT_FALSE(rules.TrySemanticValidate(OFF_CURVE));
    EXPECT_FALSE(rules.TryValidate("alice"));
}

TEST(NetworkRulesTest, CodecFormatErrorMeansInvalid) {
    EppieNetworkPublicKeyRules rules(std::make_shared<ThrowingCodec<FormatError>>());
    EXPECT_FALSE(rules.TrySemanticValidate(KEY_A));
}

TEST(NetworkRulesTest, UnexpectedCodecFailurePropagates) {
    EppieNetworkPublicKeyRules rules(std::make_shared<ThrowingCodec<std::runtime_error>>());
    EXPECT_THROW(rules.TrySemanticValidate(KEY_A), std::runtime_error);
}

TEST(NetworkRulesTest, MalformedSegmentNeverReachesCodec) {
    EppieNetworkPublicKeyRules rules(std::make_shared<ThrowingCodec<std::runtime_error>>());
    EXPECT_NO_THROW(EXPECT_FALSE(rules.TryValidate("alice")));
    EXPECT_NO_THROW(EXPECT_FALSE(rules.TryValidate(KEY_A.substr(1))));
    EXPECT_NO_THROW(EXPECT_FALSE(rules.TryValidate(KEY_A + "a")));
    EXPECT_NO_THROW(EXPECT_FALSE(rules.TryValidate("")));
}

TEST(NetworkRulesTest, NullCodecThrows) {
    EXPECT_THROW(EppieNetworkPublicKeyRules(nullptr), ArgumentNullError);
}

TEST(NetworkRulesTest, Factory) {
    auto codec = std::make_shared<Secp256k1Base32ECodec>();
    auto eppie = CreateNetworkPublicKeyRules(NetworkType::Eppie, codec);
    EXPECT_FALSE(eppie->TryValidate("0xabc"));
    
    auto bitcoin = CreateNetworkPublicKeyRules(NetworkType::Bitcoin, codec);
    EXPECT_TRUE(bitcoin->TryValidate("1BoatSLRHtKNngkdXEeobR76b53LETtpyT"));
    EXPECT_FALSE(bitcoin->TryValidate(""));
    
    EXPECT_THROW(CreateNetworkPublicKeyRules(NetworkType::Unsupported, codec), NotSupportedError);
}

// ============================================================================
// Eppie Resolver Tests
// ============================================================================

class EppieResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        names_ = std::make_shared<CountingNameResolver>();
        names_->names["alice"] = KEY_A;
        names_->names["broken"] = "not-a-key";
        names_->names["offcurve"] = OFF_CURVE;
        resolver_ = std::make_unique<EppieEmailPublicKeyResolver>(
            std::make_shared<Secp256k1Base32ECodec>(), names_);
    }
    
    ResolveResult Resolve(const std::string& address) {
        return resolver_->Resolve(EmailAddress(address), util::CancellationToken::None());
    }
    
    std::shared_ptr<CountingNameResolver> names_;
    std::unique_ptr<EppieEmailPublicKeyResolver> resolver_;
};

TEST_F(EppieResolverTest, DirectKeyNeedsNoLookup) {
    auto result = Resolve(KEY_B + "@eppie");
    EXPECT_TRUE(result.IsFound());
    EXPECT_EQ(result.value, KEY_B);
    EXPECT_EQ(names_->calls.load(), 0);
}

TEST_F(EppieResolverTest, HybridKeyNeedsNoLookup) {
    auto result = Resolve("bob+" + KEY_B + "@example.com");
    EXPECT_TRUE(result.IsFound());
    EXPECT_EQ(result.value, KEY_B);
    EXPECT_EQ(names_->calls.load(), 0);
}

TEST_F(EppieResolverTest, DirectOffCurveKeyIsMalformed) {
    auto result = Resolve(OFF_CURVE + "@eppie");
    EXPECT_EQ(result.status, ResolveResult::Status::Malformed);
    EXPECT_EQ(names_->calls.load(), 0);
}

TEST_F(EppieResolverTest, NameLookup) {
    auto result = Resolve("alice@eppie");
    EXPECT_TRUE(result.IsFound());
    EXPECT_EQ(result.value, KEY_A);
    EXPECT_EQ(names_->calls.load(), 1);
}

TEST_F(EppieResolverTest, UnknownNameIsAbsent) {
    EXPECT_EQ(Resolve("nobody@eppie").status, ResolveResult::Status::Absent);
}

TEST_F(EppieResolverTest, BadRegisteredValueIsMalformed) {
    EXPECT_EQ(Resolve("broken@eppie").status, ResolveResult::Status::Malformed);
    EXPECT_EQ(Resolve("offcurve@eppie").status, ResolveResult::Status::Malformed);
}

TEST_F(EppieResolverTest, BlankSegmentIsAbsent) {
    EXPECT_EQ(Resolve("@eppie").status, ResolveResult::Status::Absent);
    EXPECT_EQ(names_->calls.load(), 0);
}

TEST_F(EppieResolverTest, NullEmailThrows) {
    EXPECT_THROW(resolver_->Resolve(EmailAddress(), util::CancellationToken::None()),
                 ArgumentNullError);
}

TEST_F(EppieResolverTest, CanceledTokenThrows) {
    util::CancellationSource source;
    source.Cancel();
    EXPECT_THROW(resolver_->Resolve(EmailAddress("alice@eppie"), source.Token()),
                 OperationCanceledError);
}

// ============================================================================
// Foreign Resolver Tests
// ============================================================================

TEST(ForeignResolverTest, FetchedKeyIsValidated) {
    auto codec = std::make_shared<Secp256k1Base32ECodec>();
    auto good = std::make_shared<FixedKeyFetcher>(KEY_A);
    ForeignEmailPublicKeyResolver resolver(NetworkType::Bitcoin, codec, good);
    
    auto result = resolver.Resolve(EmailAddress("1BoatSLRHtKNngkdXEeobR76b53LETtpyT@bitcoin"),
                                   util::CancellationToken::None());
    EXPECT_TRUE(result.IsFound());
    EXPECT_EQ(good->lastAddress, "1BoatSLRHtKNngkdXEeobR76b53LETtpyT");
}

TEST(ForeignResolverTest, MissingAndInvalidKeys) {
    auto codec = std::make_shared<Secp256k1Base32ECodec>();
    EmailAddress email("0x52908400098527886E0F7030069857D2E4169EE7@ethereum");
    
    ForeignEmailPublicKeyResolver missing(NetworkType::Ethereum, codec,
                                          std::make_shared<FixedKeyFetcher>(std::nullopt));
    EXPECT_EQ(missing.Resolve(email, util::CancellationToken::None()).status,
              ResolveResult::Status::Absent);
    
    ForeignEmailPublicKeyResolver invalid(NetworkType::Ethereum, codec,
                                          std::make_shared<FixedKeyFetcher>("0x04abcdef"));
    EXPECT_EQ(invalid.Resolve(email, util::CancellationToken::None()).status,
              ResolveResult::Status::Malformed);
}

TEST(ForeignResolverTest, NullFetcherThrows) {
    EXPECT_THROW(ForeignEmailPublicKeyResolver(NetworkType::Bitcoin,
                                               std::make_shared<Secp256k1Base32ECodec>(),
                                               nullptr),
                 ArgumentNullError);
}

// ============================================================================
// Composite Resolver Tests
// ============================================================================

TEST(CompositeResolverTest, RoutesByNetwork) {
    auto codec = std::make_shared<Secp256k1Base32ECodec>();
    auto names = std::make_shared<CountingNameResolver>();
    names->names["alice"] = KEY_A;
    
    CompositeEmailPublicKeyResolver::ResolverMap map;
    map[NetworkType::Eppie] = std::make_shared<EppieEmailPublicKeyResolver>(codec, names);
    map[NetworkType::Bitcoin] = std::make_shared<ForeignEmailPublicKeyResolver>(
        NetworkType::Bitcoin, codec, std::make_shared<FixedKeyFetcher>(KEY_B));
    CompositeEmailPublicKeyResolver composite(map);
    
    EXPECT_TRUE(composite.Supports(NetworkType::Eppie));
    EXPECT_FALSE(composite.Supports(NetworkType::Ethereum));
    
    auto none = util::CancellationToken::None();
    EXPECT_EQ(composite.Resolve(EmailAddress("alice@eppie"), none).value, KEY_A);
    EXPECT_EQ(composite.Resolve(EmailAddress("satoshi@bitcoin"), none).value, KEY_B);
}

TEST(CompositeResolverTest, UnsupportedNetworkThrows) {
    CompositeEmailPublicKeyResolver composite({});
    auto none = util::CancellationToken::None();
    
    try {
        composite.Resolve(EmailAddress("someone@ethereum"), none);
        FAIL() << "Expected NotSupportedError";
    } catch (const NotSupportedError& e) {
        EXPECT_EQ(std::string(e.what()), "Network type ethereum is not supported");
    }
    
    EXPECT_THROW(composite.Resolve(EmailAddress("someone@example.com"), none), NotSupportedError);
}

TEST(CompositeResolverTest, NullResolverThrows) {
    CompositeEmailPublicKeyResolver::ResolverMap map;
    map[NetworkType::Eppie] = nullptr;
    EXPECT_THROW(CompositeEmailPublicKeyResolver{map}, ArgumentNullError);
}

// ============================================================================
// Caching Resolver Tests
// ============================================================================

TEST(CachingNameResolverTest, CachesFoundKeys) {
    auto inner = std::make_shared<CountingNameResolver>();
    inner->names["alice"] = KEY_A;
    CachingNameResolver cache(inner);
    auto none = util::CancellationToken::None();
    
    EXPECT_EQ(cache.Resolve("alice", none), KEY_A);
    EXPECT_EQ(cache.Resolve("alice", none), KEY_A);
    EXPECT_EQ(inner->calls.load(), 1);
    EXPECT_EQ(cache.Size(), 1u);
}

TEST(CachingNameResolverTest, DoesNotCacheMisses) {
    auto inner = std::make_shared<CountingNameResolver>();
    CachingNameResolver cache(inner);
    auto none = util::CancellationToken::None();
    
    EXPECT_FALSE(cache.Resolve("nobody", none).has_value());
    EXPECT_FALSE(cache.Resolve("nobody", none).has_value());
    EXPECT_EQ(inner->calls.load(), 2);
    EXPECT_EQ(cache.Size(), 0u);
}

TEST(CachingNameResolverTest, InvalidateForcesLookup) {
    auto inner = std::make_shared<CountingNameResolver>();
    inner->names["alice"] = KEY_A;
    CachingNameResolver cache(inner);
    auto none = util::CancellationToken::None();
    
    cache.Resolve("alice", none);
    inner->names["alice"] = KEY_B;
    cache.Invalidate("alice");
    EXPECT_EQ(cache.Resolve("alice", none), KEY_B);
    
    cache.Clear();
    EXPECT_EQ(cache.Size(), 0u);
}

} // namespace test
} // namespace decmail
