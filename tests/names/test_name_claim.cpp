// DECMAIL - Name Claim Tests
// Copyright (c) 2024 DECMAIL Developers
// MIT License

#include <gtest/gtest.h>
#include "decmail/names/name_claim.h"
#include "decmail/core/base64.h"
#include "decmail/core/errors.h"
#include "decmail/core/hex.h"
#include "decmail/keys/network_rules.h"

#include <string>

namespace decmail {
namespace test {

namespace {

const std::string SEED = "000102030405060708090a0b0c0d0e0f";
const std::string ACCOUNT0 = "ag5cbrzubnm98b87ufgmvqc6ei7gpxwsq5j6g9ed7nci5yucf6rxg";
const std::string ACCOUNT1 = "aeu6ruhru5zhzyzahyimeysgjp6kqiu5jzj85k9b8xs5wxnuwh2n8";

// RFC 6979 signatures with the key of m/44'/3630'/0'/10/0
const std::string ALICE_SIGNATURE =
    "MEUCIQCJ44AU/YZRL7BwxwiysTZtVG4z6T2xwGOFYYIl887G2wIgJ+qTp53zpjE0fG8JmNfqTFVvNV+wDW9P0NNw3jcN5oI=";
const std::string BOB_SIGNATURE =
    "MEQCIAhtFMurvJ8IMZ4ieuGszTvRdW+d/WZloJi6P2+IpH6kAiBNJHRvRLQDLAOY8QrUMJJb+/LwaFVeieZDsL6ErfHauA==";

Account EppieAccount(const std::string& key, int32_t index) {
    return Account(EmailAddress::CreateDecentralizedAddress(NetworkType::Eppie, key), index);
}

} // anonymous namespace

// ============================================================================
// Canonical Names
// ============================================================================

TEST(NameClaimTest, CanonicalizeName) {
    EXPECT_EQ(names::CanonicalizeName("alice"), "alice.test");
    EXPECT_EQ(names::CanonicalizeName("Alice"), "alice.test");
    EXPECT_EQ(names::CanonicalizeName("alice.test"), "alice.test");
    EXPECT_EQ(names::CanonicalizeName("  Al ice+ "), "alice.test");
    EXPECT_EQ(names::CanonicalizeName("ALICE.TEST"), "alice.test");
    EXPECT_EQ(names::CanonicalizeName(" a+b\t"), "ab.test");
}

TEST(NameClaimTest, CanonicalizeKeepsInnerTabsAndNewlines) {
    EXPECT_EQ(names::CanonicalizeName("a\tb"), "a\tb.test");
    EXPECT_EQ(names::CanonicalizeName("\tA\tB \n"), "a\tb.test");
    EXPECT_EQ(names::CanonicalizeName("a\nb"), "a\nb.test");
    EXPECT_NE(names::CanonicalizeName("a\tb"), names::CanonicalizeName("ab"));
}

TEST(NameClaimTest, CanonicalizeBlank) {
    EXPECT_EQ(names::CanonicalizeName(""), "");
    EXPECT_EQ(names::CanonicalizeName("   "), "");
    EXPECT_EQ(names::CanonicalizeName("\t\n"), "");
}

TEST(NameClaimTest, Payload) {
    EXPECT_EQ(names::BuildClaimV1Payload("Alice", "PUB"),
              "claim-v1\nname=alice.test\npublicKey=PUB");
    
    // Line breaks and '=' cannot forge extra fields
    EXPECT_EQ(names::BuildClaimV1Payload("alice", "PUB\npublicKey=other"),
              "claim-v1\nname=alice.test\npublicKey=PUBpublicKeyother");
    EXPECT_EQ(names::BuildClaimV1Payload("a=b", "PUB\r"),
              "claim-v1\nname=ab.test\npublicKey=PUB");
}

// ============================================================================
// Sign and Verify
// ============================================================================

class NameClaimSignerTest : public ::testing::Test {
protected:
    void SetUp() override {
        master_ = MasterKey::FromSeed(HexToBytes(SEED));
        keys_ = PublicKeyService::CreateDefault(nullptr);
    }
    
    MasterKey master_;
    std::shared_ptr<PublicKeyService> keys_;
};

TEST_F(NameClaimSignerTest, KnownSignatures) {
    names::NameClaimSigner signer(master_, keys_);
    Account account = EppieAccount(ACCOUNT0, 0);
    
    EXPECT_EQ(signer.ClaimPublicKey(account), ACCOUNT0);
    EXPECT_EQ(signer.SignClaim("alice.test", account), ALICE_SIGNATURE);
    EXPECT_EQ(signer.SignClaim("bob", account), BOB_SIGNATURE);
    
    // Same canonical name, same signature
    EXPECT_EQ(signer.SignClaim(" ALICE ", account), ALICE_SIGNATURE);
}

TEST_F(NameClaimSignerTest, VerifyKnownSignatures) {
    EXPECT_TRUE(names::VerifyClaimV1Signature("alice.test", ACCOUNT0, ALICE_SIGNATURE));
    EXPECT_TRUE(names::VerifyClaimV1Signature("Alice", ACCOUNT0, ALICE_SIGNATURE));
    EXPECT_TRUE(names::VerifyClaimV1Signature("bob.test", ACCOUNT0, BOB_SIGNATURE));
    
    EXPECT_FALSE(names::VerifyClaimV1Signature("bob.test", ACCOUNT0, ALICE_SIGNATURE));
    EXPECT_FALSE(names::VerifyClaimV1Signature("alice.test", ACCOUNT1, ALICE_SIGNATURE));
}

TEST_F(NameClaimSignerTest, SignWithAccountIndex) {
    names::NameClaimSigner signer(master_, keys_);
    Account second = EppieAccount(ACCOUNT1, 1);
    
    EXPECT_EQ(signer.ClaimPublicKey(second), ACCOUNT1);
    std::string signature = signer.SignClaim("carol", second);
    EXPECT_TRUE(names::VerifyClaimV1Signature("carol", ACCOUNT1, signature));
    EXPECT_FALSE(names::VerifyClaimV1Signature("carol", ACCOUNT0, signature));
}

TEST_F(NameClaimSignerTest, SignClaimV1Directly) {
    auto key = master_.DerivePath(GetAccountKeyPath(NetworkType::Eppie, 0));
    ASSERT_TRUE(key.has_value());
    
    EXPECT_EQ(names::SignClaimV1("alice", ACCOUNT0, key->GetPrivateKey()), ALICE_SIGNATURE);
    EXPECT_THROW(names::SignClaimV1(" ", ACCOUNT0, key->GetPrivateKey()), InvalidArgumentError);
    EXPECT_THROW(names::SignClaimV1("alice", "", key->GetPrivateKey()), InvalidArgumentError);
    EXPECT_THROW(names::SignClaimV1("alice", ACCOUNT0, PrivateKey()), InvalidArgumentError);
}

TEST_F(NameClaimSignerTest, VerifyRejectsBadInput) {
    EXPECT_FALSE(names::VerifyClaimV1Signature("", ACCOUNT0, ALICE_SIGNATURE));
    EXPECT_FALSE(names::VerifyClaimV1Signature("alice", "", ALICE_SIGNATURE));
    EXPECT_FALSE(names::VerifyClaimV1Signature("alice", ACCOUNT0, ""));
    EXPECT_FALSE(names::VerifyClaimV1Signature("alice", ACCOUNT0, "not base64!"));
    EXPECT_FALSE(names::VerifyClaimV1Signature("alice", "notakey", ALICE_SIGNATURE));
    EXPECT_FALSE(names::VerifyClaimV1Signature("alice", ACCOUNT0, EncodeBase64(Bytes{0x30, 0x00})));
    
    // Flip one bit of s
    auto der = DecodeBase64(ALICE_SIGNATURE);
    ASSERT_TRUE(der.has_value());
    (*der)[der->size() - 1] ^= 0x01;
    EXPECT_FALSE(names::VerifyClaimV1Signature("alice", ACCOUNT0, EncodeBase64(*der)));
}

TEST_F(NameClaimSignerTest, SignerRejectsUnsupportedAccounts) {
    names::NameClaimSigner signer(master_, keys_);
    
    EXPECT_THROW(signer.SignClaim("", EppieAccount(ACCOUNT0, 0)), InvalidArgumentError);
    EXPECT_THROW(signer.SignClaim("  ", EppieAccount(ACCOUNT0, 0)), InvalidArgumentError);
    
    EXPECT_THROW(signer.SignClaim("alice", EppieAccount(ACCOUNT0, -1)), NotSupportedError);
    EXPECT_THROW(signer.SignClaim("alice", Account(EmailAddress("alice@example.com"), 0)),
                 NotSupportedError);
    EXPECT_THROW(signer.SignClaim("alice", Account(EmailAddress("1abc@bitcoin"), 0)),
                 NotSupportedError);
    EXPECT_THROW(signer.ClaimPublicKey(Account()), NotSupportedError);
}

TEST_F(NameClaimSignerTest, NullKeyService) {
    EXPECT_THROW(names::NameClaimSigner(master_, nullptr), ArgumentNullError);
}

} // namespace test
} // namespace decmail
