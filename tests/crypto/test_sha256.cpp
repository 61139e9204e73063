// DECMAIL - SHA256 Tests
// Copyright (c) 2024 DECMAIL Developers
// MIT License

#include <gtest/gtest.h>
#include "decmail/crypto/sha256.h"
#include "decmail/core/hex.h"

#include <string>

namespace decmail {
namespace test {

// ============================================================================
// SHA256 Test Vectors (NIST FIPS 180-4)
// ============================================================================

TEST(SHA256Test, EmptyString) {
    EXPECT_EQ(SHA256Hash(std::string()).ToHex(),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(SHA256Test, ABCString) {
    EXPECT_EQ(SHA256Hash(std::string("abc")).ToHex(),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(SHA256Test, TwoBlockInput) {
    std::string msg = "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq";
    EXPECT_EQ(SHA256Hash(msg).ToHex(),
              "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST(SHA256Test, MillionA) {
    SHA256 hasher;
    std::string chunk(1000, 'a');
    for (int i = 0; i < 1000; ++i) {
        hasher.Write(chunk);
    }
    EXPECT_EQ(hasher.Finalize().ToHex(),
              "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0");
}

// ============================================================================
// Incremental Interface Tests
// ============================================================================

TEST(SHA256Test, IncrementalMatchesOneShot) {
    SHA256 hasher;
    hasher.Write(std::string("tuvi.dec.route.v1|")).Write(std::string("ABC"));
    EXPECT_EQ(hasher.Finalize(), SHA256Hash(std::string("tuvi.dec.route.v1|ABC")));
}

TEST(SHA256Test, ResetStartsOver) {
    SHA256 hasher;
    hasher.Write(std::string("garbage"));
    hasher.Reset();
    hasher.Write(std::string("abc"));
    EXPECT_EQ(hasher.Finalize(), SHA256Hash(std::string("abc")));
}

TEST(SHA256Test, FinalizeIntoBuffer) {
    SHA256 hasher;
    Byte out[SHA256::OUTPUT_SIZE];
    hasher.Write(std::string("abc"));
    hasher.Finalize(out);
    EXPECT_EQ(BytesToHex(out, sizeof(out)),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

} // namespace test
} // namespace decmail
