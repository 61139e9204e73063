// DECMAIL - secp256k1 Keys
// Copyright (c) 2024 DECMAIL Developers
// MIT License

#include <decmail/crypto/keys.h>
#include <decmail/core/errors.h>
#include <decmail/core/hex.h>
#include <decmail/core/random.h>
#include <decmail/crypto/hmac.h>

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/obj_mac.h>

#include <algorithm>
#include <cstring>
#include <memory>
#include <new>
#include <stdexcept>

namespace decmail {

namespace {

// ============================================================================
// OpenSSL handle ownership
// ============================================================================

struct BNDeleter { void operator()(BIGNUM* p) const { BN_clear_free(p); } };
struct BNCtxDeleter { void operator()(BN_CTX* p) const { BN_CTX_free(p); } };
struct PointDeleter { void operator()(EC_POINT* p) const { EC_POINT_clear_free(p); } };
struct GroupDeleter { void operator()(EC_GROUP* p) const { EC_GROUP_free(p); } };
struct SigDeleter { void operator()(ECDSA_SIG* p) const { ECDSA_SIG_free(p); } };

using BNPtr = std::unique_ptr<BIGNUM, BNDeleter>;
using BNCtxPtr = std::unique_ptr<BN_CTX, BNCtxDeleter>;
using PointPtr = std::unique_ptr<EC_POINT, PointDeleter>;
using GroupPtr = std::unique_ptr<EC_GROUP, GroupDeleter>;
using SigPtr = std::unique_ptr<ECDSA_SIG, SigDeleter>;

const EC_GROUP* Group() {
    static const GroupPtr group(EC_GROUP_new_by_curve_name(NID_secp256k1));
    if (!group) {
        throw std::runtime_error("secp256k1 curve is unavailable");
    }
    return group.get();
}

const BIGNUM* Order() {
    return EC_GROUP_get0_order(Group());
}

BNCtxPtr NewCtx() {
    BNCtxPtr ctx(BN_CTX_new());
    if (!ctx) {
        throw std::bad_alloc();
    }
    return ctx;
}

BNPtr NewBN() {
    BNPtr bn(BN_new());
    if (!bn) {
        throw std::bad_alloc();
    }
    return bn;
}

BNPtr BNFromBytes(const uint8_t* data, size_t len) {
    BNPtr bn(BN_bin2bn(data, static_cast<int>(len), nullptr));
    if (!bn) {
        throw std::bad_alloc();
    }
    return bn;
}

void BNToBytes32(const BIGNUM* bn, uint8_t* out) {
    if (BN_bn2binpad(bn, out, 32) != 32) {
        throw std::runtime_error("Scalar does not fit in 32 bytes");
    }
}

PointPtr NewPoint() {
    PointPtr point(EC_POINT_new(Group()));
    if (!point) {
        throw std::bad_alloc();
    }
    return point;
}

/// Parse an encoded point; null when it is not on the curve
PointPtr ParsePoint(const uint8_t* data, size_t len, BN_CTX* ctx) {
    PointPtr point = NewPoint();
    if (!EC_POINT_oct2point(Group(), point.get(), data, len, ctx)) {
        return nullptr;
    }
    if (EC_POINT_is_at_infinity(Group(), point.get())) {
        return nullptr;
    }
    return point;
}

/// Reduce a 32-byte digest modulo the curve order
BNPtr DigestToScalar(const Hash256& hash, BN_CTX* ctx) {
    BNPtr raw = BNFromBytes(hash.data(), hash.size());
    BNPtr reduced = NewBN();
    if (!BN_nnmod(reduced.get(), raw.get(), Order(), ctx)) {
        throw std::runtime_error("BN_nnmod failed");
    }
    return reduced;
}

bool AffineX(const EC_POINT* point, BIGNUM* x, BN_CTX* ctx) {
    return EC_POINT_get_affine_coordinates(Group(), point, x, nullptr, ctx) == 1;
}

// ============================================================================
// RFC 6979 deterministic nonce generation (HMAC-SHA256)
// ============================================================================

class NonceGenerator {
public:
    NonceGenerator(const Byte* key32, const uint8_t* msg32) {
        V_.fill(0x01);
        K_.fill(0x00);
        
        Bytes seed;
        seed.insert(seed.end(), key32, key32 + 32);
        seed.insert(seed.end(), msg32, msg32 + 32);
        
        Update(0x00, seed);
        Update(0x01, seed);
        SecureClear(seed.data(), seed.size());
    }
    
    ~NonceGenerator() {
        SecureClear(K_.data(), K_.size());
        SecureClear(V_.data(), V_.size());
    }
    
    /// Next candidate nonce; callers reject values outside [1, n-1]
    std::array<uint8_t, 32> Next() {
        if (retry_) {
            Bytes data(V_.begin(), V_.end());
            data.push_back(0x00);
            K_ = Mac(data);
            V_ = Mac(Bytes(V_.begin(), V_.end()));
        }
        retry_ = true;
        V_ = Mac(Bytes(V_.begin(), V_.end()));
        return V_;
    }

private:
    std::array<uint8_t, 32> K_;
    std::array<uint8_t, 32> V_;
    bool retry_{false};
    
    std::array<uint8_t, 32> Mac(const Bytes& data) const {
        Hash256 mac = ComputeHMAC_SHA256(K_.data(), K_.size(), data.data(), data.size());
        std::array<uint8_t, 32> out;
        std::memcpy(out.data(), mac.data(), 32);
        return out;
    }
    
    void Update(uint8_t separator, const Bytes& seed) {
        Bytes data(V_.begin(), V_.end());
        data.push_back(separator);
        data.insert(data.end(), seed.begin(), seed.end());
        K_ = Mac(data);
        V_ = Mac(Bytes(V_.begin(), V_.end()));
        SecureClear(data.data(), data.size());
    }
};

} // anonymous namespace

// ============================================================================
// secp256k1 helpers
// ============================================================================

namespace secp256k1 {

bool IsValidPrivateKey(const Byte* key32) {
    BNPtr k = BNFromBytes(key32, PRIVATE_KEY_SIZE);
    return !BN_is_zero(k.get()) && BN_cmp(k.get(), Order()) < 0;
}

bool ParseDERSignature(const Bytes& der, Scalar& r, Scalar& s) {
    if (der.empty() || der.size() > MAX_SIGNATURE_SIZE) {
        return false;
    }
    
    const unsigned char* p = der.data();
    SigPtr sig(d2i_ECDSA_SIG(nullptr, &p, static_cast<long>(der.size())));
    if (!sig || p != der.data() + der.size()) {
        return false;
    }
    
    // Only the canonical encoding is accepted
    int len = i2d_ECDSA_SIG(sig.get(), nullptr);
    if (len <= 0 || static_cast<size_t>(len) != der.size()) {
        return false;
    }
    Bytes reencoded(static_cast<size_t>(len));
    unsigned char* q = reencoded.data();
    i2d_ECDSA_SIG(sig.get(), &q);
    if (reencoded != der) {
        return false;
    }
    
    const BIGNUM* br = nullptr;
    const BIGNUM* bs = nullptr;
    ECDSA_SIG_get0(sig.get(), &br, &bs);
    
    for (const BIGNUM* v : {br, bs}) {
        if (BN_is_zero(v) || BN_is_negative(v) || BN_cmp(v, Order()) >= 0) {
            return false;
        }
    }
    
    BNToBytes32(br, r.data());
    BNToBytes32(bs, s.data());
    return true;
}

bool IsLowS(const Scalar& s) {
    BNPtr value = BNFromBytes(s.data(), s.size());
    BNPtr half = NewBN();
    if (!BN_rshift1(half.get(), Order())) {
        throw std::runtime_error("BN_rshift1 failed");
    }
    return BN_cmp(value.get(), half.get()) <= 0;
}

} // namespace secp256k1

// ============================================================================
// PublicKey Implementation
// ============================================================================

PublicKey::PublicKey(const Byte* data, size_t len) {
    bytes_.fill(0);
    
    if (!data || len == 0 || len > MAX_SIZE) {
        return;
    }
    
    if (len == COMPRESSED_SIZE) {
        if (data[0] != 0x02 && data[0] != 0x03) {
            return;
        }
    } else if (len == MAX_SIZE) {
        if (data[0] != 0x04) {
            return;
        }
    } else {
        return;
    }
    
    std::memcpy(bytes_.data(), data, len);
    length_ = static_cast<Byte>(len);
}

bool PublicKey::IsValid() const {
    if (length_ == COMPRESSED_SIZE) {
        return bytes_[0] == 0x02 || bytes_[0] == 0x03;
    }
    if (length_ == MAX_SIZE) {
        return bytes_[0] == 0x04;
    }
    return false;
}

bool PublicKey::IsFullyValid() const {
    if (!IsValid()) {
        return false;
    }
    BNCtxPtr ctx = NewCtx();
    return ParsePoint(bytes_.data(), length_, ctx.get()) != nullptr;
}

PublicKey PublicKey::GetCompressed() const {
    if (!IsValid()) {
        return PublicKey();
    }
    if (IsCompressed()) {
        return *this;
    }
    
    BNCtxPtr ctx = NewCtx();
    PointPtr point = ParsePoint(bytes_.data(), length_, ctx.get());
    if (!point) {
        return PublicKey();
    }
    
    std::array<uint8_t, COMPRESSED_SIZE> out{};
    size_t len = EC_POINT_point2oct(Group(), point.get(), POINT_CONVERSION_COMPRESSED,
                                    out.data(), out.size(), ctx.get());
    if (len != COMPRESSED_SIZE) {
        return PublicKey();
    }
    return PublicKey(out.data(), out.size());
}

bool PublicKey::Verify(const Hash256& hash, const Bytes& signature) const {
    if (!IsValid() || signature.empty()) {
        return false;
    }
    
    std::array<uint8_t, 32> rBytes{};
    std::array<uint8_t, 32> sBytes{};
    if (!secp256k1::ParseDERSignature(signature, rBytes, sBytes) ||
        !secp256k1::IsLowS(sBytes)) {
        return false;
    }
    
    BNCtxPtr ctx = NewCtx();
    PointPtr q = ParsePoint(bytes_.data(), length_, ctx.get());
    if (!q) {
        return false;
    }
    
    const BIGNUM* n = Order();
    BNPtr r = BNFromBytes(rBytes.data(), rBytes.size());
    BNPtr s = BNFromBytes(sBytes.data(), sBytes.size());
    BNPtr e = DigestToScalar(hash, ctx.get());
    
    // u1 = e / s, u2 = r / s, R = u1*G + u2*Q
    BNPtr w(BN_mod_inverse(nullptr, s.get(), n, ctx.get()));
    if (!w) {
        return false;
    }
    BNPtr u1 = NewBN();
    BNPtr u2 = NewBN();
    if (!BN_mod_mul(u1.get(), e.get(), w.get(), n, ctx.get()) ||
        !BN_mod_mul(u2.get(), r.get(), w.get(), n, ctx.get())) {
        return false;
    }
    
    PointPtr point = NewPoint();
    if (!EC_POINT_mul(Group(), point.get(), u1.get(), q.get(), u2.get(), ctx.get()) ||
        EC_POINT_is_at_infinity(Group(), point.get())) {
        return false;
    }
    
    BNPtr x = NewBN();
    BNPtr xModN = NewBN();
    if (!AffineX(point.get(), x.get(), ctx.get()) ||
        !BN_nnmod(xModN.get(), x.get(), n, ctx.get())) {
        return false;
    }
    return BN_cmp(xModN.get(), r.get()) == 0;
}

bool PublicKey::operator==(const PublicKey& other) const {
    return length_ == other.length_ &&
           std::memcmp(bytes_.data(), other.bytes_.data(), length_) == 0;
}

std::string PublicKey::ToHex() const {
    return BytesToHex(bytes_.data(), length_);
}

std::optional<PublicKey> PublicKey::FromHex(const std::string& hex) {
    if (!IsValidHex(hex)) {
        return std::nullopt;
    }
    PublicKey key(HexToBytes(hex));
    if (!key.IsValid()) {
        return std::nullopt;
    }
    return key;
}

// ============================================================================
// PrivateKey Implementation
// ============================================================================

PrivateKey::PrivateKey(const Byte* data) {
    bytes_.fill(0);
    if (data) {
        std::memcpy(bytes_.data(), data, SIZE);
        valid_ = secp256k1::IsValidPrivateKey(bytes_.data());
    } else {
        valid_ = false;
    }
}

PrivateKey::~PrivateKey() {
    Clear();
}

PrivateKey::PrivateKey(PrivateKey&& other) noexcept
    : bytes_(other.bytes_), valid_(other.valid_) {
    other.Clear();
}

PrivateKey& PrivateKey::operator=(PrivateKey&& other) noexcept {
    if (this != &other) {
        bytes_ = other.bytes_;
        valid_ = other.valid_;
        other.Clear();
    }
    return *this;
}

PrivateKey::PrivateKey(const PrivateKey& other)
    : bytes_(other.bytes_), valid_(other.valid_) {
}

PrivateKey& PrivateKey::operator=(const PrivateKey& other) {
    if (this != &other) {
        bytes_ = other.bytes_;
        valid_ = other.valid_;
    }
    return *this;
}

PrivateKey PrivateKey::Generate() {
    std::array<uint8_t, SIZE> candidate{};
    do {
        GetRandBytes(candidate.data(), candidate.size());
    } while (!secp256k1::IsValidPrivateKey(candidate.data()));
    
    PrivateKey key(candidate);
    SecureClear(candidate.data(), candidate.size());
    return key;
}

PublicKey PrivateKey::GetPublicKey() const {
    if (!valid_) {
        return PublicKey();
    }
    
    BNCtxPtr ctx = NewCtx();
    BNPtr d = BNFromBytes(bytes_.data(), SIZE);
    PointPtr point = NewPoint();
    if (!EC_POINT_mul(Group(), point.get(), d.get(), nullptr, nullptr, ctx.get())) {
        return PublicKey();
    }
    
    std::array<uint8_t, PublicKey::COMPRESSED_SIZE> out{};
    size_t len = EC_POINT_point2oct(Group(), point.get(), POINT_CONVERSION_COMPRESSED,
                                    out.data(), out.size(), ctx.get());
    if (len != PublicKey::COMPRESSED_SIZE) {
        return PublicKey();
    }
    return PublicKey(out.data(), out.size());
}

Bytes PrivateKey::Sign(const Hash256& hash) const {
    if (!valid_) {
        return {};
    }
    
    BNCtxPtr ctx = NewCtx();
    const BIGNUM* n = Order();
    BNPtr d = BNFromBytes(bytes_.data(), SIZE);
    BNPtr e = DigestToScalar(hash, ctx.get());
    
    std::array<uint8_t, 32> h1{};
    BNToBytes32(e.get(), h1.data());
    
    BNPtr half = NewBN();
    if (!BN_rshift1(half.get(), n)) {
        return {};
    }
    
    NonceGenerator nonces(bytes_.data(), h1.data());
    
    for (;;) {
        std::array<uint8_t, 32> kBytes = nonces.Next();
        if (!secp256k1::IsValidPrivateKey(kBytes.data())) {
            continue;
        }
        BNPtr k = BNFromBytes(kBytes.data(), kBytes.size());
        SecureClear(kBytes.data(), kBytes.size());
        
        // r = (k*G).x mod n
        PointPtr point = NewPoint();
        BNPtr x = NewBN();
        BNPtr r = NewBN();
        if (!EC_POINT_mul(Group(), point.get(), k.get(), nullptr, nullptr, ctx.get()) ||
            !AffineX(point.get(), x.get(), ctx.get()) ||
            !BN_nnmod(r.get(), x.get(), n, ctx.get())) {
            return {};
        }
        if (BN_is_zero(r.get())) {
            continue;
        }
        
        // s = k^-1 * (e + r*d) mod n
        BNPtr kinv(BN_mod_inverse(nullptr, k.get(), n, ctx.get()));
        BNPtr rd = NewBN();
        BNPtr sum = NewBN();
        BNPtr s = NewBN();
        if (!kinv ||
            !BN_mod_mul(rd.get(), r.get(), d.get(), n, ctx.get()) ||
            !BN_mod_add(sum.get(), e.get(), rd.get(), n, ctx.get()) ||
            !BN_mod_mul(s.get(), kinv.get(), sum.get(), n, ctx.get())) {
            return {};
        }
        if (BN_is_zero(s.get())) {
            continue;
        }
        
        // Normalize to low S
        if (BN_cmp(s.get(), half.get()) > 0) {
            if (!BN_sub(s.get(), n, s.get())) {
                return {};
            }
        }
        
        SigPtr sig(ECDSA_SIG_new());
        if (!sig || !ECDSA_SIG_set0(sig.get(), r.get(), s.get())) {
            return {};
        }
        // Ownership of r and s moved into sig
        r.release();
        s.release();
        
        int len = i2d_ECDSA_SIG(sig.get(), nullptr);
        if (len <= 0) {
            return {};
        }
        Bytes der(static_cast<size_t>(len));
        unsigned char* p = der.data();
        i2d_ECDSA_SIG(sig.get(), &p);
        return der;
    }
}

std::optional<PrivateKey> PrivateKey::TweakAdd(const Hash256& tweak) const {
    if (!valid_) {
        return std::nullopt;
    }
    
    BNCtxPtr ctx = NewCtx();
    const BIGNUM* n = Order();
    BNPtr t = BNFromBytes(tweak.data(), tweak.size());
    if (BN_cmp(t.get(), n) >= 0) {
        return std::nullopt;
    }
    
    BNPtr d = BNFromBytes(bytes_.data(), SIZE);
    BNPtr sum = NewBN();
    if (!BN_mod_add(sum.get(), d.get(), t.get(), n, ctx.get()) || BN_is_zero(sum.get())) {
        return std::nullopt;
    }
    
    std::array<uint8_t, SIZE> out{};
    BNToBytes32(sum.get(), out.data());
    PrivateKey result(out);
    SecureClear(out.data(), out.size());
    return result;
}

std::optional<Hash256> PrivateKey::ECDH(const PublicKey& other) const {
    if (!valid_ || !other.IsValid()) {
        return std::nullopt;
    }
    
    BNCtxPtr ctx = NewCtx();
    PointPtr q = ParsePoint(other.data(), other.size(), ctx.get());
    if (!q) {
        return std::nullopt;
    }
    
    BNPtr d = BNFromBytes(bytes_.data(), SIZE);
    PointPtr shared = NewPoint();
    BNPtr x = NewBN();
    if (!EC_POINT_mul(Group(), shared.get(), nullptr, q.get(), d.get(), ctx.get()) ||
        EC_POINT_is_at_infinity(Group(), shared.get()) ||
        !AffineX(shared.get(), x.get(), ctx.get())) {
        return std::nullopt;
    }
    
    Hash256 secret;
    BNToBytes32(x.get(), secret.data());
    return secret;
}

bool PrivateKey::operator==(const PrivateKey& other) const {
    if (valid_ != other.valid_) {
        return false;
    }
    return ConstantTimeCompare(bytes_.data(), other.bytes_.data(), SIZE);
}

void PrivateKey::Clear() {
    SecureClear(bytes_.data(), bytes_.size());
    valid_ = false;
}

} // namespace decmail
