// DECMAIL - HD Key Derivation Implementation (BIP32/BIP44)
// Copyright (c) 2024 DECMAIL Developers
// MIT License

#include <decmail/keys/hdkey.h>
#include <decmail/core/errors.h>
#include <decmail/crypto/hmac.h>
#include <decmail/crypto/sha256.h>

#include <cstring>
#include <sstream>

namespace decmail {

namespace {

const std::string TAG_DOMAIN = "decmail.tag.v1";

PathComponent CheckedComponent(uint32_t index, bool hardened) {
    if (index >= HARDENED_FLAG) {
        throw InvalidArgumentError("Path component " + std::to_string(index) +
                                   " is out of range");
    }
    return PathComponent(index, hardened);
}

} // anonymous namespace

// ============================================================================
// PathComponent Implementation
// ============================================================================

std::optional<PathComponent> PathComponent::FromString(const std::string& str) {
    if (str.empty()) {
        return std::nullopt;
    }
    
    bool hardened = false;
    std::string numStr = str;
    
    if (str.back() == '\'' || str.back() == 'h' || str.back() == 'H') {
        hardened = true;
        numStr = str.substr(0, str.size() - 1);
    }
    
    if (numStr.empty() || numStr.size() > 10) {
        return std::nullopt;
    }
    
    uint64_t value = 0;
    for (char c : numStr) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        value = value * 10 + static_cast<uint64_t>(c - '0');
    }
    if (value >= HARDENED_FLAG) {
        return std::nullopt;
    }
    
    return PathComponent(static_cast<uint32_t>(value), hardened);
}

std::string PathComponent::ToString() const {
    return std::to_string(index) + (hardened ? "'" : "");
}

// ============================================================================
// DerivationPath Implementation
// ============================================================================

std::optional<DerivationPath> DerivationPath::FromString(const std::string& path) {
    if (path.empty()) {
        return DerivationPath();
    }
    
    std::string p = path;
    
    // Remove leading "m/" or "M/"
    if (p.size() >= 2 && (p[0] == 'm' || p[0] == 'M') && p[1] == '/') {
        p = p.substr(2);
    } else if (p.size() >= 1 && (p[0] == 'm' || p[0] == 'M')) {
        p = p.substr(1);
    }
    
    if (p.empty()) {
        return DerivationPath();
    }
    
    std::vector<PathComponent> components;
    std::istringstream stream(p);
    std::string token;
    
    while (std::getline(stream, token, '/')) {
        if (token.empty()) continue;
        
        auto comp = PathComponent::FromString(token);
        if (!comp) {
            return std::nullopt;
        }
        components.push_back(*comp);
    }
    
    return DerivationPath(std::move(components));
}

DerivationPath DerivationPath::BIP44(uint32_t coinType, uint32_t account,
                                     uint32_t channel, uint32_t index) {
    std::vector<PathComponent> components;
    components.push_back(CheckedComponent(BIP44_PURPOSE, true));
    components.push_back(CheckedComponent(coinType, true));
    components.push_back(CheckedComponent(account, true));
    components.push_back(CheckedComponent(channel, false));
    components.push_back(CheckedComponent(index, false));
    return DerivationPath(std::move(components));
}

DerivationPath DerivationPath::Child(uint32_t index, bool hardened) const {
    std::vector<PathComponent> newComponents = components_;
    newComponents.push_back(CheckedComponent(index, hardened));
    return DerivationPath(std::move(newComponents));
}

std::string DerivationPath::ToString() const {
    std::string result = "m";
    for (const auto& comp : components_) {
        result += "/" + comp.ToString();
    }
    return result;
}

bool DerivationPath::operator==(const DerivationPath& other) const {
    if (components_.size() != other.components_.size()) {
        return false;
    }
    for (size_t i = 0; i < components_.size(); ++i) {
        if (components_[i].index != other.components_[i].index ||
            components_[i].hardened != other.components_[i].hardened) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// ExtendedKey Implementation
// ============================================================================

ExtendedKey::ExtendedKey(const PrivateKey& key, 
                         const std::array<Byte, CHAIN_CODE_SIZE>& chainCode,
                         uint8_t depth, uint32_t childIndex)
    : key_(key)
    , chainCode_(chainCode)
    , depth_(depth)
    , childIndex_(childIndex) {
}

ExtendedKey ExtendedKey::FromSeed(const Byte* seed, size_t seedLen) {
    if (seed == nullptr || seedLen < MIN_SEED_SIZE || seedLen > MAX_SEED_SIZE) {
        return ExtendedKey();
    }
    
    // BIP32: Master key = HMAC-SHA512(Key = "Bitcoin seed", Data = Seed)
    static const char* KEY = "Bitcoin seed";
    
    Hash512 hash = ComputeHMAC_SHA512(reinterpret_cast<const Byte*>(KEY), 12,
                                      seed, seedLen);
    
    // Left 32 bytes = private key
    // Right 32 bytes = chain code
    std::array<Byte, CHAIN_CODE_SIZE> chainCode{};
    std::memcpy(chainCode.data(), hash.data() + 32, 32);
    
    PrivateKey privKey(hash.data());
    SecureClear(hash.data(), hash.size());
    if (!privKey.IsValid()) {
        return ExtendedKey();
    }
    
    return ExtendedKey(privKey, chainCode, 0, 0);
}

std::optional<ExtendedKey> ExtendedKey::DeriveChild(uint32_t index) const {
    if (!IsValid()) {
        return std::nullopt;
    }
    
    Bytes data;
    data.reserve(37);
    
    if ((index & HARDENED_FLAG) != 0) {
        // Hardened: 0x00 || private key || index
        data.push_back(0x00);
        data.insert(data.end(), key_.begin(), key_.end());
    } else {
        // Normal: public key || index
        PublicKey pubKey = GetPublicKey();
        data.insert(data.end(), pubKey.begin(), pubKey.end());
    }
    
    // Append index (big endian)
    data.push_back((index >> 24) & 0xFF);
    data.push_back((index >> 16) & 0xFF);
    data.push_back((index >> 8) & 0xFF);
    data.push_back(index & 0xFF);
    
    auto child = DeriveFromData(data, index);
    SecureClear(data.data(), data.size());
    return child;
}

std::optional<ExtendedKey> ExtendedKey::DerivePath(const DerivationPath& path) const {
    if (!IsValid()) {
        return std::nullopt;
    }
    
    ExtendedKey current = *this;
    
    for (const auto& comp : path.GetComponents()) {
        if (comp.index >= HARDENED_FLAG) {
            return std::nullopt;
        }
        auto child = current.DeriveChild(comp.GetFullIndex());
        if (!child) {
            return std::nullopt;
        }
        current = std::move(*child);
    }
    
    return current;
}

std::optional<ExtendedKey> ExtendedKey::DeriveTagged(const std::string& tag) const {
    if (!IsValid() || tag.empty()) {
        return std::nullopt;
    }
    
    // 0x00 || private key || "decmail.tag.v1" || SHA256(tag); never 37 bytes
    // long, so it cannot coincide with the input of any child index
    Hash256 tagHash = SHA256Hash(tag);
    Bytes data;
    data.reserve(1 + PrivateKey::SIZE + TAG_DOMAIN.size() + tagHash.size());
    data.push_back(0x00);
    data.insert(data.end(), key_.begin(), key_.end());
    data.insert(data.end(), TAG_DOMAIN.begin(), TAG_DOMAIN.end());
    data.insert(data.end(), tagHash.begin(), tagHash.end());
    
    auto child = DeriveFromData(data, 0);
    SecureClear(data.data(), data.size());
    return child;
}

std::optional<ExtendedKey> ExtendedKey::DeriveFromData(const Bytes& data,
                                                       uint32_t childIndex) const {
    Hash512 hash = ComputeHMAC_SHA512(chainCode_.data(), chainCode_.size(),
                                      data.data(), data.size());
    
    // Left 32 bytes = IL (tweak for private key)
    // Right 32 bytes = new chain code
    Hash256 tweak(hash.data(), 32);
    
    std::array<Byte, CHAIN_CODE_SIZE> newChainCode{};
    std::memcpy(newChainCode.data(), hash.data() + 32, 32);
    SecureClear(hash.data(), hash.size());
    
    // Child key = IL + parent key (mod n)
    auto childKey = key_.TweakAdd(tweak);
    SecureClear(tweak.data(), tweak.size());
    if (!childKey) {
        return std::nullopt;
    }
    
    return ExtendedKey(*childKey, newChainCode, static_cast<uint8_t>(depth_ + 1), childIndex);
}

PublicKey ExtendedKey::GetPublicKey() const {
    if (!IsValid()) {
        return PublicKey();
    }
    return key_.GetPublicKey();
}

} // namespace decmail
