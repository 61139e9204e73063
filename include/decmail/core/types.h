// DECMAIL - Core Types
// Copyright (c) 2024 DECMAIL Developers
// MIT License
//
// Byte buffers, timestamps and fixed-size digests shared by every module.

#ifndef DECMAIL_CORE_TYPES_H
#define DECMAIL_CORE_TYPES_H

#include <algorithm>
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace decmail {

using Byte = uint8_t;
using Bytes = std::vector<Byte>;

/// Unix epoch seconds
using Timestamp = int64_t;

inline Timestamp GetTime() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// ============================================================================
// Digests
// ============================================================================

/**
 * Fixed-size digest (SHA-256, HMAC-SHA512 output). Zero-initialized; bytes
 * are stored and printed in the order the hash function produced them.
 */
template<size_t N>
class Digest {
public:
    static constexpr size_t SIZE = N;
    
    Digest() { bytes_.fill(0); }
    
    /// Copies min(len, SIZE) bytes; the rest stays zero
    Digest(const Byte* data, size_t len) {
        bytes_.fill(0);
        if (data != nullptr) {
            std::copy_n(data, std::min(len, SIZE), bytes_.begin());
        }
    }
    
    bool IsNull() const {
        return std::all_of(bytes_.begin(), bytes_.end(), [](Byte b) { return b == 0; });
    }
    
    constexpr size_t size() const { return SIZE; }
    Byte& operator[](size_t i) { return bytes_[i]; }
    Byte operator[](size_t i) const { return bytes_[i]; }
    Byte* data() { return bytes_.data(); }
    const Byte* data() const { return bytes_.data(); }
    const Byte* begin() const { return bytes_.data(); }
    const Byte* end() const { return bytes_.data() + SIZE; }
    
    Bytes ToBytes() const { return Bytes(begin(), end()); }
    
    bool operator==(const Digest& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const Digest& other) const { return bytes_ != other.bytes_; }
    bool operator<(const Digest& other) const { return bytes_ < other.bytes_; }
    
    std::string ToHex() const;
    std::string ToHexUpper() const;

private:
    std::array<Byte, SIZE> bytes_;
};

/// SHA-256 output; blob content hashes and routing ids are built from it
class Hash256 : public Digest<32> {
public:
    using Digest<32>::Digest;
    
    /// Exactly 64 hex characters of either case; throws FormatError otherwise
    static Hash256 FromHex(const std::string& hex);
};

/// HMAC-SHA512 output (BIP32 key material)
using Hash512 = Digest<64>;

} // namespace decmail

#endif // DECMAIL_CORE_TYPES_H
