// DECMAIL - Hex Encoding Implementation
// Copyright (c) 2024 DECMAIL Developers
// MIT License

#include <decmail/core/hex.h>
#include <decmail/core/errors.h>

namespace decmail {

namespace {

constexpr char LOWER_DIGITS[] = "0123456789abcdef";
constexpr char UPPER_DIGITS[] = "0123456789ABCDEF";

int NibbleOf(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string Encode(const Byte* data, size_t len, const char* digits) {
    std::string out(len * 2, '0');
    for (size_t i = 0; i < len; ++i) {
        out[2 * i] = digits[data[i] >> 4];
        out[2 * i + 1] = digits[data[i] & 0x0f];
    }
    return out;
}

} // namespace

std::string BytesToHex(const Byte* data, size_t len) {
    return Encode(data, len, LOWER_DIGITS);
}

std::string BytesToHexUpper(const Byte* data, size_t len) {
    return Encode(data, len, UPPER_DIGITS);
}

Bytes HexToBytes(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw FormatError("Hex string has odd length " + std::to_string(hex.size()));
    }
    
    Bytes out(hex.size() / 2);
    for (size_t i = 0; i < out.size(); ++i) {
        int high = NibbleOf(hex[2 * i]);
        int low = NibbleOf(hex[2 * i + 1]);
        if (high < 0 || low < 0) {
            throw FormatError("Invalid hex character at offset " +
                              std::to_string(high < 0 ? 2 * i : 2 * i + 1));
        }
        out[i] = static_cast<Byte>((high << 4) | low);
    }
    return out;
}

bool IsValidHex(const std::string& str) {
    if (str.empty() || str.size() % 2 != 0) {
        return false;
    }
    for (char c : str) {
        if (NibbleOf(c) < 0) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// Digest
// ============================================================================

template<size_t N>
std::string Digest<N>::ToHex() const {
    return BytesToHex(data(), SIZE);
}

template<size_t N>
std::string Digest<N>::ToHexUpper() const {
    return BytesToHexUpper(data(), SIZE);
}

template class Digest<32>;
template class Digest<64>;

Hash256 Hash256::FromHex(const std::string& hex) {
    if (hex.size() != SIZE * 2) {
        throw FormatError("Hash256 hex must be 64 characters, got " +
                          std::to_string(hex.size()));
    }
    Bytes bytes = HexToBytes(hex);
    return Hash256(bytes.data(), bytes.size());
}

} // namespace decmail
