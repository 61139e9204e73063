// DECMAIL - Base32E Public Key Addresses Implementation
// Copyright (c) 2024 DECMAIL Developers
// MIT License

#include <decmail/keys/base32e.h>
#include <decmail/core/errors.h>

#include <cctype>

namespace decmail {

namespace base32e {

namespace {

int LetterValue(char c) {
    char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    for (int i = 0; i < 32; ++i) {
        if (ALPHABET[i] == lower) {
            return i;
        }
    }
    return -1;
}

} // anonymous namespace

bool IsAlphabetChar(char c) {
    return LetterValue(c) >= 0;
}

std::string Encode(const Byte* data, size_t len) {
    const size_t letters = EncodedLength(len);
    std::string result;
    result.reserve(letters);
    
    // Start with the zero pad bits already in the accumulator
    uint32_t acc = 0;
    size_t bits = letters * 5 - len * 8;
    
    for (size_t i = 0; i < len; ++i) {
        acc = (acc << 8) | data[i];
        bits += 8;
        while (bits >= 5) {
            result.push_back(ALPHABET[(acc >> (bits - 5)) & 0x1F]);
            bits -= 5;
        }
        acc &= (1u << bits) - 1;
    }
    
    return result;
}

std::optional<Bytes> Decode(const std::string& text, size_t byteCount) {
    if (text.size() != EncodedLength(byteCount)) {
        return std::nullopt;
    }
    
    Bytes result;
    result.reserve(byteCount);
    
    uint32_t acc = 0;
    size_t bits = 0;
    size_t pad = text.size() * 5 - byteCount * 8;
    
    for (char c : text) {
        int value = LetterValue(c);
        if (value < 0) {
            return std::nullopt;
        }
        acc = (acc << 5) | static_cast<uint32_t>(value);
        bits += 5;
        
        if (pad > 0) {
            // Pad bits must be zero for the encoding to be canonical
            if ((acc >> (bits - pad)) != 0) {
                return std::nullopt;
            }
            bits -= pad;
            pad = 0;
        }
        
        while (bits >= 8) {
            result.push_back(static_cast<Byte>((acc >> (bits - 8)) & 0xFF));
            bits -= 8;
        }
        acc &= (1u << bits) - 1;
    }
    
    return result;
}

} // namespace base32e

bool IsPublicKeyAddressSyntax(const std::string& value) {
    if (value.size() != PUBLIC_KEY_ADDRESS_LENGTH) {
        return false;
    }
    for (char c : value) {
        if (!base32e::IsAlphabetChar(c)) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// Secp256k1Base32ECodec
// ============================================================================

std::string Secp256k1Base32ECodec::Encode(const PublicKey& key) const {
    if (!key.IsValid()) {
        throw InvalidArgumentError("Public key is absent or malformed");
    }
    if (!key.IsCompressed()) {
        throw InvalidArgumentError("Public key must be a 33-byte compressed point");
    }
    return base32e::Encode(key.data(), key.size());
}

PublicKey Secp256k1Base32ECodec::Decode(const std::string& address) const {
    if (address.size() != PUBLIC_KEY_ADDRESS_LENGTH) {
        throw InvalidArgumentError("Incorrect length of public key address");
    }
    
    auto bytes = base32e::Decode(address, secp256k1::COMPRESSED_PUBKEY_SIZE);
    if (!bytes) {
        throw FormatError("Public key address is not valid Base32E");
    }
    
    if ((*bytes)[0] != 0x02 && (*bytes)[0] != 0x03) {
        throw FormatError("Invalid point format. Encoded public key should start with 0x02 or 0x03.");
    }
    
    PublicKey key(*bytes);
    if (!key.IsFullyValid()) {
        throw FormatError("Encoded public key is not a point on secp256k1");
    }
    return key;
}

} // namespace decmail
