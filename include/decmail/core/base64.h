// DECMAIL - Base64 Encoding
// Copyright (c) 2024 DECMAIL Developers
// MIT License

#ifndef DECMAIL_CORE_BASE64_H
#define DECMAIL_CORE_BASE64_H

#include <decmail/core/types.h>

#include <optional>
#include <string>

namespace decmail {

/// Standard padded Base64 (RFC 4648)
std::string EncodeBase64(const Byte* data, size_t len);

inline std::string EncodeBase64(const Bytes& data) {
    return EncodeBase64(data.data(), data.size());
}

/// Decode padded Base64; nullopt on any malformed input
std::optional<Bytes> DecodeBase64(const std::string& str);

} // namespace decmail

#endif // DECMAIL_CORE_BASE64_H
