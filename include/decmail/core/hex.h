// DECMAIL - Hex Encoding
// Copyright (c) 2024 DECMAIL Developers
// MIT License

#ifndef DECMAIL_CORE_HEX_H
#define DECMAIL_CORE_HEX_H

#include <decmail/core/types.h>

#include <string>

namespace decmail {

std::string BytesToHex(const Byte* data, size_t len);

inline std::string BytesToHex(const Bytes& data) {
    return BytesToHex(data.data(), data.size());
}

std::string BytesToHexUpper(const Byte* data, size_t len);

/// Either case; "" decodes to no bytes. Throws FormatError on odd length or a non-hex character.
Bytes HexToBytes(const std::string& hex);

/// Non-empty, even length, hex characters only
bool IsValidHex(const std::string& str);

} // namespace decmail

#endif // DECMAIL_CORE_HEX_H
