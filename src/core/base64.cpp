// DECMAIL - Base64 Encoding Implementation
// Copyright (c) 2024 DECMAIL Developers
// MIT License

#include <decmail/core/base64.h>

#include <openssl/evp.h>

namespace decmail {

std::string EncodeBase64(const Byte* data, size_t len) {
    if (len == 0) {
        return "";
    }
    
    std::string out(4 * ((len + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  data, static_cast<int>(len));
    out.resize(static_cast<size_t>(written));
    return out;
}

std::optional<Bytes> DecodeBase64(const std::string& str) {
    if (str.empty() || str.size() % 4 != 0) {
        return std::nullopt;
    }
    
    size_t padding = 0;
    for (size_t i = 0; i < str.size(); ++i) {
        char c = str[i];
        bool isAlpha = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                       (c >= '0' && c <= '9') || c == '+' || c == '/';
        if (c == '=') {
            // Padding may only appear in the last two positions
            if (i + 2 < str.size()) {
                return std::nullopt;
            }
            ++padding;
        } else if (!isAlpha || padding > 0) {
            return std::nullopt;
        }
    }
    
    Bytes out(3 * (str.size() / 4));
    int written = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(str.data()),
                                  static_cast<int>(str.size()));
    if (written < 0 || static_cast<size_t>(written) < padding) {
        return std::nullopt;
    }
    
    // EVP_DecodeBlock keeps the zero bytes produced by '=' padding
    out.resize(static_cast<size_t>(written) - padding);
    return out;
}

} // namespace decmail
