// DECMAIL - Routing Identifiers Implementation
// Copyright (c) 2024 DECMAIL Developers
// MIT License

#include <decmail/dec/routing_id.h>
#include <decmail/core/errors.h>
#include <decmail/crypto/sha256.h>
#include <decmail/keys/base32e.h>

#include <algorithm>
#include <cctype>

namespace decmail {
namespace dec {

RoutingId::RoutingId(const std::string& publicKeyAddress) {
    bool blank = std::all_of(publicKeyAddress.begin(), publicKeyAddress.end(),
                             [](unsigned char c) { return std::isspace(c) != 0; });
    if (blank) {
        throw InvalidArgumentError("Public key cannot be empty");
    }
    if (!IsPublicKeyAddressSyntax(publicKeyAddress)) {
        throw InvalidArgumentError("Public key must be a valid Base32E string");
    }
    
    std::string input = ROUTE_PREFIX;
    input.reserve(input.size() + publicKeyAddress.size());
    for (char c : publicKeyAddress) {
        input += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    
    value_ = SHA256Hash(input).ToHexUpper();
}

} // namespace dec
} // namespace decmail
