// DECMAIL - Email Addresses Implementation
// Copyright (c) 2024 DECMAIL Developers
// MIT License

#include <decmail/mail/email_address.h>
#include <decmail/keys/base32e.h>
#include <decmail/core/errors.h>

#include <algorithm>
#include <cctype>

namespace decmail {

namespace {

const std::string EPPIE_POSTFIX = "@eppie";
const std::string BITCOIN_POSTFIX = "@bitcoin";
const std::string ETHEREUM_POSTFIX = "@ethereum";

std::string ToLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

bool EndsWithNoCase(const std::string& str, const std::string& suffix) {
    if (str.size() < suffix.size()) {
        return false;
    }
    return ToLower(str.substr(str.size() - suffix.size())) == suffix;
}

bool IsBlank(const std::string& str) {
    return std::all_of(str.begin(), str.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

/// name[+key]@domain split; key is only set when it has valid syntax
struct AddressParts {
    std::string name;
    std::string key;
    std::string domain;
    bool valid{false};
    
    explicit AddressParts(const std::string& address) {
        auto at = address.find('@');
        if (at == std::string::npos || address.find('@', at + 1) != std::string::npos) {
            return;
        }
        valid = true;
        domain = address.substr(at + 1);
        
        std::string local = address.substr(0, at);
        auto plus = local.find('+');
        name = local.substr(0, plus);
        if (plus != std::string::npos && local.find('+', plus + 1) == std::string::npos) {
            std::string candidate = local.substr(plus + 1);
            if (IsPublicKeyAddressSyntax(candidate)) {
                key = candidate;
            }
        }
    }
};

} // anonymous namespace

const char* NetworkTypeToString(NetworkType network) {
    switch (network) {
        case NetworkType::Eppie: return "eppie";
        case NetworkType::Bitcoin: return "bitcoin";
        case NetworkType::Ethereum: return "ethereum";
        default: return "unsupported";
    }
}

// ============================================================================
// EmailAddress Implementation
// ============================================================================

EmailAddress EmailAddress::CreateDecentralizedAddress(NetworkType network,
                                                      const std::string& segment) {
    if (IsBlank(segment)) {
        throw InvalidArgumentError("Address is required");
    }
    
    std::string address;
    switch (network) {
        case NetworkType::Eppie:
            address = segment + EPPIE_POSTFIX;
            break;
        case NetworkType::Bitcoin:
            address = segment + BITCOIN_POSTFIX;
            break;
        case NetworkType::Ethereum:
            address = segment + ETHEREUM_POSTFIX;
            break;
        default:
            throw InvalidArgumentError("Unsupported network type");
    }
    
    if (!AddressParts(address).key.empty()) {
        throw NotSupportedError("Hybrid local-part is not allowed for decentralized network addresses");
    }
    return EmailAddress(address);
}

std::string EmailAddress::DisplayName() const {
    if (IsBlank(name_)) {
        return address_;
    }
    return name_ + "<" + address_ + ">";
}

bool EmailAddress::IsHybrid() const {
    return !AddressParts(address_).key.empty();
}

bool EmailAddress::IsDecentralized() const {
    return Network() != NetworkType::Unsupported;
}

NetworkType EmailAddress::Network() const {
    if (EndsWithNoCase(address_, EPPIE_POSTFIX)) {
        return NetworkType::Eppie;
    }
    if (EndsWithNoCase(address_, BITCOIN_POSTFIX)) {
        return NetworkType::Bitcoin;
    }
    if (EndsWithNoCase(address_, ETHEREUM_POSTFIX)) {
        return NetworkType::Ethereum;
    }
    if (IsHybrid()) {
        return NetworkType::Eppie;
    }
    return NetworkType::Unsupported;
}

std::string EmailAddress::StandardAddress() const {
    AddressParts parts(address_);
    if (!parts.key.empty()) {
        return parts.name + "@" + parts.domain;
    }
    return address_;
}

std::string EmailAddress::DecentralizedAddress() const {
    AddressParts parts(address_);
    if (!parts.key.empty()) {
        return parts.key;
    }
    for (const auto* postfix : {&EPPIE_POSTFIX, &BITCOIN_POSTFIX, &ETHEREUM_POSTFIX}) {
        if (EndsWithNoCase(address_, *postfix)) {
            return address_.substr(0, address_.size() - postfix->size());
        }
    }
    return std::string();
}

std::string EmailAddress::KeyTag() const {
    if (IsNull()) {
        throw ArgumentNullError("email");
    }
    return IsHybrid() ? StandardAddress() : address_;
}

EmailAddress EmailAddress::MakeHybrid(const std::string& publicKey) const {
    if (IsBlank(publicKey)) {
        throw InvalidArgumentError("Public key is required");
    }
    if (!IsPublicKeyAddressSyntax(publicKey)) {
        throw InvalidArgumentError("Invalid public key format");
    }
    if (IsHybrid()) {
        throw NotSupportedError("Cannot create hybrid from an existing hybrid address");
    }
    if (IsDecentralized()) {
        throw NotSupportedError("Cannot create hybrid address for a decentralized network address");
    }
    
    AddressParts parts(address_);
    if (!parts.valid) {
        throw InvalidArgumentError("Malformed email address: " + address_);
    }
    
    std::string hybridName = name_.empty() ? std::string() : name_ + " (Hybrid)";
    return EmailAddress(parts.name + "+" + publicKey + "@" + parts.domain, hybridName);
}

bool EmailAddress::HasSameAddress(const EmailAddress& other) const {
    return ToLower(address_) == ToLower(other.address_);
}

bool EmailAddress::operator<(const EmailAddress& other) const {
    return ToLower(address_) < ToLower(other.address_);
}

} // namespace decmail
