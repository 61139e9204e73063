// DECMAIL - Email Addresses
// Copyright (c) 2024 DECMAIL Developers
// MIT License
//
// An email address in one of three shapes:
//
//   <key>@eppie, <name>@eppie        decentralized (direct key or alias)
//   <address>@bitcoin, @ethereum     foreign network account
//   <name>+<key>@<domain>            hybrid: conventional address carrying a key
//
// The network of an address is derived from its postfix; a hybrid address
// belongs to the Eppie network.

#ifndef DECMAIL_MAIL_EMAIL_ADDRESS_H
#define DECMAIL_MAIL_EMAIL_ADDRESS_H

#include <cstdint>
#include <string>

namespace decmail {

// ============================================================================
// Network Type
// ============================================================================

enum class NetworkType : uint8_t {
    Eppie,
    Bitcoin,
    Ethereum,
    Unsupported
};

/// Get string name for network
const char* NetworkTypeToString(NetworkType network);

// ============================================================================
// EmailAddress
// ============================================================================

class EmailAddress {
public:
    /// Null address
    EmailAddress() = default;
    
    explicit EmailAddress(std::string address, std::string name = "")
        : address_(std::move(address)), name_(std::move(name)) {}
    
    /// Build "<segment>@eppie", "@bitcoin" or "@ethereum".
    /// Throws InvalidArgumentError on a blank segment or unknown network,
    /// NotSupportedError when the segment has a hybrid local part.
    static EmailAddress CreateDecentralizedAddress(NetworkType network, const std::string& segment);
    
    /// True for a default-constructed address
    bool IsNull() const { return address_.empty(); }
    
    const std::string& Address() const { return address_; }
    const std::string& Name() const { return name_; }
    
    /// "Name<address>" or the bare address when there is no name
    std::string DisplayName() const;
    
    /// Local part carries a "+<key>" segment with valid key syntax
    bool IsHybrid() const;
    
    bool IsDecentralized() const;
    
    NetworkType Network() const;
    
    /// Address with any "+<key>" segment removed
    std::string StandardAddress() const;
    
    /// Key segment of a hybrid address, otherwise the address without its
    /// network postfix (empty for conventional addresses)
    std::string DecentralizedAddress() const;
    
    /// Tag used to derive the key of this address
    std::string KeyTag() const;
    
    /// Embed a public key address: "name+<key>@domain".
    /// Throws InvalidArgumentError for a malformed key and NotSupportedError
    /// for decentralized or already hybrid addresses.
    EmailAddress MakeHybrid(const std::string& publicKey) const;
    
    /// Case-insensitive address comparison
    bool HasSameAddress(const EmailAddress& other) const;
    
    bool operator==(const EmailAddress& other) const { return HasSameAddress(other); }
    bool operator!=(const EmailAddress& other) const { return !HasSameAddress(other); }
    
    /// Ordinal order of the lowercased address text, consistent with ==
    bool operator<(const EmailAddress& other) const;

private:
    std::string address_;
    std::string name_;
};

} // namespace decmail

#endif // DECMAIL_MAIL_EMAIL_ADDRESS_H
