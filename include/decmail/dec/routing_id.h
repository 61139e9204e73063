// DECMAIL - Routing Identifiers
// Copyright (c) 2024 DECMAIL Developers
// MIT License
//
// Backends see a one-way hash of the recipient key instead of the key:
//
//   RoutingId = HEX(SHA256("tuvi.dec.route.v1|" + UPPER(publicKeyAddress)))
//
// The key address is upper-cased first, so the id does not depend on the
// case the address was written in.

#ifndef DECMAIL_DEC_ROUTING_ID_H
#define DECMAIL_DEC_ROUTING_ID_H

#include <ostream>
#include <string>

namespace decmail {
namespace dec {

/// Version prefix of the routing hash input
constexpr const char* ROUTE_PREFIX = "tuvi.dec.route.v1|";

/// Length of a routing id in hex characters
constexpr size_t ROUTING_ID_LENGTH = 64;

class RoutingId {
public:
    /// Throws InvalidArgumentError for a blank address or one without public
    /// key address syntax
    explicit RoutingId(const std::string& publicKeyAddress);
    
    /// 64 uppercase hex characters
    const std::string& ToString() const { return value_; }
    
    bool operator==(const RoutingId& other) const { return value_ == other.value_; }
    bool operator!=(const RoutingId& other) const { return value_ != other.value_; }
    bool operator<(const RoutingId& other) const { return value_ < other.value_; }

private:
    std::string value_;
};

inline std::ostream& operator<<(std::ostream& os, const RoutingId& id) {
    return os << id.ToString();
}

} // namespace dec
} // namespace decmail

#endif // DECMAIL_DEC_ROUTING_ID_H
