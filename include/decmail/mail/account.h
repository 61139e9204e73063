// DECMAIL - Mail Account
// Copyright (c) 2024 DECMAIL Developers
// MIT License

#ifndef DECMAIL_MAIL_ACCOUNT_H
#define DECMAIL_MAIL_ACCOUNT_H

#include <decmail/mail/email_address.h>

#include <cstdint>

namespace decmail {

/// Index value of an account that has no decentralized key yet
constexpr int32_t UNINITIALIZED_ACCOUNT_INDEX = -1;

/**
 * A local mail account.
 * 
 * Decentralized accounts derive their key either from the BIP44 account
 * index (pure decentralized addresses) or from the key tag of the email
 * (hybrid addresses).
 */
struct Account {
    EmailAddress email;
    int32_t decentralizedAccountIndex{UNINITIALIZED_ACCOUNT_INDEX};
    
    Account() = default;
    
    explicit Account(EmailAddress addr, int32_t index = UNINITIALIZED_ACCOUNT_INDEX)
        : email(std::move(addr)), decentralizedAccountIndex(index) {}
    
    bool HasDecentralizedIndex() const { return decentralizedAccountIndex >= 0; }
    
    /// Throws ArgumentNullError when the account has no email
    std::string KeyTag() const { return email.KeyTag(); }
};

} // namespace decmail

#endif // DECMAIL_MAIL_ACCOUNT_H
