// DECMAIL - Mail Messages
// Copyright (c) 2024 DECMAIL Developers
// MIT License
//
// Message entities of the decentralized mailbox and their binary codec.
// Only the transmitted part of a message (addresses, date, subject and
// bodies) is encoded; folder and read/flag state stay local.

#ifndef DECMAIL_MAIL_MESSAGE_H
#define DECMAIL_MAIL_MESSAGE_H

#include <decmail/core/serialize.h>
#include <decmail/core/types.h>
#include <decmail/mail/email_address.h>

#include <cstdint>
#include <string>
#include <vector>

namespace decmail {

// ============================================================================
// Folders
// ============================================================================

enum class FolderAttributes : uint32_t {
    None  = 0,
    Inbox = (1 << 0),
    Draft = (1 << 1),
    Junk  = (1 << 2),
    Trash = (1 << 3),
    Sent  = (1 << 4),
};

/**
 * A mailbox folder. The decentralized mailbox only knows the synthetic
 * Inbox and Sent folders.
 */
struct Folder {
    std::string fullName;
    FolderAttributes attributes{FolderAttributes::None};
    
    Folder() = default;
    Folder(std::string name, FolderAttributes attrs)
        : fullName(std::move(name)), attributes(attrs) {}
    
    static Folder Inbox() { return Folder("Inbox", FolderAttributes::Inbox); }
    static Folder Sent() { return Folder("Sent", FolderAttributes::Sent); }
    
    bool IsInbox() const { return attributes == FolderAttributes::Inbox; }
    bool IsSent() const { return attributes == FolderAttributes::Sent; }
    
    bool operator==(const Folder& other) const {
        return fullName == other.fullName && attributes == other.attributes;
    }
    bool operator!=(const Folder& other) const { return !(*this == other); }
};

// ============================================================================
// Message
// ============================================================================

/// Result of checking the signature of a received message
enum class SignatureStatus : uint8_t {
    /// Message carried no signature
    Absent,
    /// Signature matches the sender's resolved key
    Verified,
    /// Signature present but could not be checked or did not match
    Unverified
};

const char* SignatureStatusToString(SignatureStatus status);

struct Message {
    std::vector<EmailAddress> from;
    std::vector<EmailAddress> replyTo;
    std::vector<EmailAddress> to;
    std::vector<EmailAddress> cc;
    std::vector<EmailAddress> bcc;
    
    Timestamp date{0};
    std::string subject;
    std::string textBody;
    std::string htmlBody;
    
    // Local state, not transmitted
    Folder folder;
    uint32_t id{0};
    bool isMarkedAsRead{false};
    bool isFlagged{false};
    bool isDecentralized{false};
    SignatureStatus signature{SignatureStatus::Absent};
    
    /// To, Cc and Bcc without duplicates, in that order
    std::vector<EmailAddress> AllRecipients() const;
};

template<typename Stream>
void Serialize(Stream& s, const EmailAddress& email) {
    Serialize(s, email.Address());
    Serialize(s, email.Name());
}

template<typename Stream>
void Unserialize(Stream& s, EmailAddress& email) {
    std::string address;
    std::string name;
    Unserialize(s, address);
    Unserialize(s, name);
    email = EmailAddress(std::move(address), std::move(name));
}

/// Current version of the message encoding
constexpr uint8_t MESSAGE_ENCODING_VERSION = 1;

/// Encode the transmitted part of a message
Bytes EncodeMessage(const Message& message);

/// Decode a message; throws FormatError on truncated or trailing data
Message DecodeMessage(const Bytes& data);

// ============================================================================
// DecMessage
// ============================================================================

/**
 * A message stored by the decentralized mailbox, keyed by the content hash
 * it was published or received under.
 */
struct DecMessage {
    std::string hash;
    Message message;
    
    DecMessage() = default;
    DecMessage(std::string h, Message msg)
        : hash(std::move(h)), message(std::move(msg)) {}
};

} // namespace decmail

#endif // DECMAIL_MAIL_MESSAGE_H
