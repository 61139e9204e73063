// DECMAIL - Message Protector
// Copyright (c) 2024 DECMAIL Developers
// MIT License
//
// Encryption of payloads and messages to decentralized recipients.
//
// Raw payloads are ECIES envelopes addressed to the recipient key.
// Structured messages are first wrapped in a signed container:
//
//   uint8 version (1) | bytes encodedMessage | bytes derSignature
//
// The signature is made with the sender account key over
// SHA256(encodedMessage); an empty signature means the message is unsigned.

#ifndef DECMAIL_DEC_PROTECTOR_H
#define DECMAIL_DEC_PROTECTOR_H

#include <decmail/core/types.h>
#include <decmail/dec/dec_storage.h>
#include <decmail/keys/public_key_service.h>
#include <decmail/mail/account.h>
#include <decmail/mail/email_address.h>
#include <decmail/mail/message.h>
#include <decmail/util/cancellation.h>

#include <future>
#include <memory>
#include <string>

namespace decmail {
namespace dec {

/// Current version of the signed message container
constexpr uint8_t SIGNED_CONTAINER_VERSION = 1;

class MessageProtector {
public:
    /// Throws ArgumentNullError for a null storage or key service
    MessageProtector(std::shared_ptr<IDecStorage> storage,
                     std::shared_ptr<const PublicKeyService> keys);
    
    // ========================================================================
    // Raw Payloads
    // ========================================================================
    
    /// Encrypt to an encoded public key
    Bytes Encrypt(const std::string& recipientKey, const Bytes& plaintext,
                  const util::CancellationToken& token) const;
    
    /// Encrypt to the resolved key of an email address
    Bytes Encrypt(const EmailAddress& recipient, const Bytes& plaintext,
                  const util::CancellationToken& token) const;
    
    /// Decrypt with the account key.
    /// Throws FormatError when the data was not encrypted to that key.
    Bytes Decrypt(const Account& account, const Bytes& ciphertext,
                  const util::CancellationToken& token) const;
    
    std::future<Bytes> EncryptAsync(std::string recipientKey, Bytes plaintext,
                                    util::CancellationToken token) const;
    
    std::future<Bytes> DecryptAsync(Account account, Bytes ciphertext,
                                    util::CancellationToken token) const;
    
    // ========================================================================
    // Structured Messages
    // ========================================================================
    
    /// Signed container of a message, signed with the sender account key
    Bytes Sign(const Account& sender, const Message& message,
               const util::CancellationToken& token) const;
    
    Bytes SignAndEncrypt(const Account& sender, const Message& message,
                         const std::string& recipientKey,
                         const util::CancellationToken& token) const;
    
    /**
     * Decrypt and decode a message. The signature is checked against the key
     * resolved for the first From address; the outcome is stored in
     * Message::signature and never raised.
     * Throws FormatError when the data cannot be decrypted or decoded.
     */
    Message TryVerifyAndDecrypt(const Account& account, const Bytes& ciphertext,
                                const util::CancellationToken& token) const;
    
    std::future<Message> TryVerifyAndDecryptAsync(Account account, Bytes ciphertext,
                                                  util::CancellationToken token) const;

private:
    std::shared_ptr<IDecStorage> storage_;
    std::shared_ptr<const PublicKeyService> keys_;
    
    ExtendedKey AccountKey(const Account& account, const util::CancellationToken& token) const;
    
    SignatureStatus VerifySender(const Message& message, const Bytes& payload,
                                 const Bytes& signature,
                                 const util::CancellationToken& token) const;
};

} // namespace dec
} // namespace decmail

#endif // DECMAIL_DEC_PROTECTOR_H
