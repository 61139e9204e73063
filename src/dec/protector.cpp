// DECMAIL - Message Protector Implementation
// Copyright (c) 2024 DECMAIL Developers
// MIT License

#include <decmail/dec/protector.h>
#include <decmail/core/errors.h>
#include <decmail/core/serialize.h>
#include <decmail/crypto/ecies.h>
#include <decmail/crypto/sha256.h>
#include <decmail/util/logging.h>

namespace decmail {
namespace dec {

MessageProtector::MessageProtector(std::shared_ptr<IDecStorage> storage,
                                   std::shared_ptr<const PublicKeyService> keys)
    : storage_(std::move(storage))
    , keys_(std::move(keys)) {
    if (!storage_) {
        throw ArgumentNullError("storage");
    }
    if (!keys_) {
        throw ArgumentNullError("keys");
    }
}

ExtendedKey MessageProtector::AccountKey(const Account& account,
                                         const util::CancellationToken& token) const {
    MasterKey master = storage_->GetMasterKey(token);
    return DeriveAccountKey(master, account);
}

// ============================================================================
// Raw Payloads
// ============================================================================

Bytes MessageProtector::Encrypt(const std::string& recipientKey, const Bytes& plaintext,
                                const util::CancellationToken& token) const {
    token.ThrowIfCancellationRequested();
    PublicKey key = keys_->Decode(recipientKey);
    return ecies::Encrypt(key, plaintext);
}

Bytes MessageProtector::Encrypt(const EmailAddress& recipient, const Bytes& plaintext,
                                const util::CancellationToken& token) const {
    PublicKey key = keys_->GetByEmail(recipient, token);
    token.ThrowIfCancellationRequested();
    return ecies::Encrypt(key, plaintext);
}

Bytes MessageProtector::Decrypt(const Account& account, const Bytes& ciphertext,
                                const util::CancellationToken& token) const {
    token.ThrowIfCancellationRequested();
    ExtendedKey key = AccountKey(account, token);
    
    auto plaintext = ecies::Decrypt(key.GetPrivateKey(), ciphertext);
    if (!plaintext) {
        throw FormatError("Data cannot be decrypted with the key of " + account.email.Address());
    }
    return std::move(*plaintext);
}

std::future<Bytes> MessageProtector::EncryptAsync(std::string recipientKey, Bytes plaintext,
                                                  util::CancellationToken token) const {
    return std::async(std::launch::async,
                      [this, recipientKey = std::move(recipientKey),
                       plaintext = std::move(plaintext), token]() {
                          return Encrypt(recipientKey, plaintext, token);
                      });
}

std::future<Bytes> MessageProtector::DecryptAsync(Account account, Bytes ciphertext,
                                                  util::CancellationToken token) const {
    return std::async(std::launch::async,
                      [this, account = std::move(account),
                       ciphertext = std::move(ciphertext), token]() {
                          return Decrypt(account, ciphertext, token);
                      });
}

// ============================================================================
// Structured Messages
// ============================================================================

Bytes MessageProtector::Sign(const Account& sender, const Message& message,
                             const util::CancellationToken& token) const {
    token.ThrowIfCancellationRequested();
    ExtendedKey key = AccountKey(sender, token);
    
    Bytes payload = EncodeMessage(message);
    Bytes signature = key.GetPrivateKey().Sign(SHA256Hash(payload));
    if (signature.empty()) {
        throw InvalidArgumentError("Signing key of " + sender.email.Address() + " is invalid");
    }
    
    DataStream ds;
    ds << SIGNED_CONTAINER_VERSION << payload << signature;
    return ds.Data();
}

Bytes MessageProtector::SignAndEncrypt(const Account& sender, const Message& message,
                                       const std::string& recipientKey,
                                       const util::CancellationToken& token) const {
    return Encrypt(recipientKey, Sign(sender, message, token), token);
}

SignatureStatus MessageProtector::VerifySender(const Message& message, const Bytes& payload,
                                               const Bytes& signature,
                                               const util::CancellationToken& token) const {
    if (signature.empty()) {
        return SignatureStatus::Absent;
    }
    if (message.from.empty()) {
        return SignatureStatus::Unverified;
    }
    
    const EmailAddress& sender = message.from.front();
    PublicKey senderKey;
    try {
        senderKey = keys_->GetByEmail(sender, token);
    } catch (const OperationCanceledError&) {
        throw;
    } catch (const NoPublicKeyError& e) {
        LOG_DEBUG(util::LogCategory::PROTECT) << "Signature not checked: " << e.what();
        return SignatureStatus::Unverified;
    } catch (const std::exception& e) {
        // A lookup failure downgrades the signature, never the message
        LOG_WARN(util::LogCategory::PROTECT) << "Signature of " << sender.Address()
                                             << " not checked: " << e.what();
        return SignatureStatus::Unverified;
    }
    
    if (!senderKey.Verify(SHA256Hash(payload), signature)) {
        LOG_WARN(util::LogCategory::PROTECT) << "Signature of " << sender.Address()
                                             << " does not match the sender key";
        return SignatureStatus::Unverified;
    }
    return SignatureStatus::Verified;
}

Message MessageProtector::TryVerifyAndDecrypt(const Account& account, const Bytes& ciphertext,
                                              const util::CancellationToken& token) const {
    Bytes container = Decrypt(account, ciphertext, token);
    
    DataStream ds(std::move(container));
    uint8_t version = 0;
    Bytes payload;
    Bytes signature;
    ds >> version;
    if (version != SIGNED_CONTAINER_VERSION) {
        throw FormatError("Unknown signed container version " + std::to_string(version));
    }
    ds >> payload >> signature;
    if (!ds.empty()) {
        throw FormatError("Trailing data after signed container");
    }
    
    Message message = DecodeMessage(payload);
    message.signature = VerifySender(message, payload, signature, token);
    return message;
}

std::future<Message> MessageProtector::TryVerifyAndDecryptAsync(
    Account account, Bytes ciphertext, util::CancellationToken token) const {
    return std::async(std::launch::async,
                      [this, account = std::move(account),
                       ciphertext = std::move(ciphertext), token]() {
                          return TryVerifyAndDecrypt(account, ciphertext, token);
                      });
}

} // namespace dec
} // namespace decmail
