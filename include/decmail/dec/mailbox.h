// DECMAIL - Decentralized Mailbox
// Copyright (c) 2024 DECMAIL Developers
// MIT License
//
// Mailbox of one account over one or more independent storage backends.
//
// Send: every recipient gets its own encrypted blob. The blob is stored on
// every backend and its hash published under the recipient routing id on
// every backend. A step succeeds when at least one backend accepted it.
//
// Receive: hashes listed under the account routing id are collected from
// every backend and deduplicated. Hashes not yet stored locally are fetched
// from the backends in order until one serves them.
//
// Folders are synthetic: Inbox holds received messages, Sent the local copy
// of every sent message.

#ifndef DECMAIL_DEC_MAILBOX_H
#define DECMAIL_DEC_MAILBOX_H

#include <decmail/core/types.h>
#include <decmail/dec/dec_storage.h>
#include <decmail/dec/protector.h>
#include <decmail/dec/routing_id.h>
#include <decmail/dec/storage_client.h>
#include <decmail/keys/public_key_service.h>
#include <decmail/mail/account.h>
#include <decmail/mail/message.h>
#include <decmail/util/cancellation.h>
#include <decmail/util/config.h>
#include <decmail/util/threadpool.h>

#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace decmail {
namespace dec {

// ============================================================================
// Options
// ============================================================================

struct MailboxOptions {
    /// Fan-out workers; 0 picks min(hardware concurrency, backend count)
    size_t fanoutThreads{0};
    
    /// Default number of messages returned by GetMessages; 0 = unlimited
    size_t receiveLimit{0};
    
    /// Put a CachingNameResolver in front of the name resolver
    bool resolverCache{false};
    
    /// Read the [mailbox] section
    static MailboxOptions FromConfig(const util::ConfigManager& config);
    
    /// The resolver to hand to PublicKeyService::CreateDefault
    std::shared_ptr<INameResolver> WrapNameResolver(std::shared_ptr<INameResolver> resolver) const;
};

// ============================================================================
// DecMailBox
// ============================================================================

class DecMailBox {
public:
    using ClientList = std::vector<std::shared_ptr<IDecStorageClient>>;
    
    /**
     * Throws ArgumentNullError for a null account email, storage, protector,
     * key service or client, and InvalidArgumentError for an empty client list.
     */
    DecMailBox(Account account,
               std::shared_ptr<IDecStorage> storage,
               ClientList clients,
               std::shared_ptr<MessageProtector> protector,
               std::shared_ptr<const PublicKeyService> keys,
               MailboxOptions options = MailboxOptions());
    
    ~DecMailBox();
    
    DecMailBox(const DecMailBox&) = delete;
    DecMailBox& operator=(const DecMailBox&) = delete;
    
    const Account& GetAccount() const { return account_; }
    
    size_t BackendCount() const { return clients_.size(); }
    
    /// Inbox and Sent
    std::vector<Folder> GetFoldersStructure() const;
    
    Folder GetDefaultInboxFolder() const { return Folder::Inbox(); }
    
    /**
     * Send a message to all of its decentralized recipients and store the
     * unread local copy in Sent.
     *
     * Throws InvalidArgumentError when a recipient is not decentralized or
     * there is none, NoPublicKeyError / NotSupportedError from resolution,
     * TransportError when every backend failed a step for a recipient and
     * OperationCanceledError on cancellation.
     */
    DecMessage SendMessage(Message message,
                           const util::CancellationToken& token = util::CancellationToken::None());
    
    /**
     * Messages of a folder, newest first. For Inbox, new messages are
     * received from the backends first.
     * count 0 uses MailboxOptions::receiveLimit.
     * Throws TransportError when every backend failed to list.
     */
    std::vector<Message> GetMessages(const Folder& folder, size_t count = 0,
                                     const util::CancellationToken& token = util::CancellationToken::None());
    
    std::future<DecMessage> SendMessageAsync(Message message,
                                             util::CancellationToken token = util::CancellationToken::None());
    
    std::future<std::vector<Message>> GetMessagesAsync(Folder folder, size_t count = 0,
                                                       util::CancellationToken token = util::CancellationToken::None());

private:
    Account account_;
    std::shared_ptr<IDecStorage> storage_;
    ClientList clients_;
    std::shared_ptr<MessageProtector> protector_;
    std::shared_ptr<const PublicKeyService> keys_;
    MailboxOptions options_;
    std::unique_ptr<util::ThreadPool> pool_;
    
    /// Store a blob and publish its hash on every backend; returns the hash
    std::string Publish(const RoutingId& route, const Bytes& ciphertext,
                        const util::CancellationToken& token);
    
    /// Union of the hashes listed by every backend, first occurrence order
    std::vector<std::string> ListAll(const RoutingId& route, const util::CancellationToken& token);
    
    /// First backend that serves the blob; nullopt when none does
    std::optional<Bytes> Fetch(const std::string& hash, const util::CancellationToken& token);
    
    /// Fetch, decrypt and store one listed hash unless it is known
    void Receive(const std::string& hash, const util::CancellationToken& token);
};

} // namespace dec
} // namespace decmail

#endif // DECMAIL_DEC_MAILBOX_H
