// DECMAIL - Decentralized Mailbox Implementation
// Copyright (c) 2024 DECMAIL Developers
// MIT License

#include <decmail/dec/mailbox.h>
#include <decmail/core/errors.h>
#include <decmail/crypto/sha256.h>
#include <decmail/util/logging.h>

#include <algorithm>
#include <cctype>
#include <set>
#include <thread>
#include <type_traits>

namespace decmail {
namespace dec {

namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

/// Results of one call issued to every backend
template<typename T>
struct FanOutOutcome {
    std::vector<T> values;
    size_t failures{0};
    std::exception_ptr lastError;
    
    bool AnySucceeded() const { return !values.empty(); }
};

/**
 * Issue call on every client through the pool and collect the outcome.
 * Backend failures are logged and counted; cancellation is rethrown.
 */
template<typename Call>
auto FanOut(util::ThreadPool& pool, const DecMailBox::ClientList& clients,
            const char* operation, const Call& call, const util::CancellationToken& token)
    -> FanOutOutcome<std::invoke_result_t<Call, IDecStorageClient&, const util::CancellationToken&>> {
    using Result = std::invoke_result_t<Call, IDecStorageClient&, const util::CancellationToken&>;
    
    token.ThrowIfCancellationRequested();
    
    std::vector<std::future<Result>> futures;
    futures.reserve(clients.size());
    for (const auto& client : clients) {
        futures.push_back(pool.Submit([client, call, token]() {
            token.ThrowIfCancellationRequested();
            return call(*client, token);
        }));
    }
    
    FanOutOutcome<Result> outcome;
    for (size_t i = 0; i < futures.size(); ++i) {
        try {
            outcome.values.push_back(futures[i].get());
        } catch (const OperationCanceledError&) {
            throw;
        } catch (const std::exception& e) {
            ++outcome.failures;
            outcome.lastError = std::current_exception();
            LOG_WARN(util::LogCategory::TRANSPORT) << operation << " failed on "
                                                   << clients[i]->Name() << ": " << e.what();
        }
    }
    return outcome;
}

} // namespace

// ============================================================================
// MailboxOptions
// ============================================================================

MailboxOptions MailboxOptions::FromConfig(const util::ConfigManager& config) {
    using util::ConfigKeys::MAILBOX_SECTION;
    
    MailboxOptions options;
    options.fanoutThreads = static_cast<size_t>(
        config.GetUInt(util::ConfigKeys::FANOUT_THREADS, options.fanoutThreads, MAILBOX_SECTION));
    options.receiveLimit = static_cast<size_t>(
        config.GetUInt(util::ConfigKeys::RECEIVE_LIMIT, options.receiveLimit, MAILBOX_SECTION));
    options.resolverCache =
        config.GetBool(util::ConfigKeys::RESOLVER_CACHE, options.resolverCache, MAILBOX_SECTION);
    return options;
}

std::shared_ptr<INameResolver> MailboxOptions::WrapNameResolver(
    std::shared_ptr<INameResolver> resolver) const {
    if (!resolver) {
        throw ArgumentNullError("resolver");
    }
    if (!resolverCache) {
        return resolver;
    }
    return std::make_shared<CachingNameResolver>(std::move(resolver));
}

// ============================================================================
// Construction
// ============================================================================

DecMailBox::DecMailBox(Account account,
                       std::shared_ptr<IDecStorage> storage,
                       ClientList clients,
                       std::shared_ptr<MessageProtector> protector,
                       std::shared_ptr<const PublicKeyService> keys,
                       MailboxOptions options)
    : account_(std::move(account))
    , storage_(std::move(storage))
    , clients_(std::move(clients))
    , protector_(std::move(protector))
    , keys_(std::move(keys))
    , options_(options) {
    if (account_.email.IsNull()) {
        throw ArgumentNullError("account");
    }
    if (!storage_) {
        throw ArgumentNullError("storage");
    }
    if (!protector_) {
        throw ArgumentNullError("protector");
    }
    if (!keys_) {
        throw ArgumentNullError("keys");
    }
    if (clients_.empty()) {
        throw InvalidArgumentError("At least one storage client is required");
    }
    for (const auto& client : clients_) {
        if (!client) {
            throw ArgumentNullError("client");
        }
    }
    
    util::ThreadPool::Config poolConfig;
    poolConfig.name = "dec-fanout";
    poolConfig.numThreads = options_.fanoutThreads;
    if (poolConfig.numThreads == 0) {
        size_t hardware = std::max<size_t>(1, std::thread::hardware_concurrency());
        poolConfig.numThreads = std::min(hardware, clients_.size());
    }
    pool_ = std::make_unique<util::ThreadPool>(poolConfig);
    
    LOG_DEBUG(util::LogCategory::MAILBOX) << "Mailbox for " << account_.email.Address()
                                          << " over " << clients_.size() << " backend(s)";
}

DecMailBox::~DecMailBox() {
    pool_->Shutdown();
}

std::vector<Folder> DecMailBox::GetFoldersStructure() const {
    return {Folder::Inbox(), Folder::Sent()};
}

// ============================================================================
// Send
// ============================================================================

std::string DecMailBox::Publish(const RoutingId& route, const Bytes& ciphertext,
                                const util::CancellationToken& token) {
    auto blob = std::make_shared<const Bytes>(ciphertext);
    const std::string hash = ComputeContentHash(*blob);
    const std::string routingId = route.ToString();
    
    auto stored = FanOut(*pool_, clients_, "put",
        [blob, hash](IDecStorageClient& client, const util::CancellationToken& t) {
            std::string returned = ToLower(client.Put(*blob, t));
            if (returned != hash) {
                throw BackendError(client.Name() + " stored the blob under " + returned);
            }
            return true;
        }, token);
    if (!stored.AnySucceeded()) {
        throw TransportError("No backend stored blob " + hash, stored.lastError);
    }
    
    auto sent = FanOut(*pool_, clients_, "send",
        [routingId, hash](IDecStorageClient& client, const util::CancellationToken& t) {
            client.Send(routingId, hash, t);
            return true;
        }, token);
    if (!sent.AnySucceeded()) {
        throw TransportError("No backend published blob " + hash + " to " + routingId,
                             sent.lastError);
    }
    
    LOG_DEBUG(util::LogCategory::MAILBOX) << "Published " << hash << " on "
                                          << sent.values.size() << "/" << clients_.size()
                                          << " backend(s)";
    return hash;
}

DecMessage DecMailBox::SendMessage(Message message, const util::CancellationToken& token) {
    token.ThrowIfCancellationRequested();
    
    std::vector<EmailAddress> recipients = message.AllRecipients();
    if (recipients.empty()) {
        throw InvalidArgumentError("Message has no recipients");
    }
    for (const auto& recipient : recipients) {
        if (!recipient.IsDecentralized() && !recipient.IsHybrid()) {
            throw InvalidArgumentError("Message should contain only decentralized recipients: " +
                                       recipient.Address());
        }
    }
    
    if (message.from.empty()) {
        message.from.push_back(account_.email);
    }
    message.date = GetTime();
    
    std::string hashes;
    for (const auto& recipient : recipients) {
        std::string recipientKey = keys_->GetEncodedByEmail(recipient, token);
        RoutingId route(recipientKey);
        Bytes ciphertext = protector_->SignAndEncrypt(account_, message, recipientKey, token);
        hashes += Publish(route, ciphertext, token);
    }
    
    // Sending never marks the sender's own copy as read
    message.folder = Folder::Sent();
    message.isMarkedAsRead = false;
    message.isDecentralized = true;
    
    DecMessage sentCopy(SHA256Hash(hashes).ToHex(), std::move(message));
    DecMessage stored = storage_->AddMessage(account_.email, std::move(sentCopy), token);
    
    LOG_INFO(util::LogCategory::MAILBOX) << "Sent message " << stored.hash << " to "
                                         << recipients.size() << " recipient(s)";
    return stored;
}

std::future<DecMessage> DecMailBox::SendMessageAsync(Message message,
                                                     util::CancellationToken token) {
    return std::async(std::launch::async,
                      [this, message = std::move(message), token]() mutable {
                          return SendMessage(std::move(message), token);
                      });
}

// ============================================================================
// Receive
// ============================================================================

std::vector<std::string> DecMailBox::ListAll(const RoutingId& route,
                                             const util::CancellationToken& token) {
    const std::string routingId = route.ToString();
    auto listed = FanOut(*pool_, clients_, "list",
        [routingId](IDecStorageClient& client, const util::CancellationToken& t) {
            return client.List(routingId, t);
        }, token);
    if (!listed.AnySucceeded()) {
        throw TransportError("No backend listed messages for " + routingId, listed.lastError);
    }
    
    std::vector<std::string> hashes;
    std::set<std::string> seen;
    for (const auto& list : listed.values) {
        for (const auto& hash : list) {
            std::string normalized = ToLower(hash);
            if (seen.insert(normalized).second) {
                hashes.push_back(std::move(normalized));
            }
        }
    }
    return hashes;
}

std::optional<Bytes> DecMailBox::Fetch(const std::string& hash,
                                       const util::CancellationToken& token) {
    for (const auto& client : clients_) {
        token.ThrowIfCancellationRequested();
        try {
            Bytes data = client->Get(hash, token);
            if (ComputeContentHash(data) != hash) {
                LOG_WARN(util::LogCategory::TRANSPORT) << client->Name()
                                                       << " served wrong content for " << hash;
                continue;
            }
            return data;
        } catch (const OperationCanceledError&) {
            throw;
        } catch (const std::exception& e) {
            LOG_WARN(util::LogCategory::TRANSPORT) << "get " << hash << " failed on "
                                                   << client->Name() << ": " << e.what();
        }
    }
    return std::nullopt;
}

void DecMailBox::Receive(const std::string& hash, const util::CancellationToken& token) {
    const Folder inbox = Folder::Inbox();
    if (storage_->MessageExists(account_.email, inbox.fullName, hash, token)) {
        return;
    }
    
    auto data = Fetch(hash, token);
    if (!data) {
        LOG_WARN(util::LogCategory::MAILBOX) << "Message " << hash
                                             << " is not served by any backend; skipped";
        return;
    }
    
    Message message;
    try {
        message = protector_->TryVerifyAndDecrypt(account_, *data, token);
    } catch (const OperationCanceledError&) {
        throw;
    } catch (const std::exception& e) {
        LOG_WARN(util::LogCategory::MAILBOX) << "Message " << hash << " skipped: " << e.what();
        return;
    }
    
    message.folder = inbox;
    message.isMarkedAsRead = false;
    message.isDecentralized = true;
    storage_->AddMessage(account_.email, DecMessage(hash, std::move(message)), token);
}

std::vector<Message> DecMailBox::GetMessages(const Folder& folder, size_t count,
                                             const util::CancellationToken& token) {
    token.ThrowIfCancellationRequested();
    
    if (folder.IsInbox()) {
        MasterKey master = storage_->GetMasterKey(token);
        RoutingId route(keys_->DeriveAccountAddress(master, account_));
        
        std::vector<std::string> hashes = ListAll(route, token);
        for (const auto& hash : hashes) {
            Receive(hash, token);
        }
        LOG_DEBUG(util::LogCategory::MAILBOX) << "Listed " << hashes.size() << " message(s) for "
                                              << account_.email.Address();
    }
    
    if (count == 0) {
        count = options_.receiveLimit;
    }
    
    std::vector<Message> messages;
    for (auto& stored : storage_->GetMessages(account_.email, folder, count, token)) {
        messages.push_back(std::move(stored.message));
    }
    return messages;
}

std::future<std::vector<Message>> DecMailBox::GetMessagesAsync(Folder folder, size_t count,
                                                               util::CancellationToken token) {
    return std::async(std::launch::async,
                      [this, folder = std::move(folder), count, token]() {
                          return GetMessages(folder, count, token);
                      });
}

} // namespace dec
} // namespace decmail
