// DECMAIL - Decentralized Mailbox Tests
// Copyright (c) 2024 DECMAIL Developers
// MIT License

#include <gtest/gtest.h>
#include "decmail/dec/mailbox.h"
#include "decmail/core/errors.h"
#include "decmail/core/hex.h"

#include <atomic>
#include <cctype>
#include <memory>
#include <string>

namespace decmail {
namespace test {

namespace {

const std::string ALICE_SEED = "000102030405060708090a0b0c0d0e0f";
const std::string BOB_SEED = "fffcf9f6f3f0edeae7e4e1dedbd8d5d2cfccc9c6c3c0bdbab7b4b1aeaba8a5a2";

/// Backend that is down
class FailingClient : public dec::IDecStorageClient {
public:
    std::string Name() const override { return "down"; }
    std::string Put(const Bytes&, const util::CancellationToken&) override {
        ++putCalls;
        throw BackendError("connection refused");
    }
    void Send(const std::string&, const std::string&, const util::CancellationToken&) override {
        ++sendCalls;
        throw BackendError("connection refused");
    }
    std::vector<std::string> List(const std::string&, const util::CancellationToken&) override {
        ++listCalls;
        throw BackendError("connection refused");
    }
    Bytes Get(const std::string&, const util::CancellationToken&) override {
        ++getCalls;
        throw BackendError("connection refused");
    }
    
    int Calls() const { return putCalls + sendCalls + listCalls + getCalls; }
    
    std::atomic<int> putCalls{0};
    std::atomic<int> sendCalls{0};
    std::atomic<int> listCalls{0};
    std::atomic<int> getCalls{0};
};

/// Backend over shared memory storage that misbehaves on request
class FaultyClient : public dec::IDecStorageClient {
public:
    explicit FaultyClient(std::shared_ptr<dec::MemoryStorageClient> inner)
        : inner_(std::move(inner)) {}
    
    std::string Name() const override { return "faulty"; }
    std::string Put(const Bytes& data, const util::CancellationToken& token) override {
        std::string hash = inner_->Put(data, token);
        return wrongHash ? std::string(64, '0') : hash;
    }
    void Send(const std::string& route, const std::string& hash,
              const util::CancellationToken& token) override {
        inner_->Send(route, hash, token);
    }
    std::vector<std::string> List(const std::string& route,
                                  const util::CancellationToken& token) override {
        auto hashes = inner_->List(route, token);
        if (upperCaseHashes) {
            for (auto& hash : hashes) {
                for (auto& c : hash) {
                    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
                }
            }
        }
        return hashes;
    }
    Bytes Get(const std::string& hash, const util::CancellationToken& token) override {
        ++getCalls;
        Bytes data = inner_->Get(hash, token);
        if (corrupt && !data.empty()) {
            data[0] ^= 0xff;
        }
        return data;
    }
    
    bool wrongHash{false};
    bool corrupt{false};
    bool upperCaseHashes{false};
    std::atomic<int> getCalls{0};

private:
    std::shared_ptr<dec::MemoryStorageClient> inner_;
};

/// Name service that is unreachable
class UnreachableNameResolver : public INameResolver {
public:
    std::optional<std::string> Resolve(const std::string&, const util::CancellationToken&) override {
        ++calls;
        throw BackendError("name service unreachable");
    }
    
    std::atomic<int> calls{0};
};

} // anonymous namespace

// ============================================================================
// Test Fixture
// ============================================================================

class DecMailBoxTest : public ::testing::Test {
protected:
    void SetUp() override {
        keys_ = PublicKeyService::CreateDefault(nullptr);
        aliceStorage_ = std::make_shared<dec::MemoryDecStorage>(
            MasterKey::FromSeed(HexToBytes(ALICE_SEED)));
        bobStorage_ = std::make_shared<dec::MemoryDecStorage>(
            MasterKey::FromSeed(HexToBytes(BOB_SEED)));
        
        aliceAccount_ = MakeAccount(*aliceStorage_);
        bobAccount_ = MakeAccount(*bobStorage_);
        
        backendA_ = std::make_shared<dec::MemoryStorageClient>("a");
        backendB_ = std::make_shared<dec::MemoryStorageClient>("b");
    }
    
    Account MakeAccount(dec::MemoryDecStorage& storage) {
        std::string key = keys_->DeriveAccountAddress(storage.GetMasterKey(none_),
                                                      Account(EmailAddress(), 0));
        return Account(EmailAddress::CreateDecentralizedAddress(NetworkType::Eppie, key), 0);
    }
    
    std::unique_ptr<dec::DecMailBox> MakeMailbox(const Account& account,
                                                 std::shared_ptr<dec::MemoryDecStorage> storage,
                                                 dec::DecMailBox::ClientList clients,
                                                 dec::MailboxOptions options = {}) {
        auto protector = std::make_shared<dec::MessageProtector>(storage, keys_);
        return std::make_unique<dec::DecMailBox>(account, storage, std::move(clients),
                                                 protector, keys_, options);
    }
    
    dec::DecMailBox::ClientList Healthy() const {
        return {backendA_, backendB_};
    }
    
    Message ToBob(const std::string& subject) const {
        Message message;
        message.to.push_back(bobAccount_.email);
        message.subject = subject;
        message.textBody = "body of " + subject;
        return message;
    }
    
    std::shared_ptr<PublicKeyService> keys_;
    std::shared_ptr<dec::MemoryDecStorage> aliceStorage_;
    std::shared_ptr<dec::MemoryDecStorage> bobStorage_;
    Account aliceAccount_;
    Account bobAccount_;
    std::shared_ptr<dec::MemoryStorageClient> backendA_;
    std::shared_ptr<dec::MemoryStorageClient> backendB_;
    util::CancellationToken none_ = util::CancellationToken::None();
};

// ============================================================================
// Construction
// ============================================================================

TEST_F(DecMailBoxTest, ConstructorValidation) {
    auto protector = std::make_shared<dec::MessageProtector>(aliceStorage_, keys_);
    
    EXPECT_THROW(dec::DecMailBox(Account(), aliceStorage_, Healthy(), protector, keys_),
                 ArgumentNullError);
    EXPECT_THROW(dec::DecMailBox(aliceAccount_, nullptr, Healthy(), protector, keys_),
                 ArgumentNullError);
    EXPECT_THROW(dec::DecMailBox(aliceAccount_, aliceStorage_, Healthy(), nullptr, keys_),
                 ArgumentNullError);
    EXPECT_THROW(dec::DecMailBox(aliceAccount_, aliceStorage_, Healthy(), protector, nullptr),
                 ArgumentNullError);
    EXPECT_THROW(dec::DecMailBox(aliceAccount_, aliceStorage_, {}, protector, keys_),
                 InvalidArgumentError);
    EXPECT_THROW(dec::DecMailBox(aliceAccount_, aliceStorage_, {nullptr}, protector, keys_),
                 ArgumentNullError);
}

TEST_F(DecMailBoxTest, Folders) {
    auto mailbox = MakeMailbox(aliceAccount_, aliceStorage_, Healthy());
    auto folders = mailbox->GetFoldersStructure();
    ASSERT_EQ(folders.size(), 2u);
    EXPECT_TRUE(folders[0].IsInbox());
    EXPECT_TRUE(folders[1].IsSent());
    EXPECT_EQ(mailbox->GetDefaultInboxFolder(), Folder::Inbox());
    EXPECT_EQ(mailbox->BackendCount(), 2u);
}

// ============================================================================
// Send and Receive
// ============================================================================

TEST_F(DecMailBoxTest, SendAndReceive) {
    auto alice = MakeMailbox(aliceAccount_, aliceStorage_, Healthy());
    auto bob = MakeMailbox(bobAccount_, bobStorage_, Healthy());
    
    alice->SendMessage(ToBob("first"));
    
    auto inbox = bob->GetMessages(Folder::Inbox());
    ASSERT_EQ(inbox.size(), 1u);
    EXPECT_EQ(inbox[0].subject, "first");
    EXPECT_EQ(inbox[0].textBody, "body of first");
    EXPECT_EQ(inbox[0].signature, SignatureStatus::Verified);
    EXPECT_TRUE(inbox[0].isDecentralized);
    EXPECT_FALSE(inbox[0].isMarkedAsRead);
    ASSERT_EQ(inbox[0].from.size(), 1u);
    EXPECT_EQ(inbox[0].from[0], aliceAccount_.email);
    
    EXPECT_EQ(backendA_->BlobCount(), 1u);
    EXPECT_EQ(backendB_->BlobCount(), 1u);
}

TEST_F(DecMailBoxTest, SentCopy) {
    auto alice = MakeMailbox(aliceAccount_, aliceStorage_, Healthy());
    
    DecMessage sent = alice->SendMessage(ToBob("copy"));
    EXPECT_EQ(sent.hash.size(), 64u);
    EXPECT_NE(sent.message.id, 0u);
    EXPECT_GT(sent.message.date, 0);
    
    auto sentFolder = alice->GetMessages(Folder::Sent());
    ASSERT_EQ(sentFolder.size(), 1u);
    EXPECT_TRUE(sentFolder[0].folder.IsSent());
    EXPECT_FALSE(sentFolder[0].isMarkedAsRead);
    EXPECT_TRUE(sentFolder[0].isDecentralized);
    ASSERT_EQ(sentFolder[0].from.size(), 1u);
    EXPECT_EQ(sentFolder[0].from[0], aliceAccount_.email);
}

TEST_F(DecMailBoxTest, ReceiveIsIdempotent) {
    auto alice = MakeMailbox(aliceAccount_, aliceStorage_, Healthy());
    
    alice->SendMessage(ToBob("once"));
    
    auto counted = std::make_shared<FaultyClient>(backendA_);
    auto bob = MakeMailbox(bobAccount_, bobStorage_, {counted});
    bob->GetMessages(Folder::Inbox());
    int fetched = counted->getCalls.load();
    EXPECT_EQ(fetched, 1);
    
    auto again = bob->GetMessages(Folder::Inbox());
    EXPECT_EQ(again.size(), 1u);
    EXPECT_EQ(counted->getCalls.load(), fetched);
    EXPECT_EQ(bobStorage_->Count(bobAccount_.email, Folder::Inbox()), 1u);
}

TEST_F(DecMailBoxTest, HashesFromBackendsAreMerged) {
    auto alice = MakeMailbox(aliceAccount_, aliceStorage_, Healthy());
    alice->SendMessage(ToBob("merged"));
    
    // The same hash listed in another case by a second backend
    auto shouting = std::make_shared<FaultyClient>(backendB_);
    shouting->upperCaseHashes = true;
    auto bob = MakeMailbox(bobAccount_, bobStorage_, {backendA_, shouting});
    
    EXPECT_EQ(bob->GetMessages(Folder::Inbox()).size(), 1u);
}

TEST_F(DecMailBoxTest, NewestFirstAndLimit) {
    auto alice = MakeMailbox(aliceAccount_, aliceStorage_, Healthy());
    dec::MailboxOptions options;
    options.receiveLimit = 2;
    auto bob = MakeMailbox(bobAccount_, bobStorage_, Healthy(), options);
    
    alice->SendMessage(ToBob("one"));
    alice->SendMessage(ToBob("two"));
    alice->SendMessage(ToBob("three"));
    
    auto limited = bob->GetMessages(Folder::Inbox());
    EXPECT_EQ(limited.size(), 2u);
    EXPECT_EQ(bob->GetMessages(Folder::Inbox(), 3).size(), 3u);
    EXPECT_EQ(bob->GetMessages(Folder::Inbox(), 1).size(), 1u);
}

TEST_F(DecMailBoxTest, HybridRecipient) {
    EmailAddress plain("bob@example.com");
    std::string tagged = keys_->DeriveEncoded(bobStorage_->GetMasterKey(none_), plain.KeyTag());
    Account hybridBob(plain.MakeHybrid(tagged));
    
    auto alice = MakeMailbox(aliceAccount_, aliceStorage_, Healthy());
    auto bob = MakeMailbox(hybridBob, bobStorage_, Healthy());
    
    Message message;
    message.to.push_back(hybridBob.email);
    message.subject = "hybrid";
    alice->SendMessage(message);
    
    auto inbox = bob->GetMessages(Folder::Inbox());
    ASSERT_EQ(inbox.size(), 1u);
    EXPECT_EQ(inbox[0].subject, "hybrid");
}

TEST_F(DecMailBoxTest, MultipleRecipients) {
    auto alice = MakeMailbox(aliceAccount_, aliceStorage_, Healthy());
    auto bob = MakeMailbox(bobAccount_, bobStorage_, Healthy());
    
    Message message = ToBob("group");
    message.cc.push_back(aliceAccount_.email);
    alice->SendMessage(message);
    
    EXPECT_EQ(bob->GetMessages(Folder::Inbox()).size(), 1u);
    EXPECT_EQ(alice->GetMessages(Folder::Inbox()).size(), 1u);
    EXPECT_EQ(backendA_->BlobCount(), 2u);
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(DecMailBoxTest, RejectsBadRecipients) {
    auto alice = MakeMailbox(aliceAccount_, aliceStorage_, Healthy());
    
    EXPECT_THROW(alice->SendMessage(Message()), InvalidArgumentError);
    
    Message plain = ToBob("mixed");
    plain.cc.emplace_back("carol@example.com");
    EXPECT_THROW(alice->SendMessage(plain), InvalidArgumentError);
    EXPECT_EQ(backendA_->BlobCount(), 0u);
}

TEST_F(DecMailBoxTest, UnknownRecipientName) {
    auto alice = MakeMailbox(aliceAccount_, aliceStorage_, Healthy());
    Message message;
    message.to.emplace_back("nobody@eppie");
    EXPECT_THROW(alice->SendMessage(message), NoPublicKeyError);
}

// ============================================================================
// Backend Failures
// ============================================================================

TEST_F(DecMailBoxTest, OneBackendDown) {
    auto down = std::make_shared<FailingClient>();
    auto alice = MakeMailbox(aliceAccount_, aliceStorage_, {down, backendA_});
    auto bob = MakeMailbox(bobAccount_, bobStorage_, {down, backendA_});
    
    alice->SendMessage(ToBob("partial"));
    EXPECT_EQ(bob->GetMessages(Folder::Inbox()).size(), 1u);
    EXPECT_GT(down->Calls(), 0);
}

TEST_F(DecMailBoxTest, AllBackendsDown) {
    auto first = std::make_shared<FailingClient>();
    auto second = std::make_shared<FailingClient>();
    auto alice = MakeMailbox(aliceAccount_, aliceStorage_, {first, second});
    
    try {
        alice->SendMessage(ToBob("lost"));
        FAIL() << "Expected TransportError";
    } catch (const TransportError& e) {
        ASSERT_TRUE(e.Inner());
        EXPECT_THROW(e.RethrowInner(), BackendError);
    }
    EXPECT_GT(first->putCalls.load(), 0);
    EXPECT_EQ(first->sendCalls.load(), 0);
    
    EXPECT_THROW(alice->GetMessages(Folder::Inbox()), TransportError);
    EXPECT_GT(first->listCalls.load(), 0);
    EXPECT_GT(second->listCalls.load(), 0);
    EXPECT_EQ(first->getCalls.load(), 0);
    EXPECT_EQ(second->getCalls.load(), 0);
    EXPECT_EQ(aliceStorage_->Count(aliceAccount_.email, Folder::Sent()), 0u);
}

TEST_F(DecMailBoxTest, SentFolderNeedsNoBackend) {
    auto alice = MakeMailbox(aliceAccount_, aliceStorage_, {std::make_shared<FailingClient>()});
    EXPECT_TRUE(alice->GetMessages(Folder::Sent()).empty());
}

TEST_F(DecMailBoxTest, WrongHashFromBackendIsFailure) {
    auto liar = std::make_shared<FaultyClient>(std::make_shared<dec::MemoryStorageClient>());
    liar->wrongHash = true;
    
    auto onlyLiar = MakeMailbox(aliceAccount_, aliceStorage_, {liar});
    EXPECT_THROW(onlyLiar->SendMessage(ToBob("x")), TransportError);
    
    auto mixed = MakeMailbox(aliceAccount_, aliceStorage_, {liar, backendA_});
    EXPECT_NO_THROW(mixed->SendMessage(ToBob("y")));
}

TEST_F(DecMailBoxTest, CorruptBlobFallsBackToNextBackend) {
    auto alice = MakeMailbox(aliceAccount_, aliceStorage_, {backendA_});
    alice->SendMessage(ToBob("intact"));
    
    auto corrupt = std::make_shared<FaultyClient>(backendA_);
    corrupt->corrupt = true;
    auto bob = MakeMailbox(bobAccount_, bobStorage_, {corrupt, backendA_});
    
    auto inbox = bob->GetMessages(Folder::Inbox());
    ASSERT_EQ(inbox.size(), 1u);
    EXPECT_EQ(inbox[0].subject, "intact");
}

TEST_F(DecMailBoxTest, UnreadableBlobsAreSkipped) {
    auto alice = MakeMailbox(aliceAccount_, aliceStorage_, Healthy());
    alice->SendMessage(ToBob("good"));
    
    // Garbage addressed to Bob, and a hash no backend serves
    dec::RoutingId bobRoute(bobAccount_.email.DecentralizedAddress());
    std::string garbage = backendA_->Put(Bytes{1, 2, 3}, none_);
    backendA_->Send(bobRoute.ToString(), garbage, none_);
    backendA_->Send(bobRoute.ToString(), std::string(64, 'f'), none_);
    
    auto bob = MakeMailbox(bobAccount_, bobStorage_, Healthy());
    auto inbox = bob->GetMessages(Folder::Inbox());
    ASSERT_EQ(inbox.size(), 1u);
    EXPECT_EQ(inbox[0].subject, "good");
}

TEST_F(DecMailBoxTest, UnreachableNameServiceLeavesMessagesUnverified) {
    auto names = std::make_shared<UnreachableNameResolver>();
    keys_ = PublicKeyService::CreateDefault(names);
    auto alice = MakeMailbox(aliceAccount_, aliceStorage_, Healthy());
    auto bob = MakeMailbox(bobAccount_, bobStorage_, Healthy());
    
    alice->SendMessage(ToBob("direct"));
    Message named = ToBob("named");
    named.from.emplace_back("alice@eppie");
    alice->SendMessage(named);
    
    auto inbox = bob->GetMessages(Folder::Inbox());
    ASSERT_EQ(inbox.size(), 2u);
    EXPECT_GT(names->calls.load(), 0);
    for (const auto& message : inbox) {
        if (message.subject == "named") {
            EXPECT_EQ(message.signature, SignatureStatus::Unverified);
        } else {
            EXPECT_EQ(message.subject, "direct");
            EXPECT_EQ(message.signature, SignatureStatus::Verified);
        }
    }
}

// ============================================================================
// Cancellation and Async
// ============================================================================

TEST_F(DecMailBoxTest, CanceledOperationsThrow) {
    auto alice = MakeMailbox(aliceAccount_, aliceStorage_, Healthy());
    util::CancellationSource source;
    source.Cancel();
    
    EXPECT_THROW(alice->SendMessage(ToBob("never"), source.Token()), OperationCanceledError);
    EXPECT_THROW(alice->GetMessages(Folder::Inbox(), 0, source.Token()), OperationCanceledError);
    EXPECT_EQ(backendA_->BlobCount(), 0u);
}

TEST_F(DecMailBoxTest, AsyncSendAndReceive) {
    auto alice = MakeMailbox(aliceAccount_, aliceStorage_, Healthy());
    auto bob = MakeMailbox(bobAccount_, bobStorage_, Healthy());
    
    DecMessage sent = alice->SendMessageAsync(ToBob("async")).get();
    EXPECT_TRUE(sent.message.folder.IsSent());
    
    auto inbox = bob->GetMessagesAsync(Folder::Inbox()).get();
    ASSERT_EQ(inbox.size(), 1u);
    EXPECT_EQ(inbox[0].subject, "async");
}

// ============================================================================
// Options
// ============================================================================

TEST(MailboxOptionsTest, FromConfig) {
    util::ConfigManager config;
    ASSERT_TRUE(config.ParseString("[mailbox]\nfanout_threads=3\nreceive_limit=50\nresolver_cache=1\n").success);
    
    auto options = dec::MailboxOptions::FromConfig(config);
    EXPECT_EQ(options.fanoutThreads, 3u);
    EXPECT_EQ(options.receiveLimit, 50u);
    EXPECT_TRUE(options.resolverCache);
}

TEST(MailboxOptionsTest, Defaults) {
    util::ConfigManager config;
    auto options = dec::MailboxOptions::FromConfig(config);
    EXPECT_EQ(options.fanoutThreads, 0u);
    EXPECT_EQ(options.receiveLimit, 0u);
    EXPECT_FALSE(options.resolverCache);
}

TEST(MailboxOptionsTest, WrapNameResolver) {
    auto inner = std::make_shared<NullNameResolver>();
    
    dec::MailboxOptions plain;
    EXPECT_EQ(plain.WrapNameResolver(inner), inner);
    
    dec::MailboxOptions cached;
    cached.resolverCache = true;
    auto wrapped = cached.WrapNameResolver(inner);
    EXPECT_NE(wrapped, inner);
    EXPECT_NE(std::dynamic_pointer_cast<CachingNameResolver>(wrapped), nullptr);
    
    EXPECT_THROW(plain.WrapNameResolver(nullptr), ArgumentNullError);
}

} // namespace test
} // namespace decmail
