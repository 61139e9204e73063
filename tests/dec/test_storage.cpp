// DECMAIL - Storage Backend and Local Store Tests
// Copyright (c) 2024 DECMAIL Developers
// MIT License

#include <gtest/gtest.h>
#include "decmail/dec/storage_client.h"
#include "decmail/dec/dec_storage.h"
#include "decmail/core/errors.h"
#include "decmail/core/hex.h"

#include <memory>
#include <string>

namespace decmail {
namespace test {

namespace {

DecMessage MakeStored(const std::string& hash, const std::string& subject,
                      const Folder& folder = Folder::Inbox()) {
    Message message;
    message.subject = subject;
    message.folder = folder;
    return DecMessage(hash, message);
}

} // anonymous namespace

// ============================================================================
// Content Hash
// ============================================================================

TEST(ContentHashTest, LowercaseSHA256) {
    EXPECT_EQ(dec::ComputeContentHash(Bytes{'a', 'b', 'c'}),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

// ============================================================================
// MemoryStorageClient Tests
// ============================================================================

class MemoryStorageClientTest : public ::testing::Test {
protected:
    dec::MemoryStorageClient client_{"test-backend"};
    util::CancellationToken none_ = util::CancellationToken::None();
};

TEST_F(MemoryStorageClientTest, PutReturnsContentHash) {
    Bytes data = {1, 2, 3};
    std::string hash = client_.Put(data, none_);
    EXPECT_EQ(hash, dec::ComputeContentHash(data));
    EXPECT_TRUE(client_.HasBlob(hash));
    EXPECT_EQ(client_.Get(hash, none_), data);
    EXPECT_EQ(client_.Name(), "test-backend");
}

TEST_F(MemoryStorageClientTest, PutIsIdempotent) {
    client_.Put(Bytes{1}, none_);
    client_.Put(Bytes{1}, none_);
    EXPECT_EQ(client_.BlobCount(), 1u);
}

TEST_F(MemoryStorageClientTest, RoutesKeepOrderWithoutDuplicates) {
    client_.Send("route", "h1", none_);
    client_.Send("route", "h2", none_);
    client_.Send("route", "h1", none_);
    
    auto listed = client_.List("route", none_);
    ASSERT_EQ(listed.size(), 2u);
    EXPECT_EQ(listed[0], "h1");
    EXPECT_EQ(listed[1], "h2");
    EXPECT_TRUE(client_.List("other", none_).empty());
}

TEST_F(MemoryStorageClientTest, MissingBlobThrows) {
    EXPECT_THROW(client_.Get("deadbeef", none_), BackendError);
}

TEST_F(MemoryStorageClientTest, HonorsCancellation) {
    util::CancellationSource source;
    source.Cancel();
    EXPECT_THROW(client_.Put(Bytes{1}, source.Token()), OperationCanceledError);
    EXPECT_THROW(client_.List("route", source.Token()), OperationCanceledError);
}

// ============================================================================
// MemoryDecStorage Tests
// ============================================================================

class MemoryDecStorageTest : public ::testing::Test {
protected:
    void SetUp() override {
        storage_ = std::make_unique<dec::MemoryDecStorage>(
            MasterKey::FromSeed(HexToBytes("000102030405060708090a0b0c0d0e0f")));
    }
    
    std::unique_ptr<dec::MemoryDecStorage> storage_;
    EmailAddress owner_{"alice@eppie"};
    util::CancellationToken none_ = util::CancellationToken::None();
};

TEST_F(MemoryDecStorageTest, MasterKey) {
    EXPECT_TRUE(storage_->GetMasterKey(none_).IsValid());
}

TEST_F(MemoryDecStorageTest, AddAssignsIds) {
    DecMessage first = storage_->AddMessage(owner_, MakeStored("h1", "one"), none_);
    DecMessage second = storage_->AddMessage(owner_, MakeStored("h2", "two"), none_);
    EXPECT_NE(first.message.id, 0u);
    EXPECT_NE(first.message.id, second.message.id);
    EXPECT_TRUE(storage_->MessageExists(owner_, "Inbox", "h1", none_));
    EXPECT_FALSE(storage_->MessageExists(owner_, "Sent", "h1", none_));
}

TEST_F(MemoryDecStorageTest, DuplicateHashReturnsExisting) {
    DecMessage first = storage_->AddMessage(owner_, MakeStored("h1", "one"), none_);
    DecMessage again = storage_->AddMessage(owner_, MakeStored("h1", "changed"), none_);
    EXPECT_EQ(again.message.id, first.message.id);
    EXPECT_EQ(again.message.subject, "one");
    EXPECT_EQ(storage_->Count(owner_, Folder::Inbox()), 1u);
}

TEST_F(MemoryDecStorageTest, SameHashInOtherFolder) {
    storage_->AddMessage(owner_, MakeStored("h1", "in"), none_);
    storage_->AddMessage(owner_, MakeStored("h1", "out", Folder::Sent()), none_);
    EXPECT_EQ(storage_->Count(owner_, Folder::Inbox()), 1u);
    EXPECT_EQ(storage_->Count(owner_, Folder::Sent()), 1u);
}

TEST_F(MemoryDecStorageTest, NewestFirstWithLimit) {
    storage_->AddMessage(owner_, MakeStored("h1", "one"), none_);
    storage_->AddMessage(owner_, MakeStored("h2", "two"), none_);
    storage_->AddMessage(owner_, MakeStored("h3", "three"), none_);
    
    auto all = storage_->GetMessages(owner_, Folder::Inbox(), 0, none_);
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].message.subject, "three");
    EXPECT_EQ(all[2].message.subject, "one");
    
    auto limited = storage_->GetMessages(owner_, Folder::Inbox(), 2, none_);
    ASSERT_EQ(limited.size(), 2u);
    EXPECT_EQ(limited[1].message.subject, "two");
}

TEST_F(MemoryDecStorageTest, AddressIsCaseInsensitive) {
    storage_->AddMessage(owner_, MakeStored("h1", "one"), none_);
    EXPECT_TRUE(storage_->MessageExists(EmailAddress("ALICE@eppie"), "Inbox", "h1", none_));
}

TEST_F(MemoryDecStorageTest, AccountsAreSeparate) {
    storage_->AddMessage(owner_, MakeStored("h1", "one"), none_);
    EXPECT_TRUE(storage_->GetMessages(EmailAddress("bob@eppie"), Folder::Inbox(), 0, none_).empty());
}

TEST_F(MemoryDecStorageTest, NullAddressThrows) {
    EXPECT_THROW(storage_->AddMessage(EmailAddress(), MakeStored("h1", "one"), none_),
                 ArgumentNullError);
    EXPECT_THROW(storage_->MessageExists(EmailAddress(), "Inbox", "h1", none_), ArgumentNullError);
}

} // namespace test
} // namespace decmail
