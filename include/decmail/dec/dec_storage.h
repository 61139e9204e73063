// DECMAIL - Local Mailbox Storage
// Copyright (c) 2024 DECMAIL Developers
// MIT License
//
// Key holder and local message store used by the decentralized mailbox.
// Messages are kept per (address, folder) and deduplicated by content hash.

#ifndef DECMAIL_DEC_DEC_STORAGE_H
#define DECMAIL_DEC_DEC_STORAGE_H

#include <decmail/keys/hdkey.h>
#include <decmail/mail/email_address.h>
#include <decmail/mail/message.h>
#include <decmail/util/cancellation.h>

#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace decmail {
namespace dec {

class IDecStorage {
public:
    virtual ~IDecStorage() = default;
    
    virtual MasterKey GetMasterKey(const util::CancellationToken& token) = 0;
    
    virtual bool MessageExists(const EmailAddress& address, const std::string& folderName,
                               const std::string& hash, const util::CancellationToken& token) = 0;
    
    /// Store a message in message.folder and return the stored copy with its
    /// id assigned. A hash already present in that folder is not stored again.
    virtual DecMessage AddMessage(const EmailAddress& address, DecMessage message,
                                  const util::CancellationToken& token) = 0;
    
    /// Newest first; limit 0 returns everything
    virtual std::vector<DecMessage> GetMessages(const EmailAddress& address, const Folder& folder,
                                                size_t limit, const util::CancellationToken& token) = 0;
};

class MemoryDecStorage : public IDecStorage {
public:
    explicit MemoryDecStorage(MasterKey masterKey);
    
    MasterKey GetMasterKey(const util::CancellationToken& token) override;
    
    bool MessageExists(const EmailAddress& address, const std::string& folderName,
                       const std::string& hash, const util::CancellationToken& token) override;
    
    DecMessage AddMessage(const EmailAddress& address, DecMessage message,
                          const util::CancellationToken& token) override;
    
    std::vector<DecMessage> GetMessages(const EmailAddress& address, const Folder& folder,
                                        size_t limit, const util::CancellationToken& token) override;
    
    /// Number of messages stored for an address in a folder
    size_t Count(const EmailAddress& address, const Folder& folder) const;

private:
    using FolderKey = std::pair<std::string, std::string>;
    
    static FolderKey MakeKey(const EmailAddress& address, const std::string& folderName);
    
    MasterKey masterKey_;
    mutable std::mutex mutex_;
    std::map<FolderKey, std::vector<DecMessage>> folders_;
    uint32_t nextId_{1};
};

} // namespace dec
} // namespace decmail

#endif // DECMAIL_DEC_DEC_STORAGE_H
