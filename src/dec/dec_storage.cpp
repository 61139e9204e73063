// DECMAIL - Local Mailbox Storage Implementation
// Copyright (c) 2024 DECMAIL Developers
// MIT License

#include <decmail/dec/dec_storage.h>
#include <decmail/core/errors.h>

#include <algorithm>
#include <cctype>

namespace decmail {
namespace dec {

MemoryDecStorage::MemoryDecStorage(MasterKey masterKey)
    : masterKey_(std::move(masterKey)) {}

MemoryDecStorage::FolderKey MemoryDecStorage::MakeKey(const EmailAddress& address,
                                                      const std::string& folderName) {
    if (address.IsNull()) {
        throw ArgumentNullError("address");
    }
    std::string lowered = address.Address();
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return {lowered, folderName};
}

MasterKey MemoryDecStorage::GetMasterKey(const util::CancellationToken& token) {
    token.ThrowIfCancellationRequested();
    return masterKey_;
}

bool MemoryDecStorage::MessageExists(const EmailAddress& address, const std::string& folderName,
                                     const std::string& hash,
                                     const util::CancellationToken& token) {
    token.ThrowIfCancellationRequested();
    FolderKey key = MakeKey(address, folderName);
    
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = folders_.find(key);
    if (it == folders_.end()) {
        return false;
    }
    return std::any_of(it->second.begin(), it->second.end(),
                       [&hash](const DecMessage& m) { return m.hash == hash; });
}

DecMessage MemoryDecStorage::AddMessage(const EmailAddress& address, DecMessage message,
                                        const util::CancellationToken& token) {
    token.ThrowIfCancellationRequested();
    FolderKey key = MakeKey(address, message.message.folder.fullName);
    
    std::lock_guard<std::mutex> lock(mutex_);
    auto& messages = folders_[key];
    auto existing = std::find_if(messages.begin(), messages.end(),
                                 [&message](const DecMessage& m) { return m.hash == message.hash; });
    if (existing != messages.end()) {
        return *existing;
    }
    
    message.message.id = nextId_++;
    messages.push_back(message);
    return message;
}

std::vector<DecMessage> MemoryDecStorage::GetMessages(const EmailAddress& address,
                                                      const Folder& folder, size_t limit,
                                                      const util::CancellationToken& token) {
    token.ThrowIfCancellationRequested();
    FolderKey key = MakeKey(address, folder.fullName);
    
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = folders_.find(key);
    if (it == folders_.end()) {
        return {};
    }
    
    std::vector<DecMessage> result(it->second.rbegin(), it->second.rend());
    if (limit != 0 && result.size() > limit) {
        result.resize(limit);
    }
    return result;
}

size_t MemoryDecStorage::Count(const EmailAddress& address, const Folder& folder) const {
    FolderKey key = MakeKey(address, folder.fullName);
    
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = folders_.find(key);
    return it == folders_.end() ? 0 : it->second.size();
}

} // namespace dec
} // namespace decmail
