// DECMAIL - Decentralized Storage Backends Implementation
// Copyright (c) 2024 DECMAIL Developers
// MIT License

#include <decmail/dec/storage_client.h>
#include <decmail/core/errors.h>
#include <decmail/crypto/sha256.h>

#include <algorithm>

namespace decmail {
namespace dec {

std::string ComputeContentHash(const Bytes& data) {
    return SHA256Hash(data).ToHex();
}

// ============================================================================
// MemoryStorageClient
// ============================================================================

MemoryStorageClient::MemoryStorageClient(std::string name)
    : name_(std::move(name)) {}

std::string MemoryStorageClient::Put(const Bytes& data, const util::CancellationToken& token) {
    token.ThrowIfCancellationRequested();
    std::string hash = ComputeContentHash(data);
    
    std::lock_guard<std::mutex> lock(mutex_);
    blobs_.emplace(hash, data);
    return hash;
}

void MemoryStorageClient::Send(const std::string& routingId, const std::string& hash,
                               const util::CancellationToken& token) {
    token.ThrowIfCancellationRequested();
    
    std::lock_guard<std::mutex> lock(mutex_);
    auto& hashes = routes_[routingId];
    if (std::find(hashes.begin(), hashes.end(), hash) == hashes.end()) {
        hashes.push_back(hash);
    }
}

std::vector<std::string> MemoryStorageClient::List(const std::string& routingId,
                                                   const util::CancellationToken& token) {
    token.ThrowIfCancellationRequested();
    
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = routes_.find(routingId);
    if (it == routes_.end()) {
        return {};
    }
    return it->second;
}

Bytes MemoryStorageClient::Get(const std::string& hash, const util::CancellationToken& token) {
    token.ThrowIfCancellationRequested();
    
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = blobs_.find(hash);
    if (it == blobs_.end()) {
        throw BackendError(name_ + ": blob " + hash + " not found");
    }
    return it->second;
}

size_t MemoryStorageClient::BlobCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return blobs_.size();
}

bool MemoryStorageClient::HasBlob(const std::string& hash) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return blobs_.count(hash) != 0;
}

} // namespace dec
} // namespace decmail
