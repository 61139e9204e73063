// DECMAIL - Decentralized Storage Backends
// Copyright (c) 2024 DECMAIL Developers
// MIT License
//
// Contract every storage backend satisfies. A backend stores immutable,
// content-addressed blobs and an append-only index from routing ids to
// blob hashes. Any call may throw BackendError.

#ifndef DECMAIL_DEC_STORAGE_CLIENT_H
#define DECMAIL_DEC_STORAGE_CLIENT_H

#include <decmail/core/types.h>
#include <decmail/util/cancellation.h>

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace decmail {
namespace dec {

/// Content hash of a blob: lowercase hex SHA-256 of its bytes
std::string ComputeContentHash(const Bytes& data);

class IDecStorageClient {
public:
    virtual ~IDecStorageClient() = default;
    
    /// Name used in log messages
    virtual std::string Name() const = 0;
    
    /// Store a blob and return its content hash
    virtual std::string Put(const Bytes& data, const util::CancellationToken& token) = 0;
    
    /// Publish hash under a routing id
    virtual void Send(const std::string& routingId, const std::string& hash,
                      const util::CancellationToken& token) = 0;
    
    /// Hashes published under a routing id, in publication order
    virtual std::vector<std::string> List(const std::string& routingId,
                                          const util::CancellationToken& token) = 0;
    
    /// Blob stored under hash
    virtual Bytes Get(const std::string& hash, const util::CancellationToken& token) = 0;
};

/**
 * In-process backend.
 * Publishing the same blob or route entry twice stores it once.
 */
class MemoryStorageClient : public IDecStorageClient {
public:
    explicit MemoryStorageClient(std::string name = "memory");
    
    std::string Name() const override { return name_; }
    
    std::string Put(const Bytes& data, const util::CancellationToken& token) override;
    
    void Send(const std::string& routingId, const std::string& hash,
              const util::CancellationToken& token) override;
    
    std::vector<std::string> List(const std::string& routingId,
                                  const util::CancellationToken& token) override;
    
    /// Throws BackendError for an unknown hash
    Bytes Get(const std::string& hash, const util::CancellationToken& token) override;
    
    size_t BlobCount() const;
    
    bool HasBlob(const std::string& hash) const;

private:
    std::string name_;
    mutable std::mutex mutex_;
    std::map<std::string, Bytes> blobs_;
    std::map<std::string, std::vector<std::string>> routes_;
};

} // namespace dec
} // namespace decmail

#endif // DECMAIL_DEC_STORAGE_CLIENT_H
