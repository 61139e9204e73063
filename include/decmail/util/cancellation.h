// DECMAIL - Cooperative Cancellation
// Copyright (c) 2024 DECMAIL Developers
// MIT License
//
// A CancellationSource owns a shared flag; the tokens it hands out are cheap
// copies that observe it. Long-running operations check their token before
// each backend call.

#ifndef DECMAIL_UTIL_CANCELLATION_H
#define DECMAIL_UTIL_CANCELLATION_H

#include <atomic>
#include <memory>

namespace decmail {
namespace util {

class CancellationToken {
public:
    /// Token that is never cancelled
    CancellationToken() = default;
    
    bool IsCancellationRequested() const {
        return flag_ && flag_->load();
    }
    
    /// Throws OperationCanceledError once cancellation was requested
    void ThrowIfCancellationRequested() const;
    
    /// Token that is never cancelled
    static CancellationToken None() { return CancellationToken(); }

private:
    friend class CancellationSource;
    
    explicit CancellationToken(std::shared_ptr<const std::atomic<bool>> flag)
        : flag_(std::move(flag)) {}
    
    std::shared_ptr<const std::atomic<bool>> flag_;
};

class CancellationSource {
public:
    CancellationSource() : flag_(std::make_shared<std::atomic<bool>>(false)) {}
    
    CancellationToken Token() const { return CancellationToken(flag_); }
    
    /// Request cancellation; idempotent
    void Cancel() { flag_->store(true); }
    
    bool IsCancellationRequested() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace util
} // namespace decmail

#endif // DECMAIL_UTIL_CANCELLATION_H
