// DECMAIL - Cooperative Cancellation Implementation
// Copyright (c) 2024 DECMAIL Developers
// MIT License

#include <decmail/util/cancellation.h>
#include <decmail/core/errors.h>

namespace decmail {
namespace util {

void CancellationToken::ThrowIfCancellationRequested() const {
    if (IsCancellationRequested()) {
        throw OperationCanceledError();
    }
}

} // namespace util
} // namespace decmail
