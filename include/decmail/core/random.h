// DECMAIL - Secure Randomness
// Copyright (c) 2024 DECMAIL Developers
// MIT License
//
// OpenSSL CSPRNG for private keys, ephemeral ECIES keys and nonces.

#ifndef DECMAIL_CORE_RANDOM_H
#define DECMAIL_CORE_RANDOM_H

#include <decmail/core/types.h>

namespace decmail {

/// Throws std::runtime_error when the generator fails
void GetRandBytes(Byte* buf, size_t len);

Bytes GetRandBytes(size_t len);

} // namespace decmail

#endif // DECMAIL_CORE_RANDOM_H
