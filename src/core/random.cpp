// DECMAIL - Secure Randomness Implementation
// Copyright (c) 2024 DECMAIL Developers
// MIT License

#include <decmail/core/random.h>

#include <openssl/err.h>
#include <openssl/rand.h>

#include <algorithm>
#include <stdexcept>
#include <string>

namespace decmail {

void GetRandBytes(Byte* buf, size_t len) {
    while (len > 0) {
        // RAND_bytes takes an int length
        int chunk = static_cast<int>(std::min<size_t>(len, 1 << 20));
        if (RAND_bytes(buf, chunk) != 1) {
            throw std::runtime_error("RAND_bytes failed: " +
                                     std::to_string(ERR_get_error()));
        }
        buf += chunk;
        len -= static_cast<size_t>(chunk);
    }
}

Bytes GetRandBytes(size_t len) {
    Bytes out(len);
    GetRandBytes(out.data(), out.size());
    return out;
}

} // namespace decmail
