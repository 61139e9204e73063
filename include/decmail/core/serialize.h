// DECMAIL - Binary Serialization
// Copyright (c) 2024 DECMAIL Developers
// MIT License
//
// Little-endian binary serialization with CompactSize length prefixes.
// Used for message bodies and encryption envelopes.

#ifndef DECMAIL_CORE_SERIALIZE_H
#define DECMAIL_CORE_SERIALIZE_H

#include <decmail/core/errors.h>
#include <decmail/core/types.h>

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace decmail {

/// Maximum size of a single serialized element (32 MB)
constexpr uint64_t MAX_SERIALIZE_SIZE = 0x02000000;

// ============================================================================
// DataStream - In-memory byte buffer for serialization
// ============================================================================

class DataStream {
public:
    DataStream() = default;
    
    explicit DataStream(const Bytes& data) : data_(data) {}
    
    explicit DataStream(Bytes&& data) : data_(std::move(data)) {}
    
    DataStream(const uint8_t* data, size_t len) : data_(data, data + len) {}
    
    /// Returns unread bytes remaining
    size_t size() const noexcept { return data_.size() - readPos_; }
    
    bool empty() const noexcept { return size() == 0; }
    
    /// Whole buffer, including bytes already read
    const Bytes& Data() const noexcept { return data_; }
    
    void Write(const uint8_t* src, size_t len) {
        data_.insert(data_.end(), src, src + len);
    }
    
    void Write(const char* src, size_t len) {
        Write(reinterpret_cast<const uint8_t*>(src), len);
    }
    
    void Read(uint8_t* dst, size_t len) {
        if (len > size()) {
            throw FormatError("DataStream::Read(): end of data");
        }
        if (len > 0) {
            std::memcpy(dst, data_.data() + readPos_, len);
        }
        readPos_ += len;
    }
    
    void Read(char* dst, size_t len) {
        Read(reinterpret_cast<uint8_t*>(dst), len);
    }
    
    template<typename T>
    DataStream& operator<<(const T& obj);
    
    template<typename T>
    DataStream& operator>>(T& obj);

private:
    Bytes data_;
    size_t readPos_{0};
};

// ============================================================================
// Fixed-width integers
// ============================================================================

/// Unsigned integer as sizeof(T) little-endian bytes
template<typename T, typename Stream>
inline void WriteLE(Stream& s, T value) {
    uint8_t buf[sizeof(T)];
    for (size_t i = 0; i < sizeof(T); ++i) {
        buf[i] = static_cast<uint8_t>(value >> (8 * i));
    }
    s.Write(buf, sizeof(T));
}

template<typename T, typename Stream>
inline T ReadLE(Stream& s) {
    uint8_t buf[sizeof(T)];
    s.Read(buf, sizeof(T));
    T value = 0;
    for (size_t i = sizeof(T); i-- > 0;) {
        value = static_cast<T>((value << 8) | buf[i]);
    }
    return value;
}

// ============================================================================
// CompactSize Encoding
// ============================================================================
//   size <  253        -- 1 byte
//   size <= 0xFFFF     -- 3 bytes (0xFD + 2 bytes little-endian)
//   size <= 0xFFFFFFFF -- 5 bytes (0xFE + 4 bytes little-endian)

template<typename Stream>
void WriteCompactSize(Stream& s, uint64_t size) {
    if (size < 253) {
        WriteLE<uint8_t>(s, static_cast<uint8_t>(size));
    } else if (size <= 0xFFFF) {
        WriteLE<uint8_t>(s, 0xFD);
        WriteLE<uint16_t>(s, static_cast<uint16_t>(size));
    } else {
        WriteLE<uint8_t>(s, 0xFE);
        WriteLE<uint32_t>(s, static_cast<uint32_t>(size));
    }
}

template<typename Stream>
uint64_t ReadCompactSize(Stream& s) {
    uint8_t marker = ReadLE<uint8_t>(s);
    uint64_t size = 0;
    
    if (marker < 253) {
        size = marker;
    } else if (marker == 253) {
        size = ReadLE<uint16_t>(s);
        if (size < 253) {
            throw FormatError("Non-canonical CompactSize");
        }
    } else if (marker == 254) {
        size = ReadLE<uint32_t>(s);
        if (size < 0x10000) {
            throw FormatError("Non-canonical CompactSize");
        }
    } else {
        throw FormatError("CompactSize exceeds the element limit");
    }
    
    if (size > MAX_SERIALIZE_SIZE) {
        throw FormatError("CompactSize exceeds the element limit");
    }
    
    return size;
}

// ============================================================================
// Serialize/Unserialize for Basic Types
// ============================================================================

template<typename Stream>
inline void Serialize(Stream& s, uint8_t a) { WriteLE<uint8_t>(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint8_t& a) { a = ReadLE<uint8_t>(s); }

template<typename Stream>
inline void Serialize(Stream& s, uint32_t a) { WriteLE<uint32_t>(s, a); }

template<typename Stream>
inline void Serialize(Stream& s, int32_t a) { WriteLE<uint32_t>(s, static_cast<uint32_t>(a)); }

template<typename Stream>
inline void Unserialize(Stream& s, uint32_t& a) { a = ReadLE<uint32_t>(s); }

template<typename Stream>
inline void Unserialize(Stream& s, int32_t& a) { a = static_cast<int32_t>(ReadLE<uint32_t>(s)); }

template<typename Stream>
inline void Serialize(Stream& s, uint64_t a) { WriteLE<uint64_t>(s, a); }

template<typename Stream>
inline void Serialize(Stream& s, int64_t a) { WriteLE<uint64_t>(s, static_cast<uint64_t>(a)); }

template<typename Stream>
inline void Unserialize(Stream& s, uint64_t& a) { a = ReadLE<uint64_t>(s); }

template<typename Stream>
inline void Unserialize(Stream& s, int64_t& a) { a = static_cast<int64_t>(ReadLE<uint64_t>(s)); }

template<typename Stream>
inline void Serialize(Stream& s, bool a) { WriteLE<uint8_t>(s, a ? 1 : 0); }

template<typename Stream>
inline void Unserialize(Stream& s, bool& a) {
    uint8_t v = ReadLE<uint8_t>(s);
    if (v > 1) {
        throw FormatError("Invalid boolean encoding");
    }
    a = (v != 0);
}

// ============================================================================
// Serialize/Unserialize for Bytes, Strings and Hashes
// ============================================================================

template<typename Stream>
void Serialize(Stream& s, const Bytes& v) {
    WriteCompactSize(s, v.size());
    if (!v.empty()) {
        s.Write(v.data(), v.size());
    }
}

template<typename Stream>
void Unserialize(Stream& s, Bytes& v) {
    uint64_t size = ReadCompactSize(s);
    if (size > s.size()) {
        throw FormatError("Byte vector exceeds remaining data");
    }
    v.resize(size);
    if (size > 0) {
        s.Read(v.data(), size);
    }
}

template<typename Stream>
void Serialize(Stream& s, const std::string& str) {
    WriteCompactSize(s, str.size());
    if (!str.empty()) {
        s.Write(str.data(), str.size());
    }
}

template<typename Stream>
void Unserialize(Stream& s, std::string& str) {
    uint64_t size = ReadCompactSize(s);
    if (size > s.size()) {
        throw FormatError("String exceeds remaining data");
    }
    str.resize(size);
    if (size > 0) {
        s.Read(&str[0], size);
    }
}

template<typename Stream>
void Serialize(Stream& s, const Hash256& hash) {
    s.Write(hash.data(), Hash256::SIZE);
}

template<typename Stream>
void Unserialize(Stream& s, Hash256& hash) {
    s.Read(hash.data(), Hash256::SIZE);
}

// ============================================================================
// Serialize/Unserialize for Vectors
// ============================================================================

template<typename Stream, typename T>
void Serialize(Stream& s, const std::vector<T>& v) {
    WriteCompactSize(s, v.size());
    for (const auto& item : v) {
        Serialize(s, item);
    }
}

template<typename Stream, typename T>
void Unserialize(Stream& s, std::vector<T>& v) {
    uint64_t size = ReadCompactSize(s);
    v.clear();
    v.reserve(static_cast<size_t>(std::min<uint64_t>(size, 1024)));
    for (uint64_t i = 0; i < size; ++i) {
        T item;
        Unserialize(s, item);
        v.push_back(std::move(item));
    }
}

// ============================================================================
// DataStream Stream Operators Implementation
// ============================================================================

template<typename T>
DataStream& DataStream::operator<<(const T& obj) {
    Serialize(*this, obj);
    return *this;
}

template<typename T>
DataStream& DataStream::operator>>(T& obj) {
    Unserialize(*this, obj);
    return *this;
}

} // namespace decmail

#endif // DECMAIL_CORE_SERIALIZE_H
