// TALLY - Serialization Header
// Copyright (c) 2024 TALLY Developers
// MIT License
//
// Binary serialization primitives used to persist ledger records.
// Integers are little-endian; strings, maps and item lists carry a
// 4-byte length prefix.

#ifndef TALLY_CORE_SERIALIZE_H
#define TALLY_CORE_SERIALIZE_H

#include "tally/core/types.h"
#include <cstdint>
#include <cstddef>
#include <cstring>
#include <ios>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tally {

/// Largest length prefix accepted when reading (guards against corrupt data)
static constexpr uint32_t MAX_SIZE = 0x02000000;  // 32 MB

// ============================================================================
// DataStream - In-memory byte buffer for serialization
// ============================================================================

class DataStream {
public:
    DataStream() = default;

    /// Stream over a copy of previously serialized bytes
    explicit DataStream(const std::string& bytes) : data_(bytes) {}

    /// Returns unread bytes remaining
    size_t size() const noexcept { return data_.size() - read_pos_; }

    void Write(const char* src, size_t len) {
        data_.append(src, len);
    }

    void Read(char* dst, size_t len) {
        if (len > size()) {
            throw std::ios_base::failure("DataStream::Read(): end of data");
        }
        std::memcpy(dst, data_.data() + read_pos_, len);
        read_pos_ += len;
    }

    /// Everything written so far
    const std::string& str() const { return data_; }

private:
    std::string data_;
    size_t read_pos_ = 0;
};

// ============================================================================
// Fixed-width integers
// ============================================================================

template<typename Stream, typename UInt>
void WriteLE(Stream& s, UInt value) {
    char bytes[sizeof(UInt)];
    for (size_t i = 0; i < sizeof(UInt); ++i) {
        bytes[i] = static_cast<char>(value & 0xff);
        value = static_cast<UInt>(value >> 8);
    }
    s.Write(bytes, sizeof(UInt));
}

template<typename UInt, typename Stream>
UInt ReadLE(Stream& s) {
    char bytes[sizeof(UInt)];
    s.Read(bytes, sizeof(UInt));
    UInt value = 0;
    for (size_t i = sizeof(UInt); i > 0; --i) {
        value = static_cast<UInt>((value << 8) | static_cast<uint8_t>(bytes[i - 1]));
    }
    return value;
}

template<typename Stream>
void WriteLength(Stream& s, size_t size) {
    WriteLE(s, static_cast<uint32_t>(size));
}

template<typename Stream>
uint32_t ReadLength(Stream& s) {
    uint32_t size = ReadLE<uint32_t>(s);
    if (size > MAX_SIZE) {
        throw std::ios_base::failure("ReadLength(): size too large");
    }
    return size;
}

// ============================================================================
// Serialize/Unserialize for Basic Types
// ============================================================================

template<typename Stream>
inline void Serialize(Stream& s, uint8_t a) { WriteLE(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint8_t& a) { a = ReadLE<uint8_t>(s); }

template<typename Stream>
inline void Serialize(Stream& s, int32_t a) { WriteLE(s, static_cast<uint32_t>(a)); }

template<typename Stream>
inline void Unserialize(Stream& s, int32_t& a) { a = static_cast<int32_t>(ReadLE<uint32_t>(s)); }

template<typename Stream>
inline void Serialize(Stream& s, uint64_t a) { WriteLE(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint64_t& a) { a = ReadLE<uint64_t>(s); }

template<typename Stream>
inline void Serialize(Stream& s, int64_t a) { WriteLE(s, static_cast<uint64_t>(a)); }

template<typename Stream>
inline void Unserialize(Stream& s, int64_t& a) { a = static_cast<int64_t>(ReadLE<uint64_t>(s)); }

template<typename Stream>
inline void Serialize(Stream& s, bool a) { WriteLE(s, static_cast<uint8_t>(a ? 1 : 0)); }

template<typename Stream>
inline void Unserialize(Stream& s, bool& a) { a = ReadLE<uint8_t>(s) != 0; }

/// Doubles are stored by bit pattern
template<typename Stream>
inline void Serialize(Stream& s, double a) {
    uint64_t bits;
    std::memcpy(&bits, &a, sizeof(bits));
    WriteLE(s, bits);
}

template<typename Stream>
inline void Unserialize(Stream& s, double& a) {
    uint64_t bits = ReadLE<uint64_t>(s);
    std::memcpy(&a, &bits, sizeof(a));
}

template<typename Stream>
void Serialize(Stream& s, const std::string& str) {
    WriteLength(s, str.size());
    s.Write(str.data(), str.size());
}

template<typename Stream>
void Unserialize(Stream& s, std::string& str) {
    str.resize(ReadLength(s));
    if (!str.empty()) {
        s.Read(&str[0], str.size());
    }
}

// ============================================================================
// Serialize/Unserialize for Containers
// ============================================================================

/// Presence byte, then the value
template<typename Stream, typename T>
void Serialize(Stream& s, const std::optional<T>& opt) {
    Serialize(s, opt.has_value());
    if (opt) {
        Serialize(s, *opt);
    }
}

template<typename Stream, typename T>
void Unserialize(Stream& s, std::optional<T>& opt) {
    bool present = false;
    Unserialize(s, present);
    if (!present) {
        opt.reset();
        return;
    }
    T value;
    Unserialize(s, value);
    opt = std::move(value);
}

template<typename Stream>
void Serialize(Stream& s, const std::map<std::string, std::string>& m) {
    WriteLength(s, m.size());
    for (const auto& [key, value] : m) {
        Serialize(s, key);
        Serialize(s, value);
    }
}

template<typename Stream>
void Unserialize(Stream& s, std::map<std::string, std::string>& m) {
    uint32_t size = ReadLength(s);
    m.clear();
    for (uint32_t i = 0; i < size; ++i) {
        std::string key, value;
        Unserialize(s, key);
        Unserialize(s, value);
        m.emplace(std::move(key), std::move(value));
    }
}

} // namespace tally

#endif // TALLY_CORE_SERIALIZE_H
