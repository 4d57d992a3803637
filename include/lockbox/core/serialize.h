// LOCKBOX - Serialization Header
// Copyright (c) 2024 LOCKBOX Developers
// MIT License
//
// Little-endian encoding for account records, instruction payloads and
// transaction messages. Every multi-byte integer is written least
// significant byte first regardless of host order.

#ifndef LOCKBOX_CORE_SERIALIZE_H
#define LOCKBOX_CORE_SERIALIZE_H

#include "lockbox/core/types.h"
#include <cstdint>
#include <cstddef>
#include <cstring>
#include <vector>
#include <ios>

namespace lockbox {

/// Largest length prefix ReadBytes accepts (1 MiB; account data is far smaller)
constexpr uint32_t MAX_BYTES_FIELD = 1u << 20;

// ============================================================================
// DataStream
// ============================================================================

/**
 * Append-only write buffer with a read cursor.
 *
 * Reads consume from the front; reading past the end throws
 * std::ios_base::failure, which record and instruction decoders turn into
 * a LockBoxError.
 */
class DataStream {
public:
    DataStream() = default;
    explicit DataStream(std::vector<Byte> bytes) : buf_(std::move(bytes)) {}
    DataStream(const Byte* data, size_t len) : buf_(data, data + len) {}

    void Write(const Byte* src, size_t len) {
        buf_.insert(buf_.end(), src, src + len);
    }

    void Write(const char* src, size_t len) {
        Write(reinterpret_cast<const Byte*>(src), len);
    }

    void Read(Byte* dst, size_t len) {
        if (len > Remaining()) {
            throw std::ios_base::failure("DataStream: read past end");
        }
        std::memcpy(dst, buf_.data() + pos_, len);
        pos_ += len;
    }

    /// Bytes not yet read
    size_t Remaining() const { return buf_.size() - pos_; }
    bool AtEnd() const { return pos_ == buf_.size(); }

    /// Everything written, read or not
    const std::vector<Byte>& Data() const { return buf_; }

private:
    std::vector<Byte> buf_;
    size_t pos_ = 0;
};

// ============================================================================
// Fixed-width integers
// ============================================================================

namespace detail {

template<typename T, typename Stream>
void WriteLE(Stream& s, T value) {
    Byte buf[sizeof(T)];
    for (size_t i = 0; i < sizeof(T); ++i) {
        buf[i] = static_cast<Byte>(value >> (8 * i));
    }
    s.Write(buf, sizeof(T));
}

template<typename T, typename Stream>
T ReadLE(Stream& s) {
    Byte buf[sizeof(T)];
    s.Read(buf, sizeof(T));
    T value = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        value |= static_cast<T>(static_cast<T>(buf[i]) << (8 * i));
    }
    return value;
}

} // namespace detail

template<typename Stream>
inline void ser_writedata8(Stream& s, uint8_t v) { s.Write(&v, 1); }

template<typename Stream>
inline void ser_writedata32(Stream& s, uint32_t v) { detail::WriteLE(s, v); }

template<typename Stream>
inline void ser_writedata64(Stream& s, uint64_t v) { detail::WriteLE(s, v); }

template<typename Stream>
inline uint8_t ser_readdata8(Stream& s) {
    uint8_t v;
    s.Read(&v, 1);
    return v;
}

template<typename Stream>
inline uint32_t ser_readdata32(Stream& s) { return detail::ReadLE<uint32_t>(s); }

template<typename Stream>
inline uint64_t ser_readdata64(Stream& s) { return detail::ReadLE<uint64_t>(s); }

// ============================================================================
// Byte strings (u32 length prefix)
// ============================================================================

template<typename Stream>
void WriteBytes(Stream& s, const std::vector<Byte>& bytes) {
    ser_writedata32(s, static_cast<uint32_t>(bytes.size()));
    s.Write(bytes.data(), bytes.size());
}

template<typename Stream>
std::vector<Byte> ReadBytes(Stream& s) {
    uint32_t len = ser_readdata32(s);
    if (len > MAX_BYTES_FIELD || len > s.Remaining()) {
        throw std::ios_base::failure("ReadBytes: bad length prefix");
    }
    std::vector<Byte> bytes(len);
    s.Read(bytes.data(), len);
    return bytes;
}

// ============================================================================
// Record fields
// ============================================================================

template<typename Stream>
inline void Serialize(Stream& s, uint8_t v) { ser_writedata8(s, v); }

template<typename Stream>
inline void Unserialize(Stream& s, uint8_t& v) { v = ser_readdata8(s); }

template<typename Stream>
inline void Serialize(Stream& s, uint64_t v) { ser_writedata64(s, v); }

template<typename Stream>
inline void Unserialize(Stream& s, uint64_t& v) { v = ser_readdata64(s); }

template<typename Stream>
inline void Serialize(Stream& s, int64_t v) { ser_writedata64(s, static_cast<uint64_t>(v)); }

template<typename Stream>
inline void Unserialize(Stream& s, int64_t& v) { v = static_cast<int64_t>(ser_readdata64(s)); }

/// One byte, 0 or 1; anything else is corrupt
template<typename Stream>
inline void Serialize(Stream& s, bool v) { ser_writedata8(s, v ? 1 : 0); }

template<typename Stream>
inline void Unserialize(Stream& s, bool& v) {
    uint8_t raw = ser_readdata8(s);
    if (raw > 1) {
        throw std::ios_base::failure("Unserialize: bool out of range");
    }
    v = raw == 1;
}

/// Addresses and hashes are raw bytes, no prefix
template<typename Stream, size_t BITS>
inline void Serialize(Stream& s, const BaseHash<BITS>& h) { s.Write(h.data(), h.size()); }

template<typename Stream, size_t BITS>
inline void Unserialize(Stream& s, BaseHash<BITS>& h) { s.Read(h.data(), h.size()); }

} // namespace lockbox

#endif // LOCKBOX_CORE_SERIALIZE_H
