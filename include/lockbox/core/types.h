// LOCKBOX - Core Types Header
// Copyright (c) 2024 LOCKBOX Developers
// MIT License
//
// This file defines fundamental types used throughout LOCKBOX.

#ifndef LOCKBOX_CORE_TYPES_H
#define LOCKBOX_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <algorithm>
#include <stdexcept>
#include <chrono>
#include <cstring>
#include <limits>
#include <optional>

namespace lockbox {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Native value units held by accounts
using Lamports = uint64_t;

/// Timestamp (Unix epoch seconds)
using Timestamp = int64_t;

/// Constants
constexpr Lamports LAMPORTS_PER_SOL = 1000000000ULL;
constexpr Lamports MAX_LAMPORTS = std::numeric_limits<Lamports>::max();

/// Checked addition; returns nullopt on overflow
inline std::optional<Lamports> CheckedAdd(Lamports a, Lamports b) {
    if (a > MAX_LAMPORTS - b) {
        return std::nullopt;
    }
    return a + b;
}

/// Checked subtraction; returns nullopt on underflow
inline std::optional<Lamports> CheckedSub(Lamports a, Lamports b) {
    if (b > a) {
        return std::nullopt;
    }
    return a - b;
}

// ============================================================================
// Time Functions
// ============================================================================

/// Get current Unix timestamp
inline Timestamp GetTime() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

// ============================================================================
// Hex
// ============================================================================

/// Lowercase hex of a byte range
std::string HexEncode(const Byte* data, size_t len);

inline std::string HexEncode(const std::vector<Byte>& bytes) {
    return HexEncode(bytes.data(), bytes.size());
}

/// Decode hex of either case; throws std::invalid_argument on odd length or a non-hex digit
std::vector<Byte> HexDecode(const std::string& hex);

/// Non-empty, even length, hex digits only
bool IsHex(const std::string& str);

// ============================================================================
// Hash Templates
// ============================================================================

/// Fixed-size byte string (hashes, addresses)
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;
    
    /// Default constructor - creates null hash
    BaseHash() noexcept {
        data_.fill(0);
    }
    
    /// Construct from byte array
    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept 
        : data_(data) {}
    
    /// Construct from raw bytes (zero padded when short)
    BaseHash(const Byte* data, size_t len) noexcept {
        if (len >= SIZE) {
            std::memcpy(data_.data(), data, SIZE);
        } else {
            data_.fill(0);
            if (data && len > 0) {
                std::memcpy(data_.data(), data, len);
            }
        }
    }
    
    /// Check if hash is all zeros
    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }
    
    /// Set hash to all zeros
    void SetNull() noexcept {
        data_.fill(0);
    }
    
    constexpr size_t size() const noexcept { return SIZE; }
    
    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }
    
    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }
    
    Byte* begin() noexcept { return data_.data(); }
    const Byte* begin() const noexcept { return data_.data(); }
    Byte* end() noexcept { return data_.data() + SIZE; }
    const Byte* end() const noexcept { return data_.data() + SIZE; }
    
    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }
    
    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }
    
    bool operator<(const BaseHash& other) const noexcept {
        return data_ < other.data_;
    }
    
    /// Convert to hex string (natural byte order)
    std::string ToHex() const;
    
    /// Create from hex string; throws std::invalid_argument on bad input
    static BaseHash FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

// ============================================================================
// Specific Hash Types
// ============================================================================

/// 256-bit hash (32 bytes)
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;
    Hash256() = default;
    Hash256(const BaseHash<256>& base) : BaseHash<256>(base) {}
};

/// Account address (32 bytes).
/// Key-controlled accounts use the x-coordinate of an even-Y secp256k1 key;
/// program-derived accounts use an off-curve SHA-256 output.
class Address : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;
    Address() = default;
    explicit Address(const Hash256& h) : BaseHash<256>(h.data(), SIZE) {}
    
    static Address FromHex(const std::string& hex) {
        return Address(BaseHash<256>::FromHex(hex).data(), SIZE);
    }
    
    /// Shortened form for log lines
    std::string ToShortString() const {
        return ToHex().substr(0, 8) + "..";
    }
};

} // namespace lockbox

#endif // LOCKBOX_CORE_TYPES_H
