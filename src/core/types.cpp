// LOCKBOX - Core Types Implementation
// Copyright (c) 2024 LOCKBOX Developers
// MIT License

#include "lockbox/core/types.h"

namespace lockbox {

namespace {

/// Value of a hex digit, or -1
int DigitValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    char lower = static_cast<char>(c | 0x20);
    if (lower >= 'a' && lower <= 'f') return lower - 'a' + 10;
    return -1;
}

} // anonymous namespace

// ============================================================================
// Hex
// ============================================================================

std::string HexEncode(const Byte* data, size_t len) {
    static const char DIGITS[] = "0123456789abcdef";
    std::string out(len * 2, '0');
    for (size_t i = 0; i < len; ++i) {
        out[2 * i] = DIGITS[data[i] >> 4];
        out[2 * i + 1] = DIGITS[data[i] & 0x0f];
    }
    return out;
}

std::vector<Byte> HexDecode(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("hex string has odd length");
    }
    std::vector<Byte> out(hex.size() / 2);
    for (size_t i = 0; i < out.size(); ++i) {
        int hi = DigitValue(hex[2 * i]);
        int lo = DigitValue(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("non-hex digit at offset " + std::to_string(2 * i));
        }
        out[i] = static_cast<Byte>((hi << 4) | lo);
    }
    return out;
}

bool IsHex(const std::string& str) {
    return !str.empty() && str.size() % 2 == 0 &&
           std::all_of(str.begin(), str.end(), [](char c) { return DigitValue(c) >= 0; });
}

// ============================================================================
// BaseHash
// ============================================================================

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    return HexEncode(data_.data(), SIZE);
}

template<size_t BITS>
BaseHash<BITS> BaseHash<BITS>::FromHex(const std::string& hex) {
    if (hex.size() != SIZE * 2) {
        throw std::invalid_argument("expected " + std::to_string(SIZE * 2) + " hex digits");
    }
    std::vector<Byte> bytes = HexDecode(hex);
    return BaseHash(bytes.data(), bytes.size());
}

template class BaseHash<256>;

} // namespace lockbox
