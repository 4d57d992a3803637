// LOCKBOX - Key Management
// Copyright (c) 2024 LOCKBOX Developers
// MIT License
//
// secp256k1 keys used to authenticate callers.
//
// Keys are normalised so that the public point always has an even Y
// coordinate. A party's Address is then the 32-byte X coordinate, and every
// Address that is a valid X coordinate belongs to exactly one private key.
// Program-derived addresses are chosen off the curve, so no key can sign
// for them.

#ifndef LOCKBOX_CRYPTO_KEYS_H
#define LOCKBOX_CRYPTO_KEYS_H

#include "lockbox/core/types.h"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lockbox {

namespace secp256k1 {
    constexpr size_t PRIVATE_KEY_SIZE = 32;
    constexpr size_t COMPRESSED_PUBKEY_SIZE = 33;
    constexpr uint8_t EVEN_Y_PREFIX = 0x02;
}

/// Check whether 32 bytes are the X coordinate of a secp256k1 point
bool IsOnCurve(const Address& x);

// ============================================================================
// PublicKey
// ============================================================================

/**
 * A compressed secp256k1 public key with even Y.
 */
class PublicKey {
public:
    static constexpr size_t SIZE = secp256k1::COMPRESSED_PUBKEY_SIZE;
    
    /// Default constructor - invalid/empty key
    PublicKey() { data_.fill(0); }
    
    /// Construct from raw compressed bytes (33)
    PublicKey(const uint8_t* data, size_t len);
    
    explicit PublicKey(const std::vector<uint8_t>& data)
        : PublicKey(data.data(), data.size()) {}
    
    /// Rebuild the key that owns an address; nullopt for off-curve addresses
    static std::optional<PublicKey> FromAddress(const Address& address);
    
    /// Check that the key is a well-formed even-Y point on the curve
    bool IsValid() const;
    
    const uint8_t* data() const { return data_.data(); }
    constexpr size_t size() const { return SIZE; }
    
    std::vector<uint8_t> ToVector() const {
        return std::vector<uint8_t>(data_.begin(), data_.end());
    }
    
    /// Address controlled by this key (the X coordinate)
    Address GetAddress() const;
    
    /// Verify a DER-encoded ECDSA signature over a 32-byte hash
    bool Verify(const Hash256& hash, const std::vector<uint8_t>& signature) const;
    
    bool operator==(const PublicKey& other) const { return data_ == other.data_; }
    bool operator!=(const PublicKey& other) const { return !(*this == other); }
    
    std::string ToHex() const;
    static std::optional<PublicKey> FromHex(const std::string& hex);

private:
    std::array<uint8_t, SIZE> data_;
};

// ============================================================================
// PrivateKey
// ============================================================================

/**
 * A secp256k1 private key.
 * 
 * Always exactly 32 bytes in the range [1, n-1]. On construction the scalar
 * is negated when needed so that its public point has an even Y.
 */
class PrivateKey {
public:
    static constexpr size_t SIZE = secp256k1::PRIVATE_KEY_SIZE;
    
    /// Default constructor - invalid key
    PrivateKey() { data_.fill(0); }
    
    /// Construct from 32 raw bytes
    explicit PrivateKey(const uint8_t* data);
    
    explicit PrivateKey(const std::vector<uint8_t>& data);
    
    ~PrivateKey();
    
    PrivateKey(const PrivateKey&) = default;
    PrivateKey& operator=(const PrivateKey&) = default;
    
    /// Generate a fresh random key
    static PrivateKey Generate();
    
    bool IsValid() const { return valid_; }
    
    const uint8_t* data() const { return data_.data(); }
    
    /// Public key (even Y)
    PublicKey GetPublicKey() const { return publicKey_; }
    
    /// Shortcut for GetPublicKey().GetAddress()
    Address GetAddress() const { return publicKey_.GetAddress(); }
    
    /// Sign a 32-byte hash (DER-encoded ECDSA); empty on failure
    std::vector<uint8_t> Sign(const Hash256& hash) const;
    
    std::string ToHex() const;
    static std::optional<PrivateKey> FromHex(const std::string& hex);

private:
    /// Validate range, normalise to even Y and cache the public key
    void Load(const uint8_t* data);
    
    std::array<uint8_t, SIZE> data_;
    PublicKey publicKey_;
    bool valid_{false};
};

} // namespace lockbox

#endif // LOCKBOX_CRYPTO_KEYS_H
