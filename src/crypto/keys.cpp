// LOCKBOX - Key Management Implementation
// Copyright (c) 2024 LOCKBOX Developers
// MIT License

#include "lockbox/crypto/keys.h"

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/err.h>
#include <openssl/obj_mac.h>
#include <openssl/rand.h>
#include <openssl/crypto.h>

#include <cstring>
#include <stdexcept>

namespace lockbox {

namespace {

/// Decode a compressed point; false if it is not on the curve
bool DecodePoint(const uint8_t* data, size_t len) {
    EC_GROUP* group = EC_GROUP_new_by_curve_name(NID_secp256k1);
    if (!group) return false;
    
    EC_POINT* point = EC_POINT_new(group);
    if (!point) { EC_GROUP_free(group); return false; }
    
    int ok = EC_POINT_oct2point(group, point, data, len, nullptr);
    // A failed decode leaves an entry on the thread's error queue
    if (ok != 1) ERR_clear_error();
    
    EC_POINT_free(point);
    EC_GROUP_free(group);
    return ok == 1;
}

/**
 * Check the scalar range, negate it if its point has odd Y and write the
 * compressed public key. Returns false for 0 or values >= n.
 */
bool NormaliseKey(uint8_t* priv32, uint8_t* pub33) {
    EC_GROUP* group = EC_GROUP_new_by_curve_name(NID_secp256k1);
    if (!group) return false;
    
    BN_CTX* ctx = BN_CTX_new();
    BIGNUM* d = BN_bin2bn(priv32, 32, nullptr);
    EC_POINT* pub = EC_POINT_new(group);
    if (!ctx || !d || !pub) {
        EC_POINT_free(pub); BN_free(d); BN_CTX_free(ctx); EC_GROUP_free(group);
        return false;
    }
    
    const BIGNUM* order = EC_GROUP_get0_order(group);
    bool ok = !BN_is_zero(d) && BN_cmp(d, order) < 0;
    
    if (ok) {
        ok = EC_POINT_mul(group, pub, d, nullptr, nullptr, ctx) == 1 &&
             EC_POINT_point2oct(group, pub, POINT_CONVERSION_COMPRESSED,
                                pub33, 33, ctx) == 33;
    }
    
    if (ok && pub33[0] != secp256k1::EVEN_Y_PREFIX) {
        // -P has the same X and the opposite Y parity
        ok = BN_sub(d, order, d) == 1 && BN_bn2binpad(d, priv32, 32) == 32;
        pub33[0] = secp256k1::EVEN_Y_PREFIX;
    }
    
    EC_POINT_free(pub);
    BN_clear_free(d);
    BN_CTX_free(ctx);
    EC_GROUP_free(group);
    return ok;
}

} // anonymous namespace

bool IsOnCurve(const Address& x) {
    uint8_t buf[secp256k1::COMPRESSED_PUBKEY_SIZE];
    buf[0] = secp256k1::EVEN_Y_PREFIX;
    std::memcpy(buf + 1, x.data(), 32);
    return DecodePoint(buf, sizeof(buf));
}

// ============================================================================
// PublicKey
// ============================================================================

PublicKey::PublicKey(const uint8_t* data, size_t len) {
    data_.fill(0);
    if (data && len == SIZE) {
        std::memcpy(data_.data(), data, SIZE);
    }
}

std::optional<PublicKey> PublicKey::FromAddress(const Address& address) {
    PublicKey key;
    key.data_[0] = secp256k1::EVEN_Y_PREFIX;
    std::memcpy(key.data_.data() + 1, address.data(), 32);
    if (!key.IsValid()) {
        return std::nullopt;
    }
    return key;
}

bool PublicKey::IsValid() const {
    if (data_[0] != secp256k1::EVEN_Y_PREFIX) return false;
    return DecodePoint(data_.data(), SIZE);
}

Address PublicKey::GetAddress() const {
    return Address(data_.data() + 1, 32);
}

bool PublicKey::Verify(const Hash256& hash, const std::vector<uint8_t>& signature) const {
    if (signature.empty()) return false;
    
    EC_KEY* key = EC_KEY_new_by_curve_name(NID_secp256k1);
    if (!key) return false;
    
    EC_POINT* pub = EC_POINT_new(EC_KEY_get0_group(key));
    if (!pub) { EC_KEY_free(key); return false; }
    
    if (EC_POINT_oct2point(EC_KEY_get0_group(key), pub, data_.data(), SIZE, nullptr) != 1 ||
        EC_KEY_set_public_key(key, pub) != 1) {
        ERR_clear_error();
        EC_POINT_free(pub); EC_KEY_free(key); return false;
    }
    
    const uint8_t* sigPtr = signature.data();
    ECDSA_SIG* sig = d2i_ECDSA_SIG(nullptr, &sigPtr, static_cast<long>(signature.size()));
    if (!sig) {
        ERR_clear_error();
        EC_POINT_free(pub); EC_KEY_free(key); return false;
    }
    
    int result = ECDSA_do_verify(hash.data(), 32, sig, key);
    if (result != 1) ERR_clear_error();
    
    ECDSA_SIG_free(sig);
    EC_POINT_free(pub);
    EC_KEY_free(key);
    return result == 1;
}

std::string PublicKey::ToHex() const {
    return HexEncode(data_.data(), data_.size());
}

std::optional<PublicKey> PublicKey::FromHex(const std::string& hex) {
    if (!IsHex(hex) || hex.size() != SIZE * 2) {
        return std::nullopt;
    }
    PublicKey key(HexDecode(hex));
    if (!key.IsValid()) {
        return std::nullopt;
    }
    return key;
}

// ============================================================================
// PrivateKey
// ============================================================================

PrivateKey::PrivateKey(const uint8_t* data) {
    data_.fill(0);
    if (data) {
        Load(data);
    }
}

PrivateKey::PrivateKey(const std::vector<uint8_t>& data) {
    data_.fill(0);
    if (data.size() == SIZE) {
        Load(data.data());
    }
}

PrivateKey::~PrivateKey() {
    OPENSSL_cleanse(data_.data(), data_.size());
}

void PrivateKey::Load(const uint8_t* data) {
    uint8_t priv[SIZE];
    uint8_t pub[PublicKey::SIZE];
    std::memcpy(priv, data, SIZE);
    
    valid_ = NormaliseKey(priv, pub);
    if (valid_) {
        std::memcpy(data_.data(), priv, SIZE);
        publicKey_ = PublicKey(pub, sizeof(pub));
    } else {
        data_.fill(0);
        publicKey_ = PublicKey();
    }
    OPENSSL_cleanse(priv, sizeof(priv));
}

PrivateKey PrivateKey::Generate() {
    uint8_t buf[SIZE];
    // Out-of-range draws are astronomically rare; retry until one loads
    for (int attempt = 0; attempt < 16; ++attempt) {
        if (RAND_bytes(buf, SIZE) != 1) {
            throw std::runtime_error("RAND_bytes failed");
        }
        PrivateKey key(buf);
        if (key.IsValid()) {
            OPENSSL_cleanse(buf, sizeof(buf));
            return key;
        }
    }
    OPENSSL_cleanse(buf, sizeof(buf));
    throw std::runtime_error("Failed to generate private key");
}

std::vector<uint8_t> PrivateKey::Sign(const Hash256& hash) const {
    if (!valid_) return {};
    
    EC_KEY* key = EC_KEY_new_by_curve_name(NID_secp256k1);
    if (!key) return {};
    
    BIGNUM* priv = BN_bin2bn(data_.data(), SIZE, nullptr);
    if (!priv) { EC_KEY_free(key); return {}; }
    
    const EC_GROUP* group = EC_KEY_get0_group(key);
    EC_POINT* pub = EC_POINT_new(group);
    if (!pub || EC_KEY_set_private_key(key, priv) != 1 ||
        EC_POINT_mul(group, pub, priv, nullptr, nullptr, nullptr) != 1 ||
        EC_KEY_set_public_key(key, pub) != 1) {
        EC_POINT_free(pub); BN_clear_free(priv); EC_KEY_free(key); return {};
    }
    EC_POINT_free(pub);

    ECDSA_SIG* sig = ECDSA_do_sign(hash.data(), 32, key);
    if (!sig) {
        BN_clear_free(priv); EC_KEY_free(key); return {};
    }
    
    std::vector<uint8_t> out;
    int len = i2d_ECDSA_SIG(sig, nullptr);
    if (len > 0) {
        out.resize(static_cast<size_t>(len));
        uint8_t* p = out.data();
        len = i2d_ECDSA_SIG(sig, &p);
        out.resize(len > 0 ? static_cast<size_t>(len) : 0);
    }
    
    ECDSA_SIG_free(sig);
    BN_clear_free(priv);
    EC_KEY_free(key);
    return out;
}

std::string PrivateKey::ToHex() const {
    return HexEncode(data_.data(), data_.size());
}

std::optional<PrivateKey> PrivateKey::FromHex(const std::string& hex) {
    if (!IsHex(hex) || hex.size() != SIZE * 2) {
        return std::nullopt;
    }
    std::vector<uint8_t> bytes = HexDecode(hex);
    PrivateKey key(bytes);
    OPENSSL_cleanse(bytes.data(), bytes.size());
    if (!key.IsValid()) {
        return std::nullopt;
    }
    return key;
}

} // namespace lockbox
