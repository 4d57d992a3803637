// LOCKBOX - SHA256 Implementation
// Copyright (c) 2024 LOCKBOX Developers
// MIT License

#include "lockbox/crypto/sha256.h"

#include <stdexcept>

#include <openssl/evp.h>

namespace lockbox {

struct SHA256::Impl {
    EVP_MD_CTX* ctx{nullptr};
    
    Impl() {
        ctx = EVP_MD_CTX_new();
        if (!ctx) {
            throw std::runtime_error("EVP_MD_CTX_new failed");
        }
    }
    
    ~Impl() {
        EVP_MD_CTX_free(ctx);
    }
    
    void Init() {
        if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
            throw std::runtime_error("EVP_DigestInit_ex failed");
        }
    }
};

SHA256::SHA256() : impl_(std::make_unique<Impl>()) {
    impl_->Init();
}

SHA256::~SHA256() = default;

SHA256& SHA256::Write(const Byte* data, size_t len) {
    if (len == 0) {
        return *this;
    }
    if (EVP_DigestUpdate(impl_->ctx, data, len) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
    return *this;
}

void SHA256::Finalize(Byte hash[OUTPUT_SIZE]) {
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(impl_->ctx, hash, &len) != 1 || len != OUTPUT_SIZE) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    // Leave the context ready for reuse
    impl_->Init();
}

SHA256& SHA256::Reset() {
    impl_->Init();
    return *this;
}

Hash256 SHA256Hash(const Byte* data, size_t len) {
    Hash256 result;
    SHA256 hasher;
    hasher.Write(data, len);
    hasher.Finalize(result.data());
    return result;
}

} // namespace lockbox
