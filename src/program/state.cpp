// LOCKBOX - LockBox Account State Implementation
// Copyright (c) 2024 LOCKBOX Developers
// MIT License

#include "lockbox/program/state.h"
#include "lockbox/core/serialize.h"
#include "lockbox/crypto/sha256.h"

#include <algorithm>
#include <iomanip>
#include <ios>
#include <sstream>

namespace lockbox {

Discriminator ComputeDiscriminator(const std::string& preimage) {
    Hash256 hash = SHA256Hash(preimage);
    Discriminator result;
    std::copy(hash.begin(), hash.begin() + result.size(), result.begin());
    return result;
}

const Discriminator& LockBoxDiscriminator() {
    static const Discriminator disc = ComputeDiscriminator("account:LockBox");
    return disc;
}

// ============================================================================
// LockBox Implementation
// ============================================================================

std::vector<Byte> LockBox::Serialize() const {
    DataStream ss;
    const Discriminator& disc = LockBoxDiscriminator();
    ss.Write(disc.data(), disc.size());
    
    lockbox::Serialize(ss, owner);
    lockbox::Serialize(ss, targetAmount);
    lockbox::Serialize(ss, depositedAmount);
    lockbox::Serialize(ss, withdrawnAmount);
    lockbox::Serialize(ss, createdAt);
    lockbox::Serialize(ss, active);
    lockbox::Serialize(ss, bump);
    lockbox::Serialize(ss, vaultBump);
    
    return ss.Data();
}

std::optional<LockBox> LockBox::Deserialize(const Byte* data, size_t len) {
    if (!data || len < SPACE) {
        return std::nullopt;
    }
    
    const Discriminator& disc = LockBoxDiscriminator();
    if (!std::equal(disc.begin(), disc.end(), data)) {
        return std::nullopt;
    }
    
    DataStream ss(data + disc.size(), SPACE - disc.size());
    LockBox box;
    try {
        Unserialize(ss, box.owner);
        Unserialize(ss, box.targetAmount);
        Unserialize(ss, box.depositedAmount);
        Unserialize(ss, box.withdrawnAmount);
        Unserialize(ss, box.createdAt);
        Unserialize(ss, box.active);
        Unserialize(ss, box.bump);
        Unserialize(ss, box.vaultBump);
    } catch (const std::ios_base::failure&) {
        return std::nullopt;
    }
    return box;
}

bool LockBox::operator==(const LockBox& other) const {
    return owner == other.owner &&
           targetAmount == other.targetAmount &&
           depositedAmount == other.depositedAmount &&
           withdrawnAmount == other.withdrawnAmount &&
           createdAt == other.createdAt &&
           active == other.active &&
           bump == other.bump &&
           vaultBump == other.vaultBump;
}

std::string LockBox::ToString() const {
    std::ostringstream ss;
    ss << "LockBox {"
       << " owner: " << owner.ToShortString()
       << ", target: " << FormatLamports(targetAmount)
       << ", deposited: " << FormatLamports(depositedAmount)
       << ", withdrawn: " << FormatLamports(withdrawnAmount)
       << ", active: " << (active ? "yes" : "no")
       << ", reached: " << (IsTargetReached() ? "yes" : "no")
       << " }";
    return ss.str();
}

std::string FormatLamports(Lamports amount) {
    std::ostringstream ss;
    ss << (amount / LAMPORTS_PER_SOL) << "."
       << std::setfill('0') << std::setw(9) << (amount % LAMPORTS_PER_SOL);
    return ss.str();
}

} // namespace lockbox
