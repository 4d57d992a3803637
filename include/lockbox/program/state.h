// LOCKBOX - LockBox Account State
// Copyright (c) 2024 LOCKBOX Developers
// MIT License
//
// The persistent LockBox record and its on-ledger layout.

#ifndef LOCKBOX_PROGRAM_STATE_H
#define LOCKBOX_PROGRAM_STATE_H

#include "lockbox/core/types.h"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lockbox {

// ============================================================================
// Discriminators
// ============================================================================

/// 8-byte type tag prefixed to account data and instruction data
using Discriminator = std::array<Byte, 8>;

/// First 8 bytes of SHA256(preimage)
Discriminator ComputeDiscriminator(const std::string& preimage);

/// Tag of LockBox account data: SHA256("account:LockBox")[0..8]
const Discriminator& LockBoxDiscriminator();

// ============================================================================
// LockBox
// ============================================================================

/**
 * Custody record tracking an owner's progress toward a savings target.
 * 
 * deposited_amount is the total ever deposited and withdrawn_amount the
 * total taken by target-gated withdrawals, so that
 * deposited_amount - withdrawn_amount equals the live Vault balance after
 * every successful operation. Emergency withdrawal resets both to zero.
 */
struct LockBox {
    /// Serialized size including the discriminator
    static constexpr size_t SPACE = 8 + 32 + 8 + 8 + 8 + 8 + 1 + 1 + 1;
    
    /// Controlling party, fixed at creation
    Address owner;
    
    /// Declared goal, fixed at creation
    Lamports targetAmount{0};
    
    /// Sum of all successful deposits
    Lamports depositedAmount{0};
    
    /// Sum of all target-gated withdrawals
    Lamports withdrawnAmount{0};
    
    /// Host clock at initialize
    Timestamp createdAt{0};
    
    /// False once emergency withdrawal has run
    bool active{false};
    
    /// Canonical bump of the LockBox address
    uint8_t bump{0};
    
    /// Canonical bump of the Vault address
    uint8_t vaultBump{0};
    
    /// deposited_amount >= target_amount
    bool IsTargetReached() const { return depositedAmount >= targetAmount; }
    
    /// Amount still needed to reach the target (0 once reached)
    Lamports RemainingToTarget() const {
        return IsTargetReached() ? 0 : targetAmount - depositedAmount;
    }
    
    /// Vault balance implied by the bookkeeping
    Lamports ExpectedVaultBalance() const {
        return depositedAmount >= withdrawnAmount ? depositedAmount - withdrawnAmount : 0;
    }
    
    /// Encode with discriminator, exactly SPACE bytes
    std::vector<Byte> Serialize() const;
    
    /// Decode; nullopt on a short buffer, wrong tag or malformed field
    static std::optional<LockBox> Deserialize(const Byte* data, size_t len);
    
    static std::optional<LockBox> Deserialize(const std::vector<Byte>& data) {
        return Deserialize(data.data(), data.size());
    }
    
    bool operator==(const LockBox& other) const;
    bool operator!=(const LockBox& other) const { return !(*this == other); }
    
    std::string ToString() const;
};

/// Format lamports as SOL with nine decimals, e.g. "1.500000000"
std::string FormatLamports(Lamports amount);

} // namespace lockbox

#endif // LOCKBOX_PROGRAM_STATE_H
