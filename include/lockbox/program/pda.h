// LOCKBOX - Program Derived Addresses
// Copyright (c) 2024 LOCKBOX Developers
// MIT License
//
// Deterministic, key-less account addresses.
//
// A derived address is SHA256(seed_0 || ... || seed_n || program_id ||
// "ProgramDerivedAddress") that does not lie on the secp256k1 curve. The
// canonical bump is the largest value in [0, 255] that, appended as a final
// one-byte seed, yields such an address.

#ifndef LOCKBOX_PROGRAM_PDA_H
#define LOCKBOX_PROGRAM_PDA_H

#include "lockbox/core/types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace lockbox {

// ============================================================================
// Constants
// ============================================================================

constexpr size_t MAX_SEEDS = 16;
constexpr size_t MAX_SEED_LEN = 32;

/// Seed prefix of the LockBox record address
extern const char* const LOCKBOX_SEED;

/// Seed prefix of the Vault address
extern const char* const VAULT_SEED;

/// Domain marker appended after the program id
extern const char* const PDA_MARKER;

using Seed = std::vector<Byte>;
using Seeds = std::vector<Seed>;

/// Seed from a string literal
Seed MakeSeed(const std::string& str);

/// Seed from an address
Seed MakeSeed(const Address& address);

/// Program id used when none is configured
Address DefaultProgramId();

// ============================================================================
// Derivation
// ============================================================================

/**
 * Hash the seeds into an address owned by programId.
 * @return nullopt if the seeds are too many or too long, or if the
 *         result is a valid curve point.
 */
std::optional<Address> CreateProgramAddress(const Seeds& seeds, const Address& programId);

/**
 * Search bumps 255..0 for the first off-curve address.
 * @return the address and canonical bump, or nullopt if none exists.
 */
std::optional<std::pair<Address, uint8_t>> FindProgramAddress(const Seeds& seeds,
                                                              const Address& programId);

/// Seeds ["lockbox", owner]
Seeds LockBoxSeeds(const Address& owner);

/// Seeds ["vault", lockbox]
Seeds VaultSeeds(const Address& lockbox);

/// Seeds with the bump appended, as passed to a signed transfer
Seeds WithBump(Seeds seeds, uint8_t bump);

std::optional<std::pair<Address, uint8_t>> DeriveLockBoxAddress(const Address& owner,
                                                                const Address& programId);

std::optional<std::pair<Address, uint8_t>> DeriveVaultAddress(const Address& lockbox,
                                                              const Address& programId);

} // namespace lockbox

#endif // LOCKBOX_PROGRAM_PDA_H
