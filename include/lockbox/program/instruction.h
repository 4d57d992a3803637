// LOCKBOX - Program Instructions
// Copyright (c) 2024 LOCKBOX Developers
// MIT License
//
// Wire encoding of the five LockBox instructions.
//
// Instruction data is an 8-byte discriminator, SHA256("global:<name>")[0..8],
// followed by a little-endian u64 argument for initialize_lockbox, deposit
// and withdraw. emergency_withdraw and close_lockbox carry no argument.

#ifndef LOCKBOX_PROGRAM_INSTRUCTION_H
#define LOCKBOX_PROGRAM_INSTRUCTION_H

#include "lockbox/core/types.h"
#include "lockbox/program/errors.h"
#include "lockbox/program/state.h"

#include <optional>
#include <string>
#include <vector>

namespace lockbox {

enum class InstructionKind : uint8_t {
    InitializeLockBox,
    Deposit,
    Withdraw,
    EmergencyWithdraw,
    CloseLockBox,
};

/// Snake-case wire name, e.g. "initialize_lockbox"
const char* InstructionKindToString(InstructionKind kind);

/// Discriminator of an instruction kind
const Discriminator& InstructionDiscriminator(InstructionKind kind);

/// Whether the instruction carries a u64 argument
bool InstructionHasAmount(InstructionKind kind);

/// Accounts every instruction names
struct InstructionAccounts {
    Address owner;
    Address lockbox;
    Address vault;
    
    bool operator==(const InstructionAccounts& other) const {
        return owner == other.owner && lockbox == other.lockbox && vault == other.vault;
    }
};

/**
 * A decoded instruction.
 */
struct Instruction {
    InstructionKind kind{InstructionKind::InitializeLockBox};
    
    /// target_amount for initialize, amount for deposit/withdraw, else 0
    uint64_t amount{0};
    
    InstructionAccounts accounts;
    
    /// Encode instruction data (discriminator plus argument)
    std::vector<Byte> EncodeData() const;
    
    /// Encode accounts followed by instruction data
    std::vector<Byte> Serialize() const;
    
    bool operator==(const Instruction& other) const {
        return kind == other.kind && amount == other.amount && accounts == other.accounts;
    }
    
    std::string ToString() const;
};

/**
 * Decode instruction data.
 * @param[out] error InvalidInstruction on unknown tag, truncation or trailing bytes
 */
std::optional<Instruction> DecodeInstructionData(const std::vector<Byte>& data,
                                                 const InstructionAccounts& accounts,
                                                 LockBoxError& error);

/// Decode the output of Instruction::Serialize
std::optional<Instruction> DeserializeInstruction(const std::vector<Byte>& data,
                                                  LockBoxError& error);

// ============================================================================
// Builders
// ============================================================================

/// Accounts for an owner, with derived lockbox and vault addresses
std::optional<InstructionAccounts> DeriveAccounts(const Address& owner, const Address& programId);

std::optional<Instruction> MakeInitialize(const Address& owner, uint64_t targetAmount,
                                          const Address& programId);
std::optional<Instruction> MakeDeposit(const Address& owner, uint64_t amount,
                                       const Address& programId);
std::optional<Instruction> MakeWithdraw(const Address& owner, uint64_t amount,
                                        const Address& programId);
std::optional<Instruction> MakeEmergencyWithdraw(const Address& owner, const Address& programId);
std::optional<Instruction> MakeClose(const Address& owner, const Address& programId);

} // namespace lockbox

#endif // LOCKBOX_PROGRAM_INSTRUCTION_H
