// LOCKBOX - Program Instructions Implementation
// Copyright (c) 2024 LOCKBOX Developers
// MIT License

#include "lockbox/program/instruction.h"
#include "lockbox/core/serialize.h"
#include "lockbox/program/pda.h"

#include <algorithm>
#include <array>
#include <sstream>

namespace lockbox {

namespace {

constexpr size_t NUM_INSTRUCTIONS = 5;

const std::array<InstructionKind, NUM_INSTRUCTIONS> ALL_KINDS = {{
    InstructionKind::InitializeLockBox,
    InstructionKind::Deposit,
    InstructionKind::Withdraw,
    InstructionKind::EmergencyWithdraw,
    InstructionKind::CloseLockBox,
}};

const std::array<Discriminator, NUM_INSTRUCTIONS>& AllDiscriminators() {
    static const std::array<Discriminator, NUM_INSTRUCTIONS> discs = [] {
        std::array<Discriminator, NUM_INSTRUCTIONS> out;
        for (size_t i = 0; i < NUM_INSTRUCTIONS; ++i) {
            out[i] = ComputeDiscriminator(std::string("global:") +
                                          InstructionKindToString(ALL_KINDS[i]));
        }
        return out;
    }();
    return discs;
}

std::optional<Instruction> Make(InstructionKind kind, const Address& owner, uint64_t amount,
                                const Address& programId) {
    auto accounts = DeriveAccounts(owner, programId);
    if (!accounts) {
        return std::nullopt;
    }
    Instruction ix;
    ix.kind = kind;
    ix.amount = amount;
    ix.accounts = *accounts;
    return ix;
}

} // anonymous namespace

const char* InstructionKindToString(InstructionKind kind) {
    switch (kind) {
        case InstructionKind::InitializeLockBox: return "initialize_lockbox";
        case InstructionKind::Deposit: return "deposit";
        case InstructionKind::Withdraw: return "withdraw";
        case InstructionKind::EmergencyWithdraw: return "emergency_withdraw";
        case InstructionKind::CloseLockBox: return "close_lockbox";
        default: return "unknown";
    }
}

const Discriminator& InstructionDiscriminator(InstructionKind kind) {
    return AllDiscriminators()[static_cast<size_t>(kind)];
}

bool InstructionHasAmount(InstructionKind kind) {
    return kind == InstructionKind::InitializeLockBox ||
           kind == InstructionKind::Deposit ||
           kind == InstructionKind::Withdraw;
}

// ============================================================================
// Instruction
// ============================================================================

std::vector<Byte> Instruction::EncodeData() const {
    DataStream ss;
    const Discriminator& disc = InstructionDiscriminator(kind);
    ss.Write(disc.data(), disc.size());
    if (InstructionHasAmount(kind)) {
        ser_writedata64(ss, amount);
    }
    return ss.Data();
}

std::vector<Byte> Instruction::Serialize() const {
    DataStream ss;
    lockbox::Serialize(ss, accounts.owner);
    lockbox::Serialize(ss, accounts.lockbox);
    lockbox::Serialize(ss, accounts.vault);
    WriteBytes(ss, EncodeData());
    return ss.Data();
}

std::string Instruction::ToString() const {
    std::ostringstream ss;
    ss << InstructionKindToString(kind);
    if (InstructionHasAmount(kind)) {
        ss << "(" << amount << ")";
    }
    ss << " owner=" << accounts.owner.ToShortString()
       << " lockbox=" << accounts.lockbox.ToShortString()
       << " vault=" << accounts.vault.ToShortString();
    return ss.str();
}

// ============================================================================
// Decoding
// ============================================================================

std::optional<Instruction> DecodeInstructionData(const std::vector<Byte>& data,
                                                 const InstructionAccounts& accounts,
                                                 LockBoxError& error) {
    error = LockBoxError::InvalidInstruction;
    
    DataStream ss(data);
    Discriminator disc;
    Instruction ix;
    ix.accounts = accounts;
    
    try {
        ss.Read(disc.data(), disc.size());
        
        const auto& known = AllDiscriminators();
        auto it = std::find(known.begin(), known.end(), disc);
        if (it == known.end()) {
            return std::nullopt;
        }
        ix.kind = ALL_KINDS[static_cast<size_t>(it - known.begin())];
        
        if (InstructionHasAmount(ix.kind)) {
            ix.amount = ser_readdata64(ss);
        }
    } catch (const std::ios_base::failure&) {
        return std::nullopt;
    }
    
    if (!ss.AtEnd()) {
        return std::nullopt;
    }
    
    error = LockBoxError::OK;
    return ix;
}

std::optional<Instruction> DeserializeInstruction(const std::vector<Byte>& data,
                                                  LockBoxError& error) {
    error = LockBoxError::InvalidInstruction;
    
    DataStream ss(data);
    InstructionAccounts accounts;
    std::vector<Byte> ixData;
    try {
        Unserialize(ss, accounts.owner);
        Unserialize(ss, accounts.lockbox);
        Unserialize(ss, accounts.vault);
        ixData = ReadBytes(ss);
    } catch (const std::ios_base::failure&) {
        return std::nullopt;
    }
    if (!ss.AtEnd()) {
        return std::nullopt;
    }
    return DecodeInstructionData(ixData, accounts, error);
}

// ============================================================================
// Builders
// ============================================================================

std::optional<InstructionAccounts> DeriveAccounts(const Address& owner, const Address& programId) {
    auto lockbox = DeriveLockBoxAddress(owner, programId);
    if (!lockbox) {
        return std::nullopt;
    }
    auto vault = DeriveVaultAddress(lockbox->first, programId);
    if (!vault) {
        return std::nullopt;
    }
    
    InstructionAccounts accounts;
    accounts.owner = owner;
    accounts.lockbox = lockbox->first;
    accounts.vault = vault->first;
    return accounts;
}

std::optional<Instruction> MakeInitialize(const Address& owner, uint64_t targetAmount,
                                          const Address& programId) {
    return Make(InstructionKind::InitializeLockBox, owner, targetAmount, programId);
}

std::optional<Instruction> MakeDeposit(const Address& owner, uint64_t amount,
                                       const Address& programId) {
    return Make(InstructionKind::Deposit, owner, amount, programId);
}

std::optional<Instruction> MakeWithdraw(const Address& owner, uint64_t amount,
                                        const Address& programId) {
    return Make(InstructionKind::Withdraw, owner, amount, programId);
}

std::optional<Instruction> MakeEmergencyWithdraw(const Address& owner, const Address& programId) {
    return Make(InstructionKind::EmergencyWithdraw, owner, 0, programId);
}

std::optional<Instruction> MakeClose(const Address& owner, const Address& programId) {
    return Make(InstructionKind::CloseLockBox, owner, 0, programId);
}

} // namespace lockbox
