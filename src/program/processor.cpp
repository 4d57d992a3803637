// LOCKBOX - Program Processor Implementation
// Copyright (c) 2024 LOCKBOX Developers
// MIT License

#include "lockbox/program/processor.h"
#include "lockbox/program/pda.h"

#include <sstream>

namespace lockbox {

LockBoxProgram::LockBoxProgram(const Address& programId)
    : programId_(programId) {}

// ============================================================================
// Dispatch
// ============================================================================

LockBoxError LockBoxProgram::Process(Host& host, const Address& signer,
                                     const Instruction& ix) const {
    switch (ix.kind) {
        case InstructionKind::InitializeLockBox:
            return InitializeLockBox(host, signer, ix.accounts, ix.amount);
        case InstructionKind::Deposit:
            return Deposit(host, signer, ix.accounts, ix.amount);
        case InstructionKind::Withdraw:
            return Withdraw(host, signer, ix.accounts, ix.amount);
        case InstructionKind::EmergencyWithdraw:
            return EmergencyWithdraw(host, signer, ix.accounts);
        case InstructionKind::CloseLockBox:
            return CloseLockBox(host, signer, ix.accounts);
    }
    return LockBoxError::InvalidInstruction;
}

LockBoxError LockBoxProgram::ProcessRaw(Host& host, const Address& signer,
                                        const InstructionAccounts& accounts,
                                        const std::vector<Byte>& data) const {
    LockBoxError error;
    auto ix = DecodeInstructionData(data, accounts, error);
    if (!ix) {
        return error;
    }
    return Process(host, signer, *ix);
}

// ============================================================================
// Initialize
// ============================================================================

LockBoxError LockBoxProgram::InitializeLockBox(Host& host, const Address& signer,
                                               const InstructionAccounts& accounts,
                                               Lamports targetAmount) const {
    if (accounts.owner != signer) {
        return LockBoxError::MissingRequiredSignature;
    }
    
    auto lockboxPda = DeriveLockBoxAddress(signer, programId_);
    if (!lockboxPda || lockboxPda->first != accounts.lockbox) {
        return LockBoxError::ConstraintSeeds;
    }
    
    auto vaultPda = DeriveVaultAddress(accounts.lockbox, programId_);
    if (!vaultPda || vaultPda->first != accounts.vault) {
        return LockBoxError::InvalidVault;
    }
    
    // Lamports alone do not claim an address; allocated data does
    auto lockboxData = host.GetData(accounts.lockbox);
    if (lockboxData && !lockboxData->empty()) {
        return LockBoxError::AlreadyInitialized;
    }
    auto vaultData = host.GetData(accounts.vault);
    if (vaultData && !vaultData->empty()) {
        return LockBoxError::AlreadyInitialized;
    }
    
    if (targetAmount == 0) {
        return LockBoxError::InvalidTarget;
    }
    
    LockBox box;
    box.owner = signer;
    box.targetAmount = targetAmount;
    box.depositedAmount = 0;
    box.withdrawnAmount = 0;
    box.createdAt = host.Now();
    box.active = true;
    box.bump = lockboxPda->second;
    box.vaultBump = vaultPda->second;
    
    LockBoxError err = host.CreateAccount(signer, accounts.lockbox, LockBox::SPACE, programId_,
                                          WithBump(LockBoxSeeds(signer), box.bump));
    if (err != LockBoxError::OK) {
        return err;
    }
    
    err = Store(host, accounts.lockbox, box);
    if (err != LockBoxError::OK) {
        return err;
    }
    
    std::ostringstream msg;
    msg << "LockBox initialized with target: " << targetAmount << " lamports";
    host.Log(msg.str());
    return LockBoxError::OK;
}

// ============================================================================
// Deposit
// ============================================================================

LockBoxError LockBoxProgram::Deposit(Host& host, const Address& signer,
                                     const InstructionAccounts& accounts,
                                     Lamports amount) const {
    LockBox box;
    LockBoxError err = LoadAuthorized(host, signer, accounts, box);
    if (err != LockBoxError::OK) {
        return err;
    }
    
    if (amount == 0) {
        return LockBoxError::InvalidAmount;
    }
    if (!box.active) {
        return LockBoxError::InactiveLockBox;
    }
    
    auto newDeposited = CheckedAdd(box.depositedAmount, amount);
    if (!newDeposited) {
        return LockBoxError::ArithmeticOverflow;
    }
    
    err = host.Transfer(signer, accounts.vault, amount);
    if (err != LockBoxError::OK) {
        return err;
    }
    
    box.depositedAmount = *newDeposited;
    err = Store(host, accounts.lockbox, box);
    if (err != LockBoxError::OK) {
        return err;
    }
    
    std::ostringstream msg;
    msg << "Deposited " << amount << " lamports. Total deposited: "
        << box.depositedAmount << " lamports";
    host.Log(msg.str());
    return LockBoxError::OK;
}

// ============================================================================
// Withdraw
// ============================================================================

LockBoxError LockBoxProgram::Withdraw(Host& host, const Address& signer,
                                      const InstructionAccounts& accounts,
                                      Lamports amount) const {
    LockBox box;
    LockBoxError err = LoadAuthorized(host, signer, accounts, box);
    if (err != LockBoxError::OK) {
        return err;
    }
    
    if (!box.active) {
        return LockBoxError::InactiveLockBox;
    }
    if (amount == 0) {
        return LockBoxError::InvalidAmount;
    }
    if (!box.IsTargetReached()) {
        return LockBoxError::TargetNotReached;
    }
    
    Lamports vaultBalance = host.GetBalance(accounts.vault);
    if (amount > vaultBalance) {
        return LockBoxError::InsufficientBalance;
    }
    
    auto newWithdrawn = CheckedAdd(box.withdrawnAmount, amount);
    if (!newWithdrawn) {
        return LockBoxError::ArithmeticOverflow;
    }
    
    Seeds seeds = VaultSignerSeeds(accounts, box);
    err = host.Transfer(accounts.vault, box.owner, amount, &seeds);
    if (err != LockBoxError::OK) {
        return err;
    }
    
    box.withdrawnAmount = *newWithdrawn;
    err = Store(host, accounts.lockbox, box);
    if (err != LockBoxError::OK) {
        return err;
    }
    
    std::ostringstream msg;
    msg << "Withdrew " << amount << " lamports from vault";
    host.Log(msg.str());
    return LockBoxError::OK;
}

// ============================================================================
// Emergency Withdraw
// ============================================================================

LockBoxError LockBoxProgram::EmergencyWithdraw(Host& host, const Address& signer,
                                               const InstructionAccounts& accounts) const {
    LockBox box;
    LockBoxError err = LoadAuthorized(host, signer, accounts, box);
    if (err != LockBoxError::OK) {
        return err;
    }
    
    if (!box.active) {
        return LockBoxError::InactiveLockBox;
    }
    
    Lamports vaultBalance = host.GetBalance(accounts.vault);
    if (vaultBalance == 0) {
        return LockBoxError::InsufficientBalance;
    }
    
    Seeds seeds = VaultSignerSeeds(accounts, box);
    err = host.Transfer(accounts.vault, box.owner, vaultBalance, &seeds);
    if (err != LockBoxError::OK) {
        return err;
    }
    
    box.active = false;
    box.depositedAmount = 0;
    box.withdrawnAmount = 0;
    err = Store(host, accounts.lockbox, box);
    if (err != LockBoxError::OK) {
        return err;
    }
    
    std::ostringstream msg;
    msg << "Emergency withdrawal of " << vaultBalance << " lamports. LockBox deactivated.";
    host.Log(msg.str());
    return LockBoxError::OK;
}

// ============================================================================
// Close
// ============================================================================

LockBoxError LockBoxProgram::CloseLockBox(Host& host, const Address& signer,
                                          const InstructionAccounts& accounts) const {
    LockBox box;
    LockBoxError err = LoadAuthorized(host, signer, accounts, box);
    if (err != LockBoxError::OK) {
        return err;
    }
    
    // Live balance, not bookkeeping
    if (host.GetBalance(accounts.vault) != 0) {
        return LockBoxError::InsufficientBalance;
    }
    
    err = host.CloseAccount(accounts.lockbox, box.owner);
    if (err != LockBoxError::OK) {
        return err;
    }
    
    host.Log("LockBox closed successfully. Rent lamports returned to owner.");
    return LockBoxError::OK;
}

// ============================================================================
// Helpers
// ============================================================================

std::optional<LockBox> LockBoxProgram::LoadLockBox(const Host& host, const Address& address,
                                                   LockBoxError& error) const {
    auto owner = host.GetOwner(address);
    if (!owner) {
        error = LockBoxError::AccountNotInitialized;
        return std::nullopt;
    }
    if (*owner != programId_) {
        error = LockBoxError::IllegalOwner;
        return std::nullopt;
    }
    
    auto data = host.GetData(address);
    if (!data) {
        error = LockBoxError::AccountNotInitialized;
        return std::nullopt;
    }
    
    auto box = LockBox::Deserialize(*data);
    if (!box) {
        error = LockBoxError::AccountDataCorrupt;
        return std::nullopt;
    }
    
    error = LockBoxError::OK;
    return box;
}

LockBoxError LockBoxProgram::LoadAuthorized(const Host& host, const Address& signer,
                                            const InstructionAccounts& accounts,
                                            LockBox& box) const {
    if (accounts.owner != signer) {
        return LockBoxError::MissingRequiredSignature;
    }
    
    LockBoxError err;
    auto loaded = LoadLockBox(host, accounts.lockbox, err);
    if (!loaded) {
        return err;
    }
    
    if (loaded->owner != signer) {
        return LockBoxError::Unauthorized;
    }
    
    auto lockboxAddr = CreateProgramAddress(WithBump(LockBoxSeeds(loaded->owner), loaded->bump),
                                            programId_);
    if (!lockboxAddr || *lockboxAddr != accounts.lockbox) {
        return LockBoxError::ConstraintSeeds;
    }
    
    auto vaultAddr = CreateProgramAddress(WithBump(VaultSeeds(accounts.lockbox), loaded->vaultBump),
                                          programId_);
    if (!vaultAddr || *vaultAddr != accounts.vault) {
        return LockBoxError::InvalidVault;
    }
    
    box = *loaded;
    return LockBoxError::OK;
}

Seeds LockBoxProgram::VaultSignerSeeds(const InstructionAccounts& accounts,
                                       const LockBox& box) const {
    return WithBump(VaultSeeds(accounts.lockbox), box.vaultBump);
}

LockBoxError LockBoxProgram::Store(Host& host, const Address& address, const LockBox& box) const {
    return host.WriteData(address, box.Serialize());
}

} // namespace lockbox
