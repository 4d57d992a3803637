// LOCKBOX - Program Processor
// Copyright (c) 2024 LOCKBOX Developers
// MIT License
//
// The LockBox state machine.
//
// Five handlers move a LockBox through its lifecycle:
//
//   initialize -> Active --emergency_withdraw--> Deactivated
//                 Active --deposit/withdraw--> Active
//   Active or Deactivated --close (vault empty)--> Closed
//
// Every handler validates all of its preconditions before asking the host to
// move value or write state. Handlers that act on an existing LockBox run
// the same guard first: the record must exist, the signer must be its owner,
// and both the LockBox and Vault addresses must re-derive from the record.

#ifndef LOCKBOX_PROGRAM_PROCESSOR_H
#define LOCKBOX_PROGRAM_PROCESSOR_H

#include "lockbox/core/types.h"
#include "lockbox/program/errors.h"
#include "lockbox/program/host.h"
#include "lockbox/program/instruction.h"
#include "lockbox/program/state.h"

#include <optional>

namespace lockbox {

class LockBoxProgram {
public:
    explicit LockBoxProgram(const Address& programId = DefaultProgramId());
    
    const Address& GetProgramId() const { return programId_; }
    
    /// Dispatch a decoded instruction signed by signer
    LockBoxError Process(Host& host, const Address& signer, const Instruction& ix) const;
    
    /// Decode raw instruction data, then dispatch
    LockBoxError ProcessRaw(Host& host, const Address& signer,
                            const InstructionAccounts& accounts,
                            const std::vector<Byte>& data) const;
    
    // ========================================================================
    // Handlers
    // ========================================================================
    
    /// Create the LockBox record and bind its Vault
    LockBoxError InitializeLockBox(Host& host, const Address& signer,
                                   const InstructionAccounts& accounts,
                                   Lamports targetAmount) const;
    
    /// Move amount from the signer into the Vault
    LockBoxError Deposit(Host& host, const Address& signer,
                         const InstructionAccounts& accounts, Lamports amount) const;
    
    /// Move amount from the Vault to the owner once the target is reached
    LockBoxError Withdraw(Host& host, const Address& signer,
                          const InstructionAccounts& accounts, Lamports amount) const;
    
    /// Drain the Vault to the owner and deactivate the LockBox
    LockBoxError EmergencyWithdraw(Host& host, const Address& signer,
                                   const InstructionAccounts& accounts) const;
    
    /// Destroy the LockBox record once the Vault is empty
    LockBoxError CloseLockBox(Host& host, const Address& signer,
                              const InstructionAccounts& accounts) const;
    
    // ========================================================================
    // Queries
    // ========================================================================
    
    /// Read and decode a LockBox record owned by this program
    std::optional<LockBox> LoadLockBox(const Host& host, const Address& address,
                                       LockBoxError& error) const;

private:
    /// Common guard for handlers acting on an existing LockBox
    LockBoxError LoadAuthorized(const Host& host, const Address& signer,
                                const InstructionAccounts& accounts, LockBox& box) const;
    
    /// Vault seeds with bump, used to sign vault debits
    Seeds VaultSignerSeeds(const InstructionAccounts& accounts, const LockBox& box) const;
    
    LockBoxError Store(Host& host, const Address& address, const LockBox& box) const;
    
    Address programId_;
};

} // namespace lockbox

#endif // LOCKBOX_PROGRAM_PROCESSOR_H
