// LOCKBOX - Program Host Interface
// Copyright (c) 2024 LOCKBOX Developers
// MIT License
//
// Primitives the LockBox program consumes from the ledger that executes it.
// A host runs one instruction at a time and guarantees that a failed
// instruction leaves no observable effect.

#ifndef LOCKBOX_PROGRAM_HOST_H
#define LOCKBOX_PROGRAM_HOST_H

#include "lockbox/core/types.h"
#include "lockbox/program/errors.h"
#include "lockbox/program/pda.h"

#include <optional>
#include <string>
#include <vector>

namespace lockbox {

/**
 * Abstract execution host.
 * 
 * Debits and account creation must be authorised either by the transaction
 * signer or, for a derived address, by seeds (bump included) that hash to
 * that address under the calling program's id.
 */
class Host {
public:
    virtual ~Host() = default;
    
    /// Lamports held by an account (0 if it does not exist)
    virtual Lamports GetBalance(const Address& account) const = 0;
    
    /// Whether an account exists
    virtual bool AccountExists(const Address& account) const = 0;
    
    /// Account data, nullopt if the account does not exist
    virtual std::optional<std::vector<Byte>> GetData(const Address& account) const = 0;
    
    /// Program that owns an account, nullopt if the account does not exist
    virtual std::optional<Address> GetOwner(const Address& account) const = 0;
    
    /**
     * Move lamports between accounts, creating the destination if needed.
     * @param signerSeeds Seeds proving authority over a derived source
     */
    virtual LockBoxError Transfer(const Address& from, const Address& to, Lamports amount,
                                  const Seeds* signerSeeds = nullptr) = 0;
    
    /**
     * Allocate a rent-exempt account of fixed size owned by ownerProgram.
     * The payer funds the rent-exempt minimum.
     */
    virtual LockBoxError CreateAccount(const Address& payer, const Address& account,
                                       size_t space, const Address& ownerProgram,
                                       const Seeds& signerSeeds) = 0;
    
    /// Overwrite the data of a program-owned account (size must match)
    virtual LockBoxError WriteData(const Address& account, const std::vector<Byte>& data) = 0;
    
    /// Destroy a program-owned account, sending all its lamports to recipient
    virtual LockBoxError CloseAccount(const Address& account, const Address& recipient) = 0;
    
    /// Current clock (Unix seconds)
    virtual Timestamp Now() const = 0;
    
    /// Append a program log line
    virtual void Log(const std::string& message) = 0;
};

} // namespace lockbox

#endif // LOCKBOX_PROGRAM_HOST_H
