// LOCKBOX - In-Process Ledger
// Copyright (c) 2024 LOCKBOX Developers
// MIT License
//
// A single-program ledger that executes LockBox instructions.
//
// Each transaction runs against a TransactionContext that records account
// changes without touching committed state. If the program returns OK the
// changes are written to the database in one batch and then applied in
// memory; otherwise they are dropped. Either way no partial effect is
// visible.

#ifndef LOCKBOX_LEDGER_LEDGER_H
#define LOCKBOX_LEDGER_LEDGER_H

#include "lockbox/core/types.h"
#include "lockbox/crypto/keys.h"
#include "lockbox/db/database.h"
#include "lockbox/program/host.h"
#include "lockbox/program/instruction.h"
#include "lockbox/program/processor.h"
#include "lockbox/program/state.h"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace lockbox {
namespace ledger {

// ============================================================================
// Accounts and Rent
// ============================================================================

/// Owner of plain value-holding accounts
Address SystemProgramId();

/**
 * A ledger account.
 */
struct Account {
    Lamports lamports{0};
    
    /// Owning program; SystemProgramId() for plain accounts
    Address owner;
    
    std::vector<Byte> data;
    
    std::vector<Byte> Serialize() const;
    static std::optional<Account> Deserialize(const std::string& bytes);
    
    bool operator==(const Account& other) const {
        return lamports == other.lamports && owner == other.owner && data == other.data;
    }
};

/**
 * Rent parameters. An account holding data must keep at least
 * (ACCOUNT_STORAGE_OVERHEAD + data_len) * lamportsPerByteYear * exemptionThreshold
 * lamports.
 */
struct RentParams {
    static constexpr size_t ACCOUNT_STORAGE_OVERHEAD = 128;
    static constexpr uint64_t DEFAULT_LAMPORTS_PER_BYTE_YEAR = 3480;
    static constexpr uint64_t DEFAULT_EXEMPTION_THRESHOLD = 2;
    
    uint64_t lamportsPerByteYear{DEFAULT_LAMPORTS_PER_BYTE_YEAR};
    uint64_t exemptionThreshold{DEFAULT_EXEMPTION_THRESHOLD};
    
    /// Saturates at MAX_LAMPORTS
    Lamports MinimumBalance(size_t dataLen) const;
};

// ============================================================================
// Transactions
// ============================================================================

/**
 * A signed request to run one instruction.
 */
struct Transaction {
    Instruction instruction;
    PublicKey signer;
    
    /// Distinguishes otherwise identical requests
    uint64_t nonce{0};
    
    /// DER ECDSA signature over GetMessageHash()
    std::vector<Byte> signature;
    
    /// SHA256 over the instruction, signer key and nonce
    Hash256 GetMessageHash() const;
    
    /// Set signer from key and sign; false if the key is invalid
    bool Sign(const PrivateKey& key);
    
    bool VerifySignature() const;
};

/// Build and sign a transaction
std::optional<Transaction> MakeTransaction(const Instruction& ix, const PrivateKey& key,
                                           uint64_t nonce);

/**
 * Outcome of a submitted transaction.
 */
struct TransactionReceipt {
    Hash256 messageHash;
    LockBoxError status{LockBoxError::OK};
    std::vector<std::string> logs;
    uint64_t slot{0};
    
    bool ok() const { return status == LockBoxError::OK; }
    std::string ToString() const;
};

class Ledger;

// ============================================================================
// Transaction Context
// ============================================================================

/**
 * Host view of the ledger for one transaction.
 * 
 * Reads fall through to committed state; writes are kept in a change set
 * that the Ledger commits or discards.
 */
class TransactionContext : public Host {
public:
    /// Changed accounts; nullopt marks a deleted account
    using ChangeSet = std::map<Address, std::optional<Account>>;
    
    TransactionContext(const Ledger& ledger, const Address& signer);
    
    Lamports GetBalance(const Address& account) const override;
    bool AccountExists(const Address& account) const override;
    std::optional<std::vector<Byte>> GetData(const Address& account) const override;
    std::optional<Address> GetOwner(const Address& account) const override;
    
    LockBoxError Transfer(const Address& from, const Address& to, Lamports amount,
                          const Seeds* signerSeeds = nullptr) override;
    LockBoxError CreateAccount(const Address& payer, const Address& account, size_t space,
                               const Address& ownerProgram, const Seeds& signerSeeds) override;
    LockBoxError WriteData(const Address& account, const std::vector<Byte>& data) override;
    LockBoxError CloseAccount(const Address& account, const Address& recipient) override;
    
    Timestamp Now() const override;
    void Log(const std::string& message) override;
    
    const ChangeSet& Changes() const { return changes_; }
    const std::vector<std::string>& Logs() const { return logs_; }

private:
    const Account* Find(const Address& address) const;
    
    /// Copy-on-write handle; creates a system account if missing
    Account& Touch(const Address& address);
    
    /// Signer, or a derived address proven by seeds
    bool IsAuthority(const Address& address, const Seeds* seeds) const;
    
    void Remove(const Address& address) { changes_[address] = std::nullopt; }
    
    const Ledger& ledger_;
    Address signer_;
    ChangeSet changes_;
    std::vector<std::string> logs_;
};

// ============================================================================
// Ledger
// ============================================================================

class Ledger {
public:
    /**
     * @param db Optional backing store. State is only reloaded by Load().
     */
    explicit Ledger(const LockBoxProgram& program,
                    const RentParams& rent = RentParams(),
                    std::shared_ptr<db::Database> db = nullptr);
    
    /// Replace in-memory state with the contents of the database
    db::Status Load();
    
    // ========================================================================
    // Operations
    // ========================================================================
    
    /// Credit lamports from nowhere (test faucet)
    LockBoxError Airdrop(const Address& to, Lamports amount);
    
    /// Verify, de-duplicate, execute and commit a signed transaction
    TransactionReceipt Submit(const Transaction& tx);
    
    /// Execute an instruction for an already authenticated signer
    TransactionReceipt Execute(const Address& signer, const Instruction& ix);
    
    // ========================================================================
    // Queries
    // ========================================================================
    
    std::optional<Account> GetAccount(const Address& address) const;
    Lamports GetBalance(const Address& address) const;
    
    /// Decode the LockBox stored at an address
    std::optional<LockBox> GetLockBox(const Address& lockboxAddress) const;
    
    bool IsProcessed(const Hash256& messageHash) const;
    
    size_t AccountCount() const;
    
    /// Sum of all account balances; nullopt if it does not fit in 64 bits
    std::optional<Lamports> TotalLamports() const;
    
    uint64_t GetSlot() const;
    
    const LockBoxProgram& GetProgram() const { return program_; }
    const RentParams& GetRent() const { return rent_; }
    
    /// Fix the clock seen by programs; nullopt restores wall time
    void SetClock(std::optional<Timestamp> now);

private:
    friend class TransactionContext;
    
    /// Caller holds mutex_
    TransactionReceipt ExecuteLocked(const Address& signer, const Instruction& ix,
                                     const std::optional<Hash256>& messageHash);
    
    /// Persist then apply; caller holds mutex_
    db::Status CommitLocked(const TransactionContext::ChangeSet& changes,
                            const std::optional<Hash256>& messageHash);
    
    LockBoxProgram program_;
    RentParams rent_;
    std::shared_ptr<db::Database> db_;
    
    std::map<Address, Account> accounts_;
    std::set<Hash256> processed_;
    uint64_t slot_{0};
    std::optional<Timestamp> clock_;
    
    mutable std::mutex mutex_;
};

} // namespace ledger
} // namespace lockbox

#endif // LOCKBOX_LEDGER_LEDGER_H
