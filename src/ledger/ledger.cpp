// LOCKBOX - In-Process Ledger Implementation
// Copyright (c) 2024 LOCKBOX Developers
// MIT License

#include "lockbox/ledger/ledger.h"
#include "lockbox/core/serialize.h"
#include "lockbox/crypto/sha256.h"
#include "lockbox/util/logging.h"

#include <sstream>

namespace lockbox {
namespace ledger {

namespace {

const char* const TX_DOMAIN = "lockbox.tx.v1";
const char* const SLOT_KEY = "slot";

} // anonymous namespace

Address SystemProgramId() {
    return Address();
}

// ============================================================================
// Account
// ============================================================================

std::vector<Byte> Account::Serialize() const {
    DataStream ss;
    ser_writedata64(ss, lamports);
    lockbox::Serialize(ss, owner);
    WriteBytes(ss, data);
    return ss.Data();
}

std::optional<Account> Account::Deserialize(const std::string& bytes) {
    DataStream ss(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size());
    Account account;
    try {
        account.lamports = ser_readdata64(ss);
        Unserialize(ss, account.owner);
        account.data = ReadBytes(ss);
    } catch (const std::ios_base::failure&) {
        return std::nullopt;
    }
    if (!ss.AtEnd()) {
        return std::nullopt;
    }
    return account;
}

Lamports RentParams::MinimumBalance(size_t dataLen) const {
    uint64_t bytes = ACCOUNT_STORAGE_OVERHEAD + static_cast<uint64_t>(dataLen);
    if (lamportsPerByteYear != 0 && bytes > MAX_LAMPORTS / lamportsPerByteYear) {
        return MAX_LAMPORTS;
    }
    uint64_t perYear = bytes * lamportsPerByteYear;
    if (exemptionThreshold != 0 && perYear > MAX_LAMPORTS / exemptionThreshold) {
        return MAX_LAMPORTS;
    }
    return perYear * exemptionThreshold;
}

// ============================================================================
// Transaction
// ============================================================================

Hash256 Transaction::GetMessageHash() const {
    DataStream ss;
    ss.Write(TX_DOMAIN, std::char_traits<char>::length(TX_DOMAIN));
    WriteBytes(ss, instruction.Serialize());
    ss.Write(signer.data(), signer.size());
    ser_writedata64(ss, nonce);
    return SHA256Hash(ss.Data());
}

bool Transaction::Sign(const PrivateKey& key) {
    if (!key.IsValid()) {
        return false;
    }
    signer = key.GetPublicKey();
    signature = key.Sign(GetMessageHash());
    return !signature.empty();
}

bool Transaction::VerifySignature() const {
    if (!signer.IsValid()) {
        return false;
    }
    return signer.Verify(GetMessageHash(), signature);
}

std::optional<Transaction> MakeTransaction(const Instruction& ix, const PrivateKey& key,
                                           uint64_t nonce) {
    Transaction tx;
    tx.instruction = ix;
    tx.nonce = nonce;
    if (!tx.Sign(key)) {
        return std::nullopt;
    }
    return tx;
}

std::string TransactionReceipt::ToString() const {
    std::ostringstream ss;
    ss << "Receipt {"
       << " tx: " << messageHash.ToHex().substr(0, 12) << "..."
       << ", slot: " << slot
       << ", status: " << LockBoxErrorToString(status)
       << ", logs: " << logs.size()
       << " }";
    return ss.str();
}

// ============================================================================
// TransactionContext
// ============================================================================

TransactionContext::TransactionContext(const Ledger& ledger, const Address& signer)
    : ledger_(ledger), signer_(signer) {}

const Account* TransactionContext::Find(const Address& address) const {
    auto changed = changes_.find(address);
    if (changed != changes_.end()) {
        return changed->second ? &*changed->second : nullptr;
    }
    auto it = ledger_.accounts_.find(address);
    return it == ledger_.accounts_.end() ? nullptr : &it->second;
}

Account& TransactionContext::Touch(const Address& address) {
    auto changed = changes_.find(address);
    if (changed != changes_.end()) {
        if (!changed->second) {
            changed->second = Account{0, SystemProgramId(), {}};
        }
        return *changed->second;
    }
    
    auto it = ledger_.accounts_.find(address);
    Account copy = it == ledger_.accounts_.end() ? Account{0, SystemProgramId(), {}} : it->second;
    return *(changes_[address] = std::move(copy));
}

bool TransactionContext::IsAuthority(const Address& address, const Seeds* seeds) const {
    if (!signer_.IsNull() && address == signer_) {
        return true;
    }
    if (!seeds) {
        return false;
    }
    auto derived = CreateProgramAddress(*seeds, ledger_.program_.GetProgramId());
    return derived && *derived == address;
}

Lamports TransactionContext::GetBalance(const Address& account) const {
    const Account* acc = Find(account);
    return acc ? acc->lamports : 0;
}

bool TransactionContext::AccountExists(const Address& account) const {
    return Find(account) != nullptr;
}

std::optional<std::vector<Byte>> TransactionContext::GetData(const Address& account) const {
    const Account* acc = Find(account);
    if (!acc) {
        return std::nullopt;
    }
    return acc->data;
}

std::optional<Address> TransactionContext::GetOwner(const Address& account) const {
    const Account* acc = Find(account);
    if (!acc) {
        return std::nullopt;
    }
    return acc->owner;
}

LockBoxError TransactionContext::Transfer(const Address& from, const Address& to,
                                          Lamports amount, const Seeds* signerSeeds) {
    if (!IsAuthority(from, signerSeeds)) {
        return LockBoxError::MissingRequiredSignature;
    }
    
    const Account* source = Find(from);
    if (source && (source->owner != SystemProgramId() || !source->data.empty())) {
        // Only plain accounts can be debited by transfer
        return LockBoxError::IllegalOwner;
    }
    
    Lamports available = source ? source->lamports : 0;
    if (amount > available) {
        return LockBoxError::InsufficientFunds;
    }
    if (amount == 0 || from == to) {
        return LockBoxError::OK;
    }
    
    auto credited = CheckedAdd(GetBalance(to), amount);
    if (!credited) {
        return LockBoxError::ArithmeticOverflow;
    }
    
    Account& src = Touch(from);
    src.lamports -= amount;
    if (src.lamports == 0) {
        Remove(from);
    }
    Touch(to).lamports = *credited;
    return LockBoxError::OK;
}

LockBoxError TransactionContext::CreateAccount(const Address& payer, const Address& account,
                                               size_t space, const Address& ownerProgram,
                                               const Seeds& signerSeeds) {
    if (!IsAuthority(payer, nullptr) || !IsAuthority(account, &signerSeeds)) {
        return LockBoxError::MissingRequiredSignature;
    }
    const Account* existing = Find(account);
    if (existing && (existing->owner != SystemProgramId() || !existing->data.empty())) {
        return LockBoxError::AlreadyInitialized;
    }
    
    // A pre-funded address only needs topping up to the rent-exempt minimum
    Lamports rent = ledger_.rent_.MinimumBalance(space);
    Lamports held = existing ? existing->lamports : 0;
    Lamports due = rent > held ? rent - held : 0;
    if (due > GetBalance(payer)) {
        return LockBoxError::InsufficientFunds;
    }
    
    if (due > 0) {
        Account& src = Touch(payer);
        src.lamports -= due;
        if (src.lamports == 0 && src.data.empty()) {
            Remove(payer);
        }
    }
    
    Account& created = Touch(account);
    created.lamports = held + due;
    created.owner = ownerProgram;
    created.data.assign(space, 0);
    return LockBoxError::OK;
}

LockBoxError TransactionContext::WriteData(const Address& account, const std::vector<Byte>& data) {
    const Account* acc = Find(account);
    if (!acc) {
        return LockBoxError::AccountNotFound;
    }
    if (acc->owner != ledger_.program_.GetProgramId()) {
        return LockBoxError::IllegalOwner;
    }
    if (acc->data.size() != data.size()) {
        return LockBoxError::AccountDataCorrupt;
    }
    Touch(account).data = data;
    return LockBoxError::OK;
}

LockBoxError TransactionContext::CloseAccount(const Address& account, const Address& recipient) {
    const Account* acc = Find(account);
    if (!acc) {
        return LockBoxError::AccountNotFound;
    }
    if (acc->owner != ledger_.program_.GetProgramId()) {
        return LockBoxError::IllegalOwner;
    }
    if (account == recipient) {
        return LockBoxError::InvalidInstruction;
    }
    
    Lamports amount = acc->lamports;
    auto credited = CheckedAdd(GetBalance(recipient), amount);
    if (!credited) {
        return LockBoxError::ArithmeticOverflow;
    }
    
    Remove(account);
    if (amount > 0) {
        Touch(recipient).lamports = *credited;
    }
    return LockBoxError::OK;
}

Timestamp TransactionContext::Now() const {
    return ledger_.clock_ ? *ledger_.clock_ : GetTime();
}

void TransactionContext::Log(const std::string& message) {
    LOG_DEBUG(util::LogCategory::PROGRAM) << "Program log: " << message;
    logs_.push_back(message);
}

// ============================================================================
// Ledger
// ============================================================================

Ledger::Ledger(const LockBoxProgram& program, const RentParams& rent,
               std::shared_ptr<db::Database> db)
    : program_(program), rent_(rent), db_(std::move(db)) {}

db::Status Ledger::Load() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return db::Status::NotSupported("ledger has no database");
    }
    
    std::map<Address, Account> accounts;
    std::set<Hash256> processed;
    uint64_t slot = 0;
    
    const std::string slotKey = db::MakeKey(db::prefix::META, SLOT_KEY);
    db::Status s = db_->Scan("", [&](const std::string& key, const std::string& value) {
        if (key.size() == 1 + Address::SIZE && key[0] == db::prefix::ACCOUNT) {
            auto account = Account::Deserialize(value);
            if (!account) {
                return db::Status::Corruption("bad account record");
            }
            accounts[Address(reinterpret_cast<const Byte*>(key.data()) + 1, Address::SIZE)] =
                std::move(*account);
        } else if (key.size() == 1 + Hash256::SIZE && key[0] == db::prefix::PROCESSED_TX) {
            processed.insert(Hash256(reinterpret_cast<const Byte*>(key.data()) + 1, Hash256::SIZE));
        } else if (key == slotKey) {
            if (value.size() != 8) {
                return db::Status::Corruption("bad slot record");
            }
            DataStream ss(reinterpret_cast<const Byte*>(value.data()), value.size());
            slot = ser_readdata64(ss);
        }
        return db::Status::Ok();
    });
    if (!s.ok()) {
        return s;
    }
    
    accounts_ = std::move(accounts);
    processed_ = std::move(processed);
    slot_ = slot;
    
    LOG_INFO(util::LogCategory::LEDGER) << "Loaded " << accounts_.size() << " accounts, "
                                        << processed_.size() << " processed transactions";
    return db::Status::Ok();
}

db::Status Ledger::CommitLocked(const TransactionContext::ChangeSet& changes,
                                const std::optional<Hash256>& messageHash) {
    if (db_) {
        db::WriteBatch batch;
        for (const auto& [address, account] : changes) {
            std::string key = db::MakeKey(db::prefix::ACCOUNT, address);
            if (account) {
                batch.Put(key, account->Serialize());
            } else {
                batch.Delete(key);
            }
        }
        DataStream slotData;
        ser_writedata64(slotData, slot_ + 1);
        if (messageHash) {
            batch.Put(db::MakeKey(db::prefix::PROCESSED_TX, *messageHash), slotData.Data());
        }
        batch.Put(db::MakeKey(db::prefix::META, SLOT_KEY), slotData.Data());
        
        db::Status s = db_->Write(batch);
        if (!s.ok()) {
            LOG_ERROR(util::LogCategory::LEDGER) << "Commit failed: " << s.ToString();
            return s;
        }
    }
    
    for (const auto& [address, account] : changes) {
        if (account) {
            accounts_[address] = *account;
        } else {
            accounts_.erase(address);
        }
    }
    if (messageHash) {
        processed_.insert(*messageHash);
    }
    ++slot_;
    return db::Status::Ok();
}

LockBoxError Ledger::Airdrop(const Address& to, Lamports amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (amount == 0) {
        return LockBoxError::InvalidAmount;
    }
    
    auto it = accounts_.find(to);
    Account account = it == accounts_.end() ? Account{0, SystemProgramId(), {}} : it->second;
    auto balance = CheckedAdd(account.lamports, amount);
    if (!balance) {
        return LockBoxError::ArithmeticOverflow;
    }
    account.lamports = *balance;
    
    TransactionContext::ChangeSet changes;
    changes[to] = account;
    if (!CommitLocked(changes, std::nullopt).ok()) {
        return LockBoxError::StorageError;
    }
    
    LOG_INFO(util::LogCategory::LEDGER) << "Airdropped " << amount << " lamports to "
                                        << to.ToShortString();
    return LockBoxError::OK;
}

TransactionReceipt Ledger::Submit(const Transaction& tx) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    TransactionReceipt receipt;
    receipt.messageHash = tx.GetMessageHash();
    receipt.slot = slot_;
    
    if (!tx.VerifySignature()) {
        receipt.status = LockBoxError::InvalidSignature;
        LOG_DEBUG(util::LogCategory::LEDGER) << "Rejected transaction with bad signature";
        return receipt;
    }
    if (processed_.count(receipt.messageHash) > 0) {
        receipt.status = LockBoxError::DuplicateTransaction;
        LOG_DEBUG(util::LogCategory::LEDGER) << "Rejected replayed transaction "
                                             << receipt.messageHash.ToHex().substr(0, 12);
        return receipt;
    }
    
    return ExecuteLocked(tx.signer.GetAddress(), tx.instruction, receipt.messageHash);
}

TransactionReceipt Ledger::Execute(const Address& signer, const Instruction& ix) {
    std::lock_guard<std::mutex> lock(mutex_);
    return ExecuteLocked(signer, ix, std::nullopt);
}

TransactionReceipt Ledger::ExecuteLocked(const Address& signer, const Instruction& ix,
                                         const std::optional<Hash256>& messageHash) {
    TransactionReceipt receipt;
    if (messageHash) {
        receipt.messageHash = *messageHash;
    }
    receipt.slot = slot_;
    
    TransactionContext ctx(*this, signer);
    receipt.status = program_.Process(ctx, signer, ix);
    receipt.logs = ctx.Logs();
    
    if (receipt.status != LockBoxError::OK) {
        // Failed transactions still consume their message hash
        TransactionContext::ChangeSet none;
        if (messageHash && !CommitLocked(none, messageHash).ok()) {
            receipt.status = LockBoxError::StorageError;
        }
        LOG_DEBUG(util::LogCategory::LEDGER) << InstructionKindToString(ix.kind) << " failed: "
                                             << FormatLockBoxError(receipt.status);
        return receipt;
    }
    
    if (!CommitLocked(ctx.Changes(), messageHash).ok()) {
        receipt.status = LockBoxError::StorageError;
        return receipt;
    }
    
    LOG_INFO(util::LogCategory::LEDGER) << "Committed " << InstructionKindToString(ix.kind)
                                        << " for " << signer.ToShortString()
                                        << " at slot " << receipt.slot;
    return receipt;
}

// ============================================================================
// Queries
// ============================================================================

std::optional<Account> Ledger::GetAccount(const Address& address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(address);
    if (it == accounts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Lamports Ledger::GetBalance(const Address& address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(address);
    return it == accounts_.end() ? 0 : it->second.lamports;
}

std::optional<LockBox> Ledger::GetLockBox(const Address& lockboxAddress) const {
    std::lock_guard<std::mutex> lock(mutex_);
    TransactionContext view(*this, Address());
    LockBoxError error;
    return program_.LoadLockBox(view, lockboxAddress, error);
}

bool Ledger::IsProcessed(const Hash256& messageHash) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return processed_.count(messageHash) > 0;
}

size_t Ledger::AccountCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return accounts_.size();
}

std::optional<Lamports> Ledger::TotalLamports() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Lamports total = 0;
    for (const auto& [address, account] : accounts_) {
        auto sum = CheckedAdd(total, account.lamports);
        if (!sum) {
            return std::nullopt;
        }
        total = *sum;
    }
    return total;
}

uint64_t Ledger::GetSlot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slot_;
}

void Ledger::SetClock(std::optional<Timestamp> now) {
    std::lock_guard<std::mutex> lock(mutex_);
    clock_ = now;
}

} // namespace ledger
} // namespace lockbox
