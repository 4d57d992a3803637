// LOCKBOX - Ledger Tests
// Copyright (c) 2024 LOCKBOX Developers
// MIT License

#include <gtest/gtest.h>
#include "lockbox/ledger/ledger.h"
#include "lockbox/db/leveldb.h"
#include "lockbox/program/pda.h"
#include "lockbox/util/logging.h"

#include <memory>
#include <string>
#include <vector>

namespace lockbox {
namespace test {

using namespace ledger;

namespace {

/// Store whose batch writes can be made to fail
class FlakyDatabase : public db::MemoryDatabase {
public:
    db::Status Write(const db::WriteBatch& batch) override {
        if (failWrites) {
            return db::Status::IOError("disk full");
        }
        return db::MemoryDatabase::Write(batch);
    }
    
    bool failWrites{false};
};

} // anonymous namespace

class LedgerTest : public ::testing::Test {
protected:
    static constexpr Lamports FUNDS = 10 * LAMPORTS_PER_SOL;
    
    LedgerTest()
        : db_(std::make_shared<FlakyDatabase>()),
          ledger_(LockBoxProgram(), RentParams(), db_) {}
    
    void SetUp() override {
        key_ = PrivateKey::Generate();
        owner_ = key_.GetAddress();
        programId_ = ledger_.GetProgram().GetProgramId();
        ASSERT_EQ(ledger_.Airdrop(owner_, FUNDS), LockBoxError::OK);
        
        auto accounts = DeriveAccounts(owner_, programId_);
        ASSERT_TRUE(accounts.has_value());
        accounts_ = *accounts;
    }
    
    Transaction Sign(const std::optional<Instruction>& ix, uint64_t nonce) {
        EXPECT_TRUE(ix.has_value());
        auto tx = MakeTransaction(*ix, key_, nonce);
        EXPECT_TRUE(tx.has_value());
        return *tx;
    }
    
    std::shared_ptr<FlakyDatabase> db_;
    Ledger ledger_;
    PrivateKey key_;
    Address owner_;
    Address programId_;
    InstructionAccounts accounts_;
};

// ============================================================================
// Rent
// ============================================================================

TEST(RentTest, DefaultMinimumBalance) {
    RentParams rent;
    EXPECT_EQ(rent.MinimumBalance(0), 128u * 3480u * 2u);
    EXPECT_EQ(rent.MinimumBalance(75), 1412880u);
}

TEST(RentTest, CustomParameters) {
    RentParams rent;
    rent.lamportsPerByteYear = 10;
    rent.exemptionThreshold = 1;
    EXPECT_EQ(rent.MinimumBalance(72), 2000u);
}

TEST(RentTest, SaturatesInsteadOfOverflowing) {
    RentParams rent;
    rent.lamportsPerByteYear = MAX_LAMPORTS / 2;
    EXPECT_EQ(rent.MinimumBalance(1000), MAX_LAMPORTS);
}

// ============================================================================
// Accounts
// ============================================================================

TEST(AccountTest, SerializeRoundTrip) {
    Account account;
    account.lamports = 123456;
    account.owner = DefaultProgramId();
    account.data = {1, 2, 3};
    
    std::vector<Byte> bytes = account.Serialize();
    auto decoded = Account::Deserialize(std::string(bytes.begin(), bytes.end()));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, account);
}

TEST(AccountTest, DeserializeRejectsTruncated) {
    Account account;
    account.lamports = 1;
    std::vector<Byte> bytes = account.Serialize();
    bytes.pop_back();
    EXPECT_FALSE(Account::Deserialize(std::string(bytes.begin(), bytes.end())).has_value());
}

TEST_F(LedgerTest, AirdropCreatesSystemAccount) {
    auto account = ledger_.GetAccount(owner_);
    ASSERT_TRUE(account.has_value());
    EXPECT_EQ(account->lamports, FUNDS);
    EXPECT_EQ(account->owner, SystemProgramId());
    EXPECT_TRUE(account->data.empty());
}

TEST_F(LedgerTest, AirdropRejectsZeroAndOverflow) {
    EXPECT_EQ(ledger_.Airdrop(owner_, 0), LockBoxError::InvalidAmount);
    EXPECT_EQ(ledger_.Airdrop(owner_, MAX_LAMPORTS), LockBoxError::ArithmeticOverflow);
    EXPECT_EQ(ledger_.GetBalance(owner_), FUNDS);
}

// ============================================================================
// Signed Transactions
// ============================================================================

TEST_F(LedgerTest, SubmitSignedTransaction) {
    TransactionReceipt receipt = ledger_.Submit(Sign(MakeInitialize(owner_, 1000, programId_), 1));
    ASSERT_TRUE(receipt.ok()) << receipt.ToString();
    EXPECT_EQ(receipt.logs.size(), 1u);
    EXPECT_TRUE(ledger_.IsProcessed(receipt.messageHash));
    EXPECT_TRUE(ledger_.GetLockBox(accounts_.lockbox).has_value());
}

TEST_F(LedgerTest, MessageHashCoversNonce) {
    Transaction a = Sign(MakeDeposit(owner_, 5, programId_), 1);
    Transaction b = Sign(MakeDeposit(owner_, 5, programId_), 2);
    EXPECT_NE(a.GetMessageHash(), b.GetMessageHash());
}

TEST_F(LedgerTest, ReplayIsRejected) {
    ASSERT_TRUE(ledger_.Submit(Sign(MakeInitialize(owner_, 1000, programId_), 1)).ok());
    
    Transaction deposit = Sign(MakeDeposit(owner_, 100, programId_), 2);
    ASSERT_TRUE(ledger_.Submit(deposit).ok());
    
    TransactionReceipt replay = ledger_.Submit(deposit);
    EXPECT_EQ(replay.status, LockBoxError::DuplicateTransaction);
    EXPECT_EQ(ledger_.GetBalance(accounts_.vault), 100u);
}

TEST_F(LedgerTest, FailedTransactionCannotBeReplayed) {
    Transaction early = Sign(MakeDeposit(owner_, 100, programId_), 1);
    EXPECT_EQ(ledger_.Submit(early).status, LockBoxError::AccountNotInitialized);
    
    ASSERT_TRUE(ledger_.Submit(Sign(MakeInitialize(owner_, 1000, programId_), 2)).ok());
    EXPECT_EQ(ledger_.Submit(early).status, LockBoxError::DuplicateTransaction);
}

TEST_F(LedgerTest, TamperedInstructionFailsVerification) {
    Transaction tx = Sign(MakeInitialize(owner_, 1000, programId_), 1);
    tx.instruction.amount = 1;
    EXPECT_EQ(ledger_.Submit(tx).status, LockBoxError::InvalidSignature);
    EXPECT_FALSE(ledger_.GetAccount(accounts_.lockbox).has_value());
}

TEST_F(LedgerTest, ForeignSignatureFails) {
    Transaction tx = Sign(MakeInitialize(owner_, 1000, programId_), 1);
    PrivateKey other = PrivateKey::Generate();
    tx.signer = other.GetPublicKey();
    EXPECT_EQ(ledger_.Submit(tx).status, LockBoxError::InvalidSignature);
}

TEST_F(LedgerTest, UnsignedTransactionFails) {
    Transaction tx;
    tx.instruction = *MakeInitialize(owner_, 1000, programId_);
    EXPECT_EQ(ledger_.Submit(tx).status, LockBoxError::InvalidSignature);
}

TEST_F(LedgerTest, SignerMustMatchOwnerAccount) {
    PrivateKey other = PrivateKey::Generate();
    ASSERT_EQ(ledger_.Airdrop(other.GetAddress(), FUNDS), LockBoxError::OK);
    
    auto tx = MakeTransaction(*MakeInitialize(owner_, 1000, programId_), other, 1);
    ASSERT_TRUE(tx.has_value());
    EXPECT_EQ(ledger_.Submit(*tx).status, LockBoxError::MissingRequiredSignature);
}

// ============================================================================
// Atomicity
// ============================================================================

TEST_F(LedgerTest, FailedInstructionLeavesNoTrace) {
    ASSERT_TRUE(ledger_.Execute(owner_, *MakeInitialize(owner_, 1000, programId_)).ok());
    size_t accounts = ledger_.AccountCount();
    Lamports balance = ledger_.GetBalance(owner_);
    
    TransactionReceipt receipt = ledger_.Execute(owner_, *MakeWithdraw(owner_, 1, programId_));
    EXPECT_EQ(receipt.status, LockBoxError::TargetNotReached);
    EXPECT_TRUE(receipt.logs.empty());
    EXPECT_EQ(ledger_.AccountCount(), accounts);
    EXPECT_EQ(ledger_.GetBalance(owner_), balance);
}

TEST_F(LedgerTest, FailedInstructionIsLoggedOnce) {
    ASSERT_TRUE(ledger_.Execute(owner_, *MakeInitialize(owner_, 1000, programId_)).ok());
    
    auto& logger = util::Logger::Instance();
    std::vector<std::string> messages;
    logger.ClearSinks();
    logger.SetLevel(util::LogLevel::Trace);
    logger.AddSink(std::make_shared<util::CallbackSink>(
        [&messages](const util::LogRecord& record) { messages.push_back(record.message); }));
    
    TransactionReceipt receipt = ledger_.Submit(Sign(MakeWithdraw(owner_, 1, programId_), 1));
    
    logger.ClearSinks();
    logger.SetLevel(util::LogLevel::Info);
    
    EXPECT_EQ(receipt.status, LockBoxError::TargetNotReached);
    size_t failures = 0;
    for (const auto& message : messages) {
        if (message.find("TargetNotReached") != std::string::npos) {
            ++failures;
        }
    }
    EXPECT_EQ(failures, 1u);
}

TEST_F(LedgerTest, LamportsAreConserved) {
    std::optional<Lamports> total = ledger_.TotalLamports();
    ASSERT_TRUE(total.has_value());
    
    ASSERT_TRUE(ledger_.Execute(owner_, *MakeInitialize(owner_, 100, programId_)).ok());
    ASSERT_TRUE(ledger_.Execute(owner_, *MakeDeposit(owner_, 150, programId_)).ok());
    ASSERT_TRUE(ledger_.Execute(owner_, *MakeWithdraw(owner_, 20, programId_)).ok());
    EXPECT_EQ(ledger_.TotalLamports(), total);
    
    ASSERT_TRUE(ledger_.Execute(owner_, *MakeEmergencyWithdraw(owner_, programId_)).ok());
    ASSERT_TRUE(ledger_.Execute(owner_, *MakeClose(owner_, programId_)).ok());
    EXPECT_EQ(ledger_.TotalLamports(), total);
    EXPECT_EQ(ledger_.GetBalance(owner_), FUNDS);
}

TEST_F(LedgerTest, TotalLamportsReportsOverflow) {
    Address whale = PrivateKey::Generate().GetAddress();
    ASSERT_EQ(ledger_.Airdrop(whale, MAX_LAMPORTS), LockBoxError::OK);
    
    // Each balance fits, their sum does not
    EXPECT_EQ(ledger_.GetBalance(whale), MAX_LAMPORTS);
    EXPECT_FALSE(ledger_.TotalLamports().has_value());
}

TEST_F(LedgerTest, SlotAdvancesOnCommit) {
    uint64_t slot = ledger_.GetSlot();
    ASSERT_TRUE(ledger_.Execute(owner_, *MakeInitialize(owner_, 100, programId_)).ok());
    EXPECT_EQ(ledger_.GetSlot(), slot + 1);
    
    EXPECT_FALSE(ledger_.Execute(owner_, *MakeInitialize(owner_, 100, programId_)).ok());
    EXPECT_EQ(ledger_.GetSlot(), slot + 1);
}

TEST_F(LedgerTest, StorageFailureDropsChanges) {
    db_->failWrites = true;
    TransactionReceipt receipt = ledger_.Execute(owner_, *MakeInitialize(owner_, 100, programId_));
    EXPECT_EQ(receipt.status, LockBoxError::StorageError);
    EXPECT_FALSE(ledger_.GetAccount(accounts_.lockbox).has_value());
    EXPECT_EQ(ledger_.GetBalance(owner_), FUNDS);
    
    EXPECT_EQ(ledger_.Airdrop(owner_, 1), LockBoxError::StorageError);
    EXPECT_EQ(ledger_.GetBalance(owner_), FUNDS);
}

// ============================================================================
// Host Rules
// ============================================================================

TEST_F(LedgerTest, TransferRequiresAuthority) {
    Address stranger = PrivateKey::Generate().GetAddress();
    ASSERT_EQ(ledger_.Airdrop(stranger, 100), LockBoxError::OK);
    
    TransactionContext ctx(ledger_, owner_);
    EXPECT_EQ(ctx.Transfer(stranger, owner_, 10), LockBoxError::MissingRequiredSignature);
    EXPECT_EQ(ctx.Transfer(owner_, stranger, 10), LockBoxError::OK);
    EXPECT_EQ(ctx.GetBalance(stranger), 110u);
    EXPECT_EQ(ledger_.GetBalance(stranger), 100u);
}

TEST_F(LedgerTest, TransferFromDerivedAddressNeedsSeeds) {
    auto vault = FindProgramAddress(VaultSeeds(accounts_.lockbox), programId_);
    ASSERT_TRUE(vault.has_value());
    ASSERT_EQ(ledger_.Airdrop(vault->first, 50), LockBoxError::OK);
    
    TransactionContext ctx(ledger_, owner_);
    EXPECT_EQ(ctx.Transfer(vault->first, owner_, 10), LockBoxError::MissingRequiredSignature);
    
    Seeds wrong = WithBump(VaultSeeds(owner_), vault->second);
    EXPECT_EQ(ctx.Transfer(vault->first, owner_, 10, &wrong),
              LockBoxError::MissingRequiredSignature);
    
    Seeds seeds = WithBump(VaultSeeds(accounts_.lockbox), vault->second);
    EXPECT_EQ(ctx.Transfer(vault->first, owner_, 50, &seeds), LockBoxError::OK);
    EXPECT_FALSE(ctx.AccountExists(vault->first));
}

TEST_F(LedgerTest, TransferCannotDebitDataAccount) {
    ASSERT_TRUE(ledger_.Execute(owner_, *MakeInitialize(owner_, 100, programId_)).ok());
    auto lockbox = ledger_.GetLockBox(accounts_.lockbox);
    ASSERT_TRUE(lockbox.has_value());
    
    Seeds seeds = WithBump(LockBoxSeeds(owner_), lockbox->bump);
    TransactionContext ctx(ledger_, owner_);
    EXPECT_EQ(ctx.Transfer(accounts_.lockbox, owner_, 1, &seeds), LockBoxError::IllegalOwner);
}

TEST_F(LedgerTest, WriteDataOnlyForProgramAccounts) {
    TransactionContext ctx(ledger_, owner_);
    EXPECT_EQ(ctx.WriteData(owner_, {}), LockBoxError::IllegalOwner);
    EXPECT_EQ(ctx.WriteData(accounts_.lockbox, {}), LockBoxError::AccountNotFound);
    EXPECT_EQ(ctx.CloseAccount(owner_, owner_), LockBoxError::IllegalOwner);
}

TEST_F(LedgerTest, ProgramSeesFixedClock) {
    ledger_.SetClock(42);
    ASSERT_TRUE(ledger_.Execute(owner_, *MakeInitialize(owner_, 100, programId_)).ok());
    EXPECT_EQ(ledger_.GetLockBox(accounts_.lockbox)->createdAt, 42);
}

// ============================================================================
// Persistence
// ============================================================================

TEST_F(LedgerTest, LoadRestoresCommittedState) {
    Transaction init = Sign(MakeInitialize(owner_, 1000, programId_), 1);
    ASSERT_TRUE(ledger_.Submit(init).ok());
    ASSERT_TRUE(ledger_.Submit(Sign(MakeDeposit(owner_, 250, programId_), 2)).ok());
    
    Ledger reloaded(LockBoxProgram(), RentParams(), db_);
    ASSERT_TRUE(reloaded.Load().ok());
    
    EXPECT_EQ(reloaded.AccountCount(), ledger_.AccountCount());
    EXPECT_EQ(reloaded.GetSlot(), ledger_.GetSlot());
    EXPECT_EQ(reloaded.GetBalance(owner_), ledger_.GetBalance(owner_));
    EXPECT_EQ(reloaded.GetBalance(accounts_.vault), 250u);
    
    auto box = reloaded.GetLockBox(accounts_.lockbox);
    ASSERT_TRUE(box.has_value());
    EXPECT_EQ(box->depositedAmount, 250u);
    
    EXPECT_EQ(reloaded.Submit(init).status, LockBoxError::DuplicateTransaction);
}

TEST_F(LedgerTest, LoadSeesDeletedAccounts) {
    ASSERT_TRUE(ledger_.Execute(owner_, *MakeInitialize(owner_, 1, programId_)).ok());
    ASSERT_TRUE(ledger_.Execute(owner_, *MakeClose(owner_, programId_)).ok());
    
    Ledger reloaded(LockBoxProgram(), RentParams(), db_);
    ASSERT_TRUE(reloaded.Load().ok());
    EXPECT_FALSE(reloaded.GetAccount(accounts_.lockbox).has_value());
    EXPECT_EQ(reloaded.GetBalance(owner_), FUNDS);
}

TEST_F(LedgerTest, LoadRejectsCorruptAccount) {
    db::WriteBatch batch;
    batch.Put(db::MakeKey(db::prefix::ACCOUNT, owner_), "junk");
    ASSERT_TRUE(db_->Write(batch).ok());
    
    Ledger reloaded(LockBoxProgram(), RentParams(), db_);
    db::Status s = reloaded.Load();
    EXPECT_TRUE(s.IsCorruption());
}

TEST(LedgerNoDatabaseTest, LoadIsNotSupported) {
    Ledger ledger{LockBoxProgram()};
    EXPECT_FALSE(ledger.Load().ok());
    
    Address someone = PrivateKey::Generate().GetAddress();
    EXPECT_EQ(ledger.Airdrop(someone, 5), LockBoxError::OK);
    EXPECT_EQ(ledger.GetBalance(someone), 5u);
}

} // namespace test
} // namespace lockbox
