// LOCKBOX - Instruction Codec Tests
// Copyright (c) 2024 LOCKBOX Developers
// MIT License

#include <gtest/gtest.h>
#include "lockbox/program/instruction.h"
#include "lockbox/program/pda.h"
#include "lockbox/crypto/keys.h"
#include "lockbox/crypto/sha256.h"

namespace lockbox {
namespace test {

class InstructionTest : public ::testing::Test {
protected:
    void SetUp() override {
        programId_ = DefaultProgramId();
        owner_ = PrivateKey::Generate().GetAddress();
        auto accounts = DeriveAccounts(owner_, programId_);
        ASSERT_TRUE(accounts.has_value());
        accounts_ = *accounts;
    }
    
    Address programId_;
    Address owner_;
    InstructionAccounts accounts_;
};

// ============================================================================
// Discriminator Tests
// ============================================================================

TEST_F(InstructionTest, DiscriminatorsUseGlobalNamespace) {
    Hash256 hash = SHA256Hash(std::string("global:deposit"));
    const Discriminator& disc = InstructionDiscriminator(InstructionKind::Deposit);
    for (size_t i = 0; i < disc.size(); ++i) {
        EXPECT_EQ(disc[i], hash[i]);
    }
}

TEST_F(InstructionTest, DiscriminatorsAreDistinct) {
    std::vector<InstructionKind> kinds = {
        InstructionKind::InitializeLockBox, InstructionKind::Deposit,
        InstructionKind::Withdraw, InstructionKind::EmergencyWithdraw,
        InstructionKind::CloseLockBox,
    };
    for (size_t i = 0; i < kinds.size(); ++i) {
        for (size_t j = i + 1; j < kinds.size(); ++j) {
            EXPECT_NE(InstructionDiscriminator(kinds[i]), InstructionDiscriminator(kinds[j]));
        }
    }
}

TEST_F(InstructionTest, KindNames) {
    EXPECT_STREQ(InstructionKindToString(InstructionKind::InitializeLockBox), "initialize_lockbox");
    EXPECT_STREQ(InstructionKindToString(InstructionKind::EmergencyWithdraw), "emergency_withdraw");
    EXPECT_STREQ(InstructionKindToString(InstructionKind::CloseLockBox), "close_lockbox");
}

// ============================================================================
// Encoding Tests
// ============================================================================

TEST_F(InstructionTest, AmountInstructionsCarryU64) {
    auto ix = MakeDeposit(owner_, 0x0102030405060708ULL, programId_);
    ASSERT_TRUE(ix.has_value());
    
    std::vector<Byte> data = ix->EncodeData();
    ASSERT_EQ(data.size(), 16u);
    EXPECT_EQ(data[8], 0x08);
    EXPECT_EQ(data[15], 0x01);
}

TEST_F(InstructionTest, NoArgumentInstructionsAreDiscriminatorOnly) {
    auto emergency = MakeEmergencyWithdraw(owner_, programId_);
    auto close = MakeClose(owner_, programId_);
    ASSERT_TRUE(emergency && close);
    EXPECT_EQ(emergency->EncodeData().size(), 8u);
    EXPECT_EQ(close->EncodeData().size(), 8u);
}

TEST_F(InstructionTest, DecodeEncodedData) {
    auto ix = MakeWithdraw(owner_, 42, programId_);
    ASSERT_TRUE(ix.has_value());
    
    LockBoxError error;
    auto decoded = DecodeInstructionData(ix->EncodeData(), accounts_, error);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(error, LockBoxError::OK);
    EXPECT_EQ(*decoded, *ix);
}

TEST_F(InstructionTest, DecodeRejectsUnknownDiscriminator) {
    std::vector<Byte> data(16, 0x00);
    LockBoxError error = LockBoxError::OK;
    EXPECT_FALSE(DecodeInstructionData(data, accounts_, error).has_value());
    EXPECT_EQ(error, LockBoxError::InvalidInstruction);
}

TEST_F(InstructionTest, DecodeRejectsTruncatedAmount) {
    auto ix = MakeDeposit(owner_, 1000, programId_);
    std::vector<Byte> data = ix->EncodeData();
    data.resize(12);
    
    LockBoxError error = LockBoxError::OK;
    EXPECT_FALSE(DecodeInstructionData(data, accounts_, error).has_value());
    EXPECT_EQ(error, LockBoxError::InvalidInstruction);
}

TEST_F(InstructionTest, DecodeRejectsTrailingBytes) {
    auto ix = MakeClose(owner_, programId_);
    std::vector<Byte> data = ix->EncodeData();
    data.push_back(0x00);
    
    LockBoxError error = LockBoxError::OK;
    EXPECT_FALSE(DecodeInstructionData(data, accounts_, error).has_value());
    EXPECT_EQ(error, LockBoxError::InvalidInstruction);
}

TEST_F(InstructionTest, DecodeRejectsEmptyData) {
    LockBoxError error = LockBoxError::OK;
    EXPECT_FALSE(DecodeInstructionData({}, accounts_, error).has_value());
    EXPECT_EQ(error, LockBoxError::InvalidInstruction);
}

// ============================================================================
// Full Instruction Tests
// ============================================================================

TEST_F(InstructionTest, SerializedInstructionDecodes) {
    auto ix = MakeInitialize(owner_, 5000000000ULL, programId_);
    ASSERT_TRUE(ix.has_value());
    
    LockBoxError error;
    auto decoded = DeserializeInstruction(ix->Serialize(), error);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, *ix);
}

TEST_F(InstructionTest, DeserializeRejectsTruncatedAccounts) {
    auto ix = MakeDeposit(owner_, 1, programId_);
    std::vector<Byte> bytes = ix->Serialize();
    bytes.resize(50);
    
    LockBoxError error = LockBoxError::OK;
    EXPECT_FALSE(DeserializeInstruction(bytes, error).has_value());
    EXPECT_EQ(error, LockBoxError::InvalidInstruction);
}

TEST_F(InstructionTest, BuildersDeriveAccounts) {
    auto ix = MakeDeposit(owner_, 1, programId_);
    ASSERT_TRUE(ix.has_value());
    EXPECT_EQ(ix->accounts, accounts_);
    EXPECT_EQ(ix->accounts.owner, owner_);
    
    auto lockbox = DeriveLockBoxAddress(owner_, programId_);
    ASSERT_TRUE(lockbox.has_value());
    EXPECT_EQ(ix->accounts.lockbox, lockbox->first);
}

TEST_F(InstructionTest, ToStringNamesKind) {
    auto ix = MakeDeposit(owner_, 77, programId_);
    EXPECT_EQ(ix->ToString().rfind("deposit(77)", 0), 0u);
}

} // namespace test
} // namespace lockbox
