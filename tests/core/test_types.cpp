// LOCKBOX - Core Types Tests
// Copyright (c) 2024 LOCKBOX Developers
// MIT License

#include <gtest/gtest.h>
#include "lockbox/core/types.h"
#include "lockbox/core/serialize.h"

#include <set>

namespace lockbox {
namespace test {

// ============================================================================
// Checked Arithmetic Tests
// ============================================================================

TEST(CheckedArithmeticTest, AddWithinRange) {
    auto sum = CheckedAdd(1000, 2500);
    ASSERT_TRUE(sum.has_value());
    EXPECT_EQ(*sum, 3500u);
}

TEST(CheckedArithmeticTest, AddAtLimit) {
    auto sum = CheckedAdd(MAX_LAMPORTS - 1, 1);
    ASSERT_TRUE(sum.has_value());
    EXPECT_EQ(*sum, MAX_LAMPORTS);
}

TEST(CheckedArithmeticTest, AddOverflowIsRejected) {
    EXPECT_FALSE(CheckedAdd(MAX_LAMPORTS, 1).has_value());
    EXPECT_FALSE(CheckedAdd(1, MAX_LAMPORTS).has_value());
    EXPECT_FALSE(CheckedAdd(MAX_LAMPORTS / 2 + 1, MAX_LAMPORTS / 2 + 1).has_value());
}

TEST(CheckedArithmeticTest, SubUnderflowIsRejected) {
    EXPECT_EQ(*CheckedSub(10, 10), 0u);
    EXPECT_EQ(*CheckedSub(10, 3), 7u);
    EXPECT_FALSE(CheckedSub(3, 10).has_value());
}

TEST(TimeTest, GetTimeIsAfter2024) {
    EXPECT_GT(GetTime(), 1704067200);
}

// ============================================================================
// Hash256 Tests
// ============================================================================

TEST(Hash256Test, DefaultConstructorCreatesZeroHash) {
    Hash256 h;
    EXPECT_TRUE(h.IsNull());
    for (size_t i = 0; i < Hash256::SIZE; ++i) {
        EXPECT_EQ(h[i], 0);
    }
}

TEST(Hash256Test, SizeIs32Bytes) {
    EXPECT_EQ(Hash256::SIZE, 32u);
    Hash256 h;
    EXPECT_EQ(h.size(), 32u);
}

TEST(Hash256Test, ShortInputIsZeroPadded) {
    Byte raw[3] = {0xaa, 0xbb, 0xcc};
    Hash256 h(raw, sizeof(raw));
    EXPECT_EQ(h[0], 0xaa);
    EXPECT_EQ(h[2], 0xcc);
    EXPECT_EQ(h[3], 0x00);
    EXPECT_EQ(h[31], 0x00);
}

TEST(Hash256Test, LessThanOrdersBytewise) {
    std::array<Byte, 32> low{}, high{};
    high[31] = 0x01;
    EXPECT_LT(Hash256(low), Hash256(high));
    EXPECT_FALSE(Hash256(high) < Hash256(low));
}

TEST(Hash256Test, HexRoundTrip) {
    std::string hex = "000102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f";
    Hash256 h = Hash256::FromHex(hex);
    EXPECT_EQ(h[0], 0x00);
    EXPECT_EQ(h[31], 0x1f);
    EXPECT_EQ(h.ToHex(), hex);
}

TEST(Hash256Test, FromHexRejectsWrongLength) {
    EXPECT_THROW(Hash256::FromHex("abcd"), std::invalid_argument);
}

// ============================================================================
// Address Tests
// ============================================================================

TEST(AddressTest, ConstructFromHash) {
    std::array<Byte, 32> data;
    data.fill(0x42);
    Hash256 h(data);
    Address addr(h);
    EXPECT_EQ(addr[0], 0x42);
    EXPECT_EQ(addr.ToHex(), h.ToHex());
}

TEST(AddressTest, ShortString) {
    Address addr = Address::FromHex(
        "deadbeef00000000000000000000000000000000000000000000000000000000");
    EXPECT_EQ(addr.ToShortString(), "deadbeef..");
}

TEST(AddressTest, UsableAsOrderedKey) {
    std::set<Address> addresses;
    std::array<Byte, 32> a{}, b{};
    b[0] = 1;
    addresses.insert(Address(a.data(), a.size()));
    addresses.insert(Address(b.data(), b.size()));
    addresses.insert(Address(a.data(), a.size()));
    EXPECT_EQ(addresses.size(), 2u);
}

// ============================================================================
// Hex Tests
// ============================================================================

TEST(HexTest, EncodeBytes) {
    std::vector<Byte> bytes = {0x00, 0x7f, 0xff, 0x10};
    EXPECT_EQ(HexEncode(bytes), "007fff10");
}

TEST(HexTest, DecodeMixedCase) {
    std::vector<Byte> bytes = HexDecode("DeadBEEF");
    ASSERT_EQ(bytes.size(), 4u);
    EXPECT_EQ(bytes[0], 0xde);
    EXPECT_EQ(bytes[3], 0xef);
}

TEST(HexTest, DecodeRejectsOddLength) {
    EXPECT_THROW(HexDecode("abc"), std::invalid_argument);
}

TEST(HexTest, DecodeRejectsBadCharacter) {
    EXPECT_THROW(HexDecode("zz"), std::invalid_argument);
}

TEST(HexTest, IsHex) {
    EXPECT_TRUE(IsHex("00ff"));
    EXPECT_FALSE(IsHex(""));
    EXPECT_FALSE(IsHex("0"));
    EXPECT_FALSE(IsHex("0g"));
}

// ============================================================================
// Serialization Tests
// ============================================================================

TEST(SerializeTest, IntegersAreLittleEndian) {
    DataStream ss;
    ser_writedata64(ss, 0x0102030405060708ULL);
    const auto& data = ss.Data();
    ASSERT_EQ(data.size(), 8u);
    EXPECT_EQ(data[0], 0x08);
    EXPECT_EQ(data[7], 0x01);
}

TEST(SerializeTest, ReadPastEndThrows) {
    std::vector<Byte> bytes = {0x01, 0x02, 0x03};
    DataStream ss(bytes);
    EXPECT_THROW(ser_readdata64(ss), std::ios_base::failure);
}

TEST(SerializeTest, BoolRejectsValuesAboveOne) {
    std::vector<Byte> bytes = {0x02};
    DataStream ss(bytes);
    bool value = false;
    EXPECT_THROW(Unserialize(ss, value), std::ios_base::failure);
}

TEST(SerializeTest, BytesCarryLengthPrefix) {
    DataStream ss;
    WriteBytes(ss, std::vector<Byte>{0xaa, 0xbb});
    EXPECT_EQ(ss.Remaining(), 6u);

    std::vector<Byte> out = ReadBytes(ss);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[1], 0xbb);
    EXPECT_TRUE(ss.AtEnd());
}

TEST(SerializeTest, OversizedBytesRejected) {
    DataStream ss;
    ser_writedata32(ss, 0xFFFFFFFF);
    EXPECT_THROW(ReadBytes(ss), std::ios_base::failure);
}

} // namespace test
} // namespace lockbox
