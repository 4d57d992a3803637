// LOCKBOX - Database Tests
// Copyright (c) 2024 LOCKBOX Developers
// MIT License

#include <gtest/gtest.h>
#include "lockbox/db/database.h"
#include "lockbox/db/leveldb.h"
#include "lockbox/crypto/sha256.h"

#include <filesystem>
#include <random>

namespace lockbox {
namespace db {
namespace test {

// ============================================================================
// Test Utilities
// ============================================================================

class DatabaseTest : public ::testing::Test {
protected:
    std::filesystem::path testDir_;
    
    void SetUp() override {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 999999);
        
        testDir_ = std::filesystem::temp_directory_path() /
                   ("lockbox_db_test_" + std::to_string(dis(gen)));
        std::filesystem::create_directories(testDir_);
    }
    
    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(testDir_, ec);
    }
};

class MemoryDatabaseTest : public ::testing::Test {
protected:
    MemoryDatabase db_;
};

// ============================================================================
// Status Tests
// ============================================================================

TEST(StatusTest, DefaultIsOk) {
    Status s;
    EXPECT_TRUE(s.ok());
    EXPECT_EQ(s.ToString(), "OK");
}

TEST(StatusTest, ToStringCarriesMessage) {
    EXPECT_EQ(Status::NotFound("missing").ToString(), "NotFound: missing");
    EXPECT_EQ(Status::Corruption("bad record").ToString(), "Corruption: bad record");
    EXPECT_EQ(Status::IOError("disk").ToString(), "IOError: disk");
    EXPECT_TRUE(Status::Corruption().IsCorruption());
    EXPECT_FALSE(Status::IOError().ok());
}

// ============================================================================
// Key Tests
// ============================================================================

TEST(KeyTest, PrefixedKeys) {
    EXPECT_EQ(MakeKey(prefix::META, "slot"), "mslot");
    
    Hash256 hash = SHA256Hash(std::string("key"));
    std::string key = MakeKey(prefix::PROCESSED_TX, hash);
    ASSERT_EQ(key.size(), 33u);
    EXPECT_EQ(key[0], 't');
    EXPECT_EQ(static_cast<uint8_t>(key[1]), hash[0]);
    EXPECT_EQ(static_cast<uint8_t>(key[32]), hash[31]);
}

// ============================================================================
// Memory Database Tests
// ============================================================================

TEST_F(MemoryDatabaseTest, GetMissingKeyIsNotFound) {
    std::string value = "untouched";
    EXPECT_TRUE(db_.Get("absent", &value).IsNotFound());
    EXPECT_EQ(value, "untouched");
}

TEST_F(MemoryDatabaseTest, BatchAppliesInOrder) {
    WriteBatch setup;
    setup.Put("old", "x");
    ASSERT_TRUE(db_.Write(setup).ok());
    
    WriteBatch batch;
    batch.Put("a", "1");
    batch.Put("b", "2");
    batch.Delete("old");
    batch.Delete("never-there");
    batch.Put("a", "3");
    EXPECT_EQ(batch.Count(), 5u);
    
    ASSERT_TRUE(db_.Write(batch).ok());
    
    std::string value;
    ASSERT_TRUE(db_.Get("a", &value).ok());
    EXPECT_EQ(value, "3");
    EXPECT_TRUE(db_.Get("old", &value).IsNotFound());
    EXPECT_EQ(db_.Size(), 2u);
}

TEST_F(MemoryDatabaseTest, BinaryValues) {
    std::vector<Byte> bytes = {0x00, 0xff, 0x00, 0x01};
    WriteBatch batch;
    batch.Put("bin", bytes);
    ASSERT_TRUE(db_.Write(batch).ok());
    
    std::string value;
    ASSERT_TRUE(db_.Get("bin", &value).ok());
    EXPECT_EQ(std::vector<Byte>(value.begin(), value.end()), bytes);
}

TEST_F(MemoryDatabaseTest, ScanVisitsPrefixInOrder) {
    WriteBatch batch;
    batch.Put(MakeKey(prefix::ACCOUNT, "y"), "2");
    batch.Put(MakeKey(prefix::META, "slot"), "3");
    batch.Put(MakeKey(prefix::ACCOUNT, "x"), "1");
    batch.Put(MakeKey(prefix::PROCESSED_TX, "h"), "4");
    ASSERT_TRUE(db_.Write(batch).ok());
    
    std::string seen;
    Status s = db_.Scan(std::string(1, prefix::ACCOUNT),
                        [&](const std::string& key, const std::string& value) {
        seen += key + "=" + value + ";";
        return Status::Ok();
    });
    ASSERT_TRUE(s.ok());
    EXPECT_EQ(seen, "ax=1;ay=2;");
    
    std::string all;
    ASSERT_TRUE(db_.Scan("", [&](const std::string& key, const std::string&) {
        all += key[0];
        return Status::Ok();
    }).ok());
    EXPECT_EQ(all, "aamt");
}

TEST_F(MemoryDatabaseTest, ScanStopsAtFirstError) {
    WriteBatch batch;
    batch.Put("a", "1");
    batch.Put("b", "bad");
    batch.Put("c", "3");
    ASSERT_TRUE(db_.Write(batch).ok());
    
    int visited = 0;
    Status s = db_.Scan("", [&](const std::string&, const std::string& value) {
        ++visited;
        return value == "bad" ? Status::Corruption("bad value") : Status::Ok();
    });
    EXPECT_TRUE(s.IsCorruption());
    EXPECT_EQ(s.message(), "bad value");
    EXPECT_EQ(visited, 2);
}

TEST_F(MemoryDatabaseTest, VisitorMayWriteDuringScan) {
    WriteBatch batch;
    batch.Put("a", "1");
    ASSERT_TRUE(db_.Write(batch).ok());
    
    Status s = db_.Scan("", [this](const std::string& key, const std::string&) {
        WriteBatch copy;
        copy.Put(key + "-copy", "x");
        return db_.Write(copy);
    });
    ASSERT_TRUE(s.ok());
    EXPECT_EQ(db_.Size(), 2u);
}

TEST_F(MemoryDatabaseTest, NotPersistent) {
    EXPECT_FALSE(db_.IsPersistent());
}

// ============================================================================
// Factory Tests
// ============================================================================

TEST_F(DatabaseTest, OpenCreatesDirectory) {
    auto path = testDir_ / "ledger";
    auto [status, db] = OpenDatabase(path);
    ASSERT_TRUE(status.ok()) << status.ToString();
    ASSERT_NE(db, nullptr);
    EXPECT_TRUE(std::filesystem::exists(path));
    
    WriteBatch batch;
    batch.Put("k", "v");
    ASSERT_TRUE(db->Write(batch).ok());
    std::string value;
    ASSERT_TRUE(db->Get("k", &value).ok());
    EXPECT_EQ(value, "v");
}

TEST_F(DatabaseTest, ReopenKeepsDataWhenPersistent) {
    auto path = testDir_ / "ledger";
    bool persistent = false;
    {
        auto [status, db] = OpenDatabase(path);
        ASSERT_TRUE(status.ok());
        persistent = db->IsPersistent();
        WriteBatch batch;
        batch.Put(MakeKey(prefix::META, "slot"), "7");
        ASSERT_TRUE(db->Write(batch).ok());
    }
    
    auto [status, db] = OpenDatabase(path);
    ASSERT_TRUE(status.ok());
    std::string value;
    Status s = db->Get(MakeKey(prefix::META, "slot"), &value);
    if (persistent) {
        ASSERT_TRUE(s.ok());
        EXPECT_EQ(value, "7");
    } else {
        EXPECT_TRUE(s.IsNotFound());
    }
}

TEST_F(DatabaseTest, DestroyRemovesData) {
    auto path = testDir_ / "ledger";
    {
        auto [status, db] = OpenDatabase(path);
        ASSERT_TRUE(status.ok());
        WriteBatch batch;
        batch.Put("k", "v");
        ASSERT_TRUE(db->Write(batch).ok());
    }
    
    ASSERT_TRUE(DestroyDatabase(path).ok());
    
    auto [status, db] = OpenDatabase(path);
    ASSERT_TRUE(status.ok());
    std::string value;
    EXPECT_TRUE(db->Get("k", &value).IsNotFound());
}

} // namespace test
} // namespace db
} // namespace lockbox
