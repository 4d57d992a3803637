// LOCKBOX - Store Backends
// Copyright (c) 2024 LOCKBOX Developers
// MIT License
//
// LevelDB backend, and the in-memory backend used by tests and by builds
// without LevelDB.

#ifndef LOCKBOX_DB_LEVELDB_H
#define LOCKBOX_DB_LEVELDB_H

#include "lockbox/db/database.h"

#include <map>
#include <mutex>

#ifdef LOCKBOX_USE_LEVELDB
#include <leveldb/db.h>
#endif

namespace lockbox {
namespace db {

#ifdef LOCKBOX_USE_LEVELDB

/// Map a LevelDB status onto ours
Status FromLevelDB(const leveldb::Status& s);

class LevelDBDatabase : public Database {
public:
    /// Takes ownership of an open handle
    explicit LevelDBDatabase(leveldb::DB* db) : db_(db) {}

    Status Get(const std::string& key, std::string* value) override;
    Status Write(const WriteBatch& batch) override;
    Status Scan(const std::string& prefix, const ScanVisitor& visit) override;
    bool IsPersistent() const override { return true; }

private:
    std::unique_ptr<leveldb::DB> db_;
};

#endif // LOCKBOX_USE_LEVELDB

/**
 * Ordered map guarded by a mutex. Scan visits a copy, so a visitor may
 * write to the database it is scanning.
 */
class MemoryDatabase : public Database {
public:
    Status Get(const std::string& key, std::string* value) override;
    Status Write(const WriteBatch& batch) override;
    Status Scan(const std::string& prefix, const ScanVisitor& visit) override;
    bool IsPersistent() const override { return false; }

    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return data_.size();
    }

private:
    std::map<std::string, std::string> data_;
    mutable std::mutex mutex_;
};

} // namespace db
} // namespace lockbox

#endif // LOCKBOX_DB_LEVELDB_H
