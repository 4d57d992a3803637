// LOCKBOX - Ledger Store Implementation
// Copyright (c) 2024 LOCKBOX Developers
// MIT License

#include "lockbox/db/database.h"
#include "lockbox/db/leveldb.h"
#include "lockbox/util/logging.h"

#include <system_error>

#ifdef LOCKBOX_USE_LEVELDB
#include <leveldb/write_batch.h>
#endif

namespace lockbox {
namespace db {

std::string Status::ToString() const {
    switch (code_) {
        case OK: return "OK";
        case NOT_FOUND: return "NotFound: " + message_;
        case CORRUPTION: return "Corruption: " + message_;
        case NOT_SUPPORTED: return "NotSupported: " + message_;
        case IO_ERROR: return "IOError: " + message_;
    }
    return "Unknown: " + message_;
}

namespace {

bool HasPrefix(const std::string& key, const std::string& prefix) {
    return key.compare(0, prefix.size(), prefix) == 0;
}

Status CreateDirectory(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) {
        return Status::IOError(path.string() + ": " + ec.message());
    }
    return Status::Ok();
}

} // anonymous namespace

// ============================================================================
// MemoryDatabase
// ============================================================================

Status MemoryDatabase::Get(const std::string& key, std::string* value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = data_.find(key);
    if (it == data_.end()) {
        return Status::NotFound();
    }
    *value = it->second;
    return Status::Ok();
}

Status MemoryDatabase::Write(const WriteBatch& batch) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [key, value] : batch.Ops()) {
        if (value) {
            data_[key] = *value;
        } else {
            data_.erase(key);
        }
    }
    return Status::Ok();
}

Status MemoryDatabase::Scan(const std::string& prefix, const ScanVisitor& visit) {
    std::map<std::string, std::string> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot.insert(data_.lower_bound(prefix), data_.end());
    }
    for (const auto& [key, value] : snapshot) {
        if (!HasPrefix(key, prefix)) {
            break;
        }
        Status s = visit(key, value);
        if (!s.ok()) {
            return s;
        }
    }
    return Status::Ok();
}

// ============================================================================
// LevelDBDatabase
// ============================================================================

#ifdef LOCKBOX_USE_LEVELDB

Status FromLevelDB(const leveldb::Status& s) {
    if (s.ok()) return Status::Ok();
    if (s.IsNotFound()) return Status::NotFound(s.ToString());
    if (s.IsCorruption()) return Status::Corruption(s.ToString());
    if (s.IsNotSupportedError()) return Status::NotSupported(s.ToString());
    return Status::IOError(s.ToString());
}

Status LevelDBDatabase::Get(const std::string& key, std::string* value) {
    return FromLevelDB(db_->Get(leveldb::ReadOptions(), key, value));
}

Status LevelDBDatabase::Write(const WriteBatch& batch) {
    leveldb::WriteBatch lb;
    for (const auto& [key, value] : batch.Ops()) {
        if (value) {
            lb.Put(key, *value);
        } else {
            lb.Delete(key);
        }
    }
    // Each commit is one transaction; make it durable before memory changes
    leveldb::WriteOptions options;
    options.sync = true;
    return FromLevelDB(db_->Write(options, &lb));
}

Status LevelDBDatabase::Scan(const std::string& prefix, const ScanVisitor& visit) {
    leveldb::ReadOptions options;
    options.fill_cache = false;
    std::unique_ptr<leveldb::Iterator> it(db_->NewIterator(options));
    for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix); it->Next()) {
        Status s = visit(it->key().ToString(), it->value().ToString());
        if (!s.ok()) {
            return s;
        }
    }
    return FromLevelDB(it->status());
}

#endif // LOCKBOX_USE_LEVELDB

// ============================================================================
// Factory Functions
// ============================================================================

std::pair<Status, std::unique_ptr<Database>> OpenDatabase(const std::filesystem::path& path) {
    Status s = CreateDirectory(path);
    if (!s.ok()) {
        return {s, nullptr};
    }

#ifdef LOCKBOX_USE_LEVELDB
    leveldb::Options options;
    options.create_if_missing = true;
    options.paranoid_checks = true;

    leveldb::DB* handle = nullptr;
    leveldb::Status ls = leveldb::DB::Open(options, path.string(), &handle);
    if (!ls.ok()) {
        return {FromLevelDB(ls), nullptr};
    }
    LOG_DEBUG(util::LogCategory::DB) << "Opened LevelDB at " << path.string();
    return {Status::Ok(), std::make_unique<LevelDBDatabase>(handle)};
#else
    LOG_WARN(util::LogCategory::DB) << "Built without LevelDB; state at "
                                    << path.string() << " will not persist";
    return {Status::Ok(), std::make_unique<MemoryDatabase>()};
#endif
}

Status DestroyDatabase(const std::filesystem::path& path) {
#ifdef LOCKBOX_USE_LEVELDB
    return FromLevelDB(leveldb::DestroyDB(path.string(), leveldb::Options()));
#else
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    if (ec) {
        return Status::IOError(path.string() + ": " + ec.message());
    }
    return Status::Ok();
#endif
}

} // namespace db
} // namespace lockbox
