// LOCKBOX - Ledger Store
// Copyright (c) 2024 LOCKBOX Developers
// MIT License
//
// Key-value store behind the ledger. The ledger reads everything once at
// startup and afterwards only writes one batch per committed transaction,
// so the interface is a point lookup, an atomic batch and a prefix scan.
// LevelDB backs it when the build finds the library; otherwise an
// in-memory map is used.

#ifndef LOCKBOX_DB_DATABASE_H
#define LOCKBOX_DB_DATABASE_H

#include "lockbox/core/types.h"

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace lockbox {
namespace db {

// ============================================================================
// Status
// ============================================================================

/**
 * Outcome of a store operation.
 */
class Status {
public:
    enum Code {
        OK = 0,
        NOT_FOUND,
        CORRUPTION,
        NOT_SUPPORTED,
        IO_ERROR,
    };

    Status() = default;

    static Status Ok() { return Status(); }
    static Status NotFound(std::string msg = "") { return Status(NOT_FOUND, std::move(msg)); }
    static Status Corruption(std::string msg = "") { return Status(CORRUPTION, std::move(msg)); }
    static Status NotSupported(std::string msg = "") { return Status(NOT_SUPPORTED, std::move(msg)); }
    static Status IOError(std::string msg = "") { return Status(IO_ERROR, std::move(msg)); }

    bool ok() const { return code_ == OK; }
    bool IsNotFound() const { return code_ == NOT_FOUND; }
    bool IsCorruption() const { return code_ == CORRUPTION; }

    Code code() const { return code_; }
    const std::string& message() const { return message_; }

    /// "Corruption: bad account record"
    std::string ToString() const;

private:
    Status(Code code, std::string msg) : code_(code), message_(std::move(msg)) {}

    Code code_ = OK;
    std::string message_;
};

// ============================================================================
// WriteBatch
// ============================================================================

/**
 * Puts and deletes applied together by Database::Write, in insertion order.
 * A delete is a put without a value.
 */
class WriteBatch {
public:
    using Op = std::pair<std::string, std::optional<std::string>>;

    void Put(const std::string& key, std::string value) {
        ops_.emplace_back(key, std::move(value));
    }

    void Put(const std::string& key, const std::vector<Byte>& value) {
        ops_.emplace_back(key, std::string(value.begin(), value.end()));
    }

    void Delete(const std::string& key) { ops_.emplace_back(key, std::nullopt); }

    size_t Count() const { return ops_.size(); }
    const std::vector<Op>& Ops() const { return ops_; }

private:
    std::vector<Op> ops_;
};

// ============================================================================
// Database
// ============================================================================

/// Scan callback; a non-OK return stops the scan and is passed back
using ScanVisitor = std::function<Status(const std::string& key, const std::string& value)>;

class Database {
public:
    virtual ~Database() = default;

    /// NotFound when the key is absent
    virtual Status Get(const std::string& key, std::string* value) = 0;

    /// All or nothing
    virtual Status Write(const WriteBatch& batch) = 0;

    /// Visit keys starting with prefix in ascending order; "" visits everything
    virtual Status Scan(const std::string& prefix, const ScanVisitor& visit) = 0;

    /// Whether data survives reopening the same path
    virtual bool IsPersistent() const = 0;
};

/**
 * Open the store under path, creating the directory.
 * Without LevelDB this returns an empty MemoryDatabase and logs a warning.
 */
std::pair<Status, std::unique_ptr<Database>> OpenDatabase(const std::filesystem::path& path);

/// Remove everything stored under path
Status DestroyDatabase(const std::filesystem::path& path);

// ============================================================================
// Keys
// ============================================================================

namespace prefix {
    constexpr char ACCOUNT = 'a';       // address -> account record
    constexpr char PROCESSED_TX = 't';  // message hash -> slot
    constexpr char META = 'm';          // name -> value
}

inline std::string MakeKey(char prefix, const std::string& name) {
    return prefix + name;
}

/// Prefix byte followed by the raw 32 bytes
template<size_t BITS>
std::string MakeKey(char prefix, const BaseHash<BITS>& hash) {
    std::string key(1, prefix);
    key.append(reinterpret_cast<const char*>(hash.data()), hash.size());
    return key;
}

} // namespace db
} // namespace lockbox

#endif // LOCKBOX_DB_DATABASE_H
