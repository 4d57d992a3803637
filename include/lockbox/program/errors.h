// LOCKBOX - Program Errors
// Copyright (c) 2024 LOCKBOX Developers
// MIT License

#ifndef LOCKBOX_PROGRAM_ERRORS_H
#define LOCKBOX_PROGRAM_ERRORS_H

#include <cstdint>
#include <string>

namespace lockbox {

/// Custom program error codes start here
constexpr uint32_t PROGRAM_ERROR_BASE = 6000;

/**
 * Result of every program handler and host primitive.
 * 
 * Values are grouped as: program errors (reported with codes 6000+),
 * account constraint errors raised while validating inputs, and host errors
 * raised by the ledger while moving value or checking transactions.
 */
enum class LockBoxError : uint8_t {
    OK = 0,
    
    // Program errors
    Unauthorized,
    InactiveLockBox,
    TargetNotReached,
    InsufficientBalance,
    InvalidAmount,
    InvalidTarget,
    ArithmeticOverflow,
    AlreadyInitialized,
    InvalidVault,
    
    // Account constraint errors
    InvalidInstruction,
    ConstraintSeeds,
    AccountNotInitialized,
    AccountDataCorrupt,
    
    // Host errors
    InsufficientFunds,
    MissingRequiredSignature,
    IllegalOwner,
    AccountNotFound,
    InvalidSignature,
    DuplicateTransaction,
    StorageError,
};

/// Error name, e.g. "TargetNotReached"
const char* LockBoxErrorToString(LockBoxError error);

/// Human readable message
const char* LockBoxErrorMessage(LockBoxError error);

/// Numeric code as reported in transaction receipts (0 for OK)
uint32_t LockBoxErrorCode(LockBoxError error);

/// True for errors defined by the program itself
bool IsProgramError(LockBoxError error);

/// "Error 6002 (TargetNotReached): Target amount not reached"
std::string FormatLockBoxError(LockBoxError error);

} // namespace lockbox

#endif // LOCKBOX_PROGRAM_ERRORS_H
