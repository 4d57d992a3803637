// LOCKBOX - Program Errors Implementation
// Copyright (c) 2024 LOCKBOX Developers
// MIT License

#include "lockbox/program/errors.h"

#include <sstream>

namespace lockbox {

const char* LockBoxErrorToString(LockBoxError error) {
    switch (error) {
        case LockBoxError::OK: return "OK";
        case LockBoxError::Unauthorized: return "Unauthorized";
        case LockBoxError::InactiveLockBox: return "InactiveLockBox";
        case LockBoxError::TargetNotReached: return "TargetNotReached";
        case LockBoxError::InsufficientBalance: return "InsufficientBalance";
        case LockBoxError::InvalidAmount: return "InvalidAmount";
        case LockBoxError::InvalidTarget: return "InvalidTarget";
        case LockBoxError::ArithmeticOverflow: return "ArithmeticOverflow";
        case LockBoxError::AlreadyInitialized: return "AlreadyInitialized";
        case LockBoxError::InvalidVault: return "InvalidVault";
        case LockBoxError::InvalidInstruction: return "InvalidInstruction";
        case LockBoxError::ConstraintSeeds: return "ConstraintSeeds";
        case LockBoxError::AccountNotInitialized: return "AccountNotInitialized";
        case LockBoxError::AccountDataCorrupt: return "AccountDataCorrupt";
        case LockBoxError::InsufficientFunds: return "InsufficientFunds";
        case LockBoxError::MissingRequiredSignature: return "MissingRequiredSignature";
        case LockBoxError::IllegalOwner: return "IllegalOwner";
        case LockBoxError::AccountNotFound: return "AccountNotFound";
        case LockBoxError::InvalidSignature: return "InvalidSignature";
        case LockBoxError::DuplicateTransaction: return "DuplicateTransaction";
        case LockBoxError::StorageError: return "StorageError";
        default: return "Unknown";
    }
}

const char* LockBoxErrorMessage(LockBoxError error) {
    switch (error) {
        case LockBoxError::OK: return "Success";
        case LockBoxError::Unauthorized: return "Unauthorized access";
        case LockBoxError::InactiveLockBox: return "LockBox is not active";
        case LockBoxError::TargetNotReached: return "Target amount not reached";
        case LockBoxError::InsufficientBalance: return "Insufficient balance in vault";
        case LockBoxError::InvalidAmount: return "Amount must be greater than zero";
        case LockBoxError::InvalidTarget: return "Target amount must be greater than zero";
        case LockBoxError::ArithmeticOverflow: return "Arithmetic overflow";
        case LockBoxError::AlreadyInitialized: return "LockBox already initialized";
        case LockBoxError::InvalidVault: return "Vault does not match its derived address";
        case LockBoxError::InvalidInstruction: return "Instruction data could not be decoded";
        case LockBoxError::ConstraintSeeds: return "A seeds constraint was violated";
        case LockBoxError::AccountNotInitialized: return "The account is not initialized";
        case LockBoxError::AccountDataCorrupt: return "Account data could not be decoded";
        case LockBoxError::InsufficientFunds: return "Insufficient funds for transfer";
        case LockBoxError::MissingRequiredSignature: return "Missing required signature";
        case LockBoxError::IllegalOwner: return "Account is not owned by the program";
        case LockBoxError::AccountNotFound: return "Account not found";
        case LockBoxError::InvalidSignature: return "Transaction signature verification failed";
        case LockBoxError::DuplicateTransaction: return "Transaction already processed";
        case LockBoxError::StorageError: return "Ledger storage failure";
        default: return "Unknown error";
    }
}

uint32_t LockBoxErrorCode(LockBoxError error) {
    switch (error) {
        case LockBoxError::OK:
            return 0;
        // Framework error numbers
        case LockBoxError::InvalidInstruction: return 102;
        case LockBoxError::ConstraintSeeds: return 2006;
        case LockBoxError::AccountDataCorrupt: return 3003;
        case LockBoxError::AccountNotInitialized: return 3012;
        default:
            break;
    }
    if (IsProgramError(error)) {
        return PROGRAM_ERROR_BASE +
               static_cast<uint32_t>(error) - static_cast<uint32_t>(LockBoxError::Unauthorized);
    }
    // Host errors are numbered from 1 in declaration order
    return 1 + static_cast<uint32_t>(error) - static_cast<uint32_t>(LockBoxError::InsufficientFunds);
}

bool IsProgramError(LockBoxError error) {
    return error >= LockBoxError::Unauthorized && error <= LockBoxError::InvalidVault;
}

std::string FormatLockBoxError(LockBoxError error) {
    std::ostringstream ss;
    ss << "Error " << LockBoxErrorCode(error) << " (" << LockBoxErrorToString(error)
       << "): " << LockBoxErrorMessage(error);
    return ss.str();
}

} // namespace lockbox
