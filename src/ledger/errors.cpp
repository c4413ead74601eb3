// TALLY - Ledger Errors
// Copyright (c) 2024 TALLY Developers
// MIT License

#include "tally/ledger/errors.h"

namespace tally {
namespace ledger {

const char* ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ValidationError:          return "ValidationError";
        case ErrorKind::UnknownAccount:           return "UnknownAccount";
        case ErrorKind::InvalidTransactionShape:  return "InvalidTransactionShape";
        case ErrorKind::DuplicateAccount:         return "DuplicateAccount";
        case ErrorKind::DuplicateRule:            return "DuplicateRule";
        case ErrorKind::NotFound:                 return "NotFound";
        case ErrorKind::InsufficientFunds:        return "InsufficientFunds";
        case ErrorKind::NoApplicableRule:         return "NoApplicableRule";
        case ErrorKind::InvalidRuleConfiguration: return "InvalidRuleConfiguration";
        case ErrorKind::TransientConflict:        return "TransientConflict";
        case ErrorKind::AlreadyResolved:          return "AlreadyResolved";
        case ErrorKind::InvalidToken:             return "InvalidToken";
        case ErrorKind::TokenExpired:             return "TokenExpired";
        case ErrorKind::InsufficientRole:         return "InsufficientRole";
        case ErrorKind::StorageError:             return "StorageError";
    }
    return "Unknown";
}

} // namespace ledger
} // namespace tally
