// TALLY - Ledger Errors
// Copyright (c) 2024 TALLY Developers
// MIT License

#ifndef TALLY_LEDGER_ERRORS_H
#define TALLY_LEDGER_ERRORS_H

#include <stdexcept>
#include <string>

namespace tally {
namespace ledger {

/// Machine-readable failure kinds reported to callers
enum class ErrorKind {
    ValidationError,
    UnknownAccount,
    InvalidTransactionShape,
    DuplicateAccount,
    DuplicateRule,
    NotFound,
    InsufficientFunds,
    NoApplicableRule,
    InvalidRuleConfiguration,
    TransientConflict,
    AlreadyResolved,
    InvalidToken,
    TokenExpired,
    InsufficientRole,
    StorageError,
};

/// Name used in API error bodies (e.g. "InsufficientFunds")
const char* ErrorKindToString(ErrorKind kind);

/// Domain failure raised by the ledger components
class LedgerError : public std::runtime_error {
public:
    LedgerError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind Kind() const { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace ledger
} // namespace tally

#endif // TALLY_LEDGER_ERRORS_H
