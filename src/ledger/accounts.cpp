// TALLY - Account Store
// Copyright (c) 2024 TALLY Developers
// MIT License

#include "tally/ledger/accounts.h"

#include <cctype>
#include <utility>

namespace tally {
namespace ledger {

namespace {

bool IsNumericRef(const std::string& ref) {
    if (ref.empty() || ref.size() > 19) return false;
    for (char c : ref) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

} // namespace

Amount TotalBalance(const std::vector<LogicalAccount>& accounts) {
    AmountSum sum = 0;
    for (const auto& account : accounts) {
        sum += account.balance;
    }
    if (sum > MAX_TREASURY) {
        LOG_ERROR(util::LogCategory::LEDGER) << "Stored balances exceed the treasury maximum";
        throw LedgerError(ErrorKind::StorageError, "stored balances exceed the treasury maximum");
    }
    return static_cast<Amount>(sum);
}

TreasuryStatus SummarizeTreasury(std::vector<LogicalAccount> activeAccounts) {
    TreasuryStatus status;
    status.accounts = std::move(activeAccounts);
    status.total = TotalBalance(status.accounts);

    for (const auto& account : status.accounts) {
        if (account.type != AccountType::RESERVE) continue;
        ReserveHealth& reserve = status.reserve;
        reserve.present = true;
        reserve.accountName = account.name;
        reserve.balance = account.balance;
        reserve.targetPercent = account.targetPercent;
        if (status.total > 0) {
            reserve.actualPercent = static_cast<double>(account.balance) /
                                    static_cast<double>(status.total) * 100.0;
            // balance / total >= 0.9 * target / 10000
            __int128 lhs = static_cast<__int128>(account.balance) * 100000;
            __int128 rhs = static_cast<__int128>(status.total) * account.targetPercent * 9;
            reserve.healthy = lhs >= rhs;
        }
        break;
    }
    return status;
}

AccountStore::AccountStore(db::LedgerDB& store, AuditLog& audit, AccountLockTable& locks,
                           RetryPolicy retry)
    : store_(store), audit_(audit), locks_(locks), retry_(retry) {}

LogicalAccount AccountStore::CreateAccount(const NewAccount& request, const std::string& actor) {
    if (request.name.empty() || request.name.size() > MAX_NAME_LENGTH) {
        throw LedgerError(ErrorKind::ValidationError,
                          "account name must be 1-" + std::to_string(MAX_NAME_LENGTH) + " characters");
    }
    if (IsNumericRef(request.name)) {
        throw LedgerError(ErrorKind::ValidationError, "account name must not be purely numeric");
    }
    if (request.targetPercent < 0 || request.targetPercent > FULL_PERCENT) {
        throw LedgerError(ErrorKind::ValidationError, "target percentage must be within 0-100");
    }

    LogicalAccount created = RunWithRetry(retry_, "CreateAccount", [&]() {
        if (FindAccountByName(request.name)) {
            throw LedgerError(ErrorKind::DuplicateAccount,
                              "account '" + request.name + "' already exists");
        }

        db::UnitOfWork uow(store_);
        LogicalAccount account;
        ThrowOnStorageError(store_.NextId(db::prefix::ACCOUNT, &account.id), "allocate account id");
        account.name = request.name;
        account.type = request.type;
        account.description = request.description;
        account.targetPercent = request.targetPercent;
        account.balance = 0;
        account.active = true;
        account.version = 1;
        account.createdAt = account.updatedAt = GetTime();

        uow.InsertAccount(account);
        uow.Claim(db::AccountNameKey(account.name), db::EncodeId(account.id));
        audit_.Record(uow, EntityType::ACCOUNT, account.id, AuditAction::CREATE,
                      {}, account.ToSnapshot(), actor);

        db::Status s = uow.Commit();
        if (s.IsAlreadyExists() && FindAccountByName(request.name)) {
            throw LedgerError(ErrorKind::DuplicateAccount,
                              "account '" + request.name + "' already exists");
        }
        ThrowOnStorageError(s, "commit account creation");
        return account;
    });

    LOG_INFO(util::LogCategory::LEDGER) << "Created account " << created.id << " '"
                                        << created.name << "' ("
                                        << AccountTypeToString(created.type) << ")";
    return created;
}

std::optional<LogicalAccount> AccountStore::FindAccount(AccountId id) const {
    LogicalAccount account;
    db::Status s = store_.ReadSnapshot().ReadAccount(id, &account);
    if (s.IsNotFound()) {
        return std::nullopt;
    }
    ThrowOnStorageError(s, "read account");
    return account;
}

std::optional<LogicalAccount> AccountStore::FindAccountByName(const std::string& name) const {
    auto snapshot = store_.ReadSnapshot();
    AccountId id = 0;
    db::Status s = snapshot.FindAccountByName(name, &id);
    if (s.IsNotFound()) {
        return std::nullopt;
    }
    ThrowOnStorageError(s, "read account name index");

    LogicalAccount account;
    s = snapshot.ReadAccount(id, &account);
    if (s.IsNotFound()) {
        return std::nullopt;
    }
    ThrowOnStorageError(s, "read account");
    return account;
}

std::optional<LogicalAccount> AccountStore::FindAccountByRef(const std::string& ref) const {
    if (IsNumericRef(ref)) {
        return FindAccount(std::stoull(ref));
    }
    return FindAccountByName(ref);
}

LogicalAccount AccountStore::GetAccount(AccountId id) const {
    auto account = FindAccount(id);
    if (!account) {
        throw LedgerError(ErrorKind::NotFound, "account " + std::to_string(id) + " not found");
    }
    return *account;
}

LogicalAccount AccountStore::GetAccountByName(const std::string& name) const {
    auto account = FindAccountByName(name);
    if (!account) {
        throw LedgerError(ErrorKind::NotFound, "account '" + name + "' not found");
    }
    return *account;
}

std::vector<LogicalAccount> AccountStore::ListAccounts(bool includeInactive) const {
    std::vector<LogicalAccount> accounts;
    db::Status s = store_.ReadSnapshot().ForEach<LogicalAccount>(db::prefix::ACCOUNT, false,
        [&](const LogicalAccount& account) {
            if (includeInactive || account.active) {
                accounts.push_back(account);
            }
            return true;
        });
    ThrowOnStorageError(s, "scan accounts");
    return accounts;
}

Amount AccountStore::TotalHoldings() const {
    return TotalBalance(ListAccounts(true));
}

LogicalAccount AccountStore::SetAccountActive(AccountId id, bool active, const std::string& actor) {
    LogicalAccount updated = RunWithRetry(retry_, "SetAccountActive", [&]() {
        auto guard = locks_.Acquire({id});
        db::UnitOfWork uow(store_);

        LogicalAccount* account = nullptr;
        db::Status s = uow.StageAccount(id, &account);
        if (s.IsNotFound()) {
            throw LedgerError(ErrorKind::NotFound, "account " + std::to_string(id) + " not found");
        }
        ThrowOnStorageError(s, "read account");

        if (account->active == active) {
            return *account;
        }

        Metadata before = account->ToSnapshot();
        account->active = active;
        account->updatedAt = GetTime();
        audit_.Record(uow, EntityType::ACCOUNT, id, AuditAction::UPDATE,
                      before, account->ToSnapshot(), actor);

        LogicalAccount result = *account;
        ThrowOnStorageError(uow.Commit(), "commit account update");
        result.version += 1;
        LOG_INFO(util::LogCategory::LEDGER) << "Account " << id << " '" << result.name << "' "
                                            << (active ? "activated" : "deactivated")
                                            << " by " << actor;
        return result;
    });
    return updated;
}

void AccountStore::AdjustBalance(db::UnitOfWork& uow, AccountId id, Amount delta,
                                 TransactionId transactionId) {
    LogicalAccount* account = nullptr;
    db::Status s = uow.StageAccount(id, &account);
    if (s.IsNotFound()) {
        throw LedgerError(ErrorKind::UnknownAccount, "account " + std::to_string(id) + " not found");
    }
    ThrowOnStorageError(s, "read account");

    Amount next = account->balance + delta;
    if (next < 0) {
        throw LedgerError(ErrorKind::InsufficientFunds,
                          "account '" + account->name + "' holds " + FormatAmount(account->balance) +
                          ", cannot debit " + FormatAmount(-delta));
    }
    LOG_TRACE(util::LogCategory::LEDGER) << "tx " << transactionId << ": account " << id
                                         << " " << FormatAmount(account->balance) << " -> "
                                         << FormatAmount(next);
    account->balance = next;
    account->updatedAt = GetTime();
}

void AccountStore::CheckStagedBalances(const db::UnitOfWork& uow) const {
    for (const auto& entry : uow.StagedAccounts()) {
        const LogicalAccount& account = entry.second;
        if (account.balance > MAX_MONEY) {
            throw LedgerError(ErrorKind::ValidationError,
                              "account '" + account.name + "' balance would exceed the maximum of " +
                              FormatAmount(MAX_MONEY));
        }
    }
}

} // namespace ledger
} // namespace tally
