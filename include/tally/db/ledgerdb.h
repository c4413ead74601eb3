// TALLY - Ledger Database
// Copyright (c) 2024 TALLY Developers
// MIT License
//
// Typed storage for the treasury ledger on top of the key-value Database.
// Reads run under a shared lock (Snapshot); every mutation is staged in a
// UnitOfWork and applied by Commit as one atomic WriteBatch under an
// exclusive lock, after checking account versions, expected values and
// unique-key claims.

#ifndef TALLY_DB_LEDGERDB_H
#define TALLY_DB_LEDGERDB_H

#include "tally/db/database.h"
#include "tally/ledger/types.h"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace tally {
namespace db {

class LedgerDB;

// ============================================================================
// Key Builders
// ============================================================================

inline std::string AccountKey(ledger::AccountId id) { return MakeIdKey(prefix::ACCOUNT, id); }
inline std::string AccountNameKey(const std::string& name) { return MakeKey(prefix::ACCOUNT_NAME, name); }
inline std::string TransactionKey(ledger::TransactionId id) { return MakeIdKey(prefix::TRANSACTION, id); }
inline std::string ExternalRefKey(const std::string& ref) { return MakeKey(prefix::EXTERNAL_REF, ref); }
inline std::string RuleKey(ledger::RuleId id) { return MakeIdKey(prefix::RULE, id); }
inline std::string RuleNameKey(const std::string& name) { return MakeKey(prefix::RULE_NAME, name); }
inline std::string AuditKey(ledger::AuditId id) { return MakeIdKey(prefix::AUDIT, id); }
inline std::string ReconciliationKey(ledger::ReconciliationId id) {
    return MakeIdKey(prefix::RECONCILIATION, id);
}

/// Idempotency key of one allocation child: parent deposit + target account
inline std::string AllocationKey(ledger::TransactionId parent, ledger::AccountId target) {
    return MakeKey(prefix::ALLOCATION, EncodeId(parent) + EncodeId(target));
}

// ============================================================================
// LedgerReader - Typed reads (unsynchronized)
// ============================================================================

class LedgerReader {
public:
    explicit LedgerReader(Database& db) : db_(&db) {}

    /// Raw value for a key
    Status Get(const std::string& key, std::string* value) const;

    /// Read and decode a record; CORRUPTION if the bytes do not decode
    template<typename T>
    Status Load(const std::string& key, T* out) const {
        std::string value;
        Status s = Get(key, &value);
        if (!s.ok()) {
            return s;
        }
        if (!DeserializeFromString(value, *out)) {
            return Status::Corruption("undecodable record");
        }
        return Status::Ok();
    }

    /// Value of an 8-byte id index (name -> id, ref -> id)
    Status LoadIndex(const std::string& key, uint64_t* id) const;

    Status ReadAccount(ledger::AccountId id, ledger::LogicalAccount* out) const {
        return Load(AccountKey(id), out);
    }

    Status ReadTransaction(ledger::TransactionId id, ledger::LedgerTransaction* out) const {
        return Load(TransactionKey(id), out);
    }

    Status ReadRule(ledger::RuleId id, ledger::AllocationRule* out) const {
        return Load(RuleKey(id), out);
    }

    Status ReadReconciliation(ledger::ReconciliationId id,
                              ledger::ReconciliationRecord* out) const {
        return Load(ReconciliationKey(id), out);
    }

    Status FindAccountByName(const std::string& name, ledger::AccountId* id) const {
        return LoadIndex(AccountNameKey(name), id);
    }

    Status FindRuleByName(const std::string& name, ledger::RuleId* id) const {
        return LoadIndex(RuleNameKey(name), id);
    }

    Status FindExternalRef(const std::string& ref, ledger::TransactionId* id) const {
        return LoadIndex(ExternalRefKey(ref), id);
    }

    /// Allocation children of a deposit as (target account, child tx id), by target id
    Status ListAllocationChildren(
        ledger::TransactionId parent,
        std::vector<std::pair<ledger::AccountId, ledger::TransactionId>>* out) const;

    /**
     * Visit every record of one table in id order (or newest first).
     * @param func Callback (const T&) -> bool (continue?)
     * @return CORRUPTION on an undecodable record, else the iterator status
     */
    template<typename T, typename Func>
    Status ForEach(char table, bool newestFirst, Func&& func) const {
        auto iter = db_->NewIterator();
        if (newestFirst) {
            iter->Seek(Slice(MakeKey(static_cast<char>(table + 1))));
            if (iter->Valid()) {
                iter->Prev();
            } else {
                iter->SeekToLast();
            }
        } else {
            iter->Seek(Slice(MakeKey(table)));
        }

        while (iter->Valid()) {
            Slice key = iter->key();
            if (key.size() < 1 || key.data()[0] != table) {
                break;
            }

            T record;
            if (!DeserializeFromString(iter->value().ToString(), record)) {
                return Status::Corruption("undecodable record under prefix '" +
                                          std::string(1, table) + "'");
            }
            if (!func(record)) {
                break;
            }

            if (newestFirst) {
                iter->Prev();
            } else {
                iter->Next();
            }
        }
        return iter->status();
    }

protected:
    Database* db_;
};

// ============================================================================
// UnitOfWork - Staged mutation
// ============================================================================

/**
 * Collects the writes of one ledger operation. Nothing becomes visible
 * until Commit succeeds; dropping the unit discards everything staged.
 */
class UnitOfWork {
public:
    explicit UnitOfWork(LedgerDB& store);

    UnitOfWork(const UnitOfWork&) = delete;
    UnitOfWork& operator=(const UnitOfWork&) = delete;

    /// Read through staged writes, then the committed store
    Status Get(const std::string& key, std::string* value) const;

    template<typename T>
    Status Load(const std::string& key, T* out) const {
        std::string value;
        Status s = Get(key, &value);
        if (!s.ok()) {
            return s;
        }
        if (!DeserializeFromString(value, *out)) {
            return Status::Corruption("undecodable record");
        }
        return Status::Ok();
    }

    /**
     * Stage an existing account for modification. The first call reads the
     * committed copy and remembers its version; later calls return the
     * same staged copy. Commit fails with CONFLICT if the version moved.
     */
    Status StageAccount(ledger::AccountId id, ledger::LogicalAccount** out);

    /// Stage a new account; its key must still be absent at commit
    void InsertAccount(const ledger::LogicalAccount& account);

    /// Accounts staged so far, with their pending balances
    const std::map<ledger::AccountId, ledger::LogicalAccount>& StagedAccounts() const {
        return accounts_;
    }

    template<typename T>
    void Put(const std::string& key, const T& record) {
        batch_.Put(key, SerializeToString(record));
    }

    void PutRaw(const std::string& key, const std::string& value) {
        batch_.Put(key, value);
    }

    void Delete(const std::string& key) {
        batch_.Delete(key);
    }

    /// Stage key=value; commit fails with ALREADY_EXISTS if the key exists
    void Claim(const std::string& key, const std::string& value);

    /// Commit fails with CONFLICT unless the key still holds this value
    void Expect(const std::string& key, const std::string& value);

    /// Apply everything atomically (see LedgerDB::Commit)
    Status Commit();

private:
    friend class LedgerDB;

    LedgerDB& store_;
    WriteBatch batch_;
    std::map<ledger::AccountId, ledger::LogicalAccount> accounts_;
    std::map<ledger::AccountId, uint64_t> readVersions_;
    std::set<std::string> claims_;
    std::map<std::string, std::string> expected_;
};

// ============================================================================
// LedgerDB
// ============================================================================

class LedgerDB {
public:
    /// Reads holding the shared lock for the lifetime of the object
    class Snapshot : public LedgerReader {
    public:
        Snapshot(Database& db, std::shared_mutex& mutex)
            : LedgerReader(db), lock_(mutex) {}

    private:
        std::shared_lock<std::shared_mutex> lock_;
    };

    explicit LedgerDB(std::unique_ptr<Database> db);

    LedgerDB(const LedgerDB&) = delete;
    LedgerDB& operator=(const LedgerDB&) = delete;

    /// Point-in-time view; commits wait until it is destroyed
    Snapshot ReadSnapshot() const {
        return Snapshot(*db_, mutex_);
    }

    /**
     * Allocate the next id of a table. Ids are never reused; an id taken
     * by a unit that fails to commit leaves a gap.
     */
    Status NextId(char table, uint64_t* id);

    /// Validate and apply a unit of work atomically
    Status Commit(UnitOfWork& uow);

    /// Connectivity check used by health reporting
    Status CheckConnection() const;

    std::string BackendName() const { return db_->BackendName(); }

private:
    std::unique_ptr<Database> db_;
    mutable std::shared_mutex mutex_;

    std::mutex sequenceMutex_;
    std::map<char, uint64_t> sequences_;
};

} // namespace db
} // namespace tally

#endif // TALLY_DB_LEDGERDB_H
