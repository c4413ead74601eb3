// TALLY - Ledger Database Implementation
// Copyright (c) 2024 TALLY Developers
// MIT License

#include "tally/db/ledgerdb.h"
#include "tally/util/logging.h"

namespace tally {
namespace db {

// ============================================================================
// LedgerReader
// ============================================================================

Status LedgerReader::Get(const std::string& key, std::string* value) const {
    return db_->Get(Slice(key), value);
}

Status LedgerReader::LoadIndex(const std::string& key, uint64_t* id) const {
    std::string value;
    Status s = Get(key, &value);
    if (!s.ok()) {
        return s;
    }
    if (value.size() != 8) {
        return Status::Corruption("index value is not an 8-byte id");
    }
    *id = DecodeId(value.data());
    return Status::Ok();
}

Status LedgerReader::ListAllocationChildren(
    ledger::TransactionId parent,
    std::vector<std::pair<ledger::AccountId, ledger::TransactionId>>* out) const {
    out->clear();
    std::string start = MakeKey(prefix::ALLOCATION, EncodeId(parent));
    Slice startSlice(start);

    auto iter = db_->NewIterator();
    for (iter->Seek(startSlice); iter->Valid(); iter->Next()) {
        Slice key = iter->key();
        if (!key.starts_with(startSlice)) {
            break;
        }
        Slice value = iter->value();
        if (key.size() != start.size() + 8 || value.size() != 8) {
            return Status::Corruption("malformed allocation index entry");
        }
        out->emplace_back(DecodeId(key.data() + start.size()), DecodeId(value.data()));
    }
    return iter->status();
}

// ============================================================================
// UnitOfWork
// ============================================================================

UnitOfWork::UnitOfWork(LedgerDB& store) : store_(store) {}

Status UnitOfWork::Get(const std::string& key, std::string* value) const {
    if (!key.empty() && key[0] == prefix::ACCOUNT && key.size() == 9) {
        auto it = accounts_.find(DecodeId(key.data() + 1));
        if (it != accounts_.end()) {
            *value = SerializeToString(it->second);
            return Status::Ok();
        }
    }

    auto staged = batch_.Find(key);
    if (staged) {
        if (!*staged) {
            return Status::NotFound();
        }
        *value = **staged;
        return Status::Ok();
    }

    return store_.ReadSnapshot().Get(key, value);
}

Status UnitOfWork::StageAccount(ledger::AccountId id, ledger::LogicalAccount** out) {
    auto it = accounts_.find(id);
    if (it != accounts_.end()) {
        *out = &it->second;
        return Status::Ok();
    }

    ledger::LogicalAccount account;
    Status s = store_.ReadSnapshot().ReadAccount(id, &account);
    if (!s.ok()) {
        return s;
    }

    readVersions_[id] = account.version;
    auto inserted = accounts_.emplace(id, std::move(account));
    *out = &inserted.first->second;
    return Status::Ok();
}

void UnitOfWork::InsertAccount(const ledger::LogicalAccount& account) {
    accounts_[account.id] = account;
    claims_.insert(AccountKey(account.id));
}

void UnitOfWork::Claim(const std::string& key, const std::string& value) {
    claims_.insert(key);
    batch_.Put(key, value);
}

void UnitOfWork::Expect(const std::string& key, const std::string& value) {
    expected_.emplace(key, value);
}

Status UnitOfWork::Commit() {
    return store_.Commit(*this);
}

// ============================================================================
// LedgerDB
// ============================================================================

LedgerDB::LedgerDB(std::unique_ptr<Database> db) : db_(std::move(db)) {}

Status LedgerDB::NextId(char table, uint64_t* id) {
    std::lock_guard<std::mutex> lock(sequenceMutex_);

    std::string key = MakeKey(prefix::SEQUENCE, std::string(1, table));
    uint64_t last = 0;

    auto it = sequences_.find(table);
    if (it != sequences_.end()) {
        last = it->second;
    } else {
        std::string value;
        Status s = db_->Get(Slice(key), &value);
        if (s.ok()) {
            if (value.size() != 8) {
                return Status::Corruption("sequence value is not an 8-byte id");
            }
            last = DecodeId(value.data());
        } else if (!s.IsNotFound()) {
            return s;
        }
    }

    Status s = db_->Put(Slice(key), Slice(EncodeId(last + 1)));
    if (!s.ok()) {
        return s;
    }
    sequences_[table] = last + 1;
    *id = last + 1;
    return Status::Ok();
}

Status LedgerDB::Commit(UnitOfWork& uow) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    LedgerReader reader(*db_);

    // Compare-and-swap on every account read during the unit
    for (const auto& [id, version] : uow.readVersions_) {
        ledger::LogicalAccount current;
        Status s = reader.ReadAccount(id, &current);
        if (s.IsNotFound()) {
            return Status::Conflict("account " + std::to_string(id) + " disappeared");
        }
        if (!s.ok()) {
            return s;
        }
        if (current.version != version) {
            LOG_DEBUG(util::LogCategory::DB) << "Version conflict on account " << id
                                             << " (read " << version << ", now "
                                             << current.version << ")";
            return Status::Conflict("account " + std::to_string(id) + " was modified");
        }
    }

    for (const auto& [key, expected] : uow.expected_) {
        std::string current;
        Status s = reader.Get(key, &current);
        if (s.IsNotFound()) {
            return Status::Conflict("expected record disappeared");
        }
        if (!s.ok()) {
            return s;
        }
        if (current != expected) {
            return Status::Conflict("record was modified concurrently");
        }
    }

    for (const auto& key : uow.claims_) {
        std::string current;
        Status s = reader.Get(key, &current);
        if (s.ok()) {
            return Status::AlreadyExists("unique key already claimed");
        }
        if (!s.IsNotFound()) {
            return s;
        }
    }

    WriteBatch batch;
    for (auto& [id, account] : uow.accounts_) {
        auto it = uow.readVersions_.find(id);
        if (it != uow.readVersions_.end()) {
            account.version = it->second + 1;
        }
        batch.Put(Slice(AccountKey(id)), Slice(SerializeToString(account)));
    }
    uow.batch_.Iterate([&batch](const std::string& key, const std::optional<std::string>& value) {
        if (value) {
            batch.Put(Slice(key), Slice(*value));
        } else {
            batch.Delete(Slice(key));
        }
    });

    if (batch.Empty()) {
        return Status::Ok();
    }

    Status s = db_->Write(&batch);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Commit of " << batch.Count()
                                         << " writes failed: " << s.ToString();
    }
    return s;
}

Status LedgerDB::CheckConnection() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::string value;
    Status s = db_->Get(Slice(MakeKey(prefix::SEQUENCE, std::string(1, prefix::ACCOUNT))), &value);
    if (s.IsNotFound()) {
        return Status::Ok();
    }
    return s;
}

} // namespace db
} // namespace tally
