// TALLY - LevelDB Wrapper
// Copyright (c) 2024 TALLY Developers
// MIT License
//
// LevelDB implementation of the database interface, and the in-memory
// store used when LevelDB is not compiled in.

#ifndef TALLY_DB_LEVELDB_H
#define TALLY_DB_LEVELDB_H

#include "tally/db/database.h"

#include <map>
#include <mutex>

#ifdef TALLY_USE_LEVELDB
#include <leveldb/cache.h>
#include <leveldb/db.h>
#include <leveldb/filter_policy.h>
#include <leveldb/write_batch.h>
#endif

namespace tally {
namespace db {

#ifdef TALLY_USE_LEVELDB

// ============================================================================
// LevelDB Iterator Wrapper
// ============================================================================

inline Status ConvertLevelDBStatus(const leveldb::Status& s) {
    if (s.ok()) return Status::Ok();
    if (s.IsNotFound()) return Status::NotFound(s.ToString());
    if (s.IsCorruption()) return Status::Corruption(s.ToString());
    if (s.IsNotSupportedError()) return Status::NotSupported(s.ToString());
    if (s.IsInvalidArgument()) return Status::InvalidArgument(s.ToString());
    return Status::IOError(s.ToString());
}

class LevelDBIterator : public Iterator {
private:
    std::unique_ptr<leveldb::Iterator> iter_;

public:
    explicit LevelDBIterator(leveldb::Iterator* iter) : iter_(iter) {}

    bool Valid() const override { return iter_->Valid(); }
    void SeekToFirst() override { iter_->SeekToFirst(); }
    void SeekToLast() override { iter_->SeekToLast(); }
    void Seek(const Slice& target) override {
        iter_->Seek(leveldb::Slice(target.data(), target.size()));
    }
    void Next() override { iter_->Next(); }
    void Prev() override { iter_->Prev(); }

    Slice key() const override {
        leveldb::Slice k = iter_->key();
        return Slice(k.data(), k.size());
    }

    Slice value() const override {
        leveldb::Slice v = iter_->value();
        return Slice(v.data(), v.size());
    }

    Status status() const override { return ConvertLevelDBStatus(iter_->status()); }
};

// ============================================================================
// LevelDB Database Implementation
// ============================================================================

class LevelDBDatabase : public Database {
private:
    std::unique_ptr<leveldb::DB> db_;
    std::unique_ptr<leveldb::Cache> cache_;
    std::unique_ptr<const leveldb::FilterPolicy> filter_policy_;
    std::filesystem::path path_;

    static leveldb::ReadOptions MakeReadOptions(const ReadOptions& opts) {
        leveldb::ReadOptions lo;
        lo.verify_checksums = opts.verify_checksums;
        lo.fill_cache = opts.fill_cache;
        return lo;
    }

    static leveldb::WriteOptions MakeWriteOptions(const WriteOptions& opts) {
        leveldb::WriteOptions lo;
        lo.sync = opts.sync;
        return lo;
    }

public:
    LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache,
                    const leveldb::FilterPolicy* filter,
                    const std::filesystem::path& path)
        : db_(db), cache_(cache), filter_policy_(filter), path_(path) {}

    ~LevelDBDatabase() override {
        // The DB must close before its cache and filter policy
        db_.reset();
        cache_.reset();
        filter_policy_.reset();
    }

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override {
        return ConvertLevelDBStatus(
            db_->Get(MakeReadOptions(options), leveldb::Slice(key.data(), key.size()), value));
    }

    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override {
        return ConvertLevelDBStatus(
            db_->Put(MakeWriteOptions(options),
                     leveldb::Slice(key.data(), key.size()),
                     leveldb::Slice(value.data(), value.size())));
    }

    Status Delete(const WriteOptions& options, const Slice& key) override {
        return ConvertLevelDBStatus(
            db_->Delete(MakeWriteOptions(options), leveldb::Slice(key.data(), key.size())));
    }

    Status Write(const WriteOptions& options, WriteBatch* batch) override {
        leveldb::WriteBatch lb;
        batch->Iterate([&lb](const std::string& key, const std::optional<std::string>& value) {
            if (value) {
                lb.Put(key, *value);
            } else {
                lb.Delete(key);
            }
        });
        return ConvertLevelDBStatus(db_->Write(MakeWriteOptions(options), &lb));
    }

    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override {
        return std::make_unique<LevelDBIterator>(db_->NewIterator(MakeReadOptions(options)));
    }

    std::string BackendName() const override { return "leveldb"; }
};

#endif // TALLY_USE_LEVELDB

// ============================================================================
// In-Memory Database
// ============================================================================

class MemoryDatabase : public Database {
private:
    std::map<std::string, std::string> data_;
    mutable std::mutex mutex_;

public:
    MemoryDatabase() = default;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;

    /// Iterates a copy of the contents taken at creation
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;

    std::string BackendName() const override { return "memory"; }

    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return data_.size();
    }
};

/// Iterator over a private copy of a MemoryDatabase
class MemoryIterator : public Iterator {
private:
    std::map<std::string, std::string> data_;
    std::map<std::string, std::string>::const_iterator iter_;
    bool valid_;

public:
    explicit MemoryIterator(std::map<std::string, std::string> data)
        : data_(std::move(data)), iter_(data_.end()), valid_(false) {}

    bool Valid() const override { return valid_ && iter_ != data_.end(); }

    void SeekToFirst() override {
        iter_ = data_.begin();
        valid_ = (iter_ != data_.end());
    }

    void SeekToLast() override {
        valid_ = !data_.empty();
        iter_ = valid_ ? std::prev(data_.end()) : data_.end();
    }

    void Seek(const Slice& target) override {
        iter_ = data_.lower_bound(target.ToString());
        valid_ = (iter_ != data_.end());
    }

    void Next() override {
        if (Valid()) {
            ++iter_;
            valid_ = (iter_ != data_.end());
        }
    }

    void Prev() override {
        if (!Valid() || iter_ == data_.begin()) {
            valid_ = false;
            return;
        }
        --iter_;
    }

    Slice key() const override { return Slice(iter_->first); }
    Slice value() const override { return Slice(iter_->second); }
    Status status() const override { return Status::Ok(); }
};

} // namespace db
} // namespace tally

#endif // TALLY_DB_LEVELDB_H
