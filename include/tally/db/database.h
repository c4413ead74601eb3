// TALLY - Database Abstraction Layer
// Copyright (c) 2024 TALLY Developers
// MIT License
//
// Abstract ordered key-value store used to persist the ledger. The
// LevelDB backend is used when built with TALLY_USE_LEVELDB, otherwise
// an in-memory ordered map.

#ifndef TALLY_DB_DATABASE_H
#define TALLY_DB_DATABASE_H

#include "tally/core/types.h"
#include "tally/core/serialize.h"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tally {
namespace db {

// ============================================================================
// Database Status - Result of database operations
// ============================================================================

class Status {
public:
    enum Code {
        OK = 0,
        NOT_FOUND = 1,
        CORRUPTION = 2,
        NOT_SUPPORTED = 3,
        INVALID_ARGUMENT = 4,
        IO_ERROR = 5,
        CONFLICT = 6,        // a compare-and-swap version moved
        ALREADY_EXISTS = 7,  // a unique key was claimed concurrently
    };

private:
    Code code_;
    std::string message_;

public:
    Status() : code_(OK) {}
    Status(Code code, const std::string& msg = "") : code_(code), message_(msg) {}

    static Status Ok() { return Status(); }
    static Status NotFound(const std::string& msg = "") { return Status(NOT_FOUND, msg); }
    static Status Corruption(const std::string& msg = "") { return Status(CORRUPTION, msg); }
    static Status NotSupported(const std::string& msg = "") { return Status(NOT_SUPPORTED, msg); }
    static Status InvalidArgument(const std::string& msg = "") { return Status(INVALID_ARGUMENT, msg); }
    static Status IOError(const std::string& msg = "") { return Status(IO_ERROR, msg); }
    static Status Conflict(const std::string& msg = "") { return Status(CONFLICT, msg); }
    static Status AlreadyExists(const std::string& msg = "") { return Status(ALREADY_EXISTS, msg); }

    bool ok() const { return code_ == OK; }
    bool IsNotFound() const { return code_ == NOT_FOUND; }
    bool IsCorruption() const { return code_ == CORRUPTION; }
    bool IsConflict() const { return code_ == CONFLICT; }
    bool IsAlreadyExists() const { return code_ == ALREADY_EXISTS; }

    /// Conflicts that a retry of the whole unit of work may resolve
    bool IsRetryable() const { return code_ == CONFLICT || code_ == ALREADY_EXISTS; }

    const std::string& message() const { return message_; }

    std::string ToString() const {
        if (ok()) return "OK";
        std::string result;
        switch (code_) {
            case NOT_FOUND: result = "NotFound: "; break;
            case CORRUPTION: result = "Corruption: "; break;
            case NOT_SUPPORTED: result = "NotSupported: "; break;
            case INVALID_ARGUMENT: result = "InvalidArgument: "; break;
            case IO_ERROR: result = "IOError: "; break;
            case CONFLICT: result = "Conflict: "; break;
            case ALREADY_EXISTS: result = "AlreadyExists: "; break;
            default: result = "Unknown: "; break;
        }
        return result + message_;
    }
};

// ============================================================================
// Slice - A reference to a byte range
// ============================================================================

/// Non-owning view of bytes; the underlying buffer must outlive the Slice
class Slice {
private:
    const char* data_;
    size_t size_;

public:
    Slice(const char* d, size_t n) : data_(d), size_(n) {}
    Slice(const std::string& s) : data_(s.data()), size_(s.size()) {}
    Slice(const char* s) : data_(s), size_(std::strlen(s)) {}

    const char* data() const { return data_; }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    std::string ToString() const { return std::string(data_, size_); }

    bool starts_with(const Slice& x) const {
        return size_ >= x.size_ && std::memcmp(data_, x.data_, x.size_) == 0;
    }

    int compare(const Slice& b) const {
        size_t min_len = std::min(size_, b.size_);
        int r = min_len == 0 ? 0 : std::memcmp(data_, b.data_, min_len);
        if (r == 0) {
            if (size_ < b.size_) r = -1;
            else if (size_ > b.size_) r = +1;
        }
        return r;
    }

    bool operator==(const Slice& b) const { return compare(b) == 0; }
    bool operator<(const Slice& b) const { return compare(b) < 0; }
};

// ============================================================================
// Database Options
// ============================================================================

struct Options {
    bool create_if_missing = true;
    bool error_if_exists = false;
    bool paranoid_checks = false;

    /// Write buffer size (default 4MB)
    size_t write_buffer_size = 4 * 1024 * 1024;

    int max_open_files = 1000;

    /// LRU cache size for blocks (default 8MB)
    size_t block_cache_size = 8 * 1024 * 1024;

    /// Bloom filter bits per key (0 to disable)
    int bloom_filter_bits = 10;
};

struct ReadOptions {
    bool verify_checksums = false;
    bool fill_cache = true;
};

struct WriteOptions {
    /// Sync write to disk before returning
    bool sync = false;
};

// ============================================================================
// WriteBatch - Atomic batch of write operations
// ============================================================================

class WriteBatch {
private:
    std::vector<std::pair<std::string, std::optional<std::string>>> operations_;

public:
    WriteBatch() = default;

    void Put(const Slice& key, const Slice& value) {
        operations_.emplace_back(key.ToString(), value.ToString());
    }

    void Delete(const Slice& key) {
        operations_.emplace_back(key.ToString(), std::nullopt);
    }

    size_t Count() const { return operations_.size(); }
    bool Empty() const { return operations_.empty(); }

    /// Visit operations in insertion order; a nullopt value is a delete
    template<typename Func>
    void Iterate(Func&& func) const {
        for (const auto& [key, value] : operations_) {
            func(key, value);
        }
    }

    /// Latest staged value for a key: nullopt if untouched, empty optional
    /// inside if the key is staged for deletion
    std::optional<std::optional<std::string>> Find(const std::string& key) const {
        for (auto it = operations_.rbegin(); it != operations_.rend(); ++it) {
            if (it->first == key) {
                return it->second;
            }
        }
        return std::nullopt;
    }
};

// ============================================================================
// Iterator - Database iterator interface
// ============================================================================

class Iterator {
public:
    virtual ~Iterator() = default;

    virtual bool Valid() const = 0;
    virtual void SeekToFirst() = 0;
    virtual void SeekToLast() = 0;

    /// Seek to the first key >= target
    virtual void Seek(const Slice& target) = 0;

    virtual void Next() = 0;
    virtual void Prev() = 0;

    virtual Slice key() const = 0;
    virtual Slice value() const = 0;
    virtual Status status() const = 0;
};

// ============================================================================
// Database - Abstract database interface
// ============================================================================

class Database {
public:
    virtual ~Database() = default;

    virtual Status Get(const ReadOptions& options, const Slice& key, std::string* value) = 0;

    Status Get(const Slice& key, std::string* value) {
        return Get(ReadOptions(), key, value);
    }

    virtual Status Put(const WriteOptions& options, const Slice& key, const Slice& value) = 0;

    Status Put(const Slice& key, const Slice& value) {
        return Put(WriteOptions(), key, value);
    }

    virtual Status Delete(const WriteOptions& options, const Slice& key) = 0;

    Status Delete(const Slice& key) {
        return Delete(WriteOptions(), key);
    }

    /// Apply a batch of writes atomically
    virtual Status Write(const WriteOptions& options, WriteBatch* batch) = 0;

    Status Write(WriteBatch* batch) {
        return Write(WriteOptions(), batch);
    }

    virtual std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) = 0;

    std::unique_ptr<Iterator> NewIterator() {
        return NewIterator(ReadOptions());
    }

    /// Backend name for health reporting
    virtual std::string BackendName() const = 0;
};

// ============================================================================
// Database Factory Functions
// ============================================================================

/**
 * Open a database at the specified path. Without LevelDB support the
 * directory is created and an in-memory store is returned.
 */
std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options = Options());

/// In-memory store regardless of build options (tests, ephemeral runs)
std::unique_ptr<Database> OpenMemoryDatabase();


// ============================================================================
// Serialization Helpers
// ============================================================================

template<typename T>
std::string SerializeToString(const T& obj) {
    DataStream ss;
    Serialize(ss, obj);
    return ss.str();
}

/// Returns false on truncated or malformed data
template<typename T>
bool DeserializeFromString(const std::string& data, T& obj) {
    try {
        DataStream ss(data);
        Unserialize(ss, obj);
        return true;
    } catch (const std::ios_base::failure&) {
        return false;
    }
}

// ============================================================================
// Key Prefixes for Database Namespacing
// ============================================================================

namespace prefix {
    constexpr char ACCOUNT = 'a';          // account id -> LogicalAccount
    constexpr char ACCOUNT_NAME = 'n';     // name -> account id
    constexpr char TRANSACTION = 't';      // tx id -> LedgerTransaction
    constexpr char ALLOCATION = 'p';       // parent id + target account id -> child tx id
    constexpr char EXTERNAL_REF = 'x';     // external reference -> tx id
    constexpr char RULE = 'r';             // rule id -> AllocationRule
    constexpr char RULE_NAME = 'q';        // name -> rule id
    constexpr char AUDIT = 'u';            // audit id -> AuditEntry
    constexpr char RECONCILIATION = 'c';   // record id -> ReconciliationRecord
    constexpr char SEQUENCE = 's';         // table prefix -> last issued id
}

/// Encode an id big-endian so lexicographic order matches numeric order
inline std::string EncodeId(uint64_t id) {
    std::string out(8, '\0');
    for (int i = 7; i >= 0; --i) {
        out[i] = static_cast<char>(id & 0xff);
        id >>= 8;
    }
    return out;
}

/// Decode the first 8 bytes of a slice as a big-endian id
inline uint64_t DecodeId(const char* data) {
    uint64_t id = 0;
    for (int i = 0; i < 8; ++i) {
        id = (id << 8) | static_cast<uint8_t>(data[i]);
    }
    return id;
}

inline std::string MakeKey(char prefix, const Slice& key) {
    std::string result;
    result.reserve(1 + key.size());
    result.push_back(prefix);
    result.append(key.data(), key.size());
    return result;
}

inline std::string MakeKey(char prefix) {
    return std::string(1, prefix);
}

inline std::string MakeIdKey(char prefix, uint64_t id) {
    return MakeKey(prefix, EncodeId(id));
}

} // namespace db
} // namespace tally

#endif // TALLY_DB_DATABASE_H
