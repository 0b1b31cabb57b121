// NODEREWARD - Database Abstraction Layer
// Copyright (c) 2024 NODEREWARD Developers
// MIT License
//
// Abstract key-value interface through which every ledger and resilience
// entity is persisted. Multi-entity transitions are committed as one
// WriteBatch.

#ifndef NODEREWARD_DB_DATABASE_H
#define NODEREWARD_DB_DATABASE_H

#include "nodereward/core/types.h"
#include "nodereward/core/serialize.h"
#include "nodereward/core/status.h"
#include <algorithm>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace nodereward {
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
    };

    Status() : code_(OK) {}
    Status(Code code, const std::string& msg = "") : code_(code), message_(msg) {}

    static Status Ok() { return Status(); }
    static Status NotFound(const std::string& msg = "") { return Status(NOT_FOUND, msg); }
    static Status Corruption(const std::string& msg = "") { return Status(CORRUPTION, msg); }
    static Status NotSupported(const std::string& msg = "") { return Status(NOT_SUPPORTED, msg); }
    static Status InvalidArgument(const std::string& msg = "") { return Status(INVALID_ARGUMENT, msg); }
    static Status IOError(const std::string& msg = "") { return Status(IO_ERROR, msg); }

    bool ok() const { return code_ == OK; }
    bool IsNotFound() const { return code_ == NOT_FOUND; }
    bool IsCorruption() const { return code_ == CORRUPTION; }
    bool IsIOError() const { return code_ == IO_ERROR; }

    Code code() const { return code_; }
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
            default: result = "Unknown: "; break;
        }
        return result + message_;
    }

private:
    Code code_;
    std::string message_;
};

// ============================================================================
// Slice - A reference to a byte range
// ============================================================================

/**
 * A lightweight reference to a contiguous range of bytes.
 * Does not own the data - the underlying buffer must outlive the Slice.
 */
class Slice {
public:
    Slice() : data_(nullptr), size_(0) {}
    Slice(const char* d, size_t n) : data_(d), size_(n) {}
    Slice(const std::string& s) : data_(s.data()), size_(s.size()) {}
    Slice(const std::vector<uint8_t>& v)
        : data_(reinterpret_cast<const char*>(v.data())), size_(v.size()) {}
    Slice(const char* s) : data_(s), size_(strlen(s)) {}

    const char* data() const { return data_; }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    std::string ToString() const { return std::string(data_, size_); }
    std::vector<uint8_t> ToVector() const {
        return std::vector<uint8_t>(data_, data_ + size_);
    }

    bool starts_with(const Slice& prefix) const {
        return size_ >= prefix.size_ && memcmp(data_, prefix.data_, prefix.size_) == 0;
    }

    int compare(const Slice& b) const {
        size_t minLen = std::min(size_, b.size_);
        int r = minLen == 0 ? 0 : memcmp(data_, b.data_, minLen);
        if (r == 0) {
            if (size_ < b.size_) r = -1;
            else if (size_ > b.size_) r = +1;
        }
        return r;
    }

    bool operator==(const Slice& b) const { return compare(b) == 0; }
    bool operator!=(const Slice& b) const { return !(*this == b); }

private:
    const char* data_;
    size_t size_;
};

// ============================================================================
// Database Options
// ============================================================================

struct Options {
    bool create_if_missing = true;
    bool error_if_exists = false;
    bool paranoid_checks = false;
    size_t write_buffer_size = 4 * 1024 * 1024;
    int max_open_files = 1000;
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
public:
    WriteBatch() = default;

    void Put(const Slice& key, const Slice& value) {
        operations_.emplace_back(key.ToString(), value.ToString());
    }

    void Delete(const Slice& key) {
        operations_.emplace_back(key.ToString(), std::nullopt);
    }

    void Clear() { operations_.clear(); }
    size_t Count() const { return operations_.size(); }
    bool Empty() const { return operations_.empty(); }

    template<typename Func>
    void Iterate(Func&& func) const {
        for (const auto& [key, value] : operations_) {
            func(key, value);
        }
    }

private:
    std::vector<std::pair<std::string, std::optional<std::string>>> operations_;
};

// ============================================================================
// Iterator - Database iterator interface
// ============================================================================

class Iterator {
public:
    virtual ~Iterator() = default;

    virtual bool Valid() const = 0;
    virtual void SeekToFirst() = 0;
    /// Seek to the first key >= target
    virtual void Seek(const Slice& target) = 0;
    virtual void Next() = 0;
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

    virtual bool Exists(const Slice& key) {
        std::string value;
        return Get(key, &value).ok();
    }

    /// Backend statistics, if any
    virtual std::string GetStats() const { return ""; }
};

// ============================================================================
// Database Factory Functions
// ============================================================================

enum class Backend {
    LevelDB,    // Durable on-disk store
    Memory,     // Ephemeral, process-local
};

const char* BackendToString(Backend backend);

/// Parse "leveldb" / "memory"; nullopt for anything else
std::optional<Backend> BackendFromString(const std::string& str);

/**
 * Open a database.
 * @param path Directory of the LevelDB store (ignored for Memory)
 * @param options Database options
 * @param backend Storage backend
 * @return Pair of (status, database pointer)
 */
std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options = Options(),
    Backend backend = Backend::LevelDB);

/// Delete an on-disk database
Status DestroyDatabase(const std::filesystem::path& path);

/// Visit every key starting with prefix in key order; stop when func returns false
Status ForEachWithPrefix(Database& db, const std::string& prefix,
                         const std::function<bool(const Slice& key, const Slice& value)>& func);

// ============================================================================
// Key Prefixes for Database Namespacing
// ============================================================================

namespace prefix {
    // Reward ledger
    constexpr char REWARD_RECORD = 'r';     // reward id -> RewardRecord
    constexpr char OPERATOR_TOTALS = 'o';   // operator -> OperatorTotals
    constexpr char DAILY_BUCKET = 'd';      // operator + day -> amount
    constexpr char MONTHLY_BUCKET = 'm';    // operator + month -> amount
    constexpr char OPERATOR_INDEX = 'i';    // operator + reward id -> ""
    constexpr char SLASH_HISTORY = 'x';     // operator + sequence -> SlashRecord
    constexpr char LEDGER_STATS = 'S';      // -> LedgerStats

    // Resilience plane
    constexpr char RATE_LIMIT = 'L';        // caller + operation -> RateLimitState
    constexpr char CIRCUIT_BREAKER = 'C';   // operation -> CircuitBreakerState
    constexpr char PAUSE = 'P';             // subsystem -> PauseState
    constexpr char TIMELOCK = 'T';          // operation hash -> TimelockProposal
    constexpr char ANOMALY = 'A';           // metric -> AnomalyBaseline

    // Executed admin commands
    constexpr char ENGINE_PARAMETERS = 'p'; // -> EngineParameters
    constexpr char CAPABILITY_GRANT = 'g';  // account + capability -> 0/1

    // Audit
    constexpr char EVENT_JOURNAL = 'E';     // sequence (big-endian) -> Event
    constexpr char JOURNAL_SEQUENCE = 'Q';  // -> next sequence
}

inline std::string MakeKey(char prefix) {
    return std::string(1, prefix);
}

inline std::string MakeKey(char prefix, const Slice& key) {
    std::string result;
    result.reserve(1 + key.size());
    result.push_back(prefix);
    result.append(key.data(), key.size());
    return result;
}

template<size_t BITS>
std::string MakeKey(char prefix, const BaseHash<BITS>& hash) {
    std::string result;
    result.reserve(1 + BaseHash<BITS>::SIZE);
    result.push_back(prefix);
    result.append(reinterpret_cast<const char*>(hash.data()), BaseHash<BITS>::SIZE);
    return result;
}

/// Big-endian encoding so that numeric order matches key order
inline std::string EncodeOrderedU64(uint64_t value) {
    std::string out(8, '\0');
    for (int i = 7; i >= 0; --i) {
        out[i] = static_cast<char>(value & 0xFF);
        value >>= 8;
    }
    return out;
}

inline uint64_t DecodeOrderedU64(const char* data) {
    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value = (value << 8) | static_cast<uint8_t>(data[i]);
    }
    return value;
}

// ============================================================================
// Serialization Helpers
// ============================================================================

inline std::string ToValue(const std::vector<Byte>& bytes) {
    return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

/**
 * Read a stored entity and decode it with T::Deserialize.
 * NotFound is passed through; undecodable data is reported as Corruption.
 */
template<typename T>
Status ReadEntity(Database& db, const std::string& key, T* out) {
    std::string value;
    Status s = db.Get(key, &value);
    if (!s.ok()) {
        return s;
    }
    auto decoded = T::Deserialize(reinterpret_cast<const Byte*>(value.data()), value.size());
    if (!decoded) {
        return Status::Corruption("undecodable value");
    }
    *out = std::move(*decoded);
    return Status::Ok();
}

/// Store an entity encoded with T::Serialize
template<typename T>
Status WriteEntity(Database& db, const std::string& key, const T& entity) {
    return db.Put(key, ToValue(entity.Serialize()));
}

/// Map a storage failure onto the domain StorageError code
inline nodereward::Status ToDomainStatus(const Status& s, const std::string& context) {
    if (s.ok()) {
        return nodereward::Status::Ok();
    }
    return nodereward::Status(ErrorCode::StorageError, context + ": " + s.ToString());
}

} // namespace db
} // namespace nodereward

#endif // NODEREWARD_DB_DATABASE_H
