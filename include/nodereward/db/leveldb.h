// NODEREWARD - Database Backends
// Copyright (c) 2024 NODEREWARD Developers
// MIT License
//
// LevelDB-backed durable store and an in-memory store with the same
// interface, selected at runtime through db::Backend.

#ifndef NODEREWARD_DB_LEVELDB_H
#define NODEREWARD_DB_LEVELDB_H

#include "nodereward/db/database.h"
#include <map>
#include <mutex>

#include <leveldb/db.h>
#include <leveldb/write_batch.h>
#include <leveldb/cache.h>
#include <leveldb/filter_policy.h>

namespace nodereward {
namespace db {

// ============================================================================
// LevelDB Database Implementation
// ============================================================================

class LevelDBDatabase : public Database {
public:
    LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache,
                    const leveldb::FilterPolicy* filter,
                    const std::filesystem::path& path);
    ~LevelDBDatabase() override;

    using Database::Get;
    using Database::Put;
    using Database::Delete;
    using Database::Write;
    using Database::NewIterator;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;
    std::string GetStats() const override;

    const std::filesystem::path& GetPath() const { return path_; }

    static Status ConvertStatus(const leveldb::Status& s);

private:
    std::unique_ptr<leveldb::DB> db_;
    std::unique_ptr<leveldb::Cache> cache_;
    std::unique_ptr<const leveldb::FilterPolicy> filterPolicy_;
    std::filesystem::path path_;
};

// ============================================================================
// In-Memory Database
// ============================================================================

/**
 * Ordered in-memory store. Iterators work on a snapshot taken when they
 * are created, so writes during iteration are not observed.
 */
class MemoryDatabase : public Database {
public:
    MemoryDatabase() = default;

    using Database::Get;
    using Database::Put;
    using Database::Delete;
    using Database::Write;
    using Database::NewIterator;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;

    size_t Size() const;
    void Clear();

    /// Make every following write fail with IOError (for failure-path tests)
    void SetFailWrites(bool fail);

private:
    std::map<std::string, std::string> data_;
    mutable std::mutex mutex_;
    bool failWrites_{false};
};

} // namespace db
} // namespace nodereward

#endif // NODEREWARD_DB_LEVELDB_H
