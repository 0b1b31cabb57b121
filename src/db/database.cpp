// NODEREWARD - Database Implementation
// Copyright (c) 2024 NODEREWARD Developers
// MIT License

#include "nodereward/db/database.h"
#include "nodereward/db/leveldb.h"
#include "nodereward/util/logging.h"

namespace nodereward {
namespace db {

// ============================================================================
// Iterators
// ============================================================================

namespace {

class LevelDBIterator : public Iterator {
public:
    explicit LevelDBIterator(leveldb::Iterator* iter) : iter_(iter) {}

    bool Valid() const override { return iter_->Valid(); }
    void SeekToFirst() override { iter_->SeekToFirst(); }
    void Seek(const Slice& target) override {
        iter_->Seek(leveldb::Slice(target.data(), target.size()));
    }
    void Next() override { iter_->Next(); }

    Slice key() const override {
        leveldb::Slice k = iter_->key();
        return Slice(k.data(), k.size());
    }

    Slice value() const override {
        leveldb::Slice v = iter_->value();
        return Slice(v.data(), v.size());
    }

    Status status() const override {
        return LevelDBDatabase::ConvertStatus(iter_->status());
    }

private:
    std::unique_ptr<leveldb::Iterator> iter_;
};

class MemoryIterator : public Iterator {
public:
    explicit MemoryIterator(std::map<std::string, std::string> snapshot)
        : data_(std::move(snapshot)), iter_(data_.end()) {}

    bool Valid() const override { return iter_ != data_.end(); }
    void SeekToFirst() override { iter_ = data_.begin(); }
    void Seek(const Slice& target) override { iter_ = data_.lower_bound(target.ToString()); }
    void Next() override {
        if (iter_ != data_.end()) {
            ++iter_;
        }
    }

    Slice key() const override { return Slice(iter_->first); }
    Slice value() const override { return Slice(iter_->second); }
    Status status() const override { return Status::Ok(); }

private:
    std::map<std::string, std::string> data_;
    std::map<std::string, std::string>::const_iterator iter_;
};

} // namespace

// ============================================================================
// LevelDBDatabase
// ============================================================================

LevelDBDatabase::LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache,
                                 const leveldb::FilterPolicy* filter,
                                 const std::filesystem::path& path)
    : db_(db), cache_(cache), filterPolicy_(filter), path_(path) {}

LevelDBDatabase::~LevelDBDatabase() {
    // The DB must close before the cache and filter it references
    db_.reset();
    cache_.reset();
    filterPolicy_.reset();
}

Status LevelDBDatabase::ConvertStatus(const leveldb::Status& s) {
    if (s.ok()) return Status::Ok();
    if (s.IsNotFound()) return Status::NotFound(s.ToString());
    if (s.IsCorruption()) return Status::Corruption(s.ToString());
    if (s.IsIOError()) return Status::IOError(s.ToString());
    if (s.IsNotSupportedError()) return Status::NotSupported(s.ToString());
    if (s.IsInvalidArgument()) return Status::InvalidArgument(s.ToString());
    return Status::IOError(s.ToString());
}

Status LevelDBDatabase::Get(const ReadOptions& options, const Slice& key, std::string* value) {
    leveldb::ReadOptions lo;
    lo.verify_checksums = options.verify_checksums;
    lo.fill_cache = options.fill_cache;
    return ConvertStatus(db_->Get(lo, leveldb::Slice(key.data(), key.size()), value));
}

Status LevelDBDatabase::Put(const WriteOptions& options, const Slice& key, const Slice& value) {
    leveldb::WriteOptions lo;
    lo.sync = options.sync;
    return ConvertStatus(db_->Put(lo, leveldb::Slice(key.data(), key.size()),
                                  leveldb::Slice(value.data(), value.size())));
}

Status LevelDBDatabase::Delete(const WriteOptions& options, const Slice& key) {
    leveldb::WriteOptions lo;
    lo.sync = options.sync;
    return ConvertStatus(db_->Delete(lo, leveldb::Slice(key.data(), key.size())));
}

Status LevelDBDatabase::Write(const WriteOptions& options, WriteBatch* batch) {
    leveldb::WriteBatch lb;
    batch->Iterate([&lb](const std::string& key, const std::optional<std::string>& value) {
        if (value) {
            lb.Put(key, *value);
        } else {
            lb.Delete(key);
        }
    });
    leveldb::WriteOptions lo;
    lo.sync = options.sync;
    return ConvertStatus(db_->Write(lo, &lb));
}

std::unique_ptr<Iterator> LevelDBDatabase::NewIterator(const ReadOptions& options) {
    leveldb::ReadOptions lo;
    lo.verify_checksums = options.verify_checksums;
    lo.fill_cache = options.fill_cache;
    return std::make_unique<LevelDBIterator>(db_->NewIterator(lo));
}

std::string LevelDBDatabase::GetStats() const {
    std::string stats;
    db_->GetProperty("leveldb.stats", &stats);
    return stats;
}

// ============================================================================
// MemoryDatabase
// ============================================================================

Status MemoryDatabase::Get(const ReadOptions&, const Slice& key, std::string* value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = data_.find(key.ToString());
    if (it == data_.end()) {
        return Status::NotFound();
    }
    *value = it->second;
    return Status::Ok();
}

Status MemoryDatabase::Put(const WriteOptions&, const Slice& key, const Slice& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failWrites_) {
        return Status::IOError("writes disabled");
    }
    data_[key.ToString()] = value.ToString();
    return Status::Ok();
}

Status MemoryDatabase::Delete(const WriteOptions&, const Slice& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failWrites_) {
        return Status::IOError("writes disabled");
    }
    data_.erase(key.ToString());
    return Status::Ok();
}

Status MemoryDatabase::Write(const WriteOptions&, WriteBatch* batch) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failWrites_) {
        return Status::IOError("writes disabled");
    }
    batch->Iterate([this](const std::string& key, const std::optional<std::string>& value) {
        if (value) {
            data_[key] = *value;
        } else {
            data_.erase(key);
        }
    });
    return Status::Ok();
}

std::unique_ptr<Iterator> MemoryDatabase::NewIterator(const ReadOptions&) {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::make_unique<MemoryIterator>(data_);
}

size_t MemoryDatabase::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.size();
}

void MemoryDatabase::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.clear();
}

void MemoryDatabase::SetFailWrites(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    failWrites_ = fail;
}

// ============================================================================
// Database Factory Functions
// ============================================================================

const char* BackendToString(Backend backend) {
    switch (backend) {
        case Backend::LevelDB: return "leveldb";
        case Backend::Memory: return "memory";
        default: return "unknown";
    }
}

std::optional<Backend> BackendFromString(const std::string& str) {
    if (str == "leveldb") return Backend::LevelDB;
    if (str == "memory") return Backend::Memory;
    return std::nullopt;
}

std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options,
    Backend backend)
{
    if (backend == Backend::Memory) {
        LOG_DEBUG(util::LogCategory::DB) << "Opened in-memory database";
        return {Status::Ok(), std::make_unique<MemoryDatabase>()};
    }

    if (options.create_if_missing) {
        std::error_code ec;
        std::filesystem::create_directories(path, ec);
        if (ec) {
            return {Status::IOError(ec.message()), nullptr};
        }
    }

    leveldb::Options lo;
    lo.create_if_missing = options.create_if_missing;
    lo.error_if_exists = options.error_if_exists;
    lo.paranoid_checks = options.paranoid_checks;
    lo.write_buffer_size = options.write_buffer_size;
    lo.max_open_files = options.max_open_files;

    leveldb::Cache* cache = nullptr;
    if (options.block_cache_size > 0) {
        cache = leveldb::NewLRUCache(options.block_cache_size);
        lo.block_cache = cache;
    }

    const leveldb::FilterPolicy* filter = nullptr;
    if (options.bloom_filter_bits > 0) {
        filter = leveldb::NewBloomFilterPolicy(options.bloom_filter_bits);
        lo.filter_policy = filter;
    }

    leveldb::DB* raw = nullptr;
    leveldb::Status s = leveldb::DB::Open(lo, path.string(), &raw);
    if (!s.ok()) {
        delete cache;
        delete filter;
        LOG_ERROR(util::LogCategory::DB) << "Cannot open " << path.string() << ": " << s.ToString();
        return {LevelDBDatabase::ConvertStatus(s), nullptr};
    }

    LOG_INFO(util::LogCategory::DB) << "Opened LevelDB database at " << path.string();
    return {Status::Ok(), std::make_unique<LevelDBDatabase>(raw, cache, filter, path)};
}

Status DestroyDatabase(const std::filesystem::path& path) {
    return LevelDBDatabase::ConvertStatus(leveldb::DestroyDB(path.string(), leveldb::Options()));
}

Status ForEachWithPrefix(Database& db, const std::string& prefix,
                         const std::function<bool(const Slice& key, const Slice& value)>& func) {
    auto it = db.NewIterator();
    Slice prefixSlice(prefix);
    for (it->Seek(prefixSlice); it->Valid(); it->Next()) {
        Slice key = it->key();
        if (!key.starts_with(prefixSlice)) {
            break;
        }
        if (!func(key, it->value())) {
            break;
        }
    }
    return it->status();
}

} // namespace db
} // namespace nodereward
