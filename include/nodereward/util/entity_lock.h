// NODEREWARD - Entity Locks
// Copyright (c) 2024 NODEREWARD Developers
// MIT License
//
// Non-blocking single-writer locks keyed by logical entity (a reward record,
// an operator's totals and buckets). A call that finds its entity held is
// rejected instead of waiting.

#ifndef NODEREWARD_UTIL_ENTITY_LOCK_H
#define NODEREWARD_UTIL_ENTITY_LOCK_H

#include <mutex>
#include <set>
#include <string>
#include <utility>

namespace nodereward {
namespace util {

class EntityLockTable;

/// Lock on one entity key (RAII). Default-constructed guards hold nothing.
class EntityLock {
public:
    EntityLock() = default;
    ~EntityLock();

    EntityLock(const EntityLock&) = delete;
    EntityLock& operator=(const EntityLock&) = delete;
    EntityLock(EntityLock&& other) noexcept;
    EntityLock& operator=(EntityLock&& other) noexcept;

    /// Release early
    void Unlock();

    bool IsLocked() const { return table_ != nullptr; }
    const std::string& GetKey() const { return key_; }

private:
    friend class EntityLockTable;
    EntityLock(EntityLockTable* table, std::string key)
        : table_(table), key_(std::move(key)) {}

    EntityLockTable* table_{nullptr};
    std::string key_;
};

class EntityLockTable {
public:
    EntityLockTable() = default;

    EntityLockTable(const EntityLockTable&) = delete;
    EntityLockTable& operator=(const EntityLockTable&) = delete;

    /// Acquire key; the returned guard is unlocked if the key is already held
    EntityLock TryAcquire(const std::string& key);

    bool IsHeld(const std::string& key) const;
    size_t HeldCount() const;

private:
    friend class EntityLock;
    void Release(const std::string& key);

    std::set<std::string> held_;
    mutable std::mutex mutex_;
};

} // namespace util
} // namespace nodereward

#endif // NODEREWARD_UTIL_ENTITY_LOCK_H
