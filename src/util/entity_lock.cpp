// NODEREWARD - Entity Locks Implementation
// Copyright (c) 2024 NODEREWARD Developers
// MIT License

#include "nodereward/util/entity_lock.h"

namespace nodereward {
namespace util {

// ============================================================================
// EntityLock
// ============================================================================

EntityLock::~EntityLock() {
    Unlock();
}

EntityLock::EntityLock(EntityLock&& other) noexcept
    : table_(other.table_), key_(std::move(other.key_)) {
    other.table_ = nullptr;
}

EntityLock& EntityLock::operator=(EntityLock&& other) noexcept {
    if (this != &other) {
        Unlock();
        table_ = other.table_;
        key_ = std::move(other.key_);
        other.table_ = nullptr;
    }
    return *this;
}

void EntityLock::Unlock() {
    if (table_) {
        table_->Release(key_);
        table_ = nullptr;
    }
}

// ============================================================================
// EntityLockTable
// ============================================================================

EntityLock EntityLockTable::TryAcquire(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!held_.insert(key).second) {
        return EntityLock();
    }
    return EntityLock(this, key);
}

bool EntityLockTable::IsHeld(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return held_.count(key) > 0;
}

size_t EntityLockTable::HeldCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return held_.size();
}

void EntityLockTable::Release(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    held_.erase(key);
}

} // namespace util
} // namespace nodereward
