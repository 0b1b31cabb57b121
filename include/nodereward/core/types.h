// NODEREWARD - Core Types Header
// Copyright (c) 2024 NODEREWARD Developers
// MIT License
//
// This file defines fundamental types used throughout NODEREWARD.

#ifndef NODEREWARD_CORE_TYPES_H
#define NODEREWARD_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <algorithm>
#include <stdexcept>
#include <cstring>

namespace nodereward {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Amount in smallest units of the reward asset
using Amount = int64_t;

/// Timestamp (Unix epoch seconds)
using Timestamp = int64_t;

/// 1 reward token = 100 million base units
constexpr Amount COIN = 100000000LL;

/// Upper bound for any single accounted amount
constexpr Amount MAX_MONEY = 21000000000LL * COIN;

/// Check if amount is in valid range
inline bool MoneyRange(Amount value) {
    return value >= 0 && value <= MAX_MONEY;
}

// ============================================================================
// Hash Templates
// ============================================================================

/// Fixed-size opaque byte identifier
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;

    /// Default constructor - creates null hash
    BaseHash() noexcept {
        data_.fill(0);
    }

    /// Construct from byte array
    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Construct from raw bytes (zero-padded if short)
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, std::min(len, SIZE));
        }
    }

    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    void SetNull() noexcept {
        data_.fill(0);
    }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    Byte* begin() noexcept { return data_.data(); }
    const Byte* begin() const noexcept { return data_.data(); }
    Byte* end() noexcept { return data_.data() + SIZE; }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const BaseHash& other) const noexcept {
        return data_ < other.data_;
    }

    /// Lowercase hex in storage byte order
    std::string ToHex() const;

    /// Parse from hex produced by ToHex(); throws std::invalid_argument
    static BaseHash FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

// ============================================================================
// Specific Hash Types
// ============================================================================

/// 256-bit hash (32 bytes)
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;
    Hash256() = default;
    Hash256(const BaseHash<256>& base) : BaseHash<256>(base) {}
};

/// 160-bit hash (20 bytes) - account addresses
class Hash160 : public BaseHash<160> {
public:
    using BaseHash<160>::BaseHash;
    Hash160() = default;
    Hash160(const BaseHash<160>& base) : BaseHash<160>(base) {}
};

// ============================================================================
// Domain Identifiers
// ============================================================================

/// Operator account providing compute/storage capacity
using OperatorId = Hash160;

/// Authenticated identity of whoever invokes a mutating call
using CallerId = Hash160;

/// Content-derived identifier of a reward record
class RewardId : public Hash256 {
public:
    using Hash256::Hash256;
    RewardId() = default;
    explicit RewardId(const Hash256& h) : Hash256(h) {}
};

/// Identifier of a time-locked administrative operation
class OperationHash : public Hash256 {
public:
    using Hash256::Hash256;
    OperationHash() = default;
    explicit OperationHash(const Hash256& h) : Hash256(h) {}
};

/// Parse an account id from hex, returning a null id on malformed input
Hash160 ParseAccountId(const std::string& hex);

} // namespace nodereward

#endif // NODEREWARD_CORE_TYPES_H
