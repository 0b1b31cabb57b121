// NODEREWARD - Reward Ledger Types
// Copyright (c) 2024 NODEREWARD Developers
// MIT License
//
// Records, per-operator totals and period buckets stored by the reward
// ledger, together with the default limits that bound them.

#ifndef NODEREWARD_REWARDS_TYPES_H
#define NODEREWARD_REWARDS_TYPES_H

#include "nodereward/core/types.h"
#include "nodereward/util/time.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace nodereward {
namespace rewards {

// ============================================================================
// Reward Constants
// ============================================================================

/// Smallest base or adjusted amount a record may carry
constexpr Amount MIN_REWARD_AMOUNT = COIN / 1000;

/// Largest base or adjusted amount a record may carry
constexpr Amount MAX_REWARD_AMOUNT = 1000 * COIN;

/// Per-operator cap for one day bucket
constexpr Amount MAX_DAILY_REWARDS = 10000 * COIN;

/// Per-operator cap for one month bucket
constexpr Amount MAX_MONTHLY_REWARDS = 100000 * COIN;

/// Seconds between two calculations for the same operator
constexpr int64_t MIN_REWARD_INTERVAL = util::SECONDS_PER_HOUR;

/// Overall score below which an operator may be slashed
constexpr uint32_t SLASHING_THRESHOLD = 70;

/// Largest slash as a percentage of cumulative distributed rewards
constexpr uint32_t MAX_SLASHING_PERCENTAGE = 50;

/// Seconds after a slash during which the operator earns nothing
constexpr int64_t SLASHING_COOLDOWN = util::SECONDS_PER_DAY;

/// Largest number of items in one batch call
constexpr size_t MAX_BATCH_SIZE = 50;

/// A month bucket is a fixed 30 days, not a calendar month
constexpr int64_t SECONDS_PER_MONTH_BUCKET = 30 * util::SECONDS_PER_DAY;

// ============================================================================
// Reward Type
// ============================================================================

enum class RewardType : uint8_t {
    Performance = 0,
    Uptime = 1,
    StorageProvided = 2,
    Computation = 3,
    NetworkContribution = 4,
    Bonus = 5,
};

const char* RewardTypeToString(RewardType type);

inline bool IsValidRewardType(RewardType type) {
    return static_cast<uint8_t>(type) <= static_cast<uint8_t>(RewardType::Bonus);
}

// ============================================================================
// Period Buckets
// ============================================================================

enum class BucketKind : uint8_t {
    Daily = 0,
    Monthly = 1,
};

const char* BucketKindToString(BucketKind kind);

using Epoch = uint64_t;

inline Epoch DayEpoch(Timestamp t) {
    return static_cast<Epoch>(t / util::SECONDS_PER_DAY);
}

inline Epoch MonthEpoch(Timestamp t) {
    return static_cast<Epoch>(t / SECONDS_PER_MONTH_BUCKET);
}

inline Epoch EpochOf(BucketKind kind, Timestamp t) {
    return kind == BucketKind::Daily ? DayEpoch(t) : MonthEpoch(t);
}

// ============================================================================
// Reward Record
// ============================================================================

/**
 * A calculated reward. The amount never changes after creation; only the
 * settled flag and distribution time are written again, exactly once.
 */
struct RewardRecord {
    RewardId id;
    OperatorId operatorId;
    std::string nodeId;

    /// Amount requested by the calculator
    Amount baseAmount{0};

    /// Amount after score adjustment; this is what gets paid
    Amount amount{0};

    RewardType type{RewardType::Performance};

    uint32_t uptimeScore{0};
    uint32_t performanceScore{0};
    uint32_t qualityScore{0};
    uint32_t overallScore{0};

    /// Free-form period label supplied by the caller
    std::string period;

    /// Identity that created the record
    CallerId calculator;

    Timestamp calculatedAt{0};

    /// Zero until settled
    Timestamp distributedAt{0};

    bool settled{false};

    std::vector<Byte> Serialize() const;
    static std::optional<RewardRecord> Deserialize(const Byte* data, size_t len);

    std::string ToString() const;
};

// ============================================================================
// Operator Totals
// ============================================================================

struct OperatorTotals {
    /// Sum of adjusted amounts of all records created
    Amount totalCalculated{0};

    /// Sum of settled amounts; historical, never reduced by slashing
    Amount totalDistributed{0};

    Amount totalSlashed{0};

    Timestamp lastCalculationTime{0};
    Timestamp lastDistributionTime{0};
    Timestamp lastSlashTime{0};

    uint64_t recordCount{0};
    uint64_t slashCount{0};

    std::vector<Byte> Serialize() const;
    static std::optional<OperatorTotals> Deserialize(const Byte* data, size_t len);
};

// ============================================================================
// Slash Record
// ============================================================================

struct SlashRecord {
    OperatorId operatorId;
    Amount amount{0};
    std::string reason;
    uint32_t uptimeScore{0};
    uint32_t performanceScore{0};
    uint32_t qualityScore{0};
    uint32_t overallScore{0};
    CallerId slasher;
    Timestamp timestamp{0};

    std::vector<Byte> Serialize() const;
    static std::optional<SlashRecord> Deserialize(const Byte* data, size_t len);
};

// ============================================================================
// Ledger Statistics
// ============================================================================

struct LedgerStats {
    Amount totalCalculated{0};
    Amount totalDistributed{0};
    Amount totalSlashed{0};
    uint64_t recordCount{0};
    uint64_t settledCount{0};
    uint64_t slashCount{0};

    std::vector<Byte> Serialize() const;
    static std::optional<LedgerStats> Deserialize(const Byte* data, size_t len);

    std::string ToString() const;
};

// ============================================================================
// Utility Functions
// ============================================================================

/// amount * percent / 100, truncated, without overflowing int64
inline Amount PercentOf(Amount amount, uint32_t percent) {
    return amount / 100 * percent + (amount % 100) * percent / 100;
}

/// Format base units as a decimal token amount, e.g. "12.50000000"
std::string FormatAmount(Amount amount, int decimals = 8);

} // namespace rewards
} // namespace nodereward

#endif // NODEREWARD_REWARDS_TYPES_H
