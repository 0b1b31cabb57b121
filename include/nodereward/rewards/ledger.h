// NODEREWARD - Reward Ledger
// Copyright (c) 2024 NODEREWARD Developers
// MIT License
//
// Durable store of reward records, per-operator totals, day and month
// buckets, slash history and global statistics. Every state transition is
// written as a single WriteBatch, so a failed commit leaves nothing behind.

#ifndef NODEREWARD_REWARDS_LEDGER_H
#define NODEREWARD_REWARDS_LEDGER_H

#include "nodereward/core/types.h"
#include "nodereward/core/status.h"
#include "nodereward/db/database.h"
#include "nodereward/rewards/types.h"

#include <mutex>
#include <string>
#include <vector>

namespace nodereward {
namespace rewards {

/// Per-bucket limits checked when a record is added
struct PeriodCaps {
    Amount daily{MAX_DAILY_REWARDS};
    Amount monthly{MAX_MONTHLY_REWARDS};
};

class RewardLedger {
public:
    explicit RewardLedger(db::Database& db);

    // ========================================================================
    // Transitions
    // ========================================================================

    /**
     * Add a new unsettled record.
     *
     * Buckets for record.calculatedAt are checked against caps first
     * (DailyCapExceeded, MonthlyCapExceeded), then the id
     * (DuplicateRewardId). On success the record, both buckets, the
     * operator's totals and index, and the statistics are written together.
     */
    Status AddRecord(const RewardRecord& record, const PeriodCaps& caps);

    /**
     * Mark a record settled at the given time and credit the operator's
     * distributed total. Fails RecordNotFound or AlreadyDistributed.
     *
     * @param settled Receives the updated record (optional)
     */
    Status SettleRecord(const RewardId& id, Timestamp when, RewardRecord* settled = nullptr);

    /// Append a slash and raise the operator's slashed total
    Status AddSlash(const SlashRecord& slash);

    // ========================================================================
    // Queries
    // ========================================================================

    /// RecordNotFound if absent
    Status GetRecord(const RewardId& id, RewardRecord* out) const;

    bool HasRecord(const RewardId& id) const;

    /// An operator without history reads as all zero
    Status GetTotals(const OperatorId& operatorId, OperatorTotals* out) const;

    /// Amount accrued in a bucket; zero if never written
    Status GetBucket(const OperatorId& operatorId, BucketKind kind, Epoch epoch, Amount* out) const;

    /// Records of an operator in reward id order
    Status GetRecordsForOperator(const OperatorId& operatorId, std::vector<RewardRecord>* out) const;

    /// Sum of the operator's unsettled amounts
    Status GetPendingAmount(const OperatorId& operatorId, Amount* out) const;

    /// Slashes of an operator, oldest first
    Status GetSlashHistory(const OperatorId& operatorId, std::vector<SlashRecord>* out) const;

    Status GetStats(LedgerStats* out) const;

    // ========================================================================
    // Keys
    // ========================================================================

    static std::string RecordKey(const RewardId& id);
    static std::string TotalsKey(const OperatorId& operatorId);
    static std::string BucketKey(const OperatorId& operatorId, BucketKind kind, Epoch epoch);
    static std::string IndexPrefix(const OperatorId& operatorId);
    static std::string SlashPrefix(const OperatorId& operatorId);

private:
    Status LoadTotals(const OperatorId& operatorId, OperatorTotals* out) const;
    Status LoadBucket(const std::string& key, Amount* out) const;
    Status LoadStats(LedgerStats* out) const;

    db::Database& db_;
    mutable std::mutex mutex_;
};

} // namespace rewards
} // namespace nodereward

#endif // NODEREWARD_REWARDS_LEDGER_H
