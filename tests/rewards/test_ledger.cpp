// NODEREWARD - Reward Ledger Tests
// Copyright (c) 2024 NODEREWARD Developers
// MIT License

#include <gtest/gtest.h>
#include "nodereward/rewards/ledger.h"
#include "nodereward/db/leveldb.h"
#include "nodereward/util/time.h"

namespace nodereward {
namespace rewards {
namespace test {

namespace {

// Midnight, so a whole day of calculations fits in one daily bucket
constexpr Timestamp T0 = 19676LL * util::SECONDS_PER_DAY;

OperatorId MakeOperator(Byte tag) {
    Byte raw[] = {tag};
    return OperatorId(raw, sizeof(raw));
}

RewardId MakeId(Byte tag) {
    Byte raw[] = {0xEE, tag};
    return RewardId(raw, sizeof(raw));
}

RewardRecord MakeRecord(Byte idTag, const OperatorId& op, Amount amount, Timestamp when) {
    RewardRecord record;
    record.id = MakeId(idTag);
    record.operatorId = op;
    record.nodeId = "node-1";
    record.baseAmount = amount;
    record.amount = amount;
    record.overallScore = 100;
    record.period = "2024-01";
    record.calculatedAt = when;
    return record;
}

} // namespace

class RewardLedgerTest : public ::testing::Test {
protected:
    db::MemoryDatabase db_;
    RewardLedger ledger_{db_};
    OperatorId op_ = MakeOperator(0x01);
};

TEST_F(RewardLedgerTest, AddRecordUpdatesEverything) {
    RewardRecord record = MakeRecord(1, op_, 10 * COIN, T0);
    ASSERT_TRUE(ledger_.AddRecord(record, PeriodCaps()).ok());

    RewardRecord stored;
    ASSERT_TRUE(ledger_.GetRecord(record.id, &stored).ok());
    EXPECT_EQ(stored.amount, 10 * COIN);
    EXPECT_FALSE(stored.settled);
    EXPECT_EQ(stored.distributedAt, 0);
    EXPECT_TRUE(ledger_.HasRecord(record.id));

    OperatorTotals totals;
    ASSERT_TRUE(ledger_.GetTotals(op_, &totals).ok());
    EXPECT_EQ(totals.totalCalculated, 10 * COIN);
    EXPECT_EQ(totals.totalDistributed, 0);
    EXPECT_EQ(totals.recordCount, 1u);
    EXPECT_EQ(totals.lastCalculationTime, T0);

    Amount daily = 0;
    Amount monthly = 0;
    ASSERT_TRUE(ledger_.GetBucket(op_, BucketKind::Daily, DayEpoch(T0), &daily).ok());
    ASSERT_TRUE(ledger_.GetBucket(op_, BucketKind::Monthly, MonthEpoch(T0), &monthly).ok());
    EXPECT_EQ(daily, 10 * COIN);
    EXPECT_EQ(monthly, 10 * COIN);

    LedgerStats stats;
    ASSERT_TRUE(ledger_.GetStats(&stats).ok());
    EXPECT_EQ(stats.totalCalculated, 10 * COIN);
    EXPECT_EQ(stats.recordCount, 1u);
}

TEST_F(RewardLedgerTest, UnknownOperatorReadsZero) {
    OperatorTotals totals;
    ASSERT_TRUE(ledger_.GetTotals(MakeOperator(0x7F), &totals).ok());
    EXPECT_EQ(totals.recordCount, 0u);
    Amount bucket = -1;
    ASSERT_TRUE(ledger_.GetBucket(MakeOperator(0x7F), BucketKind::Daily, 5, &bucket).ok());
    EXPECT_EQ(bucket, 0);
}

TEST_F(RewardLedgerTest, DuplicateIdRejected) {
    ASSERT_TRUE(ledger_.AddRecord(MakeRecord(1, op_, COIN, T0), PeriodCaps()).ok());
    EXPECT_TRUE(ledger_.AddRecord(MakeRecord(1, op_, COIN, T0 + 10), PeriodCaps())
                    .Is(ErrorCode::DuplicateRewardId));

    OperatorTotals totals;
    ASSERT_TRUE(ledger_.GetTotals(op_, &totals).ok());
    EXPECT_EQ(totals.recordCount, 1u);
}

TEST_F(RewardLedgerTest, DailyCapLeavesBucketUnchanged) {
    PeriodCaps caps;
    caps.daily = 15 * COIN;

    ASSERT_TRUE(ledger_.AddRecord(MakeRecord(1, op_, 10 * COIN, T0), caps).ok());
    EXPECT_TRUE(ledger_.AddRecord(MakeRecord(2, op_, 6 * COIN, T0 + 60), caps)
                    .Is(ErrorCode::DailyCapExceeded));

    Amount daily = 0;
    ASSERT_TRUE(ledger_.GetBucket(op_, BucketKind::Daily, DayEpoch(T0), &daily).ok());
    EXPECT_EQ(daily, 10 * COIN);
    EXPECT_FALSE(ledger_.HasRecord(MakeId(2)));

    // Exactly at the cap is allowed
    EXPECT_TRUE(ledger_.AddRecord(MakeRecord(3, op_, 5 * COIN, T0 + 120), caps).ok());

    // Next day starts a new bucket
    EXPECT_TRUE(ledger_.AddRecord(MakeRecord(4, op_, 10 * COIN, T0 + util::SECONDS_PER_DAY), caps).ok());
}

TEST_F(RewardLedgerTest, MonthlyCapSpansDays) {
    PeriodCaps caps;
    caps.daily = 10 * COIN;
    caps.monthly = 15 * COIN;

    ASSERT_TRUE(ledger_.AddRecord(MakeRecord(1, op_, 10 * COIN, T0), caps).ok());
    EXPECT_TRUE(ledger_.AddRecord(MakeRecord(2, op_, 10 * COIN, T0 + util::SECONDS_PER_DAY), caps)
                    .Is(ErrorCode::MonthlyCapExceeded));
}

TEST_F(RewardLedgerTest, CapsArePerOperator) {
    PeriodCaps caps;
    caps.daily = 10 * COIN;
    ASSERT_TRUE(ledger_.AddRecord(MakeRecord(1, op_, 10 * COIN, T0), caps).ok());
    EXPECT_TRUE(ledger_.AddRecord(MakeRecord(2, MakeOperator(0x02), 10 * COIN, T0), caps).ok());
}

TEST_F(RewardLedgerTest, SettleOnce) {
    RewardRecord record = MakeRecord(1, op_, 10 * COIN, T0);
    ASSERT_TRUE(ledger_.AddRecord(record, PeriodCaps()).ok());

    RewardRecord settled;
    ASSERT_TRUE(ledger_.SettleRecord(record.id, T0 + 100, &settled).ok());
    EXPECT_TRUE(settled.settled);
    EXPECT_EQ(settled.distributedAt, T0 + 100);

    EXPECT_TRUE(ledger_.SettleRecord(record.id, T0 + 200).Is(ErrorCode::AlreadyDistributed));

    OperatorTotals totals;
    ASSERT_TRUE(ledger_.GetTotals(op_, &totals).ok());
    EXPECT_EQ(totals.totalDistributed, 10 * COIN);
    EXPECT_EQ(totals.lastDistributionTime, T0 + 100);

    LedgerStats stats;
    ASSERT_TRUE(ledger_.GetStats(&stats).ok());
    EXPECT_EQ(stats.settledCount, 1u);
    EXPECT_EQ(stats.totalDistributed, 10 * COIN);
}

TEST_F(RewardLedgerTest, SettleMissingRecord) {
    EXPECT_TRUE(ledger_.SettleRecord(MakeId(9), T0).Is(ErrorCode::RecordNotFound));
    RewardRecord record;
    EXPECT_TRUE(ledger_.GetRecord(MakeId(9), &record).Is(ErrorCode::RecordNotFound));
}

TEST_F(RewardLedgerTest, RecordsAndPendingForOperator) {
    ASSERT_TRUE(ledger_.AddRecord(MakeRecord(1, op_, 1 * COIN, T0), PeriodCaps()).ok());
    ASSERT_TRUE(ledger_.AddRecord(MakeRecord(2, op_, 2 * COIN, T0 + 1), PeriodCaps()).ok());
    ASSERT_TRUE(ledger_.AddRecord(MakeRecord(3, op_, 4 * COIN, T0 + 2), PeriodCaps()).ok());
    ASSERT_TRUE(ledger_.AddRecord(MakeRecord(4, MakeOperator(0x02), 8 * COIN, T0), PeriodCaps()).ok());
    ASSERT_TRUE(ledger_.SettleRecord(MakeId(2), T0 + 10).ok());

    std::vector<RewardRecord> records;
    ASSERT_TRUE(ledger_.GetRecordsForOperator(op_, &records).ok());
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0].id, MakeId(1));
    EXPECT_EQ(records[2].id, MakeId(3));

    Amount pending = 0;
    ASSERT_TRUE(ledger_.GetPendingAmount(op_, &pending).ok());
    EXPECT_EQ(pending, 5 * COIN);
}

TEST_F(RewardLedgerTest, SlashHistory) {
    SlashRecord first;
    first.operatorId = op_;
    first.amount = 3 * COIN;
    first.reason = "downtime";
    first.timestamp = T0;
    SlashRecord second = first;
    second.amount = 2 * COIN;
    second.reason = "bad data";
    second.timestamp = T0 + 50;

    ASSERT_TRUE(ledger_.AddSlash(first).ok());
    ASSERT_TRUE(ledger_.AddSlash(second).ok());

    std::vector<SlashRecord> history;
    ASSERT_TRUE(ledger_.GetSlashHistory(op_, &history).ok());
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].reason, "downtime");
    EXPECT_EQ(history[1].reason, "bad data");

    OperatorTotals totals;
    ASSERT_TRUE(ledger_.GetTotals(op_, &totals).ok());
    EXPECT_EQ(totals.totalSlashed, 5 * COIN);
    EXPECT_EQ(totals.slashCount, 2u);
    EXPECT_EQ(totals.lastSlashTime, T0 + 50);
}

TEST_F(RewardLedgerTest, FailedWriteChangesNothing) {
    db_.SetFailWrites(true);
    Status st = ledger_.AddRecord(MakeRecord(1, op_, COIN, T0), PeriodCaps());
    EXPECT_TRUE(st.Is(ErrorCode::StorageError));
    db_.SetFailWrites(false);

    EXPECT_FALSE(ledger_.HasRecord(MakeId(1)));
    OperatorTotals totals;
    ASSERT_TRUE(ledger_.GetTotals(op_, &totals).ok());
    EXPECT_EQ(totals.recordCount, 0u);
}

TEST(RewardRecordTest, SerializeKeepsFields) {
    RewardRecord record = MakeRecord(1, MakeOperator(0x01), 7 * COIN, T0);
    record.type = RewardType::Computation;
    record.settled = true;
    record.distributedAt = T0 + 5;

    std::vector<Byte> data = record.Serialize();
    auto decoded = RewardRecord::Deserialize(data.data(), data.size());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->id, record.id);
    EXPECT_EQ(decoded->nodeId, "node-1");
    EXPECT_EQ(decoded->type, RewardType::Computation);
    EXPECT_TRUE(decoded->settled);
    EXPECT_EQ(decoded->distributedAt, T0 + 5);

    EXPECT_FALSE(RewardRecord::Deserialize(data.data(), data.size() - 1).has_value());
}

} // namespace test
} // namespace rewards
} // namespace nodereward
