// NODEREWARD - Reward Distributor Tests
// Copyright (c) 2024 NODEREWARD Developers
// MIT License

#include <gtest/gtest.h>
#include "nodereward/rewards/distributor.h"
#include "nodereward/rewards/ledger.h"
#include "nodereward/db/leveldb.h"
#include "nodereward/util/time.h"

namespace nodereward {
namespace rewards {
namespace test {

namespace {

constexpr Timestamp T0 = 19676LL * util::SECONDS_PER_DAY;

CallerId MakeCaller(Byte tag) {
    Byte raw[] = {tag};
    return CallerId(raw, sizeof(raw));
}

/// Pays normally but cannot take a payment back
class NoReclaimVault : public TokenVault {
public:
    Status Reclaim(const OperatorId&, const OperatorId&, Amount) override {
        return Status::Error(ErrorCode::TransferFailed, "reclaim disabled");
    }
};

} // namespace

class RewardDistributorTest : public ::testing::Test {
protected:
    RewardDistributorTest() : time_(T0) {
        registry_.Grant(distributorId_, access::Capability::Distribute);
        vault_.Credit(treasury_, 1000 * COIN);
        bus_.AddSink(std::make_shared<events::CallbackEventSink>(
            [this](const events::Event& e) { events_.push_back(e); }));
    }

    /// Pending record written straight into the ledger
    RewardId AddPending(Byte tag, Amount amount) {
        Byte raw[] = {0xEE, tag};
        RewardRecord record;
        record.id = RewardId(raw, sizeof(raw));
        record.operatorId = operator_;
        record.nodeId = "node-a";
        record.baseAmount = amount;
        record.amount = amount;
        record.overallScore = 100;
        record.period = "2024-01";
        record.calculatedAt = util::GetTime();
        EXPECT_TRUE(ledger_.AddRecord(record, PeriodCaps()).ok());
        return record.id;
    }

    util::ScopedMockTime time_;
    db::MemoryDatabase db_;
    events::EventBus bus_;
    std::vector<events::Event> events_;
    access::CapabilityRegistry registry_;
    resilience::RateLimiter limiter_{db_, &bus_};
    resilience::CircuitBreaker breaker_{db_, registry_, &bus_};
    resilience::EmergencyPause pause_{db_, registry_, &bus_};
    resilience::AdmissionGate gate_{pause_, breaker_, limiter_};
    util::EntityLockTable locks_;
    RewardLedger ledger_{db_};
    RewardContext ctx_{ledger_, registry_, gate_, breaker_, nullptr, locks_, &bus_};
    TokenVault vault_;

    CallerId distributorId_ = MakeCaller(0xD1);
    OperatorId operator_ = MakeCaller(0x0A);
    OperatorId treasury_ = MakeCaller(0x7E);

    RewardDistributor distributor_{ctx_, vault_, AssetMode::Transfer, treasury_};
};

TEST_F(RewardDistributorTest, SettlesAndPays) {
    RewardId id = AddPending(1, 100 * COIN);
    util::AdvanceMockTime(util::Seconds(30));

    ASSERT_TRUE(distributor_.Distribute(distributorId_, id).ok());

    EXPECT_EQ(vault_.BalanceOf(operator_), 100 * COIN);
    EXPECT_EQ(vault_.BalanceOf(treasury_), 900 * COIN);

    RewardRecord record;
    ASSERT_TRUE(ledger_.GetRecord(id, &record).ok());
    EXPECT_TRUE(record.settled);
    EXPECT_EQ(record.distributedAt, T0 + 30);
    EXPECT_EQ(record.amount, 100 * COIN);

    OperatorTotals totals;
    ASSERT_TRUE(ledger_.GetTotals(operator_, &totals).ok());
    EXPECT_EQ(totals.totalDistributed, 100 * COIN);
    EXPECT_EQ(totals.lastDistributionTime, T0 + 30);

    const events::Event& event = events_.back();
    EXPECT_EQ(event.type, events::EventType::RewardDistributed);
    EXPECT_EQ(event.Find("distributedAt")->before, "0");
    EXPECT_EQ(event.Find("distributedAt")->after, std::to_string(T0 + 30));
    EXPECT_EQ(event.Find("mode")->after, "transfer");
}

TEST_F(RewardDistributorTest, SecondDistributionRejected) {
    RewardId id = AddPending(1, 100 * COIN);
    ASSERT_TRUE(distributor_.Distribute(distributorId_, id).ok());
    EXPECT_TRUE(distributor_.Distribute(distributorId_, id).Is(ErrorCode::AlreadyDistributed));

    EXPECT_EQ(vault_.BalanceOf(operator_), 100 * COIN);
    OperatorTotals totals;
    ASSERT_TRUE(ledger_.GetTotals(operator_, &totals).ok());
    EXPECT_EQ(totals.totalDistributed, 100 * COIN);
}

TEST_F(RewardDistributorTest, UnknownRecord) {
    Byte raw[] = {0x99};
    EXPECT_TRUE(distributor_.Distribute(distributorId_, RewardId(raw, sizeof(raw)))
                    .Is(ErrorCode::RecordNotFound));
}

TEST_F(RewardDistributorTest, RequiresCapability) {
    RewardId id = AddPending(1, COIN);
    EXPECT_TRUE(distributor_.Distribute(operator_, id).Is(ErrorCode::Unauthorized));
}

TEST_F(RewardDistributorTest, InsufficientTreasury) {
    RewardId id = AddPending(1, 1001 * COIN);
    EXPECT_TRUE(distributor_.Distribute(distributorId_, id).Is(ErrorCode::InsufficientBalance));
    EXPECT_FALSE(distributor_.CanPay(1001 * COIN));
    EXPECT_TRUE(distributor_.CanPay(1000 * COIN));

    RewardRecord record;
    ASSERT_TRUE(ledger_.GetRecord(id, &record).ok());
    EXPECT_FALSE(record.settled);
    EXPECT_EQ(vault_.BalanceOf(treasury_), 1000 * COIN);
}

TEST_F(RewardDistributorTest, MintMode) {
    distributor_.SetAssetMode(AssetMode::Mint);
    EXPECT_EQ(distributor_.GetAssetMode(), AssetMode::Mint);
    EXPECT_TRUE(distributor_.CanPay(MAX_MONEY));

    RewardId id = AddPending(1, 2000 * COIN);
    ASSERT_TRUE(distributor_.Distribute(distributorId_, id).ok());
    EXPECT_EQ(vault_.BalanceOf(operator_), 2000 * COIN);
    EXPECT_EQ(vault_.BalanceOf(treasury_), 1000 * COIN);
    EXPECT_EQ(vault_.TotalMinted(), 2000 * COIN);
}

TEST_F(RewardDistributorTest, PaymentFailureLeavesRecordPending) {
    RewardId id = AddPending(1, 10 * COIN);
    vault_.SetFailPayments(true);

    EXPECT_TRUE(distributor_.Distribute(distributorId_, id).Is(ErrorCode::TransferFailed));

    RewardRecord record;
    ASSERT_TRUE(ledger_.GetRecord(id, &record).ok());
    EXPECT_FALSE(record.settled);

    resilience::CircuitBreakerState state;
    ASSERT_TRUE(breaker_.GetState(resilience::Operation::REWARD_DISTRIBUTION, &state).ok());
    EXPECT_EQ(state.failureCount, 1u);

    vault_.SetFailPayments(false);
    EXPECT_TRUE(distributor_.Distribute(distributorId_, id).ok());
}

TEST_F(RewardDistributorTest, LedgerFailureReclaimsPayment) {
    RewardId id = AddPending(1, 10 * COIN);
    db_.SetFailWrites(true);

    EXPECT_TRUE(distributor_.Distribute(distributorId_, id).Is(ErrorCode::StorageError));
    EXPECT_EQ(vault_.BalanceOf(operator_), 0);
    EXPECT_EQ(vault_.BalanceOf(treasury_), 1000 * COIN);

    db_.SetFailWrites(false);
    RewardRecord record;
    ASSERT_TRUE(ledger_.GetRecord(id, &record).ok());
    EXPECT_FALSE(record.settled);
}

TEST_F(RewardDistributorTest, UnreclaimedPaymentBlocksRetry) {
    NoReclaimVault vault;
    vault.Credit(treasury_, 1000 * COIN);
    RewardDistributor distributor(ctx_, vault, AssetMode::Transfer, treasury_);

    RewardId id = AddPending(1, 10 * COIN);
    db_.SetFailWrites(true);
    EXPECT_TRUE(distributor.Distribute(distributorId_, id).Is(ErrorCode::PaymentUnreconciled));
    db_.SetFailWrites(false);
    EXPECT_EQ(vault.BalanceOf(operator_), 10 * COIN);

    std::vector<RewardId> open = distributor.GetUnreconciled();
    ASSERT_EQ(open.size(), 1u);
    EXPECT_EQ(open[0], id);

    // The record is still pending but must not be paid a second time
    RewardRecord record;
    ASSERT_TRUE(ledger_.GetRecord(id, &record).ok());
    EXPECT_FALSE(record.settled);
    EXPECT_TRUE(distributor.Distribute(distributorId_, id).Is(ErrorCode::PaymentUnreconciled));
    EXPECT_EQ(vault.BalanceOf(operator_), 10 * COIN);

    EXPECT_TRUE(distributor.ClearUnreconciled(id));
    EXPECT_FALSE(distributor.ClearUnreconciled(id));
    EXPECT_TRUE(distributor.GetUnreconciled().empty());
}

TEST_F(RewardDistributorTest, PausedDistribution) {
    CallerId admin = MakeCaller(0xAD);
    registry_.Grant(admin, access::Capability::Admin);
    ASSERT_TRUE(pause_.Activate(admin, resilience::GLOBAL_SUBSYSTEM, "incident", 0).ok());

    RewardId id = AddPending(1, COIN);
    EXPECT_TRUE(distributor_.Distribute(distributorId_, id).Is(ErrorCode::SubsystemPaused));
}

TEST_F(RewardDistributorTest, TreasuryAccessors) {
    EXPECT_EQ(distributor_.GetTreasury(), treasury_);
    OperatorId other = MakeCaller(0x55);
    distributor_.SetTreasury(other);
    EXPECT_EQ(distributor_.GetTreasury(), other);
    EXPECT_FALSE(distributor_.CanPay(1));
}

} // namespace test
} // namespace rewards
} // namespace nodereward
