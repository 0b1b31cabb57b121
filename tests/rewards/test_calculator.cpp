// NODEREWARD - Reward Calculator Tests
// Copyright (c) 2024 NODEREWARD Developers
// MIT License

#include <gtest/gtest.h>
#include "nodereward/rewards/calculator.h"
#include "nodereward/rewards/slashing.h"
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

} // namespace

class RewardCalculatorTest : public ::testing::Test {
protected:
    RewardCalculatorTest() : time_(T0) {
        registry_.Grant(calculatorId_, access::Capability::Calculate);
        registry_.Grant(admin_, access::Capability::Admin);

        AddNode("node-a", operatorA_, node::NodeStatus::Active);
        AddNode("node-b", operatorB_, node::NodeStatus::Listed);
        AddNode("node-down", operatorA_, node::NodeStatus::Suspended);

        bus_.AddSink(std::make_shared<events::CallbackEventSink>(
            [this](const events::Event& e) { events_.push_back(e); }));
    }

    void AddNode(const std::string& id, const OperatorId& op, node::NodeStatus status) {
        node::NodeInfo info;
        info.nodeId = id;
        info.operatorId = op;
        info.status = status;
        nodes_.Add(info);
    }

    CalculationRequest Request(const OperatorId& op, const std::string& nodeId,
                               Amount base = 100 * COIN) const {
        CalculationRequest request;
        request.operatorId = op;
        request.nodeId = nodeId;
        request.baseAmount = base;
        request.type = RewardType::Performance;
        request.uptime = 100;
        request.performance = 100;
        request.quality = 100;
        request.period = "2024-W03";
        return request;
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
    node::StaticNodeDirectory nodes_;
    SlashingEngine slashing_{ctx_};
    RewardCalculator calculator_{ctx_, nodes_, slashing_};

    CallerId calculatorId_ = MakeCaller(0xC1);
    CallerId admin_ = MakeCaller(0xAD);
    OperatorId operatorA_ = MakeCaller(0x0A);
    OperatorId operatorB_ = MakeCaller(0x0B);
};

TEST_F(RewardCalculatorTest, CreatesPendingRecord) {
    RewardId id;
    ASSERT_TRUE(calculator_.Calculate(calculatorId_, Request(operatorA_, "node-a"), &id).ok());
    EXPECT_FALSE(id.IsNull());

    RewardRecord record;
    ASSERT_TRUE(ledger_.GetRecord(id, &record).ok());
    EXPECT_EQ(record.operatorId, operatorA_);
    EXPECT_EQ(record.nodeId, "node-a");
    EXPECT_EQ(record.baseAmount, 100 * COIN);
    EXPECT_EQ(record.amount, 100 * COIN);
    EXPECT_EQ(record.overallScore, 100u);
    EXPECT_EQ(record.calculator, calculatorId_);
    EXPECT_EQ(record.calculatedAt, T0);
    EXPECT_FALSE(record.settled);
    EXPECT_EQ(record.distributedAt, 0);

    OperatorTotals totals;
    ASSERT_TRUE(ledger_.GetTotals(operatorA_, &totals).ok());
    EXPECT_EQ(totals.totalCalculated, 100 * COIN);
    EXPECT_EQ(totals.recordCount, 1u);

    ASSERT_FALSE(events_.empty());
    const events::Event& event = events_.back();
    EXPECT_EQ(event.type, events::EventType::RewardCalculated);
    EXPECT_EQ(event.subject, id.ToHex());
    EXPECT_EQ(event.actor, calculatorId_.ToHex());
    EXPECT_EQ(event.Find("dailyBucket")->before, "0");
    EXPECT_EQ(event.Find("dailyBucket")->after, std::to_string(100 * COIN));
}

TEST_F(RewardCalculatorTest, IdMatchesContent) {
    RewardId id;
    CalculationRequest request = Request(operatorA_, "node-a");
    ASSERT_TRUE(calculator_.Calculate(calculatorId_, request, &id).ok());
    EXPECT_EQ(id, RewardCalculator::ComputeRewardId(operatorA_, "node-a", 100 * COIN, T0,
                                                    RewardType::Performance, "2024-W03"));
}

TEST_F(RewardCalculatorTest, ScoreAdjustsAmount) {
    CalculationRequest request = Request(operatorA_, "node-a");
    request.uptime = 80;
    request.performance = 90;
    request.quality = 70;

    RewardId id;
    ASSERT_TRUE(calculator_.Calculate(calculatorId_, request, &id).ok());
    RewardRecord record;
    ASSERT_TRUE(ledger_.GetRecord(id, &record).ok());
    EXPECT_EQ(record.overallScore, 81u);
    EXPECT_EQ(record.amount, 81 * COIN);
    EXPECT_EQ(record.baseAmount, 100 * COIN);
}

TEST_F(RewardCalculatorTest, RequiresCapability) {
    RewardId id;
    EXPECT_TRUE(calculator_.Calculate(admin_, Request(operatorA_, "node-a"), &id)
                    .Is(ErrorCode::Unauthorized));
}

TEST_F(RewardCalculatorTest, NodeChecks) {
    RewardId id;
    EXPECT_TRUE(calculator_.Calculate(calculatorId_, Request(operatorA_, "missing"), &id)
                    .Is(ErrorCode::NodeNotFound));
    EXPECT_TRUE(calculator_.Calculate(calculatorId_, Request(operatorA_, "node-down"), &id)
                    .Is(ErrorCode::NodeNotActive));
    EXPECT_TRUE(calculator_.Calculate(calculatorId_, Request(operatorA_, "node-b"), &id)
                    .Is(ErrorCode::InvalidOperator));
    EXPECT_TRUE(calculator_.Calculate(calculatorId_, Request(operatorA_, "bad id!"), &id)
                    .Is(ErrorCode::InvalidNodeId));
    EXPECT_TRUE(calculator_.Calculate(calculatorId_, Request(OperatorId(), "node-a"), &id)
                    .Is(ErrorCode::InvalidOperator));
}

TEST_F(RewardCalculatorTest, InputValidation) {
    RewardId id;

    CalculationRequest request = Request(operatorA_, "node-a");
    request.quality = 101;
    EXPECT_TRUE(calculator_.Calculate(calculatorId_, request, &id).Is(ErrorCode::InvalidScore));

    request = Request(operatorA_, "node-a");
    request.type = static_cast<RewardType>(9);
    EXPECT_TRUE(calculator_.Calculate(calculatorId_, request, &id).Is(ErrorCode::InvalidRewardType));

    request = Request(operatorA_, "node-a");
    request.period.clear();
    EXPECT_TRUE(calculator_.Calculate(calculatorId_, request, &id).Is(ErrorCode::InvalidPeriod));

    EXPECT_TRUE(calculator_.Calculate(calculatorId_, Request(operatorA_, "node-a", MIN_REWARD_AMOUNT - 1), &id)
                    .Is(ErrorCode::InvalidAmount));
    EXPECT_TRUE(calculator_.Calculate(calculatorId_, Request(operatorA_, "node-a", MAX_REWARD_AMOUNT + 1), &id)
                    .Is(ErrorCode::InvalidAmount));

    OperatorTotals totals;
    ASSERT_TRUE(ledger_.GetTotals(operatorA_, &totals).ok());
    EXPECT_EQ(totals.recordCount, 0u);
}

TEST_F(RewardCalculatorTest, AdjustedAmountBelowMinimum) {
    CalculationRequest request = Request(operatorA_, "node-a", MIN_REWARD_AMOUNT);
    request.uptime = 50;
    request.performance = 50;
    request.quality = 50;

    RewardId id;
    EXPECT_TRUE(calculator_.Calculate(calculatorId_, request, &id).Is(ErrorCode::InvalidAmount));
}

TEST_F(RewardCalculatorTest, MinimumInterval) {
    RewardId id;
    ASSERT_TRUE(calculator_.Calculate(calculatorId_, Request(operatorA_, "node-a"), &id).ok());

    util::AdvanceMockTime(util::Seconds(MIN_REWARD_INTERVAL - 1));
    EXPECT_TRUE(calculator_.Calculate(calculatorId_, Request(operatorA_, "node-a"), &id)
                    .Is(ErrorCode::TooRecent));

    // Other operators are unaffected
    EXPECT_TRUE(calculator_.Calculate(calculatorId_, Request(operatorB_, "node-b"), &id).ok());

    util::AdvanceMockTime(util::Seconds(1));
    EXPECT_TRUE(calculator_.Calculate(calculatorId_, Request(operatorA_, "node-a"), &id).ok());
}

TEST_F(RewardCalculatorTest, DailyCapRejectionLeavesBucket) {
    RewardLimits limits = calculator_.GetLimits();
    limits.maxDaily = 150 * COIN;
    calculator_.SetLimits(limits);

    RewardId id;
    ASSERT_TRUE(calculator_.Calculate(calculatorId_, Request(operatorA_, "node-a"), &id).ok());
    util::AdvanceMockTime(util::Seconds(MIN_REWARD_INTERVAL));
    EXPECT_TRUE(calculator_.Calculate(calculatorId_, Request(operatorA_, "node-a"), &id)
                    .Is(ErrorCode::DailyCapExceeded));

    Amount daily = 0;
    ASSERT_TRUE(ledger_.GetBucket(operatorA_, BucketKind::Daily, DayEpoch(T0), &daily).ok());
    EXPECT_EQ(daily, 100 * COIN);

    util::AdvanceMockTime(util::Seconds(util::SECONDS_PER_DAY));
    EXPECT_TRUE(calculator_.Calculate(calculatorId_, Request(operatorA_, "node-a"), &id).ok());
}

TEST_F(RewardCalculatorTest, MonthlyCap) {
    RewardLimits limits = calculator_.GetLimits();
    limits.maxDaily = 100 * COIN;
    limits.maxMonthly = 150 * COIN;
    calculator_.SetLimits(limits);

    RewardId id;
    ASSERT_TRUE(calculator_.Calculate(calculatorId_, Request(operatorA_, "node-a"), &id).ok());
    util::AdvanceMockTime(util::Seconds(util::SECONDS_PER_DAY));
    EXPECT_TRUE(calculator_.Calculate(calculatorId_, Request(operatorA_, "node-a"), &id)
                    .Is(ErrorCode::MonthlyCapExceeded));
}

TEST_F(RewardCalculatorTest, SlashedOperatorIneligible) {
    SlashRecord slash;
    slash.operatorId = operatorA_;
    slash.amount = COIN;
    slash.timestamp = T0;
    ASSERT_TRUE(ledger_.AddSlash(slash).ok());

    RewardId id;
    EXPECT_TRUE(calculator_.Calculate(calculatorId_, Request(operatorA_, "node-a"), &id)
                    .Is(ErrorCode::NotEligible));

    util::AdvanceMockTime(util::Seconds(SLASHING_COOLDOWN));
    EXPECT_TRUE(calculator_.Calculate(calculatorId_, Request(operatorA_, "node-a"), &id).ok());
}

TEST_F(RewardCalculatorTest, GatesApply) {
    RewardId id;
    ASSERT_TRUE(pause_.Activate(admin_, resilience::Operation::REWARD_CALCULATION, "audit", 0).ok());
    EXPECT_TRUE(calculator_.Calculate(calculatorId_, Request(operatorA_, "node-a"), &id)
                    .Is(ErrorCode::SubsystemPaused));
    ASSERT_TRUE(pause_.Deactivate(admin_, resilience::Operation::REWARD_CALCULATION).ok());

    ASSERT_TRUE(breaker_.Trip(admin_, resilience::Operation::REWARD_CALCULATION, "bad oracle").ok());
    Status st = calculator_.Calculate(calculatorId_, Request(operatorA_, "node-a"), &id);
    EXPECT_TRUE(st.Is(ErrorCode::CircuitOpen));
    EXPECT_EQ(st.message(), "bad oracle");
}

TEST_F(RewardCalculatorTest, RejectedCallDoesNotSpendBudget) {
    gate_.SetPolicy(resilience::Operation::REWARD_CALCULATION, resilience::RateLimitPolicy{1, 3600});

    RewardId id;
    EXPECT_TRUE(calculator_.Calculate(calculatorId_, Request(operatorA_, "missing"), &id)
                    .Is(ErrorCode::NodeNotFound));
    ASSERT_TRUE(calculator_.Calculate(calculatorId_, Request(operatorA_, "node-a"), &id).ok());
    EXPECT_TRUE(calculator_.Calculate(calculatorId_, Request(operatorB_, "node-b"), &id)
                    .Is(ErrorCode::RateLimitExceeded));
}

TEST_F(RewardCalculatorTest, SuccessCountedByBreaker) {
    RewardId id;
    ASSERT_TRUE(calculator_.Calculate(calculatorId_, Request(operatorA_, "node-a"), &id).ok());
    EXPECT_TRUE(calculator_.Calculate(calculatorId_, Request(operatorA_, "missing"), &id)
                    .Is(ErrorCode::NodeNotFound));

    resilience::CircuitBreakerState state;
    ASSERT_TRUE(breaker_.GetState(resilience::Operation::REWARD_CALCULATION, &state).ok());
    EXPECT_EQ(state.successCount, 1u);
    EXPECT_EQ(state.failureCount, 0u);
}

TEST_F(RewardCalculatorTest, StorageFailureLeavesNoRecord) {
    db_.SetFailWrites(true);
    RewardId id;
    EXPECT_TRUE(calculator_.Calculate(calculatorId_, Request(operatorA_, "node-a"), &id)
                    .Is(ErrorCode::StorageError));
    db_.SetFailWrites(false);

    OperatorTotals totals;
    ASSERT_TRUE(ledger_.GetTotals(operatorA_, &totals).ok());
    EXPECT_EQ(totals.recordCount, 0u);
}

TEST_F(RewardCalculatorTest, BusyOperatorRejected) {
    util::EntityLock held = locks_.TryAcquire(OperatorLockKey(operatorA_));
    ASSERT_TRUE(held.IsLocked());

    RewardId id;
    EXPECT_TRUE(calculator_.Calculate(calculatorId_, Request(operatorA_, "node-a"), &id)
                    .Is(ErrorCode::EntityBusy));
}

} // namespace test
} // namespace rewards
} // namespace nodereward
