// NODEREWARD - Admission Gate Tests
// Copyright (c) 2024 NODEREWARD Developers
// MIT License

#include <gtest/gtest.h>
#include "nodereward/resilience/admission.h"
#include "nodereward/access/capability.h"
#include "nodereward/db/leveldb.h"
#include "nodereward/util/time.h"

namespace nodereward {
namespace resilience {
namespace test {

class AdmissionGateTest : public ::testing::Test {
protected:
    AdmissionGateTest()
        : time_(1700000000),
          limiter_(db_),
          breaker_(db_, registry_),
          pause_(db_, registry_),
          gate_(pause_, breaker_, limiter_) {
        Byte a[] = {0xA1};
        Byte c[] = {0xC3};
        admin_ = CallerId(a, sizeof(a));
        caller_ = CallerId(c, sizeof(c));
        registry_.Grant(admin_, access::Capability::Admin);
        gate_.SetPolicy(Operation::REWARD_CALCULATION, RateLimitPolicy{2, 60});
    }

    uint32_t UsedBudget() {
        RateLimitState state;
        EXPECT_TRUE(limiter_.GetState(caller_, Operation::REWARD_CALCULATION, &state).ok());
        return state.count;
    }

    util::ScopedMockTime time_;
    db::MemoryDatabase db_;
    access::CapabilityRegistry registry_;
    RateLimiter limiter_;
    CircuitBreaker breaker_;
    EmergencyPause pause_;
    AdmissionGate gate_;
    CallerId admin_;
    CallerId caller_;
};

TEST_F(AdmissionGateTest, CommittedTicketKeepsBudget) {
    {
        Admission ticket = gate_.Admit(caller_, Operation::REWARD_CALCULATION);
        ASSERT_TRUE(ticket.ok());
        ticket.Commit();
    }
    EXPECT_EQ(UsedBudget(), 1u);
}

TEST_F(AdmissionGateTest, UncommittedTicketRollsBack) {
    {
        Admission ticket = gate_.Admit(caller_, Operation::REWARD_CALCULATION);
        ASSERT_TRUE(ticket.ok());
        EXPECT_EQ(UsedBudget(), 1u);
    }
    EXPECT_EQ(UsedBudget(), 0u);
}

TEST_F(AdmissionGateTest, MovedTicketRollsBackOnce) {
    {
        Admission first = gate_.Admit(caller_, Operation::REWARD_CALCULATION);
        first.Commit();
    }
    {
        Admission ticket = gate_.Admit(caller_, Operation::REWARD_CALCULATION);
        Admission moved(std::move(ticket));
        ASSERT_TRUE(moved.ok());
    }
    EXPECT_EQ(UsedBudget(), 1u);
}

TEST_F(AdmissionGateTest, RateLimitApplies) {
    for (int i = 0; i < 2; ++i) {
        Admission ticket = gate_.Admit(caller_, Operation::REWARD_CALCULATION);
        ASSERT_TRUE(ticket.ok());
        ticket.Commit();
    }
    Admission rejected = gate_.Admit(caller_, Operation::REWARD_CALCULATION);
    EXPECT_TRUE(rejected.status().Is(ErrorCode::RateLimitExceeded));
}

TEST_F(AdmissionGateTest, UnlimitedOperationPasses) {
    EXPECT_FALSE(gate_.GetPolicy(Operation::SLASHING).has_value());
    for (int i = 0; i < 10; ++i) {
        Admission ticket = gate_.Admit(caller_, Operation::SLASHING);
        EXPECT_TRUE(ticket.ok());
        ticket.Commit();
    }
}

TEST_F(AdmissionGateTest, PauseCheckedBeforeBudget) {
    ASSERT_TRUE(pause_.Activate(admin_, Operation::REWARD_CALCULATION, "halt", 0).ok());
    Admission ticket = gate_.Admit(caller_, Operation::REWARD_CALCULATION);
    EXPECT_TRUE(ticket.status().Is(ErrorCode::SubsystemPaused));
    EXPECT_EQ(UsedBudget(), 0u);
}

TEST_F(AdmissionGateTest, OpenBreakerRejects) {
    ASSERT_TRUE(breaker_.Trip(admin_, Operation::REWARD_CALCULATION, "bad data").ok());
    Admission ticket = gate_.Admit(caller_, Operation::REWARD_CALCULATION);
    EXPECT_TRUE(ticket.status().Is(ErrorCode::CircuitOpen));
    EXPECT_TRUE(gate_.CheckGates(Operation::REWARD_CALCULATION).Is(ErrorCode::CircuitOpen));
    EXPECT_TRUE(gate_.CheckGates(Operation::SLASHING).ok());
}

TEST_F(AdmissionGateTest, GlobalPauseRejectsAll) {
    ASSERT_TRUE(pause_.Activate(admin_, GLOBAL_SUBSYSTEM, "incident", 0).ok());
    EXPECT_TRUE(gate_.CheckGates(Operation::SLASHING).Is(ErrorCode::SubsystemPaused));
}

} // namespace test
} // namespace resilience
} // namespace nodereward
