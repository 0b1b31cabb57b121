// NODEREWARD - Rate Limiter Tests
// Copyright (c) 2024 NODEREWARD Developers
// MIT License

#include <gtest/gtest.h>
#include "nodereward/resilience/rate_limiter.h"
#include "nodereward/db/leveldb.h"
#include "nodereward/util/time.h"

namespace nodereward {
namespace resilience {
namespace test {

class RateLimiterTest : public ::testing::Test {
protected:
    void SetUp() override {
        util::SetMockTime(1700000000);
        util::EnableMockTime();
        bus_.AddSink(std::make_shared<events::CallbackEventSink>(
            [this](const events::Event& e) { events_.push_back(e); }));
        Byte raw[] = {0x11};
        caller_ = CallerId(raw, sizeof(raw));
    }

    void TearDown() override {
        util::DisableMockTime();
    }

    db::MemoryDatabase db_;
    events::EventBus bus_;
    std::vector<events::Event> events_;
    RateLimiter limiter_{db_, &bus_};
    CallerId caller_;
};

TEST_F(RateLimiterTest, FourthCallInWindowRejected) {
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(limiter_.Check(caller_, "rewardCalculation", 3, 60).ok());
    }

    Status st = limiter_.Check(caller_, "rewardCalculation", 3, 60);
    EXPECT_TRUE(st.Is(ErrorCode::RateLimitExceeded));
    EXPECT_EQ(st.message(), "count 3 of max 3");

    ASSERT_EQ(events_.size(), 1u);
    EXPECT_EQ(events_[0].type, events::EventType::RateLimitExceeded);
    EXPECT_EQ(events_[0].Find("count")->after, "3");
}

TEST_F(RateLimiterTest, RejectionDoesNotTouchState) {
    for (int i = 0; i < 2; ++i) {
        ASSERT_TRUE(limiter_.Check(caller_, "slashing", 2, 60).ok());
    }
    RateLimitState before;
    ASSERT_TRUE(limiter_.GetState(caller_, "slashing", &before).ok());

    EXPECT_FALSE(limiter_.Check(caller_, "slashing", 2, 60).ok());

    RateLimitState after;
    ASSERT_TRUE(limiter_.GetState(caller_, "slashing", &after).ok());
    EXPECT_EQ(after.count, before.count);
    EXPECT_EQ(after.windowStart, before.windowStart);
}

TEST_F(RateLimiterTest, WindowResetsAfterExpiry) {
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(limiter_.Check(caller_, "rewardCalculation", 3, 60).ok());
    }
    util::AdvanceMockTime(util::Seconds(60));

    RateLimitState state;
    ASSERT_TRUE(limiter_.Check(caller_, "rewardCalculation", 3, 60, &state).ok());
    EXPECT_EQ(state.count, 1u);
    EXPECT_EQ(state.windowStart, 1700000060);
}

TEST_F(RateLimiterTest, WindowStillOpenOneSecondBefore) {
    ASSERT_TRUE(limiter_.Check(caller_, "x", 1, 60).ok());
    util::AdvanceMockTime(util::Seconds(59));
    EXPECT_TRUE(limiter_.Check(caller_, "x", 1, 60).Is(ErrorCode::RateLimitExceeded));
}

TEST_F(RateLimiterTest, CallersAndOperationsAreIndependent) {
    Byte raw[] = {0x22};
    CallerId other(raw, sizeof(raw));

    ASSERT_TRUE(limiter_.Check(caller_, "a", 1, 60).ok());
    EXPECT_TRUE(limiter_.Check(other, "a", 1, 60).ok());
    EXPECT_TRUE(limiter_.Check(caller_, "b", 1, 60).ok());
    EXPECT_FALSE(limiter_.Check(caller_, "a", 1, 60).ok());
}

TEST_F(RateLimiterTest, ReleaseGivesBackBudget) {
    RateLimitState state;
    ASSERT_TRUE(limiter_.Check(caller_, "a", 1, 60, &state).ok());
    ASSERT_TRUE(limiter_.Release(caller_, "a", state.windowStart).ok());
    EXPECT_TRUE(limiter_.Check(caller_, "a", 1, 60).ok());
}

TEST_F(RateLimiterTest, ReleaseIgnoresReplacedWindow) {
    RateLimitState first;
    ASSERT_TRUE(limiter_.Check(caller_, "a", 5, 60, &first).ok());
    util::AdvanceMockTime(util::Seconds(120));
    RateLimitState second;
    ASSERT_TRUE(limiter_.Check(caller_, "a", 5, 60, &second).ok());

    ASSERT_TRUE(limiter_.Release(caller_, "a", first.windowStart).ok());
    RateLimitState now;
    ASSERT_TRUE(limiter_.GetState(caller_, "a", &now).ok());
    EXPECT_EQ(now.count, 1u);
}

TEST_F(RateLimiterTest, InvalidWindowRejected) {
    EXPECT_TRUE(limiter_.Check(caller_, "a", 1, 0).Is(ErrorCode::InvalidArgument));
    EXPECT_TRUE(limiter_.Check(caller_, "", 1, 60).Is(ErrorCode::InvalidArgument));
}

TEST_F(RateLimiterTest, StorageFailureSurfaces) {
    db_.SetFailWrites(true);
    EXPECT_TRUE(limiter_.Check(caller_, "a", 1, 60).Is(ErrorCode::StorageError));
}

} // namespace test
} // namespace resilience
} // namespace nodereward
