// NODEREWARD - Timelock Tests
// Copyright (c) 2024 NODEREWARD Developers
// MIT License

#include <gtest/gtest.h>
#include "nodereward/resilience/timelock.h"
#include "nodereward/access/capability.h"
#include "nodereward/db/leveldb.h"
#include "nodereward/util/time.h"

namespace nodereward {
namespace resilience {
namespace test {

namespace {

const char* const MARKER_KEY = "command-marker";

/// Records what it was asked to run and fails on request
class RecordingExecutor : public IProposalExecutor {
public:
    Status PrepareProposal(const OperationHash& hash, const std::vector<Byte>& payload,
                           db::WriteBatch& batch, std::function<void()>* onCommit) override {
        ++calls;
        lastHash = hash;
        lastPayload = payload;
        if (fail) {
            return Status::Error(ErrorCode::InvalidArgument, "rejected");
        }
        batch.Put(MARKER_KEY, "1");
        *onCommit = [this]() { ++applied; };
        return Status::Ok();
    }

    int calls{0};
    int applied{0};
    bool fail{false};
    OperationHash lastHash;
    std::vector<Byte> lastPayload;
};

} // namespace

class TimelockTest : public ::testing::Test {
protected:
    TimelockTest() : time_(1700000000), timelock_(db_, registry_, &bus_) {
        Byte a[] = {0xA1};
        Byte o[] = {0xB2};
        admin_ = CallerId(a, sizeof(a));
        outsider_ = CallerId(o, sizeof(o));
        registry_.Grant(admin_, access::Capability::Admin);
        bus_.AddSink(std::make_shared<events::CallbackEventSink>(
            [this](const events::Event& e) { events_.push_back(e); }));
    }

    OperationHash ProposeDefault() {
        OperationHash hash;
        EXPECT_TRUE(timelock_.Propose(admin_, payload_, MIN_TIMELOCK_DELAY, "raise cap", &hash).ok());
        return hash;
    }

    util::ScopedMockTime time_;
    db::MemoryDatabase db_;
    access::CapabilityRegistry registry_;
    events::EventBus bus_;
    std::vector<events::Event> events_;
    TimelockController timelock_;
    RecordingExecutor executor_;
    CallerId admin_;
    CallerId outsider_;
    std::vector<Byte> payload_{0x01, 0x00, 0x10, 0x27};
};

TEST_F(TimelockTest, ProposeStoresProposal) {
    OperationHash hash = ProposeDefault();
    EXPECT_EQ(hash, TimelockController::HashPayload(payload_));

    TimelockProposal proposal;
    ASSERT_TRUE(timelock_.GetProposal(hash, &proposal).ok());
    EXPECT_EQ(proposal.proposer, admin_);
    EXPECT_EQ(proposal.proposedAt, 1700000000);
    EXPECT_EQ(proposal.executeAfter, 1700000000 + MIN_TIMELOCK_DELAY);
    EXPECT_EQ(proposal.description, "raise cap");
    EXPECT_EQ(proposal.payload, payload_);
    EXPECT_FALSE(proposal.executed);

    ASSERT_EQ(events_.size(), 1u);
    EXPECT_EQ(events_[0].type, events::EventType::OperationProposed);
    EXPECT_EQ(events_[0].subject, hash.ToHex());
}

TEST_F(TimelockTest, ExecuteBeforeDelayFails) {
    OperationHash hash = ProposeDefault();
    util::AdvanceMockTime(util::Seconds(MIN_TIMELOCK_DELAY - 1));

    EXPECT_TRUE(timelock_.Execute(admin_, hash, executor_).Is(ErrorCode::TimelockNotReady));
    EXPECT_EQ(executor_.calls, 0);
}

TEST_F(TimelockTest, ExecuteAfterDelayRunsOnce) {
    OperationHash hash = ProposeDefault();
    util::AdvanceMockTime(util::Seconds(MIN_TIMELOCK_DELAY));

    ASSERT_TRUE(timelock_.Execute(admin_, hash, executor_).ok());
    EXPECT_EQ(executor_.calls, 1);
    EXPECT_EQ(executor_.applied, 1);
    EXPECT_TRUE(db_.Exists(MARKER_KEY));
    EXPECT_EQ(executor_.lastHash, hash);
    EXPECT_EQ(executor_.lastPayload, payload_);

    TimelockProposal proposal;
    ASSERT_TRUE(timelock_.GetProposal(hash, &proposal).ok());
    EXPECT_TRUE(proposal.executed);
    EXPECT_EQ(proposal.executedAt, 1700000000 + MIN_TIMELOCK_DELAY);

    EXPECT_TRUE(timelock_.Execute(admin_, hash, executor_).Is(ErrorCode::AlreadyExecuted));
    EXPECT_TRUE(timelock_.Cancel(admin_, hash).Is(ErrorCode::AlreadyExecuted));
    EXPECT_EQ(executor_.calls, 1);
}

TEST_F(TimelockTest, FailedCommandStaysPending) {
    OperationHash hash = ProposeDefault();
    util::AdvanceMockTime(util::Seconds(MIN_TIMELOCK_DELAY));

    executor_.fail = true;
    Status st = timelock_.Execute(admin_, hash, executor_);
    EXPECT_TRUE(st.Is(ErrorCode::CommandFailed));
    EXPECT_EQ(st.message(), "InvalidArgument: rejected");

    TimelockProposal proposal;
    ASSERT_TRUE(timelock_.GetProposal(hash, &proposal).ok());
    EXPECT_FALSE(proposal.executed);
    EXPECT_EQ(executor_.applied, 0);

    executor_.fail = false;
    EXPECT_TRUE(timelock_.Execute(admin_, hash, executor_).ok());
}

TEST_F(TimelockTest, CommitFailureAppliesNothing) {
    OperationHash hash = ProposeDefault();
    util::AdvanceMockTime(util::Seconds(MIN_TIMELOCK_DELAY));
    size_t eventsBefore = events_.size();

    db_.SetFailWrites(true);
    EXPECT_TRUE(timelock_.Execute(admin_, hash, executor_).Is(ErrorCode::StorageError));
    db_.SetFailWrites(false);

    EXPECT_EQ(executor_.calls, 1);
    EXPECT_EQ(executor_.applied, 0);
    EXPECT_FALSE(db_.Exists(MARKER_KEY));
    EXPECT_EQ(events_.size(), eventsBefore);

    TimelockProposal proposal;
    ASSERT_TRUE(timelock_.GetProposal(hash, &proposal).ok());
    EXPECT_FALSE(proposal.executed);

    ASSERT_TRUE(timelock_.Execute(admin_, hash, executor_).ok());
    EXPECT_EQ(executor_.applied, 1);
    EXPECT_TRUE(db_.Exists(MARKER_KEY));
}

TEST_F(TimelockTest, DuplicatePendingProposalRejected) {
    ProposeDefault();
    EXPECT_TRUE(timelock_.Propose(admin_, payload_, MIN_TIMELOCK_DELAY, "again", nullptr)
                    .Is(ErrorCode::ProposalExists));
}

TEST_F(TimelockTest, ExecutedProposalCanBeProposedAgain) {
    OperationHash hash = ProposeDefault();
    util::AdvanceMockTime(util::Seconds(MIN_TIMELOCK_DELAY));
    ASSERT_TRUE(timelock_.Execute(admin_, hash, executor_).ok());

    OperationHash again;
    ASSERT_TRUE(timelock_.Propose(admin_, payload_, MIN_TIMELOCK_DELAY, "again", &again).ok());
    EXPECT_EQ(again, hash);

    TimelockProposal proposal;
    ASSERT_TRUE(timelock_.GetProposal(hash, &proposal).ok());
    EXPECT_FALSE(proposal.executed);
}

TEST_F(TimelockTest, CancelRemovesProposal) {
    OperationHash hash = ProposeDefault();
    ASSERT_TRUE(timelock_.Cancel(admin_, hash).ok());

    TimelockProposal proposal;
    EXPECT_TRUE(timelock_.GetProposal(hash, &proposal).Is(ErrorCode::ProposalNotFound));
    EXPECT_TRUE(timelock_.Cancel(admin_, hash).Is(ErrorCode::ProposalNotFound));

    util::AdvanceMockTime(util::Seconds(MIN_TIMELOCK_DELAY));
    EXPECT_TRUE(timelock_.Execute(admin_, hash, executor_).Is(ErrorCode::ProposalNotFound));
    EXPECT_EQ(events_.back().type, events::EventType::OperationCancelled);
}

TEST_F(TimelockTest, DelayBounds) {
    EXPECT_TRUE(timelock_.Propose(admin_, payload_, MIN_TIMELOCK_DELAY - 1, "", nullptr)
                    .Is(ErrorCode::DelayOutOfRange));
    EXPECT_TRUE(timelock_.Propose(admin_, payload_, MAX_TIMELOCK_DELAY + 1, "", nullptr)
                    .Is(ErrorCode::DelayOutOfRange));
    EXPECT_TRUE(timelock_.Propose(admin_, payload_, MAX_TIMELOCK_DELAY, "", nullptr).ok());

    timelock_.SetDelayBounds(10, 20);
    EXPECT_EQ(timelock_.GetMinDelay(), 10);
    EXPECT_EQ(timelock_.GetMaxDelay(), 20);
    std::vector<Byte> other{0x02};
    EXPECT_TRUE(timelock_.Propose(admin_, other, 10, "", nullptr).ok());
}

TEST_F(TimelockTest, AdminOnly) {
    EXPECT_TRUE(timelock_.Propose(outsider_, payload_, MIN_TIMELOCK_DELAY, "", nullptr)
                    .Is(ErrorCode::Unauthorized));

    OperationHash hash = ProposeDefault();
    util::AdvanceMockTime(util::Seconds(MIN_TIMELOCK_DELAY));
    EXPECT_TRUE(timelock_.Execute(outsider_, hash, executor_).Is(ErrorCode::Unauthorized));
    EXPECT_TRUE(timelock_.Cancel(outsider_, hash).Is(ErrorCode::Unauthorized));
    EXPECT_EQ(executor_.calls, 0);
}

TEST_F(TimelockTest, EmptyPayloadRejected) {
    EXPECT_TRUE(timelock_.Propose(admin_, {}, MIN_TIMELOCK_DELAY, "", nullptr)
                    .Is(ErrorCode::InvalidArgument));
}

} // namespace test
} // namespace resilience
} // namespace nodereward
