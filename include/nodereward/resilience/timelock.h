// NODEREWARD - Time-Locked Operations
// Copyright (c) 2024 NODEREWARD Developers
// MIT License
//
// Two-phase privileged actions: a proposal stores an encoded command under
// the SHA-256 of its bytes, and execution is only possible once the delay
// has elapsed. The command itself is decoded and staged by an executor, and
// its writes commit in one batch with the executed flag.

#ifndef NODEREWARD_RESILIENCE_TIMELOCK_H
#define NODEREWARD_RESILIENCE_TIMELOCK_H

#include "nodereward/access/capability.h"
#include "nodereward/core/types.h"
#include "nodereward/core/status.h"
#include "nodereward/db/database.h"
#include "nodereward/events/event.h"
#include "nodereward/util/time.h"
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace nodereward {
namespace resilience {

constexpr int64_t MIN_TIMELOCK_DELAY = util::SECONDS_PER_HOUR;
constexpr int64_t MAX_TIMELOCK_DELAY = 30 * util::SECONDS_PER_DAY;

// ============================================================================
// Proposal
// ============================================================================

struct TimelockProposal {
    CallerId proposer;
    Timestamp proposedAt{0};
    Timestamp executeAfter{0};
    std::string description;
    bool executed{false};
    Timestamp executedAt{0};
    /// Encoded command; its SHA-256 is the operation hash
    std::vector<Byte> payload;

    std::vector<Byte> Serialize() const;
    static std::optional<TimelockProposal> Deserialize(const Byte* data, size_t len);
};

/// Validates and stages the command carried by a proposal
class IProposalExecutor {
public:
    virtual ~IProposalExecutor() = default;

    /**
     * Check the command and add its writes to batch without changing any
     * state. In-memory effects go into onCommit, which the controller runs
     * only after the batch has been written.
     */
    virtual Status PrepareProposal(const OperationHash& hash, const std::vector<Byte>& payload,
                                   db::WriteBatch& batch, std::function<void()>* onCommit) = 0;
};

// ============================================================================
// Timelock Controller
// ============================================================================

class TimelockController {
public:
    TimelockController(db::Database& db, const access::IPermissionChecker& permissions,
                       events::EventBus* bus = nullptr);

    void SetDelayBounds(int64_t minDelay, int64_t maxDelay);
    int64_t GetMinDelay() const { return minDelay_; }
    int64_t GetMaxDelay() const { return maxDelay_; }

    /**
     * Queue a command (Admin).
     * Fails DelayOutOfRange outside [minDelay, maxDelay] and ProposalExists
     * while an unexecuted proposal with the same hash is pending.
     */
    Status Propose(const CallerId& caller, const std::vector<Byte>& payload, int64_t delay,
                   const std::string& description, OperationHash* out);

    /**
     * Run a ready proposal (Admin). The command's writes and the executed
     * flag land in a single batch; if that write fails nothing is applied
     * and the proposal stays pending.
     */
    Status Execute(const CallerId& caller, const OperationHash& hash, IProposalExecutor& executor);

    /// Drop a pending proposal (Admin)
    Status Cancel(const CallerId& caller, const OperationHash& hash);

    Status GetProposal(const OperationHash& hash, TimelockProposal* out) const;

    static OperationHash HashPayload(const std::vector<Byte>& payload);

private:
    db::Database& db_;
    const access::IPermissionChecker& permissions_;
    events::EventBus* bus_;
    int64_t minDelay_{MIN_TIMELOCK_DELAY};
    int64_t maxDelay_{MAX_TIMELOCK_DELAY};
    mutable std::mutex mutex_;
};

} // namespace resilience
} // namespace nodereward

#endif // NODEREWARD_RESILIENCE_TIMELOCK_H
