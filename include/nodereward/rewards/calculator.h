// NODEREWARD - Reward Calculator
// Copyright (c) 2024 NODEREWARD Developers
// MIT License
//
// Turns a base amount and three performance scores into a pending reward
// record, enforcing amount bounds, the per-operator interval, and the day
// and month caps.

#ifndef NODEREWARD_REWARDS_CALCULATOR_H
#define NODEREWARD_REWARDS_CALCULATOR_H

#include "nodereward/core/types.h"
#include "nodereward/core/status.h"
#include "nodereward/node/directory.h"
#include "nodereward/rewards/config.h"
#include "nodereward/rewards/context.h"
#include "nodereward/rewards/slashing.h"
#include "nodereward/rewards/types.h"

#include <mutex>
#include <string>
#include <vector>

namespace nodereward {
namespace rewards {

struct CalculationRequest {
    OperatorId operatorId;
    std::string nodeId;
    Amount baseAmount{0};
    RewardType type{RewardType::Performance};
    uint32_t uptime{0};
    uint32_t performance{0};
    uint32_t quality{0};
    std::string period;
};

class RewardCalculator {
public:
    RewardCalculator(const RewardContext& ctx, const node::INodeDirectory& nodes,
                     const SlashingEngine& slashing, const RewardLimits& limits = RewardLimits());

    /**
     * Create a pending reward record (Calculate capability, gated as
     * "rewardCalculation").
     *
     * Checks, first failure wins: ids and node state, scores, reward type,
     * period, base amount bounds, slash cooldown, minimum interval, adjusted
     * amount bounds, day cap, month cap, id collision.
     *
     * @param out Receives the new record id
     */
    Status Calculate(const CallerId& caller, const CalculationRequest& request, RewardId* out);

    /// Calculation body for a caller already admitted by the gates
    Status CalculateAdmitted(const CallerId& caller, const CalculationRequest& request, RewardId* out);

    /// Content-derived id over (operator, node, adjusted, time, type, period)
    static RewardId ComputeRewardId(const OperatorId& operatorId, const std::string& nodeId,
                                    Amount adjusted, Timestamp when, RewardType type,
                                    const std::string& period);

    void SetLimits(const RewardLimits& limits);
    RewardLimits GetLimits() const;

private:
    Status Validate(const CalculationRequest& request, const RewardLimits& limits) const;

    const RewardContext& ctx_;
    const node::INodeDirectory& nodes_;
    const SlashingEngine& slashing_;
    RewardLimits limits_;
    mutable std::mutex mutex_;
};

} // namespace rewards
} // namespace nodereward

#endif // NODEREWARD_REWARDS_CALCULATOR_H
