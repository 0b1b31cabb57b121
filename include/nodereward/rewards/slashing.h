// NODEREWARD - Slashing Engine
// Copyright (c) 2024 NODEREWARD Developers
// MIT License
//
// Penalizes operators whose weighted score falls below the threshold. A
// slash only reduces accounted entitlement; it never moves funds. Each slash
// is bounded by a percentage of the operator's cumulative distributed
// rewards and starts a cooldown during which the operator earns nothing.

#ifndef NODEREWARD_REWARDS_SLASHING_H
#define NODEREWARD_REWARDS_SLASHING_H

#include "nodereward/core/types.h"
#include "nodereward/core/status.h"
#include "nodereward/rewards/config.h"
#include "nodereward/rewards/context.h"
#include "nodereward/rewards/types.h"

#include <mutex>
#include <string>

namespace nodereward {
namespace rewards {

struct SlashRequest {
    OperatorId operatorId;
    Amount amount{0};
    std::string reason;
    uint32_t uptime{0};
    uint32_t performance{0};
    uint32_t quality{0};
};

class SlashingEngine {
public:
    SlashingEngine(const RewardContext& ctx, const SlashingPolicy& policy = SlashingPolicy());

    /**
     * Slash an operator (Slash capability, gated as "slashing").
     *
     * Fails ThresholdNotMet when the score is at or above the threshold and
     * ExcessiveSlashing when amount exceeds maxPercentage of the operator's
     * cumulative distributed total. Not gated by eligibility.
     */
    Status Slash(const CallerId& caller, const SlashRequest& request);

    /// False until the cooldown after the last slash has elapsed
    Status IsEligibleForRewards(const OperatorId& operatorId, bool* eligible) const;

    /// Largest amount that could be slashed right now
    Status GetMaxSlashable(const OperatorId& operatorId, Amount* out) const;

    void SetPolicy(const SlashingPolicy& policy);
    SlashingPolicy GetPolicy() const;

private:
    Status SlashAdmitted(const CallerId& caller, const SlashRequest& request);

    const RewardContext& ctx_;
    SlashingPolicy policy_;
    mutable std::mutex mutex_;
};

} // namespace rewards
} // namespace nodereward

#endif // NODEREWARD_REWARDS_SLASHING_H
