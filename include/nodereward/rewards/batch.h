// NODEREWARD - Batch Coordinator
// Copyright (c) 2024 NODEREWARD Developers
// MIT License
//
// Runs calculation or distribution over many items. Shape errors abort the
// whole batch before any item runs; after that every item succeeds or fails
// on its own and the outcome is collected into a report. The batch call is
// rate limited once, while pause and breaker are checked for every item.

#ifndef NODEREWARD_REWARDS_BATCH_H
#define NODEREWARD_REWARDS_BATCH_H

#include "nodereward/core/types.h"
#include "nodereward/core/status.h"
#include "nodereward/rewards/calculator.h"
#include "nodereward/rewards/context.h"
#include "nodereward/rewards/distributor.h"

#include <string>
#include <vector>

namespace nodereward {
namespace rewards {

/// Parallel arrays, one entry per item; all must have equal length
struct BatchCalculationRequest {
    std::vector<OperatorId> operators;
    std::vector<std::string> nodeIds;
    std::vector<Amount> baseAmounts;
    std::vector<RewardType> types;
    std::vector<uint32_t> uptimes;
    std::vector<uint32_t> performances;
    std::vector<uint32_t> qualities;
    std::vector<std::string> periods;

    void Add(const CalculationRequest& request);
    size_t Size() const { return operators.size(); }
    bool LengthsMatch() const;
    CalculationRequest At(size_t index) const;
};

struct BatchItemResult {
    size_t index{0};
    /// Record created or settled by this item; null on failure of a calculation
    RewardId id;
    Status status;
};

struct BatchReport {
    std::vector<BatchItemResult> items;
    size_t succeeded{0};
    size_t failed{0};
    /// Sum of amounts across the unsettled, existing records of a distribution batch
    Amount plannedAmount{0};

    std::string ToString() const;
};

class BatchCoordinator {
public:
    BatchCoordinator(const RewardContext& ctx, RewardCalculator& calculator,
                     RewardDistributor& distributor);

    /**
     * Calculate every item. Fails BatchEmpty, BatchTooLarge or
     * BatchLengthMismatch before any work, and BatchFailedCompletely when
     * no item succeeded.
     */
    Status BatchCalculate(const CallerId& caller, const BatchCalculationRequest& request,
                          BatchReport* report);

    /**
     * Settle every id. Sums the unsettled records first and, in Transfer
     * mode, fails InsufficientBalance before paying anything if the
     * treasury cannot cover the total.
     */
    Status BatchDistribute(const CallerId& caller, const std::vector<RewardId>& ids,
                           BatchReport* report);

private:
    Status CheckShape(size_t size) const;
    void Finish(const char* operation, const CallerId& caller, BatchReport& report);

    const RewardContext& ctx_;
    RewardCalculator& calculator_;
    RewardDistributor& distributor_;
};

} // namespace rewards
} // namespace nodereward

#endif // NODEREWARD_REWARDS_BATCH_H
