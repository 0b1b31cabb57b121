// NODEREWARD - Reward Context
// Copyright (c) 2024 NODEREWARD Developers
// MIT License
//
// Collaborators shared by the calculator, distributor, slashing engine and
// batch coordinator. The engine owns every object referenced here.

#ifndef NODEREWARD_REWARDS_CONTEXT_H
#define NODEREWARD_REWARDS_CONTEXT_H

#include "nodereward/access/capability.h"
#include "nodereward/core/status.h"
#include "nodereward/events/event.h"
#include "nodereward/resilience/admission.h"
#include "nodereward/resilience/anomaly_detector.h"
#include "nodereward/resilience/circuit_breaker.h"
#include "nodereward/rewards/ledger.h"
#include "nodereward/util/entity_lock.h"

#include <string>

namespace nodereward {
namespace rewards {

/// Metrics fed to the anomaly detector after each committed transition
namespace Metric {
    constexpr const char* CALCULATION_AMOUNT = "rewardCalculation.amount";
    constexpr const char* DISTRIBUTION_AMOUNT = "rewardDistribution.amount";
}

struct RewardContext {
    RewardLedger& ledger;
    const access::IPermissionChecker& permissions;
    resilience::AdmissionGate& gate;
    resilience::CircuitBreaker& breaker;
    /// Optional
    resilience::AnomalyDetector* anomaly;
    util::EntityLockTable& locks;
    /// Optional
    events::EventBus* bus;

    void Publish(const events::Event& event) const {
        if (bus) bus->Publish(event);
    }

    /**
     * Report the outcome of a gated call to the breaker. Successes and
     * infrastructure failures are counted; rejected input is not.
     */
    void ReportOutcome(const std::string& operation, const Status& status) const;

    /// Feed a metric; detection trips a breaker but never fails the caller
    void Observe(const std::string& metric, int64_t value) const;
};

/// Log a rejected call at Debug (validation, precondition) or Warn (everything else)
void LogRejection(const char* category, const std::string& operation, const Status& status);

/// Entity lock keys
std::string OperatorLockKey(const OperatorId& operatorId);
std::string RecordLockKey(const RewardId& id);

} // namespace rewards
} // namespace nodereward

#endif // NODEREWARD_REWARDS_CONTEXT_H
