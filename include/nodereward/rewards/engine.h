// NODEREWARD - Reward Engine
// Copyright (c) 2024 NODEREWARD Developers
// MIT License
//
// Composition root. Owns the database, the event bus, the resilience plane
// and the reward components, and applies time-locked admin commands.
// Executed commands are stored, so their effect survives a reopen.

#ifndef NODEREWARD_REWARDS_ENGINE_H
#define NODEREWARD_REWARDS_ENGINE_H

#include "nodereward/access/capability.h"
#include "nodereward/core/status.h"
#include "nodereward/db/database.h"
#include "nodereward/events/event.h"
#include "nodereward/node/directory.h"
#include "nodereward/resilience/admission.h"
#include "nodereward/resilience/anomaly_detector.h"
#include "nodereward/resilience/circuit_breaker.h"
#include "nodereward/resilience/emergency_pause.h"
#include "nodereward/resilience/rate_limiter.h"
#include "nodereward/resilience/timelock.h"
#include "nodereward/rewards/admin_command.h"
#include "nodereward/rewards/batch.h"
#include "nodereward/rewards/calculator.h"
#include "nodereward/rewards/config.h"
#include "nodereward/rewards/context.h"
#include "nodereward/rewards/distributor.h"
#include "nodereward/rewards/ledger.h"
#include "nodereward/rewards/slashing.h"
#include "nodereward/rewards/token.h"
#include "nodereward/util/entity_lock.h"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace nodereward {
namespace rewards {

class RewardEngine : public IAdminCommandHandler {
public:
    /**
     * Validate the configuration, open the configured backend and wire
     * every component. Parameters and grants stored by executed commands
     * are then reapplied over the configured values.
     *
     * @param tokens Asset source used for settlement; must outlive the engine
     * @param nodes Node directory; must outlive the engine
     */
    static Status Open(const EngineConfig& config, ITokenSource& tokens,
                       const node::INodeDirectory& nodes, std::unique_ptr<RewardEngine>* out);

    /// Wire an engine over an already open database; stored command state is not read
    RewardEngine(std::unique_ptr<db::Database> db, const EngineConfig& config,
                 ITokenSource& tokens, const node::INodeDirectory& nodes);
    ~RewardEngine() override;

    RewardEngine(const RewardEngine&) = delete;
    RewardEngine& operator=(const RewardEngine&) = delete;

    // ========================================================================
    // Reward Operations
    // ========================================================================

    Status Calculate(const CallerId& caller, const CalculationRequest& request, RewardId* out);
    Status Distribute(const CallerId& caller, const RewardId& id);
    Status Slash(const CallerId& caller, const SlashRequest& request);

    Status BatchCalculate(const CallerId& caller, const BatchCalculationRequest& request,
                          BatchReport* report);
    Status BatchDistribute(const CallerId& caller, const std::vector<RewardId>& ids,
                           BatchReport* report);

    Status IsEligibleForRewards(const OperatorId& operatorId, bool* eligible) const;

    // ========================================================================
    // Resilience Administration (Admin)
    // ========================================================================

    Status TripCircuit(const CallerId& caller, const std::string& operation, const std::string& reason);
    Status ResetCircuit(const CallerId& caller, const std::string& operation);

    Status ActivatePause(const CallerId& caller, const std::string& subsystem,
                         const std::string& reason, int64_t duration);
    Status DeactivatePause(const CallerId& caller, const std::string& subsystem);

    Status Recalibrate(const CallerId& caller, const std::string& metric, int64_t value);

    // ========================================================================
    // Time-Locked Commands (Admin)
    // ========================================================================

    /// Queue a command; the description defaults to DescribeAdminCommand
    Status ProposeCommand(const CallerId& caller, const AdminCommand& command, int64_t delay,
                          OperationHash* out);
    Status ExecuteCommand(const CallerId& caller, const OperationHash& hash);
    Status CancelCommand(const CallerId& caller, const OperationHash& hash);

    /// Stage a command whose time lock has elapsed
    Status PrepareCommand(const AdminCommand& command, db::WriteBatch& batch,
                          std::function<void()>* apply) override;

    /**
     * Initial grant made by the host outside the time lock. Skipped when an
     * executed UpdateProcessor already decided this capability for caller.
     */
    Status BootstrapGrant(const CallerId& caller, access::Capability capability);

    // ========================================================================
    // Accessors
    // ========================================================================

    access::CapabilityRegistry& Capabilities() { return registry_; }

    const RewardLedger& Ledger() const { return ledger_; }
    events::EventBus& Events() { return bus_; }
    db::Database& GetDatabase() { return *db_; }

    resilience::RateLimiter& Limiter() { return limiter_; }
    resilience::CircuitBreaker& Breaker() { return breaker_; }
    resilience::EmergencyPause& Pause() { return pause_; }
    resilience::TimelockController& Timelock() { return timelock_; }
    resilience::AnomalyDetector& Anomaly() { return anomaly_; }
    resilience::AdmissionGate& Gate() { return gate_; }

    RewardCalculator& Calculator() { return calculator_; }
    RewardDistributor& Distributor() { return distributor_; }
    SlashingEngine& Slashing() { return slashing_; }

private:
    using Effect = std::function<void()>;

    Status PrepareCap(const UpdateCap& command, db::WriteBatch& batch, Effect* apply);
    Status PrepareRewardBounds(const UpdateRewardBounds& command, db::WriteBatch& batch, Effect* apply);
    Status PrepareSlashingPolicy(const UpdateSlashingPolicy& command, db::WriteBatch& batch,
                                 Effect* apply);
    Status PrepareProcessor(const UpdateProcessor& command, db::WriteBatch& batch, Effect* apply);
    Status PrepareAssetMode(const UpdateAssetMode& command, db::WriteBatch& batch, Effect* apply);
    Status PrepareBaseline(const RecalibrateBaseline& command, db::WriteBatch& batch, Effect* apply);

    Status LoadStoredState();

    EngineParameters CurrentParameters() const;
    static void StageParameters(const EngineParameters& params, db::WriteBatch& batch);
    static std::string GrantKey(const CallerId& account, access::Capability capability);

    void PublishParameter(const std::string& name, int64_t before, int64_t after);

    std::unique_ptr<db::Database> db_;
    events::EventBus bus_;

    access::CapabilityRegistry registry_;

    resilience::RateLimiter limiter_;
    resilience::CircuitBreaker breaker_;
    resilience::EmergencyPause pause_;
    resilience::TimelockController timelock_;
    resilience::AnomalyDetector anomaly_;
    resilience::AdmissionGate gate_;

    util::EntityLockTable locks_;
    RewardLedger ledger_;
    RewardContext ctx_;

    SlashingEngine slashing_;
    RewardCalculator calculator_;
    RewardDistributor distributor_;
    BatchCoordinator batch_;
    AdminCommandExecutor executor_;
};

} // namespace rewards
} // namespace nodereward

#endif // NODEREWARD_REWARDS_ENGINE_H
