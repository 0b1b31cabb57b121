// NODEREWARD - Reward Engine Implementation
// Copyright (c) 2024 NODEREWARD Developers
// MIT License

#include "nodereward/rewards/engine.h"
#include "nodereward/rewards/scorer.h"
#include "nodereward/util/logging.h"
#include "nodereward/util/time.h"

namespace nodereward {
namespace rewards {

// ============================================================================
// Construction
// ============================================================================

Status RewardEngine::Open(const EngineConfig& config, ITokenSource& tokens,
                          const node::INodeDirectory& nodes, std::unique_ptr<RewardEngine>* out) {
    std::vector<std::string> errors = config.Validate();
    if (!errors.empty()) {
        std::string joined;
        for (const auto& error : errors) {
            LOG_ERROR(util::LogCategory::CONFIG) << error;
            if (!joined.empty()) joined += "; ";
            joined += error;
        }
        return Status::Error(ErrorCode::InvalidArgument, joined);
    }

    auto [dbStatus, database] = db::OpenDatabase(config.dataDir, db::Options(), config.backend);
    if (!dbStatus.ok()) {
        return db::ToDomainStatus(dbStatus, "open " + std::string(db::BackendToString(config.backend)) +
                                            " database");
    }

    auto engine = std::make_unique<RewardEngine>(std::move(database), config, tokens, nodes);
    Status st = engine->LoadStoredState();
    if (!st.ok()) {
        LOG_ERROR(util::LogCategory::REWARDS) << "Cannot restore executed commands: " << st.ToString();
        return st;
    }
    *out = std::move(engine);
    return Status::Ok();
}

RewardEngine::RewardEngine(std::unique_ptr<db::Database> db, const EngineConfig& config,
                           ITokenSource& tokens, const node::INodeDirectory& nodes)
    : db_(std::move(db)),
      limiter_(*db_, &bus_),
      breaker_(*db_, registry_, &bus_),
      pause_(*db_, registry_, &bus_),
      timelock_(*db_, registry_, &bus_),
      anomaly_(*db_, registry_, breaker_, &bus_, config.anomalyThresholdPercent),
      gate_(pause_, breaker_, limiter_),
      ledger_(*db_),
      ctx_{ledger_, registry_, gate_, breaker_, &anomaly_, locks_, &bus_},
      slashing_(ctx_, config.slashing),
      calculator_(ctx_, nodes, slashing_, config.limits),
      distributor_(ctx_, tokens, config.assetMode, config.treasury),
      batch_(ctx_, calculator_, distributor_),
      executor_(*this)
{
    bus_.AddSink(std::make_shared<events::LogEventSink>());
    bus_.AddSink(std::make_shared<events::JournalEventSink>(*db_));

    for (const auto& [operation, policy] : config.rateLimits) {
        gate_.SetPolicy(operation, policy);
    }
    timelock_.SetDelayBounds(config.minTimelockDelay, config.maxTimelockDelay);

    // Configured baselines seed metrics only; stored recalibrations win
    for (const auto& [metric, value] : config.baselines) {
        resilience::AnomalyBaseline current;
        Status st = anomaly_.GetBaseline(metric, &current);
        if (st.ok() && current.baseline == 0) {
            st = anomaly_.SetBaseline(metric, value, "config");
        }
        if (!st.ok()) {
            LOG_ERROR(util::LogCategory::ANOMALY) << "Cannot seed baseline " << metric << ": "
                                                  << st.ToString();
        }
    }

    LOG_INFO(util::LogCategory::REWARDS) << "Reward engine ready (asset mode "
                                         << AssetModeToString(config.assetMode) << ")";
}

RewardEngine::~RewardEngine() {
    LOG_DEBUG(util::LogCategory::REWARDS) << "Reward engine shutting down";
}

// ============================================================================
// Reward Operations
// ============================================================================

Status RewardEngine::Calculate(const CallerId& caller, const CalculationRequest& request, RewardId* out) {
    return calculator_.Calculate(caller, request, out);
}

Status RewardEngine::Distribute(const CallerId& caller, const RewardId& id) {
    return distributor_.Distribute(caller, id);
}

Status RewardEngine::Slash(const CallerId& caller, const SlashRequest& request) {
    return slashing_.Slash(caller, request);
}

Status RewardEngine::BatchCalculate(const CallerId& caller, const BatchCalculationRequest& request,
                                    BatchReport* report) {
    return batch_.BatchCalculate(caller, request, report);
}

Status RewardEngine::BatchDistribute(const CallerId& caller, const std::vector<RewardId>& ids,
                                     BatchReport* report) {
    return batch_.BatchDistribute(caller, ids, report);
}

Status RewardEngine::IsEligibleForRewards(const OperatorId& operatorId, bool* eligible) const {
    return slashing_.IsEligibleForRewards(operatorId, eligible);
}

// ============================================================================
// Resilience Administration
// ============================================================================

Status RewardEngine::TripCircuit(const CallerId& caller, const std::string& operation,
                                 const std::string& reason) {
    return breaker_.Trip(caller, operation, reason);
}

Status RewardEngine::ResetCircuit(const CallerId& caller, const std::string& operation) {
    return breaker_.Reset(caller, operation);
}

Status RewardEngine::ActivatePause(const CallerId& caller, const std::string& subsystem,
                                   const std::string& reason, int64_t duration) {
    return pause_.Activate(caller, subsystem, reason, duration);
}

Status RewardEngine::DeactivatePause(const CallerId& caller, const std::string& subsystem) {
    return pause_.Deactivate(caller, subsystem);
}

Status RewardEngine::Recalibrate(const CallerId& caller, const std::string& metric, int64_t value) {
    return anomaly_.Recalibrate(caller, metric, value);
}

// ============================================================================
// Time-Locked Commands
// ============================================================================

Status RewardEngine::ProposeCommand(const CallerId& caller, const AdminCommand& command,
                                    int64_t delay, OperationHash* out) {
    return timelock_.Propose(caller, EncodeAdminCommand(command), delay,
                             DescribeAdminCommand(command), out);
}

Status RewardEngine::ExecuteCommand(const CallerId& caller, const OperationHash& hash) {
    return timelock_.Execute(caller, hash, executor_);
}

Status RewardEngine::CancelCommand(const CallerId& caller, const OperationHash& hash) {
    return timelock_.Cancel(caller, hash);
}

Status RewardEngine::PrepareCommand(const AdminCommand& command, db::WriteBatch& batch,
                                    std::function<void()>* apply) {
    Effect effect;
    Status st;
    if (const auto* c = std::get_if<UpdateCap>(&command)) {
        st = PrepareCap(*c, batch, &effect);
    } else if (const auto* c = std::get_if<UpdateRewardBounds>(&command)) {
        st = PrepareRewardBounds(*c, batch, &effect);
    } else if (const auto* c = std::get_if<UpdateSlashingPolicy>(&command)) {
        st = PrepareSlashingPolicy(*c, batch, &effect);
    } else if (const auto* c = std::get_if<UpdateProcessor>(&command)) {
        st = PrepareProcessor(*c, batch, &effect);
    } else if (const auto* c = std::get_if<UpdateAssetMode>(&command)) {
        st = PrepareAssetMode(*c, batch, &effect);
    } else if (const auto* c = std::get_if<RecalibrateBaseline>(&command)) {
        st = PrepareBaseline(*c, batch, &effect);
    }

    std::string description = DescribeAdminCommand(command);
    if (!st.ok()) {
        LOG_WARN(util::LogCategory::TIMELOCK) << "Command " << description
                                              << " rejected: " << st.ToString();
        return st;
    }
    *apply = [effect, description]() {
        if (effect) {
            effect();
        }
        LOG_INFO(util::LogCategory::TIMELOCK) << "Applied " << description;
    };
    return st;
}

Status RewardEngine::PrepareCap(const UpdateCap& command, db::WriteBatch& batch, Effect* apply) {
    RewardLimits limits = calculator_.GetLimits();
    if (command.amount <= 0 || !MoneyRange(command.amount)) {
        return Status::Error(ErrorCode::InvalidArgument, "cap out of range");
    }

    std::string name;
    Amount before = 0;
    if (command.kind == BucketKind::Daily) {
        if (command.amount < limits.maxAmount || command.amount > limits.maxMonthly) {
            return Status::Error(ErrorCode::InvalidArgument,
                                 "daily cap must lie between max amount and monthly cap");
        }
        name = "rewards.max_daily";
        before = limits.maxDaily;
        limits.maxDaily = command.amount;
    } else {
        if (command.amount < limits.maxDaily) {
            return Status::Error(ErrorCode::InvalidArgument, "monthly cap below daily cap");
        }
        name = "rewards.max_monthly";
        before = limits.maxMonthly;
        limits.maxMonthly = command.amount;
    }

    EngineParameters next = CurrentParameters();
    next.maxDaily = limits.maxDaily;
    next.maxMonthly = limits.maxMonthly;
    StageParameters(next, batch);

    Amount after = command.amount;
    *apply = [this, limits, name, before, after]() {
        calculator_.SetLimits(limits);
        PublishParameter(name, before, after);
    };
    return Status::Ok();
}

Status RewardEngine::PrepareRewardBounds(const UpdateRewardBounds& command, db::WriteBatch& batch,
                                         Effect* apply) {
    RewardLimits limits = calculator_.GetLimits();
    if (command.minAmount <= 0 || command.minAmount > command.maxAmount ||
        !MoneyRange(command.maxAmount)) {
        return Status::Error(ErrorCode::InvalidArgument, "invalid reward bounds");
    }
    if (command.maxAmount > limits.maxDaily) {
        return Status::Error(ErrorCode::InvalidArgument, "max amount above daily cap");
    }

    RewardLimits before = limits;
    limits.minAmount = command.minAmount;
    limits.maxAmount = command.maxAmount;

    EngineParameters next = CurrentParameters();
    next.minAmount = limits.minAmount;
    next.maxAmount = limits.maxAmount;
    StageParameters(next, batch);

    *apply = [this, limits, before]() {
        calculator_.SetLimits(limits);
        PublishParameter("rewards.min_amount", before.minAmount, limits.minAmount);
        PublishParameter("rewards.max_amount", before.maxAmount, limits.maxAmount);
    };
    return Status::Ok();
}

Status RewardEngine::PrepareSlashingPolicy(const UpdateSlashingPolicy& command,
                                           db::WriteBatch& batch, Effect* apply) {
    if (command.threshold > MAX_SCORE || command.maxPercentage > 100 || command.cooldown < 0) {
        return Status::Error(ErrorCode::InvalidArgument, "invalid slashing policy");
    }

    SlashingPolicy before = slashing_.GetPolicy();
    SlashingPolicy policy;
    policy.threshold = command.threshold;
    policy.maxPercentage = command.maxPercentage;
    policy.cooldown = command.cooldown;

    EngineParameters next = CurrentParameters();
    next.slashing = policy;
    StageParameters(next, batch);

    *apply = [this, policy, before]() {
        slashing_.SetPolicy(policy);
        PublishParameter("slashing.threshold", before.threshold, policy.threshold);
        PublishParameter("slashing.max_percentage", before.maxPercentage, policy.maxPercentage);
        PublishParameter("slashing.cooldown", before.cooldown, policy.cooldown);
    };
    return Status::Ok();
}

Status RewardEngine::PrepareProcessor(const UpdateProcessor& command, db::WriteBatch& batch,
                                      Effect* apply) {
    if (command.account.IsNull()) {
        return Status::Error(ErrorCode::InvalidArgument, "null account");
    }

    // The override is stored even when the registry already agrees
    batch.Put(GrantKey(command.account, command.capability),
              std::string(1, command.grant ? '\x01' : '\x00'));

    *apply = [this, command]() {
        bool changed = command.grant ? registry_.Grant(command.account, command.capability)
                                     : registry_.Revoke(command.account, command.capability);
        if (!changed) {
            LOG_DEBUG(util::LogCategory::DEFAULT) << access::CapabilityToString(command.capability)
                                                  << " unchanged for " << command.account.ToHex();
            return;
        }

        events::Event event(events::EventType::CapabilityChanged, command.account.ToHex(),
                            util::GetTime());
        event.Field(access::CapabilityToString(command.capability),
                    command.grant ? int64_t{0} : int64_t{1},
                    command.grant ? int64_t{1} : int64_t{0});
        bus_.Publish(event);
    };
    return Status::Ok();
}

Status RewardEngine::PrepareAssetMode(const UpdateAssetMode& command, db::WriteBatch& batch,
                                      Effect* apply) {
    if (command.mode == AssetMode::Transfer && distributor_.GetTreasury().IsNull()) {
        return Status::Error(ErrorCode::InvalidArgument, "transfer mode needs a treasury");
    }

    EngineParameters next = CurrentParameters();
    next.assetMode = command.mode;
    StageParameters(next, batch);

    AssetMode before = distributor_.GetAssetMode();
    AssetMode after = command.mode;
    *apply = [this, before, after]() {
        distributor_.SetAssetMode(after);

        events::Event event(events::EventType::ParameterChanged, "rewards.asset_mode", util::GetTime());
        event.Field("value", std::string(AssetModeToString(before)),
                    std::string(AssetModeToString(after)));
        bus_.Publish(event);
    };
    return Status::Ok();
}

Status RewardEngine::PrepareBaseline(const RecalibrateBaseline& command, db::WriteBatch& batch,
                                     Effect* apply) {
    int64_t before = 0;
    Status st = anomaly_.StageBaseline(command.metric, command.value, batch, &before);
    if (!st.ok()) {
        return st;
    }
    *apply = [this, command, before]() {
        anomaly_.PublishBaseline(command.metric, before, command.value, "timelock");
    };
    return Status::Ok();
}

Status RewardEngine::BootstrapGrant(const CallerId& caller, access::Capability capability) {
    std::string value;
    db::Status s = db_->Get(GrantKey(caller, capability), &value);
    if (s.ok()) {
        LOG_DEBUG(util::LogCategory::DEFAULT) << access::CapabilityToString(capability) << " for "
                                              << caller.ToHex() << " already set by command";
        return Status::Ok();
    }
    if (!s.IsNotFound()) {
        return db::ToDomainStatus(s, "read capability grant");
    }
    registry_.Grant(caller, capability);
    return Status::Ok();
}

// ============================================================================
// Stored Command State
// ============================================================================

Status RewardEngine::LoadStoredState() {
    EngineParameters params;
    db::Status s = db::ReadEntity(*db_, db::MakeKey(db::prefix::ENGINE_PARAMETERS), &params);
    if (s.ok()) {
        RewardLimits limits = calculator_.GetLimits();
        params.ApplyTo(&limits);
        calculator_.SetLimits(limits);
        slashing_.SetPolicy(params.slashing);
        distributor_.SetAssetMode(params.assetMode);
        LOG_INFO(util::LogCategory::REWARDS) << "Restored parameters (asset mode "
                                             << AssetModeToString(params.assetMode) << ")";
    } else if (!s.IsNotFound()) {
        return db::ToDomainStatus(s, "read engine parameters");
    }

    size_t grants = 0;
    bool malformed = false;
    s = db::ForEachWithPrefix(*db_, db::MakeKey(db::prefix::CAPABILITY_GRANT),
        [&](const db::Slice& key, const db::Slice& value) {
            if (key.size() != 1 + CallerId::SIZE + 1 || value.size() != 1 ||
                static_cast<uint8_t>(key.data()[key.size() - 1]) >= access::CAPABILITY_COUNT) {
                malformed = true;
                return false;
            }
            CallerId account(reinterpret_cast<const Byte*>(key.data() + 1), CallerId::SIZE);
            auto capability = static_cast<access::Capability>(key.data()[key.size() - 1]);
            if (value.data()[0] != 0) {
                registry_.Grant(account, capability);
            } else {
                registry_.Revoke(account, capability);
            }
            ++grants;
            return true;
        });
    if (!s.ok()) {
        return db::ToDomainStatus(s, "read capability grants");
    }
    if (malformed) {
        return Status::Error(ErrorCode::StorageError, "malformed capability grant");
    }
    if (grants > 0) {
        LOG_INFO(util::LogCategory::REWARDS) << "Restored " << grants << " capability grants";
    }
    return Status::Ok();
}

EngineParameters RewardEngine::CurrentParameters() const {
    RewardLimits limits = calculator_.GetLimits();
    EngineParameters params;
    params.minAmount = limits.minAmount;
    params.maxAmount = limits.maxAmount;
    params.maxDaily = limits.maxDaily;
    params.maxMonthly = limits.maxMonthly;
    params.slashing = slashing_.GetPolicy();
    params.assetMode = distributor_.GetAssetMode();
    return params;
}

void RewardEngine::StageParameters(const EngineParameters& params, db::WriteBatch& batch) {
    batch.Put(db::MakeKey(db::prefix::ENGINE_PARAMETERS), db::ToValue(params.Serialize()));
}

std::string RewardEngine::GrantKey(const CallerId& account, access::Capability capability) {
    std::string key = db::MakeKey(db::prefix::CAPABILITY_GRANT, account);
    key.push_back(static_cast<char>(capability));
    return key;
}

void RewardEngine::PublishParameter(const std::string& name, int64_t before, int64_t after) {
    events::Event event(events::EventType::ParameterChanged, name, util::GetTime());
    event.Field("value", before, after);
    bus_.Publish(event);
}

} // namespace rewards
} // namespace nodereward
