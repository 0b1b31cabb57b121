// NODEREWARD - Reward Calculator Implementation
// Copyright (c) 2024 NODEREWARD Developers
// MIT License

#include "nodereward/rewards/calculator.h"
#include "nodereward/core/serialize.h"
#include "nodereward/crypto/sha256.h"
#include "nodereward/rewards/scorer.h"
#include "nodereward/util/logging.h"
#include "nodereward/util/time.h"

namespace nodereward {
namespace rewards {

RewardCalculator::RewardCalculator(const RewardContext& ctx, const node::INodeDirectory& nodes,
                                   const SlashingEngine& slashing, const RewardLimits& limits)
    : ctx_(ctx), nodes_(nodes), slashing_(slashing), limits_(limits) {}

void RewardCalculator::SetLimits(const RewardLimits& limits) {
    std::lock_guard<std::mutex> lock(mutex_);
    limits_ = limits;
}

RewardLimits RewardCalculator::GetLimits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return limits_;
}

RewardId RewardCalculator::ComputeRewardId(const OperatorId& operatorId, const std::string& nodeId,
                                           Amount adjusted, Timestamp when, RewardType type,
                                           const std::string& period) {
    DataStream ss;
    ss << operatorId << nodeId << adjusted << when << static_cast<uint8_t>(type) << period;
    return RewardId(SHA256Hash(ss.Data()));
}

Status RewardCalculator::Calculate(const CallerId& caller, const CalculationRequest& request,
                                   RewardId* out) {
    const char* op = resilience::Operation::REWARD_CALCULATION;

    if (!ctx_.permissions.HasCapability(caller, access::Capability::Calculate)) {
        Status st(ErrorCode::Unauthorized, "calculate capability required");
        LogRejection(util::LogCategory::REWARDS, op, st);
        return st;
    }

    resilience::Admission admission = ctx_.gate.Admit(caller, op);
    if (!admission.ok()) {
        LogRejection(util::LogCategory::REWARDS, op, admission.status());
        return admission.status();
    }

    Status st = CalculateAdmitted(caller, request, out);
    if (!st.ok()) {
        LogRejection(util::LogCategory::REWARDS, op, st);
        return st;
    }
    admission.Commit();
    return st;
}

Status RewardCalculator::Validate(const CalculationRequest& request, const RewardLimits& limits) const {
    if (request.operatorId.IsNull()) {
        return Status::Error(ErrorCode::InvalidOperator, "null operator id");
    }
    if (!node::IsValidNodeId(request.nodeId)) {
        return Status::Error(ErrorCode::InvalidNodeId, "malformed node id '" + request.nodeId + "'");
    }

    auto info = nodes_.GetNodeInfo(request.nodeId);
    if (!info) {
        return Status::Error(ErrorCode::NodeNotFound, request.nodeId);
    }
    if (!info->operatorId.IsNull() && info->operatorId != request.operatorId) {
        return Status::Error(ErrorCode::InvalidOperator,
                             request.nodeId + " belongs to " + info->operatorId.ToHex());
    }
    if (!node::IsRewardable(info->status)) {
        return Status::Error(ErrorCode::NodeNotActive,
                             request.nodeId + " is " + node::NodeStatusToString(info->status));
    }

    if (!PerformanceScorer::AreValidScores(request.uptime, request.performance, request.quality)) {
        return Status::Error(ErrorCode::InvalidScore, "scores must be within 0..100");
    }
    if (!IsValidRewardType(request.type)) {
        return Status::Error(ErrorCode::InvalidRewardType,
                             std::to_string(static_cast<int>(request.type)));
    }
    if (request.period.empty()) {
        return Status::Error(ErrorCode::InvalidPeriod, "empty period");
    }
    if (request.baseAmount < limits.minAmount || request.baseAmount > limits.maxAmount) {
        return Status::Error(ErrorCode::InvalidAmount,
                             "base amount " + FormatAmount(request.baseAmount) + " outside [" +
                             FormatAmount(limits.minAmount) + ", " + FormatAmount(limits.maxAmount) + "]");
    }
    return Status::Ok();
}

Status RewardCalculator::CalculateAdmitted(const CallerId& caller, const CalculationRequest& request,
                                           RewardId* out) {
    const char* op = resilience::Operation::REWARD_CALCULATION;
    RewardLimits limits = GetLimits();

    Status st = Validate(request, limits);
    if (!st.ok()) {
        return st;
    }

    util::EntityLock lock = ctx_.locks.TryAcquire(OperatorLockKey(request.operatorId));
    if (!lock.IsLocked()) {
        return Status::Error(ErrorCode::EntityBusy, request.operatorId.ToHex());
    }

    bool eligible = false;
    st = slashing_.IsEligibleForRewards(request.operatorId, &eligible);
    if (!st.ok()) {
        ctx_.ReportOutcome(op, st);
        return st;
    }
    if (!eligible) {
        return Status::Error(ErrorCode::NotEligible, "operator is in slashing cooldown");
    }

    OperatorTotals totals;
    st = ctx_.ledger.GetTotals(request.operatorId, &totals);
    if (!st.ok()) {
        ctx_.ReportOutcome(op, st);
        return st;
    }

    Timestamp now = util::GetTime();
    if (totals.recordCount > 0 && now < totals.lastCalculationTime + limits.minInterval) {
        return Status::Error(ErrorCode::TooRecent,
                             "next calculation in " +
                             util::FormatDuration(totals.lastCalculationTime + limits.minInterval - now));
    }

    uint32_t score = PerformanceScorer::Score(request.uptime, request.performance, request.quality);
    Amount adjusted = PerformanceScorer::Adjust(request.baseAmount, score);
    if (adjusted < limits.minAmount || adjusted > limits.maxAmount) {
        return Status::Error(ErrorCode::InvalidAmount,
                             "adjusted amount " + FormatAmount(adjusted) + " outside bounds (score " +
                             std::to_string(score) + ")");
    }

    RewardRecord record;
    record.id = ComputeRewardId(request.operatorId, request.nodeId, adjusted, now, request.type,
                                request.period);
    record.operatorId = request.operatorId;
    record.nodeId = request.nodeId;
    record.baseAmount = request.baseAmount;
    record.amount = adjusted;
    record.type = request.type;
    record.uptimeScore = request.uptime;
    record.performanceScore = request.performance;
    record.qualityScore = request.quality;
    record.overallScore = score;
    record.period = request.period;
    record.calculator = caller;
    record.calculatedAt = now;

    Amount dailyBefore = 0;
    st = ctx_.ledger.GetBucket(request.operatorId, BucketKind::Daily, DayEpoch(now), &dailyBefore);
    if (st.ok()) {
        PeriodCaps caps;
        caps.daily = limits.maxDaily;
        caps.monthly = limits.maxMonthly;
        st = ctx_.ledger.AddRecord(record, caps);
    }
    ctx_.ReportOutcome(op, st);
    if (!st.ok()) {
        return st;
    }

    LOG_INFO(util::LogCategory::REWARDS) << "Calculated " << record.ToString() << " for period "
                                         << record.period;

    events::Event event(events::EventType::RewardCalculated, record.id.ToHex(), now);
    event.WithActor(caller)
         .Value("operator", record.operatorId.ToHex())
         .Value("node", record.nodeId)
         .Value("type", RewardTypeToString(record.type))
         .Value("baseAmount", record.baseAmount)
         .Value("amount", record.amount)
         .Value("score", static_cast<int64_t>(score))
         .Value("period", record.period)
         .Field("dailyBucket", dailyBefore, dailyBefore + adjusted)
         .Field("totalCalculated", totals.totalCalculated, totals.totalCalculated + adjusted);
    ctx_.Publish(event);

    ctx_.Observe(Metric::CALCULATION_AMOUNT, adjusted);

    if (out) {
        *out = record.id;
    }
    return Status::Ok();
}

} // namespace rewards
} // namespace nodereward
