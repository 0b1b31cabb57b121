// NODEREWARD - Slashing Engine Implementation
// Copyright (c) 2024 NODEREWARD Developers
// MIT License

#include "nodereward/rewards/slashing.h"
#include "nodereward/rewards/scorer.h"
#include "nodereward/util/logging.h"
#include "nodereward/util/time.h"

namespace nodereward {
namespace rewards {

SlashingEngine::SlashingEngine(const RewardContext& ctx, const SlashingPolicy& policy)
    : ctx_(ctx), policy_(policy) {}

void SlashingEngine::SetPolicy(const SlashingPolicy& policy) {
    std::lock_guard<std::mutex> lock(mutex_);
    policy_ = policy;
}

SlashingPolicy SlashingEngine::GetPolicy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return policy_;
}

Status SlashingEngine::Slash(const CallerId& caller, const SlashRequest& request) {
    const char* op = resilience::Operation::SLASHING;

    if (!ctx_.permissions.HasCapability(caller, access::Capability::Slash)) {
        Status st(ErrorCode::Unauthorized, "slash capability required");
        LogRejection(util::LogCategory::SLASHING, op, st);
        return st;
    }

    resilience::Admission admission = ctx_.gate.Admit(caller, op);
    if (!admission.ok()) {
        LogRejection(util::LogCategory::SLASHING, op, admission.status());
        return admission.status();
    }

    Status st = SlashAdmitted(caller, request);
    if (!st.ok()) {
        LogRejection(util::LogCategory::SLASHING, op, st);
        return st;
    }
    admission.Commit();
    return st;
}

Status SlashingEngine::SlashAdmitted(const CallerId& caller, const SlashRequest& request) {
    const char* op = resilience::Operation::SLASHING;
    if (request.operatorId.IsNull()) {
        return Status::Error(ErrorCode::InvalidOperator, "null operator id");
    }
    if (request.amount <= 0 || !MoneyRange(request.amount)) {
        return Status::Error(ErrorCode::InvalidAmount, FormatAmount(request.amount));
    }
    if (!PerformanceScorer::AreValidScores(request.uptime, request.performance, request.quality)) {
        return Status::Error(ErrorCode::InvalidScore, "scores must be within 0..100");
    }

    util::EntityLock lock = ctx_.locks.TryAcquire(OperatorLockKey(request.operatorId));
    if (!lock.IsLocked()) {
        return Status::Error(ErrorCode::EntityBusy, request.operatorId.ToHex());
    }

    SlashingPolicy policy = GetPolicy();

    uint32_t score = PerformanceScorer::Score(request.uptime, request.performance, request.quality);
    if (score >= policy.threshold) {
        return Status::Error(ErrorCode::ThresholdNotMet,
                             "score " + std::to_string(score) + " >= " +
                             std::to_string(policy.threshold));
    }

    OperatorTotals before;
    Status st = ctx_.ledger.GetTotals(request.operatorId, &before);
    if (!st.ok()) {
        ctx_.ReportOutcome(op, st);
        return st;
    }

    Amount maxSlashing = PercentOf(before.totalDistributed, policy.maxPercentage);
    if (request.amount > maxSlashing) {
        return Status::Error(ErrorCode::ExcessiveSlashing,
                             FormatAmount(request.amount) + " > " + FormatAmount(maxSlashing));
    }

    SlashRecord slash;
    slash.operatorId = request.operatorId;
    slash.amount = request.amount;
    slash.reason = request.reason;
    slash.uptimeScore = request.uptime;
    slash.performanceScore = request.performance;
    slash.qualityScore = request.quality;
    slash.overallScore = score;
    slash.slasher = caller;
    slash.timestamp = util::GetTime();

    st = ctx_.ledger.AddSlash(slash);
    ctx_.ReportOutcome(op, st);
    if (!st.ok()) {
        return st;
    }

    LOG_INFO(util::LogCategory::SLASHING) << "Slashed " << request.operatorId.ToHex() << " by "
                                          << FormatAmount(request.amount) << " (score " << score
                                          << "): " << request.reason;

    events::Event event(events::EventType::OperatorSlashed, request.operatorId.ToHex(), slash.timestamp);
    event.WithActor(caller)
         .Field("totalSlashed", before.totalSlashed, before.totalSlashed + request.amount)
         .Field("lastSlashTime", before.lastSlashTime, slash.timestamp)
         .Value("amount", request.amount)
         .Value("score", static_cast<int64_t>(score))
         .Value("reason", request.reason);
    ctx_.Publish(event);
    return Status::Ok();
}

Status SlashingEngine::IsEligibleForRewards(const OperatorId& operatorId, bool* eligible) const {
    OperatorTotals totals;
    Status st = ctx_.ledger.GetTotals(operatorId, &totals);
    if (!st.ok()) {
        return st;
    }
    if (totals.slashCount == 0) {
        *eligible = true;
        return Status::Ok();
    }
    *eligible = util::GetTime() >= totals.lastSlashTime + GetPolicy().cooldown;
    return Status::Ok();
}

Status SlashingEngine::GetMaxSlashable(const OperatorId& operatorId, Amount* out) const {
    OperatorTotals totals;
    Status st = ctx_.ledger.GetTotals(operatorId, &totals);
    if (!st.ok()) {
        return st;
    }
    *out = PercentOf(totals.totalDistributed, GetPolicy().maxPercentage);
    return Status::Ok();
}

} // namespace rewards
} // namespace nodereward
