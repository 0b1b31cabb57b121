// NODEREWARD - Reward Distributor Implementation
// Copyright (c) 2024 NODEREWARD Developers
// MIT License

#include "nodereward/rewards/distributor.h"
#include "nodereward/util/logging.h"
#include "nodereward/util/time.h"

namespace nodereward {
namespace rewards {

RewardDistributor::RewardDistributor(const RewardContext& ctx, ITokenSource& tokens,
                                     AssetMode mode, const OperatorId& treasury)
    : ctx_(ctx), tokens_(tokens), mode_(mode), treasury_(treasury) {}

void RewardDistributor::SetAssetMode(AssetMode mode) {
    std::lock_guard<std::mutex> lock(mutex_);
    mode_ = mode;
}

AssetMode RewardDistributor::GetAssetMode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return mode_;
}

void RewardDistributor::SetTreasury(const OperatorId& treasury) {
    std::lock_guard<std::mutex> lock(mutex_);
    treasury_ = treasury;
}

OperatorId RewardDistributor::GetTreasury() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return treasury_;
}

std::vector<RewardId> RewardDistributor::GetUnreconciled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<RewardId>(unreconciled_.begin(), unreconciled_.end());
}

bool RewardDistributor::ClearUnreconciled(const RewardId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (unreconciled_.erase(id) == 0) {
        return false;
    }
    LOG_INFO(util::LogCategory::REWARDS) << "Reconciliation of " << id.ToHex() << " cleared";
    return true;
}

bool RewardDistributor::CanPay(Amount amount) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (mode_ == AssetMode::Mint) {
        return true;
    }
    return tokens_.BalanceOf(treasury_) >= amount;
}

Status RewardDistributor::Pay(const OperatorId& to, Amount amount, AssetMode mode,
                              const OperatorId& treasury) {
    if (mode == AssetMode::Mint) {
        return tokens_.Mint(to, amount);
    }
    return tokens_.Transfer(treasury, to, amount);
}

Status RewardDistributor::Unpay(const OperatorId& from, Amount amount, AssetMode mode,
                                const OperatorId& treasury) {
    return tokens_.Reclaim(from, mode == AssetMode::Mint ? OperatorId() : treasury, amount);
}

Status RewardDistributor::Distribute(const CallerId& caller, const RewardId& id) {
    const char* op = resilience::Operation::REWARD_DISTRIBUTION;

    if (!ctx_.permissions.HasCapability(caller, access::Capability::Distribute)) {
        Status st(ErrorCode::Unauthorized, "distribute capability required");
        LogRejection(util::LogCategory::REWARDS, op, st);
        return st;
    }

    resilience::Admission admission = ctx_.gate.Admit(caller, op);
    if (!admission.ok()) {
        LogRejection(util::LogCategory::REWARDS, op, admission.status());
        return admission.status();
    }

    Status st = DistributeAdmitted(caller, id);
    if (!st.ok()) {
        LogRejection(util::LogCategory::REWARDS, op, st);
        return st;
    }
    admission.Commit();
    return st;
}

Status RewardDistributor::DistributeAdmitted(const CallerId& caller, const RewardId& id) {
    const char* op = resilience::Operation::REWARD_DISTRIBUTION;

    util::EntityLock recordLock = ctx_.locks.TryAcquire(RecordLockKey(id));
    if (!recordLock.IsLocked()) {
        return Status::Error(ErrorCode::EntityBusy, id.ToHex());
    }

    RewardRecord record;
    Status st = ctx_.ledger.GetRecord(id, &record);
    if (!st.ok()) {
        if (st.category() == ErrorCategory::Infrastructure) {
            ctx_.ReportOutcome(op, st);
        }
        return st;
    }
    if (record.settled) {
        return Status::Error(ErrorCode::AlreadyDistributed, id.ToHex());
    }

    util::EntityLock operatorLock = ctx_.locks.TryAcquire(OperatorLockKey(record.operatorId));
    if (!operatorLock.IsLocked()) {
        return Status::Error(ErrorCode::EntityBusy, record.operatorId.ToHex());
    }

    OperatorTotals before;
    st = ctx_.ledger.GetTotals(record.operatorId, &before);
    if (!st.ok()) {
        ctx_.ReportOutcome(op, st);
        return st;
    }

    AssetMode mode;
    OperatorId treasury;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (unreconciled_.count(id)) {
            return Status::Error(ErrorCode::PaymentUnreconciled,
                                 id.ToHex() + " was paid without settlement");
        }
        mode = mode_;
        treasury = treasury_;
    }

    if (mode == AssetMode::Transfer) {
        Amount balance = tokens_.BalanceOf(treasury);
        if (balance < record.amount) {
            return Status::Error(ErrorCode::InsufficientBalance,
                                 FormatAmount(balance) + " < " + FormatAmount(record.amount));
        }
    }

    st = Pay(record.operatorId, record.amount, mode, treasury);
    if (!st.ok()) {
        if (!st.Is(ErrorCode::InsufficientBalance)) {
            st = Status::Error(ErrorCode::TransferFailed, st.ToString());
        }
        ctx_.ReportOutcome(op, st);
        return st;
    }

    Timestamp now = util::GetTime();
    st = ctx_.ledger.SettleRecord(id, now);
    if (!st.ok()) {
        Status undo = Unpay(record.operatorId, record.amount, mode, treasury);
        if (!undo.ok()) {
            LOG_ERROR(util::LogCategory::REWARDS) << "Settlement of " << id.ToHex()
                                                  << " failed and the payment could not be reclaimed: "
                                                  << undo.ToString();
            {
                std::lock_guard<std::mutex> lock(mutex_);
                unreconciled_.insert(id);
            }
            st = Status::Error(ErrorCode::PaymentUnreconciled,
                               FormatAmount(record.amount) + " paid to " + record.operatorId.ToHex() +
                               " (" + st.ToString() + "; reclaim: " + undo.ToString() + ")");
        }
        ctx_.ReportOutcome(op, st);
        return st;
    }
    ctx_.ReportOutcome(op, st);

    LOG_INFO(util::LogCategory::REWARDS) << "Distributed " << FormatAmount(record.amount) << " to "
                                         << record.operatorId.ToHex() << " for " << id.ToHex()
                                         << " (" << AssetModeToString(mode) << ")";

    events::Event event(events::EventType::RewardDistributed, id.ToHex(), now);
    event.WithActor(caller)
         .Value("operator", record.operatorId.ToHex())
         .Value("amount", record.amount)
         .Value("mode", AssetModeToString(mode))
         .Field("settled", "false", "true")
         .Field("distributedAt", int64_t{0}, now)
         .Field("totalDistributed", before.totalDistributed, before.totalDistributed + record.amount);
    ctx_.Publish(event);

    ctx_.Observe(Metric::DISTRIBUTION_AMOUNT, record.amount);
    return Status::Ok();
}

} // namespace rewards
} // namespace nodereward
