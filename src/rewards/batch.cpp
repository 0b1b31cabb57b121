// NODEREWARD - Batch Coordinator Implementation
// Copyright (c) 2024 NODEREWARD Developers
// MIT License

#include "nodereward/rewards/batch.h"
#include "nodereward/util/logging.h"
#include "nodereward/util/time.h"

#include <set>
#include <sstream>

namespace nodereward {
namespace rewards {

// ============================================================================
// BatchCalculationRequest
// ============================================================================

void BatchCalculationRequest::Add(const CalculationRequest& request) {
    operators.push_back(request.operatorId);
    nodeIds.push_back(request.nodeId);
    baseAmounts.push_back(request.baseAmount);
    types.push_back(request.type);
    uptimes.push_back(request.uptime);
    performances.push_back(request.performance);
    qualities.push_back(request.quality);
    periods.push_back(request.period);
}

bool BatchCalculationRequest::LengthsMatch() const {
    size_t n = operators.size();
    return nodeIds.size() == n && baseAmounts.size() == n && types.size() == n &&
           uptimes.size() == n && performances.size() == n && qualities.size() == n &&
           periods.size() == n;
}

CalculationRequest BatchCalculationRequest::At(size_t index) const {
    CalculationRequest request;
    request.operatorId = operators[index];
    request.nodeId = nodeIds[index];
    request.baseAmount = baseAmounts[index];
    request.type = types[index];
    request.uptime = uptimes[index];
    request.performance = performances[index];
    request.quality = qualities[index];
    request.period = periods[index];
    return request;
}

std::string BatchReport::ToString() const {
    std::ostringstream ss;
    ss << "BatchReport(items=" << items.size()
       << ", succeeded=" << succeeded
       << ", failed=" << failed;
    if (plannedAmount > 0) {
        ss << ", planned=" << FormatAmount(plannedAmount);
    }
    ss << ")";
    return ss.str();
}

// ============================================================================
// BatchCoordinator
// ============================================================================

BatchCoordinator::BatchCoordinator(const RewardContext& ctx, RewardCalculator& calculator,
                                   RewardDistributor& distributor)
    : ctx_(ctx), calculator_(calculator), distributor_(distributor) {}

Status BatchCoordinator::CheckShape(size_t size) const {
    if (size == 0) {
        return Status::Error(ErrorCode::BatchEmpty);
    }
    size_t maxSize = calculator_.GetLimits().maxBatchSize;
    if (size > maxSize) {
        return Status::Error(ErrorCode::BatchTooLarge,
                             std::to_string(size) + " > " + std::to_string(maxSize));
    }
    return Status::Ok();
}

void BatchCoordinator::Finish(const char* operation, const CallerId& caller, BatchReport& report) {
    LOG_INFO(util::LogCategory::REWARDS) << operation << " finished: " << report.ToString();

    events::Event event(events::EventType::BatchCompleted, operation, util::GetTime());
    event.WithActor(caller)
         .Value("items", static_cast<int64_t>(report.items.size()))
         .Value("succeeded", static_cast<int64_t>(report.succeeded))
         .Value("failed", static_cast<int64_t>(report.failed));
    ctx_.Publish(event);
}

Status BatchCoordinator::BatchCalculate(const CallerId& caller, const BatchCalculationRequest& request,
                                        BatchReport* report) {
    const char* op = resilience::Operation::BATCH_CALCULATION;
    *report = BatchReport();

    if (!ctx_.permissions.HasCapability(caller, access::Capability::Calculate)) {
        Status st(ErrorCode::Unauthorized, "calculate capability required");
        LogRejection(util::LogCategory::REWARDS, op, st);
        return st;
    }
    if (!request.LengthsMatch()) {
        Status st(ErrorCode::BatchLengthMismatch, "parameter arrays differ in length");
        LogRejection(util::LogCategory::REWARDS, op, st);
        return st;
    }
    Status st = CheckShape(request.Size());
    if (!st.ok()) {
        LogRejection(util::LogCategory::REWARDS, op, st);
        return st;
    }

    resilience::Admission admission = ctx_.gate.Admit(caller, op);
    if (!admission.ok()) {
        LogRejection(util::LogCategory::REWARDS, op, admission.status());
        return admission.status();
    }

    for (size_t i = 0; i < request.Size(); ++i) {
        BatchItemResult item;
        item.index = i;
        item.status = ctx_.gate.CheckGates(resilience::Operation::REWARD_CALCULATION);
        if (item.status.ok()) {
            item.status = calculator_.CalculateAdmitted(caller, request.At(i), &item.id);
        }
        if (item.status.ok()) {
            ++report->succeeded;
        } else {
            LogRejection(util::LogCategory::REWARDS, op, item.status);
            ++report->failed;
        }
        report->items.push_back(std::move(item));
    }

    Finish(op, caller, *report);
    if (report->succeeded == 0) {
        return Status::Error(ErrorCode::BatchFailedCompletely,
                             std::to_string(report->failed) + " items failed");
    }
    admission.Commit();
    return Status::Ok();
}

Status BatchCoordinator::BatchDistribute(const CallerId& caller, const std::vector<RewardId>& ids,
                                         BatchReport* report) {
    const char* op = resilience::Operation::BATCH_DISTRIBUTION;
    *report = BatchReport();

    if (!ctx_.permissions.HasCapability(caller, access::Capability::Distribute)) {
        Status st(ErrorCode::Unauthorized, "distribute capability required");
        LogRejection(util::LogCategory::REWARDS, op, st);
        return st;
    }
    Status st = CheckShape(ids.size());
    if (!st.ok()) {
        LogRejection(util::LogCategory::REWARDS, op, st);
        return st;
    }

    resilience::Admission admission = ctx_.gate.Admit(caller, op);
    if (!admission.ok()) {
        LogRejection(util::LogCategory::REWARDS, op, admission.status());
        return admission.status();
    }

    // First pass: total of unsettled records, no mutation
    std::set<RewardId> seen;
    for (const auto& id : ids) {
        if (!seen.insert(id).second) {
            continue;
        }
        RewardRecord record;
        Status rs = ctx_.ledger.GetRecord(id, &record);
        if (rs.ok() && !record.settled) {
            report->plannedAmount += record.amount;
        } else if (!rs.ok() && rs.category() == ErrorCategory::Infrastructure) {
            LogRejection(util::LogCategory::REWARDS, op, rs);
            return rs;
        }
    }

    if (report->plannedAmount > 0 && !distributor_.CanPay(report->plannedAmount)) {
        st = Status::Error(ErrorCode::InsufficientBalance,
                           "treasury cannot cover " + FormatAmount(report->plannedAmount));
        LogRejection(util::LogCategory::REWARDS, op, st);
        return st;
    }

    // Second pass: settle each item on its own
    for (size_t i = 0; i < ids.size(); ++i) {
        BatchItemResult item;
        item.index = i;
        item.id = ids[i];
        item.status = ctx_.gate.CheckGates(resilience::Operation::REWARD_DISTRIBUTION);
        if (item.status.ok()) {
            item.status = distributor_.DistributeAdmitted(caller, ids[i]);
        }
        if (item.status.ok()) {
            ++report->succeeded;
        } else {
            LogRejection(util::LogCategory::REWARDS, op, item.status);
            ++report->failed;
        }
        report->items.push_back(std::move(item));
    }

    Finish(op, caller, *report);
    if (report->succeeded == 0) {
        return Status::Error(ErrorCode::BatchFailedCompletely,
                             std::to_string(report->failed) + " items failed");
    }
    admission.Commit();
    return Status::Ok();
}

} // namespace rewards
} // namespace nodereward
