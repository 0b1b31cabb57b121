// NODEREWARD - Reward Context Implementation
// Copyright (c) 2024 NODEREWARD Developers
// MIT License

#include "nodereward/rewards/context.h"
#include "nodereward/util/logging.h"

namespace nodereward {
namespace rewards {

void RewardContext::ReportOutcome(const std::string& operation, const Status& status) const {
    Status st;
    if (status.ok()) {
        st = breaker.RecordSuccess(operation);
    } else if (status.category() == ErrorCategory::Infrastructure) {
        st = breaker.RecordFailure(operation);
    } else {
        return;
    }
    if (!st.ok()) {
        LOG_ERROR(util::LogCategory::RESILIENCE) << "Cannot record outcome for " << operation
                                                 << ": " << st.ToString();
    }
}

void RewardContext::Observe(const std::string& metric, int64_t value) const {
    if (!anomaly) {
        return;
    }
    Status st = anomaly->Update(metric, value);
    if (!st.ok()) {
        LOG_ERROR(util::LogCategory::ANOMALY) << "Cannot update " << metric << ": " << st.ToString();
    }
}

void LogRejection(const char* category, const std::string& operation, const Status& status) {
    switch (status.category()) {
        case ErrorCategory::Validation:
        case ErrorCategory::Precondition:
            LOG_DEBUG(category) << operation << " rejected: " << status.ToString();
            break;
        default:
            LOG_WARN(category) << operation << " rejected: " << status.ToString();
            break;
    }
}

std::string OperatorLockKey(const OperatorId& operatorId) {
    return "operator:" + operatorId.ToHex();
}

std::string RecordLockKey(const RewardId& id) {
    return "reward:" + id.ToHex();
}

} // namespace rewards
} // namespace nodereward
