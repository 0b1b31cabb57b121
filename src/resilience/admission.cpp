// NODEREWARD - Admission Gate Implementation
// Copyright (c) 2024 NODEREWARD Developers
// MIT License

#include "nodereward/resilience/admission.h"
#include "nodereward/util/logging.h"

namespace nodereward {
namespace resilience {

// ============================================================================
// Admission
// ============================================================================

Admission::Admission(RateLimiter* limiter, const CallerId& caller, std::string operation,
                     Timestamp windowStart)
    : limiter_(limiter), caller_(caller), operation_(std::move(operation)),
      windowStart_(windowStart) {}

Admission::~Admission() {
    Rollback();
}

Admission::Admission(Admission&& other) noexcept
    : status_(std::move(other.status_)), limiter_(other.limiter_), caller_(other.caller_),
      operation_(std::move(other.operation_)), windowStart_(other.windowStart_) {
    other.limiter_ = nullptr;
}

Admission& Admission::operator=(Admission&& other) noexcept {
    if (this != &other) {
        Rollback();
        status_ = std::move(other.status_);
        limiter_ = other.limiter_;
        caller_ = other.caller_;
        operation_ = std::move(other.operation_);
        windowStart_ = other.windowStart_;
        other.limiter_ = nullptr;
    }
    return *this;
}

void Admission::Rollback() {
    if (!limiter_) {
        return;
    }
    Status st = limiter_->Release(caller_, operation_, windowStart_);
    if (!st.ok()) {
        LOG_ERROR(util::LogCategory::RESILIENCE) << "Cannot return rate limit budget for "
                                                 << operation_ << ": " << st.ToString();
    }
    limiter_ = nullptr;
}

// ============================================================================
// AdmissionGate
// ============================================================================

AdmissionGate::AdmissionGate(EmergencyPause& pause, CircuitBreaker& breaker, RateLimiter& limiter)
    : pause_(pause), breaker_(breaker), limiter_(limiter) {}

void AdmissionGate::SetPolicy(const std::string& operation, const RateLimitPolicy& policy) {
    std::lock_guard<std::mutex> lock(mutex_);
    policies_[operation] = policy;
}

std::optional<RateLimitPolicy> AdmissionGate::GetPolicy(const std::string& operation) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = policies_.find(operation);
    if (it == policies_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Status AdmissionGate::CheckGates(const std::string& operation) const {
    Status st = pause_.Check(operation);
    if (!st.ok()) {
        return st;
    }
    return breaker_.Check(operation);
}

Admission AdmissionGate::Admit(const CallerId& caller, const std::string& operation) {
    Status st = CheckGates(operation);
    if (!st.ok()) {
        LOG_DEBUG(util::LogCategory::RESILIENCE) << operation << " rejected: " << st.ToString();
        return Admission(st);
    }

    std::optional<RateLimitPolicy> policy = GetPolicy(operation);
    if (!policy) {
        return Admission(Status::Ok());
    }

    RateLimitState state;
    st = limiter_.Check(caller, operation, policy->maxAllowed, policy->windowSeconds, &state);
    if (!st.ok()) {
        return Admission(st);
    }
    return Admission(&limiter_, caller, operation, state.windowStart);
}

} // namespace resilience
} // namespace nodereward
