// NODEREWARD - Admission Gate
// Copyright (c) 2024 NODEREWARD Developers
// MIT License
//
// Runs the three gates every mutating call passes through, in order:
// emergency pause (operation and global), circuit breaker, rate limiter.

#ifndef NODEREWARD_RESILIENCE_ADMISSION_H
#define NODEREWARD_RESILIENCE_ADMISSION_H

#include "nodereward/core/types.h"
#include "nodereward/core/status.h"
#include "nodereward/resilience/circuit_breaker.h"
#include "nodereward/resilience/emergency_pause.h"
#include "nodereward/resilience/rate_limiter.h"
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace nodereward {
namespace resilience {

/// Gated operation names
namespace Operation {
    constexpr const char* REWARD_CALCULATION = "rewardCalculation";
    constexpr const char* REWARD_DISTRIBUTION = "rewardDistribution";
    constexpr const char* SLASHING = "slashing";
    constexpr const char* BATCH_CALCULATION = "batchCalculation";
    constexpr const char* BATCH_DISTRIBUTION = "batchDistribution";
}

// ============================================================================
// Admission Ticket
// ============================================================================

/**
 * Result of passing the gates. Unless Commit() is called before the ticket
 * is destroyed, the rate-limit call it consumed is given back.
 */
class Admission {
public:
    Admission() = default;
    explicit Admission(Status status) : status_(std::move(status)) {}
    Admission(RateLimiter* limiter, const CallerId& caller, std::string operation,
              Timestamp windowStart);
    ~Admission();

    Admission(Admission&& other) noexcept;
    Admission& operator=(Admission&& other) noexcept;
    Admission(const Admission&) = delete;
    Admission& operator=(const Admission&) = delete;

    const Status& status() const { return status_; }
    bool ok() const { return status_.ok(); }

    /// Keep the consumed budget
    void Commit() { limiter_ = nullptr; }

private:
    void Rollback();

    Status status_;
    RateLimiter* limiter_{nullptr};
    CallerId caller_;
    std::string operation_;
    Timestamp windowStart_{0};
};

// ============================================================================
// Admission Gate
// ============================================================================

class AdmissionGate {
public:
    AdmissionGate(EmergencyPause& pause, CircuitBreaker& breaker, RateLimiter& limiter);

    /// Budget for an operation; operations without one are not rate limited
    void SetPolicy(const std::string& operation, const RateLimitPolicy& policy);
    std::optional<RateLimitPolicy> GetPolicy(const std::string& operation) const;

    /// Pause, breaker and rate limit
    Admission Admit(const CallerId& caller, const std::string& operation);

    /// Pause and breaker only
    Status CheckGates(const std::string& operation) const;

private:
    EmergencyPause& pause_;
    CircuitBreaker& breaker_;
    RateLimiter& limiter_;
    std::map<std::string, RateLimitPolicy> policies_;
    mutable std::mutex mutex_;
};

} // namespace resilience
} // namespace nodereward

#endif // NODEREWARD_RESILIENCE_ADMISSION_H
