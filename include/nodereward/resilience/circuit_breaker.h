// NODEREWARD - Circuit Breaker
// Copyright (c) 2024 NODEREWARD Developers
// MIT License
//
// Per-operation kill switch. The breaker never trips on its own: callers
// report outcomes, and an administrator or the anomaly detector decides to
// trip. Only an explicit reset returns it to CLOSED.

#ifndef NODEREWARD_RESILIENCE_CIRCUIT_BREAKER_H
#define NODEREWARD_RESILIENCE_CIRCUIT_BREAKER_H

#include "nodereward/access/capability.h"
#include "nodereward/core/types.h"
#include "nodereward/core/status.h"
#include "nodereward/db/database.h"
#include "nodereward/events/event.h"
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace nodereward {
namespace resilience {

// ============================================================================
// Circuit Breaker State
// ============================================================================

struct CircuitBreakerState {
    bool tripped{false};
    Timestamp tripTime{0};
    uint64_t failureCount{0};
    uint64_t successCount{0};
    std::string reason;

    std::vector<Byte> Serialize() const;
    static std::optional<CircuitBreakerState> Deserialize(const Byte* data, size_t len);
};

// ============================================================================
// Circuit Breaker
// ============================================================================

class CircuitBreaker {
public:
    CircuitBreaker(db::Database& db, const access::IPermissionChecker& permissions,
                   events::EventBus* bus = nullptr);

    /// Open the breaker for an operation (Admin)
    Status Trip(const CallerId& caller, const std::string& operation, const std::string& reason);

    /// Open the breaker on behalf of an internal policy such as anomaly detection
    Status TripAutomatic(const std::string& operation, const std::string& reason);

    /// Close the breaker and zero its counters (Admin)
    Status Reset(const CallerId& caller, const std::string& operation);

    /// CircuitOpen with the stored reason while tripped
    Status Check(const std::string& operation) const;

    Status RecordFailure(const std::string& operation);
    Status RecordSuccess(const std::string& operation);

    /// Stored state; an unknown operation reads as closed with zero counts
    Status GetState(const std::string& operation, CircuitBreakerState* out) const;

    bool IsTripped(const std::string& operation) const;

private:
    Status TripLocked(const std::string& operation, const std::string& reason, const std::string& actor);
    Status RecordOutcome(const std::string& operation, bool success);
    Status LoadState(const std::string& operation, CircuitBreakerState* out) const;
    Status StoreState(const std::string& operation, const CircuitBreakerState& state);

    db::Database& db_;
    const access::IPermissionChecker& permissions_;
    events::EventBus* bus_;
    mutable std::mutex mutex_;
};

} // namespace resilience
} // namespace nodereward

#endif // NODEREWARD_RESILIENCE_CIRCUIT_BREAKER_H
