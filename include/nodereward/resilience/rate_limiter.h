// NODEREWARD - Rate Limiter
// Copyright (c) 2024 NODEREWARD Developers
// MIT License
//
// Fixed-window call budget per (caller, operation) pair, persisted in the
// key-value store under the 'L' prefix.

#ifndef NODEREWARD_RESILIENCE_RATE_LIMITER_H
#define NODEREWARD_RESILIENCE_RATE_LIMITER_H

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
// Rate Limit State
// ============================================================================

struct RateLimitState {
    Timestamp windowStart{0};
    uint32_t count{0};

    std::vector<Byte> Serialize() const;
    static std::optional<RateLimitState> Deserialize(const Byte* data, size_t len);
};

/// Budget for one operation
struct RateLimitPolicy {
    uint32_t maxAllowed{0};
    int64_t windowSeconds{0};
};

// ============================================================================
// Rate Limiter
// ============================================================================

class RateLimiter {
public:
    explicit RateLimiter(db::Database& db, events::EventBus* bus = nullptr);

    /**
     * Consume one call from the budget.
     *
     * Starts a new window when now >= windowStart + windowSeconds. Fails with
     * RateLimitExceeded, without touching stored state, when the window
     * already holds maxAllowed calls.
     *
     * @param after Receives the state after the increment (optional)
     */
    Status Check(const CallerId& caller, const std::string& operation,
                 uint32_t maxAllowed, int64_t windowSeconds,
                 RateLimitState* after = nullptr);

    /**
     * Give back one call consumed by Check. No-op once the window that
     * recorded the call has been replaced.
     */
    Status Release(const CallerId& caller, const std::string& operation, Timestamp windowStart);

    /// Stored state; a pair never seen reads as an empty window
    Status GetState(const CallerId& caller, const std::string& operation,
                    RateLimitState* out) const;

    static std::string StateKey(const CallerId& caller, const std::string& operation);

private:
    db::Database& db_;
    events::EventBus* bus_;
    mutable std::mutex mutex_;
};

} // namespace resilience
} // namespace nodereward

#endif // NODEREWARD_RESILIENCE_RATE_LIMITER_H
