// NODEREWARD - Circuit Breaker Implementation
// Copyright (c) 2024 NODEREWARD Developers
// MIT License

#include "nodereward/resilience/circuit_breaker.h"
#include "nodereward/util/logging.h"
#include "nodereward/util/time.h"

namespace nodereward {
namespace resilience {

// ============================================================================
// CircuitBreakerState
// ============================================================================

std::vector<Byte> CircuitBreakerState::Serialize() const {
    DataStream ss;
    ss << tripped << tripTime << failureCount << successCount << reason;
    return ss.Data();
}

std::optional<CircuitBreakerState> CircuitBreakerState::Deserialize(const Byte* data, size_t len) {
    if (!data || len == 0) {
        return std::nullopt;
    }
    try {
        DataStream ss(data, len);
        CircuitBreakerState state;
        ss >> state.tripped >> state.tripTime >> state.failureCount
           >> state.successCount >> state.reason;
        return state;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// CircuitBreaker
// ============================================================================

CircuitBreaker::CircuitBreaker(db::Database& db, const access::IPermissionChecker& permissions,
                               events::EventBus* bus)
    : db_(db), permissions_(permissions), bus_(bus) {}

Status CircuitBreaker::LoadState(const std::string& operation, CircuitBreakerState* out) const {
    CircuitBreakerState state;
    db::Status s = db::ReadEntity(db_, db::MakeKey(db::prefix::CIRCUIT_BREAKER, operation), &state);
    if (s.IsNotFound()) {
        *out = CircuitBreakerState();
        return Status::Ok();
    }
    if (!s.ok()) {
        return db::ToDomainStatus(s, "read breaker state");
    }
    *out = state;
    return Status::Ok();
}

Status CircuitBreaker::StoreState(const std::string& operation, const CircuitBreakerState& state) {
    return db::ToDomainStatus(
        db::WriteEntity(db_, db::MakeKey(db::prefix::CIRCUIT_BREAKER, operation), state),
        "write breaker state");
}

Status CircuitBreaker::Trip(const CallerId& caller, const std::string& operation,
                            const std::string& reason) {
    if (!permissions_.HasCapability(caller, access::Capability::Admin)) {
        return Status::Error(ErrorCode::Unauthorized, "trip requires admin");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return TripLocked(operation, reason, caller.ToHex());
}

Status CircuitBreaker::TripAutomatic(const std::string& operation, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    return TripLocked(operation, reason, "");
}

Status CircuitBreaker::TripLocked(const std::string& operation, const std::string& reason,
                                  const std::string& actor) {
    if (operation.empty()) {
        return Status::Error(ErrorCode::InvalidArgument, "empty operation name");
    }

    CircuitBreakerState state;
    Status st = LoadState(operation, &state);
    if (!st.ok()) {
        return st;
    }

    bool wasTripped = state.tripped;
    std::string oldReason = state.reason;
    state.tripped = true;
    state.tripTime = util::GetTime();
    state.reason = reason;

    st = StoreState(operation, state);
    if (!st.ok()) {
        return st;
    }

    LOG_WARN(util::LogCategory::RESILIENCE) << "Circuit breaker tripped for " << operation
                                            << ": " << reason;
    if (bus_) {
        events::Event event(events::EventType::CircuitTripped, operation, state.tripTime);
        event.actor = actor;
        event.Field("tripped", wasTripped ? "true" : "false", "true")
             .Field("reason", oldReason, reason);
        bus_->Publish(event);
    }
    return Status::Ok();
}

Status CircuitBreaker::Reset(const CallerId& caller, const std::string& operation) {
    if (!permissions_.HasCapability(caller, access::Capability::Admin)) {
        return Status::Error(ErrorCode::Unauthorized, "reset requires admin");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    CircuitBreakerState before;
    Status st = LoadState(operation, &before);
    if (!st.ok()) {
        return st;
    }

    st = StoreState(operation, CircuitBreakerState());
    if (!st.ok()) {
        return st;
    }

    LOG_INFO(util::LogCategory::RESILIENCE) << "Circuit breaker reset for " << operation;
    if (bus_) {
        events::Event event(events::EventType::CircuitReset, operation, util::GetTime());
        event.WithActor(caller)
             .Field("tripped", before.tripped ? "true" : "false", "false")
             .Field("failureCount", static_cast<int64_t>(before.failureCount), int64_t{0})
             .Field("successCount", static_cast<int64_t>(before.successCount), int64_t{0});
        bus_->Publish(event);
    }
    return Status::Ok();
}

Status CircuitBreaker::Check(const std::string& operation) const {
    std::lock_guard<std::mutex> lock(mutex_);

    CircuitBreakerState state;
    Status st = LoadState(operation, &state);
    if (!st.ok()) {
        return st;
    }
    if (state.tripped) {
        return Status::Error(ErrorCode::CircuitOpen, state.reason);
    }
    return Status::Ok();
}

Status CircuitBreaker::RecordOutcome(const std::string& operation, bool success) {
    std::lock_guard<std::mutex> lock(mutex_);

    CircuitBreakerState state;
    Status st = LoadState(operation, &state);
    if (!st.ok()) {
        return st;
    }

    uint64_t& counter = success ? state.successCount : state.failureCount;
    int64_t before = static_cast<int64_t>(counter);
    ++counter;

    st = StoreState(operation, state);
    if (!st.ok()) {
        return st;
    }

    if (bus_) {
        events::Event event(events::EventType::CircuitOutcomeRecorded, operation, util::GetTime());
        event.Field(success ? "successCount" : "failureCount", before, before + 1);
        bus_->Publish(event);
    }
    return Status::Ok();
}

Status CircuitBreaker::RecordFailure(const std::string& operation) {
    return RecordOutcome(operation, false);
}

Status CircuitBreaker::RecordSuccess(const std::string& operation) {
    return RecordOutcome(operation, true);
}

Status CircuitBreaker::GetState(const std::string& operation, CircuitBreakerState* out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return LoadState(operation, out);
}

bool CircuitBreaker::IsTripped(const std::string& operation) const {
    CircuitBreakerState state;
    return GetState(operation, &state).ok() && state.tripped;
}

} // namespace resilience
} // namespace nodereward
