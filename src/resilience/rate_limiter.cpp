// NODEREWARD - Rate Limiter Implementation
// Copyright (c) 2024 NODEREWARD Developers
// MIT License

#include "nodereward/resilience/rate_limiter.h"
#include "nodereward/util/logging.h"
#include "nodereward/util/time.h"

namespace nodereward {
namespace resilience {

// ============================================================================
// RateLimitState
// ============================================================================

std::vector<Byte> RateLimitState::Serialize() const {
    DataStream ss;
    ss << windowStart << count;
    return ss.Data();
}

std::optional<RateLimitState> RateLimitState::Deserialize(const Byte* data, size_t len) {
    if (!data || len == 0) {
        return std::nullopt;
    }
    try {
        DataStream ss(data, len);
        RateLimitState state;
        ss >> state.windowStart >> state.count;
        return state;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// RateLimiter
// ============================================================================

RateLimiter::RateLimiter(db::Database& db, events::EventBus* bus)
    : db_(db), bus_(bus) {}

std::string RateLimiter::StateKey(const CallerId& caller, const std::string& operation) {
    std::string key = db::MakeKey(db::prefix::RATE_LIMIT, caller);
    key.append(operation);
    return key;
}

Status RateLimiter::GetState(const CallerId& caller, const std::string& operation,
                             RateLimitState* out) const {
    RateLimitState state;
    db::Status s = db::ReadEntity(db_, StateKey(caller, operation), &state);
    if (s.IsNotFound()) {
        *out = RateLimitState();
        return Status::Ok();
    }
    if (!s.ok()) {
        return db::ToDomainStatus(s, "read rate limit state");
    }
    *out = state;
    return Status::Ok();
}

Status RateLimiter::Check(const CallerId& caller, const std::string& operation,
                          uint32_t maxAllowed, int64_t windowSeconds,
                          RateLimitState* after) {
    if (operation.empty() || windowSeconds <= 0) {
        return Status::Error(ErrorCode::InvalidArgument, "rate limit window must be positive");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    RateLimitState state;
    Status st = GetState(caller, operation, &state);
    if (!st.ok()) {
        return st;
    }

    Timestamp now = util::GetTime();
    if (now >= state.windowStart + windowSeconds) {
        state.windowStart = now;
        state.count = 0;
    }

    if (state.count >= maxAllowed) {
        std::string detail = "count " + std::to_string(state.count) +
                             " of max " + std::to_string(maxAllowed);
        LOG_WARN(util::LogCategory::RESILIENCE) << "Rate limit exceeded for " << operation
                                                << " by " << caller.ToHex() << ": " << detail;
        if (bus_) {
            events::Event event(events::EventType::RateLimitExceeded, operation, now);
            event.WithActor(caller)
                 .Value("count", static_cast<int64_t>(state.count))
                 .Value("max", static_cast<int64_t>(maxAllowed));
            bus_->Publish(event);
        }
        return Status::Error(ErrorCode::RateLimitExceeded, detail);
    }

    ++state.count;
    db::Status s = db::WriteEntity(db_, StateKey(caller, operation), state);
    if (!s.ok()) {
        return db::ToDomainStatus(s, "write rate limit state");
    }

    LOG_TRACE(util::LogCategory::RESILIENCE) << operation << " budget " << state.count
                                             << "/" << maxAllowed << " for " << caller.ToHex();
    if (after) {
        *after = state;
    }
    return Status::Ok();
}

Status RateLimiter::Release(const CallerId& caller, const std::string& operation,
                            Timestamp windowStart) {
    std::lock_guard<std::mutex> lock(mutex_);

    RateLimitState state;
    Status st = GetState(caller, operation, &state);
    if (!st.ok()) {
        return st;
    }
    if (state.windowStart != windowStart || state.count == 0) {
        return Status::Ok();
    }

    --state.count;
    return db::ToDomainStatus(db::WriteEntity(db_, StateKey(caller, operation), state),
                              "write rate limit state");
}

} // namespace resilience
} // namespace nodereward
