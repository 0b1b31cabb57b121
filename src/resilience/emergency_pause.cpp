// NODEREWARD - Emergency Pause Implementation
// Copyright (c) 2024 NODEREWARD Developers
// MIT License

#include "nodereward/resilience/emergency_pause.h"
#include "nodereward/util/logging.h"
#include "nodereward/util/time.h"

namespace nodereward {
namespace resilience {

// ============================================================================
// PauseState
// ============================================================================

std::vector<Byte> PauseState::Serialize() const {
    DataStream ss;
    ss << active << reason << activatedAt << duration << activator;
    return ss.Data();
}

std::optional<PauseState> PauseState::Deserialize(const Byte* data, size_t len) {
    if (!data || len == 0) {
        return std::nullopt;
    }
    try {
        DataStream ss(data, len);
        PauseState state;
        ss >> state.active >> state.reason >> state.activatedAt >> state.duration
           >> state.activator;
        return state;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// EmergencyPause
// ============================================================================

EmergencyPause::EmergencyPause(db::Database& db, const access::IPermissionChecker& permissions,
                               events::EventBus* bus)
    : db_(db), permissions_(permissions), bus_(bus) {}

Status EmergencyPause::LoadState(const std::string& subsystem, PauseState* out) const {
    PauseState state;
    db::Status s = db::ReadEntity(db_, db::MakeKey(db::prefix::PAUSE, subsystem), &state);
    if (s.IsNotFound()) {
        *out = PauseState();
        return Status::Ok();
    }
    if (!s.ok()) {
        return db::ToDomainStatus(s, "read pause state");
    }
    *out = state;
    return Status::Ok();
}

Status EmergencyPause::Activate(const CallerId& caller, const std::string& subsystem,
                                const std::string& reason, int64_t duration) {
    if (!permissions_.HasCapability(caller, access::Capability::Admin)) {
        return Status::Error(ErrorCode::Unauthorized, "pause requires admin");
    }
    if (subsystem.empty() || duration < 0) {
        return Status::Error(ErrorCode::InvalidArgument, "invalid pause request");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    PauseState state;
    Status st = LoadState(subsystem, &state);
    if (!st.ok()) {
        return st;
    }
    if (state.active) {
        return Status::Error(ErrorCode::AlreadyPaused, subsystem + ": " + state.reason);
    }

    state.active = true;
    state.reason = reason;
    state.activatedAt = util::GetTime();
    state.duration = duration;
    state.activator = caller;

    db::Status s = db::WriteEntity(db_, db::MakeKey(db::prefix::PAUSE, subsystem), state);
    if (!s.ok()) {
        return db::ToDomainStatus(s, "write pause state");
    }

    LOG_WARN(util::LogCategory::RESILIENCE) << "Emergency pause activated for " << subsystem
                                            << " by " << caller.ToHex() << ": " << reason;
    if (bus_) {
        events::Event event(events::EventType::PauseActivated, subsystem, state.activatedAt);
        event.WithActor(caller)
             .Field("active", "false", "true")
             .Value("reason", reason)
             .Value("duration", duration);
        bus_->Publish(event);
    }
    return Status::Ok();
}

Status EmergencyPause::Deactivate(const CallerId& caller, const std::string& subsystem) {
    if (!permissions_.HasCapability(caller, access::Capability::Admin)) {
        return Status::Error(ErrorCode::Unauthorized, "unpause requires admin");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    PauseState state;
    Status st = LoadState(subsystem, &state);
    if (!st.ok()) {
        return st;
    }
    if (!state.active) {
        return Status::Error(ErrorCode::NotPaused, subsystem);
    }

    state.active = false;
    db::Status s = db::WriteEntity(db_, db::MakeKey(db::prefix::PAUSE, subsystem), state);
    if (!s.ok()) {
        return db::ToDomainStatus(s, "write pause state");
    }

    Timestamp now = util::GetTime();
    LOG_INFO(util::LogCategory::RESILIENCE) << "Emergency pause lifted for " << subsystem
                                            << " after " << util::FormatDuration(now - state.activatedAt);
    if (bus_) {
        events::Event event(events::EventType::PauseDeactivated, subsystem, now);
        event.WithActor(caller).Field("active", "true", "false");
        bus_->Publish(event);
    }
    return Status::Ok();
}

Status EmergencyPause::Check(const std::string& subsystem) const {
    std::lock_guard<std::mutex> lock(mutex_);

    for (const std::string& name : {subsystem, std::string(GLOBAL_SUBSYSTEM)}) {
        PauseState state;
        Status st = LoadState(name, &state);
        if (!st.ok()) {
            return st;
        }
        if (state.active) {
            return Status::Error(ErrorCode::SubsystemPaused, name + ": " + state.reason);
        }
    }
    return Status::Ok();
}

Status EmergencyPause::GetState(const std::string& subsystem, PauseState* out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return LoadState(subsystem, out);
}

bool EmergencyPause::IsActive(const std::string& subsystem) const {
    PauseState state;
    return GetState(subsystem, &state).ok() && state.active;
}

} // namespace resilience
} // namespace nodereward
