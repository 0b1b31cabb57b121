// NODEREWARD - Emergency Pause
// Copyright (c) 2024 NODEREWARD Developers
// MIT License
//
// Named kill switch per subsystem. A pause stays active until it is
// explicitly deactivated; the stored duration is informational only.

#ifndef NODEREWARD_RESILIENCE_EMERGENCY_PAUSE_H
#define NODEREWARD_RESILIENCE_EMERGENCY_PAUSE_H

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

/// Subsystem name that pauses every gated operation
constexpr const char* GLOBAL_SUBSYSTEM = "global";

// ============================================================================
// Pause State
// ============================================================================

struct PauseState {
    bool active{false};
    std::string reason;
    Timestamp activatedAt{0};
    int64_t duration{0};
    CallerId activator;

    std::vector<Byte> Serialize() const;
    static std::optional<PauseState> Deserialize(const Byte* data, size_t len);
};

// ============================================================================
// Emergency Pause
// ============================================================================

class EmergencyPause {
public:
    EmergencyPause(db::Database& db, const access::IPermissionChecker& permissions,
                   events::EventBus* bus = nullptr);

    /// Pause a subsystem (Admin); AlreadyPaused if it is active
    Status Activate(const CallerId& caller, const std::string& subsystem,
                    const std::string& reason, int64_t duration);

    /// Lift a pause (Admin); NotPaused if it is not active
    Status Deactivate(const CallerId& caller, const std::string& subsystem);

    /// SubsystemPaused if the subsystem or the global switch is active
    Status Check(const std::string& subsystem) const;

    Status GetState(const std::string& subsystem, PauseState* out) const;

    bool IsActive(const std::string& subsystem) const;

private:
    Status LoadState(const std::string& subsystem, PauseState* out) const;

    db::Database& db_;
    const access::IPermissionChecker& permissions_;
    events::EventBus* bus_;
    mutable std::mutex mutex_;
};

} // namespace resilience
} // namespace nodereward

#endif // NODEREWARD_RESILIENCE_EMERGENCY_PAUSE_H
