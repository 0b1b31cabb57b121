// NODEREWARD - Capabilities
// Copyright (c) 2024 NODEREWARD Developers
// MIT License
//
// Caller identities hold zero or more capabilities. Components receive an
// IPermissionChecker and ask it before every mutating operation.

#ifndef NODEREWARD_ACCESS_CAPABILITY_H
#define NODEREWARD_ACCESS_CAPABILITY_H

#include "nodereward/core/types.h"
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace nodereward {
namespace access {

// ============================================================================
// Capability
// ============================================================================

enum class Capability : uint8_t {
    Calculate = 0,   // Create reward records
    Distribute = 1,  // Settle reward records
    Slash = 2,       // Penalize operators
    Admin = 3,       // Resilience plane and time-locked commands
};

constexpr uint8_t CAPABILITY_COUNT = 4;

const char* CapabilityToString(Capability capability);
std::optional<Capability> CapabilityFromString(const std::string& str);

// ============================================================================
// Permission Checker Interface
// ============================================================================

class IPermissionChecker {
public:
    virtual ~IPermissionChecker() = default;

    virtual bool HasCapability(const CallerId& caller, Capability capability) const = 0;
};

// ============================================================================
// Capability Registry
// ============================================================================

/**
 * In-process capability table. Capabilities are independent: Admin does
 * not imply Calculate, Distribute or Slash.
 */
class CapabilityRegistry : public IPermissionChecker {
public:
    CapabilityRegistry() = default;

    bool HasCapability(const CallerId& caller, Capability capability) const override;

    /// Returns false if the caller already held the capability
    bool Grant(const CallerId& caller, Capability capability);

    /// Returns false if the caller did not hold the capability
    bool Revoke(const CallerId& caller, Capability capability);

    std::vector<Capability> CapabilitiesOf(const CallerId& caller) const;

    /// Callers holding a capability
    std::vector<CallerId> HoldersOf(Capability capability) const;

private:
    std::map<CallerId, std::set<Capability>> grants_;
    mutable std::mutex mutex_;
};

} // namespace access
} // namespace nodereward

#endif // NODEREWARD_ACCESS_CAPABILITY_H
