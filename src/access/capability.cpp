// NODEREWARD - Capabilities Implementation
// Copyright (c) 2024 NODEREWARD Developers
// MIT License

#include "nodereward/access/capability.h"

namespace nodereward {
namespace access {

const char* CapabilityToString(Capability capability) {
    switch (capability) {
        case Capability::Calculate: return "calculate";
        case Capability::Distribute: return "distribute";
        case Capability::Slash: return "slash";
        case Capability::Admin: return "admin";
        default: return "unknown";
    }
}

std::optional<Capability> CapabilityFromString(const std::string& str) {
    if (str == "calculate") return Capability::Calculate;
    if (str == "distribute") return Capability::Distribute;
    if (str == "slash") return Capability::Slash;
    if (str == "admin") return Capability::Admin;
    return std::nullopt;
}

bool CapabilityRegistry::HasCapability(const CallerId& caller, Capability capability) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = grants_.find(caller);
    return it != grants_.end() && it->second.count(capability) > 0;
}

bool CapabilityRegistry::Grant(const CallerId& caller, Capability capability) {
    std::lock_guard<std::mutex> lock(mutex_);
    return grants_[caller].insert(capability).second;
}

bool CapabilityRegistry::Revoke(const CallerId& caller, Capability capability) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = grants_.find(caller);
    if (it == grants_.end() || it->second.erase(capability) == 0) {
        return false;
    }
    if (it->second.empty()) {
        grants_.erase(it);
    }
    return true;
}

std::vector<Capability> CapabilityRegistry::CapabilitiesOf(const CallerId& caller) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = grants_.find(caller);
    if (it == grants_.end()) {
        return {};
    }
    return std::vector<Capability>(it->second.begin(), it->second.end());
}

std::vector<CallerId> CapabilityRegistry::HoldersOf(Capability capability) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<CallerId> holders;
    for (const auto& [caller, caps] : grants_) {
        if (caps.count(capability)) {
            holders.push_back(caller);
        }
    }
    return holders;
}

} // namespace access
} // namespace nodereward
