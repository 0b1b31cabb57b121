// NODEREWARD - Node Directory
// Copyright (c) 2024 NODEREWARD Developers
// MIT License
//
// Read-only view of the nodes operators have registered. Reward calculation
// consults it to confirm that a node exists and is in a rewardable state.

#ifndef NODEREWARD_NODE_DIRECTORY_H
#define NODEREWARD_NODE_DIRECTORY_H

#include "nodereward/core/types.h"
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace nodereward {
namespace node {

// ============================================================================
// Node Status
// ============================================================================

enum class NodeStatus : uint8_t {
    Pending = 0,
    Active = 1,
    Inactive = 2,
    Maintenance = 3,
    Suspended = 4,
    Deregistered = 5,
    Listed = 6,
    Offline = 7,
};

const char* NodeStatusToString(NodeStatus status);

/// Only Active and Listed nodes earn rewards
inline bool IsRewardable(NodeStatus status) {
    return status == NodeStatus::Active || status == NodeStatus::Listed;
}

enum class ProviderType : uint8_t {
    Compute = 0,
    Storage = 1,
    Network = 2,
};

const char* ProviderTypeToString(ProviderType type);

/// Maximum node id length
constexpr size_t MAX_NODE_ID_LENGTH = 64;

/// Non-empty, bounded, drawn from [A-Za-z0-9_.-]
bool IsValidNodeId(const std::string& nodeId);

// ============================================================================
// Node Info
// ============================================================================

struct NodeInfo {
    std::string nodeId;
    OperatorId operatorId;
    NodeStatus status{NodeStatus::Pending};
    ProviderType providerType{ProviderType::Compute};
    /// Advertised capacity in provider-specific units
    uint64_t capacity{0};

    std::string ToString() const;
};

// ============================================================================
// Directory Interface
// ============================================================================

class INodeDirectory {
public:
    virtual ~INodeDirectory() = default;

    virtual bool NodeExists(const std::string& nodeId) const = 0;
    virtual std::optional<NodeInfo> GetNodeInfo(const std::string& nodeId) const = 0;
};

/**
 * In-process directory populated by the host.
 */
class StaticNodeDirectory : public INodeDirectory {
public:
    StaticNodeDirectory() = default;

    /// Register a node; false if the id is malformed or already present
    bool Add(const NodeInfo& info);

    /// Replace an existing entry; false if absent
    bool Update(const NodeInfo& info);

    /// Change only the status; false if absent
    bool SetStatus(const std::string& nodeId, NodeStatus status);

    bool Remove(const std::string& nodeId);

    size_t Size() const;

    bool NodeExists(const std::string& nodeId) const override;
    std::optional<NodeInfo> GetNodeInfo(const std::string& nodeId) const override;

private:
    std::map<std::string, NodeInfo> nodes_;
    mutable std::mutex mutex_;
};

} // namespace node
} // namespace nodereward

#endif // NODEREWARD_NODE_DIRECTORY_H
