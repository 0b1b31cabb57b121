// NODEREWARD - Node Directory Implementation
// Copyright (c) 2024 NODEREWARD Developers
// MIT License

#include "nodereward/node/directory.h"

#include <sstream>

namespace nodereward {
namespace node {

const char* NodeStatusToString(NodeStatus status) {
    switch (status) {
        case NodeStatus::Pending: return "Pending";
        case NodeStatus::Active: return "Active";
        case NodeStatus::Inactive: return "Inactive";
        case NodeStatus::Maintenance: return "Maintenance";
        case NodeStatus::Suspended: return "Suspended";
        case NodeStatus::Deregistered: return "Deregistered";
        case NodeStatus::Listed: return "Listed";
        case NodeStatus::Offline: return "Offline";
        default: return "Unknown";
    }
}

const char* ProviderTypeToString(ProviderType type) {
    switch (type) {
        case ProviderType::Compute: return "Compute";
        case ProviderType::Storage: return "Storage";
        case ProviderType::Network: return "Network";
        default: return "Unknown";
    }
}

bool IsValidNodeId(const std::string& nodeId) {
    if (nodeId.empty() || nodeId.size() > MAX_NODE_ID_LENGTH) {
        return false;
    }
    for (char c : nodeId) {
        bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                  (c >= '0' && c <= '9') || c == '_' || c == '.' || c == '-';
        if (!ok) {
            return false;
        }
    }
    return true;
}

std::string NodeInfo::ToString() const {
    std::ostringstream oss;
    oss << "NodeInfo(" << nodeId
        << ", operator=" << operatorId.ToHex()
        << ", status=" << NodeStatusToString(status)
        << ", type=" << ProviderTypeToString(providerType)
        << ", capacity=" << capacity << ")";
    return oss.str();
}

// ============================================================================
// StaticNodeDirectory
// ============================================================================

bool StaticNodeDirectory::Add(const NodeInfo& info) {
    if (!IsValidNodeId(info.nodeId)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return nodes_.emplace(info.nodeId, info).second;
}

bool StaticNodeDirectory::Update(const NodeInfo& info) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = nodes_.find(info.nodeId);
    if (it == nodes_.end()) {
        return false;
    }
    it->second = info;
    return true;
}

bool StaticNodeDirectory::SetStatus(const std::string& nodeId, NodeStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = nodes_.find(nodeId);
    if (it == nodes_.end()) {
        return false;
    }
    it->second.status = status;
    return true;
}

bool StaticNodeDirectory::Remove(const std::string& nodeId) {
    std::lock_guard<std::mutex> lock(mutex_);
    return nodes_.erase(nodeId) > 0;
}

size_t StaticNodeDirectory::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nodes_.size();
}

bool StaticNodeDirectory::NodeExists(const std::string& nodeId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nodes_.count(nodeId) > 0;
}

std::optional<NodeInfo> StaticNodeDirectory::GetNodeInfo(const std::string& nodeId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = nodes_.find(nodeId);
    if (it == nodes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace node
} // namespace nodereward
