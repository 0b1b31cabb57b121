// NODEREWARD - Administrative Commands
// Copyright (c) 2024 NODEREWARD Developers
// MIT License
//
// The closed set of privileged actions that can be queued behind the time
// lock. Commands are encoded to bytes; the SHA-256 of the encoding is the
// operation hash.

#ifndef NODEREWARD_REWARDS_ADMIN_COMMAND_H
#define NODEREWARD_REWARDS_ADMIN_COMMAND_H

#include "nodereward/access/capability.h"
#include "nodereward/core/types.h"
#include "nodereward/core/status.h"
#include "nodereward/resilience/timelock.h"
#include "nodereward/rewards/token.h"
#include "nodereward/rewards/types.h"

#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace nodereward {
namespace rewards {

// ============================================================================
// Commands
// ============================================================================

struct UpdateCap {
    BucketKind kind{BucketKind::Daily};
    Amount amount{0};
};

struct UpdateRewardBounds {
    Amount minAmount{0};
    Amount maxAmount{0};
};

struct UpdateSlashingPolicy {
    uint32_t threshold{0};
    uint32_t maxPercentage{0};
    int64_t cooldown{0};
};

/// Grant or revoke a capability
struct UpdateProcessor {
    access::Capability capability{access::Capability::Calculate};
    CallerId account;
    bool grant{true};
};

struct UpdateAssetMode {
    AssetMode mode{AssetMode::Transfer};
};

struct RecalibrateBaseline {
    std::string metric;
    int64_t value{0};
};

using AdminCommand = std::variant<UpdateCap, UpdateRewardBounds, UpdateSlashingPolicy,
                                  UpdateProcessor, UpdateAssetMode, RecalibrateBaseline>;

/// Short name of the command kind, e.g. "UpdateCap"
const char* AdminCommandName(const AdminCommand& command);

/// Human readable summary used as default proposal description
std::string DescribeAdminCommand(const AdminCommand& command);

std::vector<Byte> EncodeAdminCommand(const AdminCommand& command);
std::optional<AdminCommand> DecodeAdminCommand(const std::vector<Byte>& data);

/// SHA-256 of the encoded command
OperationHash HashAdminCommand(const AdminCommand& command);

// ============================================================================
// Dispatch
// ============================================================================

class IAdminCommandHandler {
public:
    virtual ~IAdminCommandHandler() = default;

    /// Validate a command, stage its writes into batch and set apply to its in-memory effect
    virtual Status PrepareCommand(const AdminCommand& command, db::WriteBatch& batch,
                                  std::function<void()>* apply) = 0;
};

/**
 * Decodes proposal payloads and hands them to an IAdminCommandHandler.
 */
class AdminCommandExecutor : public resilience::IProposalExecutor {
public:
    explicit AdminCommandExecutor(IAdminCommandHandler& handler) : handler_(handler) {}

    Status PrepareProposal(const OperationHash& hash, const std::vector<Byte>& payload,
                           db::WriteBatch& batch, std::function<void()>* onCommit) override;

private:
    IAdminCommandHandler& handler_;
};

} // namespace rewards
} // namespace nodereward

#endif // NODEREWARD_REWARDS_ADMIN_COMMAND_H
