// NODEREWARD - Administrative Commands Implementation
// Copyright (c) 2024 NODEREWARD Developers
// MIT License

#include "nodereward/rewards/admin_command.h"
#include "nodereward/core/serialize.h"

#include <sstream>

namespace nodereward {
namespace rewards {

namespace {

/// Wire tag per command kind
enum class CommandTag : uint8_t {
    UpdateCap = 1,
    UpdateRewardBounds = 2,
    UpdateSlashingPolicy = 3,
    UpdateProcessor = 4,
    UpdateAssetMode = 5,
    RecalibrateBaseline = 6,
};

} // namespace

const char* AdminCommandName(const AdminCommand& command) {
    if (std::holds_alternative<UpdateCap>(command)) return "UpdateCap";
    if (std::holds_alternative<UpdateRewardBounds>(command)) return "UpdateRewardBounds";
    if (std::holds_alternative<UpdateSlashingPolicy>(command)) return "UpdateSlashingPolicy";
    if (std::holds_alternative<UpdateProcessor>(command)) return "UpdateProcessor";
    if (std::holds_alternative<UpdateAssetMode>(command)) return "UpdateAssetMode";
    return "RecalibrateBaseline";
}

std::string DescribeAdminCommand(const AdminCommand& command) {
    std::ostringstream ss;
    ss << AdminCommandName(command) << "(";
    if (const auto* c = std::get_if<UpdateCap>(&command)) {
        ss << BucketKindToString(c->kind) << "=" << FormatAmount(c->amount);
    } else if (const auto* c = std::get_if<UpdateRewardBounds>(&command)) {
        ss << "min=" << FormatAmount(c->minAmount) << ", max=" << FormatAmount(c->maxAmount);
    } else if (const auto* c = std::get_if<UpdateSlashingPolicy>(&command)) {
        ss << "threshold=" << c->threshold << ", maxPercentage=" << c->maxPercentage
           << ", cooldown=" << c->cooldown;
    } else if (const auto* c = std::get_if<UpdateProcessor>(&command)) {
        ss << (c->grant ? "grant " : "revoke ") << access::CapabilityToString(c->capability)
           << " " << c->account.ToHex();
    } else if (const auto* c = std::get_if<UpdateAssetMode>(&command)) {
        ss << AssetModeToString(c->mode);
    } else if (const auto* c = std::get_if<RecalibrateBaseline>(&command)) {
        ss << c->metric << "=" << c->value;
    }
    ss << ")";
    return ss.str();
}

std::vector<Byte> EncodeAdminCommand(const AdminCommand& command) {
    DataStream ss;
    if (const auto* c = std::get_if<UpdateCap>(&command)) {
        ss << static_cast<uint8_t>(CommandTag::UpdateCap) << static_cast<uint8_t>(c->kind) << c->amount;
    } else if (const auto* c = std::get_if<UpdateRewardBounds>(&command)) {
        ss << static_cast<uint8_t>(CommandTag::UpdateRewardBounds) << c->minAmount << c->maxAmount;
    } else if (const auto* c = std::get_if<UpdateSlashingPolicy>(&command)) {
        ss << static_cast<uint8_t>(CommandTag::UpdateSlashingPolicy)
           << c->threshold << c->maxPercentage << c->cooldown;
    } else if (const auto* c = std::get_if<UpdateProcessor>(&command)) {
        ss << static_cast<uint8_t>(CommandTag::UpdateProcessor)
           << static_cast<uint8_t>(c->capability) << c->account << c->grant;
    } else if (const auto* c = std::get_if<UpdateAssetMode>(&command)) {
        ss << static_cast<uint8_t>(CommandTag::UpdateAssetMode) << static_cast<uint8_t>(c->mode);
    } else if (const auto* c = std::get_if<RecalibrateBaseline>(&command)) {
        ss << static_cast<uint8_t>(CommandTag::RecalibrateBaseline) << c->metric << c->value;
    }
    return ss.Data();
}

std::optional<AdminCommand> DecodeAdminCommand(const std::vector<Byte>& data) {
    if (data.empty()) {
        return std::nullopt;
    }

    try {
        DataStream ss(data);
        uint8_t tag;
        ss >> tag;

        std::optional<AdminCommand> command;
        switch (static_cast<CommandTag>(tag)) {
            case CommandTag::UpdateCap: {
                UpdateCap c;
                uint8_t kind;
                ss >> kind >> c.amount;
                if (kind > static_cast<uint8_t>(BucketKind::Monthly)) {
                    return std::nullopt;
                }
                c.kind = static_cast<BucketKind>(kind);
                command = c;
                break;
            }
            case CommandTag::UpdateRewardBounds: {
                UpdateRewardBounds c;
                ss >> c.minAmount >> c.maxAmount;
                command = c;
                break;
            }
            case CommandTag::UpdateSlashingPolicy: {
                UpdateSlashingPolicy c;
                ss >> c.threshold >> c.maxPercentage >> c.cooldown;
                command = c;
                break;
            }
            case CommandTag::UpdateProcessor: {
                UpdateProcessor c;
                uint8_t capability;
                ss >> capability >> c.account >> c.grant;
                if (capability >= access::CAPABILITY_COUNT) {
                    return std::nullopt;
                }
                c.capability = static_cast<access::Capability>(capability);
                command = c;
                break;
            }
            case CommandTag::UpdateAssetMode: {
                UpdateAssetMode c;
                uint8_t mode;
                ss >> mode;
                if (mode > static_cast<uint8_t>(AssetMode::Mint)) {
                    return std::nullopt;
                }
                c.mode = static_cast<AssetMode>(mode);
                command = c;
                break;
            }
            case CommandTag::RecalibrateBaseline: {
                RecalibrateBaseline c;
                ss >> c.metric >> c.value;
                command = c;
                break;
            }
            default:
                return std::nullopt;
        }

        // Trailing bytes would give one command two hashes
        if (!ss.empty()) {
            return std::nullopt;
        }
        return command;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

OperationHash HashAdminCommand(const AdminCommand& command) {
    return resilience::TimelockController::HashPayload(EncodeAdminCommand(command));
}

// ============================================================================
// AdminCommandExecutor
// ============================================================================

Status AdminCommandExecutor::PrepareProposal(const OperationHash& hash,
                                             const std::vector<Byte>& payload,
                                             db::WriteBatch& batch,
                                             std::function<void()>* onCommit) {
    auto command = DecodeAdminCommand(payload);
    if (!command) {
        return Status::Error(ErrorCode::InvalidArgument, "undecodable command " + hash.ToHex());
    }
    return handler_.PrepareCommand(*command, batch, onCommit);
}

} // namespace rewards
} // namespace nodereward
