// NODEREWARD - Reward Ledger Types Implementation
// Copyright (c) 2024 NODEREWARD Developers
// MIT License

#include "nodereward/rewards/types.h"
#include "nodereward/core/serialize.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace nodereward {
namespace rewards {

const char* RewardTypeToString(RewardType type) {
    switch (type) {
        case RewardType::Performance: return "Performance";
        case RewardType::Uptime: return "Uptime";
        case RewardType::StorageProvided: return "StorageProvided";
        case RewardType::Computation: return "Computation";
        case RewardType::NetworkContribution: return "NetworkContribution";
        case RewardType::Bonus: return "Bonus";
        default: return "Unknown";
    }
}

const char* BucketKindToString(BucketKind kind) {
    switch (kind) {
        case BucketKind::Daily: return "Daily";
        case BucketKind::Monthly: return "Monthly";
        default: return "Unknown";
    }
}

// ============================================================================
// RewardRecord
// ============================================================================

std::vector<Byte> RewardRecord::Serialize() const {
    DataStream ss;
    ss << id << operatorId << nodeId << baseAmount << amount << static_cast<uint8_t>(type);
    ss << uptimeScore << performanceScore << qualityScore << overallScore;
    ss << period << calculator << calculatedAt << distributedAt << settled;
    return ss.Data();
}

std::optional<RewardRecord> RewardRecord::Deserialize(const Byte* data, size_t len) {
    if (!data || len == 0) {
        return std::nullopt;
    }

    try {
        DataStream ss(data, len);
        RewardRecord record;
        uint8_t type;
        ss >> record.id >> record.operatorId >> record.nodeId
           >> record.baseAmount >> record.amount >> type;
        record.type = static_cast<RewardType>(type);
        if (!IsValidRewardType(record.type)) {
            return std::nullopt;
        }
        ss >> record.uptimeScore >> record.performanceScore
           >> record.qualityScore >> record.overallScore;
        ss >> record.period >> record.calculator >> record.calculatedAt
           >> record.distributedAt >> record.settled;
        return record;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string RewardRecord::ToString() const {
    std::ostringstream ss;
    ss << "RewardRecord(" << id.ToHex().substr(0, 16)
       << ", operator=" << operatorId.ToHex()
       << ", node=" << nodeId
       << ", type=" << RewardTypeToString(type)
       << ", amount=" << FormatAmount(amount)
       << ", score=" << overallScore
       << ", settled=" << (settled ? "yes" : "no") << ")";
    return ss.str();
}

// ============================================================================
// OperatorTotals
// ============================================================================

std::vector<Byte> OperatorTotals::Serialize() const {
    DataStream ss;
    ss << totalCalculated << totalDistributed << totalSlashed;
    ss << lastCalculationTime << lastDistributionTime << lastSlashTime;
    ss << recordCount << slashCount;
    return ss.Data();
}

std::optional<OperatorTotals> OperatorTotals::Deserialize(const Byte* data, size_t len) {
    if (!data || len == 0) {
        return std::nullopt;
    }

    try {
        DataStream ss(data, len);
        OperatorTotals totals;
        ss >> totals.totalCalculated >> totals.totalDistributed >> totals.totalSlashed;
        ss >> totals.lastCalculationTime >> totals.lastDistributionTime >> totals.lastSlashTime;
        ss >> totals.recordCount >> totals.slashCount;
        return totals;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// SlashRecord
// ============================================================================

std::vector<Byte> SlashRecord::Serialize() const {
    DataStream ss;
    ss << operatorId << amount << reason;
    ss << uptimeScore << performanceScore << qualityScore << overallScore;
    ss << slasher << timestamp;
    return ss.Data();
}

std::optional<SlashRecord> SlashRecord::Deserialize(const Byte* data, size_t len) {
    if (!data || len == 0) {
        return std::nullopt;
    }

    try {
        DataStream ss(data, len);
        SlashRecord record;
        ss >> record.operatorId >> record.amount >> record.reason;
        ss >> record.uptimeScore >> record.performanceScore
           >> record.qualityScore >> record.overallScore;
        ss >> record.slasher >> record.timestamp;
        return record;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// LedgerStats
// ============================================================================

std::vector<Byte> LedgerStats::Serialize() const {
    DataStream ss;
    ss << totalCalculated << totalDistributed << totalSlashed;
    ss << recordCount << settledCount << slashCount;
    return ss.Data();
}

std::optional<LedgerStats> LedgerStats::Deserialize(const Byte* data, size_t len) {
    if (!data || len == 0) {
        return std::nullopt;
    }

    try {
        DataStream ss(data, len);
        LedgerStats stats;
        ss >> stats.totalCalculated >> stats.totalDistributed >> stats.totalSlashed;
        ss >> stats.recordCount >> stats.settledCount >> stats.slashCount;
        return stats;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string LedgerStats::ToString() const {
    std::ostringstream ss;
    ss << "LedgerStats(records=" << recordCount
       << ", settled=" << settledCount
       << ", calculated=" << FormatAmount(totalCalculated)
       << ", distributed=" << FormatAmount(totalDistributed)
       << ", slashed=" << FormatAmount(totalSlashed)
       << ", slashes=" << slashCount << ")";
    return ss.str();
}

// ============================================================================
// Utility Functions
// ============================================================================

std::string FormatAmount(Amount amount, int decimals) {
    bool negative = amount < 0;
    if (negative) {
        amount = -amount;
    }

    Amount wholePart = amount / COIN;
    Amount fracPart = amount % COIN;

    std::ostringstream ss;
    if (negative) {
        ss << "-";
    }
    ss << wholePart;

    if (decimals > 0) {
        std::ostringstream fracSS;
        fracSS << std::setfill('0') << std::setw(8) << fracPart;
        ss << "." << fracSS.str().substr(0, std::min(decimals, 8));
    }
    return ss.str();
}

} // namespace rewards
} // namespace nodereward
