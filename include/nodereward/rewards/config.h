// NODEREWARD - Engine Configuration
// Copyright (c) 2024 NODEREWARD Developers
// MIT License

#ifndef NODEREWARD_REWARDS_CONFIG_H
#define NODEREWARD_REWARDS_CONFIG_H

#include "nodereward/core/types.h"
#include "nodereward/db/database.h"
#include "nodereward/resilience/rate_limiter.h"
#include "nodereward/rewards/token.h"
#include "nodereward/rewards/types.h"
#include "nodereward/util/config.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace nodereward {
namespace rewards {

/// Amount bounds and caps applied by the calculator
struct RewardLimits {
    Amount minAmount{MIN_REWARD_AMOUNT};
    Amount maxAmount{MAX_REWARD_AMOUNT};
    Amount maxDaily{MAX_DAILY_REWARDS};
    Amount maxMonthly{MAX_MONTHLY_REWARDS};
    int64_t minInterval{MIN_REWARD_INTERVAL};
    size_t maxBatchSize{MAX_BATCH_SIZE};
};

struct SlashingPolicy {
    uint32_t threshold{SLASHING_THRESHOLD};
    uint32_t maxPercentage{MAX_SLASHING_PERCENTAGE};
    int64_t cooldown{SLASHING_COOLDOWN};
};

/**
 * Values changed by executed admin commands. Once stored they take
 * precedence over the configured ones when the engine is reopened.
 */
struct EngineParameters {
    Amount minAmount{0};
    Amount maxAmount{0};
    Amount maxDaily{0};
    Amount maxMonthly{0};
    SlashingPolicy slashing;
    AssetMode assetMode{AssetMode::Transfer};

    /// Copy the amount bounds and caps onto limits, keeping the rest
    void ApplyTo(RewardLimits* limits) const;

    std::vector<Byte> Serialize() const;
    static std::optional<EngineParameters> Deserialize(const Byte* data, size_t len);
};

/**
 * Everything the engine needs to wire its components.
 * Defaults match the built-in constants.
 */
struct EngineConfig {
    RewardLimits limits;
    SlashingPolicy slashing;

    AssetMode assetMode{AssetMode::Transfer};
    /// Paying account in Transfer mode
    OperatorId treasury;

    /// Per-operation rate limits keyed by operation name
    std::map<std::string, resilience::RateLimitPolicy> rateLimits;

    int64_t minTimelockDelay;
    int64_t maxTimelockDelay;

    uint32_t anomalyThresholdPercent;
    /// Initial baselines keyed by metric name
    std::map<std::string, int64_t> baselines;

    db::Backend backend{db::Backend::LevelDB};
    std::string dataDir;

    /// Problems found while reading values (bad enums, malformed ids)
    std::vector<std::string> parseErrors;

    EngineConfig();

    /// Read every recognized key, keeping defaults for absent ones
    static EngineConfig FromConfig(const util::ConfigManager& config);

    /// Register every recognized key as allowed, for ConfigManager::Validate
    static void DeclareKeys(util::ConfigManager& config);

    /// Empty when the configuration is usable
    std::vector<std::string> Validate() const;
};

} // namespace rewards
} // namespace nodereward

#endif // NODEREWARD_REWARDS_CONFIG_H
