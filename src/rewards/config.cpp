// NODEREWARD - Engine Configuration Implementation
// Copyright (c) 2024 NODEREWARD Developers
// MIT License

#include "nodereward/rewards/config.h"
#include "nodereward/core/serialize.h"
#include "nodereward/resilience/admission.h"
#include "nodereward/resilience/anomaly_detector.h"
#include "nodereward/resilience/timelock.h"
#include "nodereward/util/logging.h"

#include <limits>

namespace nodereward {
namespace rewards {

namespace {

const char* const GATED_OPERATIONS[] = {
    resilience::Operation::REWARD_CALCULATION,
    resilience::Operation::REWARD_DISTRIBUTION,
    resilience::Operation::SLASHING,
    resilience::Operation::BATCH_CALCULATION,
    resilience::Operation::BATCH_DISTRIBUTION,
};

} // namespace

EngineConfig::EngineConfig()
    : minTimelockDelay(resilience::MIN_TIMELOCK_DELAY),
      maxTimelockDelay(resilience::MAX_TIMELOCK_DELAY),
      anomalyThresholdPercent(resilience::ANOMALY_THRESHOLD_PERCENT) {
    rateLimits[resilience::Operation::REWARD_CALCULATION] = {100, util::SECONDS_PER_HOUR};
    rateLimits[resilience::Operation::REWARD_DISTRIBUTION] = {100, util::SECONDS_PER_HOUR};
    rateLimits[resilience::Operation::SLASHING] = {10, util::SECONDS_PER_HOUR};
    rateLimits[resilience::Operation::BATCH_CALCULATION] = {10, util::SECONDS_PER_HOUR};
    rateLimits[resilience::Operation::BATCH_DISTRIBUTION] = {10, util::SECONDS_PER_HOUR};
}

EngineConfig EngineConfig::FromConfig(const util::ConfigManager& config) {
    using namespace util::ConfigKeys;

    EngineConfig cfg;

    // [rewards]
    cfg.limits.minAmount = config.GetInt(MIN_AMOUNT, cfg.limits.minAmount, SECTION_REWARDS);
    cfg.limits.maxAmount = config.GetInt(MAX_AMOUNT, cfg.limits.maxAmount, SECTION_REWARDS);
    cfg.limits.maxDaily = config.GetInt(MAX_DAILY, cfg.limits.maxDaily, SECTION_REWARDS);
    cfg.limits.maxMonthly = config.GetInt(MAX_MONTHLY, cfg.limits.maxMonthly, SECTION_REWARDS);
    cfg.limits.minInterval = config.GetInt(MIN_INTERVAL, cfg.limits.minInterval, SECTION_REWARDS);

    // rewards::MAX_BATCH_SIZE would hide the key name here
    int64_t batchSize = config.GetInt(util::ConfigKeys::MAX_BATCH_SIZE,
                                      static_cast<int64_t>(cfg.limits.maxBatchSize), SECTION_REWARDS);
    if (batchSize <= 0) {
        cfg.parseErrors.push_back("rewards.max_batch_size must be positive");
    } else {
        cfg.limits.maxBatchSize = static_cast<size_t>(batchSize);
    }

    if (auto mode = config.TryGetString(ASSET_MODE, SECTION_REWARDS)) {
        auto parsed = AssetModeFromString(*mode);
        if (parsed) {
            cfg.assetMode = *parsed;
        } else {
            cfg.parseErrors.push_back("rewards.asset_mode: unknown mode '" + *mode + "'");
        }
    }

    if (auto treasury = config.TryGetString(TREASURY, SECTION_REWARDS)) {
        cfg.treasury = ParseAccountId(*treasury);
        if (cfg.treasury.IsNull()) {
            cfg.parseErrors.push_back("rewards.treasury: not a 40 character hex account id");
        }
    }

    // [slashing]
    int64_t threshold = config.GetInt(THRESHOLD, cfg.slashing.threshold, SECTION_SLASHING);
    int64_t maxPercentage = config.GetInt(MAX_PERCENTAGE, cfg.slashing.maxPercentage, SECTION_SLASHING);
    if (threshold < 0 || threshold > 100) {
        cfg.parseErrors.push_back("slashing.threshold must be within 0..100");
    } else {
        cfg.slashing.threshold = static_cast<uint32_t>(threshold);
    }
    if (maxPercentage < 0 || maxPercentage > 100) {
        cfg.parseErrors.push_back("slashing.max_percentage must be within 0..100");
    } else {
        cfg.slashing.maxPercentage = static_cast<uint32_t>(maxPercentage);
    }
    cfg.slashing.cooldown = config.GetInt(COOLDOWN, cfg.slashing.cooldown, SECTION_SLASHING);

    // [ratelimit]
    for (const char* op : GATED_OPERATIONS) {
        resilience::RateLimitPolicy& policy = cfg.rateLimits[op];
        int64_t max = config.GetInt(std::string(op) + SUFFIX_MAX, policy.maxAllowed, SECTION_RATELIMIT);
        if (max < 0 || max > static_cast<int64_t>(std::numeric_limits<uint32_t>::max())) {
            cfg.parseErrors.push_back(std::string("ratelimit.") + op + ".max must be within 0.." +
                                      std::to_string(std::numeric_limits<uint32_t>::max()));
        } else {
            policy.maxAllowed = static_cast<uint32_t>(max);
        }
        policy.windowSeconds = config.GetInt(std::string(op) + SUFFIX_WINDOW, policy.windowSeconds,
                                             SECTION_RATELIMIT);
    }

    // [timelock]
    cfg.minTimelockDelay = config.GetInt(MIN_DELAY, cfg.minTimelockDelay, SECTION_TIMELOCK);
    cfg.maxTimelockDelay = config.GetInt(MAX_DELAY, cfg.maxTimelockDelay, SECTION_TIMELOCK);

    // [anomaly]
    int64_t percent = config.GetInt(THRESHOLD_PERCENT, cfg.anomalyThresholdPercent, SECTION_ANOMALY);
    if (percent < 0) {
        cfg.parseErrors.push_back("anomaly.threshold_percent must not be negative");
    } else {
        cfg.anomalyThresholdPercent = static_cast<uint32_t>(percent);
    }
    std::string prefix = BASELINE_PREFIX;
    for (const auto& key : config.GetKeys(SECTION_ANOMALY)) {
        if (key.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }
        auto value = config.TryGetInt(key, SECTION_ANOMALY);
        if (!value || *value < 0) {
            cfg.parseErrors.push_back("anomaly." + key + " must be a non-negative integer");
            continue;
        }
        cfg.baselines[key.substr(prefix.size())] = *value;
    }

    // [storage]
    if (auto backend = config.TryGetString(BACKEND, SECTION_STORAGE)) {
        auto parsed = db::BackendFromString(*backend);
        if (parsed) {
            cfg.backend = *parsed;
        } else {
            cfg.parseErrors.push_back("storage.backend: unknown backend '" + *backend + "'");
        }
    }
    cfg.dataDir = config.GetPath(PATH, "", SECTION_STORAGE);

    LOG_DEBUG(util::LogCategory::CONFIG) << "Engine configuration loaded, asset mode "
                                         << AssetModeToString(cfg.assetMode) << ", backend "
                                         << db::BackendToString(cfg.backend);
    return cfg;
}

void EngineConfig::DeclareKeys(util::ConfigManager& config) {
    using namespace util::ConfigKeys;

    for (const char* key : {MIN_AMOUNT, MAX_AMOUNT, MAX_DAILY, MAX_MONTHLY, MIN_INTERVAL,
                            util::ConfigKeys::MAX_BATCH_SIZE, ASSET_MODE, TREASURY}) {
        config.AllowKey(key, SECTION_REWARDS);
    }
    for (const char* key : {THRESHOLD, MAX_PERCENTAGE, COOLDOWN}) {
        config.AllowKey(key, SECTION_SLASHING);
    }
    for (const char* op : GATED_OPERATIONS) {
        config.AllowKey(std::string(op) + SUFFIX_MAX, SECTION_RATELIMIT);
        config.AllowKey(std::string(op) + SUFFIX_WINDOW, SECTION_RATELIMIT);
    }
    config.AllowKey(MIN_DELAY, SECTION_TIMELOCK);
    config.AllowKey(MAX_DELAY, SECTION_TIMELOCK);
    config.AllowKey(THRESHOLD_PERCENT, SECTION_ANOMALY);
    config.AllowKeyPrefix(BASELINE_PREFIX, SECTION_ANOMALY);
    config.AllowKey(BACKEND, SECTION_STORAGE);
    config.AllowKey(PATH, SECTION_STORAGE);
    for (const char* key : {LOG_LEVEL, LOG_FILE, LOG_CONSOLE, LOG_COLORS}) {
        config.AllowKey(key, SECTION_LOGGING);
    }
}

std::vector<std::string> EngineConfig::Validate() const {
    std::vector<std::string> errors = parseErrors;

    if (limits.minAmount <= 0) {
        errors.push_back("rewards.min_amount must be positive");
    }
    if (limits.minAmount > limits.maxAmount) {
        errors.push_back("rewards.min_amount exceeds rewards.max_amount");
    }
    if (!MoneyRange(limits.maxAmount)) {
        errors.push_back("rewards.max_amount out of range");
    }
    if (limits.maxDaily < limits.maxAmount) {
        errors.push_back("rewards.max_daily is below rewards.max_amount");
    }
    if (limits.maxMonthly < limits.maxDaily) {
        errors.push_back("rewards.max_monthly is below rewards.max_daily");
    }
    if (limits.minInterval < 0) {
        errors.push_back("rewards.min_interval must not be negative");
    }
    if (slashing.cooldown < 0) {
        errors.push_back("slashing.cooldown must not be negative");
    }
    if (assetMode == AssetMode::Transfer && treasury.IsNull()) {
        errors.push_back("rewards.treasury is required when asset_mode is transfer");
    }

    for (const auto& [op, policy] : rateLimits) {
        if (policy.windowSeconds <= 0) {
            errors.push_back("ratelimit." + op + ".window must be positive");
        }
    }

    if (minTimelockDelay < 0) {
        errors.push_back("timelock.min_delay must not be negative");
    }
    if (minTimelockDelay > maxTimelockDelay) {
        errors.push_back("timelock.min_delay exceeds timelock.max_delay");
    }

    if (backend == db::Backend::LevelDB && dataDir.empty()) {
        errors.push_back("storage.path is required for the leveldb backend");
    }
    return errors;
}

// ============================================================================
// EngineParameters
// ============================================================================

void EngineParameters::ApplyTo(RewardLimits* limits) const {
    limits->minAmount = minAmount;
    limits->maxAmount = maxAmount;
    limits->maxDaily = maxDaily;
    limits->maxMonthly = maxMonthly;
}

std::vector<Byte> EngineParameters::Serialize() const {
    DataStream ss;
    ss << minAmount << maxAmount << maxDaily << maxMonthly;
    ss << slashing.threshold << slashing.maxPercentage << slashing.cooldown;
    ss << static_cast<uint8_t>(assetMode);
    return ss.Data();
}

std::optional<EngineParameters> EngineParameters::Deserialize(const Byte* data, size_t len) {
    if (!data || len == 0) {
        return std::nullopt;
    }

    try {
        DataStream ss(data, len);
        EngineParameters params;
        uint8_t mode;
        ss >> params.minAmount >> params.maxAmount >> params.maxDaily >> params.maxMonthly;
        ss >> params.slashing.threshold >> params.slashing.maxPercentage >> params.slashing.cooldown;
        ss >> mode;
        if (mode > static_cast<uint8_t>(AssetMode::Mint)) {
            return std::nullopt;
        }
        params.assetMode = static_cast<AssetMode>(mode);
        return params;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace rewards
} // namespace nodereward
