// NODEREWARD - Anomaly Detector
// Copyright (c) 2024 NODEREWARD Developers
// MIT License
//
// Compares observed metric values against a stored baseline and trips the
// circuit breaker of the operation a metric belongs to when the increase
// exceeds the threshold. Baselines change only through recalibration.

#ifndef NODEREWARD_RESILIENCE_ANOMALY_DETECTOR_H
#define NODEREWARD_RESILIENCE_ANOMALY_DETECTOR_H

#include "nodereward/access/capability.h"
#include "nodereward/core/types.h"
#include "nodereward/core/status.h"
#include "nodereward/db/database.h"
#include "nodereward/events/event.h"
#include "nodereward/resilience/circuit_breaker.h"
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace nodereward {
namespace resilience {

/// Default: trip when a value exceeds its baseline by more than 200%
constexpr uint32_t ANOMALY_THRESHOLD_PERCENT = 200;

// ============================================================================
// Anomaly Baseline
// ============================================================================

struct AnomalyBaseline {
    int64_t baseline{0};
    int64_t lastValue{0};
    /// Outcome of the most recent update
    bool detected{false};
    Timestamp lastUpdate{0};

    std::vector<Byte> Serialize() const;
    static std::optional<AnomalyBaseline> Deserialize(const Byte* data, size_t len);
};

// ============================================================================
// Anomaly Detector
// ============================================================================

class AnomalyDetector {
public:
    AnomalyDetector(db::Database& db, const access::IPermissionChecker& permissions,
                    CircuitBreaker& breaker, events::EventBus* bus = nullptr,
                    uint32_t thresholdPercent = ANOMALY_THRESHOLD_PERCENT);

    /**
     * Record an observation.
     * A metric without a positive baseline never detects. On detection the
     * breaker for OperationForMetric(metric) is tripped.
     */
    Status Update(const std::string& metric, int64_t value, bool* detected = nullptr);

    /// Replace the baseline (Admin)
    Status Recalibrate(const CallerId& caller, const std::string& metric, int64_t value);

    /// Replace the baseline without a capability check, for configuration and executed commands
    Status SetBaseline(const std::string& metric, int64_t value, const std::string& actor = "");

    /**
     * Add a baseline reset to batch instead of writing it. Once the batch
     * is committed, call PublishBaseline with the returned previous value.
     */
    Status StageBaseline(const std::string& metric, int64_t value, db::WriteBatch& batch,
                         int64_t* before) const;
    void PublishBaseline(const std::string& metric, int64_t before, int64_t value,
                         const std::string& actor);

    Status GetBaseline(const std::string& metric, AnomalyBaseline* out) const;

    void SetThresholdPercent(uint32_t percent);
    uint32_t GetThresholdPercent() const;

    /// "rewardCalculation.amount" -> "rewardCalculation"
    static std::string OperationForMetric(const std::string& metric);

private:
    Status LoadLocked(const std::string& metric, AnomalyBaseline* out) const;
    Status StageLocked(const std::string& metric, int64_t value, db::WriteBatch& batch,
                       int64_t* before) const;

    db::Database& db_;
    const access::IPermissionChecker& permissions_;
    CircuitBreaker& breaker_;
    events::EventBus* bus_;
    uint32_t thresholdPercent_;
    mutable std::mutex mutex_;
};

} // namespace resilience
} // namespace nodereward

#endif // NODEREWARD_RESILIENCE_ANOMALY_DETECTOR_H
