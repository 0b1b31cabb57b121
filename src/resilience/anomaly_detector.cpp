// NODEREWARD - Anomaly Detector Implementation
// Copyright (c) 2024 NODEREWARD Developers
// MIT License

#include "nodereward/resilience/anomaly_detector.h"
#include "nodereward/util/logging.h"
#include "nodereward/util/time.h"

#include <limits>

namespace nodereward {
namespace resilience {

// ============================================================================
// AnomalyBaseline
// ============================================================================

std::vector<Byte> AnomalyBaseline::Serialize() const {
    DataStream ss;
    ss << baseline << lastValue << detected << lastUpdate;
    return ss.Data();
}

std::optional<AnomalyBaseline> AnomalyBaseline::Deserialize(const Byte* data, size_t len) {
    if (!data || len == 0) {
        return std::nullopt;
    }
    try {
        DataStream ss(data, len);
        AnomalyBaseline state;
        ss >> state.baseline >> state.lastValue >> state.detected >> state.lastUpdate;
        return state;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// AnomalyDetector
// ============================================================================

AnomalyDetector::AnomalyDetector(db::Database& db, const access::IPermissionChecker& permissions,
                                 CircuitBreaker& breaker, events::EventBus* bus,
                                 uint32_t thresholdPercent)
    : db_(db), permissions_(permissions), breaker_(breaker), bus_(bus),
      thresholdPercent_(thresholdPercent) {}

std::string AnomalyDetector::OperationForMetric(const std::string& metric) {
    return metric.substr(0, metric.find('.'));
}

void AnomalyDetector::SetThresholdPercent(uint32_t percent) {
    std::lock_guard<std::mutex> lock(mutex_);
    thresholdPercent_ = percent;
}

uint32_t AnomalyDetector::GetThresholdPercent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return thresholdPercent_;
}

Status AnomalyDetector::LoadLocked(const std::string& metric, AnomalyBaseline* out) const {
    AnomalyBaseline state;
    db::Status s = db::ReadEntity(db_, db::MakeKey(db::prefix::ANOMALY, metric), &state);
    if (s.IsNotFound()) {
        *out = AnomalyBaseline();
        return Status::Ok();
    }
    if (!s.ok()) {
        return db::ToDomainStatus(s, "read anomaly baseline");
    }
    *out = state;
    return Status::Ok();
}

Status AnomalyDetector::Update(const std::string& metric, int64_t value, bool* detected) {
    if (detected) {
        *detected = false;
    }
    if (metric.empty()) {
        return Status::Error(ErrorCode::InvalidArgument, "empty metric name");
    }

    AnomalyBaseline state;
    int64_t increasePercent = 0;
    bool found = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        Status st = LoadLocked(metric, &state);
        if (!st.ok()) {
            return st;
        }

        if (state.baseline > 0 && value > state.baseline) {
            int64_t delta = value - state.baseline;
            increasePercent = delta > std::numeric_limits<int64_t>::max() / 100
                ? std::numeric_limits<int64_t>::max()
                : delta * 100 / state.baseline;
            found = increasePercent > static_cast<int64_t>(thresholdPercent_);
        }

        state.lastValue = value;
        state.detected = found;
        state.lastUpdate = util::GetTime();

        db::Status s = db::WriteEntity(db_, db::MakeKey(db::prefix::ANOMALY, metric), state);
        if (!s.ok()) {
            return db::ToDomainStatus(s, "write anomaly baseline");
        }
    }

    if (!found) {
        return Status::Ok();
    }

    LOG_WARN(util::LogCategory::ANOMALY) << "Anomaly on " << metric << ": " << value
                                         << " is " << increasePercent << "% over baseline "
                                         << state.baseline;
    if (bus_) {
        events::Event event(events::EventType::AnomalyDetected, metric, state.lastUpdate);
        event.Value("baseline", state.baseline)
             .Value("current", value)
             .Value("percentage", increasePercent);
        bus_->Publish(event);
    }

    std::string operation = OperationForMetric(metric);
    Status st = breaker_.TripAutomatic(operation, "anomaly on " + metric + ": " +
                                       std::to_string(increasePercent) + "% over baseline");
    if (!st.ok()) {
        LOG_ERROR(util::LogCategory::ANOMALY) << "Cannot trip " << operation << ": " << st.ToString();
        return st;
    }

    if (detected) {
        *detected = true;
    }
    return Status::Ok();
}

Status AnomalyDetector::Recalibrate(const CallerId& caller, const std::string& metric, int64_t value) {
    if (!permissions_.HasCapability(caller, access::Capability::Admin)) {
        return Status::Error(ErrorCode::Unauthorized, "recalibration requires admin");
    }
    return SetBaseline(metric, value, caller.ToHex());
}

Status AnomalyDetector::SetBaseline(const std::string& metric, int64_t value, const std::string& actor) {
    db::WriteBatch batch;
    int64_t before = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Status st = StageLocked(metric, value, batch, &before);
        if (!st.ok()) {
            return st;
        }
        db::Status s = db_.Write(&batch);
        if (!s.ok()) {
            return db::ToDomainStatus(s, "write anomaly baseline");
        }
    }
    PublishBaseline(metric, before, value, actor);
    return Status::Ok();
}

Status AnomalyDetector::StageBaseline(const std::string& metric, int64_t value,
                                      db::WriteBatch& batch, int64_t* before) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return StageLocked(metric, value, batch, before);
}

Status AnomalyDetector::StageLocked(const std::string& metric, int64_t value,
                                    db::WriteBatch& batch, int64_t* before) const {
    if (metric.empty() || value < 0) {
        return Status::Error(ErrorCode::InvalidArgument, "invalid baseline");
    }

    AnomalyBaseline state;
    Status st = LoadLocked(metric, &state);
    if (!st.ok()) {
        return st;
    }

    *before = state.baseline;
    state.baseline = value;
    state.detected = false;
    batch.Put(db::MakeKey(db::prefix::ANOMALY, metric), db::ToValue(state.Serialize()));
    return Status::Ok();
}

void AnomalyDetector::PublishBaseline(const std::string& metric, int64_t before, int64_t value,
                                      const std::string& actor) {
    LOG_INFO(util::LogCategory::ANOMALY) << "Baseline for " << metric << " set to " << value;
    if (bus_) {
        events::Event event(events::EventType::BaselineRecalibrated, metric, util::GetTime());
        event.actor = actor;
        event.Field("baseline", before, value);
        bus_->Publish(event);
    }
}

Status AnomalyDetector::GetBaseline(const std::string& metric, AnomalyBaseline* out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return LoadLocked(metric, out);
}

} // namespace resilience
} // namespace nodereward
