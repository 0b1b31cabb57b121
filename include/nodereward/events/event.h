// NODEREWARD - Structured Events
// Copyright (c) 2024 NODEREWARD Developers
// MIT License
//
// Every committed state transition emits an Event with before/after values.
// The EventBus fans events out to sinks: the logger, an append-only journal
// in the key-value store, and arbitrary callbacks.

#ifndef NODEREWARD_EVENTS_EVENT_H
#define NODEREWARD_EVENTS_EVENT_H

#include "nodereward/core/types.h"
#include "nodereward/db/database.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace nodereward {
namespace events {

// ============================================================================
// Event Types
// ============================================================================

enum class EventType : uint8_t {
    RewardCalculated = 0,
    RewardDistributed,
    OperatorSlashed,
    BatchCompleted,
    CircuitTripped,
    CircuitReset,
    CircuitOutcomeRecorded,
    PauseActivated,
    PauseDeactivated,
    OperationProposed,
    OperationExecuted,
    OperationCancelled,
    AnomalyDetected,
    BaselineRecalibrated,
    RateLimitExceeded,
    CapabilityChanged,
    ParameterChanged,
};

const char* EventTypeToString(EventType type);

// ============================================================================
// Event
// ============================================================================

/// One changed value; before is empty when the value did not exist
struct EventField {
    std::string name;
    std::string before;
    std::string after;

    bool operator==(const EventField& other) const {
        return name == other.name && before == other.before && after == other.after;
    }
};

struct Event {
    EventType type{EventType::RewardCalculated};
    /// Entity the event is about (reward id, operation, subsystem, metric)
    std::string subject;
    /// Hex id of the caller, empty for internal transitions
    std::string actor;
    Timestamp timestamp{0};
    std::vector<EventField> fields;

    Event() = default;
    Event(EventType t, std::string subj, Timestamp ts)
        : type(t), subject(std::move(subj)), timestamp(ts) {}

    Event& WithActor(const CallerId& caller);
    Event& Field(const std::string& name, const std::string& before, const std::string& after);
    Event& Field(const std::string& name, int64_t before, int64_t after);
    /// Field with no previous value
    Event& Value(const std::string& name, const std::string& value);
    Event& Value(const std::string& name, int64_t value);

    /// Lookup a field by name
    const EventField* Find(const std::string& name) const;

    /// Single-line "<Type> subject k=before->after ..."
    std::string ToString() const;

    std::vector<Byte> Serialize() const;
    static std::optional<Event> Deserialize(const Byte* data, size_t len);
};

// ============================================================================
// Event Sinks
// ============================================================================

class IEventSink {
public:
    virtual ~IEventSink() = default;
    virtual void OnEvent(const Event& event) = 0;
};

/// Writes events to the logger under the "events" category
class LogEventSink : public IEventSink {
public:
    void OnEvent(const Event& event) override;
};

/// Appends events to the key-value store under increasing sequence numbers
class JournalEventSink : public IEventSink {
public:
    explicit JournalEventSink(db::Database& db);

    void OnEvent(const Event& event) override;

    /// Next sequence number to be written
    uint64_t NextSequence() const;

private:
    db::Database& db_;
    uint64_t nextSeq_{0};
    mutable std::mutex mutex_;
};

class CallbackEventSink : public IEventSink {
public:
    using Callback = std::function<void(const Event&)>;

    explicit CallbackEventSink(Callback callback) : callback_(std::move(callback)) {}

    void OnEvent(const Event& event) override {
        if (callback_) callback_(event);
    }

private:
    Callback callback_;
};

/// Read journal entries with sequence >= fromSequence, at most limit entries
db::Status ReadJournal(db::Database& db, uint64_t fromSequence, size_t limit,
                       std::vector<Event>* out);

// ============================================================================
// Event Bus
// ============================================================================

class EventBus {
public:
    EventBus() = default;

    void AddSink(std::shared_ptr<IEventSink> sink);
    void RemoveSink(const std::shared_ptr<IEventSink>& sink);
    size_t SinkCount() const;

    /// Deliver to every sink in registration order
    void Publish(const Event& event);

    uint64_t PublishedCount() const;

private:
    std::vector<std::shared_ptr<IEventSink>> sinks_;
    uint64_t published_{0};
    mutable std::mutex mutex_;
};

} // namespace events
} // namespace nodereward

#endif // NODEREWARD_EVENTS_EVENT_H
