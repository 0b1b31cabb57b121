// NODEREWARD - Structured Events Implementation
// Copyright (c) 2024 NODEREWARD Developers
// MIT License

#include "nodereward/events/event.h"
#include "nodereward/core/serialize.h"
#include "nodereward/util/logging.h"

#include <algorithm>
#include <sstream>

namespace nodereward {
namespace events {

const char* EventTypeToString(EventType type) {
    switch (type) {
        case EventType::RewardCalculated: return "RewardCalculated";
        case EventType::RewardDistributed: return "RewardDistributed";
        case EventType::OperatorSlashed: return "OperatorSlashed";
        case EventType::BatchCompleted: return "BatchCompleted";
        case EventType::CircuitTripped: return "CircuitTripped";
        case EventType::CircuitReset: return "CircuitReset";
        case EventType::CircuitOutcomeRecorded: return "CircuitOutcomeRecorded";
        case EventType::PauseActivated: return "PauseActivated";
        case EventType::PauseDeactivated: return "PauseDeactivated";
        case EventType::OperationProposed: return "OperationProposed";
        case EventType::OperationExecuted: return "OperationExecuted";
        case EventType::OperationCancelled: return "OperationCancelled";
        case EventType::AnomalyDetected: return "AnomalyDetected";
        case EventType::BaselineRecalibrated: return "BaselineRecalibrated";
        case EventType::RateLimitExceeded: return "RateLimitExceeded";
        case EventType::CapabilityChanged: return "CapabilityChanged";
        case EventType::ParameterChanged: return "ParameterChanged";
        default: return "Unknown";
    }
}

// ============================================================================
// Event
// ============================================================================

Event& Event::WithActor(const CallerId& caller) {
    actor = caller.ToHex();
    return *this;
}

Event& Event::Field(const std::string& name, const std::string& before, const std::string& after) {
    fields.push_back({name, before, after});
    return *this;
}

Event& Event::Field(const std::string& name, int64_t before, int64_t after) {
    return Field(name, std::to_string(before), std::to_string(after));
}

Event& Event::Value(const std::string& name, const std::string& value) {
    return Field(name, "", value);
}

Event& Event::Value(const std::string& name, int64_t value) {
    return Field(name, "", std::to_string(value));
}

const EventField* Event::Find(const std::string& name) const {
    auto it = std::find_if(fields.begin(), fields.end(),
                           [&name](const EventField& f) { return f.name == name; });
    return it == fields.end() ? nullptr : &*it;
}

std::string Event::ToString() const {
    std::ostringstream oss;
    oss << EventTypeToString(type) << " " << subject;
    for (const auto& field : fields) {
        oss << " " << field.name << "=";
        if (!field.before.empty()) {
            oss << field.before << "->";
        }
        oss << field.after;
    }
    if (!actor.empty()) {
        oss << " by " << actor;
    }
    return oss.str();
}

std::vector<Byte> Event::Serialize() const {
    DataStream ss;
    ss << static_cast<uint8_t>(type) << subject << actor << timestamp;
    WriteCompactSize(ss, fields.size());
    for (const auto& field : fields) {
        ss << field.name << field.before << field.after;
    }
    return ss.Data();
}

std::optional<Event> Event::Deserialize(const Byte* data, size_t len) {
    if (!data || len == 0) {
        return std::nullopt;
    }

    try {
        DataStream ss(data, len);
        Event event;
        uint8_t type;
        ss >> type >> event.subject >> event.actor >> event.timestamp;
        if (type > static_cast<uint8_t>(EventType::ParameterChanged)) {
            return std::nullopt;
        }
        event.type = static_cast<EventType>(type);

        uint64_t count = ReadCompactSize(ss);
        for (uint64_t i = 0; i < count; ++i) {
            EventField field;
            ss >> field.name >> field.before >> field.after;
            event.fields.push_back(std::move(field));
        }
        return event;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// Sinks
// ============================================================================

void LogEventSink::OnEvent(const Event& event) {
    switch (event.type) {
        case EventType::CircuitTripped:
        case EventType::PauseActivated:
        case EventType::AnomalyDetected:
        case EventType::RateLimitExceeded:
            LOG_WARN(util::LogCategory::EVENTS) << event.ToString();
            break;
        default:
            LOG_INFO(util::LogCategory::EVENTS) << event.ToString();
            break;
    }
}

JournalEventSink::JournalEventSink(db::Database& db) : db_(db) {
    std::string value;
    db::Status s = db_.Get(db::MakeKey(db::prefix::JOURNAL_SEQUENCE), &value);
    if (s.ok() && value.size() == 8) {
        nextSeq_ = db::DecodeOrderedU64(value.data());
    } else if (!s.ok() && !s.IsNotFound()) {
        LOG_ERROR(util::LogCategory::EVENTS) << "Cannot read journal sequence: " << s.ToString();
    }
}

void JournalEventSink::OnEvent(const Event& event) {
    std::lock_guard<std::mutex> lock(mutex_);

    db::WriteBatch batch;
    batch.Put(db::MakeKey(db::prefix::EVENT_JOURNAL, db::EncodeOrderedU64(nextSeq_)),
              db::ToValue(event.Serialize()));
    batch.Put(db::MakeKey(db::prefix::JOURNAL_SEQUENCE), db::EncodeOrderedU64(nextSeq_ + 1));

    db::Status s = db_.Write(&batch);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::EVENTS) << "Journal append failed for "
                                             << EventTypeToString(event.type) << ": " << s.ToString();
        return;
    }
    ++nextSeq_;
}

uint64_t JournalEventSink::NextSequence() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nextSeq_;
}

db::Status ReadJournal(db::Database& db, uint64_t fromSequence, size_t limit,
                       std::vector<Event>* out) {
    out->clear();
    auto it = db.NewIterator();
    std::string start = db::MakeKey(db::prefix::EVENT_JOURNAL, db::EncodeOrderedU64(fromSequence));
    for (it->Seek(start); it->Valid() && out->size() < limit; it->Next()) {
        db::Slice key = it->key();
        if (key.size() != 9 || key.data()[0] != db::prefix::EVENT_JOURNAL) {
            break;
        }
        db::Slice value = it->value();
        auto event = Event::Deserialize(reinterpret_cast<const Byte*>(value.data()), value.size());
        if (!event) {
            return db::Status::Corruption("journal entry " +
                                          std::to_string(db::DecodeOrderedU64(key.data() + 1)));
        }
        out->push_back(std::move(*event));
    }
    return it->status();
}

// ============================================================================
// EventBus
// ============================================================================

void EventBus::AddSink(std::shared_ptr<IEventSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void EventBus::RemoveSink(const std::shared_ptr<IEventSink>& sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

size_t EventBus::SinkCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sinks_.size();
}

void EventBus::Publish(const Event& event) {
    std::vector<std::shared_ptr<IEventSink>> sinks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks = sinks_;
        ++published_;
    }
    for (const auto& sink : sinks) {
        sink->OnEvent(event);
    }
}

uint64_t EventBus::PublishedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return published_;
}

} // namespace events
} // namespace nodereward
