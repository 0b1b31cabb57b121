// NODEREWARD - Event Bus and Journal Tests
// Copyright (c) 2024 NODEREWARD Developers
// MIT License

#include <gtest/gtest.h>
#include "nodereward/events/event.h"
#include "nodereward/db/leveldb.h"

namespace nodereward {
namespace events {
namespace test {

namespace {

CallerId Account(Byte tag) {
    Byte raw[] = {tag};
    return CallerId(raw, sizeof(raw));
}

Event SampleEvent(Timestamp ts) {
    Event event(EventType::RewardDistributed, "abcd", ts);
    event.WithActor(Account(5))
         .Field("settled", "false", "true")
         .Field("totalDistributed", int64_t{0}, int64_t{1500})
         .Value("amount", int64_t{1500});
    return event;
}

} // namespace

// ============================================================================
// Event
// ============================================================================

TEST(EventTest, BuilderAndFind) {
    Event event = SampleEvent(100);
    ASSERT_EQ(event.fields.size(), 3u);

    const EventField* total = event.Find("totalDistributed");
    ASSERT_NE(total, nullptr);
    EXPECT_EQ(total->before, "0");
    EXPECT_EQ(total->after, "1500");
    EXPECT_EQ(event.Find("missing"), nullptr);
    EXPECT_EQ(event.actor, Account(5).ToHex());
}

TEST(EventTest, ToString) {
    Event event(EventType::CircuitTripped, "slashing", 1);
    event.Value("reason", "manual");
    EXPECT_EQ(event.ToString(), "CircuitTripped slashing reason=manual");

    event.Field("tripped", "false", "true");
    EXPECT_EQ(event.ToString(), "CircuitTripped slashing reason=manual tripped=false->true");
}

TEST(EventTest, EncodedFormRestoresEveryField) {
    Event event = SampleEvent(1234);
    std::vector<Byte> bytes = event.Serialize();
    auto back = Event::Deserialize(bytes.data(), bytes.size());
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->type, EventType::RewardDistributed);
    EXPECT_EQ(back->subject, "abcd");
    EXPECT_EQ(back->timestamp, 1234);
    EXPECT_EQ(back->fields, event.fields);
}

TEST(EventTest, DeserializeRejectsUnknownType) {
    std::vector<Byte> bytes = SampleEvent(1).Serialize();
    bytes[0] = 0xEE;
    EXPECT_FALSE(Event::Deserialize(bytes.data(), bytes.size()).has_value());
    EXPECT_FALSE(Event::Deserialize(bytes.data(), 3).has_value());
}

TEST(EventTest, TypeNames) {
    EXPECT_STREQ(EventTypeToString(EventType::ParameterChanged), "ParameterChanged");
    EXPECT_STREQ(EventTypeToString(EventType::OperatorSlashed), "OperatorSlashed");
}

// ============================================================================
// Bus
// ============================================================================

TEST(EventBusTest, FansOutInOrder) {
    EventBus bus;
    std::vector<std::string> seen;
    auto first = std::make_shared<CallbackEventSink>([&](const Event& e) { seen.push_back("1:" + e.subject); });
    auto second = std::make_shared<CallbackEventSink>([&](const Event& e) { seen.push_back("2:" + e.subject); });
    bus.AddSink(first);
    bus.AddSink(second);

    bus.Publish(Event(EventType::PauseActivated, "global", 1));
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], "1:global");
    EXPECT_EQ(seen[1], "2:global");
    EXPECT_EQ(bus.PublishedCount(), 1u);

    bus.RemoveSink(first);
    EXPECT_EQ(bus.SinkCount(), 1u);
    bus.Publish(Event(EventType::PauseDeactivated, "global", 2));
    EXPECT_EQ(seen.size(), 3u);
}

TEST(EventBusTest, LogSinkAcceptsEveryType) {
    EventBus bus;
    bus.AddSink(std::make_shared<LogEventSink>());
    bus.Publish(Event(EventType::AnomalyDetected, "rewardCalculation.amount", 1));
    bus.Publish(Event(EventType::RewardCalculated, "id", 1));
    EXPECT_EQ(bus.PublishedCount(), 2u);
}

// ============================================================================
// Journal
// ============================================================================

TEST(JournalTest, AppendAndReadBack) {
    db::MemoryDatabase db;
    auto journal = std::make_shared<JournalEventSink>(db);
    EventBus bus;
    bus.AddSink(journal);

    for (Timestamp t = 1; t <= 3; ++t) {
        bus.Publish(SampleEvent(t));
    }
    EXPECT_EQ(journal->NextSequence(), 3u);

    std::vector<Event> events;
    ASSERT_TRUE(ReadJournal(db, 0, 10, &events).ok());
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].timestamp, 1);
    EXPECT_EQ(events[2].timestamp, 3);

    ASSERT_TRUE(ReadJournal(db, 1, 1, &events).ok());
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].timestamp, 2);
}

TEST(JournalTest, SequenceSurvivesRestart) {
    db::MemoryDatabase db;
    {
        JournalEventSink journal(db);
        journal.OnEvent(SampleEvent(1));
        journal.OnEvent(SampleEvent(2));
    }
    JournalEventSink reopened(db);
    EXPECT_EQ(reopened.NextSequence(), 2u);
    reopened.OnEvent(SampleEvent(3));

    std::vector<Event> events;
    ASSERT_TRUE(ReadJournal(db, 0, 100, &events).ok());
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[2].timestamp, 3);
}

TEST(JournalTest, WriteFailureDoesNotAdvance) {
    db::MemoryDatabase db;
    JournalEventSink journal(db);
    db.SetFailWrites(true);
    journal.OnEvent(SampleEvent(1));
    EXPECT_EQ(journal.NextSequence(), 0u);
}

TEST(JournalTest, CorruptEntryReported) {
    db::MemoryDatabase db;
    ASSERT_TRUE(db.Put(db::MakeKey(db::prefix::EVENT_JOURNAL, db::EncodeOrderedU64(0)), "zz").ok());
    std::vector<Event> events;
    EXPECT_TRUE(ReadJournal(db, 0, 10, &events).IsCorruption());
}

} // namespace test
} // namespace events
} // namespace nodereward
