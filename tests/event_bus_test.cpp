// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for vclock::EventBus.
//
// Validates:
//   - Generic subscription receives every clock event type
//   - Typed subscription receives only the matching event type
//   - Unsubscribe stops delivery; unknown ids are ignored
//   - Re-entrant publish from inside a callback does not deadlock
//   - Payloads survive the variant dispatch path
//
// Design note: All tests are single-threaded. Cross-thread delivery through
// ClockEngine is covered in clock_engine_test.cpp.
// =============================================================================

#include "vclock/eventbus/event_bus.hpp"
#include "vclock/events/clock_events.hpp"
#include "vclock/events/event.hpp"

#include <gtest/gtest.h>

#include <string>

class EventBusTest : public ::testing::Test {
 protected:
  vclock::EventBus bus;

  static vclock::TickAdvancedEvent makeAdvance(std::int64_t from,
                                               std::int64_t to) {
    vclock::TickAdvancedEvent e;
    e.previous_tick = from;
    e.current_tick = to;
    e.range = vclock::TickRange{to * 86400, (to + 1) * 86400 - 1};
    return e;
  }

  static vclock::TimestampIssuedEvent makeIssued(std::int64_t actor,
                                                 std::int64_t timestamp) {
    vclock::TimestampIssuedEvent e;
    e.actor_id = actor;
    e.action_hint = "create_post";
    e.result.timestamp = timestamp;
    return e;
  }
};

// -----------------------------------------------------------------------------
// 1. A generic subscriber sees every event type.
// Why: the telemetry bridge subscribes generically; a skipped type would
//      vanish from the PUB stream.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, GenericSubscriberReceivesAllEvents) {
  int call_count = 0;
  bus.subscribe([&call_count](const vclock::Event&) { ++call_count; });

  bus.publish(makeAdvance(0, 1));
  bus.publish(makeIssued(1, 10));
  bus.publish(vclock::ClockResetEvent{3, 42});

  EXPECT_EQ(call_count, 3);
}

// -----------------------------------------------------------------------------
// 2. A typed subscriber fires only for its own type.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberFiltersCorrectly) {
  int advance_count = 0;
  bus.subscribe<vclock::TickAdvancedEvent>(
      [&advance_count](const vclock::TickAdvancedEvent&) { ++advance_count; });

  bus.publish(makeAdvance(0, 1));
  bus.publish(makeIssued(1, 10));
  bus.publish(vclock::ClockResetEvent{1, 42});

  EXPECT_EQ(advance_count, 1);
}

// -----------------------------------------------------------------------------
// 3. After unsubscribe(id) the callback stays silent.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  int call_count = 0;
  const auto id = bus.subscribe<vclock::TimestampIssuedEvent>(
      [&call_count](const vclock::TimestampIssuedEvent&) { ++call_count; });
  EXPECT_EQ(bus.subscriberCount(), 1u);

  bus.publish(makeIssued(1, 10));
  EXPECT_EQ(call_count, 1);

  bus.unsubscribe(id);
  EXPECT_EQ(bus.subscriberCount(), 0u);

  bus.publish(makeIssued(1, 11));
  EXPECT_EQ(call_count, 1);
}

// -----------------------------------------------------------------------------
// 4. Unknown ids and empty buses are harmless.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeNonExistentIdIsNoOp) {
  EXPECT_NO_FATAL_FAILURE(bus.unsubscribe(9999));
}

TEST_F(EventBusTest, PublishWithNoSubscribers) {
  EXPECT_NO_FATAL_FAILURE(bus.publish(makeAdvance(0, 1)));
}

// -----------------------------------------------------------------------------
// 5. Publishing from inside a callback must not deadlock.
// Scenario: a ClockResetEvent subscriber announces the tick it resets to.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, SubscriberCanPublishInsideCallback) {
  int advances_seen = 0;
  bus.subscribe<vclock::TickAdvancedEvent>(
      [&advances_seen](const vclock::TickAdvancedEvent&) { ++advances_seen; });

  bus.subscribe<vclock::ClockResetEvent>(
      [this](const vclock::ClockResetEvent& e) {
        bus.publish(makeAdvance(e.previous_tick, 0));
      });

  bus.publish(vclock::ClockResetEvent{5, 42});
  EXPECT_EQ(advances_seen, 1);
}

// -----------------------------------------------------------------------------
// 6. Payload fields survive the variant copy.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberReceivesCorrectData) {
  vclock::TimestampIssuedEvent received;
  bus.subscribe<vclock::TimestampIssuedEvent>(
      [&received](const vclock::TimestampIssuedEvent& e) { received = e; });

  vclock::TimestampIssuedEvent sent = makeIssued(-7, 86400);
  sent.parent_timestamp = 86399;
  sent.result.outcome = vclock::SynthesisOutcome::ParentOverflow;
  sent.iso = "2024-01-02 00:00:00";
  bus.publish(sent);

  EXPECT_EQ(received.actor_id, -7);
  EXPECT_EQ(received.action_hint, "create_post");
  ASSERT_TRUE(received.parent_timestamp.has_value());
  EXPECT_EQ(*received.parent_timestamp, 86399);
  EXPECT_EQ(received.result.timestamp, 86400);
  EXPECT_EQ(received.result.outcome, vclock::SynthesisOutcome::ParentOverflow);
  EXPECT_EQ(received.iso, "2024-01-02 00:00:00");
}
