// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for sigtrader::EventBus and ScopedSubscription.
//
// Validates:
//   - Generic (all-event) subscription receives every event type
//   - Typed subscription receives only the matching event type
//   - Multiple subscribers all receive the same published event
//   - Unsubscribe and ScopedSubscription stop delivery
//   - Edge cases: unsubscribe unknown id, publish to empty bus
//   - Re-entrant publish (subscriber publishes inside callback) does not
//     deadlock
//   - Payload integrity through the variant dispatch path
//
// All tests are single-threaded. Cross-thread delivery is covered in
// signal_lanes_test.cpp.
// =============================================================================

#include "sigtrader/eventbus/event_bus.hpp"
#include "sigtrader/events/event.hpp"

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

using sigtrader::domain::Signal;
using sigtrader::domain::SignalStatus;

class EventBusTest : public ::testing::Test {
 protected:
  sigtrader::EventBus bus;

  static sigtrader::RejectionEvent makeRejection(const std::string& reason) {
    sigtrader::RejectionEvent e;
    e.stage = sigtrader::RejectionStage::Parse;
    e.reason = reason;
    e.source.channel_id = "chan";
    e.source.message_id = 7;
    return e;
  }

  static sigtrader::SignalUpdateEvent makeUpdate(sigtrader::domain::SignalId id,
                                                 SignalStatus status) {
    sigtrader::SignalUpdateEvent e;
    e.signal.id = id;
    e.signal.symbol = "EURUSD";
    e.signal.status = status;
    e.previous_status = SignalStatus::Pending;
    e.reason = "test";
    return e;
  }
};

// -----------------------------------------------------------------------------
// 1. A generic subscriber is invoked for every event type.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, GenericSubscriberReceivesAllEvents) {
  int call_count = 0;
  bus.subscribe([&call_count](const sigtrader::Event&) { ++call_count; });

  bus.publish(makeRejection("not_a_signal"));
  bus.publish(makeUpdate(1, SignalStatus::Open));
  bus.publish(sigtrader::MonitorActionEvent{});

  EXPECT_EQ(call_count, 3);
}

// -----------------------------------------------------------------------------
// 2. A typed subscriber fires only for its registered alternative.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberFiltersCorrectly) {
  int rejections = 0;
  bus.subscribe<sigtrader::RejectionEvent>(
      [&rejections](const sigtrader::RejectionEvent&) { ++rejections; });

  bus.publish(makeRejection("a"));
  bus.publish(makeUpdate(1, SignalStatus::Open));

  EXPECT_EQ(rejections, 1);
}

// -----------------------------------------------------------------------------
// 3. Multiple subscribers all receive the same published event.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, MultipleSubscribersAllReceive) {
  int count_a = 0;
  int count_b = 0;
  int count_c = 0;

  bus.subscribe<sigtrader::SignalUpdateEvent>(
      [&count_a](const sigtrader::SignalUpdateEvent&) { ++count_a; });
  bus.subscribe<sigtrader::SignalUpdateEvent>(
      [&count_b](const sigtrader::SignalUpdateEvent&) { ++count_b; });
  bus.subscribe<sigtrader::SignalUpdateEvent>(
      [&count_c](const sigtrader::SignalUpdateEvent&) { ++count_c; });

  bus.publish(makeUpdate(3, SignalStatus::Open));

  EXPECT_EQ(count_a, 1);
  EXPECT_EQ(count_b, 1);
  EXPECT_EQ(count_c, 1);
  EXPECT_EQ(bus.subscriberCount(), 3u);
}

// -----------------------------------------------------------------------------
// 4. After unsubscribe(id), the callback no longer fires.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  int call_count = 0;
  auto id = bus.subscribe<sigtrader::RejectionEvent>(
      [&call_count](const sigtrader::RejectionEvent&) { ++call_count; });

  bus.publish(makeRejection("first"));
  EXPECT_EQ(call_count, 1);

  bus.unsubscribe(id);

  bus.publish(makeRejection("second"));
  EXPECT_EQ(call_count, 1);
}

// -----------------------------------------------------------------------------
// 5. ScopedSubscription unsubscribes when destroyed, and a moved-from handle
//    does nothing.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, ScopedSubscriptionUnsubscribesOnDestruction) {
  int call_count = 0;
  {
    sigtrader::ScopedSubscription outer;
    {
      sigtrader::ScopedSubscription inner(
          bus, bus.subscribe<sigtrader::RejectionEvent>(
                   [&call_count](const sigtrader::RejectionEvent&) {
                     ++call_count;
                   }));
      outer = std::move(inner);
    }
    bus.publish(makeRejection("still subscribed"));
    EXPECT_EQ(call_count, 1);
    EXPECT_EQ(bus.subscriberCount(), 1u);
  }

  EXPECT_EQ(bus.subscriberCount(), 0u);
  bus.publish(makeRejection("gone"));
  EXPECT_EQ(call_count, 1);
}

// -----------------------------------------------------------------------------
// 6. Unsubscribing an unknown id is a no-op.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeNonExistentIdIsNoOp) {
  EXPECT_NO_FATAL_FAILURE(bus.unsubscribe(9999));
}

// -----------------------------------------------------------------------------
// 7. Publishing to a bus with zero subscribers does nothing.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, PublishWithNoSubscribers) {
  EXPECT_NO_FATAL_FAILURE(bus.publish(makeRejection("nobody listens")));
}

// -----------------------------------------------------------------------------
// 8. A subscriber that calls publish() inside its callback must not deadlock.
// Scenario: the rejection subscriber republishes as a signal update, which a
//           second subscriber receives.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, SubscriberCanPublishInsideCallback) {
  int updates_received = 0;

  bus.subscribe<sigtrader::SignalUpdateEvent>(
      [&updates_received](const sigtrader::SignalUpdateEvent&) {
        ++updates_received;
      });

  bus.subscribe<sigtrader::RejectionEvent>(
      [this](const sigtrader::RejectionEvent& rejection) {
        bus.publish(makeUpdate(rejection.signal_id, SignalStatus::Error));
      });

  bus.publish(makeRejection("reentrant"));

  EXPECT_EQ(updates_received, 1);
}

// -----------------------------------------------------------------------------
// 9. Field values survive the variant dispatch.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberReceivesCorrectData) {
  Signal received;
  std::string reason;

  bus.subscribe<sigtrader::SignalUpdateEvent>(
      [&received, &reason](const sigtrader::SignalUpdateEvent& e) {
        received = e.signal;
        reason = e.reason;
      });

  auto update = makeUpdate(42, SignalStatus::PartiallyClosed);
  update.signal.entries = {1.0850};
  update.signal.take_profits = {1.0900, 1.0950};
  bus.publish(update);

  EXPECT_EQ(received.id, 42u);
  EXPECT_EQ(received.symbol, "EURUSD");
  EXPECT_EQ(received.status, SignalStatus::PartiallyClosed);
  ASSERT_EQ(received.take_profits.size(), 2u);
  EXPECT_DOUBLE_EQ(received.take_profits[1], 1.0950);
  EXPECT_EQ(reason, "test");
}
