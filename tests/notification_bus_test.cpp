// =============================================================================
// notification_bus_test.cpp
// =============================================================================
// Unit tests for pulse::NotificationBus.
//
// Validates:
//   - A generic listener receives every notification kind
//   - A typed listener receives only its own kind
//   - Several listeners all receive the same notification
//   - unsubscribe() stops delivery; unknown ids are ignored
//   - A listener may publish from inside its callback without deadlock
//   - Payload fields survive the variant dispatch
//
// All tests are single-threaded. Cross-thread delivery through the engine
// lanes is covered in realtime_client_test.cpp.
// =============================================================================

#include "pulse/notify/notification_bus.hpp"

#include <gtest/gtest.h>

#include <string>

using pulse::domain::HeartbeatStatus;
using pulse::domain::Message;
using pulse::domain::Status;
using pulse::domain::StatusCategory;

class NotificationBusTest : public ::testing::Test {
 protected:
  pulse::NotificationBus bus;

  static Message makeMessage(const std::string& channel,
                             const std::string& payload) {
    Message message;
    message.channel = channel;
    message.payload = payload;
    message.published = pulse::domain::Cursor{"15000000000000000", 4};
    return message;
  }

  static Status makeStatus(StatusCategory category) {
    Status status;
    status.category = category;
    status.channels = pulse::domain::ChannelSet{"room"};
    return status;
  }
};

// -----------------------------------------------------------------------------
// 1. A generic listener sees statuses, messages and heartbeat results.
// Why: A logging listener subscribes generically and must not miss a kind.
// -----------------------------------------------------------------------------
TEST_F(NotificationBusTest, GenericListenerReceivesAll) {
  int calls = 0;
  bus.subscribe([&calls](const pulse::Notification&) { ++calls; });

  bus.publish(makeStatus(StatusCategory::Connected));
  bus.publish(makeMessage("room", "1"));
  bus.publish(HeartbeatStatus{});

  EXPECT_EQ(calls, 3);
}

// -----------------------------------------------------------------------------
// 2. A typed listener fires only for its registered kind.
// -----------------------------------------------------------------------------
TEST_F(NotificationBusTest, TypedListenerFilters) {
  int messages = 0;
  bus.subscribe<Message>([&messages](const Message&) { ++messages; });

  bus.publish(makeMessage("room", "1"));
  bus.publish(makeStatus(StatusCategory::Connected));
  bus.publish(HeartbeatStatus{});

  EXPECT_EQ(messages, 1);
}

// -----------------------------------------------------------------------------
// 3. Every registered listener receives the notification.
// -----------------------------------------------------------------------------
TEST_F(NotificationBusTest, MultipleListenersAllReceive) {
  int a = 0;
  int b = 0;
  bus.subscribe<Status>([&a](const Status&) { ++a; });
  bus.subscribe<Status>([&b](const Status&) { ++b; });

  bus.publish(makeStatus(StatusCategory::Disconnected));

  EXPECT_EQ(a, 1);
  EXPECT_EQ(b, 1);
  EXPECT_EQ(bus.subscriberCount(), 2u);
}

// -----------------------------------------------------------------------------
// 4. After unsubscribe(id) the callback no longer fires.
// Why: Listeners capture application state that may be destroyed after they
//      unsubscribe.
// -----------------------------------------------------------------------------
TEST_F(NotificationBusTest, UnsubscribeStopsDelivery) {
  int calls = 0;
  const auto id = bus.subscribe<Message>([&calls](const Message&) { ++calls; });

  bus.publish(makeMessage("room", "1"));
  bus.unsubscribe(id);
  bus.publish(makeMessage("room", "2"));

  EXPECT_EQ(calls, 1);
  EXPECT_EQ(bus.subscriberCount(), 0u);
}

// -----------------------------------------------------------------------------
// 5. Unknown ids and empty buses are harmless.
// -----------------------------------------------------------------------------
TEST_F(NotificationBusTest, EdgeCasesAreNoOps) {
  EXPECT_NO_FATAL_FAILURE(bus.unsubscribe(9999));
  EXPECT_NO_FATAL_FAILURE(bus.publish(makeMessage("room", "1")));
}

// -----------------------------------------------------------------------------
// 6. A listener that publishes inside its callback must not deadlock.
// Why: publish() copies the listener list and calls out without the lock;
//      holding it would hang here.
// -----------------------------------------------------------------------------
TEST_F(NotificationBusTest, ListenerCanPublishInsideCallback) {
  int statuses = 0;
  bus.subscribe<Status>([&statuses](const Status&) { ++statuses; });
  bus.subscribe<Message>([this](const Message&) {
    bus.publish(makeStatus(StatusCategory::SubscriptionChanged));
  });

  bus.publish(makeMessage("room", "1"));
  EXPECT_EQ(statuses, 1);
}

// -----------------------------------------------------------------------------
// 7. Field values survive publish and typed dispatch.
// -----------------------------------------------------------------------------
TEST_F(NotificationBusTest, TypedListenerReceivesCorrectData) {
  std::string channel;
  std::string payload;
  std::string timetoken;
  bus.subscribe<Message>([&](const Message& m) {
    channel = m.channel;
    payload = m.payload;
    timetoken = m.published.timetoken;
  });

  bus.publish(makeMessage("sports", "{\"score\":7}"));

  EXPECT_EQ(channel, "sports");
  EXPECT_EQ(payload, "{\"score\":7}");
  EXPECT_EQ(timetoken, "15000000000000000");
}
