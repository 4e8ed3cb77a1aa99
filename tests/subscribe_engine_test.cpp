// =============================================================================
// subscribe_engine_test.cpp
// =============================================================================
// Component tests for pulse::subscribe::SubscribeEngine wired to its real
// effect handler, with the network, I/O pool and timers replaced by the
// deterministic doubles in support/test_doubles.hpp.
//
// Validates:
//   - Handshake request, Connected status, then receive long-poll at the
//     handshake cursor
//   - Messages reach the NotificationBus; duplicates are dropped when
//     deduplication is on
//   - A failed handshake waits on the timer service and retries
//   - A subscription change aborts the outstanding long-poll before it runs
//   - Disconnect disarms a pending retry timer
//
// Design:
//   The lane is inline and the I/O pool is manual, so each io.runNext()
//   performs one request and every resulting transition before returning.
// =============================================================================

#include "pulse/notify/notification_bus.hpp"
#include "pulse/subscribe/subscribe_engine.hpp"

#include "support/test_doubles.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

using namespace std::chrono_literals;
using pulse::EndpointKind;
using pulse::domain::ChannelSet;
using pulse::domain::StatusCategory;

namespace sub = pulse::subscribe;

class SubscribeEngineTest : public ::testing::Test {
 protected:
  pulse::test::InlineExecutor lane;
  pulse::test::ManualExecutor io;
  pulse::test::ManualTimerService timers;
  pulse::test::ScriptedTransport transport;
  pulse::NotificationBus bus;

  std::vector<StatusCategory> statuses;
  std::vector<pulse::domain::Message> messages;

  static pulse::Configuration makeConfig(bool dedupe = false) {
    pulse::Configuration config;
    config.subscribe_key = "sub-c-key";
    config.user_id = "user-1";
    config.dedupe_on_subscribe = dedupe;
    config.retry = pulse::RetryConfiguration::linear(2s, 2);
    config.retry.maximum_jitter = 0ms;
    return config;
  }

  void SetUp() override {
    bus.subscribe<pulse::domain::Status>(
        [this](const pulse::domain::Status& s) {
          statuses.push_back(s.category);
        });
    bus.subscribe<pulse::domain::Message>(
        [this](const pulse::domain::Message& m) { messages.push_back(m); });
  }

  std::unique_ptr<sub::SubscribeEngine> makeEngine(
      const pulse::Configuration& config) {
    return std::make_unique<sub::SubscribeEngine>(config, transport, lane, io,
                                                  timers, bus);
  }

  // Subscribes to "a" and completes the handshake at {15000000000000000, 4}.
  void connect(sub::SubscribeEngine& engine) {
    engine.send(sub::event::SubscriptionChange{{"a"}, {}});
    transport.enqueueResponse(
        EndpointKind::Subscribe, 200,
        pulse::test::subscribeBody("15000000000000000", 4));
    ASSERT_TRUE(io.runNext());
    ASSERT_EQ(engine.currentState()->kind, sub::StateKind::Receiving);
  }
};

// -----------------------------------------------------------------------------
// 1. Subscribe: handshake at tt=0, Connected, then long-poll at the cursor.
// -----------------------------------------------------------------------------
TEST_F(SubscribeEngineTest, HandshakeThenReceive) {
  auto engine = makeEngine(makeConfig());

  engine->send(sub::event::SubscriptionChange{{"a"}, {}});
  EXPECT_EQ(engine->currentState()->kind, sub::StateKind::Handshaking);
  EXPECT_EQ(io.pending(), 1u);

  transport.enqueueResponse(
      EndpointKind::Subscribe, 200,
      pulse::test::subscribeBody("15000000000000000", 4));
  ASSERT_TRUE(io.runNext());

  EXPECT_EQ(engine->currentState()->kind, sub::StateKind::Receiving);
  EXPECT_EQ(statuses, std::vector<StatusCategory>{StatusCategory::Connected});

  // The receive request is queued and targets the handshake cursor.
  EXPECT_EQ(io.pending(), 1u);
  transport.enqueueResponse(
      EndpointKind::Subscribe, 200,
      pulse::test::subscribeBody(
          "15000000000000010", 4,
          "[" + pulse::test::messageJson("a", "15000000000000005",
                                         "{\"text\":\"hi\"}") +
              "]"));
  ASSERT_TRUE(io.runNext());

  const auto requests = transport.requestsFor(EndpointKind::Subscribe);
  ASSERT_EQ(requests.size(), 2u);
  EXPECT_EQ(requests[0].queryValue("tt"), "0");
  EXPECT_EQ(requests[1].queryValue("tt"), "15000000000000000");
  EXPECT_EQ(requests[1].queryValue("tr"), "4");

  ASSERT_EQ(messages.size(), 1u);
  EXPECT_EQ(messages[0].channel, "a");
  EXPECT_EQ(messages[0].payload, "{\"text\":\"hi\"}");
  EXPECT_EQ(engine->currentState()->context.cursor->timetoken,
            "15000000000000010");
}

// -----------------------------------------------------------------------------
// 2. With deduplication on, a replayed message is delivered once.
// -----------------------------------------------------------------------------
TEST_F(SubscribeEngineTest, DuplicateMessagesSuppressed) {
  auto engine = makeEngine(makeConfig(true));
  connect(*engine);

  const std::string batch =
      "[" + pulse::test::messageJson("a", "15000000000000005", "1", 9) + "]";
  transport.enqueueResponse(
      EndpointKind::Subscribe, 200,
      pulse::test::subscribeBody("15000000000000010", 4, batch));
  transport.enqueueResponse(
      EndpointKind::Subscribe, 200,
      pulse::test::subscribeBody("15000000000000020", 4, batch));
  ASSERT_TRUE(io.runNext());
  ASSERT_TRUE(io.runNext());

  EXPECT_EQ(messages.size(), 1u);
}

// -----------------------------------------------------------------------------
// 3. A failed handshake arms a retry timer; when it fires the handshake is
//    re-issued.
// Why: Retries must be driven by the timer service, not by a sleeping I/O
//      worker, so that they can be cancelled.
// -----------------------------------------------------------------------------
TEST_F(SubscribeEngineTest, HandshakeRetryAfterTimer) {
  auto engine = makeEngine(makeConfig());
  engine->send(sub::event::SubscriptionChange{{"a"}, {}});

  transport.enqueue(EndpointKind::Subscribe,
                    pulse::EndpointError::transport("connection refused"));
  ASSERT_TRUE(io.runNext());

  EXPECT_EQ(engine->currentState()->kind, sub::StateKind::Handshaking);
  EXPECT_EQ(engine->currentState()->context.attempts, 1);
  EXPECT_EQ(timers.pending(), 1u);
  EXPECT_EQ(timers.lastDelay(), 2000ms);
  EXPECT_EQ(io.pending(), 0u);

  timers.advance(1999ms);
  EXPECT_EQ(io.pending(), 0u);
  timers.advance(1ms);
  EXPECT_EQ(io.pending(), 1u);

  transport.enqueueResponse(
      EndpointKind::Subscribe, 200,
      pulse::test::subscribeBody("15000000000000000", 4));
  ASSERT_TRUE(io.runNext());
  EXPECT_EQ(engine->currentState()->kind, sub::StateKind::Receiving);
  EXPECT_EQ(engine->currentState()->context.attempts, 0);
}

// -----------------------------------------------------------------------------
// 4. Changing the subscription cancels the queued long-poll; the new
//    handshake names both channels.
// -----------------------------------------------------------------------------
TEST_F(SubscribeEngineTest, SubscriptionChangeAbortsLongPoll) {
  auto engine = makeEngine(makeConfig());
  connect(*engine);
  ASSERT_EQ(io.pending(), 1u);  // receive for "a"

  engine->send(sub::event::SubscriptionChange{{"a", "b"}, {}});
  EXPECT_EQ(statuses.back(), StatusCategory::SubscriptionChanged);

  transport.enqueueResponse(
      EndpointKind::Subscribe, 200,
      pulse::test::subscribeBody("15000000000000030", 4));
  EXPECT_EQ(io.runAll(), 3u);  // cancelled receive, handshake, new receive

  const auto requests = transport.requestsFor(EndpointKind::Subscribe);
  ASSERT_EQ(requests.size(), 3u);
  EXPECT_EQ(requests[1].path, "/v2/subscribe/sub-c-key/a,b/0");
  EXPECT_EQ(requests[1].queryValue("tt"), "0");

  // Preserve policy: the old timetoken survives the re-handshake.
  EXPECT_EQ(engine->currentState()->context.cursor->timetoken,
            "15000000000000000");
}

// -----------------------------------------------------------------------------
// 5. Disconnect while a receive retry is pending disarms the timer.
// -----------------------------------------------------------------------------
TEST_F(SubscribeEngineTest, DisconnectCancelsRetryTimer) {
  auto engine = makeEngine(makeConfig());
  connect(*engine);

  transport.enqueue(EndpointKind::Subscribe,
                    pulse::EndpointError::server(503, "unavailable"));
  ASSERT_TRUE(io.runNext());
  EXPECT_EQ(statuses.back(), StatusCategory::Reconnecting);
  EXPECT_EQ(timers.pending(), 1u);

  engine->send(sub::event::Disconnect{});
  EXPECT_EQ(engine->currentState()->kind, sub::StateKind::ReceiveStopped);
  EXPECT_EQ(timers.pending(), 0u);
  EXPECT_EQ(statuses.back(), StatusCategory::Disconnected);

  engine->send(sub::event::Reconnect{});
  EXPECT_EQ(engine->currentState()->kind, sub::StateKind::Receiving);
  EXPECT_EQ(io.pending(), 1u);
}

// -----------------------------------------------------------------------------
// 6. cancelAll() aborts the outstanding request without changing state.
// -----------------------------------------------------------------------------
TEST_F(SubscribeEngineTest, CancelAllAbortsRequest) {
  auto engine = makeEngine(makeConfig());
  connect(*engine);

  engine->cancelAll();
  ASSERT_TRUE(io.runNext());

  EXPECT_EQ(transport.requestsFor(EndpointKind::Subscribe).size(), 1u);
  EXPECT_EQ(engine->currentState()->kind, sub::StateKind::Receiving);
}
