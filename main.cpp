// -----------------------------------------------------------------------------
// pulse_client: demo entry point for the realtime core.
//
//   pulse_client <config.json> <channel>[,<channel>...] [relay_endpoint]
//
//   1) Load and validate the Configuration from JSON.
//   2) Connect a ZmqTransport to the HTTP relay (default
//      tcp://127.0.0.1:5560). The relay performs the actual HTTPS calls.
//   3) Create the RealtimeClient and subscribe logging listeners to its
//      NotificationBus before start(), so the first Connected status is seen.
//   4) Subscribe to the channels given on the command line.
//   5) Wait for Ctrl-C, then unsubscribe from everything and stop.
//
// Thread layout:
//   main thread        → waits for SIGINT
//   SubscribeLane      → subscription engine, status/message listeners
//   PresenceLane       → presence engine, heartbeat listeners
//   IoPool             → ZmqTransport requests
//   LiveTimerService   → retry waits, heartbeat cooldowns
// -----------------------------------------------------------------------------

#include "pulse/config/configuration.hpp"
#include "pulse/domain/message.hpp"
#include "pulse/domain/status.hpp"
#include "pulse/engine/realtime_client.hpp"
#include "pulse/errors/configuration_error.hpp"
#include "pulse/transport/zmq_transport.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

namespace {

constexpr const char* kDefaultRelayEndpoint = "tcp://127.0.0.1:5560";
constexpr const char* kOrigin = "https://ps.pndsn.com";

// Set by the SIGINT handler, polled by main(). Lock-free atomic store is
// async-signal-safe.
std::atomic<bool> g_shutdown_requested{false};

void sigint_handler(int /*signum*/) { g_shutdown_requested.store(true); }

pulse::domain::ChannelSet parseChannelList(const std::string& text) {
  pulse::domain::ChannelSet channels;
  std::istringstream in(text);
  std::string name;
  while (std::getline(in, name, ',')) {
    if (!name.empty()) {
      channels.insert(name);
    }
  }
  return channels;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 3) {
    std::cerr << "usage: " << argv[0]
              << " <config.json> <channel>[,<channel>...] [relay_endpoint]\n";
    return 2;
  }

  // -------------------------------------------------------------------------
  // 1) Configuration
  // -------------------------------------------------------------------------
  pulse::Configuration config;
  try {
    config = pulse::loadConfiguration(argv[1]);
  } catch (const pulse::ConfigurationError& e) {
    std::cerr << "[main] " << e.what() << "\n";
    return 1;
  }

  const std::string relay_endpoint =
      argc > 3 ? argv[3] : kDefaultRelayEndpoint;

  // -------------------------------------------------------------------------
  // 2) Transport
  // -------------------------------------------------------------------------
  pulse::transport::ZmqTransport transport(relay_endpoint, kOrigin);

  // -------------------------------------------------------------------------
  // 3) Client and listeners
  // -------------------------------------------------------------------------
  pulse::RealtimeClient client(config, transport);

  client.notifications().subscribe<pulse::domain::Status>(
      [](const pulse::domain::Status& s) {
        std::cout << "[Status] " << pulse::domain::toString(s.category)
                  << " channels=" << s.channels.join()
                  << " groups=" << s.groups.join();
        if (s.cursor) {
          std::cout << " cursor=" << pulse::domain::toString(*s.cursor);
        }
        if (s.error) {
          std::cout << " error=" << pulse::describe(*s.error);
        }
        std::cout << "\n";
      });

  client.notifications().subscribe<pulse::domain::Message>(
      [](const pulse::domain::Message& m) {
        std::cout << "[Message] channel=" << m.channel
                  << " tt=" << m.published.timetoken
                  << " publisher=" << m.publisher << " payload=" << m.payload
                  << "\n";
      });

  client.notifications().subscribe<pulse::domain::HeartbeatStatus>(
      [](const pulse::domain::HeartbeatStatus& h) {
        std::cout << "[Heartbeat] " << (h.success ? "ok" : "failed")
                  << " channels=" << h.channels.join();
        if (h.error) {
          std::cout << " error=" << pulse::describe(*h.error);
        }
        std::cout << "\n";
      });

  client.start();

  // -------------------------------------------------------------------------
  // 4) Subscribe
  // -------------------------------------------------------------------------
  try {
    client.subscribe(parseChannelList(argv[2]));
  } catch (const pulse::ConfigurationError& e) {
    std::cerr << "[main] " << e.what() << "\n";
    client.stop();
    return 1;
  }

  std::signal(SIGINT, sigint_handler);
  std::cout << "[main] relay " << relay_endpoint << ", origin " << kOrigin
            << "\n[main] Press Ctrl-C to shut down.\n";

  // -------------------------------------------------------------------------
  // 5) Wait, then shut down cleanly
  // -------------------------------------------------------------------------
  while (!g_shutdown_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] SIGINT received. Shutting down...\n";
  client.unsubscribeAll();
  client.stop();

  return 0;
}
