// -----------------------------------------------------------------------------
// relay_broker: single executable entry point.
//
//   1) Load the broker configuration (defaults, or a JSON file given as the
//      first argument).
//   2) Create a LiveTimeProvider (wall clock; tests use the simulation one).
//   3) Create the BrokerEngine and start it. The engine binds the command
//      (REP) and stream (PUB) sockets and starts the request loop, the timer
//      host and, if configured, the provider worker.
//   4) Subscribe logging callbacks for summary refreshes and sweeps.
//   5) Idle on the main thread until Ctrl-C, then shut down cleanly.
//
// Thread layout:
//   main thread      → waits for SIGINT
//   request loop     → every command, timer tick and provider completion
//   timer host       → posts ticks onto the request loop
//   IPC server       → REP command socket + PUB stream socket
//   provider worker  → REQ round trips to the data provider (if configured)
// -----------------------------------------------------------------------------

#include "relay/config/config_loader.hpp"
#include "relay/engine/broker_engine.hpp"
#include "relay/events/notification.hpp"
#include "relay/time/live_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>
#include <utility>

// -----------------------------------------------------------------------------
// Shutdown flag for the signal handler. The only global in the program; it
// is written by the handler and polled by main().
// -----------------------------------------------------------------------------
static std::atomic<bool> g_shutdown_requested{false};

static void sigint_handler(int /*signum*/) {
  g_shutdown_requested.store(true);
}

int main(int argc, char** argv) {
  // -------------------------------------------------------------------------
  // 1) Configuration.
  // -------------------------------------------------------------------------
  relay::domain::BrokerConfig config;
  if (argc > 1) {
    auto loaded = relay::loadConfigFromFile(argv[1]);
    if (!loaded.ok()) {
      std::cerr << "[main] failed to load config " << argv[1] << ": "
                << loaded.error().message << std::endl;
      return 1;
    }
    config = std::move(loaded).value();
    std::cout << "[main] loaded config from " << argv[1] << std::endl;
  }

  // -------------------------------------------------------------------------
  // 2) + 3) Clock and engine.
  // -------------------------------------------------------------------------
  relay::LiveTimeProvider clock;
  relay::BrokerEngine engine(config, clock);

  // Subscribe BEFORE start() so the first refresh is logged. These
  // callbacks run on the request loop.
  engine.eventBus().subscribe<relay::SummaryRefreshed>(
      [](const relay::SummaryRefreshed& e) {
        std::cout << "[Summary] refreshed symbols=" << e.symbol_count
                  << " failed=" << e.failed_count
                  << " cached_at=" << e.cached_at_ms << std::endl;
      });
  engine.eventBus().subscribe<relay::SweepCompleted>(
      [](const relay::SweepCompleted& e) {
        if (e.connections_removed + e.rooms_removed + e.events_expired +
                e.cache_entries_purged ==
            0) {
          return;
        }
        std::cout << "[Sweep] connections=" << e.connections_removed
                  << " rooms=" << e.rooms_removed
                  << " events=" << e.events_expired
                  << " cache=" << e.cache_entries_purged << std::endl;
      });

  engine.start();

  // -------------------------------------------------------------------------
  // 4) SIGINT triggers a clean shutdown.
  // -------------------------------------------------------------------------
  std::signal(SIGINT, sigint_handler);

  std::cout << "[main] commands on " << config.command_endpoint
            << ", streams on " << config.stream_endpoint << "\n"
            << "[main] Press Ctrl-C to shut down." << std::endl;

  while (!g_shutdown_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  // -------------------------------------------------------------------------
  // 5) Clean shutdown: closes sockets, joins every thread.
  // -------------------------------------------------------------------------
  std::cout << "\n[main] SIGINT received. Stopping broker..." << std::endl;
  engine.stop();

  return 0;
}
