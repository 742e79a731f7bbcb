// -----------------------------------------------------------------------------
// swaprouter: single executable entry point.
//
//   1) Load the configuration: compiled-in defaults, overlaid with the JSON
//      file named by the only (optional) argument.
//   2) Create the RouterEngine on a live wall clock.
//   3) Subscribe logging callbacks so every status and job event is echoed.
//   4) Start the engine: scheduler workers plus the ZeroMQ IPC thread.
//   5) Idle on the main thread until Ctrl-C, then shut down cleanly.
//
// Thread layout:
//   main thread       → waits for SIGINT
//   worker threads    → OrderScheduler, one execution attempt each
//   ipc thread        → IpcServer (REP commands, PUB status stream)
// -----------------------------------------------------------------------------

#include "swaprouter/codec/json_codec.hpp"
#include "swaprouter/config/config_loader.hpp"
#include "swaprouter/engine/router_engine.hpp"
#include "swaprouter/errors/router_error.hpp"
#include "swaprouter/events/event_types.hpp"
#include "swaprouter/time/live_time_provider.hpp"

#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <thread>

// -----------------------------------------------------------------------------
// Shutdown flag set by the SIGINT handler. sig_atomic_t is the only object
// type a handler may write portably.
// -----------------------------------------------------------------------------
static volatile std::sig_atomic_t g_stop_requested = 0;

static void sigint_handler(int /*signum*/) { g_stop_requested = 1; }

int main(int argc, char** argv) {
  // -------------------------------------------------------------------------
  // 1) Configuration.
  // -------------------------------------------------------------------------
  swaprouter::domain::RouterConfig config;
  if (argc > 1) {
    try {
      config = swaprouter::loadRouterConfig(argv[1]);
    } catch (const swaprouter::ValidationError& e) {
      std::cerr << "[main] " << e.what() << "\n";
      return 1;
    }
    std::cout << "[main] configuration loaded from " << argv[1] << "\n";
  }

  // -------------------------------------------------------------------------
  // 2) Engine.
  // -------------------------------------------------------------------------
  swaprouter::LiveTimeProvider clock;
  swaprouter::RouterEngine engine(config, clock);

  // -------------------------------------------------------------------------
  // 3) Logging subscribers. They run on whichever worker publishes.
  // -------------------------------------------------------------------------
  engine.eventBus().subscribe<swaprouter::OrderStatusEvent>(
      [](const swaprouter::OrderStatusEvent& e) {
        std::cout << "[OrderStatus] " << swaprouter::toJson(e).dump() << "\n";
      });

  engine.eventBus().subscribe<swaprouter::JobEvent>(
      [](const swaprouter::JobEvent& e) {
        std::cout << "[Job] order_id=" << e.order_id
                  << " kind=" << swaprouter::toString(e.kind)
                  << " attempt=" << e.attempt;
        if (e.kind == swaprouter::JobEventKind::RetryScheduled) {
          std::cout << " delay_ms=" << e.delay_ms;
        }
        if (!e.detail.empty()) {
          std::cout << " detail=\"" << e.detail << "\"";
        }
        std::cout << "\n";
      });

  // -------------------------------------------------------------------------
  // 4) Start.
  // -------------------------------------------------------------------------
  try {
    engine.start();
  } catch (const std::exception& e) {
    std::cerr << "[main] failed to start: " << e.what() << "\n";
    return 1;
  }
  std::signal(SIGINT, sigint_handler);

  std::cout << "[main] commands on " << config.ipc.command_endpoint
            << ", status stream on " << config.ipc.status_endpoint << "\n"
            << "[main] Press Ctrl-C to shut down.\n";

  // -------------------------------------------------------------------------
  // 5) Wait for Ctrl-C, then stop (joins every thread).
  // -------------------------------------------------------------------------
  while (g_stop_requested == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] SIGINT received. Stopping engine...\n";
  engine.stop();
  return 0;
}
