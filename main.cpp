// -----------------------------------------------------------------------------
// cppi_autopilot — single executable entry point.
//
//   1) Load the configuration (first argument; built-in defaults otherwise).
//   2) Pick the engine clock: replay (driven by valuation timestamps) or live.
//   3) Publish the strategy catalog and start the AutopilotEngine, which
//      opens the valuation feed, the IPC command/telemetry sockets and the
//      keeper.
//   4) Block the main thread until SIGINT/SIGTERM, then stop the engine.
//
// Thread layout (see AutopilotEngine):
//   main thread        → waits for the shutdown signal
//   worker threads     → PositionLedger revaluation and fills
//   execution thread   → MockRebalanceExecutor
//   keeper, ipc, feed  → housekeeping and I/O
// -----------------------------------------------------------------------------

#include "cppi/config/config_loader.hpp"
#include "cppi/engine/autopilot_engine.hpp"
#include "cppi/time/live_time_provider.hpp"
#include "cppi/time/simulation_time_provider.hpp"

#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

// The only global: a flag the signal handler may legally write.
static volatile std::sig_atomic_t g_shutdown_requested = 0;

static void shutdown_handler(int /*signum*/) { g_shutdown_requested = 1; }

int main(int argc, char** argv) {
  // -------------------------------------------------------------------------
  // 1) Configuration
  // -------------------------------------------------------------------------
  cppi::AppConfig config = argc > 1 ? cppi::ConfigLoader::loadFile(argv[1])
                                    : cppi::ConfigLoader::defaults();

  // -------------------------------------------------------------------------
  // 2) Clock. Both providers live on main()'s stack for the whole run.
  // -------------------------------------------------------------------------
  cppi::SimulationTimeProvider replay_clock;
  cppi::LiveTimeProvider live_clock;

  const cppi::ITimeProvider& clock =
      config.replay_clock ? static_cast<const cppi::ITimeProvider&>(replay_clock)
                          : live_clock;

  // -------------------------------------------------------------------------
  // 3) Engine
  // -------------------------------------------------------------------------
  cppi::AutopilotEngine engine(clock, config.engine,
                               config.replay_clock ? &replay_clock : nullptr);

  const std::size_t published =
      cppi::ConfigLoader::publishAll(engine.catalog(), config.strategies);
  if (published == 0) {
    std::cerr << "[main] no valid strategy in the configuration. Exiting.\n";
    return 1;
  }

  std::signal(SIGINT, shutdown_handler);
  std::signal(SIGTERM, shutdown_handler);

  engine.start();

  std::cout << "[main] " << published << " strateg"
            << (published == 1 ? "y" : "ies") << " published, "
            << (config.replay_clock ? "replay" : "live") << " clock.\n"
            << "[main] valuation feed: " << config.engine.valuation_endpoint
            << "\n"
            << "[main] commands: " << config.engine.ipc_cmd_endpoint
            << "  telemetry: " << config.engine.ipc_pub_endpoint << "\n"
            << "[main] Press Ctrl-C to shut down.\n";

  // -------------------------------------------------------------------------
  // 4) Wait for the shutdown signal, then stop (joins every thread).
  // -------------------------------------------------------------------------
  while (g_shutdown_requested == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] shutdown requested. Stopping engine...\n";
  engine.stop();

  return 0;
}
