// -----------------------------------------------------------------------------
// signal_trader - executable entry point.
//
//   1) Load the JSON configuration (argv[1], default
//      config/signal_trader.json; built-in defaults if the file is absent).
//   2) Build the paper venue, the signal store and the source registry.
//   3) Start the SignalEngine: synchronization gate, lanes, monitor, IPC,
//      message sources.
//   4) Sleep on the main thread until SIGINT/SIGTERM, then stop the engine.
//
// The engine owns every worker thread; main() only owns the collaborators
// the engine borrows.
// -----------------------------------------------------------------------------

#include "sigtrader/config/engine_config.hpp"
#include "sigtrader/engine/signal_engine.hpp"
#include "sigtrader/source/message_source_registry.hpp"
#include "sigtrader/store/in_memory_signal_store.hpp"
#include "sigtrader/store/json_file_signal_store.hpp"
#include "sigtrader/time/live_time_provider.hpp"
#include "sigtrader/venue/paper_execution_venue.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {

std::atomic<bool> g_stop_requested{false};

void onSignal(int /*signum*/) { g_stop_requested.store(true); }

sigtrader::EngineConfig loadConfig(const std::string& path, bool explicit_path) {
  std::ifstream file(path);
  if (!file.good() && !explicit_path) {
    std::cout << "[main] " << path << " not found, using built-in defaults\n";
    return sigtrader::defaultConfig();
  }
  return sigtrader::loadConfigFile(path);
}

}  // namespace

int main(int argc, char** argv) {
  const bool explicit_path = argc > 1;
  const std::string config_path =
      explicit_path ? argv[1] : "config/signal_trader.json";

  sigtrader::EngineConfig config;
  try {
    config = loadConfig(config_path, explicit_path);
  } catch (const sigtrader::ConfigError& e) {
    std::cerr << "[main] configuration error: " << e.what() << "\n";
    return 1;
  }

  sigtrader::LiveTimeProvider clock;

  sigtrader::PaperExecutionVenue venue(clock, config.paper_venue.balance);
  for (const auto& instrument : config.paper_venue.instruments) {
    venue.setInstrument(instrument);
    venue.setQuote(instrument.symbol, instrument.bid, instrument.ask);
  }

  std::unique_ptr<sigtrader::ISignalStore> store;
  try {
    if (config.store_path.empty()) {
      store = std::make_unique<sigtrader::InMemorySignalStore>();
    } else {
      store = std::make_unique<sigtrader::JsonFileSignalStore>(
          config.store_path, config.store_compact_every);
    }
  } catch (const sigtrader::domain::StoreUnavailable& e) {
    std::cerr << "[main] cannot open signal store: " << e.what() << "\n";
    return 1;
  }

  auto& registry = sigtrader::MessageSourceRegistry::instance();
  sigtrader::registerBuiltinSources(registry);

  std::signal(SIGINT, onSignal);
  std::signal(SIGTERM, onSignal);

  try {
    sigtrader::SignalEngine engine(config, *store, venue, clock, &registry);
    engine.start();

    std::cout << "[main] running. Press Ctrl-C to shut down.\n";
    while (!g_stop_requested.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "\n[main] shutdown requested. Stopping engine...\n";
    engine.stop();
  } catch (const std::exception& e) {
    std::cerr << "[main] fatal: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
