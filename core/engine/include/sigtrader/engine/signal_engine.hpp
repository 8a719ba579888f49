#pragma once

#include "sigtrader/command/command_classifier.hpp"
#include "sigtrader/concurrent/signal_id_generator.hpp"
#include "sigtrader/concurrent/signal_lanes.hpp"
#include "sigtrader/config/engine_config.hpp"
#include "sigtrader/console/console_session.hpp"
#include "sigtrader/console/operator_api.hpp"
#include "sigtrader/eventbus/event_bus.hpp"
#include "sigtrader/ingestion/ingestion_pipeline.hpp"
#include "sigtrader/lifecycle/lifecycle_state_machine.hpp"
#include "sigtrader/lifecycle/retry_policy.hpp"
#include "sigtrader/monitor/position_monitor.hpp"
#include "sigtrader/network/ipc_server.hpp"
#include "sigtrader/parser/signal_parser.hpp"
#include "sigtrader/parser/symbol_resolver.hpp"
#include "sigtrader/risk/sizing_calculator.hpp"
#include "sigtrader/source/message_source_registry.hpp"
#include "sigtrader/store/i_signal_store.hpp"
#include "sigtrader/time/i_time_provider.hpp"
#include "sigtrader/venue/i_execution_venue.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace sigtrader {

// -----------------------------------------------------------------------------
// SignalEngine - top-level orchestrator
// -----------------------------------------------------------------------------
//
// @brief  Owns every thread and component of one signal-trading engine and
//         wires them together.
//
// @details
// Threads:
//   ingestion    IngestionPipeline loop (filter, parse, classify, route)
//   lane-0..N-1  SignalLanes running the LifecycleStateMachine; a signal id
//                always maps to the same lane
//   monitor      PositionMonitor timer
//   ipc          IpcServer (only with ipc.command_endpoint set)
//   one per configured message source
//
// Event flow:
//   source -> submitMessage -> ingestion -> lanes.submit(id)
//          -> lifecycle -> store + venue -> telemetry bus -> IPC PUB
//   monitor -> lanes.submit(id) -> lifecycle
//
// Telemetry bus: SignalUpdateEvent and RejectionEvent are published
// synchronously on the thread that produced them (a lane or the ingestion
// loop). Subscribers must be thread-safe and quick.
//
// Ownership: borrows the store, the venue, the clock and the registry;
// all must outlive the engine. Everything else is owned.
// -----------------------------------------------------------------------------
class SignalEngine {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @param  config    Immutable engine configuration.
  // @param  store     Signal store; its contents survive restarts when it is
  //                   a JsonFileSignalStore.
  // @param  venue     Execution venue.
  // @param  clock     Time source for history rows, expiry and the trading
  //                   window.
  // @param  registry  Source factories; nullptr starts no message source
  //                   (tests submit records directly).
  // @param  sleeper   Backoff sleeper for RetryPolicy; empty uses
  //                   std::this_thread::sleep_for.
  //
  // @throws ConfigError if a parser pattern does not compile.
  // Side-effects: none; no thread is started.
  // -------------------------------------------------------------------------
  SignalEngine(EngineConfig config, ISignalStore& store,
               IExecutionVenue& venue, const ITimeProvider& clock,
               MessageSourceRegistry* registry = nullptr,
               RetryPolicy::Sleeper sleeper = {});

  ~SignalEngine();

  SignalEngine(const SignalEngine&) = delete;
  SignalEngine& operator=(const SignalEngine&) = delete;
  SignalEngine(SignalEngine&&) = delete;
  SignalEngine& operator=(SignalEngine&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  //
  // @brief  Synchronization gate followed by thread start-up.
  //
  // @details
  // 1. Reseed the signal id generator past the store's highest id.
  // 2. Subscribe the lifecycle to the lanes, start the lanes.
  // 3. Start the ingestion loop.
  // 4. One synchronous monitor pass reconciles stored tickets with the
  //    venue.
  // 5. Resume placement of Pending signals without tickets.
  // 6. Start the monitor thread, the message sources, then the IPC server.
  //
  // If any step throws, everything already started is stopped again before
  // the exception propagates; the engine is left stopped and may be
  // started again.
  //
  // Idempotent. Call from the owning thread.
  // @throws ConfigError for an unknown source type.
  // -------------------------------------------------------------------------
  void start();

  // Reverse order of start(). Idempotent.
  void stop();

  bool running() const { return running_; }

  // @return false while ingestion is halted or the engine is stopped.
  bool submitMessage(const domain::MessageRecord& record, AckCallback ack = {});
  bool submitCommand(const domain::Command& command, AckCallback ack = {});

  // -------------------------------------------------------------------------
  // executeCommand(request)
  // -------------------------------------------------------------------------
  // Handles one IPC request: "PING", "STATUS", or a JSON object whose "op"
  // is ping | status | signals | positions | history | command | report |
  // compare | summary | console | halt | resume. Always answers with a JSON
  // object carrying "status": "ok" or "error".
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& request);

  // Resumes ingestion after a store failure once store.ping() succeeds,
  // then asks every source to redeliver its unacked records.
  bool resumeIngestion();
  bool ingestionHalted() const;

  // Waits until the ingestion loop and every lane are idle. Two rounds,
  // since ingestion feeds the lanes.
  bool waitIdle(std::chrono::milliseconds timeout);

  EventBus& telemetryBus() { return telemetry_bus_; }
  OperatorApi& operatorApi() { return *operator_api_; }
  ConsoleSessionManager& console() { return *console_; }
  PositionMonitor& monitor() { return *monitor_; }
  const SignalParser& parser() const { return parser_; }
  const EngineConfig& config() const { return config_; }

 private:
  void startComponents();
  void teardown();
  std::string handleJsonRequest(const std::string& request);

  EngineConfig config_;
  ISignalStore& store_;
  IExecutionVenue& venue_;
  const ITimeProvider& clock_;
  MessageSourceRegistry* registry_;

  AliasSymbolResolver resolver_;
  SignalParser parser_;
  CommandClassifier classifier_;
  SizingCalculator sizing_;
  SignalIdGenerator ids_;
  EventBus telemetry_bus_;
  SignalLanes lanes_;

  std::unique_ptr<LifecycleStateMachine> lifecycle_;
  std::unique_ptr<IngestionPipeline> ingestion_;
  std::unique_ptr<PositionMonitor> monitor_;
  std::unique_ptr<OperatorApi> operator_api_;
  std::unique_ptr<ConsoleSessionManager> console_;
  std::unique_ptr<IpcServer> ipc_server_;
  std::vector<std::unique_ptr<IMessageSource>> sources_;

  std::vector<ScopedSubscription> lane_subscriptions_;
  std::vector<ScopedSubscription> telemetry_subscriptions_;
  bool started_{false};
  bool running_{false};
};

}  // namespace sigtrader
