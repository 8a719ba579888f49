#include "sigtrader/engine/signal_engine.hpp"

#include "sigtrader/store/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <exception>
#include <iostream>
#include <utility>

namespace sigtrader {

namespace {

MonitorSettings monitorSettingsFrom(const EngineConfig& config) {
  MonitorSettings s;
  s.monitor = config.monitor;
  s.trailing = config.trailing;
  s.profit_saving = config.profit_saving;
  s.pending_expiry_minutes = config.orders.pending_expiry_minutes;
  s.call_timeout = config.venue.call_timeout;
  return s;
}

nlohmann::json ok() { return nlohmann::json{{"status", "ok"}}; }

nlohmann::json error(const std::string& message) {
  return nlohmann::json{{"status", "error"}, {"response", message}};
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: build every component; nothing runs yet
// -----------------------------------------------------------------------------
SignalEngine::SignalEngine(EngineConfig config, ISignalStore& store,
                           IExecutionVenue& venue, const ITimeProvider& clock,
                           MessageSourceRegistry* registry,
                           RetryPolicy::Sleeper sleeper)
    : config_(std::move(config)),
      store_(store),
      venue_(venue),
      clock_(clock),
      registry_(registry),
      resolver_(config_.parser.symbol_aliases),
      parser_(config_.parser, resolver_),
      classifier_(config_.commands, parser_),
      sizing_(config_.sizing),
      lanes_(config_.lanes) {
  LifecycleOptions options;
  options.take_profit_closes_open_positions =
      config_.orders.take_profit_closes_open_positions;
  options.cancel_pending_on_trail = config_.orders.cancel_pending_on_trail;

  lifecycle_ = std::make_unique<LifecycleStateMachine>(
      store_, venue_, sizing_,
      RetryPolicy(config_.venue.retry, config_.venue.call_timeout,
                  std::move(sleeper)),
      clock_, options,
      [this](const SignalUpdateEvent& e) { telemetry_bus_.publish(e); },
      [this](const RejectionEvent& e) { telemetry_bus_.publish(e); },
      [this](const std::string& what) {
        if (ingestion_) {
          ingestion_->halt("store unavailable: " + what);
        }
      });

  ingestion_ = std::make_unique<IngestionPipeline>(
      config_.filters, config_.commands, parser_, classifier_, store_, ids_,
      clock_,
      [this](domain::SignalId id, Event event) {
        lanes_.submit(id, std::move(event));
      },
      [this](const RejectionEvent& e) { telemetry_bus_.publish(e); });

  monitor_ = std::make_unique<PositionMonitor>(
      store_, venue_, clock_, monitorSettingsFrom(config_),
      [this](const MonitorActionEvent& e) {
        lanes_.submit(e.action.signal_id, e);
      });

  operator_api_ = std::make_unique<OperatorApi>(
      store_, parser_, clock_,
      [this](const domain::Command& c) { return submitCommand(c); },
      [this] { return venue_.accountState(config_.venue.call_timeout); });
  console_ = std::make_unique<ConsoleSessionManager>(
      *operator_api_, config_.parser.decimal_comma);
}

SignalEngine::~SignalEngine() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void SignalEngine::start() {
  if (started_) {
    return;
  }
  started_ = true;

  try {
    startComponents();
  } catch (const std::exception& e) {
    std::cerr << "[SignalEngine] start failed: " << e.what()
              << "; tearing down\n";
    teardown();
    throw;
  }

  running_ = true;
  std::cout << "[SignalEngine] started. Threads: ingestion, " << lanes_.size()
            << " lane(s), monitor" << (ipc_server_ ? ", ipc" : "") << ", "
            << sources_.size() << " source(s).\n";
}

void SignalEngine::startComponents() {
  // ---  1) Ids continue after the highest stored signal ---------------------
  ids_.reseed(store_.snapshot()->maxSignalId() + 1);

  // ---  2) Lanes run the lifecycle -----------------------------------------
  auto add = [this](std::vector<ScopedSubscription> handles) {
    for (auto& h : handles) {
      lane_subscriptions_.push_back(std::move(h));
    }
  };
  add(lanes_.subscribe<NewSignalEvent>(
      [this](const NewSignalEvent& e) { lifecycle_->onNewSignal(e); }));
  add(lanes_.subscribe<CommandEvent>(
      [this](const CommandEvent& e) { lifecycle_->onCommand(e); }));
  add(lanes_.subscribe<MonitorActionEvent>(
      [this](const MonitorActionEvent& e) { lifecycle_->onMonitorAction(e); }));
  lanes_.start();

  // ---  3) Ingestion loop --------------------------------------------------
  ingestion_->start();

  // ---  4+5) Synchronization gate -------------------------------------------
  const std::size_t reconciled = monitor_->runOnce();
  const std::size_t resumed = monitor_->recoverPending();
  std::cout << "[SignalEngine] Reconciliation complete: " << reconciled
            << " action(s), " << resumed << " pending signal(s) resumed.\n";

  // ---  6) Monitor, sources, IPC last ---------------------------------------
  monitor_->start();

  if (registry_ != nullptr) {
    for (const auto& source_config : config_.sources) {
      auto source = registry_->create(
          source_config,
          [this](const domain::MessageRecord& r, AckCallback ack) {
            return submitMessage(r, std::move(ack));
          });
      source->start();
      sources_.push_back(std::move(source));
    }
  }

  if (!config_.ipc.command_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.ipc.command_endpoint, config_.ipc.telemetry_endpoint);
    ipc_server_->start();

    telemetry_subscriptions_.emplace_back(
        telemetry_bus_,
        telemetry_bus_.subscribe<SignalUpdateEvent>(
            [this](const SignalUpdateEvent& e) {
              ipc_server_->pushTelemetry(e);
            }));
    telemetry_subscriptions_.emplace_back(
        telemetry_bus_,
        telemetry_bus_.subscribe<RejectionEvent>(
            [this](const RejectionEvent& e) { ipc_server_->pushTelemetry(e); }));
  }
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void SignalEngine::stop() {
  if (!started_) {
    return;
  }
  teardown();
  std::cout << "[SignalEngine] stopped. All threads joined.\n";
}

// Stops whatever start() got running, in reverse order. Every component
// stop is a no-op when that component never started.
void SignalEngine::teardown() {
  // ---  1) IPC before the components its handler queries -------------------
  telemetry_subscriptions_.clear();
  ipc_server_.reset();

  // ---  2) No more input ----------------------------------------------------
  for (auto& source : sources_) {
    source->stop();
  }
  sources_.clear();

  // ---  3) Monitor, then drain ingestion into the lanes, then the lanes -----
  monitor_->stop();
  ingestion_->stop();
  lanes_.stop();
  lane_subscriptions_.clear();

  running_ = false;
  started_ = false;
}

bool SignalEngine::submitMessage(const domain::MessageRecord& record,
                                 AckCallback ack) {
  return ingestion_->submitMessage(record, std::move(ack));
}

bool SignalEngine::submitCommand(const domain::Command& command,
                                 AckCallback ack) {
  return ingestion_->submitCommand(command, std::move(ack));
}

bool SignalEngine::resumeIngestion() {
  if (!store_.ping()) {
    std::cerr << "[SignalEngine] store still unavailable, ingestion stays "
                 "halted\n";
    return false;
  }
  ingestion_->resume();
  for (auto& source : sources_) {
    source->redeliver();
  }
  return true;
}

bool SignalEngine::ingestionHalted() const { return ingestion_->halted(); }

bool SignalEngine::waitIdle(std::chrono::milliseconds timeout) {
  for (int round = 0; round < 2; ++round) {
    if (!ingestion_->waitIdle(timeout) || !lanes_.waitIdle(timeout)) {
      return false;
    }
  }
  return true;
}

// -----------------------------------------------------------------------------
// executeCommand(): IPC requests
// -----------------------------------------------------------------------------
std::string SignalEngine::executeCommand(const std::string& request) {
  if (request == "PING") {
    nlohmann::json response = ok();
    response["response"] = "PONG";
    return response.dump();
  }
  if (request == "STATUS") {
    return handleJsonRequest(R"({"op":"status"})");
  }
  return handleJsonRequest(request);
}

std::string SignalEngine::handleJsonRequest(const std::string& request) {
  nlohmann::json req;
  try {
    req = nlohmann::json::parse(request);
  } catch (const nlohmann::json::exception&) {
    return error("Unknown command: " + request).dump();
  }

  try {
    const std::string op = req.at("op").get<std::string>();
    nlohmann::json response = ok();
    auto snap = store_.snapshot();

    if (op == "ping") {
      response["response"] = "PONG";
    } else if (op == "status") {
      response["running"] = running_;
      response["halted"] = ingestion_->halted();
      response["lanes"] = lanes_.size();
      response["store_version"] = snap->version;
      response["active_signals"] = snap->activeSignals().size();
      response["open_positions"] = snap->openPositions().size();
    } else if (op == "signals") {
      response["signals"] = operator_api_->listActiveSignals();
    } else if (op == "positions") {
      response["positions"] = operator_api_->listOpenPositions();
    } else if (op == "history") {
      const auto limit = req.value("limit", std::size_t{20});
      response["history"] = operator_api_->signalHistory(limit);
    } else if (op == "command") {
      const auto kind = domain::parseCommandKind(req.at("kind").get<std::string>());
      if (!kind) {
        return error("unknown command kind").dump();
      }
      const std::string who = req.value("operator", std::string("ipc"));
      const auto target = req.at("signal_id").get<domain::SignalId>();
      bool accepted = false;
      if (*kind == domain::CommandKind::CloseVolume) {
        const double volume = req.at("volume").get<double>();
        if (!(volume > 0.0)) {
          return error("volume must be positive").dump();
        }
        accepted = operator_api_->closeVolume(
            who, target, req.at("ticket").get<domain::TicketId>(), volume);
      } else {
        std::optional<double> sl;
        if (req.contains("sl")) {
          sl = req.at("sl").get<double>();
        }
        std::vector<double> tps = req.value("tps", std::vector<double>{});
        accepted = operator_api_->issueCommand(who, target, *kind, sl,
                                               std::move(tps));
      }
      if (!accepted) {
        return error("ingestion halted").dump();
      }
      response["response"] = "submitted";
    } else if (op == "report") {
      response["report"] =
          operator_api_->channelReport(req.at("channel").get<std::string>());
    } else if (op == "compare") {
      response["channels"] = operator_api_->compareChannels(
          req.value("min_positions", std::size_t{1}));
    } else if (op == "summary") {
      const TradeSummary summary = operator_api_->tradeSummary();
      nlohmann::json j{{"realized_profit", summary.realized_profit},
                       {"active_signals", summary.active_signals},
                       {"open_positions", summary.open_positions},
                       {"pending_orders", summary.pending_orders}};
      if (summary.account) {
        j["balance"] = summary.account->balance;
        j["equity"] = summary.account->equity;
        j["margin"] = summary.account->margin;
        j["free_margin"] = summary.account->freeMargin();
        j["floating_profit"] = summary.floating_profit;
        j["floating_profit_pct"] = summary.floating_profit_pct;
      }
      response["summary"] = std::move(j);
    } else if (op == "console") {
      ConsoleReply reply = console_->handle(req.at("user").get<std::string>(),
                                            req.at("input").get<std::string>());
      response["ok"] = reply.ok;
      response["text"] = reply.text;
      response["state"] = toString(reply.state);
    } else if (op == "halt") {
      ingestion_->halt("operator request");
      response["response"] = "Ingestion halted";
    } else if (op == "resume") {
      if (!resumeIngestion()) {
        return error("store unavailable").dump();
      }
      response["response"] = "Ingestion resumed";
    } else {
      return error("Unknown op: " + op).dump();
    }
    return response.dump();
  } catch (const nlohmann::json::exception& e) {
    return error(std::string("bad request: ") + e.what()).dump();
  }
}

}  // namespace sigtrader
