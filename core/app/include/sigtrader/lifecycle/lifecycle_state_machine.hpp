#pragma once

#include "sigtrader/events/event.hpp"
#include "sigtrader/lifecycle/retry_policy.hpp"
#include "sigtrader/risk/sizing_calculator.hpp"
#include "sigtrader/store/i_signal_store.hpp"
#include "sigtrader/time/i_time_provider.hpp"
#include "sigtrader/venue/i_execution_venue.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace sigtrader {

struct LifecycleOptions {
  bool take_profit_closes_open_positions{false};
  bool cancel_pending_on_trail{true};
};

// -----------------------------------------------------------------------------
// LifecycleStateMachine
// -----------------------------------------------------------------------------
//
// @brief  The only component that mutates signals and tickets. Drives venue
//         calls for new signals, commands and monitor actions and records
//         every status transition.
//
// @details
// Handlers run on the lane that owns the signal, so two handlers for the
// same signal never overlap. Handlers for different signals run
// concurrently; the store and the venue are the only shared state.
//
// Acknowledgement: a NewSignalEvent is acked right after the Pending signal
// is durable; a CommandEvent once the command has been applied (or
// deliberately ignored). When the store throws StoreUnavailable the
// handler stops, nothing is acked and the StoreFailureSink is told so the
// engine can halt ingestion.
//
// Venue failures: command and placement calls go through RetryPolicy and
// an exhausted call moves the signal to Error. Monitor actions make a
// single attempt; the next monitor tick tries again.
//
// Thread-safety: handlers may be called from several lanes at once.
// Ownership: borrows store, venue, sizing and clock; all must outlive it.
// -----------------------------------------------------------------------------
class LifecycleStateMachine {
 public:
  using UpdateSink = std::function<void(const SignalUpdateEvent&)>;
  using RejectionSink = std::function<void(const RejectionEvent&)>;
  using StoreFailureSink = std::function<void(const std::string&)>;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @brief  Binds the state machine to its store, venue and sizing rules.
  //
  // @param  store             Source of truth for signals and tickets.
  // @param  venue             Where orders are placed, modified and closed.
  // @param  sizing            Turns a signal into one order per entry leg.
  // @param  retry             Attempt budget for command and placement calls.
  // @param  clock             Stamps tickets and history rows.
  // @param  options           Take-profit and trailing switches.
  // @param  on_update         Told about every status change (may be empty).
  // @param  on_rejection      Told about every rejected signal or command.
  // @param  on_store_failure  Told when the store becomes unavailable.
  //
  // Side-effects: none; no venue or store call happens until a handler runs.
  // -------------------------------------------------------------------------
  LifecycleStateMachine(ISignalStore& store, IExecutionVenue& venue,
                        const SizingCalculator& sizing, RetryPolicy retry,
                        const ITimeProvider& clock, LifecycleOptions options,
                        UpdateSink on_update = {},
                        RejectionSink on_rejection = {},
                        StoreFailureSink on_store_failure = {});

  LifecycleStateMachine(const LifecycleStateMachine&) = delete;
  LifecycleStateMachine& operator=(const LifecycleStateMachine&) = delete;
  LifecycleStateMachine(LifecycleStateMachine&&) = delete;
  LifecycleStateMachine& operator=(LifecycleStateMachine&&) = delete;

  // -------------------------------------------------------------------------
  // onNewSignal(event)
  // -------------------------------------------------------------------------
  //
  // @brief  Persists a freshly parsed signal and places its entry orders.
  //
  // @param  event  The parsed signal plus the message key it came from and
  //                the ack callback of the source record.
  //
  // @details
  // Steps, in order:
  //   1. A key the store already processed is a replay: ack and return.
  //   2. createSignal() stores the signal as Pending and binds the key.
  //   3. Ack. From here a crash is recovered by the startup gate.
  //   4. Size against accountState() and instrumentInfo(). A SizingRejected
  //      moves the signal to Error and publishes a RejectionEvent.
  //   5. placeOrder() per leg through RetryPolicy; each placed leg is saved
  //      as a ticket before the next is sent.
  //   6. Open when at least one leg was placed, keeping the failures of the
  //      others in last_error; Error when none was.
  //
  // Throws: nothing. StoreUnavailable is reported through the
  //         StoreFailureSink and leaves the event unacked.
  // -------------------------------------------------------------------------
  void onNewSignal(const NewSignalEvent& event);

  // -------------------------------------------------------------------------
  // onCommand(event)
  // -------------------------------------------------------------------------
  //
  // @brief  Applies an operator or reply command to its target signal.
  //
  // @details
  // The source key is marked processed before anything else, so a command
  // is never applied twice. A command that does not apply to the signal's
  // current status (StatusRules) is acked without effect. Delete
  // cancels every order and closes every position. RiskFree moves stops to
  // the entry. HalfClose closes half of each position. TakeProfitNow closes
  // at market. Edit replaces stop or targets. CloseVolume closes a chosen
  // number of lots of one position.
  //
  // Venue failures collected by the handler move the signal to Error with
  // the failure text; otherwise the status is re-derived from the tickets.
  // -------------------------------------------------------------------------
  void onCommand(const CommandEvent& event);

  // -------------------------------------------------------------------------
  // onMonitorAction(event)
  // -------------------------------------------------------------------------
  //
  // @brief  Applies one PositionMonitor finding to the stored ticket.
  //
  // @details
  // The action was decided on an older snapshot, so the ticket is reloaded
  // and the action dropped when it no longer fits, for example a profit
  // step that was consumed meanwhile. Monitor-driven venue calls make a
  // single attempt.
  // -------------------------------------------------------------------------
  void onMonitorAction(const MonitorActionEvent& event);

 private:
  // --- new signals -----------------------------------------------------------
  void placeSignal(domain::Signal signal);

  // --- commands; each appends venue failures to `failure` --------------------
  bool applyDelete(const domain::Signal& signal, std::string& failure);
  void applyRiskFree(const domain::Signal& signal, std::string& failure);
  void applyHalfClose(const domain::Signal& signal, std::string& failure);
  bool applyTakeProfitNow(const domain::Signal& signal, std::string& failure);
  bool applyEdit(const domain::Signal& signal, const domain::Command& command,
                 std::string& failure);
  void applyCloseVolume(const domain::Signal& signal,
                        const domain::Command& command, std::string& failure);

  // Cancels one order or fully closes one position through RetryPolicy.
  // A NotFound answer means the venue already dropped it.
  void closeTicket(domain::Ticket ticket, const std::string& reason,
                   std::string& failure);

  // --- monitor actions -------------------------------------------------------
  void syncFill(domain::Ticket ticket, const MonitorAction& action);
  void syncVolume(domain::Ticket ticket, const MonitorAction& action);
  void closedAtVenue(domain::Ticket ticket);
  void trailStop(domain::Ticket ticket, const MonitorAction& action);
  void saveProfit(domain::Ticket ticket, const MonitorAction& action);
  void expireOrder(domain::Ticket ticket);
  void cancelPendingOrders(domain::SignalId id, const std::string& reason);

  // --- status bookkeeping ----------------------------------------------------
  // Saves `signal` with status `to`; records a history row when the status
  // changes. Illegal transitions are logged and skipped.
  bool transition(domain::Signal signal, domain::SignalStatus to,
                  const std::string& reason);
  // Re-derives the status from the stored tickets.
  void refreshStatus(domain::SignalId id, const std::string& reason,
                     bool command_succeeded);
  void markError(domain::SignalId id, const std::string& error);

  std::optional<domain::Signal> loadSignal(domain::SignalId id) const;
  std::vector<domain::Ticket> activeTicketsOf(domain::SignalId id) const;
  // Stamps updated_at_ms, and closed_at_ms on the first inactive save.
  void saveTicket(domain::Ticket ticket);
  // Profit of closing `volume` of `ticket` at the current quote; 0 when the
  // venue cannot price it.
  double estimateExitProfit(const domain::Ticket& ticket, double volume) const;

  void publishUpdate(const domain::Signal& signal,
                     domain::SignalStatus previous, const std::string& reason);
  void reject(RejectionStage stage, const std::string& reason,
              const domain::MessageKey& source, domain::SignalId id);
  void storeFailed(const std::string& what);

  ISignalStore& store_;
  IExecutionVenue& venue_;
  const SizingCalculator& sizing_;
  RetryPolicy retry_;
  const ITimeProvider& clock_;
  LifecycleOptions options_;
  UpdateSink on_update_;
  RejectionSink on_rejection_;
  StoreFailureSink on_store_failure_;
};

}  // namespace sigtrader
