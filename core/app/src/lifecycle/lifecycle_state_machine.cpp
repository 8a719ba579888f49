#include "sigtrader/lifecycle/lifecycle_state_machine.hpp"

#include "sigtrader/lifecycle/status_rules.hpp"
#include "sigtrader/parser/level_rules.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace sigtrader {

using domain::Command;
using domain::CommandKind;
using domain::Signal;
using domain::SignalStatus;
using domain::Ticket;
using domain::TicketState;
using domain::VenueCallFailed;
using domain::VenueError;
using domain::VenueErrorKind;

namespace {

constexpr double kVolumeEpsilon = 1e-9;

void appendFailure(std::string& failure, const std::string& what) {
  if (!failure.empty()) {
    failure += "; ";
  }
  failure += what;
}

}  // namespace

LifecycleStateMachine::LifecycleStateMachine(
    ISignalStore& store, IExecutionVenue& venue, const SizingCalculator& sizing,
    RetryPolicy retry, const ITimeProvider& clock, LifecycleOptions options,
    UpdateSink on_update, RejectionSink on_rejection,
    StoreFailureSink on_store_failure)
    : store_(store),
      venue_(venue),
      sizing_(sizing),
      retry_(std::move(retry)),
      clock_(clock),
      options_(options),
      on_update_(std::move(on_update)),
      on_rejection_(std::move(on_rejection)),
      on_store_failure_(std::move(on_store_failure)) {}

// -----------------------------------------------------------------------------
// onNewSignal
// -----------------------------------------------------------------------------
// processed? -> ack only. Otherwise persist Pending, ack, then size and
// place. Placement failures never un-ack the message: the signal is in the
// store and its status tells the story.
// -----------------------------------------------------------------------------
void LifecycleStateMachine::onNewSignal(const NewSignalEvent& event) {
  try {
    if (store_.snapshot()->isProcessed(event.key)) {
      std::cout << "[Lifecycle] duplicate " << event.key.str() << " ignored\n";
      if (event.ack) {
        event.ack();
      }
      return;
    }

    Signal signal = event.signal;
    const auto now = clock_.now_ms();
    signal.status = SignalStatus::Pending;
    signal.created_at_ms = now;
    signal.updated_at_ms = now;
    store_.createSignal(signal, event.key);
    std::cout << "[Lifecycle] signal " << signal.id << " " << signal.symbol
              << " " << toString(signal.direction) << " created from "
              << event.key.str() << "\n";
    publishUpdate(signal, SignalStatus::Pending, "created");

    if (event.ack) {
      event.ack();
    }
    placeSignal(std::move(signal));
  } catch (const domain::StoreUnavailable& e) {
    storeFailed(e.what());
  }
}

void LifecycleStateMachine::placeSignal(Signal signal) {
  domain::AccountState account;
  domain::InstrumentInfo instrument;
  try {
    account = retry_.run("accountState", [this](std::chrono::milliseconds t) {
      return venue_.accountState(t);
    });
    instrument = retry_.run(
        "instrumentInfo", [this, &signal](std::chrono::milliseconds t) {
          return venue_.instrumentInfo(signal.symbol, t);
        });
  } catch (const VenueCallFailed& e) {
    signal.last_error = e.what();
    transition(std::move(signal), SignalStatus::Error, "venue_call_failed");
    return;
  }

  SizingOutcome outcome = sizing_.size(signal, account, instrument);
  if (const auto* rejected = std::get_if<domain::SizingRejected>(&outcome)) {
    const std::string reason = std::string("sizing_rejected(") +
                               domain::toString(rejected->kind) + ")";
    std::cerr << "[Lifecycle] signal " << signal.id << " " << reason << ": "
              << rejected->detail << "\n";
    reject(RejectionStage::Sizing, reason, signal.source, signal.id);
    signal.last_error = reason + ": " + rejected->detail;
    transition(std::move(signal), SignalStatus::Error, reason);
    return;
  }

  const auto& orders = std::get<std::vector<domain::OrderParams>>(outcome);
  std::size_t placed = 0;
  std::string failure;
  for (const auto& params : orders) {
    try {
      domain::VenueTicket vt = retry_.run(
          "placeOrder", [this, &params](std::chrono::milliseconds t) {
            return venue_.placeOrder(params, t);
          });
      Ticket ticket;
      ticket.id = vt.id;
      ticket.signal_id = signal.id;
      ticket.leg = params.leg;
      ticket.symbol = vt.symbol;
      ticket.direction = vt.direction;
      ticket.volume = vt.volume;
      ticket.initial_volume = vt.volume;
      ticket.open_price = vt.open_price;
      ticket.stop_loss = vt.stop_loss;
      ticket.take_profit = vt.take_profit;
      ticket.kind = vt.kind;
      ticket.filled = vt.kind == domain::TicketKind::Position;
      ticket.placed_at_ms = clock_.now_ms();
      ticket.updated_at_ms = ticket.placed_at_ms;
      saveTicket(ticket);
      ++placed;
      std::cout << "[Lifecycle] signal " << signal.id << " leg " << params.leg
                << " " << toString(params.type) << " " << params.volume
                << " -> ticket " << vt.id << "\n";
    } catch (const VenueCallFailed& e) {
      std::cerr << "[Lifecycle] signal " << signal.id << " leg " << params.leg
                << " " << e.what() << "\n";
      appendFailure(failure, e.what());
    }
  }

  if (placed == 0) {
    signal.last_error = failure;
    transition(std::move(signal), SignalStatus::Error, "placement_failed");
    return;
  }
  signal.last_error = failure;
  transition(std::move(signal), SignalStatus::Open,
             "placed " + std::to_string(placed) + "/" +
                 std::to_string(orders.size()) + " legs");
}

// -----------------------------------------------------------------------------
// onCommand
// -----------------------------------------------------------------------------
void LifecycleStateMachine::onCommand(const CommandEvent& event) {
  const Command& command = event.command;
  try {
    auto snap = store_.snapshot();
    if (snap->isProcessed(command.source)) {
      std::cout << "[Lifecycle] duplicate command " << command.source.str()
                << " ignored\n";
      if (event.ack) {
        event.ack();
      }
      return;
    }

    const Signal* stored = snap->findSignal(command.target);
    if (stored == nullptr) {
      reject(RejectionStage::Target, "unknown_signal", command.source,
             command.target);
      store_.markProcessed(command.source, 0);
      if (event.ack) {
        event.ack();
      }
      return;
    }
    const Signal signal = *stored;

    // Marked first: a crash mid-way never applies the command twice.
    store_.markProcessed(command.source, signal.id);

    if (!StatusRules::commandApplies(command.kind, signal.status)) {
      std::cout << "[Lifecycle] " << toString(command.kind)
                << " ignored for signal " << signal.id << " in status "
                << toString(signal.status) << "\n";
      if (event.ack) {
        event.ack();
      }
      return;
    }

    std::cout << "[Lifecycle] " << toString(command.kind) << " ("
              << toString(command.origin) << ") on signal " << signal.id
              << "\n";

    std::string failure;
    bool refresh = true;
    switch (command.kind) {
      case CommandKind::Delete:
        refresh = applyDelete(signal, failure);
        break;
      case CommandKind::RiskFree:
        applyRiskFree(signal, failure);
        break;
      case CommandKind::HalfClose:
        applyHalfClose(signal, failure);
        break;
      case CommandKind::TakeProfitNow:
        refresh = applyTakeProfitNow(signal, failure);
        break;
      case CommandKind::Edit:
        refresh = applyEdit(signal, command, failure);
        break;
      case CommandKind::CloseVolume:
        applyCloseVolume(signal, command, failure);
        break;
    }

    const std::string reason =
        std::string(toString(command.kind)) + " via " + toString(command.origin);
    if (refresh) {
      refreshStatus(signal.id, reason, failure.empty());
    }
    if (!failure.empty()) {
      markError(signal.id, failure);
    }
    if (event.ack) {
      event.ack();
    }
  } catch (const domain::StoreUnavailable& e) {
    storeFailed(e.what());
  }
}

// Returns false when the signal was cancelled outright (nothing to derive).
bool LifecycleStateMachine::applyDelete(const Signal& signal,
                                        std::string& failure) {
  const auto tickets = store_.snapshot()->ticketsFor(signal.id);
  if (tickets.empty()) {
    transition(signal, SignalStatus::Cancelled, "deleted before placement");
    return false;
  }
  for (const auto& t : tickets) {
    if (t.isActive()) {
      closeTicket(t, "delete", failure);
    }
  }
  return true;
}

void LifecycleStateMachine::closeTicket(Ticket ticket, const std::string& reason,
                                        std::string& failure) {
  const bool pending = ticket.isPendingOrder();
  try {
    if (pending) {
      retry_.run("cancelOrder", [this, &ticket](std::chrono::milliseconds t) {
        venue_.cancelOrder(ticket.id, t);
      });
    } else {
      ticket.realized_profit += retry_.run(
          "closePartial", [this, &ticket](std::chrono::milliseconds t) {
            return venue_.closePartial(ticket.id, ticket.volume, t);
          });
    }
  } catch (const VenueCallFailed& e) {
    if (e.lastKind() != VenueErrorKind::NotFound) {
      std::cerr << "[Lifecycle] ticket " << ticket.id << " " << reason << ": "
                << e.what() << "\n";
      appendFailure(failure, e.what());
      return;
    }
    std::cout << "[Lifecycle] ticket " << ticket.id
              << " already gone at venue\n";
    if (!pending) {
      ticket.realized_profit += estimateExitProfit(ticket, ticket.volume);
    }
  }
  if (pending) {
    ticket.state = TicketState::Cancelled;
  } else {
    ticket.volume = 0.0;
    ticket.state = TicketState::Closed;
  }
  saveTicket(std::move(ticket));
}

void LifecycleStateMachine::applyRiskFree(const Signal& signal,
                                          std::string& failure) {
  for (auto t : activeTicketsOf(signal.id)) {
    if (!t.isOpenPosition()) {
      continue;
    }
    const double target = t.open_price;
    if (t.stop_loss &&
        !domain::improvesStop(t.direction, target, *t.stop_loss)) {
      std::cout << "[Lifecycle] ticket " << t.id
                << " stop already at or beyond entry\n";
      continue;
    }
    try {
      retry_.run("modify", [this, &t, target](std::chrono::milliseconds ms) {
        venue_.modify(t.id, target, std::nullopt, ms);
      });
      t.stop_loss = target;
      saveTicket(t);
    } catch (const VenueCallFailed& e) {
      appendFailure(failure, e.what());
    }
  }
}

void LifecycleStateMachine::applyHalfClose(const Signal& signal,
                                           std::string& failure) {
  domain::InstrumentInfo info;
  try {
    info = retry_.run("instrumentInfo",
                      [this, &signal](std::chrono::milliseconds t) {
                        return venue_.instrumentInfo(signal.symbol, t);
                      });
  } catch (const VenueCallFailed& e) {
    appendFailure(failure, e.what());
    return;
  }

  for (auto t : activeTicketsOf(signal.id)) {
    if (!t.isOpenPosition()) {
      continue;
    }
    const double half = SizingCalculator::floorToStep(t.volume / 2.0,
                                                      info.volume_step);
    if (half <= 0.0 || half + kVolumeEpsilon < info.min_volume) {
      std::cout << "[Lifecycle] ticket " << t.id << " volume " << t.volume
                << " too small to halve, skipped\n";
      continue;
    }
    try {
      t.realized_profit += retry_.run(
          "closePartial", [this, &t, half](std::chrono::milliseconds ms) {
            return venue_.closePartial(t.id, half, ms);
          });
      t.volume -= half;
      if (t.volume <= kVolumeEpsilon) {
        t.volume = 0.0;
        t.state = TicketState::Closed;
      }
      saveTicket(t);
    } catch (const VenueCallFailed& e) {
      appendFailure(failure, e.what());
    }
  }
}

bool LifecycleStateMachine::applyTakeProfitNow(const Signal& signal,
                                               std::string& failure) {
  const auto tickets = activeTicketsOf(signal.id);
  bool any_position = false;
  for (const auto& t : tickets) {
    any_position = any_position || t.isOpenPosition();
  }

  if (any_position && !options_.take_profit_closes_open_positions) {
    std::cout << "[Lifecycle] signal " << signal.id
              << " has open positions; take-profit left to the venue\n";
    return false;
  }
  for (const auto& t : tickets) {
    if (t.isPendingOrder() || options_.take_profit_closes_open_positions) {
      closeTicket(t, "take-profit", failure);
    }
  }
  return true;
}

bool LifecycleStateMachine::applyEdit(const Signal& signal,
                                      const Command& command,
                                      std::string& failure) {
  Signal updated = signal;
  if (command.new_stop_loss) {
    updated.stop_loss = command.new_stop_loss;
  }
  if (!command.new_take_profits.empty()) {
    updated.take_profits =
        canonicalTakeProfits(signal.direction, command.new_take_profits);
  }
  if (auto invalid = validateLevels(updated.direction, updated.entries,
                                    updated.stop_loss, updated.take_profits)) {
    std::cerr << "[Lifecycle] edit of signal " << signal.id
              << " rejected: invalid_levels(" << *invalid << ")\n";
    reject(RejectionStage::Classify, "invalid_levels(" + *invalid + ")",
           command.source, signal.id);
    return false;
  }

  updated.updated_at_ms = clock_.now_ms();
  store_.saveSignal(updated, std::nullopt);

  const auto final_tp = updated.finalTakeProfit();
  for (auto t : activeTicketsOf(signal.id)) {
    try {
      retry_.run("modify", [this, &t, &updated, &final_tp](
                               std::chrono::milliseconds ms) {
        venue_.modify(t.id, updated.stop_loss, final_tp, ms);
      });
      if (updated.stop_loss) {
        t.stop_loss = updated.stop_loss;
      }
      if (final_tp) {
        t.take_profit = final_tp;
      }
      saveTicket(t);
    } catch (const VenueCallFailed& e) {
      appendFailure(failure, e.what());
    }
  }
  publishUpdate(updated, signal.status, "levels edited");
  return true;
}

// Closes an operator-chosen volume of one position. The volume is floored
// to the instrument step; a remainder below the minimum volume is closed too.
void LifecycleStateMachine::applyCloseVolume(const Signal& signal,
                                             const Command& command,
                                             std::string& failure) {
  std::optional<Ticket> target;
  for (auto& t : activeTicketsOf(signal.id)) {
    if (t.id == command.ticket_id && t.isOpenPosition()) {
      target = std::move(t);
    }
  }
  if (!target) {
    std::cerr << "[Lifecycle] close of " << command.volume << " on ticket "
              << command.ticket_id << " rejected: not an open position of "
              << "signal " << signal.id << "\n";
    reject(RejectionStage::Target, "unknown_ticket", command.source, signal.id);
    return;
  }

  domain::InstrumentInfo info;
  try {
    info = retry_.run("instrumentInfo",
                      [this, &signal](std::chrono::milliseconds t) {
                        return venue_.instrumentInfo(signal.symbol, t);
                      });
  } catch (const VenueCallFailed& e) {
    appendFailure(failure, e.what());
    return;
  }

  Ticket& t = *target;
  double volume = SizingCalculator::floorToStep(
      std::min(command.volume, t.volume), info.volume_step);
  if (volume <= 0.0 || volume + kVolumeEpsilon < info.min_volume) {
    std::cerr << "[Lifecycle] close of " << command.volume << " on ticket "
              << t.id << " rejected: below minimum volume\n";
    reject(RejectionStage::Sizing, "volume_below_minimum", command.source,
           signal.id);
    return;
  }
  const double remaining = t.volume - volume;
  if (remaining > kVolumeEpsilon && remaining + kVolumeEpsilon < info.min_volume) {
    volume = t.volume;
  }

  try {
    t.realized_profit += retry_.run(
        "closePartial", [this, &t, volume](std::chrono::milliseconds ms) {
          return venue_.closePartial(t.id, volume, ms);
        });
  } catch (const VenueCallFailed& e) {
    appendFailure(failure, e.what());
    return;
  }
  std::cout << "[Lifecycle] ticket " << t.id << " closed " << volume
            << " of " << t.volume << " on operator request\n";
  t.volume -= volume;
  if (t.volume <= kVolumeEpsilon) {
    t.volume = 0.0;
    t.state = TicketState::Closed;
  }
  saveTicket(t);
}

// -----------------------------------------------------------------------------
// onMonitorAction
// -----------------------------------------------------------------------------
// The action was computed from an older snapshot; every handler re-reads
// the ticket and drops the action when it no longer applies.
// -----------------------------------------------------------------------------
void LifecycleStateMachine::onMonitorAction(const MonitorActionEvent& event) {
  const MonitorAction& action = event.action;
  try {
    auto snap = store_.snapshot();

    if (action.kind == MonitorActionKind::ResumePlacement) {
      const Signal* signal = snap->findSignal(action.signal_id);
      if (signal != nullptr && signal->status == SignalStatus::Pending &&
          snap->ticketsFor(signal->id).empty()) {
        std::cout << "[Lifecycle] resuming placement of signal " << signal->id
                  << "\n";
        placeSignal(*signal);
      }
      return;
    }

    const Ticket* stored = snap->findTicket(action.ticket_id);
    if (stored == nullptr || !stored->isActive()) {
      return;
    }
    Ticket ticket = *stored;

    switch (action.kind) {
      case MonitorActionKind::SyncFill:
        syncFill(std::move(ticket), action);
        break;
      case MonitorActionKind::SyncVolume:
        syncVolume(std::move(ticket), action);
        break;
      case MonitorActionKind::ClosedAtVenue:
        closedAtVenue(std::move(ticket));
        break;
      case MonitorActionKind::TrailStop:
        trailStop(std::move(ticket), action);
        break;
      case MonitorActionKind::SaveProfit:
        saveProfit(std::move(ticket), action);
        break;
      case MonitorActionKind::ExpireOrder:
        expireOrder(std::move(ticket));
        break;
      case MonitorActionKind::ResumePlacement:
        break;
    }
  } catch (const domain::StoreUnavailable& e) {
    storeFailed(e.what());
  }
}

void LifecycleStateMachine::syncFill(Ticket ticket, const MonitorAction& action) {
  if (!ticket.isPendingOrder()) {
    return;
  }
  ticket.kind = domain::TicketKind::Position;
  ticket.filled = true;
  if (action.price > 0.0) {
    ticket.open_price = action.price;
  }
  saveTicket(ticket);
  refreshStatus(ticket.signal_id, "order filled", false);
}

void LifecycleStateMachine::syncVolume(Ticket ticket,
                                       const MonitorAction& action) {
  if (action.volume + kVolumeEpsilon >= ticket.volume) {
    return;
  }
  ticket.realized_profit +=
      estimateExitProfit(ticket, ticket.volume - action.volume);
  ticket.volume = action.volume;
  if (ticket.volume <= kVolumeEpsilon) {
    ticket.volume = 0.0;
    ticket.state = TicketState::Closed;
  }
  saveTicket(ticket);
  refreshStatus(ticket.signal_id, "volume reduced at venue", false);
}

void LifecycleStateMachine::closedAtVenue(Ticket ticket) {
  ticket.state = ticket.filled ? TicketState::Closed : TicketState::Cancelled;
  if (ticket.filled) {
    ticket.realized_profit += estimateExitProfit(ticket, ticket.volume);
    ticket.volume = 0.0;
  }
  saveTicket(ticket);
  refreshStatus(ticket.signal_id, "closed at venue", false);
}

void LifecycleStateMachine::trailStop(Ticket ticket,
                                      const MonitorAction& action) {
  if (!ticket.isOpenPosition()) {
    return;
  }
  if (ticket.stop_loss &&
      !domain::improvesStop(ticket.direction, action.price, *ticket.stop_loss)) {
    return;
  }
  try {
    venue_.modify(ticket.id, action.price, std::nullopt, retry_.callTimeout());
  } catch (const VenueError& e) {
    std::cerr << "[Lifecycle] trail of ticket " << ticket.id << " failed: "
              << e.what() << "\n";
    return;
  }
  std::cout << "[Lifecycle] ticket " << ticket.id << " stop trailed to "
            << action.price << "\n";
  ticket.stop_loss = action.price;
  saveTicket(ticket);
  if (options_.cancel_pending_on_trail) {
    cancelPendingOrders(ticket.signal_id, "trail");
  }
  refreshStatus(ticket.signal_id, "stop trailed", false);
}

void LifecycleStateMachine::saveProfit(Ticket ticket,
                                       const MonitorAction& action) {
  if (!ticket.isOpenPosition() || ticket.profitStepConsumed(action.step)) {
    return;
  }
  domain::InstrumentInfo info;
  try {
    info = venue_.instrumentInfo(ticket.symbol, retry_.callTimeout());
  } catch (const VenueError& e) {
    std::cerr << "[Lifecycle] profit step " << action.step << " of ticket "
              << ticket.id << " deferred: " << e.what() << "\n";
    return;
  }

  double volume =
      SizingCalculator::floorToStep(ticket.volume * action.fraction,
                                    info.volume_step);
  if (volume + kVolumeEpsilon < info.min_volume) {
    std::cout << "[Lifecycle] profit step " << action.step << " of ticket "
              << ticket.id << " below minimum volume, skipped\n";
    ticket.consumed_profit_steps.push_back(action.step);
    saveTicket(ticket);
    return;
  }
  const double remaining = ticket.volume - volume;
  if (remaining > kVolumeEpsilon && remaining + kVolumeEpsilon < info.min_volume) {
    volume = ticket.volume;
  }

  try {
    ticket.realized_profit +=
        venue_.closePartial(ticket.id, volume, retry_.callTimeout());
  } catch (const VenueError& e) {
    std::cerr << "[Lifecycle] profit step " << action.step << " of ticket "
              << ticket.id << " failed: " << e.what() << "\n";
    return;
  }
  std::cout << "[Lifecycle] ticket " << ticket.id << " saved profit step "
            << action.step << ", closed " << volume << "\n";
  ticket.consumed_profit_steps.push_back(action.step);
  ticket.volume -= volume;
  if (ticket.volume <= kVolumeEpsilon) {
    ticket.volume = 0.0;
    ticket.state = TicketState::Closed;
  }
  saveTicket(ticket);
  if (options_.cancel_pending_on_trail) {
    cancelPendingOrders(ticket.signal_id, "profit saving");
  }
  refreshStatus(ticket.signal_id,
                "profit step " + std::to_string(action.step), false);
}

void LifecycleStateMachine::expireOrder(Ticket ticket) {
  if (!ticket.isPendingOrder()) {
    return;
  }
  try {
    venue_.cancelOrder(ticket.id, retry_.callTimeout());
  } catch (const VenueError& e) {
    if (e.kind() != VenueErrorKind::NotFound) {
      std::cerr << "[Lifecycle] expiry of ticket " << ticket.id
                << " failed: " << e.what() << "\n";
      return;
    }
  }
  std::cout << "[Lifecycle] order " << ticket.id << " expired\n";
  ticket.state = TicketState::Cancelled;
  saveTicket(ticket);
  refreshStatus(ticket.signal_id, "order expired", false);
}

void LifecycleStateMachine::cancelPendingOrders(domain::SignalId id,
                                                const std::string& reason) {
  for (auto t : activeTicketsOf(id)) {
    if (!t.isPendingOrder()) {
      continue;
    }
    try {
      venue_.cancelOrder(t.id, retry_.callTimeout());
    } catch (const VenueError& e) {
      if (e.kind() != VenueErrorKind::NotFound) {
        std::cerr << "[Lifecycle] cancel of order " << t.id << " after "
                  << reason << " failed: " << e.what() << "\n";
        continue;
      }
    }
    t.state = TicketState::Cancelled;
    saveTicket(t);
  }
}

// -----------------------------------------------------------------------------
// Status bookkeeping
// -----------------------------------------------------------------------------
bool LifecycleStateMachine::transition(Signal signal, SignalStatus to,
                                       const std::string& reason) {
  const SignalStatus from = signal.status;
  if (from != to && !StatusRules::canTransition(from, to)) {
    std::cerr << "[Lifecycle] illegal transition " << toString(from) << " -> "
              << toString(to) << " for signal " << signal.id << "\n";
    return false;
  }
  const auto now = clock_.now_ms();
  signal.status = to;
  signal.updated_at_ms = now;

  std::optional<domain::SignalHistoryEntry> row;
  if (from != to) {
    row = domain::SignalHistoryEntry{signal.id, from, to, reason, now};
    std::cout << "[Lifecycle] signal " << signal.id << " " << toString(from)
              << " -> " << toString(to) << " (" << reason << ")\n";
  }
  store_.saveSignal(signal, row);
  publishUpdate(signal, from, reason);
  return true;
}

void LifecycleStateMachine::refreshStatus(domain::SignalId id,
                                          const std::string& reason,
                                          bool command_succeeded) {
  auto snap = store_.snapshot();
  const Signal* signal = snap->findSignal(id);
  if (signal == nullptr) {
    return;
  }
  const auto tickets = snap->ticketsFor(id);
  if (tickets.empty()) {
    return;
  }
  const SignalStatus derived = StatusRules::deriveStatus(tickets);
  if (signal->status == SignalStatus::Error && !domain::isTerminal(derived) &&
      !command_succeeded) {
    publishUpdate(*signal, signal->status, reason);
    return;
  }
  Signal next = *signal;
  if (next.status == SignalStatus::Error && command_succeeded) {
    next.last_error.clear();
  }
  transition(std::move(next), derived, reason);
}

void LifecycleStateMachine::markError(domain::SignalId id,
                                      const std::string& error) {
  auto current = loadSignal(id);
  if (!current) {
    return;
  }
  current->last_error = error;
  if (domain::isTerminal(current->status)) {
    current->updated_at_ms = clock_.now_ms();
    store_.saveSignal(*current, std::nullopt);
    return;
  }
  transition(std::move(*current), SignalStatus::Error, "venue_call_failed");
}

std::optional<Signal> LifecycleStateMachine::loadSignal(
    domain::SignalId id) const {
  auto snap = store_.snapshot();
  if (const Signal* s = snap->findSignal(id)) {
    return *s;
  }
  return std::nullopt;
}

std::vector<Ticket> LifecycleStateMachine::activeTicketsOf(
    domain::SignalId id) const {
  std::vector<Ticket> out;
  for (auto& t : store_.snapshot()->ticketsFor(id)) {
    if (t.isActive()) {
      out.push_back(std::move(t));
    }
  }
  return out;
}

void LifecycleStateMachine::saveTicket(Ticket ticket) {
  ticket.updated_at_ms = clock_.now_ms();
  if (!ticket.isActive() && ticket.closed_at_ms == 0) {
    ticket.closed_at_ms = ticket.updated_at_ms;
  }
  store_.saveTicket(ticket);
}

// Tickets closed by the venue report no fill price, so the exit is priced
// at the current quote. One attempt; an unreachable venue books nothing.
double LifecycleStateMachine::estimateExitProfit(const Ticket& ticket,
                                                 double volume) const {
  domain::InstrumentInfo info;
  try {
    info = venue_.instrumentInfo(ticket.symbol, retry_.callTimeout());
  } catch (const VenueError& e) {
    std::cerr << "[Lifecycle] no quote to price exit of ticket " << ticket.id
              << ": " << e.what() << "\n";
    return 0.0;
  }
  const double exit =
      ticket.direction == domain::Direction::Buy ? info.bid : info.ask;
  if (exit <= 0.0) {
    return 0.0;
  }
  return (exit - ticket.open_price) * domain::directionSign(ticket.direction) *
         volume * info.contract_size;
}

void LifecycleStateMachine::publishUpdate(const Signal& signal,
                                          SignalStatus previous,
                                          const std::string& reason) {
  if (!on_update_) {
    return;
  }
  SignalUpdateEvent update;
  update.signal = signal;
  update.previous_status = previous;
  update.reason = reason;
  update.tickets = store_.snapshot()->ticketsFor(signal.id);
  on_update_(update);
}

void LifecycleStateMachine::reject(RejectionStage stage,
                                   const std::string& reason,
                                   const domain::MessageKey& source,
                                   domain::SignalId id) {
  if (on_rejection_) {
    on_rejection_(RejectionEvent{stage, reason, source, id, clock_.now_ms()});
  }
}

void LifecycleStateMachine::storeFailed(const std::string& what) {
  std::cerr << "[Lifecycle] store unavailable: " << what << "\n";
  if (on_store_failure_) {
    on_store_failure_(what);
  }
}

}  // namespace sigtrader
