#include "sigtrader/monitor/position_monitor.hpp"

#include "sigtrader/monitor/monitor_rules.hpp"

#include <iostream>
#include <iterator>
#include <set>
#include <utility>
#include <vector>

namespace sigtrader {

namespace {

constexpr double kVolumeEpsilon = 1e-9;

}  // namespace

PositionMonitor::PositionMonitor(const ISignalStore& store,
                                 IExecutionVenue& venue,
                                 const ITimeProvider& clock,
                                 MonitorSettings settings, ActionSink sink)
    : store_(store),
      venue_(venue),
      clock_(clock),
      settings_(std::move(settings)),
      sink_(std::move(sink)) {}

PositionMonitor::~PositionMonitor() { stop(); }

// -----------------------------------------------------------------------------
// start / stop / run
// -----------------------------------------------------------------------------
void PositionMonitor::start() {
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::thread([this] { run(); });
  std::cout << "[PositionMonitor] started, interval "
            << settings_.monitor.interval.count() << "ms\n";
}

void PositionMonitor::stop() {
  {
    std::lock_guard lock(wake_mutex_);
    if (!running_.exchange(false)) {
      return;
    }
  }
  wake_cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
  std::cout << "[PositionMonitor] stopped\n";
}

// Timer thread. A throwing tick is logged and the loop keeps going.
void PositionMonitor::run() {
  while (running_.load()) {
    {
      std::unique_lock lock(wake_mutex_);
      wake_cv_.wait_for(lock, settings_.monitor.interval,
                        [this] { return !running_.load(); });
    }
    if (!running_.load()) {
      break;
    }
    try {
      runOnce();
    } catch (const std::exception& e) {
      std::cerr << "[PositionMonitor] tick failed: " << e.what() << "\n";
    }
  }
}

// -----------------------------------------------------------------------------
// runOnce: one reconciliation pass
// -----------------------------------------------------------------------------
std::size_t PositionMonitor::runOnce() {
  std::lock_guard lock(tick_mutex_);

  auto snap = store_.snapshot();
  std::vector<domain::VenueTicket> live;
  try {
    live = venue_.listOpenTickets(settings_.call_timeout);
  } catch (const domain::VenueError& e) {
    std::cerr << "[PositionMonitor] listOpenTickets failed ("
              << domain::toString(e.kind()) << "): " << e.what()
              << ", tick skipped\n";
    return 0;
  }

  // The venue list lives until the end of the tick; index it by ticket id.
  std::map<domain::TicketId, const domain::VenueTicket*> by_id;
  for (const auto& vt : live) {
    by_id[vt.id] = &vt;
  }

  const auto now = clock_.now_ms();
  std::size_t posted = 0;
  auto emit = [&](MonitorAction action) {
    post(action);
    ++posted;
  };

  std::set<domain::TicketId> seen;
  for (const auto& ticket : snap->activeTickets()) {
    seen.insert(ticket.id);
    auto it = by_id.find(ticket.id);
    if (it == by_id.end()) {
      const int misses = ++missing_ticks_[ticket.id];
      if (misses >= settings_.monitor.missing_ticks_to_close) {
        MonitorAction a;
        a.kind = MonitorActionKind::ClosedAtVenue;
        a.signal_id = ticket.signal_id;
        a.ticket_id = ticket.id;
        emit(a);
      }
      continue;
    }
    missing_ticks_.erase(ticket.id);
    const domain::VenueTicket& vt = *it->second;

    // --- pending orders ----------------------------------------------------
    if (ticket.kind == domain::TicketKind::Order) {
      if (vt.kind == domain::TicketKind::Position) {
        MonitorAction a;
        a.kind = MonitorActionKind::SyncFill;
        a.signal_id = ticket.signal_id;
        a.ticket_id = ticket.id;
        a.price = vt.open_price;
        emit(a);
      } else if (orderExpired(ticket, settings_.pending_expiry_minutes, now)) {
        MonitorAction a;
        a.kind = MonitorActionKind::ExpireOrder;
        a.signal_id = ticket.signal_id;
        a.ticket_id = ticket.id;
        emit(a);
      }
      continue;
    }

    // --- open positions ----------------------------------------------------
    // Only a shrink is synced; the venue never grows a position by itself.
    if (vt.volume + kVolumeEpsilon < ticket.volume) {
      MonitorAction a;
      a.kind = MonitorActionKind::SyncVolume;
      a.signal_id = ticket.signal_id;
      a.ticket_id = ticket.id;
      a.volume = vt.volume;
      emit(a);
    }

    const domain::Signal* signal = snap->findSignal(ticket.signal_id);
    if (signal == nullptr) {
      continue;
    }
    if (auto sl = trailingCandidate(settings_.trailing, *signal, ticket, vt)) {
      MonitorAction a;
      a.kind = MonitorActionKind::TrailStop;
      a.signal_id = ticket.signal_id;
      a.ticket_id = ticket.id;
      a.price = *sl;
      emit(a);
    }
    for (std::size_t step :
         crossedProfitSteps(settings_.profit_saving, *signal, ticket, vt)) {
      MonitorAction a;
      a.kind = MonitorActionKind::SaveProfit;
      a.signal_id = ticket.signal_id;
      a.ticket_id = ticket.id;
      a.step = step;
      a.fraction = settings_.profit_saving.steps[step].fraction;
      emit(a);
    }
  }

  // Forget counters of tickets that are no longer active in the store.
  for (auto it = missing_ticks_.begin(); it != missing_ticks_.end();) {
    it = seen.count(it->first) ? std::next(it) : missing_ticks_.erase(it);
  }
  return posted;
}

// -----------------------------------------------------------------------------
// recoverPending: startup gate
// -----------------------------------------------------------------------------
std::size_t PositionMonitor::recoverPending() {
  auto snap = store_.snapshot();
  std::size_t posted = 0;
  for (const auto& signal : snap->activeSignals()) {
    if (signal.status != domain::SignalStatus::Pending ||
        !snap->ticketsFor(signal.id).empty()) {
      continue;
    }
    MonitorAction a;
    a.kind = MonitorActionKind::ResumePlacement;
    a.signal_id = signal.id;
    post(a);
    ++posted;
  }
  if (posted > 0) {
    std::cout << "[PositionMonitor] resuming " << posted
              << " pending signal(s)\n";
  }
  return posted;
}

void PositionMonitor::post(const MonitorAction& action) {
  if (sink_) {
    sink_(MonitorActionEvent{action, clock_.now_ms()});
  }
}

}  // namespace sigtrader
