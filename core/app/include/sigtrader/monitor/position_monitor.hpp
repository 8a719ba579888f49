#pragma once

#include "sigtrader/config/engine_config.hpp"
#include "sigtrader/events/lifecycle_events.hpp"
#include "sigtrader/store/i_signal_store.hpp"
#include "sigtrader/time/i_time_provider.hpp"
#include "sigtrader/venue/i_execution_venue.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

namespace sigtrader {

struct MonitorSettings {
  MonitorConfig monitor;
  TrailingConfig trailing;
  ProfitSavingConfig profit_saving;
  int pending_expiry_minutes{0};
  std::chrono::milliseconds call_timeout{5000};
};

// -----------------------------------------------------------------------------
// PositionMonitor
// -----------------------------------------------------------------------------
//
// @brief  Periodically compares the stored tickets with the venue and posts
//         MonitorActions for the lifecycle state machine.
//
// @details
// One tick (runOnce):
//   1. load a store snapshot,
//   2. call listOpenTickets once; on failure log and skip the tick,
//   3. for every active ticket decide SyncFill / ExpireOrder / SyncVolume /
//      TrailStop / SaveProfit, or count it as missing. A ticket missing for
//      missing_ticks_to_close consecutive ticks yields ClosedAtVenue.
//
// The monitor never mutates signals or tickets. Actions go to the
// ActionSink, which routes them into the owning signal's lane. Because the
// lane applies them later, an action may be stale; the lifecycle
// revalidates every one.
//
// Thread model:
//   start() spawns the timer thread, stop() wakes and joins it. runOnce()
//   may also be called directly (startup gate, tests); ticks are serialized
//   on an internal mutex.
//
// Ownership: borrows store, venue and clock.
// -----------------------------------------------------------------------------
class PositionMonitor {
 public:
  using ActionSink = std::function<void(const MonitorActionEvent&)>;

  PositionMonitor(const ISignalStore& store, IExecutionVenue& venue,
                  const ITimeProvider& clock, MonitorSettings settings,
                  ActionSink sink);
  ~PositionMonitor();

  PositionMonitor(const PositionMonitor&) = delete;
  PositionMonitor& operator=(const PositionMonitor&) = delete;
  PositionMonitor(PositionMonitor&&) = delete;
  PositionMonitor& operator=(PositionMonitor&&) = delete;

  // Spawns the timer thread. A second call is a no-op.
  void start();
  // Wakes and joins the timer thread. Safe to call when not running.
  void stop();

  // -------------------------------------------------------------------------
  // runOnce()
  // -------------------------------------------------------------------------
  //
  // @brief  Runs a single monitoring tick.
  //
  // @return Number of actions posted, or 0 when the venue could not be read.
  //
  // @details
  // Per active ticket:
  //   not listed by the venue       -> missing counter; ClosedAtVenue once
  //                                    it reaches missing_ticks_to_close
  //   order listed as a position    -> SyncFill
  //   order past its expiry         -> ExpireOrder
  //   position smaller at the venue -> SyncVolume
  //   position, stop can trail      -> TrailStop
  //   position, steps crossed       -> one SaveProfit per step
  // The position checks are independent; one tick may post several. A
  // ticket listed again resets its counter.
  //
  // Thread-safety: serialized with the timer thread on tick_mutex_.
  // -------------------------------------------------------------------------
  std::size_t runOnce();

  // @brief  Posts ResumePlacement for every Pending signal that has no ticket
  //         yet. Called once by the startup gate, before ingestion resumes.
  // @return Number of signals resumed.
  std::size_t recoverPending();

  bool running() const { return running_.load(); }

 private:
  void run();
  void post(const MonitorAction& action);

  const ISignalStore& store_;
  IExecutionVenue& venue_;
  const ITimeProvider& clock_;
  MonitorSettings settings_;
  ActionSink sink_;

  std::mutex tick_mutex_;
  std::map<domain::TicketId, int> missing_ticks_;

  std::atomic<bool> running_{false};
  std::mutex wake_mutex_;
  std::condition_variable wake_cv_;
  std::thread thread_;
};

}  // namespace sigtrader
