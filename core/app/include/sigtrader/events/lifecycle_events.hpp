#pragma once

#include "sigtrader/domain/signal.hpp"
#include "sigtrader/domain/signal_status.hpp"
#include "sigtrader/domain/ticket.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace sigtrader {

enum class MonitorActionKind {
  SyncFill,         // venue reports the order became a position
  SyncVolume,       // venue volume is lower than the stored one
  ClosedAtVenue,    // ticket no longer listed by the venue
  TrailStop,        // move SL to `price`
  SaveProfit,       // close `fraction` of remaining volume for `step`
  ExpireOrder,      // pending order outlived its expiry
  ResumePlacement,  // Pending signal without tickets after a restart
};

inline const char* toString(MonitorActionKind k) {
  switch (k) {
    case MonitorActionKind::SyncFill:        return "SyncFill";
    case MonitorActionKind::SyncVolume:      return "SyncVolume";
    case MonitorActionKind::ClosedAtVenue:   return "ClosedAtVenue";
    case MonitorActionKind::TrailStop:       return "TrailStop";
    case MonitorActionKind::SaveProfit:      return "SaveProfit";
    case MonitorActionKind::ExpireOrder:     return "ExpireOrder";
    case MonitorActionKind::ResumePlacement: return "ResumePlacement";
  }
  return "Unknown";
}

struct MonitorAction {
  MonitorActionKind kind{MonitorActionKind::SyncFill};
  domain::SignalId signal_id{0};
  domain::TicketId ticket_id{0};
  double price{0.0};     // fill price (SyncFill) or new SL (TrailStop)
  double volume{0.0};    // venue volume (SyncVolume)
  std::size_t step{0};   // profit-saving step index (SaveProfit)
  double fraction{0.0};  // share of remaining volume to close (SaveProfit)
};

// Posted by the PositionMonitor into the owning signal's lane.
struct MonitorActionEvent {
  MonitorAction action;
  std::int64_t observed_at_ms{0};
};

// Published after every persisted signal change. `tickets` is the state of
// the signal's tickets right after the change.
struct SignalUpdateEvent {
  domain::Signal signal;
  domain::SignalStatus previous_status{domain::SignalStatus::Pending};
  std::string reason;
  std::vector<domain::Ticket> tickets;
};

}  // namespace sigtrader
