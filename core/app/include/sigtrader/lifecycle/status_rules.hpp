#pragma once

#include "sigtrader/domain/command.hpp"
#include "sigtrader/domain/signal_status.hpp"
#include "sigtrader/domain/ticket.hpp"

#include <vector>

namespace sigtrader {

// -----------------------------------------------------------------------------
// StatusRules
// -----------------------------------------------------------------------------
// Static transition table of the signal lifecycle:
//
//   Pending          -> Open | Cancelled | Error
//   Open             -> Open | PartiallyClosed | Closed | Cancelled | Error
//   PartiallyClosed  -> PartiallyClosed | Closed | Error
//   Error            -> Open | PartiallyClosed | Closed | Cancelled | Error
//   Closed, Cancelled   terminal
// -----------------------------------------------------------------------------
class StatusRules {
 public:
  static bool canTransition(domain::SignalStatus from, domain::SignalStatus to);

  // Whether `kind` has any effect on a signal in `status`. Unsupported
  // combinations are logged no-ops.
  static bool commandApplies(domain::CommandKind kind,
                             domain::SignalStatus status);

  // -------------------------------------------------------------------------
  // deriveStatus(tickets)
  // -------------------------------------------------------------------------
  // Status implied by the tickets of one signal:
  //   no active ticket          -> Closed if any was filled, else Cancelled
  //   volume reduced somewhere,
  //   or a filled ticket ended  -> PartiallyClosed
  //   otherwise                 -> Open
  // `tickets` must not be empty.
  // -------------------------------------------------------------------------
  static domain::SignalStatus deriveStatus(
      const std::vector<domain::Ticket>& tickets);
};

}  // namespace sigtrader
