#pragma once

#include "sigtrader/domain/direction.hpp"
#include "sigtrader/domain/message.hpp"
#include "sigtrader/domain/signal_status.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sigtrader {
namespace domain {

using SignalId = std::uint64_t;

// -----------------------------------------------------------------------------
// Signal
// -----------------------------------------------------------------------------
// A parsed trade instruction and its lifecycle status. Only the lifecycle
// state machine mutates a stored Signal; everyone else reads snapshots.
//
// Invariant (checked by validateLevels): for Buy, stop_loss < every entry
// <= take_profits[0] < take_profits[1] < ...; mirrored for Sell.
// -----------------------------------------------------------------------------
struct Signal {
  SignalId id{0};
  std::string symbol;
  Direction direction{Direction::Buy};
  std::vector<double> entries;  // one, or two in dual-entry mode
  std::optional<double> stop_loss;
  std::vector<double> take_profits;

  MessageKey source;
  std::string provider;  // name of the message source adapter

  SignalStatus status{SignalStatus::Pending};
  std::string last_error;
  std::int64_t created_at_ms{0};
  std::int64_t updated_at_ms{0};

  bool isDualEntry() const { return entries.size() == 2; }
  double firstEntry() const { return entries.empty() ? 0.0 : entries.front(); }
  std::optional<double> finalTakeProfit() const {
    if (take_profits.empty()) {
      return std::nullopt;
    }
    return take_profits.back();
  }
};

// One row of the append-only status history.
struct SignalHistoryEntry {
  SignalId signal_id{0};
  SignalStatus from{SignalStatus::Pending};
  SignalStatus to{SignalStatus::Pending};
  std::string reason;
  std::int64_t at_ms{0};
};

}  // namespace domain
}  // namespace sigtrader
