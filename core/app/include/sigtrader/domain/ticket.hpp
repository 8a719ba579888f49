#pragma once

#include "sigtrader/domain/direction.hpp"
#include "sigtrader/domain/signal.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sigtrader {
namespace domain {

using TicketId = std::uint64_t;

enum class TicketKind {
  Order,     // resting pending order, not filled yet
  Position,  // filled, carries market exposure
};

enum class TicketState {
  Active,
  Closed,     // position fully closed
  Cancelled,  // order cancelled or expired before a fill
};

inline const char* toString(TicketKind k) {
  return k == TicketKind::Order ? "Order" : "Position";
}

inline const char* toString(TicketState s) {
  switch (s) {
    case TicketState::Active:    return "Active";
    case TicketState::Closed:    return "Closed";
    case TicketState::Cancelled: return "Cancelled";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// Ticket
// -----------------------------------------------------------------------------
// Engine-side record of one venue order/position. One ticket per entry leg;
// volume only ever shrinks through partial closes.
// -----------------------------------------------------------------------------
struct Ticket {
  TicketId id{0};
  SignalId signal_id{0};
  int leg{0};
  std::string symbol;
  Direction direction{Direction::Buy};

  double volume{0.0};
  double initial_volume{0.0};
  double open_price{0.0};
  std::optional<double> stop_loss;
  std::optional<double> take_profit;

  TicketKind kind{TicketKind::Order};
  TicketState state{TicketState::Active};
  bool filled{false};

  std::int64_t placed_at_ms{0};
  std::int64_t updated_at_ms{0};
  std::int64_t closed_at_ms{0};  // 0 while active

  // Profit booked by partial and full closes so far, in account currency.
  double realized_profit{0.0};

  // Indices of profit-saving steps already executed on this ticket.
  std::vector<std::size_t> consumed_profit_steps;

  bool isActive() const { return state == TicketState::Active; }
  bool isOpenPosition() const {
    return isActive() && kind == TicketKind::Position;
  }
  bool isPendingOrder() const {
    return isActive() && kind == TicketKind::Order;
  }
  bool profitStepConsumed(std::size_t step) const {
    return std::find(consumed_profit_steps.begin(),
                     consumed_profit_steps.end(),
                     step) != consumed_profit_steps.end();
  }
};

}  // namespace domain
}  // namespace sigtrader
