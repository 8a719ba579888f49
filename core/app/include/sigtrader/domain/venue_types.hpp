#pragma once

#include "sigtrader/domain/direction.hpp"
#include "sigtrader/domain/signal.hpp"
#include "sigtrader/domain/ticket.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace sigtrader {
namespace domain {

enum class OrderType {
  Market,
  Limit,
  Stop,
};

inline const char* toString(OrderType t) {
  switch (t) {
    case OrderType::Market: return "Market";
    case OrderType::Limit:  return "Limit";
    case OrderType::Stop:   return "Stop";
  }
  return "Unknown";
}

// Parameters of one order placement, produced by the SizingCalculator.
struct OrderParams {
  SignalId signal_id{0};
  int leg{0};
  std::string symbol;
  Direction direction{Direction::Buy};
  OrderType type{OrderType::Market};
  double volume{0.0};
  double price{0.0};
  std::optional<double> stop_loss;
  std::optional<double> take_profit;
  std::string client_tag;  // "sig:<id>:<leg>", lets a venue dedupe retries
};

inline std::string clientTagFor(SignalId id, int leg) {
  return "sig:" + std::to_string(id) + ":" + std::to_string(leg);
}

struct AccountState {
  double balance{0.0};
  double equity{0.0};
  double margin{0.0};

  double freeMargin() const { return equity - margin; }
};

struct InstrumentInfo {
  std::string symbol;
  double contract_size{1.0};
  double min_volume{0.01};
  double max_volume{0.0};  // 0 means "no maximum"
  double volume_step{0.01};
  bool tradable{true};
  double bid{0.0};
  double ask{0.0};
  double margin_rate{1.0};
};

// An order or position as the venue reports it.
struct VenueTicket {
  TicketId id{0};
  std::string symbol;
  Direction direction{Direction::Buy};
  TicketKind kind{TicketKind::Order};
  double volume{0.0};
  double open_price{0.0};
  std::optional<double> stop_loss;
  std::optional<double> take_profit;
  double current_price{0.0};
  double profit{0.0};
  std::string client_tag;
  std::int64_t opened_at_ms{0};
};

}  // namespace domain
}  // namespace sigtrader
