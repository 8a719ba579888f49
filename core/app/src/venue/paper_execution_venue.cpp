#include "sigtrader/venue/paper_execution_venue.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace sigtrader {

using domain::Direction;
using domain::OrderType;
using domain::TicketKind;
using domain::VenueError;
using domain::VenueErrorKind;
using domain::VenueTicket;

namespace {

// Price a position is closed at: Buy positions sell at the bid, Sell
// positions buy back at the ask.
double exitPrice(Direction d, const domain::InstrumentInfo& info) {
  return d == Direction::Buy ? info.bid : info.ask;
}

double entryPrice(Direction d, const domain::InstrumentInfo& info) {
  return d == Direction::Buy ? info.ask : info.bid;
}

bool orderTriggered(const VenueTicket& t, OrderType type,
                    const domain::InstrumentInfo& info) {
  const double px = entryPrice(t.direction, info);
  if (px <= 0.0) {
    return false;
  }
  const bool buy = t.direction == Direction::Buy;
  if (type == OrderType::Limit) {
    return buy ? px <= t.open_price : px >= t.open_price;
  }
  return buy ? px >= t.open_price : px <= t.open_price;
}

}  // namespace

PaperExecutionVenue::PaperExecutionVenue(const ITimeProvider& clock,
                                         double balance)
    : clock_(clock) {
  account_.balance = balance;
  account_.equity = balance;
}

// -----------------------------------------------------------------------------
// enter: count the call and fire any scripted failure
// -----------------------------------------------------------------------------
void PaperExecutionVenue::enter(VenueOp op) {
  ++calls_[op];
  auto it = failures_.find(op);
  if (it != failures_.end() && it->second.remaining > 0) {
    --it->second.remaining;
    throw VenueError(it->second.kind, "paper venue: scripted failure");
  }
}

const domain::InstrumentInfo& PaperExecutionVenue::instrumentLocked(
    const std::string& symbol) const {
  auto it = instruments_.find(symbol);
  if (it == instruments_.end()) {
    throw VenueError(VenueErrorKind::Rejected,
                     "paper venue: unknown symbol " + symbol);
  }
  return it->second;
}

VenueTicket& PaperExecutionVenue::ticketLocked(domain::TicketId id) {
  auto it = open_.find(id);
  if (it == open_.end()) {
    throw VenueError(VenueErrorKind::NotFound,
                     "paper venue: no open ticket " + std::to_string(id));
  }
  return it->second;
}

void PaperExecutionVenue::refreshLocked(VenueTicket& t) {
  if (t.kind != TicketKind::Position) {
    return;
  }
  auto it = instruments_.find(t.symbol);
  if (it == instruments_.end()) {
    return;
  }
  const double px = exitPrice(t.direction, it->second);
  if (px <= 0.0) {
    return;
  }
  t.current_price = px;
  t.profit = (px - t.open_price) * domain::directionSign(t.direction) *
             t.volume * it->second.contract_size;
}

double PaperExecutionVenue::closeLocked(domain::TicketId id, double volume) {
  VenueTicket& t = open_.at(id);
  refreshLocked(t);
  const double closed = std::min(volume, t.volume);
  const double per_unit = t.volume > 0.0 ? t.profit / t.volume : 0.0;
  const double realized = per_unit * closed;
  account_.balance += realized;
  t.volume -= closed;
  if (t.volume <= 1e-9) {
    open_.erase(id);
    ++closed_count_;
  } else {
    refreshLocked(t);
  }
  return realized;
}

void PaperExecutionVenue::updateMarginLocked() {
  double margin = 0.0;
  double floating = 0.0;
  for (auto& [id, t] : open_) {
    if (t.kind != TicketKind::Position) {
      continue;
    }
    auto it = instruments_.find(t.symbol);
    const double contract = it != instruments_.end() ? it->second.contract_size : 1.0;
    const double rate = it != instruments_.end() ? it->second.margin_rate : 1.0;
    margin += t.volume * contract * t.open_price * rate;
    floating += t.profit;
  }
  account_.margin = margin;
  account_.equity = account_.balance + floating;
}

// -----------------------------------------------------------------------------
// placeOrder
// -----------------------------------------------------------------------------
VenueTicket PaperExecutionVenue::placeOrder(const domain::OrderParams& params,
                                            std::chrono::milliseconds) {
  std::lock_guard lock(mutex_);
  enter(VenueOp::PlaceOrder);

  if (!params.client_tag.empty()) {
    for (const auto& [id, t] : open_) {
      if (t.client_tag == params.client_tag) {
        return t;
      }
    }
  }

  const domain::InstrumentInfo& info = instrumentLocked(params.symbol);
  if (!info.tradable) {
    throw VenueError(VenueErrorKind::Rejected,
                     "paper venue: symbol not tradable " + params.symbol);
  }
  if (params.volume <= 0.0) {
    throw VenueError(VenueErrorKind::Rejected, "paper venue: invalid volume");
  }

  VenueTicket t;
  t.id = next_ticket_++;
  t.symbol = params.symbol;
  t.direction = params.direction;
  t.volume = params.volume;
  t.stop_loss = params.stop_loss;
  t.take_profit = params.take_profit;
  t.client_tag = params.client_tag;
  t.opened_at_ms = clock_.now_ms();

  if (params.type == OrderType::Market) {
    const double px = entryPrice(params.direction, info);
    t.kind = TicketKind::Position;
    t.open_price = px > 0.0 ? px : params.price;
  } else {
    t.kind = TicketKind::Order;
    t.open_price = params.price;
  }

  open_.emplace(t.id, t);
  pending_types_[t.id] = params.type;
  refreshLocked(open_.at(t.id));
  updateMarginLocked();

  std::cout << "[PaperVenue] placed " << toString(params.type) << " "
            << params.symbol << " " << params.volume << " tag="
            << params.client_tag << " ticket=" << t.id << "\n";
  return open_.at(t.id);
}

void PaperExecutionVenue::modify(domain::TicketId ticket,
                                 const std::optional<double>& stop_loss,
                                 const std::optional<double>& take_profit,
                                 std::chrono::milliseconds) {
  std::lock_guard lock(mutex_);
  enter(VenueOp::Modify);
  VenueTicket& t = ticketLocked(ticket);
  if (stop_loss) {
    t.stop_loss = stop_loss;
  }
  if (take_profit) {
    t.take_profit = take_profit;
  }
}

double PaperExecutionVenue::closePartial(domain::TicketId ticket, double volume,
                                         std::chrono::milliseconds) {
  std::lock_guard lock(mutex_);
  enter(VenueOp::ClosePartial);
  VenueTicket& t = ticketLocked(ticket);
  if (t.kind != TicketKind::Position) {
    throw VenueError(VenueErrorKind::Rejected,
                     "paper venue: ticket is a pending order");
  }
  if (volume <= 0.0) {
    throw VenueError(VenueErrorKind::Rejected, "paper venue: invalid volume");
  }
  const double realized = closeLocked(ticket, volume);
  pending_types_.erase(ticket);
  updateMarginLocked();
  return realized;
}

void PaperExecutionVenue::cancelOrder(domain::TicketId ticket,
                                      std::chrono::milliseconds) {
  std::lock_guard lock(mutex_);
  enter(VenueOp::CancelOrder);
  VenueTicket& t = ticketLocked(ticket);
  if (t.kind != TicketKind::Order) {
    throw VenueError(VenueErrorKind::Rejected,
                     "paper venue: ticket already filled");
  }
  open_.erase(ticket);
  pending_types_.erase(ticket);
}

std::vector<VenueTicket> PaperExecutionVenue::listOpenTickets(
    std::chrono::milliseconds) {
  std::lock_guard lock(mutex_);
  enter(VenueOp::ListOpenTickets);
  std::vector<VenueTicket> out;
  out.reserve(open_.size());
  for (const auto& [id, t] : open_) {
    out.push_back(t);
  }
  return out;
}

domain::AccountState PaperExecutionVenue::accountState(
    std::chrono::milliseconds) {
  std::lock_guard lock(mutex_);
  enter(VenueOp::AccountState);
  return account_;
}

domain::InstrumentInfo PaperExecutionVenue::instrumentInfo(
    const std::string& symbol, std::chrono::milliseconds) {
  std::lock_guard lock(mutex_);
  enter(VenueOp::InstrumentInfo);
  auto it = instruments_.find(symbol);
  if (it == instruments_.end()) {
    throw VenueError(VenueErrorKind::NotFound,
                     "paper venue: unknown symbol " + symbol);
  }
  return it->second;
}

// -----------------------------------------------------------------------------
// Simulation controls
// -----------------------------------------------------------------------------
void PaperExecutionVenue::setInstrument(const domain::InstrumentInfo& info) {
  std::lock_guard lock(mutex_);
  instruments_[info.symbol] = info;
}

// -----------------------------------------------------------------------------
// setQuote: move the market and apply its consequences
// -----------------------------------------------------------------------------
// Order of effects: pending orders fill first, then every position on the
// symbol is checked against its SL/TP and closed at that level.
// -----------------------------------------------------------------------------
void PaperExecutionVenue::setQuote(const std::string& symbol, double bid,
                                   double ask) {
  std::lock_guard lock(mutex_);
  auto info_it = instruments_.find(symbol);
  if (info_it == instruments_.end()) {
    domain::InstrumentInfo info;
    info.symbol = symbol;
    info_it = instruments_.emplace(symbol, info).first;
  }
  info_it->second.bid = bid;
  info_it->second.ask = ask;
  const domain::InstrumentInfo& info = info_it->second;

  std::vector<std::pair<domain::TicketId, const char*>> to_close;
  for (auto& [id, t] : open_) {
    if (t.symbol != symbol) {
      continue;
    }
    if (t.kind == TicketKind::Order) {
      auto type_it = pending_types_.find(id);
      const OrderType type =
          type_it != pending_types_.end() ? type_it->second : OrderType::Limit;
      if (!orderTriggered(t, type, info)) {
        continue;
      }
      t.kind = TicketKind::Position;
      std::cout << "[PaperVenue] filled ticket=" << id << " at "
                << t.open_price << "\n";
    }
    refreshLocked(t);
    const double px = exitPrice(t.direction, info);
    const bool buy = t.direction == Direction::Buy;
    if (t.stop_loss && (buy ? px <= *t.stop_loss : px >= *t.stop_loss)) {
      to_close.emplace_back(id, "stop-loss");
    } else if (t.take_profit &&
               (buy ? px >= *t.take_profit : px <= *t.take_profit)) {
      to_close.emplace_back(id, "take-profit");
    }
  }

  for (const auto& [id, reason] : to_close) {
    std::cout << "[PaperVenue] ticket=" << id << " closed by " << reason
              << "\n";
    closeLocked(id, open_.at(id).volume);
    pending_types_.erase(id);
  }
  updateMarginLocked();
}

void PaperExecutionVenue::failNext(VenueOp op, int count,
                                   VenueErrorKind kind) {
  std::lock_guard lock(mutex_);
  failures_[op] = Failure{count, kind};
}

void PaperExecutionVenue::fillOrder(domain::TicketId ticket) {
  std::lock_guard lock(mutex_);
  VenueTicket& t = ticketLocked(ticket);
  t.kind = TicketKind::Position;
  refreshLocked(t);
  updateMarginLocked();
}

void PaperExecutionVenue::closeAtVenue(domain::TicketId ticket) {
  std::lock_guard lock(mutex_);
  VenueTicket& t = ticketLocked(ticket);
  if (t.kind == TicketKind::Order) {
    open_.erase(ticket);
  } else {
    closeLocked(ticket, t.volume);
  }
  pending_types_.erase(ticket);
  updateMarginLocked();
}

void PaperExecutionVenue::reduceAtVenue(domain::TicketId ticket,
                                        double new_volume) {
  std::lock_guard lock(mutex_);
  VenueTicket& t = ticketLocked(ticket);
  if (new_volume < t.volume) {
    closeLocked(ticket, t.volume - new_volume);
  }
  updateMarginLocked();
}

std::size_t PaperExecutionVenue::callCount(VenueOp op) const {
  std::lock_guard lock(mutex_);
  auto it = calls_.find(op);
  return it == calls_.end() ? 0 : it->second;
}

std::vector<VenueTicket> PaperExecutionVenue::tickets() const {
  std::lock_guard lock(mutex_);
  std::vector<VenueTicket> out;
  for (const auto& [id, t] : open_) {
    out.push_back(t);
  }
  return out;
}

std::size_t PaperExecutionVenue::closedCount() const {
  std::lock_guard lock(mutex_);
  return closed_count_;
}

}  // namespace sigtrader
