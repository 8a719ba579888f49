#include "sigtrader/store/json_codec.hpp"

#include <optional>
#include <stdexcept>
#include <string>

namespace sigtrader {

namespace {

using nlohmann::json;

json optionalPrice(const std::optional<double>& v) {
  return v ? json(*v) : json(nullptr);
}

std::optional<double> readOptionalPrice(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<double>();
}

domain::Direction readDirection(const json& j) {
  auto d = domain::parseDirection(j.at("direction").get<std::string>());
  if (!d) {
    throw std::runtime_error("unknown direction in stored record");
  }
  return *d;
}

domain::SignalStatus readStatus(const json& j, const char* key) {
  auto s = domain::parseSignalStatus(j.at(key).get<std::string>());
  if (!s) {
    throw std::runtime_error(std::string("unknown status in field ") + key);
  }
  return *s;
}

}  // namespace

namespace domain {

void to_json(json& j, const MessageKey& key) {
  j = json{{"channel_id", key.channel_id},
           {"message_id", key.message_id},
           {"qualifier", key.qualifier}};
}

void from_json(const json& j, MessageKey& key) {
  key.channel_id = j.at("channel_id").get<std::string>();
  key.message_id = j.at("message_id").get<std::int64_t>();
  key.qualifier = j.value("qualifier", std::string());
}

void to_json(json& j, const Signal& s) {
  j = json{{"id", s.id},
           {"symbol", s.symbol},
           {"direction", toString(s.direction)},
           {"entries", s.entries},
           {"stop_loss", optionalPrice(s.stop_loss)},
           {"take_profits", s.take_profits},
           {"source", s.source},
           {"provider", s.provider},
           {"status", toString(s.status)},
           {"last_error", s.last_error},
           {"created_at_ms", s.created_at_ms},
           {"updated_at_ms", s.updated_at_ms}};
}

void from_json(const json& j, Signal& s) {
  s.id = j.at("id").get<SignalId>();
  s.symbol = j.at("symbol").get<std::string>();
  s.direction = readDirection(j);
  s.entries = j.at("entries").get<std::vector<double>>();
  s.stop_loss = readOptionalPrice(j, "stop_loss");
  s.take_profits = j.value("take_profits", std::vector<double>{});
  if (j.contains("source")) {
    s.source = j.at("source").get<MessageKey>();
  }
  s.provider = j.value("provider", std::string());
  s.status = readStatus(j, "status");
  s.last_error = j.value("last_error", std::string());
  s.created_at_ms = j.value("created_at_ms", std::int64_t{0});
  s.updated_at_ms = j.value("updated_at_ms", std::int64_t{0});
}

void to_json(json& j, const Ticket& t) {
  j = json{{"id", t.id},
           {"signal_id", t.signal_id},
           {"leg", t.leg},
           {"symbol", t.symbol},
           {"direction", toString(t.direction)},
           {"volume", t.volume},
           {"initial_volume", t.initial_volume},
           {"open_price", t.open_price},
           {"stop_loss", optionalPrice(t.stop_loss)},
           {"take_profit", optionalPrice(t.take_profit)},
           {"kind", toString(t.kind)},
           {"state", toString(t.state)},
           {"filled", t.filled},
           {"placed_at_ms", t.placed_at_ms},
           {"updated_at_ms", t.updated_at_ms},
           {"closed_at_ms", t.closed_at_ms},
           {"realized_profit", t.realized_profit},
           {"consumed_profit_steps", t.consumed_profit_steps}};
}

void from_json(const json& j, Ticket& t) {
  t.id = j.at("id").get<TicketId>();
  t.signal_id = j.at("signal_id").get<SignalId>();
  t.leg = j.value("leg", 0);
  t.symbol = j.at("symbol").get<std::string>();
  t.direction = readDirection(j);
  t.volume = j.at("volume").get<double>();
  t.initial_volume = j.value("initial_volume", t.volume);
  t.open_price = j.value("open_price", 0.0);
  t.stop_loss = readOptionalPrice(j, "stop_loss");
  t.take_profit = readOptionalPrice(j, "take_profit");
  const std::string kind = j.at("kind").get<std::string>();
  t.kind = kind == "Position" ? TicketKind::Position : TicketKind::Order;
  const std::string state = j.at("state").get<std::string>();
  t.state = state == "Closed"      ? TicketState::Closed
            : state == "Cancelled" ? TicketState::Cancelled
                                   : TicketState::Active;
  t.filled = j.value("filled", false);
  t.placed_at_ms = j.value("placed_at_ms", std::int64_t{0});
  t.updated_at_ms = j.value("updated_at_ms", std::int64_t{0});
  t.closed_at_ms = j.value("closed_at_ms", std::int64_t{0});
  t.realized_profit = j.value("realized_profit", 0.0);
  t.consumed_profit_steps =
      j.value("consumed_profit_steps", std::vector<std::size_t>{});
}

void to_json(json& j, const SignalHistoryEntry& e) {
  j = json{{"signal_id", e.signal_id},
           {"from", toString(e.from)},
           {"to", toString(e.to)},
           {"reason", e.reason},
           {"at_ms", e.at_ms}};
}

void from_json(const json& j, SignalHistoryEntry& e) {
  e.signal_id = j.at("signal_id").get<SignalId>();
  e.from = readStatus(j, "from");
  e.to = readStatus(j, "to");
  e.reason = j.value("reason", std::string());
  e.at_ms = j.value("at_ms", std::int64_t{0});
}

}  // namespace domain

void to_json(json& j, const StoreSnapshot& s) {
  json signals = json::array();
  for (const auto& [id, signal] : s.signals) {
    signals.push_back(signal);
  }
  json tickets = json::array();
  for (const auto& [id, ticket] : s.tickets) {
    tickets.push_back(ticket);
  }
  j = json{{"format", 1},
           {"version", s.version},
           {"signals", signals},
           {"tickets", tickets},
           {"history", s.history},
           {"processed", s.processed},
           {"bindings", s.bindings},
           {"latest_by_channel", s.latest_by_channel}};
}

void from_json(const json& j, StoreSnapshot& s) {
  s = StoreSnapshot{};
  s.version = j.value("version", std::uint64_t{0});
  for (const auto& node : j.at("signals")) {
    auto signal = node.get<domain::Signal>();
    s.signals[signal.id] = std::move(signal);
  }
  for (const auto& node : j.at("tickets")) {
    auto ticket = node.get<domain::Ticket>();
    s.tickets[ticket.id] = std::move(ticket);
  }
  s.history = j.value("history", std::vector<domain::SignalHistoryEntry>{});
  s.processed = j.value("processed", std::map<std::string, domain::SignalId>{});
  s.bindings = j.value("bindings", std::map<std::string, domain::SignalId>{});
  s.latest_by_channel =
      j.value("latest_by_channel", std::map<std::string, domain::SignalId>{});
}

void to_json(json& j, const StoreMutation& m) {
  j = json{{"op", toString(m.kind)}};
  switch (m.kind) {
    case StoreMutationKind::CreateSignal:
      j["signal"] = m.signal;
      j["key"] = m.key;
      break;
    case StoreMutationKind::SaveSignal:
      j["signal"] = m.signal;
      j["transition"] = m.transition ? json(*m.transition) : json(nullptr);
      break;
    case StoreMutationKind::SaveTicket:
      j["ticket"] = m.ticket;
      break;
    case StoreMutationKind::MarkProcessed:
      j["key"] = m.key;
      j["signal_id"] = m.signal_id;
      break;
  }
}

void from_json(const json& j, StoreMutation& m) {
  const std::string op = j.at("op").get<std::string>();
  if (op == "create_signal") {
    m.kind = StoreMutationKind::CreateSignal;
    m.signal = j.at("signal").get<domain::Signal>();
    m.key = j.at("key").get<domain::MessageKey>();
  } else if (op == "save_signal") {
    m.kind = StoreMutationKind::SaveSignal;
    m.signal = j.at("signal").get<domain::Signal>();
    auto it = j.find("transition");
    if (it != j.end() && !it->is_null()) {
      m.transition = it->get<domain::SignalHistoryEntry>();
    }
  } else if (op == "save_ticket") {
    m.kind = StoreMutationKind::SaveTicket;
    m.ticket = j.at("ticket").get<domain::Ticket>();
  } else if (op == "mark_processed") {
    m.kind = StoreMutationKind::MarkProcessed;
    m.key = j.at("key").get<domain::MessageKey>();
    m.signal_id = j.at("signal_id").get<domain::SignalId>();
  } else {
    throw std::runtime_error("unknown journal op '" + op + "'");
  }
}

void to_json(json& j, const ChannelStats& s) {
  j = json{{"channel_id", s.channel_id},
           {"total_positions", s.total_positions},
           {"open_positions", s.open_positions},
           {"closed_positions", s.closed_positions},
           {"winning_positions", s.winning_positions},
           {"losing_positions", s.losing_positions},
           {"total_profit", s.total_profit},
           {"total_loss", s.total_loss},
           {"net_profit", s.net_profit},
           {"largest_win", s.largest_win},
           {"largest_loss", s.largest_loss},
           {"average_win", s.average_win},
           {"average_loss", s.average_loss},
           {"win_rate", s.win_rate},
           {"profit_factor", s.profit_factor},
           {"max_drawdown", s.max_drawdown},
           {"current_drawdown", s.current_drawdown},
           {"total_volume", s.total_volume},
           {"first_trade_ms", s.first_trade_ms},
           {"last_trade_ms", s.last_trade_ms}};
}

}  // namespace sigtrader
