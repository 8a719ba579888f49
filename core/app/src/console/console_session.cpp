#include "sigtrader/console/console_session.hpp"

#include "sigtrader/command/command_classifier.hpp"
#include "sigtrader/parser/number_normalizer.hpp"

#include <charconv>
#include <cstdint>
#include <iomanip>
#include <optional>
#include <sstream>
#include <utility>

namespace sigtrader {

namespace {

constexpr const char* kMainHelp =
    "signals | positions | history [n] | signal <id> | report <channel> | "
    "compare | summary | tester";
constexpr const char* kSignalHelp =
    "close | half | riskfree | tp | sl | tps | closelot <ticket> <lots> | "
    "back | menu";

std::string trim(const std::string& s) {
  const auto first = s.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = s.find_last_not_of(" \t\r\n");
  return s.substr(first, last - first + 1);
}

// Whole decimal number >= 1; anything with a sign, a fraction, an exponent
// or more digits than fit in 64 bits is rejected.
std::optional<std::uint64_t> parsePositiveInteger(const std::string& arg) {
  const std::string text = normalizeDigits(arg);
  std::uint64_t value = 0;
  const char* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (ec != std::errc() || ptr != end || value < 1) {
    return std::nullopt;
  }
  return value;
}

std::string describe(const domain::Signal& s) {
  std::ostringstream out;
  out << "#" << s.id << " " << toString(s.direction) << " " << s.symbol
      << " @";
  for (double e : s.entries) {
    out << " " << e;
  }
  if (s.stop_loss) {
    out << " SL " << *s.stop_loss;
  }
  if (!s.take_profits.empty()) {
    out << " TP";
    for (double tp : s.take_profits) {
      out << " " << tp;
    }
  }
  out << " [" << toString(s.status) << "]";
  if (!s.last_error.empty()) {
    out << " error: " << s.last_error;
  }
  return out.str();
}

std::string describe(const domain::Ticket& t) {
  std::ostringstream out;
  out << "ticket " << t.id << " signal " << t.signal_id << " "
      << toString(t.kind) << " " << toString(t.direction) << " " << t.symbol
      << " " << t.volume << " @ " << t.open_price;
  if (t.stop_loss) {
    out << " SL " << *t.stop_loss;
  }
  if (t.take_profit) {
    out << " TP " << *t.take_profit;
  }
  out << " [" << toString(t.state) << "]";
  return out.str();
}

std::string describe(const ChannelStats& c) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(2);
  out << c.channel_id << ": " << c.total_positions << " positions ("
      << c.open_positions << " open, " << c.closed_positions << " closed)\n"
      << "  won " << c.winning_positions << " lost " << c.losing_positions
      << " win rate " << c.win_rate << "%\n"
      << "  net " << c.net_profit << " profit " << c.total_profit << " loss "
      << c.total_loss << " factor " << c.profit_factor << "\n"
      << "  best " << c.largest_win << " worst " << c.largest_loss
      << " avg win " << c.average_win << " avg loss " << c.average_loss
      << "\n"
      << "  drawdown max " << c.max_drawdown << " now " << c.current_drawdown
      << " volume " << c.total_volume << "\n";
  return out.str();
}

std::string describe(const TradeSummary& t) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(2);
  if (t.account) {
    out << "balance " << t.account->balance << " equity " << t.account->equity
        << " P&L " << t.floating_profit << " (" << t.floating_profit_pct
        << "%)\n"
        << "margin " << t.account->margin << " free "
        << t.account->freeMargin() << "\n";
  } else {
    out << "account unavailable\n";
  }
  out << "signals " << t.active_signals << " positions " << t.open_positions
      << " orders " << t.pending_orders << " realized " << t.realized_profit
      << "\n";
  return out.str();
}

ConsoleReply reply(const ConsoleSession& s, std::string text, bool ok = true) {
  return ConsoleReply{ok, std::move(text), s.state};
}

}  // namespace

const char* toString(ConsoleState state) {
  switch (state) {
    case ConsoleState::MainMenu:      return "MainMenu";
    case ConsoleState::ViewingSignal: return "ViewingSignal";
    case ConsoleState::AwaitingValue: return "AwaitingValue";
  }
  return "Unknown";
}

const char* toString(AwaitedValue value) {
  switch (value) {
    case AwaitedValue::StopLoss:   return "StopLoss";
    case AwaitedValue::TakeProfit: return "TakeProfit";
    case AwaitedValue::TesterText: return "TesterText";
  }
  return "Unknown";
}

ConsoleSessionManager::ConsoleSessionManager(OperatorApi& api,
                                             bool decimal_comma)
    : api_(api), decimal_comma_(decimal_comma) {}

ConsoleReply ConsoleSessionManager::handle(const std::string& user_id,
                                           const std::string& input) {
  std::lock_guard lock(mutex_);
  ConsoleSession& s = sessions_[user_id];

  const std::string line = trim(input);
  const auto space = line.find(' ');
  const std::string verb = asciiLower(line.substr(0, space));
  const std::string arg =
      space == std::string::npos ? std::string() : trim(line.substr(space + 1));

  if (verb == "menu") {
    s = ConsoleSession{};
    return reply(s, kMainHelp);
  }

  if (s.state == ConsoleState::AwaitingValue) {
    if (verb == "cancel" || verb == "back") {
      s.state = s.signal_id != 0 && s.awaiting != AwaitedValue::TesterText
                    ? ConsoleState::ViewingSignal
                    : ConsoleState::MainMenu;
      return reply(s, "cancelled");
    }
    return onValue(user_id, s, line);
  }
  if (s.state == ConsoleState::ViewingSignal) {
    return onSignalInput(user_id, s, verb, arg);
  }
  return onMainInput(user_id, s, verb, arg);
}

std::optional<ConsoleSession> ConsoleSessionManager::session(
    const std::string& user_id) const {
  std::lock_guard lock(mutex_);
  auto it = sessions_.find(user_id);
  if (it == sessions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void ConsoleSessionManager::reset(const std::string& user_id) {
  std::lock_guard lock(mutex_);
  sessions_.erase(user_id);
}

ConsoleReply ConsoleSessionManager::onMainInput(const std::string&,
                                                ConsoleSession& s,
                                                const std::string& verb,
                                                const std::string& arg) {
  if (verb == "signals") {
    const auto signals = api_.listActiveSignals();
    if (signals.empty()) {
      return reply(s, "no active signals");
    }
    std::ostringstream out;
    for (const auto& sig : signals) {
      out << describe(sig) << "\n";
    }
    return reply(s, out.str());
  }
  if (verb == "positions") {
    const auto positions = api_.listOpenPositions();
    if (positions.empty()) {
      return reply(s, "no open positions");
    }
    std::ostringstream out;
    for (const auto& t : positions) {
      out << describe(t) << "\n";
    }
    return reply(s, out.str());
  }
  if (verb == "history") {
    std::size_t limit = 10;
    if (!arg.empty()) {
      const auto n = parsePositiveInteger(arg);
      if (!n) {
        return reply(s, "usage: history [n]", false);
      }
      limit = static_cast<std::size_t>(*n);
    }
    std::ostringstream out;
    for (const auto& h : api_.signalHistory(limit)) {
      out << "#" << h.signal_id << " " << toString(h.from) << " -> "
          << toString(h.to) << " (" << h.reason << ")\n";
    }
    const std::string text = out.str();
    return reply(s, text.empty() ? "no history" : text);
  }
  if (verb == "signal") {
    const auto id = parsePositiveInteger(arg);
    if (!id) {
      return reply(s, "usage: signal <id>", false);
    }
    return showSignal(s, static_cast<domain::SignalId>(*id));
  }
  if (verb == "report") {
    if (arg.empty()) {
      return reply(s, "usage: report <channel>", false);
    }
    const ChannelStats stats = api_.channelReport(arg);
    if (stats.total_positions == 0) {
      return reply(s, "no positions for channel " + arg);
    }
    return reply(s, describe(stats));
  }
  if (verb == "compare") {
    const auto all = api_.compareChannels();
    if (all.empty()) {
      return reply(s, "no channel has positions");
    }
    std::ostringstream out;
    out << std::fixed << std::setprecision(2);
    std::size_t rank = 0;
    for (const auto& c : all) {
      out << ++rank << ". " << c.channel_id << " net " << c.net_profit
          << " win rate " << c.win_rate << "% (" << c.total_positions
          << " positions)\n";
    }
    return reply(s, out.str());
  }
  if (verb == "summary") {
    return reply(s, describe(api_.tradeSummary()));
  }
  if (verb == "tester") {
    s.state = ConsoleState::AwaitingValue;
    s.awaiting = AwaitedValue::TesterText;
    return reply(s, "send the message text to test");
  }
  return reply(s, kMainHelp, false);
}

ConsoleReply ConsoleSessionManager::onSignalInput(const std::string& user_id,
                                                  ConsoleSession& s,
                                                  const std::string& verb,
                                                  const std::string& arg) {
  using domain::CommandKind;
  if (verb == "back") {
    s = ConsoleSession{};
    return reply(s, kMainHelp);
  }
  if (verb == "close") {
    return command(user_id, s, CommandKind::Delete);
  }
  if (verb == "half") {
    return command(user_id, s, CommandKind::HalfClose);
  }
  if (verb == "riskfree") {
    return command(user_id, s, CommandKind::RiskFree);
  }
  if (verb == "tp") {
    return command(user_id, s, CommandKind::TakeProfitNow);
  }
  if (verb == "closelot") {
    return closeLot(user_id, s, arg);
  }
  if (verb == "sl" || verb == "tps") {
    s.state = ConsoleState::AwaitingValue;
    s.awaiting = verb == "sl" ? AwaitedValue::StopLoss : AwaitedValue::TakeProfit;
    return reply(s, verb == "sl" ? "send the new stop-loss"
                                 : "send the new take-profits");
  }
  ConsoleReply main = onMainInput(user_id, s, verb, arg);
  if (!main.ok) {
    return reply(s, kSignalHelp, false);
  }
  return main;
}

ConsoleReply ConsoleSessionManager::onValue(const std::string& user_id,
                                            ConsoleSession& s,
                                            const std::string& input) {
  switch (s.awaiting) {
    case AwaitedValue::StopLoss: {
      const auto value = parseNumber(normalizeDigits(input), decimal_comma_);
      if (!value || *value <= 0.0) {
        return reply(s, "not a price: " + input, false);
      }
      s.state = ConsoleState::ViewingSignal;
      return command(user_id, s, domain::CommandKind::Edit, *value);
    }
    case AwaitedValue::TakeProfit: {
      auto values = parseNumberList(normalizeDigits(input), decimal_comma_);
      if (values.empty()) {
        return reply(s, "no prices in: " + input, false);
      }
      s.state = ConsoleState::ViewingSignal;
      return command(user_id, s, domain::CommandKind::Edit, std::nullopt,
                     std::move(values));
    }
    case AwaitedValue::TesterText: {
      s = ConsoleSession{};
      ParseOutcome outcome = api_.testParse(input);
      if (const auto* rejected = std::get_if<domain::ParseRejected>(&outcome)) {
        return reply(s, "rejected: " + rejected->reason);
      }
      return reply(s, "parsed: " + describe(std::get<domain::Signal>(outcome)));
    }
  }
  return reply(s, kMainHelp, false);
}

ConsoleReply ConsoleSessionManager::showSignal(ConsoleSession& s,
                                               domain::SignalId id) {
  const auto signal = api_.findSignal(id);
  if (!signal) {
    return reply(s, "no signal #" + std::to_string(id), false);
  }
  s.state = ConsoleState::ViewingSignal;
  s.signal_id = id;
  std::ostringstream out;
  out << describe(*signal) << "\n";
  for (const auto& t : api_.ticketsFor(id)) {
    out << "  " << describe(t) << "\n";
  }
  out << kSignalHelp;
  return reply(s, out.str());
}

// closelot <ticket> <lots>: the ticket must be an open position of the
// signal being viewed.
ConsoleReply ConsoleSessionManager::closeLot(const std::string& user_id,
                                             ConsoleSession& s,
                                             const std::string& arg) {
  const auto space = arg.find(' ');
  const auto ticket = parsePositiveInteger(arg.substr(0, space));
  std::optional<double> lots;
  if (space != std::string::npos) {
    lots = parseNumber(normalizeDigits(trim(arg.substr(space + 1))),
                       decimal_comma_);
  }
  if (!ticket || !lots || !(*lots > 0.0)) {
    return reply(s, "usage: closelot <ticket> <lots>", false);
  }

  bool open_position = false;
  for (const auto& t : api_.ticketsFor(s.signal_id)) {
    open_position = open_position || (t.id == *ticket && t.isOpenPosition());
  }
  if (!open_position) {
    return reply(s, "no open position " + std::to_string(*ticket) +
                        " on signal #" + std::to_string(s.signal_id), false);
  }

  if (!api_.closeVolume(user_id, s.signal_id, *ticket, *lots)) {
    return reply(s, "command refused: ingestion halted", false);
  }
  std::ostringstream out;
  out << "closing " << *lots << " lots of ticket " << *ticket;
  return reply(s, out.str());
}

ConsoleReply ConsoleSessionManager::command(const std::string& user_id,
                                            ConsoleSession& s,
                                            domain::CommandKind kind,
                                            std::optional<double> stop_loss,
                                            std::vector<double> take_profits) {
  const bool accepted = api_.issueCommand(user_id, s.signal_id, kind,
                                          stop_loss, std::move(take_profits));
  if (!accepted) {
    return reply(s, "command refused: ingestion halted", false);
  }
  return reply(s, std::string(toString(kind)) + " sent for signal #" +
                      std::to_string(s.signal_id));
}

}  // namespace sigtrader
