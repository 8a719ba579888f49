#include "sigtrader/console/operator_api.hpp"

#include "sigtrader/domain/errors.hpp"

#include <iostream>
#include <utility>

namespace sigtrader {

OperatorApi::OperatorApi(const ISignalStore& store, const SignalParser& parser,
                         const ITimeProvider& clock, CommandSubmitter submit,
                         AccountReader read_account)
    : store_(store),
      parser_(parser),
      clock_(clock),
      submit_(std::move(submit)),
      read_account_(std::move(read_account)) {}

std::vector<domain::Signal> OperatorApi::listActiveSignals() const {
  return store_.snapshot()->activeSignals();
}

std::vector<domain::Ticket> OperatorApi::listOpenPositions() const {
  return store_.snapshot()->openPositions();
}

std::vector<domain::SignalHistoryEntry> OperatorApi::signalHistory(
    std::size_t limit) const {
  return store_.snapshot()->recentHistory(limit);
}

std::optional<domain::Signal> OperatorApi::findSignal(domain::SignalId id) const {
  auto snap = store_.snapshot();
  if (const domain::Signal* s = snap->findSignal(id)) {
    return *s;
  }
  return std::nullopt;
}

std::vector<domain::Ticket> OperatorApi::ticketsFor(domain::SignalId id) const {
  return store_.snapshot()->ticketsFor(id);
}

bool OperatorApi::issueCommand(const std::string& operator_id,
                               domain::SignalId target,
                               domain::CommandKind kind,
                               std::optional<double> new_stop_loss,
                               std::vector<double> new_take_profits) {
  domain::Command command;
  command.kind = kind;
  command.target = target;
  command.new_stop_loss = new_stop_loss;
  command.new_take_profits = std::move(new_take_profits);
  return submit(operator_id, std::move(command));
}

bool OperatorApi::closeVolume(const std::string& operator_id,
                              domain::SignalId target, domain::TicketId ticket,
                              double volume) {
  domain::Command command;
  command.kind = domain::CommandKind::CloseVolume;
  command.target = target;
  command.ticket_id = ticket;
  command.volume = volume;
  return submit(operator_id, std::move(command));
}

bool OperatorApi::submit(const std::string& operator_id,
                         domain::Command command) {
  command.origin = domain::CommandOrigin::Console;
  command.source.channel_id = "console:" + operator_id;
  command.source.message_id =
      clock_.now_ms() * 1000 + static_cast<std::int64_t>(seq_.fetch_add(1) % 1000);

  const bool accepted = submit_ && submit_(command);
  std::cout << "[OperatorApi] " << operator_id << " " << toString(command.kind)
            << " on signal " << command.target
            << (accepted ? " submitted" : " refused") << "\n";
  return accepted;
}

ChannelStats OperatorApi::channelReport(const std::string& channel_id,
                                        const ReportWindow& window) const {
  return ChannelReport::analyze(*store_.snapshot(), channel_id, window);
}

std::vector<ChannelStats> OperatorApi::compareChannels(
    std::size_t min_positions, const ReportWindow& window) const {
  return ChannelReport::compare(*store_.snapshot(), min_positions, window);
}

TradeSummary OperatorApi::tradeSummary() const {
  TradeSummary summary;
  auto snap = store_.snapshot();
  summary.active_signals = snap->activeSignals().size();
  for (const auto& [id, t] : snap->tickets) {
    summary.realized_profit += t.realized_profit;
    if (t.isOpenPosition()) {
      ++summary.open_positions;
    } else if (t.isPendingOrder()) {
      ++summary.pending_orders;
    }
  }

  if (!read_account_) {
    return summary;
  }
  try {
    summary.account = read_account_();
  } catch (const domain::VenueError& e) {
    std::cerr << "[OperatorApi] account state unavailable: " << e.what() << "\n";
    return summary;
  }
  summary.floating_profit = summary.account->equity - summary.account->balance;
  if (summary.account->balance > 0.0) {
    summary.floating_profit_pct =
        100.0 * summary.floating_profit / summary.account->balance;
  }
  return summary;
}

ParseOutcome OperatorApi::testParse(const std::string& text) const {
  return parser_.parse(text);
}

}  // namespace sigtrader
