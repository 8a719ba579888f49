#include "sigtrader/report/channel_report.hpp"

#include <algorithm>
#include <set>
#include <tuple>
#include <utility>

namespace sigtrader {

namespace {

struct ClosedPnl {
  std::int64_t closed_at_ms;
  domain::TicketId id;
  double pnl;
};

void applyDrawdown(const std::vector<ClosedPnl>& series, ChannelStats& stats) {
  double cumulative = 0.0;
  double peak = 0.0;
  for (const auto& p : series) {
    cumulative += p.pnl;
    peak = std::max(peak, cumulative);
    stats.max_drawdown = std::max(stats.max_drawdown, peak - cumulative);
  }
  stats.current_drawdown = peak - cumulative;
}

}  // namespace

ChannelStats ChannelReport::analyze(const StoreSnapshot& snapshot,
                                    const std::string& channel_id,
                                    const ReportWindow& window) {
  ChannelStats stats;
  stats.channel_id = channel_id;

  std::vector<ClosedPnl> series;
  for (const auto& [id, ticket] : snapshot.tickets) {
    if (!ticket.filled || !window.contains(ticket.placed_at_ms)) {
      continue;
    }
    const domain::Signal* signal = snapshot.findSignal(ticket.signal_id);
    if (signal == nullptr || signal->source.channel_id != channel_id) {
      continue;
    }

    ++stats.total_positions;
    stats.total_volume += ticket.initial_volume;
    if (stats.first_trade_ms == 0 || ticket.placed_at_ms < stats.first_trade_ms) {
      stats.first_trade_ms = ticket.placed_at_ms;
    }
    stats.last_trade_ms = std::max(stats.last_trade_ms, ticket.placed_at_ms);

    if (ticket.isActive()) {
      ++stats.open_positions;
      continue;
    }
    ++stats.closed_positions;
    const double pnl = ticket.realized_profit;
    series.push_back({ticket.closed_at_ms, id, pnl});
    if (pnl > 0.0) {
      ++stats.winning_positions;
      stats.total_profit += pnl;
      stats.largest_win = std::max(stats.largest_win, pnl);
    } else if (pnl < 0.0) {
      ++stats.losing_positions;
      stats.total_loss -= pnl;
      stats.largest_loss = std::min(stats.largest_loss, pnl);
    }
  }

  stats.net_profit = stats.total_profit - stats.total_loss;
  if (stats.closed_positions > 0) {
    stats.win_rate = 100.0 * static_cast<double>(stats.winning_positions) /
                     static_cast<double>(stats.closed_positions);
  }
  if (stats.winning_positions > 0) {
    stats.average_win =
        stats.total_profit / static_cast<double>(stats.winning_positions);
  }
  if (stats.losing_positions > 0) {
    stats.average_loss =
        stats.total_loss / static_cast<double>(stats.losing_positions);
  }
  if (stats.total_loss > 0.0) {
    stats.profit_factor = stats.total_profit / stats.total_loss;
  }

  std::sort(series.begin(), series.end(),
            [](const ClosedPnl& a, const ClosedPnl& b) {
              return std::tie(a.closed_at_ms, a.id) <
                     std::tie(b.closed_at_ms, b.id);
            });
  applyDrawdown(series, stats);
  return stats;
}

std::vector<ChannelStats> ChannelReport::compare(const StoreSnapshot& snapshot,
                                                 std::size_t min_positions,
                                                 const ReportWindow& window) {
  std::vector<ChannelStats> out;
  for (const auto& channel : channels(snapshot)) {
    ChannelStats stats = analyze(snapshot, channel, window);
    if (stats.total_positions >= min_positions) {
      out.push_back(std::move(stats));
    }
  }
  std::stable_sort(out.begin(), out.end(),
                   [](const ChannelStats& a, const ChannelStats& b) {
                     return a.net_profit > b.net_profit;
                   });
  return out;
}

std::vector<std::string> ChannelReport::channels(const StoreSnapshot& snapshot) {
  std::set<std::string> names;
  for (const auto& [id, signal] : snapshot.signals) {
    if (!signal.source.channel_id.empty()) {
      names.insert(signal.source.channel_id);
    }
  }
  return {names.begin(), names.end()};
}

}  // namespace sigtrader
