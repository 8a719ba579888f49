#pragma once

#include "sigtrader/store/store_snapshot.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace sigtrader {

// Performance of one source channel. Money fields are in account currency;
// losses are reported as positive amounts except largest_loss.
struct ChannelStats {
  std::string channel_id;

  std::size_t total_positions{0};
  std::size_t open_positions{0};
  std::size_t closed_positions{0};
  std::size_t winning_positions{0};
  std::size_t losing_positions{0};

  double total_profit{0.0};
  double total_loss{0.0};
  double net_profit{0.0};
  double largest_win{0.0};
  double largest_loss{0.0};
  double average_win{0.0};
  double average_loss{0.0};

  double win_rate{0.0};       // percent of closed positions
  double profit_factor{0.0};  // 0 when there is no loss

  double max_drawdown{0.0};
  double current_drawdown{0.0};

  double total_volume{0.0};
  std::int64_t first_trade_ms{0};
  std::int64_t last_trade_ms{0};
};

// Inclusive bounds on a position's placement time; 0 leaves a side open.
struct ReportWindow {
  std::int64_t from_ms{0};
  std::int64_t to_ms{0};

  bool contains(std::int64_t t) const {
    return (from_ms == 0 || t >= from_ms) && (to_ms == 0 || t <= to_ms);
  }
};

// -----------------------------------------------------------------------------
// ChannelReport
// -----------------------------------------------------------------------------
//
// @brief  Per-channel trading statistics computed from one store snapshot.
//
// @details
// A position is a ticket that was filled; unfilled orders are ignored. A
// ticket belongs to the channel of the message that created its signal.
//
// Win/loss figures use closed positions only, each counted once with its
// realized profit. Open positions count toward totals and volume.
//
// Drawdown walks the closed positions in closing order:
//   cumulative += pnl;  peak = max(peak, cumulative);
//   max_drawdown = max(max_drawdown, peak - cumulative)
// current_drawdown is peak - cumulative after the last position.
//
// Pure functions of the snapshot; safe from any thread.
// -----------------------------------------------------------------------------
class ChannelReport {
 public:
  static ChannelStats analyze(const StoreSnapshot& snapshot,
                              const std::string& channel_id,
                              const ReportWindow& window = {});

  // Every channel with at least `min_positions` positions, best net profit
  // first.
  static std::vector<ChannelStats> compare(const StoreSnapshot& snapshot,
                                           std::size_t min_positions = 1,
                                           const ReportWindow& window = {});

  // Channels that produced at least one signal, sorted.
  static std::vector<std::string> channels(const StoreSnapshot& snapshot);
};

}  // namespace sigtrader
