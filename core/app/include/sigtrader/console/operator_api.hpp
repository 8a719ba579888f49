#pragma once

#include "sigtrader/domain/command.hpp"
#include "sigtrader/domain/signal.hpp"
#include "sigtrader/domain/ticket.hpp"
#include "sigtrader/domain/venue_types.hpp"
#include "sigtrader/parser/signal_parser.hpp"
#include "sigtrader/report/channel_report.hpp"
#include "sigtrader/store/i_signal_store.hpp"
#include "sigtrader/time/i_time_provider.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace sigtrader {

// Account and book overview for the console summary screen.
struct TradeSummary {
  std::optional<domain::AccountState> account;  // nullopt: venue unreachable
  double floating_profit{0.0};      // equity - balance
  double floating_profit_pct{0.0};  // of balance
  double realized_profit{0.0};      // sum over every stored ticket
  std::size_t active_signals{0};
  std::size_t open_positions{0};
  std::size_t pending_orders{0};
};

// -----------------------------------------------------------------------------
// OperatorApi
// -----------------------------------------------------------------------------
//
// @brief  Read queries and commands for a human operator, independent of
//         any UI toolkit.
//
// @details
// Reads come from the latest store snapshot and never block the engine.
// issueCommand() builds a Command with source key
//   {"console:<operator>", now_ms * 1000 + seq, ""}
// and hands it to the same ingestion command path as channel replies, so it
// is serialized on the signal's lane and recorded as processed like any
// other command.
//
// Reports (channelReport, compareChannels) are pure functions of one
// snapshot. tradeSummary() is the only read that touches the venue, through
// the AccountReader; a failing reader leaves the account fields empty.
//
// Thread-safety: all methods are safe from any thread.
// -----------------------------------------------------------------------------
class OperatorApi {
 public:
  using CommandSubmitter = std::function<bool(const domain::Command&)>;
  using AccountReader = std::function<domain::AccountState()>;

  OperatorApi(const ISignalStore& store, const SignalParser& parser,
              const ITimeProvider& clock, CommandSubmitter submit,
              AccountReader read_account = {});

  std::vector<domain::Signal> listActiveSignals() const;
  std::vector<domain::Ticket> listOpenPositions() const;
  std::vector<domain::SignalHistoryEntry> signalHistory(std::size_t limit) const;
  std::optional<domain::Signal> findSignal(domain::SignalId id) const;
  std::vector<domain::Ticket> ticketsFor(domain::SignalId id) const;

  // @return false if the engine refused the command (ingestion halted or
  //         not running).
  bool issueCommand(const std::string& operator_id, domain::SignalId target,
                    domain::CommandKind kind,
                    std::optional<double> new_stop_loss = std::nullopt,
                    std::vector<double> new_take_profits = {});

  // Closes `volume` lots of one position of `target`.
  bool closeVolume(const std::string& operator_id, domain::SignalId target,
                   domain::TicketId ticket, double volume);

  ChannelStats channelReport(const std::string& channel_id,
                             const ReportWindow& window = {}) const;
  std::vector<ChannelStats> compareChannels(std::size_t min_positions = 1,
                                            const ReportWindow& window = {}) const;
  TradeSummary tradeSummary() const;

  // Runs the parser on `text` without side effects.
  ParseOutcome testParse(const std::string& text) const;

 private:
  const ISignalStore& store_;
  const SignalParser& parser_;
  const ITimeProvider& clock_;
  bool submit(const std::string& operator_id, domain::Command command);

  CommandSubmitter submit_;
  AccountReader read_account_;
  std::atomic<std::uint32_t> seq_{0};
};

}  // namespace sigtrader
