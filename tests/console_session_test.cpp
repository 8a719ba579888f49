// =============================================================================
// console_session_test.cpp
// =============================================================================
// Tests for OperatorApi and the ConsoleSessionManager menu state machine.
//
// Validates:
//   - Reads come from the store snapshot
//   - Menu navigation: MainMenu -> ViewingSignal -> AwaitingValue and back
//   - Signal actions become Console commands with unique source keys
//   - Free-text stop-loss / take-profit input, including decimal commas
//   - The parse tester has no side effects
//   - Unknown input keeps the state; refused commands are reported
//   - Channel report, channel comparison and trade summary screens
//   - Custom-lot close of one position
// =============================================================================

#include "sigtrader/config/engine_config.hpp"
#include "sigtrader/console/console_session.hpp"
#include "sigtrader/console/operator_api.hpp"
#include "sigtrader/domain/errors.hpp"
#include "sigtrader/parser/signal_parser.hpp"
#include "sigtrader/parser/symbol_resolver.hpp"
#include "sigtrader/store/in_memory_signal_store.hpp"
#include "sigtrader/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

using sigtrader::ConsoleReply;
using sigtrader::ConsoleState;
using sigtrader::domain::Command;
using sigtrader::domain::CommandKind;
using sigtrader::domain::MessageKey;
using sigtrader::domain::SignalStatus;

namespace {

bool contains(const std::string& text, const std::string& part) {
  return text.find(part) != std::string::npos;
}

}  // namespace

class ConsoleSessionTest : public ::testing::Test {
 protected:
  void SetUp() override {
    resolver = std::make_unique<sigtrader::AliasSymbolResolver>(
        config.parser.symbol_aliases);
    parser = std::make_unique<sigtrader::SignalParser>(config.parser, *resolver);
    api = std::make_unique<sigtrader::OperatorApi>(
        store, *parser, clock, [this](const Command& c) {
          submitted.push_back(c);
          return accept;
        });
    console = std::make_unique<sigtrader::ConsoleSessionManager>(*api);

    sigtrader::domain::Signal s;
    s.id = 1;
    s.symbol = "EURUSD";
    s.entries = {1.0850};
    s.stop_loss = 1.0800;
    s.take_profits = {1.0900};
    store.createSignal(s, MessageKey{"chan", 10, ""});
    s.status = SignalStatus::Open;
    store.saveSignal(s, sigtrader::domain::SignalHistoryEntry{
                            1, SignalStatus::Pending, SignalStatus::Open,
                            "placed", 5000});

    sigtrader::domain::Ticket t;
    t.id = 1000;
    t.signal_id = 1;
    t.symbol = "EURUSD";
    t.volume = t.initial_volume = 0.2;
    t.open_price = 1.0850;
    t.kind = sigtrader::domain::TicketKind::Position;
    t.filled = true;
    store.saveTicket(t);
  }

  // Signal `id` from `channel` with one closed position worth `pnl`.
  void addClosedTrade(sigtrader::domain::SignalId id, const std::string& channel,
                      double pnl) {
    sigtrader::domain::Signal s;
    s.id = id;
    s.symbol = "EURUSD";
    s.entries = {1.0850};
    s.status = SignalStatus::Closed;
    s.source = MessageKey{channel, static_cast<std::int64_t>(id), ""};
    store.createSignal(s, s.source);

    sigtrader::domain::Ticket t;
    t.id = 2000 + id;
    t.signal_id = id;
    t.symbol = "EURUSD";
    t.initial_volume = 0.1;
    t.kind = sigtrader::domain::TicketKind::Position;
    t.state = sigtrader::domain::TicketState::Closed;
    t.filled = true;
    t.realized_profit = pnl;
    t.closed_at_ms = 4000 + static_cast<std::int64_t>(id);
    store.saveTicket(t);
  }

  ConsoleReply send(const std::string& input) { return console->handle("u", input); }

  ConsoleState state() {
    auto s = console->session("u");
    return s ? s->state : ConsoleState::MainMenu;
  }

  sigtrader::EngineConfig config = sigtrader::defaultConfig();
  sigtrader::SimulationTimeProvider clock{5000};
  sigtrader::InMemorySignalStore store;
  std::unique_ptr<sigtrader::AliasSymbolResolver> resolver;
  std::unique_ptr<sigtrader::SignalParser> parser;
  std::unique_ptr<sigtrader::OperatorApi> api;
  std::unique_ptr<sigtrader::ConsoleSessionManager> console;

  std::vector<Command> submitted;
  bool accept{true};
};

TEST_F(ConsoleSessionTest, OperatorApiReadsSnapshot) {
  EXPECT_EQ(api->listActiveSignals().size(), 1u);
  EXPECT_EQ(api->listOpenPositions().size(), 1u);
  EXPECT_EQ(api->signalHistory(10).size(), 1u);
  EXPECT_TRUE(api->findSignal(1).has_value());
  EXPECT_FALSE(api->findSignal(2).has_value());
  EXPECT_EQ(api->ticketsFor(1).size(), 1u);
}

TEST_F(ConsoleSessionTest, OperatorCommandsGetUniqueConsoleKeys) {
  ASSERT_TRUE(api->issueCommand("alice", 1, CommandKind::RiskFree));
  ASSERT_TRUE(api->issueCommand("alice", 1, CommandKind::RiskFree));

  ASSERT_EQ(submitted.size(), 2u);
  EXPECT_EQ(submitted[0].origin, sigtrader::domain::CommandOrigin::Console);
  EXPECT_EQ(submitted[0].target, 1u);
  EXPECT_EQ(submitted[0].source.channel_id, "console:alice");
  EXPECT_EQ(submitted[0].source.message_id, 5000 * 1000);
  EXPECT_NE(submitted[0].source, submitted[1].source);
}

TEST_F(ConsoleSessionTest, NewUserStartsInMainMenu) {
  EXPECT_FALSE(console->session("u").has_value());

  ConsoleReply r = send("signals");
  EXPECT_TRUE(r.ok);
  EXPECT_EQ(r.state, ConsoleState::MainMenu);
  EXPECT_TRUE(contains(r.text, "#1 Buy EURUSD"));
  EXPECT_TRUE(contains(r.text, "[Open]"));

  EXPECT_TRUE(contains(send("positions").text, "ticket 1000"));
  EXPECT_TRUE(contains(send("history 5").text, "#1 Pending -> Open (placed)"));
}

TEST_F(ConsoleSessionTest, UnknownInputKeepsState) {
  ConsoleReply r = send("dance");
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.state, ConsoleState::MainMenu);
  EXPECT_TRUE(contains(r.text, "signal <id>"));

  EXPECT_FALSE(send("history lots").ok);
  EXPECT_FALSE(send("signal abc").ok);
}

TEST_F(ConsoleSessionTest, IdsAndCountsMustBeWholeNumbers) {
  for (const char* bad : {"1e30", "1.5", "-1", "0", "99999999999999999999999"}) {
    ConsoleReply history = send(std::string("history ") + bad);
    EXPECT_FALSE(history.ok) << bad;
    EXPECT_EQ(history.text, "usage: history [n]") << bad;

    ConsoleReply signal = send(std::string("signal ") + bad);
    EXPECT_FALSE(signal.ok) << bad;
    EXPECT_EQ(signal.text, "usage: signal <id>") << bad;
    EXPECT_EQ(signal.state, ConsoleState::MainMenu);
  }
  EXPECT_TRUE(send("history 2").ok);
  EXPECT_TRUE(send("signal 1").ok);
}

TEST_F(ConsoleSessionTest, ViewingSignalAndSendingCommands) {
  ConsoleReply r = send("signal 1");
  EXPECT_TRUE(r.ok);
  EXPECT_EQ(r.state, ConsoleState::ViewingSignal);
  EXPECT_TRUE(contains(r.text, "ticket 1000"));

  r = send("half");
  EXPECT_TRUE(r.ok);
  EXPECT_TRUE(contains(r.text, "HalfClose sent for signal #1"));
  r = send("close");
  EXPECT_TRUE(r.ok);

  ASSERT_EQ(submitted.size(), 2u);
  EXPECT_EQ(submitted[0].kind, CommandKind::HalfClose);
  EXPECT_EQ(submitted[1].kind, CommandKind::Delete);
  EXPECT_EQ(submitted[1].source.channel_id, "console:u");
  EXPECT_EQ(state(), ConsoleState::ViewingSignal);

  // Main-menu inputs still work while viewing a signal.
  EXPECT_TRUE(send("signals").ok);
  EXPECT_EQ(send("back").state, ConsoleState::MainMenu);
}

TEST_F(ConsoleSessionTest, MissingSignalStaysInMainMenu) {
  ConsoleReply r = send("signal 99");
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.text, "no signal #99");
  EXPECT_EQ(r.state, ConsoleState::MainMenu);
}

TEST_F(ConsoleSessionTest, StopLossInput) {
  send("signal 1");
  EXPECT_EQ(send("sl").state, ConsoleState::AwaitingValue);

  ConsoleReply bad = send("soon");
  EXPECT_FALSE(bad.ok);
  EXPECT_EQ(bad.state, ConsoleState::AwaitingValue);

  ConsoleReply r = send("1.0790");
  EXPECT_TRUE(r.ok);
  EXPECT_EQ(r.state, ConsoleState::ViewingSignal);
  ASSERT_EQ(submitted.size(), 1u);
  EXPECT_EQ(submitted[0].kind, CommandKind::Edit);
  ASSERT_TRUE(submitted[0].new_stop_loss.has_value());
  EXPECT_DOUBLE_EQ(*submitted[0].new_stop_loss, 1.0790);
}

TEST_F(ConsoleSessionTest, DecimalCommaStopLoss) {
  console = std::make_unique<sigtrader::ConsoleSessionManager>(*api, true);
  send("signal 1");
  send("sl");
  ASSERT_TRUE(send("1,0790").ok);
  ASSERT_EQ(submitted.size(), 1u);
  EXPECT_DOUBLE_EQ(*submitted[0].new_stop_loss, 1.0790);
}

TEST_F(ConsoleSessionTest, TakeProfitListInput) {
  send("signal 1");
  send("tps");
  ConsoleReply r = send("1.0990 / 1.1010");
  EXPECT_TRUE(r.ok);
  ASSERT_EQ(submitted.size(), 1u);
  ASSERT_EQ(submitted[0].new_take_profits.size(), 2u);
  EXPECT_DOUBLE_EQ(submitted[0].new_take_profits[0], 1.0990);
  EXPECT_DOUBLE_EQ(submitted[0].new_take_profits[1], 1.1010);
  EXPECT_FALSE(submitted[0].new_stop_loss.has_value());
}

TEST_F(ConsoleSessionTest, CancelAndMenuLeaveValueInput) {
  send("signal 1");
  send("sl");
  EXPECT_EQ(send("cancel").state, ConsoleState::ViewingSignal);

  send("tps");
  EXPECT_EQ(send("menu").state, ConsoleState::MainMenu);
  EXPECT_EQ(console->session("u")->signal_id, 0u);
  EXPECT_TRUE(submitted.empty());
}

TEST_F(ConsoleSessionTest, ParseTesterHasNoSideEffects) {
  EXPECT_EQ(send("tester").state, ConsoleState::AwaitingValue);
  ConsoleReply r = send("SELL GOLD @ 2350 SL 2360 TP 2340");
  EXPECT_TRUE(r.ok);
  EXPECT_EQ(r.state, ConsoleState::MainMenu);
  EXPECT_TRUE(contains(r.text, "parsed: "));
  EXPECT_TRUE(contains(r.text, "Sell XAUUSD"));

  send("tester");
  r = send("EURUSD looks strong today");
  EXPECT_EQ(r.text, "rejected: missing_field(direction)");

  EXPECT_TRUE(submitted.empty());
  EXPECT_EQ(store.snapshot()->signals.size(), 1u);
}

TEST_F(ConsoleSessionTest, RefusedCommandIsReported) {
  accept = false;
  send("signal 1");
  ConsoleReply r = send("riskfree");
  EXPECT_FALSE(r.ok);
  EXPECT_TRUE(contains(r.text, "command refused"));
}

TEST_F(ConsoleSessionTest, SessionsAreIndependent) {
  send("signal 1");
  EXPECT_EQ(console->handle("other", "signals").state, ConsoleState::MainMenu);
  EXPECT_EQ(state(), ConsoleState::ViewingSignal);

  console->reset("u");
  EXPECT_FALSE(console->session("u").has_value());
}

TEST_F(ConsoleSessionTest, ChannelReportAndComparison) {
  addClosedTrade(2, "vip", 25.0);
  addClosedTrade(3, "vip", -5.0);
  addClosedTrade(4, "free", -10.0);

  ConsoleReply r = send("report vip");
  EXPECT_TRUE(r.ok);
  EXPECT_TRUE(contains(r.text, "vip: 2 positions (0 open, 2 closed)"));
  EXPECT_TRUE(contains(r.text, "win rate 50.00%"));
  EXPECT_TRUE(contains(r.text, "net 20.00"));
  EXPECT_TRUE(contains(r.text, "factor 5.00"));

  EXPECT_EQ(send("report nowhere").text, "no positions for channel nowhere");
  EXPECT_FALSE(send("report").ok);

  r = send("compare");
  EXPECT_TRUE(r.ok);
  const auto vip = r.text.find("1. vip net 20.00");
  const auto free = r.text.find("2. free net -10.00");
  EXPECT_NE(vip, std::string::npos);
  EXPECT_NE(free, std::string::npos);

  EXPECT_EQ(api->compareChannels(2).size(), 1u);
  EXPECT_TRUE(submitted.empty());
}

TEST_F(ConsoleSessionTest, TradeSummaryWithoutAndWithAccount) {
  addClosedTrade(2, "vip", 25.0);

  ConsoleReply r = send("summary");
  EXPECT_TRUE(r.ok);
  EXPECT_TRUE(contains(r.text, "account unavailable"));
  EXPECT_TRUE(contains(r.text, "positions 1 orders 0 realized 25.00"));

  sigtrader::OperatorApi with_account(
      store, *parser, clock, [](const Command&) { return true; }, [] {
        sigtrader::domain::AccountState a;
        a.balance = 1000.0;
        a.equity = 1050.0;
        a.margin = 200.0;
        return a;
      });
  const sigtrader::TradeSummary summary = with_account.tradeSummary();
  ASSERT_TRUE(summary.account.has_value());
  EXPECT_DOUBLE_EQ(summary.floating_profit, 50.0);
  EXPECT_DOUBLE_EQ(summary.floating_profit_pct, 5.0);
  EXPECT_EQ(summary.active_signals, 1u);
  EXPECT_EQ(summary.open_positions, 1u);

  sigtrader::ConsoleSessionManager console2(with_account);
  r = console2.handle("u", "summary");
  EXPECT_TRUE(contains(r.text, "balance 1000.00 equity 1050.00 P&L 50.00 (5.00%)"));
  EXPECT_TRUE(contains(r.text, "margin 200.00 free 850.00"));

  sigtrader::OperatorApi offline(
      store, *parser, clock, [](const Command&) { return true; },
      []() -> sigtrader::domain::AccountState {
        throw sigtrader::domain::VenueError(
            sigtrader::domain::VenueErrorKind::Unavailable, "down");
      });
  EXPECT_FALSE(offline.tradeSummary().account.has_value());
}

TEST_F(ConsoleSessionTest, CloseLotSendsCloseVolume) {
  send("signal 1");

  ConsoleReply r = send("closelot 1000 0.05");
  EXPECT_TRUE(r.ok);
  EXPECT_EQ(r.text, "closing 0.05 lots of ticket 1000");
  ASSERT_EQ(submitted.size(), 1u);
  EXPECT_EQ(submitted[0].kind, CommandKind::CloseVolume);
  EXPECT_EQ(submitted[0].target, 1u);
  EXPECT_EQ(submitted[0].ticket_id, 1000u);
  EXPECT_DOUBLE_EQ(submitted[0].volume, 0.05);
  EXPECT_EQ(submitted[0].origin, sigtrader::domain::CommandOrigin::Console);

  for (const char* bad : {"closelot", "closelot 1000", "closelot 1000 -1",
                          "closelot 1.5 0.05", "closelot 1000 lots"}) {
    ConsoleReply usage = send(bad);
    EXPECT_FALSE(usage.ok) << bad;
    EXPECT_EQ(usage.text, "usage: closelot <ticket> <lots>") << bad;
  }
  EXPECT_FALSE(send("closelot 77 0.05").ok);
  EXPECT_EQ(submitted.size(), 1u);
  EXPECT_EQ(state(), ConsoleState::ViewingSignal);
}
