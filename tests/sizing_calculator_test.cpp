// =============================================================================
// sizing_calculator_test.cpp
// =============================================================================
// Unit tests for SizingCalculator.
//
// Validates:
//   - Fixed, percent-of-balance and risk-percent volumes
//   - Floor to the instrument's volume step, never clamped into range
//   - Dual-entry split by ratio
//   - Market / Limit / Stop selection against the current quote
//   - Typed rejections: not tradable, below minimum, insufficient margin,
//     missing stop-loss
// =============================================================================

#include "sigtrader/risk/sizing_calculator.hpp"

#include <gtest/gtest.h>

#include <variant>
#include <vector>

using sigtrader::SizingCalculator;
using sigtrader::SizingConfig;
using sigtrader::SizingMode;
using sigtrader::domain::OrderParams;
using sigtrader::domain::OrderType;
using sigtrader::domain::SizingRejected;
using sigtrader::domain::SizingRejectKind;

class SizingCalculatorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    signal.id = 12;
    signal.symbol = "EURUSD";
    signal.direction = sigtrader::domain::Direction::Buy;
    signal.entries = {1.0850};
    signal.stop_loss = 1.0800;
    signal.take_profits = {1.0900, 1.0950};

    account.balance = 10000.0;
    account.equity = 10000.0;
    account.margin = 0.0;

    instrument.symbol = "EURUSD";
    instrument.contract_size = 100000.0;
    instrument.min_volume = 0.01;
    instrument.max_volume = 50.0;
    instrument.volume_step = 0.01;
    instrument.bid = 1.0858;
    instrument.ask = 1.0860;
    instrument.margin_rate = 0.01;
  }

  std::vector<OrderParams> sized(const SizingConfig& cfg) {
    auto outcome = SizingCalculator(cfg).size(signal, account, instrument);
    if (const auto* rejected = std::get_if<SizingRejected>(&outcome)) {
      ADD_FAILURE() << "rejected: " << toString(rejected->kind) << " "
                    << rejected->detail;
      return {};
    }
    return std::get<std::vector<OrderParams>>(outcome);
  }

  SizingRejectKind rejection(const SizingConfig& cfg) {
    auto outcome = SizingCalculator(cfg).size(signal, account, instrument);
    const auto* rejected = std::get_if<SizingRejected>(&outcome);
    EXPECT_NE(rejected, nullptr);
    return rejected ? rejected->kind : SizingRejectKind::InvalidConfiguration;
  }

  static SizingConfig fixed(double volume) {
    SizingConfig cfg;
    cfg.mode = SizingMode::Fixed;
    cfg.value = volume;
    return cfg;
  }

  sigtrader::domain::Signal signal;
  sigtrader::domain::AccountState account;
  sigtrader::domain::InstrumentInfo instrument;
};

TEST_F(SizingCalculatorTest, FixedVolumeBecomesOneLimitOrder) {
  auto orders = sized(fixed(0.1));

  ASSERT_EQ(orders.size(), 1u);
  const OrderParams& o = orders[0];
  EXPECT_DOUBLE_EQ(o.volume, 0.1);
  EXPECT_EQ(o.type, OrderType::Limit);  // entry below the ask
  EXPECT_DOUBLE_EQ(o.price, 1.0850);
  ASSERT_TRUE(o.stop_loss.has_value());
  EXPECT_DOUBLE_EQ(*o.stop_loss, 1.0800);
  ASSERT_TRUE(o.take_profit.has_value());
  EXPECT_DOUBLE_EQ(*o.take_profit, 1.0950);
  EXPECT_EQ(o.client_tag, "sig:12:0");
}

TEST_F(SizingCalculatorTest, RiskPercentUsesStopDistance) {
  SizingConfig cfg;
  cfg.mode = SizingMode::RiskPercent;
  cfg.value = 1.0;  // 100 of 10000 at risk over 50 pips of 100000 units

  auto orders = sized(cfg);
  ASSERT_EQ(orders.size(), 1u);
  EXPECT_DOUBLE_EQ(orders[0].volume, 0.2);
}

TEST_F(SizingCalculatorTest, PercentOfBalanceUsesNotional) {
  instrument.contract_size = 1.0;
  instrument.volume_step = 1.0;
  instrument.min_volume = 1.0;
  instrument.max_volume = 0.0;
  signal.entries = {100.0};
  signal.stop_loss = 90.0;
  signal.take_profits = {110.0};
  instrument.ask = 100.5;
  instrument.bid = 100.4;

  SizingConfig cfg;
  cfg.mode = SizingMode::PercentOfBalance;
  cfg.value = 5.0;  // 500 notional at 100 each

  auto orders = sized(cfg);
  ASSERT_EQ(orders.size(), 1u);
  EXPECT_DOUBLE_EQ(orders[0].volume, 5.0);
}

TEST_F(SizingCalculatorTest, VolumeIsFlooredToStep) {
  instrument.volume_step = 0.1;
  auto orders = sized(fixed(0.37));
  ASSERT_EQ(orders.size(), 1u);
  EXPECT_DOUBLE_EQ(orders[0].volume, 0.3);
  EXPECT_DOUBLE_EQ(SizingCalculator::floorToStep(0.3, 0.1), 0.3);
}

TEST_F(SizingCalculatorTest, DualEntrySplitsByRatio) {
  signal.entries = {1.0850, 1.0840};
  SizingConfig cfg = fixed(0.3);
  cfg.dual_entry_enabled = true;
  cfg.dual_entry_ratio = 0.5;

  auto orders = sized(cfg);
  ASSERT_EQ(orders.size(), 2u);
  EXPECT_DOUBLE_EQ(orders[0].volume, 0.15);
  EXPECT_DOUBLE_EQ(orders[1].volume, 0.15);
  EXPECT_DOUBLE_EQ(orders[0].price, 1.0850);
  EXPECT_DOUBLE_EQ(orders[1].price, 1.0840);
  EXPECT_EQ(orders[1].leg, 1);
  EXPECT_EQ(orders[1].client_tag, "sig:12:1");
}

TEST_F(SizingCalculatorTest, CloseEntryIsSentAtMarket) {
  SizingConfig cfg = fixed(0.1);
  cfg.closer_price = 0.0015;

  auto orders = sized(cfg);
  ASSERT_EQ(orders.size(), 1u);
  EXPECT_EQ(orders[0].type, OrderType::Market);
  EXPECT_DOUBLE_EQ(orders[0].price, instrument.ask);
}

TEST_F(SizingCalculatorTest, EntryBeyondQuoteIsAStopOrder) {
  signal.entries = {1.0870};
  signal.take_profits = {1.0950};
  auto orders = sized(fixed(0.1));
  ASSERT_EQ(orders.size(), 1u);
  EXPECT_EQ(orders[0].type, OrderType::Stop);

  signal.direction = sigtrader::domain::Direction::Sell;
  signal.entries = {1.0840};
  signal.stop_loss = 1.0900;
  signal.take_profits = {1.0800};
  orders = sized(fixed(0.1));
  ASSERT_EQ(orders.size(), 1u);
  EXPECT_EQ(orders[0].type, OrderType::Stop);
}

TEST_F(SizingCalculatorTest, TypedRejections) {
  instrument.min_volume = 0.1;
  EXPECT_EQ(rejection(fixed(0.05)), SizingRejectKind::BelowMinimumVolume);
  instrument.min_volume = 0.01;

  EXPECT_EQ(rejection(fixed(0.001)), SizingRejectKind::VolumeRoundsToZero);

  instrument.margin_rate = 1.0;
  EXPECT_EQ(rejection(fixed(1.0)), SizingRejectKind::InsufficientMargin);
  instrument.margin_rate = 0.01;

  instrument.tradable = false;
  EXPECT_EQ(rejection(fixed(0.1)), SizingRejectKind::SymbolNotTradable);
  instrument.tradable = true;

  signal.stop_loss.reset();
  SizingConfig risk;
  risk.mode = SizingMode::RiskPercent;
  EXPECT_EQ(rejection(risk), SizingRejectKind::MissingStopLoss);
}

TEST_F(SizingCalculatorTest, AboveMaximumIsRejectedNotClamped) {
  EXPECT_EQ(rejection(fixed(60.0)), SizingRejectKind::AboveMaximumVolume);
}
