// =============================================================================
// signal_parser_test.cpp
// =============================================================================
// Unit tests for SignalParser, level rules and the alias symbol resolver,
// run against the built-in pattern tables.
//
// Validates:
//   - The canonical English layout yields a complete Buy / Sell signal
//   - Aliases and slashed pairs resolve to the venue symbol
//   - Persian keywords and digits are understood
//   - Dual-entry extraction only when enabled
//   - Missing fields and inconsistent levels are rejected with a reason
//   - Take-profits are canonicalized (deduplicated, ordered by distance)
//   - extractLevels() for edit instructions
// =============================================================================

#include "sigtrader/config/engine_config.hpp"
#include "sigtrader/parser/level_rules.hpp"
#include "sigtrader/parser/signal_parser.hpp"
#include "sigtrader/parser/symbol_resolver.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <variant>

using sigtrader::domain::Direction;
using sigtrader::domain::ParseRejected;
using sigtrader::domain::Signal;

class SignalParserTest : public ::testing::Test {
 protected:
  void SetUp() override { rebuild(); }

  void rebuild() {
    parser.reset();
    resolver = std::make_unique<sigtrader::AliasSymbolResolver>(
        config.parser.symbol_aliases);
    parser = std::make_unique<sigtrader::SignalParser>(config.parser, *resolver);
  }

  Signal parseOk(const std::string& text) {
    auto outcome = parser->parse(text);
    if (const auto* rejected = std::get_if<ParseRejected>(&outcome)) {
      ADD_FAILURE() << "rejected: " << rejected->reason << " for: " << text;
      return Signal{};
    }
    return std::get<Signal>(outcome);
  }

  std::string rejectReason(const std::string& text) {
    auto outcome = parser->parse(text);
    if (const auto* rejected = std::get_if<ParseRejected>(&outcome)) {
      return rejected->reason;
    }
    return "<accepted>";
  }

  sigtrader::EngineConfig config = sigtrader::defaultConfig();
  std::unique_ptr<sigtrader::AliasSymbolResolver> resolver;
  std::unique_ptr<sigtrader::SignalParser> parser;
};

// -----------------------------------------------------------------------------
// 1. Canonical layout.
// -----------------------------------------------------------------------------
TEST_F(SignalParserTest, ParsesCanonicalBuySignal) {
  Signal s = parseOk("BUY EURUSD @ 1.0850 SL 1.0800 TP 1.0900 1.0950");

  EXPECT_EQ(s.symbol, "EURUSD");
  EXPECT_EQ(s.direction, Direction::Buy);
  ASSERT_EQ(s.entries.size(), 1u);
  EXPECT_DOUBLE_EQ(s.entries[0], 1.0850);
  ASSERT_TRUE(s.stop_loss.has_value());
  EXPECT_DOUBLE_EQ(*s.stop_loss, 1.0800);
  ASSERT_EQ(s.take_profits.size(), 2u);
  EXPECT_DOUBLE_EQ(s.take_profits[0], 1.0900);
  EXPECT_DOUBLE_EQ(s.take_profits[1], 1.0950);
}

TEST_F(SignalParserTest, ParsesSellWithNumberedTargets) {
  Signal s = parseOk(
      "sell gbpusd @ 1.2700\nsl: 1.2750\ntp1: 1.2650\ntp2: 1.2600");

  EXPECT_EQ(s.symbol, "GBPUSD");
  EXPECT_EQ(s.direction, Direction::Sell);
  EXPECT_DOUBLE_EQ(s.firstEntry(), 1.2700);
  ASSERT_EQ(s.take_profits.size(), 2u);
  // Sell targets are ordered from nearest to farthest: descending.
  EXPECT_DOUBLE_EQ(s.take_profits[0], 1.2650);
  EXPECT_DOUBLE_EQ(s.take_profits[1], 1.2600);
}

// A trailing "(target 2)" names a level; the 2 is not a take-profit.
TEST_F(SignalParserTest, BareTargetIndexIsNotAValue) {
  Signal s = parseOk(
      "BUY EURUSD 1.0850 SL 1.0800 TP 1.0900 TP 1.0950 (target 2)");
  ASSERT_EQ(s.take_profits.size(), 2u);
  EXPECT_DOUBLE_EQ(s.take_profits[0], 1.0900);
  EXPECT_DOUBLE_EQ(s.take_profits[1], 1.0950);

  Signal t = parseOk("SELL XAUUSD 2350 SL 2360 TP 2340\nTarget 3");
  ASSERT_EQ(t.take_profits.size(), 1u);
  EXPECT_DOUBLE_EQ(t.take_profits[0], 2340.0);
}

TEST_F(SignalParserTest, ResolvesAliasAndSlashedPair) {
  Signal gold = parseOk("BUY GOLD @ 2350 SL 2340 TP 2360");
  EXPECT_EQ(gold.symbol, "XAUUSD");

  Signal pair = parseOk("SELL EUR/USD @ 1.0850 SL 1.0900");
  EXPECT_EQ(pair.symbol, "EURUSD");
  EXPECT_TRUE(pair.take_profits.empty());
}

TEST_F(SignalParserTest, UnderstandsPersianKeywordsAndDigits) {
  // "خرید EURUSD @ ۱.۰۸۵۰ SL ۱.۰۸۰۰ TP ۱.۰۹۰۰"
  const std::string text =
      "\xD8\xAE\xD8\xB1\xDB\x8C\xD8\xAF EURUSD @ "
      "\xDB\xB1.\xDB\xB0\xDB\xB8\xDB\xB5\xDB\xB0 SL "
      "\xDB\xB1.\xDB\xB0\xDB\xB8\xDB\xB0\xDB\xB0 TP "
      "\xDB\xB1.\xDB\xB0\xDB\xB9\xDB\xB0\xDB\xB0";
  Signal s = parseOk(text);

  EXPECT_EQ(s.direction, Direction::Buy);
  EXPECT_EQ(s.symbol, "EURUSD");
  EXPECT_DOUBLE_EQ(s.firstEntry(), 1.0850);
  ASSERT_TRUE(s.stop_loss.has_value());
  EXPECT_DOUBLE_EQ(*s.stop_loss, 1.0800);
  ASSERT_EQ(s.take_profits.size(), 1u);
  EXPECT_DOUBLE_EQ(s.take_profits[0], 1.0900);
}

TEST_F(SignalParserTest, DualEntryOnlyWhenEnabled) {
  const std::string text = "BUY EURUSD @ 1.0850 - 1.0840 SL 1.0800 TP 1.0900";

  Signal single = parseOk(text);
  EXPECT_EQ(single.entries.size(), 1u);

  config.parser.dual_entry_enabled = true;
  rebuild();
  Signal dual = parseOk(text);
  ASSERT_TRUE(dual.isDualEntry());
  EXPECT_DOUBLE_EQ(dual.entries[0], 1.0850);
  EXPECT_DOUBLE_EQ(dual.entries[1], 1.0840);
}

// -----------------------------------------------------------------------------
// 2. Rejections.
// -----------------------------------------------------------------------------
TEST_F(SignalParserTest, RejectsMissingFields) {
  EXPECT_EQ(rejectReason("EURUSD looks strong today"),
            "missing_field(direction)");
  EXPECT_EQ(rejectReason("buy the dip"), "missing_field(entry)");
}

TEST_F(SignalParserTest, RequireStopLossRejectsSignalWithoutOne) {
  const std::string text = "BUY EURUSD @ 1.0850 TP 1.0900";
  EXPECT_FALSE(parseOk(text).stop_loss.has_value());

  config.parser.require_stop_loss = true;
  rebuild();
  EXPECT_EQ(rejectReason(text), "missing_field(stop_loss)");
}

TEST_F(SignalParserTest, RejectsBuyWithStopLossAboveEntry) {
  EXPECT_EQ(rejectReason("BUY EURUSD @ 1.0850 SL 1.0900 TP 1.0950"),
            "invalid_levels(stop_loss_above_entry)");
}

TEST_F(SignalParserTest, RejectsSellWithTakeProfitAboveEntry) {
  EXPECT_EQ(rejectReason("SELL EURUSD @ 1.0850 SL 1.0900 TP 1.0870"),
            "invalid_levels(take_profit_above_entry)");
}

// -----------------------------------------------------------------------------
// 3. Level helpers.
// -----------------------------------------------------------------------------
TEST_F(SignalParserTest, CanonicalTakeProfitsDedupeAndOrder) {
  auto buy = sigtrader::canonicalTakeProfits(Direction::Buy,
                                             {1.0950, 1.0900, 1.0950, 0.0});
  ASSERT_EQ(buy.size(), 2u);
  EXPECT_DOUBLE_EQ(buy[0], 1.0900);
  EXPECT_DOUBLE_EQ(buy[1], 1.0950);

  auto sell = sigtrader::canonicalTakeProfits(Direction::Sell, {1.0, 1.2, 1.1});
  ASSERT_EQ(sell.size(), 3u);
  EXPECT_DOUBLE_EQ(sell[0], 1.2);
  EXPECT_DOUBLE_EQ(sell[2], 1.0);
}

TEST_F(SignalParserTest, ValidateLevelsAcceptsEntryEqualToFirstTarget) {
  EXPECT_FALSE(
      sigtrader::validateLevels(Direction::Buy, {1.0}, 0.9, {1.0, 1.1})
          .has_value());
  EXPECT_EQ(
      sigtrader::validateLevels(Direction::Sell, {1.0}, 0.9, {}).value_or(""),
      "stop_loss_below_entry");
}

TEST_F(SignalParserTest, ExtractLevelsForEdits) {
  auto explicit_levels = parser->extractLevels("edit sl 1.0790");
  ASSERT_TRUE(explicit_levels.stop_loss.has_value());
  EXPECT_DOUBLE_EQ(*explicit_levels.stop_loss, 1.0790);
  EXPECT_TRUE(explicit_levels.take_profits.empty());

  auto bare = parser->extractLevels("move it to 1.0795");
  ASSERT_TRUE(bare.stop_loss.has_value());
  EXPECT_DOUBLE_EQ(*bare.stop_loss, 1.0795);

  auto targets = parser->extractLevels("new targets: 1.0990, 1.1010");
  EXPECT_FALSE(targets.stop_loss.has_value());
  ASSERT_EQ(targets.take_profits.size(), 2u);

  EXPECT_TRUE(parser->extractLevels("no numbers here").empty());
}

TEST(AliasSymbolResolverTest, NormalizesAndMapsTokens) {
  sigtrader::AliasSymbolResolver resolver(std::map<std::string, std::string>{{"Gold", "xau/usd"}});

  EXPECT_EQ(resolver.resolve("gold"), "XAUUSD");
  EXPECT_EQ(resolver.resolve("eur/usd"), "EURUSD");
  EXPECT_EQ(resolver.resolve("us-30."), "US30");
  ASSERT_EQ(resolver.aliases().size(), 1u);
  EXPECT_EQ(resolver.aliases()[0], "Gold");
}
