#pragma once

#include "sigtrader/config/engine_config.hpp"
#include "sigtrader/domain/errors.hpp"
#include "sigtrader/domain/signal.hpp"
#include "sigtrader/parser/pattern_matcher.hpp"
#include "sigtrader/parser/symbol_resolver.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sigtrader {

using ParseOutcome = std::variant<domain::Signal, domain::ParseRejected>;

// Stop-loss / take-profit values found in a follow-up message.
struct LevelUpdate {
  std::optional<double> stop_loss;
  std::vector<double> take_profits;

  bool empty() const { return !stop_loss && take_profits.empty(); }
};

// -----------------------------------------------------------------------------
// SignalParser
// -----------------------------------------------------------------------------
//
// @brief  Turns free message text into a validated domain::Signal.
//
// @details
// All pattern tables are compiled once in the constructor; parse() itself is
// a pure function of its input: no I/O, no clock, no shared mutable state.
// The returned Signal carries only the trade fields (symbol, direction,
// entries, stop_loss, take_profits); ids, source and timestamps are filled
// in by the ingestion pipeline.
//
// Rejection reasons:
//   missing_field(direction|symbol|entry|stop_loss)
//   invalid_levels(<validateLevels reason>)
//
// Thread-safety: Immutable after construction; parse() may run concurrently.
// Ownership: Holds a reference to the resolver, which must outlive it.
// -----------------------------------------------------------------------------
class SignalParser {
 public:
  // @throws ConfigError if any pattern fails to compile.
  SignalParser(const ParserConfig& config, const ISymbolResolver& resolver);

  ParseOutcome parse(const std::string& text) const;

  // -------------------------------------------------------------------------
  // extractLevels(text)
  // -------------------------------------------------------------------------
  // @brief  Stop-loss and take-profit values of an edit instruction.
  // @details Uses the stop-loss and take-profit tables only. When neither
  //          matches, the first bare number in the text is taken as the new
  //          stop-loss ("edit 1.0790"). Take-profits are de-duplicated but
  //          not ordered; the caller knows the signal's direction.
  // -------------------------------------------------------------------------
  LevelUpdate extractLevels(const std::string& text) const;

 private:
  std::optional<domain::Direction> extractDirection(const std::string& text) const;
  std::optional<std::string> extractSymbol(const std::string& text) const;
  std::optional<double> extractPrice(const FieldMatcher& matcher,
                                     const std::string& text) const;
  std::vector<double> extractTakeProfits(const std::string& text) const;

  const ISymbolResolver& resolver_;
  bool require_stop_loss_;
  bool decimal_comma_;
  bool dual_entry_enabled_;

  FieldMatcher direction_;
  FieldMatcher alias_;
  FieldMatcher symbol_;
  FieldMatcher first_price_;
  FieldMatcher second_price_;
  FieldMatcher stop_loss_;
  FieldMatcher take_profit_;
};

}  // namespace sigtrader
