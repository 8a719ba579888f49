#pragma once

#include "sigtrader/config/engine_config.hpp"
#include "sigtrader/domain/errors.hpp"
#include "sigtrader/domain/signal.hpp"
#include "sigtrader/domain/venue_types.hpp"

#include <variant>
#include <vector>

namespace sigtrader {

using SizingOutcome =
    std::variant<std::vector<domain::OrderParams>, domain::SizingRejected>;

// -----------------------------------------------------------------------------
// SizingCalculator
// -----------------------------------------------------------------------------
//
// @brief  Converts a signal plus account/instrument state into one order per
//         entry leg, or a typed rejection.
//
// @details
// Total volume by mode:
//   Fixed             value
//   PercentOfBalance  basis * value% / (contract_size * entry)
//   RiskPercent       basis * value% / (|entry - stop_loss| * contract_size)
// where basis is the balance or the equity.
//
// A dual-entry signal splits the total by dual_entry_ratio. Every leg is
// floored to the instrument's volume step and must reach min_volume; no
// value is ever clamped into range, the signal is rejected instead.
//
// Margin check: sum(volume) * contract_size * entry * margin_rate must not
// exceed equity - margin.
//
// Order type per leg: Market when |quote - entry| <= closer_price (quote is
// ask for Buy, bid for Sell); otherwise Limit when the entry is on the
// favourable side of the quote, else Stop. Without a quote the leg is a
// Limit order at the entry.
//
// Thread-safety: Stateless apart from immutable config.
// -----------------------------------------------------------------------------
class SizingCalculator {
 public:
  explicit SizingCalculator(SizingConfig config);

  // -------------------------------------------------------------------------
  // size(signal, account, instrument)
  // -------------------------------------------------------------------------
  //
  // @brief  Builds the entry orders for `signal`.
  //
  // @param  signal      Parsed signal; needs direction, entries and symbol.
  // @param  account     Balance, equity and used margin from the venue.
  // @param  instrument  Contract size, volume limits and the current quote.
  //
  // @return One OrderParams per entry leg, or SizingRejected with its
  //         SizingRejectKind and a detail text.
  // -------------------------------------------------------------------------
  SizingOutcome size(const domain::Signal& signal,
                     const domain::AccountState& account,
                     const domain::InstrumentInfo& instrument) const;

  // Largest multiple of `step` not above `volume` (tolerant to FP noise).
  static double floorToStep(double volume, double step);

  const SizingConfig& config() const { return config_; }

 private:
  domain::OrderType orderTypeFor(domain::Direction direction, double entry,
                                 const domain::InstrumentInfo& instrument) const;

  SizingConfig config_;
};

}  // namespace sigtrader
