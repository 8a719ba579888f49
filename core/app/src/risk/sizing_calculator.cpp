#include "sigtrader/risk/sizing_calculator.hpp"

#include <cmath>
#include <sstream>
#include <utility>

namespace sigtrader {

namespace {

constexpr double kVolumeEpsilon = 1e-9;

domain::SizingRejected reject(domain::SizingRejectKind kind,
                              const std::string& detail) {
  return domain::SizingRejected{kind, detail};
}

std::string describe(double v) {
  std::ostringstream os;
  os << v;
  return os.str();
}

}  // namespace

SizingCalculator::SizingCalculator(SizingConfig config)
    : config_(std::move(config)) {}

double SizingCalculator::floorToStep(double volume, double step) {
  if (!(step > 0.0)) {
    return volume;
  }
  const double steps = std::floor(volume / step + kVolumeEpsilon);
  // Round the product to suppress artefacts like 0.30000000000000004.
  return std::round(steps * step * 1e8) / 1e8;
}

// -----------------------------------------------------------------------------
// size
// -----------------------------------------------------------------------------
// Total volume first, then the per-leg split, then step/limit checks per leg,
// then one margin check over all legs. Prices are only decided at the end.
// -----------------------------------------------------------------------------
SizingOutcome SizingCalculator::size(
    const domain::Signal& signal, const domain::AccountState& account,
    const domain::InstrumentInfo& instrument) const {
  using domain::SizingRejectKind;

  if (!instrument.tradable) {
    return reject(SizingRejectKind::SymbolNotTradable,
                  signal.symbol + " is not tradable");
  }
  if (signal.entries.empty() || !(instrument.contract_size > 0.0)) {
    return reject(SizingRejectKind::InvalidConfiguration,
                  "missing entry price or contract size");
  }

  const double entry = signal.firstEntry();
  const double basis = config_.basis == SizingBasis::Equity ? account.equity
                                                            : account.balance;
  double total = 0.0;
  switch (config_.mode) {
    case SizingMode::Fixed:
      total = config_.value;
      break;
    case SizingMode::PercentOfBalance:
      total = basis * config_.value / 100.0 / (instrument.contract_size * entry);
      break;
    case SizingMode::RiskPercent: {
      if (!signal.stop_loss) {
        return reject(SizingRejectKind::MissingStopLoss,
                      "risk sizing needs a stop-loss");
      }
      const double distance = std::fabs(entry - *signal.stop_loss);
      if (!(distance > 0.0)) {
        return reject(SizingRejectKind::InvalidConfiguration,
                      "stop-loss equals entry");
      }
      total = basis * config_.value / 100.0 /
              (distance * instrument.contract_size);
      break;
    }
  }
  if (!(total > 0.0) || !std::isfinite(total)) {
    return reject(SizingRejectKind::VolumeRoundsToZero,
                  "computed volume " + describe(total));
  }

  // --- legs ----------------------------------------------------------------
  std::vector<double> legs;
  const bool split = signal.isDualEntry() && config_.dual_entry_enabled;
  if (split) {
    legs.push_back(total * config_.dual_entry_ratio);
    legs.push_back(total * (1.0 - config_.dual_entry_ratio));
  } else {
    legs.push_back(total);
  }

  double required_margin = 0.0;
  for (std::size_t i = 0; i < legs.size(); ++i) {
    const double raw = legs[i];
    legs[i] = floorToStep(raw, instrument.volume_step);
    if (legs[i] <= kVolumeEpsilon) {
      return reject(SizingRejectKind::VolumeRoundsToZero,
                    "leg " + std::to_string(i) + " volume " + describe(raw) +
                        " rounds to zero at step " +
                        describe(instrument.volume_step));
    }
    if (legs[i] + kVolumeEpsilon < instrument.min_volume) {
      return reject(SizingRejectKind::BelowMinimumVolume,
                    "leg " + std::to_string(i) + " volume " +
                        describe(legs[i]) + " < min " +
                        describe(instrument.min_volume));
    }
    if (instrument.max_volume > 0.0 &&
        legs[i] > instrument.max_volume + kVolumeEpsilon) {
      return reject(SizingRejectKind::AboveMaximumVolume,
                    "leg " + std::to_string(i) + " volume " +
                        describe(legs[i]) + " > max " +
                        describe(instrument.max_volume));
    }
    const double price = split ? signal.entries[i] : entry;
    required_margin +=
        legs[i] * instrument.contract_size * price * instrument.margin_rate;
  }

  // --- margin --------------------------------------------------------------
  if (required_margin > account.freeMargin() + kVolumeEpsilon) {
    return reject(SizingRejectKind::InsufficientMargin,
                  "required " + describe(required_margin) + ", free " +
                      describe(account.freeMargin()));
  }

  // --- orders --------------------------------------------------------------
  // A market leg is priced at the side it fills on.
  std::vector<domain::OrderParams> orders;
  for (std::size_t i = 0; i < legs.size(); ++i) {
    domain::OrderParams p;
    p.signal_id = signal.id;
    p.leg = static_cast<int>(i);
    p.symbol = signal.symbol;
    p.direction = signal.direction;
    p.volume = legs[i];
    p.price = split ? signal.entries[i] : entry;
    p.type = orderTypeFor(signal.direction, p.price, instrument);
    if (p.type == domain::OrderType::Market) {
      p.price = signal.direction == domain::Direction::Buy ? instrument.ask
                                                           : instrument.bid;
    }
    p.stop_loss = signal.stop_loss;
    p.take_profit = signal.finalTakeProfit();
    p.client_tag = domain::clientTagFor(signal.id, p.leg);
    orders.push_back(std::move(p));
  }
  return orders;
}

// -----------------------------------------------------------------------------
// orderTypeFor
// -----------------------------------------------------------------------------
domain::OrderType SizingCalculator::orderTypeFor(
    domain::Direction direction, double entry,
    const domain::InstrumentInfo& instrument) const {
  const bool buy = direction == domain::Direction::Buy;
  const double quote = buy ? instrument.ask : instrument.bid;
  if (!(quote > 0.0)) {
    return domain::OrderType::Limit;
  }
  if (std::fabs(quote - entry) <= config_.closer_price) {
    return domain::OrderType::Market;
  }
  // Buy below the ask / Sell above the bid rests as a limit order.
  if (buy) {
    return entry < quote ? domain::OrderType::Limit : domain::OrderType::Stop;
  }
  return entry > quote ? domain::OrderType::Limit : domain::OrderType::Stop;
}

}  // namespace sigtrader
