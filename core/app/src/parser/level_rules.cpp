#include "sigtrader/parser/level_rules.hpp"

#include <algorithm>
#include <cmath>
#include <functional>

namespace sigtrader {

namespace {

constexpr double kPriceEpsilon = 1e-9;

}  // namespace

std::vector<double> canonicalTakeProfits(domain::Direction direction,
                                         std::vector<double> take_profits) {
  take_profits.erase(std::remove_if(take_profits.begin(), take_profits.end(),
                                    [](double v) { return !(v > 0.0); }),
                     take_profits.end());
  if (direction == domain::Direction::Buy) {
    std::sort(take_profits.begin(), take_profits.end());
  } else {
    std::sort(take_profits.begin(), take_profits.end(), std::greater<double>());
  }
  take_profits.erase(
      std::unique(take_profits.begin(), take_profits.end(),
                  [](double a, double b) {
                    return std::fabs(a - b) < kPriceEpsilon;
                  }),
      take_profits.end());
  return take_profits;
}

std::optional<std::string> validateLevels(
    domain::Direction direction, const std::vector<double>& entries,
    const std::optional<double>& stop_loss,
    const std::vector<double>& take_profits) {
  if (entries.empty()) {
    return std::string("missing_entry");
  }
  for (double e : entries) {
    if (!(e > 0.0)) {
      return std::string("non_positive_price");
    }
  }
  if (stop_loss && !(*stop_loss > 0.0)) {
    return std::string("non_positive_price");
  }

  const double lowest = *std::min_element(entries.begin(), entries.end());
  const double highest = *std::max_element(entries.begin(), entries.end());
  const bool buy = direction == domain::Direction::Buy;

  if (stop_loss) {
    if (buy && !(*stop_loss < lowest)) {
      return std::string("stop_loss_above_entry");
    }
    if (!buy && !(*stop_loss > highest)) {
      return std::string("stop_loss_below_entry");
    }
  }

  for (std::size_t i = 0; i < take_profits.size(); ++i) {
    const double tp = take_profits[i];
    if (buy && tp < highest - kPriceEpsilon) {
      return std::string("take_profit_below_entry");
    }
    if (!buy && tp > lowest + kPriceEpsilon) {
      return std::string("take_profit_above_entry");
    }
    if (i > 0) {
      const double prev = take_profits[i - 1];
      if (buy ? !(tp > prev) : !(tp < prev)) {
        return std::string("take_profits_not_ordered");
      }
    }
  }
  return std::nullopt;
}

}  // namespace sigtrader
