#pragma once

#include "sigtrader/domain/direction.hpp"

#include <optional>
#include <string>
#include <vector>

namespace sigtrader {

// De-duplicates take-profit levels, drops non-positive values and orders
// them by distance from the entry (ascending for Buy, descending for Sell).
std::vector<double> canonicalTakeProfits(domain::Direction direction,
                                         std::vector<double> take_profits);

// -----------------------------------------------------------------------------
// validateLevels(direction, entries, stop_loss, take_profits)
// -----------------------------------------------------------------------------
// Checks the price ordering of a signal: for Buy
//   stop_loss < every entry <= take_profits[0] < take_profits[1] < ...
// and the mirror image for Sell. `take_profits` must already be canonical.
//
// @return std::nullopt when consistent, otherwise a short reason such as
//         "stop_loss_above_entry" or "take_profit_below_entry".
// -----------------------------------------------------------------------------
std::optional<std::string> validateLevels(
    domain::Direction direction, const std::vector<double>& entries,
    const std::optional<double>& stop_loss,
    const std::vector<double>& take_profits);

}  // namespace sigtrader
