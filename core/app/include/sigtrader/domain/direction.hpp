#pragma once

#include <optional>
#include <string>

namespace sigtrader {
namespace domain {

enum class Direction {
  Buy,
  Sell,
};

inline const char* toString(Direction d) {
  switch (d) {
    case Direction::Buy:  return "Buy";
    case Direction::Sell: return "Sell";
  }
  return "Unknown";
}

// Accepts "buy"/"sell" in any letter case.
std::optional<Direction> parseDirection(const std::string& text);

// Signed orientation of profit: +1 for Buy, -1 for Sell.
inline double directionSign(Direction d) {
  return d == Direction::Buy ? 1.0 : -1.0;
}

// True when `candidate` is a strictly tighter protective stop than `current`
// for a position in direction `d` (higher for Buy, lower for Sell).
inline bool improvesStop(Direction d, double candidate, double current) {
  return d == Direction::Buy ? candidate > current : candidate < current;
}

}  // namespace domain
}  // namespace sigtrader
