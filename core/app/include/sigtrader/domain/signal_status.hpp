#pragma once

#include <optional>
#include <string>

namespace sigtrader {
namespace domain {

enum class SignalStatus {
  Pending,          // Recorded, orders not (yet) placed
  Open,             // At least one ticket live at the venue
  PartiallyClosed,  // Some volume already closed, some still live
  Closed,           // Every ticket closed after a fill - terminal state
  Cancelled,        // Closed before any fill - terminal state
  Error,            // Venue or sizing failure; still accepts Delete/Edit
};

inline const char* toString(SignalStatus s) {
  switch (s) {
    case SignalStatus::Pending:         return "Pending";
    case SignalStatus::Open:            return "Open";
    case SignalStatus::PartiallyClosed: return "PartiallyClosed";
    case SignalStatus::Closed:          return "Closed";
    case SignalStatus::Cancelled:       return "Cancelled";
    case SignalStatus::Error:           return "Error";
  }
  return "Unknown";
}

std::optional<SignalStatus> parseSignalStatus(const std::string& text);

inline bool isTerminal(SignalStatus s) {
  return s == SignalStatus::Closed || s == SignalStatus::Cancelled;
}

}  // namespace domain
}  // namespace sigtrader
