#include "sigtrader/time/time_utils.hpp"

#include <cctype>

namespace sigtrader {

std::optional<int> parseClockMinutes(const std::string& hhmm) {
  const auto colon = hhmm.find(':');
  if (colon == std::string::npos || colon == 0 || colon > 2 ||
      hhmm.size() != colon + 3) {
    return std::nullopt;
  }
  for (std::size_t i = 0; i < hhmm.size(); ++i) {
    if (i != colon && !std::isdigit(static_cast<unsigned char>(hhmm[i]))) {
      return std::nullopt;
    }
  }
  const int hours = std::stoi(hhmm.substr(0, colon));
  const int minutes = std::stoi(hhmm.substr(colon + 1));
  if (hours > 23 || minutes > 59) {
    return std::nullopt;
  }
  return hours * 60 + minutes;
}

}  // namespace sigtrader
