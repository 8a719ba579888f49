#include "sigtrader/domain/command.hpp"
#include "sigtrader/domain/direction.hpp"
#include "sigtrader/domain/signal_status.hpp"

#include <algorithm>
#include <cctype>

namespace sigtrader {
namespace domain {

namespace {

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

}  // namespace

std::optional<Direction> parseDirection(const std::string& text) {
  const std::string t = lower(text);
  if (t == "buy") {
    return Direction::Buy;
  }
  if (t == "sell") {
    return Direction::Sell;
  }
  return std::nullopt;
}

std::optional<SignalStatus> parseSignalStatus(const std::string& text) {
  for (SignalStatus s :
       {SignalStatus::Pending, SignalStatus::Open,
        SignalStatus::PartiallyClosed, SignalStatus::Closed,
        SignalStatus::Cancelled, SignalStatus::Error}) {
    if (text == toString(s)) {
      return s;
    }
  }
  return std::nullopt;
}

std::optional<CommandKind> parseCommandKind(const std::string& text) {
  const std::string t = lower(text);
  if (t == "delete" || t == "close") {
    return CommandKind::Delete;
  }
  if (t == "riskfree" || t == "risk_free") {
    return CommandKind::RiskFree;
  }
  if (t == "halfclose" || t == "half_close" || t == "half") {
    return CommandKind::HalfClose;
  }
  if (t == "takeprofitnow" || t == "take_profit_now" || t == "tp") {
    return CommandKind::TakeProfitNow;
  }
  if (t == "edit") {
    return CommandKind::Edit;
  }
  if (t == "closevolume" || t == "close_volume" || t == "closelot") {
    return CommandKind::CloseVolume;
  }
  return std::nullopt;
}

}  // namespace domain
}  // namespace sigtrader
