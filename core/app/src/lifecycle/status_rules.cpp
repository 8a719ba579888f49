#include "sigtrader/lifecycle/status_rules.hpp"

namespace sigtrader {

namespace {

constexpr double kVolumeEpsilon = 1e-9;

}  // namespace

bool StatusRules::canTransition(domain::SignalStatus from,
                                domain::SignalStatus to) {
  using S = domain::SignalStatus;
  switch (from) {
    case S::Pending:
      return to == S::Open || to == S::Cancelled || to == S::Error;
    case S::Open:
      return to != S::Pending;
    case S::PartiallyClosed:
      return to == S::PartiallyClosed || to == S::Closed || to == S::Error;
    case S::Error:
      return to != S::Pending;
    case S::Closed:
    case S::Cancelled:
      return false;
  }
  return false;
}

bool StatusRules::commandApplies(domain::CommandKind kind,
                                 domain::SignalStatus status) {
  using S = domain::SignalStatus;
  if (domain::isTerminal(status)) {
    return false;
  }
  switch (kind) {
    case domain::CommandKind::Delete:
    case domain::CommandKind::Edit:
      return true;
    case domain::CommandKind::RiskFree:
    case domain::CommandKind::HalfClose:
    case domain::CommandKind::TakeProfitNow:
    case domain::CommandKind::CloseVolume:
      return status == S::Open || status == S::PartiallyClosed ||
             status == S::Error;
  }
  return false;
}

domain::SignalStatus StatusRules::deriveStatus(
    const std::vector<domain::Ticket>& tickets) {
  bool any_active = false;
  bool any_filled = false;
  bool reduced = false;
  for (const auto& t : tickets) {
    any_filled = any_filled || t.filled;
    if (t.isActive()) {
      any_active = true;
      if (t.volume + kVolumeEpsilon < t.initial_volume) {
        reduced = true;
      }
    } else if (t.filled) {
      reduced = true;
    }
  }
  if (!any_active) {
    return any_filled ? domain::SignalStatus::Closed
                      : domain::SignalStatus::Cancelled;
  }
  return reduced ? domain::SignalStatus::PartiallyClosed
                 : domain::SignalStatus::Open;
}

}  // namespace sigtrader
