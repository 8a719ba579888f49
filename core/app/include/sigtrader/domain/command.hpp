#pragma once

#include "sigtrader/domain/message.hpp"
#include "sigtrader/domain/signal.hpp"
#include "sigtrader/domain/ticket.hpp"

#include <optional>
#include <string>
#include <vector>

namespace sigtrader {
namespace domain {

// Declared in priority order; the classifier picks the first matching kind.
// CloseVolume has no keywords and only comes from the operator.
enum class CommandKind {
  Delete,
  RiskFree,
  HalfClose,
  TakeProfitNow,
  Edit,
  CloseVolume,
};

inline const char* toString(CommandKind k) {
  switch (k) {
    case CommandKind::Delete:        return "Delete";
    case CommandKind::RiskFree:      return "RiskFree";
    case CommandKind::HalfClose:     return "HalfClose";
    case CommandKind::TakeProfitNow: return "TakeProfitNow";
    case CommandKind::Edit:          return "Edit";
    case CommandKind::CloseVolume:   return "CloseVolume";
  }
  return "Unknown";
}

std::optional<CommandKind> parseCommandKind(const std::string& text);

enum class CommandOrigin {
  Reply,     // reply message classified by the CommandClassifier
  Edit,      // edited source message re-parsed into new levels
  Deletion,  // source message deleted in the channel
  Console,   // issued by an operator through OperatorApi
};

inline const char* toString(CommandOrigin o) {
  switch (o) {
    case CommandOrigin::Reply:    return "reply";
    case CommandOrigin::Edit:     return "edit";
    case CommandOrigin::Deletion: return "deletion";
    case CommandOrigin::Console:  return "console";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// Command
// -----------------------------------------------------------------------------
// A follow-up instruction against one signal. `target` is 0 until the
// ingestion pipeline has bound the command to a signal.
// -----------------------------------------------------------------------------
struct Command {
  CommandKind kind{CommandKind::Edit};
  SignalId target{0};
  MessageKey source;
  CommandOrigin origin{CommandOrigin::Reply};

  // Edit payload. Either or both may be present.
  std::optional<double> new_stop_loss;
  std::vector<double> new_take_profits;

  // CloseVolume payload: which position and how many lots to close.
  TicketId ticket_id{0};
  double volume{0.0};
};

}  // namespace domain
}  // namespace sigtrader
