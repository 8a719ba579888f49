#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace sigtrader {
namespace domain {

// -----------------------------------------------------------------------------
// Value-type outcomes
// -----------------------------------------------------------------------------
// Parse and sizing failures are expected, frequent and never fatal; they are
// returned as variant alternatives rather than thrown.
// -----------------------------------------------------------------------------

// Message text is not a valid signal. `reason` is machine readable, e.g.
// "missing_field(symbol)" or "invalid_levels(stop_loss_above_entry)".
struct ParseRejected {
  std::string reason;
};

enum class SizingRejectKind {
  SymbolNotTradable,
  VolumeRoundsToZero,
  BelowMinimumVolume,
  AboveMaximumVolume,
  InsufficientMargin,
  MissingStopLoss,
  InvalidConfiguration,
};

inline const char* toString(SizingRejectKind k) {
  switch (k) {
    case SizingRejectKind::SymbolNotTradable:    return "symbol_not_tradable";
    case SizingRejectKind::VolumeRoundsToZero:   return "volume_rounds_to_zero";
    case SizingRejectKind::BelowMinimumVolume:   return "below_minimum_volume";
    case SizingRejectKind::AboveMaximumVolume:   return "above_maximum_volume";
    case SizingRejectKind::InsufficientMargin:   return "insufficient_margin";
    case SizingRejectKind::MissingStopLoss:      return "missing_stop_loss";
    case SizingRejectKind::InvalidConfiguration: return "invalid_configuration";
  }
  return "unknown";
}

struct SizingRejected {
  SizingRejectKind kind{SizingRejectKind::InvalidConfiguration};
  std::string detail;
};

// -----------------------------------------------------------------------------
// Exceptions
// -----------------------------------------------------------------------------

enum class VenueErrorKind {
  Timeout,      // no answer within the call timeout; outcome unknown
  Unavailable,  // transport or session down
  Rejected,     // venue refused the request (permanent)
  NotFound,     // ticket or symbol unknown to the venue (permanent)
};

inline const char* toString(VenueErrorKind k) {
  switch (k) {
    case VenueErrorKind::Timeout:     return "timeout";
    case VenueErrorKind::Unavailable: return "unavailable";
    case VenueErrorKind::Rejected:    return "rejected";
    case VenueErrorKind::NotFound:    return "not_found";
  }
  return "unknown";
}

inline bool isTransient(VenueErrorKind k) {
  return k == VenueErrorKind::Timeout || k == VenueErrorKind::Unavailable;
}

// Thrown by IExecutionVenue implementations for a single failed call.
class VenueError : public std::runtime_error {
 public:
  VenueError(VenueErrorKind kind, const std::string& message)
      : std::runtime_error(message), kind_(kind) {}

  VenueErrorKind kind() const { return kind_; }

 private:
  VenueErrorKind kind_;
};

// Thrown by RetryPolicy once a venue operation is given up on.
class VenueCallFailed : public std::runtime_error {
 public:
  VenueCallFailed(std::string op, int attempts, VenueErrorKind last_kind,
                  const std::string& last_message)
      : std::runtime_error("venue_call_failed(" + op + ", attempt=" +
                           std::to_string(attempts) + "): " + last_message),
        op_(std::move(op)),
        attempts_(attempts),
        last_kind_(last_kind) {}

  const std::string& op() const { return op_; }
  int attempts() const { return attempts_; }
  VenueErrorKind lastKind() const { return last_kind_; }

 private:
  std::string op_;
  int attempts_;
  VenueErrorKind last_kind_;
};

// Thrown by a signal store when a mutation cannot be made durable. The
// mutation is not visible in any snapshot when this is thrown.
class StoreUnavailable : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

}  // namespace domain
}  // namespace sigtrader
