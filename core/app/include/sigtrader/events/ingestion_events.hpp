#pragma once

#include "sigtrader/domain/command.hpp"
#include "sigtrader/domain/message.hpp"
#include "sigtrader/domain/signal.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace sigtrader {

// Invoked once the effect of a message is durably recorded (or the message
// was deliberately discarded). Never invoked when the store is unavailable.
using AckCallback = std::function<void()>;

// Raw message entering the ingestion loop.
struct MessageEvent {
  domain::MessageRecord record;
  AckCallback ack;
};

// Parsed signal routed to its lane. `key` is the idempotency key.
struct NewSignalEvent {
  domain::Signal signal;
  domain::MessageKey key;
  AckCallback ack;
};

// Command bound to a target signal, routed to that signal's lane. On the
// ingestion loop it also carries operator commands whose target is already
// set.
struct CommandEvent {
  domain::Command command;
  AckCallback ack;
};

enum class RejectionStage {
  Filter,    // channel/symbol filter or trading window
  Parse,     // not a signal
  Classify,  // reply that is not a usable command
  Target,    // command without a bound signal
  Sizing,    // signal could not be sized
};

inline const char* toString(RejectionStage s) {
  switch (s) {
    case RejectionStage::Filter:   return "filter";
    case RejectionStage::Parse:    return "parse";
    case RejectionStage::Classify: return "classify";
    case RejectionStage::Target:   return "target";
    case RejectionStage::Sizing:   return "sizing";
  }
  return "unknown";
}

// Published on the telemetry bus whenever an input is discarded.
struct RejectionEvent {
  RejectionStage stage{RejectionStage::Parse};
  std::string reason;
  domain::MessageKey source;
  domain::SignalId signal_id{0};
  std::int64_t at_ms{0};
};

}  // namespace sigtrader
