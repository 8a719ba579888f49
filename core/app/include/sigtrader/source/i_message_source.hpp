#pragma once

#include "sigtrader/domain/message.hpp"
#include "sigtrader/events/ingestion_events.hpp"

#include <functional>
#include <string>

namespace sigtrader {

// Receives records from a source together with the callback that
// acknowledges the record once it is durably handled. Returns false while
// ingestion is halted; the source keeps the record and offers it again
// later.
using MessageSink =
    std::function<bool(const domain::MessageRecord&, AckCallback)>;

// -----------------------------------------------------------------------------
// IMessageSource
// -----------------------------------------------------------------------------
//
// @brief  A channel adapter feeding MessageRecords into ingestion.
//
// @details
// Records of one channel reach the sink in the order the channel produced
// them. A record the sink accepted stays owned by the source until its ack
// fires; redeliver() offers every such record again, in arrival order. The
// engine calls it when ingestion resumes after a store outage, so a record
// that was accepted but never persisted is not lost.
//
// start()/stop() are idempotent; stop() joins any thread the source owns.
// redeliver() is safe from any thread.
// -----------------------------------------------------------------------------
class IMessageSource {
 public:
  virtual ~IMessageSource() = default;

  virtual const std::string& name() const = 0;
  virtual void start() = 0;
  virtual void stop() = 0;
  virtual void redeliver() = 0;
};

}  // namespace sigtrader
