#pragma once

#include "sigtrader/domain/message.hpp"
#include "sigtrader/domain/signal.hpp"
#include "sigtrader/domain/ticket.hpp"
#include "sigtrader/store/store_snapshot.hpp"

#include <memory>
#include <optional>

namespace sigtrader {

// -----------------------------------------------------------------------------
// ISignalStore
// -----------------------------------------------------------------------------
//
// @brief  Durable home of signals, tickets, history and processed message
//         keys.
//
// @details
// Reads go through snapshot(), which never blocks behind a writer. Each
// mutator either becomes visible in the next snapshot or throws
// domain::StoreUnavailable and changes nothing.
//
// Writers: only the lifecycle state machine mutates, always from the lane
// that owns the signal. Stores must nevertheless accept concurrent writers
// from different lanes.
// -----------------------------------------------------------------------------
class ISignalStore {
 public:
  virtual ~ISignalStore() = default;

  virtual std::shared_ptr<const StoreSnapshot> snapshot() const = 0;

  // Inserts a new signal, binds (channel, message) to it, makes it the
  // channel's latest signal and records `key` as processed.
  virtual void createSignal(const domain::Signal& signal,
                            const domain::MessageKey& key) = 0;

  // Replaces a stored signal; appends `transition` to the history if given.
  virtual void saveSignal(
      const domain::Signal& signal,
      const std::optional<domain::SignalHistoryEntry>& transition) = 0;

  virtual void saveTicket(const domain::Ticket& ticket) = 0;

  virtual void markProcessed(const domain::MessageKey& key,
                             domain::SignalId signal_id) = 0;

  // True if the backing storage currently accepts writes.
  virtual bool ping() = 0;
};

}  // namespace sigtrader
