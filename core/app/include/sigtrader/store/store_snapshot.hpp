#pragma once

#include "sigtrader/domain/message.hpp"
#include "sigtrader/domain/signal.hpp"
#include "sigtrader/domain/ticket.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sigtrader {

// -----------------------------------------------------------------------------
// StoreSnapshot
// -----------------------------------------------------------------------------
// Immutable view of the whole signal store at one version. Stores hand it out
// as std::shared_ptr<const StoreSnapshot>; holders keep reading a consistent
// state while writers publish newer versions.
// -----------------------------------------------------------------------------
struct StoreSnapshot {
  std::uint64_t version{0};
  std::map<domain::SignalId, domain::Signal> signals;
  std::map<domain::TicketId, domain::Ticket> tickets;
  std::vector<domain::SignalHistoryEntry> history;
  std::map<std::string, domain::SignalId> processed;        // MessageKey::str()
  std::map<std::string, domain::SignalId> bindings;         // bindingKey()
  std::map<std::string, domain::SignalId> latest_by_channel;

  const domain::Signal* findSignal(domain::SignalId id) const;
  const domain::Ticket* findTicket(domain::TicketId id) const;
  std::vector<domain::Ticket> ticketsFor(domain::SignalId id) const;

  // Signals whose status is not terminal, ordered by id.
  std::vector<domain::Signal> activeSignals() const;
  // Active tickets (orders and positions).
  std::vector<domain::Ticket> activeTickets() const;
  // Active position tickets only.
  std::vector<domain::Ticket> openPositions() const;

  bool isProcessed(const domain::MessageKey& key) const;
  std::optional<domain::SignalId> signalForMessage(const std::string& channel_id,
                                                   std::int64_t message_id) const;
  std::optional<domain::SignalId> latestSignalFor(const std::string& channel_id) const;

  // The most recent `limit` history rows, newest first.
  std::vector<domain::SignalHistoryEntry> recentHistory(std::size_t limit) const;

  domain::SignalId maxSignalId() const;
};

}  // namespace sigtrader
