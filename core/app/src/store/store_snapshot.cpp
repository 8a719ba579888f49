#include "sigtrader/store/store_snapshot.hpp"

#include <algorithm>

namespace sigtrader {

const domain::Signal* StoreSnapshot::findSignal(domain::SignalId id) const {
  auto it = signals.find(id);
  return it == signals.end() ? nullptr : &it->second;
}

const domain::Ticket* StoreSnapshot::findTicket(domain::TicketId id) const {
  auto it = tickets.find(id);
  return it == tickets.end() ? nullptr : &it->second;
}

std::vector<domain::Ticket> StoreSnapshot::ticketsFor(domain::SignalId id) const {
  std::vector<domain::Ticket> out;
  for (const auto& [ticket_id, ticket] : tickets) {
    if (ticket.signal_id == id) {
      out.push_back(ticket);
    }
  }
  std::sort(out.begin(), out.end(),
            [](const domain::Ticket& a, const domain::Ticket& b) {
              return a.leg < b.leg;
            });
  return out;
}

std::vector<domain::Signal> StoreSnapshot::activeSignals() const {
  std::vector<domain::Signal> out;
  for (const auto& [id, signal] : signals) {
    if (!domain::isTerminal(signal.status)) {
      out.push_back(signal);
    }
  }
  return out;
}

std::vector<domain::Ticket> StoreSnapshot::activeTickets() const {
  std::vector<domain::Ticket> out;
  for (const auto& [id, ticket] : tickets) {
    if (ticket.isActive()) {
      out.push_back(ticket);
    }
  }
  return out;
}

std::vector<domain::Ticket> StoreSnapshot::openPositions() const {
  std::vector<domain::Ticket> out;
  for (const auto& [id, ticket] : tickets) {
    if (ticket.isOpenPosition()) {
      out.push_back(ticket);
    }
  }
  return out;
}

bool StoreSnapshot::isProcessed(const domain::MessageKey& key) const {
  return processed.count(key.str()) != 0;
}

std::optional<domain::SignalId> StoreSnapshot::signalForMessage(
    const std::string& channel_id, std::int64_t message_id) const {
  auto it = bindings.find(domain::bindingKey(channel_id, message_id));
  if (it == bindings.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<domain::SignalId> StoreSnapshot::latestSignalFor(
    const std::string& channel_id) const {
  auto it = latest_by_channel.find(channel_id);
  if (it == latest_by_channel.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::SignalHistoryEntry> StoreSnapshot::recentHistory(
    std::size_t limit) const {
  const std::size_t n = std::min(limit, history.size());
  return std::vector<domain::SignalHistoryEntry>(history.rbegin(),
                                                 history.rbegin() + n);
}

domain::SignalId StoreSnapshot::maxSignalId() const {
  return signals.empty() ? 0 : signals.rbegin()->first;
}

}  // namespace sigtrader
