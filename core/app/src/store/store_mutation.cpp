#include "sigtrader/store/store_mutation.hpp"

namespace sigtrader {

const char* toString(StoreMutationKind kind) {
  switch (kind) {
    case StoreMutationKind::CreateSignal:  return "create_signal";
    case StoreMutationKind::SaveSignal:    return "save_signal";
    case StoreMutationKind::SaveTicket:    return "save_ticket";
    case StoreMutationKind::MarkProcessed: return "mark_processed";
  }
  return "unknown";
}

void applyMutation(StoreSnapshot& s, const StoreMutation& m) {
  switch (m.kind) {
    case StoreMutationKind::CreateSignal:
      s.signals[m.signal.id] = m.signal;
      s.bindings[domain::bindingKey(m.key.channel_id, m.key.message_id)] =
          m.signal.id;
      s.latest_by_channel[m.key.channel_id] = m.signal.id;
      s.processed[m.key.str()] = m.signal.id;
      break;
    case StoreMutationKind::SaveSignal:
      s.signals[m.signal.id] = m.signal;
      if (m.transition) {
        s.history.push_back(*m.transition);
      }
      break;
    case StoreMutationKind::SaveTicket:
      s.tickets[m.ticket.id] = m.ticket;
      break;
    case StoreMutationKind::MarkProcessed:
      s.processed[m.key.str()] = m.signal_id;
      break;
  }
}

}  // namespace sigtrader
