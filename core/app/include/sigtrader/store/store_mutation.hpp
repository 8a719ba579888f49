#pragma once

#include "sigtrader/domain/message.hpp"
#include "sigtrader/domain/signal.hpp"
#include "sigtrader/domain/ticket.hpp"
#include "sigtrader/store/store_snapshot.hpp"

#include <optional>

namespace sigtrader {

enum class StoreMutationKind {
  CreateSignal,
  SaveSignal,
  SaveTicket,
  MarkProcessed,
};

const char* toString(StoreMutationKind kind);

// -----------------------------------------------------------------------------
// StoreMutation
// -----------------------------------------------------------------------------
// One ISignalStore write as data. The store applies it to the next snapshot;
// a durable store may also journal it and apply it again on load.
//
//   CreateSignal   signal, key
//   SaveSignal     signal, transition (optional)
//   SaveTicket     ticket
//   MarkProcessed  key, signal_id
// -----------------------------------------------------------------------------
struct StoreMutation {
  StoreMutationKind kind{StoreMutationKind::SaveSignal};
  domain::Signal signal;
  domain::Ticket ticket;
  domain::MessageKey key;
  domain::SignalId signal_id{0};
  std::optional<domain::SignalHistoryEntry> transition;
};

// Applies `m` to `s`. Does not touch s.version.
void applyMutation(StoreSnapshot& s, const StoreMutation& m);

}  // namespace sigtrader
