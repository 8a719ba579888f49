#include "sigtrader/store/in_memory_signal_store.hpp"

#include <utility>

namespace sigtrader {

InMemorySignalStore::InMemorySignalStore()
    : current_(std::make_shared<const StoreSnapshot>()) {}

std::shared_ptr<const StoreSnapshot> InMemorySignalStore::snapshot() const {
  return std::atomic_load(&current_);
}

void InMemorySignalStore::createSignal(const domain::Signal& signal,
                                       const domain::MessageKey& key) {
  StoreMutation m;
  m.kind = StoreMutationKind::CreateSignal;
  m.signal = signal;
  m.key = key;
  mutate(m);
}

void InMemorySignalStore::saveSignal(
    const domain::Signal& signal,
    const std::optional<domain::SignalHistoryEntry>& transition) {
  StoreMutation m;
  m.kind = StoreMutationKind::SaveSignal;
  m.signal = signal;
  m.transition = transition;
  mutate(m);
}

void InMemorySignalStore::saveTicket(const domain::Ticket& ticket) {
  StoreMutation m;
  m.kind = StoreMutationKind::SaveTicket;
  m.ticket = ticket;
  mutate(m);
}

void InMemorySignalStore::markProcessed(const domain::MessageKey& key,
                                        domain::SignalId signal_id) {
  StoreMutation m;
  m.kind = StoreMutationKind::MarkProcessed;
  m.key = key;
  m.signal_id = signal_id;
  mutate(m);
}

void InMemorySignalStore::persist(const StoreSnapshot& /*next*/,
                                  const StoreMutation& /*change*/) {}

void InMemorySignalStore::replaceContents(StoreSnapshot contents) {
  std::lock_guard lock(write_mutex_);
  std::shared_ptr<const StoreSnapshot> next =
      std::make_shared<const StoreSnapshot>(std::move(contents));
  std::atomic_store(&current_, next);
}

void InMemorySignalStore::mutate(const StoreMutation& change) {
  std::lock_guard lock(write_mutex_);
  auto next = std::make_shared<StoreSnapshot>(*std::atomic_load(&current_));
  applyMutation(*next, change);
  ++next->version;
  persist(*next, change);
  std::atomic_store(&current_, std::shared_ptr<const StoreSnapshot>(std::move(next)));
}

}  // namespace sigtrader
