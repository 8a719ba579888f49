#pragma once

#include "sigtrader/store/i_signal_store.hpp"
#include "sigtrader/store/store_mutation.hpp"

#include <memory>
#include <mutex>

namespace sigtrader {

// -----------------------------------------------------------------------------
// InMemorySignalStore
// -----------------------------------------------------------------------------
//
// @brief  Copy-on-write store: every mutation builds the next StoreSnapshot
//         and swaps it in atomically.
//
// @details
// Each mutator describes its write as a StoreMutation. Writers serialize on
// write_mutex_, copy the current snapshot, apply the mutation, call
// persist() and finally publish with std::atomic_store.
// Readers only perform std::atomic_load on the shared_ptr, so they never
// wait for a writer and always observe a complete version.
//
// Subclasses make the store durable by overriding persist(), which sees both
// the candidate snapshot and the mutation that produced it. Throwing from it
// aborts the mutation before anything is published.
//
// Thread-safety: all methods safe from any thread.
// -----------------------------------------------------------------------------
class InMemorySignalStore : public ISignalStore {
 public:
  InMemorySignalStore();
  ~InMemorySignalStore() override = default;

  InMemorySignalStore(const InMemorySignalStore&) = delete;
  InMemorySignalStore& operator=(const InMemorySignalStore&) = delete;

  std::shared_ptr<const StoreSnapshot> snapshot() const override;

  void createSignal(const domain::Signal& signal,
                    const domain::MessageKey& key) override;
  void saveSignal(
      const domain::Signal& signal,
      const std::optional<domain::SignalHistoryEntry>& transition) override;
  void saveTicket(const domain::Ticket& ticket) override;
  void markProcessed(const domain::MessageKey& key,
                     domain::SignalId signal_id) override;
  bool ping() override { return true; }

 protected:
  // Called with the candidate snapshot while the write lock is held.
  // Throw domain::StoreUnavailable to reject the mutation.
  virtual void persist(const StoreSnapshot& next, const StoreMutation& change);

  // Replaces the whole content; used when loading from disk.
  void replaceContents(StoreSnapshot contents);

 private:
  void mutate(const StoreMutation& change);

  std::mutex write_mutex_;
  std::shared_ptr<const StoreSnapshot> current_;
};

}  // namespace sigtrader
