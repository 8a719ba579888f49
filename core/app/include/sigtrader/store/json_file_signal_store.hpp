#pragma once

#include "sigtrader/store/in_memory_signal_store.hpp"

#include <cstddef>
#include <string>

namespace sigtrader {

// -----------------------------------------------------------------------------
// JsonFileSignalStore
// -----------------------------------------------------------------------------
//
// @brief  InMemorySignalStore made durable by a JSON snapshot file plus an
//         append-only journal of mutations.
//
// @details
// Files:
//   <path>          one complete StoreSnapshot (json_codec.hpp)
//   <path>.journal  one JSON line per mutation since that snapshot,
//                   {"op": ..., "version": N, ...}
//
// persist() appends the mutation to the journal and flushes it, so a write
// costs one line instead of the whole store. Every `compact_every` writes
// the store compacts: the candidate snapshot goes to "<path>.tmp", is
// renamed over <path>, and the journal is truncated. A failed append also
// forces the next write to compact, so a torn line is never followed by
// good ones.
//
// Loading reads <path> (if present) and replays journal lines whose version
// is newer than the snapshot. A torn final line (crash mid-append) is
// dropped; a bad line followed by more lines is corruption. A store that
// replayed anything compacts right away.
//
// Any I/O failure raises domain::StoreUnavailable and the in-memory version
// stays where it was.
//
// Thread-safety: as InMemorySignalStore; file I/O happens under its write
// lock.
// -----------------------------------------------------------------------------
class JsonFileSignalStore final : public InMemorySignalStore {
 public:
  static constexpr std::size_t kDefaultCompactEvery = 256;

  // @throws domain::StoreUnavailable if <path> or its journal exists but
  //         cannot be read.
  explicit JsonFileSignalStore(std::string path,
                               std::size_t compact_every = kDefaultCompactEvery);

  bool ping() override;

  const std::string& path() const { return path_; }
  std::string journalPath() const { return path_ + ".journal"; }

  // Journal lines written since the last compaction.
  std::size_t journalEntries() const;

 protected:
  void persist(const StoreSnapshot& next, const StoreMutation& change) override;

 private:
  void writeSnapshot(const StoreSnapshot& s);
  void compact(const StoreSnapshot& s);
  // Applies journal lines newer than `s`; returns how many were applied.
  std::size_t replayJournal(StoreSnapshot& s, bool& torn) const;

  std::string path_;
  std::size_t compact_every_;
  std::size_t journal_entries_{0};
  bool must_compact_{false};
};

}  // namespace sigtrader
