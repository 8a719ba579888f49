#pragma once

#include "sigtrader/domain/message.hpp"
#include "sigtrader/events/ingestion_events.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace sigtrader {

// -----------------------------------------------------------------------------
// UnackedRecords
// -----------------------------------------------------------------------------
// Responsibility: Holds the records a source has handed to ingestion until
// their acknowledgement arrives.
//
// track() assigns an increasing sequence number; ackFor(seq) builds the
// AckCallback passed along with the record. The callback keeps this object
// alive, so an ack firing on a lane after the source was destroyed is
// harmless. Acknowledging twice is a no-op.
//
// Thread model: all methods lock an internal mutex. Acks arrive on lane
// threads while the owning source reads from its own thread.
// -----------------------------------------------------------------------------
class UnackedRecords : public std::enable_shared_from_this<UnackedRecords> {
 public:
  std::uint64_t track(domain::MessageRecord record);
  AckCallback ackFor(std::uint64_t seq);
  void acknowledge(std::uint64_t seq);

  std::optional<domain::MessageRecord> find(std::uint64_t seq) const;

  // Sequence numbers still waiting for an ack, oldest first.
  std::vector<std::uint64_t> sequences() const;
  std::size_t size() const;

 private:
  mutable std::mutex mutex_;
  std::uint64_t next_seq_{1};
  std::map<std::uint64_t, domain::MessageRecord> records_;
};

}  // namespace sigtrader
