#include "sigtrader/source/unacked_records.hpp"

#include <utility>

namespace sigtrader {

std::uint64_t UnackedRecords::track(domain::MessageRecord record) {
  std::lock_guard lock(mutex_);
  const std::uint64_t seq = next_seq_++;
  records_.emplace(seq, std::move(record));
  return seq;
}

AckCallback UnackedRecords::ackFor(std::uint64_t seq) {
  return [self = shared_from_this(), seq] { self->acknowledge(seq); };
}

void UnackedRecords::acknowledge(std::uint64_t seq) {
  std::lock_guard lock(mutex_);
  records_.erase(seq);
}

std::optional<domain::MessageRecord> UnackedRecords::find(
    std::uint64_t seq) const {
  std::lock_guard lock(mutex_);
  auto it = records_.find(seq);
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<std::uint64_t> UnackedRecords::sequences() const {
  std::lock_guard lock(mutex_);
  std::vector<std::uint64_t> out;
  out.reserve(records_.size());
  for (const auto& entry : records_) {
    out.push_back(entry.first);
  }
  return out;
}

std::size_t UnackedRecords::size() const {
  std::lock_guard lock(mutex_);
  return records_.size();
}

}  // namespace sigtrader
