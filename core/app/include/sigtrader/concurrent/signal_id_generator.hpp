#pragma once

#include <atomic>
#include <cstdint>

namespace sigtrader {

// -----------------------------------------------------------------------------
// SignalIdGenerator
// -----------------------------------------------------------------------------
// Responsibility: Hands out unique, monotonically increasing signal ids.
// Ids start at 1; 0 is reserved for "no signal".
//
// The ingestion loop is the only caller of next_id(). At startup the engine
// calls reseed() with one past the highest id found in the store so ids stay
// unique across restarts.
//
// Thread model: Lock-free. next_id() and reseed() are safe from any thread.
// -----------------------------------------------------------------------------
class SignalIdGenerator {
 public:
  explicit SignalIdGenerator(std::uint64_t first_id = 1) : next_id_(first_id) {}

  SignalIdGenerator(const SignalIdGenerator&) = delete;
  SignalIdGenerator& operator=(const SignalIdGenerator&) = delete;
  SignalIdGenerator(SignalIdGenerator&&) = delete;
  SignalIdGenerator& operator=(SignalIdGenerator&&) = delete;

  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

  // Moves the counter forward to at least `next`. Never moves it backwards.
  void reseed(std::uint64_t next) {
    std::uint64_t current = next_id_.load(std::memory_order_relaxed);
    while (current < next &&
           !next_id_.compare_exchange_weak(current, next,
                                           std::memory_order_relaxed)) {
    }
  }

  std::uint64_t peek() const { return next_id_.load(std::memory_order_relaxed); }

 private:
  std::atomic<std::uint64_t> next_id_;
};

}  // namespace sigtrader
