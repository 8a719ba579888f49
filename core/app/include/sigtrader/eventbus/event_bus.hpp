#pragma once

#include "sigtrader/events/event.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace sigtrader {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
//
// @brief  Synchronous publish/subscribe hub for the Event variant.
//
// @details
// Each EventLoopThread owns one bus and publishes on its own thread, so a
// lane's subscribers (the lifecycle handlers) run strictly one event at a
// time. The engine additionally owns a free-standing telemetry bus that is
// published from whichever lane produced the update.
//
// Thread-safety: subscribe/unsubscribe/publish are safe from any thread.
// publish() snapshots the subscriber list under the lock and invokes the
// callbacks outside it, so a callback may subscribe or publish re-entrantly.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;
  EventBus(EventBus&&) = delete;
  EventBus& operator=(EventBus&&) = delete;

  // Registers a callback for every event. Returns an id for unsubscribe().
  SubscriptionId subscribe(GenericCallback callback);

  // Registers a callback that only sees the `EventType` alternative.
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // Unknown ids are ignored.
  void unsubscribe(SubscriptionId id);

  void publish(const Event& event);

  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
};

template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](const Event& event) {
    if (const auto* ptr = std::get_if<EventType>(&event)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped));
}

// -----------------------------------------------------------------------------
// ScopedSubscription
// -----------------------------------------------------------------------------
// Owns one subscription and removes it on destruction. Movable so owners can
// keep them in a vector. The bus must outlive the subscription.
// -----------------------------------------------------------------------------
class ScopedSubscription {
 public:
  ScopedSubscription() = default;
  ScopedSubscription(EventBus& bus, EventBus::SubscriptionId id)
      : bus_(&bus), id_(id) {}

  ~ScopedSubscription() { reset(); }

  ScopedSubscription(const ScopedSubscription&) = delete;
  ScopedSubscription& operator=(const ScopedSubscription&) = delete;

  ScopedSubscription(ScopedSubscription&& other) noexcept
      : bus_(std::exchange(other.bus_, nullptr)), id_(other.id_) {}

  ScopedSubscription& operator=(ScopedSubscription&& other) noexcept {
    if (this != &other) {
      reset();
      bus_ = std::exchange(other.bus_, nullptr);
      id_ = other.id_;
    }
    return *this;
  }

  void reset() {
    if (bus_ != nullptr) {
      bus_->unsubscribe(id_);
      bus_ = nullptr;
    }
  }

 private:
  EventBus* bus_{nullptr};
  EventBus::SubscriptionId id_{0};
};

}  // namespace sigtrader
