#pragma once

#include "sigtrader/command/command_classifier.hpp"
#include "sigtrader/concurrent/event_loop_thread.hpp"
#include "sigtrader/concurrent/signal_id_generator.hpp"
#include "sigtrader/config/engine_config.hpp"
#include "sigtrader/eventbus/event_bus.hpp"
#include "sigtrader/events/event.hpp"
#include "sigtrader/parser/signal_parser.hpp"
#include "sigtrader/store/i_signal_store.hpp"
#include "sigtrader/time/i_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace sigtrader {

// 64-bit FNV-1a. Stable across builds and runs, so it may appear in
// persisted idempotency keys.
std::uint64_t stableHash(const std::string& text);

// -----------------------------------------------------------------------------
// IngestionPipeline
// -----------------------------------------------------------------------------
//
// @brief  Single-threaded front door: turns raw message records into
//         NewSignalEvents and bound CommandEvents and hands them to the
//         owning signal lane.
//
// @details
// Per record, in order:
//   1. channel allow/block lists
//   2. deleted message bound to a signal  -> Delete command
//   3. edited message bound to a signal   -> Edit command ("edit:<hash>")
//   4. reply                              -> classify, resolve target
//   5. otherwise a new signal             -> trading window, parse,
//                                            symbol filter, idempotency,
//                                            id assignment
// Anything discarded is published as a RejectionEvent and acked.
//
// Targets resolve through a route table filled as ids are assigned, then
// through the store. The route table lets a reply find a signal whose
// placement is still queued or in flight; the resulting command is queued
// behind it on the same lane. Once the table reaches kRouteSweepSize
// entries, those the store already answers for are dropped.
//
// While halted (store unavailable) submitMessage()/submitCommand() return
// false and accept nothing.
//
// Thread model: handlers run on the internal "ingestion" EventLoopThread.
// submit*(), halt(), resume() are safe from any thread.
// -----------------------------------------------------------------------------
class IngestionPipeline {
 public:
  using RouteSink = std::function<void(domain::SignalId, Event)>;
  using RejectionSink = std::function<void(const RejectionEvent&)>;

  IngestionPipeline(const FilterConfig& filters, const CommandConfig& commands,
                    const SignalParser& parser,
                    const CommandClassifier& classifier,
                    const ISignalStore& store, SignalIdGenerator& ids,
                    const ITimeProvider& clock, RouteSink route,
                    RejectionSink reject);
  ~IngestionPipeline();

  IngestionPipeline(const IngestionPipeline&) = delete;
  IngestionPipeline& operator=(const IngestionPipeline&) = delete;
  IngestionPipeline(IngestionPipeline&&) = delete;
  IngestionPipeline& operator=(IngestionPipeline&&) = delete;

  void start();
  void stop();

  // @return false when halted or not started; the record is not taken.
  bool submitMessage(const domain::MessageRecord& record, AckCallback ack = {});

  // Operator command whose target is already set.
  bool submitCommand(const domain::Command& command, AckCallback ack = {});

  void halt(const std::string& reason);
  void resume();
  bool halted() const { return halted_.load(); }

  bool waitIdle(std::chrono::milliseconds timeout);

  // Synchronous entry points used by the loop; public for tests.
  void handleMessage(const MessageEvent& event);
  void handleCommand(const CommandEvent& event);

  static constexpr std::size_t kRouteSweepSize = 1024;

  // Drops route-table entries for signals the store already holds.
  // Ingestion thread only. @return entries dropped.
  std::size_t pruneRoutes();
  std::size_t trackedRoutes() const { return routes_.size(); }

 private:
  bool channelAllowed(const domain::MessageRecord& record, std::string& why) const;
  void handleDeletion(const MessageEvent& event, domain::SignalId target);
  void handleEdit(const MessageEvent& event, domain::SignalId target);
  void handleReply(const MessageEvent& event);
  void handleNewMessage(const MessageEvent& event);
  bool tryLastSignalEdit(const MessageEvent& event);

  std::optional<domain::SignalId> resolve(const std::string& channel_id,
                                          std::int64_t message_id) const;
  std::optional<domain::SignalId> latestFor(const std::string& channel_id) const;
  bool signalKnown(domain::SignalId id) const;

  void routeCommand(domain::Command command, const AckCallback& ack);
  void reject(RejectionStage stage, const std::string& reason,
              const domain::MessageKey& source, const AckCallback& ack,
              domain::SignalId id = 0);

  FilterConfig filters_;
  bool edit_applies_to_last_signal_;
  const SignalParser& parser_;
  const CommandClassifier& classifier_;
  const ISignalStore& store_;
  SignalIdGenerator& ids_;
  const ITimeProvider& clock_;
  RouteSink route_;
  RejectionSink reject_;

  // Ingestion-thread only.
  std::map<std::string, domain::SignalId> routes_;     // bindingKey()
  std::map<std::string, domain::SignalId> latest_;     // channel id
  std::set<domain::SignalId> assigned_;
  std::size_t next_sweep_at_{kRouteSweepSize};

  std::atomic<bool> halted_{false};
  EventLoopThread loop_{"ingestion"};
  std::vector<ScopedSubscription> subscriptions_;
};

}  // namespace sigtrader
