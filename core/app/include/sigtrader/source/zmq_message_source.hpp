#pragma once

#include "sigtrader/config/engine_config.hpp"
#include "sigtrader/source/i_message_source.hpp"
#include "sigtrader/source/unacked_records.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace sigtrader {

// -----------------------------------------------------------------------------
// ZmqMessageSource
// -----------------------------------------------------------------------------
//
// @brief  SUB socket bridge: each frame is one JSON message record.
//
// @details
// Frame layout:
//
//   {"channel_id": "vip", "message_id": 42, "text": "BUY EURUSD ...",
//    "reply_to": 41, "edited": false, "deleted": false,
//    "timestamp_ms": 1700000000000}
//
// channel_id, message_id and text are required (text may be empty for a
// deletion); the rest are optional. A frame that is not valid JSON or lacks
// a required key is logged and skipped.
//
// Every decoded record is tracked in UnackedRecords before it is offered to
// the sink, and leaves it only when its ack fires (after the store write).
// When the sink refuses a record (ingestion halted) it is offered again
// every kRetryHoldMs until accepted or the source stops; nothing is
// received meanwhile, so channel order is kept. redeliver() queues every
// still-unacked record again, oldest first, ahead of new frames.
//
// options: "subscribe" (topic prefix, default ""), "topic_frame" (bool,
// publisher sends a topic frame before the JSON frame).
//
// Thread model: start() connects the socket and spawns the recv thread.
// stop() sets the flag; the recv loop notices within kRecvTimeoutMs.
// -----------------------------------------------------------------------------
class ZmqMessageSource final : public IMessageSource {
 public:
  static constexpr int kRecvTimeoutMs = 100;
  static constexpr int kRetryHoldMs = 200;

  ZmqMessageSource(SourceConfig config, MessageSink sink);
  ~ZmqMessageSource() override;

  ZmqMessageSource(const ZmqMessageSource&) = delete;
  ZmqMessageSource& operator=(const ZmqMessageSource&) = delete;

  const std::string& name() const override { return config_.name; }
  void start() override;
  void stop() override;
  void redeliver() override;

  // Records accepted by the sink whose ack has not fired yet.
  std::size_t unackedCount() const { return unacked_->size(); }

  // Decodes one JSON frame. std::nullopt if malformed.
  static std::optional<domain::MessageRecord> decode(
      const std::string& payload, const std::string& source_name);

 private:
  void run();

  SourceConfig config_;
  MessageSink sink_;
  std::shared_ptr<UnackedRecords> unacked_ = std::make_shared<UnackedRecords>();
  std::atomic<bool> redeliver_requested_{false};
  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};
  std::atomic<bool> running_{false};
  std::thread thread_;
};

}  // namespace sigtrader
