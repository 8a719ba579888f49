#include "sigtrader/source/zmq_message_source.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <deque>
#include <iostream>
#include <utility>

namespace sigtrader {

ZmqMessageSource::ZmqMessageSource(SourceConfig config, MessageSink sink)
    : config_(std::move(config)), sink_(std::move(sink)) {}

ZmqMessageSource::~ZmqMessageSource() { stop(); }

void ZmqMessageSource::start() {
  if (running_.exchange(true)) {
    return;
  }
  const std::string topic = config_.options.value("subscribe", std::string());
  socket_.set(zmq::sockopt::subscribe, topic);
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_.connect(config_.endpoint);

  thread_ = std::thread([this] {
    std::cout << "[ZmqMessageSource] " << config_.name << " listening on "
              << config_.endpoint << "\n";
    run();
    std::cout << "[ZmqMessageSource] " << config_.name
              << " recv loop exited.\n";
  });
}

void ZmqMessageSource::stop() {
  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
  }
}

std::optional<domain::MessageRecord> ZmqMessageSource::decode(
    const std::string& payload, const std::string& source_name) {
  try {
    auto json = nlohmann::json::parse(payload);
    domain::MessageRecord record;
    record.source_name = source_name;
    record.channel_id = json.at("channel_id").get<std::string>();
    record.message_id = json.at("message_id").get<std::int64_t>();
    record.text = json.at("text").get<std::string>();
    if (json.contains("reply_to") && !json.at("reply_to").is_null()) {
      record.reply_to = json.at("reply_to").get<std::int64_t>();
    }
    record.edited = json.value("edited", false);
    record.deleted = json.value("deleted", false);
    record.received_at_ms = json.value("timestamp_ms", std::int64_t{0});
    return record;
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[ZmqMessageSource] " << source_name
              << " malformed record: " << e.what() << " payload: " << payload
              << "\n";
    return std::nullopt;
  }
}

void ZmqMessageSource::redeliver() { redeliver_requested_.store(true); }

void ZmqMessageSource::run() {
  const bool topic_frame = config_.options.value("topic_frame", false);
  // Sequence numbers waiting to be offered to the sink, oldest first.
  std::deque<std::uint64_t> outbox;
  bool refused = false;

  while (running_.load()) {
    if (redeliver_requested_.exchange(false)) {
      const auto pending = unacked_->sequences();
      outbox.assign(pending.begin(), pending.end());
      refused = false;
      if (!outbox.empty()) {
        std::cout << "[ZmqMessageSource] " << config_.name << " redelivering "
                  << outbox.size() << " unacked record(s)\n";
      }
    }

    if (!outbox.empty()) {
      const std::uint64_t seq = outbox.front();
      auto record = unacked_->find(seq);
      if (!record) {
        outbox.pop_front();  // acked meanwhile
        continue;
      }
      if (sink_(*record, unacked_->ackFor(seq))) {
        outbox.pop_front();
        refused = false;
      } else {
        if (!refused) {
          std::cerr << "[ZmqMessageSource] " << config_.name
                    << " ingestion halted, holding " << record->channel_id
                    << "#" << record->message_id << "\n";
          refused = true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(kRetryHoldMs));
      }
      continue;
    }

    zmq::message_t msg;
    auto result = socket_.recv(msg, zmq::recv_flags::none);
    if (!result.has_value()) {
      continue;
    }
    if (topic_frame && msg.more()) {
      zmq::message_t body;
      if (!socket_.recv(body, zmq::recv_flags::none).has_value()) {
        continue;
      }
      msg = std::move(body);
    }

    if (auto record = decode(msg.to_string(), config_.name)) {
      outbox.push_back(unacked_->track(std::move(*record)));
    }
  }
}

}  // namespace sigtrader
