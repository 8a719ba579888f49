// =============================================================================
// signal_engine_test.cpp
// =============================================================================
// End-to-end tests for sigtrader::SignalEngine with a PaperExecutionVenue.
//
// Validates:
//   - Lifecycle: start() / stop() / destructor, idempotent
//   - A source message becomes a placed signal, then a reply closes it
//   - Rejections and updates reach the telemetry bus
//   - Ids continue after the highest stored signal
//   - A store outage halts ingestion until the store answers again
//   - A source record lost to a store outage is redelivered on resume
//   - A failing start() stops whatever it already started
//   - A Delete arriving mid-placement is applied after the placement
//   - executeCommand(): PING, STATUS and the JSON ops
//   - Report, summary and custom-lot close over IPC
//   - Signals survive a restart with a JsonFileSignalStore
//
// Design: each test builds its own engine; monitor ticks are effectively
// disabled so only explicit submissions drive the lanes.
// =============================================================================

#include "sigtrader/domain/errors.hpp"
#include "sigtrader/engine/signal_engine.hpp"
#include "sigtrader/store/in_memory_signal_store.hpp"
#include "sigtrader/source/message_source_registry.hpp"
#include "sigtrader/store/json_file_signal_store.hpp"
#include "sigtrader/time/simulation_time_provider.hpp"
#include "sigtrader/venue/paper_execution_venue.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using nlohmann::json;
using sigtrader::SignalEngine;
using sigtrader::domain::MessageRecord;
using sigtrader::domain::SignalStatus;

namespace {

const char* kBuyText = "BUY EURUSD @ 1.0850 SL 1.0800 TP 1.0900";

class FlakySignalStore : public sigtrader::InMemorySignalStore {
 public:
  std::atomic<bool> fail{false};

  bool ping() override { return !fail.load(); }

 protected:
  void persist(const sigtrader::StoreSnapshot&,
               const sigtrader::StoreMutation&) override {
    if (fail.load()) {
      throw sigtrader::domain::StoreUnavailable("store offline");
    }
  }
};

MessageRecord record(std::int64_t id, const std::string& text) {
  MessageRecord r;
  r.source_name = "test";
  r.channel_id = "vip";
  r.message_id = id;
  r.text = text;
  return r;
}

MessageRecord reply(std::int64_t id, std::int64_t to, const std::string& text) {
  MessageRecord r = record(id, text);
  r.reply_to = to;
  return r;
}

}  // namespace

class SignalEngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    config = sigtrader::defaultConfig();
    config.lanes = 2;
    config.sizing.mode = sigtrader::SizingMode::Fixed;
    config.sizing.value = 0.2;
    config.monitor.interval = std::chrono::hours(1);

    sigtrader::domain::InstrumentInfo info;
    info.symbol = "EURUSD";
    info.contract_size = 100000.0;
    info.min_volume = 0.01;
    info.volume_step = 0.01;
    info.margin_rate = 0.01;
    venue.setInstrument(info);
    venue.setQuote("EURUSD", 1.0858, 1.0860);
  }

  std::unique_ptr<SignalEngine> makeEngine(
      sigtrader::ISignalStore& s,
      sigtrader::MessageSourceRegistry* registry = nullptr) {
    return std::make_unique<SignalEngine>(
        config, s, venue, clock, registry, [](std::chrono::milliseconds) {});
  }

  json request(SignalEngine& engine, const std::string& text) {
    return json::parse(engine.executeCommand(text));
  }

  sigtrader::EngineConfig config;
  sigtrader::SimulationTimeProvider clock{1000};
  sigtrader::PaperExecutionVenue venue{clock, 10000.0};
  FlakySignalStore store;
};

// -----------------------------------------------------------------------------
// 1. Start / stop are idempotent and the destructor joins everything.
// -----------------------------------------------------------------------------
TEST_F(SignalEngineTest, StartStopIdempotent) {
  auto engine = makeEngine(store);
  EXPECT_FALSE(engine->running());
  EXPECT_FALSE(engine->submitMessage(record(1, kBuyText)));

  engine->start();
  engine->start();
  EXPECT_TRUE(engine->running());

  engine->stop();
  engine->stop();
  EXPECT_FALSE(engine->running());

  auto second = makeEngine(store);
  second->start();
  second.reset();  // destructor stops the running engine
}

// -----------------------------------------------------------------------------
// 2. A message flows through ingestion and a lane to the venue.
// -----------------------------------------------------------------------------
TEST_F(SignalEngineTest, MessageBecomesPlacedSignal) {
  auto engine = makeEngine(store);

  std::promise<sigtrader::SignalUpdateEvent> placed;
  auto future = placed.get_future();
  std::atomic<bool> done{false};
  engine->telemetryBus().subscribe<sigtrader::SignalUpdateEvent>(
      [&](const sigtrader::SignalUpdateEvent& e) {
        if (!e.tickets.empty() && !done.exchange(true)) {
          placed.set_value(e);
        }
      });

  engine->start();
  std::atomic<int> acks{0};
  ASSERT_TRUE(engine->submitMessage(record(10, kBuyText), [&] { ++acks; }));

  ASSERT_EQ(future.wait_for(2s), std::future_status::ready)
      << "Timed out - signal was never placed";
  auto update = future.get();
  EXPECT_EQ(update.signal.id, 1u);
  EXPECT_EQ(update.signal.status, SignalStatus::Open);
  EXPECT_EQ(update.signal.provider, "test");

  ASSERT_TRUE(engine->waitIdle(2s));
  EXPECT_EQ(acks.load(), 1);
  EXPECT_EQ(venue.tickets().size(), 1u);
  EXPECT_EQ(store.snapshot()->ticketsFor(1).size(), 1u);

  engine->stop();
}

// -----------------------------------------------------------------------------
// 3. A reply to the signal message is classified and applied.
// -----------------------------------------------------------------------------
TEST_F(SignalEngineTest, ReplyClosesSignal) {
  auto engine = makeEngine(store);
  engine->start();

  ASSERT_TRUE(engine->submitMessage(record(10, kBuyText)));
  ASSERT_TRUE(engine->submitMessage(reply(11, 10, "close")));
  ASSERT_TRUE(engine->waitIdle(2s));

  const auto* signal = store.snapshot()->findSignal(1);
  ASSERT_NE(signal, nullptr);
  EXPECT_EQ(signal->status, SignalStatus::Cancelled);
  EXPECT_TRUE(venue.tickets().empty());

  engine->stop();
}

// -----------------------------------------------------------------------------
// 4. Rejections are published on the telemetry bus and acked.
// -----------------------------------------------------------------------------
TEST_F(SignalEngineTest, RejectionsReachTelemetry) {
  auto engine = makeEngine(store);

  std::mutex mutex;
  std::vector<sigtrader::RejectionEvent> rejections;
  engine->telemetryBus().subscribe<sigtrader::RejectionEvent>(
      [&](const sigtrader::RejectionEvent& e) {
        std::lock_guard lock(mutex);
        rejections.push_back(e);
      });

  engine->start();
  std::atomic<int> acks{0};
  engine->submitMessage(record(20, "good morning traders"), [&] { ++acks; });
  engine->submitMessage(reply(21, 999, "close"), [&] { ++acks; });
  ASSERT_TRUE(engine->waitIdle(2s));
  engine->stop();

  EXPECT_EQ(acks.load(), 2);
  ASSERT_EQ(rejections.size(), 2u);
  EXPECT_EQ(rejections[0].stage, sigtrader::RejectionStage::Parse);
  EXPECT_EQ(rejections[1].stage, sigtrader::RejectionStage::Target);
  EXPECT_EQ(rejections[1].reason, "unresolved_command_target");
}

// -----------------------------------------------------------------------------
// 5. New ids continue after the highest stored signal.
// -----------------------------------------------------------------------------
TEST_F(SignalEngineTest, IdsContinueAfterStoredSignals) {
  sigtrader::domain::Signal old;
  old.id = 5;
  old.symbol = "EURUSD";
  old.entries = {1.0850};
  old.status = SignalStatus::Closed;
  store.createSignal(old, sigtrader::domain::MessageKey{"vip", 1, ""});

  auto engine = makeEngine(store);
  engine->start();
  engine->submitMessage(record(10, kBuyText));
  ASSERT_TRUE(engine->waitIdle(2s));
  engine->stop();

  EXPECT_NE(store.snapshot()->findSignal(6), nullptr);
}

// -----------------------------------------------------------------------------
// 6. A store outage halts ingestion; the unacked message is redelivered
//    after resume and gets the same id.
// -----------------------------------------------------------------------------
TEST_F(SignalEngineTest, StoreOutageHaltsIngestion) {
  auto engine = makeEngine(store);
  engine->start();

  store.fail = true;
  std::atomic<int> acks{0};
  ASSERT_TRUE(engine->submitMessage(record(10, kBuyText), [&] { ++acks; }));
  ASSERT_TRUE(engine->waitIdle(2s));

  EXPECT_TRUE(engine->ingestionHalted());
  EXPECT_EQ(acks.load(), 0);
  EXPECT_FALSE(engine->submitMessage(record(10, kBuyText)));
  EXPECT_FALSE(engine->resumeIngestion());
  EXPECT_TRUE(engine->ingestionHalted());

  store.fail = false;
  EXPECT_TRUE(engine->resumeIngestion());
  EXPECT_FALSE(engine->ingestionHalted());

  ASSERT_TRUE(engine->submitMessage(record(10, kBuyText), [&] { ++acks; }));
  ASSERT_TRUE(engine->waitIdle(2s));
  EXPECT_EQ(acks.load(), 1);
  const auto* signal = store.snapshot()->findSignal(1);
  ASSERT_NE(signal, nullptr);
  EXPECT_EQ(signal->status, SignalStatus::Open);

  engine->stop();
}

// -----------------------------------------------------------------------------
// 7. executeCommand: plain-text and JSON requests.
// -----------------------------------------------------------------------------
TEST_F(SignalEngineTest, ExecuteCommandOps) {
  auto engine = makeEngine(store);
  engine->start();
  engine->submitMessage(record(10, kBuyText));
  ASSERT_TRUE(engine->waitIdle(2s));

  EXPECT_EQ(request(*engine, "PING")["response"], "PONG");

  json status = request(*engine, "STATUS");
  EXPECT_EQ(status["status"], "ok");
  EXPECT_EQ(status["running"], true);
  EXPECT_EQ(status["halted"], false);
  EXPECT_EQ(status["lanes"], 2);
  EXPECT_EQ(status["active_signals"], 1);

  json signals = request(*engine, R"({"op":"signals"})");
  ASSERT_EQ(signals["signals"].size(), 1u);
  EXPECT_EQ(signals["signals"][0]["symbol"], "EURUSD");
  EXPECT_EQ(signals["signals"][0]["status"], "Open");

  json history = request(*engine, R"({"op":"history","limit":1})");
  ASSERT_EQ(history["history"].size(), 1u);
  EXPECT_EQ(history["history"][0]["to"], "Open");

  json console =
      request(*engine, R"({"op":"console","user":"ops","input":"signal 1"})");
  EXPECT_EQ(console["ok"], true);
  EXPECT_EQ(console["state"], "ViewingSignal");

  json command = request(
      *engine, R"({"op":"command","signal_id":1,"kind":"Edit","sl":1.0790})");
  EXPECT_EQ(command["response"], "submitted");
  ASSERT_TRUE(engine->waitIdle(2s));
  const auto* signal = store.snapshot()->findSignal(1);
  ASSERT_NE(signal, nullptr);
  ASSERT_TRUE(signal->stop_loss.has_value());
  EXPECT_DOUBLE_EQ(*signal->stop_loss, 1.0790);

  EXPECT_EQ(request(*engine, R"({"op":"halt"})")["status"], "ok");
  EXPECT_TRUE(engine->ingestionHalted());
  EXPECT_EQ(request(*engine, R"({"op":"command","signal_id":1,"kind":"Delete"})")
                ["status"],
            "error");
  EXPECT_EQ(request(*engine, R"({"op":"resume"})")["status"], "ok");
  EXPECT_FALSE(engine->ingestionHalted());

  EXPECT_EQ(request(*engine, "FLY")["status"], "error");
  EXPECT_EQ(request(*engine, R"({"op":"dance"})")["status"], "error");
  EXPECT_EQ(request(*engine, R"({"op":"command","signal_id":1,"kind":"Nope"})")
                ["status"],
            "error");
  EXPECT_EQ(request(*engine, R"({"op":"console"})")["status"], "error");

  engine->stop();
}

// -----------------------------------------------------------------------------
// 8. Restart: a file-backed store restores signals, tickets and ids.
// -----------------------------------------------------------------------------
TEST_F(SignalEngineTest, RestartRestoresStore) {
  const std::string path = ::testing::TempDir() + "sigtrader_engine_test.json";
  std::remove(path.c_str());
  std::remove((path + ".journal").c_str());

  {
    sigtrader::JsonFileSignalStore file_store(path);
    auto engine = makeEngine(file_store);
    engine->start();
    engine->submitMessage(record(10, kBuyText));
    ASSERT_TRUE(engine->waitIdle(2s));
    engine->stop();
  }

  sigtrader::JsonFileSignalStore reopened(path);
  const auto* signal = reopened.snapshot()->findSignal(1);
  ASSERT_NE(signal, nullptr);
  EXPECT_EQ(signal->status, SignalStatus::Open);
  EXPECT_EQ(reopened.snapshot()->ticketsFor(1).size(), 1u);

  auto engine = makeEngine(reopened);
  engine->start();
  // The first message is a replay; a new one gets id 2.
  std::atomic<int> acks{0};
  engine->submitMessage(record(10, kBuyText), [&] { ++acks; });
  engine->submitMessage(record(11, "SELL EURUSD @ 1.0870 SL 1.0920 TP 1.0820"));
  ASSERT_TRUE(engine->waitIdle(2s));
  engine->stop();

  EXPECT_EQ(acks.load(), 1);
  EXPECT_EQ(venue.callCount(sigtrader::VenueOp::PlaceOrder), 2u);
  EXPECT_NE(reopened.snapshot()->findSignal(2), nullptr);

  std::remove(path.c_str());
  std::remove((path + ".journal").c_str());
}

// -----------------------------------------------------------------------------
// 9. A record a zmq source handed over while the store was down is never
//    acked; resume asks the source for it again and the signal is created.
// -----------------------------------------------------------------------------
TEST_F(SignalEngineTest, SourceRecordRedeliveredAfterResume) {
  zmq::context_t ctx{1};
  zmq::socket_t pub{ctx, zmq::socket_type::pub};
  pub.bind("tcp://127.0.0.1:*");

  sigtrader::SourceConfig feed;
  feed.name = "feed";
  feed.type = "zmq";
  feed.endpoint = pub.get(zmq::sockopt::last_endpoint);
  config.sources = {feed};

  sigtrader::MessageSourceRegistry registry;
  sigtrader::registerBuiltinSources(registry);
  auto engine = makeEngine(store, &registry);

  store.fail = true;
  engine->start();

  const std::string frame = json{{"channel_id", "vip"},
                                 {"message_id", 10},
                                 {"text", kBuyText}}
                                .dump();
  auto deadline = std::chrono::steady_clock::now() + 3s;
  while (!engine->ingestionHalted() &&
         std::chrono::steady_clock::now() < deadline) {
    static_cast<void>(pub.send(zmq::buffer(frame), zmq::send_flags::dontwait));
    std::this_thread::sleep_for(20ms);
  }
  ASSERT_TRUE(engine->ingestionHalted());
  ASSERT_TRUE(engine->waitIdle(2s));
  EXPECT_EQ(store.snapshot()->findSignal(1), nullptr);

  // Nothing is published from here on; the signal can only come back
  // through redelivery.
  store.fail = false;
  ASSERT_TRUE(engine->resumeIngestion());

  deadline = std::chrono::steady_clock::now() + 3s;
  while (store.snapshot()->findSignal(1) == nullptr &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(10ms);
  }
  ASSERT_TRUE(engine->waitIdle(2s));
  engine->stop();

  const auto* signal = store.snapshot()->findSignal(1);
  ASSERT_NE(signal, nullptr);
  EXPECT_EQ(signal->status, SignalStatus::Open);
  EXPECT_EQ(store.snapshot()->findSignal(2), nullptr);
  EXPECT_EQ(venue.tickets().size(), 1u);
}

// -----------------------------------------------------------------------------
// 10. start() that fails on a source leaves nothing running.
// -----------------------------------------------------------------------------
TEST_F(SignalEngineTest, FailedStartTearsDown) {
  sigtrader::domain::Signal pending;
  pending.id = 3;
  pending.symbol = "EURUSD";
  pending.entries = {1.0850};
  pending.stop_loss = 1.0800;
  pending.status = SignalStatus::Pending;
  store.createSignal(pending, sigtrader::domain::MessageKey{"vip", 1, ""});

  sigtrader::SourceConfig bogus;
  bogus.name = "desk";
  bogus.type = "carrier-pigeon";
  config.sources = {bogus};

  sigtrader::MessageSourceRegistry registry;
  sigtrader::registerBuiltinSources(registry);
  auto engine = makeEngine(store, &registry);

  EXPECT_THROW(engine->start(), sigtrader::ConfigError);
  EXPECT_FALSE(engine->running());
  EXPECT_FALSE(engine->submitMessage(record(10, kBuyText)));
  EXPECT_EQ(request(*engine, "STATUS")["running"], false);

  engine->stop();
  engine.reset();
}

// -----------------------------------------------------------------------------
// 11. An IPC bind failure after the sources started stops them again.
// -----------------------------------------------------------------------------
TEST_F(SignalEngineTest, IpcBindFailureStopsSources) {
  zmq::context_t ctx{1};
  zmq::socket_t pub{ctx, zmq::socket_type::pub};
  pub.bind("tcp://127.0.0.1:*");

  sigtrader::SourceConfig feed;
  feed.name = "feed";
  feed.type = "zmq";
  feed.endpoint = pub.get(zmq::sockopt::last_endpoint);
  config.sources = {feed};
  config.ipc.command_endpoint = "nonsense://nowhere";

  sigtrader::MessageSourceRegistry registry;
  sigtrader::registerBuiltinSources(registry);
  auto engine = makeEngine(store, &registry);

  EXPECT_THROW(engine->start(), zmq::error_t);
  EXPECT_FALSE(engine->running());
  EXPECT_FALSE(engine->submitMessage(record(10, kBuyText)));
  engine.reset();
}

// -----------------------------------------------------------------------------
// 12. The operator deletes the signal while its placement is still being
//     retried; the Delete queues behind the placement on the same lane.
// -----------------------------------------------------------------------------
TEST_F(SignalEngineTest, DeleteDuringPlacementCancelsSignal) {
  SignalEngine* target = nullptr;
  std::atomic<bool> sent{false};
  std::atomic<bool> accepted{false};
  auto sleeper = [&](std::chrono::milliseconds) {
    if (target != nullptr && !sent.exchange(true)) {
      accepted = target->submitMessage(reply(11, 10, "close"));
    }
  };
  auto engine = std::make_unique<SignalEngine>(config, store, venue, clock,
                                               nullptr, sleeper);
  target = engine.get();
  venue.failNext(sigtrader::VenueOp::PlaceOrder, 1,
                 sigtrader::domain::VenueErrorKind::Timeout);

  engine->start();
  ASSERT_TRUE(engine->submitMessage(record(10, kBuyText)));
  ASSERT_TRUE(engine->waitIdle(2s));
  engine->stop();

  EXPECT_TRUE(sent.load());
  EXPECT_TRUE(accepted.load());
  EXPECT_EQ(venue.callCount(sigtrader::VenueOp::PlaceOrder), 2u);
  const auto* signal = store.snapshot()->findSignal(1);
  ASSERT_NE(signal, nullptr);
  EXPECT_EQ(signal->status, SignalStatus::Cancelled);
  EXPECT_TRUE(venue.tickets().empty());

  // Pending -> Open by the placement, then Open -> Cancelled by the Delete.
  auto rows = store.snapshot()->recentHistory(2);
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[1].to, SignalStatus::Open);
  EXPECT_EQ(rows[0].to, SignalStatus::Cancelled);
}

// -----------------------------------------------------------------------------
// 13. Operator reports and a custom-lot close through executeCommand.
// -----------------------------------------------------------------------------
TEST_F(SignalEngineTest, ReportSummaryAndCloseVolumeOps) {
  config.sizing.closer_price = 0.01;  // fill at the quote
  auto engine = makeEngine(store);
  engine->start();
  ASSERT_TRUE(engine->submitMessage(record(10, kBuyText)));
  ASSERT_TRUE(engine->waitIdle(2s));
  const auto tickets = store.snapshot()->ticketsFor(1);
  ASSERT_EQ(tickets.size(), 1u);
  const auto ticket = tickets[0].id;

  json close = request(*engine,
                       R"({"op":"command","signal_id":1,"kind":"closevolume","ticket":)" +
                           std::to_string(ticket) + R"(,"volume":0.05})");
  EXPECT_EQ(close["response"], "submitted");
  ASSERT_TRUE(engine->waitIdle(2s));
  const auto* closed = store.snapshot()->findTicket(ticket);
  ASSERT_NE(closed, nullptr);
  EXPECT_NEAR(closed->volume, 0.15, 1e-9);
  EXPECT_NEAR(closed->realized_profit, -1.0, 1e-6);

  EXPECT_EQ(request(*engine, R"({"op":"command","signal_id":1,"kind":"closevolume","ticket":1,"volume":-1})")
                ["status"],
            "error");
  EXPECT_EQ(request(*engine, R"({"op":"command","signal_id":1,"kind":"closevolume"})")
                ["status"],
            "error");

  json report = request(*engine, R"({"op":"report","channel":"vip"})");
  EXPECT_EQ(report["report"]["total_positions"], 1);
  EXPECT_EQ(report["report"]["open_positions"], 1);

  json compare = request(*engine, R"({"op":"compare"})");
  ASSERT_EQ(compare["channels"].size(), 1u);
  EXPECT_EQ(compare["channels"][0]["channel_id"], "vip");

  json summary = request(*engine, R"({"op":"summary"})")["summary"];
  EXPECT_EQ(summary["open_positions"], 1);
  EXPECT_EQ(summary["pending_orders"], 0);
  EXPECT_NEAR(summary["realized_profit"].get<double>(), -1.0, 1e-6);
  EXPECT_NEAR(summary["balance"].get<double>(), 9999.0, 1e-6);

  engine->stop();
}
