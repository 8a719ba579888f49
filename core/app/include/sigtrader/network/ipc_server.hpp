#pragma once

#include "sigtrader/concurrent/thread_safe_queue.hpp"
#include "sigtrader/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace sigtrader {

// -----------------------------------------------------------------------------
// IpcServer - ZeroMQ command and telemetry gateway
// -----------------------------------------------------------------------------
//
// @brief  Dedicated thread serving a REP socket for operator requests and a
//         PUB socket broadcasting signal telemetry.
//
// @details
//   1. PUB socket: JSON for every SignalUpdateEvent and RejectionEvent
//      pushed through pushTelemetry(). Lanes and the ingestion loop only
//      enqueue; serialization and socket I/O happen on the IPC thread.
//
//   2. REP socket: every request string goes to the CommandHandler (bound
//      to SignalEngine::executeCommand) and its answer is sent back. The
//      socket uses ZMQ_RCVTIMEO so the thread alternates between request
//      polling and telemetry draining.
//
// Telemetry frames:
//   {"type":"signal_update","signal":{...},"previous_status":"Pending",
//    "reason":"...","tickets":[...]}
//   {"type":"rejection","stage":"parse","reason":"...","source":{...},
//    "signal_id":0,"at_ms":...}
//
// Thread model:
//   start()/stop() from the owning thread; stop() joins and publishes what
//   is still queued. pushTelemetry() from any thread. The CommandHandler
//   runs on the IPC thread.
//
// Ownership: owned by SignalEngine; owns the context, both sockets, the
// queue and the thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
            std::string pub_endpoint);
  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  void start();
  void stop();

  void pushTelemetry(Event event);

  // JSON frame for `event`, or std::nullopt for events that are not
  // telemetry.
  static std::optional<std::string> formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace sigtrader
