#include "sigtrader/network/ipc_server.hpp"

#include "sigtrader/store/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>

namespace sigtrader {

IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): bind both sockets, then spawn the worker
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->bind(cmd_endpoint_);

  if (!pub_endpoint_.empty()) {
    pub_socket_ =
        std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);
    pub_socket_->bind(pub_endpoint_);
  }

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << (pub_endpoint_.empty() ? "-" : pub_endpoint_)
            << "\n";
}

void IpcServer::stop() {
  if (!running_.load()) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped.\n";
}

void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }
  processTelemetry();
}

void IpcServer::processTelemetry() {
  while (auto event = telemetry_queue_.try_pop()) {
    if (!pub_socket_) {
      continue;
    }
    if (auto frame = formatTelemetry(*event)) {
      zmq::message_t msg(frame->data(), frame->size());
      if (!pub_socket_->send(msg, zmq::send_flags::dontwait)) {
        std::cerr << "[IpcServer] telemetry frame dropped (would block)\n";
      }
    }
  }
}

// -----------------------------------------------------------------------------
// processCommands(): one request/reply round-trip, or a timeout
// -----------------------------------------------------------------------------
void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }
  if (!result.has_value()) {
    return;
  }

  std::string response;
  try {
    response = command_handler_(request.to_string());
  } catch (const std::exception& e) {
    std::cerr << "[IpcServer] command failed: " << e.what() << "\n";
    response = nlohmann::json{{"status", "error"}, {"response", e.what()}}.dump();
  }

  zmq::message_t reply(response.data(), response.size());
  if (!cmd_socket_->send(reply, zmq::send_flags::none)) {
    std::cerr << "[IpcServer] reply could not be sent\n";
  }
}

std::optional<std::string> IpcServer::formatTelemetry(const Event& event) {
  if (const auto* e = std::get_if<SignalUpdateEvent>(&event)) {
    nlohmann::json j;
    j["type"] = "signal_update";
    j["signal"] = e->signal;
    j["previous_status"] = domain::toString(e->previous_status);
    j["reason"] = e->reason;
    j["tickets"] = e->tickets;
    return j.dump();
  }
  if (const auto* e = std::get_if<RejectionEvent>(&event)) {
    nlohmann::json j;
    j["type"] = "rejection";
    j["stage"] = toString(e->stage);
    j["reason"] = e->reason;
    j["source"] = e->source;
    j["signal_id"] = e->signal_id;
    j["at_ms"] = e->at_ms;
    return j.dump();
  }
  return std::nullopt;
}

}  // namespace sigtrader
