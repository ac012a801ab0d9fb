#include "ledger/network/ipc_server.hpp"
#include "ledger/network/wire_format.hpp"

#include <iostream>
#include <optional>
#include <utility>

namespace ledger {

IpcServer::IpcServer(CommandHandler command_handler,
                     std::string command_endpoint,
                     std::string telemetry_endpoint)
    : command_handler_(std::move(command_handler)),
      command_endpoint_(std::move(command_endpoint)),
      telemetry_endpoint_(std::move(telemetry_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): a server that is never started never binds a port.
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  command_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  telemetry_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  command_socket_->set(zmq::sockopt::rcvtimeo, kCommandWaitMs);
  command_socket_->set(zmq::sockopt::linger, 0);
  telemetry_socket_->set(zmq::sockopt::linger, 0);
  telemetry_socket_->set(zmq::sockopt::sndhwm, kTelemetryHighWaterMark);

  try {
    command_socket_->bind(command_endpoint_);
    telemetry_socket_->bind(telemetry_endpoint_);
  } catch (const zmq::error_t& e) {
    std::cerr << "[IpcServer] bind failed: " << e.what() << "\n";
    telemetry_socket_.reset();
    command_socket_.reset();
    context_.reset();
    throw;
  }

  commands_served_.store(0);
  telemetry_dropped_.store(0);
  running_.store(true);
  worker_ = std::thread([this] { serve(); });

  std::cout << "[IpcServer] listening: commands on " << command_endpoint_
            << ", telemetry on " << telemetry_endpoint_ << "\n";
}

void IpcServer::stop() {
  running_.store(false);
  if (!worker_.joinable()) {
    return;
  }
  worker_.join();

  telemetry_socket_.reset();
  command_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped after " << commands_served_.load()
            << " commands (" << telemetry_dropped_.load()
            << " telemetry messages dropped).\n";
}

void IpcServer::pushTelemetry(Event event) {
  outbox_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// serve(): worker loop. Telemetry is flushed between commands and once more
// after the last one, so nothing queued before stop() is left behind.
// -----------------------------------------------------------------------------
void IpcServer::serve() {
  while (running_.load()) {
    publishQueuedTelemetry();
    serveOneCommand();
  }
  publishQueuedTelemetry();
}

// Two frames per event: the type tag (subscription topic) and the JSON body.
void IpcServer::publishQueuedTelemetry() {
  while (std::optional<Event> event = outbox_.try_pop()) {
    const nlohmann::json body = wire::eventToJson(*event);
    const std::string topic = body.at("type").get<std::string>();
    const std::string payload = body.dump();

    zmq::message_t topic_frame(topic.data(), topic.size());
    zmq::message_t body_frame(payload.data(), payload.size());
    const bool sent =
        telemetry_socket_
            ->send(topic_frame, zmq::send_flags::sndmore |
                                    zmq::send_flags::dontwait)
            .has_value() &&
        telemetry_socket_->send(body_frame, zmq::send_flags::dontwait)
            .has_value();
    if (!sent) {
      telemetry_dropped_.fetch_add(1);
    }
  }
}

// -----------------------------------------------------------------------------
// serveOneCommand(): REP is lock-step, so every received request gets
// exactly one reply before the next recv.
// -----------------------------------------------------------------------------
void IpcServer::serveOneCommand() {
  zmq::message_t request;
  zmq::recv_result_t received;
  try {
    received = command_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }
  if (!received) {
    return;  // rcvtimeo elapsed
  }

  const std::string reply = command_handler_(request.to_string());
  command_socket_->send(zmq::buffer(reply), zmq::send_flags::none);
  commands_served_.fetch_add(1);
}

}  // namespace ledger
