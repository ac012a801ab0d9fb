#pragma once

#include "ledger/concurrent/thread_safe_queue.hpp"
#include "ledger/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace ledger {

// -----------------------------------------------------------------------------
// IpcServer — ZeroMQ front door of the ledger
// -----------------------------------------------------------------------------
//
// @brief  Serves JSON commands on a REP socket and broadcasts ledger
//         telemetry on a PUB socket, both from one worker thread.
//
// @details
// Command channel (REP, default tcp://127.0.0.1:5556):
//   Each request is one JSON document such as
//     {"command":"adjust","user_id":1,"product_id":7,"location_id":1,
//      "delta":-3,"type":"SALE","expected_version":4}
//   The raw string is handed to the CommandHandler (LedgerEngine's
//   executeCommand) and its return value is sent back as the reply. The
//   handler runs on this server's worker thread, so commands are served one
//   at a time per server; concurrency between request sources comes from
//   callers using the engine API directly.
//
// Telemetry channel (PUB, default tcp://127.0.0.1:5557):
//   pushTelemetry() queues notification events from the notification loop.
//   Each event goes out as two frames: the type tag ("stock_adjusted",
//   "low_stock", ...) and the JSON body (wire::eventToJson). Subscribers
//   filter on the first frame, e.g. setsockopt(ZMQ_SUBSCRIBE, "low_stock").
//   Sends never block; a message past the high-water mark is dropped and
//   counted.
//
// Socket ownership:
//   zmq sockets are not thread-safe. Both sockets and the context are
//   created in start() and used only by the worker thread until stop()
//   joins it.
//
// Thread model:
//   start()/stop() from the owning thread (LedgerEngine). pushTelemetry()
//   and the counters from any thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  explicit IpcServer(CommandHandler command_handler,
                     std::string command_endpoint = "tcp://127.0.0.1:5556",
                     std::string telemetry_endpoint = "tcp://127.0.0.1:5557");
  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // Binds both sockets and spawns the worker. Rethrows zmq::error_t if an
  // endpoint cannot be bound; the server is then left stopped.
  void start();

  // Publishes what is still queued, joins the worker and closes sockets.
  void stop();

  void pushTelemetry(Event event);

  bool running() const { return running_.load(); }
  std::uint64_t commandsServed() const { return commands_served_.load(); }
  std::uint64_t telemetryDropped() const { return telemetry_dropped_.load(); }

 private:
  // Bounds how late the worker notices stop().
  static constexpr int kCommandWaitMs = 50;
  static constexpr int kTelemetryHighWaterMark = 10'000;

  void serve();
  void publishQueuedTelemetry();
  void serveOneCommand();

  CommandHandler command_handler_;
  std::string command_endpoint_;
  std::string telemetry_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> command_socket_;
  std::unique_ptr<zmq::socket_t> telemetry_socket_;

  ThreadSafeQueue<Event> outbox_;
  std::thread worker_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> commands_served_{0};
  std::atomic<std::uint64_t> telemetry_dropped_{0};
};

}  // namespace ledger
