#pragma once

#include "ledger/concurrent/thread_safe_queue.hpp"
#include "ledger/eventbus/event_bus.hpp"
#include "ledger/events/event.hpp"

#include <atomic>
#include <cstddef>
#include <thread>

namespace ledger {

// -----------------------------------------------------------------------------
// EventLoopThread — the notification loop
// -----------------------------------------------------------------------------
//
// @brief  Owns one worker thread that drains a ThreadSafeQueue<Event> and
//         publishes each event on its own EventBus.
//
// @details
// Request threads (adjustments, batches) only push; they never run
// subscriber code. Everything subscribed to eventBus() (low-stock
// detection, telemetry) therefore runs serialized on this one thread and
// cannot add latency to, or deadlock with, a store commit.
//
// Shutdown:
//   stop() asks the worker to exit, joins it, then publishes whatever is
//   still queued on the calling thread. Notifications for commits that
//   already happened are never silently lost at shutdown.
//
// Thread model:
//   start(), stop() and push() are safe from any thread. Subscriber
//   callbacks run on the worker thread (or on the stop() caller during the
//   final drain).
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  EventLoopThread() = default;
  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  // Idempotent.
  void start();

  // Idempotent. Drains the queue after joining the worker.
  void stop();

  void push(Event event) { queue_.push(std::move(event)); }

  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

  bool running() const { return running_.load(); }
  std::size_t pending() const { return queue_.size(); }

 private:
  void run();
  void drain();

  ThreadSafeQueue<Event> queue_;
  EventBus bus_;
  std::atomic<bool> running_{false};
  std::thread thread_;
};

}  // namespace ledger
