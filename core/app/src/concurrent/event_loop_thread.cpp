#include "ledger/concurrent/event_loop_thread.hpp"

#include <chrono>

namespace ledger {

namespace {

// Upper bound on how long stop() waits for an idle worker to notice.
constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

}  // namespace

EventLoopThread::~EventLoopThread() { stop(); }

void EventLoopThread::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

void EventLoopThread::stop() {
  if (!thread_.joinable()) {
    return;
  }
  running_.store(false);
  thread_.join();
  drain();
}

// -----------------------------------------------------------------------------
// run() — worker loop
// -----------------------------------------------------------------------------
// pop_for() returns after at most kIdleWaitTimeout, so running_ is
// re-checked regularly even when no events arrive.
// -----------------------------------------------------------------------------
void EventLoopThread::run() {
  while (running_.load()) {
    std::optional<Event> event = queue_.pop_for(kIdleWaitTimeout);
    if (event) {
      bus_.publish(*event);
    }
  }
}

void EventLoopThread::drain() {
  while (std::optional<Event> event = queue_.try_pop()) {
    bus_.publish(*event);
  }
}

}  // namespace ledger
