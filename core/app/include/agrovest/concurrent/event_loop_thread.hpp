#pragma once

#include "agrovest/concurrent/thread_safe_queue.hpp"
#include "agrovest/eventbus/event_bus.hpp"
#include "agrovest/events/event.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string>
#include <thread>

namespace agrovest {

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------
// Responsibility: One worker thread that drains a ThreadSafeQueue<Event> and
// publishes each event on its own EventBus. Request threads push post-commit
// notifications here and return immediately; subscribers (audit log, IPC
// telemetry) run serialized on the loop thread.
//
// Thread model: start(), stop() and push() may be called from any thread.
// stop() publishes whatever is still queued before the worker exits, so no
// committed change goes unreported at shutdown.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  explicit EventLoopThread(std::string name = "EventLoop");

  // Joins the worker.
  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  // Idempotent.
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // Clears running_, wakes the worker, joins it. The worker drains the queue
  // before returning. Idempotent; start() may be called again afterwards.
  // -------------------------------------------------------------------------
  void stop();

  void push(Event event) {
    queue_.push(std::move(event));
    wake_cv_.notify_one();
  }

  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

  bool running() const { return running_.load(); }
  std::size_t pending() const { return queue_.size(); }
  const std::string& name() const { return name_; }

 private:
  void run();
  void drain();

  std::string name_;
  ThreadSafeQueue<Event> queue_;
  EventBus bus_;
  std::atomic<bool> running_{false};
  std::mutex wake_mutex_;
  std::condition_variable wake_cv_;
  std::thread thread_;
};

}  // namespace agrovest
