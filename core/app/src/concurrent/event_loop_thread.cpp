#include "agrovest/concurrent/event_loop_thread.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <utility>

namespace agrovest {

namespace {

// Upper bound on how long an idle worker sleeps before re-checking running_.
constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

}  // namespace

EventLoopThread::EventLoopThread(std::string name) : name_(std::move(name)) {}

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
  wake_cv_.notify_all();
  thread_.join();
}

// -----------------------------------------------------------------------------
// run(): pop-and-publish until stopped, then flush the backlog
// -----------------------------------------------------------------------------
void EventLoopThread::run() {
  while (running_.load()) {
    if (auto event = queue_.try_pop()) {
      try {
        bus_.publish(*event);
      } catch (const std::exception& e) {
        // A failing subscriber must not take the audit loop down with it.
        std::cerr << "[" << name_ << "] ERROR: subscriber threw: " << e.what()
                  << "\n";
      }
      continue;
    }

    std::unique_lock lock(wake_mutex_);
    wake_cv_.wait_for(lock, kIdleWaitTimeout, [this] {
      return !running_.load() || !queue_.empty();
    });
  }

  drain();
}

void EventLoopThread::drain() {
  while (auto event = queue_.try_pop()) {
    try {
      bus_.publish(*event);
    } catch (const std::exception& e) {
      std::cerr << "[" << name_ << "] ERROR: subscriber threw during drain: "
                << e.what() << "\n";
    }
  }
}

}  // namespace agrovest
