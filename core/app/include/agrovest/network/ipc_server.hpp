#pragma once

#include "agrovest/concurrent/thread_safe_queue.hpp"
#include "agrovest/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace agrovest {

// -----------------------------------------------------------------------------
// IpcServer: dual-socket ZeroMQ front door for commands and telemetry
// -----------------------------------------------------------------------------
//
// @brief  Runs a socket thread that accepts JSON commands (ROUTER socket)
//         and broadcasts committed changes as JSON (PUB socket), plus a
//         pool of command workers.
//
// @details
// Two ZeroMQ sockets operate on the socket thread:
//
//   1. ROUTER socket (cmd_endpoint, default tcp://127.0.0.1:5556):
//      Clients talk to it with plain REQ sockets. Each request is one JSON
//      command; the socket thread queues it with its routing envelope and
//      a worker runs the command handler (bound to
//      InvestmentEngine::executeCommand()). Replies come back through a
//      second queue and are routed to the right client, so a command stuck
//      on a slow gateway call only occupies its own worker. ZMQ_RCVTIMEO
//      keeps recv() from blocking so the thread can alternate between
//      commands, replies and telemetry.
//
//   2. PUB socket (pub_endpoint, default tcp://127.0.0.1:5557):
//      Post-commit events arrive through pushTelemetry() from the audit
//      loop, are buffered in a ThreadSafeQueue, and are published as two
//      frames: the telemetry type, then the JSON body (see telemetryJson()).
//      A subscriber that cannot keep up loses messages; the engine never
//      blocks on it.
//
// Thread model:
//   Constructed and destroyed on the main thread (via InvestmentEngine).
//   start() spawns the socket thread and command_workers workers; stop()
//   clears an atomic flag, lets the workers finish queued commands and
//   joins everything.
//   pushTelemetry() is safe from any thread.
//   The command handler runs concurrently on the workers and must be
//   thread-safe. Only the socket thread touches the sockets while it runs.
//
// Ownership:
//   Owned by InvestmentEngine via std::unique_ptr. Owns the ZMQ context,
//   both sockets, the queues and all threads.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // No sockets are opened and no threads are spawned here; see start().
  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557",
                     std::size_t command_workers = 4);

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // Creates the context, binds ROUTER and PUB, sets ZMQ_RCVTIMEO and spawns
  // the threads. A second call is a no-op.
  // -------------------------------------------------------------------------
  void start();

  // Idempotent. Publishes whatever telemetry is still queued, then closes
  // the sockets and logs how many commands and events went through.
  void stop();

  void pushTelemetry(Event event);

  bool running() const { return running_.load(); }

  // Endpoint the command socket actually bound; resolves a "*" port.
  // Empty before start().
  const std::string& boundCommandEndpoint() const { return bound_cmd_endpoint_; }

 private:
  static constexpr int kPollTimeoutMs = 10;

  // One request in flight: the ROUTER envelope (identity and delimiter
  // frames) and the body, which the worker replaces with the reply.
  struct CommandJob {
    std::vector<std::string> envelope;
    std::string body;
  };

  // Loop (while running_): drain telemetry, send finished replies, then
  // poll one command.
  void run();
  void workerLoop();

  void processTelemetry();
  void processReplies();
  void processCommands();

  // {type, json} or nullopt for events that are not broadcast.
  static std::optional<std::pair<std::string, std::string>> formatTelemetry(
      const Event& event);

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;
  std::string bound_cmd_endpoint_;
  std::size_t command_workers_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  // std::nullopt tells one worker to exit.
  ThreadSafeQueue<std::optional<CommandJob>> command_queue_;
  ThreadSafeQueue<CommandJob> reply_queue_;
  std::thread thread_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};

  // Touched only by the socket thread while it runs.
  std::uint64_t commands_served_{0};
  std::uint64_t telemetry_published_{0};
};

}  // namespace agrovest
