#include "agrovest/network/ipc_server.hpp"

#include "agrovest/network/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>
#include <vector>

namespace agrovest {

IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint, std::size_t command_workers)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)),
      command_workers_(command_workers == 0 ? 1 : command_workers) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  // ---  1) Sockets ------------------------------------------------------------
  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::router);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  // recv() returns empty after kPollTimeoutMs so telemetry keeps flowing
  // between commands. No linger: stop() must not wait on slow subscribers.
  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->set(zmq::sockopt::linger, 0);
  pub_socket_->set(zmq::sockopt::linger, 0);

  // ---  2) Bind (throws zmq::error_t if an endpoint is taken) -----------------
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  bound_cmd_endpoint_ = cmd_socket_->get(zmq::sockopt::last_endpoint);

  // ---  3) Threads --------------------------------------------------------------
  commands_served_ = 0;
  telemetry_published_ = 0;
  running_.store(true);
  for (std::size_t i = 0; i < command_workers_; ++i) {
    workers_.emplace_back([this] { workerLoop(); });
  }
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] listening. commands=" << bound_cmd_endpoint_
            << " telemetry=" << pub_endpoint_
            << " workers=" << command_workers_ << "\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  const bool was_running = running_.exchange(false);
  if (thread_.joinable()) {
    thread_.join();
  }
  if (!was_running) {
    return;
  }

  // Workers finish what is already queued, then exit on the markers.
  for (std::size_t i = 0; i < workers_.size(); ++i) {
    command_queue_.push(std::nullopt);
  }
  for (auto& worker : workers_) {
    worker.join();
  }
  workers_.clear();

  // The socket thread is gone, so the sockets are safe to use from here.
  processReplies();

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped. commands_served=" << commands_served_
            << " telemetry_published=" << telemetry_published_ << "\n";
}

void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// run()
// -----------------------------------------------------------------------------
void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processReplies();
    processCommands();
  }
  processTelemetry();
}

// -----------------------------------------------------------------------------
// workerLoop(): runs the command handler off the socket thread
// -----------------------------------------------------------------------------
void IpcServer::workerLoop() {
  while (auto job = command_queue_.pop()) {
    // Every request gets a reply, so a handler failure still answers.
    try {
      job->body = command_handler_(job->body);
    } catch (const std::exception& e) {
      std::cerr << "[IpcServer] ERROR: command handler threw: " << e.what()
                << "\n";
      job->body =
          nlohmann::json{{"code", 500}, {"error", "Internal error"}}.dump();
    }
    reply_queue_.push(std::move(*job));
  }
}

// -----------------------------------------------------------------------------
// processTelemetry(): two frames per event, [type][json]
// -----------------------------------------------------------------------------
// The first frame is the telemetry type ("payment_update", ...), so a SUB
// client can filter with ZMQ_SUBSCRIBE on the type name.
// -----------------------------------------------------------------------------
void IpcServer::processTelemetry() {
  while (auto event = telemetry_queue_.try_pop()) {
    auto frames = formatTelemetry(*event);
    if (!frames.has_value()) {
      continue;
    }

    zmq::message_t topic(frames->first.data(), frames->first.size());
    zmq::message_t body(frames->second.data(), frames->second.size());
    if (!pub_socket_->send(topic,
                           zmq::send_flags::sndmore | zmq::send_flags::dontwait) ||
        !pub_socket_->send(body, zmq::send_flags::dontwait)) {
      std::cerr << "[IpcServer] WARNING: dropped " << frames->first
                << " telemetry (PUB would block).\n";
      continue;
    }
    ++telemetry_published_;
  }
}

// -----------------------------------------------------------------------------
// processReplies(): [envelope...][reply] back through the ROUTER
// -----------------------------------------------------------------------------
// A client that went away is dropped by the ROUTER without an error.
// -----------------------------------------------------------------------------
void IpcServer::processReplies() {
  while (auto job = reply_queue_.try_pop()) {
    for (const auto& frame : job->envelope) {
      zmq::message_t part(frame.data(), frame.size());
      cmd_socket_->send(part, zmq::send_flags::sndmore);
    }
    zmq::message_t reply(job->body.data(), job->body.size());
    cmd_socket_->send(reply, zmq::send_flags::none);
    ++commands_served_;
  }
}

// -----------------------------------------------------------------------------
// processCommands(): read one request and hand it to the workers
// -----------------------------------------------------------------------------
// A REQ client arrives as [identity][empty][body]. Everything before the
// body is kept verbatim and sent back in front of the reply.
// -----------------------------------------------------------------------------
void IpcServer::processCommands() {
  zmq::message_t part;
  zmq::recv_result_t received;

  try {
    received = cmd_socket_->recv(part, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }
  if (!received.has_value()) {
    return;
  }

  // The remaining frames of a multipart message are already queued.
  std::vector<std::string> frames{part.to_string()};
  while (part.more()) {
    if (!cmd_socket_->recv(part, zmq::recv_flags::none)) {
      break;
    }
    frames.push_back(part.to_string());
  }

  if (frames.size() < 2) {
    std::cerr << "[IpcServer] WARNING: dropped command without an envelope.\n";
    return;
  }

  CommandJob job;
  job.body = std::move(frames.back());
  frames.pop_back();
  job.envelope = std::move(frames);
  command_queue_.push(std::move(job));
}

std::optional<std::pair<std::string, std::string>> IpcServer::formatTelemetry(
    const Event& event) {
  auto j = telemetryJson(event);
  if (!j.has_value()) {
    return std::nullopt;
  }
  return std::make_pair(j->at("type").get<std::string>(), j->dump());
}

}  // namespace agrovest
