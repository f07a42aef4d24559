#include "dca/network/ipc_server.hpp"

#include "dca/network/json_format.hpp"

#include <cerrno>
#include <iostream>
#include <utility>

namespace dca {

IpcServer::IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): bind sockets, spawn worker
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->set(zmq::sockopt::linger, 0);
  pub_socket_->set(zmq::sockopt::linger, 0);

  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal, join, close
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  if (!running_.load() && !thread_.joinable()) {
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

std::string IpcServer::formatTelemetry(const Event& event) {
  return eventToJson(event).dump();
}

// -----------------------------------------------------------------------------
// run(): alternate telemetry drain and command poll
// -----------------------------------------------------------------------------
void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }

  // Publish what was queued before shutdown.
  processTelemetry();
}

void IpcServer::processTelemetry() {
  while (auto event = telemetry_queue_.try_pop()) {
    std::string payload = formatTelemetry(*event);
    zmq::message_t msg(payload.data(), payload.size());
    if (!pub_socket_->send(msg, zmq::send_flags::dontwait)) {
      std::cerr << "[IpcServer] telemetry dropped (PUB would block)\n";
    }
  }
}

// -----------------------------------------------------------------------------
// processCommands(): one REQ/REP round trip, or a timeout
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

  std::string response = command_handler_(request.to_string());

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

}  // namespace dca
