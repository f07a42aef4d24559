#pragma once

#include "dca/concurrent/thread_safe_queue.hpp"
#include "dca/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace dca {

// -----------------------------------------------------------------------------
// IpcServer — ZeroMQ command endpoint and telemetry publisher
// -----------------------------------------------------------------------------
//
// @brief  Runs one thread that answers JSON commands on a REP socket and
//         broadcasts lifecycle events as JSON on a PUB socket.
//
// @details
// Two ZeroMQ sockets live on the same worker thread:
//
//   1. REP socket (default port 5556):
//      Each request is one JSON object {"cmd": "...", ...}. The payload is
//      handed to command_handler_ (bound to DcaEngine::executeCommand())
//      and the returned JSON string is sent back. The handler never
//      throws; malformed requests come back as error replies.
//
//   2. PUB socket (default port 5557):
//      Lifecycle events pushed through pushTelemetry() are rendered with
//      eventToJson() and published with dontwait. Slow subscribers lose
//      messages; the engine never blocks on them.
//
// The REP socket has ZMQ_RCVTIMEO = kPollTimeoutMs, so the loop alternates
// between draining telemetry and waiting for the next command.
//
// Thread model:
//   Constructed, started and stopped by DcaEngine on the owning thread.
//   pushTelemetry() may be called from any thread (the ThreadSafeQueue
//   hands events over to the worker). Sockets are only touched by the
//   worker between start() and stop().
//
// Ownership:
//   Owned by DcaEngine via std::unique_ptr. Owns the context, both
//   sockets, the telemetry queue and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @brief  Stores parameters; no sockets are opened until start().
  //
  // @param  command_handler  Invoked on the worker thread for every request.
  // @param  cmd_endpoint     Bind address of the REP socket.
  // @param  pub_endpoint     Bind address of the PUB socket.
  // -------------------------------------------------------------------------
  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  //
  // @brief  Binds both sockets and spawns the worker. No-op when running.
  //
  // @details
  // Binding happens on the calling thread, so a port already in use
  // surfaces here as zmq::error_t rather than inside the worker.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  //
  // @brief  Clears running_, joins the worker (at most kPollTimeoutMs
  //         later), publishes whatever telemetry is still queued and closes
  //         the sockets. Idempotent.
  // -------------------------------------------------------------------------
  void stop();

  // Enqueue one lifecycle event for publication. Any thread.
  void pushTelemetry(Event event);

  // Rendered payload for one event, exactly as published.
  static std::string formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();

  void processTelemetry();

  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace dca
