#pragma once

#include "vclock/concurrent/thread_safe_queue.hpp"
#include "vclock/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace vclock {

// -----------------------------------------------------------------------------
// ClockServer: ZeroMQ front end for an out-of-process simulation driver
// -----------------------------------------------------------------------------
//
// @brief  Serves clock commands on a REP socket and broadcasts clock
//         telemetry on a PUB socket, both from one worker thread.
//
// @details
// The simulation driver (typically a Python agent loop) keeps no clock of
// its own. Each step it sends
//
//   {"op":"synthesize","actor_id":7,"parent":81015,"hint":"create_comment"}
//
// to the REP socket and receives {"status":"ok","timestamp":...,"iso":...}.
// Requests are forwarded verbatim to the CommandHandler (bound to
// ClockEngine::executeCommand()), which owns the protocol.
//
// Every event ClockEngine publishes reaches pushTelemetry() and is
// broadcast as one JSON message, e.g.
//
//   {"type":"tick_advanced","previous_tick":0,"current_tick":1,...}
//
// so observers (dashboards, exporters) can follow a run without polling.
//
// Thread model:
//   start()/stop() from the owning thread. run() on the worker thread,
//   which alone touches the sockets. pushTelemetry() from any thread.
//   The REP socket has ZMQ_RCVTIMEO so the worker alternates between
//   draining telemetry and waiting for commands, and notices stop().
//
// Ownership:
//   Owned by ClockEngine via std::unique_ptr. Owns the ZMQ context, both
//   sockets, the telemetry queue and the worker thread.
// -----------------------------------------------------------------------------
class ClockServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // No sockets are opened until start().
  explicit ClockServer(CommandHandler command_handler,
                       std::string cmd_endpoint = "tcp://127.0.0.1:5560",
                       std::string pub_endpoint = "tcp://127.0.0.1:5561");

  // RAII: calls stop().
  ~ClockServer();

  ClockServer(const ClockServer&) = delete;
  ClockServer& operator=(const ClockServer&) = delete;
  ClockServer(ClockServer&&) = delete;
  ClockServer& operator=(ClockServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // @brief  Binds both sockets and spawns the worker thread.
  //
  // @throws zmq::error_t if an endpoint cannot be bound (e.g. port in use).
  //
  // Idempotent.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // @brief  Signals the worker, joins it (within kPollTimeoutMs), publishes
  //         any telemetry still queued and closes the sockets.
  //
  // Idempotent; safe if never started.
  // -------------------------------------------------------------------------
  void stop();

  // Queue an event for broadcast. Never blocks on I/O.
  void pushTelemetry(Event event);

  bool isRunning() const { return running_.load(); }

  // -------------------------------------------------------------------------
  // formatTelemetry(event)
  // -------------------------------------------------------------------------
  // @brief  JSON wire form of a clock event, as published on the PUB socket.
  //
  // @details
  // Public so the wire format can be tested without sockets.
  // -------------------------------------------------------------------------
  static std::string formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();

  static std::string formatTickAdvanced(const TickAdvancedEvent& e);
  static std::string formatTimestampIssued(const TimestampIssuedEvent& e);
  static std::string formatClockReset(const ClockResetEvent& e);

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

}  // namespace vclock
