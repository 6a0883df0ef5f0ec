#pragma once

#include "vclock/config/engine_config.hpp"
#include "vclock/eventbus/event_bus.hpp"
#include "vclock/network/clock_server.hpp"
#include "vclock/time/legacy_clock_adapter.hpp"
#include "vclock/time/tick_clock.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace vclock {

// -----------------------------------------------------------------------------
// ClockEngine
// -----------------------------------------------------------------------------
//
// @brief  Programmatic root of vclock: owns the TickClock, its legacy
//         adapter, the EventBus and (optionally) the ClockServer.
//
// @details
// Drivers mutate simulated time through the engine rather than the raw
// clock so that every mutation is announced on the bus:
//
//   advance(n)                → TickAdvancedEvent
//   stamp(actor, parent, hint) → TimestampIssuedEvent
//   reset()                   → ClockResetEvent
//
// executeCommand() is the JSON protocol served by ClockServer. It is also
// callable directly, which is how tests exercise the protocol without
// sockets.
//
// Thread model:
//   start()/stop() from the owning thread. advance/stamp/reset and
//   executeCommand() may run on the driver thread and the server thread at
//   once; TickClock serializes them internally. Bus callbacks run on
//   whichever thread caused the event.
//
// Ownership:
//   ClockEngine
//    ├── clock_              (TickClock, value member)
//    ├── legacy_             (LegacyClockAdapter, borrows clock_)
//    ├── event_bus_          (EventBus, value member)
//    └── server_             (shared_ptr<ClockServer>, only while running
//                             with both endpoints configured; the telemetry
//                             bridge holds the other reference)
// -----------------------------------------------------------------------------
class ClockEngine {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  config  Clock parameters and server endpoints. Empty endpoints
  //                 disable the server.
  //
  // @throws std::invalid_argument if config.clock fails validate().
  //
  // No threads or sockets are created until start().
  // -------------------------------------------------------------------------
  explicit ClockEngine(EngineConfig config = {});

  ~ClockEngine();

  ClockEngine(const ClockEngine&) = delete;
  ClockEngine& operator=(const ClockEngine&) = delete;
  ClockEngine(ClockEngine&&) = delete;
  ClockEngine& operator=(ClockEngine&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // @brief  Starts ClockServer (if configured) and bridges bus events to its
  //         telemetry queue. Idempotent.
  //
  // @throws zmq::error_t if the server cannot bind.
  // -------------------------------------------------------------------------
  void start();

  // Detaches telemetry and stops the server. Idempotent.
  void stop();

  // -------------------------------------------------------------------------
  // Clock mutations (publish on the bus)
  // -------------------------------------------------------------------------
  void advance(std::int64_t n = 1);

  TimestampResult stamp(std::int64_t actor_id,
                        std::optional<std::int64_t> parent_timestamp =
                            std::nullopt,
                        const std::string& action_hint = "");

  void reset();

  // -------------------------------------------------------------------------
  // executeCommand(request)
  // -------------------------------------------------------------------------
  //
  // @brief  Runs one JSON command and returns the JSON response.
  //
  // @details
  // Request: {"op": <name>, ...args}. Response: {"status":"ok", ...} or
  // {"status":"error","response":<message>}. Never throws.
  //
  //   ping                                → {"response":"pong"}
  //   status                              → tick, range, seed, duration,
  //                                         description
  //   advance        {n=1}                → tick, range
  //   tick_range                          → start, end
  //   synthesize     {actor_id, parent?,  → timestamp, tick, outcome, iso
  //                   hint?=""}
  //   to_iso         {v}                  → iso
  //   from_iso       {iso}                → v
  //   reset                               → tick
  //   get_time_step                       → time_step (string)
  //   set_time_step  {value}              → time_step
  //   time_transfer                       → iso
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& request);

  TickClock& clock() { return clock_; }
  LegacyClockAdapter& legacy() { return legacy_; }
  EventBus& eventBus() { return event_bus_; }

  bool isRunning() const { return running_; }

 private:
  nlohmann::json dispatch(const nlohmann::json& request);

  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  TickClock clock_;
  LegacyClockAdapter legacy_;
  EventBus event_bus_;

  std::shared_ptr<ClockServer> server_;
  std::optional<EventBus::SubscriptionId> telemetry_subscription_;

  bool running_{false};
};

}  // namespace vclock
