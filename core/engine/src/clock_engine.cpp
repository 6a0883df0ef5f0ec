#include "vclock/engine/clock_engine.hpp"

#include <nlohmann/json.hpp>

#include <exception>
#include <iostream>
#include <utility>

namespace vclock {

namespace {

nlohmann::json errorResponse(const std::string& message) {
  nlohmann::json j;
  j["status"] = "error";
  j["response"] = message;
  return j;
}

nlohmann::json okResponse() {
  nlohmann::json j;
  j["status"] = "ok";
  return j;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor / destructor
// -----------------------------------------------------------------------------
ClockEngine::ClockEngine(EngineConfig config)
    : cmd_endpoint_(std::move(config.cmd_endpoint)),
      pub_endpoint_(std::move(config.pub_endpoint)),
      clock_(config.clock),
      legacy_(clock_) {}

ClockEngine::~ClockEngine() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void ClockEngine::start() {
  if (running_) {
    return;
  }

  if (!cmd_endpoint_.empty() && !pub_endpoint_.empty()) {
    server_ = std::make_shared<ClockServer>(
        [this](const std::string& request) { return executeCommand(request); },
        cmd_endpoint_, pub_endpoint_);
    server_->start();

    // Telemetry bridge: every bus event is queued for the PUB socket. The
    // bridge shares ownership of the server, so a publish that snapshotted
    // it before stop() pushes into a stopped server, not a destroyed one.
    telemetry_subscription_ = event_bus_.subscribe(
        [server = server_](const Event& event) {
          server->pushTelemetry(event);
        });
  }

  running_ = true;

  std::cout << "[ClockEngine] started. " << clock_.describe()
            << (server_ ? "" : " (server disabled)") << "\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void ClockEngine::stop() {
  if (!running_) {
    return;
  }

  // Detach the bridge before the server it points at goes away.
  if (telemetry_subscription_.has_value()) {
    event_bus_.unsubscribe(*telemetry_subscription_);
    telemetry_subscription_.reset();
  }

  if (server_) {
    server_->stop();
    server_.reset();
  }

  running_ = false;

  std::cout << "[ClockEngine] stopped at tick " << clock_.currentTick()
            << ".\n";
}

// -----------------------------------------------------------------------------
// advance()
// -----------------------------------------------------------------------------
void ClockEngine::advance(std::int64_t n) {
  TickAdvancedEvent e;
  e.previous_tick = clock_.currentTick();
  clock_.advance(n);
  e.current_tick = clock_.currentTick();
  e.range = clock_.tickRange();
  e.range_start_iso = clock_.toIso(e.range.start);
  event_bus_.publish(e);
}

// -----------------------------------------------------------------------------
// stamp()
// -----------------------------------------------------------------------------
TimestampResult ClockEngine::stamp(std::int64_t actor_id,
                                   std::optional<std::int64_t> parent_timestamp,
                                   const std::string& action_hint) {
  TimestampIssuedEvent e;
  e.actor_id = actor_id;
  e.action_hint = action_hint;
  e.parent_timestamp = parent_timestamp;
  e.result = clock_.synthesizeTimestampDetailed(actor_id, parent_timestamp,
                                                action_hint);
  e.iso = clock_.toIso(e.result.timestamp);
  event_bus_.publish(e);
  return e.result;
}

// -----------------------------------------------------------------------------
// reset()
// -----------------------------------------------------------------------------
void ClockEngine::reset() {
  ClockResetEvent e;
  e.previous_tick = clock_.currentTick();
  e.seed = clock_.config().seed;
  clock_.reset();
  event_bus_.publish(e);
}

// -----------------------------------------------------------------------------
// executeCommand(): parse, dispatch, never throw
// -----------------------------------------------------------------------------
std::string ClockEngine::executeCommand(const std::string& request) {
  nlohmann::json response;
  try {
    response = dispatch(nlohmann::json::parse(request));
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[ClockEngine] JSON error: " << e.what()
              << "; request: " << request << "\n";
    response = errorResponse(std::string("bad request: ") + e.what());
  } catch (const std::exception& e) {
    response = errorResponse(e.what());
  }
  return response.dump();
}

// -----------------------------------------------------------------------------
// dispatch(): one branch per op
// -----------------------------------------------------------------------------
nlohmann::json ClockEngine::dispatch(const nlohmann::json& request) {
  const std::string op = request.at("op").get<std::string>();
  nlohmann::json r = okResponse();

  if (op == "ping") {
    r["response"] = "pong";
  } else if (op == "status") {
    const TickRange range = clock_.tickRange();
    r["tick"] = clock_.currentTick();
    r["range_start"] = range.start;
    r["range_end"] = range.end;
    r["tick_duration_seconds"] = clock_.config().tick_duration_seconds;
    r["seed"] = clock_.config().seed;
    r["description"] = clock_.describe();
  } else if (op == "advance") {
    advance(request.value("n", std::int64_t{1}));
    const TickRange range = clock_.tickRange();
    r["tick"] = clock_.currentTick();
    r["range_start"] = range.start;
    r["range_end"] = range.end;
  } else if (op == "tick_range") {
    const TickRange range = clock_.tickRange();
    r["start"] = range.start;
    r["end"] = range.end;
  } else if (op == "synthesize") {
    std::optional<std::int64_t> parent;
    if (request.contains("parent") && !request.at("parent").is_null()) {
      parent = request.at("parent").get<std::int64_t>();
    }
    const TimestampResult result =
        stamp(request.at("actor_id").get<std::int64_t>(), parent,
              request.value("hint", std::string{}));
    r["timestamp"] = result.timestamp;
    r["tick"] = result.tick;
    r["outcome"] = synthesisOutcomeToString(result.outcome);
    r["iso"] = clock_.toIso(result.timestamp);
  } else if (op == "to_iso") {
    r["iso"] = clock_.toIso(request.at("v").get<std::int64_t>());
  } else if (op == "from_iso") {
    r["v"] = clock_.fromCalendar(parseIso(request.at("iso").get<std::string>()));
  } else if (op == "reset") {
    reset();
    r["tick"] = clock_.currentTick();
  } else if (op == "get_time_step") {
    r["time_step"] = legacy_.timeStepString();
  } else if (op == "set_time_step") {
    legacy_.setTimeStep(request.at("value").get<std::int64_t>());
    r["time_step"] = legacy_.timeStep();
  } else if (op == "time_transfer") {
    // The legacy call ignores its instants, so none are read here either.
    r["iso"] = formatIso(legacy_.timeTransfer(CalendarInstant{},
                                              CalendarInstant{}));
  } else {
    return errorResponse("unknown op: " + op);
  }

  return r;
}

}  // namespace vclock
