#include "vclock/network/clock_server.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <iostream>
#include <utility>

namespace vclock {

// -----------------------------------------------------------------------------
// Constructor / destructor
// -----------------------------------------------------------------------------
ClockServer::ClockServer(CommandHandler command_handler,
                         std::string cmd_endpoint, std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

ClockServer::~ClockServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): bind sockets, spawn worker
// -----------------------------------------------------------------------------
void ClockServer::start() {
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

  std::cout << "[ClockServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal, join, close
// -----------------------------------------------------------------------------
void ClockServer::stop() {
  if (!running_.exchange(false)) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[ClockServer] stopped.\n";
}

void ClockServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// run(): worker loop
// -----------------------------------------------------------------------------
void ClockServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }

  // Commands answered just before stop() may have queued telemetry.
  processTelemetry();
}

void ClockServer::processTelemetry() {
  while (auto maybe_event = telemetry_queue_.try_pop()) {
    const std::string json_str = formatTelemetry(*maybe_event);
    zmq::message_t msg(json_str.data(), json_str.size());
    // dontwait: a slow subscriber must never stall the clock.
    const auto sent = pub_socket_->send(msg, zmq::send_flags::dontwait);
    if (!sent.has_value()) {
      std::cerr << "[ClockServer] WARNING: telemetry dropped (PUB would "
                   "block)\n";
    }
  }
}

// -----------------------------------------------------------------------------
// processCommands(): one REQ/REP round trip, or a timeout
// -----------------------------------------------------------------------------
void ClockServer::processCommands() {
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

  // REP must answer every request, so the handler is expected not to throw.
  const std::string response = command_handler_(request.to_string());

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

// -----------------------------------------------------------------------------
// formatTelemetry(): dispatch on the Event variant
// -----------------------------------------------------------------------------
std::string ClockServer::formatTelemetry(const Event& event) {
  if (const auto* e = std::get_if<TickAdvancedEvent>(&event)) {
    return formatTickAdvanced(*e);
  }
  if (const auto* e = std::get_if<TimestampIssuedEvent>(&event)) {
    return formatTimestampIssued(*e);
  }
  return formatClockReset(std::get<ClockResetEvent>(event));
}

std::string ClockServer::formatTickAdvanced(const TickAdvancedEvent& e) {
  nlohmann::json j;
  j["type"] = "tick_advanced";
  j["previous_tick"] = e.previous_tick;
  j["current_tick"] = e.current_tick;
  j["range_start"] = e.range.start;
  j["range_end"] = e.range.end;
  j["range_start_iso"] = e.range_start_iso;
  return j.dump();
}

std::string ClockServer::formatTimestampIssued(const TimestampIssuedEvent& e) {
  nlohmann::json j;
  j["type"] = "timestamp_issued";
  j["actor_id"] = e.actor_id;
  j["hint"] = e.action_hint;
  if (e.parent_timestamp.has_value()) {
    j["parent"] = *e.parent_timestamp;
  } else {
    j["parent"] = nullptr;
  }
  j["tick"] = e.result.tick;
  j["timestamp"] = e.result.timestamp;
  j["outcome"] = synthesisOutcomeToString(e.result.outcome);
  j["iso"] = e.iso;
  return j.dump();
}

std::string ClockServer::formatClockReset(const ClockResetEvent& e) {
  nlohmann::json j;
  j["type"] = "clock_reset";
  j["previous_tick"] = e.previous_tick;
  j["seed"] = e.seed;
  return j.dump();
}

}  // namespace vclock
