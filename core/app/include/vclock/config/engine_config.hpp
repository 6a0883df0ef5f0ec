#pragma once

#include "vclock/time/tick_clock_config.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace vclock {

// -----------------------------------------------------------------------------
// EngineConfig: everything vclock_server needs at startup
// -----------------------------------------------------------------------------
//
// @brief  TickClock parameters plus the ZeroMQ endpoints of ClockServer.
//
// @details
// JSON form (every key optional; missing keys keep the defaults):
//
//   {
//     "tick_duration_seconds": 86400,
//     "epoch": "2024-01-01 00:00:00",
//     "seed": 42,
//     "cmd_endpoint": "tcp://127.0.0.1:5560",
//     "pub_endpoint": "tcp://127.0.0.1:5561"
//   }
//
// An empty cmd_endpoint or pub_endpoint disables the server entirely, which
// is how tests and --demo runs use ClockEngine in process.
// -----------------------------------------------------------------------------
struct EngineConfig {
  TickClockConfig clock{};
  std::string cmd_endpoint{"tcp://127.0.0.1:5560"};
  std::string pub_endpoint{"tcp://127.0.0.1:5561"};
};

// -------------------------------------------------------------------------
// tickClockConfigFromJson / engineConfigFromJson
// -------------------------------------------------------------------------
// @throws nlohmann::json::type_error   if a key has the wrong JSON type.
// @throws std::invalid_argument        if "epoch" is not a valid date-time
//                                      or the clock config fails validate().
// -------------------------------------------------------------------------
TickClockConfig tickClockConfigFromJson(const nlohmann::json& j);
EngineConfig engineConfigFromJson(const nlohmann::json& j);

// -------------------------------------------------------------------------
// loadEngineConfig(path)
// -------------------------------------------------------------------------
// @throws std::runtime_error             if the file cannot be opened.
// @throws nlohmann::json::parse_error    on malformed JSON.
// Plus everything engineConfigFromJson() throws.
// -------------------------------------------------------------------------
EngineConfig loadEngineConfig(const std::string& path);

}  // namespace vclock
