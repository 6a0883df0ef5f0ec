#pragma once

#include "vclock/time/tick_clock.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace vclock {

// -----------------------------------------------------------------------------
// TickAdvancedEvent
// -----------------------------------------------------------------------------
// Published by ClockEngine after every advance(). Carries the new tick's
// range so subscribers need not query the clock back.
// -----------------------------------------------------------------------------
struct TickAdvancedEvent {
  std::int64_t previous_tick{0};
  std::int64_t current_tick{0};
  TickRange range{};
  std::string range_start_iso;  // toIso(range.start), for display
};

// -----------------------------------------------------------------------------
// TimestampIssuedEvent
// -----------------------------------------------------------------------------
// One per ClockEngine::stamp() call. This is the export record of a
// simulated event's time: who acted, what they did, what it followed and
// when it happened.
// -----------------------------------------------------------------------------
struct TimestampIssuedEvent {
  std::int64_t actor_id{0};
  std::string action_hint;
  std::optional<std::int64_t> parent_timestamp;
  TimestampResult result{};
  std::string iso;  // toIso(result.timestamp)
};

// -----------------------------------------------------------------------------
// ClockResetEvent
// -----------------------------------------------------------------------------
// Published after reset(). Subscribers that keep per-run state (timelines,
// exporters) should drop it here.
// -----------------------------------------------------------------------------
struct ClockResetEvent {
  std::int64_t previous_tick{0};
  std::int64_t seed{0};
};

}  // namespace vclock
