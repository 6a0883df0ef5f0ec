#pragma once

#include "vclock/time/calendar.hpp"
#include "vclock/time/seed_mixer.hpp"
#include "vclock/time/tick_clock_config.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace vclock {

// -----------------------------------------------------------------------------
// TickRange
// -----------------------------------------------------------------------------
// Inclusive virtual-second interval covered by one tick.
// -----------------------------------------------------------------------------
struct TickRange {
  std::int64_t start{0};
  std::int64_t end{0};

  bool contains(std::int64_t v) const { return v >= start && v <= end; }

  bool operator==(const TickRange& o) const {
    return start == o.start && end == o.end;
  }
};

// -----------------------------------------------------------------------------
// SynthesisOutcome
// -----------------------------------------------------------------------------
// How a timestamp was obtained. Only Drawn and Probed satisfy every clock
// invariant; the other two are the documented degenerate cases.
// -----------------------------------------------------------------------------
enum class SynthesisOutcome {
  Drawn,           // First candidate was unused
  Probed,          // Candidate collided; a later free value was found
  ParentOverflow,  // Parent at/after tick end; returned parent + 1
  RangeExhausted   // Every value in [min_allowed, tick_end] was taken
};

const char* synthesisOutcomeToString(SynthesisOutcome outcome);

// -----------------------------------------------------------------------------
// TimestampResult
// -----------------------------------------------------------------------------
struct TimestampResult {
  std::int64_t timestamp{0};  // Virtual seconds since epoch
  std::int64_t tick{0};       // Tick active when the call was made
  SynthesisOutcome outcome{SynthesisOutcome::Drawn};
};

// -----------------------------------------------------------------------------
// TickClock: deterministic tick counter and sub-tick timestamp generator
// -----------------------------------------------------------------------------
//
// @brief  Owns all simulated time. Time moves only when advance() is called;
//         every simulated event asks synthesizeTimestamp() for a unique,
//         reproducible virtual-second timestamp inside the current tick.
//
// @details
// A tick covers tick_duration_seconds virtual seconds:
//
//   tick 0 → [0, d - 1]      tick 1 → [d, 2d - 1]      ...
//
// Many agents act "at once" inside one tick. To give them a stable order
// each call draws its timestamp from an isolated random source seeded by
//
//   (seed, tick, actor_id, action_hint, call_index)
//
// where call_index counts earlier calls by the same actor in the same tick.
// The same call sequence against a clock with the same config therefore
// always yields the same timestamps, with no dependence on wall-clock time
// or hash-table iteration order.
//
// Causality: a call with a parent timestamp p draws from [p + 1, tick_end].
// If p + 1 already lies past tick_end, the call returns p + 1 directly and
// spills out of the tick rather than break causality.
//
// Uniqueness: every value issued in a tick is remembered. A colliding draw
// probes forward (wrapping to min_allowed) until it finds a free value. If
// the whole window is taken the collision is accepted and logged.
//
// Thread model:
//   Designed for one driver loop, but every public method takes mutex_, so
//   a network thread and the driver may share one clock. Determinism then
//   holds only if the callers are serialized in a fixed order.
//
// Ownership:
//   Owned by ClockEngine (or a test) by value. Owns all of its state.
// -----------------------------------------------------------------------------
class TickClock {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @brief  Validates the config and starts at tick 0.
  //
  // @throws std::invalid_argument if config.tick_duration_seconds <= 0.
  // -------------------------------------------------------------------------
  explicit TickClock(TickClockConfig config = {});

  TickClock(const TickClock&) = delete;
  TickClock& operator=(const TickClock&) = delete;

  // -------------------------------------------------------------------------
  // advance(n)
  // -------------------------------------------------------------------------
  // @brief  Moves the current tick forward by n and forgets per-tick call
  //         counters.
  //
  // @param  n  Number of ticks to advance. Must be >= 1.
  //
  // @throws std::invalid_argument if n < 1, or if the new tick's range
  //         would end past INT64_MAX.
  //
  // Used-timestamp sets of earlier ticks are kept, so a tick revisited via
  // overrideTick() still never reissues a value.
  // -------------------------------------------------------------------------
  void advance(std::int64_t n = 1);

  // Inclusive virtual-second range of the current tick.
  TickRange tickRange() const;

  // -------------------------------------------------------------------------
  // synthesizeTimestamp(actor_id, parent_timestamp, action_hint)
  // -------------------------------------------------------------------------
  // @brief  Issues a virtual timestamp for one simulated event.
  //
  // @param  actor_id          Agent performing the action. Any value.
  // @param  parent_timestamp  Event this one causally follows, if any. The
  //                           result is strictly greater.
  // @param  action_hint       Opaque action tag; only diversifies the seed.
  //
  // @return Virtual seconds since epoch. Never throws.
  // -------------------------------------------------------------------------
  std::int64_t synthesizeTimestamp(
      std::int64_t actor_id,
      std::optional<std::int64_t> parent_timestamp = std::nullopt,
      const std::string& action_hint = "");

  // Same as synthesizeTimestamp() but also reports the tick and outcome.
  TimestampResult synthesizeTimestampDetailed(
      std::int64_t actor_id,
      std::optional<std::int64_t> parent_timestamp = std::nullopt,
      const std::string& action_hint = "");

  // -------------------------------------------------------------------------
  // Calendar conversion
  // -------------------------------------------------------------------------
  // toCalendar(v)       epoch + v seconds
  // toIso(v)            toCalendar(v) as "YYYY-MM-DD HH:MM:SS"
  // fromCalendar(i)     floor(i - epoch) in whole seconds
  //
  // Results that do not fit an int64 second count saturate instead of
  // overflowing; every value below INT64_MAX - epoch round-trips exactly.
  // -------------------------------------------------------------------------
  CalendarInstant toCalendar(std::int64_t virtual_seconds) const;
  std::string toIso(std::int64_t virtual_seconds) const;
  std::int64_t fromCalendar(CalendarInstant instant) const;
  std::int64_t fromCalendar(std::chrono::system_clock::time_point instant) const;

  // -------------------------------------------------------------------------
  // reset()
  // -------------------------------------------------------------------------
  // @brief  Returns to tick 0 with empty counters and used sets, and
  //         reseeds the random source from config().seed.
  //
  // @details
  // After reset() the clock is indistinguishable from a freshly
  // constructed one with the same config.
  // -------------------------------------------------------------------------
  void reset();

  std::int64_t currentTick() const;
  const TickClockConfig& config() const { return config_; }

  // Number of distinct values recorded for the current tick.
  std::size_t usedTimestampCount() const;

  // -------------------------------------------------------------------------
  // overrideTick(tick)
  // -------------------------------------------------------------------------
  // @brief  Writes current_tick directly. Legacy escape hatch used by
  //         LegacyClockAdapter::setTimeStep().
  //
  // @details
  // Unlike advance(), this does NOT clear the per-tick call counters and
  // may move time backwards. Values already issued in the target tick stay
  // recorded, so a driver that jumps back into a visited tick is probed
  // away from them.
  //
  // @throws std::invalid_argument if tick < 0 or the tick's range would end
  //         past INT64_MAX.
  // -------------------------------------------------------------------------
  void overrideTick(std::int64_t tick);

  // "TickClock(tick=0, tick_duration_seconds=86400, current_range=[0, 86399])"
  std::string describe() const;

 private:
  std::int64_t maxTick() const;
  TickRange rangeForTick(std::int64_t tick) const;
  TimestampResult synthesizeLocked(std::int64_t actor_id,
                                   std::optional<std::int64_t> parent,
                                   const std::string& action_hint);

  const TickClockConfig config_;

  mutable std::mutex mutex_;  // Guards everything below
  std::int64_t current_tick_{0};
  SeedMixer mixer_;

  // (tick, actor_id) → calls already served for that pair.
  std::map<std::pair<std::int64_t, std::int64_t>, std::uint64_t>
      call_counter_;

  // tick → values already issued in that tick.
  std::unordered_map<std::int64_t, std::unordered_set<std::int64_t>>
      used_by_tick_;
};

std::ostream& operator<<(std::ostream& os, const TickClock& clock);

}  // namespace vclock
