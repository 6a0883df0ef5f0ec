#include "vclock/time/tick_clock.hpp"

#include <algorithm>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace vclock {

namespace {

TickClockConfig validated(TickClockConfig config) {
  config.validate();
  return config;
}

}  // namespace

// -----------------------------------------------------------------------------
// synthesisOutcomeToString()
// -----------------------------------------------------------------------------
const char* synthesisOutcomeToString(SynthesisOutcome outcome) {
  switch (outcome) {
    case SynthesisOutcome::Drawn:          return "drawn";
    case SynthesisOutcome::Probed:         return "probed";
    case SynthesisOutcome::ParentOverflow: return "parent_overflow";
    case SynthesisOutcome::RangeExhausted: return "range_exhausted";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
TickClock::TickClock(TickClockConfig config)
    : config_(validated(std::move(config))), mixer_(config_.seed) {}

// -----------------------------------------------------------------------------
// advance()
// -----------------------------------------------------------------------------
void TickClock::advance(std::int64_t n) {
  if (n < 1) {
    throw std::invalid_argument("TickClock::advance: n must be >= 1, got " +
                                std::to_string(n));
  }

  std::lock_guard lock(mutex_);
  if (n > maxTick() - current_tick_) {
    throw std::invalid_argument(
        "TickClock::advance: tick " + std::to_string(current_tick_) + " + " +
        std::to_string(n) + " exceeds the last representable tick " +
        std::to_string(maxTick()));
  }
  current_tick_ += n;

  // Used sets are kept for every tick: overrideTick() may revisit one.
  call_counter_.clear();
}

// -----------------------------------------------------------------------------
// tickRange()
// -----------------------------------------------------------------------------
TickRange TickClock::tickRange() const {
  std::lock_guard lock(mutex_);
  return rangeForTick(current_tick_);
}

// Largest tick whose range end (tick + 1) * d - 1 still fits in int64.
std::int64_t TickClock::maxTick() const {
  return std::numeric_limits<std::int64_t>::max() /
             config_.tick_duration_seconds -
         1;
}

TickRange TickClock::rangeForTick(std::int64_t tick) const {
  const std::int64_t d = config_.tick_duration_seconds;
  return TickRange{tick * d, (tick + 1) * d - 1};
}

// -----------------------------------------------------------------------------
// synthesizeTimestamp() / synthesizeTimestampDetailed()
// -----------------------------------------------------------------------------
std::int64_t TickClock::synthesizeTimestamp(
    std::int64_t actor_id, std::optional<std::int64_t> parent_timestamp,
    const std::string& action_hint) {
  return synthesizeTimestampDetailed(actor_id, parent_timestamp, action_hint)
      .timestamp;
}

TimestampResult TickClock::synthesizeTimestampDetailed(
    std::int64_t actor_id, std::optional<std::int64_t> parent_timestamp,
    const std::string& action_hint) {
  std::lock_guard lock(mutex_);
  return synthesizeLocked(actor_id, parent_timestamp, action_hint);
}

TimestampResult TickClock::synthesizeLocked(
    std::int64_t actor_id, std::optional<std::int64_t> parent,
    const std::string& action_hint) {
  const TickRange range = rangeForTick(current_tick_);

  TimestampResult result;
  result.tick = current_tick_;

  // --- 1) Lower bound: tick start, or strictly after the parent ------------
  std::int64_t min_allowed = range.start;
  if (parent.has_value()) {
    if (*parent >= range.end) {
      // No room left in this tick. Spill one second past the parent.
      constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
      result.timestamp = *parent == kMax ? kMax : *parent + 1;
      result.outcome = SynthesisOutcome::ParentOverflow;
      return result;
    }
    // A parent before time zero would otherwise allow negative output.
    min_allowed = std::max<std::int64_t>(*parent + 1, 0);
  }
  const std::int64_t max_allowed = range.end;

  // --- 2) Per-call seed from the call's identity ---------------------------
  const auto key = std::make_pair(current_tick_, actor_id);
  const std::uint64_t call_index = call_counter_[key]++;

  DeterministicRng rng(
      mixer_.derive(current_tick_, actor_id, action_hint, call_index));
  std::int64_t candidate = rng.uniformInt(min_allowed, max_allowed);

  // --- 3) Uniqueness within the tick: linear probe with wrap ---------------
  auto& used = used_by_tick_[current_tick_];
  const std::int64_t max_attempts = max_allowed - min_allowed + 1;
  std::int64_t attempts = 0;
  while (used.count(candidate) != 0 && attempts < max_attempts) {
    ++candidate;
    if (candidate > max_allowed) {
      candidate = min_allowed;
    }
    ++attempts;
  }

  if (attempts == 0) {
    result.outcome = SynthesisOutcome::Drawn;
  } else if (used.count(candidate) == 0) {
    result.outcome = SynthesisOutcome::Probed;
  } else {
    result.outcome = SynthesisOutcome::RangeExhausted;
    std::cerr << "[TickClock] WARNING: tick " << current_tick_ << " window ["
              << min_allowed << ", " << max_allowed
              << "] exhausted; accepting duplicate timestamp " << candidate
              << " for actor " << actor_id << "\n";
  }

  used.insert(candidate);
  result.timestamp = candidate;
  return result;
}

// -----------------------------------------------------------------------------
// Calendar conversion
// -----------------------------------------------------------------------------
CalendarInstant TickClock::toCalendar(std::int64_t virtual_seconds) const {
  return addSecondsSaturating(config_.epoch, virtual_seconds);
}

std::string TickClock::toIso(std::int64_t virtual_seconds) const {
  return formatIso(toCalendar(virtual_seconds));
}

std::int64_t TickClock::fromCalendar(CalendarInstant instant) const {
  const std::int64_t epoch = config_.epoch.time_since_epoch().count();
  const std::int64_t value = instant.time_since_epoch().count();
  constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
  constexpr auto kMin = std::numeric_limits<std::int64_t>::min();
  if (epoch < 0 && value > kMax + epoch) {
    return kMax;
  }
  if (epoch > 0 && value < kMin + epoch) {
    return kMin;
  }
  return value - epoch;
}

std::int64_t TickClock::fromCalendar(
    std::chrono::system_clock::time_point instant) const {
  return fromCalendar(floorToSecond(instant));
}

// -----------------------------------------------------------------------------
// reset()
// -----------------------------------------------------------------------------
void TickClock::reset() {
  std::lock_guard lock(mutex_);
  current_tick_ = 0;
  mixer_ = SeedMixer(config_.seed);
  call_counter_.clear();
  used_by_tick_.clear();
}

// -----------------------------------------------------------------------------
// Introspection
// -----------------------------------------------------------------------------
std::int64_t TickClock::currentTick() const {
  std::lock_guard lock(mutex_);
  return current_tick_;
}

std::size_t TickClock::usedTimestampCount() const {
  std::lock_guard lock(mutex_);
  const auto it = used_by_tick_.find(current_tick_);
  return it == used_by_tick_.end() ? 0 : it->second.size();
}

void TickClock::overrideTick(std::int64_t tick) {
  if (tick < 0) {
    throw std::invalid_argument("TickClock::overrideTick: tick must be >= 0, got " +
                                std::to_string(tick));
  }
  if (tick > maxTick()) {
    throw std::invalid_argument("TickClock::overrideTick: tick " +
                                std::to_string(tick) +
                                " exceeds the last representable tick " +
                                std::to_string(maxTick()));
  }
  std::lock_guard lock(mutex_);
  current_tick_ = tick;
}

std::string TickClock::describe() const {
  std::lock_guard lock(mutex_);
  const TickRange range = rangeForTick(current_tick_);
  std::ostringstream out;
  out << "TickClock(tick=" << current_tick_
      << ", tick_duration_seconds=" << config_.tick_duration_seconds
      << ", current_range=[" << range.start << ", " << range.end << "])";
  return out.str();
}

std::ostream& operator<<(std::ostream& os, const TickClock& clock) {
  return os << clock.describe();
}

}  // namespace vclock
