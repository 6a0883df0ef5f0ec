#pragma once

#include "vclock/time/calendar.hpp"

#include <cstdint>

namespace vclock {

// -----------------------------------------------------------------------------
// TickClockConfig: immutable TickClock parameters
// -----------------------------------------------------------------------------
//
// @brief  Plain data struct holding everything a TickClock needs to be
//         reproduced: tick length, calendar epoch and random seed.
//
// @details
// Copied into TickClock at construction and never changed afterwards.
// Two clocks built from equal configs and fed the same call sequence issue
// identical timestamps.
//
// Loaded from JSON by loadEngineConfig() (vclock/config/engine_config.hpp);
// the defaults below match a missing key.
//
// Thread model:
//   Value semantics, no shared mutable state.
// -----------------------------------------------------------------------------
struct TickClockConfig {
  /// Length of one tick in virtual seconds. Must be positive.
  std::int64_t tick_duration_seconds{86400};

  /// Calendar instant corresponding to virtual time zero.
  CalendarInstant epoch{defaultEpoch()};

  /// Root of all deterministic randomness.
  std::int64_t seed{42};

  // -------------------------------------------------------------------------
  // validate()
  // -------------------------------------------------------------------------
  // @brief  Fails fast on a config that would make tick ranges ill-defined.
  //
  // @throws std::invalid_argument if tick_duration_seconds <= 0.
  // -------------------------------------------------------------------------
  void validate() const;
};

}  // namespace vclock
