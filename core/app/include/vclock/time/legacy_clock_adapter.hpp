#pragma once

#include "vclock/time/calendar.hpp"
#include "vclock/time/tick_clock.hpp"

#include <cstdint>
#include <string>

namespace vclock {

// -----------------------------------------------------------------------------
// LegacyClockAdapter: drop-in surface for older simulation drivers
// -----------------------------------------------------------------------------
//
// @brief  Exposes a TickClock through the shape the previous clock
//         abstraction had: a read/write "time step", a stringified tick and a
//         two-instant "time transfer".
//
// @details
// Older drivers read and write clock.time_step and call
// time_transfer(now, start) to obtain "the current simulated datetime".
// This adapter keeps those call sites compiling against a TickClock:
//
//   timeStep()             → clock.currentTick()
//   setTimeStep(v)         → clock.overrideTick(v) + warning on stderr
//   timeStepString()       → std::to_string(clock.currentTick())
//   timeTransfer(now, st)  → clock.toCalendar(tickRange().start)
//
// Only the surface is preserved. setTimeStep() bypasses advance(): per-tick
// call counters are not cleared and time may move backwards. New code
// should call TickClock::advance() instead.
//
// Ownership:
//   Holds a non-owning reference. The clock must outlive the adapter.
// -----------------------------------------------------------------------------
class LegacyClockAdapter {
 public:
  explicit LegacyClockAdapter(TickClock& clock) : clock_(clock) {}

  std::int64_t timeStep() const;

  // @throws std::invalid_argument if value < 0.
  void setTimeStep(std::int64_t value);

  std::string timeStepString() const;

  // Both arguments are ignored; virtual time never follows the wall clock.
  CalendarInstant timeTransfer(CalendarInstant now_time,
                               CalendarInstant start_time) const;

 private:
  TickClock& clock_;
};

}  // namespace vclock
