#include "vclock/time/legacy_clock_adapter.hpp"

#include <iostream>

namespace vclock {

std::int64_t LegacyClockAdapter::timeStep() const {
  return clock_.currentTick();
}

void LegacyClockAdapter::setTimeStep(std::int64_t value) {
  const std::int64_t previous = clock_.currentTick();
  clock_.overrideTick(value);
  std::cerr << "[LegacyClockAdapter] WARNING: time_step set " << previous
            << " -> " << value
            << " without advance(); per-tick counters were not reset\n";
}

std::string LegacyClockAdapter::timeStepString() const {
  return std::to_string(clock_.currentTick());
}

CalendarInstant LegacyClockAdapter::timeTransfer(
    CalendarInstant /*now_time*/, CalendarInstant /*start_time*/) const {
  return clock_.toCalendar(clock_.tickRange().start);
}

}  // namespace vclock
