#include "vclock/time/tick_clock_config.hpp"

#include <stdexcept>
#include <string>

namespace vclock {

void TickClockConfig::validate() const {
  if (tick_duration_seconds <= 0) {
    throw std::invalid_argument(
        "TickClockConfig: tick_duration_seconds must be positive, got " +
        std::to_string(tick_duration_seconds));
  }
}

}  // namespace vclock
