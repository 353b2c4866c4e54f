#include "costbasis/time/system_clock.hpp"

#include <chrono>
#include <cstdint>

namespace costbasis {

// -----------------------------------------------------------------------------
// today(): floor system_clock to whole days since the epoch
// -----------------------------------------------------------------------------
domain::Date SystemClock::today() const {
  using Days = std::chrono::duration<std::int64_t, std::ratio<86400>>;

  const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
  auto days = std::chrono::duration_cast<Days>(since_epoch);
  // duration_cast truncates toward zero; floor for pre-1970 clocks.
  if (days > since_epoch) {
    days -= Days{1};
  }
  return domain::Date{static_cast<std::int32_t>(days.count())};
}

}  // namespace costbasis
