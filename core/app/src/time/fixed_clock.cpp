#include "costbasis/time/fixed_clock.hpp"

namespace costbasis {

FixedClock::FixedClock(domain::Date today) : days_(today.days) {}

domain::Date FixedClock::today() const {
  return domain::Date{days_.load()};
}

void FixedClock::set(domain::Date date) { days_.store(date.days); }

}  // namespace costbasis
