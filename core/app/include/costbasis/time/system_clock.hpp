#pragma once

#include "costbasis/time/i_clock.hpp"

namespace costbasis {

// -----------------------------------------------------------------------------
// SystemClock: wall-clock implementation of IClock
// -----------------------------------------------------------------------------
// Returns the current UTC calendar day. std::chrono::system_clock counts
// from the Unix epoch, the same origin as domain::Date, so the conversion is
// a floor division by one day.
//
// Thread model:
//   Stateless. Safe to call from any thread.
// -----------------------------------------------------------------------------
class SystemClock final : public IClock {
 public:
  domain::Date today() const override;
};

}  // namespace costbasis
