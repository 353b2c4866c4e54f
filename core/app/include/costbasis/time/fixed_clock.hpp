#pragma once

#include "costbasis/time/i_clock.hpp"

#include <atomic>
#include <cstdint>

namespace costbasis {

// -----------------------------------------------------------------------------
// FixedClock: externally-set clock for tests and replays
// -----------------------------------------------------------------------------
//
// @brief  IClock whose "today" is whatever the caller last set.
//
// @details
// Stored as std::atomic<int32_t> days so a test can move the clock on its
// own thread while the IPC worker reads it.
//
// Ownership:
//   Created by the caller (test fixture or replay harness) and passed by
//   reference to PortfolioEngine.
// -----------------------------------------------------------------------------
class FixedClock final : public IClock {
 public:
  explicit FixedClock(domain::Date today = {});

  domain::Date today() const override;

  // Moves the clock to `date`. No monotonicity check.
  void set(domain::Date date);

 private:
  std::atomic<std::int32_t> days_{0};
};

}  // namespace costbasis
