#pragma once

#include "costbasis/domain/date.hpp"

namespace costbasis {

// -----------------------------------------------------------------------------
// IClock: abstract source of "today"
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface that hides where the current calendar day
//         comes from.
//
// @details
// The core components never ask for the current date; every date they use
// is passed in. Only the command facade needs "today", for defaults such as
// the report year and the date of a previewed sale. Injecting the clock
// keeps those defaults deterministic in tests:
//   - SystemClock  → today's UTC date from std::chrono::system_clock.
//   - FixedClock   → a date set by the caller.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads. The IPC worker thread
//   calls today() while the owning thread may still hold the clock.
//
// Ownership:
//   Components hold a const reference; the clock must outlive them.
// -----------------------------------------------------------------------------
class IClock {
 public:
  virtual ~IClock() = default;

  // Current calendar day.
  virtual domain::Date today() const = 0;
};

}  // namespace costbasis
