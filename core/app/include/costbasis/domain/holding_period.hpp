#pragma once

namespace costbasis {
namespace domain {

// -----------------------------------------------------------------------------
// Engine-wide constants shared by every component
// -----------------------------------------------------------------------------

/// Quantities at or below this value count as zero. Absorbs floating-point
/// residue left by fractional-share arithmetic (e.g. 0.1 + 0.2 - 0.3).
inline constexpr double kQuantityEpsilon = 1e-4;

/// A holding strictly longer than this many days is long-term. Exactly 365
/// days is still short-term.
inline constexpr int kLongTermThresholdDays = 365;

/// Replacement purchases within this many calendar days before or after a
/// loss sale trigger the wash-sale rule (a 61-day window in total).
inline constexpr int kWashSaleWindowDays = 30;

inline bool isLongTermHolding(int holding_days) {
  return holding_days > kLongTermThresholdDays;
}

}  // namespace domain
}  // namespace costbasis
