#pragma once
#include <cstdint>

namespace lrc {

inline constexpr int kMinTick = -887272;
inline constexpr int kMaxTick = 887272;
inline constexpr double kTickBase = 1.0001;

struct TickRange {
  int lowerTick{0};
  int upperTick{0};
  double lowerPrice{0};
  double upperPrice{0};
};

// price0 of a tick index: 1.0001^tick.
double tickToPrice(int tick);

// Price of `tick` relative to a known (referenceTick, referencePrice) pair.
// Used when the pool price is already decimal-adjusted.
double tickToScaledPrice(int tick, int referenceTick, double referencePrice);

// Largest tick whose price does not exceed `price`. Non-positive or
// non-finite prices clamp to kMinTick.
int priceToTick(double price);

// Round to the closest multiple of `spacing` inside [kMinTick, kMaxTick].
// spacing <= 0 is treated as 1.
int nearestUsableTick(int tick, int spacing);

// Widest usable tick pair for a pool with the given spacing.
TickRange fullRangeTicks(int spacing);

// Snap a price range to usable ticks. Guarantees lowerTick < upperTick;
// when both prices snap to the same tick the upper one is pushed one spacing up
// (or the lower one down at the top boundary).
TickRange snapRangeToSpacing(double minPrice, double maxPrice, int spacing);

} // namespace lrc
