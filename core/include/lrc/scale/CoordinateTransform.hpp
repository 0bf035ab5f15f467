#pragma once
#include "lrc/model/ChartTypes.hpp"
#include "lrc/scale/TickScale.hpp"
#include <vector>

namespace lrc {

// Price <-> pixel-Y mapping over a tick series sorted by ascending price0.
// Prices between two ticks interpolate linearly between their bands, so the
// mapping is monotone (higher price, smaller Y) and the two directions invert
// each other inside the data domain. Prices outside the domain extrapolate
// with the overall slope; Y outside the content clamps to the data bounds.
//
// Holds references: the tick vector and scale must outlive the transform.
class CoordinateTransform {
public:
  CoordinateTransform(const std::vector<TickEntry>& ticks, const TickScale& scale);

  // NaN for an empty series or non-finite price.
  double priceToY(double price, TickAlignment align = TickAlignment::Center) const;

  // NaN for an empty series, a zero price range or a collapsed scale.
  double yToPrice(double y, TickAlignment align = TickAlignment::Center) const;

  PriceBounds dataBounds() const;

private:
  double alignmentOffset(TickAlignment align) const;
  bool ready() const;

  const std::vector<TickEntry>& ticks_;
  const TickScale& scale_;
};

// Tick whose price0 is nearest to `price` (first wins on ties);
// nullptr / -1 when the series is empty.
const TickEntry* findClosestTick(const std::vector<TickEntry>& ticks, double price);
int findClosestTickIndex(const std::vector<TickEntry>& ticks, double price);

} // namespace lrc
