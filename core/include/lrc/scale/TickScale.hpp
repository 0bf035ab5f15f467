#pragma once
#include "lrc/model/ChartTypes.hpp"
#include <cstddef>
#include <unordered_map>
#include <vector>

namespace lrc {

// Band scale over the ordered tick series. Index 0 (lowest price) sits at the
// bottom of the content; the band top of index i is
//   panY + (count - 1 - i) * step,   step = pitch * zoom.
// Rebuilt by the owner whenever ticks, dimensions, zoom or pan change.
class TickScale {
public:
  void rebuild(const std::vector<TickEntry>& ticks, double pitch,
               double paddingInner, double zoomLevel, double panY);

  std::size_t size() const { return count_; }
  bool empty() const { return count_ == 0; }

  double step() const { return step_; }
  double bandwidth() const { return step_ * (1.0 - paddingInner_); }
  double zoomLevel() const { return zoom_; }
  double panY() const { return panY_; }

  // Total content height at the current zoom.
  double contentHeight() const { return static_cast<double>(count_) * step_; }

  // Top edge of the band for a sorted index.
  double bandY(std::size_t index) const;

  // Band top for a tick identifier. Returns false if the tick is unknown.
  bool bandYForTick(int tick, double& outY) const;

  // Sorted index of the band containing y (top and bottom edge inclusive),
  // or -1 if y falls in padding or outside the content.
  int indexAtY(double y) const;

  // Continuous inverse of bandY: the (fractional) index whose band top is y.
  double fractionalIndexAtTop(double y) const;

private:
  std::size_t count_{0};
  double pitch_{0};
  double paddingInner_{0};
  double zoom_{1};
  double panY_{0};
  double step_{0};
  std::unordered_map<int, std::size_t> indexByTick_;
};

} // namespace lrc
