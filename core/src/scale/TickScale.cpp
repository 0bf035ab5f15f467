#include "lrc/scale/TickScale.hpp"
#include <cmath>

namespace lrc {

void TickScale::rebuild(const std::vector<TickEntry>& ticks, double pitch,
                        double paddingInner, double zoomLevel, double panY) {
  count_ = ticks.size();
  pitch_ = pitch;
  paddingInner_ = paddingInner;
  zoom_ = zoomLevel;
  panY_ = panY;
  step_ = pitch * zoomLevel;

  indexByTick_.clear();
  indexByTick_.reserve(count_);
  for (std::size_t i = 0; i < count_; i++) {
    indexByTick_.emplace(ticks[i].tick, i);
  }
}

double TickScale::bandY(std::size_t index) const {
  double fromTop = static_cast<double>(count_) - 1.0 - static_cast<double>(index);
  return panY_ + fromTop * step_;
}

bool TickScale::bandYForTick(int tick, double& outY) const {
  auto it = indexByTick_.find(tick);
  if (it == indexByTick_.end()) return false;
  outY = bandY(it->second);
  return true;
}

int TickScale::indexAtY(double y) const {
  if (count_ == 0 || step_ <= 0.0) return -1;
  double slot = std::floor((y - panY_) / step_);
  if (slot < 0.0 || slot > static_cast<double>(count_ - 1)) return -1;
  double top = panY_ + slot * step_;
  if (y - top > bandwidth()) return -1;  // inner padding
  return static_cast<int>(count_ - 1 - static_cast<std::size_t>(slot));
}

double TickScale::fractionalIndexAtTop(double y) const {
  if (count_ == 0 || step_ <= 0.0) return 0.0;
  return static_cast<double>(count_) - 1.0 - (y - panY_) / step_;
}

} // namespace lrc
