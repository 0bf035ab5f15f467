#include "lrc/recipe/PriceLineRecipe.hpp"
#include "lrc/layout/ChartLayout.hpp"
#include "lrc/recipe/GeometryBuilder.hpp"

#include <algorithm>
#include <cmath>

namespace lrc {

PriceLineRecipe::PriceLineRecipe(Id idBase, Id paneId, const ChartReader& reader)
  : Recipe(idBase, paneId, reader) {
  addSlot("base", "lineAA@1", VertexFormat::Rect4);
  addSlot("active", "lineAA@1", VertexFormat::Rect4);
  addSlot("dotOuter", "triSolid@1", VertexFormat::Pos2);
  addSlot("dotInner", "triSolid@1", VertexFormat::Pos2);
}

void PriceLineRecipe::appendBuildStyles(std::vector<CmdString>& out) const {
  const auto& c = reader_.config().colors;
  out.push_back(styleCommand(drawItemId(kBaseLine), c.priceLineOutOfRange, c.priceLineWidth));
  out.push_back(styleCommand(drawItemId(kActiveLine), c.priceLineInRange, c.priceLineWidth));
}

ScissorRect PriceLineRecipe::activeMask() const {
  ScissorRect r;
  const auto& st = reader_.state();
  if (!st.hasRange()) return r;

  const auto& xf = reader_.transform();
  double minY = xf.priceToY(st.minPrice);
  double maxY = xf.priceToY(st.maxPrice);
  if (!std::isfinite(minY) || !std::isfinite(maxY)) return r;

  r.enabled = true;
  r.x = 0.0f;
  r.y = static_cast<float>(std::min(minY, maxY));
  r.w = static_cast<float>(st.dimensions.width);
  r.h = static_cast<float>(std::abs(minY - maxY));
  return r;
}

LayerFrame PriceLineRecipe::draw() const {
  LayerFrame frame = beginFrame();

  const auto& st = reader_.state();
  const auto& series = reader_.priceSeries();
  const auto& xf = reader_.transform();
  const auto& cfg = reader_.config();

  ScissorRect plot{true, 0.0f, 0.0f,
                   static_cast<float>(st.dimensions.width),
                   static_cast<float>(st.dimensions.height)};
  frame.commands.push_back(scissorCommand(drawItemId(kBaseLine), plot));

  ScissorRect mask = activeMask();
  frame.commands.push_back(scissorCommand(drawItemId(kActiveLine), mask));

  if (series.empty()) return frame;

  const std::int64_t t0 = series.front().time;
  const std::int64_t t1 = series.back().time;
  const double width = st.dimensions.width;

  std::vector<float> segs;
  segs.reserve(series.size() * 4);
  bool havePrev = false;
  double px = 0, py = 0;
  for (const auto& p : series) {
    double x = timeToX(p.time, t0, t1, width);
    double y = xf.priceToY(p.value);
    if (!std::isfinite(y)) {
      havePrev = false;
      continue;
    }
    if (havePrev) appendRect(segs, px, py, x, y);
    px = x;
    py = y;
    havePrev = true;
  }

  setSlotData(frame, kBaseLine, segs);
  if (mask.enabled) setSlotData(frame, kActiveLine, std::move(segs));

  const PricePoint& last = series.back();
  double lastX = timeToX(last.time, t0, t1, width);
  double lastY = xf.priceToY(last.value);
  if (std::isfinite(lastY)) {
    bool inRange = st.hasRange() && last.value >= st.minPrice && last.value <= st.maxPrice;
    const float* base = inRange ? cfg.colors.priceLineInRange : cfg.colors.priceLineOutOfRange;
    float outer[4] = {base[0], base[1], base[2], base[3] * 0.4f};

    std::vector<float> outerTris, innerTris;
    appendCircle(outerTris, lastX, lastY, cfg.dims.priceDotRadius);
    appendCircle(innerTris, lastX, lastY, cfg.dims.priceDotRadius / 2.0);
    setSlotData(frame, kDotOuter, std::move(outerTris));
    setSlotData(frame, kDotInner, std::move(innerTris));
    frame.commands.push_back(styleCommand(drawItemId(kDotOuter), outer));
    frame.commands.push_back(styleCommand(drawItemId(kDotInner), base));
  }

  return frame;
}

} // namespace lrc
