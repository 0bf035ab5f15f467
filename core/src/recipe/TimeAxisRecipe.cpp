#include "lrc/recipe/TimeAxisRecipe.hpp"
#include "lrc/layout/ChartLayout.hpp"
#include "lrc/math/TimeFormat.hpp"
#include "lrc/math/TimeTicks.hpp"

namespace lrc {

TimeAxisRecipe::TimeAxisRecipe(Id idBase, Id paneId, const ChartReader& reader)
  : Recipe(idBase, paneId, reader) {
  addSlot("tickMarks", "line2d@1", VertexFormat::Pos2);
}

void TimeAxisRecipe::appendBuildStyles(std::vector<CmdString>& out) const {
  out.push_back(styleCommand(drawItemId(0), reader_.config().colors.axisTick));
}

LayerFrame TimeAxisRecipe::draw() const {
  LayerFrame frame = beginFrame();

  const auto& series = reader_.priceSeries();
  if (series.empty()) return frame;

  const auto& cfg = reader_.config();
  ChartLayout layout = computeChartLayout(reader_.state().dimensions, cfg.dims);
  if (layout.plotWidth <= 0.0) return frame;

  std::int64_t t0 = series.front().time;
  std::int64_t t1 = series.back().time;
  const char* fmt = chooseDurationFormat(reader_.duration());
  const double labelY = layout.plotHeight + cfg.dims.timescaleHeight / 2.0;

  std::vector<float> marks;
  for (std::int64_t t : generateTimeTicks(t0, t1, kMaxLabels)) {
    double x = timeToX(t, t0, t1, layout.plotWidth);
    marks.push_back(static_cast<float>(x));
    marks.push_back(static_cast<float>(layout.plotHeight));
    marks.push_back(static_cast<float>(x));
    marks.push_back(static_cast<float>(layout.plotHeight + kTickLength));

    TextLabel label;
    label.x = x;
    label.y = labelY;
    label.text = formatTimestamp(t, fmt, utc);
    for (int i = 0; i < 4; i++) label.color[i] = cfg.colors.axisLabel[i];
    frame.labels.push_back(std::move(label));
  }
  setSlotData(frame, 0, std::move(marks));
  return frame;
}

} // namespace lrc
