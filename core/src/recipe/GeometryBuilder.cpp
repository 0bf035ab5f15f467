#include "lrc/recipe/GeometryBuilder.hpp"
#include <algorithm>
#include <cmath>

namespace lrc {

static constexpr double kPi = 3.14159265358979323846;

void appendRect(std::vector<float>& out, double x0, double y0, double x1, double y1) {
  out.push_back(static_cast<float>(x0));
  out.push_back(static_cast<float>(y0));
  out.push_back(static_cast<float>(x1));
  out.push_back(static_cast<float>(y1));
}

void appendCircle(std::vector<float>& out, double cx, double cy, double radius, int segments) {
  if (segments < 3 || radius <= 0.0) return;
  for (int i = 0; i < segments; i++) {
    double a0 = 2.0 * kPi * i / segments;
    double a1 = 2.0 * kPi * (i + 1) / segments;
    out.push_back(static_cast<float>(cx));
    out.push_back(static_cast<float>(cy));
    out.push_back(static_cast<float>(cx + radius * std::cos(a0)));
    out.push_back(static_cast<float>(cy + radius * std::sin(a0)));
    out.push_back(static_cast<float>(cx + radius * std::cos(a1)));
    out.push_back(static_cast<float>(cy + radius * std::sin(a1)));
  }
}

void appendDashedLine(std::vector<float>& out, double x0, double x1, double y,
                      double dash, double gap) {
  if (dash <= 0.0 || x1 <= x0) return;
  double period = dash + std::max(0.0, gap);
  for (double x = x0; x < x1; x += period) {
    appendRect(out, x, y, std::min(x + dash, x1), y);
  }
}

bool clipRectY(double& y0, double& y1, double top, double bottom) {
  if (y0 > y1) std::swap(y0, y1);
  y0 = std::max(y0, top);
  y1 = std::min(y1, bottom);
  return y1 > y0;
}

} // namespace lrc
