#pragma once
#include <vector>

namespace lrc {

// Vertex emitters shared by the layer recipes. All coordinates are pixels.

// rect4 record (x0, y0, x1, y1); used for instancedRect and lineAA segments.
void appendRect(std::vector<float>& out, double x0, double y0, double x1, double y1);

// Filled circle as a triangle list (pos2, 3 vertices per triangle).
void appendCircle(std::vector<float>& out, double cx, double cy, double radius,
                  int segments = 24);

// Horizontal dashed line as lineAA segments from x0 to x1.
void appendDashedLine(std::vector<float>& out, double x0, double x1, double y,
                      double dash, double gap);

// Clip a rect to the vertical band [top, bottom]. Returns false when nothing is left.
bool clipRectY(double& y0, double& y1, double top, double bottom);

} // namespace lrc
