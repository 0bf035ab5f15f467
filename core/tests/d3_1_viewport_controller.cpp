// D3.1 - vertical zoom / pan arithmetic
// Tests: dynamic zoom floor, zoom ceiling for tiny data, range framing
// (50 ticks, 10..40 centered in a 200px viewport), pan bounds, anchored zoom,
// zoom steps.

#include "lrc/scale/TickScale.hpp"
#include "lrc/viewport/ViewportController.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static void requireClose(double a, double b, double eps, const char* msg) {
  if (std::fabs(a - b) > eps) {
    std::fprintf(stderr, "ASSERT FAIL: %s (got %.9f, expected %.9f)\n", msg, a, b);
    std::exit(1);
  }
}

int main() {
  lrc::ChartConfig cfg;
  lrc::ViewportController vc;
  vc.setConfig(cfg);

  // ---- Test 1: dynamic zoom floor ----
  {
    requireClose(vc.pitch(), 4.0, 1e-12, "pitch = barHeight + barSpacing");
    requireClose(vc.calculateDynamicZoomMin(50, 200.0), 1.0, 1e-12, "50 ticks fill 200px at 1x");
    requireClose(vc.calculateDynamicZoomMin(1000, 200.0), 0.1, 1e-12, "floor at zoomMin");
    requireClose(vc.calculateDynamicZoomMin(0, 200.0), 0.1, 1e-12, "no ticks");
    requireClose(vc.calculateDynamicZoomMin(50, 0.0), 0.1, 1e-12, "no height");
    requireClose(vc.calculateDynamicZoomMin(2, 200.0), 25.0, 1e-12, "tiny data set");

    requireClose(vc.effectiveZoomMax(1.0), 10.0, 1e-12, "configured ceiling");
    requireClose(vc.effectiveZoomMax(25.0), 25.0, 1e-12, "ceiling raised to the floor");
    std::printf("  Test 1 (dynamic zoom floor): PASS\n");
  }

  // ---- Test 2: frame a selected range ----
  {
    const std::size_t n = 50;
    const double h = 200.0;
    double dynMin = vc.calculateDynamicZoomMin(n, h);
    lrc::ViewportFrame f = vc.calculateRangeViewport(10, 40, n, h, dynMin);

    requireTrue(f.zoomLevel >= dynMin && f.zoomLevel <= 3.0, "zoom within [floor, 3]");
    requireClose(f.zoomLevel, 4.0 / 3.0, 1e-9, "30 ticks * 1.25 padding fill 200px");

    std::vector<lrc::TickEntry> ticks(n);
    for (std::size_t i = 0; i < n; i++) {
      ticks[i].tick = static_cast<int>(i);
      ticks[i].price0 = 1.0 + 0.01 * static_cast<double>(i);
    }
    lrc::TickScale s;
    s.rebuild(ticks, vc.pitch(), cfg.dims.bandPaddingInner, f.zoomLevel, f.panY);
    requireClose(s.bandY(25) + s.bandwidth() / 2.0, 100.0, 1e-9, "midpoint band centered");

    // Order of the indices does not matter
    lrc::ViewportFrame g = vc.calculateRangeViewport(40, 10, n, h, dynMin);
    requireClose(g.zoomLevel, f.zoomLevel, 1e-12, "reversed indices zoom");
    requireClose(g.panY, f.panY, 1e-12, "reversed indices pan");

    // A collapsed span fits every tick instead
    lrc::ViewportFrame z = vc.calculateRangeViewport(5, 5, n, h, dynMin);
    requireClose(z.zoomLevel, dynMin, 1e-12, "zero span -> floor");
    requireClose(z.panY, 0.0, 1e-12, "zero span -> bounded pan");

    // Very narrow span is capped at the ceiling
    lrc::ViewportFrame narrow = vc.calculateRangeViewport(24, 25, n, h, dynMin);
    requireClose(narrow.zoomLevel, 10.0, 1e-12, "capped at zoomMax");

    lrc::ViewportFrame empty = vc.calculateRangeViewport(0, 5, 0, h, 0.1);
    requireClose(empty.zoomLevel, 0.1, 1e-12, "no ticks -> floor");
    requireClose(empty.panY, 0.0, 1e-12, "no ticks -> no pan");
    std::printf("  Test 2 (range framing): PASS\n");
  }

  // ---- Test 3: pan bounds ----
  {
    // 50 ticks at 2x: 400px of content in a 200px viewport
    requireClose(vc.boundPanY(50.0, 200.0, 50, 2.0), 0.0, 1e-12, "no gap at the top");
    requireClose(vc.boundPanY(-500.0, 200.0, 50, 2.0), -200.0, 1e-12, "no scrolling past bottom");
    requireClose(vc.boundPanY(-100.0, 200.0, 50, 2.0), -100.0, 1e-12, "inside bounds untouched");
    // Content shorter than the viewport never pans
    requireClose(vc.boundPanY(-30.0, 200.0, 10, 1.0), 0.0, 1e-12, "short content pinned");
    requireClose(vc.boundPanY(-30.0, 200.0, 0, 1.0), 0.0, 1e-12, "no ticks");

    lrc::ViewportFrame f{2.0, 0.0};
    double steps[] = {-37.0, -120.0, 55.0, -400.0, 900.0, -13.0, -250.0};
    for (double dy : steps) {
      f = vc.panBy(f, dy, 200.0, 50);
      requireTrue(f.panY <= 0.0 && f.panY >= -200.0, "pan stays bounded");
      requireClose(f.zoomLevel, 2.0, 1e-12, "pan keeps zoom");
    }
    std::printf("  Test 3 (pan bounds): PASS\n");
  }

  // ---- Test 4: anchored zoom ----
  {
    lrc::ViewportFrame cur{2.0, -100.0};
    const double anchor = 80.0;
    lrc::ViewportFrame next = vc.zoomAt(cur, 4.0, anchor, 200.0, 50);
    requireClose(next.zoomLevel, 4.0, 1e-12, "target zoom");
    requireClose((anchor - next.panY) / next.zoomLevel, (anchor - cur.panY) / cur.zoomLevel,
                 1e-9, "content under the anchor stays put");
    requireClose(next.panY, -280.0, 1e-9, "anchored pan");

    lrc::ViewportFrame same = vc.zoomAt(cur, 4.0, anchor, 200.0, 0);
    requireClose(same.zoomLevel, 2.0, 1e-12, "no ticks -> unchanged");
    std::printf("  Test 4 (anchored zoom): PASS\n");
  }

  // ---- Test 5: zoom steps ----
  {
    lrc::ViewportFrame f{1.0, 0.0};
    lrc::ViewportFrame in = vc.zoomIn(f, 200.0, 50, 1.0);
    requireClose(in.zoomLevel, 1.3, 1e-12, "one zoomFactor step");
    requireClose(in.panY, -30.0, 1e-9, "around the viewport center");

    lrc::ViewportFrame out = vc.zoomOut(in, 200.0, 50, 1.0);
    requireClose(out.zoomLevel, 1.0, 1e-12, "back out");
    requireClose(out.panY, 0.0, 1e-9, "pan restored");

    lrc::ViewportFrame floor = vc.zoomOut(f, 200.0, 50, 1.0);
    requireClose(floor.zoomLevel, 1.0, 1e-12, "cannot zoom below the floor");

    lrc::ViewportFrame top{10.0, -500.0};
    lrc::ViewportFrame ceil = vc.zoomIn(top, 200.0, 50, 1.0);
    requireClose(ceil.zoomLevel, 10.0, 1e-12, "cannot zoom past the ceiling");

    lrc::ViewportFrame tiny{25.0, 0.0};
    lrc::ViewportFrame tinyIn = vc.zoomIn(tiny, 200.0, 2, 25.0);
    requireClose(tinyIn.zoomLevel, 25.0, 1e-12, "tiny data keeps its floor");
    std::printf("  Test 5 (zoom steps): PASS\n");
  }

  std::printf("D3.1 viewport_controller: ALL PASS\n");
  return 0;
}
