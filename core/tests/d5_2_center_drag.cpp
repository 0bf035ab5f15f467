// D5.2 - center (whole range) drag
// Tests: range moves by whole ticks keeping its width, grab offset, moves that
// would leave the data are rejected rather than clamped, one commit per gesture.

#include "lrc/interaction/CenterDrag.hpp"
#include "lrc/state/ChartStore.hpp"

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

// 50 ticks, 1.00 .. 1.49; band i centered at y = (49 - i) * 4 + 1.9.
struct Fixture {
  lrc::ChartStore store;
  int commits{0};
  double lastMin{0};
  double lastMax{0};

  explicit Fixture(int lo = 10, int hi = 40) {
    std::vector<lrc::TickEntry> ticks;
    for (int i = 0; i < 50; i++) {
      lrc::TickEntry e;
      e.tick = i * 10;
      e.price0 = 1.0 + 0.01 * i;
      e.price1 = 1.0 / e.price0;
      e.activeLiquidity = 10.0;
      ticks.push_back(e);
    }
    store.setTicks(ticks);
    store.setDimensions(lrc::Dimensions{400, 200});
    store.setViewport(lrc::ViewportFrame{1.0, 0.0});
    store.setRange(price(lo), price(hi));
    store.setCommitHandler([this](double a, double b) {
      commits++;
      lastMin = a;
      lastMax = b;
    });
  }

  double price(int i) const { return store.ticks()[static_cast<std::size_t>(i)].price0; }
  static double bandCenterY(int i) { return (49 - i) * 4.0 + 1.9; }
};

int main() {
  // ---- Test 1: move by whole ticks ----
  {
    Fixture f;
    lrc::CenterDrag drag(f.store, f.store);
    drag.onStart(0, Fixture::bandCenterY(25));
    requireTrue(drag.active(), "active");
    requireTrue(drag.tickSpan() == 30, "span in ticks");
    requireTrue(f.store.state().isDragging, "dragging flag");

    drag.onDrag(0, Fixture::bandCenterY(30));
    requireClose(f.store.state().minPrice, f.price(15), 1e-12, "min moved 5 ticks");
    requireClose(f.store.state().maxPrice, f.price(45), 1e-12, "max moved 5 ticks");

    drag.onDrag(0, Fixture::bandCenterY(20));
    requireClose(f.store.state().minPrice, f.price(5), 1e-12, "moved down");
    requireClose(f.store.state().maxPrice, f.price(35), 1e-12, "width kept");
    requireTrue(f.commits == 0, "no commit while dragging");

    drag.onEnd(0, Fixture::bandCenterY(20));
    requireTrue(f.commits == 1, "one commit");
    requireClose(f.lastMin, f.price(5), 1e-12, "committed min");
    requireClose(f.lastMax, f.price(35), 1e-12, "committed max");
    requireTrue(!f.store.state().isDragging, "flag cleared");
    std::printf("  Test 1 (whole-tick moves): PASS\n");
  }

  // ---- Test 2: grab offset ----
  {
    Fixture f;
    lrc::CenterDrag drag(f.store, f.store);
    const double grab = Fixture::bandCenterY(25) + 2.1;
    drag.onStart(0, grab);
    drag.onDrag(0, grab);
    requireClose(f.store.state().minPrice, f.price(10), 1e-12, "no jump on first move");
    requireClose(f.store.state().maxPrice, f.price(40), 1e-12, "no jump on first move");

    drag.onDrag(0, grab - 20.0);
    requireClose(f.store.state().minPrice, f.price(15), 1e-12, "offset preserved");
    drag.onEnd(0, grab - 20.0);
    std::printf("  Test 2 (grab offset): PASS\n");
  }

  // ---- Test 3: moves outside the data are rejected, not clamped ----
  {
    Fixture f;
    lrc::CenterDrag drag(f.store, f.store);
    drag.onStart(0, Fixture::bandCenterY(25));

    drag.onDrag(0, Fixture::bandCenterY(30));
    requireClose(f.store.state().minPrice, f.price(15), 1e-12, "accepted move");

    double lo = 0, hi = 0;
    requireTrue(!drag.computeRange(Fixture::bandCenterY(40), lo, hi), "past the top rejected");
    drag.onDrag(0, Fixture::bandCenterY(40));
    requireClose(f.store.state().minPrice, f.price(15), 1e-12, "range stays put (min)");
    requireClose(f.store.state().maxPrice, f.price(45), 1e-12, "range stays put (max)");

    drag.onDrag(0, Fixture::bandCenterY(0));
    requireClose(f.store.state().minPrice, f.price(15), 1e-12, "past the bottom rejected");

    // Exactly touching the top is allowed
    requireTrue(drag.computeRange(Fixture::bandCenterY(34), lo, hi), "edge move accepted");
    requireClose(hi, f.price(49), 1e-12, "max at the top tick");
    requireClose(lo, f.price(19), 1e-12, "min keeps the width");

    drag.onEnd(0, Fixture::bandCenterY(40));
    requireTrue(f.commits == 1, "commit on a rejected release");
    requireClose(f.lastMin, f.price(15), 1e-12, "last accepted range committed");
    requireClose(f.lastMax, f.price(45), 1e-12, "last accepted range committed");
    std::printf("  Test 3 (reject outside bounds): PASS\n");
  }

  // ---- Test 4: odd tick span ----
  {
    Fixture f(10, 41);
    lrc::CenterDrag drag(f.store, f.store);
    drag.onStart(0, (f.store.transform().priceToY(f.price(10)) +
                     f.store.transform().priceToY(f.price(41))) / 2.0);
    requireTrue(drag.tickSpan() == 31, "odd span");
    double lo = 0, hi = 0;
    requireTrue(drag.computeRange(Fixture::bandCenterY(20), lo, hi), "move");
    requireClose(lo, f.price(5), 1e-12, "min = center - span/2");
    requireClose(hi, f.price(36), 1e-12, "max = min + span");
    drag.onEnd(0, Fixture::bandCenterY(20));
    std::printf("  Test 4 (odd span): PASS\n");
  }

  // ---- Test 5: locked states ----
  {
    Fixture f;
    f.store.setFullRange(true);
    lrc::CenterDrag drag(f.store, f.store);
    drag.onStart(0, Fixture::bandCenterY(25));
    requireTrue(!drag.active(), "full range locks the range");
    drag.onDrag(0, Fixture::bandCenterY(30));
    drag.onEnd(0, Fixture::bandCenterY(30));
    requireClose(f.store.state().minPrice, f.price(10), 1e-12, "unchanged");
    requireTrue(f.commits == 0, "no commit");

    lrc::ChartStore bare;
    lrc::CenterDrag none(bare, bare);
    none.onStart(0, 10.0);
    requireTrue(!none.active(), "no ticks, no range");
    double lo = 0, hi = 0;
    requireTrue(!none.computeRange(10.0, lo, hi), "nothing to compute");
    std::printf("  Test 5 (locked): PASS\n");
  }

  std::printf("D5.2 center_drag: ALL PASS\n");
  return 0;
}
