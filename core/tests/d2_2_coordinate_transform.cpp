// D2.2 - price <-> pixel transform
// Tests: exact band alignment, monotonicity, round trip inside the data,
// clamping outside it, degenerate series, closest-tick lookup.

#include "lrc/scale/CoordinateTransform.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
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

// Geometric prices so neighbouring bands cover unequal price steps.
static std::vector<lrc::TickEntry> makeTicks(int n) {
  std::vector<lrc::TickEntry> ticks;
  for (int i = 0; i < n; i++) {
    lrc::TickEntry e;
    e.tick = i * 60;
    e.price0 = 100.0 * std::pow(1.01, i);
    e.price1 = 1.0 / e.price0;
    e.activeLiquidity = 1.0;
    ticks.push_back(e);
  }
  return ticks;
}

int main() {
  auto ticks = makeTicks(20);
  lrc::TickScale scale;
  scale.rebuild(ticks, 4.0, 0.05, 1.5, -20.0);
  lrc::CoordinateTransform xf(ticks, scale);

  const double lo = ticks.front().price0;
  const double hi = ticks.back().price0;

  // ---- Test 1: tick prices land on their bands ----
  {
    for (std::size_t i = 0; i < ticks.size(); i++) {
      requireClose(xf.priceToY(ticks[i].price0, lrc::TickAlignment::Top), scale.bandY(i), 1e-9,
                   "top alignment");
      requireClose(xf.priceToY(ticks[i].price0, lrc::TickAlignment::Bottom),
                   scale.bandY(i) + scale.bandwidth(), 1e-9, "bottom alignment");
      requireClose(xf.priceToY(ticks[i].price0),
                   scale.bandY(i) + scale.bandwidth() / 2.0, 1e-9, "center alignment");
    }
    std::printf("  Test 1 (band alignment): PASS\n");
  }

  // ---- Test 2: monotone, higher price -> smaller y ----
  {
    double prevY = std::numeric_limits<double>::infinity();
    for (int k = 0; k <= 400; k++) {
      double p = lo * 0.95 + (hi * 1.05 - lo * 0.95) * k / 400.0;
      double y = xf.priceToY(p);
      requireTrue(std::isfinite(y), "finite y");
      requireTrue(y < prevY, "strictly decreasing");
      prevY = y;
    }
    std::printf("  Test 2 (monotone): PASS\n");
  }

  // ---- Test 3: round trip inside the data ----
  {
    const lrc::TickAlignment aligns[] = {
      lrc::TickAlignment::Center, lrc::TickAlignment::Top, lrc::TickAlignment::Bottom
    };
    for (lrc::TickAlignment a : aligns) {
      for (int k = 0; k <= 100; k++) {
        double p = lo + (hi - lo) * k / 100.0;
        double back = xf.yToPrice(xf.priceToY(p, a), a);
        requireClose(back, p, 1e-9 * hi, "price -> y -> price");
      }
    }
    for (std::size_t i = 0; i < ticks.size(); i++) {
      double y = scale.bandY(i) + scale.bandwidth() / 2.0;
      requireClose(xf.priceToY(xf.yToPrice(y)), y, 1e-9, "y -> price -> y");
    }
    std::printf("  Test 3 (round trip): PASS\n");
  }

  // ---- Test 4: outside the data ----
  {
    requireClose(xf.yToPrice(-1000.0), hi, 1e-12, "above content clamps to max");
    requireClose(xf.yToPrice(1e6), lo, 1e-12, "below content clamps to min");
    requireTrue(xf.priceToY(lo * 0.9) > xf.priceToY(lo), "below data extrapolates down");
    requireTrue(xf.priceToY(hi * 1.1) < xf.priceToY(hi), "above data extrapolates up");

    lrc::PriceBounds b = xf.dataBounds();
    requireClose(b.min, lo, 1e-12, "data min");
    requireClose(b.max, hi, 1e-12, "data max");
    std::printf("  Test 4 (outside the data): PASS\n");
  }

  // ---- Test 5: degenerate inputs ----
  {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    requireTrue(std::isnan(xf.priceToY(nan)), "NaN price");
    requireTrue(std::isnan(xf.yToPrice(nan)), "NaN y");

    std::vector<lrc::TickEntry> empty;
    lrc::TickScale emptyScale;
    emptyScale.rebuild(empty, 4.0, 0.05, 1.0, 0.0);
    lrc::CoordinateTransform none(empty, emptyScale);
    requireTrue(std::isnan(none.priceToY(1.0)), "empty priceToY");
    requireTrue(std::isnan(none.yToPrice(10.0)), "empty yToPrice");
    lrc::PriceBounds eb = none.dataBounds();
    requireTrue(eb.min == 0.0 && eb.max == 0.0, "empty bounds");

    std::vector<lrc::TickEntry> one(ticks.begin(), ticks.begin() + 1);
    lrc::TickScale oneScale;
    oneScale.rebuild(one, 4.0, 0.05, 1.0, 0.0);
    lrc::CoordinateTransform single(one, oneScale);
    requireClose(single.priceToY(123.0, lrc::TickAlignment::Top), 0.0, 1e-12,
                 "single tick maps to its band");
    requireTrue(std::isnan(single.yToPrice(1.0)), "single tick has no price range");

    // Scale built for a different series: not usable
    lrc::TickScale stale;
    stale.rebuild(one, 4.0, 0.05, 1.0, 0.0);
    lrc::CoordinateTransform mismatched(ticks, stale);
    requireTrue(std::isnan(mismatched.priceToY(lo)), "stale scale rejected");

    std::printf("  Test 5 (degenerate inputs): PASS\n");
  }

  // ---- Test 6: closest tick ----
  {
    requireTrue(lrc::findClosestTickIndex(ticks, ticks[7].price0) == 7, "exact price");
    requireTrue(lrc::findClosestTickIndex(ticks, ticks[7].price0 * 1.001) == 7, "slightly above");
    requireTrue(lrc::findClosestTickIndex(ticks, 1.0) == 0, "far below");
    requireTrue(lrc::findClosestTickIndex(ticks, 1e9) == 19, "far above");

    std::vector<lrc::TickEntry> pair(2);
    pair[0].price0 = 1.0;
    pair[1].price0 = 3.0;
    requireTrue(lrc::findClosestTickIndex(pair, 2.0) == 0, "tie goes to the first");

    std::vector<lrc::TickEntry> empty;
    requireTrue(lrc::findClosestTickIndex(empty, 1.0) == -1, "empty -> -1");
    requireTrue(lrc::findClosestTick(empty, 1.0) == nullptr, "empty -> nullptr");
    requireTrue(lrc::findClosestTick(ticks, ticks[3].price0)->tick == 180, "pointer to entry");
    std::printf("  Test 6 (closest tick): PASS\n");
  }

  std::printf("D2.2 coordinate_transform: ALL PASS\n");
  return 0;
}
