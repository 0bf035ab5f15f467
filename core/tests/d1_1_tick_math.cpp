// D1.1 - tick math and liquidity depth
// Tests: tick <-> price, usable-tick snapping, full range, depth accumulation,
// visible-range filtering, bounds helpers.

#include "lrc/model/LiquidityDepth.hpp"
#include "lrc/model/TickMath.hpp"

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
    std::fprintf(stderr, "ASSERT FAIL: %s (got %.12f, expected %.12f)\n", msg, a, b);
    std::exit(1);
  }
}

int main() {
  // ---- Test 1: tick <-> price ----
  {
    requireClose(lrc::tickToPrice(0), 1.0, 1e-15, "tick 0 is price 1");
    requireClose(lrc::tickToPrice(100), std::pow(1.0001, 100), 1e-12, "tick 100");
    requireClose(lrc::tickToPrice(-100) * lrc::tickToPrice(100), 1.0, 1e-12, "symmetric ticks");

    const int samples[] = {-50000, -6931, -1, 0, 1, 60, 12345, 200000};
    for (int t : samples) {
      requireTrue(lrc::priceToTick(lrc::tickToPrice(t)) == t, "priceToTick inverts tickToPrice");
    }

    // Between two ticks: the lower one
    double mid = (lrc::tickToPrice(500) + lrc::tickToPrice(501)) / 2.0;
    requireTrue(lrc::priceToTick(mid) == 500, "price between ticks floors");

    requireTrue(lrc::priceToTick(0.0) == lrc::kMinTick, "zero price clamps");
    requireTrue(lrc::priceToTick(-3.0) == lrc::kMinTick, "negative price clamps");
    requireTrue(lrc::priceToTick(std::numeric_limits<double>::quiet_NaN()) == lrc::kMinTick,
                "NaN price clamps");
    requireTrue(lrc::priceToTick(1e300) == lrc::kMaxTick, "huge price clamps to max");

    requireClose(lrc::tickToScaledPrice(10, 0, 2.0), 2.0 * std::pow(1.0001, 10), 1e-12,
                 "scaled price relative to reference");
    requireClose(lrc::tickToScaledPrice(500, 500, 1850.0), 1850.0, 1e-12,
                 "reference tick gives reference price");

    std::printf("  Test 1 (tick <-> price): PASS\n");
  }

  // ---- Test 2: usable ticks ----
  {
    requireTrue(lrc::nearestUsableTick(17, 10) == 20, "17 -> 20");
    requireTrue(lrc::nearestUsableTick(14, 10) == 10, "14 -> 10");
    requireTrue(lrc::nearestUsableTick(-16, 10) == -20, "-16 -> -20");
    requireTrue(lrc::nearestUsableTick(120, 60) == 120, "already usable");
    requireTrue(lrc::nearestUsableTick(7, 0) == 7, "spacing 0 treated as 1");

    int top = lrc::nearestUsableTick(lrc::kMaxTick, 60);
    requireTrue(top <= lrc::kMaxTick, "max tick stays in bounds");
    requireTrue(top % 60 == 0, "max tick stays usable");
    int bottom = lrc::nearestUsableTick(lrc::kMinTick, 60);
    requireTrue(bottom >= lrc::kMinTick, "min tick stays in bounds");
    requireTrue(bottom % 60 == 0, "min tick stays usable");

    lrc::TickRange full = lrc::fullRangeTicks(60);
    requireTrue(full.lowerTick == -887220, "full range lower");
    requireTrue(full.upperTick == 887220, "full range upper");
    requireClose(full.lowerPrice * full.upperPrice, 1.0, 1e-9, "full range prices reciprocal");

    std::printf("  Test 2 (usable ticks): PASS\n");
  }

  // ---- Test 3: snap a price range ----
  {
    lrc::TickRange r = lrc::snapRangeToSpacing(lrc::tickToPrice(600), lrc::tickToPrice(1200), 60);
    requireTrue(r.lowerTick == 600, "lower snapped");
    requireTrue(r.upperTick == 1200, "upper snapped");
    requireClose(r.lowerPrice, lrc::tickToPrice(600), 1e-12, "lower price");

    lrc::TickRange swapped = lrc::snapRangeToSpacing(lrc::tickToPrice(1200), lrc::tickToPrice(600), 60);
    requireTrue(swapped.lowerTick == 600 && swapped.upperTick == 1200, "reversed input");

    double p = lrc::tickToPrice(600);
    lrc::TickRange same = lrc::snapRangeToSpacing(p, p, 60);
    requireTrue(same.lowerTick == 600, "collapsed lower kept");
    requireTrue(same.upperTick == 660, "collapsed upper pushed one spacing up");

    lrc::TickRange atTop = lrc::snapRangeToSpacing(1e300, 1e300, 60);
    requireTrue(atTop.lowerTick < atTop.upperTick, "top boundary still ordered");
    requireTrue(atTop.upperTick == 887220, "top boundary upper is max usable");

    std::printf("  Test 3 (snap range to spacing): PASS\n");
  }

  // ---- Test 4: depth accumulation ----
  std::vector<lrc::RawTick> raw = {
    {60, -120.0}, {-60, 100.0}, {120, -30.0}, {0, 50.0}
  };
  {
    auto entries = lrc::buildTickEntries(raw);
    requireTrue(entries.size() == 4, "four entries");
    requireTrue(entries[0].tick == -60 && entries[3].tick == 120, "sorted by tick");
    requireClose(entries[0].activeLiquidity, 100.0, 1e-12, "cum -60");
    requireClose(entries[1].activeLiquidity, 150.0, 1e-12, "cum 0");
    requireClose(entries[2].activeLiquidity, 30.0, 1e-12, "cum 60");
    requireClose(entries[3].activeLiquidity, 0.0, 1e-12, "cum 120");
    for (std::size_t i = 1; i < entries.size(); i++)
      requireTrue(entries[i].price0 > entries[i - 1].price0, "ascending price0");
    requireClose(entries[1].price0, 1.0, 1e-15, "tick 0 price0");
    requireClose(entries[2].price1, 1.0 / entries[2].price0, 1e-15, "price1 reciprocal");

    auto inverted = lrc::buildTickEntries(raw, true);
    requireTrue(inverted.size() == 4, "inverted size");
    requireTrue(inverted[0].tick == 120, "inverted lowest price is highest tick");
    for (std::size_t i = 1; i < inverted.size(); i++)
      requireTrue(inverted[i].price0 > inverted[i - 1].price0, "inverted ascending price0");

    std::vector<lrc::RawTick> withNaN = raw;
    withNaN.push_back({30, std::numeric_limits<double>::quiet_NaN()});
    requireTrue(lrc::buildTickEntries(withNaN).size() == 4, "non-finite skipped");

    // Negative running sums clamp at zero
    std::vector<lrc::RawTick> negative = {{0, -10.0}, {10, 25.0}};
    auto neg = lrc::buildTickEntries(negative);
    requireClose(neg[0].activeLiquidity, 0.0, 1e-12, "negative clamped");
    requireClose(neg[1].activeLiquidity, 15.0, 1e-12, "sum continues unclamped");

    requireTrue(lrc::buildTickEntries({}).empty(), "empty input");

    std::printf("  Test 4 (depth accumulation): PASS\n");
  }

  // ---- Test 5: point liquidity and filtering ----
  {
    requireClose(lrc::liquidityAtTick(raw, 0), 150.0, 1e-12, "at 0");
    requireClose(lrc::liquidityAtTick(raw, 59), 150.0, 1e-12, "just below 60");
    requireClose(lrc::liquidityAtTick(raw, 60), 30.0, 1e-12, "at 60");
    requireClose(lrc::liquidityAtTick(raw, -100), 0.0, 1e-12, "below all");
    requireClose(lrc::liquidityAtTick(raw, 1000), 0.0, 1e-12, "above all");

    auto entries = lrc::buildTickEntries(raw);
    auto visible = lrc::filterToVisibleRange(entries, 0, 60, 0.5);
    requireTrue(visible.size() == 2, "buffer 30 keeps 0 and 60");
    auto wide = lrc::filterToVisibleRange(entries, 60, 0, 1.0);
    requireTrue(wide.size() == 4, "reversed bounds, buffer 60 keeps all");
    auto none = lrc::filterToVisibleRange(entries, 1000, 2000, 0.0);
    requireTrue(none.empty(), "nothing in window");

    std::printf("  Test 5 (point liquidity + filter): PASS\n");
  }

  // ---- Test 6: bounds helpers ----
  {
    auto entries = lrc::buildTickEntries(raw);
    requireClose(lrc::maxLiquidity(entries), 165.0, 1e-9, "max with 10% padding");
    requireClose(lrc::maxLiquidity(entries, 0.0), 150.0, 1e-12, "max without padding");
    requireClose(lrc::maxLiquidity({}), 1.0, 1e-15, "empty -> 1");

    lrc::PriceBounds b = lrc::dataPriceBounds(entries);
    requireClose(b.min, lrc::tickToPrice(-60), 1e-12, "data min");
    requireClose(b.max, lrc::tickToPrice(120), 1e-12, "data max");
    lrc::PriceBounds e = lrc::dataPriceBounds({});
    requireTrue(e.min == 0.0 && e.max == 0.0, "empty data bounds");

    std::vector<lrc::PricePoint> series = {{10, 5.0}, {20, 2.0}, {30, 9.0}};
    lrc::PriceBounds s = lrc::priceSeriesBounds(series);
    requireTrue(s.min == 2.0 && s.max == 9.0, "series bounds");
    lrc::PriceBounds se = lrc::priceSeriesBounds({});
    requireTrue(se.min == 0.0 && se.max == 0.0, "empty series bounds");

    std::printf("  Test 6 (bounds helpers): PASS\n");
  }

  std::printf("D1.1 tick_math: ALL PASS\n");
  return 0;
}
