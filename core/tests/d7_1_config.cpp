// D7.1 - chart configuration JSON
// Tests: serialize/parse round trip, partial overlay keeps other values,
// invalid JSON leaves the config untouched, malformed colors are ignored,
// a parsed config drives the store's scale.

#include "lrc/config/ChartConfig.hpp"
#include "lrc/state/ChartStore.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>
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
  // ---- Test 1: round trip ----
  {
    lrc::ChartConfig cfg;
    cfg.dims.barHeight = 5;
    cfg.dims.rangeMinHeight = 20;
    cfg.behavior.zoomFactor = 1.5;
    cfg.behavior.measureRetries = 3;
    cfg.colors.barActive[0] = 0.25f;
    cfg.colors.priceLineWidth = 3.0f;

    std::string json = lrc::serializeChartConfig(cfg);
    requireTrue(json.find("\"dimensions\"") != std::string::npos, "dimensions section");
    requireTrue(json.find("\"behavior\"") != std::string::npos, "behavior section");
    requireTrue(json.find("\"colors\"") != std::string::npos, "colors section");

    lrc::ChartConfig back;
    requireTrue(lrc::parseChartConfig(json, back), "parse ok");
    requireClose(back.dims.barHeight, 5.0, 1e-12, "barHeight");
    requireClose(back.dims.rangeMinHeight, 20.0, 1e-12, "rangeMinHeight");
    requireClose(back.behavior.zoomFactor, 1.5, 1e-12, "zoomFactor");
    requireTrue(back.behavior.measureRetries == 3, "measureRetries");
    requireClose(back.colors.barActive[0], 0.25, 1e-6, "color channel");
    requireClose(back.colors.priceLineWidth, 3.0, 1e-6, "line width");
    requireTrue(lrc::serializeChartConfig(back) == json, "stable output");
    std::printf("  Test 1 (round trip): PASS\n");
  }

  // ---- Test 2: partial overlay ----
  {
    lrc::ChartConfig cfg;
    cfg.behavior.zoomMax = 4.0;
    requireTrue(lrc::parseChartConfig(R"({"dimensions":{"barSpacing":3}})", cfg), "parse ok");
    requireClose(cfg.dims.barSpacing, 3.0, 1e-12, "overlaid");
    requireClose(cfg.dims.barHeight, 3.0, 1e-12, "default kept");
    requireClose(cfg.behavior.zoomMax, 4.0, 1e-12, "previous value kept");

    // Wrong types keep the current value
    requireTrue(lrc::parseChartConfig(
      R"({"behavior":{"zoomFactor":"fast","measureRetries":2.5},"colors":[1,2]})", cfg),
      "parse ok");
    requireClose(cfg.behavior.zoomFactor, 1.3, 1e-12, "string ignored");
    requireTrue(cfg.behavior.measureRetries == 10, "non-integer ignored");
    std::printf("  Test 2 (partial overlay): PASS\n");
  }

  // ---- Test 3: invalid JSON ----
  {
    lrc::ChartConfig cfg;
    cfg.dims.barHeight = 7;
    requireTrue(!lrc::parseChartConfig("{not json", cfg), "parse error");
    requireTrue(!lrc::parseChartConfig("[1,2,3]", cfg), "not an object");
    requireTrue(!lrc::parseChartConfig("", cfg), "empty");
    requireClose(cfg.dims.barHeight, 7.0, 1e-12, "untouched");
    std::printf("  Test 3 (invalid JSON): PASS\n");
  }

  // ---- Test 4: colors need four numbers ----
  {
    lrc::ChartConfig cfg;
    const float before = cfg.colors.guideLine[0];
    requireTrue(lrc::parseChartConfig(
      R"({"colors":{"guideLine":[1,0,0],"barHover":[0,1,"x",1],"rangeArea":[0,0,1,0.5]}})", cfg),
      "parse ok");
    requireClose(cfg.colors.guideLine[0], before, 1e-9, "three channels ignored");
    requireClose(cfg.colors.barHover[0], 1.0, 1e-9, "non-numeric channel ignored");
    requireClose(cfg.colors.rangeArea[2], 1.0, 1e-9, "full color applied");
    requireClose(cfg.colors.rangeArea[3], 0.5, 1e-9, "alpha applied");
    std::printf("  Test 4 (color arrays): PASS\n");
  }

  // ---- Test 5: parsed config drives the band layout ----
  {
    lrc::ChartConfig cfg;
    requireTrue(lrc::parseChartConfig(R"({"dimensions":{"barHeight":6,"barSpacing":2}})", cfg),
                "parse ok");
    lrc::ChartStore store(cfg);
    std::vector<lrc::TickEntry> ticks;
    for (int i = 0; i < 10; i++) {
      lrc::TickEntry e;
      e.tick = i;
      e.price0 = 1.0 + i;
      e.price1 = 1.0 / e.price0;
      e.activeLiquidity = 1.0;
      ticks.push_back(e);
    }
    store.setTicks(ticks);
    store.setDimensions(lrc::Dimensions{400, 200});
    requireClose(store.viewportController().pitch(), 8.0, 1e-9, "pitch from config");
    requireClose(store.tickScale().step(), 8.0, 1e-9, "scale step at zoom 1");
    std::printf("  Test 5 (config drives scale): PASS\n");
  }

  std::printf("D7.1 config: ALL PASS\n");
  return 0;
}
