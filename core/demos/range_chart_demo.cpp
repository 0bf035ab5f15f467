// Liquidity range chart demo
// GLFW: interactive window (drag handles, wheel zoom, middle-drag pan,
//       +/- zoom, C center, R reset, F toggle full range, Esc quit)
// OSMesa fallback: scripted handle drag, single frame written to PPM

#include "lrc/gl/GlContext.hpp"
#include "lrc/gl/GpuBufferManager.hpp"
#include "lrc/gl/Renderer.hpp"
#include "lrc/model/LiquidityDepth.hpp"
#include "lrc/model/TickMath.hpp"
#include "lrc/session/RangeChart.hpp"

#ifdef LRC_HAS_GLFW
#include "lrc/gl/GlfwContext.hpp"
#include <GLFW/glfw3.h>
#endif
#ifdef LRC_HAS_OSMESA
#include "lrc/gl/OsMesaContext.hpp"
#endif

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <vector>

static constexpr int kTickSpacing = 60;
static constexpr int kCenterTick = 23040;  // ~10.0

static void writePPM(const char* filename, const std::vector<std::uint8_t>& pixels,
                     int w, int h) {
  FILE* f = std::fopen(filename, "wb");
  if (!f) {
    std::fprintf(stderr, "writePPM: cannot open %s\n", filename);
    return;
  }
  std::fprintf(f, "P6\n%d %d\n255\n", w, h);
  for (int y = h - 1; y >= 0; y--) {
    for (int x = 0; x < w; x++) {
      std::size_t idx = static_cast<std::size_t>((y * w + x) * 4);
      std::fputc(pixels[idx + 0], f);
      std::fputc(pixels[idx + 1], f);
      std::fputc(pixels[idx + 2], f);
    }
  }
  std::fclose(f);
  std::printf("Wrote %s (%dx%d)\n", filename, w, h);
}

// Deterministic liquidity positions: a few wide ones and many narrow ones
// clustered around the current tick.
static std::vector<lrc::RawTick> makeRawTicks() {
  std::vector<lrc::RawTick> raw;
  for (int i = -60; i <= 60; i++) {
    int tick = kCenterTick + i * kTickSpacing;
    double weight = std::exp(-(i * i) / 600.0) * 4.0e6 + 2.0e5 * (1.0 + std::sin(i * 0.7));
    raw.push_back({tick, i < 0 ? weight : -weight * 0.9});
  }
  return raw;
}

static std::vector<lrc::PricePoint> makePriceSeries(double lastPrice) {
  std::vector<lrc::PricePoint> series;
  const std::int64_t t0 = 1700000000;
  double p = lastPrice * 0.93;
  for (int i = 0; i < 240; i++) {
    p += lastPrice * 0.004 * std::sin(i * 0.21) + lastPrice * 0.0006;
    series.push_back({t0 + i * 3600, p});
  }
  series.back().value = lastPrice;
  return series;
}

int main() {
  constexpr int W = 880, H = 404;

  std::unique_ptr<lrc::GlContext> glCtx;
#ifdef LRC_HAS_GLFW
  lrc::GlfwContext* glfwCtx = nullptr;
  {
    auto g = std::make_unique<lrc::GlfwContext>();
    if (g->init(W, H)) {
      glfwCtx = g.get();
      glCtx = std::move(g);
    }
  }
#endif
#ifdef LRC_HAS_OSMESA
  if (!glCtx) {
    auto m = std::make_unique<lrc::OsMesaContext>();
    if (!m->init(W, H)) {
      std::fprintf(stderr, "OSMesa init failed\n");
      return 1;
    }
    glCtx = std::move(m);
    std::printf("Using OSMesa (headless), single frame\n");
  }
#endif
  if (!glCtx) {
    std::fprintf(stderr, "No GL context\n");
    return 1;
  }

  lrc::Renderer renderer;
  if (!renderer.init()) return 1;
  lrc::GpuBufferManager gpu;

  lrc::ChartConfig cfg;
  renderer.setClearColor(cfg.colors.background);

  lrc::ChartProps props;
  props.ticks = lrc::buildTickEntries(makeRawTicks());
  props.currentPrice = lrc::tickToPrice(kCenterTick);
  props.hasCurrentTick = true;
  props.currentTick = kCenterTick;
  props.priceSeries = makePriceSeries(props.currentPrice);
  props.duration = lrc::HistoryDuration::Week;

  lrc::RangeChart chart(cfg);

  // Act as the embedding page: log the snapped position and feed the
  // committed range back in as props.
  chart.setRangeChangeHandler([&](double minPrice, double maxPrice) {
    lrc::TickRange snapped = lrc::snapRangeToSpacing(minPrice, maxPrice, kTickSpacing);
    std::printf("range %.6f - %.6f  ticks [%d, %d]\n",
                minPrice, maxPrice, snapped.lowerTick, snapped.upperTick);
    props.hasMinPrice = true;
    props.minPrice = minPrice;
    props.hasMaxPrice = true;
    props.maxPrice = maxPrice;
    chart.setProps(props);
  });
  chart.setProps(props);

#ifdef LRC_HAS_GLFW
  if (glfwCtx) {
    chart.setMeasureFunction([glfwCtx](double& w, double& h) {
      w = glfwCtx->width();
      h = glfwCtx->height();
      return w > 0.0;
    });
    chart.mount(glfwGetTime() * 1000.0);

    bool labelsPrinted = false;
    while (true) {
      lrc::WindowInput in = glfwCtx->pollInput();
      if (in.shouldClose) break;

      for (const auto& ev : in.pointer) chart.handlePointer(ev);

      bool quit = false;
      for (lrc::KeyCode k : in.keys) {
        switch (k) {
          case lrc::KeyCode::Plus:  chart.zoomIn(); break;
          case lrc::KeyCode::Minus: chart.zoomOut(); break;
          case lrc::KeyCode::C:     chart.centerRange(); break;
          case lrc::KeyCode::R:     chart.reset(); break;
          case lrc::KeyCode::F:
            props.isFullRange = !props.isFullRange;
            chart.setProps(props);
            break;
          case lrc::KeyCode::Escape: quit = true; break;
          default: break;
        }
      }
      if (quit) break;
      if (in.resized) chart.onContainerResize();

      chart.tick(glfwGetTime() * 1000.0);

      if (chart.initialized() && !labelsPrinted) {
        for (const auto& l : chart.labels())
          std::printf("axis label @%.0f: %s\n", l.x, l.text.c_str());
        labelsPrinted = true;
      }

      gpu.sync(chart.buffers());
      renderer.render(chart.scene(), gpu, glfwCtx->width(), glfwCtx->height(),
                      static_cast<float>(glfwCtx->pixelRatio()));
      glfwCtx->swapBuffers();
    }
    return 0;
  }
#endif

  // Headless: fixed size, one scripted drag of the max handle, one frame.
  chart.setContainerSize(W, H);
  chart.reset();

  const auto& st = chart.store().state();
  double maxY = chart.store().transform().priceToY(st.maxPrice, lrc::TickAlignment::Top);
  double lineX = chart.layout().plotWidth * 0.5;

  lrc::PointerEvent ev;
  ev.button = lrc::PointerButton::Left;
  ev.x = lineX;
  ev.y = maxY;
  ev.action = lrc::PointerAction::Down;
  chart.handlePointer(ev);
  ev.action = lrc::PointerAction::Move;
  ev.y = maxY - 40.0;
  chart.handlePointer(ev);
  ev.action = lrc::PointerAction::Up;
  chart.handlePointer(ev);

  std::uint64_t uploaded = gpu.sync(chart.buffers());
  lrc::Stats stats = renderer.render(chart.scene(), gpu, glCtx->width(), glCtx->height(),
                                     static_cast<float>(glCtx->pixelRatio()));
  glCtx->swapBuffers();
  std::printf("frame: %u draw calls (%u clipped, %u culled), %llu instances, %llu bytes uploaded\n",
              stats.drawCalls, stats.clippedDrawItems, stats.culledDrawItems,
              static_cast<unsigned long long>(stats.instances),
              static_cast<unsigned long long>(uploaded));

  writePPM("range_chart_demo.ppm", glCtx->readPixels(), glCtx->width(), glCtx->height());
  return 0;
}
