// D9.1 - chart rendering (OSMesa)
// Tests: a mounted chart renders its layers (range shading, liquidity bars,
// indicator bar), bars are clipped at the time strip, buffers upload only
// after a redraw, every pipeline maps pixels with a top-left origin.

#include "lrc/commands/CommandProcessor.hpp"
#include "lrc/gl/GpuBufferManager.hpp"
#include "lrc/gl/OsMesaContext.hpp"
#include "lrc/gl/Renderer.hpp"
#include "lrc/scene/BufferStore.hpp"
#include "lrc/scene/ResourceRegistry.hpp"
#include "lrc/scene/Scene.hpp"
#include "lrc/session/RangeChart.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

struct Pixel {
  int r, g, b;
};

// (x, y) in chart pixels, top-left origin; readPixels is bottom row first.
static Pixel pixelAt(const std::vector<std::uint8_t>& px, int w, int h, int x, int y) {
  std::size_t idx = static_cast<std::size_t>(((h - 1 - y) * w + x) * 4);
  return Pixel{px[idx], px[idx + 1], px[idx + 2]};
}

static void apply(lrc::CommandProcessor& cp, const char* json) {
  lrc::CmdResult r = cp.applyJsonText(json);
  if (!r.ok) {
    std::fprintf(stderr, "FAIL [%s]: code=%s msg=%s\n", json, r.err.code.c_str(),
                 r.err.message.c_str());
    std::exit(1);
  }
}

static lrc::ChartProps makeProps() {
  lrc::ChartProps p;
  for (int i = 0; i < 50; i++) {
    lrc::TickEntry e;
    e.tick = i * 10;
    e.price0 = 1.0 + 0.01 * i;
    e.price1 = 1.0 / e.price0;
    e.activeLiquidity = 10.0 + i;
    p.ticks.push_back(e);
  }
  for (int k = 0; k < 5; k++)
    p.priceSeries.push_back({1705312200 + k * 86400, 1.05 + 0.05 * k});
  p.currentPrice = 1.25;
  p.hasMinPrice = true;
  p.minPrice = 1.10;
  p.hasMaxPrice = true;
  p.maxPrice = 1.40;
  return p;
}

int main() {
  constexpr int W = 480;
  constexpr int H = 224;

  lrc::OsMesaContext ctx;
  if (!ctx.init(W, H)) {
    std::fprintf(stderr, "Could not init OSMesa - skipping test\n");
    return 0;
  }

  lrc::RangeChart chart;
  chart.setProps(makeProps());
  chart.setContainerSize(W, H);
  requireTrue(chart.failedCommands() == 0, "scene built cleanly");

  lrc::GpuBufferManager gpuBufs;
  lrc::Renderer renderer;
  requireTrue(renderer.init(), "Renderer::init");
  renderer.setClearColor(chart.store().config().colors.background);

  // ---- Test 1: layers reach the framebuffer ----
  {
    std::uint64_t bytes = gpuBufs.sync(chart.buffers());
    requireTrue(bytes > 0, "initial upload");

    lrc::Stats stats = renderer.render(chart.scene(), gpuBufs, W, H);
    ctx.swapBuffers();
    requireTrue(stats.drawCalls > 0, "draw calls issued");
    requireTrue(stats.culledDrawItems > 0, "empty items skipped");
    requireTrue(stats.clippedDrawItems > 0 && stats.clippedDrawItems <= stats.drawCalls,
                "plot items carry a scissor");
    requireTrue(stats.instances > 0, "instanced bars drawn");

    auto px = ctx.readPixels();
    const auto& st = chart.store().state();
    const auto& xf = chart.store().transform();

    // Time strip, away from tick marks: background only
    Pixel bg = pixelAt(px, W, H, 200, 218);
    std::printf("  Background: R=%d G=%d B=%d\n", bg.r, bg.g, bg.b);
    requireTrue(bg.r < 30 && bg.g < 30 && bg.b < 30, "dark background");

    // Inside the range, above the price line: translucent range shading
    int areaY = static_cast<int>(xf.priceToY(1.35));
    Pixel area = pixelAt(px, W, H, 350, areaY);
    std::printf("  Range area: R=%d G=%d B=%d\n", area.r, area.g, area.b);
    requireTrue(area.r > bg.r + 10, "shaded orange");
    requireTrue(area.r > area.b, "warm tint");

    // Active liquidity bar next to the indicator
    int barY = static_cast<int>(xf.priceToY(1.24));
    Pixel bar = pixelAt(px, W, H, 460, barY);
    std::printf("  Active bar: R=%d G=%d B=%d\n", bar.r, bar.g, bar.b);
    requireTrue(bar.r > 150, "bar is bright orange");
    requireTrue(bar.b < 120, "bar is not white");

    // Indicator bar between the handles
    int indY = static_cast<int>(xf.priceToY(1.32));
    Pixel ind = pixelAt(px, W, H, 470, indY);
    std::printf("  Indicator: R=%d G=%d B=%d\n", ind.r, ind.g, ind.b);
    requireTrue(ind.r > 200, "indicator fill");

    // Band 6 straddles the bottom of the plot; below it the scissor cuts it off
    requireTrue(st.dimensions.height == 200.0, "plot height");
    Pixel cut = pixelAt(px, W, H, 460, 202);
    std::printf("  Below plot: R=%d G=%d B=%d\n", cut.r, cut.g, cut.b);
    requireTrue(cut.r < 30, "bars clipped to the plot");
    std::printf("  Test 1 (chart layers): PASS\n");
  }

  // ---- Test 2: uploads follow redraws ----
  {
    requireTrue(gpuBufs.sync(chart.buffers()) == 0, "nothing changed");

    chart.zoomIn();
    requireTrue(gpuBufs.sync(chart.buffers()) > 0, "redraw re-uploads");
    renderer.render(chart.scene(), gpuBufs, W, H);
    ctx.swapBuffers();
    requireTrue(gpuBufs.sync(chart.buffers()) == 0, "idle again");
    requireTrue(gpuBufs.activeBuffers() == chart.buffers().bufferIds().size(), "one VBO per buffer");
    std::printf("  Test 2 (incremental upload): PASS\n");
  }

  // ---- Test 3: pixel space per pipeline ----
  {
    lrc::Scene scene;
    lrc::ResourceRegistry reg;
    lrc::CommandProcessor cp(scene, reg);
    lrc::BufferStore cpuBufs;
    lrc::GpuBufferManager uploads;

    apply(cp, R"({"cmd":"createPane","id":1})");
    apply(cp, R"({"cmd":"createLayer","id":10,"paneId":1})");

    // triSolid: quad over x 0..100, y 0..50
    const float quad[] = {0, 0, 100, 0, 0, 50, 0, 50, 100, 0, 100, 50};
    apply(cp, R"({"cmd":"createBuffer","id":20,"byteLength":0})");
    cpuBufs.setBufferData(20, quad, static_cast<std::uint32_t>(sizeof(quad)));
    apply(cp, R"({"cmd":"createGeometry","id":21,"vertexBufferId":20,"format":"pos2","vertexCount":6})");
    apply(cp, R"({"cmd":"createDrawItem","id":22,"layerId":10})");
    apply(cp, R"({"cmd":"bindDrawItem","drawItemId":22,"pipeline":"triSolid@1","geometryId":21})");
    apply(cp, R"({"cmd":"setDrawItemStyle","drawItemId":22,"r":1,"g":0,"b":0,"a":1})");

    // instancedRect: x 300..400, y 150..200
    const float rect[] = {300, 150, 400, 200};
    apply(cp, R"({"cmd":"createBuffer","id":30,"byteLength":0})");
    cpuBufs.setBufferData(30, rect, static_cast<std::uint32_t>(sizeof(rect)));
    apply(cp, R"({"cmd":"createGeometry","id":31,"vertexBufferId":30,"format":"rect4","vertexCount":1})");
    apply(cp, R"({"cmd":"createDrawItem","id":32,"layerId":10})");
    apply(cp, R"({"cmd":"bindDrawItem","drawItemId":32,"pipeline":"instancedRect@1","geometryId":31})");
    apply(cp, R"({"cmd":"setDrawItemStyle","drawItemId":32,"r":0,"g":1,"b":0,"a":1})");

    // lineAA: horizontal segment at y = 120, 4px wide
    const float seg[] = {0, 120, 480, 120};
    apply(cp, R"({"cmd":"createBuffer","id":40,"byteLength":0})");
    cpuBufs.setBufferData(40, seg, static_cast<std::uint32_t>(sizeof(seg)));
    apply(cp, R"({"cmd":"createGeometry","id":41,"vertexBufferId":40,"format":"rect4","vertexCount":1})");
    apply(cp, R"({"cmd":"createDrawItem","id":42,"layerId":10})");
    apply(cp, R"({"cmd":"bindDrawItem","drawItemId":42,"pipeline":"lineAA@1","geometryId":41})");
    apply(cp, R"({"cmd":"setDrawItemStyle","drawItemId":42,"r":0,"g":0,"b":1,"a":1,"lineWidth":4})");

    cpuBufs.syncBufferLengths(scene);
    requireTrue(uploads.sync(cpuBufs) > 0, "test buffers uploaded");
    lrc::Stats stats = renderer.render(scene, uploads, W, H);
    ctx.swapBuffers();
    requireTrue(stats.drawCalls == 3, "one call per pipeline");

    auto px = ctx.readPixels();
    Pixel tri = pixelAt(px, W, H, 50, 25);
    Pixel triFlip = pixelAt(px, W, H, 50, H - 25);
    std::printf("  triSolid: R=%d G=%d B=%d\n", tri.r, tri.g, tri.b);
    requireTrue(tri.r > 200 && tri.g < 50, "triangles land top-left");
    requireTrue(triFlip.r < 50, "triangles are not mirrored");

    Pixel box = pixelAt(px, W, H, 350, 175);
    Pixel boxFlip = pixelAt(px, W, H, 350, H - 175);
    std::printf("  instancedRect: R=%d G=%d B=%d\n", box.r, box.g, box.b);
    requireTrue(box.g > 200 && box.r < 50, "rect at its pixel bounds");
    requireTrue(boxFlip.g < 50, "rect is not mirrored");

    Pixel line = pixelAt(px, W, H, 240, 120);
    Pixel lineFlip = pixelAt(px, W, H, 240, H - 120);
    std::printf("  lineAA: R=%d G=%d B=%d\n", line.r, line.g, line.b);
    requireTrue(line.b > 200 && line.g < 50, "segment at its pixel y");
    requireTrue(lineFlip.b < 50, "segment is not mirrored");
    std::printf("  Test 3 (pixel space): PASS\n");
  }

  std::printf("D9.1 gl_render: ALL PASS\n");
  return 0;
}
