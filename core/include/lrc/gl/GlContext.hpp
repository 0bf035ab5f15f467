#pragma once
#include <cstdint>
#include <vector>

namespace lrc {

// A current GL 3.3 core context the chart renders into: a GLFW window for the
// interactive demo, an OSMesa buffer for headless rendering and tests.
class GlContext {
public:
  virtual ~GlContext() = default;

  // Create the context at width x height chart pixels, make it current and
  // load GL entry points through glad.
  virtual bool init(int width, int height) = 0;
  virtual void swapBuffers() = 0;

  // Size in chart pixels, the coordinate space of the scene and of pointer events.
  virtual int width() const = 0;
  virtual int height() const = 0;

  // Framebuffer pixels per chart pixel.
  virtual double pixelRatio() const { return 1.0; }

  // RGBA8 framebuffer contents, bottom row first.
  virtual std::vector<std::uint8_t> readPixels() const = 0;
};

} // namespace lrc
