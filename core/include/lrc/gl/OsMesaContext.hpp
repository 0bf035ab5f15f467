#pragma once
#include "lrc/gl/GlContext.hpp"

#ifdef LRC_HAS_OSMESA

// glad first: it guards GL/gl.h, so osmesa.h finds no GLAPI/APIENTRY.
#include <glad/gl.h>
#ifndef APIENTRY
#define APIENTRY
#endif
#ifndef GLAPI
#define GLAPI extern
#endif
#include <GL/osmesa.h>

namespace lrc {

// Software GL 3.3 core context drawing into memory. Used by the headless
// demo mode and the render tests; no window system required.
class OsMesaContext : public GlContext {
public:
  OsMesaContext() = default;
  ~OsMesaContext() override { destroy(); }

  OsMesaContext(const OsMesaContext&) = delete;
  OsMesaContext& operator=(const OsMesaContext&) = delete;

  bool init(int width, int height) override;
  // Drawing is synchronous into the color buffer; this only waits for GL.
  void swapBuffers() override;

  int width() const override { return width_; }
  int height() const override { return height_; }

  std::vector<std::uint8_t> readPixels() const override;

private:
  bool fail(const char* what);
  void destroy();

  OSMesaContext ctx_{nullptr};
  int width_{0};
  int height_{0};
  std::vector<std::uint8_t> color_;
};

} // namespace lrc

#endif // LRC_HAS_OSMESA
