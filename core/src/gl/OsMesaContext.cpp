#ifdef LRC_HAS_OSMESA

#include "lrc/gl/OsMesaContext.hpp"
#include <cstdio>

namespace lrc {

bool OsMesaContext::fail(const char* what) {
  std::fprintf(stderr, "OsMesaContext::init: %s\n", what);
  destroy();
  return false;
}

void OsMesaContext::destroy() {
  if (ctx_) OSMesaDestroyContext(ctx_);
  ctx_ = nullptr;
  width_ = height_ = 0;
  color_.clear();
}

bool OsMesaContext::init(int width, int height) {
  destroy();
  if (width <= 0 || height <= 0) return fail("empty surface");

  // Color only: the chart draws back to front with blending.
  const int attribs[] = {
    OSMESA_FORMAT, OSMESA_RGBA,
    OSMESA_DEPTH_BITS, 0,
    OSMESA_STENCIL_BITS, 0,
    OSMESA_PROFILE, OSMESA_CORE_PROFILE,
    OSMESA_CONTEXT_MAJOR_VERSION, 3,
    OSMESA_CONTEXT_MINOR_VERSION, 3,
    0,
  };
  ctx_ = OSMesaCreateContextAttribs(attribs, nullptr);
  if (!ctx_) return fail("no GL 3.3 core profile");

  color_.resize(static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * 4u);
  if (!OSMesaMakeCurrent(ctx_, color_.data(), GL_UNSIGNED_BYTE, width, height))
    return fail("cannot bind the color buffer");
  if (!gladLoadGL(reinterpret_cast<GLADloadfunc>(OSMesaGetProcAddress)))
    return fail("GL entry points did not load");

  width_ = width;
  height_ = height;
  return true;
}

void OsMesaContext::swapBuffers() {
  if (ctx_) glFinish();
}

std::vector<std::uint8_t> OsMesaContext::readPixels() const {
  std::vector<std::uint8_t> rgba(color_.size());
  if (ctx_ && !rgba.empty())
    glReadPixels(0, 0, width_, height_, GL_RGBA, GL_UNSIGNED_BYTE, rgba.data());
  return rgba;
}

} // namespace lrc

#endif // LRC_HAS_OSMESA
