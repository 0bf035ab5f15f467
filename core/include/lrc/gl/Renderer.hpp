#pragma once
#include "lrc/debug/Stats.hpp"
#include "lrc/gl/GpuBufferManager.hpp"
#include "lrc/gl/ShaderProgram.hpp"
#include "lrc/scene/Scene.hpp"
#include <glad/gl.h>

namespace lrc {

// Draws a Scene whose geometry is in pixels (top-left origin). Panes, layers
// and draw items are walked in id order, which is creation order for the
// chart's recipes.
class Renderer {
public:
  Renderer() = default;
  ~Renderer();

  Renderer(const Renderer&) = delete;
  Renderer& operator=(const Renderer&) = delete;

  // Compile shaders, create VAO. Call once after the GL context is current.
  bool init();

  void setClearColor(const float rgba[4]);

  // viewW/viewH: pixel space of the scene; pixelRatio: framebuffer pixels per
  // scene pixel.
  Stats render(const Scene& scene, GpuBufferManager& gpuBufs, int viewW, int viewH,
               float pixelRatio = 1.0f);

private:
  ShaderProgram pos2Prog_;      // triSolid@1 + line2d@1
  ShaderProgram instRectProg_;  // instancedRect@1
  ShaderProgram lineAAProg_;    // lineAA@1
  GLuint vao_{0};
  bool inited_{false};
  float clearColor_[4] = {0.0f, 0.0f, 0.0f, 1.0f};

  void applyScissor(const DrawItem& di, int viewW, int viewH, float pixelRatio);

  void drawVertices(const DrawItem& di, const Geometry& geo, GLuint vbo, GLenum mode,
                    int viewW, int viewH, Stats& stats);
  void drawInstances(ShaderProgram& prog, const Geometry& geo, GLuint vbo, Stats& stats);
  void drawRects(const DrawItem& di, const Geometry& geo, GLuint vbo,
                 int viewW, int viewH, Stats& stats);
  void drawSegments(const DrawItem& di, const Geometry& geo, GLuint vbo,
                    int viewW, int viewH, Stats& stats);
};

} // namespace lrc
