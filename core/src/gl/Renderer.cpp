#include "lrc/gl/Renderer.hpp"
#include "lrc/scene/Geometry.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace lrc {

// ---- Pos2 shader (triSolid + line2d) ----
// Vertex inputs are pixels with a top-left origin.

static const char* kPos2Vert = R"GLSL(
#version 330 core
in vec2 a_pos;
uniform vec2 u_view;
vec2 toClip(vec2 p) {
    return vec2(p.x / u_view.x * 2.0 - 1.0, 1.0 - p.y / u_view.y * 2.0);
}
void main() {
    gl_Position = vec4(toClip(a_pos), 0.0, 1.0);
}
)GLSL";

static const char* kSolidFrag = R"GLSL(
#version 330 core
out vec4 outColor;
uniform vec4 u_color;
void main() {
    outColor = u_color;
}
)GLSL";

// ---- instancedRect@1 shader ----

static const char* kInstRectVert = R"GLSL(
#version 330 core
in vec4 a_rect;
uniform vec2 u_view;
vec2 toClip(vec2 p) {
    return vec2(p.x / u_view.x * 2.0 - 1.0, 1.0 - p.y / u_view.y * 2.0);
}
void main() {
    int v = gl_VertexID % 6;
    vec2 uv;
    if (v == 0)      uv = vec2(0.0, 0.0);
    else if (v == 1) uv = vec2(1.0, 0.0);
    else if (v == 2) uv = vec2(0.0, 1.0);
    else if (v == 3) uv = vec2(0.0, 1.0);
    else if (v == 4) uv = vec2(1.0, 0.0);
    else             uv = vec2(1.0, 1.0);
    vec2 p = vec2(mix(a_rect.x, a_rect.z, uv.x), mix(a_rect.y, a_rect.w, uv.y));
    gl_Position = vec4(toClip(p), 0.0, 1.0);
}
)GLSL";

// ---- lineAA@1 shader: segment quads expanded in pixel space ----

static const char* kLineAAVert = R"GLSL(
#version 330 core
in vec4 a_rect;
uniform vec2 u_view;
uniform float u_lineWidth;
uniform float u_aaWidth;
out float v_dist;
vec2 toClip(vec2 p) {
    return vec2(p.x / u_view.x * 2.0 - 1.0, 1.0 - p.y / u_view.y * 2.0);
}
void main() {
    vec2 p0 = a_rect.xy;
    vec2 p1 = a_rect.zw;
    vec2 dir = p1 - p0;
    float len = length(dir);
    vec2 d = (len > 0.0001) ? dir / len : vec2(1.0, 0.0);
    vec2 perp = vec2(-d.y, d.x);
    float hw = u_lineWidth * 0.5;
    float totalHW = hw + u_aaWidth;
    int vid = gl_VertexID % 6;
    vec2 uv;
    if (vid == 0)      uv = vec2(0.0, -1.0);
    else if (vid == 1) uv = vec2(1.0, -1.0);
    else if (vid == 2) uv = vec2(0.0,  1.0);
    else if (vid == 3) uv = vec2(0.0,  1.0);
    else if (vid == 4) uv = vec2(1.0, -1.0);
    else               uv = vec2(1.0,  1.0);
    vec2 pos = mix(p0, p1, uv.x) + perp * (uv.y * totalHW);
    gl_Position = vec4(toClip(pos), 0.0, 1.0);
    v_dist = uv.y * totalHW / max(hw, 0.0001);
}
)GLSL";

static const char* kLineAAFrag = R"GLSL(
#version 330 core
uniform vec4 u_color;
uniform float u_fringeEdge;
in float v_dist;
out vec4 outColor;
void main() {
    float d = abs(v_dist);
    // d <= 1.0: inside nominal line; 1.0 -> u_fringeEdge: AA fringe
    float a = 1.0 - smoothstep(1.0, u_fringeEdge, d);
    outColor = vec4(u_color.rgb, u_color.a * a);
}
)GLSL";

static constexpr float kAAFringePx = 1.0f;

Renderer::~Renderer() {
  if (vao_) glDeleteVertexArrays(1, &vao_);
}

bool Renderer::init() {
  if (!pos2Prog_.build("pos2", kPos2Vert, kSolidFrag)) {
    std::fprintf(stderr, "Renderer::init: failed to build pos2 shader\n");
    return false;
  }
  if (!instRectProg_.build("instancedRect", kInstRectVert, kSolidFrag)) {
    std::fprintf(stderr, "Renderer::init: failed to build instRect shader\n");
    return false;
  }
  if (!lineAAProg_.build("lineAA", kLineAAVert, kLineAAFrag)) {
    std::fprintf(stderr, "Renderer::init: failed to build lineAA shader\n");
    return false;
  }

  glGenVertexArrays(1, &vao_);
  inited_ = true;
  return true;
}

void Renderer::setClearColor(const float rgba[4]) {
  std::copy(rgba, rgba + 4, clearColor_);
}

void Renderer::applyScissor(const DrawItem& di, int viewW, int viewH, float pixelRatio) {
  const int fbW = static_cast<int>(std::lround(viewW * pixelRatio));
  const int fbH = static_cast<int>(std::lround(viewH * pixelRatio));
  if (!di.scissor.enabled) {
    glScissor(0, 0, fbW, fbH);
    return;
  }
  // Top-left pixel rect to GL's bottom-left framebuffer rect.
  const ScissorRect& s = di.scissor;
  int x = static_cast<int>(std::lround(s.x * pixelRatio));
  int y = static_cast<int>(std::lround((viewH - (s.y + s.h)) * pixelRatio));
  int w = static_cast<int>(std::lround(std::max(0.0f, s.w) * pixelRatio));
  int h = static_cast<int>(std::lround(std::max(0.0f, s.h) * pixelRatio));
  glScissor(x, y, w, h);
}

// triSolid@1 and line2d@1: one Pos2 vertex per GL vertex.
void Renderer::drawVertices(const DrawItem& di, const Geometry& geo, GLuint vbo, GLenum mode,
                            int viewW, int viewH, Stats& stats) {
  pos2Prog_.use();
  pos2Prog_.setVec2("u_view", static_cast<float>(viewW), static_cast<float>(viewH));
  pos2Prog_.setColor("u_color", di.color);

  glBindBuffer(GL_ARRAY_BUFFER, vbo);
  const GLuint aPos = pos2Prog_.attrib("a_pos");
  glEnableVertexAttribArray(aPos);
  glVertexAttribPointer(aPos, 2, GL_FLOAT, GL_FALSE,
                        static_cast<GLsizei>(strideOf(VertexFormat::Pos2)), nullptr);
  glDrawArrays(mode, 0, static_cast<GLsizei>(geo.vertexCount));
  glDisableVertexAttribArray(aPos);

  stats.drawCalls++;
}

// instancedRect@1 and lineAA@1: one Rect4 record per instance, six generated
// vertices each.
void Renderer::drawInstances(ShaderProgram& prog, const Geometry& geo, GLuint vbo, Stats& stats) {
  glBindBuffer(GL_ARRAY_BUFFER, vbo);
  const GLuint aRect = prog.attrib("a_rect");
  glEnableVertexAttribArray(aRect);
  glVertexAttribPointer(aRect, 4, GL_FLOAT, GL_FALSE,
                        static_cast<GLsizei>(strideOf(VertexFormat::Rect4)), nullptr);
  glVertexAttribDivisor(aRect, 1);
  glDrawArraysInstanced(GL_TRIANGLES, 0, 6, static_cast<GLsizei>(geo.vertexCount));
  glVertexAttribDivisor(aRect, 0);
  glDisableVertexAttribArray(aRect);

  stats.drawCalls++;
  stats.instances += geo.vertexCount;
}

void Renderer::drawRects(const DrawItem& di, const Geometry& geo, GLuint vbo,
                         int viewW, int viewH, Stats& stats) {
  instRectProg_.use();
  instRectProg_.setVec2("u_view", static_cast<float>(viewW), static_cast<float>(viewH));
  instRectProg_.setColor("u_color", di.color);
  drawInstances(instRectProg_, geo, vbo, stats);
}

void Renderer::drawSegments(const DrawItem& di, const Geometry& geo, GLuint vbo,
                            int viewW, int viewH, Stats& stats) {
  const float width = std::max(di.lineWidth, 0.0f);
  const float halfWidth = width * 0.5f;

  lineAAProg_.use();
  lineAAProg_.setVec2("u_view", static_cast<float>(viewW), static_cast<float>(viewH));
  lineAAProg_.setColor("u_color", di.color);
  lineAAProg_.setFloat("u_lineWidth", width);
  lineAAProg_.setFloat("u_aaWidth", kAAFringePx);
  lineAAProg_.setFloat("u_fringeEdge",
                       halfWidth > 0.0001f ? (halfWidth + kAAFringePx) / halfWidth : 2.0f);
  drawInstances(lineAAProg_, geo, vbo, stats);
}

Stats Renderer::render(const Scene& scene, GpuBufferManager& gpuBufs, int viewW, int viewH,
                       float pixelRatio) {
  Stats stats{};
  if (!inited_ || viewW <= 0 || viewH <= 0) return stats;

  glViewport(0, 0, static_cast<int>(std::lround(viewW * pixelRatio)),
             static_cast<int>(std::lround(viewH * pixelRatio)));
  glDisable(GL_SCISSOR_TEST);
  glClearColor(clearColor_[0], clearColor_[1], clearColor_[2], clearColor_[3]);
  glClear(GL_COLOR_BUFFER_BIT);

  glEnable(GL_BLEND);
  glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
  glEnable(GL_SCISSOR_TEST);
  glBindVertexArray(vao_);

  for (Id paneId : scene.paneIds()) {
    for (Id layerId : scene.layersOf(paneId)) {
      for (Id diId : scene.drawItemsOf(layerId)) {
        const DrawItem* di = scene.getDrawItem(diId);
        if (!di || di->pipeline.empty()) continue;

        const Geometry* geo = scene.getGeometry(di->geometryId);
        const GLuint vbo = geo ? gpuBufs.getGlBuffer(geo->vertexBufferId) : 0;
        if (!di->visible || !geo || !vbo || geo->vertexCount == 0) {
          stats.culledDrawItems++;
          continue;
        }

        applyScissor(*di, viewW, viewH, pixelRatio);
        if (di->scissor.enabled) stats.clippedDrawItems++;

        if (di->pipeline == "triSolid@1")
          drawVertices(*di, *geo, vbo, GL_TRIANGLES, viewW, viewH, stats);
        else if (di->pipeline == "line2d@1")
          drawVertices(*di, *geo, vbo, GL_LINES, viewW, viewH, stats);
        else if (di->pipeline == "instancedRect@1")
          drawRects(*di, *geo, vbo, viewW, viewH, stats);
        else if (di->pipeline == "lineAA@1")
          drawSegments(*di, *geo, vbo, viewW, viewH, stats);
      }
    }
  }

  glDisable(GL_SCISSOR_TEST);
  glBindVertexArray(0);
  glDisable(GL_BLEND);
  glFlush();

  stats.activeBuffers = gpuBufs.activeBuffers();
  return stats;
}

} // namespace lrc
