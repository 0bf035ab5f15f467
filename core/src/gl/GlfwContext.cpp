#ifdef LRC_HAS_GLFW

#include "lrc/gl/GlfwContext.hpp"
#include <glad/gl.h>
#include <GLFW/glfw3.h>
#include <cstdio>

namespace lrc {

GlfwContext::GlfwContext() = default;

GlfwContext::~GlfwContext() {
  if (window_) glfwDestroyWindow(window_);
  glfwTerminate();
}

bool GlfwContext::init(int width, int height) {
  if (!glfwInit()) {
    std::fprintf(stderr, "GlfwContext: glfwInit failed\n");
    return false;
  }

  glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
  glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
  glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
  glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);

  window_ = glfwCreateWindow(width, height, "Liquidity Range", nullptr, nullptr);
  if (!window_) {
    std::fprintf(stderr, "GlfwContext: glfwCreateWindow failed\n");
    glfwTerminate();
    return false;
  }

  glfwMakeContextCurrent(window_);
  glfwSwapInterval(1);

  if (!gladLoadGL((GLADloadfunc)glfwGetProcAddress)) {
    std::fprintf(stderr, "GlfwContext: gladLoadGL failed\n");
    glfwDestroyWindow(window_);
    window_ = nullptr;
    glfwTerminate();
    return false;
  }

  glfwGetWindowSize(window_, &width_, &height_);
  glfwGetFramebufferSize(window_, &fbWidth_, &fbHeight_);

  glfwSetWindowUserPointer(window_, this);
  glfwSetScrollCallback(window_, scrollCallback);
  glfwSetCursorPosCallback(window_, cursorPosCallback);
  glfwSetCursorEnterCallback(window_, cursorEnterCallback);
  glfwSetMouseButtonCallback(window_, mouseButtonCallback);
  glfwSetKeyCallback(window_, keyCallback);
  glfwSetFramebufferSizeCallback(window_, framebufferSizeCallback);

  glfwGetCursorPos(window_, &cursorX_, &cursorY_);
  return true;
}

void GlfwContext::swapBuffers() {
  if (window_) glfwSwapBuffers(window_);
}

double GlfwContext::pixelRatio() const {
  if (width_ <= 0) return 1.0;
  return static_cast<double>(fbWidth_) / width_;
}

std::vector<std::uint8_t> GlfwContext::readPixels() const {
  std::vector<std::uint8_t> pixels(static_cast<std::size_t>(fbWidth_) * fbHeight_ * 4);
  glReadPixels(0, 0, fbWidth_, fbHeight_, GL_RGBA, GL_UNSIGNED_BYTE, pixels.data());
  return pixels;
}

bool GlfwContext::shouldClose() const {
  return window_ && glfwWindowShouldClose(window_);
}

WindowInput GlfwContext::pollInput() {
  glfwPollEvents();

  WindowInput out = std::move(pending_);
  pending_ = WindowInput{};
  out.shouldClose = shouldClose();
  return out;
}

void GlfwContext::scrollCallback(GLFWwindow* w, double /*xoff*/, double yoff) {
  auto* self = static_cast<GlfwContext*>(glfwGetWindowUserPointer(w));
  if (!self) return;

  PointerEvent ev;
  ev.action = PointerAction::Wheel;
  ev.x = self->cursorX_;
  ev.y = self->cursorY_;
  ev.wheelDelta = yoff;
  ev.shift = self->shift_;
  ev.ctrl = self->ctrl_;
  self->pending_.pointer.push_back(ev);
}

void GlfwContext::cursorPosCallback(GLFWwindow* w, double x, double y) {
  auto* self = static_cast<GlfwContext*>(glfwGetWindowUserPointer(w));
  if (!self) return;

  self->cursorX_ = x;
  self->cursorY_ = y;

  PointerEvent ev;
  ev.action = PointerAction::Move;
  ev.x = x;
  ev.y = y;
  ev.shift = self->shift_;
  ev.ctrl = self->ctrl_;
  self->pending_.pointer.push_back(ev);
}

void GlfwContext::cursorEnterCallback(GLFWwindow* w, int entered) {
  auto* self = static_cast<GlfwContext*>(glfwGetWindowUserPointer(w));
  if (!self || entered) return;

  PointerEvent ev;
  ev.action = PointerAction::Leave;
  ev.x = self->cursorX_;
  ev.y = self->cursorY_;
  self->pending_.pointer.push_back(ev);
}

void GlfwContext::mouseButtonCallback(GLFWwindow* w, int button, int action, int mods) {
  auto* self = static_cast<GlfwContext*>(glfwGetWindowUserPointer(w));
  if (!self) return;

  PointerEvent ev;
  switch (button) {
    case GLFW_MOUSE_BUTTON_LEFT:   ev.button = PointerButton::Left; break;
    case GLFW_MOUSE_BUTTON_MIDDLE: ev.button = PointerButton::Middle; break;
    case GLFW_MOUSE_BUTTON_RIGHT:  ev.button = PointerButton::Right; break;
    default: return;
  }
  ev.action = action == GLFW_PRESS ? PointerAction::Down : PointerAction::Up;
  ev.x = self->cursorX_;
  ev.y = self->cursorY_;
  ev.shift = (mods & GLFW_MOD_SHIFT) != 0;
  ev.ctrl = (mods & GLFW_MOD_CONTROL) != 0;
  self->pending_.pointer.push_back(ev);
}

void GlfwContext::keyCallback(GLFWwindow* w, int key, int /*scancode*/, int action, int mods) {
  auto* self = static_cast<GlfwContext*>(glfwGetWindowUserPointer(w));
  if (!self) return;

  self->shift_ = (mods & GLFW_MOD_SHIFT) != 0;
  self->ctrl_ = (mods & GLFW_MOD_CONTROL) != 0;
  if (action != GLFW_PRESS) return;

  KeyCode code = KeyCode::None;
  switch (key) {
    case GLFW_KEY_EQUAL:
    case GLFW_KEY_KP_ADD:      code = KeyCode::Plus; break;
    case GLFW_KEY_MINUS:
    case GLFW_KEY_KP_SUBTRACT: code = KeyCode::Minus; break;
    case GLFW_KEY_C:           code = KeyCode::C; break;
    case GLFW_KEY_F:           code = KeyCode::F; break;
    case GLFW_KEY_R:           code = KeyCode::R; break;
    case GLFW_KEY_ESCAPE:      code = KeyCode::Escape; break;
    default: break;
  }
  if (code != KeyCode::None) self->pending_.keys.push_back(code);
}

void GlfwContext::framebufferSizeCallback(GLFWwindow* w, int width, int height) {
  auto* self = static_cast<GlfwContext*>(glfwGetWindowUserPointer(w));
  if (!self) return;

  self->fbWidth_ = width;
  self->fbHeight_ = height;
  glfwGetWindowSize(w, &self->width_, &self->height_);
  self->pending_.resized = true;
}

} // namespace lrc

#endif // LRC_HAS_GLFW
