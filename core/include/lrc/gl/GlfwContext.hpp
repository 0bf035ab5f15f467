#pragma once
#include "lrc/gl/GlContext.hpp"
#include "lrc/viewport/InputState.hpp"

#ifdef LRC_HAS_GLFW

struct GLFWwindow;

namespace lrc {

// Everything that happened since the previous pollInput(), in arrival order.
struct WindowInput {
  std::vector<PointerEvent> pointer;
  std::vector<KeyCode> keys;
  bool resized{false};
  bool shouldClose{false};
};

class GlfwContext : public GlContext {
public:
  GlfwContext();
  ~GlfwContext() override;

  GlfwContext(const GlfwContext&) = delete;
  GlfwContext& operator=(const GlfwContext&) = delete;

  bool init(int width, int height) override;
  void swapBuffers() override;

  // Window size in screen coordinates (the pointer coordinate space).
  int width() const override { return width_; }
  int height() const override { return height_; }

  double pixelRatio() const override;

  std::vector<std::uint8_t> readPixels() const override;

  WindowInput pollInput();
  bool shouldClose() const;

private:
  GLFWwindow* window_{nullptr};
  int width_{0};
  int height_{0};
  int fbWidth_{0};
  int fbHeight_{0};

  // Filled by the callbacks, drained by pollInput().
  WindowInput pending_;
  double cursorX_{0};
  double cursorY_{0};
  bool shift_{false};
  bool ctrl_{false};

  static void scrollCallback(GLFWwindow* w, double xoff, double yoff);
  static void cursorPosCallback(GLFWwindow* w, double x, double y);
  static void cursorEnterCallback(GLFWwindow* w, int entered);
  static void mouseButtonCallback(GLFWwindow* w, int button, int action, int mods);
  static void keyCallback(GLFWwindow* w, int key, int scancode, int action, int mods);
  static void framebufferSizeCallback(GLFWwindow* w, int width, int height);
};

} // namespace lrc

#endif // LRC_HAS_GLFW
