#pragma once
#include <glad/gl.h>
#include <string>
#include <unordered_map>

namespace lrc {

// One linked GLSL program. Uniform locations are looked up by name on first
// use and cached; an unknown name caches -1, which GL ignores on upload.
class ShaderProgram {
public:
  ShaderProgram() = default;
  ~ShaderProgram();

  ShaderProgram(const ShaderProgram&) = delete;
  ShaderProgram& operator=(const ShaderProgram&) = delete;

  // Compile both stages and link. The info log of a failed stage is printed
  // to stderr under `label`.
  bool build(const char* label, const char* vertSrc, const char* fragSrc);

  bool valid() const { return program_ != 0; }
  void use() const { glUseProgram(program_); }

  GLuint attrib(const char* name) const;

  void setFloat(const char* name, float v);
  void setVec2(const char* name, float x, float y);
  void setColor(const char* name, const float rgba[4]);

private:
  GLint uniform(const char* name);
  void release();

  GLuint program_{0};
  std::unordered_map<std::string, GLint> uniforms_;
};

} // namespace lrc
