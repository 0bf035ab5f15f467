#include "lrc/gl/ShaderProgram.hpp"
#include <cstdio>
#include <string>

namespace lrc {

namespace {

std::string shaderLog(GLuint shader) {
  GLint len = 0;
  glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &len);
  std::string log(static_cast<std::size_t>(len > 1 ? len : 1), '\0');
  glGetShaderInfoLog(shader, static_cast<GLsizei>(log.size()), nullptr, &log[0]);
  return log;
}

std::string programLog(GLuint program) {
  GLint len = 0;
  glGetProgramiv(program, GL_INFO_LOG_LENGTH, &len);
  std::string log(static_cast<std::size_t>(len > 1 ? len : 1), '\0');
  glGetProgramInfoLog(program, static_cast<GLsizei>(log.size()), nullptr, &log[0]);
  return log;
}

// 0 on failure.
GLuint compileStage(const char* label, GLenum stage, const char* src) {
  const GLuint sh = glCreateShader(stage);
  glShaderSource(sh, 1, &src, nullptr);
  glCompileShader(sh);

  GLint compiled = GL_FALSE;
  glGetShaderiv(sh, GL_COMPILE_STATUS, &compiled);
  if (compiled == GL_TRUE) return sh;

  std::fprintf(stderr, "ShaderProgram::build(%s): %s stage failed to compile:\n%s\n", label,
               stage == GL_VERTEX_SHADER ? "vertex" : "fragment", shaderLog(sh).c_str());
  glDeleteShader(sh);
  return 0;
}

} // namespace

ShaderProgram::~ShaderProgram() {
  release();
}

void ShaderProgram::release() {
  if (program_ != 0) glDeleteProgram(program_);
  program_ = 0;
  uniforms_.clear();
}

bool ShaderProgram::build(const char* label, const char* vertSrc, const char* fragSrc) {
  release();

  const GLuint vs = compileStage(label, GL_VERTEX_SHADER, vertSrc);
  const GLuint fs = vs ? compileStage(label, GL_FRAGMENT_SHADER, fragSrc) : 0;
  if (!fs) {
    if (vs) glDeleteShader(vs);
    return false;
  }

  const GLuint prog = glCreateProgram();
  glAttachShader(prog, vs);
  glAttachShader(prog, fs);
  glLinkProgram(prog);
  // the program keeps the compiled stages alive
  glDeleteShader(vs);
  glDeleteShader(fs);

  GLint linked = GL_FALSE;
  glGetProgramiv(prog, GL_LINK_STATUS, &linked);
  if (linked != GL_TRUE) {
    std::fprintf(stderr, "ShaderProgram::build(%s): link failed:\n%s\n", label, programLog(prog).c_str());
    glDeleteProgram(prog);
    return false;
  }
  program_ = prog;
  return true;
}

GLuint ShaderProgram::attrib(const char* name) const {
  return static_cast<GLuint>(glGetAttribLocation(program_, name));
}

GLint ShaderProgram::uniform(const char* name) {
  auto it = uniforms_.find(name);
  if (it == uniforms_.end())
    it = uniforms_.emplace(name, glGetUniformLocation(program_, name)).first;
  return it->second;
}

void ShaderProgram::setFloat(const char* name, float v) {
  glUniform1f(uniform(name), v);
}

void ShaderProgram::setVec2(const char* name, float x, float y) {
  glUniform2f(uniform(name), x, y);
}

void ShaderProgram::setColor(const char* name, const float rgba[4]) {
  glUniform4fv(uniform(name), 1, rgba);
}

} // namespace lrc
