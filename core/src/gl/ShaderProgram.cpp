#include "sc/gl/ShaderProgram.hpp"
#include <cstdio>
#include <vector>

namespace sc {

namespace {

// Info log of a shader or program object.
template <typename GetIv, typename GetLog>
std::vector<char> infoLog(GLuint object, GetIv getIv, GetLog getLog) {
  GLint len = 0;
  getIv(object, GL_INFO_LOG_LENGTH, &len);
  std::vector<char> log(static_cast<std::size_t>(len > 0 ? len : 1), '\0');
  getLog(object, static_cast<GLsizei>(log.size()), nullptr, log.data());
  return log;
}

GLuint compileStage(GLenum stage, const char* src) {
  GLuint s = glCreateShader(stage);
  glShaderSource(s, 1, &src, nullptr);
  glCompileShader(s);

  GLint ok = 0;
  glGetShaderiv(s, GL_COMPILE_STATUS, &ok);
  if (ok) return s;

  std::vector<char> log = infoLog(s, glGetShaderiv, glGetShaderInfoLog);
  std::fprintf(stderr, "ShaderProgram: %s stage failed to compile:\n%s\n",
               stage == GL_VERTEX_SHADER ? "vertex" : "fragment", log.data());
  glDeleteShader(s);
  return 0;
}

} // namespace

ShaderProgram::~ShaderProgram() {
  release();
}

void ShaderProgram::release() {
  if (program_) glDeleteProgram(program_);
  program_ = 0;
  uniforms_.clear();
  attribs_.clear();
}

bool ShaderProgram::build(const char* vertSrc, const char* fragSrc) {
  release();

  GLuint vs = compileStage(GL_VERTEX_SHADER, vertSrc);
  GLuint fs = vs ? compileStage(GL_FRAGMENT_SHADER, fragSrc) : 0;
  if (!vs || !fs) {
    if (vs) glDeleteShader(vs);
    return false;
  }

  GLuint prog = glCreateProgram();
  glAttachShader(prog, vs);
  glAttachShader(prog, fs);
  glLinkProgram(prog);
  glDetachShader(prog, vs);
  glDetachShader(prog, fs);
  glDeleteShader(vs);
  glDeleteShader(fs);

  GLint linked = 0;
  glGetProgramiv(prog, GL_LINK_STATUS, &linked);
  if (!linked) {
    std::vector<char> log = infoLog(prog, glGetProgramiv, glGetProgramInfoLog);
    std::fprintf(stderr, "ShaderProgram: link failed:\n%s\n", log.data());
    glDeleteProgram(prog);
    return false;
  }

  program_ = prog;
  return true;
}

void ShaderProgram::use() const {
  glUseProgram(program_);
}

GLint ShaderProgram::attribLocation(const char* name) {
  auto it = attribs_.find(name);
  if (it != attribs_.end()) return it->second;
  GLint loc = glGetAttribLocation(program_, name);
  attribs_.emplace(name, loc);
  return loc;
}

GLint ShaderProgram::uniformLocation(const char* name) {
  auto it = uniforms_.find(name);
  if (it != uniforms_.end()) return it->second;
  GLint loc = glGetUniformLocation(program_, name);
  uniforms_.emplace(name, loc);
  return loc;
}

void ShaderProgram::setMat3(const char* name, const float* data) {
  glUniformMatrix3fv(uniformLocation(name), 1, GL_FALSE, data);
}

void ShaderProgram::setColor(const char* name, const float rgba[4]) {
  glUniform4fv(uniformLocation(name), 1, rgba);
}

void ShaderProgram::setFloat(const char* name, float v) {
  glUniform1f(uniformLocation(name), v);
}

} // namespace sc
