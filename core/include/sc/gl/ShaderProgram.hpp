#pragma once
#include <glad/gl.h>

#include <string>
#include <unordered_map>

namespace sc {

// Linked vertex + fragment program. Uniform and attribute locations are
// looked up once per name and cached until the program is rebuilt.
class ShaderProgram {
public:
  ShaderProgram() = default;
  ~ShaderProgram();

  ShaderProgram(const ShaderProgram&) = delete;
  ShaderProgram& operator=(const ShaderProgram&) = delete;

  // Compile and link. Returns false on failure (errors go to stderr).
  bool build(const char* vertSrc, const char* fragSrc);

  // Deletes the program; the owning context must be current.
  void release();
  bool isValid() const { return program_ != 0; }

  void use() const;

  GLint attribLocation(const char* name);
  GLint uniformLocation(const char* name);

  // By uniform name; the program must be in use.
  void setMat3(const char* name, const float* data);
  void setColor(const char* name, const float rgba[4]);
  void setFloat(const char* name, float v);

private:
  GLuint program_{0};
  std::unordered_map<std::string, GLint> uniforms_;
  std::unordered_map<std::string, GLint> attribs_;
};

} // namespace sc
