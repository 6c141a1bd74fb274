#pragma once
#include <glad/gl.h>
#include <string>
#include <unordered_map>

namespace qc {

// One linked GL program of a draw pipeline. Attribute and uniform locations
// are looked up once per name and cached.
class ShaderProgram {
public:
  ShaderProgram() = default;
  ~ShaderProgram();

  ShaderProgram(const ShaderProgram&) = delete;
  ShaderProgram& operator=(const ShaderProgram&) = delete;

  // Compile + link. On failure the info log is kept in lastError() and
  // printed to stderr.
  bool build(const std::string& name, const char* vertSrc, const char* fragSrc);

  void use() const;

  // -1 when the name is not an active attribute / uniform.
  GLint attribLocation(const char* name) const;
  GLint uniformLocation(const char* name) const;

  void setUniformMat3(const char* name, const float* data) const;
  void setUniformFloat(const char* name, float v) const;
  void setUniformInt(const char* name, int v) const;

  bool built() const { return program_ != 0; }
  const std::string& name() const { return name_; }
  const std::string& lastError() const { return lastError_; }

private:
  GLuint program_{0};
  std::string name_;
  std::string lastError_;
  mutable std::unordered_map<std::string, GLint> attribs_;
  mutable std::unordered_map<std::string, GLint> uniforms_;

  GLuint compile(GLenum type, const char* src);
};

} // namespace qc
