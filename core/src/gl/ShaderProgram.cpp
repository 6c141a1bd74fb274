#include "qc/gl/ShaderProgram.hpp"
#include <cstdio>
#include <vector>

namespace qc {

namespace {

std::string shaderLog(GLuint shader) {
  GLint len = 0;
  glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &len);
  std::vector<char> log(static_cast<std::size_t>(len > 0 ? len : 1), '\0');
  glGetShaderInfoLog(shader, static_cast<GLsizei>(log.size()), nullptr, log.data());
  return log.data();
}

std::string programLog(GLuint program) {
  GLint len = 0;
  glGetProgramiv(program, GL_INFO_LOG_LENGTH, &len);
  std::vector<char> log(static_cast<std::size_t>(len > 0 ? len : 1), '\0');
  glGetProgramInfoLog(program, static_cast<GLsizei>(log.size()), nullptr, log.data());
  return log.data();
}

} // namespace

ShaderProgram::~ShaderProgram() {
  if (program_) glDeleteProgram(program_);
}

GLuint ShaderProgram::compile(GLenum type, const char* src) {
  GLuint s = glCreateShader(type);
  glShaderSource(s, 1, &src, nullptr);
  glCompileShader(s);

  GLint ok = 0;
  glGetShaderiv(s, GL_COMPILE_STATUS, &ok);
  if (ok) return s;

  lastError_ = name_ + (type == GL_VERTEX_SHADER ? " vertex: " : " fragment: ") + shaderLog(s);
  std::fprintf(stderr, "Shader compile error (%s)\n", lastError_.c_str());
  glDeleteShader(s);
  return 0;
}

bool ShaderProgram::build(const std::string& name, const char* vertSrc, const char* fragSrc) {
  if (program_) {
    glDeleteProgram(program_);
    program_ = 0;
  }
  name_ = name;
  lastError_.clear();
  attribs_.clear();
  uniforms_.clear();

  GLuint vs = compile(GL_VERTEX_SHADER, vertSrc);
  if (!vs) return false;
  GLuint fs = compile(GL_FRAGMENT_SHADER, fragSrc);
  if (!fs) {
    glDeleteShader(vs);
    return false;
  }

  GLuint prog = glCreateProgram();
  glAttachShader(prog, vs);
  glAttachShader(prog, fs);
  glLinkProgram(prog);
  glDeleteShader(vs);
  glDeleteShader(fs);

  GLint ok = 0;
  glGetProgramiv(prog, GL_LINK_STATUS, &ok);
  if (!ok) {
    lastError_ = name_ + " link: " + programLog(prog);
    std::fprintf(stderr, "Program link error (%s)\n", lastError_.c_str());
    glDeleteProgram(prog);
    return false;
  }
  program_ = prog;
  return true;
}

void ShaderProgram::use() const {
  glUseProgram(program_);
}

GLint ShaderProgram::attribLocation(const char* name) const {
  auto it = attribs_.find(name);
  if (it != attribs_.end()) return it->second;
  const GLint loc = glGetAttribLocation(program_, name);
  attribs_.emplace(name, loc);
  return loc;
}

GLint ShaderProgram::uniformLocation(const char* name) const {
  auto it = uniforms_.find(name);
  if (it != uniforms_.end()) return it->second;
  const GLint loc = glGetUniformLocation(program_, name);
  uniforms_.emplace(name, loc);
  return loc;
}

void ShaderProgram::setUniformMat3(const char* name, const float* data) const {
  glUniformMatrix3fv(uniformLocation(name), 1, GL_FALSE, data);
}

void ShaderProgram::setUniformFloat(const char* name, float v) const {
  glUniform1f(uniformLocation(name), v);
}

void ShaderProgram::setUniformInt(const char* name, int v) const {
  glUniform1i(uniformLocation(name), v);
}

} // namespace qc
