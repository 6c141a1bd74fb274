#include "qc/gl/OsMesaContext.hpp"
#include <cstdio>

namespace qc {

OsMesaContext::~OsMesaContext() {
  if (ctx_) OSMesaDestroyContext(ctx_);
}

bool OsMesaContext::failInit(const char* what) {
  lastError_ = what;
  std::fprintf(stderr, "OsMesaContext: %s\n", what);
  if (ctx_) {
    OSMesaDestroyContext(ctx_);
    ctx_ = nullptr;
  }
  canvas_.clear();
  width_ = height_ = 0;
  return false;
}

bool OsMesaContext::init(int width, int height) {
  if (ctx_) {
    if (width != width_ || height != height_) {
      lastError_ = "context already created with another canvas size";
      return false;
    }
    return makeCurrent();
  }
  if (width <= 0 || height <= 0) return failInit("invalid canvas size");

  const int attribs[] = {
    OSMESA_FORMAT,                OSMESA_RGBA,
    OSMESA_DEPTH_BITS,            0,
    OSMESA_STENCIL_BITS,          0,
    OSMESA_PROFILE,               OSMESA_CORE_PROFILE,
    OSMESA_CONTEXT_MAJOR_VERSION, kGlMajor,
    OSMESA_CONTEXT_MINOR_VERSION, kGlMinor,
    0
  };

  ctx_ = OSMesaCreateContextAttribs(attribs, nullptr);
  if (!ctx_) return failInit("OSMesaCreateContextAttribs failed (no GL 3.3 core)");

  width_ = width;
  height_ = height;
  canvas_.assign(static_cast<std::size_t>(width) * height * 4, 0);

  if (!makeCurrent()) return failInit("OSMesaMakeCurrent failed");

  const int version = gladLoadGL(reinterpret_cast<GLADloadfunc>(OSMesaGetProcAddress));
  if (!version) return failInit("gladLoadGL failed");
  if (GLAD_VERSION_MAJOR(version) * 10 + GLAD_VERSION_MINOR(version) < kGlMajor * 10 + kGlMinor) {
    return failInit("GL 3.3 entry points missing");
  }

  lastError_.clear();
  return true;
}

bool OsMesaContext::makeCurrent() {
  if (!ctx_) {
    lastError_ = "no context";
    return false;
  }
  if (!OSMesaMakeCurrent(ctx_, canvas_.data(), GL_UNSIGNED_BYTE, width_, height_)) {
    lastError_ = "OSMesaMakeCurrent failed";
    std::fprintf(stderr, "OsMesaContext: %s\n", lastError_.c_str());
    return false;
  }
  return true;
}

void OsMesaContext::finish() {
  if (ctx_) glFinish();
}

bool OsMesaContext::readPixels(std::vector<std::uint8_t>& out) const {
  if (!ctx_) return false;
  out.resize(static_cast<std::size_t>(width_) * height_ * 4);
  while (glGetError() != GL_NO_ERROR) {}  // errors from earlier draws
  glPixelStorei(GL_PACK_ALIGNMENT, 1);
  glReadPixels(0, 0, width_, height_, GL_RGBA, GL_UNSIGNED_BYTE, out.data());
  return glGetError() == GL_NO_ERROR;
}

} // namespace qc
