#pragma once
#include <glad/gl.h>    // GLAD must precede osmesa.h (guards GL/gl.h)

// OSMesa header uses GLAPI and APIENTRY from GL/gl.h, which GLAD suppresses.
#ifndef APIENTRY
#define APIENTRY
#endif
#ifndef GLAPI
#define GLAPI extern
#endif

#include <GL/osmesa.h>
#include <cstdint>
#include <string>
#include <vector>

namespace qc {

// Off-screen OpenGL 3.3 core context that renders into a client-side
// RGBA8 canvas. One canvas size per context; created lazily by init().
class OsMesaContext {
public:
  static constexpr int kGlMajor = 3;
  static constexpr int kGlMinor = 3;

  OsMesaContext() = default;
  ~OsMesaContext();

  OsMesaContext(const OsMesaContext&) = delete;
  OsMesaContext& operator=(const OsMesaContext&) = delete;

  // False when OSMesa or the GL loader is unavailable; see lastError().
  // A second call with the same size only rebinds the context.
  bool init(int width, int height);
  bool inited() const { return ctx_ != nullptr; }

  // Rebind to the calling thread.
  bool makeCurrent();

  void finish();

  // RGBA8, bottom row first. False before init().
  bool readPixels(std::vector<std::uint8_t>& out) const;

  int width() const { return width_; }
  int height() const { return height_; }
  const std::string& lastError() const { return lastError_; }

private:
  OSMesaContext ctx_{nullptr};
  int width_{0};
  int height_{0};
  std::vector<std::uint8_t> canvas_;
  std::string lastError_;

  bool failInit(const char* what);
};

} // namespace qc
