#pragma once
#include "qc/ids/Id.hpp"
#include <glad/gl.h>
#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace qc {

// Float vertex data staged per scene buffer id and mirrored into GL VBOs.
//
// Chart layers live for one render only, so released VBO names go back to a
// pool and are reused by the next request instead of being deleted.
class GpuBufferManager {
public:
  GpuBufferManager() = default;
  ~GpuBufferManager();

  GpuBufferManager(const GpuBufferManager&) = delete;
  GpuBufferManager& operator=(const GpuBufferManager&) = delete;

  // Replace the staged floats of a buffer; uploaded by the next uploadDirty().
  void stage(Id bufferId, const std::vector<float>& floats);

  // Returns the number of bytes sent to GL.
  std::uint64_t uploadDirty();

  // 0 until the buffer has been uploaded.
  GLuint glBuffer(Id bufferId) const;

  // Forget the buffer; its VBO name is kept for reuse.
  void release(Id bufferId);

  std::size_t size() const { return entries_.size(); }
  std::size_t pooled() const { return freeVbos_.size(); }

private:
  struct Entry {
    std::vector<float> floats;
    GLuint vbo{0};
    bool dirty{false};
  };
  std::unordered_map<Id, Entry> entries_;
  std::vector<GLuint> freeVbos_;
};

} // namespace qc
