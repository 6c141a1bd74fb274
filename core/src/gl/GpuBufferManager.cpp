#include "qc/gl/GpuBufferManager.hpp"

namespace qc {

GpuBufferManager::~GpuBufferManager() {
  for (auto& kv : entries_) {
    if (kv.second.vbo) freeVbos_.push_back(kv.second.vbo);
  }
  if (!freeVbos_.empty()) {
    glDeleteBuffers(static_cast<GLsizei>(freeVbos_.size()), freeVbos_.data());
  }
}

void GpuBufferManager::stage(Id bufferId, const std::vector<float>& floats) {
  Entry& e = entries_[bufferId];
  e.floats = floats;
  e.dirty = true;
}

std::uint64_t GpuBufferManager::uploadDirty() {
  std::uint64_t uploaded = 0;
  for (auto& kv : entries_) {
    Entry& e = kv.second;
    if (!e.dirty) continue;

    if (!e.vbo) {
      if (!freeVbos_.empty()) {
        e.vbo = freeVbos_.back();
        freeVbos_.pop_back();
      } else {
        glGenBuffers(1, &e.vbo);
      }
    }

    const std::size_t bytes = e.floats.size() * sizeof(float);
    glBindBuffer(GL_ARRAY_BUFFER, e.vbo);
    glBufferData(GL_ARRAY_BUFFER, static_cast<GLsizeiptr>(bytes),
                 e.floats.empty() ? nullptr : e.floats.data(), GL_STREAM_DRAW);
    uploaded += bytes;
    e.dirty = false;
  }
  glBindBuffer(GL_ARRAY_BUFFER, 0);
  return uploaded;
}

GLuint GpuBufferManager::glBuffer(Id bufferId) const {
  auto it = entries_.find(bufferId);
  return it == entries_.end() ? 0 : it->second.vbo;
}

void GpuBufferManager::release(Id bufferId) {
  auto it = entries_.find(bufferId);
  if (it == entries_.end()) return;
  if (it->second.vbo) freeVbos_.push_back(it->second.vbo);
  entries_.erase(it);
}

} // namespace qc
