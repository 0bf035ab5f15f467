#include "lrc/gl/GpuBufferManager.hpp"

namespace lrc {

GpuBufferManager::~GpuBufferManager() {
  for (auto& kv : entries_) {
    if (kv.second.vbo) glDeleteBuffers(1, &kv.second.vbo);
  }
}

std::uint64_t GpuBufferManager::sync(const BufferStore& store) {
  std::uint64_t uploaded = 0;

  for (auto it = entries_.begin(); it != entries_.end();) {
    if (!store.hasBuffer(it->first)) {
      if (it->second.vbo) glDeleteBuffers(1, &it->second.vbo);
      it = entries_.erase(it);
    } else {
      ++it;
    }
  }

  for (Id id : store.bufferIds()) {
    auto& e = entries_[id];
    std::uint64_t rev = store.revision(id);
    if (e.vbo && e.revision == rev) continue;
    if (!e.vbo) glGenBuffers(1, &e.vbo);

    std::uint32_t bytes = store.getBufferSize(id);
    glBindBuffer(GL_ARRAY_BUFFER, e.vbo);
    glBufferData(GL_ARRAY_BUFFER, static_cast<GLsizeiptr>(bytes),
                 bytes ? store.getBufferData(id) : nullptr, GL_DYNAMIC_DRAW);
    uploaded += bytes;
    e.revision = rev;
  }
  glBindBuffer(GL_ARRAY_BUFFER, 0);
  return uploaded;
}

GLuint GpuBufferManager::getGlBuffer(Id bufferId) const {
  auto it = entries_.find(bufferId);
  if (it == entries_.end()) return 0;
  return it->second.vbo;
}

} // namespace lrc
