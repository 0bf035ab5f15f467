#pragma once
#include "lrc/ids/Id.hpp"
#include "lrc/scene/BufferStore.hpp"
#include <glad/gl.h>
#include <cstdint>
#include <unordered_map>

namespace lrc {

// GL vertex buffers mirroring a BufferStore. sync() uploads only buffers
// whose revision moved and drops VBOs whose buffer no longer exists.
class GpuBufferManager {
public:
  GpuBufferManager() = default;
  ~GpuBufferManager();

  GpuBufferManager(const GpuBufferManager&) = delete;
  GpuBufferManager& operator=(const GpuBufferManager&) = delete;

  // Returns total bytes uploaded.
  std::uint64_t sync(const BufferStore& store);

  // GL buffer name for an id (0 if not uploaded yet).
  GLuint getGlBuffer(Id bufferId) const;

  std::uint32_t activeBuffers() const { return static_cast<std::uint32_t>(entries_.size()); }

private:
  struct Entry {
    GLuint vbo{0};
    std::uint64_t revision{0};
  };
  std::unordered_map<Id, Entry> entries_;
};

} // namespace lrc
