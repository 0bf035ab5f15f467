#pragma once
#include "lrc/ids/Id.hpp"
#include "lrc/scene/Scene.hpp"

#include <cstdint>
#include <unordered_map>
#include <vector>

namespace lrc {

// CPU-side vertex bytes per buffer id. Every write bumps the buffer's
// revision so the GPU side can upload only what changed.
class BufferStore {
public:
  void ensureBuffer(Id id);
  void setBufferData(Id id, const void* data, std::uint32_t len);
  void removeBuffer(Id id);

  bool hasBuffer(Id id) const;
  const std::uint8_t* getBufferData(Id id) const;
  std::uint32_t getBufferSize(Id id) const;
  std::uint64_t revision(Id id) const;  // 0 for unknown ids

  std::vector<Id> bufferIds() const;

  // Copy current byte lengths into the scene's Buffer records.
  void syncBufferLengths(Scene& scene) const;

private:
  struct CpuBuffer {
    std::vector<std::uint8_t> data;
    std::uint64_t revision{0};
  };

  std::unordered_map<Id, CpuBuffer> buffers_;
};

} // namespace lrc
