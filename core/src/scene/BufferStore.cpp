#include "lrc/scene/BufferStore.hpp"
#include <algorithm>
#include <cstring>

namespace lrc {

void BufferStore::ensureBuffer(Id id) {
  buffers_.emplace(id, CpuBuffer{});
}

void BufferStore::setBufferData(Id id, const void* data, std::uint32_t len) {
  auto& buf = buffers_[id];
  buf.data.resize(len);
  if (len > 0 && data) std::memcpy(buf.data.data(), data, len);
  ++buf.revision;
}

void BufferStore::removeBuffer(Id id) {
  buffers_.erase(id);
}

bool BufferStore::hasBuffer(Id id) const {
  return buffers_.find(id) != buffers_.end();
}

const std::uint8_t* BufferStore::getBufferData(Id id) const {
  auto it = buffers_.find(id);
  if (it == buffers_.end() || it->second.data.empty()) return nullptr;
  return it->second.data.data();
}

std::uint32_t BufferStore::getBufferSize(Id id) const {
  auto it = buffers_.find(id);
  if (it == buffers_.end()) return 0;
  return static_cast<std::uint32_t>(it->second.data.size());
}

std::uint64_t BufferStore::revision(Id id) const {
  auto it = buffers_.find(id);
  return it == buffers_.end() ? 0 : it->second.revision;
}

std::vector<Id> BufferStore::bufferIds() const {
  std::vector<Id> out;
  out.reserve(buffers_.size());
  for (auto& kv : buffers_) out.push_back(kv.first);
  std::sort(out.begin(), out.end());
  return out;
}

void BufferStore::syncBufferLengths(Scene& scene) const {
  for (auto& kv : buffers_) {
    if (Buffer* b = scene.getBufferMutable(kv.first)) {
      b->byteLength = static_cast<std::uint32_t>(kv.second.data.size());
    }
  }
}

} // namespace lrc
