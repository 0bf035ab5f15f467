#pragma once
#include <cstdint>

namespace lrc {

// Per-frame counters returned by Renderer::render.
struct Stats {
  std::uint32_t drawCalls = 0;
  std::uint32_t culledDrawItems = 0;   // hidden, unbound or empty
  std::uint32_t clippedDrawItems = 0;  // drawn with their own scissor rect
  std::uint64_t instances = 0;         // rects and segments across instanced draws
  std::uint32_t activeBuffers = 0;
};

} // namespace lrc
