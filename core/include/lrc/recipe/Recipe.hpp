#pragma once
#include "lrc/ids/Id.hpp"
#include "lrc/interaction/HitTarget.hpp"
#include "lrc/scene/Geometry.hpp"
#include "lrc/scene/Types.hpp"
#include "lrc/state/ChartAccess.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace lrc {

// A single JSON command string to be applied via CommandProcessor.
using CmdString = std::string;

// Commands that create a recipe's resources, and those that remove them again.
struct RecipeBuildResult {
  std::vector<CmdString> createCommands;
  std::vector<CmdString> disposeCommands; // applied in order to tear down
};

// New contents for one draw item's buffer.
struct BufferWrite {
  Id bufferId{0};
  Id geometryId{0};
  std::vector<float> data;
  std::uint32_t vertexCount{0};
};

// Text the host should present; the GL backend does not rasterize glyphs.
struct TextLabel {
  double x{0};
  double y{0};
  std::string text;
  float color[4] = {1.0f, 1.0f, 1.0f, 1.0f};
};

// Everything a layer shows for one state snapshot. Applying a frame replaces
// the layer's previous contents: every draw item gets a write, even if empty.
struct LayerFrame {
  Id layerId{0};
  std::vector<BufferWrite> writes;
  std::vector<CmdString> commands;    // style / scissor updates
  std::vector<HitTarget> hitTargets;  // draw order; later wins
  std::vector<TextLabel> labels;

  std::uint32_t totalVertices() const {
    std::uint32_t n = 0;
    for (const auto& w : writes) n += w.vertexCount;
    return n;
  }
};

// Base class for the chart layers. A recipe owns one Layer in the given pane
// and a fixed set of draw items with deterministic ids (idBase + offset):
//
//   0         Layer
//   1 + 3k    Buffer    of draw item k
//   2 + 3k    Geometry  of draw item k
//   3 + 3k    DrawItem  k
//
// draw() reads the chart state and fully regenerates the layer.
class Recipe {
public:
  Recipe(Id idBase, Id paneId, const ChartReader& reader);
  virtual ~Recipe() = default;

  Id idBase() const { return idBase_; }
  Id layerId() const { return rid(0); }

  virtual const char* name() const = 0;

  RecipeBuildResult build() const;

  virtual LayerFrame draw() const = 0;

  std::vector<Id> drawItemIds() const;
  std::size_t slotCount() const { return slots_.size(); }

  static constexpr std::uint32_t ID_SLOTS = 64;

protected:
  struct Slot {
    std::string name;
    std::string pipeline;
    VertexFormat format{VertexFormat::Pos2};
  };

  // Declare draw item k; call in the subclass constructor, in draw order.
  std::size_t addSlot(const std::string& slotName, const std::string& pipeline,
                      VertexFormat format);

  Id bufferId(std::size_t slot) const   { return rid(1 + 3 * static_cast<std::uint32_t>(slot)); }
  Id geometryId(std::size_t slot) const { return rid(2 + 3 * static_cast<std::uint32_t>(slot)); }
  Id drawItemId(std::size_t slot) const { return rid(3 + 3 * static_cast<std::uint32_t>(slot)); }

  // Frame with an empty write for every draw item (the clear step).
  LayerFrame beginFrame() const;

  // Replace slot contents; vertexCount follows from the slot's format.
  void setSlotData(LayerFrame& frame, std::size_t slot, std::vector<float> data) const;

  // Initial style commands appended to build().
  virtual void appendBuildStyles(std::vector<CmdString>&) const {}

  static CmdString styleCommand(Id drawItemId, const float color[4], float lineWidth = 1.0f);
  static CmdString scissorCommand(Id drawItemId, const ScissorRect& rect);

  // Deterministic ID: idBase_ + offset
  Id rid(std::uint32_t offset) const {
    return idBase_ + static_cast<Id>(offset);
  }

  Id idBase_;
  Id paneId_;
  const ChartReader& reader_;
  std::vector<Slot> slots_;
};

} // namespace lrc
