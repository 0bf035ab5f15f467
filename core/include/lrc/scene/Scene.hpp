#pragma once
#include "lrc/scene/Geometry.hpp"
#include "lrc/scene/Types.hpp"
#include <unordered_map>
#include <vector>

namespace lrc {

// Retained scene: Pane -> Layer -> DrawItem, plus the buffers and
// geometries draw items bind to.
class Scene {
public:
  bool hasPane(Id id) const;
  bool hasLayer(Id id) const;
  bool hasDrawItem(Id id) const;
  bool hasBuffer(Id id) const;
  bool hasGeometry(Id id) const;

  const Pane*     getPane(Id id) const;
  const Layer*    getLayer(Id id) const;
  const DrawItem* getDrawItem(Id id) const;
  const Buffer*   getBuffer(Id id) const;
  const Geometry* getGeometry(Id id) const;

  DrawItem* getDrawItemMutable(Id id);
  Buffer*   getBufferMutable(Id id);
  Geometry* getGeometryMutable(Id id);

  // Ids are checked against the ResourceRegistry by the caller.
  void addPane(Pane p);
  void addLayer(Layer l);
  void addDrawItem(DrawItem d);
  void addBuffer(Buffer b);
  void addGeometry(Geometry g);

  // Each returns every id it removed, the target first; empty when the id is
  // unknown. Panes take their layers and items with them, layers their items.
  // Buffers and geometries never cascade: an item bound to a deleted geometry
  // is culled at render time.
  std::vector<Id> deletePane(Id paneId);
  std::vector<Id> deleteLayer(Id layerId);
  std::vector<Id> deleteDrawItem(Id drawItemId);
  std::vector<Id> deleteBuffer(Id bufferId);
  std::vector<Id> deleteGeometry(Id geometryId);

  // Ascending id order, which is creation order for recipe-allocated ids.
  std::vector<Id> paneIds() const;
  std::vector<Id> layerIds() const;
  std::vector<Id> drawItemIds() const;
  std::vector<Id> bufferIds() const;
  std::vector<Id> geometryIds() const;

  // Layers of a pane / items of a layer, ascending.
  std::vector<Id> layersOf(Id paneId) const;
  std::vector<Id> drawItemsOf(Id layerId) const;

private:
  std::unordered_map<Id, Pane> panes_;
  std::unordered_map<Id, Layer> layers_;
  std::unordered_map<Id, DrawItem> drawItems_;
  std::unordered_map<Id, Buffer> buffers_;
  std::unordered_map<Id, Geometry> geometries_;
};

} // namespace lrc
