#include "lrc/scene/Scene.hpp"
#include <algorithm>

namespace lrc {

namespace {

template <typename Map>
std::vector<Id> sortedKeys(const Map& m) {
  std::vector<Id> out;
  out.reserve(m.size());
  for (auto& kv : m) out.push_back(kv.first);
  std::sort(out.begin(), out.end());
  return out;
}

template <typename Map>
auto findOrNull(Map& m, Id id) -> decltype(&m.begin()->second) {
  auto it = m.find(id);
  return it == m.end() ? nullptr : &it->second;
}

} // namespace

bool Scene::hasPane(Id id) const     { return panes_.find(id) != panes_.end(); }
bool Scene::hasLayer(Id id) const    { return layers_.find(id) != layers_.end(); }
bool Scene::hasDrawItem(Id id) const { return drawItems_.find(id) != drawItems_.end(); }
bool Scene::hasBuffer(Id id) const   { return buffers_.find(id) != buffers_.end(); }
bool Scene::hasGeometry(Id id) const { return geometries_.find(id) != geometries_.end(); }

const Pane* Scene::getPane(Id id) const         { return findOrNull(panes_, id); }
const Layer* Scene::getLayer(Id id) const       { return findOrNull(layers_, id); }
const DrawItem* Scene::getDrawItem(Id id) const { return findOrNull(drawItems_, id); }
const Buffer* Scene::getBuffer(Id id) const     { return findOrNull(buffers_, id); }
const Geometry* Scene::getGeometry(Id id) const { return findOrNull(geometries_, id); }

DrawItem* Scene::getDrawItemMutable(Id id) { return findOrNull(drawItems_, id); }
Buffer* Scene::getBufferMutable(Id id)     { return findOrNull(buffers_, id); }
Geometry* Scene::getGeometryMutable(Id id) { return findOrNull(geometries_, id); }

void Scene::addPane(Pane p)         { panes_[p.id] = std::move(p); }
void Scene::addLayer(Layer l)       { layers_[l.id] = std::move(l); }
void Scene::addDrawItem(DrawItem d) { drawItems_[d.id] = std::move(d); }
void Scene::addBuffer(Buffer b)     { buffers_[b.id] = std::move(b); }
void Scene::addGeometry(Geometry g) { geometries_[g.id] = std::move(g); }

std::vector<Id> Scene::deleteDrawItem(Id drawItemId) {
  auto it = drawItems_.find(drawItemId);
  if (it == drawItems_.end()) return {};
  drawItems_.erase(it);
  return {drawItemId};
}

std::vector<Id> Scene::deleteLayer(Id layerId) {
  auto it = layers_.find(layerId);
  if (it == layers_.end()) return {};

  std::vector<Id> deleted;
  deleted.push_back(layerId);

  // cascade delete draw items
  for (Id id : drawItemsOf(layerId)) {
    drawItems_.erase(id);
    deleted.push_back(id);
  }

  layers_.erase(it);
  return deleted;
}

std::vector<Id> Scene::deletePane(Id paneId) {
  auto it = panes_.find(paneId);
  if (it == panes_.end()) return {};

  std::vector<Id> deleted;
  deleted.push_back(paneId);

  for (Id lid : layersOf(paneId)) {
    auto layerDeleted = deleteLayer(lid);
    deleted.insert(deleted.end(), layerDeleted.begin(), layerDeleted.end());
  }

  panes_.erase(it);
  return deleted;
}

std::vector<Id> Scene::deleteBuffer(Id bufferId) {
  auto it = buffers_.find(bufferId);
  if (it == buffers_.end()) return {};
  buffers_.erase(it);
  return {bufferId};
}

std::vector<Id> Scene::deleteGeometry(Id geometryId) {
  auto it = geometries_.find(geometryId);
  if (it == geometries_.end()) return {};
  geometries_.erase(it);
  return {geometryId};
}

std::vector<Id> Scene::paneIds() const     { return sortedKeys(panes_); }
std::vector<Id> Scene::layerIds() const    { return sortedKeys(layers_); }
std::vector<Id> Scene::drawItemIds() const { return sortedKeys(drawItems_); }
std::vector<Id> Scene::bufferIds() const   { return sortedKeys(buffers_); }
std::vector<Id> Scene::geometryIds() const { return sortedKeys(geometries_); }

std::vector<Id> Scene::layersOf(Id paneId) const {
  std::vector<Id> out;
  for (auto& kv : layers_) {
    if (kv.second.paneId == paneId) out.push_back(kv.first);
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::vector<Id> Scene::drawItemsOf(Id layerId) const {
  std::vector<Id> out;
  for (auto& kv : drawItems_) {
    if (kv.second.layerId == layerId) out.push_back(kv.first);
  }
  std::sort(out.begin(), out.end());
  return out;
}

} // namespace lrc
